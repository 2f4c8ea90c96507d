#include <cstdarg>
#include <cstdio>
#include <iostream>

#include "ising/helpers/error.h"
#include "ising/helpers/utils.h"

void ising_warning(const char *string, ...) {
  va_list args;
  char buffer[1024];

  va_start(args, string);
  vsnprintf(buffer, sizeof(buffer), string, args);
  va_end(args);

  std::cerr << "\n********************************************************************************\n";
  std::cerr << "WARNING: \n";
  std::cerr << word_wrap(buffer, 80);
  std::cerr << "\n";
  std::cerr << "********************************************************************************\n";
  std::cerr << std::flush;
}
