#include <string>
#include <cstring>
#include <cerrno>
#include <cstdio>

// POSIX headers
#include <unistd.h>
#include <sys/stat.h>

#include "ising/helpers/exception.h"
#include "ising/helpers/utils.h"
#include "ising/interface/system.h"

using namespace std;

bool ising::system::file_exists(const string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

namespace {
    void make_directory(const string &path, mode_t mode) {
      struct stat st;
      if (stat(path.c_str(), &st) != 0) {
        // EEXIST if another process made it first
        if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
          throw ising::FileException(path, "mkdir failed: ", strerror(errno));
        }
      } else if (!S_ISDIR(st.st_mode)) {
        throw ising::FileException(path, "not a directory");
      }
    }
}

void ising::system::make_path(const string &path, mode_t mode) {
  auto directories = split(path, "/");

  string total_path = (!path.empty() && path[0] == '/') ? "/" : "";
  for (const auto &d : directories) {
    total_path += d + "/";
    make_directory(total_path, mode);
  }
}

bool ising::system::stdout_is_tty() {
  return isatty(fileno(stdout));
}
