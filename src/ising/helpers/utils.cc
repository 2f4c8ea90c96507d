#include <sstream>
#include <string>

#include "ising/helpers/utils.h"

std::vector<std::string> split(const std::string &s, const std::string &delimiters) {
  std::vector<std::string> tokens;

  std::string::size_type start = 0;
  while (start < s.size()) {
    auto end = s.find_first_of(delimiters, start);
    if (end == std::string::npos) {
      end = s.size();
    }
    if (end > start) {
      tokens.push_back(s.substr(start, end - start));
    }
    start = end + 1;
  }
  return tokens;
}

std::string word_wrap(const char *text, size_t line_length) {
// https://www.rosettacode.org/wiki/Word_wrap#C.2B.2B
  std::istringstream words(text);
  std::ostringstream wrapped;
  std::string word;

  if (words >> word) {
    wrapped << word;
    size_t space_left = line_length - word.length();
    while (words >> word) {
      if (space_left < word.length() + 1) {
        wrapped << '\n' << word;
        space_left = line_length - word.length();
      } else {
        wrapped << ' ' << word;
        space_left -= word.length() + 1;
      }
    }
  }
  return wrapped.str();
}
