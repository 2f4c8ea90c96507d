#ifndef ISING_HELPERS_UTILS_H
#define ISING_HELPERS_UTILS_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

inline double division_or_zero(const double nominator, const double denominator) {
  if (denominator == 0.0) {
    return 0.0;
  } else {
    return nominator / denominator;
  }
}

inline std::string get_date_string(std::chrono::time_point<std::chrono::system_clock> t) {
  auto as_time_t = std::chrono::system_clock::to_time_t(t);
  struct tm tm;
  if (::gmtime_r(&as_time_t, &tm)) {
    char timebuffer[80];
    if (std::strftime(timebuffer, sizeof(timebuffer), "%Y-%m-%d %H:%M:%S", &tm)) {
      return std::string{timebuffer};
    }
  }
  throw std::runtime_error("Failed to get current date as string");
}

inline std::string& left_trim(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
    [](unsigned char c) { return !std::isspace(c); }));
  return s;
}

// trim from end
inline std::string& right_trim(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
    [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
  return s;
}

// trim from both ends
inline std::string trim(std::string s) {
  return left_trim(right_trim(s));
}

inline std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// "path/to/file.cfg" -> "file"
inline std::string file_basename_no_extension(const std::string& filepath) {
  auto slash = filepath.find_last_of("/\\");
  auto start = (slash == std::string::npos) ? 0 : slash + 1;
  auto dot = filepath.find_last_of('.');
  if (dot == std::string::npos || dot < start) {
    return filepath.substr(start);
  }
  return filepath.substr(start, dot - start);
}

inline std::uint64_t concatenate_32_bit(std::uint32_t msw, std::uint32_t lsw) {
  return (std::uint64_t(msw) << 32) | lsw;
}

inline std::string find_and_replace(std::string data, const std::string& find, const std::string& replace) {
  size_t pos = data.find(find);

  while(pos != std::string::npos) {
    data.replace(pos, find.size(), replace);
    pos = data.find(find, pos + replace.size());
  }
  return data;
}

// split on any of the characters in 'delimiters', dropping empty tokens
std::vector<std::string> split(const std::string &s, const std::string &delimiters);

std::string word_wrap(const char *text, size_t line_length = 72);

#endif  // ISING_HELPERS_UTILS_H
