#ifndef ISING_HELPERS_EXCEPTION_H
#define ISING_HELPERS_EXCEPTION_H

#include <stdexcept>
#include <sstream>
#include <string>
#include <libconfig.h++>

namespace ising {

class GeneralException : public std::exception {
  std::string msg;
 public:
  template<class ... Args>
  explicit GeneralException(Args &&... args) :
      std::exception() {
    std::ostringstream os;
    ([&] {
      os << args;
    }(), ...);
    msg = os.str();
  }

  [[nodiscard]] const char *what() const noexcept override {
    return msg.c_str();
  }
};

// Prefixes the message with the full path of the offending setting,
// e.g. "solver.beta: must be positive"
class ConfigException : public GeneralException {
 public:
  template<class ... Args>
  explicit ConfigException(const libconfig::Setting &setting, Args &&... args) :
      GeneralException(setting.getPath(), ": ", std::forward<Args>(args)...) {}
};

class FileException : public GeneralException {
 public:
  template<class ... Args>
  explicit FileException(const std::string& file_path, Args &&... args) :
      GeneralException(file_path, ": ", std::forward<Args>(args)...) {}
};

class SanityException : public GeneralException {
 public:
  template<class ... Args>
  explicit SanityException(Args &&... args) :
      GeneralException(std::forward<Args>(args)...) {}
};

} // namespace ising

#endif  // ISING_HELPERS_EXCEPTION_H
