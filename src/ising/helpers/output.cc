#include <iostream>
#include <fstream>

#include "ising/common.h"
#include "ising/helpers/exception.h"
#include "ising/helpers/output.h"
#include "ising/helpers/utils.h"

namespace ising {
    namespace output {
        void desync_io() {
          std::cin.tie(nullptr);
          std::ios_base::sync_with_stdio(false);
        }

        void set_default_cout_flags() {
          std::cout << std::boolalpha;
        }

        void initialise() {
          desync_io();
          set_default_cout_flags();
        }

        std::string output_path() {
          if (ising::instance().output_path().empty()) {
            return std::string();
          }
          return ising::instance().output_path() + "/";
        }

        std::string full_path_filename(const std::string &ending) {
          auto sep = file_basename_no_extension(ending).empty() ? "" : "_";
          return output_path() + ising::instance().simulation_name() + sep + ending;
        }

        TsvWriter::TsvWriter(const std::string &filename, std::vector<ColDef> cols, int precision)
        : filename_(filename),
          file_(filename),
          cols_(std::move(cols)),
          precision_(precision) {
          if (!file_.is_open()) {
            throw FileException(filename_, "failed to open for writing");
          }
          file_ << make_json_units_string(cols_);
          file_ << make_tsv_header_row(cols_, precision_);
        }

        void TsvWriter::write_row(const std::vector<double> &values) {
          if (values.size() != cols_.size()) {
            throw SanityException("row for ", filename_, " has ", values.size(),
                                  " values but file has ", cols_.size(), " columns");
          }
          write_tsv_row(file_, cols_, values, precision_);
          file_.flush();
        }
    }
}
