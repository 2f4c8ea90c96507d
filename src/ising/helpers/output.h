#ifndef ISING_HELPERS_OUTPUT_H
#define ISING_HELPERS_OUTPUT_H

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace ising::output {
    void initialise();

    /// Name of an output file: <output path>/<simulation name>_<ending>
    std::string full_path_filename(const std::string& ending);
    std::string output_path();

    enum class ColFmt {
      Scientific,
      Fixed,
      Integer
    };

    struct ColDef {
        std::string name;
        std::string units;
        ColFmt format = ColFmt::Scientific;
    };

    inline void apply_format(std::ostream& os, ColFmt fmt, int precision = 8)
    {
      os.unsetf(std::ios::floatfield);  // Clear scientific/fixed flags first

      switch (fmt) {
        case ColFmt::Scientific:
          os << std::scientific << std::setprecision(precision) << std::setw(precision + 9);
          break;
        case ColFmt::Fixed:
          os << std::fixed << std::setprecision(precision) << std::setw(precision + 4);
          break;
        case ColFmt::Integer:
          os << std::setw(12);
          break;
      }

      os << std::right;
    }

    inline void write_tsv_row(std::ostream& os,
                          const std::vector<ColDef>& cols,
                          const std::vector<double>& values,
                          int precision)
    {
      for (std::size_t i = 0; i < cols.size(); ++i) {
        const auto& col = cols[i];
        double v = values[i];

        apply_format(os, col.format, precision);

        switch (col.format) {
          case ColFmt::Integer:
            os << static_cast<long long>(std::llround(v));
            break;
          case ColFmt::Scientific:
          case ColFmt::Fixed:
            os << v;
            break;
        }
      }

      os << '\n';
    }

    inline std::string make_json_units_string(const std::vector<ColDef>& cols) {
      std::ostringstream os;
      os << "# { ";

      for (std::size_t i = 0; i < cols.size(); ++i) {
        if (i > 0) {
          os << ", ";
        }
        os << '"' << cols[i].name << "\": \"" << cols[i].units << '"';
      }

      os << " }\n";
      return os.str();
    }

    inline std::string make_tsv_header_row(const std::vector<ColDef>& cols, int precision) {
      std::ostringstream os;
      os << std::scientific << std::setprecision(precision) << std::right;

      for (const auto& col : cols) {
        apply_format(os, col.format, precision);
        os << col.name;
      }

      os << '\n';
      return os.str();
    }

    /// Column formatted text file with a JSON units comment and a header row.
    class TsvWriter {
    public:
        TsvWriter(const std::string& filename, std::vector<ColDef> cols, int precision = 8);

        inline std::size_t num_cols() const { return cols_.size(); }

        void write_row(const std::vector<double>& values);

    private:
        std::string filename_;
        std::ofstream file_;
        std::vector<ColDef> cols_;
        int precision_;
    };
}

#endif //ISING_HELPERS_OUTPUT_H
