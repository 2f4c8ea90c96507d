#include "version.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

#include "ising/common.h"
#include "ising/core/args.h"
#include "ising/core/lattice.h"
#include "ising/core/monitor.h"
#include "ising/core/simulation.h"
#include "ising/core/solver.h"
#include "ising/helpers/error.h"
#include "ising/helpers/exception.h"
#include "ising/helpers/output.h"
#include "ising/helpers/progress_bar.h"
#include "ising/helpers/timer.h"
#include "ising/helpers/utils.h"
#include "ising/initializer/init_dispatcher.h"
#include "ising/interface/config.h"
#include "ising/interface/system.h"
#include "ising/solvers/cpu_monte_carlo_checkerboard.h"

using namespace std;

namespace ising {

    namespace {
        std::unique_ptr<Simulation> simulation;

        void write_config(const std::string& filename, const unique_ptr<libconfig::Config> &cfg) {
          cfg->setFloatPrecision(ising::defaults::config_float_precision);
          cfg->writeFile(filename.c_str());
        }

        string build_info() {
          stringstream ss;
          ss << "  version    " << ising::build::version << "\n";
          ss << "  build      " << ising::build::type << "\n";
          ss << "  libconfig  " << ising::build::libconfig_version << "\n";
          ss << "    " << find_and_replace(ising::build::libconfig_libraries, ";", "\n    ") << "\n";
          ss << "  pcg        " << find_and_replace(ising::build::pcg_include_dir, ";", "\n    ") << "\n";
          return ss.str();
        }

        string run_info() {
          stringstream ss;
          ss << "time    ";
          ss << get_date_string(std::chrono::system_clock::now()) << "\n";
          return ss.str();
        }

        void initialize_config(
            const vector<string>& config_strings,
            const int config_options = ising::defaults::config_options) {
          using namespace libconfig;

          simulation->config.reset(new Config);
          simulation->config->setOptions(config_options);

          cout << "config files " << "\n";
          for (const auto& s : config_strings) {
            if (ising::system::file_exists(s)) {
              cout << "  " << s << "\n";
            }
          }

          ising::parse_config_strings(config_strings, simulation->config);

          std::string filename = ising::output::full_path_filename("combined.cfg");
          write_config(filename, simulation->config);
        }

        void initialize_random_generator(const libconfig::Config& cfg) {
          auto& sim = *simulation;

          if (cfg.exists("sim")) {
            const libconfig::Setting& settings = cfg.lookup("sim");
            sim.verbose = ising::config_optional<bool>(settings, "verbose", ising::defaults::sim_verbose_output);

            if (settings.exists("seed")) {
              sim.random_seed = ising::config_required<unsigned long>(settings, "seed");
              sim.random_generator = make_random_generator(sim.random_seed);
              cout << "seed    " << sim.random_seed << "\n";
            }

            if (settings.exists("rng_state")) {
              if (settings.exists("seed")) {
                ising_warning("Both sim.seed and sim.rng_state are set. The generator starts from sim.rng_state.");
              }
              set_random_generator_state(sim.random_generator,
                                         ising::config_required<string>(settings, "rng_state"));
            }
          }

          sim.random_state = random_generator_state(sim.random_generator);

          cout << "verbose " << sim.verbose << "\n";
          cout << "rng state " << sim.random_state << "\n";
        }

        void initialize_lattice(const libconfig::Config& cfg) {
          const libconfig::Setting& settings = cfg.lookup("lattice");

          const int rows = ising::config_required<int>(settings, "rows");
          if (rows < 1) {
            throw ConfigException(settings["rows"], "must be at least 1");
          }

          const int cols = ising::config_required<int>(settings, "cols");
          if (cols < 1) {
            throw ConfigException(settings["cols"], "must be at least 1");
          }

          simulation->lattice.reset(new Lattice(rows, cols));

          cout << "  rows  " << rows << "\n";
          cout << "  cols  " << cols << "\n";
          cout << "  sites " << simulation->lattice->size() << "\n";
        }

        void initialize_spins(const libconfig::Config& cfg) {
          if (!cfg.exists("initializer")) {
            cout << "  no initializer given, using '" << ising::defaults::initializer_module << "'\n";
            libconfig::Config default_config;
            default_config.getRoot().add("module", libconfig::Setting::TypeString) = ising::defaults::initializer_module;
            InitializerDispatcher::execute(default_config.getRoot(), *simulation->lattice, simulation->random_generator);
            return;
          }
          InitializerDispatcher::execute(cfg.lookup("initializer"), *simulation->lattice, simulation->random_generator);
        }
    }

    void parse_config_strings(const vector<string>& config_strings, unique_ptr<libconfig::Config>& combined_config) {
      if (!combined_config) {
        combined_config.reset(new libconfig::Config);
      }

      for (const auto &s : config_strings) {
        libconfig::Config patch;
        if (ising::system::file_exists(s)) {
          try {
            patch.readFile(s.c_str());
          }
          catch (const libconfig::FileIOException &fex) {
            throw FileException(s, "IO error opening config file");
          }
          catch (const libconfig::ParseException &pex) {
            throw GeneralException("Error parsing config file: ",
                                   pex.getFile(), ":", pex.getLine(), ": ", pex.getError());
          }
        } else {
          try {
            patch.readString(s.c_str());
          }
          catch (const libconfig::ParseException &pex) {
            throw GeneralException("File not found or error parsing config string:\n",
                                   "  '", s, "'\n",
                                   "line ", pex.getLine(), ": ", pex.getError());
          }
        }

        overwrite_config_settings(combined_config->getRoot(), patch.getRoot());
      }
    }

    std::string section(const std::string &name) {
      std::string line = "\n--------------------------------------------------------------------------------\n";
      return line.replace(1, name.size() + 1, name + " ");
    }

    string choose_simulation_name(const ising::ProgramArgs &program_args) {
      // specify a default name in case no other is found
      string name = "ising";
      if (!program_args.simulation_name.empty()) {
        // name specified with command line flag
        name = trim(program_args.simulation_name);
      } else {
        // name after the first config file if one exists
        for (const auto& s : program_args.config_strings) {
          if (ising::system::file_exists(s)) {
            name = trim(file_basename_no_extension(s));
            break;
          }
        }
      }
      return name;
    }

    void initialize_simulation(const ising::ProgramArgs &program_args) {
      try {
        cout << ising::section("build info") << std::endl;
        cout << build_info();
        cout << ising::section("run info") << std::endl;
        cout << run_info();

        if (!program_args.output_path.empty()) {
          ising::instance().set_output_dir(program_args.output_path);
        }

        ising::instance().set_simulation_name(choose_simulation_name(program_args));

        simulation.reset(new Simulation);

        initialize_config(program_args.config_strings);

        const libconfig::Config& cfg = *simulation->config;

        initialize_random_generator(cfg);

        if (simulation->verbose) {
          cout << ising::section("combined config") << std::endl;
          std::ifstream combined(ising::output::full_path_filename("combined.cfg"));
          std::stringstream contents;
          contents << combined.rdbuf();
          cout << contents.str() << "\n";
        }

        cout << ising::section("init lattice") << std::endl;

        initialize_lattice(cfg);
        initialize_spins(cfg);

        cout << ising::section("init solver") << std::endl;

        simulation->solver.reset(Solver::create(cfg.lookup("solver"), *simulation->lattice, simulation->random_generator));
        simulation->solver->initialize(cfg.lookup("solver"));

        cout << ising::section("init monitors") << std::endl;

        if (!cfg.exists("monitors")) {
          ising_warning("No monitors in config");
        } else {
          const libconfig::Setting &monitor_settings = cfg.lookup("monitors");
          for (auto i = 0; i < monitor_settings.getLength(); ++i) {
            simulation->solver->register_monitor(Monitor::create(monitor_settings[i]));
          }
        }
      }
      catch (const libconfig::SettingTypeException &stex) {
        ising::die("Config setting type error ", "'", stex.getPath(), "'");
      }
      catch (const libconfig::SettingNotFoundException &nfex) {
        ising::die("Required config setting not found ", "'", nfex.getPath(), "'");
      }
      catch (const ising::GeneralException &gex) {
        ising::die(gex.what());
      }
      catch (const std::exception &e) {
        ising::die(e.what());
      }
    }

    void run_simulation() {
      if (!simulation || !simulation->solver) {
        ising::die("run_simulation called before initialize_simulation");
      }

      auto& solver = *simulation->solver;

      try {
        cout << ising::section("running solver") << std::endl;
        cout << "start   " << get_date_string(std::chrono::system_clock::now()) << "\n" << std::endl;
        {
          // verbose runs report progress after every step
          const int progress_steps = simulation->verbose ? 1 : 1000;

          ProgressBar progress;
          Timer timer;
          while (solver.is_running()) {
            solver.notify_monitors();
            solver.run();

            progress.set(division_or_zero(solver.iteration(), solver.max_steps()));
            if (solver.iteration() % progress_steps == 0) {
              cout << progress;
            }
          }
          // final state is also seen by the monitors
          solver.notify_monitors();

          cout << "\n\n";
          cout << "runtime " << timer.elapsed_time() << " seconds" << std::endl;

          if (auto mc = dynamic_cast<const CheckerboardMetropolisSolver*>(&solver)) {
            cout << "acceptance " << mc->total_acceptance_ratio() << "\n";
          }

          cout << "finish  " << get_date_string(std::chrono::system_clock::now()) << "\n\n";
        }

        {
          cout << ising::section("running post process") << std::endl;
          cout << "start   " << get_date_string(std::chrono::system_clock::now()) << "\n" << std::endl;

          Timer timer;

          for (const auto& m : solver.monitors()) {
            m->post_process();
          }
          cout << "runtime " << timer.elapsed_time() << " seconds" << std::endl;
          cout << "finish  " << get_date_string(std::chrono::system_clock::now()) << "\n\n";
        }
      }
      catch (const ising::GeneralException &gex) {
        ising::die(gex.what());
      }
      catch (const std::exception &e) {
        ising::die(e.what());
      }
    }

    void cleanup_simulation() {
      simulation.reset();
    }
}
