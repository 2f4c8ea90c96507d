#ifndef ISING_TEST_SOLVERS_CHECKERBOARD_SOLVER_H
#define ISING_TEST_SOLVERS_CHECKERBOARD_SOLVER_H

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <libconfig.h++>

#include "ising/common.h"
#include "ising/core/lattice.h"
#include "ising/core/monitor.h"
#include "ising/core/solver.h"
#include "ising/helpers/exception.h"
#include "ising/helpers/output.h"
#include "ising/helpers/random.h"
#include "ising/solvers/checkerboard_sweep.h"
#include "ising/solvers/cpu_monte_carlo_checkerboard.h"
#include "ising/test/output.h"

namespace {
    std::vector<std::string> read_lines(const std::string& filename) {
      std::ifstream file(filename);
      std::vector<std::string> lines;
      std::string line;
      while (std::getline(file, line)) {
        lines.push_back(line);
      }
      return lines;
    }
}

class CheckerboardSolverTest : public ::testing::Test {
protected:
    void SetUp() override {
      ising::testing::toggle_cout();
      ising::instance().set_output_dir(::testing::TempDir() + "ising_solver_test");
      ising::instance().set_simulation_name("solver_test");
    }

    void TearDown() override {
      solver_.reset();
      ising::testing::toggle_cout();
    }

    void create(const std::string& config_string) {
      config_.reset(new libconfig::Config);
      config_->readString(config_string);
      solver_.reset(ising::Solver::create(config_->lookup("solver"), lattice_, gen_));
      solver_->initialize(config_->lookup("solver"));
      if (config_->exists("monitors")) {
        const libconfig::Setting& monitors = config_->lookup("monitors");
        for (auto i = 0; i < monitors.getLength(); ++i) {
          solver_->register_monitor(ising::Monitor::create(monitors[i]));
        }
      }
    }

    void run_to_completion() {
      while (solver_->is_running()) {
        solver_->notify_monitors();
        solver_->run();
      }
    }

    ising::Lattice lattice_{8, 8};
    ising::RandomGeneratorType gen_ = ising::make_random_generator(31);
    std::unique_ptr<libconfig::Config> config_;
    std::unique_ptr<ising::Solver> solver_;
};

TEST_F(CheckerboardSolverTest, factory_and_settings) {
  create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 10; temperature = 2.0; };)");

  ASSERT_EQ(solver_->name(), "monte-carlo-checkerboard-cpu");
  EXPECT_EQ(solver_->max_steps(), 10);
  EXPECT_EQ(solver_->iteration(), 0);

  auto mc = dynamic_cast<ising::CheckerboardMetropolisSolver*>(solver_.get());
  ASSERT_NE(mc, nullptr);
  EXPECT_DOUBLE_EQ(mc->beta(), 0.5);
}

TEST_F(CheckerboardSolverTest, default_beta) {
  create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; };)");

  auto mc = dynamic_cast<ising::CheckerboardMetropolisSolver*>(solver_.get());
  ASSERT_NE(mc, nullptr);
  EXPECT_DOUBLE_EQ(mc->beta(), ising::kDefaultBeta);
}

TEST_F(CheckerboardSolverTest, invalid_settings) {
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; beta = 0.0; };)"),
               ising::ConfigException);
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; beta = -0.4; };)"),
               ising::ConfigException);
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; beta = 0.4; temperature = 2.5; };)"),
               ising::ConfigException);
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = -1; };)"),
               ising::ConfigException);
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-wolff-cpu"; max_steps = 1; };)"),
               ising::ConfigException);
  EXPECT_THROW(create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; };)"),
               libconfig::SettingNotFoundException);
}

TEST_F(CheckerboardSolverTest, run_matches_kernel) {
  const ising::Lattice initial = lattice_;
  auto reference_gen = gen_;
  ising::Lattice reference = initial;
  ising::run(reference, 10, 0.3, reference_gen);

  create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 10; beta = 0.3; };)");
  run_to_completion();

  EXPECT_EQ(solver_->iteration(), 10);
  EXPECT_FALSE(solver_->is_running());
  EXPECT_EQ(lattice_, reference);
  EXPECT_EQ(gen_, reference_gen);
}

TEST_F(CheckerboardSolverTest, zero_steps) {
  const ising::Lattice initial = lattice_;

  create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 0; };)");
  EXPECT_FALSE(solver_->is_running());
  run_to_completion();

  EXPECT_EQ(lattice_, initial);
}

TEST_F(CheckerboardSolverTest, monitors_write_files) {
  create(R"(
    solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 10; beta = 0.4; output_write_steps = 5; };
    monitors = (
      { module = "magnetisation"; output_steps = 5; },
      { module = "energy"; output_steps = 2; }
    );
  )");

  ASSERT_EQ(solver_->monitors().size(), 2);
  EXPECT_EQ(solver_->monitors()[0]->name(), "magnetisation");
  EXPECT_EQ(solver_->monitors()[1]->output_step_freq(), 2);

  run_to_completion();
  for (const auto& m : solver_->monitors()) {
    m->post_process();
  }

  // units line, header line, then one row per update
  auto mag = read_lines(ising::output::full_path_filename("mag.tsv"));
  ASSERT_EQ(mag.size(), 2 + 2);
  EXPECT_EQ(mag[0].find("# {"), 0);
  EXPECT_NE(mag[1].find("m_abs"), std::string::npos);

  // initial state of a fully aligned lattice
  std::istringstream first_row(mag[2]);
  double step, m, m_abs;
  first_row >> step >> m >> m_abs;
  EXPECT_EQ(step, 0);
  EXPECT_DOUBLE_EQ(m, 1.0);
  EXPECT_DOUBLE_EQ(m_abs, 1.0);

  auto eng = read_lines(ising::output::full_path_filename("eng.tsv"));
  EXPECT_EQ(eng.size(), 2 + 5);

  auto stats = read_lines(ising::output::full_path_filename("monte_carlo_stats.tsv"));
  EXPECT_EQ(stats.size(), 2 + 2);
}

TEST_F(CheckerboardSolverTest, verbose_monitor_echoes_values) {
  create(R"(
    solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 0; };
    monitors = (
      { module = "energy"; output_steps = 1; verbose = true; },
      { module = "magnetisation"; output_steps = 1; }
    );
  )");

  ASSERT_EQ(solver_->monitors().size(), 2);
  EXPECT_TRUE(solver_->monitors()[0]->verbose_is_enabled());
  EXPECT_FALSE(solver_->monitors()[1]->verbose_is_enabled());

  std::stringstream captured;
  auto sbuf = std::cout.rdbuf(captured.rdbuf());
  solver_->notify_monitors();
  std::cout.rdbuf(sbuf);

  // fully aligned 8x8 lattice: e = -4 per site
  double e;
  std::string label;
  int step;
  captured >> label >> step >> e;
  EXPECT_EQ(label, "energy");
  EXPECT_EQ(step, 0);
  EXPECT_DOUBLE_EQ(e, -4.0);
  EXPECT_EQ(captured.str().find("magnetisation"), std::string::npos);
}

TEST_F(CheckerboardSolverTest, invalid_monitors) {
  EXPECT_THROW(create(R"(
    solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; };
    monitors = ( { module = "structure-factor"; } );
  )"), ising::ConfigException);

  EXPECT_THROW(create(R"(
    solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 1; };
    monitors = ( { module = "energy"; output_steps = 0; } );
  )"), ising::ConfigException);
}

TEST_F(CheckerboardSolverTest, acceptance_ratio) {
  create(R"(solver = { module = "monte-carlo-checkerboard-cpu"; max_steps = 3; beta = 0.0; };)");

  auto mc = dynamic_cast<ising::CheckerboardMetropolisSolver*>(solver_.get());
  ASSERT_NE(mc, nullptr);
  EXPECT_DOUBLE_EQ(mc->total_acceptance_ratio(), 0.0);

  run_to_completion();
  EXPECT_DOUBLE_EQ(mc->total_acceptance_ratio(), 1.0);
}

#endif // ISING_TEST_SOLVERS_CHECKERBOARD_SOLVER_H
