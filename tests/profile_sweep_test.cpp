#include "planet_config.hpp"
#include "profile_sweep.hpp"
#include "thermal_profiles.hpp"

#include <gsl/gsl_errno.h>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Test fixture for multi-model sweeps
class ProfileSweepTest : public ::testing::Test {
protected:
  void SetUp() override {
    gsl_set_error_handler_off();
    base = europa_config();
    base.steps.nIceI = 100;
    base.steps.nOceanMax = 150;
    base.steps.nSilMax = 200;
  }

  PlanetConfig base;
  RunConfig run;
  DeschampsSotinConvection convection;
};

// Test evenly spaced bottom temperatures and their names
TEST_F(ProfileSweepTest, MakeTbSweep) {
  std::vector<PlanetConfig> configs = make_tb_sweep(base, 266.0, 272.0, 4);

  ASSERT_EQ(configs.size(), 4u);
  EXPECT_DOUBLE_EQ(configs[0].bulk.Tb_K, 266.0);
  EXPECT_DOUBLE_EQ(configs[1].bulk.Tb_K, 268.0);
  EXPECT_DOUBLE_EQ(configs[3].bulk.Tb_K, 272.0);
  EXPECT_EQ(configs[0].name, "Europa_Tb266.00");
  EXPECT_EQ(configs[3].name, "Europa_Tb272.00");
  EXPECT_EQ(configs[2].steps.nIceI, base.steps.nIceI);

  std::vector<PlanetConfig> single = make_tb_sweep(base, 269.8, 269.8, 1);
  ASSERT_EQ(single.size(), 1u);
  EXPECT_DOUBLE_EQ(single[0].bulk.Tb_K, 269.8);

  EXPECT_THROW(make_tb_sweep(base, 266.0, 272.0, 0), std::invalid_argument);
  EXPECT_THROW(make_tb_sweep(base, 272.0, 266.0, 3), std::invalid_argument);
}

// Test that a failing model does not affect the others
TEST_F(ProfileSweepTest, FailuresAreIsolated) {
  // Arrange
  std::vector<PlanetConfig> configs = make_tb_sweep(base, 268.0, 271.0, 3);
  PlanetConfig bad = base;
  bad.name = "Europa_glycerol";
  bad.ocean.comp = "Glycerol";
  configs.insert(configs.begin() + 1, bad);

  // Act
  std::vector<SweepResult> results = sweep_profiles(configs, run, convection);

  // Assert
  ASSERT_EQ(results.size(), configs.size());
  for (size_t i = 0; i < configs.size(); ++i) {
    EXPECT_EQ(results[i].name, configs[i].name) << "Results should keep the input order";
  }
  EXPECT_FALSE(results[1].ok);
  EXPECT_NE(results[1].error.find("Glycerol"), std::string::npos);

  for (size_t i : {0u, 2u, 3u}) {
    EXPECT_TRUE(results[i].ok) << results[i].name << ": " << results[i].error;
    EXPECT_TRUE(results[i].profile.valid);
    EXPECT_NEAR(results[i].profile.Tb_K, configs[i].bulk.Tb_K, 1e-12);
  }
  // Warmer bottoms melt at lower pressure
  EXPECT_GT(results[0].profile.PbI_MPa, results[3].profile.PbI_MPa);
}

// Test that a broken model is reported without an exception
TEST_F(ProfileSweepTest, BrokenModelReported) {
  run.allow_broken_models = true;
  PlanetConfig warm = base;
  warm.name = "Europa_warm";
  warm.bulk.Tb_K = 280.0;

  std::vector<SweepResult> results = sweep_profiles({base, warm}, run, convection);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok);
  EXPECT_FALSE(results[1].ok);
  EXPECT_FALSE(results[1].profile.valid);
  EXPECT_FALSE(results[1].error.empty());
}

// Test that verbose sweeps report one intact line per model
TEST_F(ProfileSweepTest, VerboseSweepReportsEachModel) {
  // Arrange
  run.verbose = true;
  std::vector<PlanetConfig> configs = make_tb_sweep(base, 268.0, 271.0, 3);

  // Act
  testing::internal::CaptureStdout();
  std::vector<SweepResult> results = sweep_profiles(configs, run, convection);
  const std::string output = testing::internal::GetCapturedStdout();

  // Assert
  ASSERT_EQ(results.size(), configs.size());
  for (const auto &r : results) {
    EXPECT_TRUE(r.ok) << r.name << ": " << r.error;
  }
  for (const auto &c : configs) {
    EXPECT_NE(output.find("Evaluated " + c.name + "\n"), std::string::npos)
        << "Missing summary line for " << c.name;
  }
  std::istringstream lines(output);
  std::string line;
  int summaries = 0;
  while (std::getline(lines, line)) {
    if (line.rfind("Evaluated ", 0) == 0) {
      ++summaries;
      EXPECT_EQ(line.find("Evaluated ", 1), std::string::npos) << "Interleaved line: " << line;
    }
  }
  EXPECT_EQ(summaries, 3);
}

// Test an empty sweep
TEST_F(ProfileSweepTest, EmptySweep) {
  std::vector<SweepResult> results = sweep_profiles({}, run, convection);
  EXPECT_TRUE(results.empty());
}

// Main function is provided by gtest_main library
