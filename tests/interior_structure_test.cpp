#include "eos_cache.hpp"
#include "interior_structure.hpp"
#include "planet_config.hpp"
#include "profile_errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <gsl/gsl_errno.h>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

// Test fixture for complete body-model evaluations
class InteriorStructureTest : public ::testing::Test {
protected:
  void SetUp() override {
    gsl_set_error_handler_off();
    // Use /tmp directory for test outputs
    test_output_dir = "/tmp/interior_structure_test_outputs";
    std::filesystem::create_directories(test_output_dir);
    config = europa_config();
  }

  void TearDown() override {
    // Cleanup after each test
    try {
      std::filesystem::remove_all(test_output_dir);
    } catch (const std::filesystem::filesystem_error &e) {
      std::cerr << "Warning: Could not remove test directory: " << e.what() << std::endl;
    }
  }

  static size_t countDataLines(const std::string &filename) {
    std::ifstream file(filename);
    std::string line;
    size_t n = 0;
    while (std::getline(file, line)) {
      if (!line.empty() && line[0] != '#') {
        ++n;
      }
    }
    return n;
  }

  std::string test_output_dir;
  PlanetConfig config;
  RunConfig run;
  EOSCache cache;
};

// Test the Europa reference scenario end to end
TEST_F(InteriorStructureTest, EuropaReferenceScenario) {
  // Arrange
  const std::string filename = test_output_dir + "/europa.csv";

  // Act
  ProfileResult result = interior_structure(config, run, cache, filename);

  // Assert
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.name, "Europa");
  EXPECT_GE(result.moi.CMR2mean, 0.341);
  EXPECT_LE(result.moi.CMR2mean, 0.351);
  EXPECT_GT(result.moi.RsilRange_m, 0.0) << "Several interiors should match within uncertainty";
  EXPECT_FALSE(result.moi.matches.empty());
  EXPECT_NEAR(result.PbI_MPa, 41.0, 3.0);
  EXPECT_DOUBLE_EQ(result.Pb_MPa, result.PbI_MPa);
  EXPECT_GT(result.zb_m, 0.0);
  EXPECT_GT(result.QfromMantle_W, 0.0);
  EXPECT_EQ(result.nSurfIce, config.steps.nIceI);

  const LayerArrays &L = result.layers;
  EXPECT_EQ(L.size(),
            static_cast<size_t>(result.moi.nHydro + result.moi.nSil + result.moi.nCore));
  EXPECT_TRUE(L.radiusStrictlyDecreasing());
  EXPECT_TRUE(L.pressureNonDecreasing());
  EXPECT_TRUE(L.depthNonDecreasing());
  EXPECT_NEAR(L.totalMass(), result.moi.Mtot_kg, 1e-6 * config.bulk.M_kg);
  EXPECT_EQ(L.phase.back(), PhaseID::IRON);

  // Written profile
  ASSERT_TRUE(std::filesystem::exists(filename));
  EXPECT_EQ(countDataLines(filename), L.size() + 1) << "Header plus one line per layer";
  std::ifstream file(filename);
  std::string first_line;
  std::getline(file, first_line);
  EXPECT_EQ(first_line, "# Europa");
}

// Test that the CSV writer reports unwritable paths
TEST_F(InteriorStructureTest, WriteProfileToMissingDirectory) {
  ProfileResult result;
  result.name = "empty";
  result.layers.resize(3);

  EXPECT_FALSE(write_profile_csv(result, test_output_dir + "/missing/profile.csv"));
  EXPECT_TRUE(write_profile_csv(result, test_output_dir + "/profile.csv"));
  EXPECT_EQ(countDataLines(test_output_dir + "/profile.csv"), 4u);
}

// Test the layer CSV header
TEST_F(InteriorStructureTest, LayerCsvHeader) {
  LayerArrays layers(2);
  std::ostringstream out;

  layers.writeCsv(out);

  std::istringstream in(out.str());
  std::string header;
  std::getline(in, header);
  EXPECT_EQ(header, "r[m],z[m],P[MPa],T[K],rho[kg/m3],Cp[J/kg/K],alpha[1/K],k[W/m/K],g[m/s2],phi,"
                    "phase,MLayer[kg]");
}

// Test output filename convention
TEST_F(InteriorStructureTest, ProfileFilename) {
  EXPECT_EQ(get_profile_filename("Europa", 269.8), "data/Europa_Tb_269p8.csv");
  EXPECT_EQ(get_profile_filename("Ganymede", 270.0), "data/Ganymede_Tb_270p0.csv");
}

// Test that a broken hydrosphere yields a partial, invalid profile
TEST_F(InteriorStructureTest, BrokenHydrosphereIsInvalid) {
  config.bulk.Tb_K = 280.0;
  run.allow_broken_models = true;

  ProfileResult result;
  EXPECT_NO_THROW(result = interior_structure(config, run, cache));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.layers.size(),
            static_cast<size_t>(config.steps.nIceI + config.steps.nOceanMax));
  EXPECT_TRUE(result.moi.candidates.empty());
}

// Test that model failures propagate as ProfileError
TEST_F(InteriorStructureTest, ModelFailuresPropagate) {
  config.bulk.Cmeasured = 0.2;
  config.bulk.Cuncertainty = 0.001;
  EXPECT_THROW(interior_structure(config, run, cache), NoMoIMatch);

  config = europa_config();
  config.ocean.comp = "NH3";
  EXPECT_THROW(interior_structure(config, run, cache), ProfileError);
}

// Test that repeated evaluations reuse cached EOS tables
TEST_F(InteriorStructureTest, RepeatedEvaluationsReuseCache) {
  interior_structure(config, run, cache);
  const size_t builds = cache.buildCount();

  ProfileResult again = interior_structure(config, run, cache);

  EXPECT_TRUE(again.valid);
  EXPECT_EQ(cache.buildCount(), builds);
}

// Main function is provided by gtest_main library
