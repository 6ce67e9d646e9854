#include "eos_cache.hpp"
#include "layer_propagators.hpp"
#include "moi_matching.hpp"
#include "planet_config.hpp"
#include "profile_errors.hpp"
#include "reference_eos.hpp"
#include "thermal_profiles.hpp"

#include <cmath>
#include <gsl/gsl_errno.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

// Test fixture for moment-of-inertia matching
class MoIMatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    gsl_set_error_handler_off();
    config = europa_config();
    rel_tolerance = 1e-6;
  }

  HydrosphereState buildHydrosphere() {
    HydrosphereIntegrator integrator(config, run, cache, convection);
    return integrator.propagate();
  }

  void expectBestIsClosest(const MoIResult &result) {
    const double best = std::abs(result.candidates[result.best].CMR2 - config.bulk.Cmeasured);
    for (const auto &c : result.candidates) {
      EXPECT_LE(best, std::abs(c.CMR2 - config.bulk.Cmeasured))
          << "Candidate at row " << c.index << " is closer than the best match";
    }
  }

  PlanetConfig config;
  RunConfig run;
  EOSCache cache;
  DeschampsSotinConvection convection;
  double rel_tolerance;
};

// Test constant-density matching for the Europa reference body
TEST_F(MoIMatcherTest, ConstantDensityEuropa) {
  // Arrange
  run.skip_inner = true;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  // Act
  MoIResult result = matcher.calc_moi_constant_rho(hydro, inner);

  // Assert
  ASSERT_FALSE(result.candidates.empty());
  ASSERT_FALSE(result.matches.empty());
  for (size_t k : result.matches) {
    EXPECT_LE(std::abs(result.candidates[k].CMR2 - config.bulk.Cmeasured),
              config.bulk.Cuncertainty);
  }
  expectBestIsClosest(result);

  EXPECT_NEAR(result.CMR2mean, config.bulk.Cmeasured, config.bulk.Cuncertainty);
  EXPECT_LE(result.CMR2min, result.CMR2mean);
  EXPECT_GE(result.CMR2max, result.CMR2mean);
  EXPECT_EQ(result.RsilTrade_m.size(), result.matches.size());
  EXPECT_EQ(result.RcoreTrade_m.size(), result.matches.size());
  EXPECT_GT(result.RsilRange_m, 0.0);
  EXPECT_GT(result.RsilMean_m, result.RcoreMean_m);
  EXPECT_GT(result.RcoreMean_m, 0.0);
  EXPECT_GE(result.nHydro, hydro.nSurfIce);

  EXPECT_DOUBLE_EQ(result.rhoSilMean_kgm3, config.sil.rhoSilWithCore_kgm3);
  EXPECT_DOUBLE_EQ(result.rhoCoreMean_kgm3, config.core.rhoCore());
  EXPECT_NEAR(result.Mtot_kg, config.bulk.M_kg, rel_tolerance * config.bulk.M_kg)
      << "Constant-density interiors conserve the body mass";

  EXPECT_EQ(result.nSil, config.steps.nSilMax);
  EXPECT_EQ(result.nCore, config.steps.nCore);
  ASSERT_EQ(inner.size(), static_cast<size_t>(result.nSil + result.nCore));
  EXPECT_DOUBLE_EQ(inner.r_m.front(), result.RsilMean_m);
  EXPECT_DOUBLE_EQ(inner.r_m[result.nSil], result.RcoreMean_m);
  EXPECT_EQ(inner.phase.front(), PhaseID::SILICATE);
  EXPECT_EQ(inner.phase.back(), PhaseID::IRON);
  EXPECT_TRUE(inner.radiusStrictlyDecreasing());
  EXPECT_TRUE(inner.pressureNonDecreasing());
}

// Test the merged whole-body profile
TEST_F(MoIMatcherTest, InnerLayersMergeBelowHydrosphere) {
  run.skip_inner = true;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  MoIResult result;

  LayerArrays body = matcher.inner_layers(hydro, result);

  ASSERT_EQ(body.size(), static_cast<size_t>(result.nHydro + result.nSil + result.nCore));
  EXPECT_TRUE(body.radiusStrictlyDecreasing());
  EXPECT_TRUE(body.pressureNonDecreasing());
  EXPECT_TRUE(body.depthNonDecreasing());
  EXPECT_FALSE(result.non_equilibrium);
  EXPECT_EQ(result.non_equilibrium_index, -1);

  EXPECT_DOUBLE_EQ(body.P_MPa[result.nHydro], hydro.layers.P_MPa[result.nHydro]);
  EXPECT_EQ(body.phase[result.nHydro - 1], hydro.layers.phase[result.nHydro - 1]);
  EXPECT_EQ(body.phase[result.nHydro], PhaseID::SILICATE);
  EXPECT_EQ(body.phase[result.nHydro + result.nSil], PhaseID::IRON);
  EXPECT_NEAR(body.totalMass(), config.bulk.M_kg, rel_tolerance * config.bulk.M_kg);
}

// Test a core-free body at constant density
TEST_F(MoIMatcherTest, ConstantDensityWithoutCore) {
  // Conduction to the center of a core-free body diverges, so rows stay at constant density
  run.skip_inner = true;
  config.model.Fe_CORE = false;
  config.bulk.Cuncertainty = 0.1;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  MoIResult result = matcher.calc_moi_constant_rho(hydro, inner);

  EXPECT_EQ(result.nCore, 0);
  EXPECT_DOUBLE_EQ(result.RcoreMean_m, 0.0);
  EXPECT_EQ(inner.size(), static_cast<size_t>(config.steps.nSilMax));
  const MoICandidate &best = result.candidates[result.best];
  const double V = 4.0 / 3.0 * PI * std::pow(best.Rsil_m, 3);
  EXPECT_NEAR(best.rhoSil_kgm3 * V + hydro.layers.massAbove()[best.index], config.bulk.M_kg,
              rel_tolerance * config.bulk.M_kg);
  expectBestIsClosest(result);
}

// Test that constant-density sizes are filled from the silicate and core EOS
TEST_F(MoIMatcherTest, ConstantDensitySizesFilledFromEOS) {
  // Arrange
  HydrosphereState hydro = buildHydrosphere();
  LayerArrays constantInner;
  run.skip_inner = true;
  const MoIResult constant =
      MoIMatcher(config, run, cache).calc_moi_constant_rho(hydro, constantInner);
  run.skip_inner = false;
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  // Act
  MoIResult result = matcher.calc_moi_constant_rho(hydro, inner);

  // Assert
  EXPECT_EQ(result.best, constant.best) << "Sizing does not depend on the EOS fill";
  EXPECT_DOUBLE_EQ(result.CMR2mean, constant.CMR2mean);
  EXPECT_DOUBLE_EQ(result.RsilMean_m, constant.RsilMean_m);
  EXPECT_DOUBLE_EQ(result.RcoreMean_m, constant.RcoreMean_m);
  EXPECT_EQ(result.nSil, config.steps.nSilMax);
  EXPECT_EQ(result.nCore, config.steps.nCore);
  ASSERT_EQ(inner.size(), constantInner.size());
  EXPECT_DOUBLE_EQ(inner.r_m.front(), result.RsilMean_m);
  EXPECT_DOUBLE_EQ(inner.r_m[result.nSil], result.RcoreMean_m);
  EXPECT_DOUBLE_EQ(inner.P_MPa.front(), hydro.layers.P_MPa[result.nHydro]);
  EXPECT_EQ(inner.phase.front(), PhaseID::SILICATE);
  EXPECT_EQ(inner.phase.back(), PhaseID::IRON);
  EXPECT_TRUE(inner.radiusStrictlyDecreasing());
  EXPECT_TRUE(inner.pressureNonDecreasing());

  // Rows carry EOS densities and the means follow from them
  const double rhoSilConst = config.sil.rhoSilWithCore_kgm3;
  EXPECT_GT(std::abs(inner.rho_kgm3.front() - rhoSilConst), 1.0);
  double Msil = 0.0;
  for (int j = 0; j < result.nSil; ++j) {
    Msil += inner.MLayer_kg[j];
  }
  const double Vshell = 4.0 / 3.0 * PI *
                        (std::pow(result.RsilMean_m, 3) - std::pow(result.RcoreMean_m, 3));
  EXPECT_NEAR(result.rhoSilMean_kgm3, Msil / Vshell, 1e-9 * rhoSilConst);
  EXPECT_GT(result.rhoCoreMean_kgm3, result.rhoSilMean_kgm3);
  const double MAbove = hydro.layers.massAbove()[result.nHydro];
  EXPECT_NEAR(result.Mtot_kg, MAbove + inner.totalMass(), rel_tolerance * config.bulk.M_kg);
  EXPECT_GT(std::abs(result.Mtot_kg - config.bulk.M_kg), rel_tolerance * config.bulk.M_kg)
      << "EOS densities need not reproduce the body mass";
  EXPECT_TRUE(cache.contains("inner_reference_silicate"));
  EXPECT_TRUE(cache.contains("inner_reference_iron_core"));
}

// Test an unreachable moment of inertia
TEST_F(MoIMatcherTest, NoMatchThrows) {
  config.bulk.Cmeasured = 0.2;
  config.bulk.Cuncertainty = 0.001;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  try {
    matcher.calc_moi_constant_rho(hydro, inner);
    FAIL() << "Expected NoMoIMatch";
  } catch (const NoMoIMatch &e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("Min:"), std::string::npos);
    EXPECT_NE(msg.find("Max:"), std::string::npos);
  }
}

// Test rejection of a core lighter than the mantle
TEST_F(MoIMatcherTest, CoreLighterThanMantleThrows) {
  config.sil.rhoSilWithCore_kgm3 = 9000.0;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  EXPECT_THROW(matcher.calc_moi_constant_rho(hydro, inner), std::invalid_argument);
}

// Test that EOS matching requires an iron core
TEST_F(MoIMatcherTest, EOSModeRequiresCore) {
  config.model.CONSTANT_INNER_DENSITY = false;
  config.model.Fe_CORE = false;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  EXPECT_THROW(matcher.calc_moi_with_eos(hydro, inner), std::invalid_argument);
}

// Test EOS matching for the Europa reference body
TEST_F(MoIMatcherTest, EOSModeEuropa) {
  config.model.CONSTANT_INNER_DENSITY = false;
  config.bulk.Cuncertainty = 0.02;
  run.extrap_sil = true;
  run.extrap_fe = true;
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  MoIResult result;

  LayerArrays body = matcher.inner_layers(hydro, result);

  ASSERT_FALSE(result.matches.empty());
  expectBestIsClosest(result);
  for (const auto &c : result.candidates) {
    EXPECT_LT(c.Mtot_kg, config.bulk.M_kg) << "Kept cores undershoot the body mass";
  }
  EXPECT_NEAR(result.Mtot_kg, config.bulk.M_kg, 0.01 * config.bulk.M_kg);
  EXPECT_GT(result.rhoCoreMean_kgm3, result.rhoSilMean_kgm3);
  EXPECT_GT(result.RsilMean_m, result.RcoreMean_m);
  EXPECT_EQ(result.nCore, config.steps.nCore);
  EXPECT_EQ(body.size(), static_cast<size_t>(result.nHydro + result.nSil + result.nCore));
  EXPECT_TRUE(body.radiusStrictlyDecreasing());
  EXPECT_TRUE(body.pressureNonDecreasing());
  EXPECT_NEAR(body.totalMass(), result.Mtot_kg, rel_tolerance * config.bulk.M_kg)
      << "Merged rows carry the mass of the kept silicate and core";
  EXPECT_NEAR(body.totalMass(), config.bulk.M_kg, 0.01 * config.bulk.M_kg);

  EXPECT_TRUE(cache.contains("inner_reference_silicate_extrap"));
  EXPECT_TRUE(cache.contains("inner_reference_iron_core_extrap"));
}

// Test that a mantle too dense for the body mass is rejected
TEST_F(MoIMatcherTest, EOSModeMassExceeded) {
  // Arrange
  config.model.CONSTANT_INNER_DENSITY = false;
  config.sil.mantle_eos = "dense_silicate";
  run.extrap_sil = true;
  run.extrap_fe = true;
  const ReferenceEOS reference;
  cache.registerInnerSource("dense_silicate", [reference](const EOSGrid &grid) {
    EOSTable table = reference.solidTable(grid, ReferenceMaterial::SILICATE);
    for (double &rho : table.rho_kgm3) {
      rho *= 5.0;
    }
    return table;
  });
  HydrosphereState hydro = buildHydrosphere();
  MoIMatcher matcher(config, run, cache);
  LayerArrays inner;

  // Act & Assert
  try {
    matcher.calc_moi_with_eos(hydro, inner);
    FAIL() << "Expected MassExceededError";
  } catch (const MassExceededError &e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("Min mass"), std::string::npos);
    EXPECT_NE(msg.find("max mass"), std::string::npos);
  }
}

// Main function is provided by gtest_main library
