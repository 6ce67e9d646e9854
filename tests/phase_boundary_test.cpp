#include "eos_cache.hpp"
#include "phase_boundary.hpp"
#include "planet_config.hpp"
#include "profile_errors.hpp"

#include <gsl/gsl_errno.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>
#include <vector>

// Classifier with a single step in pressure or temperature. Properties are constant.
class StepEOS : public EOSView {
public:
  StepEOS(int below, int above, double P_step_MPa, double T_step_K)
      : below_(below), above_(above), P_step_(P_step_MPa), T_step_(T_step_K) {}

  double rho_kgm3(double, double) const override { return 1000.0; }
  double Cp_JkgK(double, double) const override { return 4000.0; }
  double alpha_pK(double, double) const override { return 1e-4; }
  double kTherm_WmK(double, double) const override { return 0.5; }
  int phase(double P_MPa, double T_K) const override {
    return (P_MPa >= P_step_ || T_K >= T_step_) ? above_ : below_;
  }
  EOSBounds bounds() const override { return {0.0, 1000.0, 1.0, 1000.0}; }

private:
  int below_;
  int above_;
  double P_step_;
  double T_step_;
};

// Step classifier over a table that ends at Tmax and refuses queries beyond it
class BoundedStepEOS : public StepEOS {
public:
  BoundedStepEOS(int below, int above, double T_step_K, double Tmax_K)
      : StepEOS(below, above, 1e9, T_step_K), Tmax_(Tmax_K) {}

  int phase(double P_MPa, double T_K) const override {
    if (T_K > Tmax_) {
      throw EOSRangeError("queried above the table edge");
    }
    return StepEOS::phase(P_MPa, T_K);
  }
  EOSBounds bounds() const override { return {0.0, 1000.0, 1.0, Tmax_}; }

private:
  double Tmax_;
};

// Test fixture for the phase boundary solver
class PhaseBoundaryTest : public ::testing::Test {
protected:
  void SetUp() override {
    gsl_set_error_handler_off();
    Pres = 0.1;
    Tres = 0.05;
    NEVER = 1e9;
  }

  double Pres;
  double Tres;
  double NEVER;
};

// Test that melting searches land just past the boundary for several brackets
TEST_F(PhaseBoundaryTest, MeltingPressureWithinResolution) {
  // Arrange
  const double boundary = 41.6;
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, boundary, NEVER);
  const std::vector<std::pair<double, double>> brackets = {
      {5.0, 300.0}, {40.0, 42.0}, {0.0, 1000.0}, {41.0, 41.7}};

  for (const auto &bracket : brackets) {
    // Act
    const double P = find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, bracket.first,
                                          bracket.second, Pres, UnderplateMode::NO_UNDERPLATE);

    // Assert
    EXPECT_NEAR(P, boundary + Pres / 5.0, Pres)
        << "Bracket [" << bracket.first << ", " << bracket.second << "]";
    EXPECT_EQ(eos.phase(P, 260.0), PhaseID::LIQUID)
        << "Result should lie on the liquid side of the boundary";
  }
}

// Test the underplating direction toward a denser polymorph
TEST_F(PhaseBoundaryTest, UnderplatePressure) {
  const double boundary = 208.6;
  StepEOS eos(PhaseID::ICE_I, PhaseID::ICE_III, boundary, NEVER);

  const double P = find_freeze_pressure(eos, PhaseID::ICE_I, 250.0, 5.0, 300.0, Pres,
                                        UnderplateMode::UNDERPLATE);

  EXPECT_NEAR(P, boundary + Pres / 5.0, Pres);
  EXPECT_EQ(eos.phase(P, 250.0), PhaseID::ICE_III);
}

// Test that UNSET falls back to melting when no underplate exists
TEST_F(PhaseBoundaryTest, UnsetModeFallsBackToMelting) {
  const double boundary = 120.0;
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, boundary, NEVER);

  const double P =
      find_freeze_pressure(eos, PhaseID::ICE_I, 265.0, 5.0, 300.0, Pres, UnderplateMode::UNSET);

  EXPECT_NEAR(P, boundary + Pres / 5.0, Pres);
}

// Test that a missing underplate transition is an error in UNDERPLATE mode
TEST_F(PhaseBoundaryTest, MissingUnderplateThrows) {
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, 41.6, NEVER);

  EXPECT_THROW(find_freeze_pressure(eos, PhaseID::ICE_I, 269.8, 5.0, 300.0, Pres,
                                    UnderplateMode::UNDERPLATE),
               NoUnderplatePressure);
}

// Test that a bracket without a transition throws or returns the sentinel
TEST_F(PhaseBoundaryTest, NoTransitionInBracket) {
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, 500.0, NEVER);

  EXPECT_THROW(find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, 5.0, 300.0, Pres,
                                    UnderplateMode::UNSET),
               NoFreezePressureFound);

  BoundarySearchOptions opts;
  opts.allow_broken = true;
  double P = 0.0;
  EXPECT_NO_THROW(P = find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, 5.0, 300.0, Pres,
                                           UnderplateMode::UNSET, opts));
  EXPECT_TRUE(isNotFound(P));

  EXPECT_TRUE(isNotFound(find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, 5.0, 300.0, Pres,
                                              UnderplateMode::UNDERPLATE, opts)));
}

// Test rejection of empty brackets and non-positive resolutions
TEST_F(PhaseBoundaryTest, InvalidBracket) {
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, 41.6, NEVER);

  EXPECT_THROW(find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, 300.0, 5.0, Pres,
                                    UnderplateMode::UNSET),
               std::invalid_argument);
  EXPECT_THROW(find_freeze_pressure(eos, PhaseID::ICE_I, 260.0, 5.0, 300.0, 0.0,
                                    UnderplateMode::UNSET),
               std::invalid_argument);
  EXPECT_THROW(find_freeze_temperature(eos, 100.0, 250.0, -10.0, Tres), std::invalid_argument);
}

// Test melting temperature search along an isobar
TEST_F(PhaseBoundaryTest, MeltingTemperatureWithinResolution) {
  const double boundary = 252.3;
  StepEOS eos(PhaseID::ICE_III, PhaseID::LIQUID, NEVER, boundary);

  for (double range : {5.0, 20.0, 50.0}) {
    const double T = find_freeze_temperature(eos, 220.0, 250.0, range, Tres);
    EXPECT_NEAR(T, boundary + Tres / 5.0, Tres) << "Range " << range << " K";
  }

  EXPECT_THROW(find_freeze_temperature(eos, 220.0, 200.0, 10.0, Tres), NoFreezePressureFound);

  BoundarySearchOptions opts;
  opts.allow_broken = true;
  EXPECT_TRUE(isNotFound(find_freeze_temperature(eos, 220.0, 200.0, 10.0, Tres, opts)));
}

// Test that melting searches stop at the edge of a strict table
TEST_F(PhaseBoundaryTest, MeltingTemperatureCappedAtTableEdge) {
  const double boundary = 252.3;
  BoundedStepEOS eos(PhaseID::ICE_III, PhaseID::LIQUID, boundary, 260.0);

  double T = 0.0;
  ASSERT_NO_THROW(T = find_freeze_temperature(eos, 220.0, 250.0, 50.0, Tres));
  EXPECT_NEAR(T, boundary + Tres / 5.0, Tres);

  // Boundary beyond the table edge
  BoundedStepEOS cold(PhaseID::ICE_III, PhaseID::LIQUID, 270.0, 260.0);
  EXPECT_THROW(find_freeze_temperature(cold, 220.0, 250.0, 50.0, Tres), NoFreezePressureFound);
}

// Test the objective signs on both sides of a transition
TEST_F(PhaseBoundaryTest, ObjectiveSigns) {
  StepEOS eos(PhaseID::ICE_I, PhaseID::LIQUID, 50.0, NEVER);
  const PhaseChangeObjective melting{eos, PhaseID::ICE_I, 260.0, SearchAxis::PRESSURE, false};

  EXPECT_GT(melting(10.0), 0.0);
  EXPECT_LT(melting(60.0), 0.0);

  StepEOS denser(PhaseID::ICE_I, PhaseID::ICE_III, 50.0, NEVER);
  const PhaseChangeObjective underplate{denser, PhaseID::ICE_I, 250.0, SearchAxis::PRESSURE,
                                        true};
  EXPECT_GT(underplate(10.0), 0.0);
  EXPECT_LT(underplate(60.0), 0.0);
}

// Test against the reference ocean: ice Ih melting under Europa-like conditions
TEST_F(PhaseBoundaryTest, ReferenceOceanIceIhMelting) {
  EOSCache cache;
  OceanEOSRequest req;
  req.range = {0.0, 350.0, 0.5, 110.0, 320.0, 1.0};
  auto ocean = cache.getOceanEOS(req);

  const double PbI = find_freeze_pressure(*ocean, PhaseID::ICE_I, 269.8, 5.0, 300.0, Pres,
                                          UnderplateMode::UNSET);

  EXPECT_NEAR(PbI, 41.0, 3.0) << "Ice Ih should melt near 42 MPa at 269.8 K";
  EXPECT_EQ(ocean->phase(PbI, 269.8), PhaseID::LIQUID);
  EXPECT_EQ(ocean->phase(PbI - 2.0, 269.8), PhaseID::ICE_I);
}

// Test that a failed search leaves the cache untouched
TEST_F(PhaseBoundaryTest, FailedSearchDoesNotTouchCache) {
  EOSCache cache;
  OceanEOSRequest req;
  req.range = {0.0, 350.0, 0.5, 110.0, 320.0, 1.0};
  auto ocean = cache.getOceanEOS(req);
  const size_t entries = cache.size();
  const size_t builds = cache.buildCount();

  // Warm enough that the whole bracket is liquid
  EXPECT_THROW(find_freeze_pressure(*ocean, PhaseID::ICE_I, 300.0, 5.0, 300.0, Pres,
                                    UnderplateMode::UNSET),
               NoFreezePressureFound);

  EXPECT_EQ(cache.size(), entries);
  EXPECT_EQ(cache.buildCount(), builds);
}

// Main function is provided by gtest_main library
