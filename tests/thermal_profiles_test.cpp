#include "planet_config.hpp"
#include "thermal_profiles.hpp"

#include <cmath>
#include <gsl/gsl_errno.h>
#include <gtest/gtest.h>
#include <stdexcept>

// Ice with uniform properties
class UniformIce : public EOSView {
public:
  double rho_kgm3(double, double) const override { return 920.0; }
  double Cp_JkgK(double, double) const override { return 1900.0; }
  double alpha_pK(double, double) const override { return 1.6e-4; }
  double kTherm_WmK(double, double) const override { return 2.5; }
  int phase(double, double) const override { return PhaseID::ICE_I; }
  EOSBounds bounds() const override { return {0.0, 300.0, 50.0, 300.0}; }
};

// Ice whose properties must not be queried
class UnqueriedIce : public UniformIce {
public:
  double rho_kgm3(double, double) const override { throw std::logic_error("rho queried"); }
  double Cp_JkgK(double, double) const override { throw std::logic_error("Cp queried"); }
  double alpha_pK(double, double) const override { throw std::logic_error("alpha queried"); }
};

// Test fixture for conduction and convection laws
class ThermalProfilesTest : public ::testing::Test {
protected:
  void SetUp() override {
    gsl_set_error_handler_off();
    tolerance = 1e-9;

    europa.Ttop_K = 110.0;
    europa.rTop_m = 1561.0e3;
    europa.kTop_WmK = kThermIsobaricAnderssonInaba2005(110.0, PhaseID::ICE_I);
    europa.Tb_K = 269.8;
    europa.zb_m = 30.0e3;
    europa.gtop_ms2 = 1.315;
    europa.Pmid_MPa = 20.0;
    europa.phase = PhaseID::ICE_I;
  }

  double tolerance;
  ConvectionInput europa{};
  UniformIce ice;
  DeschampsSotinConvection model;
};

// Test that without heating the conductive law conserves heat flow
TEST_F(ThermalProfilesTest, ConductionWithoutHeating) {
  // Arrange
  const double rTop = 1500.0e3;
  const double rBot = 1400.0e3;
  const double k = 4.0;
  const double qTop = 0.02;

  // Act
  const ConductiveResult result =
      conductive_temperature(300.0, rTop, rBot, k, 3300.0, 0.0, 0.0, qTop);

  // Assert
  const double expected = 300.0 + qTop * rTop * rTop / (2.0 * k) * (1.0 / rBot - 1.0 / rTop);
  EXPECT_NEAR(result.Tbot_K, expected, 1e-9 * expected);
  EXPECT_NEAR(result.qBot_Wm2 * rBot * rBot, qTop * rTop * rTop, 1e-9 * qTop * rTop * rTop)
      << "Heat flow through the shell should be conserved without internal heating";
  EXPECT_GT(result.Tbot_K, 300.0);
}

// Test the energy balance with radiogenic and tidal heating
TEST_F(ThermalProfilesTest, ConductionEnergyBalance) {
  const double rTop = 1400.0e3;
  const double rBot = 1300.0e3;
  const double rho = 3300.0;
  const double Qrad = 5.33e-12;
  const double Htidal = 1e-9;
  const double qTop = 0.015;

  const ConductiveResult result =
      conductive_temperature(280.0, rTop, rBot, 4.0, rho, Qrad, Htidal, qTop);

  const double heating =
      rho * (Qrad + Htidal / rho) / 3.0 * (std::pow(rTop, 3) - std::pow(rBot, 3));
  const double outflow = qTop * rTop * rTop - result.qBot_Wm2 * rBot * rBot;
  EXPECT_NEAR(outflow, heating, 1e-6 * heating)
      << "Heat leaving the top should equal heat entering the bottom plus heat generated";
}

// Test the degenerate zero-thickness shell
TEST_F(ThermalProfilesTest, ZeroThicknessShell) {
  const ConductiveResult result =
      conductive_temperature(250.0, 1.0e6, 1.0e6, 3.0, 1000.0, 1e-11, 0.0, 0.05);
  EXPECT_NEAR(result.Tbot_K, 250.0, tolerance);
}

// Test the well-mixed temperature of the Europa reference shell
TEST_F(ThermalProfilesTest, DeschampsSotinEuropaShell) {
  const ConvectionResult result = model.evaluate(europa, ice);

  EXPECT_NEAR(result.Tconv_K, 258.654, 0.01);
  EXPECT_GT(result.Ra, RA_CRIT);
  EXPECT_TRUE(result.convecting);
  EXPECT_GT(result.etaConv_Pas, meltViscosity_Pas(PhaseID::ICE_I))
      << "Interior viscosity should exceed the melting-point value";
  EXPECT_GT(result.eLid_m, 0.0);
  EXPECT_GT(result.deltaTBL_m, 0.0);
  EXPECT_GT(result.qbot_Wm2, 0.0);
  EXPECT_LT(result.Tconv_K, europa.Tb_K);
  EXPECT_GT(result.Tconv_K, europa.Ttop_K);
}

// Test that a thin shell is reported as conductive
TEST_F(ThermalProfilesTest, DeschampsSotinThinShellIsConductive) {
  ConvectionInput thin = europa;
  thin.zb_m = 1.0e3;

  const ConvectionResult result = model.evaluate(thin, ice);

  EXPECT_LT(result.Ra, RA_CRIT);
  EXPECT_FALSE(result.convecting);
  EXPECT_DOUBLE_EQ(result.eLid_m, thin.zb_m);
  EXPECT_DOUBLE_EQ(result.deltaTBL_m, thin.zb_m);
  EXPECT_NEAR(result.qbot_Wm2, 632.0 * std::log(thin.Tb_K / thin.Ttop_K) / thin.zb_m, 1e-9);
}

// Test that a cold underplate whose well-mixed temperature falls below its top is conductive
TEST_F(ThermalProfilesTest, ColdUnderplateSkipsEOSQueries) {
  // Arrange
  ConvectionInput underplate = europa;
  underplate.Ttop_K = 250.0;
  underplate.Tb_K = 252.0;
  underplate.zb_m = 5.0e3;
  underplate.Pmid_MPa = 215.0;
  underplate.phase = PhaseID::ICE_III;
  UnqueriedIce strict;

  // Act
  ConvectionResult result{};
  ASSERT_NO_THROW(result = model.evaluate(underplate, strict));

  // Assert
  EXPECT_LT(result.Tconv_K, underplate.Ttop_K);
  EXPECT_FALSE(result.convecting);
  EXPECT_DOUBLE_EQ(result.Ra, 0.0);
  EXPECT_DOUBLE_EQ(result.eLid_m, underplate.zb_m);
  EXPECT_DOUBLE_EQ(result.deltaTBL_m, underplate.zb_m);
  EXPECT_NEAR(result.qbot_Wm2, 242.0 * std::log(252.0 / 250.0) / underplate.zb_m, 1e-12)
      << "Ice III conductive flux should follow its conductivity integral";
}

// Test the Rayleigh number scaling with shell thickness
TEST_F(ThermalProfilesTest, RayleighNumberScalesWithThicknessCubed) {
  ConvectionInput thicker = europa;
  thicker.zb_m = 2.0 * europa.zb_m;

  const double Ra1 = model.evaluate(europa, ice).Ra;
  const double Ra2 = model.evaluate(thicker, ice).Ra;

  EXPECT_NEAR(Ra2 / Ra1, 8.0, 1e-9);
}

// Test rejection of phases without creep parameters
TEST_F(ThermalProfilesTest, InvalidPhaseThrows) {
  ConvectionInput liquid = europa;
  liquid.phase = PhaseID::LIQUID;
  EXPECT_THROW(model.evaluate(liquid, ice), std::invalid_argument);

  liquid.phase = 4;
  EXPECT_THROW(model.evaluate(liquid, ice), std::invalid_argument);

  EXPECT_THROW(kThermIsobaricAnderssonInaba2005(200.0, PhaseID::CLATHRATE), std::invalid_argument);
  EXPECT_THROW(activationEnergy_kJmol(PhaseID::SILICATE), std::invalid_argument);
}

// Test literature fits
TEST_F(ThermalProfilesTest, LiteratureFits) {
  EXPECT_NEAR(kThermIsobaricAnderssonInaba2005(100.0, PhaseID::ICE_I),
              630.0 * std::pow(100.0, -0.995), tolerance);
  EXPECT_GT(kThermIsobaricAnderssonInaba2005(100.0, PhaseID::ICE_I),
            kThermIsobaricAnderssonInaba2005(250.0, PhaseID::ICE_I))
      << "Ice Ih conductivity should fall with temperature";
  EXPECT_NEAR(TsolidusHirschmann2000(0.0), 1120.661 + 273.15, tolerance);
  EXPECT_GT(TsolidusHirschmann2000(3000.0), TsolidusHirschmann2000(1000.0));
}

// Main function is provided by gtest_main library
