#ifndef PLANET_CONFIG_HPP
#define PLANET_CONFIG_HPP

/**
 * @file planet_config.hpp
 * @brief Physical constants, phase tags and configuration records for body-model evaluations
 * @date 2025-08-11
 *
 * @details Every body-model evaluation is driven by a PlanetConfig (what the body is) and a
 * RunConfig (how the run behaves). Both are plain records with defaults, so a caller only
 * overrides what differs from the Europa-like baseline.
 *
 * Units used throughout the project:
 * - Pressure: MPa
 * - Temperature: K
 * - Radius, depth: m
 * - Density: kg/m^3, mass: kg
 * - Heat capacity: J/kg/K, expansivity: 1/K, conductivity: W/m/K
 */

#include <algorithm>
#include <cmath>
#include <string>

inline constexpr double G = 6.673e-11;      // Gravitational constant (m^3/kg/s^2)
inline constexpr double R_GAS = 8.314;      // Gas constant (J/mol/K)
inline constexpr double PI = 3.14159265358979323846;

/**
 * @brief Integer phase tags shared by every EOS classifier and the layer arrays.
 */
struct PhaseID {
  static constexpr int LIQUID = 0;
  static constexpr int ICE_I = 1;
  static constexpr int ICE_II = 2;
  static constexpr int ICE_III = 3;
  static constexpr int ICE_V = 5;
  static constexpr int ICE_VI = 6;
  static constexpr int CLATHRATE = 30;
  static constexpr int SILICATE = 50;
  static constexpr int IRON = 100;
};

/**
 * @brief Human-readable name of a phase tag ("Ih", "III", "liquid", ...).
 * @throws std::invalid_argument for a tag with no associated material
 */
std::string phaseName(int phase);

/**
 * @brief Whether a tag belongs to one of the water-ice polymorphs.
 */
inline bool isIcePhase(int phase) {
  return phase == PhaseID::ICE_I || phase == PhaseID::ICE_II || phase == PhaseID::ICE_III ||
         phase == PhaseID::ICE_V || phase == PhaseID::ICE_VI;
}

/**
 * @brief Pressure-closure porosity law, phi(P) = phi_surface * exp(-P / P_closure).
 */
struct PorosityModel {
  bool enabled = false;
  double phi_surface_frac = 0.0;
  double P_closure_MPa = 20.0;
  double rho_pore_kgm3 = 1000.0; // density of whatever fills the pores

  [[nodiscard]] double porosity(double P_MPa) const {
    if (!enabled || phi_surface_frac <= 0.0) {
      return 0.0;
    }
    return phi_surface_frac * std::exp(-std::max(P_MPa, 0.0) / P_closure_MPa);
  }
};

struct BulkParameters {
  double R_m = 1561.0e3;
  double M_kg = 4.7991e22;
  double Cmeasured = 0.346;
  double Cuncertainty = 0.005;
  double Tsurf_K = 110.0;
  double Psurf_MPa = 0.0;
  double Tb_K = 269.8;     // bottom of the ice I shell
  double TbIII_K = 252.0;  // bottom of an ice III underplate
  double TbV_K = 258.0;    // bottom of an ice V underplate
  double zbChangeTol_frac = 0.05;
};

struct OceanParameters {
  std::string comp = "PureH2O";
  double w_ppt = 0.0;
  std::string elec_type = "Vance2018";
  double PHydroMax_MPa = 350.0;
  double THydroMax_K = 320.0;
  double deltaP_eos_MPa = 0.5;
  double deltaT_eos_K = 1.0;
};

struct IceShellParameters {
  PorosityModel porosity;
  double PbClath_MPa = 5.0;   // bottom of the clathrate lid
  double TbClath_K = 200.0;
  double deltaP_eos_MPa = 0.5;
  double deltaT_eos_K = 1.0;
};

struct SilicateParameters {
  double rhoSilWithCore_kgm3 = 3539.0;
  double kTherm_WmK = 4.0;
  double Cp_JkgK = 920.0;      // constant-density mode only
  double alpha_pK = 3.0e-5;    // constant-density mode only
  double Qrad_Wkg = 5.33e-12;
  double Htidal_Wm3 = 0.0;
  std::string mantle_eos = "reference_silicate";
  PorosityModel porosity;
  double PsilMax_MPa = 0.0;    // <= 0 derives an upper bound from bulk M and R
  double TsilMax_K = 10000.0;  // conductive mantles reach ~7000 K above a Europa-sized core
  double deltaP_eos_MPa = 50.0;
  double deltaT_eos_K = 50.0;
};

struct CoreParameters {
  double rhoFe_kgm3 = 8000.0;
  double rhoFeS_kgm3 = 5150.0;
  double xFeS = 0.0;
  double rhoMin_kgm3 = 5000.0; // lightest admissible core, bounds the largest core radius
  double kTherm_WmK = 33.0;
  double Cp_JkgK = 840.0;      // constant-density mode only
  double alpha_pK = 1.0e-5;    // constant-density mode only
  std::string core_eos = "reference_iron_core";

  /// Fe-FeS mixture density.
  [[nodiscard]] double rhoCore() const {
    return rhoFeS_kgm3 * rhoFe_kgm3 / (xFeS * (rhoFe_kgm3 - rhoFeS_kgm3) + rhoFeS_kgm3);
  }
};

struct StepParameters {
  int nClath = 30;
  int nIceI = 200;
  int nIceIIILitho = 50;
  int nIceVLitho = 50;
  int nOceanMax = 350;
  int nSilMax = 500;
  int nCore = 10;
};

struct ModelSwitches {
  bool CLATHRATE = false;
  bool NO_ICE_CONVECTION = false;
  bool BOTTOM_ICEIII = false;
  bool BOTTOM_ICEV = false;
  bool CONSTANT_INNER_DENSITY = true;
  bool Fe_CORE = true;
};

/**
 * @brief Everything that describes one body model.
 */
struct PlanetConfig {
  std::string name = "Europa";
  BulkParameters bulk;
  OceanParameters ocean;
  IceShellParameters ice;
  SilicateParameters sil;
  CoreParameters core;
  StepParameters steps;
  ModelSwitches model;

  // Freeze-boundary searches
  double PfreezeLower_MPa = 5.0;
  double PfreezeUpper_MPa = 300.0;
  double PfreezeRes_MPa = 0.1;
  double TfreezeRange_K = 50.0;
  double TfreezeRes_K = 0.05;
};

/**
 * @brief Run-wide toggles, independent of the body being modeled.
 */
struct RunConfig {
  bool verbose = false;
  int progress_stride = 50;
  bool allow_broken_models = false;
  bool force_eos_recalc = false;
  bool skip_inner = false; // keep constant-density silicate and core rows, no EOS evaluation
  bool extrap_ocean = false;
  bool extrap_ice = false;
  bool extrap_sil = false;
  bool extrap_fe = false;
};

/**
 * @brief Preset used by the example driver and the regression tests.
 */
PlanetConfig europa_config();

#endif // PLANET_CONFIG_HPP
