#include "reference_eos.hpp"
#include "planet_config.hpp"
#include "thermal_profiles.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// IAPWS R14-08 melting-pressure constants
constexpr double P_TRIPLE_IH_MPa = 611.657e-6;
constexpr double T_TRIPLE_IH_K = 273.16;
constexpr double P_IH_III_MPa = 208.566;
constexpr double T_IH_III_K = 251.165;
constexpr double P_III_V_MPa = 350.1;
constexpr double T_III_V_K = 256.164;
constexpr double P_V_VI_MPa = 632.4;
constexpr double T_V_VI_K = 273.31;

double meltingPressureIh(double T_K) {
  static const double a[3] = {0.119539337e7, 0.808183159e5, 0.333826860e4};
  static const double b[3] = {0.300000e1, 0.257500e2, 0.103750e3};
  const double theta = T_K / T_TRIPLE_IH_K;
  double sum = 1.0;
  for (int i = 0; i < 3; ++i) {
    sum += a[i] * (1.0 - std::pow(theta, b[i]));
  }
  return P_TRIPLE_IH_MPa * sum;
}

// Melting pressure of Ih decreases monotonically with T on [251.165, 273.16] K.
double meltingTemperatureIh(double P_MPa) {
  double lo = T_IH_III_K;
  double hi = T_TRIPLE_IH_K;
  if (P_MPa <= P_TRIPLE_IH_MPa) {
    return T_TRIPLE_IH_K;
  }
  for (int iter = 0; iter < 60; ++iter) {
    const double mid = 0.5 * (lo + hi);
    if (meltingPressureIh(mid) > P_MPa) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return 0.5 * (lo + hi);
}

// Inverse of P/Pref = 1 - a (1 - theta^b)
double meltingTemperatureSimon(double P_MPa, double Pref_MPa, double Tref_K, double a, double b) {
  const double thetaB = 1.0 - (1.0 - P_MPa / Pref_MPa) / a;
  return Tref_K * std::pow(std::max(thetaB, 0.0), 1.0 / b);
}

std::vector<MeltingPoint> liquidusAlong(const std::vector<double> &P_MPa) {
  std::vector<MeltingPoint> liquidus;
  liquidus.reserve(P_MPa.size());
  for (double P : P_MPa) {
    liquidus.push_back(ReferenceEOS::waterMeltingPoint(P));
  }
  return liquidus;
}

} // namespace

ReferenceMaterialData ReferenceEOS::getMaterialParameters(ReferenceMaterial material) const {
  switch (material) {
  case ReferenceMaterial::WATER:
    return ReferenceMaterialData("water", PhaseID::LIQUID, 1000.0, 2200.0, 1.0e-4, 273.15,
                                 4190.0, 0.55);
  case ReferenceMaterial::ICE_IH:
    return ReferenceMaterialData("ice Ih", PhaseID::ICE_I, 917.0, 9.0e3, 1.6e-4, 250.0, 0.0, 0.0);
  case ReferenceMaterial::ICE_II:
    return ReferenceMaterialData("ice II", PhaseID::ICE_II, 1170.0, 11.0e3, 1.5e-4, 250.0, 0.0,
                                 0.0);
  case ReferenceMaterial::ICE_III:
    return ReferenceMaterialData("ice III", PhaseID::ICE_III, 1160.0, 9.0e3, 2.0e-4, 250.0, 0.0,
                                 0.0);
  case ReferenceMaterial::ICE_V:
    return ReferenceMaterialData("ice V", PhaseID::ICE_V, 1235.0, 13.0e3, 1.5e-4, 250.0, 0.0, 0.0);
  case ReferenceMaterial::ICE_VI:
    return ReferenceMaterialData("ice VI", PhaseID::ICE_VI, 1310.0, 15.0e3, 1.5e-4, 250.0, 0.0,
                                 0.0);
  case ReferenceMaterial::CLATHRATE:
    return ReferenceMaterialData("sI clathrate", PhaseID::CLATHRATE, 940.0, 8.0e3, 1.0e-4, 250.0,
                                 0.0, 0.5);
  case ReferenceMaterial::SILICATE:
    return ReferenceMaterialData("silicate", PhaseID::SILICATE, 3300.0, 1.25e5, 3.0e-5, 300.0,
                                 920.0, 4.0);
  case ReferenceMaterial::IRON_CORE:
    return ReferenceMaterialData("Fe-FeS core", PhaseID::IRON, 5500.0, 1.3e5, 1.0e-5, 300.0,
                                 840.0, 33.0);
  default:
    throw std::invalid_argument("Unknown reference material");
  }
}

ReferenceMaterial ReferenceEOS::materialForPhase(int phase) {
  switch (phase) {
  case PhaseID::ICE_I:
    return ReferenceMaterial::ICE_IH;
  case PhaseID::ICE_II:
    return ReferenceMaterial::ICE_II;
  case PhaseID::ICE_III:
    return ReferenceMaterial::ICE_III;
  case PhaseID::ICE_V:
    return ReferenceMaterial::ICE_V;
  case PhaseID::ICE_VI:
    return ReferenceMaterial::ICE_VI;
  case PhaseID::CLATHRATE:
    return ReferenceMaterial::CLATHRATE;
  case PhaseID::SILICATE:
    return ReferenceMaterial::SILICATE;
  case PhaseID::IRON:
    return ReferenceMaterial::IRON_CORE;
  default:
    throw std::invalid_argument("No reference solid for phase " + std::to_string(phase));
  }
}

MeltingPoint ReferenceEOS::waterMeltingPoint(double P_MPa) {
  if (P_MPa < P_IH_III_MPa) {
    return {meltingTemperatureIh(P_MPa), PhaseID::ICE_I};
  }
  if (P_MPa < P_III_V_MPa) {
    return {meltingTemperatureSimon(P_MPa, P_IH_III_MPa, T_IH_III_K, 0.299948, 60.0),
            PhaseID::ICE_III};
  }
  if (P_MPa < P_V_VI_MPa) {
    return {meltingTemperatureSimon(P_MPa, P_III_V_MPa, T_III_V_K, 1.18721, 8.0), PhaseID::ICE_V};
  }
  return {meltingTemperatureSimon(P_MPa, P_V_VI_MPa, T_V_VI_K, 1.07476, 4.6), PhaseID::ICE_VI};
}

int ReferenceEOS::waterPhase(double P_MPa, double T_K, double depression_K) {
  const MeltingPoint melt = waterMeltingPoint(P_MPa);
  return (T_K + depression_K > melt.T_K) ? PhaseID::LIQUID : melt.solid_phase;
}

double ReferenceEOS::linearDensity(const ReferenceMaterialData &data, double P_MPa, double T_K) {
  return data.rho0_kgm3 * (1.0 + P_MPa / data.K_MPa) * (1.0 - data.alpha0_pK * (T_K - data.Tref_K));
}

EOSTable ReferenceEOS::waterTable(const EOSGrid &grid, double w_ppt) const {
  ReferenceMaterialData water = getMaterialParameters(ReferenceMaterial::WATER);
  water.rho0_kgm3 += 0.75 * w_ppt;
  const double depression_K = freezingDepression_K(w_ppt);
  const std::vector<MeltingPoint> liquidus = liquidusAlong(grid.P_MPa);

  EOSTable table(grid);
  for (size_t iT = 0; iT < grid.T_K.size(); ++iT) {
    const double T = grid.T_K[iT];
    for (size_t iP = 0; iP < grid.P_MPa.size(); ++iP) {
      const double P = grid.P_MPa[iP];
      const size_t idx = table.index(iP, iT);
      table.rho_kgm3[idx] = linearDensity(water, P, T);
      table.Cp_JkgK[idx] = water.Cp_JkgK - 1.0 * P;
      // Positive expansivity keeps the ocean adiabat increasing downward.
      table.alpha_pK[idx] = std::max(5.0e-5 + 3.0e-7 * P + 2.0e-6 * (T - water.Tref_K), 1.0e-6);
      table.kTherm_WmK[idx] = water.kTherm_WmK;
      table.phase[idx] =
          (T + depression_K > liquidus[iP].T_K) ? PhaseID::LIQUID : liquidus[iP].solid_phase;
    }
  }
  return table;
}

EOSTable ReferenceEOS::iceTable(const EOSGrid &grid, int phase) const {
  const ReferenceMaterialData ice = getMaterialParameters(materialForPhase(phase));
  if (!isIcePhase(phase) && phase != PhaseID::CLATHRATE) {
    throw std::invalid_argument("iceTable called for non-ice phase " + std::to_string(phase));
  }

  EOSTable table(grid);
  for (size_t iT = 0; iT < grid.T_K.size(); ++iT) {
    const double T = grid.T_K[iT];
    for (size_t iP = 0; iP < grid.P_MPa.size(); ++iP) {
      const double P = grid.P_MPa[iP];
      const size_t idx = table.index(iP, iT);
      table.rho_kgm3[idx] = linearDensity(ice, P, T);
      table.Cp_JkgK[idx] = 7.037 * T + 185.0;
      table.alpha_pK[idx] = ice.alpha0_pK;
      table.kTherm_WmK[idx] = (phase == PhaseID::CLATHRATE)
                                  ? ice.kTherm_WmK
                                  : kThermIsobaricAnderssonInaba2005(T, phase);
      table.phase[idx] = phase;
    }
  }
  return table;
}

EOSTable ReferenceEOS::solidTable(const EOSGrid &grid, ReferenceMaterial material) const {
  if (material != ReferenceMaterial::SILICATE && material != ReferenceMaterial::IRON_CORE) {
    throw std::invalid_argument("solidTable supports silicate and iron core only, got " +
                                materialToString(material));
  }
  const ReferenceMaterialData solid = getMaterialParameters(material);

  EOSTable table(grid);
  for (size_t iT = 0; iT < grid.T_K.size(); ++iT) {
    for (size_t iP = 0; iP < grid.P_MPa.size(); ++iP) {
      const size_t idx = table.index(iP, iT);
      table.rho_kgm3[idx] = linearDensity(solid, grid.P_MPa[iP], grid.T_K[iT]);
      table.Cp_JkgK[idx] = solid.Cp_JkgK;
      table.alpha_pK[idx] = solid.alpha0_pK;
      table.kTherm_WmK[idx] = solid.kTherm_WmK;
      table.phase[idx] = solid.phase;
    }
  }
  return table;
}

std::string ReferenceEOS::materialToString(ReferenceMaterial material) {
  switch (material) {
  case ReferenceMaterial::WATER:
    return "WATER";
  case ReferenceMaterial::ICE_IH:
    return "ICE_IH";
  case ReferenceMaterial::ICE_II:
    return "ICE_II";
  case ReferenceMaterial::ICE_III:
    return "ICE_III";
  case ReferenceMaterial::ICE_V:
    return "ICE_V";
  case ReferenceMaterial::ICE_VI:
    return "ICE_VI";
  case ReferenceMaterial::CLATHRATE:
    return "CLATHRATE";
  case ReferenceMaterial::SILICATE:
    return "SILICATE";
  case ReferenceMaterial::IRON_CORE:
    return "IRON_CORE";
  default:
    return "UNKNOWN";
  }
}
