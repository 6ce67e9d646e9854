#include "thermal_profiles.hpp"
#include "planet_config.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Indexed by phase tag 0..6; liquid and the unused tag 4 are NaN.
constexpr std::array<double, 7> EACT_KJMOL = {NaN, 49.9, 50.0, 57.0, NaN, 55.0, 55.0};
constexpr std::array<double, 7> ETA_MELT_PAS = {NaN, 1e14, 1e18, 5e12, NaN, 5e14, 5e14};
constexpr std::array<double, 7> D_COND = {NaN, 632.0, 418.0, 242.0, NaN, 328.0, 183.0};

// Deschamps & Sotin (2000) Cartesian scaling constants
constexpr double C1 = 1.43;
constexpr double C2 = -0.03;

double lookupIcePhase(const std::array<double, 7> &table, int phase, const char *what) {
  if (phase < 0 || phase >= static_cast<int>(table.size()) || std::isnan(table[phase])) {
    throw std::invalid_argument(std::string(what) + " undefined for phase " +
                                std::to_string(phase));
  }
  return table[phase];
}

// Whole shell conducts; flux from the isobaric conductivity integral
void conductiveShell(const ConvectionInput &in, ConvectionResult &out) {
  out.convecting = false;
  out.qbot_Wm2 = lookupIcePhase(D_COND, in.phase, "Conductive coefficient") *
                 std::log(in.Tb_K / in.Ttop_K) / in.zb_m;
  out.eLid_m = in.zb_m;
  out.deltaTBL_m = in.zb_m;
}

} // namespace

double activationEnergy_kJmol(int phase) {
  return lookupIcePhase(EACT_KJMOL, phase, "Activation energy");
}

double meltViscosity_Pas(int phase) {
  return lookupIcePhase(ETA_MELT_PAS, phase, "Melt viscosity");
}

ConductiveResult conductive_temperature(double Ttop_K, double rTop_m, double rBot_m,
                                        double kTherm_WmK, double rho_kgm3, double Qrad_Wkg,
                                        double Htidal_Wm3, double qTop_Wm2) {
  const double Qtot_Wkg = Qrad_Wkg + Htidal_Wm3 / rho_kgm3;
  const double heat = rho_kgm3 * Qtot_Wkg / 6.0 / kTherm_WmK;
  const double c1 = qTop_Wm2 * rTop_m * rTop_m / 2.0 / kTherm_WmK - heat * std::pow(rTop_m, 3);

  const double Tbot_K =
      Ttop_K + heat * (rTop_m * rTop_m - rBot_m * rBot_m) + c1 * (1.0 / rBot_m - 1.0 / rTop_m);
  const double qBot_Wm2 =
      rho_kgm3 * Qtot_Wkg / 3.0 * rBot_m + 2.0 * kTherm_WmK / (rBot_m * rBot_m) * c1;
  return {Tbot_K, qBot_Wm2};
}

double kThermIsobaricAnderssonInaba2005(double T_K, int phase) {
  double D;
  double X;
  switch (phase) {
  case PhaseID::ICE_I:
    D = 630.0;
    X = 0.995;
    break;
  case PhaseID::ICE_II:
    D = 695.0;
    X = 1.097;
    break;
  case PhaseID::ICE_III:
    D = 93.2;
    X = 0.822;
    break;
  case PhaseID::ICE_V:
    D = 38.0;
    X = 0.612;
    break;
  case PhaseID::ICE_VI:
    D = 50.9;
    X = 0.612;
    break;
  default:
    throw std::invalid_argument("No ice conductivity fit for phase " + std::to_string(phase));
  }
  return D * std::pow(T_K, -X);
}

double TsolidusHirschmann2000(double P_MPa) {
  const double P_GPa = P_MPa * 1e-3;
  return -5.104 * P_GPa * P_GPa + 132.899 * P_GPa + 1120.661 + 273.15;
}

ConvectionResult DeschampsSotinConvection::evaluate(const ConvectionInput &in,
                                                    const EOSView &ice) const {
  const double Eact_Jmol = activationEnergy_kJmol(in.phase) * 1e3;
  const double A = Eact_Jmol / R_GAS / in.Tb_K;
  const double B = Eact_Jmol / 2.0 / R_GAS / C1;
  const double C = C2 * (in.Tb_K - in.Ttop_K);

  ConvectionResult out{};
  out.Tconv_K = B * (std::sqrt(1.0 + 2.0 / B * (in.Tb_K - C)) - 1.0);
  out.etaConv_Pas = meltViscosity_Pas(in.phase) * std::exp(A * (in.Tb_K / out.Tconv_K - 1.0));

  // A well-mixed interior outside (Ttop, Tb) cannot convect; thin cold underplates land here
  if (!(out.Tconv_K > in.Ttop_K && out.Tconv_K < in.Tb_K)) {
    out.Ra = 0.0;
    conductiveShell(in, out);
    return out;
  }

  const double alpha = ice.alpha_pK(in.Pmid_MPa, out.Tconv_K);
  const double rho = ice.rho_kgm3(in.Pmid_MPa, out.Tconv_K);
  const double Cp = ice.Cp_JkgK(in.Pmid_MPa, out.Tconv_K);
  const double kMid = kThermIsobaricAnderssonInaba2005(out.Tconv_K, in.phase);
  const double buoyancy = alpha * Cp * rho * rho * in.gtop_ms2;

  out.Ra = buoyancy * (in.Tb_K - in.Ttop_K) * std::pow(in.zb_m, 3) / out.etaConv_Pas / kMid;
  const double Radelta = 0.28 * std::pow(out.Ra, 0.21);

  out.deltaTBL_m =
      std::cbrt(out.etaConv_Pas * kMid * Radelta / buoyancy / (in.Tb_K - out.Tconv_K));
  out.qbot_Wm2 = kMid * (in.Tb_K - out.Tconv_K) / out.deltaTBL_m;
  // Spherical correction of the Cartesian flux balance
  const double qtop_Wm2 =
      std::pow(in.rTop_m - in.zb_m, 2) / (in.rTop_m * in.rTop_m) * out.qbot_Wm2;
  out.eLid_m = in.kTop_WmK * (out.Tconv_K - in.Ttop_K) / qtop_Wm2;
  out.convecting = out.Ra >= RA_CRIT;

  if (!out.convecting) {
    conductiveShell(in, out);
  }
  return out;
}
