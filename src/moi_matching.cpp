#include "moi_matching.hpp"
#include "profile_errors.hpp"
#include "thermal_profiles.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

constexpr double C_FACTOR = 8.0 * PI / 15.0;

double shellVolume(double rOuter_m, double rInner_m) {
  return 4.0 / 3.0 * PI * (std::pow(rOuter_m, 3) - std::pow(rInner_m, 3));
}

double shellC(double rho_kgm3, double rOuter_m, double rInner_m) {
  return C_FACTOR * rho_kgm3 * (std::pow(rOuter_m, 5) - std::pow(rInner_m, 5));
}

// Cumulative C of the hydrosphere rows above each row.
std::vector<double> hydroCAbove(const LayerArrays &L) {
  std::vector<double> C(L.size(), 0.0);
  for (size_t i = 1; i < L.size(); ++i) {
    C[i] = C[i - 1] + shellC(L.rho_kgm3[i - 1], L.r_m[i - 1], L.r_m[i]);
  }
  return C;
}

std::vector<double> linspace(double from, double to, int n) {
  std::vector<double> x(static_cast<size_t>(n) + 1);
  for (int j = 0; j <= n; ++j) {
    x[j] = from + (to - from) * j / n;
  }
  x[n] = to;
  return x;
}

void setRow(LayerArrays &L, size_t row, double R_m, double r_m, double P_MPa, double T_K,
            double rho_kgm3, double Cp_JkgK, double alpha_pK, double k_WmK, double g_ms2,
            double phi_frac, int phase, double MLayer_kg) {
  L.r_m[row] = r_m;
  L.z_m[row] = R_m - r_m;
  L.P_MPa[row] = P_MPa;
  L.T_K[row] = T_K;
  L.rho_kgm3[row] = rho_kgm3;
  L.Cp_JkgK[row] = Cp_JkgK;
  L.alpha_pK[row] = alpha_pK;
  L.kTherm_WmK[row] = k_WmK;
  L.g_ms2[row] = g_ms2;
  L.phi_frac[row] = phi_frac;
  L.phase[row] = phase;
  L.MLayer_kg[row] = MLayer_kg;
}

void throwNegativeSilicateTemperature(double T_K, size_t row) {
  std::ostringstream msg;
  msg << "Negative temperature " << T_K << " K in silicate row " << row
      << ". Qrad_Wkg + Htidal_Wm3 is too high to be consistent with the heat flow through"
         " the ice shell.";
  throw ProfileError(msg.str());
}

} // namespace

struct MoIMatcher::SilicateProfile {
  std::vector<double> r_m; // nSil + 1 nodes, last one is the inner edge
  std::vector<double> P_MPa;
  std::vector<double> T_K;
  std::vector<double> rho_kgm3;
  std::vector<double> Cp_JkgK;
  std::vector<double> alpha_pK;
  std::vector<double> phi_frac;
  std::vector<double> g_ms2;
  std::vector<double> MLayer_kg;
  std::vector<double> MAbove_kg;
  double Mtot_kg = 0.0;
  // State at the inner edge r_m.back()
  double Pend_MPa = 0.0;
  double Tend_K = 0.0;
  double gEnd_ms2 = 0.0;
};

struct MoIMatcher::CoreProfile {
  std::vector<double> r_m;
  std::vector<double> P_MPa;
  std::vector<double> T_K;
  std::vector<double> rho_kgm3;
  std::vector<double> Cp_JkgK;
  std::vector<double> alpha_pK;
  std::vector<double> k_WmK;
  std::vector<double> g_ms2;
  std::vector<double> MLayer_kg;
  double Mcore_kg = 0.0;
};

MoIMatcher::MoIMatcher(const PlanetConfig &config, const RunConfig &run, EOSCache &cache)
    : config_(config), run_(run), cache_(cache) {}

RangeDescriptor MoIMatcher::innerRange() const {
  const BulkParameters &bulk = config_.bulk;
  double Pmax_MPa = config_.sil.PsilMax_MPa;
  if (Pmax_MPa <= 0.0) {
    // Four times the central pressure of a uniform sphere
    Pmax_MPa = 4.0 * 3.0 / (8.0 * PI) * G * bulk.M_kg * bulk.M_kg / std::pow(bulk.R_m, 4) * 1e-6;
  }
  return {0.0,           Pmax_MPa, config_.sil.deltaP_eos_MPa, bulk.Tsurf_K, config_.sil.TsilMax_K,
          config_.sil.deltaT_eos_K};
}

void MoIMatcher::select_best(MoIResult &result) const {
  const double Cmeasured = config_.bulk.Cmeasured;
  const double Cunc = config_.bulk.Cuncertainty;
  const auto &cands = result.candidates;

  result.CMR2min = cands.front().CMR2;
  result.CMR2max = cands.front().CMR2;
  for (const auto &c : cands) {
    result.CMR2min = std::min(result.CMR2min, c.CMR2);
    result.CMR2max = std::max(result.CMR2max, c.CMR2);
  }

  result.matches.clear();
  for (size_t k = 0; k < cands.size(); ++k) {
    if (std::abs(cands[k].CMR2 - Cmeasured) <= Cunc) {
      result.matches.push_back(k);
    }
  }
  if (result.matches.empty()) {
    std::ostringstream msg;
    msg << std::fixed << std::setprecision(3) << "No MoI found matching C/MR^2 = " << Cmeasured
        << " +/- " << Cunc << ". Min: " << result.CMR2min << ", Max: " << result.CMR2max
        << ". Try increasing PHydroMax_MPa or adjusting properties of silicates and core.";
    throw NoMoIMatch(msg.str());
  }

  // Closest match, earliest candidate on ties
  result.best = result.matches.front();
  for (size_t k : result.matches) {
    if (std::abs(cands[k].CMR2 - Cmeasured) < std::abs(cands[result.best].CMR2 - Cmeasured)) {
      result.best = k;
    }
  }

  const MoICandidate &best = cands[result.best];
  result.CMR2mean = best.CMR2;
  result.RsilMean_m = best.Rsil_m;
  result.RcoreMean_m = best.Rcore_m;
  result.rhoSilMean_kgm3 = best.rhoSil_kgm3;
  result.rhoCoreMean_kgm3 = best.rhoCore_kgm3;
  result.nHydro = best.index;
  result.nSil = best.nSil;
  result.Mtot_kg = best.Mtot_kg;

  result.RsilTrade_m.clear();
  result.RcoreTrade_m.clear();
  result.rhoSilTrade_kgm3.clear();
  for (size_t k : result.matches) {
    result.RsilTrade_m.push_back(cands[k].Rsil_m);
    result.RcoreTrade_m.push_back(cands[k].Rcore_m);
    result.rhoSilTrade_kgm3.push_back(cands[k].rhoSil_kgm3);
  }
  const auto silRange = std::minmax_element(result.RsilTrade_m.begin(), result.RsilTrade_m.end());
  const auto coreRange =
      std::minmax_element(result.RcoreTrade_m.begin(), result.RcoreTrade_m.end());
  result.RsilRange_m = *silRange.second - *silRange.first;
  result.RcoreRange_m = *coreRange.second - *coreRange.first;
}

MoIResult MoIMatcher::calc_moi_constant_rho(const HydrosphereState &hydro, LayerArrays &inner) {
  const BulkParameters &bulk = config_.bulk;
  const SilicateParameters &sil = config_.sil;
  const bool withCore = config_.model.Fe_CORE;
  const LayerArrays &L = hydro.layers;
  const double M = bulk.M_kg;
  const double MR2 = M * bulk.R_m * bulk.R_m;

  const double rhoCore = withCore ? config_.core.rhoCore() : 0.0;
  if (withCore && !(rhoCore > sil.rhoSilWithCore_kgm3)) {
    throw std::invalid_argument("Core density must exceed the silicate density");
  }
  if (run_.verbose) {
    std::cout << "Finding MoI consistent with measured value for constant-density inner layers"
              << std::endl;
  }

  const std::vector<double> MAbove = L.massAbove();
  const std::vector<double> Chydro = hydroCAbove(L);

  MoIResult result;
  const int nRows = static_cast<int>(L.size());
  for (int i = hydro.nSurfIce; i < nRows - 1; ++i) {
    const double r = L.r_m[i];
    const double Vsphere = 4.0 / 3.0 * PI * std::pow(r, 3);
    double rhoSil = sil.rhoSilWithCore_kgm3;
    double rCore = 0.0;
    if (withCore) {
      const double Vcore = (M - MAbove[i] - Vsphere * rhoSil) / (rhoCore - rhoSil);
      if (!(Vcore > 0.0 && Vcore < Vsphere)) {
        continue;
      }
      rCore = std::cbrt(Vcore * 3.0 / (4.0 * PI));
    } else {
      rhoSil = (M - MAbove[i]) / Vsphere;
      if (!(rhoSil > 0.0)) {
        continue;
      }
    }

    MoICandidate c;
    c.index = i;
    c.CMR2 = (Chydro[i] + shellC(rhoSil, r, rCore) + C_FACTOR * rhoCore * std::pow(rCore, 5)) /
             MR2;
    c.Rsil_m = r;
    c.Rcore_m = rCore;
    c.rhoSil_kgm3 = rhoSil;
    c.rhoCore_kgm3 = rhoCore;
    c.Mtot_kg = M;
    c.nSil = config_.steps.nSilMax;
    result.candidates.push_back(c);
  }
  if (result.candidates.empty()) {
    throw NoMoIMatch("No silicate/core configuration is consistent with the body mass for any "
                     "hydrosphere depth. Try increasing PHydroMax_MPa.");
  }
  select_best(result);

  // Fill the winning configuration at constant density
  const MoICandidate &best = result.candidates[result.best];
  const int nSil = config_.steps.nSilMax;
  const int nCore = withCore ? config_.steps.nCore : 0;
  result.nCore = nCore;
  inner = LayerArrays(static_cast<size_t>(nSil + nCore));

  const std::vector<double> rSil = linspace(best.Rsil_m, best.Rcore_m, nSil);
  double P = L.P_MPa[best.index];
  double T = L.T_K[best.index];
  double g = L.g_ms2[best.index];
  double MA = MAbove[best.index];
  double qTop = hydro.QfromMantle_W / (4.0 * PI * rSil[0] * rSil[0]);
  for (int j = 0; j < nSil; ++j) {
    if (T < 0.0) {
      throwNegativeSilicateTemperature(T, j);
    }
    const double ML = best.rhoSil_kgm3 * shellVolume(rSil[j], rSil[j + 1]);
    setRow(inner, j, bulk.R_m, rSil[j], P, T, best.rhoSil_kgm3, sil.Cp_JkgK, sil.alpha_pK,
           sil.kTherm_WmK, g, sil.porosity.porosity(P), PhaseID::SILICATE, ML);
    MA += ML;
    P += best.rhoSil_kgm3 * g * (rSil[j] - rSil[j + 1]) * 1e-6;
    const ConductiveResult cond = conductive_temperature(T, rSil[j], rSil[j + 1], sil.kTherm_WmK,
                                                         best.rhoSil_kgm3, sil.Qrad_Wkg,
                                                         sil.Htidal_Wm3, qTop);
    T = cond.Tbot_K;
    qTop = cond.qBot_Wm2;
    if (rSil[j + 1] > 0.0) {
      g = G * (bulk.M_kg - MA) / (rSil[j + 1] * rSil[j + 1]);
    }
  }

  if (nCore > 0) {
    const CoreParameters &core = config_.core;
    const std::vector<double> rCore = linspace(best.Rcore_m, 0.0, nCore);
    const double g0 = g;
    for (int k = 0; k < nCore; ++k) {
      const double gk = g0 * rCore[k] / rCore[0];
      const double ML = rhoCore * shellVolume(rCore[k], rCore[k + 1]);
      setRow(inner, nSil + k, bulk.R_m, rCore[k], P, T, rhoCore, core.Cp_JkgK, core.alpha_pK,
             core.kTherm_WmK, gk, 0.0, PhaseID::IRON, ML);
      const double dP = rhoCore * gk * (rCore[k] - rCore[k + 1]) * 1e-6;
      T += core.alpha_pK * T / (core.Cp_JkgK * rhoCore) * dP * 1e6;
      P += dP;
    }
  }
  result.Mtot_kg = MAbove[best.index] + inner.totalMass();
  if (!run_.skip_inner) {
    evaluate_inner_eos(hydro, MAbove, best, inner, result);
  }
  return result;
}

void MoIMatcher::evaluate_inner_eos(const HydrosphereState &hydro,
                                    const std::vector<double> &MAbove, const MoICandidate &best,
                                    LayerArrays &inner, MoIResult &result) {
  const BulkParameters &bulk = config_.bulk;

  if (run_.verbose) {
    std::cout << "Evaluating silicate and core EOS for the matched interior" << std::endl;
  }
  InnerEOSRequest silReq;
  silReq.table_name = config_.sil.mantle_eos;
  silReq.range = innerRange();
  silReq.porosity = config_.sil.porosity;
  silReq.allow_extrapolation = run_.extrap_sil;
  const auto silEOS = cache_.getInnerEOS(silReq);
  const SilicateProfile sil = silicate_layers(hydro, MAbove, best.index, best.Rcore_m, *silEOS);

  CoreProfile core;
  if (config_.model.Fe_CORE) {
    InnerEOSRequest coreReq;
    coreReq.table_name = config_.core.core_eos;
    coreReq.range = innerRange();
    coreReq.allow_extrapolation = run_.extrap_fe;
    const auto coreEOS = cache_.getInnerEOS(coreReq);
    core = core_profile(best.Rcore_m, sil.Pend_MPa, sil.Tend_K, sil.gEnd_ms2, *coreEOS);
  }

  const int nSil = static_cast<int>(sil.MLayer_kg.size());
  const int nCore = static_cast<int>(core.MLayer_kg.size());
  inner = LayerArrays(static_cast<size_t>(nSil + nCore));
  double Msil = 0.0;
  for (int j = 0; j < nSil; ++j) {
    setRow(inner, j, bulk.R_m, sil.r_m[j], sil.P_MPa[j], sil.T_K[j], sil.rho_kgm3[j],
           sil.Cp_JkgK[j], sil.alpha_pK[j], config_.sil.kTherm_WmK, sil.g_ms2[j], sil.phi_frac[j],
           PhaseID::SILICATE, sil.MLayer_kg[j]);
    Msil += sil.MLayer_kg[j];
  }
  for (int k = 0; k < nCore; ++k) {
    setRow(inner, nSil + k, bulk.R_m, core.r_m[k], core.P_MPa[k], core.T_K[k], core.rho_kgm3[k],
           core.Cp_JkgK[k], core.alpha_pK[k], core.k_WmK[k], core.g_ms2[k], 0.0, PhaseID::IRON,
           core.MLayer_kg[k]);
  }

  result.nSil = nSil;
  result.nCore = nCore;
  result.rhoSilMean_kgm3 = Msil / shellVolume(best.Rsil_m, best.Rcore_m);
  result.rhoCoreMean_kgm3 =
      (nCore > 0) ? core.Mcore_kg / (4.0 / 3.0 * PI * std::pow(best.Rcore_m, 3)) : 0.0;
  result.Mtot_kg = MAbove[best.index] + Msil + core.Mcore_kg;
  if (run_.verbose) {
    std::cerr << "Warning: Silicate and core properties were evaluated from the EOS after sizing "
                 "them at constant density, so the body mass may not match the measured value."
              << std::endl;
  }
}

MoIMatcher::SilicateProfile MoIMatcher::silicate_layers(const HydrosphereState &hydro,
                                                        const std::vector<double> &MAbove,
                                                        int index, double rEnd_m,
                                                        const EOSView &eos) const {
  const SilicateParameters &sil = config_.sil;
  const LayerArrays &L = hydro.layers;
  const double M = config_.bulk.M_kg;
  const int n = config_.steps.nSilMax;

  SilicateProfile s;
  s.r_m = linspace(L.r_m[index], rEnd_m, n);
  s.P_MPa.assign(n, 0.0);
  s.T_K.assign(n, 0.0);
  s.rho_kgm3.assign(n, 0.0);
  s.Cp_JkgK.assign(n, 0.0);
  s.alpha_pK.assign(n, 0.0);
  s.phi_frac.assign(n, 0.0);
  s.g_ms2.assign(n, 0.0);
  s.MLayer_kg.assign(n, 0.0);
  s.MAbove_kg.assign(n, 0.0);

  s.P_MPa[0] = L.P_MPa[index];
  s.T_K[0] = L.T_K[index];
  s.g_ms2[0] = L.g_ms2[index];
  s.MAbove_kg[0] = MAbove[index];
  double qTop = hydro.QfromMantle_W / (4.0 * PI * s.r_m[0] * s.r_m[0]);

  for (int j = 0; j < n; ++j) {
    if (j > 0) {
      s.MAbove_kg[j] = s.MAbove_kg[j - 1] + s.MLayer_kg[j - 1];
      s.P_MPa[j] =
          s.P_MPa[j - 1] + s.rho_kgm3[j - 1] * s.g_ms2[j - 1] * (s.r_m[j - 1] - s.r_m[j]) * 1e-6;
      const ConductiveResult cond =
          conductive_temperature(s.T_K[j - 1], s.r_m[j - 1], s.r_m[j], sil.kTherm_WmK,
                                 s.rho_kgm3[j - 1], sil.Qrad_Wkg, sil.Htidal_Wm3, qTop);
      s.T_K[j] = cond.Tbot_K;
      qTop = cond.qBot_Wm2;
      // Absolute value so overweight profiles can still be integrated and rejected
      s.g_ms2[j] = G * std::abs(M - s.MAbove_kg[j]) / (s.r_m[j] * s.r_m[j]);
    }
    if (s.T_K[j] < 0.0) {
      throwNegativeSilicateTemperature(s.T_K[j], j);
    }
    s.rho_kgm3[j] = eos.rho_kgm3(s.P_MPa[j], s.T_K[j]);
    s.Cp_JkgK[j] = eos.Cp_JkgK(s.P_MPa[j], s.T_K[j]);
    s.alpha_pK[j] = eos.alpha_pK(s.P_MPa[j], s.T_K[j]);
    s.phi_frac[j] = eos.porosity_frac(s.P_MPa[j], s.T_K[j]);
    s.MLayer_kg[j] = s.rho_kgm3[j] * shellVolume(s.r_m[j], s.r_m[j + 1]);
  }
  s.Mtot_kg = s.MAbove_kg[n - 1] + s.MLayer_kg[n - 1];
  s.Pend_MPa = s.P_MPa[n - 1] + s.rho_kgm3[n - 1] * s.g_ms2[n - 1] * (s.r_m[n - 1] - s.r_m[n]) * 1e-6;
  s.Tend_K = s.T_K[n - 1];
  if (s.r_m[n] > 0.0) {
    s.Tend_K = conductive_temperature(s.T_K[n - 1], s.r_m[n - 1], s.r_m[n], sil.kTherm_WmK,
                                      s.rho_kgm3[n - 1], sil.Qrad_Wkg, sil.Htidal_Wm3, qTop)
                   .Tbot_K;
    s.gEnd_ms2 = G * std::abs(M - s.Mtot_kg) / (s.r_m[n] * s.r_m[n]);
  }
  return s;
}

MoIMatcher::CoreProfile MoIMatcher::core_profile(double rTop_m, double Ptop_MPa, double Ttop_K,
                                                 double gTop_ms2, const EOSView &eos) const {
  const int nCore = config_.steps.nCore;
  CoreProfile c;
  c.r_m = linspace(rTop_m, 0.0, nCore);
  c.P_MPa.assign(nCore, 0.0);
  c.T_K.assign(nCore, 0.0);
  c.rho_kgm3.assign(nCore, 0.0);
  c.Cp_JkgK.assign(nCore, 0.0);
  c.alpha_pK.assign(nCore, 0.0);
  c.k_WmK.assign(nCore, 0.0);
  c.g_ms2.assign(nCore, 0.0);
  c.MLayer_kg.assign(nCore, 0.0);

  c.P_MPa[0] = Ptop_MPa;
  c.T_K[0] = Ttop_K;
  c.g_ms2[0] = gTop_ms2;
  for (int k = 0; k < nCore; ++k) {
    if (k > 0) {
      const double dP = c.rho_kgm3[k - 1] * c.g_ms2[k - 1] * (c.r_m[k - 1] - c.r_m[k]) * 1e-6;
      c.P_MPa[k] = c.P_MPa[k - 1] + dP;
      c.T_K[k] = c.T_K[k - 1] + c.alpha_pK[k - 1] * c.T_K[k - 1] /
                                    (c.Cp_JkgK[k - 1] * c.rho_kgm3[k - 1]) * dP * 1e6;
      // Linear gravity, exact for a uniform core
      c.g_ms2[k] = c.g_ms2[0] * c.r_m[k] / c.r_m[0];
    }
    c.rho_kgm3[k] = eos.rho_kgm3(c.P_MPa[k], c.T_K[k]);
    c.Cp_JkgK[k] = eos.Cp_JkgK(c.P_MPa[k], c.T_K[k]);
    c.alpha_pK[k] = eos.alpha_pK(c.P_MPa[k], c.T_K[k]);
    c.k_WmK[k] = eos.kTherm_WmK(c.P_MPa[k], c.T_K[k]);
    c.MLayer_kg[k] = c.rho_kgm3[k] * shellVolume(c.r_m[k], c.r_m[k + 1]);
    c.Mcore_kg += c.MLayer_kg[k];
  }
  return c;
}

bool MoIMatcher::iron_core_layers(const SilicateProfile &sil, const EOSView &eos,
                                  CoreProfile &core, int &nSilFinal) const {
  const double M = config_.bulk.M_kg;
  const int nSil = static_cast<int>(sil.P_MPa.size());

  // First silicate node small enough to hold the remaining mass at rhoMin
  int start = -1;
  for (int j = 0; j < nSil; ++j) {
    const double Mremain = M - sil.MAbove_kg[j];
    if (Mremain <= 0.0) {
      break;
    }
    const double rCoreMax = std::cbrt(Mremain / config_.core.rhoMin_kgm3 * 3.0 / (4.0 * PI));
    if (sil.r_m[j] < rCoreMax) {
      start = j;
      break;
    }
  }
  if (start < 0) {
    return false;
  }

  for (int j = start; j < nSil; ++j) {
    CoreProfile c = core_profile(sil.r_m[j], sil.P_MPa[j], sil.T_K[j], sil.g_ms2[j], eos);
    if (sil.MAbove_kg[j] + c.Mcore_kg < M) {
      nSilFinal = j;
      core = std::move(c);
      return true;
    }
  }
  return false;
}

MoIResult MoIMatcher::calc_moi_with_eos(const HydrosphereState &hydro, LayerArrays &inner) {
  if (!config_.model.Fe_CORE) {
    throw std::invalid_argument("MoI matching with a silicate EOS requires an iron core. Enable "
                                "CONSTANT_INNER_DENSITY for core-free bodies.");
  }
  const BulkParameters &bulk = config_.bulk;
  const LayerArrays &L = hydro.layers;
  const double M = bulk.M_kg;
  const double MR2 = M * bulk.R_m * bulk.R_m;

  InnerEOSRequest silReq;
  silReq.table_name = config_.sil.mantle_eos;
  silReq.range = innerRange();
  silReq.porosity = config_.sil.porosity;
  silReq.allow_extrapolation = run_.extrap_sil;
  const auto silEOS = cache_.getInnerEOS(silReq);

  InnerEOSRequest coreReq;
  coreReq.table_name = config_.core.core_eos;
  coreReq.range = innerRange();
  coreReq.allow_extrapolation = run_.extrap_fe;
  const auto coreEOS = cache_.getInnerEOS(coreReq);

  if (run_.verbose) {
    std::cout << "Propagating silicate EOS for each possible mantle size" << std::endl;
  }

  const std::vector<double> MAbove = L.massAbove();
  const std::vector<double> Chydro = hydroCAbove(L);

  MoIResult result;
  int nTooHeavy = 0;
  int nProfiles = 0;
  double MtotMin = 0.0;
  double MtotMax = 0.0;
  const int nRows = static_cast<int>(L.size());
  for (int i = hydro.nSurfIce; i < nRows - 1; ++i) {
    const SilicateProfile sil = silicate_layers(hydro, MAbove, i, 0.0, *silEOS);
    MtotMin = (nProfiles == 0) ? sil.Mtot_kg : std::min(MtotMin, sil.Mtot_kg);
    MtotMax = (nProfiles == 0) ? sil.Mtot_kg : std::max(MtotMax, sil.Mtot_kg);
    ++nProfiles;
    if (sil.Mtot_kg > M) {
      ++nTooHeavy;
      continue;
    }

    CoreProfile core;
    int nSilFinal = 0;
    if (!iron_core_layers(sil, *coreEOS, core, nSilFinal)) {
      continue;
    }

    double C = Chydro[i];
    double Msil = 0.0;
    for (int k = 0; k < nSilFinal; ++k) {
      C += shellC(sil.rho_kgm3[k], sil.r_m[k], sil.r_m[k + 1]);
      Msil += sil.MLayer_kg[k];
    }
    for (size_t k = 0; k < core.MLayer_kg.size(); ++k) {
      C += shellC(core.rho_kgm3[k], core.r_m[k], core.r_m[k + 1]);
    }

    MoICandidate c;
    c.index = i;
    c.CMR2 = C / MR2;
    c.Rsil_m = sil.r_m[0];
    c.Rcore_m = sil.r_m[nSilFinal];
    c.rhoSil_kgm3 = (nSilFinal > 0) ? Msil / shellVolume(sil.r_m[0], sil.r_m[nSilFinal]) : 0.0;
    c.rhoCore_kgm3 = core.Mcore_kg / (4.0 / 3.0 * PI * std::pow(c.Rcore_m, 3));
    c.Mtot_kg = sil.MAbove_kg[nSilFinal] + core.Mcore_kg;
    c.nSil = nSilFinal;
    result.candidates.push_back(c);
  }

  if (nProfiles > 0 && nTooHeavy == nProfiles) {
    std::ostringstream msg;
    msg << std::setprecision(4) << "No core/mantle combination was found matching total mass. "
        << "Min mass: " << MtotMin / M << " M, max mass: " << MtotMax / M
        << " M. Try adjusting silicate composition or heat flux settings.";
    throw MassExceededError(msg.str());
  }
  if (result.candidates.empty()) {
    throw NoMoIMatch("No silicate profile admits an iron core lighter than the remaining mass");
  }
  select_best(result);

  // Re-integrate the winner to fill its rows
  const MoICandidate &best = result.candidates[result.best];
  const SilicateProfile sil = silicate_layers(hydro, MAbove, best.index, 0.0, *silEOS);
  CoreProfile core;
  int nSilFinal = 0;
  if (!iron_core_layers(sil, *coreEOS, core, nSilFinal)) {
    throw ProfileError("Best-matching interior could not be reproduced");
  }
  const int nCore = static_cast<int>(core.MLayer_kg.size());
  result.nSil = nSilFinal;
  result.nCore = nCore;

  inner = LayerArrays(static_cast<size_t>(nSilFinal + nCore));
  for (int j = 0; j < nSilFinal; ++j) {
    setRow(inner, j, bulk.R_m, sil.r_m[j], sil.P_MPa[j], sil.T_K[j], sil.rho_kgm3[j],
           sil.Cp_JkgK[j], sil.alpha_pK[j], config_.sil.kTherm_WmK, sil.g_ms2[j], sil.phi_frac[j],
           PhaseID::SILICATE, sil.MLayer_kg[j]);
  }
  for (int k = 0; k < nCore; ++k) {
    setRow(inner, nSilFinal + k, bulk.R_m, core.r_m[k], core.P_MPa[k], core.T_K[k],
           core.rho_kgm3[k], core.Cp_JkgK[k], core.alpha_pK[k], core.k_WmK[k], core.g_ms2[k], 0.0,
           PhaseID::IRON, core.MLayer_kg[k]);
  }
  return result;
}

LayerArrays MoIMatcher::inner_layers(const HydrosphereState &hydro, MoIResult &result) {
  LayerArrays inner;
  if (config_.model.CONSTANT_INNER_DENSITY) {
    result = calc_moi_constant_rho(hydro, inner);
  } else {
    result = calc_moi_with_eos(hydro, inner);
  }

  if (result.nHydro <= hydro.nSurfIce) {
    std::cerr << "Warning: For these run settings, the hydrosphere of " << config_.name
              << " is entirely frozen and contains only surface ice." << std::endl;
  }
  if (run_.verbose) {
    std::cout << std::setprecision(4) << "Found matching MoI of " << result.CMR2mean
              << " (C/MR^2 = " << config_.bulk.Cmeasured << " +/- " << config_.bulk.Cuncertainty
              << ") for rho_sil = " << result.rhoSilMean_kgm3
              << " kg/m^3, R_sil = " << result.RsilMean_m / config_.bulk.R_m
              << " R, R_core = " << result.RcoreMean_m / config_.bulk.R_m
              << " R, M_tot = " << result.Mtot_kg / config_.bulk.M_kg << " M" << std::endl;
    std::cout << std::setprecision(6);
  }

  for (size_t j = 0; j < inner.size(); ++j) {
    if (inner.phase[j] == PhaseID::SILICATE &&
        inner.T_K[j] > TsolidusHirschmann2000(inner.P_MPa[j])) {
      std::cerr << "Warning: Silicate temperature " << inner.T_K[j] << " K exceeds the dry "
                << "peridotite solidus at " << inner.P_MPa[j] << " MPa (silicate row " << j
                << ")." << std::endl;
      break;
    }
  }

  LayerArrays merged;
  merged.append(hydro.layers, 0, static_cast<size_t>(result.nHydro));
  merged.append(inner, 0, inner.size());

  result.non_equilibrium_index = merged.firstNegativeTemperatureStep();
  result.non_equilibrium = result.non_equilibrium_index >= 0;
  if (result.non_equilibrium) {
    std::cerr << "Warning: Negative temperature gradient starting at index "
              << result.non_equilibrium_index
              << ". Internal heating parameters Qrad_Wkg and/or Htidal_Wm3 are too high to be "
                 "consistent with the heat flux into the ocean. The current configuration "
                 "represents a non-equilibrium state."
              << std::endl;
  }
  return merged;
}
