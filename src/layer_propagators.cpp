#include "layer_propagators.hpp"
#include "profile_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// Pressure at depth z by linear interpolation over rows [top, bottom].
double pressureAtDepth(const LayerArrays &L, int top, int bottom, double z_m) {
  if (z_m <= L.z_m[top]) {
    return L.P_MPa[top];
  }
  for (int i = top + 1; i <= bottom; ++i) {
    if (z_m <= L.z_m[i]) {
      const double f = (z_m - L.z_m[i - 1]) / (L.z_m[i] - L.z_m[i - 1]);
      return L.P_MPa[i - 1] + f * (L.P_MPa[i] - L.P_MPa[i - 1]);
    }
  }
  return L.P_MPa[bottom];
}

void requirePositiveSteps(int n, const char *name) {
  if (n < 1) {
    throw std::invalid_argument(std::string("Step count ") + name + " must be at least 1, got " +
                                std::to_string(n));
  }
}

} // namespace

HydrosphereIntegrator::HydrosphereIntegrator(const PlanetConfig &config, const RunConfig &run,
                                             EOSCache &cache, const ConvectionModel &convection)
    : config_(config), run_(run), cache_(cache), convection_(convection) {
  search_.allow_broken = run.allow_broken_models;
  search_.verbose = run.verbose;
}

HydrosphereState HydrosphereIntegrator::propagate() {
  if (run_.force_eos_recalc) {
    if (run_.verbose) {
      std::cout << "Clearing EOS cache before integration" << std::endl;
    }
    cache_.clear();
  }
  HydrosphereState state = initialize();
  ice_layers(state);
  if (state.broken) {
    std::cerr << "Warning: " << config_.name
              << " ice shell is incomplete, skipping ocean layers" << std::endl;
    return state;
  }
  ocean_layers(state);
  return state;
}

HydrosphereState HydrosphereIntegrator::initialize() {
  const BulkParameters &bulk = config_.bulk;
  const StepParameters &steps = config_.steps;
  const ModelSwitches &model = config_.model;

  if (!(bulk.R_m > 0.0) || !(bulk.M_kg > 0.0)) {
    throw std::invalid_argument("Body radius and mass must be positive");
  }
  if (!(bulk.Tb_K > bulk.Tsurf_K)) {
    throw std::invalid_argument("Tb_K must exceed Tsurf_K");
  }
  requirePositiveSteps(steps.nIceI, "nIceI");
  requirePositiveSteps(steps.nOceanMax, "nOceanMax");
  if (!(config_.ocean.PHydroMax_MPa > config_.PfreezeUpper_MPa)) {
    throw std::invalid_argument("PHydroMax_MPa must exceed PfreezeUpper_MPa so the ocean has a "
                                "positive pressure step");
  }
  if (model.CLATHRATE) {
    requirePositiveSteps(steps.nClath, "nClath");
    if (!(config_.ice.TbClath_K > bulk.Tsurf_K && config_.ice.TbClath_K < bulk.Tb_K)) {
      throw std::invalid_argument("TbClath_K must lie between Tsurf_K and Tb_K");
    }
  }
  const bool underplateIII = model.BOTTOM_ICEIII || model.BOTTOM_ICEV;
  if (underplateIII) {
    requirePositiveSteps(steps.nIceIIILitho, "nIceIIILitho");
    if (!(bulk.TbIII_K > bulk.Tb_K)) {
      throw std::invalid_argument("TbIII_K must exceed Tb_K when modeling an ice III underplate");
    }
  }
  if (model.BOTTOM_ICEV) {
    requirePositiveSteps(steps.nIceVLitho, "nIceVLitho");
    if (!(bulk.TbV_K > bulk.TbIII_K)) {
      throw std::invalid_argument("TbV_K must exceed TbIII_K when modeling an ice V underplate");
    }
  }

  HydrosphereState state;
  state.nClath = model.CLATHRATE ? steps.nClath : 0;
  state.nIbottom = state.nClath + steps.nIceI;
  state.nIIIbottom = state.nIbottom + (underplateIII ? steps.nIceIIILitho : 0);
  state.nSurfIce = state.nIIIbottom + (model.BOTTOM_ICEV ? steps.nIceVLitho : 0);
  state.nOceanMax = steps.nOceanMax;
  state.Tb_K = model.BOTTOM_ICEV ? bulk.TbV_K : (underplateIII ? bulk.TbIII_K : bulk.Tb_K);

  state.layers.resize(static_cast<size_t>(state.nSurfIce + state.nOceanMax));
  std::fill(state.layers.phase.begin(), state.layers.phase.end(), PhaseID::LIQUID);

  OceanEOSRequest req;
  req.comp = cache_.resolveOceanComposition(config_.ocean.comp);
  req.custom_name = config_.ocean.comp;
  req.w_ppt = config_.ocean.w_ppt;
  req.elec_type = config_.ocean.elec_type;
  req.allow_extrapolation = run_.extrap_ocean;
  req.range = {bulk.Psurf_MPa,
               std::max(config_.ocean.PHydroMax_MPa, config_.PfreezeUpper_MPa),
               config_.ocean.deltaP_eos_MPa,
               bulk.Tsurf_K,
               config_.ocean.THydroMax_K,
               config_.ocean.deltaT_eos_K};
  state.ocean_eos = cache_.getOceanEOS(req);

  LayerArrays &L = state.layers;
  L.P_MPa[0] = bulk.Psurf_MPa;
  L.T_K[0] = bulk.Tsurf_K;
  L.z_m[0] = 0.0;
  L.r_m[0] = bulk.R_m;
  L.g_ms2[0] = G * bulk.M_kg / (bulk.R_m * bulk.R_m);
  return state;
}

void HydrosphereIntegrator::ice_layers(HydrosphereState &state) {
  const BulkParameters &bulk = config_.bulk;
  const ModelSwitches &model = config_.model;
  const bool underplate = model.BOTTOM_ICEIII || model.BOTTOM_ICEV;
  LayerArrays &L = state.layers;

  state.PbI_MPa = find_freeze_pressure(*state.ocean_eos, PhaseID::ICE_I, bulk.Tb_K,
                                       config_.PfreezeLower_MPa, config_.PfreezeUpper_MPa,
                                       config_.PfreezeRes_MPa,
                                       underplate ? UnderplateMode::UNDERPLATE
                                                  : UnderplateMode::UNSET,
                                       search_);
  if (isNotFound(state.PbI_MPa)) {
    state.broken = true;
    return;
  }
  if (run_.verbose) {
    std::cout << "Ice I bottom phase transition pressure: " << std::fixed << std::setprecision(3)
              << state.PbI_MPa << " MPa at Tb_K = " << bulk.Tb_K << " K" << std::endl;
    std::cout.unsetf(std::ios::floatfield);
  }

  if (model.CLATHRATE) {
    clathrate_lid(state);
  } else {
    state.PbClath_MPa = bulk.Psurf_MPa;
  }

  const int top = state.nClath;
  const int bottom = state.nIbottom;
  auto iceI = iceEOS(PhaseID::ICE_I, L.P_MPa[top], state.PbI_MPa, L.T_K[top], bulk.Tb_K);
  conduct_shell(state, top, bottom, L.P_MPa[top], state.PbI_MPa, L.T_K[top], bulk.Tb_K,
                PhaseID::ICE_I, *iceI);
  if (run_.verbose) {
    std::cout << "Upper ice initial conductive profile complete" << std::endl;
  }

  if (!model.NO_ICE_CONVECTION) {
    convect_shell(state, top, bottom, PhaseID::ICE_I, *iceI);
  } else {
    if (run_.verbose) {
      std::cout << "NO_ICE_CONVECTION set, skipping ice I convection" << std::endl;
    }
    // Surface flux of the conductive profile, no tidal heating
    const double qSurf_Wm2 = (L.T_K[1] - bulk.Tsurf_K) / (bulk.R_m - L.r_m[1]) * L.kTherm_WmK[0];
    state.QfromMantle_W = qSurf_Wm2 * 4.0 * PI * bulk.R_m * bulk.R_m;
  }

  if (model.BOTTOM_ICEV) {
    if (run_.verbose) {
      std::cout << "Modeling ice III and V underplating" << std::endl;
    }
    ice_underplate(state, PhaseID::ICE_III, state.nIbottom, state.nIIIbottom, state.PbI_MPa,
                   bulk.TbIII_K, state.PbIII_MPa);
    if (state.broken) {
      return;
    }
    ice_underplate(state, PhaseID::ICE_V, state.nIIIbottom, state.nSurfIce, state.PbIII_MPa,
                   bulk.TbV_K, state.PbV_MPa);
    if (state.broken) {
      return;
    }
    state.Pb_MPa = state.PbV_MPa;
  } else if (model.BOTTOM_ICEIII) {
    if (run_.verbose) {
      std::cout << "Modeling ice III underplating" << std::endl;
    }
    ice_underplate(state, PhaseID::ICE_III, state.nIbottom, state.nIIIbottom, state.PbI_MPa,
                   bulk.TbIII_K, state.PbIII_MPa);
    if (state.broken) {
      return;
    }
    state.Pb_MPa = state.PbIII_MPa;
  } else {
    state.Pb_MPa = state.PbI_MPa;
  }

  state.zb_m = L.z_m[state.nSurfIce];
  if (run_.verbose) {
    std::cout << "Upper ice transition pressure: " << state.Pb_MPa
              << " MPa, ice shell thickness: " << state.zb_m / 1e3 << " km" << std::endl;
  }
}

void HydrosphereIntegrator::clathrate_lid(HydrosphereState &state) {
  const BulkParameters &bulk = config_.bulk;
  const IceShellParameters &ice = config_.ice;
  if (!(ice.PbClath_MPa > bulk.Psurf_MPa && ice.PbClath_MPa < state.PbI_MPa)) {
    std::ostringstream msg;
    msg << "Clathrate lid bottom pressure " << ice.PbClath_MPa
        << " MPa must lie between the surface pressure and the ice I bottom pressure "
        << state.PbI_MPa << " MPa";
    throw PhysicallyInvalidRange(msg.str());
  }
  if (run_.verbose) {
    std::cout << "Evaluating clathrate layers" << std::endl;
  }
  state.PbClath_MPa = ice.PbClath_MPa;
  auto clath = iceEOS(PhaseID::CLATHRATE, bulk.Psurf_MPa, ice.PbClath_MPa, bulk.Tsurf_K,
                      ice.TbClath_K);
  conduct_shell(state, 0, state.nClath, bulk.Psurf_MPa, ice.PbClath_MPa, bulk.Tsurf_K,
                ice.TbClath_K, PhaseID::CLATHRATE, *clath);
}

std::shared_ptr<const EOSView> HydrosphereIntegrator::iceEOS(int phase, double Pmin_MPa,
                                                             double Pmax_MPa, double Tmin_K,
                                                             double Tmax_K) {
  IceEOSRequest req;
  req.phase = phase;
  req.range = {Pmin_MPa, Pmax_MPa, config_.ice.deltaP_eos_MPa,
               Tmin_K,   Tmax_K,   config_.ice.deltaT_eos_K};
  req.porosity = config_.ice.porosity;
  req.allow_extrapolation = run_.extrap_ice;
  return cache_.getIceEOS(req);
}

void HydrosphereIntegrator::conduct_shell(HydrosphereState &state, int top, int bottom,
                                          double Ptop_MPa, double Pbot_MPa, double Ttop_K,
                                          double Tbot_K, int phase, const EOSView &eos) {
  LayerArrays &L = state.layers;
  const int n = bottom - top;
  for (int i = top; i <= bottom; ++i) {
    const double x = static_cast<double>(i - top) / n;
    L.P_MPa[i] = Ptop_MPa + x * (Pbot_MPa - Ptop_MPa);
    L.T_K[i] = std::pow(Tbot_K, x) * std::pow(Ttop_K, 1.0 - x);
  }
  // Pin the end points against rounding in pow
  L.P_MPa[bottom] = Pbot_MPa;
  L.T_K[top] = Ttop_K;
  L.T_K[bottom] = Tbot_K;

  for (int i = top; i < bottom; ++i) {
    fill_properties(state, i, eos, phase);
  }
  hydrostatic(state, top, bottom);
}

void HydrosphereIntegrator::convect_shell(HydrosphereState &state, int top, int bottom, int phase,
                                          const EOSView &eos) {
  LayerArrays &L = state.layers;
  const double zbOld_m = L.z_m[bottom];
  ShellConvection shell = apply_convection(state, top, bottom, phase, eos);

  const double change = std::abs(L.z_m[bottom] - zbOld_m) / L.z_m[bottom];
  if (change > config_.bulk.zbChangeTol_frac) {
    if (run_.verbose) {
      std::cout << "Bottom depth of " << phaseName(phase) << " shell changed by "
                << (L.z_m[bottom] - zbOld_m) / 1e3 << " km, more than "
                << config_.bulk.zbChangeTol_frac * 100.0
                << "%, re-evaluating convection" << std::endl;
    }
    shell = apply_convection(state, top, bottom, phase, eos);
    shell.evaluations = 2;
  }

  state.QfromMantle_W = shell.qbot_Wm2 * 4.0 * PI * L.r_m[bottom] * L.r_m[bottom];
  state.convection.push_back(shell);
}

ShellConvection HydrosphereIntegrator::apply_convection(HydrosphereState &state, int top,
                                                        int bottom, int phase,
                                                        const EOSView &eos) {
  LayerArrays &L = state.layers;
  const double zb_m = L.z_m[bottom] - L.z_m[top];
  const double Ptop = L.P_MPa[top];
  const double Pbot = L.P_MPa[bottom];
  const double Ttop = L.T_K[top];
  const double Tbot = L.T_K[bottom];

  const ConvectionInput in{Ttop,        L.r_m[top], L.kTherm_WmK[top], Tbot, zb_m,
                           L.g_ms2[top], 0.5 * (Ptop + Pbot), phase};
  const ConvectionResult res = convection_.evaluate(in, eos);

  ShellConvection shell;
  shell.phase = phase;
  shell.evaluations = 1;
  shell.Tconv_K = res.Tconv_K;
  shell.etaConv_Pas = res.etaConv_Pas;
  shell.eLid_m = res.eLid_m;
  shell.deltaTBL_m = res.deltaTBL_m;
  shell.qbot_Wm2 = res.qbot_Wm2;
  shell.Ra = res.Ra;
  shell.convecting = res.convecting && res.eLid_m + res.deltaTBL_m < zb_m;

  if (run_.verbose) {
    std::cout << phaseName(phase) << " shell: Ra = " << res.Ra << ", Tconv = " << res.Tconv_K
              << " K, lid = " << res.eLid_m / 1e3 << " km, TBL = " << res.deltaTBL_m / 1e3
              << " km, thickness = " << zb_m / 1e3 << " km" << std::endl;
  }
  if (!shell.convecting) {
    if (run_.verbose) {
      std::cout << phaseName(phase) << " shell is conductive, keeping conductive profile"
                << std::endl;
    }
    return shell;
  }

  const double PLid = pressureAtDepth(L, top, bottom, L.z_m[top] + res.eLid_m);
  const double PTBL = pressureAtDepth(L, top, bottom, L.z_m[bottom] - res.deltaTBL_m);
  const double Tconv = std::min(res.Tconv_K, Tbot);
  double TconvBottom = Tconv;

  for (int i = top + 1; i < bottom; ++i) {
    const double P = L.P_MPa[i];
    double T;
    if (P <= PLid) {
      const double x = (P - Ptop) / (PLid - Ptop);
      T = std::pow(Tconv, x) * std::pow(Ttop, 1.0 - x);
    } else if (P < PTBL) {
      // Adiabat through the well-mixed interior, starting from Tconv at the lid base
      const bool fromLid = L.P_MPa[i - 1] <= PLid;
      const double T0 = fromLid ? Tconv : L.T_K[i - 1];
      const double P0 = fromLid ? PLid : L.P_MPa[i - 1];
      T = T0 + L.alpha_pK[i - 1] * T0 / (L.Cp_JkgK[i - 1] * L.rho_kgm3[i - 1]) * (P - P0) * 1e6;
      T = std::min(T, Tbot);
      TconvBottom = T;
    } else {
      const double x = (P - PTBL) / (Pbot - PTBL);
      T = std::pow(Tbot, x) * std::pow(TconvBottom, 1.0 - x);
    }
    L.T_K[i] = T;
    fill_properties(state, i, eos, phase);
  }
  hydrostatic(state, top, bottom);
  return shell;
}

void HydrosphereIntegrator::ice_underplate(HydrosphereState &state, int phase, int top,
                                           int bottom, double Plow_MPa, double Tbot_K,
                                           double &Pbot_MPa) {
  LayerArrays &L = state.layers;
  Pbot_MPa = find_freeze_pressure(*state.ocean_eos, phase, Tbot_K, Plow_MPa,
                                  config_.ocean.PHydroMax_MPa, config_.PfreezeRes_MPa,
                                  UnderplateMode::NO_UNDERPLATE, search_);
  if (isNotFound(Pbot_MPa)) {
    state.broken = true;
    return;
  }
  if (run_.verbose) {
    std::cout << "Ice " << phaseName(phase) << " bottom phase transition pressure: " << Pbot_MPa
              << " MPa at " << Tbot_K << " K" << std::endl;
  }

  const double Ptop = L.P_MPa[top];
  const double Ttop = L.T_K[top];
  auto eos = iceEOS(phase, Ptop, Pbot_MPa, Ttop, Tbot_K);
  conduct_shell(state, top, bottom, Ptop, Pbot_MPa, Ttop, Tbot_K, phase, *eos);

  if (!config_.model.NO_ICE_CONVECTION) {
    convect_shell(state, top, bottom, phase, *eos);
  } else if (run_.verbose) {
    std::cout << "NO_ICE_CONVECTION set, skipping ice " << phaseName(phase) << " convection"
              << std::endl;
  }
}

void HydrosphereIntegrator::ocean_layers(HydrosphereState &state) {
  LayerArrays &L = state.layers;
  const int first = state.nSurfIce;
  const int end = state.nSurfIce + state.nOceanMax;
  const EOSView &ocean = *state.ocean_eos;

  if (L.phase[first] != PhaseID::LIQUID) {
    std::ostringstream msg;
    msg << "Ocean seam row " << first << " is already assigned phase " << L.phase[first]
        << " before the ocean layers were evaluated";
    throw PhaseAssignmentError(msg.str());
  }
  if (run_.verbose) {
    std::cout << "Evaluating ocean layers" << std::endl;
  }

  if (!(state.Pb_MPa < config_.ocean.PHydroMax_MPa)) {
    std::ostringstream msg;
    msg << "Ocean top pressure " << state.Pb_MPa << " MPa is not below PHydroMax_MPa = "
        << config_.ocean.PHydroMax_MPa << " MPa";
    throw PhysicallyInvalidRange(msg.str());
  }
  const double dP = (config_.ocean.PHydroMax_MPa - state.Pb_MPa) / state.nOceanMax;
  L.P_MPa[first] = state.Pb_MPa;
  L.T_K[first] = state.Tb_K;

  for (int j = first; j < end; ++j) {
    if (j > first) {
      L.P_MPa[j] = L.P_MPa[j - 1] + dP;
    }
    const int phase = ocean.phase(L.P_MPa[j], L.T_K[j]);
    double Tnext;
    if (phase == PhaseID::LIQUID) {
      fill_properties(state, j, ocean, PhaseID::LIQUID);
      Tnext = L.T_K[j] +
              L.alpha_pK[j] * L.T_K[j] / (L.Cp_JkgK[j] * L.rho_kgm3[j]) * dP * 1e6;
    } else {
      auto ice = iceEOS(phase, state.Pb_MPa, config_.ocean.PHydroMax_MPa, config_.bulk.Tsurf_K,
                        config_.ocean.THydroMax_K);
      fill_properties(state, j, *ice, phase);
      // High-pressure ice stays pinned to its melting curve
      Tnext = find_freeze_temperature(ocean, L.P_MPa[j], L.T_K[j], config_.TfreezeRange_K,
                                      config_.TfreezeRes_K, search_);
      if (isNotFound(Tnext)) {
        state.broken = true;
        Tnext = L.T_K[j];
      }
    }
    if (j + 1 < end) {
      L.T_K[j + 1] = Tnext;
    }
  }
  hydrostatic(state, first, end - 1);
}

void HydrosphereIntegrator::fill_properties(HydrosphereState &state, int row,
                                            const EOSView &eos, int phase) {
  LayerArrays &L = state.layers;
  const double P = L.P_MPa[row];
  const double T = L.T_K[row];
  L.rho_kgm3[row] = eos.rho_kgm3(P, T);
  L.Cp_JkgK[row] = eos.Cp_JkgK(P, T);
  L.alpha_pK[row] = eos.alpha_pK(P, T);
  L.kTherm_WmK[row] = eos.kTherm_WmK(P, T);
  L.phi_frac[row] = eos.porosity_frac(P, T);
  L.phase[row] = phase;
}

void HydrosphereIntegrator::hydrostatic(HydrosphereState &state, int top, int bottom) const {
  LayerArrays &L = state.layers;
  const double R = config_.bulk.R_m;
  const double M = config_.bulk.M_kg;

  double MAbove_kg = 0.0;
  for (int i = 0; i < top; ++i) {
    MAbove_kg += L.MLayer_kg[i];
  }
  for (int i = top + 1; i <= bottom; ++i) {
    L.z_m[i] = L.z_m[i - 1] + (L.P_MPa[i] - L.P_MPa[i - 1]) * 1e6 / L.g_ms2[i - 1] /
                                  L.rho_kgm3[i - 1];
    L.r_m[i] = R - L.z_m[i];
    L.MLayer_kg[i - 1] = 4.0 / 3.0 * PI * L.rho_kgm3[i - 1] *
                         (std::pow(L.r_m[i - 1], 3) - std::pow(L.r_m[i], 3));
    MAbove_kg += L.MLayer_kg[i - 1];
    L.g_ms2[i] = G * (M - MAbove_kg) / (L.r_m[i] * L.r_m[i]);
    logRow(state, i);
  }
}

void HydrosphereIntegrator::logRow(const HydrosphereState &state, int row) const {
  if (!run_.verbose || run_.progress_stride <= 0 || row % run_.progress_stride != 0) {
    return;
  }
  const LayerArrays &L = state.layers;
  std::cout << "il: " << row << "; P_MPa: " << L.P_MPa[row] << "; T_K: " << L.T_K[row]
            << "; phase: " << L.phase[row] << std::endl;
}
