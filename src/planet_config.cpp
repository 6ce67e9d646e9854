#include "planet_config.hpp"

#include <stdexcept>

std::string phaseName(int phase) {
  switch (phase) {
  case PhaseID::LIQUID:
    return "liquid";
  case PhaseID::ICE_I:
    return "Ih";
  case PhaseID::ICE_II:
    return "II";
  case PhaseID::ICE_III:
    return "III";
  case PhaseID::ICE_V:
    return "V";
  case PhaseID::ICE_VI:
    return "VI";
  case PhaseID::CLATHRATE:
    return "Clath";
  case PhaseID::SILICATE:
    return "Sil";
  case PhaseID::IRON:
    return "Fe";
  default:
    throw std::invalid_argument("Unknown phase tag: " + std::to_string(phase));
  }
}

PlanetConfig europa_config() {
  PlanetConfig config;
  config.name = "Europa";

  config.bulk.R_m = 1561.0e3;
  config.bulk.M_kg = 4.7991e22;
  config.bulk.Cmeasured = 0.346;
  config.bulk.Cuncertainty = 0.005;
  config.bulk.Tsurf_K = 110.0;
  config.bulk.Psurf_MPa = 0.0;
  config.bulk.Tb_K = 269.8;

  config.ocean.comp = "PureH2O";
  config.ocean.w_ppt = 0.0;
  config.ocean.PHydroMax_MPa = 350.0;

  config.sil.rhoSilWithCore_kgm3 = 3539.0;
  config.core.rhoFe_kgm3 = 8000.0;
  config.core.xFeS = 0.0;

  config.steps.nIceI = 200;
  config.steps.nOceanMax = 350;
  config.steps.nSilMax = 500;
  config.steps.nCore = 10;

  config.model.CONSTANT_INNER_DENSITY = true;
  config.model.Fe_CORE = true;
  return config;
}
