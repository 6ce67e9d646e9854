#include "eos_cache.hpp"
#include "profile_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string formatNumber(double x) {
  std::ostringstream out;
  out.precision(6);
  out << x;
  return out.str();
}

std::string porositySuffix(const PorosityModel &porosity) {
  if (!porosity.enabled) {
    return "";
  }
  return "_phi" + formatNumber(porosity.phi_surface_frac) + "_Pc" +
         formatNumber(porosity.P_closure_MPa) + "_pore" + formatNumber(porosity.rho_pore_kgm3);
}

std::vector<double> linspace(double lo, double hi, size_t n) {
  std::vector<double> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
  }
  out.back() = hi;
  return out;
}

size_t sampleCount(double lo, double hi, double step) {
  const auto n = static_cast<size_t>(std::lround((hi - lo) / step)) + 1;
  return std::max<size_t>(n, 2);
}

} // namespace

OceanComposition parseOceanComposition(const std::string &name) {
  if (name == "PureH2O" || name == "PURE_WATER") {
    return OceanComposition::PURE_WATER;
  } else if (name == "Seawater" || name == "SEAWATER") {
    return OceanComposition::SEAWATER;
  } else if (name == "MgSO4" || name == "MGSO4") {
    return OceanComposition::MGSO4;
  } else if (name == "NaCl" || name == "NACL") {
    return OceanComposition::NACL;
  } else if (name == "NH3") {
    return OceanComposition::NH3;
  } else if (name == "CUSTOM") {
    return OceanComposition::CUSTOM;
  }
  throw UnsupportedComposition("Unknown ocean composition: " + name);
}

std::string oceanCompositionToString(OceanComposition comp) {
  switch (comp) {
  case OceanComposition::PURE_WATER:
    return "PureH2O";
  case OceanComposition::SEAWATER:
    return "Seawater";
  case OceanComposition::MGSO4:
    return "MgSO4";
  case OceanComposition::NACL:
    return "NaCl";
  case OceanComposition::NH3:
    return "NH3";
  case OceanComposition::CUSTOM:
    return "CUSTOM";
  }
  return "UNKNOWN";
}

void RangeDescriptor::validate(const std::string &label) const {
  const bool finite = std::isfinite(Pmin_MPa) && std::isfinite(Pmax_MPa) &&
                      std::isfinite(deltaP_MPa) && std::isfinite(Tmin_K) &&
                      std::isfinite(Tmax_K) && std::isfinite(deltaT_K);
  if (!finite || Pmax_MPa <= Pmin_MPa || Tmax_K <= Tmin_K || deltaP_MPa <= 0.0 ||
      deltaT_K <= 0.0) {
    std::ostringstream msg;
    msg << "Invalid EOS range for " << label << ": P = [" << Pmin_MPa << ", " << Pmax_MPa
        << "] step " << deltaP_MPa << " MPa, T = [" << Tmin_K << ", " << Tmax_K << "] step "
        << deltaT_K << " K";
    throw PhysicallyInvalidRange(msg.str());
  }
  if (Tmin_K <= 0.0) {
    throw PhysicallyInvalidRange("Non-positive temperature bound requested for " + label);
  }
}

bool RangeDescriptor::contains(const RangeDescriptor &other) const {
  return other.Pmin_MPa >= Pmin_MPa && other.Pmax_MPa <= Pmax_MPa && other.Tmin_K >= Tmin_K &&
         other.Tmax_K <= Tmax_K;
}

bool RangeDescriptor::operator==(const RangeDescriptor &other) const {
  return Pmin_MPa == other.Pmin_MPa && Pmax_MPa == other.Pmax_MPa &&
         deltaP_MPa == other.deltaP_MPa && Tmin_K == other.Tmin_K && Tmax_K == other.Tmax_K &&
         deltaT_K == other.deltaT_K;
}

RangeDescriptor RangeDescriptor::unite(const RangeDescriptor &a, const RangeDescriptor &b) {
  RangeDescriptor out;
  out.Pmin_MPa = std::min(a.Pmin_MPa, b.Pmin_MPa);
  out.Pmax_MPa = std::max(a.Pmax_MPa, b.Pmax_MPa);
  out.deltaP_MPa = std::min(a.deltaP_MPa, b.deltaP_MPa);
  out.Tmin_K = std::min(a.Tmin_K, b.Tmin_K);
  out.Tmax_K = std::max(a.Tmax_K, b.Tmax_K);
  out.deltaT_K = std::min(a.deltaT_K, b.deltaT_K);
  return out;
}

EOSCache::EOSCache(bool verbose) : verbose_(verbose) {
  // Sources hold their own copy so copies of the cache stay self-contained
  const ReferenceEOS ref{};
  auto water = [ref](const EOSGrid &grid, double w_ppt) { return ref.waterTable(grid, w_ppt); };
  registerOceanSource(OceanComposition::PURE_WATER,
                      [ref](const EOSGrid &grid, double) { return ref.waterTable(grid, 0.0); });
  registerOceanSource(OceanComposition::SEAWATER, water);

  auto ice = [ref](const EOSGrid &grid, int phase) { return ref.iceTable(grid, phase); };
  for (int phase : {PhaseID::ICE_I, PhaseID::ICE_II, PhaseID::ICE_III, PhaseID::ICE_V,
                    PhaseID::ICE_VI, PhaseID::CLATHRATE}) {
    registerIceSource(phase, ice);
  }

  registerInnerSource("reference_silicate", [ref](const EOSGrid &grid) {
    return ref.solidTable(grid, ReferenceMaterial::SILICATE);
  });
  registerInnerSource("reference_iron_core", [ref](const EOSGrid &grid) {
    return ref.solidTable(grid, ReferenceMaterial::IRON_CORE);
  });
}

OceanComposition EOSCache::resolveOceanComposition(const std::string &name) const {
  OceanComposition comp = OceanComposition::CUSTOM;
  bool builtin = true;
  try {
    comp = parseOceanComposition(name);
  } catch (const UnsupportedComposition &) {
    builtin = false;
  }
  if (builtin && comp != OceanComposition::CUSTOM &&
      ocean_sources_.find(comp) != ocean_sources_.end()) {
    return comp;
  }
  if (custom_ocean_sources_.find(name) != custom_ocean_sources_.end()) {
    return OceanComposition::CUSTOM;
  }
  if (!builtin) {
    throw UnsupportedComposition("Unknown ocean composition: " + name);
  }
  throw UnsupportedComposition("No EOS source registered for ocean composition " + name);
}

void EOSCache::registerOceanSource(OceanComposition comp, OceanTableSource source) {
  if (comp == OceanComposition::CUSTOM) {
    throw std::invalid_argument("CUSTOM ocean sources are registered by name");
  }
  ocean_sources_[comp] = std::move(source);
}

void EOSCache::registerCustomOceanSource(const std::string &name, OceanTableSource source) {
  custom_ocean_sources_[name] = std::move(source);
}

void EOSCache::registerIceSource(int phase, IceTableSource source) {
  ice_sources_[phase] = std::move(source);
}

void EOSCache::registerInnerSource(const std::string &name, InnerTableSource source) {
  inner_sources_[name] = std::move(source);
}

std::string EOSCache::oceanLabel(const OceanEOSRequest &req) {
  const std::string comp = (req.comp == OceanComposition::CUSTOM)
                               ? "custom:" + req.custom_name
                               : oceanCompositionToString(req.comp);
  return "ocean_" + comp + "_" + formatNumber(req.w_ppt) + "ppt_" + req.elec_type +
         (req.allow_extrapolation ? "_extrap" : "");
}

std::string EOSCache::iceLabel(const IceEOSRequest &req) {
  return "ice_" + phaseName(req.phase) + porositySuffix(req.porosity) +
         (req.allow_extrapolation ? "_extrap" : "");
}

std::string EOSCache::innerLabel(const InnerEOSRequest &req) {
  return "inner_" + req.table_name + porositySuffix(req.porosity) +
         (req.allow_extrapolation ? "_extrap" : "");
}

std::shared_ptr<const EOSView> EOSCache::getOceanEOS(const OceanEOSRequest &req) {
  const OceanTableSource *source = nullptr;
  if (req.comp == OceanComposition::CUSTOM) {
    auto it = custom_ocean_sources_.find(req.custom_name);
    if (it != custom_ocean_sources_.end()) {
      source = &it->second;
    }
  } else {
    auto it = ocean_sources_.find(req.comp);
    if (it != ocean_sources_.end()) {
      source = &it->second;
    }
  }
  const std::string label = oceanLabel(req);
  if (source == nullptr) {
    throw UnsupportedComposition("No EOS source registered for ocean composition " + label);
  }
  const double w_ppt = req.w_ppt;
  return getOrBuild(label, req.range, req.allow_extrapolation, PorosityModel(),
                    [source, w_ppt](const EOSGrid &grid) { return (*source)(grid, w_ppt); });
}

std::shared_ptr<const EOSView> EOSCache::getIceEOS(const IceEOSRequest &req) {
  auto it = ice_sources_.find(req.phase);
  if (it == ice_sources_.end()) {
    throw UnsupportedComposition("No EOS source registered for ice phase " +
                                 std::to_string(req.phase));
  }
  const IceTableSource &source = it->second;
  const int phase = req.phase;
  return getOrBuild(iceLabel(req), req.range, req.allow_extrapolation, req.porosity,
                    [&source, phase](const EOSGrid &grid) { return source(grid, phase); });
}

std::shared_ptr<const EOSView> EOSCache::getInnerEOS(const InnerEOSRequest &req) {
  auto it = inner_sources_.find(req.table_name);
  if (it == inner_sources_.end()) {
    throw UnsupportedComposition("No EOS source registered for inner material " + req.table_name);
  }
  return getOrBuild(innerLabel(req), req.range, req.allow_extrapolation, req.porosity,
                    it->second);
}

std::shared_ptr<const EOSView> EOSCache::getOrBuild(const std::string &label,
                                                    const RangeDescriptor &range,
                                                    bool allow_extrapolation,
                                                    const PorosityModel &porosity,
                                                    const TableBuilder &build) {
  range.validate(label);

  RangeDescriptor target = range;
  auto it = entries_.find(label);
  if (it != entries_.end()) {
    if (it->second.range == range || it->second.range.contains(range)) {
      return it->second.eos;
    }
    target = RangeDescriptor::unite(it->second.range, range);
  }

  if (verbose_) {
    std::cout << "Building EOS " << label << " over P = [" << target.Pmin_MPa << ", "
              << target.Pmax_MPa << "] MPa, T = [" << target.Tmin_K << ", " << target.Tmax_K
              << "] K" << std::endl;
  }

  EOSTable table = build(makeGrid(target));
  if (porosity.enabled) {
    for (size_t iT = 0; iT < table.grid.T_K.size(); ++iT) {
      for (size_t iP = 0; iP < table.grid.P_MPa.size(); ++iP) {
        const size_t idx = table.index(iP, iT);
        const double phi = porosity.porosity(table.grid.P_MPa[iP]);
        table.rho_kgm3[idx] = (1.0 - phi) * table.rho_kgm3[idx] + phi * porosity.rho_pore_kgm3;
      }
    }
  }
  auto eos = std::make_shared<const SplineEOSView>(label, table, allow_extrapolation, porosity);

  // Only a fully built instance replaces the entry.
  entries_[label] = Entry{target, eos};
  ++builds_;
  return eos;
}

void EOSCache::clear() {
  entries_.clear();
}

bool EOSCache::contains(const std::string &label) const {
  return entries_.find(label) != entries_.end();
}

RangeDescriptor EOSCache::cachedRange(const std::string &label) const {
  return entries_.at(label).range;
}

EOSGrid EOSCache::makeGrid(const RangeDescriptor &range) {
  size_t nP = sampleCount(range.Pmin_MPa, range.Pmax_MPa, range.deltaP_MPa);
  size_t nT = sampleCount(range.Tmin_K, range.Tmax_K, range.deltaT_K);
  if (nP < 4) {
    nP = std::max<size_t>(3 * nP, 4);
  }
  if (nT < 4) {
    nT = std::max<size_t>(3 * nT, 4);
  }

  EOSGrid grid;
  grid.P_MPa = linspace(range.Pmin_MPa, range.Pmax_MPa, nP);
  grid.T_K = linspace(range.Tmin_K, range.Tmax_K, nT);
  if (nP == nT) {
    grid.T_K.push_back(grid.T_K.back() * 1.00001);
  }
  return grid;
}
