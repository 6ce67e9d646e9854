#ifndef EOS_CACHE_HPP
#define EOS_CACHE_HPP

/**
 * @file eos_cache.hpp
 * @brief Memoizing factory for material EOS interpolants
 *
 * Table sources (construction closures) are registered per composition; the cache turns
 * their raw (P, T) tables into SplineEOSView instances and keeps one instance per
 * composition-configuration label. The reference tables of reference_eos.hpp are
 * registered on construction for pure water, seawater, the ice polymorphs, clathrate,
 * silicate and iron.
 *
 * Reuse policy for a request on an existing label:
 * - identical range descriptor: return the cached instance
 * - requested range inside the cached bounds: return the cached instance
 * - otherwise: rebuild over the union of both ranges and replace the entry
 *
 * The cache performs no locking. Share one instance between threads only behind an
 * external mutex held across each get*EOS call, or give each worker its own cache.
 *
 * @date 2025-08-13
 *
 * @example Basic Usage
 * ```cpp
 * EOSCache cache;
 * OceanEOSRequest req;
 * req.comp = parseOceanComposition("Seawater");
 * req.w_ppt = 35.0;
 * req.range = {0.0, 350.0, 0.5, 250.0, 320.0, 1.0};
 * auto ocean = cache.getOceanEOS(req);
 * double rho = ocean->rho_kgm3(100.0, 272.0);
 * ```
 *
 * @example Registering External Tables
 * ```cpp
 * cache.registerOceanSource(OceanComposition::MGSO4,
 *                           [&loader](const EOSGrid &grid, double w_ppt) {
 *                             return loader.mgso4Table(grid, w_ppt);
 *                           });
 * ```
 */

#include "planet_config.hpp"
#include "reference_eos.hpp"
#include "spline_view.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

enum class OceanComposition {
  PURE_WATER, ///< "PureH2O"
  SEAWATER,   ///< "Seawater"
  MGSO4,      ///< "MgSO4"
  NACL,       ///< "NaCl"
  NH3,        ///< "NH3"
  CUSTOM      ///< Registered at run time under OceanEOSRequest::custom_name
};

/**
 * @brief Parse a composition name.
 * @throws UnsupportedComposition if the name matches no known composition
 */
OceanComposition parseOceanComposition(const std::string &name);

std::string oceanCompositionToString(OceanComposition comp);

/**
 * @brief Pressure/temperature extent and sampling step of an EOS grid.
 */
struct RangeDescriptor {
  double Pmin_MPa = 0.0;
  double Pmax_MPa = 0.0;
  double deltaP_MPa = 1.0;
  double Tmin_K = 0.0;
  double Tmax_K = 0.0;
  double deltaT_K = 1.0;

  /// @throws PhysicallyInvalidRange for non-finite values, max <= min, or step <= 0
  void validate(const std::string &label) const;

  [[nodiscard]] bool contains(const RangeDescriptor &other) const;
  [[nodiscard]] bool operator==(const RangeDescriptor &other) const;

  /// Union of extents, finer of the two steps.
  static RangeDescriptor unite(const RangeDescriptor &a, const RangeDescriptor &b);
};

struct OceanEOSRequest {
  OceanComposition comp = OceanComposition::PURE_WATER;
  std::string custom_name;
  double w_ppt = 0.0;
  RangeDescriptor range;
  std::string elec_type = "Vance2018";
  bool allow_extrapolation = false;
};

struct IceEOSRequest {
  int phase = PhaseID::ICE_I;
  RangeDescriptor range;
  PorosityModel porosity;
  bool allow_extrapolation = false;
};

struct InnerEOSRequest {
  std::string table_name;
  RangeDescriptor range;
  PorosityModel porosity;
  bool allow_extrapolation = false;
};

using OceanTableSource = std::function<EOSTable(const EOSGrid &grid, double w_ppt)>;
using IceTableSource = std::function<EOSTable(const EOSGrid &grid, int phase)>;
using InnerTableSource = std::function<EOSTable(const EOSGrid &grid)>;

class EOSCache {
public:
  explicit EOSCache(bool verbose = false);

  void registerOceanSource(OceanComposition comp, OceanTableSource source);
  void registerCustomOceanSource(const std::string &name, OceanTableSource source);
  void registerIceSource(int phase, IceTableSource source);
  void registerInnerSource(const std::string &name, InnerTableSource source);

  /**
   * @brief Composition selected by a configured ocean name.
   *
   * Builtin names with a registered source map to their enum value; any other name with a
   * source registered through registerCustomOceanSource maps to CUSTOM.
   * @throws UnsupportedComposition if no source would serve the name
   */
  [[nodiscard]] OceanComposition resolveOceanComposition(const std::string &name) const;

  /**
   * @throws UnsupportedComposition if no source is registered for the composition
   * @throws PhysicallyInvalidRange for a degenerate range
   */
  std::shared_ptr<const EOSView> getOceanEOS(const OceanEOSRequest &req);
  std::shared_ptr<const EOSView> getIceEOS(const IceEOSRequest &req);
  std::shared_ptr<const EOSView> getInnerEOS(const InnerEOSRequest &req);

  /// Drop every entry. Instances already handed out stay alive with their holders.
  void clear();

  [[nodiscard]] size_t size() const { return entries_.size(); }
  [[nodiscard]] bool contains(const std::string &label) const;
  [[nodiscard]] size_t buildCount() const { return builds_; }
  /// Range an entry was built over. @throws std::out_of_range for an unknown label
  [[nodiscard]] RangeDescriptor cachedRange(const std::string &label) const;

  static std::string oceanLabel(const OceanEOSRequest &req);
  static std::string iceLabel(const IceEOSRequest &req);
  static std::string innerLabel(const InnerEOSRequest &req);

  /**
   * @brief Sample a range into grid axes.
   *
   * Axes shorter than 4 nodes are stretched to max(3n, 4) nodes. When both axes have
   * the same length an extra temperature node at 1.00001 * Tmax is appended.
   */
  static EOSGrid makeGrid(const RangeDescriptor &range);

private:
  using TableBuilder = std::function<EOSTable(const EOSGrid &grid)>;

  struct Entry {
    RangeDescriptor range;
    std::shared_ptr<const SplineEOSView> eos;
  };

  std::shared_ptr<const EOSView> getOrBuild(const std::string &label, const RangeDescriptor &range,
                                            bool allow_extrapolation,
                                            const PorosityModel &porosity,
                                            const TableBuilder &build);

  bool verbose_;
  size_t builds_ = 0;
  std::map<std::string, Entry> entries_;
  std::map<OceanComposition, OceanTableSource> ocean_sources_;
  std::map<std::string, OceanTableSource> custom_ocean_sources_;
  std::map<int, IceTableSource> ice_sources_;
  std::map<std::string, InnerTableSource> inner_sources_;
};

#endif // EOS_CACHE_HPP
