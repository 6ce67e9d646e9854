#ifndef MOI_MATCHING_HPP
#define MOI_MATCHING_HPP

/**
 * @file moi_matching.hpp
 * @brief Silicate/core sizing against a measured moment-of-inertia factor
 * @date 2025-08-20
 *
 * @details Every row of the hydrosphere at or below the ice/ocean interface is a
 * candidate seafloor. For each candidate the remaining mass is split between a silicate
 * mantle and an optional iron core, and the axial moment of inertia
 * \f[
 *   C = C_{hydro} + \frac{8\pi}{15}\left[\rho_{sil}(r_{sil}^5 - r_{core}^5)
 *       + \rho_{core} r_{core}^5\right]
 * \f]
 * is compared with the measured C/MR^2. Two modes are available:
 *
 * - Constant density: mantle and core densities are fixed, the core volume follows
 *   from mass conservation. Unless RunConfig::skip_inner is set, the winning sizes are
 *   then filled from the silicate and core EOS, so the reported mass may differ from M.
 * - EOS: the silicate EOS is propagated from each candidate to the center and the core
 *   EOS is started at the first silicate node whose remaining mass fits a core no
 *   lighter than rhoMin; the first core that undershoots the body mass is kept.
 *
 * Candidates whose C/MR^2 lies within the measurement uncertainty form the trade-off
 * set; the best match is the one closest to the measured value.
 */

#include "eos_cache.hpp"
#include "layer_arrays.hpp"
#include "layer_propagators.hpp"
#include "planet_config.hpp"

#include <cstddef>
#include <vector>

/**
 * @brief One physically admissible interior configuration.
 */
struct MoICandidate {
  int index = 0;            ///< Hydrosphere row at the top of the silicate layer
  double CMR2 = 0.0;
  double Rsil_m = 0.0;
  double Rcore_m = 0.0;
  double rhoSil_kgm3 = 0.0; ///< Mean silicate density
  double rhoCore_kgm3 = 0.0;
  double Mtot_kg = 0.0;
  int nSil = 0;             ///< Silicate rows kept above the core
};

struct MoIResult {
  std::vector<MoICandidate> candidates; ///< All admissible configurations, shallow first
  std::vector<size_t> matches;          ///< Indices into candidates within the uncertainty band
  size_t best = 0;                      ///< Index into candidates of the best match

  double CMR2mean = 0.0;
  double CMR2min = 0.0;
  double CMR2max = 0.0;

  double RsilMean_m = 0.0;
  double RsilRange_m = 0.0;
  std::vector<double> RsilTrade_m;
  double RcoreMean_m = 0.0;
  double RcoreRange_m = 0.0;
  std::vector<double> RcoreTrade_m;
  double rhoSilMean_kgm3 = 0.0;
  std::vector<double> rhoSilTrade_kgm3;
  double rhoCoreMean_kgm3 = 0.0;

  int nHydro = 0;
  int nSil = 0;
  int nCore = 0;
  double Mtot_kg = 0.0;

  bool non_equilibrium = false; ///< Temperature decreases with depth somewhere
  long non_equilibrium_index = -1;
};

class MoIMatcher {
public:
  /// Keeps references to its arguments.
  MoIMatcher(const PlanetConfig &config, const RunConfig &run, EOSCache &cache);

  /**
   * @brief Size the interior, fill silicate and core rows and merge them below the
   *        hydrosphere.
   *
   * @param[out] result Matching summary, including non-equilibrium flags
   * @return Whole-body layer arrays, surface first
   * @throws NoMoIMatch if no candidate lies within the uncertainty band
   */
  LayerArrays inner_layers(const HydrosphereState &hydro, MoIResult &result);

  /**
   * @param[out] inner Silicate and core rows of the best match
   * @throws NoMoIMatch
   * @throws EOSRangeError if the EOS fill leaves a strict table
   */
  MoIResult calc_moi_constant_rho(const HydrosphereState &hydro, LayerArrays &inner);

  /**
   * @param[out] inner Silicate and core rows of the best match
   * @throws std::invalid_argument without an iron core
   * @throws MassExceededError if every silicate profile is heavier than the body
   * @throws ProfileError for negative silicate temperatures
   * @throws NoMoIMatch
   */
  MoIResult calc_moi_with_eos(const HydrosphereState &hydro, LayerArrays &inner);

private:
  struct SilicateProfile;
  struct CoreProfile;

  SilicateProfile silicate_layers(const HydrosphereState &hydro, const std::vector<double> &MAbove,
                                  int index, double rEnd_m, const EOSView &eos) const;
  CoreProfile core_profile(double rTop_m, double Ptop_MPa, double Ttop_K, double gTop_ms2,
                           const EOSView &eos) const;
  bool iron_core_layers(const SilicateProfile &sil, const EOSView &eos, CoreProfile &core,
                        int &nSilFinal) const;

  /// Replace constant-density rows of the best match with silicate and core EOS profiles.
  void evaluate_inner_eos(const HydrosphereState &hydro, const std::vector<double> &MAbove,
                          const MoICandidate &best, LayerArrays &inner, MoIResult &result);

  void select_best(MoIResult &result) const;

  RangeDescriptor innerRange() const;

  const PlanetConfig &config_;
  const RunConfig &run_;
  EOSCache &cache_;
};

#endif // MOI_MATCHING_HPP
