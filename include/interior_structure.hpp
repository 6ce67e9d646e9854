#ifndef INTERIOR_STRUCTURE_HPP
#define INTERIOR_STRUCTURE_HPP

/**
 * @file interior_structure.hpp
 * @brief One complete body-model evaluation: hydrosphere, then MoI-matched interior
 * @date 2025-08-21
 */

#include "eos_cache.hpp"
#include "layer_arrays.hpp"
#include "layer_propagators.hpp"
#include "moi_matching.hpp"
#include "planet_config.hpp"
#include "thermal_profiles.hpp"

#include <string>
#include <vector>

/**
 * @brief Layer arrays of the whole body plus its boundary and interior summary.
 */
struct ProfileResult {
  std::string name;
  bool valid = false; ///< False when a broken hydrosphere stopped the evaluation
  LayerArrays layers;

  int nClath = 0;
  int nIbottom = 0;
  int nIIIbottom = 0;
  int nSurfIce = 0;

  double PbI_MPa = 0.0;
  double PbIII_MPa = 0.0;
  double PbV_MPa = 0.0;
  double Pb_MPa = 0.0;
  double zb_m = 0.0;
  double Tb_K = 0.0;
  double QfromMantle_W = 0.0;
  std::vector<ShellConvection> convection;

  MoIResult moi;
};

/**
 * @brief Evaluate one body model.
 *
 * Runs the hydrosphere integrator, then the MoI matching engine, and merges both into
 * a single surface-to-center profile. When allow_broken_models is set and a freeze
 * search fails, the partial hydrosphere is returned with valid = false.
 *
 * @param output_filename Write the merged profile as CSV when non-empty
 * @throws ProfileError subclasses and std::invalid_argument as raised by the stages
 */
ProfileResult interior_structure(const PlanetConfig &config, const RunConfig &run,
                                 EOSCache &cache, const ConvectionModel &convection,
                                 const std::string &output_filename = "");

/// Same as above with the Deschamps & Sotin convection model.
ProfileResult interior_structure(const PlanetConfig &config, const RunConfig &run,
                                 EOSCache &cache, const std::string &output_filename = "");

/**
 * @brief Write the layer arrays with a summary header to a CSV file.
 * @return false if the file could not be opened
 */
bool write_profile_csv(const ProfileResult &result, const std::string &filename);

/**
 * @brief Conventional output path, e.g. "data/Europa_Tb_269p8.csv".
 */
std::string get_profile_filename(const std::string &name, double Tb_K);

#endif // INTERIOR_STRUCTURE_HPP
