#ifndef PROFILE_SWEEP_HPP
#define PROFILE_SWEEP_HPP
#include "interior_structure.hpp"
#include "planet_config.hpp"
#include "thermal_profiles.hpp"

#include <string>
#include <vector>

struct SweepResult {
  std::string name;
  bool ok = false;
  std::string error; // what() of the exception that stopped this model, if any
  ProfileResult profile;
};

/**
 * @brief Evaluate many body models.
 *
 * Each worker owns its EOSCache, so no cache is shared between threads. With OpenMP the
 * models are distributed dynamically. A failing model is reported in its own result and
 * does not stop the others. Results keep the order of configs.
 */
std::vector<SweepResult> sweep_profiles(const std::vector<PlanetConfig> &configs,
                                        const RunConfig &run, const ConvectionModel &convection);

/**
 * @brief Copies of base with the ice-shell bottom temperature spaced evenly in
 *        [Tb_min, Tb_max]; names carry the temperature.
 * @throws std::invalid_argument for n < 1 or Tb_max < Tb_min
 */
std::vector<PlanetConfig> make_tb_sweep(const PlanetConfig &base, double Tb_min_K,
                                        double Tb_max_K, int n);

#endif // PROFILE_SWEEP_HPP
