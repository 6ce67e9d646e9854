#include "profile_sweep.hpp"
#include "eos_cache.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

std::vector<SweepResult> sweep_profiles(const std::vector<PlanetConfig> &configs,
                                        const RunConfig &run, const ConvectionModel &convection) {
  std::vector<SweepResult> results(configs.size());
  const long n = static_cast<long>(configs.size());

#ifdef _OPENMP
  if (run.verbose) {
    std::cout << "Sweeping " << n << " models on up to " << omp_get_max_threads() << " threads"
              << std::endl;
  }
#pragma omp parallel
#endif
  {
    RunConfig workerRun = run;
#ifdef _OPENMP
    // Per-step output of concurrent models would interleave; only the one-line summaries below
    // are written while more than one thread runs
    if (omp_get_num_threads() > 1) {
      workerRun.verbose = false;
    }
#endif
    EOSCache cache(workerRun.verbose);

#ifdef _OPENMP
#pragma omp for schedule(dynamic)
#endif
    for (long i = 0; i < n; ++i) {
      SweepResult &item = results[i];
      item.name = configs[i].name;
      try {
        item.profile = interior_structure(configs[i], workerRun, cache, convection);
        item.ok = item.profile.valid;
        if (!item.ok) {
          item.error = "hydrosphere integration stopped at a failed phase boundary search";
        }
      } catch (const std::exception &e) {
        item.ok = false;
        item.error = e.what();
#ifdef _OPENMP
#pragma omp critical(sweep_log)
#endif
        std::cerr << "Error: " << item.name << ": " << item.error << std::endl;
      }
      if (run.verbose) {
#ifdef _OPENMP
#pragma omp critical(sweep_log)
#endif
        std::cout << "Evaluated " << item.name << (item.ok ? "" : " (failed)") << std::endl;
      }
    }
  }
  return results;
}

std::vector<PlanetConfig> make_tb_sweep(const PlanetConfig &base, double Tb_min_K,
                                        double Tb_max_K, int n) {
  if (n < 1 || Tb_max_K < Tb_min_K) {
    throw std::invalid_argument("make_tb_sweep: need n >= 1 and Tb_max_K >= Tb_min_K");
  }
  std::vector<PlanetConfig> configs;
  configs.reserve(n);
  for (int i = 0; i < n; ++i) {
    PlanetConfig config = base;
    config.bulk.Tb_K = (n == 1) ? Tb_min_K : Tb_min_K + (Tb_max_K - Tb_min_K) * i / (n - 1);
    std::ostringstream name;
    name << base.name << "_Tb" << std::fixed << std::setprecision(2) << config.bulk.Tb_K;
    config.name = name.str();
    configs.push_back(config);
  }
  return configs;
}
