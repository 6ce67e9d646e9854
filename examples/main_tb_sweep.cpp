#include "planet_config.hpp"
#include "profile_sweep.hpp"
#include "thermal_profiles.hpp"

#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <vector>

// Ice-shell thickness and C/MR^2 across a range of ice-shell bottom temperatures.
int main() {
  gsl_set_error_handler_off();

  const PlanetConfig base = europa_config();
  RunConfig run;
  const DeschampsSotinConvection convection{};

  const std::vector<PlanetConfig> configs = make_tb_sweep(base, 266.0, 272.0, 13);
  std::cout << "Computing " << configs.size() << " models of " << base.name << "..." << '\n';
  const std::vector<SweepResult> results = sweep_profiles(configs, run, convection);

  std::cout << std::setw(22) << "Model" << std::setw(12) << "Tb [K]" << std::setw(12)
            << "Pb [MPa]" << std::setw(12) << "zb [km]" << std::setw(12) << "C/MR^2"
            << std::setw(14) << "Rsil [km]" << '\n';
  int failed = 0;
  for (size_t i = 0; i < results.size(); ++i) {
    const SweepResult &r = results[i];
    std::cout << std::setw(22) << r.name << std::fixed << std::setprecision(2) << std::setw(12)
              << configs[i].bulk.Tb_K;
    if (!r.ok) {
      ++failed;
      std::cout << "  failed: " << r.error << '\n';
      continue;
    }
    std::cout << std::setw(12) << r.profile.Pb_MPa << std::setw(12) << r.profile.zb_m / 1e3
              << std::setprecision(4) << std::setw(12) << r.profile.moi.CMR2mean
              << std::setprecision(1) << std::setw(14) << r.profile.moi.RsilMean_m / 1e3 << '\n';
  }
  if (failed > 0) {
    std::cout << failed << " of " << results.size() << " models failed." << '\n';
  }
  return failed == static_cast<int>(results.size()) ? 1 : 0;
}
