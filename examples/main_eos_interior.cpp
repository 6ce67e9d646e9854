#include "eos_cache.hpp"
#include "interior_structure.hpp"
#include "planet_config.hpp"
#include "profile_errors.hpp"

#include <exception>
#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>

// Europa with a seawater ocean, a clathrate lid and EOS-consistent silicate and core layers.
int main() {
  gsl_set_error_handler_off();

  PlanetConfig config = europa_config();
  config.name = "Europa_seawater_EOS";
  config.ocean.comp = "Seawater";
  config.ocean.w_ppt = 35.0;
  config.model.CLATHRATE = true;
  config.model.CONSTANT_INNER_DENSITY = false;
  config.bulk.Cuncertainty = 0.02;

  RunConfig run;
  run.verbose = true;
  run.progress_stride = 100;
  run.extrap_sil = true;
  run.extrap_fe = true;

  EOSCache cache(run.verbose);
  try {
    const ProfileResult result = interior_structure(config, run, cache);
    const MoIResult &moi = result.moi;
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "C/MR^2 = " << moi.CMR2mean << ", M_tot/M = " << moi.Mtot_kg / config.bulk.M_kg
              << '\n';
    std::cout << std::setprecision(1) << "R_sil = " << moi.RsilMean_m / 1e3
              << " km, R_core = " << moi.RcoreMean_m / 1e3 << " km, rho_sil = "
              << moi.rhoSilMean_kgm3 << " kg/m^3, rho_core = " << moi.rhoCoreMean_kgm3
              << " kg/m^3" << '\n';
    if (moi.non_equilibrium) {
      std::cout << "Profile is not in thermal equilibrium below row " << moi.non_equilibrium_index
                << '\n';
    }
  } catch (const ProfileError &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: unexpected failure: " << e.what() << '\n';
    return 2;
  }
  std::cout << "EOS cache holds " << cache.size() << " tables (" << cache.buildCount()
            << " builds)" << '\n';
  return 0;
}
