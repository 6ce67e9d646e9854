#include "eos_cache.hpp"
#include "interior_structure.hpp"
#include "planet_config.hpp"
#include "profile_errors.hpp"

#include <exception>
#include <filesystem>
#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>

// Helpers for reporting
namespace {
constexpr double kMPerKm = 1e3;

void printSummary(const ProfileResult &result, const PlanetConfig &config) {
  const MoIResult &moi = result.moi;
  std::cout << "\n=== " << result.name << " INTERIOR SUMMARY ===" << '\n';
  std::cout << std::fixed << std::setprecision(3);
  std::cout << "Ice I bottom pressure PbI:   " << result.PbI_MPa << " MPa" << '\n';
  std::cout << "Ice/ocean interface Pb:      " << result.Pb_MPa << " MPa at " << result.Tb_K
            << " K" << '\n';
  std::cout << "Ice shell thickness zb:      " << result.zb_m / kMPerKm << " km" << '\n';
  std::cout << std::scientific << std::setprecision(4);
  std::cout << "Heat flux into hydrosphere:  " << result.QfromMantle_W << " W" << '\n';
  for (const auto &shell : result.convection) {
    std::cout << "  " << phaseName(shell.phase) << " shell: Ra = " << shell.Ra
              << (shell.convecting ? " (convecting)" : " (conductive)") << '\n';
  }
  std::cout << std::fixed << std::setprecision(4);
  std::cout << "C/MR^2 best match:           " << moi.CMR2mean << " (target "
            << config.bulk.Cmeasured << " +/- " << config.bulk.Cuncertainty << ", "
            << moi.matches.size() << " matching configurations)" << '\n';
  std::cout << std::setprecision(1);
  std::cout << "Silicate radius:             " << moi.RsilMean_m / kMPerKm << " km (range "
            << moi.RsilRange_m / kMPerKm << " km)" << '\n';
  std::cout << "Core radius:                 " << moi.RcoreMean_m / kMPerKm << " km (range "
            << moi.RcoreRange_m / kMPerKm << " km)" << '\n';
  std::cout << "Layers (hydro/sil/core):     " << moi.nHydro << " / " << moi.nSil << " / "
            << moi.nCore << '\n';
  std::cout << std::setprecision(5);
  std::cout << "Total mass:                  " << moi.Mtot_kg / config.bulk.M_kg << " M" << '\n';
}
} // namespace

int main(int argc, char *argv[]) {
  gsl_set_error_handler_off();

  PlanetConfig config = europa_config();
  RunConfig run;
  run.verbose = (argc > 1 && std::string(argv[1]) == "-v");

  EOSCache cache(run.verbose);
  const std::string filename = get_profile_filename(config.name, config.bulk.Tb_K);
  std::error_code ec;
  std::filesystem::create_directories("data", ec);
  if (ec) {
    std::cerr << "Warning: could not create data directory: " << ec.message() << '\n';
  }

  try {
    ProfileResult result = interior_structure(config, run, cache, filename);
    if (!result.valid) {
      std::cerr << "Model " << config.name << " is incomplete." << '\n';
      return 1;
    }
    printSummary(result, config);
    if (!ec) {
      std::cout << "Profile written to " << filename << '\n';
    }
  } catch (const ProfileError &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: unexpected failure: " << e.what() << '\n';
    return 2;
  }
  return 0;
}
