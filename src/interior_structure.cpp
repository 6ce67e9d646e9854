#include "interior_structure.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

ProfileResult interior_structure(const PlanetConfig &config, const RunConfig &run,
                                 EOSCache &cache, const ConvectionModel &convection,
                                 const std::string &output_filename) {
  if (run.verbose) {
    std::cout << "=== " << config.name << " ===" << std::endl;
  }

  HydrosphereIntegrator integrator(config, run, cache, convection);
  HydrosphereState hydro = integrator.propagate();

  ProfileResult result;
  result.name = config.name;
  result.nClath = hydro.nClath;
  result.nIbottom = hydro.nIbottom;
  result.nIIIbottom = hydro.nIIIbottom;
  result.nSurfIce = hydro.nSurfIce;
  result.PbI_MPa = hydro.PbI_MPa;
  result.PbIII_MPa = hydro.PbIII_MPa;
  result.PbV_MPa = hydro.PbV_MPa;
  result.Pb_MPa = hydro.Pb_MPa;
  result.zb_m = hydro.zb_m;
  result.Tb_K = hydro.Tb_K;
  result.QfromMantle_W = hydro.QfromMantle_W;
  result.convection = hydro.convection;

  if (hydro.broken) {
    std::cerr << "Warning: " << config.name
              << " hydrosphere is broken, skipping interior matching" << std::endl;
    result.layers = std::move(hydro.layers);
    result.valid = false;
    return result;
  }

  MoIMatcher matcher(config, run, cache);
  result.layers = matcher.inner_layers(hydro, result.moi);
  result.valid = true;

  if (!output_filename.empty() && !write_profile_csv(result, output_filename)) {
    std::cerr << "Warning: profile for " << config.name << " was not saved" << std::endl;
  }
  return result;
}

ProfileResult interior_structure(const PlanetConfig &config, const RunConfig &run,
                                 EOSCache &cache, const std::string &output_filename) {
  const DeschampsSotinConvection convection{};
  return interior_structure(config, run, cache, convection, output_filename);
}

bool write_profile_csv(const ProfileResult &result, const std::string &filename) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error: Could not open file " << filename << std::endl;
    return false;
  }

  outfile << "# " << result.name << '\n';
  outfile << std::setprecision(8);
  outfile << "# Pb_MPa = " << result.Pb_MPa << ", zb_m = " << result.zb_m
          << ", Tb_K = " << result.Tb_K << ", QfromMantle_W = " << result.QfromMantle_W << '\n';
  outfile << "# CMR2 = " << result.moi.CMR2mean << ", Rsil_m = " << result.moi.RsilMean_m
          << ", Rcore_m = " << result.moi.RcoreMean_m << ", nHydro = " << result.moi.nHydro
          << ", nSil = " << result.moi.nSil << ", nCore = " << result.moi.nCore << '\n';
  result.layers.writeCsv(outfile);
  return static_cast<bool>(outfile);
}

std::string get_profile_filename(const std::string &name, double Tb_K) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << Tb_K;
  std::string tb_str = ss.str();
  std::replace(tb_str.begin(), tb_str.end(), '.', 'p');

  return "data/" + name + "_Tb_" + tb_str + ".csv";
}
