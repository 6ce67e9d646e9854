#include "layer_arrays.hpp"

#include <stdexcept>

void LayerArrays::resize(size_t n) {
  r_m.resize(n, 0.0);
  z_m.resize(n, 0.0);
  P_MPa.resize(n, 0.0);
  T_K.resize(n, 0.0);
  rho_kgm3.resize(n, 0.0);
  Cp_JkgK.resize(n, 0.0);
  alpha_pK.resize(n, 0.0);
  kTherm_WmK.resize(n, 0.0);
  g_ms2.resize(n, 0.0);
  phi_frac.resize(n, 0.0);
  phase.resize(n, 0);
  MLayer_kg.resize(n, 0.0);
}

void LayerArrays::append(const LayerArrays &other, size_t begin, size_t end) {
  if (begin > end || end > other.size()) {
    throw std::out_of_range("LayerArrays::append: invalid row range");
  }
  auto copyRows = [begin, end](auto &dst, const auto &src) {
    dst.insert(dst.end(), src.begin() + begin, src.begin() + end);
  };
  copyRows(r_m, other.r_m);
  copyRows(z_m, other.z_m);
  copyRows(P_MPa, other.P_MPa);
  copyRows(T_K, other.T_K);
  copyRows(rho_kgm3, other.rho_kgm3);
  copyRows(Cp_JkgK, other.Cp_JkgK);
  copyRows(alpha_pK, other.alpha_pK);
  copyRows(kTherm_WmK, other.kTherm_WmK);
  copyRows(g_ms2, other.g_ms2);
  copyRows(phi_frac, other.phi_frac);
  copyRows(phase, other.phase);
  copyRows(MLayer_kg, other.MLayer_kg);
}

std::vector<double> LayerArrays::massAbove() const {
  std::vector<double> above(size(), 0.0);
  for (size_t i = 1; i < size(); ++i) {
    above[i] = above[i - 1] + MLayer_kg[i - 1];
  }
  return above;
}

double LayerArrays::totalMass() const {
  double total = 0.0;
  for (double m : MLayer_kg) {
    total += m;
  }
  return total;
}

bool LayerArrays::radiusStrictlyDecreasing() const {
  for (size_t i = 1; i < size(); ++i) {
    if (!(r_m[i] < r_m[i - 1])) {
      return false;
    }
  }
  return true;
}

bool LayerArrays::pressureNonDecreasing() const {
  for (size_t i = 1; i < size(); ++i) {
    if (P_MPa[i] < P_MPa[i - 1]) {
      return false;
    }
  }
  return true;
}

bool LayerArrays::depthNonDecreasing() const {
  for (size_t i = 1; i < size(); ++i) {
    if (z_m[i] < z_m[i - 1]) {
      return false;
    }
  }
  return true;
}

long LayerArrays::firstNegativeTemperatureStep() const {
  for (size_t i = 1; i < size(); ++i) {
    if (T_K[i] < T_K[i - 1]) {
      return static_cast<long>(i);
    }
  }
  return -1;
}

void LayerArrays::writeCsv(std::ostream &out) const {
  out << "r[m],z[m],P[MPa],T[K],rho[kg/m3],Cp[J/kg/K],alpha[1/K],k[W/m/K],g[m/s2],phi,phase,"
         "MLayer[kg]\n";
  for (size_t i = 0; i < size(); ++i) {
    out << r_m[i] << "," << z_m[i] << "," << P_MPa[i] << "," << T_K[i] << "," << rho_kgm3[i]
        << "," << Cp_JkgK[i] << "," << alpha_pK[i] << "," << kTherm_WmK[i] << "," << g_ms2[i]
        << "," << phi_frac[i] << "," << phase[i] << "," << MLayer_kg[i] << "\n";
  }
}
