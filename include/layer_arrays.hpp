#ifndef LAYER_ARRAYS_HPP
#define LAYER_ARRAYS_HPP
#include <cstddef>
#include <ostream>
#include <vector>

// Radial profile of one body model, index 0 at the surface. Row i describes the shell whose
// outer radius is r_m[i]; MLayer_kg[i] is the mass between r_m[i] and r_m[i + 1].
struct LayerArrays {
  std::vector<double> r_m;
  std::vector<double> z_m;
  std::vector<double> P_MPa;
  std::vector<double> T_K;
  std::vector<double> rho_kgm3;
  std::vector<double> Cp_JkgK;
  std::vector<double> alpha_pK;
  std::vector<double> kTherm_WmK;
  std::vector<double> g_ms2;
  std::vector<double> phi_frac;
  std::vector<int> phase;
  std::vector<double> MLayer_kg;

  LayerArrays() = default;
  explicit LayerArrays(size_t n) { resize(n); }

  [[nodiscard]] size_t size() const { return r_m.size(); }
  [[nodiscard]] bool empty() const { return r_m.empty(); }

  void resize(size_t n);

  // Append rows [begin, end) of another profile.
  void append(const LayerArrays &other, size_t begin, size_t end);

  // Cumulative mass of the rows above each row; element i sums MLayer_kg[0..i-1].
  [[nodiscard]] std::vector<double> massAbove() const;
  [[nodiscard]] double totalMass() const;

  [[nodiscard]] bool radiusStrictlyDecreasing() const;
  [[nodiscard]] bool pressureNonDecreasing() const;
  [[nodiscard]] bool depthNonDecreasing() const;

  // Index of the first row whose temperature is lower than the row above, or -1.
  [[nodiscard]] long firstNegativeTemperatureStep() const;

  // CSV with a header line, one row per layer.
  void writeCsv(std::ostream &out) const;
};

#endif // LAYER_ARRAYS_HPP
