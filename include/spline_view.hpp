#ifndef SPLINE_VIEW_HPP
#define SPLINE_VIEW_HPP
#include "eos_view.hpp"
#include "planet_config.hpp"

#include <gsl/gsl_interp2d.h>
#include <gsl/gsl_spline2d.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct EOSGrid {
  std::vector<double> P_MPa; // strictly increasing
  std::vector<double> T_K;   // strictly increasing
};

// Raw property samples over an EOSGrid. Values are stored T-major,
// value[iT * nP + iP], which is the layout gsl_spline2d_init expects.
struct EOSTable {
  EOSGrid grid;
  std::vector<double> rho_kgm3;
  std::vector<double> Cp_JkgK;
  std::vector<double> alpha_pK;
  std::vector<double> kTherm_WmK;
  std::vector<int> phase;

  explicit EOSTable(EOSGrid g) : grid(std::move(g)) {
    const size_t n = grid.P_MPa.size() * grid.T_K.size();
    rho_kgm3.assign(n, 0.0);
    Cp_JkgK.assign(n, 0.0);
    alpha_pK.assign(n, 0.0);
    kTherm_WmK.assign(n, 0.0);
    phase.assign(n, 0);
  }

  [[nodiscard]] size_t index(size_t iP, size_t iT) const { return iT * grid.P_MPa.size() + iP; }
};

struct Spline2dDeleter {
  void operator()(gsl_spline2d *s) const { gsl_spline2d_free(s); }
};

/**
 * @brief Material EOS backed by bicubic GSL surfaces over a rectangular (P, T) grid.
 *
 * Owns its splines. Accelerators are not used, so concurrent const queries on one
 * instance are safe. The phase classifier returns the tag of the nearest grid node.
 * Out-of-range queries, phase included, throw EOSRangeError unless the view was built
 * with extrapolation, in which case they are clamped to the grid edge.
 */
class SplineEOSView : public EOSView {
public:
  /**
   * @throws std::invalid_argument if the grid has fewer than 4 nodes on an axis, is not
   *         strictly increasing, or the property arrays do not match the grid size
   */
  SplineEOSView(std::string label, const EOSTable &table, bool allow_extrapolation,
                PorosityModel porosity = PorosityModel());

  SplineEOSView(const SplineEOSView &) = delete;
  SplineEOSView &operator=(const SplineEOSView &) = delete;

  [[nodiscard]] double rho_kgm3(double P_MPa, double T_K) const override;
  [[nodiscard]] double Cp_JkgK(double P_MPa, double T_K) const override;
  [[nodiscard]] double alpha_pK(double P_MPa, double T_K) const override;
  [[nodiscard]] double kTherm_WmK(double P_MPa, double T_K) const override;
  [[nodiscard]] int phase(double P_MPa, double T_K) const override;
  [[nodiscard]] double porosity_frac(double P_MPa, double T_K) const override;

  [[nodiscard]] EOSBounds bounds() const override { return bounds_; }
  [[nodiscard]] bool allows_extrapolation() const override { return extrapolate_; }
  [[nodiscard]] std::string label() const override { return label_; }

  [[nodiscard]] size_t nP() const { return P_.size(); }
  [[nodiscard]] size_t nT() const { return T_.size(); }

private:
  using SplinePtr = std::unique_ptr<gsl_spline2d, Spline2dDeleter>;

  SplinePtr makeSpline(const std::vector<double> &values) const;
  /// @throws EOSRangeError outside the grid unless extrapolating
  void clampToBounds(double &P_MPa, double &T_K) const;
  double evaluate(const SplinePtr &spline, double P_MPa, double T_K) const;

  std::string label_;
  bool extrapolate_;
  PorosityModel porosity_;
  EOSBounds bounds_;
  std::vector<double> P_;
  std::vector<double> T_;
  std::vector<int> phase_;
  SplinePtr rho_;
  SplinePtr cp_;
  SplinePtr alpha_;
  SplinePtr k_;
};

#endif // SPLINE_VIEW_HPP
