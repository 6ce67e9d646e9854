#include "spline_view.hpp"
#include "profile_errors.hpp"

#include <algorithm>
#include <functional>
#include <gsl/gsl_errno.h>
#include <sstream>
#include <stdexcept>

namespace {

bool strictlyIncreasing(const std::vector<double> &v) {
  return std::adjacent_find(v.begin(), v.end(), std::greater_equal<double>()) == v.end();
}

size_t nearestIndex(const std::vector<double> &axis, double x) {
  auto it = std::lower_bound(axis.begin(), axis.end(), x);
  if (it == axis.begin()) {
    return 0;
  }
  if (it == axis.end()) {
    return axis.size() - 1;
  }
  const size_t hi = static_cast<size_t>(it - axis.begin());
  return (x - axis[hi - 1] <= axis[hi] - x) ? hi - 1 : hi;
}

} // namespace

SplineEOSView::SplineEOSView(std::string label, const EOSTable &table, bool allow_extrapolation,
                             PorosityModel porosity)
    : label_(std::move(label)), extrapolate_(allow_extrapolation), porosity_(porosity),
      P_(table.grid.P_MPa), T_(table.grid.T_K), phase_(table.phase) {
  if (P_.size() < 4 || T_.size() < 4) {
    throw std::invalid_argument("EOS grid for " + label_ +
                                " needs at least 4 nodes per axis for bicubic interpolation");
  }
  if (!strictlyIncreasing(P_) || !strictlyIncreasing(T_)) {
    throw std::invalid_argument("EOS grid axes for " + label_ + " must be strictly increasing");
  }
  const size_t n = P_.size() * T_.size();
  if (table.rho_kgm3.size() != n || table.Cp_JkgK.size() != n || table.alpha_pK.size() != n ||
      table.kTherm_WmK.size() != n || phase_.size() != n) {
    throw std::invalid_argument("EOS property arrays for " + label_ + " do not match the grid size");
  }

  bounds_ = {P_.front(), P_.back(), T_.front(), T_.back()};
  rho_ = makeSpline(table.rho_kgm3);
  cp_ = makeSpline(table.Cp_JkgK);
  alpha_ = makeSpline(table.alpha_pK);
  k_ = makeSpline(table.kTherm_WmK);
}

SplineEOSView::SplinePtr SplineEOSView::makeSpline(const std::vector<double> &values) const {
  SplinePtr spline(gsl_spline2d_alloc(gsl_interp2d_bicubic, P_.size(), T_.size()));
  if (!spline) {
    throw std::runtime_error("Failed to allocate 2D spline for " + label_);
  }
  const int status =
      gsl_spline2d_init(spline.get(), P_.data(), T_.data(), values.data(), P_.size(), T_.size());
  if (status != GSL_SUCCESS) {
    throw std::runtime_error("Failed to initialize 2D spline for " + label_ + ": " +
                             gsl_strerror(status));
  }
  return spline;
}

void SplineEOSView::clampToBounds(double &P_MPa, double &T_K) const {
  if (bounds_.contains(P_MPa, T_K)) {
    return;
  }
  if (!extrapolate_) {
    std::ostringstream msg;
    msg << "EOS " << label_ << " queried at P = " << P_MPa << " MPa, T = " << T_K
        << " K, outside [" << bounds_.Pmin_MPa << ", " << bounds_.Pmax_MPa << "] MPa x ["
        << bounds_.Tmin_K << ", " << bounds_.Tmax_K << "] K";
    throw EOSRangeError(msg.str());
  }
  P_MPa = std::clamp(P_MPa, bounds_.Pmin_MPa, bounds_.Pmax_MPa);
  T_K = std::clamp(T_K, bounds_.Tmin_K, bounds_.Tmax_K);
}

double SplineEOSView::evaluate(const SplinePtr &spline, double P_MPa, double T_K) const {
  clampToBounds(P_MPa, T_K);

  double result = 0.0;
  const int status = gsl_spline2d_eval_e(spline.get(), P_MPa, T_K, nullptr, nullptr, &result);
  if (status != GSL_SUCCESS) {
    throw EOSRangeError("2D spline evaluation failed for " + label_ + ": " + gsl_strerror(status));
  }
  return result;
}

double SplineEOSView::rho_kgm3(double P_MPa, double T_K) const {
  return evaluate(rho_, P_MPa, T_K);
}

double SplineEOSView::Cp_JkgK(double P_MPa, double T_K) const {
  return evaluate(cp_, P_MPa, T_K);
}

double SplineEOSView::alpha_pK(double P_MPa, double T_K) const {
  return evaluate(alpha_, P_MPa, T_K);
}

double SplineEOSView::kTherm_WmK(double P_MPa, double T_K) const {
  return evaluate(k_, P_MPa, T_K);
}

int SplineEOSView::phase(double P_MPa, double T_K) const {
  clampToBounds(P_MPa, T_K);
  const size_t iP = nearestIndex(P_, P_MPa);
  const size_t iT = nearestIndex(T_, T_K);
  return phase_[iT * P_.size() + iP];
}

double SplineEOSView::porosity_frac(double P_MPa, [[maybe_unused]] double T_K) const {
  return porosity_.porosity(P_MPa);
}
