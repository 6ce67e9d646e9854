#include "phase_boundary.hpp"
#include "profile_errors.hpp"

#include <algorithm>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_roots.h>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

double PhaseChangeObjective::operator()(double x) const {
  const int phase = (axis == SearchAxis::PRESSURE) ? eos.phase(x, fixed) : eos.phase(fixed, x);
  const double change = static_cast<double>(top_phase - phase);
  return underplate ? 0.5 + change : 0.5 - change;
}

double PhaseChangeObjective::f(double x, void *params) {
  const auto *objective = static_cast<const PhaseChangeObjective *>(params);
  return (*objective)(x);
}

namespace {

// Brent iteration on [x_lo, x_hi]. Empty result when the bracket has no sign change
// or the solver does not converge.
std::optional<double> brent_root(const PhaseChangeObjective &objective, double x_lo, double x_hi,
                                 double tolerance, const BoundarySearchOptions &opts) {
  const double f_lo = objective(x_lo);
  const double f_hi = objective(x_hi);
  if (opts.verbose) {
    std::cout << "Bracket [" << x_lo << ", " << x_hi << "]: f(x_lo) = " << f_lo
              << ", f(x_hi) = " << f_hi << std::endl;
  }
  if (f_lo * f_hi >= 0) {
    return std::nullopt;
  }

  gsl_root_fsolver *s = gsl_root_fsolver_alloc(gsl_root_fsolver_brent);
  if (s == nullptr) {
    throw std::runtime_error("Failed to allocate Brent root solver");
  }
  gsl_function F;
  F.function = &PhaseChangeObjective::f;
  F.params = const_cast<PhaseChangeObjective *>(&objective);

  int status = gsl_root_fsolver_set(s, &F, x_lo, x_hi);
  int iter = 0;
  double x = 0.5 * (x_lo + x_hi);

  while (status == GSL_SUCCESS || status == GSL_CONTINUE) {
    ++iter;
    status = gsl_root_fsolver_iterate(s);
    if (status != GSL_SUCCESS) {
      break;
    }
    x = gsl_root_fsolver_root(s);
    status = gsl_root_test_interval(gsl_root_fsolver_x_lower(s), gsl_root_fsolver_x_upper(s),
                                    tolerance, 0.0);
    if (status == GSL_SUCCESS || iter >= opts.max_iterations) {
      break;
    }
  }
  gsl_root_fsolver_free(s);

  if (status != GSL_SUCCESS) {
    std::cerr << "Warning: Brent search on [" << x_lo << ", " << x_hi << "] stopped after "
              << iter << " iterations without converging" << std::endl;
    return std::nullopt;
  }
  if (opts.verbose) {
    std::cout << "Converged to " << x << " after " << iter << " iterations" << std::endl;
  }
  return x;
}

void checkBracket(double lo, double hi, double res, const char *what) {
  if (!(hi > lo) || !(res > 0.0)) {
    std::ostringstream msg;
    msg << what << ": invalid bracket [" << lo << ", " << hi << "] or resolution " << res;
    throw std::invalid_argument(msg.str());
  }
}

} // namespace

double find_freeze_pressure(const EOSView &eos, int top_phase, double Tb_K, double Plow_MPa,
                            double Phigh_MPa, double Pres_MPa, UnderplateMode mode,
                            const BoundarySearchOptions &opts) {
  checkBracket(Plow_MPa, Phigh_MPa, Pres_MPa, "find_freeze_pressure");
  const double tolerance = Pres_MPa / 10.0;

  if (mode != UnderplateMode::NO_UNDERPLATE) {
    const PhaseChangeObjective underplate{eos, top_phase, Tb_K, SearchAxis::PRESSURE, true};
    if (auto root = brent_root(underplate, Plow_MPa, Phigh_MPa, tolerance, opts)) {
      return *root + Pres_MPa / 5.0;
    }
    if (mode == UnderplateMode::UNDERPLATE) {
      std::ostringstream msg;
      msg << "No underplating transition below phase " << top_phase << " at Tb = " << Tb_K
          << " K in [" << Plow_MPa << ", " << Phigh_MPa
          << "] MPa. The bottom temperature is inconsistent with an ice III underplate.";
      if (opts.allow_broken) {
        std::cerr << "Warning: " << msg.str() << std::endl;
        return NOT_FOUND;
      }
      throw NoUnderplatePressure(msg.str());
    }
    if (opts.verbose) {
      std::cout << "No underplating transition at Tb = " << Tb_K
                << " K, searching for melting instead" << std::endl;
    }
  }

  const PhaseChangeObjective melting{eos, top_phase, Tb_K, SearchAxis::PRESSURE, false};
  if (auto root = brent_root(melting, Plow_MPa, Phigh_MPa, tolerance, opts)) {
    return *root + Pres_MPa / 5.0;
  }

  std::ostringstream msg;
  msg << "No phase change from phase " << top_phase << " at Tb = " << Tb_K << " K between "
      << Plow_MPa << " and " << Phigh_MPa << " MPa";
  if (opts.allow_broken) {
    std::cerr << "Warning: " << msg.str() << std::endl;
    return NOT_FOUND;
  }
  throw NoFreezePressureFound(msg.str());
}

double find_freeze_temperature(const EOSView &eos, double P_MPa, double T_K, double range_K,
                               double Tres_K, const BoundarySearchOptions &opts) {
  double Thigh_K = T_K + range_K;
  if (!eos.allows_extrapolation()) {
    Thigh_K = std::min(Thigh_K, eos.bounds().Tmax_K);
  }
  checkBracket(T_K, Thigh_K, Tres_K, "find_freeze_temperature");
  const int top_phase = eos.phase(P_MPa, T_K);
  const PhaseChangeObjective objective{eos, top_phase, P_MPa, SearchAxis::TEMPERATURE, false};

  if (auto root = brent_root(objective, T_K, Thigh_K, Tres_K / 10.0, opts)) {
    return *root + Tres_K / 5.0;
  }

  std::ostringstream msg;
  msg << "No melting temperature for phase " << top_phase << " at P = " << P_MPa
      << " MPa between " << T_K << " and " << Thigh_K << " K";
  if (opts.allow_broken) {
    std::cerr << "Warning: " << msg.str() << std::endl;
    return NOT_FOUND;
  }
  throw NoFreezePressureFound(msg.str());
}
