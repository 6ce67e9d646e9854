#ifndef PHASE_BOUNDARY_HPP
#define PHASE_BOUNDARY_HPP

/**
 * @file phase_boundary.hpp
 * @brief Bracketed search for freezing/melting boundaries on a discrete phase classifier
 * @date 2025-08-15
 *
 * @details The classifier of an EOS is a step function of (P, T). A boundary is located by
 * turning it into a scalar objective with a sign change and running GSL's Brent solver
 * inside the caller's bracket:
 * \f[
 *   f(x) = 0.5 - (\phi_{top} - \phi(x)) \qquad \text{(melting toward liquid)}
 * \f]
 * \f[
 *   f(x) = 0.5 + (\phi_{top} - \phi(x)) \qquad \text{(underplating by a denser polymorph)}
 * \f]
 * The converged root is pushed past the boundary by a fifth of the resolution so the
 * result lies on the far side of the transition.
 */

#include "eos_view.hpp"

#include <cmath>
#include <limits>

enum class UnderplateMode {
  UNSET,        ///< Try UNDERPLATE, then NO_UNDERPLATE
  UNDERPLATE,   ///< Transition to a higher-numbered ice polymorph
  NO_UNDERPLATE ///< Transition to liquid
};

enum class SearchAxis { PRESSURE, TEMPERATURE };

/**
 * @brief Scalar objective over one axis of the phase classifier.
 *
 * The fixed coordinate is the temperature for a pressure search and the pressure for a
 * temperature search.
 */
struct PhaseChangeObjective {
  const EOSView &eos;
  int top_phase;
  double fixed;
  SearchAxis axis;
  bool underplate;

  double operator()(double x) const;

  /// gsl_function trampoline; params points to a PhaseChangeObjective.
  static double f(double x, void *params);
};

struct BoundarySearchOptions {
  int max_iterations = 100;
  bool allow_broken = false; ///< Return NOT_FOUND instead of throwing
  bool verbose = false;
};

/// Sentinel returned by failed searches when allow_broken is set.
inline constexpr double NOT_FOUND = std::numeric_limits<double>::quiet_NaN();

inline bool isNotFound(double x) { return std::isnan(x); }

/**
 * @brief Pressure at which the classifier leaves top_phase along the isotherm Tb.
 *
 * @param Pres_MPa Resolution; the solver interval tolerance is Pres/10 and the result is
 *        offset by Pres/5
 * @throws NoUnderplatePressure if mode is UNDERPLATE and the bracket has no sign change
 * @throws NoFreezePressureFound if every attempted mode fails
 * @throws std::invalid_argument for an empty bracket or non-positive resolution
 */
double find_freeze_pressure(const EOSView &eos, int top_phase, double Tb_K, double Plow_MPa,
                            double Phigh_MPa, double Pres_MPa, UnderplateMode mode,
                            const BoundarySearchOptions &opts = BoundarySearchOptions());

/**
 * @brief Next phase boundary above T along the isobar P.
 *
 * The top phase is the classifier value at (P, T) and the bracket is [T, T + range],
 * capped at the table edge when the EOS does not extrapolate.
 *
 * @throws NoFreezePressureFound if the bracket has no sign change
 */
double find_freeze_temperature(const EOSView &eos, double P_MPa, double T_K, double range_K,
                               double Tres_K,
                               const BoundarySearchOptions &opts = BoundarySearchOptions());

#endif // PHASE_BOUNDARY_HPP
