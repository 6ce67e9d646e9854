#ifndef LAYER_PROPAGATORS_HPP
#define LAYER_PROPAGATORS_HPP

/**
 * @file layer_propagators.hpp
 * @brief Surface-to-seafloor integration of the hydrosphere
 * @date 2025-08-18
 *
 * @details The hydrosphere is walked in pressure, top down:
 *
 *   surface -> [clathrate lid] -> ice Ih (conductive, then convective correction)
 *           -> [ice III underplate] -> [ice V underplate] -> ocean
 *
 * Each region has a fixed number of rows. Region boundaries come from the phase
 * boundary solver applied to the ocean EOS. Inside a region pressure is linear in the
 * row index and, before any convective correction, temperature follows
 * \f[
 *   T = T_b^{x} \, T_{top}^{1-x}, \qquad x = \frac{P - P_{top}}{P_b - P_{top}}
 * \f]
 * Depth, radius, shell mass and gravity follow from an explicit hydrostatic step using
 * the properties of the row above:
 * \f[
 *   z_i = z_{i-1} + \frac{\Delta P}{g_{i-1}\rho_{i-1}}, \qquad
 *   g_i = \frac{G (M - M_{above,i})}{r_i^2}
 * \f]
 * The first row of every region holds the conditions at the boundary with the region
 * above it.
 */

#include "eos_cache.hpp"
#include "layer_arrays.hpp"
#include "phase_boundary.hpp"
#include "planet_config.hpp"
#include "thermal_profiles.hpp"

#include <limits>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Outcome of the convection model for one ice shell.
 */
struct ShellConvection {
  int phase = 0;
  bool convecting = false; ///< Convective correction applied to the profile
  int evaluations = 0;     ///< 1, or 2 when the bottom depth moved beyond tolerance
  double Tconv_K = 0.0;
  double etaConv_Pas = 0.0;
  double eLid_m = 0.0;
  double deltaTBL_m = 0.0;
  double qbot_Wm2 = 0.0;
  double Ra = 0.0;
};

/**
 * @brief Hydrosphere profile under construction, plus its region bookkeeping.
 */
struct HydrosphereState {
  LayerArrays layers;

  int nClath = 0;     ///< First ice Ih row
  int nIbottom = 0;   ///< First row below ice Ih
  int nIIIbottom = 0; ///< First row below an ice III underplate
  int nSurfIce = 0;   ///< First ocean row
  int nOceanMax = 0;

  double PbClath_MPa = 0.0;
  double PbI_MPa = std::numeric_limits<double>::quiet_NaN();
  double PbIII_MPa = std::numeric_limits<double>::quiet_NaN();
  double PbV_MPa = std::numeric_limits<double>::quiet_NaN();
  double Pb_MPa = std::numeric_limits<double>::quiet_NaN(); ///< Ice/ocean interface
  double Tb_K = 0.0;
  double zb_m = 0.0;
  double QfromMantle_W = 0.0; ///< Heat entering the hydrosphere from below

  std::vector<ShellConvection> convection;
  std::shared_ptr<const EOSView> ocean_eos;

  /// Set when a freeze search failed under allow_broken_models.
  bool broken = false;
};

class HydrosphereIntegrator {
public:
  /**
   * The integrator keeps references to all four arguments; they must outlive it.
   */
  HydrosphereIntegrator(const PlanetConfig &config, const RunConfig &run, EOSCache &cache,
                        const ConvectionModel &convection);

  /// Run every stage and return the completed hydrosphere.
  HydrosphereState propagate();

  /**
   * @brief Validate the configuration, size the arrays and fetch the ocean EOS.
   * @throws std::invalid_argument for inconsistent step counts or temperatures
   */
  HydrosphereState initialize();

  /// Clathrate lid, ice Ih and optional underplates, rows [0, nSurfIce].
  void ice_layers(HydrosphereState &state);

  /**
   * @brief Ocean rows [nSurfIce, nSurfIce + nOceanMax).
   * @throws PhaseAssignmentError if the seam row is already tagged as a solid
   */
  void ocean_layers(HydrosphereState &state);

private:
  std::shared_ptr<const EOSView> iceEOS(int phase, double Pmin_MPa, double Pmax_MPa,
                                        double Tmin_K, double Tmax_K);

  void clathrate_lid(HydrosphereState &state);

  /// Linear P, geometric T over rows [top, bottom]; properties for rows [top, bottom).
  void conduct_shell(HydrosphereState &state, int top, int bottom, double Ptop_MPa,
                     double Pbot_MPa, double Ttop_K, double Tbot_K, int phase,
                     const EOSView &eos);

  /// Apply the convection model, re-running once if the bottom depth moved too far.
  void convect_shell(HydrosphereState &state, int top, int bottom, int phase, const EOSView &eos);

  ShellConvection apply_convection(HydrosphereState &state, int top, int bottom, int phase,
                                   const EOSView &eos);

  void ice_underplate(HydrosphereState &state, int phase, int top, int bottom, double Plow_MPa,
                      double Tbot_K, double &Pbot_MPa);

  void fill_properties(HydrosphereState &state, int row, const EOSView &eos, int phase);

  /// Depth, radius, gravity for rows (top, bottom] and shell mass for rows [top, bottom).
  void hydrostatic(HydrosphereState &state, int top, int bottom) const;

  void logRow(const HydrosphereState &state, int row) const;

  const PlanetConfig &config_;
  const RunConfig &run_;
  EOSCache &cache_;
  const ConvectionModel &convection_;
  BoundarySearchOptions search_;
};

#endif // LAYER_PROPAGATORS_HPP
