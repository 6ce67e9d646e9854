#ifndef REFERENCE_EOS_HPP
#define REFERENCE_EOS_HPP

/**
 * @file reference_eos.hpp
 * @brief Analytic reference material tables for water, ices, clathrate, rock and iron
 * @date 2025-08-12
 *
 * @details Laboratory EOS tables are supplied by the data-loading layer. These analytic
 * stand-ins give every registered composition a table out of the box, so that a body
 * can be modeled end to end without external data, and so tests have exact phase
 * boundaries to compare against.
 *
 * Solids and liquid water use a linearized density law
 * \f[
 *   \rho(P, T) = \rho_0 \left(1 + \frac{P}{K}\right)\left(1 - \alpha_0 (T - T_{ref})\right)
 * \f]
 * The liquidus of H2O follows the IAPWS (2011) melting-pressure equations for ice Ih,
 * III, V and VI. Dissolved salt lowers the melting point linearly with salinity.
 */

#include "spline_view.hpp"

#include <string>
#include <vector>

enum class ReferenceMaterial {
  WATER,
  ICE_IH,
  ICE_II,
  ICE_III,
  ICE_V,
  ICE_VI,
  CLATHRATE,
  SILICATE,
  IRON_CORE
};

struct ReferenceMaterialData {
  std::string name;
  int phase;         ///< Phase tag reported by the classifier
  double rho0_kgm3;  ///< Density at P = 0, T = T_ref
  double K_MPa;      ///< Linear compressibility scale
  double alpha0_pK;  ///< Thermal expansivity
  double Tref_K;
  double Cp_JkgK;    ///< Used only where no temperature law applies (rock, iron)
  double kTherm_WmK; ///< Used only where no conductivity fit applies

  ReferenceMaterialData()
      : name(""), phase(0), rho0_kgm3(0.0), K_MPa(1.0), alpha0_pK(0.0), Tref_K(0.0),
        Cp_JkgK(0.0), kTherm_WmK(0.0) {}

  ReferenceMaterialData(const std::string &n, int ph, double rho0, double K, double alpha0,
                        double Tref, double Cp, double k)
      : name(n), phase(ph), rho0_kgm3(rho0), K_MPa(K), alpha0_pK(alpha0), Tref_K(Tref),
        Cp_JkgK(Cp), kTherm_WmK(k) {}
};

struct MeltingPoint {
  double T_K;
  int solid_phase; ///< Polymorph that coexists with liquid at this pressure
};

class ReferenceEOS {
public:
  ReferenceEOS() = default;

  ReferenceMaterialData getMaterialParameters(ReferenceMaterial material) const;

  /**
   * @brief Material for an ice, clathrate, silicate or iron phase tag.
   * @throws std::invalid_argument for the liquid tag or unknown tags
   */
  static ReferenceMaterial materialForPhase(int phase);

  /**
   * @brief Liquidus of pure water at pressure P.
   * @details Melting-pressure curves are inverted piecewise between the triple points
   * Ih-III-L (208.566 MPa), III-V-L (350.1 MPa) and V-VI-L (632.4 MPa).
   */
  static MeltingPoint waterMeltingPoint(double P_MPa);

  /// Phase tag of water at (P, T) with the liquidus lowered by depression_K.
  static int waterPhase(double P_MPa, double T_K, double depression_K = 0.0);

  /// Freezing-point depression for dissolved salt at w_ppt.
  static double freezingDepression_K(double w_ppt) { return 0.0575 * w_ppt; }

  /**
   * @brief Liquid-water table with salinity w_ppt. Nodes below the liquidus carry the
   * tag of the stable ice polymorph and metastable liquid properties.
   */
  EOSTable waterTable(const EOSGrid &grid, double w_ppt) const;

  /**
   * @brief Single-phase ice or clathrate table for the given phase tag.
   */
  EOSTable iceTable(const EOSGrid &grid, int phase) const;

  /**
   * @brief Single-phase table for SILICATE or IRON_CORE.
   */
  EOSTable solidTable(const EOSGrid &grid, ReferenceMaterial material) const;

  static std::string materialToString(ReferenceMaterial material);

private:
  static double linearDensity(const ReferenceMaterialData &data, double P_MPa, double T_K);
};

#endif // REFERENCE_EOS_HPP
