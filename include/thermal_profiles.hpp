#ifndef THERMAL_PROFILES_HPP
#define THERMAL_PROFILES_HPP

/**
 * @file thermal_profiles.hpp
 * @brief Conduction and convection laws used when integrating ice and rock shells
 * @date 2025-08-14
 *
 * @details Two collaborators of the layer integrator live here:
 * - the conductive temperature law for a spherical shell with internal heating
 *   (Turcotte & Schubert, Geodynamics, eq. 4.40), and
 * - the stagnant-lid convection parameterization of Deschamps & Sotin (2001), exposed
 *   through the ConvectionModel interface so integrators can be driven by other models.
 *
 * Also provides the laboratory thermal-conductivity fits for the ice polymorphs
 * (Andersson & Inaba, 2005) and the peridotite solidus of Hirschmann (2000).
 */

#include "eos_view.hpp"

/// Critical Rayleigh number for the onset of convection in an ice shell.
inline constexpr double RA_CRIT = 1e5;

/// Activation energy (kJ/mol) of ice creep, indexed by phase tag 0..6 (NaN where undefined).
double activationEnergy_kJmol(int phase);

/// Viscosity (Pa s) of ice at its melting point, indexed by phase tag 0..6.
double meltViscosity_Pas(int phase);

struct ConductiveResult {
  double Tbot_K;
  double qBot_Wm2;
};

/**
 * @brief Temperature at the bottom of a conducting spherical shell.
 *
 * @details Solves the steady heat equation with uniform volumetric heating
 * \f[
 *   Q_{tot} = Q_{rad} + H_{tidal}/\rho, \quad
 *   c_1 = \frac{q_{top} r_{top}^2}{2k} - \frac{\rho Q_{tot}}{6k} r_{top}^3
 * \f]
 * \f[
 *   T_{bot} = T_{top} + \frac{\rho Q_{tot}}{6k}(r_{top}^2 - r_{bot}^2)
 *             + c_1\left(\frac{1}{r_{bot}} - \frac{1}{r_{top}}\right)
 * \f]
 *
 * @param qTop_Wm2 Heat flux leaving the top of the shell (positive outward)
 * @return Bottom temperature and the heat flux through the bottom surface
 */
ConductiveResult conductive_temperature(double Ttop_K, double rTop_m, double rBot_m,
                                        double kTherm_WmK, double rho_kgm3, double Qrad_Wkg,
                                        double Htidal_Wm3, double qTop_Wm2);

/**
 * @brief Isobaric conductivity fit k = D T^-X of Andersson & Inaba (2005).
 * @throws std::invalid_argument for phases other than Ih, II, III, V, VI
 */
double kThermIsobaricAnderssonInaba2005(double T_K, int phase);

/// Dry peridotite solidus (Hirschmann, 2000) in K.
double TsolidusHirschmann2000(double P_MPa);

struct ConvectionInput {
  double Ttop_K;
  double rTop_m;
  double kTop_WmK;
  double Tb_K;
  double zb_m;     // shell thickness
  double gtop_ms2;
  double Pmid_MPa;
  int phase;
};

struct ConvectionResult {
  double Tconv_K;
  double etaConv_Pas;
  double eLid_m;
  double deltaTBL_m;
  double qbot_Wm2;
  double Ra;
  bool convecting;
};

class ConvectionModel {
public:
  /**
   * @param ice EOS of the shell material, queried at mid-shell conditions
   */
  virtual ConvectionResult evaluate(const ConvectionInput &in, const EOSView &ice) const = 0;
  virtual ~ConvectionModel() = default;
};

/**
 * @brief Stagnant-lid scaling of Deschamps & Sotin (2001) in spherical form.
 *
 * @details The well-mixed temperature is
 * \f[ T_{conv} = B\left(\sqrt{1 + \frac{2}{B}(T_b - C)} - 1\right) \f]
 * with \f$B = E_a / (2 R c_1)\f$ and \f$C = c_2 (T_b - T_{top})\f$. Below RA_CRIT the
 * shell is reported as conductive: lid and boundary layer span the whole shell and the
 * bottom flux follows the isobaric conductivity integral.
 */
class DeschampsSotinConvection : public ConvectionModel {
public:
  [[nodiscard]] ConvectionResult evaluate(const ConvectionInput &in,
                                          const EOSView &ice) const override;
};

#endif // THERMAL_PROFILES_HPP
