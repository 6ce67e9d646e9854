#ifndef EOS_VIEW_HPP
#define EOS_VIEW_HPP
#include <cmath>
#include <string>

struct EOSBounds {
  double Pmin_MPa;
  double Pmax_MPa;
  double Tmin_K;
  double Tmax_K;

  [[nodiscard]] bool contains(double P_MPa, double T_K) const {
    return P_MPa >= Pmin_MPa && P_MPa <= Pmax_MPa && T_K >= Tmin_K && T_K <= Tmax_K;
  }
};

struct EOSView {
  // Continuous material properties at (P [MPa], T [K]).
  virtual double rho_kgm3(double P_MPa, double T_K) const = 0;
  virtual double Cp_JkgK(double P_MPa, double T_K) const = 0;
  virtual double alpha_pK(double P_MPa, double T_K) const = 0;
  virtual double kTherm_WmK(double P_MPa, double T_K) const = 0;

  // Discrete phase tag (see PhaseID).
  virtual int phase(double P_MPa, double T_K) const = 0;

  // Pore fraction folded into rho_kgm3; zero for non-porous materials.
  virtual double porosity_frac([[maybe_unused]] double P_MPa, [[maybe_unused]] double T_K) const {
    return 0.0;
  }

  virtual EOSBounds bounds() const = 0;
  virtual bool allows_extrapolation() const { return false; }
  virtual std::string label() const { return "unnamed"; }

  virtual ~EOSView() = default;
};

#endif // EOS_VIEW_HPP
