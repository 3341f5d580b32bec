#include "line_sizing.h"

#include "Common/common.h"

#include "boost/math/tools/roots.hpp"

#include <cmath>
#include <sstream>

namespace rocketprops {

namespace {

// rho in lbm/ft^3 of the compressed liquid
double liquid_density(const Propellant& prop, double TdegR, double Ppsia) {
  return prop.SG_compressed(TdegR, Ppsia) * constants::LBM_PER_FT3_PER_SG;
}

LineSize line_pressure_drop(const Propellant& prop, double TdegR, double rho, double velFPS,
    double IDinches, double roughness, double Kfactor, double len_inches) {
  LineSize line;
  line.IDinches = IDinches;
  line.velFPS = velFPS;

  const double mu = prop.ViscAtTdegR(TdegR) * constants::POISE_TO_LBM_FT_S; // lbm/ft-s
  line.Re = rho * velFPS * (IDinches / 12.0) / mu;
  line.f = colebrook_friction(line.Re, roughness / IDinches);

  const double dyn_head = rho * velFPS * velFPS / (2.0 * constants::GC) / 144.0; // psi
  line.deltaPpsia = (line.f * len_inches / IDinches + Kfactor) * dyn_head;
  return line;
}

void check_line_inputs(double wdotPPS, double roughness, double Kfactor, double len_inches) {
  if (!(wdotPPS > 0.0)) throw RocketPropsError("line sizing: wdotPPS must be positive");
  if (roughness < 0.0 || Kfactor < 0.0 || len_inches < 0.0) {
    throw RocketPropsError("line sizing: roughness, Kfactor and len_inches must not be negative");
  }
}

} // namespace

double colebrook_friction(double Re, double rel_roughness) {
  if (!(Re > 0.0)) throw RocketPropsError("colebrook_friction: Reynolds number must be positive");
  if (Re < RE_LAMINAR) return 64.0 / Re;

  // x = 1/sqrt(f)
  auto objFun = [&](double x) {
    return x + 2.0 * std::log10(rel_roughness / 3.7 + 2.51 * x / Re);
  };
  double x_lo = 0.5, x_hi = 50.0;
  const double f_lo = objFun(x_lo);
  const double f_hi = objFun(x_hi);
  if ((f_lo > 0.0) == (f_hi > 0.0)) {
    std::ostringstream msg;
    msg << "colebrook_friction: no solution for Re = " << Re << ", e/D = " << rel_roughness;
    throw RocketPropsError(msg.str());
  }

  const boost::uintmax_t maxit = 200;
  boost::uintmax_t it = maxit;
  boost::math::tools::eps_tolerance<double> tol(48);
  std::pair<double, double> sol = boost::math::tools::toms748_solve(objFun, x_lo, x_hi, f_lo, f_hi, tol, it);
  if (it >= maxit) {
    throw std::runtime_error("colebrook_friction(): max iteration achieved.");
  }
  const double x = 0.5 * (sol.first + sol.second);
  return 1.0 / (x * x);
}

LineSize calc_line_id_dp(const Propellant& prop, double TdegR, double Ppsia, double wdotPPS,
    double velFPS, double roughness, double Kfactor, double len_inches) {
  check_line_inputs(wdotPPS, roughness, Kfactor, len_inches);
  if (!(velFPS > 0.0)) throw RocketPropsError("calc_line_id_dp: velFPS must be positive");

  const double rho = liquid_density(prop, TdegR, Ppsia);
  const double area = wdotPPS / (rho * velFPS); // ft^2
  const double IDinches = std::sqrt(4.0 * area / constants::PI) * 12.0;
  return line_pressure_drop(prop, TdegR, rho, velFPS, IDinches, roughness, Kfactor, len_inches);
}

LineSize calc_line_vel_dp(const Propellant& prop, double TdegR, double Ppsia, double wdotPPS,
    double IDinches, double roughness, double Kfactor, double len_inches) {
  check_line_inputs(wdotPPS, roughness, Kfactor, len_inches);
  if (!(IDinches > 0.0)) throw RocketPropsError("calc_line_vel_dp: IDinches must be positive");

  const double rho = liquid_density(prop, TdegR, Ppsia);
  const double area = constants::PI / 4.0 * SQR(IDinches / 12.0); // ft^2
  const double velFPS = wdotPPS / (rho * area);
  return line_pressure_drop(prop, TdegR, rho, velFPS, IDinches, roughness, Kfactor, len_inches);
}

std::ostream& operator<<(std::ostream& os, const LineSize& line) {
  os << "    IDinches = " << line.IDinches << " in\n"
     << "  deltaPpsia = " << line.deltaPpsia << " psid\n"
     << "      velFPS = " << line.velFPS << " ft/s\n"
     << "          Re = " << line.Re << "\n"
     << "           f = " << line.f << "\n";
  return os;
}

} // namespace rocketprops
