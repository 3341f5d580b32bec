#ifndef ROCKETPROPS_LINE_SIZING_H
#define ROCKETPROPS_LINE_SIZING_H

#include "Physics/propellant.h"

#include <ostream>

namespace rocketprops {

struct LineSize {
  double IDinches = 0.0;    // inside diameter
  double deltaPpsia = 0.0;  // pressure drop, psid
  double velFPS = 0.0;      // flow velocity
  double Re = 0.0;          // Reynolds number
  double f = 0.0;           // Darcy friction factor
};

// Re below which the flow is taken as laminar, f = 64/Re
const double RE_LAMINAR = 2100.0;

// \brief: Darcy friction factor, Colebrook-White for turbulent flow
double colebrook_friction(double Re, double rel_roughness);

// \brief: inside diameter for a target velocity and the pressure drop over the line
//         roughness and len_inches in inches; dP = (f L/D + K) rho V^2 / 2gc
LineSize calc_line_id_dp(const Propellant& prop, double TdegR, double Ppsia, double wdotPPS,
    double velFPS, double roughness, double Kfactor, double len_inches);

// \brief: velocity and pressure drop through a line of known inside diameter
LineSize calc_line_vel_dp(const Propellant& prop, double TdegR, double Ppsia, double wdotPPS,
    double IDinches, double roughness, double Kfactor, double len_inches);

std::ostream& operator<<(std::ostream& os, const LineSize& line);

} // namespace rocketprops

#endif // ROCKETPROPS_LINE_SIZING_H
