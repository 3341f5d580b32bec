#include "tank_volume.h"

#include "Common/common.h"
#include "Units/unit_conv.h"

#include <sstream>

namespace rocketprops {

TankVolume calc_tank_volume(const Propellant& prop, double kg_expelled, double TmaxC,
    double expPcent, double ullPcent) {
  if (!(kg_expelled > 0.0)) throw RocketPropsError("calc_tank_volume: kg_expelled must be positive");
  if (ullPcent < 0.0 || expPcent > 100.0 || !(expPcent > ullPcent)) {
    std::ostringstream msg;
    msg << "calc_tank_volume: need 0 <= ullPcent < expPcent <= 100, got ullPcent = " << ullPcent
        << ", expPcent = " << expPcent;
    throw RocketPropsError(msg.str());
  }

  TankVolume tank;
  tank.TmaxR = (TmaxC + 273.15) * 1.8;
  tank.SG = prop.SGLiqAtTdegR(tank.TmaxR);

  const double kg_capacity = kg_expelled * 100.0 / (expPcent - ullPcent);
  tank.kg_loaded = kg_capacity * (100.0 - ullPcent) / 100.0;
  tank.kg_residual = tank.kg_loaded - kg_expelled;
  tank.cc_Total = kg_capacity * 1000.0 / tank.SG; // SG is g/cc
  return tank;
}

std::ostream& operator<<(std::ostream& os, const TankVolume& tank) {
  os << "    cc_Total = " << tank.cc_Total << " cc ("
     << units::convert(tank.cc_Total, "cc", "in**3") << " in**3)\n"
     << "   kg_loaded = " << tank.kg_loaded << " kg\n"
     << " kg_residual = " << tank.kg_residual << " kg\n"
     << "    SG(Tmax) = " << tank.SG << " at " << tank.TmaxR << " degR\n";
  return os;
}

} // namespace rocketprops
