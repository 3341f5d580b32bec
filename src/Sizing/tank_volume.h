#ifndef ROCKETPROPS_TANK_VOLUME_H
#define ROCKETPROPS_TANK_VOLUME_H

#include "Physics/propellant.h"

#include <ostream>

namespace rocketprops {

struct TankVolume {
  double cc_Total = 0.0;     // tank volume, cc
  double kg_loaded = 0.0;    // propellant loaded
  double kg_residual = 0.0;  // loaded but not expelled
  double SG = 0.0;           // saturated liquid SG at Tmax
  double TmaxR = 0.0;        // degR
};

// \brief: tank sized so that kg_expelled is expPcent of its capacity at TmaxC while
//         ullPcent of the volume stays empty; capacity is liquid density at Tmax
TankVolume calc_tank_volume(const Propellant& prop, double kg_expelled, double TmaxC,
    double expPcent = 98.0, double ullPcent = 3.0);

std::ostream& operator<<(std::ostream& os, const TankVolume& tank);

} // namespace rocketprops

#endif // ROCKETPROPS_TANK_VOLUME_H
