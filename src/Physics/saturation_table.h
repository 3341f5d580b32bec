#ifndef ROCKETPROPS_SATURATION_TABLE_H
#define ROCKETPROPS_SATURATION_TABLE_H

#include "Physics/propellant.h"

#include <string>
#include <vector>

namespace rocketprops {

// \brief: saturated liquid properties vs. reduced temperature, column major
struct SaturationTable {
  std::string name;
  std::vector<std::string> columns; // Tr, T, Pvap, SGliq, SGvap, visc, cond, Cp, Hvap, surf
  std::vector<std::string> units;
  std::vector<std::vector<double>> data; // data[column][point]

  std::size_t num_points() const { return this->data.empty() ? 0 : this->data[0].size(); }
  // throws RocketPropsError for an unknown column label
  const std::vector<double>& column(const std::string& label) const;
};

// \brief: highest temperature [degR] at which every recommended curve is defined
double saturation_table_Tmax(const Propellant& prop);

// \brief: npts equally spaced points from Tfreeze to saturation_table_Tmax()
//         points are evaluated in parallel; the first failing point is rethrown
SaturationTable build_saturation_table(const Propellant& prop, int npts);

} // namespace rocketprops

#endif // ROCKETPROPS_SATURATION_TABLE_H
