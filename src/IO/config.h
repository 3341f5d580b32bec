#ifndef ROCKETPROPS_CONFIG_H
#define ROCKETPROPS_CONFIG_H

#include "IO/input.h"
#include "Physics/property_evaluator.h"
#include "Physics/propellant.h"

#include <ostream>
#include <string>
#include <vector>

namespace rocketprops {
namespace IO {

struct RocketPropsConfig {
  std::string data_file;                // empty -> default_database_path()
  EvaluatorOptions evaluator;
  DisplayUnits display_units;           // [output] <quantity>_unit
  std::vector<std::string> substances;  // printed by the CLI when none are given
  std::string hdf5_file;                // [output] saturation table export, empty -> none
  std::string dat_file;                 // [output] text export, empty -> none
  int num_saturation_points = 21;
};

// \brief: read rocketprops.toml; missing keys keep their defaults
//         throws IncompatibleUnitError for a display unit of the wrong quantity
RocketPropsConfig read_config(const Input& input);

// toml key of a display unit, "temperature_unit"
std::string display_unit_key(units::Quantity quantity);

std::ostream& operator<<(std::ostream& os, const RocketPropsConfig& config);

} // namespace IO
} // namespace rocketprops

#endif // ROCKETPROPS_CONFIG_H
