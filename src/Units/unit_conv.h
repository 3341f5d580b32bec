#ifndef ROCKETPROPS_UNIT_CONV_H
#define ROCKETPROPS_UNIT_CONV_H

#include <string>
#include <vector>

namespace rocketprops {
namespace units {

// physical quantity families; conversions are only allowed inside a family
enum class Quantity {
  Temperature,
  Pressure,
  Density,
  Viscosity,
  Conductivity,
  SurfaceTension,
  HeatCapacity,
  Enthalpy,
  MolecularWeight,
  Length,
  Velocity,
  Mass,
  Volume,
  MassFlow
};

// \brief: a unit maps onto the internal unit of its family by
//         internal = value * scale + offset
struct UnitDef {
  Quantity quantity;
  double scale;
  double offset;
};

// \brief: convert value from from_unit to to_unit
//         throws UnknownUnitError for an unknown name and IncompatibleUnitError
//         when the units belong to different quantity families
double convert(double value, const std::string& from_unit, const std::string& to_unit);

// \brief: value in unit -> internal unit of the quantity (checks the family)
double to_internal(double value, const std::string& unit, Quantity quantity);
// \brief: internal unit of the quantity -> unit (checks the family)
double from_internal(double value, const std::string& unit, Quantity quantity);

const UnitDef& lookup(const std::string& unit);
Quantity quantity_of(const std::string& unit);
bool is_known_unit(const std::string& unit);
bool are_compatible(const std::string& unit_a, const std::string& unit_b);

// e.g. "degR" for Temperature, "SG" for Density
const std::string& internal_unit(Quantity quantity);
std::string quantity_name(Quantity quantity);
// all unit names of a family, in table order
std::vector<std::string> units_of(Quantity quantity);

} // namespace units
} // namespace rocketprops

#endif // ROCKETPROPS_UNIT_CONV_H
