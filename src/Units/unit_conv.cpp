#include "unit_conv.h"

#include "Common/common.h"

#include <map>
#include <utility>

namespace rocketprops {
namespace units {

namespace {

using constants::LBM_PER_FT3_PER_SG;
using constants::POISE_TO_LBM_FT_S;

const double KG_PER_LBM = 0.45359237;
const double PSIA_PER_BAR = 14.503773773020923;
const double PSIA_PER_ATM = 14.6959487755;
const double WMK_PER_BTU_HR_FT_F = 1.7307346663713; // W/m-K per BTU/hr-ft-delF
const double NM_PER_LBF_IN = 4.4482216152605 / 0.0254; // N/m per lbf/in
const double JG_PER_BTU_LBM = 2.326; // J/g per BTU/lbm
const double CC_PER_IN3 = 16.387064;

struct UnitEntry {
  const char* name;
  UnitDef def;
};

// first entry of every family is its internal unit
const std::vector<UnitEntry>& unit_entries() {
  static const std::vector<UnitEntry> entries = {
    // Temperature [degR]
    {"degR", {Quantity::Temperature, 1.0, 0.0}},
    {"degK", {Quantity::Temperature, 1.8, 0.0}},
    {"degF", {Quantity::Temperature, 1.0, 459.67}},
    {"degC", {Quantity::Temperature, 1.8, 491.67}},
    // Pressure [psia]
    {"psia", {Quantity::Pressure, 1.0, 0.0}},
    {"atm", {Quantity::Pressure, PSIA_PER_ATM, 0.0}},
    {"bar", {Quantity::Pressure, PSIA_PER_BAR, 0.0}},
    {"MPa", {Quantity::Pressure, PSIA_PER_BAR * 10.0, 0.0}},
    {"kPa", {Quantity::Pressure, PSIA_PER_BAR * 0.01, 0.0}},
    {"Pa", {Quantity::Pressure, PSIA_PER_BAR * 1.0e-5, 0.0}},
    {"mmHg", {Quantity::Pressure, PSIA_PER_ATM / 760.0, 0.0}},
    // Density [SG]
    {"SG", {Quantity::Density, 1.0, 0.0}},
    {"g/cc", {Quantity::Density, 1.0, 0.0}},
    {"g/ml", {Quantity::Density, 1.0, 0.0}},
    {"kg/m**3", {Quantity::Density, 1.0e-3, 0.0}},
    {"lbm/ft**3", {Quantity::Density, 1.0 / LBM_PER_FT3_PER_SG, 0.0}},
    {"lbm/in**3", {Quantity::Density, 1728.0 / LBM_PER_FT3_PER_SG, 0.0}},
    // Viscosity [poise]
    {"poise", {Quantity::Viscosity, 1.0, 0.0}},
    {"cpoise", {Quantity::Viscosity, 0.01, 0.0}},
    {"cP", {Quantity::Viscosity, 0.01, 0.0}},
    {"Pa*s", {Quantity::Viscosity, 10.0, 0.0}},
    {"lbm/ft-s", {Quantity::Viscosity, 1.0 / POISE_TO_LBM_FT_S, 0.0}},
    {"lbm/ft-hr", {Quantity::Viscosity, 1.0 / (POISE_TO_LBM_FT_S * 3600.0), 0.0}},
    {"lbf-s/ft**2", {Quantity::Viscosity, constants::GC / POISE_TO_LBM_FT_S, 0.0}},
    // Thermal conductivity [BTU/hr-ft-delF]
    {"BTU/hr-ft-delF", {Quantity::Conductivity, 1.0, 0.0}},
    {"W/m-delK", {Quantity::Conductivity, 1.0 / WMK_PER_BTU_HR_FT_F, 0.0}},
    {"cal/s-cm-delC", {Quantity::Conductivity, 418.68 / WMK_PER_BTU_HR_FT_F, 0.0}},
    {"BTU/s-in-delF", {Quantity::Conductivity, 3600.0 * 12.0, 0.0}},
    // Surface tension [lbf/in]
    {"lbf/in", {Quantity::SurfaceTension, 1.0, 0.0}},
    {"lbf/ft", {Quantity::SurfaceTension, 1.0 / 12.0, 0.0}},
    {"N/m", {Quantity::SurfaceTension, 1.0 / NM_PER_LBF_IN, 0.0}},
    {"mN/m", {Quantity::SurfaceTension, 1.0e-3 / NM_PER_LBF_IN, 0.0}},
    {"dyne/cm", {Quantity::SurfaceTension, 1.0e-3 / NM_PER_LBF_IN, 0.0}},
    // Heat capacity [BTU/lbm-delF]
    {"BTU/lbm-delF", {Quantity::HeatCapacity, 1.0, 0.0}},
    {"BTU/lbm-delR", {Quantity::HeatCapacity, 1.0, 0.0}},
    {"cal/g-delC", {Quantity::HeatCapacity, 1.0, 0.0}},
    {"J/g-delK", {Quantity::HeatCapacity, 1.0 / 4.1868, 0.0}},
    {"kJ/kg-delK", {Quantity::HeatCapacity, 1.0 / 4.1868, 0.0}},
    {"J/kg-delK", {Quantity::HeatCapacity, 1.0 / 4186.8, 0.0}},
    // Enthalpy [BTU/lbm]
    {"BTU/lbm", {Quantity::Enthalpy, 1.0, 0.0}},
    {"J/g", {Quantity::Enthalpy, 1.0 / JG_PER_BTU_LBM, 0.0}},
    {"kJ/kg", {Quantity::Enthalpy, 1.0 / JG_PER_BTU_LBM, 0.0}},
    {"J/kg", {Quantity::Enthalpy, 1.0e-3 / JG_PER_BTU_LBM, 0.0}},
    {"cal/g", {Quantity::Enthalpy, 4.1868 / JG_PER_BTU_LBM, 0.0}},
    // Molecular weight [g/gmole]
    {"g/gmole", {Quantity::MolecularWeight, 1.0, 0.0}},
    {"lbm/lbmole", {Quantity::MolecularWeight, 1.0, 0.0}},
    {"kg/kmol", {Quantity::MolecularWeight, 1.0, 0.0}},
    // Length [inch]
    {"inch", {Quantity::Length, 1.0, 0.0}},
    {"in", {Quantity::Length, 1.0, 0.0}},
    {"ft", {Quantity::Length, 12.0, 0.0}},
    {"mm", {Quantity::Length, 1.0 / 25.4, 0.0}},
    {"cm", {Quantity::Length, 1.0 / 2.54, 0.0}},
    {"m", {Quantity::Length, 1.0 / 0.0254, 0.0}},
    // Velocity [ft/s]
    {"ft/s", {Quantity::Velocity, 1.0, 0.0}},
    {"in/s", {Quantity::Velocity, 1.0 / 12.0, 0.0}},
    {"m/s", {Quantity::Velocity, 1.0 / 0.3048, 0.0}},
    // Mass [lbm]
    {"lbm", {Quantity::Mass, 1.0, 0.0}},
    {"kg", {Quantity::Mass, 1.0 / KG_PER_LBM, 0.0}},
    {"g", {Quantity::Mass, 1.0e-3 / KG_PER_LBM, 0.0}},
    // Volume [in**3]
    {"in**3", {Quantity::Volume, 1.0, 0.0}},
    {"ft**3", {Quantity::Volume, 1728.0, 0.0}},
    {"cc", {Quantity::Volume, 1.0 / CC_PER_IN3, 0.0}},
    {"ml", {Quantity::Volume, 1.0 / CC_PER_IN3, 0.0}},
    {"L", {Quantity::Volume, 1000.0 / CC_PER_IN3, 0.0}},
    {"m**3", {Quantity::Volume, 1.0e6 / CC_PER_IN3, 0.0}},
    {"gal", {Quantity::Volume, 231.0, 0.0}},
    // Mass flow rate [lbm/s]
    {"lbm/s", {Quantity::MassFlow, 1.0, 0.0}},
    {"lbm/hr", {Quantity::MassFlow, 1.0 / 3600.0, 0.0}},
    {"kg/s", {Quantity::MassFlow, 1.0 / KG_PER_LBM, 0.0}},
    {"g/s", {Quantity::MassFlow, 1.0e-3 / KG_PER_LBM, 0.0}},
  };
  return entries;
}

// "lbm/ft**3", "lbm/ft3" and "lbm / ft**3" are the same key
std::string unit_key(const std::string& unit) {
  std::string key = common::removeBlanks(unit);
  std::string::size_type pos;
  while ((pos = key.find("**")) != std::string::npos) key.erase(pos, 2);
  return key;
}

const std::map<std::string, UnitDef>& unit_table() {
  static const std::map<std::string, UnitDef> table = [] {
    std::map<std::string, UnitDef> t;
    for (const auto& entry : unit_entries()) t.emplace(unit_key(entry.name), entry.def);
    return t;
  }();
  return table;
}

} // namespace

const UnitDef& lookup(const std::string& unit) {
  const auto& table = unit_table();
  auto it = table.find(unit_key(unit));
  if (it == table.end()) {
    throw UnknownUnitError("units::lookup: unknown unit '" + unit + "'");
  }
  return it->second;
}

bool is_known_unit(const std::string& unit) {
  return unit_table().count(unit_key(unit)) > 0;
}

Quantity quantity_of(const std::string& unit) {
  return lookup(unit).quantity;
}

bool are_compatible(const std::string& unit_a, const std::string& unit_b) {
  return quantity_of(unit_a) == quantity_of(unit_b);
}

double convert(double value, const std::string& from_unit, const std::string& to_unit) {
  const UnitDef& from = lookup(from_unit);
  const UnitDef& to = lookup(to_unit);
  if (from.quantity != to.quantity) {
    throw IncompatibleUnitError("units::convert: cannot convert " + quantity_name(from.quantity)
        + " unit '" + from_unit + "' to " + quantity_name(to.quantity) + " unit '" + to_unit + "'");
  }
  if (from.scale == to.scale && from.offset == to.offset) return value;
  const double internal = value * from.scale + from.offset;
  return (internal - to.offset) / to.scale;
}

double to_internal(double value, const std::string& unit, Quantity quantity) {
  const UnitDef& def = lookup(unit);
  if (def.quantity != quantity) {
    throw IncompatibleUnitError("units::to_internal: '" + unit + "' is not a "
        + quantity_name(quantity) + " unit");
  }
  return value * def.scale + def.offset;
}

double from_internal(double value, const std::string& unit, Quantity quantity) {
  const UnitDef& def = lookup(unit);
  if (def.quantity != quantity) {
    throw IncompatibleUnitError("units::from_internal: '" + unit + "' is not a "
        + quantity_name(quantity) + " unit");
  }
  return (value - def.offset) / def.scale;
}

const std::string& internal_unit(Quantity quantity) {
  static const std::map<Quantity, std::string> names = [] {
    std::map<Quantity, std::string> n;
    for (const auto& entry : unit_entries()) n.emplace(entry.def.quantity, entry.name);
    return n;
  }();
  return names.at(quantity);
}

std::vector<std::string> units_of(Quantity quantity) {
  std::vector<std::string> out;
  for (const auto& entry : unit_entries()) {
    if (entry.def.quantity == quantity) out.push_back(entry.name);
  }
  return out;
}

std::string quantity_name(Quantity quantity) {
  switch (quantity) {
    case Quantity::Temperature: return "temperature";
    case Quantity::Pressure: return "pressure";
    case Quantity::Density: return "density";
    case Quantity::Viscosity: return "viscosity";
    case Quantity::Conductivity: return "thermal conductivity";
    case Quantity::SurfaceTension: return "surface tension";
    case Quantity::HeatCapacity: return "heat capacity";
    case Quantity::Enthalpy: return "enthalpy";
    case Quantity::MolecularWeight: return "molecular weight";
    case Quantity::Length: return "length";
    case Quantity::Velocity: return "velocity";
    case Quantity::Mass: return "mass";
    case Quantity::Volume: return "volume";
    case Quantity::MassFlow: return "mass flow rate";
  }
  return "unknown";
}

} // namespace units
} // namespace rocketprops
