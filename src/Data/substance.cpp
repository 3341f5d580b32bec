#include "substance.h"

#include "Common/common.h"

namespace rocketprops {

using units::Quantity;

const std::vector<PropertyInfo>& all_properties() {
  static const std::vector<PropertyInfo> table = {
    {Property::Temperature, "T", Quantity::Temperature, false, false},
    {Property::Pressure, "P", Quantity::Pressure, false, false},
    {Property::VaporPressure, "Pvap", Quantity::Pressure, true, true},
    {Property::CriticalPressure, "Pc", Quantity::Pressure, false, false},
    {Property::CriticalTemperature, "Tc", Quantity::Temperature, false, false},
    {Property::LiquidSG, "SGliq", Quantity::Density, true, true},
    {Property::VaporSG, "SGvap", Quantity::Density, true, true},
    {Property::CompressedLiquidSG, "SGcomp", Quantity::Density, true, false},
    {Property::Viscosity, "visc", Quantity::Viscosity, true, true},
    {Property::ThermalConductivity, "cond", Quantity::Conductivity, true, true},
    {Property::BoilingPoint, "Tnbp", Quantity::Temperature, false, false},
    {Property::FreezingPoint, "Tfreeze", Quantity::Temperature, false, false},
    {Property::SpecificHeat, "Cp", Quantity::HeatCapacity, true, true},
    {Property::MolecularWeight, "MolWt", Quantity::MolecularWeight, false, false},
    {Property::HeatOfVaporization, "Hvap", Quantity::Enthalpy, true, true},
    {Property::SurfaceTension, "surf", Quantity::SurfaceTension, true, true},
  };
  return table;
}

const PropertyInfo& property_info(Property property) {
  for (const auto& info : all_properties()) {
    if (info.property == property) return info;
  }
  throw RocketPropsError("property_info: unhandled property");
}

Property parse_property(const std::string& name) {
  static const std::map<std::string, Property> aliases = {
    {"SG", Property::LiquidSG},
    {"TEMPERATURE", Property::Temperature},
    {"PRESSURE", Property::Pressure},
    {"VAPORPRESSURE", Property::VaporPressure},
    {"VISCOSITY", Property::Viscosity},
    {"CONDUCTIVITY", Property::ThermalConductivity},
    {"SURFACETENSION", Property::SurfaceTension},
    {"HEATOFVAPORIZATION", Property::HeatOfVaporization},
    {"MOLECULARWEIGHT", Property::MolecularWeight},
  };
  const std::string key = common::normalizeName(name);
  for (const auto& info : all_properties()) {
    if (common::normalizeName(info.label) == key) return info.property;
  }
  auto it = aliases.find(key);
  if (it != aliases.end()) return it->second;
  throw RocketPropsError("parse_property: unknown property '" + name + "'");
}

std::string property_label(Property property) {
  return property_info(property).label;
}

const fits::CorrelationFit& PropertyModel::selected_fit() const {
  if (this->selected < 0 || this->selected >= static_cast<int>(this->fits.size())) {
    throw DataError("PropertyModel::selected_fit: no recommended curve");
  }
  return this->fits[this->selected];
}

const fits::CorrelationFit* PropertyModel::find_fit(const std::string& name) const {
  const std::string key = common::normalizeName(name);
  for (const auto& fit : this->fits) {
    if (common::normalizeName(fit.name()) == key || common::normalizeName(fit.source) == key) return &fit;
  }
  return nullptr;
}

const PropertyModel& Substance::model(Property property) const {
  auto it = this->models.find(property);
  if (it == this->models.end()) {
    throw DataError("Substance::model: no " + property_label(property) + " data for " + this->name);
  }
  return it->second;
}

void validate_substance(const Substance& substance) {
  const std::string& name = substance.name;
  const fits::CriticalConstants& crit = substance.crit;
  if (name.empty()) throw DataError("validate_substance: substance without a name");
  if (crit.Tc <= 0.0 || crit.Pc <= 0.0 || crit.MolWt <= 0.0) {
    throw DataError("validate_substance: " + name + " needs positive Tc, Pc and MolWt");
  }
  if (crit.Tfreeze <= 0.0 || crit.Tfreeze >= crit.Tc) {
    throw DataError("validate_substance: " + name + " needs 0 < Tfreeze < Tc");
  }
  for (const auto& entry : substance.models) {
    const PropertyModel& model = entry.second;
    const std::string label = property_label(entry.first);
    model.selected_fit(); // throws without a recommended curve
    if (fits::needs_anchor(model.selected_fit().kind) && model.anchors.empty()) {
      throw DataError("validate_substance: " + name + " " + label + " "
          + model.selected_fit().name() + " has no anchor point");
    }
    for (const auto& anchor : model.anchors) {
      if (anchor.T <= 0.0) throw DataError("validate_substance: " + name + " " + label + " anchor without T");
    }
  }
}

} // namespace rocketprops
