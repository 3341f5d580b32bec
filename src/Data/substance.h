#ifndef ROCKETPROPS_SUBSTANCE_H
#define ROCKETPROPS_SUBSTANCE_H

#include "Correlations/correlation_fit.h"
#include "Units/unit_conv.h"

#include <map>
#include <string>
#include <vector>

namespace rocketprops {

enum class Property {
  Temperature,
  Pressure,
  VaporPressure,
  CriticalTemperature,
  CriticalPressure,
  LiquidSG,
  VaporSG,
  CompressedLiquidSG,
  Viscosity,
  ThermalConductivity,
  BoilingPoint,
  FreezingPoint,
  SpecificHeat,
  MolecularWeight,
  HeatOfVaporization,
  SurfaceTension
};

struct PropertyInfo {
  Property property;
  const char* label;       // short name used in reports and the database ("Pvap")
  units::Quantity quantity;
  bool liquid_only;        // only defined on the saturation line [Tfreeze, Tc]
  bool has_model;          // evaluated from anchors + fits of the substance
};

const PropertyInfo& property_info(Property property);
const std::vector<PropertyInfo>& all_properties();
// \brief: "Pvap", "SGliq", "visc", ... (case insensitive); throws RocketPropsError
Property parse_property(const std::string& name);
std::string property_label(Property property);

// \brief: one literature/vendor data value of one property
struct AnchorPoint {
  std::string source;  // "RocketProps", "NIST RefProp", "Aerojet", ...
  int rank = 3;        // authority, 0 is the most authoritative
  double T = 0.0;      // degR
  double P = 0.0;      // psia
  double value = 0.0;  // internal unit of the property
};

// \brief: data for one saturated property of one substance
struct PropertyModel {
  std::vector<AnchorPoint> anchors;
  std::vector<fits::CorrelationFit> fits; // literature candidates
  int selected = -1;                      // recommended curve, index into fits

  const fits::CorrelationFit& selected_fit() const;
  // nullptr when no candidate has that name (or source)
  const fits::CorrelationFit* find_fit(const std::string& name) const;
};

struct Substance {
  std::string name;
  std::vector<std::string> aliases;
  std::string data_source;
  fits::CriticalConstants crit;
  double Tref = 0.0; // default state, degR
  double Pref = 0.0; // default state, psia
  std::map<Property, PropertyModel> models;

  bool has_model(Property property) const { return this->models.count(property) > 0; }
  // throws DataError when the substance has no data for the property
  const PropertyModel& model(Property property) const;
};

// \brief: consistency checks of a substance record, throws DataError
void validate_substance(const Substance& substance);

} // namespace rocketprops

#endif // ROCKETPROPS_SUBSTANCE_H
