#include "propellant.h"

#include "Common/common.h"

#include <iomanip>
#include <sstream>
#include <utility>

namespace rocketprops {

const std::vector<Property>& summary_properties() {
  static const std::vector<Property> order = {
    Property::Temperature,
    Property::Pressure,
    Property::VaporPressure,
    Property::CriticalPressure,
    Property::CriticalTemperature,
    Property::LiquidSG,
    Property::VaporSG,
    Property::Viscosity,
    Property::ThermalConductivity,
    Property::BoilingPoint,
    Property::FreezingPoint,
    Property::SpecificHeat,
    Property::MolecularWeight,
    Property::HeatOfVaporization,
    Property::SurfaceTension
  };
  return order;
}

Propellant::Propellant(std::shared_ptr<const Substance> substance, const PropertyEvaluator& evaluator)
  : sub(std::move(substance)), eval(evaluator) {
  if (!this->sub) throw RocketPropsError("Propellant: null substance");
  this->T_state = this->sub->Tref;
  this->P_state = this->sub->Pref;
}

Propellant::Propellant(std::shared_ptr<const Substance> substance, const PropertyEvaluator& evaluator,
    double TdegR, double Ppsia)
  : sub(std::move(substance)), eval(evaluator), T_state(TdegR), P_state(Ppsia) {
  if (!this->sub) throw RocketPropsError("Propellant: null substance");
}

Propellant Propellant::at_state(double TdegR, double Ppsia) const {
  return Propellant(this->sub, this->eval, TdegR, Ppsia);
}

//----------------------------------------------------------------------------

double Propellant::PvapAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::VaporPressure, TdegR);
}

double Propellant::SGLiqAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::LiquidSG, TdegR);
}

double Propellant::SGVapAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::VaporSG, TdegR);
}

double Propellant::ViscAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::Viscosity, TdegR);
}

double Propellant::CondAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::ThermalConductivity, TdegR);
}

double Propellant::CpAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::SpecificHeat, TdegR);
}

double Propellant::HvapAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::HeatOfVaporization, TdegR);
}

double Propellant::SurfAtTdegR(double TdegR) const {
  return this->eval.value(*this->sub, Property::SurfaceTension, TdegR);
}

double Propellant::SG_compressed(double TdegR, double Ppsia) const {
  return this->eval.value(*this->sub, Property::CompressedLiquidSG, TdegR, Ppsia);
}

double Propellant::TdegRAtPsat(double Psat) const {
  return this->eval.saturation_temperature(*this->sub, Psat);
}

//----------------------------------------------------------------------------

PropertyResult Propellant::get_property(Property property, const std::string& unit) const {
  return this->eval.get_property(*this->sub, property, this->T_state, this->P_state, unit);
}

PropertyResult Propellant::get_property(const std::string& property_name, const std::string& unit) const {
  return this->get_property(parse_property(property_name), unit);
}

PropertyResult Propellant::get_property(Property property, double TdegR, double Ppsia,
    const std::string& unit) const {
  return this->eval.get_property(*this->sub, property, TdegR, Ppsia, unit);
}

std::vector<PropertyResult> Propellant::summary_results(const DisplayUnits& display_units) const {
  std::vector<PropertyResult> results;
  for (Property property : summary_properties()) {
    auto it = display_units.find(property_info(property).quantity);
    const std::string unit = it == display_units.end() ? std::string() : it->second;
    results.push_back(this->get_property(property, unit));
  }
  return results;
}

std::string Propellant::summary(const DisplayUnits& display_units) const {
  // evaluate everything first, a failing property produces no report at all
  const std::vector<PropertyResult> results = this->summary_results(display_units);

  std::ostringstream os;
  os << std::setw(8) << "Name" << " = " << this->sub->name;
  if (!this->sub->aliases.empty()) {
    os << " (";
    for (std::size_t i = 0; i < this->sub->aliases.size(); ++i) {
      if (i > 0) os << ", ";
      os << this->sub->aliases[i];
    }
    os << ")";
  }
  os << "\n";

  for (const auto& result : results) {
    os << std::setw(8) << property_label(result.property) << " = "
       << std::setw(12) << std::setprecision(6) << result.value << " " << result.unit << "\n";
  }
  return os.str();
}

std::ostream& operator<<(std::ostream& os, const Propellant& prop) {
  os << prop.summary();
  return os;
}

} // namespace rocketprops
