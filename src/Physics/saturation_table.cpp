#include "saturation_table.h"

#include "Common/common.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace rocketprops {

namespace {

const Property table_properties[] = {
  Property::VaporPressure,
  Property::LiquidSG,
  Property::VaporSG,
  Property::Viscosity,
  Property::ThermalConductivity,
  Property::SpecificHeat,
  Property::HeatOfVaporization,
  Property::SurfaceTension
};

} // namespace

const std::vector<double>& SaturationTable::column(const std::string& label) const {
  LOOP_i_N(this->columns.size()) {
    if (this->columns[i] == label) return this->data[i];
  }
  throw RocketPropsError("SaturationTable::column: no column '" + label + "' in " + this->name);
}

double saturation_table_Tmax(const Propellant& prop) {
  const Substance& substance = prop.substance();
  double Tr_max = 1.0;
  for (Property property : table_properties) {
    Tr_max = std::min(Tr_max, substance.model(property).selected_fit().Tr_max);
  }
  // T/Tc must not round above Tr_max
  double Tmax = Tr_max * substance.crit.Tc;
  while (Tmax / substance.crit.Tc > Tr_max) Tmax = std::nextafter(Tmax, 0.0);
  return Tmax;
}

SaturationTable build_saturation_table(const Propellant& prop, int npts) {
  if (npts < 2) throw RocketPropsError("build_saturation_table: need at least two points");

  const Substance& substance = prop.substance();
  const PropertyEvaluator& evaluator = prop.evaluator();
  const double Tlo = substance.crit.Tfreeze;
  const double Thi = saturation_table_Tmax(prop);
  if (!(Thi > Tlo)) {
    throw PhaseRangeError("build_saturation_table: " + substance.name + " has no tabulated liquid range");
  }
  const double dT = (Thi - Tlo) / (npts - 1);
  const int ncols = 2 + static_cast<int>(sizeof(table_properties) / sizeof(table_properties[0]));

  SaturationTable table;
  table.name = substance.name;
  table.columns = {"Tr", "T"};
  table.units = {"", "degR"};
  for (Property property : table_properties) {
    table.columns.push_back(property_label(property));
    table.units.push_back(units::internal_unit(property_info(property).quantity));
  }
  table.data.assign(ncols, std::vector<double>(npts, 0.0));

  // registry data and evaluator are read-only, points are independent
  std::vector<std::exception_ptr> errors(npts);
  #pragma omp parallel for
  for (int i = 0; i < npts; ++i) {
    try {
      const double T = (i == npts - 1) ? Thi : Tlo + i * dT;
      table.data[0][i] = T / substance.crit.Tc;
      table.data[1][i] = T;
      int col = 2;
      for (Property property : table_properties) {
        table.data[col++][i] = evaluator.value(substance, property, T);
      }
    } catch (...) {
      errors[i] = std::current_exception();
    }
  }

  for (const auto& error : errors) {
    if (error) std::rethrow_exception(error);
  }
  return table;
}

} // namespace rocketprops
