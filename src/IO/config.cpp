#include "config.h"

#include "Common/common.h"
#include "Data/property_db.h"

#include <cctype>

namespace rocketprops {
namespace IO {

namespace {

const units::Quantity display_quantities[] = {
  units::Quantity::Temperature,
  units::Quantity::Pressure,
  units::Quantity::Density,
  units::Quantity::Viscosity,
  units::Quantity::Conductivity,
  units::Quantity::SurfaceTension,
  units::Quantity::HeatCapacity,
  units::Quantity::Enthalpy,
  units::Quantity::MolecularWeight
};

} // namespace

std::string display_unit_key(units::Quantity quantity) {
  std::string key;
  for (char c : units::quantity_name(quantity)) {
    key.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return key + "_unit";
}

RocketPropsConfig read_config(const Input& input) {
  RocketPropsConfig config;
  config.data_file = input.getStringParam("data_file", "");

  EvaluatorOptions& opts = config.evaluator;
  opts.anchor_tolerance_degR = input.getDoubleParam("anchor_tolerance_degR", opts.anchor_tolerance_degR);
  opts.bracket_margin_Tr = input.getDoubleParam("bracket_margin_Tr", opts.bracket_margin_Tr);
  opts.domain_policy = parse_domain_policy(input.getStringParam("domain_policy", "strict"));
  if (opts.anchor_tolerance_degR < 0.0 || opts.bracket_margin_Tr < 0.0) {
    throw RocketPropsError("read_config: anchor_tolerance_degR and bracket_margin_Tr must not be negative");
  }

  config.substances = input.getStringArrayParam("substances");

  for (units::Quantity quantity : display_quantities) {
    const std::string key = "output." + display_unit_key(quantity);
    if (!input.hasParam(key)) continue;
    const std::string unit = input.getStringParam(key);
    if (units::quantity_of(unit) != quantity) {
      throw IncompatibleUnitError("read_config: " + key + " = '" + unit + "' is not a "
          + units::quantity_name(quantity) + " unit");
    }
    config.display_units[quantity] = unit;
  }

  config.hdf5_file = input.getStringParam("output.hdf5_file", "");
  config.dat_file = input.getStringParam("output.dat_file", "");
  config.num_saturation_points = input.getIntParam("output.num_saturation_points", config.num_saturation_points);
  if (config.num_saturation_points < 2) {
    throw RocketPropsError("read_config: output.num_saturation_points must be at least 2");
  }
  return config;
}

std::ostream& operator<<(std::ostream& os, const RocketPropsConfig& config) {
  os << "data_file             = " << (config.data_file.empty() ? default_database_path() : config.data_file) << "\n"
     << "anchor_tolerance_degR = " << config.evaluator.anchor_tolerance_degR << "\n"
     << "bracket_margin_Tr     = " << config.evaluator.bracket_margin_Tr << "\n"
     << "domain_policy         = "
     << (config.evaluator.domain_policy == DomainPolicy::Clamp ? "clamp" : "strict") << "\n";
  for (const auto& entry : config.display_units) {
    os << display_unit_key(entry.first) << " = " << entry.second << "\n";
  }
  return os;
}

} // namespace IO
} // namespace rocketprops
