#include "property_db.h"

#include "Common/common.h"

#include "pugixml.hpp"

#include <iostream>
#include <sstream>

#ifndef ROCKETPROPS_DATA_DIR
#define ROCKETPROPS_DATA_DIR "data"
#endif

namespace rocketprops {

namespace {

double required_double(const pugi::xml_node& node, const char* attribute, const std::string& context) {
  pugi::xml_attribute attr = node.attribute(attribute);
  if (!attr || std::string(attr.value()).empty()) {
    throw DataError("property database: " + context + " is missing attribute '" + attribute + "'");
  }
  std::vector<double> values;
  try {
    values = common::Tokenize(attr.value(), " ");
  } catch (const std::invalid_argument&) {
    values.clear();
  }
  if (values.size() != 1) {
    throw DataError("property database: " + context + " attribute '" + attribute + "' is not a number");
  }
  return values[0];
}

std::vector<double> read_float_array(const pugi::xml_node& node, const std::string& context) {
  try {
    return common::Tokenize(node.child_value(), " ,\n\t\r");
  } catch (const std::invalid_argument& e) {
    throw DataError("property database: " + context + ": " + e.what());
  }
}

fits::CorrelationFit read_fit(const pugi::xml_node& fit_node, const std::string& context) {
  const std::string kind_name = fit_node.attribute("kind").value();
  if (kind_name.empty()) throw DataError("property database: " + context + " fit without kind");
  const fits::FitKind kind = fits::parse_fit_kind(kind_name);
  const std::string source = fit_node.attribute("source").as_string(kind_name.c_str());

  fits::CorrelationFit fit;
  if (kind == fits::FitKind::SaturationTable) {
    std::vector<double> tr = read_float_array(fit_node.child("Tr"), context + " Tr");
    std::vector<double> values = read_float_array(fit_node.child("values"), context + " values");
    fit = fits::make_table_fit(tr, values, fit_node.attribute("log10").as_bool(false), source);
  } else {
    fit = fits::make_fit(kind, read_float_array(fit_node, context + " " + kind_name), source);
  }
  if (fit_node.attribute("Trmin")) fit.Tr_min = fit_node.attribute("Trmin").as_double();
  if (fit_node.attribute("Trmax")) fit.Tr_max = fit_node.attribute("Trmax").as_double();
  if (fit.Tr_min >= fit.Tr_max) throw DataError("property database: " + context + " has an empty Tr domain");
  return fit;
}

PropertyModel read_property_model(const pugi::xml_node& prop_node, const Substance& substance,
    const std::string& context) {
  PropertyModel model;
  for (pugi::xml_node anchor_node : prop_node.children("anchor")) {
    AnchorPoint anchor;
    anchor.source = anchor_node.attribute("source").as_string("RocketProps");
    anchor.rank = anchor_node.attribute("rank").as_int(3);
    anchor.T = required_double(anchor_node, "T", context + " anchor");
    anchor.P = anchor_node.attribute("P") ? required_double(anchor_node, "P", context) : substance.Pref;
    anchor.value = required_double(anchor_node, "value", context + " anchor");
    model.anchors.push_back(anchor);
  }
  for (pugi::xml_node fit_node : prop_node.children("fit")) {
    model.fits.push_back(read_fit(fit_node, context));
    if (fit_node.attribute("selected").as_bool(false)) {
      if (model.selected >= 0) throw DataError("property database: " + context + " has two selected fits");
      model.selected = static_cast<int>(model.fits.size()) - 1;
    }
  }
  if (model.selected < 0) {
    throw DataError("property database: " + context + " has no selected fit");
  }
  return model;
}

Substance read_substance(const pugi::xml_node& node) {
  Substance substance;
  substance.name = common::trim(node.attribute("name").value());
  if (substance.name.empty()) throw DataError("property database: substance without a name");
  substance.data_source = node.attribute("source").as_string("RocketProps");
  const std::string& name = substance.name;

  for (const std::string& alias : common::splitString(node.child_value("aliases"), ',')) {
    const std::string trimmed = common::trim(alias);
    if (!trimmed.empty()) substance.aliases.push_back(trimmed);
  }

  pugi::xml_node crit_node = node.child("critical");
  if (!crit_node) throw DataError("property database: " + name + " has no <critical> element");
  fits::CriticalConstants& crit = substance.crit;
  crit.Tc = required_double(crit_node, "Tc", name);
  crit.Pc = required_double(crit_node, "Pc", name);
  crit.SGc = required_double(crit_node, "SGc", name);
  crit.Zc = required_double(crit_node, "Zc", name);
  crit.Zra = crit_node.attribute("Zra").as_double(0.0);
  crit.Tnbp = required_double(crit_node, "Tnbp", name);
  crit.Tfreeze = required_double(crit_node, "Tfreeze", name);
  crit.omega = required_double(crit_node, "omega", name);
  crit.MolWt = required_double(crit_node, "MolWt", name);

  pugi::xml_node ref_node = node.child("reference");
  substance.Tref = ref_node.attribute("T").as_double(constants::T_REF_DEGR);
  substance.Pref = ref_node.attribute("P").as_double(constants::P_REF_PSIA);

  for (pugi::xml_node prop_node : node.children("property")) {
    const std::string label = prop_node.attribute("name").value();
    Property property;
    try {
      property = parse_property(label);
    } catch (const RocketPropsError& e) {
      throw DataError("property database: " + name + ": " + e.what());
    }
    if (!property_info(property).has_model) {
      throw DataError("property database: " + name + ": " + label + " is not a saturated property");
    }
    if (substance.has_model(property)) {
      throw DataError("property database: " + name + ": " + label + " given twice");
    }
    substance.models[property] = read_property_model(prop_node, substance, name + " " + label);
  }

  validate_substance(substance);
  return substance;
}

FreezeCurve read_freeze_curve(const pugi::xml_node& node) {
  FreezeCurve curve;
  curve.name = node.attribute("name").value();
  curve.x = read_float_array(node.child("x"), "freeze curve " + curve.name);
  curve.T = read_float_array(node.child("T"), "freeze curve " + curve.name);
  if (curve.name.empty() || curve.x.size() < 2 || curve.x.size() != curve.T.size()) {
    throw DataError("property database: malformed freeze curve '" + curve.name + "'");
  }
  return curve;
}

PropertyDatabase read_document(const pugi::xml_document& xmlDoc, const std::string& path) {
  pugi::xml_node root = xmlDoc.child("rocketprops");
  if (!root) throw DataError("property database: " + path + " has no <rocketprops> root");

  PropertyDatabase db;
  db.path = path;
  db.version = root.attribute("version").as_int(0);
  for (pugi::xml_node node : root.children("substance")) {
    db.substances.push_back(read_substance(node));
  }
  for (pugi::xml_node node : root.children("freeze_curve")) {
    FreezeCurve curve = read_freeze_curve(node);
    db.freeze_curves[curve.name] = curve;
  }
  if (db.substances.empty()) throw DataError("property database: " + path + " holds no substances");
  return db;
}

} // namespace

double FreezeCurve::Tfreeze(double x_in) const {
  if (!(x_in >= this->x.front() && x_in <= this->x.back())) {
    std::ostringstream msg;
    msg << "FreezeCurve::Tfreeze: " << x_in << " is outside of the " << this->name
        << " curve [" << this->x.front() << ", " << this->x.back() << "]";
    throw RocketPropsError(msg.str());
  }
  for (std::size_t i = 1; i < this->x.size(); ++i) {
    if (x_in <= this->x[i]) {
      const double w = (x_in - this->x[i - 1]) / (this->x[i] - this->x[i - 1]);
      return this->T[i - 1] + w * (this->T[i] - this->T[i - 1]);
    }
  }
  return this->T.back();
}

PropertyDatabase read_property_database(const std::string& path) {
  pugi::xml_document xmlDoc;
  pugi::xml_parse_result result = xmlDoc.load_file(path.c_str());
  if (!result) {
    throw DataError("property database: cannot read " + path + ": " + result.description());
  }
  PropertyDatabase db = read_document(xmlDoc, path);
  std::cout << "Loaded " << db.substances.size() << " substances from " << path
            << " (version " << db.version << ")" << std::endl;
  return db;
}

PropertyDatabase parse_property_database(const std::string& xml_text) {
  pugi::xml_document xmlDoc;
  pugi::xml_parse_result result = xmlDoc.load_string(xml_text.c_str());
  if (!result) {
    throw DataError(std::string("property database: parse error: ") + result.description());
  }
  return read_document(xmlDoc, "<string>");
}

std::string default_database_path() {
  return std::string(ROCKETPROPS_DATA_DIR) + "/propellants.xml";
}

} // namespace rocketprops
