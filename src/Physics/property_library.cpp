#include "property_library.h"

#include "Common/common.h"
#include "Data/property_db.h"
#include "Physics/mixture.h"

#include <iostream>

namespace rocketprops {

PropertyLibrary::PropertyLibrary() : input(nullptr) {}

void PropertyLibrary::initialize() {
  if (this->input != nullptr) {
    this->initialize(IO::read_config(*this->input));
  } else {
    this->initialize(IO::RocketPropsConfig());
  }
}

void PropertyLibrary::initialize(const IO::RocketPropsConfig& config) {
  this->cfg = config;
  const std::string path = config.data_file.empty() ? default_database_path() : config.data_file;
  this->reg.reset(new SubstanceRegistry(SubstanceRegistry::from_xml(path)));
  this->eval = PropertyEvaluator(config.evaluator);

  std::cout << "Number of substances: " << this->reg->size() << std::endl;
  for (const auto& name : this->reg->names()) {
    std::cout << "Substance: " << name << std::endl;
  }
}

const SubstanceRegistry& PropertyLibrary::registry() const {
  if (!this->reg) throw RocketPropsError("PropertyLibrary: initialize() has not been called");
  return *this->reg;
}

Propellant PropertyLibrary::get_prop(const std::string& name) const {
  const SubstanceRegistry& registry = this->registry();
  if (registry.contains(name)) return Propellant(registry.resolve(name), this->eval);
  if (!is_mixture_name(name)) {
    // resolve() reports the unknown name
    return Propellant(registry.resolve(name), this->eval);
  }
  auto mix = std::make_shared<const Substance>(build_mixture(registry, this->eval, name));
  return Propellant(mix, this->eval);
}

Propellant PropertyLibrary::get_prop(const std::string& name, double TdegR, double Ppsia) const {
  return this->get_prop(name).at_state(TdegR, Ppsia);
}

} // namespace rocketprops
