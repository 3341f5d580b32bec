#include "registry.h"

#include "Common/common.h"

#include <utility>

namespace rocketprops {

SubstanceRegistry::SubstanceRegistry(std::vector<Substance> substances_in,
    std::map<std::string, FreezeCurve> freeze_curves_in, int version)
  : freeze_curves(std::move(freeze_curves_in)), db_version(version) {
  for (auto& substance : substances_in) {
    validate_substance(substance);
    const std::size_t pos = this->substances.size();

    std::vector<std::string> keys = substance.aliases;
    keys.push_back(substance.name);
    for (const auto& key : keys) {
      const std::string normalized = common::normalizeName(key);
      if (normalized.empty()) continue;
      auto it = this->index.find(normalized);
      if (it != this->index.end() && it->second != pos) {
        throw DataError("SubstanceRegistry: alias '" + key + "' of " + substance.name
            + " is already used by " + this->substances[it->second]->name);
      }
      this->index[normalized] = pos;
    }
    this->substances.push_back(std::make_shared<const Substance>(std::move(substance)));
  }
}

SubstanceRegistry SubstanceRegistry::from_database(const PropertyDatabase& db) {
  return SubstanceRegistry(db.substances, db.freeze_curves, db.version);
}

SubstanceRegistry SubstanceRegistry::from_xml(const std::string& path) {
  return from_database(read_property_database(path));
}

std::shared_ptr<const Substance> SubstanceRegistry::resolve(const std::string& name_or_alias) const {
  auto it = this->index.find(common::normalizeName(name_or_alias));
  if (it == this->index.end()) {
    throw UnknownSubstanceError("SubstanceRegistry::resolve: unknown substance '" + name_or_alias + "'");
  }
  return this->substances[it->second];
}

bool SubstanceRegistry::contains(const std::string& name_or_alias) const {
  return this->index.count(common::normalizeName(name_or_alias)) > 0;
}

std::vector<std::string> SubstanceRegistry::names() const {
  std::vector<std::string> out;
  for (const auto& substance : this->substances) out.push_back(substance->name);
  return out;
}

const FreezeCurve& SubstanceRegistry::freeze_curve(const std::string& name) const {
  auto it = this->freeze_curves.find(name);
  if (it == this->freeze_curves.end()) {
    throw DataError("SubstanceRegistry::freeze_curve: no freeze curve '" + name + "'");
  }
  return it->second;
}

} // namespace rocketprops
