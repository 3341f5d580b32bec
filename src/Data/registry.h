#ifndef ROCKETPROPS_REGISTRY_H
#define ROCKETPROPS_REGISTRY_H

#include "Data/property_db.h"
#include "Data/substance.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rocketprops {

// -----------------------------------------------------------------------------
// Read-only name/alias -> Substance lookup.
// Built once from the reference database; every accessor is const so any
// number of threads may share one registry.
// -----------------------------------------------------------------------------
class SubstanceRegistry {
  public:
    // throws DataError when two substances share a (normalized) alias
    explicit SubstanceRegistry(std::vector<Substance> substances,
        std::map<std::string, FreezeCurve> freeze_curves = {}, int version = 0);

    static SubstanceRegistry from_database(const PropertyDatabase& db);
    static SubstanceRegistry from_xml(const std::string& path);

    // \brief: case, blank and separator insensitive ("mon-3" == "MON3")
    //         throws UnknownSubstanceError
    std::shared_ptr<const Substance> resolve(const std::string& name_or_alias) const;
    bool contains(const std::string& name_or_alias) const;

    // canonical names in database order
    std::vector<std::string> names() const;
    std::size_t size() const { return this->substances.size(); }
    int version() const { return this->db_version; }

    const FreezeCurve& freeze_curve(const std::string& name) const;

  private:
    std::vector<std::shared_ptr<const Substance>> substances;
    std::map<std::string, std::size_t> index; // normalized alias -> substances[]
    std::map<std::string, FreezeCurve> freeze_curves;
    int db_version;
};

} // namespace rocketprops

#endif // ROCKETPROPS_REGISTRY_H
