#ifndef ROCKETPROPS_PROPERTY_LIBRARY_H
#define ROCKETPROPS_PROPERTY_LIBRARY_H

#include "Data/registry.h"
#include "IO/config.h"
#include "IO/input.h"
#include "Physics/propellant.h"
#include "Physics/property_evaluator.h"

#include <memory>
#include <string>

namespace rocketprops {

// -----------------------------------------------------------------------------
// Owns the registry and the evaluator; the entry point "name -> Propellant".
// initialize() runs once, afterwards every member is const.
// -----------------------------------------------------------------------------
class PropertyLibrary {
  public:
    PropertyLibrary();

    void set_input_file(const IO::Input* input_file) { this->input = input_file; }
    // \brief: read the configuration (defaults without an input file) and load the database
    void initialize();
    void initialize(const IO::RocketPropsConfig& config);

    bool is_initialized() const { return static_cast<bool>(this->reg); }

    // \brief: registered substance or blend (M20, MHF3, FLOX70, MON15)
    //         throws UnknownSubstanceError
    Propellant get_prop(const std::string& name) const;
    Propellant get_prop(const std::string& name, double TdegR, double Ppsia) const;

    const SubstanceRegistry& registry() const;
    const PropertyEvaluator& evaluator() const { return this->eval; }
    const IO::RocketPropsConfig& config() const { return this->cfg; }

  private:
    const IO::Input* input;
    IO::RocketPropsConfig cfg;
    std::unique_ptr<const SubstanceRegistry> reg;
    PropertyEvaluator eval;
};

} // namespace rocketprops

#endif // ROCKETPROPS_PROPERTY_LIBRARY_H
