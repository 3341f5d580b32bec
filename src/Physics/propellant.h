#ifndef ROCKETPROPS_PROPELLANT_H
#define ROCKETPROPS_PROPELLANT_H

#include "Data/substance.h"
#include "Physics/property_evaluator.h"

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace rocketprops {

// per quantity display unit of the summary; missing entries use the internal unit
typedef std::map<units::Quantity, std::string> DisplayUnits;

// -----------------------------------------------------------------------------
// Immutable handle of one substance at one default state.
// Every query goes through the evaluator; nothing is cached.
// -----------------------------------------------------------------------------
class Propellant {
  public:
    Propellant(std::shared_ptr<const Substance> substance, const PropertyEvaluator& evaluator);
    Propellant(std::shared_ptr<const Substance> substance, const PropertyEvaluator& evaluator,
        double TdegR, double Ppsia);

    const std::string& name() const { return this->sub->name; }
    const Substance& substance() const { return *this->sub; }
    std::shared_ptr<const Substance> substance_ptr() const { return this->sub; }
    const PropertyEvaluator& evaluator() const { return this->eval; }

    // default state
    double T() const { return this->T_state; }
    double P() const { return this->P_state; }
    Propellant at_state(double TdegR, double Ppsia) const;

    double Tc() const { return this->sub->crit.Tc; }
    double Pc() const { return this->sub->crit.Pc; }
    double Tnbp() const { return this->sub->crit.Tnbp; }
    double Tfreeze() const { return this->sub->crit.Tfreeze; }
    double MolWt() const { return this->sub->crit.MolWt; }
    double omega() const { return this->sub->crit.omega; }

    // saturated liquid properties, internal units
    double PvapAtTdegR(double TdegR) const;
    double SGLiqAtTdegR(double TdegR) const;
    double SGVapAtTdegR(double TdegR) const;
    double ViscAtTdegR(double TdegR) const;
    double CondAtTdegR(double TdegR) const;
    double CpAtTdegR(double TdegR) const;
    double HvapAtTdegR(double TdegR) const;
    double SurfAtTdegR(double TdegR) const;
    // compressed liquid SG at (T, P)
    double SG_compressed(double TdegR, double Ppsia) const;
    // saturation temperature at Psat
    double TdegRAtPsat(double Psat) const;

    // at the default state
    PropertyResult get_property(Property property, const std::string& unit = "") const;
    PropertyResult get_property(const std::string& property_name, const std::string& unit = "") const;
    PropertyResult get_property(Property property, double TdegR, double Ppsia, const std::string& unit = "") const;

    // \brief: the summary fields in report order, evaluated at the default state
    //         throws on the first property that cannot be evaluated
    std::vector<PropertyResult> summary_results(const DisplayUnits& display_units = DisplayUnits()) const;
    // \brief: fixed-format multi-line report (Name, T, P, Pvap, ..., surf)
    std::string summary(const DisplayUnits& display_units = DisplayUnits()) const;

  private:
    std::shared_ptr<const Substance> sub;
    PropertyEvaluator eval;
    double T_state;
    double P_state;
};

// \brief: report order of the summary (Name is printed ahead of these)
const std::vector<Property>& summary_properties();

std::ostream& operator<<(std::ostream& os, const Propellant& prop);

} // namespace rocketprops

#endif // ROCKETPROPS_PROPELLANT_H
