#ifndef ROCKETPROPS_PROPERTY_EVALUATOR_H
#define ROCKETPROPS_PROPERTY_EVALUATOR_H

#include "Data/substance.h"

#include <string>

namespace rocketprops {

enum class DomainPolicy {
  Strict, // DomainError from a fit reaches the caller
  Clamp   // re-evaluate the fit at the nearest end of its domain
};

DomainPolicy parse_domain_policy(const std::string& name);

struct EvaluatorOptions {
  double anchor_tolerance_degR = 0.5;
  double bracket_margin_Tr = 0.02;
  DomainPolicy domain_policy = DomainPolicy::Strict;
};

struct PropertyResult {
  Property property = Property::Temperature;
  double value = 0.0;
  std::string unit;
  double T = 0.0;              // degR
  double P = 0.0;              // psia
  std::string fit_name;        // correlation (or "anchor", "constant", "state")
  std::string anchor_source;   // anchor used by the fit, empty if none
  bool from_anchor = false;    // value is the anchor itself
  bool clamped = false;        // fit was evaluated at the edge of its domain

  std::string to_string() const;
};

// -----------------------------------------------------------------------------
// Selects and evaluates the recommended curve of a property.
//
// 1. an anchor at T (or within anchor_tolerance_degR of T when the selected
//    fit does not bracket Tr by bracket_margin_Tr) is returned directly
// 2. otherwise the selected fit is evaluated at Tr = T/Tc, anchored on the
//    closest anchor point (ties go to the lower rank)
// 3. liquid-only properties outside [Tfreeze, Tc] raise PhaseRangeError
// 4. the result is converted to the requested unit
// -----------------------------------------------------------------------------
class PropertyEvaluator {
  public:
    explicit PropertyEvaluator(EvaluatorOptions options = EvaluatorOptions());

    // unit "" means the internal unit of the property
    PropertyResult get_property(const Substance& substance, Property property,
        double T, double P, const std::string& unit = "") const;
    PropertyResult get_property(const Substance& substance, const std::string& property_name,
        double T, double P, const std::string& unit = "") const;
    // at the reference state of the substance
    PropertyResult get_property(const Substance& substance, Property property,
        const std::string& unit = "") const;

    // \brief: internal-unit value only
    double value(const Substance& substance, Property property, double T, double P) const;
    double value(const Substance& substance, Property property, double T) const;

    // \brief: evaluate one (not necessarily selected) candidate curve by kind or source name
    PropertyResult evaluate_fit(const Substance& substance, Property property,
        const std::string& fit_name, double T, const std::string& unit = "") const;

    // \brief: temperature [degR] at which Pvap == Psat [psia]
    double saturation_temperature(const Substance& substance, double Psat) const;

    // \brief: anchor used to parameterize a fit at T, nullptr if the property has none
    const AnchorPoint* select_anchor(const PropertyModel& model, double T) const;

    const EvaluatorOptions& options() const { return this->opts; }
    PropertyEvaluator with_policy(DomainPolicy policy) const;

  private:
    void check_phase_range(const Substance& substance, Property property, double T) const;
    double saturated(const Substance& substance, Property property, double T, PropertyResult& result) const;
    double evaluate_model_fit(const Substance& substance, const fits::CorrelationFit& fit,
        const AnchorPoint* anchor, double T, double Psat, PropertyResult& result) const;

    EvaluatorOptions opts;
};

} // namespace rocketprops

#endif // ROCKETPROPS_PROPERTY_EVALUATOR_H
