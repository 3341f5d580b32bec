#include "property_evaluator.h"

#include "Common/common.h"
#include "Units/unit_conv.h"

#include "boost/math/tools/roots.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rocketprops {

DomainPolicy parse_domain_policy(const std::string& name) {
  const std::string key = common::normalizeName(name);
  if (key == "STRICT") return DomainPolicy::Strict;
  if (key == "CLAMP") return DomainPolicy::Clamp;
  throw RocketPropsError("parse_domain_policy: unknown domain policy '" + name + "'");
}

std::string PropertyResult::to_string() const {
  std::ostringstream os;
  os << property_label(this->property) << " = " << this->value << " " << this->unit
     << " at T = " << this->T << " degR, P = " << this->P << " psia [" << this->fit_name;
  if (!this->anchor_source.empty()) os << ", " << this->anchor_source;
  if (this->clamped) os << ", clamped";
  os << "]";
  return os.str();
}

//----------------------------------------------------------------------------

PropertyEvaluator::PropertyEvaluator(EvaluatorOptions options) : opts(options) {}

PropertyEvaluator PropertyEvaluator::with_policy(DomainPolicy policy) const {
  EvaluatorOptions options = this->opts;
  options.domain_policy = policy;
  return PropertyEvaluator(options);
}

//----------------------------------------------------------------------------

PropertyResult PropertyEvaluator::get_property(const Substance& substance, Property property,
    double T, double P, const std::string& unit) const {
  const PropertyInfo& info = property_info(property);
  const fits::CriticalConstants& crit = substance.crit;

  PropertyResult result;
  result.property = property;
  result.T = T;
  result.P = P;

  if (info.liquid_only) this->check_phase_range(substance, property, T);

  double raw = 0.0;
  switch (property) {
    case Property::Temperature: raw = T; result.fit_name = "state"; break;
    case Property::Pressure: raw = P; result.fit_name = "state"; break;
    case Property::CriticalTemperature: raw = crit.Tc; result.fit_name = "constant"; break;
    case Property::CriticalPressure: raw = crit.Pc; result.fit_name = "constant"; break;
    case Property::BoilingPoint: raw = crit.Tnbp; result.fit_name = "constant"; break;
    case Property::FreezingPoint: raw = crit.Tfreeze; result.fit_name = "constant"; break;
    case Property::MolecularWeight: raw = crit.MolWt; result.fit_name = "constant"; break;
    case Property::CompressedLiquidSG: {
      PropertyResult psat_result;
      const double Psat = this->saturated(substance, Property::VaporPressure, T, psat_result);
      const double SGsat = this->saturated(substance, Property::LiquidSG, T, result);
      try {
        raw = fits::costald_compressed_sg(SGsat, T / crit.Tc, P, Psat, crit);
        if (P > Psat) result.fit_name += "+COSTALD";
      } catch (const DomainError&) {
        // near Tc the clamp policy keeps the saturated SG, flagged as clamped
        if (this->opts.domain_policy != DomainPolicy::Clamp) throw;
        raw = SGsat;
        result.clamped = true;
      }
      break;
    }
    default:
      raw = this->saturated(substance, property, T, result);
      break;
  }

  result.unit = unit.empty() ? units::internal_unit(info.quantity) : unit;
  result.value = unit.empty() ? raw : units::from_internal(raw, unit, info.quantity);
  return result;
}

PropertyResult PropertyEvaluator::get_property(const Substance& substance, const std::string& property_name,
    double T, double P, const std::string& unit) const {
  return this->get_property(substance, parse_property(property_name), T, P, unit);
}

PropertyResult PropertyEvaluator::get_property(const Substance& substance, Property property,
    const std::string& unit) const {
  return this->get_property(substance, property, substance.Tref, substance.Pref, unit);
}

double PropertyEvaluator::value(const Substance& substance, Property property, double T, double P) const {
  return this->get_property(substance, property, T, P).value;
}

double PropertyEvaluator::value(const Substance& substance, Property property, double T) const {
  return this->get_property(substance, property, T, substance.Pref).value;
}

//----------------------------------------------------------------------------

void PropertyEvaluator::check_phase_range(const Substance& substance, Property property, double T) const {
  const fits::CriticalConstants& crit = substance.crit;
  if (T < crit.Tfreeze || T > crit.Tc) {
    std::ostringstream msg;
    msg << substance.name << " " << property_label(property) << " is a liquid property; T = " << T
        << " degR is outside of [Tfreeze, Tc] = [" << crit.Tfreeze << ", " << crit.Tc << "] degR";
    throw PhaseRangeError(msg.str());
  }
}

const AnchorPoint* PropertyEvaluator::select_anchor(const PropertyModel& model, double T) const {
  const AnchorPoint* best = nullptr;
  for (const auto& anchor : model.anchors) {
    if (best == nullptr) {
      best = &anchor;
      continue;
    }
    const double d = std::abs(anchor.T - T);
    const double d_best = std::abs(best->T - T);
    if (d < d_best || (d == d_best && anchor.rank < best->rank)) best = &anchor;
  }
  return best;
}

double PropertyEvaluator::saturated(const Substance& substance, Property property, double T,
    PropertyResult& result) const {
  const PropertyModel& model = substance.model(property);
  const fits::CorrelationFit& fit = model.selected_fit();
  const AnchorPoint* anchor = this->select_anchor(model, T);
  const double Tr = T / substance.crit.Tc;

  if (anchor != nullptr) {
    const double dT = std::abs(T - anchor->T);
    const bool bracketed = Tr >= fit.Tr_min + this->opts.bracket_margin_Tr
      && Tr <= fit.Tr_max - this->opts.bracket_margin_Tr;
    if (dT <= 1.0e-9 || (dT <= this->opts.anchor_tolerance_degR && !bracketed)) {
      result.fit_name = "anchor";
      result.anchor_source = anchor->source;
      result.from_anchor = true;
      return anchor->value;
    }
  }

  double Psat = 0.0;
  if (fit.kind == fits::FitKind::PitzerVirial) {
    PropertyResult psat_result;
    Psat = this->saturated(substance, Property::VaporPressure, T, psat_result);
  }
  return this->evaluate_model_fit(substance, fit, anchor, T, Psat, result);
}

double PropertyEvaluator::evaluate_model_fit(const Substance& substance, const fits::CorrelationFit& fit,
    const AnchorPoint* anchor, double T, double Psat, PropertyResult& result) const {
  const fits::CriticalConstants& crit = substance.crit;
  fits::FitParams params(crit);
  params.Psat = Psat;
  if (anchor != nullptr && fits::uses_anchor(fit.kind)) {
    params.anchor = fits::Anchor{anchor->T / crit.Tc, anchor->value};
    result.anchor_source = anchor->source;
  }
  result.fit_name = fit.name();

  const double Tr = T / crit.Tc;
  try {
    return fits::evaluate(fit, Tr, params);
  } catch (const DomainError& e) {
    if (this->opts.domain_policy != DomainPolicy::Clamp) throw;
    const double Tr_clamped = std::min(std::max(Tr, fit.Tr_min), fit.Tr_max);
    if (Tr_clamped == Tr) throw; // singular inside the domain, nothing to clamp to
    result.clamped = true;
    return fits::evaluate(fit, Tr_clamped, params);
  }
}

//----------------------------------------------------------------------------

PropertyResult PropertyEvaluator::evaluate_fit(const Substance& substance, Property property,
    const std::string& fit_name, double T, const std::string& unit) const {
  const PropertyInfo& info = property_info(property);
  const PropertyModel& model = substance.model(property);
  const fits::CorrelationFit* fit = model.find_fit(fit_name);
  if (fit == nullptr) {
    throw DataError("PropertyEvaluator::evaluate_fit: " + substance.name + " has no "
        + info.label + " curve named '" + fit_name + "'");
  }
  this->check_phase_range(substance, property, T);

  PropertyResult result;
  result.property = property;
  result.T = T;
  result.P = substance.Pref;

  double Psat = 0.0;
  if (fit->kind == fits::FitKind::PitzerVirial) {
    PropertyResult psat_result;
    Psat = this->saturated(substance, Property::VaporPressure, T, psat_result);
  }
  const double raw = this->evaluate_model_fit(substance, *fit, this->select_anchor(model, T), T, Psat, result);
  result.unit = unit.empty() ? units::internal_unit(info.quantity) : unit;
  result.value = unit.empty() ? raw : units::from_internal(raw, unit, info.quantity);
  return result;
}

double PropertyEvaluator::saturation_temperature(const Substance& substance, double Psat) const {
  const fits::CriticalConstants& crit = substance.crit;
  auto objFun = [&](double T) {
    return this->value(substance, Property::VaporPressure, T) - Psat;
  };

  const double T_lo = crit.Tfreeze;
  const double T_hi = crit.Tc;
  const double f_lo = objFun(T_lo);
  const double f_hi = objFun(T_hi);
  if (f_lo == 0.0) return T_lo;
  if (f_hi == 0.0) return T_hi;
  if ((f_lo > 0.0) == (f_hi > 0.0)) {
    std::ostringstream msg;
    msg << substance.name << " Pvap = " << Psat << " psia is outside of the saturation range ["
        << f_lo + Psat << ", " << f_hi + Psat << "] psia";
    throw PhaseRangeError(msg.str());
  }

  const boost::uintmax_t maxit = 200;
  boost::uintmax_t it = maxit;
  boost::math::tools::eps_tolerance<double> tol(40);
  std::pair<double, double> sol = boost::math::tools::toms748_solve(objFun, T_lo, T_hi, f_lo, f_hi, tol, it);
  if (it >= maxit) {
    throw std::runtime_error("PropertyEvaluator::saturation_temperature(): max iteration achieved.");
  }
  return 0.5 * (sol.first + sol.second);
}

} // namespace rocketprops
