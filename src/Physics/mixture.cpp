#include "mixture.h"

#include "Common/common.h"
#include "Correlations/curve_fitting.h"

#include "boost/math/tools/roots.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace rocketprops {

namespace {

// "M20" -> 20; false when the name is not prefix + number
bool parse_percent(const std::string& key, const std::string& prefix, double& percent) {
  if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) return false;
  const std::string digits = key.substr(prefix.size());
  // digits only: no sign, exponent, hex or nan/inf spellings
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  char* end = nullptr;
  percent = std::strtod(digits.c_str(), &end);
  return end != digits.c_str() && *end == '\0';
}

// property of one constituent with T held inside its own [Tfreeze, Tc]
double clamped_property(const PropertyEvaluator& evaluator, const Substance& substance,
    Property property, double T) {
  const double Tclamped = std::min(std::max(T, substance.crit.Tfreeze), substance.crit.Tc);
  return evaluator.value(substance, property, Tclamped);
}

double mixed_cond(const std::vector<double>& mass_fractions, const std::vector<double>& cond) {
  if (mass_fractions.size() == 2) return mixing::filippov_cond(mass_fractions, cond);
  return mixing::dippr9h_cond(mass_fractions, cond);
}

PropertyModel table_model(const std::vector<double>& tr, const std::vector<double>& values,
    bool log10_values, const AnchorPoint& anchor) {
  PropertyModel model;
  model.anchors.push_back(anchor);
  model.fits.push_back(fits::make_table_fit(tr, values, log10_values, "Mixture Rules"));
  model.selected = 0;
  return model;
}

} // namespace

//----------------------------------------------------------------------------
namespace mixing {

std::vector<double> mole_fractions(const std::vector<double>& mass_fractions,
    const std::vector<double>& MolWt) {
  std::vector<double> moles(mass_fractions.size());
  double total = 0.0;
  LOOP_i_N(mass_fractions.size()) {
    moles[i] = mass_fractions[i] / MolWt[i];
    total += moles[i];
  }
  for (auto& m : moles) m /= total;
  return moles;
}

double simple(const std::vector<double>& fractions, const std::vector<double>& values) {
  double sum = 0.0;
  LOOP_i_N(fractions.size()) sum += fractions[i] * values[i];
  return sum;
}

double li_tcm(const std::vector<double>& mole_fractions, const std::vector<double>& Tc,
    const std::vector<double>& Vc) {
  const double denom = simple(mole_fractions, Vc);
  double Tcm = 0.0;
  LOOP_i_N(mole_fractions.size()) {
    const double phi = mole_fractions[i] * Vc[i] / denom;
    Tcm += phi * Tc[i];
  }
  return Tcm;
}

double filippov_cond(const std::vector<double>& mass_fractions, const std::vector<double>& cond) {
  if (mass_fractions.size() != 2 || cond.size() != 2) {
    throw RocketPropsError("mixing::filippov_cond: needs exactly two components");
  }
  const double w1 = mass_fractions[0], w2 = mass_fractions[1];
  const double k1 = cond[0], k2 = cond[1];
  return w1 * k1 + w2 * k2 - 0.72 * w1 * w2 * std::abs(k2 - k1);
}

double dippr9h_cond(const std::vector<double>& mass_fractions, const std::vector<double>& cond) {
  double sum = 0.0;
  LOOP_i_N(mass_fractions.size()) sum += mass_fractions[i] / (cond[i] * cond[i]);
  return 1.0 / std::sqrt(sum);
}

} // namespace mixing

//----------------------------------------------------------------------------

bool is_mixture_name(const std::string& name) {
  const std::string key = common::normalizeName(name);
  double percent;
  return key == "MHF3" || parse_percent(key, "M", percent) || parse_percent(key, "FLOX", percent)
    || parse_percent(key, "MON", percent);
}

MixtureRecipe mixture_recipe(const std::string& name, const SubstanceRegistry& registry) {
  const std::string key = common::normalizeName(name);
  MixtureRecipe recipe;
  recipe.name = key;
  double percent = 0.0;

  if (key == "MHF3" || parse_percent(key, "M", percent)) {
    if (key == "MHF3") percent = 86.0;
    if (percent <= 0.0 || percent >= 100.0) {
      throw UnknownSubstanceError("mixture_recipe: " + name + " needs 0 < %MMH < 100");
    }
    recipe.components = {"MMH", "N2H4"};
    recipe.mass_percent = {percent, 100.0 - percent};
    recipe.Tfreeze = registry.freeze_curve("MMH_N2H4").Tfreeze(percent);
  } else if (parse_percent(key, "FLOX", percent)) {
    if (percent <= 0.0 || percent >= 100.0) {
      throw UnknownSubstanceError("mixture_recipe: " + name + " needs 0 < %F2 < 100");
    }
    recipe.components = {"LF2", "LOX"};
    recipe.mass_percent = {percent, 100.0 - percent};
    const double Tf_F2 = registry.resolve("LF2")->crit.Tfreeze;
    const double Tf_O2 = registry.resolve("LOX")->crit.Tfreeze;
    recipe.Tfreeze = (percent * Tf_F2 + (100.0 - percent) * Tf_O2) / 100.0;
  } else if (parse_percent(key, "MON", percent)) {
    if (percent <= 10.0 || percent >= 25.0) {
      throw UnknownSubstanceError("mixture_recipe: " + name + " is not a MON10/MON25 blend (10 < %NO < 25)");
    }
    const double w25 = (percent - 10.0) / 15.0;
    recipe.components = {"MON10", "MON25"};
    recipe.mass_percent = {100.0 * (1.0 - w25), 100.0 * w25};
    recipe.Tfreeze = registry.freeze_curve("MON").Tfreeze(percent);
  } else {
    throw UnknownSubstanceError("'" + name + "' is not a registered substance or a known mixture "
        "(M<n>, MHF3, FLOX<n>, MON<n>)");
  }
  return recipe;
}

Substance build_mixture(const SubstanceRegistry& registry, const PropertyEvaluator& evaluator,
    const std::string& name) {
  return build_mixture(registry, evaluator, mixture_recipe(name, registry));
}

Substance build_mixture(const SubstanceRegistry& registry, const PropertyEvaluator& evaluator,
    const MixtureRecipe& recipe) {
  const std::size_t n = recipe.components.size();
  if (n < 2 || recipe.mass_percent.size() != n) {
    throw RocketPropsError("build_mixture: " + recipe.name + " needs two or more components");
  }
  const PropertyEvaluator clamp_eval = evaluator.with_policy(DomainPolicy::Clamp);

  std::vector<std::shared_ptr<const Substance>> parts;
  std::vector<double> MolWt, Tc, Vc, Zc, omega, Tref, Pref;
  for (const auto& component : recipe.components) {
    auto part = registry.resolve(component);
    parts.push_back(part);
    MolWt.push_back(part->crit.MolWt);
    Tc.push_back(part->crit.Tc);
    Vc.push_back(part->crit.MolWt / part->crit.SGc); // cm^3/gmole
    Zc.push_back(part->crit.Zc);
    omega.push_back(part->crit.omega);
    Tref.push_back(part->Tref);
    Pref.push_back(part->Pref);
  }

  const double total = mixing::simple(std::vector<double>(n, 1.0), recipe.mass_percent);
  std::vector<double> mass_frac(recipe.mass_percent);
  for (auto& w : mass_frac) w /= total;
  const std::vector<double> mole_frac = mixing::mole_fractions(mass_frac, MolWt);

  Substance mix;
  mix.name = recipe.name;
  mix.data_source = "Mixture Rules";

  fits::CriticalConstants& crit = mix.crit;
  crit.omega = mixing::simple(mole_frac, omega);
  crit.Tc = mixing::li_tcm(mole_frac, Tc, Vc);
  crit.Zc = mixing::simple(mole_frac, Zc);
  crit.MolWt = mixing::simple(mole_frac, MolWt);
  const double Vcm_cc = mixing::simple(mole_frac, Vc);
  const double Vcm = units::convert(Vcm_cc, "cc", "in**3");
  const double R = 18540.0 / 453.59237; // psi-in^3 / (gmole degR)
  crit.Pc = crit.Zc * R * crit.Tc / Vcm;
  crit.SGc = crit.MolWt / Vcm_cc;
  crit.Tfreeze = recipe.Tfreeze;

  mix.Tref = mixing::simple(mole_frac, Tref);
  mix.Pref = mixing::simple(mole_frac, Pref);

  // constituent properties along one temperature, mixed by the blend rules
  auto mixed_at = [&](double T, Property property) {
    std::vector<double> values(n);
    LOOP_i_N(n) values[i] = clamped_property(clamp_eval, *parts[i], property, T);
    switch (property) {
      case Property::LiquidSG: {
        // Amagat volume mixing
        std::vector<double> Vm(n);
        LOOP_i_N(n) Vm[i] = MolWt[i] / values[i];
        return crit.MolWt / mixing::simple(mole_frac, Vm);
      }
      case Property::ThermalConductivity:
        return mixed_cond(mass_frac, values);
      default:
        // Raoult's law for Pvap, mole averages otherwise
        return mixing::simple(mole_frac, values);
    }
  };

  // reference point anchors
  auto reference_anchor = [&](Property property) {
    AnchorPoint anchor;
    anchor.source = "Mixture Rules";
    anchor.rank = 0;
    anchor.T = mix.Tref;
    anchor.P = mix.Pref;
    if (property == Property::SurfaceTension || property == Property::Viscosity) {
      std::vector<double> values(n);
      LOOP_i_N(n) values[i] = clamped_property(clamp_eval, *parts[i], property, mix.Tref);
      anchor.value = mixing::simple(mass_frac, values);
    } else {
      anchor.value = mixed_at(mix.Tref, property);
    }
    return anchor;
  };

  // saturation table
  const double Tlo = crit.Tfreeze;
  const double Thi = std::min(*std::max_element(Tc.begin(), Tc.end()), crit.Tc);
  if (!(Thi > Tlo)) {
    std::ostringstream msg;
    msg << "build_mixture: " << recipe.name << " has no liquid range (Tfreeze = " << Tlo
        << ", Tc = " << Thi << " degR)";
    throw DataError(msg.str());
  }
  const double dT = (Thi - Tlo) / (MIXTURE_SAT_POINTS - 1);

  std::vector<double> trL, tL, pL, SGL, viscL, condL, cpL, hvapL, surfL;
  LOOP_i_N(MIXTURE_SAT_POINTS) {
    const double T = (i == MIXTURE_SAT_POINTS - 1) ? Thi : Tlo + i * dT;
    tL.push_back(T);
    trL.push_back(T / crit.Tc);
    pL.push_back(mixed_at(T, Property::VaporPressure));
    SGL.push_back(mixed_at(T, Property::LiquidSG));
    viscL.push_back(mixed_at(T, Property::Viscosity));
    condL.push_back(mixed_at(T, Property::ThermalConductivity));
    cpL.push_back(mixed_at(T, Property::SpecificHeat));
    hvapL.push_back(mixed_at(T, Property::HeatOfVaporization));
    surfL.push_back(mixed_at(T, Property::SurfaceTension));
  }

  mix.models[Property::VaporPressure] = table_model(trL, pL, true, reference_anchor(Property::VaporPressure));
  mix.models[Property::LiquidSG] = table_model(trL, SGL, false, reference_anchor(Property::LiquidSG));
  mix.models[Property::Viscosity] = table_model(trL, viscL, true, reference_anchor(Property::Viscosity));
  mix.models[Property::ThermalConductivity] = table_model(trL, condL, false,
      reference_anchor(Property::ThermalConductivity));
  mix.models[Property::SpecificHeat] = table_model(trL, cpL, false, reference_anchor(Property::SpecificHeat));
  mix.models[Property::HeatOfVaporization] = table_model(trL, hvapL, false,
      reference_anchor(Property::HeatOfVaporization));
  mix.models[Property::SurfaceTension] = table_model(trL, surfL, false,
      reference_anchor(Property::SurfaceTension));

  PropertyModel vapor;
  vapor.fits.push_back(fits::make_fit(fits::FitKind::PitzerVirial, {}, "Pitzer"));
  vapor.selected = 0;
  mix.models[Property::VaporSG] = vapor;

  // smooth literature-style candidates next to the tables
  mix.models[Property::VaporPressure].fits.push_back(fits::fit_wagner(trL, pL, crit.Pc, "Wagner least squares"));
  mix.models[Property::SpecificHeat].fits.push_back(fits::fit_polynomial(trL, cpL, 3, "Polynomial least squares"));

  // normal boiling point on the Raoult curve
  const fits::CorrelationFit& pvap_table = mix.models[Property::VaporPressure].fits[0];
  const fits::FitParams params(crit);
  auto objFun = [&](double T) {
    return constants::P_REF_PSIA - std::max(0.0, fits::evaluate(pvap_table, T / crit.Tc, params));
  };
  const double f_lo = objFun(tL.front());
  const double f_hi = objFun(tL.back());
  if ((f_lo > 0.0) == (f_hi > 0.0)) {
    throw DataError("build_mixture: " + recipe.name + " normal boiling point is outside of its liquid range");
  }
  const boost::uintmax_t maxit = 200;
  boost::uintmax_t it = maxit;
  boost::math::tools::eps_tolerance<double> tol(40);
  std::pair<double, double> sol = boost::math::tools::toms748_solve(objFun, tL.front(), tL.back(), f_lo, f_hi, tol, it);
  if (it >= maxit) {
    throw std::runtime_error("build_mixture(): max iteration achieved.");
  }
  crit.Tnbp = 0.5 * (sol.first + sol.second);

  std::cout << "Built mixture " << mix.name << ": Tc = " << crit.Tc << " degR, Pc = " << crit.Pc
            << " psia, Tnbp = " << crit.Tnbp << " degR" << std::endl;

  validate_substance(mix);
  return mix;
}

} // namespace rocketprops
