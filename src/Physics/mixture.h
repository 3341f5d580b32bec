#ifndef ROCKETPROPS_MIXTURE_H
#define ROCKETPROPS_MIXTURE_H

#include "Data/registry.h"
#include "Physics/property_evaluator.h"

#include <string>
#include <vector>

namespace rocketprops {

// \brief: which registered substances a named blend is made of
struct MixtureRecipe {
  std::string name;
  std::vector<std::string> components;
  std::vector<double> mass_percent;  // normalized by the builder
  double Tfreeze = 0.0;              // degR
};

// number of saturation points tabulated for a blend
const int MIXTURE_SAT_POINTS = 21;

// \brief: true for names of the form M<n>, MHF3, FLOX<n>, MON<n>
bool is_mixture_name(const std::string& name);

// \brief: recipe of M<n> (n % MMH in N2H4), MHF3 (86 % MMH), FLOX<n> (n % F2 in LOX)
//         and MON<n> with 10 < n < 25 (MON10 + MON25 blend)
//         throws UnknownSubstanceError for anything else
MixtureRecipe mixture_recipe(const std::string& name, const SubstanceRegistry& registry);

// \brief: Substance record of a blend; constituents are evaluated with the Clamp policy
Substance build_mixture(const SubstanceRegistry& registry, const PropertyEvaluator& evaluator,
    const std::string& name);
Substance build_mixture(const SubstanceRegistry& registry, const PropertyEvaluator& evaluator,
    const MixtureRecipe& recipe);

namespace mixing {

std::vector<double> mole_fractions(const std::vector<double>& mass_fractions,
    const std::vector<double>& MolWt);

// sum x_i v_i
double simple(const std::vector<double>& fractions, const std::vector<double>& values);

// Li rule for the critical temperature of a mixture
double li_tcm(const std::vector<double>& mole_fractions, const std::vector<double>& Tc,
    const std::vector<double>& Vc);

// binary liquid thermal conductivity, mass fractions
double filippov_cond(const std::vector<double>& mass_fractions, const std::vector<double>& cond);

// DIPPR 9H multicomponent liquid thermal conductivity, mass fractions
double dippr9h_cond(const std::vector<double>& mass_fractions, const std::vector<double>& cond);

} // namespace mixing

} // namespace rocketprops

#endif // ROCKETPROPS_MIXTURE_H
