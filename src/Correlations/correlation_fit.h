#ifndef ROCKETPROPS_CORRELATION_FIT_H
#define ROCKETPROPS_CORRELATION_FIT_H

#include <optional>
#include <string>
#include <vector>

namespace rocketprops {
namespace fits {

// -----------------------------------------------------------------------------
// Closed-form property correlations in reduced temperature Tr = T/Tc.
//
// Every fit returns its property in the internal unit system
// (psia, SG, poise, BTU/hr-ft-delF, BTU/lbm-delF, BTU/lbm, lbf/in) and takes
// the substance critical constants plus, where the correlation is a scaling
// law, one anchor value (Tr_a, value_a) that the curve is forced through.
// -----------------------------------------------------------------------------

enum class FitKind {
  Wagner,             // vapor pressure, fitted coefficients
  ClausiusClapeyron,  // vapor pressure, anchor + critical point
  LeeKesler,          // vapor pressure, acentric factor
  Rackett,            // saturated liquid SG
  PitzerVirial,       // saturated vapor SG, truncated virial
  RowlinsonBondi,     // liquid heat capacity
  Polynomial,         // any property, sum c_i Tr^i
  Watson,             // heat of vaporization
  PitzerHvap,         // heat of vaporization, acentric factor
  LewisSquires,       // liquid viscosity
  Andrade,            // liquid viscosity, log10(visc) = A + B/T
  SatoRiedel,         // liquid thermal conductivity
  PitzerSurface,      // surface tension, Curl-Pitzer corresponding states
  SaturationTable     // any property, interpolated saturation table
};

struct CriticalConstants {
  double Tc = 0.0;      // degR
  double Pc = 0.0;      // psia
  double SGc = 0.0;     // critical specific gravity
  double Zc = 0.0;      // critical compressibility
  double Zra = 0.0;     // Rackett compressibility (0 -> use Zc)
  double Tnbp = 0.0;    // normal boiling point, degR
  double Tfreeze = 0.0; // degR
  double omega = 0.0;   // acentric factor
  double MolWt = 0.0;   // g/gmole
};

struct Anchor {
  double Tr;
  double value;
};

// \brief: everything a fit may need besides Tr
struct FitParams {
  explicit FitParams(const CriticalConstants& crit_in) : crit(crit_in) {}
  FitParams(const CriticalConstants& crit_in, const Anchor& anchor_in)
    : crit(crit_in), anchor(anchor_in) {}

  const CriticalConstants& crit;
  std::optional<Anchor> anchor;
  double Psat = 0.0; // psia, only used by PitzerVirial
};

// tagged variant; one struct for every fit kind, interpreted by evaluate()
struct CorrelationFit {
  FitKind kind = FitKind::Polynomial;
  std::string source;           // provenance label, e.g. "Poling 5th Ed."
  std::vector<double> coeffs;
  double Tr_min = 0.0;
  double Tr_max = 1.0;

  // SaturationTable only
  std::vector<double> tr_table;
  std::vector<double> value_table;
  bool log10_values = false;    // interpolate log10(value)

  std::string name() const;
  bool in_domain(double Tr) const { return Tr >= this->Tr_min && Tr <= this->Tr_max; }
};

// \brief: fit with the default domain of its kind
CorrelationFit make_fit(FitKind kind, const std::vector<double>& coeffs = {}, const std::string& source = "");
CorrelationFit make_table_fit(const std::vector<double>& tr, const std::vector<double>& values,
    bool log10_values, const std::string& source = "");

// \brief: evaluate fit at reduced temperature Tr
//         throws DomainError outside [Tr_min, Tr_max] and DataError on missing parameters
double evaluate(const CorrelationFit& fit, double Tr, const FitParams& params);

std::string fit_kind_name(FitKind kind);
FitKind parse_fit_kind(const std::string& name);
void default_domain(FitKind kind, double& Tr_min, double& Tr_max);

// \brief: true when the kind cannot be evaluated without an anchor
bool needs_anchor(FitKind kind);
// \brief: true when the kind uses an anchor if one is supplied
bool uses_anchor(FitKind kind);

// COSTALD (Thomson-Brobst-Hankinson) compressed liquid SG from saturated SG.
// Above Tr = COSTALD_TR_MAX the B parameter turns negative and the correction
// throws DomainError when P > Psat.
const double COSTALD_TR_MAX = 0.95;
double costald_compressed_sg(double SGsat, double Tr, double P, double Psat, const CriticalConstants& crit);

} // namespace fits
} // namespace rocketprops

#endif // ROCKETPROPS_CORRELATION_FIT_H
