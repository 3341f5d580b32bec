#include "correlation_fit.h"

#include "Common/common.h"

#include <math.h>  // Boost 1.74 pchip.hpp calls unqualified isnan
#include <boost/math/interpolators/pchip.hpp>

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <sstream>

namespace rocketprops {
namespace fits {

namespace {

struct KindEntry {
  FitKind kind;
  const char* name;
  double Tr_min, Tr_max;
};

const KindEntry kind_table[] = {
  {FitKind::Wagner, "Wagner", 0.30, 1.00},
  {FitKind::ClausiusClapeyron, "ClausiusClapeyron", 0.30, 1.00},
  {FitKind::LeeKesler, "LeeKesler", 0.30, 1.00},
  {FitKind::Rackett, "Rackett", 0.25, 1.00},
  {FitKind::PitzerVirial, "PitzerVirial", 0.30, 1.00},
  {FitKind::RowlinsonBondi, "RowlinsonBondi", 0.25, 0.99},
  {FitKind::Polynomial, "Polynomial", 0.00, 1.00},
  {FitKind::Watson, "Watson", 0.25, 1.00},
  {FitKind::PitzerHvap, "PitzerHvap", 0.25, 1.00},
  {FitKind::LewisSquires, "LewisSquires", 0.25, 0.95},
  {FitKind::Andrade, "Andrade", 0.25, 0.90},
  {FitKind::SatoRiedel, "SatoRiedel", 0.25, 1.00},
  {FitKind::PitzerSurface, "PitzerSurface", 0.25, 1.00},
  {FitKind::SaturationTable, "SaturationTable", 0.00, 1.00},
};

const KindEntry& kind_entry(FitKind kind) {
  for (const auto& entry : kind_table) {
    if (entry.kind == kind) return entry;
  }
  throw DataError("fits::kind_entry: unhandled fit kind");
}

const Anchor& require_anchor(const CorrelationFit& fit, const FitParams& params) {
  if (!params.anchor) {
    throw DataError("fits::evaluate: " + fit.name() + " needs an anchor value");
  }
  return *params.anchor;
}

void require_coeffs(const CorrelationFit& fit, std::size_t n) {
  if (fit.coeffs.size() < n) {
    std::ostringstream msg;
    msg << "fits::evaluate: " << fit.name() << " needs " << n << " coefficients, got " << fit.coeffs.size();
    throw DataError(msg.str());
  }
}

// Wagner equation, ln(P/Pc) = (a t + b t^1.5 + c t^e3 + d t^e4)/Tr; (e3, e4) default to (2.5, 5)
double wagner(const CorrelationFit& fit, double Tr, const CriticalConstants& crit) {
  require_coeffs(fit, 4);
  const double e3 = fit.coeffs.size() >= 6 ? fit.coeffs[4] : 2.5;
  const double e4 = fit.coeffs.size() >= 6 ? fit.coeffs[5] : 5.0;
  const double tau = 1.0 - Tr;
  const double sum = fit.coeffs[0] * tau + fit.coeffs[1] * std::pow(tau, 1.5)
    + fit.coeffs[2] * std::pow(tau, e3) + fit.coeffs[3] * std::pow(tau, e4);
  return crit.Pc * std::exp(sum / Tr);
}

// two point (anchor, critical point) fit of ln(P) vs 1/T
double clausius_clapeyron(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const Anchor& a = require_anchor(fit, params);
  if (a.Tr >= 1.0 || a.value <= 0.0) {
    throw DataError("fits::evaluate: ClausiusClapeyron anchor must be below the critical point");
  }
  const double lnPr_a = std::log(a.value / params.crit.Pc);
  return params.crit.Pc * std::exp(lnPr_a * (1.0 / Tr - 1.0) / (1.0 / a.Tr - 1.0));
}

double lee_kesler(double Tr, const CriticalConstants& crit) {
  const double Tr6 = std::pow(Tr, 6);
  const double lnTr = std::log(Tr);
  const double f0 = 5.92714 - 6.09648 / Tr - 1.28862 * lnTr + 0.169347 * Tr6;
  const double f1 = 15.2518 - 15.6875 / Tr - 13.4721 * lnTr + 0.43577 * Tr6;
  return crit.Pc * std::exp(f0 + crit.omega * f1);
}

double rackett(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const CriticalConstants& crit = params.crit;
  double Zra = crit.Zra > 0.0 ? crit.Zra : crit.Zc;
  if (!fit.coeffs.empty()) Zra = fit.coeffs[0];
  if (Zra <= 0.0) throw DataError("fits::evaluate: Rackett needs Zra or Zc");

  const double x = std::pow(1.0 - Tr, 2.0 / 7.0);
  if (params.anchor) {
    const Anchor& a = *params.anchor;
    return a.value * std::pow(Zra, std::pow(1.0 - a.Tr, 2.0 / 7.0) - x);
  }
  // generalized form, rho = Pc MW / (R Tc Zra^(1 + (1-Tr)^2/7))
  const double rho = crit.Pc * crit.MolWt / (constants::R_PSIA_FT3 * crit.Tc) * std::pow(Zra, -(1.0 + x));
  return rho / constants::LBM_PER_FT3_PER_SG;
}

double pitzer_virial(double Tr, const FitParams& params) {
  const CriticalConstants& crit = params.crit;
  if (params.Psat <= 0.0) throw DataError("fits::evaluate: PitzerVirial needs a saturation pressure");
  const double Pr = params.Psat / crit.Pc;
  const double B0 = 0.083 - 0.422 / std::pow(Tr, 1.6);
  const double B1 = 0.139 - 0.172 / std::pow(Tr, 4.2);
  const double Z = 1.0 + (B0 + crit.omega * B1) * Pr / Tr;
  if (Z <= 0.0) {
    throw DomainError("fits::evaluate: PitzerVirial compressibility is not positive", Tr, 0.0, 1.0);
  }
  const double rho = params.Psat * crit.MolWt / (Z * constants::R_PSIA_FT3 * Tr * crit.Tc);
  return rho / constants::LBM_PER_FT3_PER_SG;
}

// (Cp_liq - Cp_ideal)/R
double rowlinson_bondi_departure(double Tr, double omega) {
  const double tau = 1.0 - Tr;
  return 1.586 + 0.49 / tau
    + omega * (4.2775 + 6.3 * std::pow(tau, 1.0 / 3.0) / Tr + 0.4355 / tau);
}

double rowlinson_bondi(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const Anchor& a = require_anchor(fit, params);
  const double omega = params.crit.omega;
  return a.value + constants::R_BTU / params.crit.MolWt
    * (rowlinson_bondi_departure(Tr, omega) - rowlinson_bondi_departure(a.Tr, omega));
}

double polynomial(const CorrelationFit& fit, double Tr) {
  require_coeffs(fit, 1);
  double value = 0.0;
  for (auto it = fit.coeffs.rbegin(); it != fit.coeffs.rend(); ++it) value = value * Tr + *it;
  return value;
}

double watson(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const Anchor& a = require_anchor(fit, params);
  if (a.Tr >= 1.0) throw DataError("fits::evaluate: Watson anchor must be below the critical point");
  return a.value * std::pow((1.0 - Tr) / (1.0 - a.Tr), 0.38);
}

double pitzer_hvap_shape(double Tr, double omega) {
  const double tau = 1.0 - Tr;
  return 7.08 * std::pow(tau, 0.354) + 10.95 * omega * std::pow(tau, 0.456);
}

double pitzer_hvap(double Tr, const FitParams& params) {
  const CriticalConstants& crit = params.crit;
  if (params.anchor) {
    const Anchor& a = *params.anchor;
    const double shape_a = pitzer_hvap_shape(a.Tr, crit.omega);
    if (shape_a <= 0.0) throw DataError("fits::evaluate: PitzerHvap anchor must be below the critical point");
    return a.value * pitzer_hvap_shape(Tr, crit.omega) / shape_a;
  }
  return constants::R_BTU * crit.Tc * pitzer_hvap_shape(Tr, crit.omega) / crit.MolWt;
}

// mu^-0.2661 = mu_a^-0.2661 + (T - T_a)/233 with mu in cP and T in K
double lewis_squires(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const Anchor& a = require_anchor(fit, params);
  const double T_K = Tr * params.crit.Tc / 1.8;
  const double Ta_K = a.Tr * params.crit.Tc / 1.8;
  const double mu_a_cP = a.value * 100.0;
  const double base = std::pow(mu_a_cP, -0.2661) + (T_K - Ta_K) / 233.0;
  if (base <= 0.0) {
    throw DomainError("fits::evaluate: LewisSquires is singular at Tr=" + std::to_string(Tr),
        Tr, fit.Tr_min, fit.Tr_max);
  }
  return std::pow(base, -1.0 / 0.2661) / 100.0;
}

double andrade(const CorrelationFit& fit, double Tr, const CriticalConstants& crit) {
  require_coeffs(fit, 2);
  return std::pow(10.0, fit.coeffs[0] + fit.coeffs[1] / (Tr * crit.Tc));
}

double sato_riedel(const CorrelationFit& fit, double Tr, const FitParams& params) {
  const Anchor& a = require_anchor(fit, params);
  const double num = 3.0 + 20.0 * std::pow(1.0 - Tr, 2.0 / 3.0);
  const double den = 3.0 + 20.0 * std::pow(1.0 - a.Tr, 2.0 / 3.0);
  return a.value * num / den;
}

double pitzer_surface(double Tr, const FitParams& params) {
  const double exponent = 11.0 / 9.0;
  if (params.anchor) {
    const Anchor& a = *params.anchor;
    if (a.Tr >= 1.0) throw DataError("fits::evaluate: PitzerSurface anchor must be below the critical point");
    return a.value * std::pow((1.0 - Tr) / (1.0 - a.Tr), exponent);
  }
  // dyne/cm with Pc in bar and Tc in K
  const CriticalConstants& crit = params.crit;
  const double w = crit.omega;
  const double Pc_bar = crit.Pc / 14.503773773020923;
  const double Tc_K = crit.Tc / 1.8;
  const double sigma = std::pow(Pc_bar, 2.0 / 3.0) * std::pow(Tc_K, 1.0 / 3.0)
    * (1.86 + 1.18 * w) / 19.05 * std::pow((3.75 + 0.91 * w) / (0.291 - 0.08 * w), 2.0 / 3.0)
    * std::pow(1.0 - Tr, exponent);
  return sigma * 1.0e-3 * 0.0254 / 4.4482216152605; // dyne/cm -> lbf/in
}

double saturation_table(const CorrelationFit& fit, double Tr) {
  const std::size_t n = fit.tr_table.size();
  if (n < 2 || n != fit.value_table.size()) {
    throw DataError("fits::evaluate: SaturationTable needs matching Tr and value arrays");
  }
  std::vector<double> x(fit.tr_table);
  std::vector<double> y(fit.value_table);
  if (fit.log10_values) {
    for (auto& v : y) {
      if (v <= 0.0) throw DataError("fits::evaluate: SaturationTable log10 of a non-positive value");
      v = std::log10(v);
    }
  }

  double result;
  if (n >= 4) {
    boost::math::interpolators::pchip<std::vector<double>> spline(std::move(x), std::move(y));
    result = spline(Tr);
  } else {
    auto hi = std::upper_bound(x.begin(), x.end(), Tr);
    std::size_t i = std::min<std::size_t>(std::max<std::ptrdiff_t>(hi - x.begin(), 1), n - 1);
    const double w = (Tr - x[i - 1]) / (x[i] - x[i - 1]);
    result = y[i - 1] + w * (y[i] - y[i - 1]);
  }
  return fit.log10_values ? std::pow(10.0, result) : result;
}

} // namespace

std::string CorrelationFit::name() const {
  return fit_kind_name(this->kind);
}

std::string fit_kind_name(FitKind kind) {
  return kind_entry(kind).name;
}

FitKind parse_fit_kind(const std::string& name) {
  const std::string key = common::normalizeName(name);
  for (const auto& entry : kind_table) {
    if (common::normalizeName(entry.name) == key) return entry.kind;
  }
  throw DataError("fits::parse_fit_kind: unknown correlation '" + name + "'");
}

void default_domain(FitKind kind, double& Tr_min, double& Tr_max) {
  const KindEntry& entry = kind_entry(kind);
  Tr_min = entry.Tr_min;
  Tr_max = entry.Tr_max;
}

bool needs_anchor(FitKind kind) {
  switch (kind) {
    case FitKind::ClausiusClapeyron:
    case FitKind::RowlinsonBondi:
    case FitKind::Watson:
    case FitKind::LewisSquires:
    case FitKind::SatoRiedel:
      return true;
    default:
      return false;
  }
}

bool uses_anchor(FitKind kind) {
  return needs_anchor(kind) || kind == FitKind::Rackett || kind == FitKind::PitzerHvap
    || kind == FitKind::PitzerSurface;
}

CorrelationFit make_fit(FitKind kind, const std::vector<double>& coeffs, const std::string& source) {
  CorrelationFit fit;
  fit.kind = kind;
  fit.coeffs = coeffs;
  fit.source = source;
  default_domain(kind, fit.Tr_min, fit.Tr_max);
  return fit;
}

CorrelationFit make_table_fit(const std::vector<double>& tr, const std::vector<double>& values,
    bool log10_values, const std::string& source) {
  if (tr.size() < 2 || tr.size() != values.size()) {
    throw DataError("fits::make_table_fit: need at least two (Tr, value) pairs");
  }
  for (std::size_t i = 1; i < tr.size(); ++i) {
    if (!(tr[i] > tr[i - 1])) throw DataError("fits::make_table_fit: Tr must be strictly increasing");
  }
  CorrelationFit fit;
  fit.kind = FitKind::SaturationTable;
  fit.source = source;
  fit.tr_table = tr;
  fit.value_table = values;
  fit.log10_values = log10_values;
  fit.Tr_min = tr.front();
  fit.Tr_max = tr.back();
  return fit;
}

double evaluate(const CorrelationFit& fit, double Tr, const FitParams& params) {
  if (!fit.in_domain(Tr) || !(Tr > 0.0)) {
    std::ostringstream msg;
    msg << "fits::evaluate: " << fit.name() << " evaluated at Tr=" << Tr
        << " outside of its domain [" << fit.Tr_min << ", " << fit.Tr_max << "]";
    throw DomainError(msg.str(), Tr, fit.Tr_min, fit.Tr_max);
  }

  switch (fit.kind) {
    case FitKind::Wagner: return wagner(fit, Tr, params.crit);
    case FitKind::ClausiusClapeyron: return clausius_clapeyron(fit, Tr, params);
    case FitKind::LeeKesler: return lee_kesler(Tr, params.crit);
    case FitKind::Rackett: return rackett(fit, Tr, params);
    case FitKind::PitzerVirial: return pitzer_virial(Tr, params);
    case FitKind::RowlinsonBondi: return rowlinson_bondi(fit, Tr, params);
    case FitKind::Polynomial: return polynomial(fit, Tr);
    case FitKind::Watson: return watson(fit, Tr, params);
    case FitKind::PitzerHvap: return pitzer_hvap(Tr, params);
    case FitKind::LewisSquires: return lewis_squires(fit, Tr, params);
    case FitKind::Andrade: return andrade(fit, Tr, params.crit);
    case FitKind::SatoRiedel: return sato_riedel(fit, Tr, params);
    case FitKind::PitzerSurface: return pitzer_surface(Tr, params);
    case FitKind::SaturationTable: return saturation_table(fit, Tr);
  }
  throw DataError("fits::evaluate: unhandled fit kind");
}

double costald_compressed_sg(double SGsat, double Tr, double P, double Psat, const CriticalConstants& crit) {
  if (P <= Psat) return SGsat;
  if (!(Tr <= COSTALD_TR_MAX)) {
    std::ostringstream msg;
    msg << "fits::costald_compressed_sg: Tr=" << Tr << " above the COSTALD limit " << COSTALD_TR_MAX;
    throw DomainError(msg.str(), Tr, 0.0, COSTALD_TR_MAX);
  }

  const double a = -9.070217, b = 62.45326, d = -135.1102;
  const double f = 4.79594, g = 0.250047, h = 1.14188;
  const double j = 0.0861488, k = 0.0344483;
  const double w = crit.omega;

  const double tau = 1.0 - Tr;
  const double e = std::exp(f + g * w + h * w * w);
  const double c = j + k * w;
  const double beta = crit.Pc * (-1.0 + a * std::pow(tau, 1.0 / 3.0) + b * std::pow(tau, 2.0 / 3.0)
      + d * tau + e * std::pow(tau, 4.0 / 3.0));
  if (!std::isfinite(beta) || beta + Psat <= 0.0) {
    throw DomainError("fits::costald_compressed_sg: B + Psat is not positive at Tr=" + std::to_string(Tr),
        Tr, 0.0, COSTALD_TR_MAX);
  }
  const double denom = 1.0 - c * std::log((beta + P) / (beta + Psat));
  if (!std::isfinite(denom) || denom <= 0.0) {
    throw DomainError("fits::costald_compressed_sg: correction is singular at Tr=" + std::to_string(Tr),
        Tr, 0.0, COSTALD_TR_MAX);
  }
  return SGsat / denom;
}

} // namespace fits
} // namespace rocketprops
