#include "curve_fitting.h"

#include "Common/common.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace rocketprops {
namespace fits {

CorrelationFit fit_wagner(const std::vector<double>& Tr, const std::vector<double>& Pvap,
    double Pc, const std::string& source) {
  if (Tr.size() != Pvap.size()) throw DataError("fits::fit_wagner: Tr and Pvap differ in length");

  // Tr ln(P/Pc) = a t + b t^1.5 + c t^2.5 + d t^5 is linear in (a, b, c, d)
  std::vector<int> rows;
  LOOP_i_N(Tr.size()) {
    if (Tr[i] < 1.0 && Pvap[i] > 0.0) rows.push_back(i);
  }
  if (rows.size() < 4) throw DataError("fits::fit_wagner: need at least four points below Tc");

  Eigen::MatrixXd A(rows.size(), 4);
  Eigen::VectorXd b(rows.size());
  LOOP_k_N(rows.size()) {
    const int i = rows[k];
    const double tau = 1.0 - Tr[i];
    A(k, 0) = tau;
    A(k, 1) = std::pow(tau, 1.5);
    A(k, 2) = std::pow(tau, 2.5);
    A(k, 3) = std::pow(tau, 5.0);
    b(k) = Tr[i] * std::log(Pvap[i] / Pc);
  }
  Eigen::VectorXd x = A.colPivHouseholderQr().solve(b);

  CorrelationFit fit = make_fit(FitKind::Wagner, {x(0), x(1), x(2), x(3)}, source);
  double Tr_lo = Tr[rows.front()];
  for (int i : rows) Tr_lo = std::min(Tr_lo, Tr[i]);
  fit.Tr_min = Tr_lo;
  return fit;
}

CorrelationFit fit_polynomial(const std::vector<double>& Tr, const std::vector<double>& values,
    int order, const std::string& source) {
  if (Tr.size() != values.size()) throw DataError("fits::fit_polynomial: Tr and values differ in length");
  if (order < 0 || static_cast<int>(Tr.size()) < order + 1) {
    throw DataError("fits::fit_polynomial: not enough points for the requested order");
  }

  Eigen::MatrixXd A(Tr.size(), order + 1);
  Eigen::VectorXd b(Tr.size());
  LOOP_i_N(Tr.size()) {
    double p = 1.0;
    LOOP_k_N(order + 1) {
      A(i, k) = p;
      p *= Tr[i];
    }
    b(i) = values[i];
  }
  Eigen::VectorXd x = A.colPivHouseholderQr().solve(b);

  std::vector<double> coeffs(x.data(), x.data() + x.size());
  CorrelationFit fit = make_fit(FitKind::Polynomial, coeffs, source);
  fit.Tr_min = *std::min_element(Tr.begin(), Tr.end());
  fit.Tr_max = *std::max_element(Tr.begin(), Tr.end());
  return fit;
}

double rms_relative_error(const CorrelationFit& fit, const std::vector<double>& Tr,
    const std::vector<double>& values, const FitParams& params) {
  if (Tr.empty() || Tr.size() != values.size()) throw DataError("fits::rms_relative_error: bad input");
  double sum = 0.0;
  LOOP_i_N(Tr.size()) {
    const double rel = (evaluate(fit, Tr[i], params) - values[i]) / values[i];
    sum += rel * rel;
  }
  return std::sqrt(sum / Tr.size());
}

} // namespace fits
} // namespace rocketprops
