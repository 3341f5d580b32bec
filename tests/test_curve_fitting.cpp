#include <gtest/gtest.h>

#include "Common/errors.h"
#include "Correlations/curve_fitting.h"

#include <cmath>
#include <vector>

using namespace rocketprops;
using namespace rocketprops::fits;

TEST(CurveFitting, WagnerRecoversCoefficients) {
  CriticalConstants crit;
  crit.Tc = 925.056;
  crit.Pc = 891.69;
  const CorrelationFit truth = make_fit(FitKind::Wagner, {-8.68587, 1.17831, -4.87620, 1.58820});

  std::vector<double> tr, pvap;
  for (int i = 0; i <= 12; ++i) {
    tr.push_back(0.35 + 0.05 * i);
    pvap.push_back(evaluate(truth, tr.back(), FitParams(crit)));
  }
  // the critical point itself is skipped
  tr.push_back(1.0);
  pvap.push_back(crit.Pc);

  const CorrelationFit fit = fit_wagner(tr, pvap, crit.Pc, "test");
  ASSERT_EQ(fit.kind, FitKind::Wagner);
  ASSERT_EQ(fit.coeffs.size(), 4u);
  for (int k = 0; k < 4; ++k) EXPECT_NEAR(fit.coeffs[k], truth.coeffs[k], 1e-4);
  EXPECT_DOUBLE_EQ(fit.Tr_min, 0.35);
  EXPECT_EQ(fit.source, "test");
  EXPECT_LT(rms_relative_error(fit, tr, pvap, FitParams(crit)), 1e-8);
}

TEST(CurveFitting, WagnerNeedsFourSubcriticalPoints) {
  EXPECT_THROW(fit_wagner({0.5, 0.6, 0.7, 1.0}, {1.0, 2.0, 4.0, 100.0}, 100.0), DataError);
  EXPECT_THROW(fit_wagner({0.5, 0.6}, {1.0}, 100.0), DataError);
}

TEST(CurveFitting, PolynomialIsExactForItsOrder) {
  std::vector<double> tr, values;
  for (int i = 0; i < 8; ++i) {
    const double x = 0.3 + 0.1 * i;
    tr.push_back(x);
    values.push_back(1.0 + 2.0 * x + 3.0 * x * x);
  }
  const CorrelationFit fit = fit_polynomial(tr, values, 2);
  ASSERT_EQ(fit.coeffs.size(), 3u);
  EXPECT_NEAR(fit.coeffs[0], 1.0, 1e-9);
  EXPECT_NEAR(fit.coeffs[1], 2.0, 1e-9);
  EXPECT_NEAR(fit.coeffs[2], 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(fit.Tr_min, 0.3);
  EXPECT_NEAR(fit.Tr_max, 1.0, 1e-12);

  CriticalConstants crit;
  EXPECT_LT(rms_relative_error(fit, tr, values, FitParams(crit)), 1e-10);
}

TEST(CurveFitting, PolynomialNeedsEnoughPoints) {
  EXPECT_THROW(fit_polynomial({0.3, 0.4}, {1.0, 2.0}, 2), DataError);
  EXPECT_THROW(fit_polynomial({0.3, 0.4, 0.5}, {1.0, 2.0}, 1), DataError);
}
