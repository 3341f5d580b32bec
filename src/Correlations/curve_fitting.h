#ifndef ROCKETPROPS_CURVE_FITTING_H
#define ROCKETPROPS_CURVE_FITTING_H

#include "Correlations/correlation_fit.h"

#include <vector>

namespace rocketprops {
namespace fits {

// \brief: least squares Wagner (2.5, 5) coefficients through (Tr, Pvap) points
//         points at Tr >= 1 are skipped; needs at least four usable points
CorrelationFit fit_wagner(const std::vector<double>& Tr, const std::vector<double>& Pvap,
    double Pc, const std::string& source = "least squares");

// \brief: least squares polynomial sum c_i Tr^i of the given order
CorrelationFit fit_polynomial(const std::vector<double>& Tr, const std::vector<double>& values,
    int order, const std::string& source = "least squares");

// \brief: root mean square of the relative deviation of fit from the points
double rms_relative_error(const CorrelationFit& fit, const std::vector<double>& Tr,
    const std::vector<double>& values, const FitParams& params);

} // namespace fits
} // namespace rocketprops

#endif // ROCKETPROPS_CURVE_FITTING_H
