#ifndef ROCKETPROPS_COMMON_H
#define ROCKETPROPS_COMMON_H

#include "Common/common_macros.h"
#include "Common/common_string_operations.h"
#include "Common/errors.h"

namespace rocketprops {
namespace constants {

// default reference state
const double T_REF_DEGR = 527.67; // 68 degF
const double P_REF_PSIA = 14.6959;

// universal gas constant
const double R_PSIA_FT3 = 10.731577089; // psia ft^3 / (lbmole degR)
const double R_BTU = 1.98588;           // BTU / (lbmole degR)

// density of water at SG = 1 (1000 kg/m^3)
const double LBM_PER_FT3_PER_SG = 1000.0 / 0.45359237 * 0.3048 * 0.3048 * 0.3048;

const double GC = 32.174049; // lbm ft / (lbf s^2)
const double PI = 3.14159265358979323846;

// poise -> lbm/ft-s
const double POISE_TO_LBM_FT_S = 0.1 * 0.3048 / 0.45359237;

} // namespace constants
} // namespace rocketprops

#endif // ROCKETPROPS_COMMON_H
