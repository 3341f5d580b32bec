#ifndef ROCKETPROPS_COMMON_MACROS_H
#define ROCKETPROPS_COMMON_MACROS_H
// Common loop macros
#define LOOP_k_N(N) for (int k = 0; k < static_cast<int>(N); ++k)
#define LOOP_i_N(N) for (int i = 0; i < static_cast<int>(N); ++i)

#define SQR(a) ((a)*(a))

#endif // ROCKETPROPS_COMMON_MACROS_H
