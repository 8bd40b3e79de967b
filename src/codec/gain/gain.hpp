#pragma once
#include <vector>

namespace LPV {

class Gain {
public:
    // sqrt of the mean residual power after inverse filtering with coeffs,
    // skipping the first order samples where the predictor has no history
    static double estimate(const std::vector<double>& frame,
                           const std::vector<double>& coeffs);
};

} // namespace LPV
