#include "gain.hpp"
#include <cmath>
#include "codec/lpc/lpc.hpp"

namespace LPV {

double Gain::estimate(const std::vector<double>& frame,
                      const std::vector<double>& coeffs) {
    if (frame.empty()) return 0.0;

    std::vector<double> residual;
    LPC::compute_residual(frame, coeffs, residual);

    // the first taps samples are predicted from missing history
    const size_t taps = coeffs.empty() ? 0 : coeffs.size() - 1;
    const size_t start = (residual.size() > taps) ? taps : 0;

    double power = 0.0;
    for (size_t n = start; n < residual.size(); ++n) {
        power += residual[n] * residual[n];
    }
    power /= static_cast<double>(residual.size() - start);
    if (!(power > 0.0)) return 0.0;
    return std::sqrt(power);
}

} // namespace LPV
