#include "lpc.hpp"
#include <cmath>
#include <string>
#include "codec/constants.hpp"
#include "codec/errors.hpp"

namespace LPV {

LPC::LPC(int order)
    : order(order)
{
    if (order <= 0) {
        throw ConfigError("LPC order must be positive, got " + std::to_string(order));
    }
}

int LPC::get_order() const {
    return this->order;
}

void LPC::apply_hamming(const std::vector<double>& frame, std::vector<double>& out) {
    const size_t N = frame.size();
    out.resize(N);
    if (N == 1) {
        out[0] = frame[0];
        return;
    }
    const double two_pi = 6.28318530717958647692;
    for (size_t n = 0; n < N; ++n) {
        const double w = 0.54 - 0.46 * std::cos(two_pi * static_cast<double>(n) /
                                                 static_cast<double>(N - 1));
        out[n] = frame[n] * w;
    }
}

void LPC::autocorrelation(const std::vector<double>& frame,
                          int max_lag,
                          std::vector<double>& R) {
    const size_t N = frame.size();
    R.assign(static_cast<size_t>(max_lag) + 1, 0.0);
    for (int k = 0; k <= max_lag; ++k) {
        double sum = 0.0;
        for (size_t n = static_cast<size_t>(k); n < N; ++n) {
            sum += frame[n] * frame[n - k];
        }
        R[k] = sum;
    }
}

void LPC::levinson_durbin(const std::vector<double>& R, LpcResult& out) const {
    std::vector<double> a(this->order + 1, 0.0);
    std::vector<double> prevA(this->order + 1, 0.0);
    out.reflection.assign(this->order, 0.0);

    double E = R[0];
    const double floor = R[0] * kMinPredictionError;

    for (int i = 1; i <= this->order; ++i) {
        if (E <= floor) {
            break;
        }

        double acc = 0.0;
        for (int j = 1; j < i; ++j) {
            acc += prevA[j] * R[i - j];
        }

        double K = (R[i] - acc) / E;
        if (std::fabs(K) > kMaxReflection) {
            if (std::fabs(K) >= 1.0) ++out.clamped;
            K = (K > 0.0) ? kMaxReflection : -kMaxReflection;
        }

        a[i] = K;
        for (int j = 1; j < i; ++j) {
            a[j] = prevA[j] - K * prevA[i - j];
        }
        for (int j = 1; j <= i; ++j) {
            prevA[j] = a[j];
        }

        out.reflection[i - 1] = -K;
        E = (1.0 - K * K) * E;
    }

    out.coeffs.assign(this->order + 1, 0.0);
    out.coeffs[0] = 1.0;
    for (int i = 1; i <= this->order; ++i) {
        out.coeffs[i] = -a[i];
    }
    out.error_power = (E > 0.0) ? E : 0.0;
}

LpcResult LPC::analyze(const std::vector<double>& frame) const {
    LpcResult result;

    std::vector<double> windowed;
    apply_hamming(frame, windowed);

    std::vector<double> R;
    autocorrelation(windowed, this->order, R);
    if (!std::isfinite(R[0])) {
        throw NumericalError("autocorrelation is not finite (frame contains NaN or Inf)");
    }

    const double mean_square = frame.empty() ? 0.0 : R[0] / static_cast<double>(frame.size());
    if (mean_square <= kSilenceEnergy) {
        result.coeffs.assign(this->order + 1, 0.0);
        result.coeffs[0] = 1.0;
        result.reflection.assign(this->order, 0.0);
        result.error_power = 0.0;
        result.silent = true;
        return result;
    }

    this->levinson_durbin(R, result);
    return result;
}

void LPC::compute_residual(const std::vector<double>& frame,
                           const std::vector<double>& coeffs,
                           std::vector<double>& residual) {
    const size_t N = frame.size();
    const int taps = static_cast<int>(coeffs.size()) - 1;
    residual.resize(N);

    for (size_t n = 0; n < N; ++n) {
        double acc = frame[n] * (coeffs.empty() ? 1.0 : coeffs[0]);
        for (int i = 1; i <= taps; ++i) {
            if (n >= static_cast<size_t>(i)) {
                acc += coeffs[i] * frame[n - i];
            }
        }
        residual[n] = acc;
    }
}

bool LPC::reflection_from_coefficients(const std::vector<double>& coeffs,
                                       std::vector<double>& k_out) {
    const int p = static_cast<int>(coeffs.size()) - 1;
    k_out.assign(p > 0 ? p : 0, 0.0);
    if (p <= 0) return true;

    const double lead = coeffs[0];
    if (lead == 0.0 || !std::isfinite(lead)) return false;

    std::vector<double> cur(p + 1);
    for (int i = 0; i <= p; ++i) {
        cur[i] = coeffs[i] / lead;
    }

    std::vector<double> prev(p + 1);
    for (int i = p; i >= 1; --i) {
        const double k = cur[i];
        k_out[i - 1] = k;
        if (!std::isfinite(k) || std::fabs(k) >= 1.0) {
            return false;
        }
        const double denom = 1.0 - k * k;
        for (int j = 1; j < i; ++j) {
            prev[j] = (cur[j] - k * cur[i - j]) / denom;
        }
        for (int j = 1; j < i; ++j) {
            cur[j] = prev[j];
        }
    }
    return true;
}

} // namespace LPV
