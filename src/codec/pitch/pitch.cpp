#include "pitch.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "codec/errors.hpp"

namespace LPV {

PitchEstimator::PitchEstimator(int32_t sample_rate, PitchConfig config)
    : sample_rate(sample_rate),
      config(config)
{
    if (sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive, got " + std::to_string(sample_rate));
    }
    if (config.min_hz <= 0.0 || config.max_hz <= config.min_hz) {
        throw ConfigError("pitch range must satisfy 0 < min_hz < max_hz");
    }
    if (config.tie_tolerance < 0.0) {
        throw ConfigError("pitch tie tolerance must be non-negative");
    }
}

void PitchEstimator::lag_range(size_t frame_size, int& min_lag, int& max_lag) const {
    const double sr = static_cast<double>(this->sample_rate);
    min_lag = std::max(2, static_cast<int>(std::floor(sr / this->config.max_hz)));
    max_lag = static_cast<int>(std::ceil(sr / this->config.min_hz));
    max_lag = std::min(max_lag, static_cast<int>(frame_size / 2));
}

double PitchEstimator::normalized_correlation(const std::vector<double>& frame, int lag) {
    const size_t N = frame.size();
    if (lag <= 0 || static_cast<size_t>(lag) >= N) return 0.0;

    double cross = 0.0;
    double e0 = 0.0;
    double e1 = 0.0;
    for (size_t n = 0; n + lag < N; ++n) {
        const double a = frame[n];
        const double b = frame[n + lag];
        cross += a * b;
        e0 += a * a;
        e1 += b * b;
    }
    const double denom = std::sqrt(e0 * e1);
    if (denom <= 0.0) return 0.0;
    return cross / denom;
}

PitchResult PitchEstimator::estimate(const std::vector<double>& frame) const {
    PitchResult result;
    const size_t N = frame.size();
    if (N == 0) return result;

    double energy = 0.0;
    for (double v : frame) energy += v * v;
    if (energy / static_cast<double>(N) <= kSilenceEnergy) {
        return result;
    }

    int min_lag = 0;
    int max_lag = 0;
    this->lag_range(N, min_lag, max_lag);
    if (min_lag > max_lag) return result;

    // scores[i] holds lag (min_lag - 1 + i) so every candidate has both neighbours
    std::vector<double> scores(static_cast<size_t>(max_lag - min_lag + 3));
    for (int lag = min_lag - 1; lag <= max_lag + 1; ++lag) {
        scores[lag - min_lag + 1] = normalized_correlation(frame, lag);
    }

    std::vector<int> peaks;
    double best = -1.0;
    for (int lag = min_lag; lag <= max_lag; ++lag) {
        const size_t i = static_cast<size_t>(lag - min_lag + 1);
        if (scores[i] > scores[i - 1] && scores[i] >= scores[i + 1]) {
            peaks.push_back(lag);
            best = std::max(best, scores[i]);
        }
    }
    if (peaks.empty() || best < this->config.voicing_threshold) {
        result.score = std::max(best, 0.0);
        return result;
    }

    // shortest lag close enough to the best wins, against octave errors
    for (int lag : peaks) {
        const double s = scores[static_cast<size_t>(lag - min_lag + 1)];
        if (s >= best - this->config.tie_tolerance) {
            result.lag = lag;
            result.score = s;
            break;
        }
    }
    result.voiced = true;
    result.pitch = static_cast<double>(this->sample_rate) / static_cast<double>(result.lag);
    return result;
}

} // namespace LPV
