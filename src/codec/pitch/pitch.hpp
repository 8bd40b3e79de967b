#pragma once
#include <cstdint>
#include <vector>
#include "codec/constants.hpp"

namespace LPV {

struct PitchConfig {
    double min_hz = kMinPitchHz;
    double max_hz = kMaxPitchHz;
    double voicing_threshold = kVoicingThreshold;
    double tie_tolerance = kPitchTieTolerance;
};

struct PitchResult {
    double pitch = kUnvoicedPitch; // Hz
    int lag = 0;
    double score = 0.0;
    bool voiced = false;
};

class PitchEstimator {
public:
    explicit PitchEstimator(int32_t sample_rate, PitchConfig config = PitchConfig());

    PitchResult estimate(const std::vector<double>& frame) const;

    // lag search bounds for a frame of the given length; min > max means
    // the frame is too short to hold a single period
    void lag_range(size_t frame_size, int& min_lag, int& max_lag) const;

    static double normalized_correlation(const std::vector<double>& frame, int lag);

private:
    int32_t sample_rate;
    PitchConfig config;
};

} // namespace LPV
