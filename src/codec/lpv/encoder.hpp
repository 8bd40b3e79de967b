#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include "codec/pitch/pitch.hpp"
#include "codec/stream/encoded_stream.hpp"

namespace LPV {

class Encoder {
public:
    explicit Encoder(const EncoderConfig& config, const PitchConfig& pitch_config = PitchConfig());

    const EncoderConfig& config() const;

    // signal.sample_rate must match the configured rate
    EncodedStream encode(const AudioSignal& signal) const;

    // one window of window_size samples
    EncodedFrame analyze_frame(const std::vector<double>& window) const;

    void set_parallel(bool enabled);

private:
    EncoderConfig cfg;
    PitchEstimator pitch;
    bool parallel;
};

} // namespace LPV
