#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include "codec/stream/encoded_stream.hpp"

namespace LPV {

// Drives 1 / A(z) with a pulse train or white noise, one window per frame.
// Filter memory and pulse phase carry from frame to frame, so one instance
// serves exactly one decode and frames must arrive in order.
class SynthesisEngine {
public:
    explicit SynthesisEngine(const EncoderConfig& config, uint32_t seed = kNoiseSeed);

    std::vector<double> synthesize(const EncodedFrame& frame);

    // excitation of the next frame without running the filter; advances
    // the same state synthesize() does
    std::vector<double> excitation(const EncodedFrame& frame);

    size_t frames_done() const;
    size_t clamped_samples() const;

private:
    EncoderConfig config;
    std::mt19937 rng;
    std::normal_distribution<double> noise;
    std::vector<double> history;   // y[n-1], y[n-2], ..., y[n-order]
    size_t frame_index;
    bool have_anchor;
    double pulse_anchor;           // absolute position of the last pulse before the next origin
    size_t clamped;

    void build_excitation(const EncodedFrame& frame, std::vector<double>& exc);
    double limit(double y);
};

} // namespace LPV
