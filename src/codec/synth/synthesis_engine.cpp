#include "synthesis_engine.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "codec/errors.hpp"
#include "utils/logger.hpp"

namespace LPV {

SynthesisEngine::SynthesisEngine(const EncoderConfig& config, uint32_t seed)
    : config(config),
      rng(seed),
      noise(0.0, 1.0),
      history(static_cast<size_t>(config.order > 0 ? config.order : 0), 0.0),
      frame_index(0),
      have_anchor(false),
      pulse_anchor(0.0),
      clamped(0)
{
    this->config.validate();
}

size_t SynthesisEngine::frames_done() const {
    return this->frame_index;
}

size_t SynthesisEngine::clamped_samples() const {
    return this->clamped;
}

double SynthesisEngine::limit(double y) {
    if (!std::isfinite(y)) {
        ++this->clamped;
        return 0.0;
    }
    if (y > kOutputClamp) {
        ++this->clamped;
        return kOutputClamp;
    }
    if (y < -kOutputClamp) {
        ++this->clamped;
        return -kOutputClamp;
    }
    return y;
}

void SynthesisEngine::build_excitation(const EncodedFrame& frame, std::vector<double>& exc) {
    const size_t W = static_cast<size_t>(this->config.window_size);
    const double stride = static_cast<double>(this->config.stride());
    const double origin = static_cast<double>(this->frame_index) * stride;
    exc.assign(W, 0.0);

    if (!frame.voiced()) {
        this->have_anchor = false;
        for (size_t n = 0; n < W; ++n) {
            exc[n] = frame.gain * this->noise(this->rng);
        }
        return;
    }

    double period = static_cast<double>(this->config.sample_rate) / frame.pitch;
    if (period < 1.0) period = 1.0;
    const double amplitude = frame.gain * std::sqrt(period);

    double pos = this->have_anchor ? (this->pulse_anchor + period) : origin;
    while (pos < origin) {
        pos += period;
    }

    double next_anchor = pos - period;
    const double end = origin + static_cast<double>(W);
    for (; pos < end; pos += period) {
        const size_t idx = static_cast<size_t>(std::floor(pos - origin + 0.5));
        if (idx < W) {
            exc[idx] += amplitude;
        }
        if (pos < origin + stride) {
            next_anchor = pos;
        }
    }
    this->pulse_anchor = next_anchor;
    this->have_anchor = true;
}

std::vector<double> SynthesisEngine::excitation(const EncodedFrame& frame) {
    std::vector<double> exc;
    this->build_excitation(frame, exc);
    ++this->frame_index;
    return exc;
}

std::vector<double> SynthesisEngine::synthesize(const EncodedFrame& frame) {
    const size_t expected = static_cast<size_t>(this->config.order) + 1;
    if (frame.coefficients.size() != expected) {
        throw FormatError("frame has " + std::to_string(frame.coefficients.size()) +
                          " coefficients, expected " + std::to_string(expected));
    }

    std::vector<double> exc;
    this->build_excitation(frame, exc);

    const std::vector<double>& c = frame.coefficients;
    const double lead = (c[0] != 0.0) ? c[0] : 1.0;
    const int order = this->config.order;
    const size_t before = this->clamped;

    std::vector<double> out(exc.size());
    for (size_t n = 0; n < exc.size(); ++n) {
        double acc = exc[n];
        for (int k = 1; k <= order; ++k) {
            acc -= c[k] * this->history[k - 1];
        }
        const double y = acc / lead;
        out[n] = this->limit(y);
        if (!std::isfinite(y)) {
            std::fill(this->history.begin(), this->history.end(), 0.0);
            continue;
        }
        // the filter runs on unclamped values, only the emitted sample is limited
        for (int k = order - 1; k > 0; --k) {
            this->history[k] = this->history[k - 1];
        }
        this->history[0] = y;
    }

    if (this->clamped != before) {
        LPV_TRACE_LOG("[synth] frame " << this->frame_index << " clamped "
                      << (this->clamped - before) << " samples\n");
    }
    ++this->frame_index;
    return out;
}

} // namespace LPV
