#include "encoder.hpp"
#include <algorithm>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include "codec/errors.hpp"
#include "codec/frame/signal_framer.hpp"
#include "codec/gain/gain.hpp"
#include "codec/lpc/lpc.hpp"
#include "utils/logger.hpp"

namespace {
constexpr size_t kMinFramesPerTask = 16;

struct FrameRange {
    size_t start;
    size_t count;
};

const LPV::EncoderConfig& checked(const LPV::EncoderConfig& config) {
    config.validate();
    return config;
}
}

namespace LPV {

Encoder::Encoder(const EncoderConfig& config, const PitchConfig& pitch_config)
    : cfg(checked(config)),
      pitch(config.sample_rate, pitch_config),
      parallel(true)
{
}

const EncoderConfig& Encoder::config() const {
    return this->cfg;
}

void Encoder::set_parallel(bool enabled) {
    this->parallel = enabled;
}

EncodedFrame Encoder::analyze_frame(const std::vector<double>& window) const {
    EncodedFrame frame;

    LPC lpc(this->cfg.order);
    LpcResult lpc_result = lpc.analyze(window);
    frame.coefficients = std::move(lpc_result.coeffs);

    if (lpc_result.silent) {
        frame.gain = 0.0;
        frame.pitch = kUnvoicedPitch;
        return frame;
    }

    frame.gain = Gain::estimate(window, frame.coefficients);

    frame.pitch = this->pitch.estimate(window).pitch;
    return frame;
}

EncodedStream Encoder::encode(const AudioSignal& signal) const {
    if (signal.sample_rate != this->cfg.sample_rate) {
        throw ConfigError("signal sample rate " + std::to_string(signal.sample_rate) +
                          " does not match encoder sample rate " +
                          std::to_string(this->cfg.sample_rate));
    }

    const SignalFramer framer(signal, this->cfg.window_size, this->cfg.overlap);
    const size_t total = framer.frame_count();

    EncodedStream stream;
    stream.encoder_info = this->cfg;
    stream.frames.resize(total);
    if (total == 0) {
        return stream;
    }

    const unsigned hw = std::thread::hardware_concurrency();
    size_t workers = (this->parallel && hw > 1) ? hw : 1;
    workers = std::max<size_t>(1, std::min(workers, (total + kMinFramesPerTask - 1) / kMinFramesPerTask));

    std::vector<FrameRange> ranges;
    const size_t per_task = (total + workers - 1) / workers;
    for (size_t start = 0; start < total; start += per_task) {
        ranges.push_back({start, std::min(per_task, total - start)});
    }

    auto launch_policy = (ranges.size() > 1)
        ? std::launch::async
        : std::launch::deferred;

    std::vector<std::future<void>> tasks;
    tasks.reserve(ranges.size());
    for (const auto& range : ranges) {
        tasks.emplace_back(std::async(
            launch_policy,
            [this, &framer, &stream, range]() {
                for (size_t i = range.start; i < range.start + range.count; ++i) {
                    stream.frames[i] = this->analyze_frame(framer.window_at(i));
                }
            }
        ));
    }
    for (auto& task : tasks) {
        task.get();
    }

    for (size_t i = 0; i < total; ++i) {
        const EncodedFrame& f = stream.frames[i];
        LPV_TRACE_LOG("[enc] frame=" << i << " pitch=" << f.pitch << " gain=" << f.gain << "\n");
    }
    return stream;
}

} // namespace LPV
