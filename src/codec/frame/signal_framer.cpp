#include "signal_framer.hpp"
#include <algorithm>
#include <string>
#include "codec/errors.hpp"

namespace LPV {

SignalFramer::SignalFramer(const AudioSignal& signal, int32_t window_size, int32_t overlap)
    : signal(signal),
      window(0),
      hop(0),
      cursor(0)
{
    if (window_size <= 0) {
        throw ConfigError("window_size must be positive, got " + std::to_string(window_size));
    }
    if (overlap < 0 || overlap >= window_size) {
        throw ConfigError("overlap must be in [0, " + std::to_string(window_size) +
                          "), got " + std::to_string(overlap));
    }
    this->window = static_cast<size_t>(window_size);
    this->hop = static_cast<size_t>(window_size - overlap);
}

size_t SignalFramer::frame_count() const {
    const size_t n = this->signal.samples.size();
    return (n + this->hop - 1) / this->hop;
}

size_t SignalFramer::window_size() const {
    return this->window;
}

size_t SignalFramer::stride() const {
    return this->hop;
}

std::vector<double> SignalFramer::window_at(size_t index) const {
    std::vector<double> out(this->window, 0.0);
    const std::vector<double>& samples = this->signal.samples;
    const size_t start = index * this->hop;
    if (start >= samples.size()) return out;
    const size_t available = std::min(this->window, samples.size() - start);
    std::copy(samples.begin() + static_cast<std::ptrdiff_t>(start),
              samples.begin() + static_cast<std::ptrdiff_t>(start + available),
              out.begin());
    return out;
}

bool SignalFramer::next(std::vector<double>& out) {
    if (this->cursor >= this->frame_count()) return false;
    out = this->window_at(this->cursor);
    ++this->cursor;
    return true;
}

void SignalFramer::reset() {
    this->cursor = 0;
}

size_t SignalFramer::position() const {
    return this->cursor;
}

} // namespace LPV
