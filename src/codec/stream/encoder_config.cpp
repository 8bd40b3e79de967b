#include "encoder_config.hpp"
#include <sstream>
#include "codec/errors.hpp"

namespace LPV {

int32_t EncoderConfig::default_window_size(int32_t sample_rate) {
    if (sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive, got " + std::to_string(sample_rate));
    }
    const int64_t samples = static_cast<int64_t>(sample_rate) * kDefaultFrameMs / 1000;
    return static_cast<int32_t>(samples > 0 ? samples : 1);
}

EncoderConfig EncoderConfig::defaults_for(int32_t sample_rate) {
    EncoderConfig cfg;
    cfg.sample_rate = sample_rate;
    cfg.window_size = default_window_size(sample_rate);
    return cfg;
}

void EncoderConfig::validate() const {
    if (this->order <= 0) {
        throw ConfigError("order must be positive, got " + std::to_string(this->order));
    }
    if (this->window_size <= 0) {
        throw ConfigError("window_size must be positive, got " + std::to_string(this->window_size));
    }
    if (this->overlap < 0) {
        throw ConfigError("overlap must be non-negative, got " + std::to_string(this->overlap));
    }
    if (this->overlap >= this->window_size) {
        throw ConfigError("overlap (" + std::to_string(this->overlap) +
                          ") must be smaller than window_size (" +
                          std::to_string(this->window_size) + ")");
    }
    if (this->sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive, got " + std::to_string(this->sample_rate));
    }
}

std::string describe(const EncoderConfig& cfg) {
    std::ostringstream ss;
    ss << "order=" << cfg.order
       << " window=" << cfg.window_size
       << " overlap=" << cfg.overlap
       << " sr=" << cfg.sample_rate;
    return ss.str();
}

} // namespace LPV
