#pragma once
#include <cstdint>
#include <string>

namespace LPV {

struct EncoderConfig {
    static constexpr int32_t kDefaultOrder = 10;
    static constexpr int32_t kDefaultOverlap = 50;
    static constexpr int32_t kDefaultFrameMs = 30;

    int32_t order = kDefaultOrder;
    int32_t window_size = 0;
    int32_t overlap = kDefaultOverlap;
    int32_t sample_rate = 0;

    static int32_t default_window_size(int32_t sample_rate);
    static EncoderConfig defaults_for(int32_t sample_rate);

    int32_t stride() const { return this->window_size - this->overlap; }

    // throws ConfigError
    void validate() const;

    bool operator==(const EncoderConfig& other) const {
        return this->order == other.order &&
               this->window_size == other.window_size &&
               this->overlap == other.overlap &&
               this->sample_rate == other.sample_rate;
    }
    bool operator!=(const EncoderConfig& other) const { return !(*this == other); }
};

std::string describe(const EncoderConfig& cfg);

} // namespace LPV
