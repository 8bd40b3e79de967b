#pragma once
#include <cstdint>
#include <vector>
#include "codec/constants.hpp"
#include "codec/stream/encoder_config.hpp"

namespace LPV {

struct AudioSignal {
    std::vector<double> samples;
    int32_t sample_rate = 0;
};

struct EncodedFrame {
    double pitch = kUnvoicedPitch; // Hz, or kUnvoicedPitch
    double gain = 0.0;
    std::vector<double> coefficients; // [1, c1..c_order], synthesis is 1 / A(z)

    bool voiced() const { return this->pitch > 0.0; }
};

struct EncodedStream {
    EncoderConfig encoder_info;
    std::vector<EncodedFrame> frames;

    // throws ConfigError for a bad header, FormatError for a frame that
    // does not fit it
    void validate() const;
};

} // namespace LPV
