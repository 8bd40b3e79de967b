#pragma once
#include <vector>
#include <cstdint>
#include <string>
#include "codec/constants.hpp"
#include "codec/stream/encoded_stream.hpp"

namespace LPV {

class Decoder {
public:
    explicit Decoder(bool crossfade = true, uint32_t seed = kNoiseSeed);

    // Output length is (frames - 1) * stride + window_size; the framer's
    // zero padding is kept.
    AudioSignal decode(const EncodedStream& stream) const;

    AudioSignal decode_file(const std::string& path) const;

private:
    bool crossfade;
    uint32_t seed;
};

} // namespace LPV
