#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/stream/encoded_stream.hpp"

namespace LPV {

// Binary layout (little-endian, no padding):
//   int32 window_size, int32 sample_rate, int32 overlap, int32 order
//   per frame: f64 gain, f64 pitch, f64 coefficients[order + 1]
//
// Structured layout:
//   {"encoder_info": {"order", "window_size", "overlap", "sample_rate"},
//    "frames": [{"pitch", "gain", "coefficients": [...]}, ...]}
class FrameCodec {
public:
    static size_t frame_bytes(int32_t order);

    static std::vector<uint8_t> to_binary(const EncodedStream& stream);
    static EncodedStream from_binary(const uint8_t* data, size_t size);
    static EncodedStream from_binary(const std::vector<uint8_t>& data);

    static nlohmann::json to_json(const EncodedStream& stream);
    static EncodedStream from_json(const nlohmann::json& doc);

    static void save_binary(const std::string& path, const EncodedStream& stream);
    static EncodedStream load_binary(const std::string& path);

    static void save_json(const std::string& path, const EncodedStream& stream, int indent = 2);
    static EncodedStream load_json(const std::string& path);
};

} // namespace LPV
