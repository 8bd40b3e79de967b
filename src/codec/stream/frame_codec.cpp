#include "frame_codec.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>
#include "codec/bytestream/byte_reader.hpp"
#include "codec/bytestream/byte_writer.hpp"
#include "codec/errors.hpp"
#include "utils/logger.hpp"

namespace LPV {
namespace {

void check_header(const EncoderConfig& cfg) {
    if (cfg.window_size <= 0) {
        throw FormatError("window_size must be positive, got " + std::to_string(cfg.window_size));
    }
    if (cfg.sample_rate <= 0) {
        throw FormatError("sample_rate must be positive, got " + std::to_string(cfg.sample_rate));
    }
    if (cfg.overlap < 0) {
        throw FormatError("overlap must be non-negative, got " + std::to_string(cfg.overlap));
    }
    if (cfg.order <= 0) {
        throw FormatError("order must be positive, got " + std::to_string(cfg.order));
    }
    if (cfg.overlap >= cfg.window_size) {
        throw FormatError("overlap " + std::to_string(cfg.overlap) +
                          " is not smaller than window_size " + std::to_string(cfg.window_size));
    }
}

int32_t read_int_field(const nlohmann::json& obj, const char* key) {
    const nlohmann::json& v = obj.at(key);
    if (!v.is_number_integer()) {
        throw FormatError(std::string("encoder_info.") + key + " must be an integer");
    }
    const int64_t value = v.get<int64_t>();
    if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
        throw FormatError(std::string("encoder_info.") + key + " does not fit in 32 bits");
    }
    return static_cast<int32_t>(value);
}

double read_number_field(const nlohmann::json& obj, const char* key, size_t frame) {
    const nlohmann::json& v = obj.at(key);
    if (!v.is_number()) {
        throw FormatError("frame " + std::to_string(frame) + ": " + key + " must be a number");
    }
    return v.get<double>();
}

} // namespace

size_t FrameCodec::frame_bytes(int32_t order) {
    return (2 + static_cast<size_t>(order) + 1) * sizeof(double);
}

std::vector<uint8_t> FrameCodec::to_binary(const EncodedStream& stream) {
    stream.validate();
    const EncoderConfig& cfg = stream.encoder_info;

    ByteWriter writer;
    writer.reserve(kHeaderBytes + stream.frames.size() * frame_bytes(cfg.order));
    writer.write_i32_le(cfg.window_size);
    writer.write_i32_le(cfg.sample_rate);
    writer.write_i32_le(cfg.overlap);
    writer.write_i32_le(cfg.order);

    for (const EncodedFrame& frame : stream.frames) {
        writer.write_f64_le(frame.gain);
        writer.write_f64_le(frame.pitch);
        for (double c : frame.coefficients) {
            writer.write_f64_le(c);
        }
    }
    return writer.get_buffer();
}

EncodedStream FrameCodec::from_binary(const uint8_t* data, size_t size) {
    if (size < kHeaderBytes) {
        throw FormatError("stream of " + std::to_string(size) + " bytes is shorter than the header");
    }

    ByteReader reader(data, size);
    EncodedStream stream;
    EncoderConfig& cfg = stream.encoder_info;
    cfg.window_size = reader.read_i32_le();
    cfg.sample_rate = reader.read_i32_le();
    cfg.overlap = reader.read_i32_le();
    cfg.order = reader.read_i32_le();
    check_header(cfg);

    const size_t per_frame = frame_bytes(cfg.order);
    const size_t payload = reader.bytes_remaining();
    if (payload % per_frame != 0) {
        throw FormatError("payload of " + std::to_string(payload) +
                          " bytes is not a multiple of the " + std::to_string(per_frame) +
                          "-byte frame size");
    }

    const size_t count = payload / per_frame;
    stream.frames.resize(count);
    for (size_t i = 0; i < count; ++i) {
        EncodedFrame& frame = stream.frames[i];
        frame.gain = reader.read_f64_le();
        frame.pitch = reader.read_f64_le();
        frame.coefficients.resize(static_cast<size_t>(cfg.order) + 1);
        for (double& c : frame.coefficients) {
            c = reader.read_f64_le();
        }
    }
    if (reader.has_error() || !reader.eof()) {
        throw FormatError("frame payload ended unexpectedly");
    }

    stream.validate();
    LPV_TRACE_LOG("[codec] binary " << describe(cfg) << " frames=" << count << "\n");
    return stream;
}

EncodedStream FrameCodec::from_binary(const std::vector<uint8_t>& data) {
    return from_binary(data.data(), data.size());
}

nlohmann::json FrameCodec::to_json(const EncodedStream& stream) {
    stream.validate();
    const EncoderConfig& cfg = stream.encoder_info;

    nlohmann::json doc;
    doc["encoder_info"] = {
        {"order", cfg.order},
        {"window_size", cfg.window_size},
        {"overlap", cfg.overlap},
        {"sample_rate", cfg.sample_rate}
    };
    doc["frames"] = nlohmann::json::array();
    for (const EncodedFrame& frame : stream.frames) {
        doc["frames"].push_back({
            {"pitch", frame.pitch},
            {"gain", frame.gain},
            {"coefficients", frame.coefficients}
        });
    }
    return doc;
}

EncodedStream FrameCodec::from_json(const nlohmann::json& doc) {
    EncodedStream stream;
    try {
        if (!doc.is_object()) {
            throw FormatError("document must be an object");
        }
        const nlohmann::json& info = doc.at("encoder_info");
        if (!info.is_object()) {
            throw FormatError("encoder_info must be an object");
        }
        EncoderConfig& cfg = stream.encoder_info;
        cfg.order = read_int_field(info, "order");
        cfg.window_size = read_int_field(info, "window_size");
        cfg.overlap = read_int_field(info, "overlap");
        cfg.sample_rate = read_int_field(info, "sample_rate");
        check_header(cfg);

        const nlohmann::json& frames = doc.at("frames");
        if (!frames.is_array()) {
            throw FormatError("frames must be an array");
        }
        stream.frames.reserve(frames.size());
        for (size_t i = 0; i < frames.size(); ++i) {
            const nlohmann::json& item = frames[i];
            if (!item.is_object()) {
                throw FormatError("frame " + std::to_string(i) + " must be an object");
            }
            EncodedFrame frame;
            frame.pitch = read_number_field(item, "pitch", i);
            frame.gain = read_number_field(item, "gain", i);
            const nlohmann::json& coeffs = item.at("coefficients");
            if (!coeffs.is_array()) {
                throw FormatError("frame " + std::to_string(i) + ": coefficients must be an array");
            }
            frame.coefficients.reserve(coeffs.size());
            for (const nlohmann::json& c : coeffs) {
                if (!c.is_number()) {
                    throw FormatError("frame " + std::to_string(i) + ": coefficient is not a number");
                }
                frame.coefficients.push_back(c.get<double>());
            }
            stream.frames.push_back(std::move(frame));
        }
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(e.what());
    }

    stream.validate();
    return stream;
}

void FrameCodec::save_binary(const std::string& path, const EncodedStream& stream) {
    const std::vector<uint8_t> bytes = to_binary(stream);
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw IoError("cannot open " + path + " for writing");
    }
    if (!bytes.empty()) {
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!f.good()) {
        throw IoError("write to " + path + " failed");
    }
}

EncodedStream FrameCodec::load_binary(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw IoError("cannot open " + path);
    }
    f.seekg(0, std::ios::end);
    const std::streamsize size = f.tellg();
    if (size < 0) {
        throw IoError("cannot determine size of " + path);
    }
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0) {
        f.read(reinterpret_cast<char*>(data.data()), size);
        if (f.gcount() != size) {
            throw IoError("short read from " + path);
        }
    }
    return from_binary(data);
}

void FrameCodec::save_json(const std::string& path, const EncodedStream& stream, int indent) {
    const std::string text = to_json(stream).dump(indent);
    std::ofstream f(path);
    if (!f) {
        throw IoError("cannot open " + path + " for writing");
    }
    f << text << "\n";
    if (!f.good()) {
        throw IoError("write to " + path + " failed");
    }
}

EncodedStream FrameCodec::load_json(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw IoError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw IoError("read from " + path + " failed");
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError(e.what());
    }
    return from_json(doc);
}

} // namespace LPV
