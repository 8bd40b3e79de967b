#include "wav_io.hpp"
#include <cmath>
#include <cstring>
#include <fstream>
#include "codec/errors.hpp"

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t read_u16_le(std::ifstream& f) {
    uint8_t b[2] = {0, 0};
    f.read(reinterpret_cast<char*>(b), 2);
    return static_cast<uint16_t>(b[0] | (static_cast<uint16_t>(b[1]) << 8));
}

uint32_t read_u32_le(std::ifstream& f) {
    uint8_t b[4] = {0, 0, 0, 0};
    f.read(reinterpret_cast<char*>(b), 4);
    return static_cast<uint32_t>(b[0] |
                                 (static_cast<uint32_t>(b[1]) << 8) |
                                 (static_cast<uint32_t>(b[2]) << 16) |
                                 (static_cast<uint32_t>(b[3]) << 24));
}

void write_u16_le(std::ofstream& f, uint16_t v) {
    uint8_t b[2] = { static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF) };
    f.write(reinterpret_cast<const char*>(b), 2);
}

void write_u32_le(std::ofstream& f, uint32_t v) {
    uint8_t b[4] = {
        static_cast<uint8_t>(v & 0xFF),
        static_cast<uint8_t>((v >> 8) & 0xFF),
        static_cast<uint8_t>((v >> 16) & 0xFF),
        static_cast<uint8_t>((v >> 24) & 0xFF)
    };
    f.write(reinterpret_cast<const char*>(b), 4);
}

bool is_supported(uint16_t format, uint16_t bits) {
    if (format == kFormatPcm) return bits == 16 || bits == 24 || bits == 32;
    if (format == kFormatFloat) return bits == 32;
    return false;
}

double read_sample(const uint8_t*& p, uint16_t format, uint16_t bits) {
    if (format == kFormatFloat) {
        uint32_t u = static_cast<uint32_t>(p[0]) |
                     (static_cast<uint32_t>(p[1]) << 8) |
                     (static_cast<uint32_t>(p[2]) << 16) |
                     (static_cast<uint32_t>(p[3]) << 24);
        p += 4;
        float v = 0.0f;
        static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 binary32 expected");
        std::memcpy(&v, &u, sizeof(v));
        return static_cast<double>(v);
    }
    if (bits == 16) {
        int32_t s = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                         (static_cast<uint32_t>(p[1]) << 8));
        p += 2;
        if (s & 0x8000) s |= ~0xFFFF;
        return static_cast<double>(s) / 32768.0;
    }
    if (bits == 24) {
        int32_t s = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                         (static_cast<uint32_t>(p[1]) << 8) |
                                         (static_cast<uint32_t>(p[2]) << 16));
        p += 3;
        if (s & 0x800000) s |= ~0xFFFFFF;
        return static_cast<double>(s) / 8388608.0;
    }
    uint32_t u = static_cast<uint32_t>(p[0]) |
                 (static_cast<uint32_t>(p[1]) << 8) |
                 (static_cast<uint32_t>(p[2]) << 16) |
                 (static_cast<uint32_t>(p[3]) << 24);
    p += 4;
    return static_cast<double>(static_cast<int32_t>(u)) / 2147483648.0;
}

int16_t to_pcm16(double v) {
    if (!std::isfinite(v)) return 0;
    double scaled = std::round(v * 32768.0);
    if (scaled > 32767.0) scaled = 32767.0;
    if (scaled < -32768.0) scaled = -32768.0;
    return static_cast<int16_t>(scaled);
}

} // namespace

bool read_wav(const std::string& path,
              std::vector<double>& samples,
              int32_t& sample_rate,
              uint16_t& channels) {
    samples.clear();
    sample_rate = 0;
    channels = 0;

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;

    char riff[4];
    f.read(riff, 4);
    if (f.gcount() != 4 || std::string(riff, 4) != "RIFF") return false;
    (void)read_u32_le(f);
    char wave[4];
    f.read(wave, 4);
    if (f.gcount() != 4 || std::string(wave, 4) != "WAVE") return false;

    bool got_fmt = false;
    bool got_data = false;
    uint16_t fmt_format = 0;
    uint16_t fmt_bits = 0;
    uint16_t fmt_block_align = 0;
    uint32_t fmt_rate = 0;

    while (f && !got_data) {
        char chunk_id[4];
        f.read(chunk_id, 4);
        if (f.gcount() != 4) break;
        uint32_t chunk_size = read_u32_le(f);

        if (std::string(chunk_id, 4) == "fmt ") {
            if (chunk_size < 16) return false;
            fmt_format = read_u16_le(f);
            channels = read_u16_le(f);
            fmt_rate = read_u32_le(f);
            (void)read_u32_le(f); // byte rate
            fmt_block_align = read_u16_le(f);
            fmt_bits = read_u16_le(f);
            uint32_t consumed = 16;
            if (fmt_format == kFormatExtensible && chunk_size >= 26) {
                (void)read_u16_le(f); // cbSize
                (void)read_u16_le(f); // valid bits
                (void)read_u32_le(f); // channel mask
                fmt_format = read_u16_le(f); // leading bytes of the sub-format GUID
                consumed = 26;
            }
            if (chunk_size > consumed) {
                f.seekg(static_cast<std::streamoff>(chunk_size - consumed), std::ios::cur);
            }
            got_fmt = true;
        } else if (std::string(chunk_id, 4) == "data") {
            if (!got_fmt) return false;
            if (!is_supported(fmt_format, fmt_bits)) return false;
            if (channels == 0) return false;
            if (fmt_rate == 0 || fmt_rate > 0x7FFFFFFFu) return false;
            const uint16_t bytes_per_sample = static_cast<uint16_t>(fmt_bits / 8);
            if (fmt_block_align != channels * bytes_per_sample) return false;
            if (chunk_size % fmt_block_align != 0) return false;

            std::vector<char> raw(chunk_size);
            f.read(raw.data(), static_cast<std::streamsize>(chunk_size));
            if (f.gcount() != static_cast<std::streamsize>(chunk_size)) return false;

            const size_t frames = chunk_size / fmt_block_align;
            samples.resize(frames);
            const uint8_t* p = reinterpret_cast<const uint8_t*>(raw.data());
            for (size_t i = 0; i < frames; ++i) {
                double acc = 0.0;
                for (uint16_t ch = 0; ch < channels; ++ch) {
                    acc += read_sample(p, fmt_format, fmt_bits);
                }
                samples[i] = acc / static_cast<double>(channels);
            }
            sample_rate = static_cast<int32_t>(fmt_rate);
            got_data = true;
        } else {
            f.seekg(static_cast<std::streamoff>(chunk_size), std::ios::cur);
        }

        if (chunk_size % 2 == 1 && f) f.seekg(1, std::ios::cur);
    }

    return got_fmt && got_data;
}

bool write_wav(const std::string& path,
               const std::vector<double>& samples,
               int32_t sample_rate) {
    if (sample_rate <= 0) return false;

    const uint32_t frames = static_cast<uint32_t>(samples.size());
    const uint16_t block_align = 2;
    const uint32_t data_size = frames * block_align;
    const uint32_t riff_size = 36 + data_size;

    std::ofstream f(path, std::ios::binary);
    if (!f) return false;

    f.write("RIFF", 4);
    write_u32_le(f, riff_size);
    f.write("WAVE", 4);

    f.write("fmt ", 4);
    write_u32_le(f, 16);
    write_u16_le(f, kFormatPcm);
    write_u16_le(f, 1);
    write_u32_le(f, static_cast<uint32_t>(sample_rate));
    write_u32_le(f, static_cast<uint32_t>(sample_rate) * block_align);
    write_u16_le(f, block_align);
    write_u16_le(f, 16);

    f.write("data", 4);
    write_u32_le(f, data_size);

    for (double v : samples) {
        write_u16_le(f, static_cast<uint16_t>(to_pcm16(v)));
    }

    return f.good();
}

LoadedAudio load_audio(const std::string& path, int32_t window_size, int32_t overlap) {
    LoadedAudio out;
    uint16_t channels = 0;
    if (!read_wav(path, out.signal.samples, out.signal.sample_rate, channels)) {
        throw LPV::IoError("cannot read WAV file " + path);
    }
    out.window_size = (window_size > 0)
        ? window_size
        : LPV::EncoderConfig::default_window_size(out.signal.sample_rate);
    out.overlap = (overlap >= 0) ? overlap : LPV::EncoderConfig::kDefaultOverlap;
    return out;
}

void save_audio(const std::string& path, const LPV::AudioSignal& signal) {
    if (!write_wav(path, signal.samples, signal.sample_rate)) {
        throw LPV::IoError("cannot write WAV file " + path);
    }
}
