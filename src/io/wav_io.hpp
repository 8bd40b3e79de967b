#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "codec/stream/encoded_stream.hpp"

// Multi-channel input is averaged to mono; samples land in [-1, 1).
bool read_wav(const std::string& path,
              std::vector<double>& samples,
              int32_t& sample_rate,
              uint16_t& channels);

// 16-bit PCM mono, clipped
bool write_wav(const std::string& path,
               const std::vector<double>& samples,
               int32_t sample_rate);

struct LoadedAudio {
    LPV::AudioSignal signal;
    int32_t window_size = 0;
    int32_t overlap = 0;
};

// window_size <= 0 picks the 30 ms default, overlap < 0 picks the default
// overlap. Throws LPV::IoError if the file cannot be read.
LoadedAudio load_audio(const std::string& path, int32_t window_size = 0, int32_t overlap = -1);

// Throws LPV::IoError.
void save_audio(const std::string& path, const LPV::AudioSignal& signal);
