#pragma once
#include <cstddef>
#include <vector>
#include "codec/stream/encoded_stream.hpp"

namespace LPV {

// Cuts a signal into windows of window_size samples, advancing by
// window_size - overlap. A frame starts at every stride multiple below the
// signal length; the tail of the last one is zero-padded.
// The signal must outlive the framer.
class SignalFramer {
public:
    SignalFramer(const AudioSignal& signal, int32_t window_size, int32_t overlap);

    size_t frame_count() const;
    size_t window_size() const;
    size_t stride() const;

    // random access, does not touch the cursor
    std::vector<double> window_at(size_t index) const;

    // sequential cursor
    bool next(std::vector<double>& out);
    void reset();
    size_t position() const;

private:
    const AudioSignal& signal;
    size_t window;
    size_t hop;
    size_t cursor;
};

} // namespace LPV
