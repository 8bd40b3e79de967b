#include "encoded_stream.hpp"
#include <cmath>
#include <string>
#include "codec/errors.hpp"

namespace LPV {

void EncodedStream::validate() const {
    this->encoder_info.validate();
    const size_t expected = static_cast<size_t>(this->encoder_info.order) + 1;
    for (size_t i = 0; i < this->frames.size(); ++i) {
        const EncodedFrame& f = this->frames[i];
        if (f.coefficients.size() != expected) {
            throw FormatError("frame " + std::to_string(i) + " has " +
                              std::to_string(f.coefficients.size()) +
                              " coefficients, expected " + std::to_string(expected));
        }
        if (!std::isfinite(f.gain) || f.gain < 0.0) {
            throw FormatError("frame " + std::to_string(i) + " has invalid gain");
        }
        if (!std::isfinite(f.pitch)) {
            throw FormatError("frame " + std::to_string(i) + " has non-finite pitch");
        }
        for (double c : f.coefficients) {
            if (!std::isfinite(c)) {
                throw FormatError("frame " + std::to_string(i) + " has non-finite coefficient");
            }
        }
    }
}

} // namespace LPV
