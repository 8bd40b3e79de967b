#include "overlap.hpp"
#include <string>
#include "codec/errors.hpp"

namespace LPV {

OverlapReconstructor::OverlapReconstructor(int32_t window_size, int32_t overlap, bool crossfade)
    : window(0),
      overlap(0),
      crossfade(crossfade),
      count(0)
{
    if (window_size <= 0 || overlap < 0 || overlap >= window_size) {
        throw ConfigError("overlap-add needs 0 <= overlap < window_size, got window=" +
                          std::to_string(window_size) + " overlap=" + std::to_string(overlap));
    }
    this->window = static_cast<size_t>(window_size);
    this->overlap = static_cast<size_t>(overlap);

    this->fade_in.resize(this->overlap);
    for (size_t j = 0; j < this->overlap; ++j) {
        this->fade_in[j] = static_cast<double>(j + 1) / static_cast<double>(this->overlap + 1);
    }
}

size_t OverlapReconstructor::segments() const {
    return this->count;
}

size_t OverlapReconstructor::length() const {
    return this->output.size();
}

void OverlapReconstructor::push(const std::vector<double>& segment) {
    if (segment.size() != this->window) {
        throw FormatError("segment of " + std::to_string(segment.size()) +
                          " samples, expected " + std::to_string(this->window));
    }

    if (this->count == 0) {
        this->output.assign(segment.begin(), segment.end());
        ++this->count;
        return;
    }

    const size_t start = this->output.size() - this->overlap;
    for (size_t j = 0; j < this->overlap; ++j) {
        double& dst = this->output[start + j];
        if (this->crossfade) {
            const double w = this->fade_in[j];
            dst = dst * (1.0 - w) + segment[j] * w;
        } else {
            dst += segment[j];
        }
    }
    this->output.insert(this->output.end(),
                        segment.begin() + static_cast<std::ptrdiff_t>(this->overlap),
                        segment.end());
    ++this->count;
}

std::vector<double> OverlapReconstructor::finish() {
    std::vector<double> out;
    out.swap(this->output);
    this->count = 0;
    return out;
}

std::vector<double> OverlapReconstructor::assemble(const std::vector<std::vector<double>>& segments,
                                                   int32_t window_size,
                                                   int32_t overlap,
                                                   bool crossfade) {
    OverlapReconstructor ola(window_size, overlap, crossfade);
    for (const auto& seg : segments) {
        ola.push(seg);
    }
    return ola.finish();
}

} // namespace LPV
