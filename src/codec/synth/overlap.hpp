#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace LPV {

class OverlapReconstructor {
public:
    OverlapReconstructor(int32_t window_size, int32_t overlap, bool crossfade = true);

    // segments must be exactly window_size long
    void push(const std::vector<double>& segment);

    size_t segments() const;
    size_t length() const;

    std::vector<double> finish();

    static std::vector<double> assemble(const std::vector<std::vector<double>>& segments,
                                        int32_t window_size,
                                        int32_t overlap,
                                        bool crossfade = true);

private:
    size_t window;
    size_t overlap;
    bool crossfade;
    size_t count;
    std::vector<double> fade_in;
    std::vector<double> output;
};

} // namespace LPV
