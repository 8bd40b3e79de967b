#pragma once
#include <cstddef>
#include <cstdint>

namespace LPV {

constexpr double kUnvoicedPitch = -1.0;

// pitch search
constexpr double kMinPitchHz = 50.0;
constexpr double kMaxPitchHz = 500.0;
constexpr double kVoicingThreshold = 0.45;
constexpr double kPitchTieTolerance = 0.05;

// analysis numerics
constexpr double kMaxReflection = 0.999;
constexpr double kMinPredictionError = 1e-12; // relative to R[0]
constexpr double kSilenceEnergy = 1e-10;      // mean square

// synthesis
constexpr double kOutputClamp = 1.0;
constexpr uint32_t kNoiseSeed = 0x4C5056u; // "LPV"

// binary layout
constexpr size_t kHeaderBytes = 4 * sizeof(int32_t);

}
