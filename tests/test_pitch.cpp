#include "codec/pitch/pitch.hpp"
#include "codec/errors.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

const double kTwoPi = 6.28318530717958647692;

std::vector<double> make_tone(size_t n, double freq, double sample_rate, double amplitude) {
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = amplitude * std::sin(kTwoPi * freq * static_cast<double>(i) / sample_rate);
    }
    return out;
}

std::vector<double> make_noise(size_t n) {
    std::vector<double> out(n);
    uint32_t state = 1;
    for (size_t i = 0; i < n; ++i) {
        state = state * 1664525u + 1013904223u;
        out[i] = static_cast<double>(state >> 8) / 16777216.0 - 0.5;
    }
    return out;
}

void check_tone(double freq, int32_t sample_rate, size_t window) {
    LPV::PitchEstimator estimator(sample_rate);
    LPV::PitchResult r = estimator.estimate(make_tone(window, freq, sample_rate, 0.7));
    assert(r.voiced);
    assert(r.pitch > 0.0);
    assert(std::fabs(r.pitch - freq) / freq < 0.05);
    assert(std::fabs(r.pitch - static_cast<double>(sample_rate) / r.lag) < 1e-9);
    std::cout << "Test tone " << freq << "Hz@" << sample_rate << ": lag=" << r.lag
              << " pitch=" << r.pitch << " score=" << r.score << "\n";
}

void test_440_at_8000() {
    LPV::PitchEstimator estimator(8000);
    LPV::PitchResult r = estimator.estimate(make_tone(256, 440.0, 8000.0, 1.0));
    assert(r.voiced);
    assert(r.lag == 18);
    assert(static_cast<int>(r.pitch) == 444);
}

void test_unvoiced() {
    LPV::PitchEstimator estimator(8000);

    LPV::PitchResult noise = estimator.estimate(make_noise(512));
    assert(!noise.voiced);
    assert(noise.pitch == LPV::kUnvoicedPitch);

    LPV::PitchResult silence = estimator.estimate(std::vector<double>(256, 0.0));
    assert(!silence.voiced);
    assert(silence.pitch == -1.0);

    // too short to hold one period of the highest allowed pitch
    LPV::PitchResult tiny = estimator.estimate(make_tone(20, 440.0, 8000.0, 1.0));
    assert(!tiny.voiced);
    assert(tiny.pitch == -1.0);

    LPV::PitchResult empty = estimator.estimate(std::vector<double>());
    assert(!empty.voiced);
}

void test_shortest_lag_wins() {
    // a weak sub-harmonic makes lag 80 correlate slightly better than lag 40
    const size_t n = 480;
    std::vector<double> x = make_tone(n, 200.0, 8000.0, 1.0);
    std::vector<double> sub = make_tone(n, 100.0, 8000.0, 0.1);
    for (size_t i = 0; i < n; ++i) x[i] += sub[i];

    assert(LPV::PitchEstimator::normalized_correlation(x, 80) >
           LPV::PitchEstimator::normalized_correlation(x, 40));

    LPV::PitchEstimator estimator(8000);
    LPV::PitchResult r = estimator.estimate(x);
    assert(r.voiced);
    assert(r.lag == 40);
    assert(std::fabs(r.pitch - 200.0) < 1e-9);

    LPV::PitchConfig strict;
    strict.tie_tolerance = 0.0;
    LPV::PitchEstimator exact(8000, strict);
    LPV::PitchResult r2 = exact.estimate(x);
    assert(r2.voiced);
    assert(r2.lag == 80 || r2.lag == 160);
}

void test_lag_range() {
    LPV::PitchEstimator estimator(8000);
    int lo = 0;
    int hi = 0;
    estimator.lag_range(1024, lo, hi);
    assert(lo == 16);
    assert(hi == 160);
    estimator.lag_range(256, lo, hi);
    assert(hi == 128);

    bool thrown = false;
    try {
        LPV::PitchEstimator bad(0);
    } catch (const LPV::ConfigError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    LPV::PitchConfig inverted;
    inverted.min_hz = 400.0;
    inverted.max_hz = 100.0;
    try {
        LPV::PitchEstimator bad(8000, inverted);
    } catch (const LPV::ConfigError&) {
        thrown = true;
    }
    assert(thrown);
}

} // namespace

void run_pitch_tests() {
    test_440_at_8000();
    check_tone(440.0, 8000, 256);
    check_tone(200.0, 8000, 480);
    check_tone(120.0, 16000, 480);
    check_tone(300.0, 44100, 1323);
    test_unvoiced();
    test_shortest_lag_wins();
    test_lag_range();
    std::cout << "pitch tests ok\n";
}
