#include "codec/synth/synthesis_engine.hpp"
#include "codec/synth/overlap.hpp"
#include "codec/lpv/decoder.hpp"
#include "codec/errors.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

LPV::EncoderConfig make_config(int32_t order, int32_t window, int32_t overlap) {
    LPV::EncoderConfig cfg;
    cfg.order = order;
    cfg.window_size = window;
    cfg.overlap = overlap;
    cfg.sample_rate = 8000;
    return cfg;
}

LPV::EncodedFrame identity_frame(int32_t order, double pitch, double gain) {
    LPV::EncodedFrame f;
    f.pitch = pitch;
    f.gain = gain;
    f.coefficients.assign(static_cast<size_t>(order) + 1, 0.0);
    f.coefficients[0] = 1.0;
    return f;
}

std::vector<size_t> nonzero_positions(const std::vector<double>& v) {
    std::vector<size_t> out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (v[i] != 0.0) out.push_back(i);
    }
    return out;
}

bool any_nonzero(const std::vector<double>& v) {
    for (double s : v) {
        if (s != 0.0) return true;
    }
    return false;
}

void test_unvoiced_noise() {
    LPV::SynthesisEngine engine(make_config(10, 256, 50));
    std::vector<double> out = engine.synthesize(identity_frame(10, -1.0, 0.5));
    assert(out.size() == 256);
    assert(any_nonzero(out));
    double power = 0.0;
    for (double s : out) {
        assert(std::isfinite(s));
        assert(std::fabs(s) <= LPV::kOutputClamp);
        power += s * s;
    }
    power /= static_cast<double>(out.size());
    // 0.5 * unit-variance noise
    assert(power > 0.1 && power < 0.5);
}

void test_pulse_phase_continues() {
    LPV::SynthesisEngine engine(make_config(2, 100, 50));
    const double gain = 0.1;
    const double amplitude = gain * std::sqrt(20.0);

    std::vector<double> f0 = engine.synthesize(identity_frame(2, 400.0, gain));
    std::vector<double> f1 = engine.synthesize(identity_frame(2, 400.0, gain));
    assert((nonzero_positions(f0) == std::vector<size_t>{0, 20, 40, 60, 80}));
    // frame 1 starts 50 samples later on the same pulse grid
    assert((nonzero_positions(f1) == std::vector<size_t>{10, 30, 50, 70, 90}));
    assert(std::fabs(f0[0] - amplitude) < 1e-12);
    assert(std::fabs(f1[10] - amplitude) < 1e-12);

    // an unvoiced frame drops the grid, the next voiced frame starts at its origin
    (void)engine.synthesize(identity_frame(2, -1.0, 0.0));
    std::vector<double> f3 = engine.synthesize(identity_frame(2, 400.0, gain));
    assert(nonzero_positions(f3).front() == 0);
    assert(engine.frames_done() == 4);
}

void test_excitation_matches_synthesis() {
    LPV::SynthesisEngine a(make_config(4, 120, 40));
    LPV::SynthesisEngine b(make_config(4, 120, 40));
    const double pitches[] = {160.0, 170.0, -1.0, 250.0};
    for (double p : pitches) {
        std::vector<double> exc = a.excitation(identity_frame(4, p, 0.05));
        std::vector<double> out = b.synthesize(identity_frame(4, p, 0.05));
        assert(exc == out);
    }
}

void test_filter_memory_carries() {
    LPV::SynthesisEngine engine(make_config(1, 64, 16));
    LPV::EncodedFrame excited = identity_frame(1, 200.0, 0.05);
    excited.coefficients[1] = -0.9;
    LPV::EncodedFrame quiet = excited;
    quiet.gain = 0.0;

    std::vector<double> first = engine.synthesize(excited);
    std::vector<double> second = engine.synthesize(quiet);
    assert(first.back() != 0.0);
    assert(second[0] == 0.9 * first.back());
    assert(second[1] == 0.9 * second[0]);
}

void test_zero_gain_is_silent() {
    LPV::SynthesisEngine engine(make_config(10, 240, 50));
    assert(!any_nonzero(engine.synthesize(identity_frame(10, -1.0, 0.0))));
    assert(!any_nonzero(engine.synthesize(identity_frame(10, 444.0, 0.0))));
}

void test_unstable_filter_is_clamped() {
    LPV::SynthesisEngine engine(make_config(2, 256, 50));
    LPV::EncodedFrame f = identity_frame(2, -1.0, 0.5);
    f.coefficients = {1.0, -2.0, 1.2};
    for (int i = 0; i < 4; ++i) {
        std::vector<double> out = engine.synthesize(f);
        for (double s : out) {
            assert(std::isfinite(s));
            assert(std::fabs(s) <= LPV::kOutputClamp);
        }
    }
    assert(engine.clamped_samples() > 0);
}

void test_clamp_leaves_filter_state() {
    // single pulse of amplitude 3 into a resonator at fs/8 with r = 0.95
    const double r = 0.95;
    const double theta = 0.78539816339744830962;
    LPV::SynthesisEngine engine(make_config(2, 256, 50));
    LPV::EncodedFrame f = identity_frame(2, 8000.0 / 300.0, 3.0 / std::sqrt(300.0));
    f.coefficients = {1.0, -2.0 * r * std::cos(theta), r * r};

    std::vector<double> out = engine.synthesize(f);
    size_t over = 0;
    for (size_t n = 0; n < out.size(); ++n) {
        const double free_run = 3.0 * std::pow(r, static_cast<double>(n)) *
                                std::sin(static_cast<double>(n + 1) * theta) / std::sin(theta);
        if (std::fabs(free_run) > LPV::kOutputClamp) {
            ++over;
            assert(std::fabs(out[n]) == LPV::kOutputClamp);
        } else {
            assert(std::fabs(out[n] - free_run) < 1e-9);
        }
    }
    assert(over > 0);
    assert(engine.clamped_samples() == over);
}

void test_non_finite_resets_filter() {
    LPV::SynthesisEngine engine(make_config(1, 64, 16));
    LPV::EncodedFrame f = identity_frame(1, 8000.0 / 300.0, 1.0 / std::sqrt(300.0));
    f.coefficients[1] = -1e300;

    std::vector<double> out = engine.synthesize(f);
    assert(std::fabs(out[0] - 1.0) < 1e-12);
    assert(out[1] == LPV::kOutputClamp);
    for (size_t n = 2; n < out.size(); ++n) {
        assert(out[n] == 0.0);
    }
    assert(engine.clamped_samples() == 2);

    std::vector<double> next = engine.synthesize(identity_frame(1, -1.0, 0.0));
    assert(!any_nonzero(next));
}

void test_engine_rejects() {
    LPV::SynthesisEngine engine(make_config(10, 256, 50));
    bool thrown = false;
    try {
        (void)engine.synthesize(identity_frame(8, -1.0, 0.5));
    } catch (const LPV::FormatError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        LPV::SynthesisEngine bad(make_config(10, 256, 256));
    } catch (const LPV::ConfigError&) {
        thrown = true;
    }
    assert(thrown);
}

void test_overlap_add() {
    const size_t counts[] = {1, 2, 5, 78};
    for (size_t count : counts) {
        std::vector<std::vector<double>> segs(count, std::vector<double>(256, 1.0));
        std::vector<double> out = LPV::OverlapReconstructor::assemble(segs, 256, 50);
        assert(out.size() == (count - 1) * 206 + 256);
        // complementary fades keep a constant signal constant
        for (double s : out) {
            assert(std::fabs(s - 1.0) < 1e-12);
        }
    }

    std::vector<std::vector<double>> segs(3, std::vector<double>(10, 1.0));
    std::vector<double> summed = LPV::OverlapReconstructor::assemble(segs, 10, 4, false);
    assert(summed.size() == 22);
    const std::vector<double> expected = {1, 1, 1, 1, 1, 1, 2, 2, 2, 2, 1, 1, 2, 2, 2, 2, 1, 1, 1, 1, 1, 1};
    assert(summed == expected);

    std::vector<std::vector<double>> plain = {{1, 2, 3}, {4, 5, 6}};
    assert((LPV::OverlapReconstructor::assemble(plain, 3, 0) == std::vector<double>{1, 2, 3, 4, 5, 6}));

    LPV::OverlapReconstructor ola(8, 2);
    assert(ola.segments() == 0);
    ola.push(std::vector<double>(8, 0.5));
    ola.push(std::vector<double>(8, 0.5));
    assert(ola.segments() == 2);
    assert(ola.length() == 14);
    bool thrown = false;
    try {
        ola.push(std::vector<double>(7, 0.5));
    } catch (const LPV::FormatError&) {
        thrown = true;
    }
    assert(thrown);
    assert(ola.finish().size() == 14);

    thrown = false;
    try {
        LPV::OverlapReconstructor bad(8, 8);
    } catch (const LPV::ConfigError&) {
        thrown = true;
    }
    assert(thrown);
}

void test_decoder_pulse_grid() {
    LPV::EncodedStream stream;
    stream.encoder_info = make_config(2, 100, 50);
    for (int i = 0; i < 3; ++i) {
        stream.frames.push_back(identity_frame(2, 400.0, 0.1));
    }
    LPV::Decoder decoder;
    LPV::AudioSignal out = decoder.decode(stream);
    assert(out.sample_rate == 8000);
    assert(out.samples.size() == 200);
    const double amplitude = 0.1 * std::sqrt(20.0);
    for (size_t i = 0; i < out.samples.size(); ++i) {
        if (i % 20 == 0) {
            assert(std::fabs(out.samples[i] - amplitude) < 1e-12);
        } else {
            assert(std::fabs(out.samples[i]) < 1e-15);
        }
    }
}

void test_decoder_single_frame() {
    LPV::EncodedStream stream;
    stream.encoder_info = make_config(10, 256, 50);
    stream.frames.push_back(identity_frame(10, -1.0, 0.5));

    LPV::Decoder decoder;
    LPV::AudioSignal a = decoder.decode(stream);
    assert(a.samples.size() == 256);
    assert(any_nonzero(a.samples));

    // each decode runs its own engine
    LPV::AudioSignal b = decoder.decode(stream);
    assert(a.samples == b.samples);

    LPV::EncodedStream empty;
    empty.encoder_info = stream.encoder_info;
    assert(decoder.decode(empty).samples.empty());

    stream.frames[0].coefficients.resize(5);
    bool thrown = false;
    try {
        (void)decoder.decode(stream);
    } catch (const LPV::FormatError&) {
        thrown = true;
    }
    assert(thrown);
}

} // namespace

void run_synthesis_tests() {
    test_unvoiced_noise();
    test_pulse_phase_continues();
    test_excitation_matches_synthesis();
    test_filter_memory_carries();
    test_zero_gain_is_silent();
    test_unstable_filter_is_clamped();
    test_clamp_leaves_filter_state();
    test_non_finite_resets_filter();
    test_engine_rejects();
    test_overlap_add();
    test_decoder_pulse_grid();
    test_decoder_single_frame();
    std::cout << "synthesis tests ok\n";
}
