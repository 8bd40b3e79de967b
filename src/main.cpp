#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <chrono>
#include <cstdlib>
#include "io/wav_io.hpp"
#include "utils/cli.hpp"
#include "codec/errors.hpp"
#include "codec/lpv/encoder.hpp"
#include "codec/lpv/decoder.hpp"
#include "codec/stream/frame_codec.hpp"

static void usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  lpv_cli encode input.wav output.lpv [--order=N] [--window=N] [--overlap=N] [--json]\n";
    std::cerr << "  lpv_cli decode input.lpv output.wav [--json] [--no-crossfade]\n";
    std::cerr << "  lpv_cli selftest\n";
}

static int run_encode(int argc, char** argv) {
    std::string in_path = argv[2];
    std::string out_path = argv[3];
    int32_t order = LPV::EncoderConfig::kDefaultOrder;
    int32_t window = 0;
    int32_t overlap = -1;
    bool json = false;
    for (int i = 4; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--json") {
            json = true;
            continue;
        }
        Cli::FlagParse parsed = Cli::parse_int_flag(flag, "--order=", order);
        if (parsed == Cli::FlagParse::NotThisFlag) parsed = Cli::parse_int_flag(flag, "--window=", window);
        if (parsed == Cli::FlagParse::NotThisFlag) parsed = Cli::parse_int_flag(flag, "--overlap=", overlap);
        if (parsed == Cli::FlagParse::Invalid) {
            std::cerr << "Invalid or out of range value in " << flag << "\n";
            return 1;
        }
        if (parsed == Cli::FlagParse::NotThisFlag) {
            usage();
            return 1;
        }
    }

    return Cli::run_guarded("encode", [&]() {
        LoadedAudio audio = load_audio(in_path, window, overlap);
        LPV::EncoderConfig cfg;
        cfg.order = order;
        cfg.window_size = audio.window_size;
        cfg.overlap = audio.overlap;
        cfg.sample_rate = audio.signal.sample_rate;

        LPV::Encoder encoder(cfg);
        auto t0 = std::chrono::high_resolution_clock::now();
        LPV::EncodedStream stream = encoder.encode(audio.signal);
        auto t1 = std::chrono::high_resolution_clock::now();

        if (json) {
            LPV::FrameCodec::save_json(out_path, stream);
        } else {
            LPV::FrameCodec::save_binary(out_path, stream);
        }
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        std::cout << "Encoded " << in_path << " -> " << out_path
                  << " (" << stream.frames.size() << " frames, " << LPV::describe(encoder.config())
                  << ", " << us << "us)\n";
        return 0;
    });
}

static int run_decode(int argc, char** argv) {
    std::string in_path = argv[2];
    std::string out_path = argv[3];
    bool json = false;
    bool crossfade = true;
    for (int i = 4; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--json") {
            json = true;
        } else if (flag == "--no-crossfade") {
            crossfade = false;
        } else {
            usage();
            return 1;
        }
    }

    return Cli::run_guarded("decode", [&]() {
        LPV::EncodedStream stream = json
            ? LPV::FrameCodec::load_json(in_path)
            : LPV::FrameCodec::load_binary(in_path);
        LPV::Decoder decoder(crossfade);
        LPV::AudioSignal signal = decoder.decode(stream);
        if (signal.samples.empty()) {
            std::cerr << "Decode produced no samples\n";
            return 1;
        }
        save_audio(out_path, signal);
        std::cout << "Decoded " << in_path << " -> " << out_path
                  << " (" << signal.samples.size() << " samples @ " << signal.sample_rate << "Hz)\n";
        return 0;
    });
}

static int run_selftest() {
    const double pi = 3.14159265358979323846;
    const int32_t sample_rate = 8000;
    const size_t length = 16000;

    LPV::AudioSignal tone;
    tone.sample_rate = sample_rate;
    tone.samples.resize(length);
    for (size_t i = 0; i < length; ++i) {
        tone.samples[i] = std::sin(2.0 * pi * 440.0 * static_cast<double>(i) / sample_rate);
    }

    const int status = Cli::run_guarded("selftest", [&]() {
        LPV::EncoderConfig cfg = LPV::EncoderConfig::defaults_for(sample_rate);
        cfg.window_size = 256;
        LPV::Encoder encoder(cfg);
        LPV::EncodedStream stream = encoder.encode(tone);

        const size_t stride = static_cast<size_t>(cfg.stride());
        const size_t expected_frames = (length + stride - 1) / stride;
        if (stream.frames.size() != expected_frames) {
            std::cerr << "Frame count " << stream.frames.size() << " != " << expected_frames << "\n";
            return 1;
        }

        std::vector<uint8_t> bytes = LPV::FrameCodec::to_binary(stream);
        LPV::EncodedStream reloaded = LPV::FrameCodec::from_binary(bytes);
        if (reloaded.encoder_info != stream.encoder_info || reloaded.frames.size() != stream.frames.size()) {
            std::cerr << "Binary roundtrip mismatch\n";
            return 1;
        }

        LPV::Decoder decoder;
        LPV::AudioSignal out = decoder.decode(reloaded);
        const size_t expected_len = (expected_frames - 1) * stride + static_cast<size_t>(cfg.window_size);
        if (out.samples.size() != expected_len) {
            std::cerr << "Decoded length " << out.samples.size() << " != " << expected_len << "\n";
            return 1;
        }

        std::cout << "Selftest sr=" << sample_rate << "Hz frames=" << stream.frames.size()
                  << " pitch=" << stream.frames.front().pitch
                  << " bytes=" << bytes.size()
                  << " decoded=" << out.samples.size() << " samples\n";
        return 0;
    });
    if (status != 0) return status;

    std::cout << "Selftest complete.\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string mode = argv[1];

    if (mode == "encode" || mode == "decode") {
        if (argc < 4) {
            usage();
            return 1;
        }
        return (mode == "encode") ? run_encode(argc, argv) : run_decode(argc, argv);
    }

    if (mode == "selftest") {
        return run_selftest();
    }

    usage();
    return 1;
}
