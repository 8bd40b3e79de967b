#include "decoder.hpp"
#include "codec/lpc/lpc.hpp"
#include "codec/stream/frame_codec.hpp"
#include "codec/synth/overlap.hpp"
#include "codec/synth/synthesis_engine.hpp"
#include "utils/logger.hpp"

namespace LPV {

Decoder::Decoder(bool crossfade, uint32_t seed)
    : crossfade(crossfade),
      seed(seed)
{
}

AudioSignal Decoder::decode(const EncodedStream& stream) const {
    stream.validate();
    const EncoderConfig& cfg = stream.encoder_info;

    AudioSignal out;
    out.sample_rate = cfg.sample_rate;
    if (stream.frames.empty()) {
        return out;
    }

    SynthesisEngine engine(cfg, this->seed);
    OverlapReconstructor ola(cfg.window_size, cfg.overlap, this->crossfade);

    std::vector<double> k;
    for (size_t i = 0; i < stream.frames.size(); ++i) {
        const EncodedFrame& frame = stream.frames[i];
        if (!LPC::reflection_from_coefficients(frame.coefficients, k)) {
            LPV_DEBUG_LOG("[dec] frame " << i << " has an unstable filter, output will be clamped\n");
        }
        ola.push(engine.synthesize(frame));
    }

    if (engine.clamped_samples() > 0) {
        LPV_TRACE_LOG("[dec] clamped " << engine.clamped_samples() << " samples\n");
    }
    out.samples = ola.finish();
    return out;
}

AudioSignal Decoder::decode_file(const std::string& path) const {
    return this->decode(FrameCodec::load_binary(path));
}

} // namespace LPV
