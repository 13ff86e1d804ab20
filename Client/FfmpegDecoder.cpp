#include "FfmpegDecoder.h"
#include "ErrorUtils.h"
#include "Logging.h"

#include <cstring>

// Per-chunk FFmpeg state, released in reverse order of allocation
struct FfmpegDecoder::Context {
    AVCodecParserContext* parser = nullptr;
    AVCodecContext* codecCtx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    SwrContext* swr = nullptr;

    ~Context() {
        if (swr) swr_free(&swr);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (parser) av_parser_close(parser);
    }
};

FfmpegDecoder::FfmpegDecoder(const std::string& codecName, int outputRate, int outputChannels)
    : m_codecName(codecName), m_outputRate(outputRate), m_outputChannels(outputChannels)
{
}

bool FfmpegDecoder::IsAvailable(const std::string& codecName)
{
    return avcodec_find_decoder_by_name(codecName.c_str()) != nullptr;
}

bool FfmpegDecoder::Decode(const std::vector<uint8_t>& chunk, DecodedAudio& out, std::string& error)
{
    out.samples.clear();
    out.sampleRate = m_outputRate;
    out.channels = m_outputChannels;

    if (chunk.empty()) {
        error = "empty chunk";
        return false;
    }

    const AVCodec* codec = avcodec_find_decoder_by_name(m_codecName.c_str());
    if (!codec) {
        error = "decoder '" + m_codecName + "' not available";
        return false;
    }

    Context ctx;
    ctx.parser = av_parser_init(codec->id);
    ctx.codecCtx = avcodec_alloc_context3(codec);
    ctx.packet = av_packet_alloc();
    ctx.frame = av_frame_alloc();
    if (!ctx.parser || !ctx.codecCtx || !ctx.packet || !ctx.frame) {
        error = "failed to allocate decoder state";
        return false;
    }

    int ret = avcodec_open2(ctx.codecCtx, codec, nullptr);
    if (ret < 0) {
        error = ErrorUtils::formatAvError(ret, "avcodec_open2");
        return false;
    }

    // The parser may read past the end; input needs zeroed padding
    std::vector<uint8_t> input(chunk.size() + AV_INPUT_BUFFER_PADDING_SIZE, 0);
    std::memcpy(input.data(), chunk.data(), chunk.size());

    const uint8_t* data = input.data();
    int remaining = static_cast<int>(chunk.size());
    bool flushing = false;
    while (true) {
        int used = av_parser_parse2(ctx.parser, ctx.codecCtx, &ctx.packet->data, &ctx.packet->size,
                                    flushing ? nullptr : data, flushing ? 0 : remaining,
                                    AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
        if (used < 0) {
            error = ErrorUtils::formatAvError(used, "av_parser_parse2");
            return false;
        }
        if (!flushing) {
            data += used;
            remaining -= used;
        }

        if (ctx.packet->size > 0) {
            ret = avcodec_send_packet(ctx.codecCtx, ctx.packet);
            if (ret == AVERROR_INVALIDDATA) {
                LOG_TRACE("[Decoder] Skipping invalid frame in chunk");
            } else if (ret < 0) {
                error = ErrorUtils::formatAvError(ret, "avcodec_send_packet");
                return false;
            } else if (!DrainFrames(ctx, out, error)) {
                return false;
            }
        }

        if (flushing) {
            if (ctx.packet->size == 0) break;
        } else if (remaining <= 0) {
            flushing = true;
        }
    }

    // Flush the decoder
    ret = avcodec_send_packet(ctx.codecCtx, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        error = ErrorUtils::formatAvError(ret, "avcodec_send_packet(flush)");
        return false;
    }
    if (!DrainFrames(ctx, out, error)) {
        return false;
    }

    // Flush samples buffered inside the resampler
    if (ctx.swr) {
        int pending = swr_get_out_samples(ctx.swr, 0);
        if (pending > 0) {
            size_t offset = out.samples.size();
            out.samples.resize(offset + static_cast<size_t>(pending) * m_outputChannels);
            uint8_t* outPtr = reinterpret_cast<uint8_t*>(out.samples.data() + offset);
            int got = swr_convert(ctx.swr, &outPtr, pending, nullptr, 0);
            out.samples.resize(offset + static_cast<size_t>(got > 0 ? got : 0) * m_outputChannels);
        }
    }

    if (out.samples.empty()) {
        error = "chunk contained no decodable audio";
        return false;
    }
    return true;
}

bool FfmpegDecoder::DrainFrames(Context& ctx, DecodedAudio& out, std::string& error)
{
    while (true) {
        int ret = avcodec_receive_frame(ctx.codecCtx, ctx.frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            error = ErrorUtils::formatAvError(ret, "avcodec_receive_frame");
            return false;
        }
        bool ok = AppendFrame(ctx, ctx.frame, out, error);
        av_frame_unref(ctx.frame);
        if (!ok) {
            return false;
        }
    }
}

bool FfmpegDecoder::AppendFrame(Context& ctx, const AVFrame* frame, DecodedAudio& out, std::string& error)
{
    if (!ctx.swr) {
        AVChannelLayout outLayout;
        av_channel_layout_default(&outLayout, m_outputChannels);
        const AVChannelLayout* inLayout = frame->ch_layout.nb_channels > 0 ? &frame->ch_layout
                                                                            : &ctx.codecCtx->ch_layout;
        int ret = swr_alloc_set_opts2(&ctx.swr, &outLayout, AV_SAMPLE_FMT_FLT, m_outputRate,
                                      inLayout, static_cast<AVSampleFormat>(frame->format), frame->sample_rate,
                                      0, nullptr);
        av_channel_layout_uninit(&outLayout);
        if (ret < 0) {
            error = ErrorUtils::formatAvError(ret, "swr_alloc_set_opts2");
            return false;
        }
        ret = swr_init(ctx.swr);
        if (ret < 0) {
            error = ErrorUtils::formatAvError(ret, "swr_init");
            return false;
        }
        LOG_TRACE("[Decoder] Converting " + std::to_string(frame->sample_rate) + " Hz, " +
                  std::to_string(inLayout->nb_channels) + " ch to " + std::to_string(m_outputRate) + " Hz");
    }

    int capacity = swr_get_out_samples(ctx.swr, frame->nb_samples);
    if (capacity <= 0) {
        return true;
    }
    size_t offset = out.samples.size();
    out.samples.resize(offset + static_cast<size_t>(capacity) * m_outputChannels);
    uint8_t* outPtr = reinterpret_cast<uint8_t*>(out.samples.data() + offset);
    int got = swr_convert(ctx.swr, &outPtr, capacity,
                          const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (got < 0) {
        out.samples.resize(offset);
        error = ErrorUtils::formatAvError(got, "swr_convert");
        return false;
    }
    out.samples.resize(offset + static_cast<size_t>(got) * m_outputChannels);
    return true;
}
