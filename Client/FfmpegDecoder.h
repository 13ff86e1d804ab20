#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include <string>

#include "ChunkDecoder.h"

// Decodes compressed chunks (MP3 by default) with libavcodec and converts
// them to interleaved float at the output rate and channel count.
// Each chunk is decoded with a fresh parser and codec context.
class FfmpegDecoder : public ChunkDecoder
{
public:
    FfmpegDecoder(const std::string& codecName, int outputRate, int outputChannels);

    bool Decode(const std::vector<uint8_t>& chunk, DecodedAudio& out, std::string& error) override;

    // True when libavcodec has a decoder with this name
    static bool IsAvailable(const std::string& codecName);

private:
    struct Context;

    bool DrainFrames(Context& ctx, DecodedAudio& out, std::string& error);
    bool AppendFrame(Context& ctx, const AVFrame* frame, DecodedAudio& out, std::string& error);

    std::string m_codecName;
    int m_outputRate;
    int m_outputChannels;
};
