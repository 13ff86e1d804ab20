#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Decoded PCM ready for the output device
struct DecodedAudio {
    std::vector<float> samples;   // Interleaved
    int sampleRate = 0;
    int channels = 0;

    size_t Frames() const { return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0; }
};

// Turns one self-contained compressed chunk into PCM in the output format.
// Called from the playback decode thread only.
class ChunkDecoder {
public:
    virtual ~ChunkDecoder() = default;
    virtual bool Decode(const std::vector<uint8_t>& chunk, DecodedAudio& out, std::string& error) = 0;
};
