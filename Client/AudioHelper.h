#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

// Symmetric float -> int16 conversion: clamp to [-1, 1], then scale by
// 32768 for negative samples and 32767 otherwise.
int16_t ConvertFloatToPcm16(float sample);
void ConvertFloatToPcm16(const float* in, size_t count, std::vector<int16_t>& out);

// Averages interleaved channels into one
void DownmixToMono(const float* in, size_t frames, int channels, std::vector<float>& out);

// Mono linear-interpolation resampler that keeps its phase and last sample
// across calls, so consecutive blocks resample as one continuous stream.
class LinearResampler
{
public:
    LinearResampler(uint32_t inRate, uint32_t outRate);

    void Process(const float* in, size_t inFrames, std::vector<float>& out);
    void Reset();

    bool IsPassthrough() const { return m_inRate == m_outRate; }

private:
    uint32_t m_inRate;
    uint32_t m_outRate;
    double m_step;
    double m_phase = 0.0;     // Read position relative to the next input block
    float m_prev = 0.0f;      // Last sample of the previous block (index -1)
};

// Analysis tap: RMS and peak of the most recent block, readable from any thread
class LevelMeter
{
public:
    void Process(const float* samples, size_t count);
    void Reset();

    float Rms() const { return m_rms.load(std::memory_order_relaxed); }
    float Peak() const { return m_peak.load(std::memory_order_relaxed); }

private:
    std::atomic<float> m_rms{0.0f};
    std::atomic<float> m_peak{0.0f};
};
