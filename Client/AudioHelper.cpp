#include "AudioHelper.h"

#include <algorithm>
#include <cmath>

int16_t ConvertFloatToPcm16(float sample)
{
    if (!std::isfinite(sample)) {
        return 0;
    }
    float s = std::max(-1.0f, std::min(1.0f, sample));
    return s < 0.0f ? static_cast<int16_t>(s * 32768.0f) : static_cast<int16_t>(s * 32767.0f);
}

void ConvertFloatToPcm16(const float* in, size_t count, std::vector<int16_t>& out)
{
    out.resize(count);
    for (size_t i = 0; i < count; ++i) {
        out[i] = ConvertFloatToPcm16(in[i]);
    }
}

void DownmixToMono(const float* in, size_t frames, int channels, std::vector<float>& out)
{
    out.resize(frames);
    if (channels <= 1) {
        std::copy(in, in + frames, out.begin());
        return;
    }
    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += in[f * channels + c];
        }
        out[f] = sum * scale;
    }
}

LinearResampler::LinearResampler(uint32_t inRate, uint32_t outRate)
    : m_inRate(inRate), m_outRate(outRate),
      m_step(outRate > 0 ? static_cast<double>(inRate) / static_cast<double>(outRate) : 1.0)
{
}

void LinearResampler::Reset()
{
    m_phase = 0.0;
    m_prev = 0.0f;
}

void LinearResampler::Process(const float* in, size_t inFrames, std::vector<float>& out)
{
    out.clear();
    if (inFrames == 0) {
        return;
    }
    if (IsPassthrough()) {
        out.assign(in, in + inFrames);
        return;
    }

    out.reserve(static_cast<size_t>(std::ceil(inFrames / m_step)) + 1);

    // Index -1 is the previous block's last sample
    auto sampleAt = [&](long idx) -> float {
        return idx < 0 ? m_prev : in[idx];
    };

    const double last = static_cast<double>(inFrames - 1);
    double t = m_phase;
    while (t <= last) {
        long i = static_cast<long>(std::floor(t));
        double frac = t - static_cast<double>(i);
        float s0 = sampleAt(i);
        float value = s0;
        if (frac > 0.0) {
            float s1 = sampleAt(i + 1);
            value = static_cast<float>(s0 + (s1 - s0) * frac);
        }
        out.push_back(value);
        t += m_step;
    }

    m_phase = t - static_cast<double>(inFrames);
    m_prev = in[inFrames - 1];
}

void LevelMeter::Process(const float* samples, size_t count)
{
    if (!samples || count == 0) {
        return;
    }
    double sumSquares = 0.0;
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        float s = samples[i];
        sumSquares += static_cast<double>(s) * s;
        peak = std::max(peak, std::fabs(s));
    }
    m_rms.store(static_cast<float>(std::sqrt(sumSquares / count)), std::memory_order_relaxed);
    m_peak.store(peak, std::memory_order_relaxed);
}

void LevelMeter::Reset()
{
    m_rms.store(0.0f, std::memory_order_relaxed);
    m_peak.store(0.0f, std::memory_order_relaxed);
}
