#include "AudioPlayback.h"
#include "ErrorUtils.h"
#include "Logging.h"
#include "Metrics.h"
#include "Protocol.h"

#include <algorithm>

namespace {

// source -> gain -> level meter; read by the output device thread
class GainTapSource : public PlaybackSource {
public:
    GainTapSource(DecodedAudio audio, std::shared_ptr<std::atomic<float>> gain, std::shared_ptr<LevelMeter> level)
        : m_audio(std::move(audio)), m_gain(std::move(gain)), m_level(std::move(level)) {}

    size_t Read(float* out, size_t frames) override {
        const size_t channels = static_cast<size_t>(m_audio.channels);
        const size_t available = m_audio.Frames() - m_position;
        const size_t n = std::min(frames, available);
        const float gain = m_gain->load(std::memory_order_relaxed);

        const float* src = m_audio.samples.data() + m_position * channels;
        for (size_t i = 0; i < n * channels; ++i) {
            out[i] = src[i] * gain;
        }
        m_level->Process(out, n * channels);
        m_position += n;
        return n;
    }

private:
    DecodedAudio m_audio;
    size_t m_position = 0;
    std::shared_ptr<std::atomic<float>> m_gain;
    std::shared_ptr<LevelMeter> m_level;
};

} // namespace

AudioPlayback::AudioPlayback(boost::asio::io_context& io, const ClientConfig::PlaybackConfig& config,
                             std::unique_ptr<ChunkDecoder> decoder, AudioOutputFactory outputFactory)
    : m_io(io),
      m_config(config),
      m_decoder(std::move(decoder)),
      m_outputFactory(std::move(outputFactory)),
      m_gain(std::make_shared<std::atomic<float>>(std::max(0.0f, std::min(1.0f, config.volume)))),
      m_level(std::make_shared<LevelMeter>())
{
    m_decodeThread = std::thread(&AudioPlayback::DecodeLoop, this);
}

AudioPlayback::~AudioPlayback()
{
    Stop();
    m_jobs.shutdown();
    if (m_decodeThread.joinable()) {
        m_decodeThread.join();
    }
}

void AudioPlayback::QueueAudio(const std::string& base64Chunk)
{
    std::vector<uint8_t> bytes;
    if (!Protocol::decodeBase64(base64Chunk, bytes) || bytes.empty()) {
        CallMetrics::inc(CallMetrics::decodeFailures());
        LOG_PROTOCOL_WARNING("Dropping audio chunk with invalid base64",
                             std::to_string(base64Chunk.size()) + " characters");
        return;
    }
    QueueChunk(std::move(bytes));
}

void AudioPlayback::QueueChunk(std::vector<uint8_t> chunk)
{
    CallMetrics::inc(CallMetrics::chunksQueued());
    m_queue.push_back(std::move(chunk));
    LOG_TRACE("[Playback] Queued chunk, pending=" + std::to_string(m_queue.size()));
    Advance();
}

void AudioPlayback::SetVolume(float volume)
{
    m_gain->store(std::max(0.0f, std::min(1.0f, volume)), std::memory_order_relaxed);
}

void AudioPlayback::Stop()
{
    bool active = m_playing || !m_queue.empty() || m_output;
    m_queue.clear();
    m_jobs.clear();
    ++m_generation;
    m_playing = false;

    if (m_output) {
        m_output->Close();
        m_output.reset();
    }
    m_level->Reset();
    if (active) {
        LOG_INFO("[Playback] Stopped");
    }
}

void AudioPlayback::Advance()
{
    // Completions re-enter here from the control loop, never recursively
    while (!m_playing && !m_queue.empty()) {
        DecodeJob job;
        job.generation = m_generation;
        job.sequence = ++m_nextSequence;
        job.chunk = std::move(m_queue.front());
        m_queue.pop_front();

        uint64_t sequence = job.sequence;
        if (m_jobs.tryPush(std::move(job))) {
            m_playing = true;
            return;
        }
        CallMetrics::inc(CallMetrics::decodeFailures());
        LOG_DECODE_ERROR("Decoder unavailable, dropping chunk", std::to_string(sequence));
    }
}

void AudioPlayback::DecodeLoop()
{
    DecodeJob job;
    while (m_jobs.pop(job)) {
        DecodedAudio audio;
        std::string error;
        bool ok = false;
        try {
            ok = m_decoder && m_decoder->Decode(job.chunk, audio, error);
            if (!m_decoder) error = "no decoder configured";
        } catch (const std::exception& e) {
            error = e.what();
        }

        std::weak_ptr<int> alive = m_lifetime;
        uint64_t generation = job.generation;
        uint64_t sequence = job.sequence;
        boost::asio::post(m_io, [this, alive, generation, sequence, ok, audio = std::move(audio), error]() mutable {
            if (alive.expired()) return;
            OnDecoded(generation, sequence, ok, std::move(audio), std::move(error));
        });
    }
}

void AudioPlayback::OnDecoded(uint64_t generation, uint64_t sequence, bool ok, DecodedAudio audio, std::string error)
{
    if (generation != m_generation) {
        LOG_TRACE("[Playback] Discarding chunk " + std::to_string(sequence) + " decoded before stop");
        return;
    }

    if (!ok) {
        CallMetrics::inc(CallMetrics::decodeFailures());
        LOG_DECODE_ERROR("Dropping chunk " + std::to_string(sequence), error);
        m_playing = false;
        Advance();
        return;
    }

    std::string outputError;
    if (!StartOutput(std::move(audio), sequence, outputError)) {
        LOG_DEVICE_ERROR("Cannot play chunk " + std::to_string(sequence), outputError);
        m_playing = false;
        Advance();
    }
}

bool AudioPlayback::StartOutput(DecodedAudio audio, uint64_t sequence, std::string& error)
{
    if (audio.channels != m_config.channels || audio.sampleRate != m_config.sampleRate) {
        error = "decoded format " + std::to_string(audio.sampleRate) + " Hz/" + std::to_string(audio.channels) +
                " ch does not match the output";
        return false;
    }

    // The output is opened lazily and kept until Stop()
    if (!m_output) {
        std::unique_ptr<AudioOutputDevice> output = m_outputFactory ? m_outputFactory() : nullptr;
        if (!output) {
            error = "no audio output available";
            return false;
        }
        AudioOutputOptions options;
        options.sampleRate = m_config.sampleRate;
        options.channels = m_config.channels;
        options.deviceName = m_config.deviceName;
        if (!output->Open(options, error)) {
            return false;
        }
        m_output = std::move(output);
    }

    auto source = std::make_shared<GainTapSource>(std::move(audio), m_gain, m_level);
    boost::asio::io_context& io = m_io;
    std::weak_ptr<int> alive = m_lifetime;
    uint64_t generation = m_generation;
    auto onEnded = [this, &io, alive, generation, sequence]() {
        boost::asio::post(io, [this, alive, generation, sequence]() {
            if (alive.expired()) return;
            OnPlaybackEnded(generation, sequence);
        });
    };

    if (!m_output->Play(source, onEnded, error)) {
        return false;
    }
    LOG_TRACE("[Playback] Playing chunk " + std::to_string(sequence));
    return true;
}

void AudioPlayback::OnPlaybackEnded(uint64_t generation, uint64_t sequence)
{
    if (generation != m_generation) {
        return;
    }
    CallMetrics::inc(CallMetrics::chunksPlayed());
    LOG_TRACE("[Playback] Finished chunk " + std::to_string(sequence));
    m_playing = false;
    Advance();
}
