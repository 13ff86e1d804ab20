#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "AudioDevice.h"
#include "AudioHelper.h"
#include "ChunkDecoder.h"
#include "ClientConfig.h"
#include "PacketQueue.h"

/**
 * @brief Sequential playback of agent speech chunks
 *
 * Chunks are queued in arrival order and played one at a time through
 * source -> gain -> level meter -> output device. Decoding runs on a worker
 * thread; decode and end-of-playback completions are posted back to the
 * control loop, which advances to the next chunk. A failed chunk is dropped
 * and the queue moves on.
 *
 * All public methods except SetVolume() run on the control loop.
 */
class AudioPlayback
{
public:
    AudioPlayback(boost::asio::io_context& io, const ClientConfig::PlaybackConfig& config,
                  std::unique_ptr<ChunkDecoder> decoder, AudioOutputFactory outputFactory);
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    // Base64-decodes and enqueues one chunk; invalid base64 is logged and dropped
    void QueueAudio(const std::string& base64Chunk);

    // Enqueues already-decoded transport bytes
    void QueueChunk(std::vector<uint8_t> chunk);

    // Clamped to [0, 1]; applies to the chunk in flight and every later one
    void SetVolume(float volume);
    float GetVolume() const { return m_gain->load(std::memory_order_relaxed); }

    // Drops pending chunks, abandons the one in flight and releases the output
    void Stop();

    bool IsPlaying() const { return m_playing; }
    size_t PendingChunks() const { return m_queue.size(); }

    float OutputRms() const { return m_level->Rms(); }
    float OutputPeak() const { return m_level->Peak(); }

private:
    struct DecodeJob {
        uint64_t generation = 0;
        uint64_t sequence = 0;
        std::vector<uint8_t> chunk;
    };

    void Advance();
    void DecodeLoop();
    void OnDecoded(uint64_t generation, uint64_t sequence, bool ok, DecodedAudio audio, std::string error);
    void OnPlaybackEnded(uint64_t generation, uint64_t sequence);
    bool StartOutput(DecodedAudio audio, uint64_t sequence, std::string& error);

    boost::asio::io_context& m_io;
    ClientConfig::PlaybackConfig m_config;
    std::unique_ptr<ChunkDecoder> m_decoder;
    AudioOutputFactory m_outputFactory;
    std::unique_ptr<AudioOutputDevice> m_output;

    // Shared with sources still held by the output device
    std::shared_ptr<std::atomic<float>> m_gain;
    std::shared_ptr<LevelMeter> m_level;

    std::deque<std::vector<uint8_t>> m_queue;
    bool m_playing = false;
    uint64_t m_generation = 0;      // Bumped by Stop(); stale completions are ignored
    uint64_t m_nextSequence = 0;

    ThreadSafeQueue<DecodeJob> m_jobs;
    std::thread m_decodeThread;

    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0);
};
