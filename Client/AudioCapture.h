#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "AudioDevice.h"
#include "AudioHelper.h"
#include "ClientConfig.h"
#include "PacketQueue.h"

/**
 * @brief Real-time side of the capture pipeline
 *
 * Runs on the device thread: downmixes, resamples to the target rate and
 * accumulates samples into fixed-size frames. A full frame is handed to the
 * bounded queue without waiting; if the queue is full the frame is dropped.
 */
class CaptureProcessor
{
public:
    using FrameQueue = ThreadSafeQueue<std::vector<float>>;

    CaptureProcessor(size_t frameSamples, uint32_t inputRate, int inputChannels, uint32_t targetRate,
                     FrameQueue& queue, std::function<void()> onFrameReady);

    void Process(const float* interleaved, size_t frames);

    LevelMeter& InputLevel() { return m_level; }

private:
    size_t m_frameSamples;
    int m_inputChannels;
    LinearResampler m_resampler;
    FrameQueue& m_queue;
    std::function<void()> m_onFrameReady;

    std::vector<float> m_mono;
    std::vector<float> m_resampled;
    std::vector<float> m_current;
    LevelMeter m_level;
};

/**
 * @brief Microphone capture producing fixed-length 16-bit PCM frames
 *
 * StartRecording() and StopRecording() run on the control loop, which is also
 * where frames are converted and delivered to the callback, in production order.
 */
class AudioCapture
{
public:
    using FrameCallback = std::function<void(const std::vector<int16_t>& frame)>;

    AudioCapture(boost::asio::io_context& io, const ClientConfig::CaptureConfig& config,
                 AudioInputFactory deviceFactory);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Acquires the device and starts streaming. On failure nothing is left
    // allocated and the reason is written to error.
    bool StartRecording(FrameCallback onFrame, std::string& error);

    // Stops the device, detaches the processor and releases the device.
    // Every step runs even if an earlier one fails; safe to call repeatedly.
    void StopRecording();

    bool IsRecording() const { return m_recording; }

    // RMS/peak of the latest captured block; zero while not recording
    float InputRms() const;
    float InputPeak() const;

private:
    void DrainFrames();

    boost::asio::io_context& m_io;
    ClientConfig::CaptureConfig m_config;
    AudioInputFactory m_deviceFactory;

    std::unique_ptr<AudioInputDevice> m_device;
    std::shared_ptr<CaptureProcessor> m_processor;
    CaptureProcessor::FrameQueue m_frames;
    FrameCallback m_onFrame;
    bool m_recording = false;

    std::vector<int16_t> m_pcm;
    // Posted drains hold a weak reference and do nothing once this is gone
    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0);
};
