#include "AudioCapture.h"
#include "ErrorUtils.h"
#include "Logging.h"
#include "Metrics.h"

#include <algorithm>

CaptureProcessor::CaptureProcessor(size_t frameSamples, uint32_t inputRate, int inputChannels, uint32_t targetRate,
                                   FrameQueue& queue, std::function<void()> onFrameReady)
    : m_frameSamples(frameSamples),
      m_inputChannels(std::max(inputChannels, 1)),
      m_resampler(inputRate, targetRate),
      m_queue(queue),
      m_onFrameReady(std::move(onFrameReady))
{
    m_current.reserve(m_frameSamples);
}

void CaptureProcessor::Process(const float* interleaved, size_t frames)
{
    if (!interleaved || frames == 0) {
        return;
    }

    DownmixToMono(interleaved, frames, m_inputChannels, m_mono);
    m_resampler.Process(m_mono.data(), m_mono.size(), m_resampled);
    m_level.Process(m_resampled.data(), m_resampled.size());

    size_t offset = 0;
    while (offset < m_resampled.size()) {
        size_t take = std::min(m_frameSamples - m_current.size(), m_resampled.size() - offset);
        m_current.insert(m_current.end(), m_resampled.begin() + offset, m_resampled.begin() + offset + take);
        offset += take;

        if (m_current.size() == m_frameSamples) {
            std::vector<float> full;
            full.swap(m_current);
            m_current.reserve(m_frameSamples);

            if (m_queue.tryPush(std::move(full))) {
                CallMetrics::inc(CallMetrics::framesCaptured());
                if (m_onFrameReady) m_onFrameReady();
            } else {
                CallMetrics::inc(CallMetrics::framesDropped());
            }
        }
    }
}

AudioCapture::AudioCapture(boost::asio::io_context& io, const ClientConfig::CaptureConfig& config,
                           AudioInputFactory deviceFactory)
    : m_io(io),
      m_config(config),
      m_deviceFactory(std::move(deviceFactory)),
      m_frames(config.queueDepth)
{
}

AudioCapture::~AudioCapture()
{
    StopRecording();
}

bool AudioCapture::StartRecording(FrameCallback onFrame, std::string& error)
{
    if (m_device || m_processor) {
        LOG_DEBUG("[Capture] Replacing previous recording");
        StopRecording();
    }

    std::unique_ptr<AudioInputDevice> device = m_deviceFactory ? m_deviceFactory() : nullptr;
    if (!device) {
        error = "no audio input available";
        LOG_DEVICE_ERROR("Cannot start recording", error);
        return false;
    }

    AudioInputOptions options;
    options.sampleRate = m_config.sampleRate;
    options.channels = m_config.channels;
    options.echoCancellation = m_config.echoCancellation;
    options.noiseSuppression = m_config.noiseSuppression;
    options.autoGainControl = m_config.autoGainControl;
    options.deviceName = m_config.deviceName;

    if (!device->Open(options, error)) {
        LOG_DEVICE_ERROR("Microphone unavailable", error);
        return false;
    }

    AudioStreamFormat format = device->Format();
    if (format.sampleRate <= 0) {
        error = "device reported an invalid sample rate";
        LOG_DEVICE_ERROR("Microphone unavailable", error);
        device->Close();
        return false;
    }

    m_frames.reset();
    boost::asio::io_context& io = m_io;
    std::weak_ptr<int> alive = m_lifetime;
    auto processor = std::make_shared<CaptureProcessor>(
        m_config.frameSamples, static_cast<uint32_t>(format.sampleRate), format.channels,
        static_cast<uint32_t>(m_config.sampleRate), m_frames,
        [this, &io, alive]() {
            boost::asio::post(io, [this, alive]() {
                if (alive.expired()) return;
                DrainFrames();
            });
        });

    if (!device->Start([processor](const float* samples, size_t frames) { processor->Process(samples, frames); },
                       error)) {
        LOG_DEVICE_ERROR("Failed to start input stream", error);
        device->Close();
        m_frames.shutdown();
        return false;
    }

    m_device = std::move(device);
    m_processor = std::move(processor);
    m_onFrame = std::move(onFrame);
    m_recording = true;
    LOG_INFO("[Capture] Recording started: " + std::to_string(m_config.frameSamples) + " samples per frame at " +
             std::to_string(m_config.sampleRate) + " Hz (device " + std::to_string(format.sampleRate) + " Hz)");
    return true;
}

void AudioCapture::StopRecording()
{
    if (!m_device && !m_processor) {
        m_recording = false;
        return;
    }
    m_recording = false;

    // 1. Stop the device stream
    try {
        std::string error;
        if (m_device && !m_device->Stop(error)) {
            LOG_DEVICE_ERROR("Failed to stop input stream", error);
        }
    } catch (const std::exception& e) {
        LOG_DEVICE_ERROR("Exception stopping input stream", e.what());
    }

    // 2. Detach the processor and discard undelivered frames
    try {
        m_processor.reset();
        m_frames.shutdown();
        m_frames.clear();
        m_onFrame = nullptr;
    } catch (const std::exception& e) {
        LOG_DEVICE_ERROR("Exception detaching capture processor", e.what());
    }

    // 3. Release the device
    try {
        if (m_device) {
            m_device->Close();
        }
    } catch (const std::exception& e) {
        LOG_DEVICE_ERROR("Exception closing input device", e.what());
    }
    m_device.reset();

    LOG_INFO("[Capture] Recording stopped");
}

void AudioCapture::DrainFrames()
{
    std::vector<float> frame;
    while (m_recording && m_frames.tryPop(frame)) {
        ConvertFloatToPcm16(frame.data(), frame.size(), m_pcm);
        // The callback may stop the recording
        FrameCallback callback = m_onFrame;
        if (callback) {
            callback(m_pcm);
        }
    }
}

float AudioCapture::InputRms() const
{
    return m_processor ? m_processor->InputLevel().Rms() : 0.0f;
}

float AudioCapture::InputPeak() const
{
    return m_processor ? m_processor->InputLevel().Peak() : 0.0f;
}
