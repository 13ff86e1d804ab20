#include "PortAudioDevice.h"
#include "ErrorUtils.h"
#include "Logging.h"

#include <algorithm>
#include <cstring>

namespace {

std::mutex g_sessionMutex;
std::weak_ptr<PortAudioSession> g_session;

// Default device when name is empty, else the first device whose name contains it
PaDeviceIndex findDevice(const std::string& name, bool input) {
    if (name.empty()) {
        return input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
    }
    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || !info->name) continue;
        int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0 && std::string(info->name).find(name) != std::string::npos) {
            return i;
        }
    }
    return paNoDevice;
}

} // namespace

std::shared_ptr<PortAudioSession> PortAudioSession::Acquire(std::string& error) {
    std::lock_guard<std::mutex> lock(g_sessionMutex);
    if (auto session = g_session.lock()) {
        return session;
    }
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_Initialize");
        return nullptr;
    }
    LOG_DEBUG(std::string("[PortAudio] Initialized: ") + Pa_GetVersionText());
    std::shared_ptr<PortAudioSession> session(new PortAudioSession());
    g_session = session;
    return session;
}

PortAudioSession::~PortAudioSession() {
    PaError err = Pa_Terminate();
    if (err != paNoError) {
        LOG_WARN("[PortAudio] " + ErrorUtils::formatPaError(err, "Pa_Terminate"));
    }
}

// ---------------------------------------------------------------------------
// Input
// ---------------------------------------------------------------------------

PortAudioInput::~PortAudioInput() {
    std::string error;
    if (m_stream && !Stop(error)) {
        LOG_WARN("[Capture] " + error);
    }
    Close();
}

bool PortAudioInput::Open(const AudioInputOptions& options, std::string& error) {
    if (m_stream) {
        error = "input device already open";
        return false;
    }
    m_session = PortAudioSession::Acquire(error);
    if (!m_session) {
        return false;
    }

    PaDeviceIndex device = findDevice(options.deviceName, true);
    if (device == paNoDevice) {
        error = options.deviceName.empty() ? "no default input device"
                                           : "input device '" + options.deviceName + "' not found";
        m_session.reset();
        return false;
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);

    // PortAudio exposes no echo cancellation, noise suppression or gain
    // control; those come from the selected device (e.g. an echo-cancel source)
    if (options.echoCancellation || options.noiseSuppression || options.autoGainControl) {
        LOG_DEBUG(std::string("[Capture] Voice processing requested; using device '") + info->name + "'");
    }

    PaStreamParameters params;
    std::memset(&params, 0, sizeof(params));
    params.device = device;
    params.channelCount = std::min(std::max(options.channels, 1), info->maxInputChannels);
    params.sampleFormat = paFloat32;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    double rate = options.sampleRate;
    if (Pa_IsFormatSupported(&params, nullptr, rate) != paFormatIsSupported) {
        // Capture at the native rate; the pipeline resamples
        rate = info->defaultSampleRate;
        LOG_INFO("[Capture] " + std::to_string(options.sampleRate) + " Hz not supported, capturing at " +
                 std::to_string(static_cast<int>(rate)) + " Hz");
    }

    PaError err = Pa_OpenStream(&m_stream, &params, nullptr, rate, paFramesPerBufferUnspecified,
                                paClipOff, &PortAudioInput::StreamCallback, this);
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_OpenStream(input)");
        m_stream = nullptr;
        m_session.reset();
        return false;
    }

    m_format.sampleRate = static_cast<int>(rate);
    m_format.channels = params.channelCount;
    LOG_INFO(std::string("[Capture] Opened '") + info->name + "' at " + std::to_string(m_format.sampleRate) +
             " Hz, " + std::to_string(m_format.channels) + " ch");
    return true;
}

bool PortAudioInput::Start(SampleCallback callback, std::string& error) {
    if (!m_stream) {
        error = "input device not open";
        return false;
    }
    m_callback = std::move(callback);
    PaError err = Pa_StartStream(m_stream);
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_StartStream(input)");
        return false;
    }
    return true;
}

bool PortAudioInput::Stop(std::string& error) {
    if (!m_stream || Pa_IsStreamActive(m_stream) != 1) {
        return true;
    }
    PaError err = Pa_StopStream(m_stream);
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_StopStream(input)");
        return false;
    }
    return true;
}

void PortAudioInput::Close() {
    if (m_stream) {
        PaError err = Pa_CloseStream(m_stream);
        if (err != paNoError) {
            LOG_WARN("[Capture] " + ErrorUtils::formatPaError(err, "Pa_CloseStream(input)"));
        }
        m_stream = nullptr;
    }
    m_callback = nullptr;
    m_session.reset();
}

int PortAudioInput::StreamCallback(const void* input, void* /*output*/, unsigned long frameCount,
                                   const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                   PaStreamCallbackFlags /*statusFlags*/, void* userData) {
    auto* self = static_cast<PortAudioInput*>(userData);
    if (input && self->m_callback) {
        self->m_callback(static_cast<const float*>(input), frameCount);
    }
    return paContinue;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

PortAudioOutput::~PortAudioOutput() {
    Close();
}

bool PortAudioOutput::Open(const AudioOutputOptions& options, std::string& error) {
    if (m_stream) {
        return true;
    }
    m_session = PortAudioSession::Acquire(error);
    if (!m_session) {
        return false;
    }

    PaDeviceIndex device = findDevice(options.deviceName, false);
    if (device == paNoDevice) {
        error = options.deviceName.empty() ? "no default output device"
                                           : "output device '" + options.deviceName + "' not found";
        m_session.reset();
        return false;
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);

    PaStreamParameters params;
    std::memset(&params, 0, sizeof(params));
    params.device = device;
    params.channelCount = options.channels;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = info->defaultLowOutputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&m_stream, nullptr, &params, options.sampleRate, paFramesPerBufferUnspecified,
                                paClipOff, &PortAudioOutput::StreamCallback, this);
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_OpenStream(output)");
        m_stream = nullptr;
        m_session.reset();
        return false;
    }
    m_channels = options.channels;

    err = Pa_StartStream(m_stream);
    if (err != paNoError) {
        error = ErrorUtils::formatPaError(err, "Pa_StartStream(output)");
        Close();
        return false;
    }
    LOG_INFO(std::string("[Playback] Opened '") + info->name + "' at " + std::to_string(options.sampleRate) + " Hz");
    return true;
}

bool PortAudioOutput::Play(std::shared_ptr<PlaybackSource> source, std::function<void()> onEnded, std::string& error) {
    if (!m_stream) {
        error = "output device not open";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_sourceMutex);
    if (m_source) {
        error = "output device is already playing";
        return false;
    }
    m_source = std::move(source);
    m_onEnded = std::move(onEnded);
    return true;
}

void PortAudioOutput::Close() {
    if (m_stream) {
        PaError err = Pa_AbortStream(m_stream);
        if (err != paNoError) {
            LOG_WARN("[Playback] " + ErrorUtils::formatPaError(err, "Pa_AbortStream"));
        }
        err = Pa_CloseStream(m_stream);
        if (err != paNoError) {
            LOG_WARN("[Playback] " + ErrorUtils::formatPaError(err, "Pa_CloseStream(output)"));
        }
        m_stream = nullptr;
    }
    {
        std::lock_guard<std::mutex> lock(m_sourceMutex);
        m_source.reset();
        m_onEnded = nullptr;
    }
    m_session.reset();
}

void PortAudioOutput::Render(float* out, unsigned long frameCount) {
    const size_t total = static_cast<size_t>(frameCount) * m_channels;
    std::function<void()> finished;
    size_t written = 0;
    {
        std::unique_lock<std::mutex> lock(m_sourceMutex, std::try_to_lock);
        if (lock.owns_lock() && m_source) {
            written = m_source->Read(out, frameCount);
            if (written < frameCount) {
                m_source.reset();
                finished = std::move(m_onEnded);
                m_onEnded = nullptr;
            }
        }
    }
    std::fill(out + written * m_channels, out + total, 0.0f);
    if (finished) {
        finished();
    }
}

int PortAudioOutput::StreamCallback(const void* /*input*/, void* output, unsigned long frameCount,
                                    const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                    PaStreamCallbackFlags /*statusFlags*/, void* userData) {
    static_cast<PortAudioOutput*>(userData)->Render(static_cast<float*>(output), frameCount);
    return paContinue;
}
