#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <portaudio.h>

#include "AudioDevice.h"

// Reference-counted Pa_Initialize/Pa_Terminate shared by all streams
class PortAudioSession {
public:
    ~PortAudioSession();

    // Returns the live session, initializing PortAudio on first use
    static std::shared_ptr<PortAudioSession> Acquire(std::string& error);

private:
    PortAudioSession() = default;
};

// Microphone input stream delivering float32 samples
class PortAudioInput : public AudioInputDevice {
public:
    PortAudioInput() = default;
    ~PortAudioInput() override;

    bool Open(const AudioInputOptions& options, std::string& error) override;
    AudioStreamFormat Format() const override { return m_format; }
    bool Start(SampleCallback callback, std::string& error) override;
    bool Stop(std::string& error) override;
    void Close() override;

private:
    static int StreamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo,
                              PaStreamCallbackFlags statusFlags, void* userData);

    std::shared_ptr<PortAudioSession> m_session;
    PaStream* m_stream = nullptr;
    AudioStreamFormat m_format;
    SampleCallback m_callback;
};

// Speaker output stream; renders silence between sources
class PortAudioOutput : public AudioOutputDevice {
public:
    PortAudioOutput() = default;
    ~PortAudioOutput() override;

    bool Open(const AudioOutputOptions& options, std::string& error) override;
    bool IsOpen() const override { return m_stream != nullptr; }
    bool Play(std::shared_ptr<PlaybackSource> source, std::function<void()> onEnded, std::string& error) override;
    void Close() override;

private:
    static int StreamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo,
                              PaStreamCallbackFlags statusFlags, void* userData);
    void Render(float* out, unsigned long frameCount);

    std::shared_ptr<PortAudioSession> m_session;
    PaStream* m_stream = nullptr;
    int m_channels = 1;

    std::mutex m_sourceMutex;   // try-locked on the audio thread
    std::shared_ptr<PlaybackSource> m_source;
    std::function<void()> m_onEnded;
};
