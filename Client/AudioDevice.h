#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

// Capture request. The processing flags are passed to the device layer,
// which honours them where the selected device or host API supports it.
struct AudioInputOptions {
    int sampleRate = 16000;
    int channels = 1;
    bool echoCancellation = true;
    bool noiseSuppression = true;
    bool autoGainControl = true;
    std::string deviceName;
};

struct AudioOutputOptions {
    int sampleRate = 48000;
    int channels = 1;
    std::string deviceName;
};

// Format the device actually delivers, which may differ from the request
struct AudioStreamFormat {
    int sampleRate = 0;
    int channels = 0;
};

/**
 * @brief Exclusive microphone handle
 *
 * Open() acquires the device (blocking until the host grants or refuses it),
 * Start() begins delivering interleaved float samples on the device's
 * real-time thread, Stop() halts delivery and Close() releases the device.
 */
class AudioInputDevice {
public:
    using SampleCallback = std::function<void(const float* samples, size_t frames)>;

    virtual ~AudioInputDevice() = default;

    virtual bool Open(const AudioInputOptions& options, std::string& error) = 0;
    virtual AudioStreamFormat Format() const = 0;
    virtual bool Start(SampleCallback callback, std::string& error) = 0;
    virtual bool Stop(std::string& error) = 0;
    virtual void Close() = 0;
};

// Pull-based stream of output-format samples
class PlaybackSource {
public:
    virtual ~PlaybackSource() = default;

    // Writes up to frames interleaved frames; fewer means the source is finished
    virtual size_t Read(float* out, size_t frames) = 0;
};

/**
 * @brief Single shared speaker output
 *
 * Plays one source at a time. onEnded is invoked from the device thread once
 * the source is drained; it is never invoked for a source cut short by Close().
 */
class AudioOutputDevice {
public:
    virtual ~AudioOutputDevice() = default;

    virtual bool Open(const AudioOutputOptions& options, std::string& error) = 0;
    virtual bool IsOpen() const = 0;
    virtual bool Play(std::shared_ptr<PlaybackSource> source, std::function<void()> onEnded, std::string& error) = 0;
    virtual void Close() = 0;
};

using AudioInputFactory = std::function<std::unique_ptr<AudioInputDevice>()>;
using AudioOutputFactory = std::function<std::unique_ptr<AudioOutputDevice>()>;
