#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "AudioDevice.h"
#include "ChunkDecoder.h"
#include "MessageChannel.h"

namespace TestFakes {

// Runs the loop in short slices until pred() holds or the timeout expires
template <typename Pred>
bool RunUntil(boost::asio::io_context& io, Pred pred,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        io.restart();
        io.run_for(std::chrono::milliseconds(1));
    }
    return true;
}

inline void RunFor(boost::asio::io_context& io, std::chrono::milliseconds duration)
{
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        io.restart();
        io.run_for(std::chrono::milliseconds(1));
    }
}

// ---------------------------------------------------------------------------
// MessageChannel
// ---------------------------------------------------------------------------

// Observable side of one fake connection; outlives the channel itself
struct FakeChannelState {
    std::string uri;
    MessageChannel::Callbacks callbacks;
    bool open = false;
    bool detached = false;
    std::vector<std::string> sentText;
    std::vector<std::string> sentBinary;
    std::vector<uint16_t> closeCodes;

    // Server side actions
    void Accept() {
        open = true;
        if (!detached && callbacks.onOpen) callbacks.onOpen();
    }
    void Deliver(const std::string& payload) {
        if (!detached && callbacks.onText) callbacks.onText(payload);
    }
    void Drop(uint16_t code) {
        open = false;
        if (!detached && callbacks.onClose) callbacks.onClose(code, "");
    }
};

class FakeChannel : public MessageChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeChannelState> state) : m_state(std::move(state)) {}
    ~FakeChannel() override { m_state->detached = true; }

    void Open(const std::string& uri, Callbacks callbacks) override {
        m_state->uri = uri;
        m_state->callbacks = std::move(callbacks);
    }
    bool IsOpen() const override { return m_state->open; }
    bool SendText(const std::string& payload) override {
        if (!m_state->open) return false;
        m_state->sentText.push_back(payload);
        return true;
    }
    bool SendBinary(const std::string& payload) override {
        if (!m_state->open) return false;
        m_state->sentBinary.push_back(payload);
        return true;
    }
    void Close(uint16_t code, const std::string&) override {
        m_state->closeCodes.push_back(code);
        m_state->open = false;
    }

private:
    std::shared_ptr<FakeChannelState> m_state;
};

// Hands out fake channels and remembers every one it created
struct FakeChannelFactory {
    std::vector<std::shared_ptr<FakeChannelState>> channels;

    ChannelFactory Factory() {
        return [this]() {
            auto state = std::make_shared<FakeChannelState>();
            channels.push_back(state);
            return std::make_unique<FakeChannel>(state);
        };
    }

    FakeChannelState& Last() { return *channels.back(); }
    size_t Count() const { return channels.size(); }
};

// ---------------------------------------------------------------------------
// Audio input
// ---------------------------------------------------------------------------

struct FakeInputState {
    bool failOpen = false;
    bool failStart = false;
    bool failStop = false;
    bool throwOnStop = false;
    AudioStreamFormat format{16000, 1};

    AudioInputOptions options;
    int openCalls = 0;
    int startCalls = 0;
    int stopCalls = 0;
    int closeCalls = 0;

    std::mutex mutex;
    AudioInputDevice::SampleCallback callback;

    // Plays the part of the device thread
    void Deliver(const std::vector<float>& interleaved) {
        std::lock_guard<std::mutex> lock(mutex);
        if (callback) {
            size_t channels = static_cast<size_t>(format.channels > 0 ? format.channels : 1);
            callback(interleaved.data(), interleaved.size() / channels);
        }
    }
};

class FakeInputDevice : public AudioInputDevice {
public:
    explicit FakeInputDevice(std::shared_ptr<FakeInputState> state) : m_state(std::move(state)) {}

    bool Open(const AudioInputOptions& options, std::string& error) override {
        m_state->openCalls++;
        m_state->options = options;
        if (m_state->failOpen) {
            error = "permission denied";
            return false;
        }
        return true;
    }
    AudioStreamFormat Format() const override { return m_state->format; }
    bool Start(SampleCallback callback, std::string& error) override {
        m_state->startCalls++;
        if (m_state->failStart) {
            error = "stream failed to start";
            return false;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callback = std::move(callback);
        return true;
    }
    bool Stop(std::string& error) override {
        m_state->stopCalls++;
        if (m_state->throwOnStop) {
            throw std::runtime_error("device disappeared");
        }
        if (m_state->failStop) {
            error = "stream refused to stop";
            return false;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callback = nullptr;
        return true;
    }
    void Close() override {
        m_state->closeCalls++;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callback = nullptr;
    }

private:
    std::shared_ptr<FakeInputState> m_state;
};

inline AudioInputFactory MakeInputFactory(std::shared_ptr<FakeInputState> state)
{
    return [state]() { return std::make_unique<FakeInputDevice>(state); };
}

// ---------------------------------------------------------------------------
// Audio output
// ---------------------------------------------------------------------------

struct FakeOutputState {
    bool failOpen = false;
    int openCalls = 0;
    int closeCalls = 0;
    int playCalls = 0;
    bool overlapped = false;

    std::shared_ptr<PlaybackSource> active;
    std::function<void()> onEnded;
    std::vector<std::vector<float>> rendered;

    bool HasActive() const { return active != nullptr; }

    // Drains the active source as the device would and reports the end
    void FinishActive() {
        std::vector<float> out;
        float buffer[64];
        size_t n = 0;
        while ((n = active->Read(buffer, 64)) > 0) {
            out.insert(out.end(), buffer, buffer + n);
        }
        rendered.push_back(out);
        active.reset();
        auto ended = std::move(onEnded);
        onEnded = nullptr;
        if (ended) ended();
    }
};

class FakeOutputDevice : public AudioOutputDevice {
public:
    explicit FakeOutputDevice(std::shared_ptr<FakeOutputState> state) : m_state(std::move(state)) {}

    bool Open(const AudioOutputOptions&, std::string& error) override {
        m_state->openCalls++;
        if (m_state->failOpen) {
            error = "no output device";
            return false;
        }
        m_open = true;
        return true;
    }
    bool IsOpen() const override { return m_open; }
    bool Play(std::shared_ptr<PlaybackSource> source, std::function<void()> onEnded, std::string&) override {
        m_state->playCalls++;
        if (m_state->active) {
            m_state->overlapped = true;
        }
        m_state->active = std::move(source);
        m_state->onEnded = std::move(onEnded);
        return true;
    }
    void Close() override {
        m_state->closeCalls++;
        m_state->active.reset();
        m_state->onEnded = nullptr;
        m_open = false;
    }

private:
    std::shared_ptr<FakeOutputState> m_state;
    bool m_open = false;
};

inline AudioOutputFactory MakeOutputFactory(std::shared_ptr<FakeOutputState> state)
{
    return [state]() { return std::make_unique<FakeOutputDevice>(state); };
}

// ---------------------------------------------------------------------------
// Chunk decoder
// ---------------------------------------------------------------------------

// Each chunk's first byte is its id; decoding yields four samples of id / 100
struct FakeDecoderState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int> decoded;
    std::set<int> failing;
    bool gated = false;
    bool inside = false;
    int sampleRate = 48000;
    int channels = 1;

    void Release() {
        std::lock_guard<std::mutex> lock(mutex);
        gated = false;
        cv.notify_all();
    }

    bool WaitInside(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return inside; });
    }

    std::vector<int> Decoded() {
        std::lock_guard<std::mutex> lock(mutex);
        return decoded;
    }
};

class FakeDecoder : public ChunkDecoder {
public:
    explicit FakeDecoder(std::shared_ptr<FakeDecoderState> state) : m_state(std::move(state)) {}

    bool Decode(const std::vector<uint8_t>& chunk, DecodedAudio& out, std::string& error) override {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->inside = true;
        m_state->cv.notify_all();
        m_state->cv.wait(lock, [this] { return !m_state->gated; });
        m_state->inside = false;

        int id = chunk.empty() ? -1 : chunk[0];
        m_state->decoded.push_back(id);
        if (m_state->failing.count(id)) {
            error = "corrupt chunk";
            return false;
        }
        out.sampleRate = m_state->sampleRate;
        out.channels = m_state->channels;
        out.samples.assign(4 * static_cast<size_t>(m_state->channels), static_cast<float>(id) / 100.0f);
        return true;
    }

private:
    std::shared_ptr<FakeDecoderState> m_state;
};

} // namespace TestFakes
