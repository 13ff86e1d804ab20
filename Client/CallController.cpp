#include "CallController.h"
#include "ErrorUtils.h"
#include "IdGenerator.h"
#include "Logging.h"
#include "Metrics.h"

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

CallController::CallController(Session::SessionStore& store, TransportSession& transport,
                               AudioCapture& capture, AudioPlayback& playback)
    : m_store(store), m_transport(transport), m_capture(capture), m_playback(playback)
{
    m_transport.On("audio", [this](const nlohmann::json& message) {
        std::string data;
        std::string error;
        if (!Protocol::parseAudio(message, data, error)) {
            LOG_PROTOCOL_WARNING("Ignoring audio message", error);
            return;
        }
        m_playback.QueueAudio(data);
    });
}

CallController::~CallController()
{
    if (m_inCall) {
        EndCall();
    }
    m_transport.On("audio", nullptr);
}

void CallController::StartCall(Session::CallMode mode)
{
    if (m_inCall) {
        LOG_INFO("[Call] Ending previous call before starting a new one");
        EndCall();
    }

    m_mode = mode;
    m_inCall = true;
    m_store.Reset();
    m_playback.SetVolume(m_store.Snapshot().volume);

    LOG_INFO(std::string("[Call] Starting ") + Session::toString(mode) + " call");
    m_transport.Connect(mode);

    if (mode == Session::CallMode::VOICE) {
        std::string error;
        if (!m_capture.StartRecording([this](const std::vector<int16_t>& frame) { OnCapturedFrame(frame); },
                                      error)) {
            LOG_DEVICE_ERROR("Microphone access failed, continuing without capture", error);
        }
    }
}

void CallController::EndCall()
{
    m_capture.StopRecording();
    m_playback.Stop();
    m_transport.Disconnect();

    if (m_inCall) {
        LOG_INFO("[Call] Call ended: " + CallMetrics::summary());
    }
    m_inCall = false;
}

bool CallController::SendText(const std::string& text)
{
    std::string content = trim(text);
    if (content.empty()) {
        return false;
    }
    m_transport.SendText(content);

    if (m_mode == Session::CallMode::TEXT) {
        Session::TranscriptMessage message;
        message.id = generateUuid();
        message.speaker = Session::Speaker::USER;
        message.text = content;
        message.isFinal = true;
        message.timestamp = currentIsoTimestamp();
        m_store.AddMessage(std::move(message));
    }
    return true;
}

void CallController::SetVolume(float volume)
{
    m_store.SetVolume(volume);
    m_playback.SetVolume(volume);
}

void CallController::ToggleMute()
{
    m_store.ToggleMute();
    LOG_INFO(std::string("[Call] Microphone ") + (m_store.IsMuted() ? "muted" : "unmuted"));
}

void CallController::OnCapturedFrame(const std::vector<int16_t>& frame)
{
    if (m_store.IsMuted()) {
        CallMetrics::inc(CallMetrics::framesDropped());
        return;
    }
    m_transport.SendAudio(frame);
}
