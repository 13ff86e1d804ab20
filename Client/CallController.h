#pragma once

#include <string>

#include "AudioCapture.h"
#include "AudioPlayback.h"
#include "SessionStore.h"
#include "TransportSession.h"

/**
 * @brief Wires transport, audio and session state into one call
 *
 * All methods run on the control loop; other threads post into it.
 */
class CallController {
public:
    CallController(Session::SessionStore& store, TransportSession& transport,
                   AudioCapture& capture, AudioPlayback& playback);
    ~CallController();

    CallController(const CallController&) = delete;
    CallController& operator=(const CallController&) = delete;

    // Ends any current call, resets the session and connects. In voice mode
    // the microphone streams to the transport; if it cannot be opened the
    // call continues receive-only.
    void StartCall(Session::CallMode mode);

    // Stops capture and playback, then hangs up. Safe when no call is running.
    void EndCall();

    // Trims and sends typed input; returns false for empty input.
    // In text mode the message is also added to the transcript.
    bool SendText(const std::string& text);

    void SetVolume(float volume);
    void ToggleMute();

    bool InCall() const { return m_inCall; }
    Session::CallMode Mode() const { return m_mode; }

private:
    void OnCapturedFrame(const std::vector<int16_t>& frame);

    Session::SessionStore& m_store;
    TransportSession& m_transport;
    AudioCapture& m_capture;
    AudioPlayback& m_playback;

    bool m_inCall = false;
    Session::CallMode m_mode = Session::CallMode::TEXT;
};
