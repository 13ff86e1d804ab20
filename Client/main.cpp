#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include <boost/asio.hpp>

#include "AudioCapture.h"
#include "AudioPlayback.h"
#include "CallController.h"
#include "ConfigUtils.h"
#include "ErrorUtils.h"
#include "FfmpegDecoder.h"
#include "Logging.h"
#include "Metrics.h"
#include "PortAudioDevice.h"
#include "Runtime.h"
#include "SessionStore.h"
#include "TransportSession.h"
#include "WebsocketChannel.h"

namespace {

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " [voice|text] [config.json]" << std::endl;
}

void handleCommand(CallController& controller, const std::string& line, const std::function<void()>& shutdown)
{
    if (line == "/quit") {
        shutdown();
    } else if (line == "/mute") {
        controller.ToggleMute();
    } else if (line.rfind("/volume", 0) == 0) {
        try {
            controller.SetVolume(std::stof(line.substr(7)));
        } catch (const std::exception& e) {
            LOG_WARN(std::string("[main] Invalid volume: ") + e.what());
        }
    } else if (!controller.SendText(line)) {
        LOG_DEBUG("[main] Ignoring empty input");
    }
}

// Stops and joins the console reader however the loop exits
class InputThreadJoiner
{
public:
    InputThreadJoiner(std::thread& thread, std::atomic<bool>& stop) : m_thread(thread), m_stop(stop) {}
    ~InputThreadJoiner()
    {
        m_stop.store(true);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    InputThreadJoiner(const InputThreadJoiner&) = delete;
    InputThreadJoiner& operator=(const InputThreadJoiner&) = delete;

private:
    std::thread& m_thread;
    std::atomic<bool>& m_stop;
};

}

int main(int argc, char* argv[])
{
    Session::CallMode mode = Session::CallMode::TEXT;
    if (argc > 1 && !Session::parseCallMode(argv[1], mode)) {
        printUsage(argv[0]);
        return -1;
    }
    std::string configFile = argc > 2 ? argv[2] : "config.json";

    // --- Load Configuration ---
    ClientConfig::Configuration config;
    if (!ConfigUtils::LoadClientConfig(config, configFile)) {
        ErrorUtils::logError(ErrorUtils::ErrorSeverity::FATAL, ErrorUtils::ErrorCategory::CONFIG,
                             "Failed to load configuration", configFile);
        return -1;
    }
    Logging::initialize(config.logging.level);
    LOG_INFO("[main] " + ClientConfig::getConfigurationSummary(config));

    if (!FfmpegDecoder::IsAvailable(config.playback.codec)) {
        LOG_WARN("[main] FFmpeg has no '" + config.playback.codec + "' decoder; agent audio will be dropped");
    }

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    try {
        WebsocketEndpoint endpoint(io);
        {
            Session::SessionStore store;
            TransportSession transport(io, store,
                [&endpoint]() { return std::make_unique<WebsocketChannel>(endpoint); },
                config.server, config.reconnect);
            AudioCapture capture(io, config.capture,
                []() { return std::make_unique<PortAudioInput>(); });
            AudioPlayback playback(io, config.playback,
                std::make_unique<FfmpegDecoder>(config.playback.codec, config.playback.sampleRate,
                                                config.playback.channels),
                []() { return std::make_unique<PortAudioOutput>(); });
            CallController controller(store, transport, capture, playback);

            Runtime::ConsolePrinter printer(std::cout);
            printer.Attach(store);
            Runtime::PrintBanner(std::cout, mode, config.server.baseUrl);

            std::atomic<bool> shuttingDown{false};
            boost::asio::signal_set signals(io, SIGINT, SIGTERM);

            // Runs on the control loop
            std::function<void()> shutdown = [&]() {
                if (shuttingDown.exchange(true)) return;
                LOG_INFO("[main] Shutting down");
                controller.EndCall();
                signals.cancel();
                work.reset();
            };

            signals.async_wait([&](const boost::system::error_code& ec, int signo) {
                if (ec) return;
                LOG_INFO("[main] Received signal " + std::to_string(signo));
                shutdown();
            });

            // The process exits once the call has ended on its own
            int endedSubscription = store.Subscribe([&](Session::ChangeKind kind, const Session::SessionSnapshot& s) {
                if (kind == Session::ChangeKind::CALL_STATUS && s.callStatus == Session::CallStatus::ENDED) {
                    boost::asio::post(io, [&]() { shutdown(); });
                }
            });

            boost::asio::post(io, [&]() { controller.StartCall(mode); });

            // Console input is read on its own thread and handed to the control loop
            std::thread inputThread([&]() {
                std::string line;
                while (!shuttingDown.load()) {
                    pollfd pfd{STDIN_FILENO, POLLIN, 0};
                    int ready = ::poll(&pfd, 1, 200);
                    if (ready <= 0) continue;
                    if (!std::getline(std::cin, line)) {
                        boost::asio::post(io, [&]() { shutdown(); });
                        break;
                    }
                    boost::asio::post(io, [&, line]() {
                        if (shuttingDown.load()) return;
                        handleCommand(controller, line, shutdown);
                    });
                }
            });

            {
                InputThreadJoiner joiner(inputThread, shuttingDown);
                io.run();
            }
            // Drain input handed over during shutdown; it is ignored
            io.restart();
            io.poll();

            store.Unsubscribe(endedSubscription);
            printer.Detach();
        }

        // Release channels still queued for destruction while the endpoint is alive
        io.restart();
        io.poll();
    }
    catch (const std::exception& e) {
        ErrorUtils::logError(ErrorUtils::ErrorSeverity::FATAL, ErrorUtils::ErrorCategory::GENERIC,
                             "Unhandled exception", e.what());
        return -1;
    }

    LOG_INFO("[main] " + CallMetrics::summary());
    return 0;
}
