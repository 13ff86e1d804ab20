#pragma once

#include <map>
#include <mutex>
#include <ostream>
#include <string>

#include "SessionStore.h"

namespace Runtime {
    // Print banner with mode, endpoint and console commands
    void PrintBanner(std::ostream& out, Session::CallMode mode, const std::string& serverUrl);

    // Prints transcript, call and agent status changes as they happen
    class ConsolePrinter {
    public:
        explicit ConsolePrinter(std::ostream& out) : m_out(out) {}

        void Attach(Session::SessionStore& store);
        void Detach();

        void OnChange(Session::ChangeKind kind, const Session::SessionSnapshot& snapshot);

    private:
        void PrintTranscript(const Session::SessionSnapshot& snapshot);

        std::ostream& m_out;
        std::mutex m_mutex;
        Session::SessionStore* m_store = nullptr;
        int m_subscription = 0;

        // Last printed text and finality per message id
        std::map<std::string, std::pair<std::string, bool>> m_printed;
    };
}
