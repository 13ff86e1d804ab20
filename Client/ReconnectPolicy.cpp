#include "ReconnectPolicy.h"

ReconnectPolicy::ReconnectPolicy(std::vector<std::chrono::milliseconds> delays)
    : m_delays(std::move(delays)) {}

bool ReconnectPolicy::NextDelay(std::chrono::milliseconds& delay) {
    if (Exhausted()) {
        return false;
    }
    delay = m_delays[m_failures++];
    return true;
}
