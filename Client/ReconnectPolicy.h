#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

// Fixed backoff schedule indexed by the number of consecutive failures.
// NextDelay() hands out the next entry and advances; once every entry has
// been used the policy is exhausted until Reset() (called on a successful open).
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(std::vector<std::chrono::milliseconds> delays);

    bool Exhausted() const { return m_failures >= m_delays.size(); }

    // Returns false when the schedule is exhausted
    bool NextDelay(std::chrono::milliseconds& delay);

    void Reset() { m_failures = 0; }

    size_t ConsecutiveFailures() const { return m_failures; }
    size_t ScheduleLength() const { return m_delays.size(); }

private:
    std::vector<std::chrono::milliseconds> m_delays;
    size_t m_failures = 0;
};
