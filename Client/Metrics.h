#pragma once
#ifndef CALLCLIENT_METRICS_H
#define CALLCLIENT_METRICS_H

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace CallMetrics {

// Capture -> transport
inline std::atomic<uint64_t>& framesCaptured() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& framesSent() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& framesDropped() { static std::atomic<uint64_t> v{0}; return v; }

// Inbound protocol
inline std::atomic<uint64_t>& messagesReceived() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& malformedMessages() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& unknownMessages() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& reconnectAttempts() { static std::atomic<uint64_t> v{0}; return v; }

// Playback
inline std::atomic<uint64_t>& chunksQueued() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& chunksPlayed() { static std::atomic<uint64_t> v{0}; return v; }
inline std::atomic<uint64_t>& decodeFailures() { static std::atomic<uint64_t> v{0}; return v; }

// Access helpers
inline uint64_t load(std::atomic<uint64_t>& c) { return c.load(std::memory_order_relaxed); }
inline void inc(std::atomic<uint64_t>& c, uint64_t n=1) { c.fetch_add(n, std::memory_order_relaxed); }

inline std::string summary() {
    std::ostringstream ss;
    ss << "frames captured=" << load(framesCaptured())
       << " sent=" << load(framesSent())
       << " dropped=" << load(framesDropped())
       << " | messages=" << load(messagesReceived())
       << " malformed=" << load(malformedMessages())
       << " unknown=" << load(unknownMessages())
       << " reconnects=" << load(reconnectAttempts())
       << " | chunks queued=" << load(chunksQueued())
       << " played=" << load(chunksPlayed())
       << " decodeFailures=" << load(decodeFailures());
    return ss.str();
}

} // namespace CallMetrics

#endif // CALLCLIENT_METRICS_H
