#include "IdGenerator.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

std::string generateUuid() {
    static thread_local std::mt19937_64 generator(std::random_device{}());
    std::uniform_int_distribution<uint64_t> distribution;

    uint64_t hi = distribution(generator);
    uint64_t lo = distribution(generator);

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<uint32_t>(hi >> 32) << "-"
       << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFF) << "-"
       << std::setw(4) << static_cast<uint32_t>(lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::string currentIsoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}
