// ASClock.cpp
#include "ASClock.hpp"

#include <cstdio>

namespace AirStream {
namespace Clock {

std::string formatSeconds(NtpTime ntp) {
    char buf[32];
    uint32_t millis = static_cast<uint32_t>((static_cast<uint64_t>(ntpFraction(ntp)) * 1000ULL) >> 32);
    std::snprintf(buf, sizeof(buf), "%u.%03u", ntpSeconds(ntp), millis);
    return buf;
}

NtpTime SystemClock::fromTimePoint(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch())
                      .count();
    uint64_t secs = static_cast<uint64_t>(micros / 1000000) + kNTPvsUnixSeconds;
    uint64_t usec = static_cast<uint64_t>(micros % 1000000);
    return (secs << 32) | ((usec << 32) / 1000000ULL);
}

NtpTime SystemClock::now() {
    NtpTime reading = fromTimePoint(std::chrono::system_clock::now());
    NtpTime previous = last_.load();
    while (reading > previous) {
        if (last_.compare_exchange_weak(previous, reading)) {
            return reading;
        }
    }
    // Clock stepped backwards (or a concurrent reader got further); hold
    return previous;
}

} // namespace Clock
} // namespace AirStream
