// ASClock.hpp
#ifndef AIRSTREAM_CLOCK_HPP
#define AIRSTREAM_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace AirStream {
namespace Clock {

// 64-bit NTP timestamp: seconds since 1900-01-01 in the high word, binary
// fraction of a second in the low word. Wrap-around at 2^64 is not handled.
using NtpTime = uint64_t;

constexpr uint64_t kNTPvsUnixSeconds =
    2208988800ULL; // Seconds between NTP epoch (1900) and Unix epoch (1970)
constexpr uint32_t kDefaultSampleRate = 44100;

// --- Unit conversions ---
// All conversions are integer fixed-point and truncate toward zero.

constexpr uint64_t ntpToMs(NtpTime ntp) {
    return ((ntp >> 10) * 1000ULL) >> 22;
}

constexpr NtpTime msToNtp(uint64_t ms) {
    return ((ms << 22) / 1000ULL) << 10;
}

constexpr uint64_t ntpToTicks(NtpTime ntp, uint32_t rate) {
    return ((ntp >> 16) * rate) >> 16;
}

constexpr NtpTime ticksToNtp(uint64_t ticks, uint32_t rate) {
    return ((ticks << 16) / rate) << 16;
}

constexpr uint64_t msToTicks(uint64_t ms, uint32_t rate) {
    return (ms * rate) / 1000ULL;
}

constexpr uint64_t ticksToMs(uint64_t ticks, uint32_t rate) {
    return ntpToMs(ticksToNtp(ticks, rate));
}

// Signed tick distance for an NTP difference that may be negative
constexpr int64_t ntpDiffToTicks(NtpTime later, NtpTime earlier, uint32_t rate) {
    return later >= earlier
               ? static_cast<int64_t>(ntpToTicks(later - earlier, rate))
               : -static_cast<int64_t>(ntpToTicks(earlier - later, rate));
}

constexpr uint32_t ntpSeconds(NtpTime ntp) { return static_cast<uint32_t>(ntp >> 32); }
constexpr uint32_t ntpFraction(NtpTime ntp) { return static_cast<uint32_t>(ntp & 0xFFFFFFFFULL); }
constexpr NtpTime makeNtp(uint32_t secs, uint32_t frac) {
    return (static_cast<uint64_t>(secs) << 32) | frac;
}

// "<seconds>.<milliseconds>" for log lines
std::string formatSeconds(NtpTime ntp);

// Source of the shared time domain
class IClock {
  public:
    virtual ~IClock() = default;
    virtual NtpTime now() = 0;
};

// Wall clock mapped to NTP. Readings never go backwards, even if the
// system clock is stepped.
class SystemClock : public IClock {
  public:
    NtpTime now() override;

    static NtpTime fromTimePoint(std::chrono::system_clock::time_point tp);

  private:
    std::atomic<NtpTime> last_{0};
};

} // namespace Clock
} // namespace AirStream

#endif // AIRSTREAM_CLOCK_HPP
