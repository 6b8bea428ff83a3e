#include "ASScheduler.hpp"

namespace AirStream {
namespace Playback {

namespace {
Clock::NtpTime startFrom(Clock::NtpTime base, uint64_t waitMs,
                         uint32_t latencyTicks, uint32_t sampleRate) {
    return base + Clock::msToNtp(waitMs) -
           Clock::ticksToNtp(latencyTicks, sampleRate);
}
} // namespace

Clock::NtpTime computeStart(std::optional<Clock::NtpTime> base, uint64_t waitMs,
                            uint32_t latencyTicks, uint32_t sampleRate,
                            Clock::IClock &clock) {
    Clock::NtpTime from = base ? *base : clock.now();
    return startFrom(from, waitMs, latencyTicks, sampleRate);
}

ScheduledStart scheduleStart(std::optional<Clock::NtpTime> base, uint64_t waitMs,
                             uint32_t latencyTicks, uint32_t sampleRate,
                             Clock::IClock &clock) {
    ScheduledStart result;
    result.now = clock.now();
    result.startAt = startFrom(base ? *base : result.now, waitMs, latencyTicks,
                               sampleRate);

    Clock::NtpTime latencyNtp = Clock::ticksToNtp(latencyTicks, sampleRate);
    Clock::NtpTime heardAt = result.startAt + latencyNtp;
    result.inMs = heardAt > result.now ? Clock::ntpToMs(heardAt - result.now) : 0;
    return result;
}

} // namespace Playback
} // namespace AirStream
