#pragma once

#include "ASClock.hpp"
#include <cstdint>
#include <optional>

namespace AirStream {
namespace Playback {

struct ScheduledStart {
    Clock::NtpTime startAt = 0; // Value handed to the transport's startAt()
    Clock::NtpTime now = 0;     // Clock reading used for the computation
    uint64_t inMs = 0;          // Time until the first frame is heard, 0 if past
};

/**
 * @brief Computes the NTP time to hand to ITransportClient::startAt().
 *
 * result = (base or now) + msToNtp(waitMs) - ticksToNtp(latencyTicks, rate)
 *
 * The output latency is subtracted so that the first frame is *heard* at
 * base + wait. The result may lie in the past, in which case the transport
 * starts as soon as it can.
 */
Clock::NtpTime computeStart(std::optional<Clock::NtpTime> base, uint64_t waitMs,
                            uint32_t latencyTicks, uint32_t sampleRate,
                            Clock::IClock &clock);

// Same computation, also reporting the lead time for the start log line
ScheduledStart scheduleStart(std::optional<Clock::NtpTime> base, uint64_t waitMs,
                             uint32_t latencyTicks, uint32_t sampleRate,
                             Clock::IClock &clock);

} // namespace Playback
} // namespace AirStream
