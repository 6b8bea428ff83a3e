#include "ASClock.hpp"
#include <gtest/gtest.h>

using namespace AirStream::Clock;

TEST(ClockConversions, OneSecondIsExact) {
    EXPECT_EQ(msToTicks(1000, 44100), 44100u);
    EXPECT_EQ(ticksToMs(44100, 44100), 1000u);
    EXPECT_EQ(msToNtp(1000), 1ULL << 32);
    EXPECT_EQ(ntpToMs(1ULL << 32), 1000u);
    EXPECT_EQ(ticksToNtp(44100, 44100), 1ULL << 32);
    EXPECT_EQ(ntpToTicks(1ULL << 32, 44100), 44100u);
}

TEST(ClockConversions, MillisecondRoundTripWithinOne) {
    for (uint64_t ms : {0ULL, 1ULL, 7ULL, 200ULL, 999ULL, 12345ULL, 86400000ULL}) {
        uint64_t back = ntpToMs(msToNtp(ms));
        EXPECT_LE(back, ms);
        EXPECT_LE(ms - back, 1u) << "ms=" << ms;
    }
}

TEST(ClockConversions, TickRoundTripWithinOne) {
    for (uint32_t rate : {44100u, 48000u}) {
        for (uint64_t ticks : {0ULL, 1ULL, 352ULL, 11025ULL, 44100ULL, 1000003ULL}) {
            uint64_t back = ntpToTicks(ticksToNtp(ticks, rate), rate);
            EXPECT_LE(back, ticks);
            EXPECT_LE(ticks - back, 1u) << "ticks=" << ticks << " rate=" << rate;
        }
    }
}

TEST(ClockConversions, SignedTickDistance) {
    NtpTime base = makeNtp(100, 0);
    EXPECT_EQ(ntpDiffToTicks(base + msToNtp(1000), base, 44100), 44100);
    EXPECT_EQ(ntpDiffToTicks(base, base + msToNtp(1000), 44100), -44100);
    EXPECT_EQ(ntpDiffToTicks(base, base, 44100), 0);
}

TEST(ClockConversions, NtpParts) {
    NtpTime t = makeNtp(0x12345678u, 0x9ABCDEF0u);
    EXPECT_EQ(ntpSeconds(t), 0x12345678u);
    EXPECT_EQ(ntpFraction(t), 0x9ABCDEF0u);
}

TEST(ClockFormat, SecondsAndMilliseconds) {
    EXPECT_EQ(formatSeconds(makeNtp(12, 0x80000000u)), "12.500");
    EXPECT_EQ(formatSeconds(makeNtp(3900000000u, 0)), "3900000000.000");
    EXPECT_EQ(formatSeconds(makeNtp(1, 0x40000000u)), "1.250");
}

TEST(SystemClock, UnixEpochMapsToNtpOffset) {
    auto epoch = std::chrono::system_clock::time_point{};
    EXPECT_EQ(SystemClock::fromTimePoint(epoch), kNTPvsUnixSeconds << 32);
}

TEST(SystemClock, NeverGoesBackwards) {
    SystemClock clock;
    NtpTime previous = clock.now();
    EXPECT_GT(ntpSeconds(previous), kNTPvsUnixSeconds);
    for (int i = 0; i < 1000; ++i) {
        NtpTime reading = clock.now();
        EXPECT_GE(reading, previous);
        previous = reading;
    }
}
