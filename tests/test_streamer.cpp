#include "ASStreamer.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

using namespace AirStream;
using namespace AirStream::Playback;
using AirStream::Testing::FakeTransport;
using AirStream::Testing::ManualClock;
using AirStream::Testing::MemorySource;

namespace {
constexpr uint32_t kBytesPerFrame = 4;
constexpr size_t kChunkBytes = kFramesPerChunk * kBytesPerFrame;
} // namespace

class StreamerTest : public ::testing::Test {
  protected:
    StreamerOptions fastOptions() {
        StreamerOptions options;
        options.idleSleep = std::chrono::microseconds(0);
        return options;
    }

    ManualClock clock;
    FakeTransport transport;
    CommandQueue commands;
};

TEST_F(StreamerTest, ChunkIsWholeFrames) {
    PlaybackControl control(transport, clock);
    MemorySource source(0);
    StreamerOptions options = fastOptions();
    options.chunkBytes = 1410;
    Streamer streamer(transport, control, nullptr, source, clock, kBytesPerFrame, options);
    EXPECT_EQ(streamer.chunkBytes(), 1408u);

    Streamer defaults(transport, control, nullptr, source, clock, kBytesPerFrame);
    EXPECT_EQ(defaults.chunkBytes(), kChunkBytes);
}

TEST_F(StreamerTest, RejectsZeroFrameSize) {
    PlaybackControl control(transport, clock);
    MemorySource source(0);
    EXPECT_THROW(Streamer(transport, control, nullptr, source, clock, 0), std::invalid_argument);
}

TEST_F(StreamerTest, SendsOnlyWhenTransportAccepts) {
    transport.alternateAccept = true;
    PlaybackControl control(transport, clock);
    MemorySource source(100 * kChunkBytes);
    Streamer streamer(transport, control, nullptr, source, clock, kBytesPerFrame, fastOptions());

    streamer.begin();
    int sent = 0;
    for (int i = 0; i < 10; ++i) {
        if (streamer.step() == StepOutcome::Sent) {
            ++sent;
        }
    }
    EXPECT_EQ(transport.acceptCalls, 10);
    EXPECT_EQ(sent, 5);
    EXPECT_EQ(transport.chunks.size(), 5u);
    EXPECT_EQ(streamer.cursor().frames, 5u * kFramesPerChunk);
}

TEST_F(StreamerTest, StatusOncePerSecondAfterLatencyFilled) {
    PlaybackControl control(transport, clock);
    MemorySource source(100 * kChunkBytes);
    Streamer streamer(transport, control, nullptr, source, clock, kBytesPerFrame, fastOptions());

    streamer.begin();
    // 48 steps of 250 ms: the timer fires every 4th step. 11025 frames of
    // latency need 32 chunks, so only the checks at steps 36, 40, 44 and 48
    // see more frames than the latency.
    for (int i = 1; i <= 48; ++i) {
        clock.advanceMs(250);
        streamer.step();
    }
    EXPECT_EQ(streamer.cursor().frames, 48u * kFramesPerChunk);
    EXPECT_EQ(streamer.statusReports(), 4u);
    EXPECT_EQ(streamer.cursor().lastStatus, clock.now());
}

TEST_F(StreamerTest, NoStatusWhileTimeStandsStill) {
    PlaybackControl control(transport, clock);
    MemorySource source(100 * kChunkBytes);
    Streamer streamer(transport, control, nullptr, source, clock, kBytesPerFrame, fastOptions());

    streamer.begin();
    for (int i = 0; i < 100; ++i) {
        streamer.step();
    }
    EXPECT_EQ(streamer.statusReports(), 0u);
}

TEST_F(StreamerTest, KeepAliveEveryThirtySeconds) {
    PlaybackControl control(transport, clock);
    MemorySource source(0);
    Streamer streamer(transport, control, nullptr, source, clock, kBytesPerFrame, fastOptions());

    streamer.begin();
    auto stepFor = [&](int steps) {
        for (int i = 0; i < steps; ++i) {
            clock.advanceMs(250);
            streamer.step();
        }
    };

    stepFor(119);
    EXPECT_EQ(transport.keepAlives, 0);
    stepFor(1); // 30 s
    EXPECT_EQ(transport.keepAlives, 1);
    EXPECT_EQ(streamer.keepAlives(), 1u);
    stepFor(119);
    EXPECT_EQ(transport.keepAlives, 1);
    stepFor(1); // 60 s
    EXPECT_EQ(transport.keepAlives, 2);
}

TEST_F(StreamerTest, ShortFileEndsOnlyWhenTransportStopsPlaying) {
    // 8820 frames of 4 bytes in 1408 byte chunks: 25 full chunks and one of 80
    transport.playingFor = 40;
    PlaybackControl control(transport, clock);
    MemorySource source(8820 * kBytesPerFrame);
    Streamer streamer(transport, control, &commands, source, clock, kBytesPerFrame,
                      fastOptions());

    EXPECT_EQ(streamer.run(), ExitReason::Finished);
    EXPECT_EQ(transport.chunks.size(), 26u);
    EXPECT_EQ(transport.chunks.back(), 80u);
    EXPECT_EQ(transport.totalBytes(), 8820u * kBytesPerFrame);
    EXPECT_EQ(streamer.cursor().frames, 8820u);
    // The loop kept polling after the source ran dry
    EXPECT_EQ(transport.acceptCalls, 41);
}

TEST_F(StreamerTest, PauseHoldsAudioAndStopShutsDown) {
    PlaybackControl control(transport, clock);
    MemorySource source(100 * kChunkBytes);
    Streamer streamer(transport, control, &commands, source, clock, kBytesPerFrame,
                      fastOptions());

    streamer.begin();
    EXPECT_EQ(streamer.step(), StepOutcome::Sent);

    commands.push(Command::Pause);
    EXPECT_EQ(streamer.step(), StepOutcome::Idle);
    EXPECT_EQ(streamer.step(), StepOutcome::Idle);
    EXPECT_EQ(transport.chunks.size(), 1u);
    EXPECT_EQ(transport.pauses, 1);

    commands.push(Command::Restart);
    EXPECT_EQ(streamer.step(), StepOutcome::Sent);
    EXPECT_EQ(transport.starts.size(), 1u);

    commands.push(Command::Stop);
    EXPECT_EQ(streamer.step(), StepOutcome::Shutdown);
    EXPECT_EQ(transport.stops, 1);
    EXPECT_EQ(transport.chunks.size(), 2u);
}
