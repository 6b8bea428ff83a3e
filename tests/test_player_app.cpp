#include "PlayerApp.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace AirStream;
using AirStream::Testing::FakeTransport;
using AirStream::Testing::ManualClock;
using AirStream::Testing::ScriptedKeySource;

namespace {

// Hands the app a transport whose state outlives the run
class ForwardingTransport : public Transport::ITransportClient {
  public:
    explicit ForwardingTransport(FakeTransport &target) : target_(target) {}

    bool connect(uint16_t port, bool setVolume) override { return target_.connect(port, setVolume); }
    bool disconnect() override { return target_.disconnect(); }
    bool startAt(Clock::NtpTime startTime) override { return target_.startAt(startTime); }
    void pause() override { target_.pause(); }
    void stop() override { target_.stop(); }
    bool flush() override { return target_.flush(); }
    bool keepAlive() override { return target_.keepAlive(); }
    bool acceptFrames() override { return target_.acceptFrames(); }
    Transport::SendResult sendChunk(std::span<const uint8_t> pcm) override {
        return target_.sendChunk(pcm);
    }
    bool isPlaying() override { return target_.isPlaying(); }
    uint32_t latency() const override { return target_.latency(); }
    uint32_t sampleRate() const override { return target_.sampleRate(); }

  private:
    FakeTransport &target_;
};

std::string tempPath(const std::string &name) {
    return ::testing::TempDir() + "airstream_app_" + name;
}

} // namespace

class PlayerAppTest : public ::testing::Test {
  protected:
    void SetUp() override {
        audioPath = tempPath("audio.pcm");
        std::ofstream out(audioPath, std::ios::binary);
        std::string frames(8820 * 4, '\x01');
        out.write(frames.data(), static_cast<std::streamsize>(frames.size()));

        config.serverAddress = "192.168.1.20";
        config.filename = audioPath;
    }

    void TearDown() override { std::remove(audioPath.c_str()); }

    PlayerApp makeApp(PlayerApp::KeySourceFactory keys = {}) {
        PlayerApp app(config, clock,
                      [this](const PlayerConfig &) {
                          ++factoryCalls;
                          return std::make_unique<ForwardingTransport>(transport);
                      },
                      std::move(keys));
        Playback::StreamerOptions options;
        options.idleSleep = std::chrono::microseconds(0);
        app.setStreamerOptions(options);
        return app;
    }

    std::string audioPath;
    PlayerConfig config;
    ManualClock clock;
    FakeTransport transport;
    int factoryCalls = 0;
};

TEST_F(PlayerAppTest, NtpDumpWritesTimeAndSkipsConnect) {
    std::string ntpPath = tempPath("ntp");
    config.ntpFile = ntpPath;
    PlayerApp app = makeApp();

    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(factoryCalls, 0);

    std::ifstream in(ntpPath);
    std::string text;
    in >> text;
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.find_first_not_of("0123456789"), std::string::npos);
    EXPECT_GT(std::stoull(text), 0u);
    EXPECT_EQ(std::stoull(text), Clock::makeNtp(3900000000u, 0));
    std::remove(ntpPath.c_str());
}

TEST_F(PlayerAppTest, ConnectFailureExitsWithOne) {
    transport.connectResult = false;
    PlayerApp app = makeApp();
    EXPECT_EQ(app.run(), 1);
    EXPECT_EQ(transport.connects, 1);
    EXPECT_TRUE(transport.chunks.empty());
}

TEST_F(PlayerAppTest, MissingAudioFileThrowsBeforeConnect) {
    config.filename = tempPath("missing.pcm");
    PlayerApp app = makeApp();
    EXPECT_THROW(app.run(), std::runtime_error);
    EXPECT_EQ(factoryCalls, 0);
}

TEST_F(PlayerAppTest, MissingStartFileThrows) {
    config.startFile = tempPath("missing_start");
    PlayerApp app = makeApp();
    EXPECT_THROW(app.run(), std::runtime_error);
    EXPECT_EQ(factoryCalls, 0);
}

TEST_F(PlayerAppTest, StreamsWholeFileUntilTransportFinishes) {
    transport.playingFor = 40;
    PlayerApp app = makeApp();

    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(transport.chunks.size(), 26u);
    EXPECT_EQ(transport.totalBytes(), 8820u * 4u);
    EXPECT_TRUE(transport.starts.empty());
    EXPECT_EQ(transport.disconnects, 1);
}

TEST_F(PlayerAppTest, WaitSchedulesStart) {
    transport.playingFor = 0;
    config.waitMs = 2000;
    PlayerApp app = makeApp();
    Clock::NtpTime now = clock.now();

    EXPECT_EQ(app.run(), 0);
    ASSERT_EQ(transport.starts.size(), 1u);
    EXPECT_EQ(transport.starts[0],
              now + Clock::msToNtp(2000) - Clock::ticksToNtp(transport.latencyTicks, 44100));
}

TEST_F(PlayerAppTest, StartFileOverridesStartOption) {
    transport.playingFor = 0;
    std::string startPath = tempPath("start");
    {
        std::ofstream out(startPath);
        out << Clock::makeNtp(4000000000u, 0);
    }
    config.start = Clock::makeNtp(3950000000u, 0);
    config.startFile = startPath;
    PlayerApp app = makeApp();

    EXPECT_EQ(app.run(), 0);
    ASSERT_EQ(transport.starts.size(), 1u);
    EXPECT_EQ(transport.starts[0],
              Clock::makeNtp(4000000000u, 0) - Clock::ticksToNtp(transport.latencyTicks, 44100));
    std::remove(startPath.c_str());
}

TEST_F(PlayerAppTest, InteractiveStopEndsRun) {
    config.interactive = true;
    PlayerApp app = makeApp([]() { return std::make_unique<ScriptedKeySource>("s"); });

    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(transport.stops, 1);
    EXPECT_EQ(transport.flushes, 1);
    EXPECT_EQ(transport.disconnects, 1);
}

TEST_F(PlayerAppTest, RefusedStartIsLoggedAndPlaybackContinues) {
    transport.playingFor = 0;
    transport.startResult = false;
    config.waitMs = 500;
    PlayerApp app = makeApp();

    ::testing::internal::CaptureStdout();
    int rc = app.run();
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(transport.starts.size(), 1u);
    EXPECT_NE(output.find("[WARNING]"), std::string::npos);
    EXPECT_NE(output.find("Transport refused start at"), std::string::npos);
    EXPECT_EQ(transport.disconnects, 1);
}
