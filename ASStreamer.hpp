#pragma once

#include "ASAudioSource.hpp"
#include "ASClock.hpp"
#include "ASCommandQueue.hpp"
#include "ASPlaybackControl.hpp"
#include "ITransportClient.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace AirStream {
namespace Playback {

// Frames per RTP packet for RAOP
constexpr uint32_t kFramesPerChunk = 352;

struct StreamerOptions {
    size_t chunkBytes = 0; // 0 selects kFramesPerChunk frames
    std::chrono::microseconds idleSleep{1000};
    uint64_t statusIntervalMs = 1000;
    uint64_t keepAliveIntervalMs = 30000;
};

struct FrameCursor {
    uint64_t frames = 0;             // frames handed to the transport
    Clock::NtpTime start = 0;        // loop start
    Clock::NtpTime lastStatus = 0;
    Clock::NtpTime lastKeepAlive = 0;
};

enum class StepOutcome {
    Sent,     // a chunk went out
    Idle,     // nothing to do this time around
    Finished, // transport reports it is no longer playing
    Shutdown  // stop/quit was applied
};

enum class ExitReason { Finished, Shutdown };

/**
 * Polling loop that pushes audio to the transport.
 *
 * Each step applies queued commands, runs the status and keepalive timers,
 * sends one chunk if the state is PLAYING and the transport accepts frames,
 * then checks transport liveness. Pausing or running out of audio does not
 * end the loop; only liveness or a shutdown request does.
 */
class Streamer {
  public:
    Streamer(Transport::ITransportClient &transport, PlaybackControl &control,
             CommandQueue *commands, IAudioSource &source, Clock::IClock &clock,
             uint32_t bytesPerFrame, StreamerOptions options = {});

    Streamer(const Streamer &) = delete;
    Streamer &operator=(const Streamer &) = delete;

    // Resets the cursor to the current time. run() calls this itself.
    void begin();

    StepOutcome step();

    ExitReason run();

    const FrameCursor &cursor() const { return cursor_; }
    size_t chunkBytes() const { return buffer_.size(); }
    uint64_t chunksSent() const { return chunksSent_; }
    uint64_t statusReports() const { return statusReports_; }
    uint64_t keepAlives() const { return keepAlives_; }

  private:
    void drainCommands();
    void runTimers(Clock::NtpTime now);
    bool sendNextChunk();
    uint64_t playedMs() const;

    Transport::ITransportClient &transport_;
    PlaybackControl &control_;
    CommandQueue *commands_;
    IAudioSource &source_;
    Clock::IClock &clock_;
    const uint32_t bytesPerFrame_;
    const StreamerOptions options_;

    uint32_t latency_;
    uint32_t sampleRate_;
    std::vector<uint8_t> buffer_;
    FrameCursor cursor_;

    uint64_t chunksSent_ = 0;
    uint64_t statusReports_ = 0;
    uint64_t keepAlives_ = 0;
};

} // namespace Playback
} // namespace AirStream
