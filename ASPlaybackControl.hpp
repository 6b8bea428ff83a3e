#pragma once

#include "ASClock.hpp"
#include "ASCommandQueue.hpp"
#include "ITransportClient.hpp"
#include <atomic>
#include <mutex>

namespace AirStream {
namespace Playback {

enum class PlaybackState { Playing, Paused, Stopped };

inline const char *PlaybackStateToString(PlaybackState state) {
    switch (state) {
        case PlaybackState::Playing: return "PLAYING";
        case PlaybackState::Paused: return "PAUSED";
        case PlaybackState::Stopped: return "STOPPED";
        default: return "UNKNOWN";
    }
}

/**
 * Transport control state machine.
 *
 *   PLAYING --pause--> PAUSED        (transport pause + flush)
 *   PAUSED/STOPPED --pause--> same   (no-op)
 *   any --restart--> PLAYING         (startAt(now + 200ms - latency), no flush)
 *   any --stop/quit--> STOPPED       (transport stop + flush, shutdown requested)
 *
 * Every transition and the transport calls it makes run under one mutex.
 * The streaming loop takes the same mutex through whilePlaying() so a chunk
 * can never be sent in the middle of a pause or stop.
 */
class PlaybackControl {
  public:
    static constexpr uint64_t kRestartDelayMs = 200;

    PlaybackControl(Transport::ITransportClient &transport, Clock::IClock &clock);

    PlaybackControl(const PlaybackControl &) = delete;
    PlaybackControl &operator=(const PlaybackControl &) = delete;

    void apply(Command command);

    PlaybackState state() const;

    // Set once a stop/quit has been applied; never cleared
    bool shutdownRequested() const { return shutdown_.load(); }

    // Runs `fn` under the control mutex if the state is PLAYING.
    // Returns whatever `fn` returns, or false when not playing.
    template <typename Fn> bool whilePlaying(Fn &&fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != PlaybackState::Playing) {
            return false;
        }
        return fn();
    }

  private:
    void pauseLocked();
    void restartLocked();
    void stopLocked(Command command);

    Transport::ITransportClient &transport_;
    Clock::IClock &clock_;
    mutable std::mutex mutex_;
    PlaybackState state_ = PlaybackState::Playing;
    std::atomic<bool> shutdown_{false};
};

} // namespace Playback
} // namespace AirStream
