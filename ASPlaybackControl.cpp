#include "ASPlaybackControl.hpp"
#include "ASScheduler.hpp"
#include "logger.hpp"

namespace AirStream {
namespace Playback {

PlaybackControl::PlaybackControl(Transport::ITransportClient &transport,
                                 Clock::IClock &clock)
    : transport_(transport), clock_(clock) {}

PlaybackState PlaybackControl::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void PlaybackControl::apply(Command command) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("Applying '{}' in state {}", CommandToString(command),
              PlaybackStateToString(state_));
    switch (command) {
        case Command::Pause:
            pauseLocked();
            break;
        case Command::Restart:
            restartLocked();
            break;
        case Command::Stop:
        case Command::Quit:
            stopLocked(command);
            break;
    }
}

void PlaybackControl::pauseLocked() {
    if (state_ != PlaybackState::Playing) {
        LOG_DEBUG("Pause ignored, not playing.");
        return;
    }
    transport_.pause();
    if (!transport_.flush()) {
        LOG_WARN("Flush after pause failed.");
    }
    state_ = PlaybackState::Paused;
    LOG_INFO("Pause at : {}", Clock::formatSeconds(clock_.now()));
}

void PlaybackControl::restartLocked() {
    // No flush here: whatever the receiver still holds is kept
    Clock::NtpTime startAt = computeStart(std::nullopt, kRestartDelayMs,
                                          transport_.latency(),
                                          transport_.sampleRate(), clock_);
    state_ = PlaybackState::Playing;
    if (!transport_.startAt(startAt)) {
        LOG_WARN("Transport refused start at {}", Clock::formatSeconds(startAt));
    }
    LOG_INFO("Restarted at : {}", Clock::formatSeconds(clock_.now()));
}

void PlaybackControl::stopLocked(Command command) {
    transport_.stop();
    if (!transport_.flush()) {
        LOG_WARN("Flush after {} failed.", CommandToString(command));
    }
    state_ = PlaybackState::Stopped;
    shutdown_.store(true);
    LOG_INFO("Stopped at : {}", Clock::formatSeconds(clock_.now()));
}

} // namespace Playback
} // namespace AirStream
