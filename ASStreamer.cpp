#include "ASStreamer.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <thread>

namespace AirStream {
namespace Playback {

Streamer::Streamer(Transport::ITransportClient &transport, PlaybackControl &control,
                   CommandQueue *commands, IAudioSource &source,
                   Clock::IClock &clock, uint32_t bytesPerFrame,
                   StreamerOptions options)
    : transport_(transport), control_(control), commands_(commands),
      source_(source), clock_(clock), bytesPerFrame_(bytesPerFrame),
      options_(options), latency_(transport.latency()),
      sampleRate_(transport.sampleRate()) {
    if (bytesPerFrame_ == 0) {
        throw std::invalid_argument("bytesPerFrame must be positive");
    }
    size_t chunk = options_.chunkBytes ? options_.chunkBytes
                                       : kFramesPerChunk * bytesPerFrame_;
    // Whole frames only
    chunk -= chunk % bytesPerFrame_;
    if (chunk == 0) {
        throw std::invalid_argument("chunk smaller than one frame");
    }
    buffer_.resize(chunk);
}

void Streamer::begin() {
    Clock::NtpTime now = clock_.now();
    cursor_ = FrameCursor{};
    cursor_.start = now;
    cursor_.lastStatus = now;
    cursor_.lastKeepAlive = now;
    chunksSent_ = 0;
    statusReports_ = 0;
    keepAlives_ = 0;
}

void Streamer::drainCommands() {
    if (!commands_) {
        return;
    }
    while (auto command = commands_->tryPop()) {
        control_.apply(*command);
    }
}

uint64_t Streamer::playedMs() const {
    if (cursor_.frames <= latency_) {
        return 0;
    }
    return Clock::ticksToMs(cursor_.frames - latency_, sampleRate_);
}

void Streamer::runTimers(Clock::NtpTime now) {
    if (now - cursor_.lastStatus >= Clock::msToNtp(options_.statusIntervalMs)) {
        cursor_.lastStatus = now;
        // Nothing audible yet while the receiver is still filling its latency
        if (cursor_.frames > latency_) {
            ++statusReports_;
            LOG_INFO("At {}, ({} ms after start), played {} ms",
                     Clock::formatSeconds(now), Clock::ntpToMs(now - cursor_.start),
                     playedMs());
        }
    }

    if (now - cursor_.lastKeepAlive >= Clock::msToNtp(options_.keepAliveIntervalMs)) {
        cursor_.lastKeepAlive = now;
        ++keepAlives_;
        LOG_INFO("Keep alive: At {}, ({} ms after start), played {} ms",
                 Clock::formatSeconds(now), Clock::ntpToMs(now - cursor_.start),
                 playedMs());
        if (!transport_.keepAlive()) {
            LOG_WARN("Keep alive failed");
        }
    }
}

bool Streamer::sendNextChunk() {
    return control_.whilePlaying([this]() {
        if (!transport_.acceptFrames()) {
            return false;
        }
        size_t bytes = source_.read(buffer_.data(), buffer_.size());
        if (bytes == 0) {
            return false;
        }

        auto result = transport_.sendChunk(std::span<const uint8_t>(buffer_.data(), bytes));
        if (!result.ok) {
            LOG_WARN("Sending chunk of {} bytes failed", bytes);
        } else {
            LOG_VERBOSE("Chunk of {} bytes plays at {}", bytes,
                        Clock::formatSeconds(result.playtime));
        }
        cursor_.frames += bytes / bytesPerFrame_;
        ++chunksSent_;
        return true;
    });
}

StepOutcome Streamer::step() {
    drainCommands();
    if (control_.shutdownRequested()) {
        return StepOutcome::Shutdown;
    }

    runTimers(clock_.now());

    bool sent = sendNextChunk();

    if (!transport_.isPlaying()) {
        return StepOutcome::Finished;
    }
    return sent ? StepOutcome::Sent : StepOutcome::Idle;
}

ExitReason Streamer::run() {
    begin();
    LOG_DEBUG("Streaming with {} byte chunks, latency {} frames", buffer_.size(),
              latency_);

    while (true) {
        switch (step()) {
            case StepOutcome::Sent:
                break;
            case StepOutcome::Idle:
                if (options_.idleSleep.count() > 0) {
                    std::this_thread::sleep_for(options_.idleSleep);
                }
                break;
            case StepOutcome::Finished:
                LOG_DEBUG("Transport finished after {} frames", cursor_.frames);
                return ExitReason::Finished;
            case StepOutcome::Shutdown:
                LOG_DEBUG("Shutdown requested after {} frames", cursor_.frames);
                return ExitReason::Shutdown;
        }
    }
}

} // namespace Playback
} // namespace AirStream
