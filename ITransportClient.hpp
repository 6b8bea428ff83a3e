#pragma once

#include "ASClock.hpp"
#include <cstdint>
#include <span>

namespace AirStream {
namespace Transport {

struct SendResult {
    bool ok = false;
    Clock::NtpTime playtime = 0; // NTP time at which the chunk will be heard
};

/**
 * Capability that carries audio to a receiver. The playback core only sees
 * this interface; session handshake, packet framing and encryption live
 * behind it. Destroying the object releases the session.
 */
class ITransportClient {
public:
    virtual ~ITransportClient() = default;

    /**
     * @brief Opens the session with the receiver.
     * @param port Receiver control port (5000 for RAOP).
     * @param setVolume Push the configured volume once connected.
     * @return false on any failure; the caller treats this as fatal.
     */
    virtual bool connect(uint16_t port, bool setVolume) = 0;

    /**
     * @brief Ends the session. Safe to call when not connected.
     */
    virtual bool disconnect() = 0;

    /**
     * @brief Sets the NTP time at which the next sent frame starts its trip
     *        through the receiver (it is heard one latency later). A value in
     *        the past starts as soon as possible.
     */
    virtual bool startAt(Clock::NtpTime startTime) = 0;

    /**
     * @brief Stops pacing frames, keeping the session ready to resume.
     *        Usually followed by flush().
     */
    virtual void pause() = 0;

    /**
     * @brief Stops pacing frames for good. Usually followed by flush().
     */
    virtual void stop() = 0;

    /**
     * @brief Asks the receiver to drop everything buffered.
     */
    virtual bool flush() = 0;

    /**
     * @brief No-payload request that keeps the receiver from tearing down an
     *        idle session.
     */
    virtual bool keepAlive() = 0;

    /**
     * @brief Backpressure signal: true when the receiver can take one more
     *        chunk right now.
     */
    virtual bool acceptFrames() = 0;

    /**
     * @brief Sends one chunk of interleaved little-endian PCM frames.
     *        The chunk must not exceed the transport's frame length.
     */
    virtual SendResult sendChunk(std::span<const uint8_t> pcm) = 0;

    /**
     * @brief Liveness: false once the session is gone or has played out
     *        everything it was given.
     */
    virtual bool isPlaying() = 0;

    // Negotiated output latency in sample ticks
    virtual uint32_t latency() const = 0;
    virtual uint32_t sampleRate() const = 0;
};

} // namespace Transport
} // namespace AirStream
