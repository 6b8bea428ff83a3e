#pragma once

#include "ASClock.hpp"
#include "ASInputListener.hpp"
#include "ASStreamer.hpp"
#include "ITransportClient.hpp"
#include "PlayerConfig.hpp"
#include <functional>
#include <memory>

namespace AirStream {

/**
 * Owns one playback run: NTP dump, connect, scheduling, the streaming loop and
 * the optional interactive listener. Process exit codes come from run().
 */
class PlayerApp {
  public:
    using TransportFactory =
        std::function<std::unique_ptr<Transport::ITransportClient>(const PlayerConfig &)>;
    using KeySourceFactory = std::function<std::unique_ptr<Playback::IKeySource>()>;

    PlayerApp(PlayerConfig config, Clock::IClock &clock, TransportFactory transportFactory,
              KeySourceFactory keySourceFactory = {});

    /**
     * @return 0 on normal completion, NTP dump or interactive stop; 1 when the
     *         receiver can not be reached.
     * Throws std::runtime_error when the audio or start time file is unusable.
     */
    int run();

    void setStreamerOptions(const Playback::StreamerOptions &options) { streamerOptions_ = options; }

    // Default factory: a RaopClient built from the command line
    static std::unique_ptr<Transport::ITransportClient> makeRaopClient(const PlayerConfig &config,
                                                                       Clock::IClock &clock);

  private:
    PlayerConfig config_;
    Clock::IClock &clock_;
    TransportFactory transportFactory_;
    KeySourceFactory keySourceFactory_;
    Playback::StreamerOptions streamerOptions_;
};

} // namespace AirStream
