#include "PlayerApp.hpp"
#include "ASAudioSource.hpp"
#include "ASCommandQueue.hpp"
#include "ASPlaybackControl.hpp"
#include "ASScheduler.hpp"
#include "RaopClient.hpp"
#include "logger.hpp"

namespace AirStream {

namespace {
constexpr uint32_t kChannels = 2;
constexpr uint32_t kSampleSize = 16;
constexpr uint32_t kBytesPerFrame = kChannels * kSampleSize / 8;
} // namespace

PlayerApp::PlayerApp(PlayerConfig config, Clock::IClock &clock,
                     TransportFactory transportFactory, KeySourceFactory keySourceFactory)
    : config_(std::move(config)), clock_(clock),
      transportFactory_(std::move(transportFactory)),
      keySourceFactory_(std::move(keySourceFactory)) {
    if (!keySourceFactory_) {
        keySourceFactory_ = []() { return std::make_unique<Playback::TerminalKeySource>(); };
    }
}

std::unique_ptr<Transport::ITransportClient>
PlayerApp::makeRaopClient(const PlayerConfig &config, Clock::IClock &clock) {
    Raop::RaopClientConfig raop;
    raop.host = config.serverAddress;
    raop.codec = config.alac ? Raop::Codec::ALACRaw : Raop::Codec::PCM;
    raop.crypto = config.encrypt ? Raop::Crypto::RSA : Raop::Crypto::Clear;
    raop.latency = config.requestedLatency();
    raop.sampleRate = Clock::kDefaultSampleRate;
    raop.sampleSize = kSampleSize;
    raop.channels = kChannels;
    raop.volume = Raop::RaopClient::floatVolume(config.volume);
    raop.password = config.password;
    raop.secret = config.secret;
    raop.rsaKeyPath = config.rsaKeyPath;
    return std::make_unique<Raop::RaopClient>(std::move(raop), clock);
}

int PlayerApp::run() {
    Logger::getInstance().setLevel(Logger::levelFromDebug(config_.debug));

    if (!config_.ntpFile.empty()) {
        Clock::NtpTime now = clock_.now();
        writeNtpFile(config_.ntpFile, now);
        LOG_DEBUG("Wrote NTP {} to {}", now, config_.ntpFile);
        return 0;
    }

    Clock::NtpTime start = config_.start;
    if (!config_.startFile.empty()) {
        start = readStartTimeFile(config_.startFile);
    }

    Playback::FileSource source(config_.filename);

    std::unique_ptr<Transport::ITransportClient> transport = transportFactory_(config_);
    if (!transport->connect(config_.port, true)) {
        LOG_ERROR("Can not connect to AirPlay device {}", config_.serverAddress);
        return 1;
    }

    const uint32_t latency = transport->latency();
    const uint32_t rate = transport->sampleRate();
    LOG_INFO("Connected to {} on port {}, player latency is {} ms", config_.serverAddress,
             config_.port, Clock::ticksToMs(latency, rate));

    if (start || config_.waitMs) {
        std::optional<Clock::NtpTime> base;
        if (start) {
            base = start;
        }
        auto scheduled = Playback::scheduleStart(base, config_.waitMs, latency, rate, clock_);
        LOG_INFO("Now {}, audio starts at NTP {} (in {} ms)",
                 Clock::formatSeconds(scheduled.now), Clock::formatSeconds(scheduled.startAt),
                 scheduled.inMs);
        if (!transport->startAt(scheduled.startAt)) {
            LOG_WARN("Transport refused start at {}", Clock::formatSeconds(scheduled.startAt));
        }
    }

    Playback::PlaybackControl control(*transport, clock_);
    Playback::CommandQueue commands;

    std::unique_ptr<Playback::IKeySource> keys;
    std::unique_ptr<Playback::InputListener> listener;
    if (config_.interactive) {
        keys = keySourceFactory_();
        listener = std::make_unique<Playback::InputListener>(*keys, commands);
        listener->start();
    }

    Playback::Streamer streamer(*transport, control, &commands, source, clock_, kBytesPerFrame,
                                streamerOptions_);
    auto reason = streamer.run();
    LOG_DEBUG("Streaming ended ({})",
              reason == Playback::ExitReason::Shutdown ? "shutdown" : "finished");

    if (listener) {
        listener->stop();
    }
    if (!transport->disconnect()) {
        LOG_WARN("Disconnect from {} was not clean", config_.serverAddress);
    }
    return 0;
}

} // namespace AirStream
