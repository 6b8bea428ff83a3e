#pragma once

#include "ASClock.hpp"
#include "ASTimingResponder.hpp"
#include "ITransportClient.hpp"
#include "RaopRtp.hpp"
#include "client.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/circular_buffer.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace AirStream {
namespace Raop {

struct RaopClientConfig {
    std::string host;
    Codec codec = Codec::PCM;
    Crypto crypto = Crypto::Clear;
    uint32_t framesPerPacket = kFramesPerPacket;
    uint32_t latency = 0; // requested, in frames
    uint32_t sampleRate = Clock::kDefaultSampleRate;
    uint8_t sampleSize = 16;
    uint8_t channels = 2;
    float volume = -15.0f; // dB, see RaopClient::floatVolume
    std::string password;
    std::string secret;
    std::string rsaKeyPath; // PEM public key, needed for Crypto::RSA
    std::chrono::seconds rtspTimeout{10};
};

/**
 * RAOP (AirPlay v1) sender.
 *
 * The RTSP dialogue runs over RTSPClient; audio goes out as RTP over UDP,
 * with sync packets and retransmits on the control port and timing replies on
 * the timing port. A private io_context thread drives all asynchronous work.
 * Calls on the ITransportClient interface block and must come from a thread
 * other than that io thread.
 */
class RaopClient : public Transport::ITransportClient,
                   private RTSP::RTSPClientDelegate {
public:
    enum class State { Down, Flushing, Flushed, Streaming };

    RaopClient(RaopClientConfig config, Clock::IClock &clock);
    ~RaopClient() override;

    RaopClient(const RaopClient &) = delete;
    RaopClient &operator=(const RaopClient &) = delete;

    bool connect(uint16_t port, bool setVolume) override;
    bool disconnect() override;
    bool startAt(Clock::NtpTime startTime) override;
    void pause() override;
    void stop() override;
    bool flush() override;
    bool keepAlive() override;
    bool acceptFrames() override;
    Transport::SendResult sendChunk(std::span<const uint8_t> pcm) override;
    bool isPlaying() override;
    uint32_t latency() const override { return latency_.load(); }
    uint32_t sampleRate() const override { return config_.sampleRate; }

    bool setVolume(float volume);

    State state() const;

    // Percent (0-100) to receiver gain in dB: 0 mutes (-144), otherwise
    // -30 + 30 * percent / 100
    static float floatVolume(int percent);

private:
    struct BacklogEntry {
        uint16_t seq = 0;
        std::vector<uint8_t> packet;
    };

    // RTSPClientDelegate
    void onConnectionClosed(RTSP::RTSPClient *client,
                            const boost::system::error_code &ec) override;

    bool openSession(uint16_t port);
    void closeSession();
    void runOnIoThread(const std::function<void()> &fn);

    RTSP::RTSPMessage makeRequest(const std::string &method, const std::string &uri) const;
    std::optional<RTSP::RTSPMessage> exchange(const RTSP::RTSPMessage &request);
    std::optional<RTSP::RTSPMessage> exchangeOnce(RTSP::RTSPMessage request);
    bool announce();
    bool setup();
    bool record();

    uint32_t rtpNowLocked(Clock::NtpTime now) const;
    void anchorLocked(Clock::NtpTime now);

    void startSyncTimer();
    void sendSync();
    void startControlReceive();
    void handleControl(const boost::system::error_code &ec, std::size_t bytes);
    void retransmit(uint16_t seqStart, uint16_t count);

    RaopClientConfig config_;
    Clock::IClock &clock_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread ioThread_;

    std::shared_ptr<RTSP::RTSPClient> rtsp_;
    std::unique_ptr<TimingResponder> timing_;
    boost::asio::ip::udp::socket audioSocket_;
    boost::asio::ip::udp::socket controlSocket_;
    boost::asio::ip::udp::endpoint audioEndpoint_;
    boost::asio::ip::udp::endpoint controlEndpoint_;
    boost::asio::ip::udp::endpoint controlSender_;
    std::vector<uint8_t> controlBuffer_;
    boost::asio::steady_timer syncTimer_;

    // RTSP session
    std::string sessionUri_;
    std::string session_;
    std::string clientInstance_;
    std::string dacpId_;
    std::optional<AuthChallenge> auth_;
    std::optional<AudioCryptor> cryptor_;
    std::atomic<uint32_t> latency_{0};
    std::atomic<bool> connectionLost_{false};

    // Packet state, guarded by mutex_
    mutable std::mutex mutex_;
    State state_ = State::Down;
    bool started_ = false;
    bool stopped_ = false;
    bool firstPacket_ = true;
    bool firstSync_ = true;
    std::optional<Clock::NtpTime> pendingStart_;
    uint16_t seq_ = 0;
    uint32_t ssrc_ = 0;
    uint32_t headTs_ = 0;
    uint32_t startTs_ = 0;
    Clock::NtpTime startTime_ = 0;
    boost::circular_buffer<BacklogEntry> backlog_;
};

} // namespace Raop
} // namespace AirStream
