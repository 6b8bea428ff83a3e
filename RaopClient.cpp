#include "RaopClient.hpp"
#include "ASUtils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <cstdio>
#include <cstring>
#include <future>

namespace AirStream {
namespace Raop {

namespace {
const char *kUserAgent = "iTunes/7.6.2 (Windows; N;)";
const char *kAuthUser = "iTunes";

uint32_t randomU32() {
    auto bytes = Utils::randomBytes(4);
    uint32_t value;
    std::memcpy(&value, bytes.data(), sizeof(value));
    return value;
}

const char *StateToString(RaopClient::State state) {
    switch (state) {
        case RaopClient::State::Down: return "DOWN";
        case RaopClient::State::Flushing: return "FLUSHING";
        case RaopClient::State::Flushed: return "FLUSHED";
        case RaopClient::State::Streaming: return "STREAMING";
        default: return "UNKNOWN";
    }
}
} // namespace

RaopClient::RaopClient(RaopClientConfig config, Clock::IClock &clock)
    : config_(std::move(config)), clock_(clock), work_(ioc_.get_executor()),
      audioSocket_(ioc_), controlSocket_(ioc_), controlBuffer_(1500),
      syncTimer_(ioc_), backlog_(kBacklogSize) {
    if (config_.channels == 0 || config_.sampleSize == 0 || config_.sampleRate == 0) {
        throw std::invalid_argument("Invalid audio format for RAOP client");
    }
    if (config_.codec == Codec::ALACRaw && (config_.channels != 2 || config_.sampleSize != 16)) {
        throw std::invalid_argument("Uncompressed ALAC needs 16-bit stereo");
    }
    ioThread_ = std::thread([this]() {
        LOG_DEBUG("RAOP io thread started");
        ioc_.run();
        LOG_DEBUG("RAOP io thread finished");
    });
}

RaopClient::~RaopClient() {
    if (state() != State::Down || rtsp_) {
        disconnect();
    }
    work_.reset();
    ioc_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

float RaopClient::floatVolume(int percent) {
    percent = std::clamp(percent, 0, 100);
    if (percent == 0) {
        return -144.0f;
    }
    return -30.0f + 30.0f * static_cast<float>(percent) / 100.0f;
}

RaopClient::State RaopClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RaopClient::runOnIoThread(const std::function<void()> &fn) {
    if (std::this_thread::get_id() == ioThread_.get_id()) {
        fn();
        return;
    }
    std::promise<void> done;
    auto future = done.get_future();
    boost::asio::post(ioc_, [&fn, &done]() {
        fn();
        done.set_value();
    });
    future.wait();
}

void RaopClient::onConnectionClosed(RTSP::RTSPClient * /*client*/,
                                    const boost::system::error_code &ec) {
    if (ec != boost::asio::error::operation_aborted) {
        LOG_WARN("RTSP connection to {} lost: {}", config_.host, ec.message());
    }
    connectionLost_ = true;
}

// --- RTSP ---

RTSP::RTSPMessage RaopClient::makeRequest(const std::string &method,
                                          const std::string &uri) const {
    auto request = RTSP::RTSPMessage::request(method, uri);
    request.headers["User-Agent"] = kUserAgent;
    request.headers["Client-Instance"] = clientInstance_;
    request.headers["DACP-ID"] = dacpId_;
    if (!session_.empty()) {
        request.headers["Session"] = session_;
    }
    return request;
}

std::optional<RTSP::RTSPMessage> RaopClient::exchangeOnce(RTSP::RTSPMessage request) {
    if (!rtsp_ || connectionLost_) {
        LOG_ERROR("No RTSP connection for {}", request.method);
        return std::nullopt;
    }
    if (auth_) {
        request.headers["Authorization"] = buildAuthorization(
            *auth_, kAuthUser, config_.password, request.method, request.uri);
    }

    using Result = std::pair<boost::system::error_code, RTSP::RTSPMessage>;
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    std::string method = request.method;

    rtsp_->sendMessage(std::move(request),
                       [promise](boost::system::error_code ec,
                                 const RTSP::RTSPMessage &response) {
                           promise->set_value({ec, response});
                       });

    if (future.wait_for(config_.rtspTimeout + std::chrono::seconds(2)) !=
        std::future_status::ready) {
        LOG_ERROR("{} got no answer from {}", method, config_.host);
        return std::nullopt;
    }
    auto [ec, response] = future.get();
    if (ec) {
        LOG_ERROR("{} failed: {}", method, ec.message());
        return std::nullopt;
    }
    return response;
}

std::optional<RTSP::RTSPMessage> RaopClient::exchange(const RTSP::RTSPMessage &request) {
    auto response = exchangeOnce(request);

    // Answer one authentication challenge, then give up
    if (response && response->statusCode == 401 && !config_.password.empty()) {
        auto challengeHeader = response->header("WWW-Authenticate");
        auto challenge = challengeHeader ? parseAuthenticate(*challengeHeader)
                                         : std::nullopt;
        if (challenge) {
            LOG_DEBUG("{} needs authentication, retrying", request.method);
            auth_ = challenge;
            response = exchangeOnce(request);
        }
    }

    if (response && !response->isSuccess()) {
        LOG_ERROR("{} rejected: {} {}", request.method, response->statusCode,
                  response->reasonPhrase);
    }
    return response;
}

bool RaopClient::openSession(uint16_t port) {
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(config_.host, std::to_string(port), ec);
    if (ec || results.empty()) {
        LOG_ERROR("Cannot resolve {}: {}", config_.host, ec.message());
        return false;
    }
    boost::asio::ip::tcp::endpoint remote = *results.begin();

    rtsp_ = std::make_shared<RTSP::RTSPClient>(ioc_, this);
    rtsp_->setResponseTimeout(config_.rtspTimeout);

    std::promise<boost::system::error_code> connected;
    auto future = connected.get_future();
    rtsp_->connect(remote, [&connected](boost::system::error_code connectEc) {
        connected.set_value(connectEc);
    });
    // The RTSP client's own timer bounds the wait
    ec = future.get();
    if (ec) {
        return false;
    }

    auto protocol = remote.address().is_v6() ? boost::asio::ip::udp::v6()
                                             : boost::asio::ip::udp::v4();
    try {
        audioSocket_.open(protocol);
        audioSocket_.bind(boost::asio::ip::udp::endpoint(protocol, 0));
        controlSocket_.open(protocol);
        controlSocket_.bind(boost::asio::ip::udp::endpoint(protocol, 0));
        timing_ = std::make_unique<TimingResponder>(ioc_, clock_, protocol);
    } catch (const boost::system::system_error &e) {
        LOG_ERROR("Cannot open UDP ports: {}", e.what());
        return false;
    }

    auto local = rtsp_->localEndpoint();
    sessionUri_ = "rtsp://" + local.address().to_string() + "/" +
                  std::to_string(randomU32());
    clientInstance_ = Utils::clientInstanceId();
    dacpId_ = clientInstance_;
    session_.clear();
    auth_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq_ = static_cast<uint16_t>(randomU32());
        ssrc_ = randomU32();
        headTs_ = randomU32();
        backlog_.clear();
    }

    LOG_DEBUG("Session {} control port {} timing port {}", sessionUri_,
              controlSocket_.local_endpoint().port(), timing_->getLocalPort());
    return true;
}

void RaopClient::closeSession() {
    runOnIoThread([this]() {
        syncTimer_.cancel();
        boost::system::error_code ec;
        if (controlSocket_.is_open()) {
            controlSocket_.close(ec);
        }
        if (timing_) {
            timing_->stop();
        }
        if (rtsp_) {
            rtsp_->stop();
        }
    });
    // Aborted handlers queued by the closes above run before this
    runOnIoThread([this]() { timing_.reset(); });
    rtsp_.reset();

    std::lock_guard<std::mutex> lock(mutex_);
    boost::system::error_code ec;
    if (audioSocket_.is_open()) {
        audioSocket_.close(ec);
    }
    state_ = State::Down;
    started_ = false;
    stopped_ = false;
    pendingStart_.reset();
    backlog_.clear();
}

bool RaopClient::announce() {
    SdpParams params;
    params.sessionId = sessionUri_.substr(sessionUri_.rfind('/') + 1);
    params.localAddress = rtsp_->localEndpoint().address().to_string();
    params.remoteAddress = rtsp_->remoteEndpoint().address().to_string();
    params.codec = config_.codec;
    params.framesPerPacket = config_.framesPerPacket;
    params.sampleRate = config_.sampleRate;
    params.sampleSize = config_.sampleSize;
    params.channels = config_.channels;

    if (config_.crypto == Crypto::RSA) {
        if (config_.rsaKeyPath.empty()) {
            LOG_ERROR("Encryption needs the receiver's RSA public key");
            return false;
        }
        try {
            auto key = AudioCryptor::loadPublicKey(config_.rsaKeyPath);
            cryptor_.emplace();
            params.rsaAesKey = Utils::base64Encode(cryptor_->wrapKey(key.get()));
            params.aesIv = Utils::base64Encode(cryptor_->iv().data(), cryptor_->iv().size());
        } catch (const std::runtime_error &e) {
            LOG_ERROR("Cannot set up encryption: {}", e.what());
            cryptor_.reset();
            return false;
        }
    } else {
        cryptor_.reset();
    }

    auto request = makeRequest("ANNOUNCE", sessionUri_);
    request.setBody("application/sdp", buildAnnounceSdp(params));
    auto response = exchange(request);
    return response && response->isSuccess();
}

bool RaopClient::setup() {
    auto request = makeRequest("SETUP", sessionUri_);
    request.headers["Transport"] =
        "RTP/AVP/UDP;unicast;interleaved=0-1;mode=record;control_port=" +
        std::to_string(controlSocket_.local_endpoint().port()) +
        ";timing_port=" + std::to_string(timing_->getLocalPort());

    auto response = exchange(request);
    if (!response || !response->isSuccess()) {
        return false;
    }

    auto transport = response->header("Transport");
    auto ports = transport ? parseTransportHeader(*transport) : std::nullopt;
    if (!ports) {
        LOG_ERROR("SETUP answer has no usable Transport header");
        return false;
    }

    auto session = response->header("Session");
    if (!session) {
        LOG_ERROR("SETUP answer has no Session header");
        return false;
    }
    session_ = session->substr(0, session->find(';'));

    auto remoteAddress = rtsp_->remoteEndpoint().address();
    audioEndpoint_ = boost::asio::ip::udp::endpoint(remoteAddress, ports->server);
    controlEndpoint_ = boost::asio::ip::udp::endpoint(remoteAddress, ports->control);
    if (ports->control == 0) {
        LOG_WARN("Receiver gave no control port, sync packets are disabled");
    }
    LOG_DEBUG("Receiver ports: audio {} control {} timing {}", ports->server,
              ports->control, ports->timing);
    return true;
}

bool RaopClient::record() {
    uint16_t seq;
    uint32_t rtptime;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = seq_;
        rtptime = headTs_;
    }

    auto request = makeRequest("RECORD", sessionUri_);
    request.headers["Range"] = "npt=0-";
    request.headers["RTP-Info"] =
        "seq=" + std::to_string(seq) + ";rtptime=" + std::to_string(rtptime);

    auto response = exchange(request);
    if (!response || !response->isSuccess()) {
        return false;
    }

    auto reported = parseAudioLatency(response->header("Audio-Latency"));
    latency_ = std::max({config_.latency, reported.value_or(0), kLatencyMin});
    LOG_DEBUG("Receiver latency {} frames, using {}", reported.value_or(0),
              latency_.load());
    return true;
}

// --- ITransportClient ---

bool RaopClient::connect(uint16_t port, bool setVolume) {
    if (state() != State::Down) {
        LOG_WARN("Already connected to {}", config_.host);
        return true;
    }
    connectionLost_ = false;

    if (!config_.secret.empty()) {
        LOG_WARN("Pair-verify is not supported, ignoring the secret");
    }

    if (!openSession(port) || !announce() || !setup() || !record()) {
        LOG_ERROR("RAOP session setup with {}:{} failed", config_.host, port);
        closeSession();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Flushed;
        started_ = false;
        stopped_ = false;
        firstPacket_ = true;
        firstSync_ = true;
    }

    runOnIoThread([this]() {
        timing_->start();
        startControlReceive();
        startSyncTimer();
    });

    if (setVolume && !this->setVolume(config_.volume)) {
        LOG_WARN("Initial volume was not applied");
    }

    LOG_DEBUG("Connected to {} with {} {}, latency {} frames", config_.host,
              CodecToString(config_.codec), cryptor_ ? "encrypted" : "clear",
              latency_.load());
    return true;
}

bool RaopClient::disconnect() {
    if (state() == State::Down && !rtsp_) {
        return true;
    }

    bool ok = true;
    if (rtsp_ && rtsp_->isConnected()) {
        auto response = exchange(makeRequest("TEARDOWN", sessionUri_));
        ok = response && response->isSuccess();
    }
    closeSession();
    LOG_DEBUG("Disconnected from {}", config_.host);
    return ok;
}

bool RaopClient::setVolume(float volume) {
    if (state() == State::Down) {
        return false;
    }
    if ((volume < -30.0f && volume != -144.0f) || volume > 0.0f) {
        LOG_WARN("Volume {} dB out of range", volume);
        return false;
    }
    config_.volume = volume;

    char body[32];
    std::snprintf(body, sizeof(body), "volume: %f\r\n", volume);
    auto request = makeRequest("SET_PARAMETER", sessionUri_);
    request.setBody("text/parameters", body);

    auto response = exchange(request);
    return response && response->isSuccess();
}

bool RaopClient::startAt(Clock::NtpTime startTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down) {
        return false;
    }
    pendingStart_ = startTime;
    started_ = false;
    stopped_ = false;
    LOG_DEBUG("Start pending at {}", Clock::formatSeconds(startTime));
    return true;
}

void RaopClient::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down) {
        return;
    }
    started_ = false;
    pendingStart_.reset();
    state_ = State::Flushing;
}

void RaopClient::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down) {
        return;
    }
    started_ = false;
    stopped_ = true;
    pendingStart_.reset();
    state_ = State::Flushing;
}

bool RaopClient::flush() {
    uint16_t seq;
    uint32_t rtptime;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Down) {
            return false;
        }
        seq = seq_;
        rtptime = headTs_;
    }

    auto request = makeRequest("FLUSH", sessionUri_);
    request.headers["RTP-Info"] =
        "seq=" + std::to_string(seq) + ";rtptime=" + std::to_string(rtptime);
    auto response = exchange(request);
    if (!response || !response->isSuccess()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Down) {
        state_ = State::Flushed;
        firstPacket_ = true;
    }
    return true;
}

bool RaopClient::keepAlive() {
    if (state() == State::Down) {
        return false;
    }
    auto response = exchange(makeRequest("OPTIONS", "*"));
    return response && response->isSuccess();
}

uint32_t RaopClient::rtpNowLocked(Clock::NtpTime now) const {
    return startTs_ +
           static_cast<uint32_t>(Clock::ntpDiffToTicks(now, startTime_, config_.sampleRate));
}

void RaopClient::anchorLocked(Clock::NtpTime now) {
    startTs_ = headTs_;
    startTime_ = pendingStart_.value_or(now);
    pendingStart_.reset();
    started_ = true;
    firstSync_ = true;
    LOG_DEBUG("Frame {} anchored at {}", startTs_, Clock::formatSeconds(startTime_));
    boost::asio::post(ioc_, [this]() { sendSync(); });
}

bool RaopClient::acceptFrames() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down || stopped_ || connectionLost_) {
        return false;
    }
    Clock::NtpTime now = clock_.now();
    if (!started_) {
        anchorLocked(now);
    }
    return Mod32_LT(headTs_, rtpNowLocked(now) + latency_.load());
}

Transport::SendResult RaopClient::sendChunk(std::span<const uint8_t> pcm) {
    const size_t bytesPerFrame = static_cast<size_t>(config_.channels) * config_.sampleSize / 8;
    const uint32_t frames = static_cast<uint32_t>(pcm.size() / bytesPerFrame);
    if (frames == 0 || frames > config_.framesPerPacket) {
        LOG_ERROR("Chunk of {} frames does not fit a packet", frames);
        return {};
    }

    std::vector<uint8_t> payload = config_.codec == Codec::ALACRaw
                                       ? encodeAlacRaw(pcm.first(frames * bytesPerFrame),
                                                       config_.framesPerPacket)
                                       : encodePcm(pcm.first(frames * bytesPerFrame));
    if (cryptor_ && !cryptor_->encrypt(payload.data(), payload.size())) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down || connectionLost_) {
        return {};
    }
    if (!started_) {
        anchorLocked(clock_.now());
    }

    bool first = firstPacket_;
    firstPacket_ = false;
    state_ = State::Streaming;

    Transport::SendResult result;
    result.playtime = startTime_ + Clock::ticksToNtp(headTs_ - startTs_, config_.sampleRate) +
                      Clock::ticksToNtp(latency_.load(), config_.sampleRate);

    auto packet = buildAudioPacket(seq_, headTs_, ssrc_, first, payload);
    boost::system::error_code ec;
    audioSocket_.send_to(boost::asio::buffer(packet), audioEndpoint_, 0, ec);

    backlog_.push_back(BacklogEntry{seq_, std::move(packet)});
    ++seq_;
    headTs_ += frames;

    if (ec) {
        LOG_ERROR("Audio send failed: {}", ec.message());
        connectionLost_ = true;
        return result;
    }
    result.ok = true;
    return result;
}

bool RaopClient::isPlaying() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Down || stopped_ || connectionLost_) {
        return false;
    }
    if (!started_) {
        return true;
    }
    return Mod32_LT(rtpNowLocked(clock_.now()), headTs_ + latency_.load());
}

// --- Control and sync (io thread) ---

void RaopClient::startSyncTimer() {
    syncTimer_.expires_after(std::chrono::seconds(1));
    syncTimer_.async_wait([this](const boost::system::error_code &ec) {
        if (ec) {
            return;
        }
        sendSync();
        startSyncTimer();
    });
}

void RaopClient::sendSync() {
    auto pkt = std::make_shared<RtpSyncPacket>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Down || !started_ || stopped_ || controlEndpoint_.port() == 0 ||
            !controlSocket_.is_open()) {
            return;
        }
        Clock::NtpTime now = clock_.now();
        *pkt = buildSyncPacket(rtpNowLocked(now), latency_.load(), now, firstSync_);
        firstSync_ = false;
    }

    controlSocket_.async_send_to(
        boost::asio::buffer(pkt.get(), sizeof(*pkt)), controlEndpoint_,
        [pkt](const boost::system::error_code &ec, std::size_t /*bytes*/) {
            if (ec && ec != boost::asio::error::operation_aborted) {
                LOG_WARN("Sync send failed: {}", ec.message());
            }
        });
}

void RaopClient::startControlReceive() {
    if (!controlSocket_.is_open()) {
        return;
    }
    controlSocket_.async_receive_from(
        boost::asio::buffer(controlBuffer_), controlSender_,
        [this](const boost::system::error_code &ec, std::size_t bytes) {
            handleControl(ec, bytes);
        });
}

void RaopClient::handleControl(const boost::system::error_code &ec, std::size_t bytes) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    if (ec) {
        LOG_WARN("Control receive error: {}", ec.message());
        startControlReceive();
        return;
    }

    if (bytes >= sizeof(RtcpRetransmitRequestPacket) &&
        (controlBuffer_[1] & ~kRtpMarkerBit) ==
            static_cast<uint8_t>(PayloadType::RetransmitRequest)) {
        RtcpRetransmitRequestPacket request;
        std::memcpy(&request, controlBuffer_.data(), sizeof(request));
        request.ntoh();
        retransmit(request.seqStart, request.seqCount);
    } else {
        LOG_VERBOSE("Ignoring {} byte control packet type {}", bytes, controlBuffer_[1]);
    }

    startControlReceive();
}

void RaopClient::retransmit(uint16_t seqStart, uint16_t count) {
    LOG_DEBUG("Retransmit request for {} packets from {}", count, seqStart);
    for (uint16_t i = 0; i < count; ++i) {
        uint16_t seq = static_cast<uint16_t>(seqStart + i);
        std::shared_ptr<std::vector<uint8_t>> reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!backlog_.empty()) {
                uint16_t age = static_cast<uint16_t>(backlog_.back().seq - seq);
                if (age < backlog_.size()) {
                    const BacklogEntry &entry = backlog_[backlog_.size() - 1 - age];
                    if (entry.seq == seq) {
                        reply = std::make_shared<std::vector<uint8_t>>(
                            buildRetransmitReply(entry.packet));
                    }
                }
            }
        }
        if (!reply) {
            LOG_DEBUG("Packet {} is no longer in the backlog", seq);
            continue;
        }
        controlSocket_.async_send_to(
            boost::asio::buffer(*reply), controlSender_,
            [reply](const boost::system::error_code &ec, std::size_t /*bytes*/) {
                if (ec && ec != boost::asio::error::operation_aborted) {
                    LOG_WARN("Retransmit send failed: {}", ec.message());
                }
            });
    }
}

} // namespace Raop
} // namespace AirStream
