#include "ASTimingResponder.hpp"
#include "RaopRtp.hpp"
#include "logger.hpp"
#include <boost/asio/buffer.hpp>
#include <cstring>
#include <memory>

namespace AirStream {
namespace Raop {

TimingResponder::TimingResponder(boost::asio::io_context &ioContext,
                                 Clock::IClock &clock,
                                 const boost::asio::ip::udp &protocol,
                                 uint16_t localPort)
    : clock_(clock), timingSocket_(ioContext), recvBuffer_(1500) // MTU size buffer
{
    // Throws boost::system::system_error if the port can not be bound
    boost::asio::ip::udp::endpoint localEndpoint(protocol, localPort);
    timingSocket_.open(localEndpoint.protocol());
    timingSocket_.bind(localEndpoint);
    localPort_ = timingSocket_.local_endpoint().port();
    LOG_DEBUG("Timing socket bound to local port {}", localPort_);
}

TimingResponder::~TimingResponder() { stop(); }

void TimingResponder::start() {
    if (running_.exchange(true)) {
        return;
    }
    startReceive();
}

void TimingResponder::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (timingSocket_.is_open()) {
        boost::system::error_code ec;
        timingSocket_.close(ec);
        if (ec)
            LOG_WARN("Error closing timing socket: {}", ec.message());
    }
    LOG_DEBUG("Timing responder stopped after {} replies", repliesSent_.load());
}

void TimingResponder::startReceive() {
    if (!running_) return;
    timingSocket_.async_receive_from(
        boost::asio::buffer(recvBuffer_), senderEndpoint_,
        [this](const boost::system::error_code &ec, std::size_t bytes_transferred) {
            handleReceive(ec, bytes_transferred);
        });
}

void TimingResponder::handleReceive(const boost::system::error_code &ec,
                                    std::size_t bytes_transferred) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
        return;
    }

    if (ec) {
        LOG_ERROR("Timing receive error: {}", ec.message());
        startReceive();
        return;
    }

    Clock::NtpTime receivedAt = clock_.now();

    if (bytes_transferred < sizeof(RtcpTimeSyncPacket)) {
        LOG_WARN("Timing packet too small ({} bytes)", bytes_transferred);
        startReceive();
        return;
    }

    RtcpTimeSyncPacket request;
    std::memcpy(&request, recvBuffer_.data(), sizeof(request));
    if ((request.type & ~kRtpMarkerBit) != static_cast<uint8_t>(PayloadType::TimingRequest)) {
        LOG_WARN("Unhandled packet type 0x{} on timing port",
                 Utils::hexString(&request.type, 1));
        startReceive();
        return;
    }
    request.ntoh();

    auto reply = std::make_shared<RtcpTimeSyncPacket>(
        buildTimingReply(request, receivedAt, clock_.now()));

    LOG_VERBOSE("Timing request from {}:{}, replying", senderEndpoint_.address().to_string(),
                senderEndpoint_.port());
    timingSocket_.async_send_to(
        boost::asio::buffer(reply.get(), sizeof(*reply)), senderEndpoint_,
        [this, reply](const boost::system::error_code &sendEc, std::size_t /*bytes_sent*/) {
            if (sendEc) {
                if (sendEc != boost::asio::error::operation_aborted)
                    LOG_ERROR("Error sending timing reply: {}", sendEc.message());
                return;
            }
            repliesSent_++;
        });

    startReceive();
}

} // namespace Raop
} // namespace AirStream
