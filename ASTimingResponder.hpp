// ASTimingResponder.hpp
#ifndef AIRSTREAM_TIMING_RESPONDER_HPP
#define AIRSTREAM_TIMING_RESPONDER_HPP

#include "ASClock.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <vector>

namespace AirStream {
namespace Raop {

constexpr uint16_t kDefaultTimingLocalPort = 0; // 0 for ephemeral local port

// Answers the receiver's NTP timing requests on our timing port. The sender
// is the time reference in RAOP, so there is no clock discipline here: every
// request gets our current NTP time back.
class TimingResponder {
  public:
    TimingResponder(boost::asio::io_context &ioContext, Clock::IClock &clock,
                    const boost::asio::ip::udp &protocol,
                    uint16_t localPort = kDefaultTimingLocalPort);

    ~TimingResponder();

    TimingResponder(const TimingResponder &) = delete;
    TimingResponder &operator=(const TimingResponder &) = delete;

    void start();
    void stop();

    uint16_t getLocalPort() const { return localPort_; }
    uint64_t repliesSent() const { return repliesSent_.load(); }

  private:
    void startReceive();
    void handleReceive(const boost::system::error_code &ec, std::size_t bytes_transferred);

    Clock::IClock &clock_;
    boost::asio::ip::udp::socket timingSocket_;
    boost::asio::ip::udp::endpoint senderEndpoint_;
    std::vector<uint8_t> recvBuffer_;
    uint16_t localPort_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> repliesSent_{0};
};

} // namespace Raop
} // namespace AirStream

#endif // AIRSTREAM_TIMING_RESPONDER_HPP
