#pragma once

#include "RTSPMessage.hpp"
#include "logger.hpp"
#include <atomic>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace AirStream {
namespace RTSP {

namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

class RTSPClient;

using RTSPRequestCompletionFunc =
    std::function<void(error_code ec, const RTSPMessage &response)>;
using RTSPConnectCompletionFunc = std::function<void(error_code ec)>;

struct RTSPClientDelegate {
  virtual ~RTSPClientDelegate() = default;
  // Called when the established connection is closed or fails
  virtual void onConnectionClosed(RTSPClient * /*client*/,
                                  const error_code & /*ec*/) {}
};

struct QueuedRequest {
  RTSPMessage request;
  RTSPRequestCompletionFunc completion;
};

// --- RTSP Client Class (Connecting Role) ---
//
// One request is in flight at a time; later ones wait in the queue. Every
// request gets the next CSeq. All socket work happens on the strand, and
// completions are posted back to it.
class RTSPClient : public std::enable_shared_from_this<RTSPClient> {
  enum class State {
    Idle,          // Not connected yet
    Connecting,    // async_connect in progress
    Connected,     // Ready to send
    Sending,       // Writing request data to socket
    ReadingHeader, // Reading response status line and headers
    ReadingBody,   // Reading response body
    Error          // A non-recoverable error occurred
  };

public:
  explicit RTSPClient(net::io_context &ioc, RTSPClientDelegate *delegate = nullptr)
      : strand_(net::make_strand(ioc)), socket_(strand_), delegate_(delegate),
        state_(State::Idle), read_buffer_(65536), response_timer_(strand_) {}

  ~RTSPClient() {
    LOG_DEBUG("RTSPClient destructor called.");
  }

  RTSPClient(const RTSPClient &) = delete;
  RTSPClient &operator=(const RTSPClient &) = delete;

  void connect(const tcp::endpoint &remote, RTSPConnectCompletionFunc completion) {
    net::post(strand_, [self = shared_from_this(), remote,
                        comp = std::move(completion)]() mutable {
      self->doConnect(remote, std::move(comp));
    });
  }

  void setResponseTimeout(std::chrono::seconds timeout) {
    net::post(strand_, [self = shared_from_this(), timeout]() {
      self->response_timeout_ = timeout;
    });
  }

  // Send an RTSP request asynchronously. The CSeq header is filled in here.
  void sendMessage(RTSPMessage request, RTSPRequestCompletionFunc completion) {
    net::post(strand_, [self = shared_from_this(), req = std::move(request),
                        comp = std::move(completion)]() mutable {
      self->queueRequest(std::move(req), std::move(comp));
    });
  }

  // Close the socket, cancel operations and fail pending requests
  void stop() {
    net::post(strand_, [self = shared_from_this()]() {
      self->enterErrorState(net::error::operation_aborted);
    });
  }

  bool isConnected() const { return connected_.load(); }

  // Valid once connected
  tcp::endpoint localEndpoint() const { return local_endpoint_; }
  tcp::endpoint remoteEndpoint() const { return remote_endpoint_; }

private:
  void doConnect(const tcp::endpoint &remote, RTSPConnectCompletionFunc completion);
  void handleConnect(error_code ec, RTSPConnectCompletionFunc completion);

  void queueRequest(RTSPMessage request, RTSPRequestCompletionFunc completion);
  void runStateMachine();
  void enterErrorState(error_code ec);
  void failPendingRequests(error_code ec);

  void startSend();
  void startRead() {
    state_ = State::ReadingHeader;
    do_read_headers();
  }
  void do_read_headers();
  void do_read_body(size_t needed_bytes);

  void completeCurrentRequest();
  void failCurrentRequest(error_code ec);

  void startResponseTimer(std::chrono::seconds timeout);

  net::strand<net::io_context::executor_type> strand_;
  tcp::socket socket_;
  RTSPClientDelegate *delegate_;

  tcp::endpoint local_endpoint_;
  tcp::endpoint remote_endpoint_;
  std::chrono::seconds response_timeout_{std::chrono::seconds(10)};

  State state_;
  std::atomic<bool> connected_{false};
  int next_cseq_ = 1;
  std::deque<QueuedRequest> outgoing_queue_;

  net::streambuf read_buffer_;
  std::vector<char> write_buffer_;
  RTSPMessage current_response_;

  net::steady_timer response_timer_;
};

} // namespace RTSP
} // namespace AirStream
