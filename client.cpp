#include "client.hpp"

namespace AirStream {
namespace RTSP {

void RTSPClient::doConnect(const tcp::endpoint &remote,
                           RTSPConnectCompletionFunc completion) {
  if (state_ != State::Idle) {
    LOG_WARN("Cannot connect, state is {}.", static_cast<int>(state_));
    net::post(strand_, [comp = std::move(completion)]() {
      comp(net::error::already_connected);
    });
    return;
  }

  state_ = State::Connecting;
  remote_endpoint_ = remote;
  LOG_DEBUG("Connecting to {}:{}", remote.address().to_string(), remote.port());

  startResponseTimer(response_timeout_);
  socket_.async_connect(
      remote, net::bind_executor(strand_, [self = shared_from_this(),
                                           comp = std::move(completion)](
                                              error_code ec) mutable {
        self->handleConnect(ec, std::move(comp));
      }));
}

void RTSPClient::handleConnect(error_code ec, RTSPConnectCompletionFunc completion) {
  response_timer_.cancel();

  if (state_ != State::Connecting) {
    // Timed out or stopped while connecting
    completion(ec ? ec : net::error::operation_aborted);
    return;
  }

  if (ec) {
    LOG_ERROR("Connect to {}:{} failed: {}", remote_endpoint_.address().to_string(),
              remote_endpoint_.port(), ec.message());
    enterErrorState(ec);
    completion(ec);
    return;
  }

  error_code ep_ec;
  local_endpoint_ = socket_.local_endpoint(ep_ec);
  if (ep_ec) {
    LOG_ERROR("Failed to get local endpoint after connect: {}", ep_ec.message());
    enterErrorState(ep_ec);
    completion(ep_ec);
    return;
  }

  error_code opt_ec;
  socket_.set_option(tcp::no_delay(true), opt_ec);
  if (opt_ec) {
    LOG_WARN("Failed to set TCP_NODELAY: {}", opt_ec.message());
  }

  LOG_INFO("RTSP connected to {}:{} from {}", remote_endpoint_.address().to_string(),
           remote_endpoint_.port(), local_endpoint_.address().to_string());
  state_ = State::Connected;
  connected_ = true;
  completion({});

  // Requests may have been queued while connecting
  runStateMachine();
}

void RTSPClient::queueRequest(RTSPMessage request,
                              RTSPRequestCompletionFunc completion) {
  if (state_ == State::Error) {
    LOG_ERROR("Client is in error state, cannot send {}.", request.method);
    net::post(strand_, [comp = std::move(completion)]() {
      comp(boost::system::errc::make_error_code(
               boost::system::errc::not_connected),
           {});
    });
    return;
  }

  request.cseq = next_cseq_++;
  LOG_DEBUG("Queueing request: {} {} (CSeq {})", request.method, request.uri,
            request.cseq);
  outgoing_queue_.push_back(QueuedRequest{std::move(request), std::move(completion)});

  if (state_ == State::Connected) {
    runStateMachine();
  }
}

void RTSPClient::runStateMachine() {
  switch (state_) {
  case State::Connected:
    if (!outgoing_queue_.empty()) {
      startSend();
    } else {
      LOG_VERBOSE("Connected and idle.");
    }
    break;
  case State::Idle:
  case State::Connecting:
  case State::Sending:
  case State::ReadingHeader:
  case State::ReadingBody:
  case State::Error:
    break;
  }
}

void RTSPClient::enterErrorState(error_code ec) {
  if (state_ == State::Error)
    return;

  LOG_WARN("RTSP connection entering error state: {}", ec.message());
  State previous_state = state_;
  state_ = State::Error;
  connected_ = false;

  response_timer_.cancel();

  if (socket_.is_open()) {
    error_code ignored_ec;
    socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);
    socket_.close(ignored_ec);
  }

  if (delegate_ && previous_state != State::Idle &&
      previous_state != State::Connecting) {
    delegate_->onConnectionClosed(this, ec);
  }

  failPendingRequests(ec);
}

void RTSPClient::failPendingRequests(error_code ec) {
  std::deque<QueuedRequest> failed_queue;
  failed_queue.swap(outgoing_queue_);

  for (auto &queued : failed_queue) {
    if (queued.completion) {
      net::post(strand_, [comp = std::move(queued.completion), ec]() {
        comp(ec, {});
      });
    }
  }
}

void RTSPClient::startSend() {
  if (outgoing_queue_.empty()) {
    state_ = State::Connected;
    return;
  }

  state_ = State::Sending;
  current_response_.clear();

  QueuedRequest &current = outgoing_queue_.front();
  LOG_DEBUG("Sending request: {} {}", current.request.method, current.request.uri);
  write_buffer_ = current.request.constructRequest();
  if (Logger::getInstance().getLevel() <= LogLevel::VERBOSE) {
    current.request.print();
  }

  startResponseTimer(response_timeout_);

  net::async_write(
      socket_, net::buffer(write_buffer_),
      net::bind_executor(strand_, [self = shared_from_this()](
                                      error_code ec, std::size_t /*bytes_written*/) {
        if (self->state_ != State::Sending)
          return;

        if (ec) {
          LOG_ERROR("Send failed: {}", ec.message());
          self->enterErrorState(ec);
          return;
        }

        LOG_VERBOSE("Send successful.");
        self->startRead();
      }));
}

void RTSPClient::do_read_headers() {
  if (state_ != State::ReadingHeader)
    return;

  net::async_read_until(
      socket_, read_buffer_, "\r\n\r\n",
      net::bind_executor(strand_, [self = shared_from_this()](
                                      error_code ec, std::size_t bytes_read) {
        if (self->state_ != State::ReadingHeader)
          return;

        if (ec) {
          LOG_ERROR("Error reading headers: {}", ec.message());
          self->enterErrorState(ec);
          return;
        }

        std::string header_data(bytes_read, '\0');
        net::buffer_copy(net::buffer(header_data), self->read_buffer_.data(),
                         bytes_read);
        self->read_buffer_.consume(bytes_read);

        if (!self->current_response_.parseResponseHeader(header_data)) {
          LOG_ERROR("Failed to parse RTSP response headers.");
          self->enterErrorState(boost::system::errc::make_error_code(
              boost::system::errc::bad_message));
          return;
        }

        size_t content_length = self->current_response_.getExpectedContentLength();
        LOG_VERBOSE("Parsed headers, Content-Length: {}", content_length);
        if (content_length > 0) {
          self->state_ = State::ReadingBody;
          self->do_read_body(content_length);
        } else {
          self->completeCurrentRequest();
        }
      }));
}

void RTSPClient::do_read_body(size_t needed_bytes) {
  if (state_ != State::ReadingBody)
    return;

  size_t available = read_buffer_.size();
  size_t to_read = (available < needed_bytes) ? (needed_bytes - available) : 0;

  auto finish = [this, needed_bytes]() {
    std::vector<char> body_data(needed_bytes);
    net::buffer_copy(net::buffer(body_data), read_buffer_.data(), needed_bytes);
    read_buffer_.consume(needed_bytes);
    current_response_.parseBody(body_data);
    completeCurrentRequest();
  };

  if (to_read == 0) {
    LOG_VERBOSE("Body already in buffer ({}), processing.", available);
    finish();
    return;
  }

  LOG_VERBOSE("Need to read {} more bytes for body.", to_read);
  net::async_read(
      socket_, read_buffer_, net::transfer_exactly(to_read),
      net::bind_executor(strand_, [self = shared_from_this(), needed_bytes,
                                   finish](error_code ec, std::size_t /*bytes*/) {
        if (self->state_ != State::ReadingBody)
          return;

        if (ec) {
          LOG_ERROR("Error reading body: {}", ec.message());
          self->enterErrorState(ec);
          return;
        }
        if (self->read_buffer_.size() < needed_bytes) {
          LOG_ERROR("Read less body than expected.");
          self->enterErrorState(boost::system::errc::make_error_code(
              boost::system::errc::io_error));
          return;
        }
        finish();
      }));
}

void RTSPClient::completeCurrentRequest() {
  response_timer_.cancel();

  if (outgoing_queue_.empty()) {
    LOG_ERROR("Response received but no request is pending.");
    state_ = State::Connected;
    return;
  }

  QueuedRequest completed = std::move(outgoing_queue_.front());
  outgoing_queue_.pop_front();

  if (current_response_.cseq != completed.request.cseq) {
    LOG_WARN("Response CSeq {} does not match request CSeq {}",
             current_response_.cseq, completed.request.cseq);
  }
  if (Logger::getInstance().getLevel() <= LogLevel::VERBOSE) {
    current_response_.print();
  }
  LOG_DEBUG("{} -> {} {}", completed.request.method, current_response_.statusCode,
            current_response_.reasonPhrase);

  if (completed.completion) {
    net::post(strand_, [comp = std::move(completed.completion),
                        resp = current_response_]() { comp({}, resp); });
  }

  if (socket_.is_open()) {
    state_ = State::Connected;
    runStateMachine();
  } else {
    enterErrorState(boost::system::errc::make_error_code(
        boost::system::errc::connection_reset));
  }
}

void RTSPClient::failCurrentRequest(error_code ec) {
  if (!outgoing_queue_.empty()) {
    QueuedRequest &current = outgoing_queue_.front();
    if (current.completion) {
      net::post(strand_,
                [comp = std::move(current.completion), ec]() { comp(ec, {}); });
    }
    outgoing_queue_.pop_front();
  }
}

void RTSPClient::startResponseTimer(std::chrono::seconds timeout) {
  if (timeout == std::chrono::seconds::zero()) {
    return;
  }

  response_timer_.expires_after(timeout);
  response_timer_.async_wait(
      net::bind_executor(strand_, [self = shared_from_this()](error_code ec) {
        if (!ec) {
          LOG_WARN("RTSP operation timed out.");
          auto timed_out = boost::system::errc::make_error_code(
              boost::system::errc::timed_out);
          self->failCurrentRequest(timed_out);
          self->enterErrorState(timed_out);
        } else if (ec != net::error::operation_aborted) {
          LOG_ERROR("Response timer error: {}", ec.message());
        }
      }));
}

} // namespace RTSP
} // namespace AirStream
