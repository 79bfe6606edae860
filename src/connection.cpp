#include "wscore/connection.hpp"

#include "wscore/log.hpp"

#include <string>
#include <vector>

namespace wscore {

using VoidResult = expected<void, ErrorCode>;

std::atomic<uint64_t> Connection::next_id_{1};

Connection::Connection(std::unique_ptr<Transport> transport, const EngineConfig& config)
    : id_(next_id_.fetch_add(1)),
      transport_(std::move(transport)),
      config_(config),
      session_(config_),
      outbound_(config_.backpressure),
      inbound_(config_.backpressure.inbound_capacity) {}

Connection::~Connection() {
  abort();
  // The last reference may be dropped on one of our own threads.
  for (std::thread* t : {&reader_, &writer_, &timer_}) {
    if (!t->joinable()) continue;
    if (t->get_id() == std::this_thread::get_id()) {
      t->detach();
    } else {
      t->join();
    }
  }
}

VoidResult Connection::start(Bytes initial) {
  if (started_.exchange(true)) {
    return VoidResult::error(ErrorCode::kInvalidState);
  }
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto r = session_.open(Clock::now());
    if (!r) return r;
  }

  std::weak_ptr<Connection> weak = weak_from_this();
  outbound_.on_backpressure = [weak] {
    if (auto self = weak.lock()) {
      WSCORE_LOG_DEBUG("conn " + std::to_string(self->id_) + ": outbound above high watermark");
      if (self->on_backpressure) self->on_backpressure(self);
    }
  };
  outbound_.on_drain = [weak] {
    if (auto self = weak.lock()) {
      if (self->on_drain) self->on_drain(self);
    }
  };

  ConnPtr self = shared_from_this();
  reader_ = std::thread(&Connection::read_loop, this, self, std::move(initial));
  writer_ = std::thread(&Connection::write_loop, this, self);
  timer_ = std::thread(&Connection::timer_loop, this, self);
  return VoidResult::success();
}

// ============================================================================
// Sending
// ============================================================================

VoidResult Connection::send(const Message& msg) {
  if (msg.type() == MessageType::kClose) {
    return close(msg.has_close_code() ? msg.close_code() : close_code::kNormal,
                 msg.close_reason());
  }

  std::lock_guard<std::mutex> send_lock(send_mutex_);
  SessionEvents events;
  auto r = [&] {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_.send(msg, events);
  }();
  if (!r) {
    // A compression failure tears the connection down.
    if (events.closed || !events.outbound.empty()) dispatch(shared_from_this(), events);
    return r;
  }

  for (auto& item : events.outbound) {
    auto pushed = outbound_.push(std::move(item));
    if (!pushed) return pushed;
  }
  return VoidResult::success();
}

// Does not take send_mutex_: a sender may be parked in a full Block-policy
// queue, and the Close frame goes into the critical reserve anyway.
VoidResult Connection::close(uint16_t code, std::string_view reason) {
  SessionEvents events;
  auto r = [&] {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_.state_machine().is_closing()) return VoidResult::success();
    return session_.close(code, reason, Clock::now(), events);
  }();
  if (!r) return r;
  dispatch(shared_from_this(), events);
  return VoidResult::success();
}

// ============================================================================
// Receiving
// ============================================================================

expected<Message, ErrorCode> Connection::receive(std::chrono::milliseconds timeout) {
  auto msg = inbound_.pop(timeout);
  if (msg) return expected<Message, ErrorCode>::success(std::move(msg.value()));
  if (inbound_.is_drained()) {
    return expected<Message, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<Message, ErrorCode>::error(ErrorCode::kTimeout);
}

// ============================================================================
// Event dispatch
// ============================================================================

void Connection::dispatch(const ConnPtr& self, SessionEvents& events) {
  for (auto& item : events.outbound) {
    auto pushed = outbound_.push(std::move(item));
    if (!pushed) {
      WSCORE_LOG_DEBUG("conn " + std::to_string(id_) + ": control frame dropped (" +
                       error_name(pushed.get_error()) + ")");
    }
  }

  for (auto& msg : events.messages) {
    if (on_message) {
      on_message(self, msg);
    } else if (!inbound_.push(std::move(msg))) {
      break;
    }
  }

  if (events.closed) finish(self, events.closed.value());
}

void Connection::finish(const ConnPtr& self, const CloseInfo& info) {
  if (close_notified_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    close_info_ = info;
  }
  if (info.timed_out) {
    // The peer stopped cooperating; a write may be stuck on it.
    outbound_.abort();
    transport_->shutdown();
  } else {
    // Anything already queued (a final Close frame) is still written.
    outbound_.close();
  }
  inbound_.close();
  close_cv_.notify_all();

  if (info.error != ErrorCode::kOk) {
    WSCORE_LOG_INFO("conn " + std::to_string(id_) + " closed: code " +
                    std::to_string(info.code) + " (" + error_name(info.error) + ")");
  } else {
    WSCORE_LOG_DEBUG("conn " + std::to_string(id_) + " closed: code " +
                     std::to_string(info.code));
  }
  if (on_close) on_close(self, info);
}

// ============================================================================
// I/O threads
// ============================================================================

void Connection::read_loop(ConnPtr self, Bytes initial) {
  if (!initial.empty()) {
    SessionEvents events;
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      auto r = session_.receive(initial, Clock::now(), events);
      if (!r) WSCORE_LOG_DEBUG(std::string("initial bytes rejected: ") + error_name(r.get_error()));
    }
    dispatch(self, events);
  }

  std::vector<uint8_t> buf(kReadChunkSize);
  while (!close_notified_.load()) {
    auto n = transport_->read(buf.data(), buf.size());
    if (!n && n.get_error() == ErrorCode::kTimeout) continue;

    SessionEvents events;
    if (!n || n.value() == 0) {
      {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.on_transport_error(events);
      }
      dispatch(self, events);
      break;
    }

    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      auto r = session_.receive(Bytes::copy_from(buf.data(), n.value()), Clock::now(), events);
      if (!r) {
        WSCORE_LOG_DEBUG("conn " + std::to_string(id_) + ": receive failed: " +
                         error_name(r.get_error()));
      }
    }
    dispatch(self, events);
  }
}

void Connection::write_loop(ConnPtr self) {
  for (;;) {
    OutboundItem item;
    if (outbound_.pop(item, kTick)) {
      // Nothing may follow a Close frame on the wire.
      if (close_written_.load()) continue;

      auto w = transport_->write(item.wire.data(), item.wire.size());
      SessionEvents events;
      if (!w) {
        {
          std::lock_guard<std::mutex> lock(session_mutex_);
          session_.on_transport_error(events);
        }
        dispatch(self, events);
        break;
      }
      if (item.is_close) {
        close_written_.store(true);
        {
          std::lock_guard<std::mutex> lock(session_mutex_);
          session_.on_close_sent(events);
        }
        dispatch(self, events);
      }
    } else if (close_notified_.load()) {
      // Closed and drained.
      break;
    }
  }

  transport_->shutdown();
}

// Timers run on their own thread so that a write blocked on a peer that
// stopped reading cannot hold back the close or idle deadlines.
void Connection::timer_loop(ConnPtr self) {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(close_mutex_);
      if (close_cv_.wait_for(lock, kTick, [this] { return close_info_.has_value(); })) return;
    }
    SessionEvents events;
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      session_.poll(Clock::now(), events);
    }
    dispatch(self, events);
  }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Connection::shutdown(uint16_t code, std::chrono::milliseconds timeout) {
  if (!is_closed() && started_.load()) {
    auto r = close(code, "");
    if (r && wait_closed(timeout)) return;
  }
  abort();
}

void Connection::abort() {
  if (!close_notified_.load()) {
    SessionEvents events;
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      session_.on_transport_error(events);
    }
    if (events.closed) {
      events.closed.value().origin = CloseOrigin::kLocal;
      events.closed.value().error = ErrorCode::kConnectionClosed;
    }
    events.outbound.clear();
    auto self = weak_from_this().lock();
    if (self) {
      dispatch(self, events);
    } else if (events.closed) {
      // Destructor path: record the outcome without callbacks.
      close_notified_.store(true);
      std::lock_guard<std::mutex> lock(close_mutex_);
      close_info_ = events.closed;
    }
  }
  outbound_.abort();
  inbound_.close();
  close_cv_.notify_all();
  transport_->shutdown();
}

bool Connection::wait_closed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(close_mutex_);
  return close_cv_.wait_for(lock, timeout, [this] { return close_info_.has_value(); });
}

void Connection::join() {
  if (reader_.joinable()) reader_.join();
  if (writer_.joinable()) writer_.join();
  if (timer_.joinable()) timer_.join();
}

ConnectionState Connection::get_state() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_.state();
}

bool Connection::compression_enabled() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_.compression_enabled();
}

optional<CloseInfo> Connection::close_info() const {
  std::lock_guard<std::mutex> lock(close_mutex_);
  return close_info_;
}

}  // namespace wscore
