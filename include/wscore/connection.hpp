#ifndef WSCORE_CONNECTION_HPP_
#define WSCORE_CONNECTION_HPP_

#include "wscore/backpressure.hpp"
#include "wscore/bytes.hpp"
#include "wscore/config.hpp"
#include "wscore/message.hpp"
#include "wscore/session.hpp"
#include "wscore/transport.hpp"
#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace wscore {

// ============================================================================
// Connection (Session + Transport + reader/writer/timer threads)
// ============================================================================

/**
 * @brief One live WebSocket connection after the opening handshake.
 *
 * A reader thread feeds transport bytes into the Session and hands decoded
 * messages to the application, a writer thread drains the outbound queue and
 * a timer thread drives the handshake, idle, keepalive and close deadlines.
 * All public methods are thread-safe.
 *
 * Messages go to on_message when it is set before start(), otherwise they are
 * buffered (up to backpressure.inbound_capacity) for receive(). A full inbound
 * buffer pauses reading from the transport.
 */
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  using ConnPtr = std::shared_ptr<Connection>;
  using Clock = std::chrono::steady_clock;

  static constexpr size_t kReadChunkSize = 16 * 1024;
  static constexpr std::chrono::milliseconds kTick{50};

  Connection(std::unique_ptr<Transport> transport, const EngineConfig& config);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /// Enter Open and start the I/O threads. initial holds bytes read past the
  /// handshake; they are processed before anything else.
  expected<void, ErrorCode> start(Bytes initial = Bytes());

  // --- Sending ---

  expected<void, ErrorCode> send(const Message& msg);
  expected<void, ErrorCode> send_text(std::string_view text) { return send(Message::text(text)); }
  expected<void, ErrorCode> send_binary(Bytes data) { return send(Message::binary(std::move(data))); }
  expected<void, ErrorCode> send_binary(std::string_view data) {
    return send(Message::binary(data));
  }
  expected<void, ErrorCode> ping(Bytes payload = Bytes()) {
    return send(Message::ping(std::move(payload)));
  }

  /// Start the closing handshake. Succeeds when one is already running.
  expected<void, ErrorCode> close(uint16_t code = close_code::kNormal,
                                  std::string_view reason = {});

  // --- Receiving (when on_message is not set) ---

  /// kTimeout when nothing arrives in time, kConnectionClosed once the
  /// connection is closed and every buffered message has been read.
  expected<Message, ErrorCode> receive(std::chrono::milliseconds timeout);

  // --- Lifecycle ---

  /// Graceful close bounded by timeout, then abort().
  void shutdown(uint16_t code, std::chrono::milliseconds timeout);

  /// Drop the transport without a closing handshake.
  void abort();

  /// Block until Closed. false on timeout.
  bool wait_closed(std::chrono::milliseconds timeout);

  /// Join the I/O threads. Must not be called from a callback.
  void join();

  // --- Getters ---

  uint64_t get_id() const { return id_; }
  ConnectionState get_state() const;
  bool is_closed() const { return close_notified_.load(); }
  bool compression_enabled() const;
  std::string peer_address() const { return transport_->peer_address(); }
  optional<CloseInfo> close_info() const;
  size_t outbound_size() const { return outbound_.size(); }
  uint64_t dropped_messages() const { return outbound_.dropped(); }

  // --- Callbacks (set before start()) ---

  std::function<void(const ConnPtr&, const Message&)> on_message;
  std::function<void(const ConnPtr&, const CloseInfo&)> on_close;
  std::function<void(const ConnPtr&)> on_backpressure;
  std::function<void(const ConnPtr&)> on_drain;

 private:
  void read_loop(ConnPtr self, Bytes initial);
  void write_loop(ConnPtr self);
  void timer_loop(ConnPtr self);

  /// Act on what the session produced: queue frames, deliver messages and
  /// report the close.
  void dispatch(const ConnPtr& self, SessionEvents& events);
  void finish(const ConnPtr& self, const CloseInfo& info);

  static std::atomic<uint64_t> next_id_;

  uint64_t id_;
  std::unique_ptr<Transport> transport_;
  EngineConfig config_;

  mutable std::mutex session_mutex_;
  Session session_;

  // Held across encode and enqueue so compressed messages keep stream order.
  std::mutex send_mutex_;

  BackpressureQueue outbound_;
  BoundedChannel<Message> inbound_;

  std::thread reader_;
  std::thread writer_;
  std::thread timer_;
  std::atomic<bool> started_{false};
  std::atomic<bool> close_written_{false};
  std::atomic<bool> close_notified_{false};

  mutable std::mutex close_mutex_;
  std::condition_variable close_cv_;
  optional<CloseInfo> close_info_;
};

}  // namespace wscore

#endif  // WSCORE_CONNECTION_HPP_
