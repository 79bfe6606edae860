#ifndef WSCORE_SESSION_HPP_
#define WSCORE_SESSION_HPP_

#include "wscore/backpressure.hpp"
#include "wscore/bytes.hpp"
#include "wscore/compression.hpp"
#include "wscore/config.hpp"
#include "wscore/control_handler.hpp"
#include "wscore/fragment_assembler.hpp"
#include "wscore/frame.hpp"
#include "wscore/message.hpp"
#include "wscore/state_machine.hpp"
#include "wscore/vocabulary.hpp"

#include <chrono>
#include <string_view>
#include <vector>

namespace wscore {

struct SessionEvents {
  std::vector<Message> messages;       // in arrival order
  std::vector<OutboundItem> outbound;  // in send order
  optional<CloseInfo> closed;          // set once, when Closed is reached
  ErrorCode error = ErrorCode::kOk;    // fatal error or expired timer, if any

  void clear() {
    messages.clear();
    outbound.clear();
    closed.reset();
    error = ErrorCode::kOk;
  }
};

class Session {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit Session(const EngineConfig& config, TimePoint now = Clock::now());

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Handshaking -> Open once the opening handshake is done.
  expected<void, ErrorCode> open(TimePoint now);

  /**
   * @brief Feed bytes read from the transport.
   *
   * Decodes every complete frame in the buffer. A fatal error returns the
   * error, queues a best-effort Close and leaves the session Closed; further
   * input is refused with kConnectionClosed.
   */
  expected<void, ErrorCode> receive(const Bytes& chunk, TimePoint now,
                                    SessionEvents& events);

  /// Queue an application message. Data messages require Open.
  expected<void, ErrorCode> send(const Message& msg, SessionEvents& events);

  /// Start the closing handshake (Open -> ClosingLocal).
  expected<void, ErrorCode> close(uint16_t code, std::string_view reason, TimePoint now,
                                  SessionEvents& events);

  /// Handshake, idle and close deadlines plus keepalive pings.
  void poll(TimePoint now, SessionEvents& events);

  /// A Close frame reached the transport.
  void on_close_sent(SessionEvents& events);

  /// The transport failed or hit end of stream.
  void on_transport_error(SessionEvents& events);

  /// Fatal local error outside frame decoding.
  void fail(ErrorCode err, SessionEvents& events);

  ConnectionState state() const { return state_.get_state(); }
  StateMachine& state_machine() { return state_; }
  bool is_closed() const { return state_.is_closed(); }
  bool compression_enabled() const { return deflate_.enabled(); }
  const EngineConfig& config() const { return config_; }
  size_t buffered() const { return pending_.size() + partial_.size(); }

  /// Serialize one message for this session's role, compressing and
  /// fragmenting data messages as configured.
  expected<OutboundItem, ErrorCode> encode_message(const Message& msg);

 private:
  expected<void, ErrorCode> handle_frame(const ws::Frame& frame, TimePoint now,
                                         SessionEvents& events);
  expected<void, ErrorCode> deliver(const AssembledMessage& msg, SessionEvents& events);
  OutboundItem encode_control(const ws::Frame& frame, bool is_close) const;
  void apply(ControlFrameHandler::Result& result, SessionEvents& events);

  EngineConfig config_;
  StateMachine state_;
  ControlFrameHandler control_;
  FragmentAssembler assembler_;
  PerMessageDeflate deflate_;
  ws::DecodeOptions decode_opts_;
  void drop_input();

  Bytes pending_;
  // Tail of a frame split across reads. Its header has already been checked.
  std::vector<uint8_t> partial_;
  uint64_t partial_size_ = 0;  // full encoded size once the header is known
  bool failed_ = false;
};

}  // namespace wscore

#endif  // WSCORE_SESSION_HPP_
