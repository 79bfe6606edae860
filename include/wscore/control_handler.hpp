#ifndef WSCORE_CONTROL_HANDLER_HPP_
#define WSCORE_CONTROL_HANDLER_HPP_

#include "wscore/config.hpp"
#include "wscore/frame.hpp"
#include "wscore/message.hpp"
#include "wscore/state_machine.hpp"
#include "wscore/vocabulary.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace wscore {

/**
 * @brief Reacts to inbound control frames and drives the close handshake.
 *
 * Holds a reference to the connection's StateMachine and is the only
 * component that moves it between Open, the two closing states and Closed.
 */
class ControlFrameHandler {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  struct Result {
    optional<ws::Frame> reply;        // Pong or Close echo to queue
    bool reply_is_close = false;      // echo: call on_echo_sent() once written
    optional<Message> surfaced;       // Pong delivered to the application
    optional<CloseInfo> closed;       // the connection just reached Closed
  };

  struct TimerResult {
    ErrorCode expired = ErrorCode::kOk;  // kHandshakeTimeout, kIdleTimeout, kCloseTimeout
    optional<ws::Frame> ping;            // keepalive ping to queue
    optional<CloseInfo> closed;
  };

  ControlFrameHandler(StateMachine& state, const EngineConfig& config, TimePoint now);

  /// kInvalidArgument for a non-control frame, kInvalidState before Open.
  expected<Result, ErrorCode> handle(const ws::Frame& frame, TimePoint now);

  /// Open -> ClosingLocal. Returns the Close frame to send and arms the close
  /// deadline. kInvalidArgument for a code that may not be sent,
  /// kInvalidState when not Open.
  expected<ws::Frame, ErrorCode> initiate_close(uint16_t code, std::string_view reason,
                                                TimePoint now);

  /// Fatal error: any -> Closed. reply carries a best-effort Close frame
  /// with the mapped code unless a Close already went out.
  Result fail(ErrorCode err);

  /// The echo queued in ClosingRemote went out: ClosingRemote -> Closed.
  optional<CloseInfo> on_echo_sent();

  /// Transport broke: any -> Closed without a handshake.
  optional<CloseInfo> on_transport_error();

  TimerResult poll(TimePoint now);

  void note_activity(TimePoint now) { last_activity_ = now; }
  void note_open(TimePoint now);

  bool close_sent() const { return close_sent_; }

 private:
  optional<CloseInfo> close_now(CloseInfo info);

  StateMachine& state_;
  const EngineConfig& config_;

  TimePoint created_at_;
  TimePoint last_activity_;
  TimePoint last_ping_;
  TimePoint close_deadline_;

  bool close_sent_ = false;
  uint16_t local_code_ = close_code::kNormal;
  std::string local_reason_;
  CloseInfo remote_close_;
};

}  // namespace wscore

#endif  // WSCORE_CONTROL_HANDLER_HPP_
