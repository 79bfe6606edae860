#ifndef WSCORE_STATE_MACHINE_HPP_
#define WSCORE_STATE_MACHINE_HPP_

#include "wscore/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <functional>

namespace wscore {

enum class ConnectionState : uint8_t {
  kHandshaking,    // waiting for the opening handshake to finish
  kOpen,           // data flows both ways
  kClosingLocal,   // we sent Close, waiting for the echo
  kClosingRemote,  // peer sent Close, our echo is on its way out
  kClosed          // terminal
};

const char* state_name(ConnectionState state);

// Per-state behaviour table (const, zero allocation)
struct StateOps {
  ConnectionState state;
  bool accepts_data;   // inbound data frames are decoded
  bool delivers_data;  // decoded data messages reach the application
  bool sends_data;     // application may send data messages
  uint8_t next_mask;   // bit per legal target state
};

const StateOps& state_ops(ConnectionState state);

/**
 * @brief The single source of truth for a connection's state.
 *
 * Reads are lock-free; transitions are expected to be serialized by the
 * owner (the session mutex).
 */
class StateMachine {
 public:
  StateMachine() = default;

  ConnectionState get_state() const { return state_.load(std::memory_order_acquire); }

  static bool is_legal(ConnectionState from, ConnectionState to);

  /// kInvalidState for anything outside the transition table.
  expected<void, ErrorCode> transition_to(ConnectionState next);

  bool can_receive_data() const { return state_ops(get_state()).accepts_data; }
  bool delivers_data() const { return state_ops(get_state()).delivers_data; }
  bool can_send_data() const { return state_ops(get_state()).sends_data; }
  bool is_closed() const { return get_state() == ConnectionState::kClosed; }
  bool is_closing() const {
    auto s = get_state();
    return s == ConnectionState::kClosingLocal || s == ConnectionState::kClosingRemote;
  }

  std::function<void(ConnectionState from, ConnectionState to)> on_transition;

 private:
  std::atomic<ConnectionState> state_{ConnectionState::kHandshaking};
};

}  // namespace wscore

#endif  // WSCORE_STATE_MACHINE_HPP_
