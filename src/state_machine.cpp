#include "wscore/state_machine.hpp"

#include "wscore/log.hpp"

#include <string>

namespace wscore {

namespace {

constexpr uint8_t bit(ConnectionState s) {
  return static_cast<uint8_t>(1u << static_cast<uint8_t>(s));
}

// Any live state may drop straight to Closed (transport error, timeout,
// fatal protocol error). Closed is terminal.
const StateOps kStateTable[] = {
    {ConnectionState::kHandshaking, false, false, false,
     static_cast<uint8_t>(bit(ConnectionState::kOpen) | bit(ConnectionState::kClosed))},
    {ConnectionState::kOpen, true, true, true,
     static_cast<uint8_t>(bit(ConnectionState::kClosingLocal) |
                          bit(ConnectionState::kClosingRemote) |
                          bit(ConnectionState::kClosed))},
    {ConnectionState::kClosingLocal, true, false, false,
     bit(ConnectionState::kClosed)},
    {ConnectionState::kClosingRemote, false, false, false,
     bit(ConnectionState::kClosed)},
    {ConnectionState::kClosed, false, false, false, 0},
};

}  // namespace

const char* state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kHandshaking: return "Handshaking";
    case ConnectionState::kOpen: return "Open";
    case ConnectionState::kClosingLocal: return "ClosingLocal";
    case ConnectionState::kClosingRemote: return "ClosingRemote";
    case ConnectionState::kClosed: return "Closed";
  }
  return "Unknown";
}

const StateOps& state_ops(ConnectionState state) {
  return kStateTable[static_cast<uint8_t>(state)];
}

bool StateMachine::is_legal(ConnectionState from, ConnectionState to) {
  return (state_ops(from).next_mask & bit(to)) != 0;
}

expected<void, ErrorCode> StateMachine::transition_to(ConnectionState next) {
  const ConnectionState current = get_state();
  if (!is_legal(current, next)) {
    WSCORE_LOG_DEBUG(std::string("illegal transition ") + state_name(current) +
                     " -> " + state_name(next));
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  state_.store(next, std::memory_order_release);
  if (on_transition) on_transition(current, next);
  return expected<void, ErrorCode>::success();
}

}  // namespace wscore
