#pragma once

#include <cstdint>
#include <string_view>

namespace txcoord::xa {

enum class XaState : std::uint8_t {
  kIdle       = 0,
  kStarted    = 1,
  kEnded      = 2,
  kPrepared   = 3,
  kCommitted  = 4,
  kRolledBack = 5,
};

constexpr bool IsTerminal(XaState state) {
  return state == XaState::kCommitted || state == XaState::kRolledBack;
}

// Protocol-level transitions. Whether a backend accepts rollback before
// prepare is a dialect capability checked by the participant.
constexpr bool CanTransition(XaState from, XaState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case XaState::kStarted:
      return from == XaState::kIdle;
    case XaState::kEnded:
      return from == XaState::kStarted;
    case XaState::kPrepared:
      return from == XaState::kEnded;
    case XaState::kCommitted:
      // Ended -> Committed is the one-phase path.
      return from == XaState::kPrepared || from == XaState::kEnded;
    case XaState::kRolledBack:
      return from != XaState::kIdle;
    case XaState::kIdle:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(XaState state) {
  switch (state) {
    case XaState::kIdle:
      return "idle";
    case XaState::kStarted:
      return "started";
    case XaState::kEnded:
      return "ended";
    case XaState::kPrepared:
      return "prepared";
    case XaState::kCommitted:
      return "committed";
    case XaState::kRolledBack:
      return "rolled_back";
  }
  return "unknown";
}

} // namespace txcoord::xa
