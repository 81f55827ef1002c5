#pragma once

#include <cstdint>

namespace sensorweave::stream {

enum class SessionState : std::uint8_t {
  kClosed      = 0,
  kNegotiating = 1,
  kOpen        = 2,
  kPaused      = 3,
  kError       = 4,
};

constexpr const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::kClosed:
      return "CLOSED";
    case SessionState::kNegotiating:
      return "NEGOTIATING";
    case SessionState::kOpen:
      return "OPEN";
    case SessionState::kPaused:
      return "PAUSED";
    case SessionState::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

/*
  CLOSED -> NEGOTIATING -> OPEN -> {PAUSED, ERROR} -> CLOSED

  plus the recovery edges ERROR -> NEGOTIATING, PAUSED -> OPEN and the
  abort edges NEGOTIATING -> {CLOSED, ERROR}. OPEN -> CLOSED is an
  ordinary unsubscribe.
*/
constexpr bool CanTransition(SessionState from, SessionState to) {
  if (from == to) {
    return true;
  }

  switch (from) {
    case SessionState::kClosed:
      return to == SessionState::kNegotiating;
    case SessionState::kNegotiating:
      return to == SessionState::kOpen || to == SessionState::kClosed || to == SessionState::kError;
    case SessionState::kOpen:
      return to == SessionState::kPaused || to == SessionState::kError || to == SessionState::kClosed;
    case SessionState::kPaused:
      return to == SessionState::kOpen || to == SessionState::kError || to == SessionState::kClosed;
    case SessionState::kError:
      return to == SessionState::kNegotiating || to == SessionState::kClosed;
  }
  return false;
}

constexpr bool AcceptsPackets(SessionState state) {
  return state == SessionState::kOpen || state == SessionState::kPaused;
}

} // namespace sensorweave::stream
