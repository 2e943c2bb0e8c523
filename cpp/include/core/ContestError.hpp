#pragma once

#include "core/BasicTypes.hpp"
#include "util/Exception.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>

namespace core {

enum class ErrorKind : int8_t {
  // An agent returned an action outside the legal set.
  kIllegalAction,

  // An agent did not return within its time budget plus the contest's tolerance.
  kTimeout,

  // An agent's decide() call threw.
  kAgentFailure,

  // A decision or a contest step was requested on a game that is already over.
  kGameAlreadyOver,

  // Invalid contest or agent parameters.
  kConfigurationError,

  // The game model itself misbehaved, e.g. apply() threw on an action that get_legal_actions()
  // listed, or a non-terminal state had no legal actions.
  kRulesFailure,
};

std::string to_str(ErrorKind kind);

// Only these two violations can be resolved as a forfeit. Every other kind is always fatal.
inline bool is_forfeitable(ErrorKind kind) {
  return kind == ErrorKind::kIllegalAction || kind == ErrorKind::kTimeout;
}

/*
 * The typed failure surfaced by the contest runner and by game models and agents.
 *
 * what() renders as "<kind>[ seat=<seat>][ ply=<ply>]: <detail>", where the seat and ply parts are
 * omitted when unknown (-1).
 */
class ContestError : public util::Exception {
 public:
  template <typename... Ts>
  ContestError(ErrorKind kind, seat_index_t seat, ply_t ply, fmt::format_string<Ts...> fmt,
               Ts&&... ts);

  template <typename... Ts>
  ContestError(ErrorKind kind, fmt::format_string<Ts...> fmt, Ts&&... ts);

  ErrorKind kind() const { return kind_; }
  seat_index_t seat() const { return seat_; }
  ply_t ply() const { return ply_; }
  const std::string& detail() const { return detail_; }

  // Same error, attributed to the given seat and ply.
  ContestError attributed_to(seat_index_t seat, ply_t ply) const;

 private:
  void init(ErrorKind kind, seat_index_t seat, ply_t ply, const std::string& detail);

  std::string detail_;
  ErrorKind kind_;
  seat_index_t seat_;
  ply_t ply_;
};

}  // namespace core

#include "inline/core/ContestError.inl"
