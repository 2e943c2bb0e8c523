#pragma once

#include "core/BasicTypes.hpp"
#include "core/ContestError.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace core {

enum termination_t : int8_t { kNormalTermination, kForfeit };

/*
 * The final result of a contest: one utility per seat, summing to zero.
 *
 * A forfeit also records which seat forfeited and the violation that caused it.
 */
struct Outcome {
  using utility_array_t = std::array<utility_t, kNumPlayers>;

  static Outcome normal(const utility_array_t& utilities);
  static Outcome forfeit(seat_index_t offender, ErrorKind violation, utility_t max_utility);

  utility_t utility(seat_index_t seat) const { return utilities[seat]; }

  // The seat with the strictly higher utility, or -1 for a draw.
  seat_index_t winner() const;
  bool is_draw() const { return utilities[0] == utilities[1]; }
  bool is_zero_sum() const { return utilities[0] + utilities[1] == 0; }

  std::string to_str() const;

  utility_array_t utilities = {};
  termination_t termination = kNormalTermination;
  seat_index_t forfeiting_seat = -1;
  std::optional<ErrorKind> violation;
};

}  // namespace core
