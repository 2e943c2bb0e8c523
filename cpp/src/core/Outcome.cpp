#include "core/Outcome.hpp"

#include <spdlog/fmt/fmt.h>

namespace core {

Outcome Outcome::normal(const utility_array_t& utilities) {
  Outcome outcome;
  outcome.utilities = utilities;
  return outcome;
}

Outcome Outcome::forfeit(seat_index_t offender, ErrorKind violation, utility_t max_utility) {
  Outcome outcome;
  outcome.utilities[offender] = -max_utility;
  outcome.utilities[opponent_of(offender)] = max_utility;
  outcome.termination = kForfeit;
  outcome.forfeiting_seat = offender;
  outcome.violation = violation;
  return outcome;
}

seat_index_t Outcome::winner() const {
  if (utilities[0] > utilities[1]) return 0;
  if (utilities[1] > utilities[0]) return 1;
  return -1;
}

std::string Outcome::to_str() const {
  std::string s = fmt::format("[{}, {}]", utilities[0], utilities[1]);
  if (termination == kForfeit) {
    s += fmt::format(" (seat {} forfeited: {})", forfeiting_seat, core::to_str(*violation));
  }
  return s;
}

}  // namespace core
