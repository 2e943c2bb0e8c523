#include "core/ContestParams.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace core {

inline auto ContestParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Contest options");

  return desc
    .template add_option<"time-budget-per-move", 't'>(
      po2::default_value("{:.3f}", &time_budget_per_move),
      "wall-clock seconds an agent may spend deciding each move")
    .template add_option<"timeout-tolerance">(
      po2::default_value("{:.3f}", &timeout_tolerance),
      "extra seconds allowed past the time budget before a decision counts as timed out")
    .template add_option<"forfeit-on-violation">(
      po::value<bool>()->required()->notifier([this](bool b) { forfeit_on_violation = b; }),
      "required. 1: an illegal action or timeout forfeits the game. 0: it aborts the contest")
    .template add_flag<"announce-results", "no-announce-results">(
      &announce_results, "log the result of each contest", "do not log contest results")
    .template add_flag<"print-states", "no-print-states">(&print_states, "log every state",
                                                          "do not log every state");
}

}  // namespace core
