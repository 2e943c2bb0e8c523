#include "core/Contest.hpp"

#include "core/DecisionTask.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

namespace core {

template <concepts::Game Game>
Contest<Game>::Contest(const Params& params, Agent_sptr agent_a, Agent_sptr agent_b)
    : Contest(params, agent_a, agent_b, make_initial_state()) {}

template <concepts::Game Game>
Contest<Game>::Contest(const Params& params, Agent_sptr agent_a, Agent_sptr agent_b,
                       const State& initial_state)
    : params_(validated(params)),
      agents_(validate_agents(agent_a, agent_b)),
      state_(static_initialized(initial_state)),
      history_(initial_state, get_agent_names(agents_)) {}

template <concepts::Game Game>
bool Contest<Game>::step() {
  if (finished()) {
    throw ContestError(ErrorKind::kGameAlreadyOver, -1, ply(), "{} contest already finished",
                       Game::Constants::kGameName);
  }

  if (status_ == kNotStarted) {
    status_ = kInProgress;
    LOG_DEBUG("Starting {} contest: {} vs {}", Game::Constants::kGameName,
              history_.agent_names()[0], history_.agent_names()[1]);
  }

  if (!is_terminal()) {
    play_turn();
    if (finished()) return false;
  }

  if (is_terminal()) {
    finish(get_terminal_outcome());
    return false;
  }
  return true;
}

template <concepts::Game Game>
typename Contest<Game>::Result Contest<Game>::run() {
  if (status_ == kAborted || result_taken_) {
    throw ContestError(ErrorKind::kGameAlreadyOver, -1, ply(), "{} contest result unavailable",
                       Game::Constants::kGameName);
  }
  while (!finished() && step()) {
  }
  result_taken_ = true;
  return Result{std::move(history_), *outcome_};
}

template <concepts::Game Game>
const ContestParams& Contest<Game>::validated(const Params& params) {
  params.validate();
  return params;
}

template <concepts::Game Game>
typename Game::State Contest<Game>::make_initial_state() {
  Game::static_init();
  return Rules::init_state();
}

template <concepts::Game Game>
const typename Game::State& Contest<Game>::static_initialized(const State& state) {
  Game::static_init();
  return state;
}

template <concepts::Game Game>
typename Contest<Game>::agent_array_t Contest<Game>::validate_agents(Agent_sptr agent_a,
                                                                     Agent_sptr agent_b) {
  if (!agent_a || !agent_b) {
    throw ContestError(ErrorKind::kConfigurationError, "both agents must be non-null");
  }
  return agent_array_t{agent_a, agent_b};
}

template <concepts::Game Game>
typename History<Game>::agent_name_array_t Contest<Game>::get_agent_names(
  const agent_array_t& agents) {
  typename History::agent_name_array_t names;
  for (int s = 0; s < kNumPlayers; ++s) {
    names[s] = agents[s]->get_name();
  }
  return names;
}

template <concepts::Game Game>
void Contest<Game>::play_turn() {
  seat_index_t seat = get_current_seat();
  std::vector<Action> legal_actions = get_legal_actions();

  const Agent_sptr& agent = agents_[seat];
  auto result = DecisionTask<Game>::run(agent, state_, params_.time_budget(), params_.tolerance());
  double elapsed_ms = std::chrono::duration<double, std::milli>(result.elapsed).count();

  if (result.status == DecisionTask<Game>::kTimedOut) {
    handle_violation(seat, ErrorKind::kTimeout,
                     fmt::format("{} did not decide within {:.3f}s (+{:.3f}s tolerance)",
                                 agent->get_name(), params_.time_budget_per_move,
                                 params_.timeout_tolerance));
    return;
  }

  if (result.status == DecisionTask<Game>::kFailed) {
    try {
      std::rethrow_exception(result.exception);
    } catch (const ContestError& e) {
      if (e.kind() == ErrorKind::kGameAlreadyOver) {
        abort(e.attributed_to(seat, ply()));
      }
      abort(ContestError(ErrorKind::kAgentFailure, seat, ply(), "{} threw: {}", agent->get_name(),
                         e.what()));
    } catch (const std::exception& e) {
      abort(ContestError(ErrorKind::kAgentFailure, seat, ply(), "{} threw: {}", agent->get_name(),
                         e.what()));
    } catch (...) {
      abort(ContestError(ErrorKind::kAgentFailure, seat, ply(), "{} threw a non-std exception",
                         agent->get_name()));
    }
  }

  const Action& action = *result.action;
  if (std::find(legal_actions.begin(), legal_actions.end(), action) == legal_actions.end()) {
    handle_violation(seat, ErrorKind::kIllegalAction,
                     fmt::format("{} chose illegal action {} in state {}", agent->get_name(),
                                 IO::action_to_str(action), IO::compact_state_repr(state_)));
    return;
  }

  State next = apply_action(seat, action);

  LOG_DEBUG("{} ply {}: {} plays {} ({:.1f}ms)", Game::Constants::kGameName, ply(),
            IO::player_to_str(seat), IO::action_to_str(action), elapsed_ms);

  history_.append({state_, action, next, seat, result.elapsed});
  state_ = next;
  ++ply_;

  if (params_.print_states) {
    std::ostringstream ss;
    IO::print_state(ss, state_);
    LOG_INFO("{}", ss.str());
  }
}

template <concepts::Game Game>
bool Contest<Game>::is_terminal() {
  try {
    return Rules::is_terminal(state_);
  } catch (const std::exception& e) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(), "is_terminal() failed in state {}: {}",
                       IO::compact_state_repr(state_), e.what()));
  }
}

template <concepts::Game Game>
seat_index_t Contest<Game>::get_current_seat() {
  seat_index_t seat = -1;
  try {
    seat = Rules::get_current_player(state_);
  } catch (const std::exception& e) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(),
                       "get_current_player() failed in state {}: {}",
                       IO::compact_state_repr(state_), e.what()));
  }
  if (seat < 0 || seat >= kNumPlayers) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(),
                       "get_current_player() returned invalid seat {} in state {}", int(seat),
                       IO::compact_state_repr(state_)));
  }
  return seat;
}

template <concepts::Game Game>
std::vector<typename Game::Action> Contest<Game>::get_legal_actions() {
  std::vector<Action> legal_actions;
  try {
    legal_actions = Rules::get_legal_actions(state_);
  } catch (const std::exception& e) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(), "get_legal_actions() failed: {}",
                       e.what()));
  }
  if (legal_actions.empty()) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(),
                       "non-terminal state {} has no legal actions",
                       IO::compact_state_repr(state_)));
  }
  return legal_actions;
}

template <concepts::Game Game>
typename Game::State Contest<Game>::apply_action(seat_index_t seat, const Action& action) {
  try {
    return Rules::apply(state_, action);
  } catch (const std::exception& e) {
    abort(ContestError(ErrorKind::kRulesFailure, seat, ply(), "apply({}) failed in state {}: {}",
                       IO::action_to_str(action), IO::compact_state_repr(state_), e.what()));
  }
}

template <concepts::Game Game>
Outcome Contest<Game>::get_terminal_outcome() {
  Outcome::utility_array_t utilities;
  for (int s = 0; s < kNumPlayers; ++s) {
    try {
      utilities[s] = Rules::get_utility(state_, s);
    } catch (const std::exception& e) {
      abort(ContestError(ErrorKind::kRulesFailure, s, ply(),
                         "get_utility() failed for seat {} in state {}: {}", s,
                         IO::compact_state_repr(state_), e.what()));
    }
  }
  Outcome outcome = Outcome::normal(utilities);
  if (!outcome.is_zero_sum()) {
    abort(ContestError(ErrorKind::kRulesFailure, -1, ply(),
                       "terminal state {} is not zero-sum: {}", IO::compact_state_repr(state_),
                       outcome.to_str()));
  }
  return outcome;
}

template <concepts::Game Game>
void Contest<Game>::handle_violation(seat_index_t seat, ErrorKind kind, const std::string& detail) {
  ContestError error(kind, seat, ply(), "{}", detail);
  if (!*params_.forfeit_on_violation) {
    abort(error);
  }

  LOG_WARN("{} forfeit: {}", Game::Constants::kGameName, error.what());
  finish(Outcome::forfeit(seat, kind, Game::Constants::kMaxUtility));
}

template <concepts::Game Game>
void Contest<Game>::finish(const Outcome& outcome) {
  outcome_ = outcome;
  status_ = kCompleted;
  if (params_.announce_results) {
    LOG_INFO("{} result after {} plies: {} vs {} -> {}", Game::Constants::kGameName, ply(),
             history_.agent_names()[0], history_.agent_names()[1], outcome.to_str());
  }
}

template <concepts::Game Game>
void Contest<Game>::abort(const ContestError& error) {
  status_ = kAborted;
  LOG_ERROR("{} contest aborted: {}", Game::Constants::kGameName, error.what());
  throw error;
}

template <concepts::Game Game>
ContestResult<Game> run_contest(const ContestParams& params, AbstractAgent_sptr<Game> agent_a,
                                AbstractAgent_sptr<Game> agent_b) {
  Contest<Game> contest(params, agent_a, agent_b);
  return contest.run();
}

}  // namespace core
