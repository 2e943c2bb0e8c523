#pragma once

#include "core/AbstractAgent.hpp"
#include "core/BasicTypes.hpp"
#include "core/ContestError.hpp"
#include "core/ContestParams.hpp"
#include "core/History.hpp"
#include "core/Outcome.hpp"
#include "core/concepts/GameConcept.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

enum contest_status_t : int8_t { kNotStarted, kInProgress, kCompleted, kAborted };

template <concepts::Game Game>
struct ContestResult {
  History<Game> history;
  Outcome outcome;
};

/*
 * Plays one game between two agents. agent_a plays seat 0 and agent_b plays seat 1.
 *
 * Each turn, the agent to move decides on a dedicated thread (see core::DecisionTask), bounded by
 * the time budget plus the timeout tolerance. The returned action is checked against
 * Rules::get_legal_actions() before it is applied. A rejected action is never applied and never
 * recorded.
 *
 * An illegal action or a timeout is a violation. If params.forfeit_on_violation is set, the
 * offending seat forfeits (-kMaxUtility) and the contest completes. Otherwise the contest aborts
 * with a core::ContestError of kind kIllegalAction/kTimeout.
 *
 * An agent whose decide() throws aborts the contest with kAgentFailure (or kGameAlreadyOver, if
 * that is what it threw). A game model that misbehaves aborts it with kRulesFailure.
 *
 * After an abort, status(), state() and history() describe the contest as it was when the error
 * occurred.
 *
 * Usage:
 *
 * core::Contest<tictactoe::Game> contest(params, agent_a, agent_b);
 * auto result = contest.run();
 *
 * or, turn by turn:
 *
 * while (contest.step()) { ... }
 */
template <concepts::Game Game>
class Contest {
 public:
  using Params = ContestParams;
  using State = Game::State;
  using Action = Game::Action;
  using Rules = Game::Rules;
  using IO = Game::IO;
  using Agent_sptr = AbstractAgent_sptr<Game>;
  using agent_array_t = std::array<Agent_sptr, kNumPlayers>;
  using History = core::History<Game>;
  using Result = ContestResult<Game>;

  /*
   * Throws core::ContestError of kind kConfigurationError if params are invalid or an agent is
   * null.
   */
  Contest(const Params& params, Agent_sptr agent_a, Agent_sptr agent_b);
  Contest(const Params& params, Agent_sptr agent_a, Agent_sptr agent_b,
          const State& initial_state);

  /*
   * Plays one turn. Returns true iff the contest is still in progress afterwards.
   *
   * The first step() on a contest whose initial state is already terminal completes it without
   * consulting either agent.
   *
   * Throws core::ContestError of kind kGameAlreadyOver if the contest has already finished, and
   * the contest's own ContestError if this turn aborts it.
   */
  bool step();

  /*
   * Steps until the contest finishes, and moves the history out to the caller.
   *
   * Throws core::ContestError of kind kGameAlreadyOver if the contest aborted earlier or its result
   * was already taken.
   */
  Result run();

  contest_status_t status() const { return status_; }
  bool finished() const { return status_ == kCompleted || status_ == kAborted; }
  const State& state() const { return state_; }
  const History& history() const { return history_; }
  const std::optional<Outcome>& outcome() const { return outcome_; }
  const Params& params() const { return params_; }
  ply_t ply() const { return ply_; }

 private:
  static const Params& validated(const Params& params);
  static State make_initial_state();
  static const State& static_initialized(const State& state);
  static agent_array_t validate_agents(Agent_sptr agent_a, Agent_sptr agent_b);
  static typename History::agent_name_array_t get_agent_names(const agent_array_t& agents);

  void play_turn();
  bool is_terminal();
  seat_index_t get_current_seat();
  std::vector<Action> get_legal_actions();
  State apply_action(seat_index_t seat, const Action& action);
  Outcome get_terminal_outcome();
  void handle_violation(seat_index_t seat, ErrorKind kind, const std::string& detail);
  void finish(const Outcome& outcome);
  [[noreturn]] void abort(const ContestError& error);

  const Params params_;
  const agent_array_t agents_;
  State state_;
  History history_;
  std::optional<Outcome> outcome_;
  ply_t ply_ = 0;
  contest_status_t status_ = kNotStarted;
  bool result_taken_ = false;
};

/*
 * Convenience wrapper: Contest<Game>(params, agent_a, agent_b).run().
 */
template <concepts::Game Game>
ContestResult<Game> run_contest(const ContestParams& params, AbstractAgent_sptr<Game> agent_a,
                                AbstractAgent_sptr<Game> agent_b);

}  // namespace core

#include "inline/core/Contest.inl"
