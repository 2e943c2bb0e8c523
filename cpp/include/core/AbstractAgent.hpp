#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "util/CppUtil.hpp"

#include <memory>
#include <string>
#include <vector>

namespace core {

/*
 * Base class for all agents.
 *
 * decide() is called when it is the agent's turn. It must return a member of
 * Game::Rules::get_legal_actions(state), and should return within time_budget. The contest runner
 * calls decide() on a dedicated thread, and stops waiting once time_budget plus a tolerance has
 * elapsed. An agent that overruns is abandoned, not interrupted, so decide() must only touch state
 * owned by the agent itself.
 *
 * An agent asked to decide on a terminal state should throw a core::ContestError of kind
 * kGameAlreadyOver.
 *
 * Agents are shared via std::shared_ptr, so that an abandoned decide() call keeps its agent alive.
 */
template <concepts::Game Game>
class AbstractAgent {
 public:
  using State = Game::State;
  using Action = Game::Action;

  virtual ~AbstractAgent() = default;

  virtual Action decide(const State& state, duration_t time_budget) = 0;

  virtual std::string get_name() const { return util::get_typename(*this); }

 protected:
  // Throws core::ContestError of kind kGameAlreadyOver if state is terminal.
  void check_not_terminal(const State& state) const;

  /*
   * Returns Rules::get_legal_actions(state). Throws core::ContestError of kind kGameAlreadyOver if
   * state is terminal.
   */
  std::vector<Action> get_legal_actions_or_throw(const State& state) const;
};

template <concepts::Game Game>
using AbstractAgent_sptr = std::shared_ptr<AbstractAgent<Game>>;

}  // namespace core

#include "inline/core/AbstractAgent.inl"
