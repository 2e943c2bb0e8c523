#pragma once

#include "core/AbstractAgent.hpp"
#include "core/concepts/GameConcept.hpp"

#include <functional>
#include <string>
#include <utility>

namespace generic {

/*
 * Adapts a callable to the agent interface. Useful for scripted agents in tests.
 *
 * The callable is never invoked on a terminal state. Beyond that it is trusted as-is: nothing checks
 * that its action is legal or that it respects the time budget.
 */
template <core::concepts::Game Game>
class FunctionalAgent : public core::AbstractAgent<Game> {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using decide_func_t = std::function<Action(const State&, core::duration_t)>;

  FunctionalAgent(const std::string& name, decide_func_t func)
      : name_(name), func_(std::move(func)) {}

  Action decide(const State& state, core::duration_t time_budget) override {
    this->check_not_terminal(state);
    return func_(state, time_budget);
  }

  std::string get_name() const override { return name_; }

 private:
  const std::string name_;
  const decide_func_t func_;
};

}  // namespace generic
