#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

namespace search {

/*
 * Heuristic evaluation of non-terminal states, used by search::MinimaxAgent at depth-limited
 * leaves.
 *
 * evaluate() returns the value of state from perspective's point of view. It should stay strictly
 * within (-kMaxUtility, kMaxUtility), so that no heuristic value outranks a decided result.
 *
 * Evaluators are shared between agents and may be called from several decision threads at once,
 * so evaluate() must not modify shared state.
 */
template <core::concepts::Game Game>
class AbstractEvaluator {
 public:
  using State = Game::State;

  virtual ~AbstractEvaluator() = default;

  virtual core::utility_t evaluate(const State& state, core::seat_index_t perspective) const = 0;
};

// Values every non-terminal state as a draw.
template <core::concepts::Game Game>
class NeutralEvaluator : public AbstractEvaluator<Game> {
 public:
  using State = Game::State;

  core::utility_t evaluate(const State&, core::seat_index_t) const override { return 0; }
};

}  // namespace search
