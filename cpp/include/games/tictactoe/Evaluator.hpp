#pragma once

#include "core/BasicTypes.hpp"
#include "games/tictactoe/Game.hpp"
#include "search/AbstractEvaluator.hpp"

namespace tictactoe {

/*
 * Counts the lines still open for each side. A line is open for a side if it holds at least one of
 * that side's marks and none of the opponent's.
 *
 * evaluate() = kLineWeight * (open lines for perspective - open lines for the opponent), which
 * stays within (-kMaxUtility, kMaxUtility) since there are only 8 lines.
 */
class Evaluator : public search::AbstractEvaluator<Game> {
 public:
  static constexpr core::utility_t kLineWeight = 0.1f;

  core::utility_t evaluate(const State& state, core::seat_index_t perspective) const override;
};

inline core::utility_t Evaluator::evaluate(const State& state,
                                           core::seat_index_t perspective) const {
  core::seat_index_t cp = Game::Rules::get_current_player(state);
  mask_t mine = (cp == perspective) ? state.cur_player_mask : state.opponent_mask();
  mask_t theirs = state.full_mask ^ mine;

  int score = 0;
  for (mask_t line : Game::kThreeInARowMasks) {
    bool has_mine = line & mine;
    bool has_theirs = line & theirs;
    if (has_mine && !has_theirs) score++;
    if (has_theirs && !has_mine) score--;
  }
  return kLineWeight * score;
}

}  // namespace tictactoe
