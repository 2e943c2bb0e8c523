#include "games/tictactoe/Game.hpp"

#include "core/ContestError.hpp"
#include "util/Asserts.hpp"

#include <bit>

namespace tictactoe {

std::vector<Game::Action> Game::Rules::get_legal_actions(const State& state) {
  std::vector<Action> actions;
  if (is_terminal(state)) return actions;

  mask_t empty = ~state.full_mask & ((mask_t(1) << kNumCells) - 1);
  while (empty) {
    actions.push_back(std::countr_zero(empty));
    empty &= empty - 1;
  }
  return actions;
}

Game::State Game::Rules::apply(const State& state, const Action& action) {
  if (action < 0 || action >= kNumCells) {
    throw core::ContestError(core::ErrorKind::kIllegalAction, "cell {} is off the board", action);
  }
  mask_t piece_mask = mask_t(1) << action;
  if (state.full_mask & piece_mask) {
    throw core::ContestError(core::ErrorKind::kIllegalAction, "cell {} is occupied in {}", action,
                             IO::compact_state_repr(state));
  }
  if (is_terminal(state)) {
    throw core::ContestError(core::ErrorKind::kIllegalAction, "game is over in {}",
                             IO::compact_state_repr(state));
  }

  State next = state;
  next.cur_player_mask ^= next.full_mask;
  next.full_mask |= piece_mask;
  return next;
}

core::utility_t Game::Rules::get_utility(const State& state, core::seat_index_t seat) {
  RELEASE_ASSERT(is_terminal(state), "utility of non-terminal state {}",
                 IO::compact_state_repr(state));

  if (!last_mover_won(state)) return 0;
  core::seat_index_t winner = 1 - get_current_player(state);
  return seat == winner ? Constants::kMaxUtility : -Constants::kMaxUtility;
}

void Game::IO::print_state(std::ostream& ss, const State& state) {
  auto cp = Rules::get_current_player(state);
  mask_t opp_player_mask = state.opponent_mask();
  mask_t o_mask = (cp == kO) ? state.cur_player_mask : opp_player_mask;
  mask_t x_mask = (cp == kX) ? state.cur_player_mask : opp_player_mask;

  char text[] =
    "0 1 2  | | | |\n"
    "3 4 5  | | | |\n"
    "6 7 8  | | | |\n";

  int offset_table[] = {8, 10, 12, 23, 25, 27, 38, 40, 42};
  for (int i = 0; i < kNumCells; ++i) {
    int offset = offset_table[i];
    if (o_mask & (mask_t(1) << i)) {
      text[offset] = 'O';
    } else if (x_mask & (mask_t(1) << i)) {
      text[offset] = 'X';
    }
  }

  ss << text << std::endl;
}

}  // namespace tictactoe
