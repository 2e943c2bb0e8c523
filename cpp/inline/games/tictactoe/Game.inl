#include "games/tictactoe/Game.hpp"

#include "util/Asserts.hpp"

#include <boost/functional/hash.hpp>

#include <bit>

namespace tictactoe {

inline core::seat_index_t Game::State::get_player_at(int row, int col) const {
  DEBUG_ASSERT(row >= 0 && row < kBoardDimension && col >= 0 && col < kBoardDimension,
               "cell ({}, {}) is off the board", row, col);
  int cp = Rules::get_current_player(*this);
  int index = row * kBoardDimension + col;
  bool occupied_by_cur_player = (mask_t(1) << index) & cur_player_mask;
  bool occupied_by_any_player = (mask_t(1) << index) & full_mask;
  return occupied_by_any_player ? (occupied_by_cur_player ? cp : (1 - cp)) : -1;
}

inline size_t Game::State::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, full_mask);
  boost::hash_combine(seed, cur_player_mask);
  return seed;
}

inline core::seat_index_t Game::Rules::get_current_player(const State& state) {
  return std::popcount(state.full_mask) % 2;
}

inline bool Game::Rules::last_mover_won(const State& state) {
  mask_t last_mover_mask = state.opponent_mask();
  for (mask_t mask : kThreeInARowMasks) {
    if ((mask & last_mover_mask) == mask) return true;
  }
  return false;
}

inline bool Game::Rules::is_terminal(const State& state) {
  return last_mover_won(state) || std::popcount(state.full_mask) == kNumCells;
}

inline std::string Game::IO::compact_state_repr(const State& state) {
  char buf[12];
  const char* syms = "_XO";

  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      buf[row * 4 + col] = syms[state.get_player_at(row, col) + 1];
    }
  }
  buf[3] = '/';
  buf[7] = '/';
  buf[11] = '\0';

  return std::string(buf);
}

}  // namespace tictactoe
