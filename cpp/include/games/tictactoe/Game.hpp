#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "games/tictactoe/Constants.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 *
 * X moves first. An Action is the index of the cell to mark, and legal actions are enumerated in
 * increasing cell order.
 */
class Game {
 public:
  struct Constants {
    static constexpr const char* kGameName = "tictactoe";
    static constexpr int kNumPlayers = tictactoe::kNumPlayers;
    static constexpr core::utility_t kMaxUtility = 1;
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    size_t hash() const;
    mask_t opponent_mask() const { return full_mask ^ cur_player_mask; }
    core::seat_index_t get_player_at(int row, int col) const;

    mask_t full_mask;        // spaces occupied by either player
    mask_t cur_player_mask;  // spaces occupied by current player
  };

  using Action = int;

  struct Rules {
    static State init_state() { return State{0, 0}; }
    static core::seat_index_t get_current_player(const State&);
    static std::vector<Action> get_legal_actions(const State&);
    static State apply(const State&, const Action& action);
    static bool is_terminal(const State& state);
    static core::utility_t get_utility(const State& state, core::seat_index_t seat);

    // true iff the player who just moved completed a line
    static bool last_mover_won(const State& state);
  };

  struct IO {
    static std::string action_to_str(const Action& action) { return std::to_string(action); }
    static std::string player_to_str(core::seat_index_t player) {
      return (player == tictactoe::kX) ? "X" : "O";
    }
    static void print_state(std::ostream&, const State&);
    static std::string compact_state_repr(const State& state);
  };

  static constexpr mask_t kThreeInARowMasks[] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};

  static void static_init() {}
};

}  // namespace tictactoe

namespace std {

template <>
struct hash<tictactoe::Game::State> {
  size_t operator()(const tictactoe::Game::State& state) const { return state.hash(); }
};

}  // namespace std

static_assert(core::concepts::Game<tictactoe::Game>);

#include "inline/games/tictactoe/Game.inl"
