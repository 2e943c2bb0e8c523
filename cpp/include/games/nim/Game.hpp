#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "games/nim/Constants.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace nim {

/*
 * Players alternately take 1 to kMaxStonesToTake stones from a single pile. Whoever takes the last
 * stone wins.
 *
 * An Action is the number of stones to take.
 */
struct Game {
  struct Constants {
    static constexpr const char* kGameName = "nim";
    static constexpr int kNumPlayers = nim::kNumPlayers;
    static constexpr core::utility_t kMaxUtility = 1;
    static constexpr char kSeatChars[kNumPlayers] = {'A', 'B'};
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    size_t hash() const;

    int stones_left;
    core::seat_index_t current_player;
  };

  using Action = int;

  struct Rules {
    static State init_state() { return State{nim::kStartingStones, 0}; }
    static std::vector<Action> get_legal_actions(const State& state);
    static core::seat_index_t get_current_player(const State& state);
    static State apply(const State& state, const Action& action);
    static bool is_terminal(const State& state) { return state.stones_left == 0; }
    static core::utility_t get_utility(const State& state, core::seat_index_t seat);
  };

  struct IO {
    static std::string action_to_str(const Action& action) { return std::to_string(action); }
    static std::string player_to_str(core::seat_index_t seat) {
      return std::string(1, Constants::kSeatChars[seat]);
    }
    static void print_state(std::ostream& os, const State& state);
    static std::string compact_state_repr(const State& state);
  };

  static void static_init() {}
};  // struct Game

}  // namespace nim

namespace std {

template <>
struct hash<nim::Game::State> {
  size_t operator()(const nim::Game::State& state) const { return state.hash(); }
};

}  // namespace std

static_assert(core::concepts::Game<nim::Game>);

#include "inline/games/nim/Game.inl"
