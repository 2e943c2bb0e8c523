#include "games/nim/Game.hpp"

#include "core/ContestError.hpp"
#include "util/Asserts.hpp"

#include <boost/functional/hash.hpp>

#include <algorithm>
#include <sstream>

namespace nim {

inline size_t Game::State::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, stones_left);
  boost::hash_combine(seed, current_player);
  return seed;
}

inline std::vector<Game::Action> Game::Rules::get_legal_actions(const State& state) {
  std::vector<Action> actions;
  int max_take = std::min(nim::kMaxStonesToTake, state.stones_left);
  for (int i = 1; i <= max_take; ++i) {
    actions.push_back(i);
  }
  return actions;
}

inline core::seat_index_t Game::Rules::get_current_player(const State& state) {
  return state.current_player;
}

inline Game::State Game::Rules::apply(const State& state, const Action& action) {
  if (action < 1 || action > nim::kMaxStonesToTake || action > state.stones_left) {
    throw core::ContestError(core::ErrorKind::kIllegalAction, "cannot take {} of {} stones",
                             action, state.stones_left);
  }

  return State{state.stones_left - action, core::opponent_of(state.current_player)};
}

// The player to move in a terminal state is the one who did not take the last stone.
inline core::utility_t Game::Rules::get_utility(const State& state, core::seat_index_t seat) {
  RELEASE_ASSERT(is_terminal(state), "utility of non-terminal state {}",
                 IO::compact_state_repr(state));
  return seat == state.current_player ? -Constants::kMaxUtility : Constants::kMaxUtility;
}

inline void Game::IO::print_state(std::ostream& os, const State& state) {
  os << compact_state_repr(state) << std::endl;
}

inline std::string Game::IO::compact_state_repr(const State& state) {
  std::ostringstream ss;
  ss << "[" << state.stones_left << ", " << player_to_str(state.current_player) << "]";
  return ss.str();
}

}  // namespace nim
