#include "core/AbstractAgent.hpp"

#include "core/ContestError.hpp"

namespace core {

template <concepts::Game Game>
void AbstractAgent<Game>::check_not_terminal(const State& state) const {
  if (Game::Rules::is_terminal(state)) {
    throw ContestError(ErrorKind::kGameAlreadyOver, "{} asked to decide in {}", get_name(),
                       Game::IO::compact_state_repr(state));
  }
}

template <concepts::Game Game>
std::vector<typename Game::Action> AbstractAgent<Game>::get_legal_actions_or_throw(
  const State& state) const {
  check_not_terminal(state);
  return Game::Rules::get_legal_actions(state);
}

}  // namespace core
