#include "core/History.hpp"

#include "util/Asserts.hpp"

#include <spdlog/fmt/fmt.h>

namespace core {

template <concepts::Game Game>
History<Game>::History(const State& initial_state, const agent_name_array_t& agent_names)
    : initial_state_(initial_state), agent_names_(agent_names) {}

template <concepts::Game Game>
void History<Game>::append(const Transition& transition) {
  RELEASE_ASSERT(transition.before == current(), "transition {} starts from {}, expected {}",
                 transitions_.size(), IO::compact_state_repr(transition.before),
                 IO::compact_state_repr(current()));
  transitions_.push_back(transition);
}

template <concepts::Game Game>
const typename Game::State& History<Game>::current() const {
  return transitions_.empty() ? initial_state_ : transitions_.back().after;
}

template <concepts::Game Game>
bool History<Game>::replay_matches() const {
  State state = initial_state_;
  for (const Transition& t : transitions_) {
    if (!(t.before == state)) return false;
    state = Rules::apply(state, t.action);
    if (!(t.after == state)) return false;
  }
  return true;
}

template <concepts::Game Game>
duration_t History<Game>::get_total_agent_time(seat_index_t seat) const {
  duration_t total{0};
  for (const Transition& t : transitions_) {
    if (t.seat == seat) total += t.agent_time;
  }
  return total;
}

template <concepts::Game Game>
void History<Game>::print(std::ostream& os) const {
  for (int s = 0; s < kNumPlayers; ++s) {
    if (!agent_names_[s].empty()) {
      os << IO::player_to_str(s) << ": " << agent_names_[s] << std::endl;
    }
  }
  IO::print_state(os, initial_state_);
  int ply = 0;
  for (const Transition& t : transitions_) {
    double ms = std::chrono::duration<double, std::milli>(t.agent_time).count();
    os << fmt::format("{}. {} {} ({:.1f}ms)", ply, IO::player_to_str(t.seat),
                      IO::action_to_str(t.action), ms)
       << std::endl;
    IO::print_state(os, t.after);
    ++ply;
  }
}

}  // namespace core
