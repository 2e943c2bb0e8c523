#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <array>
#include <ostream>
#include <string>
#include <vector>

namespace core {

/*
 * Append-only record of the transitions of one contest.
 *
 * Transition i takes the state before ply i to the state after it. The first transition starts
 * from initial_state(), and each subsequent transition starts where the previous one ended. There
 * is no API to remove or modify a recorded transition.
 */
template <concepts::Game Game>
class History {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Rules = Game::Rules;
  using IO = Game::IO;
  using agent_name_array_t = std::array<std::string, kNumPlayers>;

  struct Transition {
    State before;
    Action action;
    State after;
    seat_index_t seat;
    duration_t agent_time;  // wall-clock time the agent spent deciding
  };
  using transition_vec_t = std::vector<Transition>;
  using const_iterator = transition_vec_t::const_iterator;

  explicit History(const State& initial_state, const agent_name_array_t& agent_names = {});

  /*
   * Throws util::ReleaseAssertionError if transition.before is not current(), leaving the history
   * unchanged.
   */
  void append(const Transition& transition);

  int size() const { return transitions_.size(); }
  bool empty() const { return transitions_.empty(); }
  const Transition& operator[](int i) const { return transitions_[i]; }
  const_iterator begin() const { return transitions_.begin(); }
  const_iterator end() const { return transitions_.end(); }

  const State& initial_state() const { return initial_state_; }
  const State& current() const;
  const agent_name_array_t& agent_names() const { return agent_names_; }

  /*
   * Replays every recorded action from initial_state() through Rules::apply(), and returns true iff
   * each resulting state equals the recorded one.
   */
  bool replay_matches() const;

  duration_t get_total_agent_time(seat_index_t seat) const;

  void print(std::ostream& os) const;

 private:
  State initial_state_;
  agent_name_array_t agent_names_;
  transition_vec_t transitions_;
};

}  // namespace core

#include "inline/core/History.inl"
