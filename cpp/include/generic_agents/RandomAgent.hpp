#pragma once

#include "core/AbstractAgent.hpp"
#include "core/concepts/GameConcept.hpp"

#include <mutex>
#include <random>
#include <string>

namespace generic {

/*
 * RandomAgent always chooses uniformly at random among the set of legal actions.
 *
 * Each agent owns its prng, seeded from Params::seed (0 means draw from util::Random), so that
 * a seeded agent's choices do not depend on anything else drawing random numbers.
 */
template <core::concepts::Game Game>
class RandomAgent : public core::AbstractAgent<Game> {
 public:
  using State = Game::State;
  using Action = Game::Action;

  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  RandomAgent(const Params& params = Params());

  Action decide(const State& state, core::duration_t) override;

  std::string get_name() const override { return "Random"; }

 private:
  std::mutex mutex_;
  std::mt19937 prng_;
};

}  // namespace generic

#include "inline/generic_agents/RandomAgent.inl"
