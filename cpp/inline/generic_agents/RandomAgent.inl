#include "generic_agents/RandomAgent.hpp"

#include "util/BoostUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

namespace generic {

template <core::concepts::Game Game>
auto RandomAgent<Game>::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("RandomAgent options");

  return desc.template add_option<"random-agent-seed">(
    po::value<int>(&seed)->default_value(seed),
    "random agent seed (default: 0 means derive from --seed)");
}

template <core::concepts::Game Game>
RandomAgent<Game>::RandomAgent(const Params& params)
    : prng_(util::Random::make_prng(params.seed)) {}

template <core::concepts::Game Game>
typename Game::Action RandomAgent<Game>::decide(const State& state, core::duration_t) {
  auto actions = this->get_legal_actions_or_throw(state);

  std::lock_guard lock(mutex_);
  return actions[util::Random::uniform_sample(prng_, size_t(0), actions.size())];
}

}  // namespace generic
