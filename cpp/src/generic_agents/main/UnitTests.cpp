#include "core/Contest.hpp"
#include "core/ContestError.hpp"
#include "core/ContestParams.hpp"
#include "games/nim/Game.hpp"
#include "games/tictactoe/Game.hpp"
#include "generic_agents/FirstLegalAgent.hpp"
#include "generic_agents/FunctionalAgent.hpp"
#include "generic_agents/RandomAgent.hpp"
#include "util/BoostUtil.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace generic {

template <core::concepts::Game Game>
class GenericAgentTest : public ::testing::Test {
 protected:
  using State = Game::State;
  using Action = Game::Action;
  using Rules = Game::Rules;

  // Some reachable non-terminal state with more than one legal action.
  static State midgame_state() {
    State state = Rules::init_state();
    state = Rules::apply(state, Rules::get_legal_actions(state)[1]);
    state = Rules::apply(state, Rules::get_legal_actions(state)[0]);
    return state;
  }

  // Plays first legal actions until the game ends.
  static State terminal_state() {
    State state = Rules::init_state();
    while (!Rules::is_terminal(state)) {
      state = Rules::apply(state, Rules::get_legal_actions(state)[0]);
    }
    return state;
  }

  static bool is_legal(const State& state, const Action& action) {
    auto actions = Rules::get_legal_actions(state);
    return std::find(actions.begin(), actions.end(), action) != actions.end();
  }

  static void expect_game_already_over(core::AbstractAgent<Game>& agent) {
    try {
      agent.decide(terminal_state(), 1s);
      FAIL() << "expected throw";
    } catch (const core::ContestError& e) {
      EXPECT_EQ(e.kind(), core::ErrorKind::kGameAlreadyOver);
    }
  }
};

using GameTypes = ::testing::Types<nim::Game, tictactoe::Game>;
TYPED_TEST_SUITE(GenericAgentTest, GameTypes);

TYPED_TEST(GenericAgentTest, first_legal) {
  using Rules = TypeParam::Rules;

  FirstLegalAgent<TypeParam> agent;
  EXPECT_EQ(agent.get_name(), "FirstLegal");

  auto state = this->midgame_state();
  EXPECT_EQ(agent.decide(state, 1s), Rules::get_legal_actions(state)[0]);

  this->expect_game_already_over(agent);
}

TYPED_TEST(GenericAgentTest, random_is_legal) {
  typename RandomAgent<TypeParam>::Params params;
  params.seed = 3;
  RandomAgent<TypeParam> agent(params);
  EXPECT_EQ(agent.get_name(), "Random");

  auto state = this->midgame_state();
  std::set<typename TypeParam::Action> chosen;
  for (int i = 0; i < 100; ++i) {
    auto action = agent.decide(state, 1s);
    EXPECT_TRUE(this->is_legal(state, action));
    chosen.insert(action);
  }
  EXPECT_GT(chosen.size(), 1u);

  this->expect_game_already_over(agent);
}

TYPED_TEST(GenericAgentTest, random_seed_is_reproducible) {
  typename RandomAgent<TypeParam>::Params params;
  params.seed = 17;
  RandomAgent<TypeParam> a(params);
  RandomAgent<TypeParam> b(params);

  auto state = this->midgame_state();
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(a.decide(state, 1s), b.decide(state, 1s));
  }
}

TYPED_TEST(GenericAgentTest, functional) {
  using State = TypeParam::State;
  using Action = TypeParam::Action;
  using Rules = TypeParam::Rules;

  int num_calls = 0;
  FunctionalAgent<TypeParam> agent("Last", [&](const State& state, core::duration_t) -> Action {
    num_calls++;
    return Rules::get_legal_actions(state).back();
  });
  EXPECT_EQ(agent.get_name(), "Last");

  auto state = this->midgame_state();
  EXPECT_EQ(agent.decide(state, 1s), Rules::get_legal_actions(state).back());
  EXPECT_EQ(num_calls, 1);

  // the callable is not consulted on a terminal state
  this->expect_game_already_over(agent);
  EXPECT_EQ(num_calls, 1);
}

TYPED_TEST(GenericAgentTest, random_vs_random_completes) {
  core::ContestParams contest_params;
  contest_params.forfeit_on_violation = false;
  contest_params.announce_results = false;

  typename RandomAgent<TypeParam>::Params params;
  params.seed = 5;
  auto a = std::make_shared<RandomAgent<TypeParam>>(params);
  params.seed = 6;
  auto b = std::make_shared<RandomAgent<TypeParam>>(params);

  auto result = core::run_contest<TypeParam>(contest_params, a, b);
  EXPECT_EQ(result.outcome.termination, core::kNormalTermination);
  EXPECT_TRUE(result.outcome.is_zero_sum());
  EXPECT_TRUE(result.history.replay_matches());
  EXPECT_EQ(result.history.agent_names()[0], "Random");
}

TEST(RandomAgent, options) {
  RandomAgent<nim::Game>::Params params;
  auto desc = params.make_options_description();

  std::vector<std::string> args = {"--random-agent-seed", "99"};
  boost_util::program_options::parse_args(desc, args);
  EXPECT_EQ(params.seed, 99);
}

}  // namespace generic

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
