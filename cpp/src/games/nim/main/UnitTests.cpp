#include "core/ContestError.hpp"
#include "games/nim/Game.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using Game = nim::Game;
using State = Game::State;
using Action = Game::Action;
using IO = Game::IO;
using Rules = Game::Rules;

namespace {

State play(const std::vector<Action>& actions) {
  State state = Rules::init_state();
  for (Action action : actions) {
    state = Rules::apply(state, action);
  }
  return state;
}

}  // namespace

TEST(NimGameTest, InitialState) {
  State state = Rules::init_state();

  EXPECT_EQ(Rules::get_current_player(state), 0);
  EXPECT_EQ(state.stones_left, nim::kStartingStones);
  EXPECT_FALSE(Rules::is_terminal(state));
  EXPECT_EQ(Rules::get_legal_actions(state), (std::vector<Action>{1, 2, 3}));
}

TEST(NimGameTest, MakeMove) {
  State initial = Rules::init_state();
  State state = Rules::apply(initial, 3);

  EXPECT_EQ(state.stones_left, 18);
  EXPECT_EQ(Rules::get_current_player(state), 1);

  // apply() returns a new state
  EXPECT_EQ(initial, Rules::init_state());
}

TEST(NimGameTest, LegalActionsShrinkNearEnd) {
  State state{2, 1};
  EXPECT_EQ(Rules::get_legal_actions(state), (std::vector<Action>{1, 2}));

  state = State{0, 1};
  EXPECT_TRUE(Rules::get_legal_actions(state).empty());
}

TEST(NimGameTest, Player0Wins) {
  State state = play({3, 3, 3, 3, 3, 3, 3});

  EXPECT_TRUE(Rules::is_terminal(state));
  EXPECT_EQ(Rules::get_utility(state, 0), 1);
  EXPECT_EQ(Rules::get_utility(state, 1), -1);
}

TEST(NimGameTest, Player1Wins) {
  State state = play({3, 3, 3, 3, 3, 3, 1, 2});

  EXPECT_TRUE(Rules::is_terminal(state));
  EXPECT_EQ(Rules::get_utility(state, 0), -1);
  EXPECT_EQ(Rules::get_utility(state, 1), 1);
}

TEST(NimGameTest, InvalidMove) {
  State state = Rules::init_state();
  EXPECT_THROW(Rules::apply(state, 0), core::ContestError);
  EXPECT_THROW(Rules::apply(state, 4), core::ContestError);

  try {
    Rules::apply(State{2, 0}, 3);
    FAIL() << "expected throw";
  } catch (const core::ContestError& e) {
    EXPECT_EQ(e.kind(), core::ErrorKind::kIllegalAction);
  }
}

TEST(NimGameTest, UtilityOfNonTerminalStateThrows) {
  EXPECT_THROW(Rules::get_utility(Rules::init_state(), 0), util::Exception);
}

TEST(NimGameTest, IO) {
  EXPECT_EQ(IO::compact_state_repr(State{5, 1}), "[5, B]");
  EXPECT_EQ(IO::action_to_str(2), "2");
  EXPECT_EQ(IO::player_to_str(0), "A");

  std::ostringstream ss;
  IO::print_state(ss, Rules::init_state());
  EXPECT_EQ(ss.str(), "[21, A]\n");
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
