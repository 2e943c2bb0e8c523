#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

static_assert(util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 3>);
static_assert(!util::int_sequence_contains_v<util::int_sequence<1, 3, 5>, 2>);
static_assert(util::no_overlap_v<util::StringLiteralSequence<"a", "b">,
                                 util::StringLiteralSequence<"c">>);
static_assert(!util::no_overlap_v<util::StringLiteralSequence<"a", "b">,
                                  util::StringLiteralSequence<"b">>);

TEST(CppUtil, seconds_to_duration) {
  EXPECT_EQ(util::seconds_to_duration(1.5), std::chrono::milliseconds(1500));
  EXPECT_EQ(util::seconds_to_duration(0), std::chrono::nanoseconds(0));
  EXPECT_EQ(util::seconds_to_duration(1e300), std::chrono::nanoseconds::max());
}

TEST(CppUtil, saturating_add) {
  using steady_clock = std::chrono::steady_clock;
  auto now = steady_clock::now();
  EXPECT_EQ(util::saturating_add(now, std::chrono::seconds(1)), now + std::chrono::seconds(1));
  EXPECT_EQ(util::saturating_add(now, std::chrono::nanoseconds::max()),
            steady_clock::time_point::max());
}

TEST(CppUtil, get_typename) {
  EXPECT_EQ(util::get_typename<int>(), "int");
  EXPECT_NE(util::get_typename(std::string()).find("basic_string"), std::string::npos);
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 7;
    RELEASE_ASSERT(x < 5, "x={}", x);
    FAIL() << "expected throw";
  } catch (const util::Exception& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: x=7"), std::string::npos) << what;
  }
}

TEST(Asserts, debug_assert) {
  EXPECT_NO_THROW(DEBUG_ASSERT(1 + 1 == 2, "math"));
  if (IS_DEFINED(DEBUG_BUILD)) {
    EXPECT_THROW(DEBUG_ASSERT(1 + 1 == 3, "math"), util::DebugAssertionError);
  } else {
    EXPECT_NO_THROW(DEBUG_ASSERT(1 + 1 == 3, "math"));
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "bad input {}", 3), util::CleanException);
}

TEST(Random, uniform_sample) {
  std::mt19937 prng = util::Random::make_prng(1);
  std::array<int, 4> counts = {};
  constexpr int N = 4000;
  for (int i = 0; i < N; ++i) {
    int k = util::Random::uniform_sample(prng, 0, 4);
    ASSERT_GE(k, 0);
    ASSERT_LT(k, 4);
    counts[k]++;
  }
  for (int c : counts) {
    EXPECT_GT(c, N / 8);
  }

  EXPECT_THROW(util::Random::uniform_sample(prng, 3, 3), util::Exception);
}

TEST(Random, make_prng_is_reproducible) {
  std::mt19937 a = util::Random::make_prng(42);
  std::mt19937 b = util::Random::make_prng(42);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(a(), b());
  }
}

TEST(Random, set_seed_fixes_unseeded_prngs) {
  util::Random::set_seed(7);
  std::mt19937 a1 = util::Random::make_prng(0);
  std::mt19937 a2 = util::Random::make_prng(0);

  util::Random::set_seed(7);
  std::mt19937 b1 = util::Random::make_prng(0);
  std::mt19937 b2 = util::Random::make_prng(0);

  EXPECT_EQ(a1(), b1());
  EXPECT_EQ(a2(), b2());
}

namespace {

struct TestParams {
  int depth = 3;
  double budget = 1.0;
  bool verbose = false;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Test options");
    return desc
      .template add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth), "depth")
      .template add_option<"budget">(po2::default_value("{:.2f}", &budget), "budget")
      .template add_flag<"verbose", "quiet">(&verbose, "verbose", "quiet");
  }
};

}  // namespace

TEST(BoostUtil, parse_args) {
  TestParams params;
  auto desc = params.make_options_description();

  std::vector<std::string> args = {"-d", "5", "--budget", "0.25", "--verbose"};
  boost_util::program_options::parse_args(desc, args);

  EXPECT_EQ(params.depth, 5);
  EXPECT_DOUBLE_EQ(params.budget, 0.25);
  EXPECT_TRUE(params.verbose);
}

TEST(BoostUtil, parse_args_errors_are_clean) {
  TestParams params;
  auto desc = params.make_options_description();

  std::vector<std::string> bad_value = {"--depth", "deep"};
  EXPECT_THROW(boost_util::program_options::parse_args(desc, bad_value), util::CleanException);

  std::vector<std::string> unknown = {"--breadth", "5"};
  EXPECT_THROW(boost_util::program_options::parse_args(desc, unknown), util::CleanException);
}

TEST(BoostUtil, help_marks_default_flag) {
  TestParams params;
  auto desc = params.make_options_description();

  std::ostringstream ss;
  ss << desc;
  EXPECT_NE(ss.str().find("quiet (default)"), std::string::npos) << ss.str();
  EXPECT_EQ(ss.str().find("verbose (default)"), std::string::npos) << ss.str();
}

TEST(BoostUtil, help_formats_default_value) {
  TestParams params;
  params.budget = 0.5;
  auto desc = params.make_options_description();

  std::ostringstream ss;
  ss << desc;
  EXPECT_NE(ss.str().find("(=0.50)"), std::string::npos) << ss.str();
  EXPECT_EQ(ss.str().find("0.500000"), std::string::npos) << ss.str();

  std::vector<std::string> no_args;
  boost_util::program_options::parse_args(desc, no_args);
  EXPECT_DOUBLE_EQ(params.budget, 0.5);
}

TEST(Logging, rejects_unknown_level) {
  util::Logging::Params params;
  params.log_level = "loud";
  EXPECT_THROW(util::Logging::init(params), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
