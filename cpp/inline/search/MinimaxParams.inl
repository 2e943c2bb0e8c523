#include "search/MinimaxParams.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <string>

namespace search {

inline auto MinimaxParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Minimax options");

  std::string default_tie_break = tie_break_policy == kRandom ? "random" : "first";

  return desc
    .template add_option<"max-search-depth", 'd'>(
      po::value<int>(&max_search_depth)->default_value(max_search_depth),
      "maximum search depth in plies")
    .template add_option<"tie-break">(
      po::value<std::string>()
        ->default_value(default_tie_break)
        ->notifier([this](const std::string& s) {
          if (s == "first") {
            tie_break_policy = kFirstEncountered;
          } else if (s == "random") {
            tie_break_policy = kRandom;
          } else {
            throw po::invalid_option_value(s);
          }
        }),
      "how to choose among equally-valued actions (first|random)")
    .template add_option<"minimax-seed">(po::value<int>(&seed)->default_value(seed),
                                         "seed for random tie-breaks (0 means derive from --seed)")
    .template add_flag<"minimax-verbose", "no-minimax-verbose">(
      &verbose, "log a summary of each search", "do not log search summaries");
}

}  // namespace search
