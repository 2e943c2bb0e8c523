#pragma once

#include <cstdint>

namespace search {

enum tie_break_policy_t : int8_t {
  kFirstEncountered,  // the first best action in enumeration order
  kRandom             // uniform among the exactly-tied best actions
};

struct MinimaxParams {
  auto make_options_description();

  // Throws core::ContestError of kind kConfigurationError if any field is invalid.
  void validate() const;

  int max_search_depth = 9;
  tie_break_policy_t tie_break_policy = kFirstEncountered;
  int seed = 0;  // for kRandom tie-breaks. 0 means draw one via util::Random::make_prng()
  bool verbose = false;
};

}  // namespace search

#include "inline/search/MinimaxParams.inl"
