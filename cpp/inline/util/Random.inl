#include "util/Random.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <chrono>
#include <type_traits>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed">(
    po::value<int>(&seed)->default_value(seed),
    "seed for every prng created with seed 0 (default: 0 means seed with current time)");
}

inline void Random::init(const Params& params) {
  if (params.seed) {
    set_seed(params.seed);
  }
}

inline void Random::set_seed(int seed) {
  std::lock_guard lock(seed_stream_mutex());
  seed_stream().seed(seed);
}

inline std::mt19937 Random::make_prng(int seed) {
  if (seed) return std::mt19937(seed);

  std::lock_guard lock(seed_stream_mutex());
  return std::mt19937(seed_stream()());
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw Exception("Random::uniform_sample() - invalid range [{}, {})", lower, upper);
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

inline std::mt19937& Random::seed_stream() {
  static std::mt19937 prng(static_cast<std::mt19937::result_type>(
    std::chrono::steady_clock::now().time_since_epoch().count()));
  return prng;
}

inline std::mutex& Random::seed_stream_mutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace util
