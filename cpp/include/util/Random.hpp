#pragma once

#include <concepts>
#include <mutex>
#include <random>

/*
 * Seeding and sampling helpers over std::mt19937.
 *
 * Every component that draws random numbers owns its own prng, obtained from make_prng(seed), so
 * that two agents in one contest never perturb each other's streams. A nonzero seed gives a fixed
 * stream. A zero seed draws one from the process-wide seed stream, which is time-based unless
 * --seed was given:
 *
 * util::Random::Params random_params;
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, argc, argv);
 * util::Random::init(random_params);
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  // Reseeds the process-wide seed stream.
  static void set_seed(int seed);

  static std::mt19937 make_prng(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * Throws util::Exception if lower >= upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

 private:
  static std::mt19937& seed_stream();
  static std::mutex& seed_stream_mutex();
};

}  // namespace util

#include "inline/util/Random.inl"
