#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

/*
 * po::value<T>(dest)->default_value(t) renders floating-point defaults with full precision in
 * --help. These overloads render the default through a format string instead:
 *
 * boost_util::program_options::default_value("{:.3f}", &time_budget_per_move)
 */
template <typename T>
auto default_value(fmt::format_string<T> fmt, T* dest, T t) {
  // format an rvalue copy so that Args... deduces as {T}
  std::string s = fmt::format(fmt, T(t));
  return boost::program_options::value<T>(dest)->default_value(t, s);
}

template <typename T>
auto default_value(fmt::format_string<T> fmt, T* dest) {
  return default_value(fmt, dest, *dest);
}

/*
 * Wraps boost::program_options::options_description so that option names and single-character
 * abbreviations are tracked in the type. Registering a name or abbreviation twice, directly or by
 * combining two descriptions with add(), fails to compile.
 *
 * namespace po2 = boost_util::program_options;
 *
 * po2::options_description desc("Minimax options");
 * return desc
 *   .add_option<"max-search-depth", 'd'>(po::value<int>(&max_search_depth), "...")
 *   .add_flag<"minimax-verbose", "no-minimax-verbose">(&verbose, "...", "...");
 *
 * Every call returns a new options_description type; the underlying boost object is shared.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Adds --<TrueStrLit> and --<FalseStrLit>, which set *flag to true and false respectively. The
   * help text of the one matching the current value of *flag is marked as the default.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.base_->print(s);
    return s;
  }

  const base_t& get() const { return *base_; }

 private:
  explicit options_description(base_t* base) : base_(base) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto extend() const;

  template <util::StringLiteral StrLit, char Char>
  static std::string option_name();

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  // Never freed: boost keeps pointers into it from every variables_map it populates, and every
  // description derived from this one shares it.
  base_t* base_;
};

/*
 * Parses a command line against desc, which is either a boost or a boost_util
 * options_description, and runs the notifiers. ts are forwarded to
 * boost::program_options::command_line_parser: (argc, argv) or a std::vector<std::string>.
 *
 * Boost errors, including a missing required option, are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
