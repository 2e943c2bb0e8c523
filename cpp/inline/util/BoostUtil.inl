#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <string>
#include <type_traits>

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : base_(new base_t(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  std::string name = option_name<StrLit, Char>();
  base_->add_options()(name.c_str(), std::forward<Ts>(ts)...);
  return extend<StrLit, Char>();
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  std::string true_descr = fmt::format("{}{}", true_help, *flag ? " (default)" : "");
  std::string false_descr = fmt::format("{}{}", false_help, *flag ? "" : " (default)");

  base_->add_options()(TrueStrLit.value, po::value(flag)->implicit_value(true)->zero_tokens(),
                       true_descr.c_str())(
    FalseStrLit.value, po::value(flag)->implicit_value(false)->zero_tokens(), false_descr.c_str());

  return extend<TrueStrLit>().template extend<FalseStrLit>();
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using StrSeq3 = util::concat_string_literal_sequence_t<StrSeq, StrSeq2>;
  using CharSeq3 = util::concat_int_sequence_t<CharSeq, CharSeq2>;

  base_->add(*desc.base_);
  return options_description<StrSeq3, CharSeq3>(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::extend() const {
  constexpr bool kHasAbbrev = Char != ' ';
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");
  static_assert(!kHasAbbrev || !util::int_sequence_contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using StrSeq2 =
    util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>;
  using CharSeq2 = std::conditional_t<
    kHasAbbrev, util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Char)>>, CharSeq>;

  return options_description<StrSeq2, CharSeq2>(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
std::string options_description<StrSeq, CharSeq>::option_name() {
  if (Char == ' ') return StrLit.value;
  return fmt::format("{},{}", StrLit.value, Char);
}

namespace detail {

template <typename T>
const T& to_boost(const T& desc) {
  return desc;
}

template <typename S, util::concepts::IntSequence C>
const auto& to_boost(const options_description<S, C>& desc) {
  return desc.get();
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;

  po::variables_map vm;
  try {
    po::store(
      po::command_line_parser(std::forward<Ts>(ts)...).options(detail::to_boost(desc)).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
