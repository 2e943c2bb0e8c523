#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * constexpr check that a macro expands to 1. CMakeLists.txt passes build switches such as
 * DEBUG_BUILD=1 this way; an undefined macro stringizes to its own name and reads as disabled.
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

// Alias of IS_MACRO_ENABLED(), reads better at if-statement call sites.
#define IS_DEFINED(macro) IS_MACRO_ENABLED(macro)

/*
 * Marks the given expressions as used, without evaluating them. This silences unused-variable
 * warnings for variables that are only referenced inside compiled-out logging statements.
 */
#define USE_UNEVALUATED(...) ((void)sizeof(std::make_tuple(__VA_ARGS__)))

namespace util {

template <typename T>
std::string get_typename() {
  return boost::core::demangle(typeid(T).name());
}
template <typename T>
std::string get_typename(const T& t) {
  return boost::core::demangle(typeid(t).name());
}

/*
 * Converts a floating-point number of seconds to a std::chrono::nanoseconds. Saturates instead of
 * overflowing for very large inputs.
 */
std::chrono::nanoseconds seconds_to_duration(double seconds);

/*
 * Returns t + d, saturating at TimePoint::max() instead of overflowing.
 */
template <typename TimePoint, typename Duration>
TimePoint saturating_add(const TimePoint& t, const Duration& d);

/*
 * Declared only, for use in unevaluated contexts. Lets a concept pin the type of a static data
 * member, as in core::concepts::GameConstants:
 *
 *   { util::decay_copy(GC::kNumPlayers) } -> std::same_as<int>;
 */
template <class T>
std::decay_t<T> decay_copy(T&&);

template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }
  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    // strcmp() is not constexpr
    if (N != M) return false;
    for (size_t i = 0; i < N; ++i) {
      if (value[i] != other.value[i]) return false;
    }
    return true;
  }
  char value[N];
};

template <StringLiteral...>
struct StringLiteralSequence {};

// Compile-time lists of ints and of string literals. boost_util::program_options uses them to
// reject duplicate option names and short flags at compile time.
template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence {
  static const bool value = false;
};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> {
  static constexpr bool value = true;
};
template <typename T>
inline constexpr bool is_int_sequence_v = is_int_sequence<T>::value;

template <typename T, int K>
struct int_sequence_contains {
  static constexpr bool value = false;
};
template <int I, int... Is, int K>
struct int_sequence_contains<int_sequence<I, Is...>, K> {
  static constexpr bool value = (I == K) || int_sequence_contains<int_sequence<Is...>, K>::value;
};
template <typename T, int K>
static constexpr bool int_sequence_contains_v = int_sequence_contains<T, K>::value;

template <typename T, StringLiteral S>
struct string_literal_sequence_contains {
  static constexpr bool value = false;
};
template <StringLiteral I, StringLiteral... Is, StringLiteral S>
struct string_literal_sequence_contains<StringLiteralSequence<I, Is...>, S> {
  static constexpr bool value =
    (I == S) || string_literal_sequence_contains<StringLiteralSequence<Is...>, S>::value;
};
template <typename T, StringLiteral S>
static constexpr bool string_literal_sequence_contains_v =
  string_literal_sequence_contains<T, S>::value;

template <typename T, typename U>
struct concat_int_sequence {};
template <int... Ints1, int... Ints2>
struct concat_int_sequence<int_sequence<Ints1...>, int_sequence<Ints2...>> {
  using type = int_sequence<Ints1..., Ints2...>;
};
template <typename T, typename U>
using concat_int_sequence_t = concat_int_sequence<T, U>::type;

template <typename T, typename U>
struct concat_string_literal_sequence {};
template <StringLiteral... S1, StringLiteral... S2>
struct concat_string_literal_sequence<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};
template <typename T, typename U>
using concat_string_literal_sequence_t = concat_string_literal_sequence<T, U>::type;

// True iff no element of U appears in T.
template <typename T, typename U>
struct no_overlap {
  static constexpr bool value = true;
};
template <typename T, StringLiteral S, StringLiteral... Ss>
struct no_overlap<T, StringLiteralSequence<S, Ss...>> {
  static constexpr bool value = !string_literal_sequence_contains_v<T, S> &&
                                no_overlap<T, StringLiteralSequence<Ss...>>::value;
};
template <typename T, int I, int... Is>
struct no_overlap<T, int_sequence<I, Is...>> {
  static constexpr bool value =
    !int_sequence_contains_v<T, I> && no_overlap<T, int_sequence<Is...>>::value;
};
template <typename T, typename U>
constexpr bool no_overlap_v = no_overlap<T, U>::value;

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence_v<T>;

}  // namespace concepts

}  // namespace util

#include "inline/util/CppUtil.inl"
