#pragma once
#include <iterator>
#include <type_traits>
#include <utility>

namespace sc {

// A cursor source exposes `value_type` and `bool next(value_type& out)`;
// next() returns false once the source is exhausted. Consumption is one-pass.
template <class C, class = void>
struct is_cursor_source : std::false_type {};

template <class C>
struct is_cursor_source<C, std::void_t<
    typename C::value_type,
    decltype(std::declval<bool&>() = std::declval<C&>().next(std::declval<typename C::value_type&>()))>>
  : std::true_type {};

// An indexable source has size() and random-access iterators.
template <class S, class = void>
struct is_indexable_source : std::false_type {};

template <class S>
struct is_indexable_source<S, std::void_t<
    decltype(std::size(std::declval<const S&>())),
    decltype(std::begin(std::declval<const S&>()))>>
  : std::is_base_of<std::random_access_iterator_tag,
                    typename std::iterator_traits<
                      decltype(std::begin(std::declval<const S&>()))>::iterator_category> {};

template <class S>
inline constexpr bool is_cursor_source_v = is_cursor_source<S>::value;

template <class S>
inline constexpr bool is_indexable_source_v = is_indexable_source<S>::value;

// Adapts an iterator pair to the cursor capability. Only operator++ and
// operator* are used, so single-pass input iterators work.
template <class It>
class IteratorCursor {
public:
  using value_type = typename std::iterator_traits<It>::value_type;

  IteratorCursor(It first, It last) : cur_(std::move(first)), end_(std::move(last)) {}

  bool next(value_type& out) {
    if (cur_ == end_) return false;
    out = *cur_;
    ++cur_;
    return true;
  }

private:
  It cur_;
  It end_;
};

template <class It>
IteratorCursor<It> make_cursor(It first, It last) {
  return IteratorCursor<It>(std::move(first), std::move(last));
}

}
