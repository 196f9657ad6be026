#pragma once
#include "step_chunker/chunk_params.hpp"
#include "step_chunker/cursor.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace sc {

// Pull-based, forward-only sequence of chunks. Not restartable.
template <class T>
class ChunkStream {
public:
  using value_type = T;
  using chunk_type = std::vector<T>;
  using ChunkCallback = std::function<bool(const chunk_type&)>;

  virtual ~ChunkStream() = default;

  // Replaces `out` with the next chunk; false once the sequence is exhausted.
  virtual bool next(chunk_type& out) = 0;

  // Drives the stream until it ends or `cb` returns false.
  // Returns the number of chunks handed to `cb`.
  std::size_t for_each(const ChunkCallback& cb) {
    chunk_type c;
    std::size_t n = 0;
    while (next(c)) {
      ++n;
      if (!cb(c)) break;
    }
    return n;
  }

  // Source index of the first element of the last chunk returned by next().
  std::size_t last_start() const noexcept { return last_start_; }
  std::size_t chunks_emitted() const noexcept { return emitted_; }

protected:
  void mark_emitted(std::size_t start) noexcept { last_start_ = start; ++emitted_; }

private:
  std::size_t last_start_{0};
  std::size_t emitted_{0};
};

namespace detail {

template <class S>
using source_t = std::remove_cv_t<std::remove_reference_t<S>>;

template <class S, bool Indexable = is_indexable_source_v<source_t<S>>>
struct source_value;

template <class S>
struct source_value<S, true> {
  // value_type, not the dereferenced type, so vector<bool> yields values
  using type = typename std::iterator_traits<
      decltype(std::begin(std::declval<const source_t<S>&>()))>::value_type;
};

template <class S>
struct source_value<S, false> {
  using type = typename source_t<S>::value_type;
};

}

template <class S>
using source_value_t = typename detail::source_value<S>::type;

// Strategy for sources with a known length and random access. The window is
// addressed by offsets into `source`; nothing is copied until a chunk is built.
// S is either an owned container type or an lvalue reference to one.
template <class S>
class IndexedChunker final : public ChunkStream<source_value_t<S>> {
public:
  using chunk_type = typename ChunkStream<source_value_t<S>>::chunk_type;

  template <class Src>
  IndexedChunker(Src&& source, const ChunkWindow& w)
    : src_(std::forward<Src>(source)), w_(w) {
    const std::size_t len  = static_cast<std::size_t>(std::size(src_));
    const std::size_t stop = w_.resolve_stop(len);
    begin_ = std::min(w_.start_at, stop);
    window_len_ = stop - begin_;
    full_ = window_len_ >= w_.chunk_size
          ? (window_len_ - w_.chunk_size) / w_.chunk_step + 1
          : 0;
  }

  bool next(chunk_type& out) override {
    std::size_t n = 0;
    if (full_done_ < full_) {
      n = w_.chunk_size;
      ++full_done_;
    } else if (w_.return_tail && bt_ < window_len_) {
      n = std::min(w_.chunk_size, window_len_ - bt_);
    } else {
      return false;
    }

    using diff_t = typename std::iterator_traits<decltype(std::begin(src_))>::difference_type;
    auto first = std::begin(src_) + static_cast<diff_t>(begin_ + bt_);
    out.assign(first, first + static_cast<diff_t>(n));
    this->mark_emitted(begin_ + bt_);

    bt_ = (window_len_ - bt_ > w_.chunk_step) ? bt_ + w_.chunk_step : window_len_;
    return true;
  }

  // Number of full chunks this stream yields in total.
  std::size_t full_chunks() const noexcept { return full_; }
  std::size_t window_size() const noexcept { return window_len_; }

private:
  S src_;
  ChunkWindow w_;
  std::size_t begin_{0};
  std::size_t window_len_{0};
  std::size_t full_{0};
  std::size_t full_done_{0};
  std::size_t bt_{0};   // chunk start, relative to the window
};

// Strategy for one-pass cursor sources. Holds at most chunk_size buffered
// elements and refills lazily on the following pull, so stopping early never
// consumes past the last chunk handed out.
// C is either an owned cursor type or an lvalue reference to one.
template <class C>
class CursorChunker final : public ChunkStream<source_value_t<C>> {
public:
  using value_type = source_value_t<C>;
  using chunk_type = typename ChunkStream<value_type>::chunk_type;

  template <class Src>
  CursorChunker(Src&& source, const ChunkWindow& w)
    : src_(std::forward<Src>(source)), w_(w), next_start_(w.start_at) {}

  bool next(chunk_type& out) override {
    switch (phase_) {
      case Phase::Start: fill(w_.chunk_size); phase_ = Phase::Full; break;
      case Phase::Full:  refill(); break;
      case Phase::Tail:  drop_front(w_.chunk_step); break;
      case Phase::Done:  return false;
    }

    if (phase_ == Phase::Full && buf_.size() < w_.chunk_size) {
      phase_ = w_.return_tail ? Phase::Tail : Phase::Done;
    }
    if (phase_ == Phase::Done || buf_.empty()) {
      phase_ = Phase::Done;
      buf_.clear();
      return false;
    }

    out.assign(buf_.begin(), buf_.end());
    this->mark_emitted(next_start_);
    next_start_ += w_.chunk_step;
    return true;
  }

  // Elements pulled from the underlying cursor so far, skipped ones included.
  std::size_t consumed() const noexcept { return pos_; }

private:
  enum class Phase { Start, Full, Tail, Done };

  // Next element of the window; false at the window end or source end.
  bool pull(value_type& v) {
    if (exhausted_) return false;
    if (w_.stop_at && std::max(pos_, w_.start_at) >= *w_.stop_at) {
      exhausted_ = true;
      return false;
    }
    while (pos_ < w_.start_at) {
      if (!src_.next(v)) { exhausted_ = true; return false; }
      ++pos_;
    }
    if (!src_.next(v)) { exhausted_ = true; return false; }
    ++pos_;
    return true;
  }

  void fill(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      value_type v;
      if (!pull(v)) return;
      buf_.push_back(std::move(v));
    }
  }

  void skip(std::size_t n) {
    value_type v;
    for (std::size_t i = 0; i < n; ++i) {
      if (!pull(v)) return;
    }
  }

  void drop_front(std::size_t n) {
    if (n >= buf_.size()) { buf_.clear(); return; }
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n));
  }

  void refill() {
    if (w_.chunk_step < w_.chunk_size) {
      drop_front(w_.chunk_step);
      fill(w_.chunk_step);
    } else {
      buf_.clear();
      skip(w_.chunk_step - w_.chunk_size);
      fill(w_.chunk_size);
    }
  }

  C src_;
  ChunkWindow w_;
  std::deque<value_type> buf_;
  Phase phase_{Phase::Start};
  std::size_t pos_{0};
  std::size_t next_start_{0};
  bool exhausted_{false};
};

// Picks the strategy from the source's capabilities. Lvalue sources are held
// by reference and must outlive the returned stream; rvalues are moved in.
// Throws InvalidParameter on malformed parameters.
template <class S>
auto chunk(S&& source, const ChunkParams& p) {
  using Src = detail::source_t<S>;
  static_assert(is_indexable_source_v<Src> || is_cursor_source_v<Src>,
                "source must be indexable (size + random access) or a cursor (next(value_type&))");
  const ChunkWindow w = normalize(p);
  if constexpr (is_indexable_source_v<Src>) {
    return IndexedChunker<S>(std::forward<S>(source), w);
  } else {
    return CursorChunker<S>(std::forward<S>(source), w);
  }
}

// Iterator pairs always go through the cursor strategy.
template <class It>
CursorChunker<IteratorCursor<It>> chunk(It first, It last, const ChunkParams& p) {
  return CursorChunker<IteratorCursor<It>>(make_cursor(std::move(first), std::move(last)), normalize(p));
}

template <class S>
std::unique_ptr<ChunkStream<source_value_t<S>>> make_chunk_stream(S&& source, const ChunkParams& p) {
  using Src = detail::source_t<S>;
  static_assert(is_indexable_source_v<Src> || is_cursor_source_v<Src>,
                "source must be indexable (size + random access) or a cursor (next(value_type&))");
  const ChunkWindow w = normalize(p);
  if constexpr (is_indexable_source_v<Src>) {
    return std::make_unique<IndexedChunker<S>>(std::forward<S>(source), w);
  } else {
    return std::make_unique<CursorChunker<S>>(std::forward<S>(source), w);
  }
}

template <class T>
std::vector<std::vector<T>> collect(ChunkStream<T>& stream) {
  std::vector<std::vector<T>> all;
  std::vector<T> c;
  while (stream.next(c)) all.push_back(c);
  return all;
}

template <class T>
std::vector<std::vector<T>> collect(ChunkStream<T>&& stream) {
  return collect(stream);
}

}
