#ifndef STREAM_HPP
#define STREAM_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace bookgraph {

/**
 * @brief Lazy, single-pass sequence of T
 *
 * A Stream is a pull function: each call writes the next element and returns
 * true, returns false once the sequence is exhausted, or returns an error
 * status. Combinators (filter, map, flat_map) wrap the upstream pull function
 * without touching any element; work happens only when a terminal operation
 * (to_vector, count, for_each, iteration) drains the stream. A stream cannot
 * be restarted: combinators and terminal operations consume it.
 */
template <typename T>
class Stream {
 public:
  using value_type = T;
  using Pull = std::function<arrow::Result<bool>(T &)>;

  explicit Stream(Pull pull) : pull_(std::move(pull)) {}

  Stream(const Stream &) = delete;
  Stream &operator=(const Stream &) = delete;
  Stream(Stream &&) noexcept = default;
  Stream &operator=(Stream &&) noexcept = default;

  static Stream empty() {
    return Stream([](T &) -> arrow::Result<bool> { return false; });
  }

  /**
   * Yields the elements of *items by index. items is not copied: owner keeps
   * whatever holds the container alive for as long as the stream exists.
   * Pass a null owner when the container outlives the stream anyway.
   */
  static Stream over(const std::vector<T> *items,
                     std::shared_ptr<const void> owner = nullptr) {
    size_t index = 0;
    return Stream([items, owner = std::move(owner),
                   index](T &out) mutable -> arrow::Result<bool> {
      if (index >= items->size()) {
        return false;
      }
      out = (*items)[index++];
      return true;
    });
  }

  // Yields the elements of an owned container
  static Stream of(std::vector<T> items) {
    auto owned = std::make_shared<const std::vector<T>>(std::move(items));
    const std::vector<T> *raw = owned.get();
    return over(raw, std::move(owned));
  }

  arrow::Result<bool> next(T &out) {
    if (!pull_) {
      return false;
    }
    return pull_(out);
  }

  Stream filter(std::function<arrow::Result<bool>(const T &)> predicate) {
    return Stream([upstream = release(), predicate = std::move(predicate)](
                      T &out) mutable -> arrow::Result<bool> {
      while (true) {
        ARROW_ASSIGN_OR_RAISE(const bool has_next, upstream(out));
        if (!has_next) {
          return false;
        }
        ARROW_ASSIGN_OR_RAISE(const bool keep, predicate(out));
        if (keep) {
          return true;
        }
      }
    });
  }

  template <typename U>
  Stream<U> map(std::function<arrow::Result<U>(const T &)> fn) {
    return Stream<U>([upstream = release(), fn = std::move(fn)](
                         U &out) mutable -> arrow::Result<bool> {
      T current{};
      ARROW_ASSIGN_OR_RAISE(const bool has_next, upstream(current));
      if (!has_next) {
        return false;
      }
      ARROW_ASSIGN_OR_RAISE(out, fn(current));
      return true;
    });
  }

  // Concatenates the streams produced by fn, one upstream element at a time
  template <typename U>
  Stream<U> flat_map(std::function<Stream<U>(const T &)> fn) {
    typename Stream<U>::Pull inner;
    return Stream<U>([upstream = release(), fn = std::move(fn),
                      inner](U &out) mutable -> arrow::Result<bool> {
      while (true) {
        if (inner) {
          ARROW_ASSIGN_OR_RAISE(const bool has_next, inner(out));
          if (has_next) {
            return true;
          }
          inner = nullptr;
        }
        T current{};
        ARROW_ASSIGN_OR_RAISE(const bool has_outer, upstream(current));
        if (!has_outer) {
          return false;
        }
        inner = fn(current).release();
      }
    });
  }

  arrow::Result<std::vector<T>> to_vector() {
    std::vector<T> result;
    T current{};
    while (true) {
      ARROW_ASSIGN_OR_RAISE(const bool has_next, next(current));
      if (!has_next) {
        break;
      }
      result.push_back(std::move(current));
    }
    pull_ = nullptr;
    return result;
  }

  arrow::Result<size_t> count() {
    size_t result = 0;
    T current{};
    while (true) {
      ARROW_ASSIGN_OR_RAISE(const bool has_next, next(current));
      if (!has_next) {
        break;
      }
      ++result;
    }
    pull_ = nullptr;
    return result;
  }

  arrow::Status for_each(const std::function<arrow::Status(const T &)> &fn) {
    T current{};
    while (true) {
      ARROW_ASSIGN_OR_RAISE(const bool has_next, next(current));
      if (!has_next) {
        break;
      }
      ARROW_RETURN_NOT_OK(fn(current));
    }
    pull_ = nullptr;
    return arrow::Status::OK();
  }

  /**
   * Input iterator for range-for loops. Iteration stops at the first error;
   * check status() afterwards.
   */
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T *;
    using reference = const T &;

    iterator() = default;
    explicit iterator(Stream *stream) : stream_(stream) { advance(); }

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    iterator &operator++() {
      advance();
      return *this;
    }

    bool operator==(const iterator &other) const {
      return stream_ == other.stream_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

   private:
    void advance() {
      auto res = stream_->next(current_);
      if (!res.ok()) {
        stream_->status_ = res.status();
        stream_ = nullptr;
      } else if (!res.ValueOrDie()) {
        stream_ = nullptr;
      }
    }

    Stream *stream_ = nullptr;
    T current_{};
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  // Error that ended a range-for iteration, OK otherwise
  [[nodiscard]] const arrow::Status &status() const { return status_; }

 private:
  template <typename>
  friend class Stream;

  Pull release() {
    Pull pull = std::move(pull_);
    pull_ = nullptr;
    if (!pull) {
      return [](T &) -> arrow::Result<bool> { return false; };
    }
    return pull;
  }

  Pull pull_;
  arrow::Status status_;
};

// Arithmetic mean of a numeric stream; 0.0 when the stream is empty
inline arrow::Result<double> mean(Stream<double> values) {
  double sum = 0.0;
  size_t n = 0;
  ARROW_RETURN_NOT_OK(values.for_each([&](const double &v) {
    sum += v;
    ++n;
    return arrow::Status::OK();
  }));
  if (n == 0) {
    return 0.0;
  }
  return sum / static_cast<double>(n);
}

}  // namespace bookgraph

#endif  // STREAM_HPP
