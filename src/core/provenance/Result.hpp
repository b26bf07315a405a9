#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace docguard {

template <typename E>
struct Error {
  E           kind;
  std::string message;
};

// Success value or {kind, message}. Used by every core transition so that
// failures are reported to the immediate caller instead of thrown.
template <typename T, typename E>
class Result {
public:
  static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result failure(E kind, std::string message) {
    return Result(std::in_place_index<1>, Error<E>{kind, std::move(message)});
  }

  bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<0>(v_); }
  const Error<E>& error() const { return std::get<1>(v_); }
  E kind() const { return error().kind; }

private:
  template <size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : v_(tag, std::forward<V>(v)) {}

  std::variant<T, Error<E>> v_;
};

// For transitions without a payload.
using Unit = std::monostate;

} // namespace docguard
