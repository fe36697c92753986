#pragma once

#include <utility>
#include <variant>

namespace sme::core {

// Result<T, E> carries either a value or an error for operations at the system
// boundary (pool loading, record decoding) that can legitimately fail on bad input.
// Engine operations do not use it: they degrade malformed data to empty results and
// reserve exceptions for caller contract violations.
//
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

  // Moves the value out; only valid when has_value() is true.
  [[nodiscard]] T take_value() { return std::move(std::get<0>(data_)); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace sme::core
