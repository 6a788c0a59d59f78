#pragma once

#include <utility>
#include <variant>

#include "engine/error.hpp"

namespace relay::stream {

using engine::Error;
using engine::ErrorCode;
using engine::Expected;

struct EndOfStream {};

/// One element observed on a stream: a value, an in-band error, or end-of-stream.
template <typename T>
class StreamItem {
 public:
  static auto value(T value) -> StreamItem {
    return StreamItem(std::in_place_index<0>, std::move(value));
  }

  static auto error(Error error) -> StreamItem {
    return StreamItem(std::in_place_index<1>, std::move(error));
  }

  static auto eof() -> StreamItem { return StreamItem(std::in_place_index<2>, EndOfStream{}); }

  auto is_value() const -> bool { return data_.index() == 0; }
  auto is_error() const -> bool { return data_.index() == 1; }
  auto is_eof() const -> bool { return data_.index() == 2; }

  auto get() -> T& { return std::get<0>(data_); }
  auto get() const -> const T& { return std::get<0>(data_); }
  auto take() -> T { return std::move(std::get<0>(data_)); }

  auto error() const -> const Error& { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  StreamItem(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v)) {}

  std::variant<T, Error, EndOfStream> data_;
};

}  // namespace relay::stream
