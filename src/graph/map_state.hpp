#pragma once

#include <optional>
#include <string>

#include "engine/error.hpp"

namespace relay::graph {

using engine::Json;

/// Immutable string-keyed state for prototyping graphs. Updates return a new
/// MapState and leave the receiver untouched.
class MapState {
 public:
  MapState();
  explicit MapState(Json data);

  /// Value under key; nullopt when absent or not convertible to T.
  template <typename T>
  auto get(const std::string& key) const -> std::optional<T> {
    auto it = data_.find(key);
    if (it == data_.end()) {
      return std::nullopt;
    }
    try {
      return it->template get<T>();
    } catch (const Json::type_error&) {
      return std::nullopt;
    }
  }

  auto set(const std::string& key, Json value) const -> MapState;
  auto set_all(const Json& updates) const -> MapState;
  auto remove(const std::string& key) const -> MapState;
  auto contains(const std::string& key) const -> bool;
  auto size() const -> std::size_t;
  auto data() const -> const Json& { return data_; }
  auto to_string() const -> std::string;

  friend auto operator==(const MapState& lhs, const MapState& rhs) -> bool { return lhs.data_ == rhs.data_; }

 private:
  Json data_;
};

void to_json(Json& json, const MapState& state);

}  // namespace relay::graph
