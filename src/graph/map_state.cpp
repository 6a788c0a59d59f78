#include "graph/map_state.hpp"

#include <utility>

namespace relay::graph {

MapState::MapState() : data_(Json::object()) {}

MapState::MapState(Json data) : data_(data.is_object() ? std::move(data) : Json::object()) {}

auto MapState::set(const std::string& key, Json value) const -> MapState {
  Json next = data_;
  next[key] = std::move(value);
  return MapState(std::move(next));
}

auto MapState::set_all(const Json& updates) const -> MapState {
  Json next = data_;
  if (updates.is_object()) {
    next.update(updates);
  }
  return MapState(std::move(next));
}

auto MapState::remove(const std::string& key) const -> MapState {
  Json next = data_;
  next.erase(key);
  return MapState(std::move(next));
}

auto MapState::contains(const std::string& key) const -> bool { return data_.contains(key); }

auto MapState::size() const -> std::size_t { return data_.size(); }

auto MapState::to_string() const -> std::string { return "MapState(" + data_.dump() + ")"; }

void to_json(Json& json, const MapState& state) { json = state.data(); }

}  // namespace relay::graph
