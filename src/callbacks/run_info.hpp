#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "engine/error.hpp"

namespace relay::callbacks {

using engine::Json;

/// Observer context threaded through the handler chain by value.
using Context = Json;

enum class ComponentType {
  ChatModel,
  Tool,
  Chain,
  Retriever,
  Embedder,
  PromptTemplate,
  Runnable,
  Agent,
  Graph,
  GraphNode,
  Custom,
};

inline auto to_string(ComponentType type) -> std::string_view {
  switch (type) {
    case ComponentType::ChatModel: return "chat_model";
    case ComponentType::Tool: return "tool";
    case ComponentType::Chain: return "chain";
    case ComponentType::Retriever: return "retriever";
    case ComponentType::Embedder: return "embedder";
    case ComponentType::PromptTemplate: return "prompt_template";
    case ComponentType::Runnable: return "runnable";
    case ComponentType::Agent: return "agent";
    case ComponentType::Graph: return "graph";
    case ComponentType::GraphNode: return "graph_node";
    case ComponentType::Custom: return "custom";
  }
  return "unknown";
}

struct RunInfo {
  std::string name;
  /// Concrete implementation tag, e.g. "Lambda" or "StateGraph".
  std::string type;
  ComponentType component = ComponentType::Runnable;
  Json metadata = Json::object();
};

inline auto operator==(const RunInfo& lhs, const RunInfo& rhs) -> bool {
  return lhs.name == rhs.name && lhs.type == rhs.type && lhs.component == rhs.component;
}

namespace detail {

template <typename T>
concept JsonConvertible = requires(const T& value) { Json(value); };

}  // namespace detail

/// Borrowed, type-erased view of a unit's input or output. Valid only for the
/// duration of the hook call that receives it.
class Payload {
 public:
  Payload() = default;

  template <typename T>
  static auto of(const T& value, Json metadata = Json::object()) -> Payload {
    Payload payload;
    payload.type_ = std::type_index(typeid(T));
    payload.data_ = &value;
    payload.metadata = std::move(metadata);
    if constexpr (detail::JsonConvertible<T>) {
      payload.to_json_ = [](const void* data) { return Json(*static_cast<const T*>(data)); };
    }
    return payload;
  }

  static auto none(Json metadata = Json::object()) -> Payload {
    Payload payload;
    payload.metadata = std::move(metadata);
    return payload;
  }

  template <typename T>
  auto get() const -> const T* {
    if (data_ == nullptr || type_ != std::type_index(typeid(T))) {
      return nullptr;
    }
    return static_cast<const T*>(data_);
  }

  auto empty() const -> bool { return data_ == nullptr; }
  auto type() const -> std::type_index { return type_; }

  /// JSON rendering of the value when its type converts to nlohmann::json.
  auto to_json() const -> std::optional<Json> {
    if (data_ == nullptr || to_json_ == nullptr) {
      return std::nullopt;
    }
    return to_json_(data_);
  }

  Json metadata = Json::object();

 private:
  std::type_index type_ = std::type_index(typeid(void));
  const void* data_ = nullptr;
  Json (*to_json_)(const void*) = nullptr;
};

/// Non-consuming description of a stream crossing a unit boundary.
struct StreamPayload {
  std::type_index item_type = std::type_index(typeid(void));
  Json metadata = Json::object();

  template <typename T>
  static auto of(Json metadata = Json::object()) -> StreamPayload {
    return StreamPayload{std::type_index(typeid(T)), std::move(metadata)};
  }
};

}  // namespace relay::callbacks
