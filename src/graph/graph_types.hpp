#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "common/logging/flags.hpp"
#include "compose/run_options.hpp"
#include "engine/error.hpp"

namespace relay::graph {

using compose::RunOptions;
using engine::Error;
using engine::ErrorCode;
using engine::Expected;
using engine::Json;

/// Termination sentinel: routing here stops the run.
inline constexpr std::string_view kEnd = "__end__";
/// Reserved pseudo-node naming the entry edge in renderings.
inline constexpr std::string_view kStart = "__start__";

template <typename S>
using NodeFn = std::function<Expected<S>(S, const RunOptions&)>;

template <typename S>
struct GraphNode {
  std::string name;
  NodeFn<S> fn;
  std::string description;
};

template <typename S>
struct DirectEdge {
  std::string from;
  std::string to;
};

template <typename S>
struct ConditionalEdge {
  std::string from;
  std::function<std::string(const S&)> router;
  std::string description;
};

template <typename S>
struct Route {
  std::string target;
  std::function<bool(const S&)> predicate;
};

/// Ordered predicates; the first that holds wins, else default_route.
template <typename S>
struct MultiRouteEdge {
  std::string from;
  std::vector<Route<S>> routes;
  std::string default_route = std::string(kEnd);
};

template <typename S>
using Merger = std::function<Expected<S>(const S& original, std::vector<S> results)>;

template <typename S>
struct ParallelEdge {
  std::string from;
  std::vector<std::string> targets;
  /// Empty: the last result in declared target order wins.
  Merger<S> merger;
};

template <typename S>
using GraphEdge = std::variant<DirectEdge<S>, ConditionalEdge<S>, MultiRouteEdge<S>, ParallelEdge<S>>;

template <typename S>
auto edge_source(const GraphEdge<S>& edge) -> const std::string& {
  return std::visit([](const auto& e) -> const std::string& { return e.from; }, edge);
}

struct GraphConfig {
  std::string name = "StateGraph";
  int max_iterations = FLAGS_graph_max_iterations;
};

/// Outcome of one graph invocation.
template <typename S>
class GraphResult {
 public:
  GraphResult(S state, std::vector<std::string> path, int iterations)
      : state_(std::move(state)),
        path_(std::move(path)),
        iterations_(iterations),
        metadata_(Json{{"iterations", iterations}}) {}

  auto state() const -> const S& { return state_; }
  auto path() const -> const std::vector<std::string>& { return path_; }
  auto iterations() const -> int { return iterations_; }
  auto metadata() const -> const Json& { return metadata_; }

  auto take_state() && -> S { return std::move(state_); }

 private:
  S state_;
  std::vector<std::string> path_;
  int iterations_;
  Json metadata_;
};

}  // namespace relay::graph
