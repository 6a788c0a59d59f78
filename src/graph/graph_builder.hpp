#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "graph/state_graph.hpp"

namespace relay::graph {

/// Fluent front end over StateGraph. The first failing call is remembered, later
/// calls are ignored, and build() reports it.
template <typename S>
class GraphBuilder {
 public:
  explicit GraphBuilder(GraphConfig config = {}) : graph_(std::move(config)) {}

  template <typename Fn>
  auto with_node(std::string name, Fn fn, std::string description = {}) -> GraphBuilder& {
    return apply(graph_.add_node(std::move(name), std::move(fn), std::move(description)));
  }

  auto connect(std::string from, std::string to) -> GraphBuilder& {
    return apply(graph_.add_edge(std::move(from), std::move(to)));
  }

  /// Routes to then_node when condition holds, otherwise to otherwise_node.
  auto route_if(std::string from, std::function<bool(const S&)> condition, std::string then_node,
                std::string otherwise_node = std::string(kEnd)) -> GraphBuilder& {
    std::vector<Route<S>> routes;
    routes.push_back(Route<S>{std::move(then_node), std::move(condition)});
    return apply(graph_.add_conditional_router(std::move(from), std::move(routes), std::move(otherwise_node)));
  }

  auto route_when(std::string from, std::vector<Route<S>> routes,
                  std::string default_route = std::string(kEnd)) -> GraphBuilder& {
    return apply(graph_.add_conditional_router(std::move(from), std::move(routes), std::move(default_route)));
  }

  auto route(std::string from, std::function<std::string(const S&)> router, std::string description = {})
      -> GraphBuilder& {
    return apply(graph_.add_conditional_edge(std::move(from), std::move(router), std::move(description)));
  }

  auto parallel(std::string from, std::vector<std::string> targets, Merger<S> merger = {}) -> GraphBuilder& {
    return apply(graph_.add_parallel_edge(std::move(from), std::move(targets), std::move(merger)));
  }

  auto start_from(std::string name) -> GraphBuilder& { return apply(graph_.set_entry_point(std::move(name))); }

  auto build() -> Expected<StateGraph<S>> {
    if (error_) {
      return tl::unexpected(*error_);
    }
    if (!graph_.entry_point()) {
      return tl::unexpected(engine::make_error(ErrorCode::InvalidGraph, "entry point is not set"));
    }
    return std::move(graph_);
  }

 private:
  auto apply(Expected<void> result) -> GraphBuilder& {
    if (!result && !error_) {
      error_ = result.error();
    }
    return *this;
  }

  StateGraph<S> graph_;
  std::optional<Error> error_;
};

template <typename S>
struct NodeSpec {
  std::string name;
  std::function<Expected<S>(S)> fn;
};

/// Prebuilt graph shapes.
struct GraphPatterns {
  /// nodes[0] -> nodes[1] -> ... -> end.
  template <typename S>
  static auto linear(std::vector<NodeSpec<S>> nodes, GraphConfig config = {}) -> Expected<StateGraph<S>> {
    if (nodes.empty()) {
      return tl::unexpected(engine::make_error(ErrorCode::InvalidGraph, "linear graph needs at least one node"));
    }
    GraphBuilder<S> builder(std::move(config));
    for (auto& node : nodes) {
      builder.with_node(node.name, std::move(node.fn));
    }
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
      builder.connect(nodes[i].name, nodes[i + 1].name);
    }
    builder.connect(nodes.back().name, std::string(kEnd));
    builder.start_from(nodes.front().name);
    return builder.build();
  }

  /// Runs nodes in order, then returns to the first while should_continue holds.
  template <typename S>
  static auto loop(std::vector<NodeSpec<S>> nodes, std::function<bool(const S&)> should_continue,
                   GraphConfig config = {}) -> Expected<StateGraph<S>> {
    if (nodes.empty()) {
      return tl::unexpected(engine::make_error(ErrorCode::InvalidGraph, "loop graph needs at least one node"));
    }
    GraphBuilder<S> builder(std::move(config));
    for (auto& node : nodes) {
      builder.with_node(node.name, std::move(node.fn));
    }
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
      builder.connect(nodes[i].name, nodes[i + 1].name);
    }
    builder.route_if(nodes.back().name, std::move(should_continue), nodes.front().name, std::string(kEnd));
    builder.start_from(nodes.front().name);
    return builder.build();
  }

  /// split fans out to every mapper in parallel; the merged state flows into
  /// reduce and then ends.
  template <typename S>
  static auto map_reduce(NodeSpec<S> split, std::vector<NodeSpec<S>> mappers, NodeSpec<S> reduce,
                         Merger<S> merger = {}, GraphConfig config = {}) -> Expected<StateGraph<S>> {
    if (mappers.empty()) {
      return tl::unexpected(engine::make_error(ErrorCode::InvalidGraph, "map_reduce needs at least one mapper"));
    }
    GraphBuilder<S> builder(std::move(config));
    builder.with_node(split.name, std::move(split.fn));
    std::vector<std::string> targets;
    for (auto& mapper : mappers) {
      targets.push_back(mapper.name);
      builder.with_node(mapper.name, std::move(mapper.fn));
    }
    builder.with_node(reduce.name, std::move(reduce.fn));
    builder.parallel(split.name, targets, std::move(merger));
    for (const auto& target : targets) {
      builder.connect(target, reduce.name);
    }
    builder.connect(reduce.name, std::string(kEnd));
    builder.start_from(split.name);
    return builder.build();
  }
};

}  // namespace relay::graph
