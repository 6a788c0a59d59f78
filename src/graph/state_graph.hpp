#pragma once

#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "callbacks/run_with_callbacks.hpp"
#include "common/logging/log.hpp"
#include "graph/graph_types.hpp"
#include "graph/node_adapt.hpp"

namespace relay::graph {

/// Named state transforms connected by edges, executed from an entry point until a
/// route reaches kEnd. Cycles are allowed; the iteration ceiling bounds every run.
///
/// Each loop step runs one node and resolves the first edge declared from it.
/// A parallel edge runs all its targets concurrently on copies of the same state,
/// merges the results, and continues from the first target whose own edge does not
/// terminate. The fan-out shares the iteration of the node that triggered it.
template <typename S>
class StateGraph {
 public:
  using State = S;

  explicit StateGraph(GraphConfig config = {}) : config_(std::move(config)) {}

  template <typename Fn>
  auto add_node(std::string name, Fn fn, std::string description = {}) -> Expected<void> {
    if (name.empty() || name == kEnd || name == kStart) {
      return invalid(std::format("node name '{}' is reserved", name));
    }
    if (index_.contains(name)) {
      return invalid(std::format("node '{}' already exists", name));
    }
    index_.emplace(name, nodes_.size());
    auto adapted = detail::adapt_node<S>(name, std::move(fn));
    nodes_.push_back(GraphNode<S>{std::move(name), std::move(adapted), std::move(description)});
    return {};
  }

  auto add_edge(std::string from, std::string to) -> Expected<void> {
    if (from == kStart) {
      return set_entry_point(std::move(to));
    }
    if (auto checked = check_source(from); !checked) {
      return checked;
    }
    if (auto checked = check_target(to); !checked) {
      return checked;
    }
    edges_.push_back(DirectEdge<S>{std::move(from), std::move(to)});
    return {};
  }

  auto add_conditional_edge(std::string from, std::function<std::string(const S&)> router,
                            std::string description = {}) -> Expected<void> {
    if (auto checked = check_source(from); !checked) {
      return checked;
    }
    if (!router) {
      return invalid(std::format("conditional edge from '{}' has no router", from));
    }
    edges_.push_back(ConditionalEdge<S>{std::move(from), std::move(router), std::move(description)});
    return {};
  }

  auto add_conditional_router(std::string from, std::vector<Route<S>> routes,
                              std::string default_route = std::string(kEnd)) -> Expected<void> {
    if (auto checked = check_source(from); !checked) {
      return checked;
    }
    for (const auto& route : routes) {
      if (auto checked = check_target(route.target); !checked) {
        return checked;
      }
      if (!route.predicate) {
        return invalid(std::format("route '{}' from '{}' has no predicate", route.target, from));
      }
    }
    if (auto checked = check_target(default_route); !checked) {
      return checked;
    }
    edges_.push_back(MultiRouteEdge<S>{std::move(from), std::move(routes), std::move(default_route)});
    return {};
  }

  auto add_parallel_edge(std::string from, std::vector<std::string> targets, Merger<S> merger = {})
      -> Expected<void> {
    if (auto checked = check_source(from); !checked) {
      return checked;
    }
    if (targets.empty()) {
      return invalid(std::format("parallel edge from '{}' has no targets", from));
    }
    for (const auto& target : targets) {
      if (!index_.contains(target)) {
        return invalid(std::format("parallel target '{}' does not exist", target));
      }
    }
    edges_.push_back(ParallelEdge<S>{std::move(from), std::move(targets), std::move(merger)});
    return {};
  }

  auto set_entry_point(std::string name) -> Expected<void> {
    if (!index_.contains(name)) {
      return invalid(std::format("entry point '{}' does not exist", name));
    }
    entry_point_ = std::move(name);
    return {};
  }

  auto invoke(S initial, const RunOptions& options = {}) const -> Expected<GraphResult<S>> {
    if (!entry_point_) {
      return invalid("entry point is not set");
    }
    const auto info = run_info();
    return callbacks::run_with_callbacks(
        options.callbacks, options.context, info, callbacks::Payload::of(initial),
        [&](const callbacks::Context& context) { return execute(std::move(initial), options.with_context(context)); });
  }

  auto run_info() const -> callbacks::RunInfo {
    return callbacks::RunInfo{config_.name, "StateGraph", callbacks::ComponentType::Graph,
                              Json{{"entry_point", entry_point_.value_or("")},
                                   {"node_count", nodes_.size()},
                                   {"edge_count", edges_.size()}}};
  }

  /// Mermaid flowchart of nodes and edges.
  auto to_mermaid() const -> std::string {
    std::string out = "graph TD\n";
    if (entry_point_) {
      out += std::format("    {}(( ))\n    {} --> {}\n", kStart, kStart, *entry_point_);
    }
    for (const auto& node : nodes_) {
      if (node.description.empty()) {
        out += std::format("    {}[{}]\n", node.name, node.name);
      } else {
        out += std::format("    {}[{}<br/>{}]\n", node.name, node.name, node.description);
      }
    }
    for (const auto& edge : edges_) {
      std::visit([&](const auto& e) { out += render_edge(e); }, edge);
    }
    out += std::format("    {}(( ))\n", kEnd);
    return out;
  }

  auto describe() const -> std::string {
    return std::format("StateGraph(name: {}, nodes: {}, edges: {}, entry: {})", config_.name, nodes_.size(),
                       edges_.size(), entry_point_.value_or("<unset>"));
  }

  auto config() const -> const GraphConfig& { return config_; }
  auto nodes() const -> const std::vector<GraphNode<S>>& { return nodes_; }
  auto edges() const -> const std::vector<GraphEdge<S>>& { return edges_; }
  auto entry_point() const -> const std::optional<std::string>& { return entry_point_; }

 private:
  static auto invalid(std::string message) -> tl::unexpected<Error> {
    return tl::unexpected(engine::make_error(ErrorCode::InvalidGraph, std::move(message)));
  }

  auto check_source(const std::string& from) const -> Expected<void> {
    if (!index_.contains(from)) {
      return invalid(std::format("edge source '{}' does not exist", from));
    }
    return {};
  }

  auto check_target(const std::string& to) const -> Expected<void> {
    if (to != kEnd && !index_.contains(to)) {
      return invalid(std::format("edge target '{}' does not exist", to));
    }
    return {};
  }

  auto find_edge(const std::string& from) const -> const GraphEdge<S>* {
    for (const auto& edge : edges_) {
      if (edge_source<S>(edge) == from) {
        return &edge;
      }
    }
    return nullptr;
  }

  /// Targets of the first edge leaving from; {kEnd} when none is declared.
  auto next_nodes(const std::string& from, const S& state) const -> Expected<std::vector<std::string>> {
    const auto* edge = find_edge(from);
    if (edge == nullptr) {
      return std::vector<std::string>{std::string(kEnd)};
    }
    return std::visit([&](const auto& e) { return resolve(e, state); }, *edge);
  }

  auto resolve(const DirectEdge<S>& edge, const S&) const -> Expected<std::vector<std::string>> {
    return std::vector<std::string>{edge.to};
  }

  auto resolve(const ConditionalEdge<S>& edge, const S& state) const -> Expected<std::vector<std::string>> {
    auto target = engine::detail::invoke_guarded(edge.from, edge.router, state);
    if (!target) {
      return tl::unexpected(target.error());
    }
    if (*target != kEnd && !index_.contains(*target)) {
      return tl::unexpected(engine::make_error(
          ErrorCode::InvalidGraph, std::format("router returned unknown node '{}'", *target), edge.from));
    }
    return std::vector<std::string>{std::move(*target)};
  }

  auto resolve(const MultiRouteEdge<S>& edge, const S& state) const -> Expected<std::vector<std::string>> {
    for (const auto& route : edge.routes) {
      auto matched = engine::detail::invoke_guarded(edge.from, route.predicate, state);
      if (!matched) {
        return tl::unexpected(matched.error());
      }
      if (*matched) {
        return std::vector<std::string>{route.target};
      }
    }
    return std::vector<std::string>{edge.default_route};
  }

  auto resolve(const ParallelEdge<S>& edge, const S&) const -> Expected<std::vector<std::string>> {
    return edge.targets;
  }

  auto run_node(const GraphNode<S>& node, S state, const RunOptions& options) const -> Expected<S> {
    const callbacks::RunInfo info{node.name, "GraphNode", callbacks::ComponentType::GraphNode,
                                  Json{{"description", node.description}}};
    return callbacks::run_with_callbacks(options.callbacks, options.context, info, callbacks::Payload::of(state),
                                         [&](const callbacks::Context& context) {
                                           return node.fn(std::move(state), options.with_context(context));
                                         });
  }

  auto node_named(const std::string& name) const -> const GraphNode<S>& { return nodes_[index_.at(name)]; }

  auto run_parallel(const ParallelEdge<S>& edge, const S& state, const RunOptions& options) const -> Expected<S> {
    std::vector<std::optional<Expected<S>>> results(edge.targets.size());
    options.executor_or_shared().for_each_index(edge.targets.size(), [&](std::size_t index) {
      results[index].emplace(run_node(node_named(edge.targets[index]), state, options));
    });

    std::vector<S> states;
    states.reserve(results.size());
    for (auto& result : results) {
      if (!*result) {
        return tl::unexpected(result->error());
      }
      states.push_back(std::move(**result));
    }
    if (edge.merger) {
      return engine::detail::invoke_guarded(edge.from, edge.merger, state, std::move(states));
    }
    return std::move(states.back());
  }

  auto execute(S state, const RunOptions& options) const -> Expected<GraphResult<S>> {
    std::string current = *entry_point_;
    std::vector<std::string> path;
    int iterations = 0;

    while (current != kEnd) {
      if (iterations >= config_.max_iterations) {
        log::warn("graph '{}' stopped at iteration ceiling {} before node '{}'", config_.name,
                  config_.max_iterations, current);
        return tl::unexpected(engine::make_error(
            ErrorCode::IterationCeiling,
            std::format("graph exceeded maximum iterations ({})", config_.max_iterations), current));
      }
      ++iterations;
      path.push_back(current);

      auto next_state = run_node(node_named(current), std::move(state), options);
      if (!next_state) {
        return tl::unexpected(failure(std::move(next_state.error()), current));
      }
      state = std::move(*next_state);

      auto next = next_nodes(current, state);
      if (!next) {
        return tl::unexpected(next.error());
      }
      if (next->empty() || next->front() == kEnd) {
        break;
      }
      if (next->size() == 1) {
        current = std::move(next->front());
        continue;
      }

      const auto& edge = std::get<ParallelEdge<S>>(*find_edge(current));
      auto merged = run_parallel(edge, state, options);
      if (!merged) {
        return tl::unexpected(failure(std::move(merged.error()), current));
      }
      state = std::move(*merged);
      // Fanned-out targets ran, so they are recorded in declared order.
      path.insert(path.end(), edge.targets.begin(), edge.targets.end());

      auto continuation = continue_after(edge.targets, state);
      if (!continuation) {
        return tl::unexpected(continuation.error());
      }
      current = std::move(*continuation);
    }

    log::debug("graph '{}' finished after {} iterations", config_.name, iterations);
    return GraphResult<S>(std::move(state), std::move(path), iterations);
  }

  /// First fanned-out node, in declared order, whose edge does not terminate.
  auto continue_after(const std::vector<std::string>& targets, const S& state) const -> Expected<std::string> {
    for (const auto& target : targets) {
      auto next = next_nodes(target, state);
      if (!next) {
        return tl::unexpected(next.error());
      }
      if (!next->empty() && next->front() != kEnd) {
        return std::move(next->front());
      }
    }
    return std::string(kEnd);
  }

  static auto failure(Error error, const std::string& node) -> Error {
    if (error.origin.empty()) {
      error.origin = node;
    }
    return error;
  }

  auto render_edge(const DirectEdge<S>& edge) const -> std::string {
    return std::format("    {} --> {}\n", edge.from, edge.to);
  }

  auto render_edge(const ConditionalEdge<S>& edge) const -> std::string {
    return std::format("    {} -->|{}| ?\n", edge.from, edge.description.empty() ? "?" : edge.description);
  }

  auto render_edge(const MultiRouteEdge<S>& edge) const -> std::string {
    std::string out;
    for (const auto& route : edge.routes) {
      out += std::format("    {} -->|{}| {}\n", edge.from, route.target, route.target);
    }
    out += std::format("    {} -->|default| {}\n", edge.from, edge.default_route);
    return out;
  }

  auto render_edge(const ParallelEdge<S>& edge) const -> std::string {
    std::string out;
    for (const auto& target : edge.targets) {
      out += std::format("    {} -.-> {}\n", edge.from, target);
    }
    return out;
  }

  GraphConfig config_;
  std::vector<GraphNode<S>> nodes_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<GraphEdge<S>> edges_;
  std::optional<std::string> entry_point_;
};

}  // namespace relay::graph
