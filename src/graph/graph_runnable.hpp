#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "compose/runnable.hpp"
#include "graph/state_graph.hpp"

namespace relay::graph {

/// A graph seen as an execution unit. Only invoke is native: stream yields the
/// final result as a single item, collect runs the first input and transform runs
/// each input in turn.
template <typename S>
class GraphRunnable final : public compose::Runnable<S, GraphResult<S>> {
 public:
  explicit GraphRunnable(std::shared_ptr<const StateGraph<S>> graph) : graph_(std::move(graph)) {}

  auto name() const -> std::string override { return graph_->config().name; }

  auto run_info() const -> callbacks::RunInfo override {
    auto info = graph_->run_info();
    info.type = "GraphRunnable";
    info.component = callbacks::ComponentType::Chain;
    return info;
  }

  auto graph() const -> const StateGraph<S>& { return *graph_; }

 protected:
  auto capabilities() const -> compose::Capabilities<S, GraphResult<S>> override {
    compose::Capabilities<S, GraphResult<S>> caps;
    caps.invoke = [graph = graph_](S input, const RunOptions& options) { return graph->invoke(std::move(input), options); };
    return caps;
  }

 private:
  std::shared_ptr<const StateGraph<S>> graph_;
};

template <typename S>
auto to_runnable(StateGraph<S> graph) -> compose::RunnablePtr<S, GraphResult<S>> {
  return std::make_shared<GraphRunnable<S>>(std::make_shared<const StateGraph<S>>(std::move(graph)));
}

/// Wraps a runnable as a graph node: get_input extracts its input from the state and
/// set_output folds its output back into a new state. S is given explicitly:
/// as_node<MyState>(unit, get, set).
template <typename S, typename I, typename O>
auto as_node(compose::RunnablePtr<I, O> runnable, std::type_identity_t<std::function<I(const S&)>> get_input,
             std::type_identity_t<std::function<S(const S&, O)>> set_output) {
  return [runnable = std::move(runnable), get_input = std::move(get_input),
          set_output = std::move(set_output)](S state, const RunOptions& options) -> Expected<S> {
    auto output = runnable->invoke(get_input(state), options);
    if (!output) {
      return tl::unexpected(output.error());
    }
    return set_output(state, std::move(*output));
  };
}

}  // namespace relay::graph
