#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include "callbacks/logging_handler.hpp"
#include "callbacks/metrics_handler.hpp"
#include "callbacks/trace.hpp"
#include "callbacks/tracing_handler.hpp"
#include "common/logging/flags.hpp"
#include "common/logging/log.hpp"
#include "compose/lambda.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_runnable.hpp"
#include "graph/map_state.hpp"

DEFINE_int32(agent_factor, 6, "Amount the calculator tool adds on every call");
DEFINE_int32(agent_target, 42, "Value the scripted model waits for before answering");

namespace {

using relay::callbacks::CallbackManager;
using relay::callbacks::HandlerPtr;
using relay::compose::RunOptions;
using relay::graph::GraphBuilder;
using relay::graph::GraphConfig;
using relay::graph::MapState;
namespace trace = relay::callbacks::trace;

struct StdoutTraceSink {
  std::mutex mutex;

  void on_span_start(const trace::SpanStart& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[trace] span_start id={} parent={} name={} depth={}\n", event.span_id,
                             event.parent_span_id, event.name, event.depth);
  }

  void on_span_end(const trace::SpanEnd& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[trace] span_end id={} name={} status={} duration_ns={}\n", event.span_id, event.name,
                             static_cast<int>(event.status), event.duration);
  }
};

/// Scripted model: asks for the calculator until the running total reaches the target.
auto think(MapState state) -> MapState {
  const auto total = state.get<int>("total").value_or(0);
  if (total < FLAGS_agent_target) {
    return state.set("action", "calculate");
  }
  return state.set("action", "answer");
}

auto answer(MapState state) -> MapState {
  const auto total = state.get<int>("total").value_or(0);
  const auto calls = state.get<int>("tool_calls").value_or(0);
  return state.set("answer", std::format("{} reached after {} tool calls", total, calls));
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs a think/act agent loop over a cyclic StateGraph");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  relay::log::init();

  auto calculator = relay::compose::make_lambda([](int total) { return total + FLAGS_agent_factor; }, "calculator");

  auto act = relay::graph::as_node<MapState>(
      calculator, [](const MapState& state) { return state.get<int>("total").value_or(0); },
      [](const MapState& state, int total) {
        return state.set("total", total).set("tool_calls", state.get<int>("tool_calls").value_or(0) + 1);
      });

  auto graph = GraphBuilder<MapState>(GraphConfig{.name = "agent"})
                   .with_node("think", think, "decide next action")
                   .with_node("act", std::move(act), "call calculator")
                   .with_node("answer", answer, "format reply")
                   .route_if(
                       "think",
                       [](const MapState& state) { return state.get<std::string>("action") == "calculate"; },
                       "act", "answer")
                   .connect("act", "think")
                   .start_from("think")
                   .build();
  if (!graph) {
    std::cerr << "graph error: " << relay::engine::describe(graph.error()) << "\n";
    relay::log::shutdown();
    return 1;
  }

  std::cout << graph->describe() << "\n" << graph->to_mermaid() << "\n";

  StdoutTraceSink sink;
  auto metrics = std::make_shared<relay::callbacks::MetricsHandler>();
  auto tracer = std::make_shared<relay::callbacks::TracingHandler>(relay::callbacks::TracingOptions{},
                                                                   trace::make_sink(sink));
  auto logger = std::make_shared<relay::callbacks::LoggingHandler>();

  RunOptions options;
  options.callbacks = std::make_shared<CallbackManager>(std::vector<HandlerPtr>{metrics, tracer, logger});

  auto agent = relay::graph::to_runnable(std::move(*graph));
  auto result = agent->invoke(MapState().set("total", 0), options);
  if (!result) {
    std::cerr << "agent error: " << relay::engine::describe(result.error()) << "\n";
    relay::log::shutdown();
    return 1;
  }

  std::cout << std::format("answer: {}\n", result->state().get<std::string>("answer").value_or("<none>"));
  std::cout << std::format("iterations: {}\n", result->iterations());
  std::string path;
  for (const auto& node : result->path()) {
    path += path.empty() ? node : " -> " + node;
  }
  std::cout << "path: " << path << "\n\n";
  std::cout << tracer->render() << "\n" << metrics->summary();

  relay::log::shutdown();
  return 0;
}
