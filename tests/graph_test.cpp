#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "compose/lambda.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_runnable.hpp"
#include "graph/map_state.hpp"
#include "runtime/executor.hpp"
#include "test_support.hpp"

namespace graph = relay::graph;
namespace compose = relay::compose;
namespace callbacks = relay::callbacks;
using graph::GraphBuilder;
using graph::GraphConfig;
using graph::GraphPatterns;
using graph::kEnd;
using graph::kStart;
using graph::MapState;
using graph::NodeSpec;
using graph::Route;
using graph::StateGraph;
using relay::engine::ErrorCode;
using relay::engine::Expected;
using relay::engine::Json;
using relay::engine::make_error;

namespace {

auto end_node() -> std::string { return std::string(kEnd); }

/// Stateless step whose call operator is const; copies share one call counter.
struct CountingStep {
  std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

  auto operator()(int s) const -> int {
    calls->fetch_add(1);
    return s + 1;
  }
};

auto recording_options(std::shared_ptr<RecordingHandler> recorder) -> compose::RunOptions {
  compose::RunOptions options;
  options.callbacks =
      std::make_shared<callbacks::CallbackManager>(std::vector<callbacks::HandlerPtr>{std::move(recorder)});
  return options;
}

auto count_of(const std::vector<std::string>& calls, const std::string& call) -> long {
  return std::count(calls.begin(), calls.end(), call);
}

/// split -> {a: +1, b: +10} with the given merger; both branches continue to join (*2).
auto fan_graph(graph::Merger<int> merger) -> StateGraph<int> {
  StateGraph<int> g(GraphConfig{.name = "fan"});
  EXPECT_TRUE(g.add_node("split", [](int s) { return s; }).has_value());
  EXPECT_TRUE(g.add_node("a", [](int s) { return s + 1; }).has_value());
  EXPECT_TRUE(g.add_node("b", [](int s) { return s + 10; }).has_value());
  EXPECT_TRUE(g.add_node("join", [](int s) { return s * 2; }).has_value());
  EXPECT_TRUE(g.add_parallel_edge("split", {"a", "b"}, std::move(merger)).has_value());
  EXPECT_TRUE(g.add_edge("a", "join").has_value());
  EXPECT_TRUE(g.add_edge("b", "join").has_value());
  EXPECT_TRUE(g.add_edge("join", end_node()).has_value());
  EXPECT_TRUE(g.set_entry_point("split").has_value());
  return g;
}

}  // namespace

TEST(StateGraph, LinearRunFollowsEdges) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("add", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_node("double", [](int s) -> Expected<int> { return s * 2; }).has_value());
  ASSERT_TRUE(g.add_edge(std::string(kStart), "add").has_value());
  ASSERT_TRUE(g.add_edge("add", "double").has_value());
  ASSERT_TRUE(g.add_edge("double", end_node()).has_value());

  auto result = g.invoke(3);
  ASSERT_TRUE(result.has_value()) << relay::engine::describe(result.error());
  EXPECT_EQ(result->state(), 8);
  EXPECT_EQ(result->path(), (std::vector<std::string>{"add", "double"}));
  EXPECT_EQ(result->iterations(), 2);
  EXPECT_EQ(result->metadata()["iterations"], 2);
}

TEST(StateGraph, NodeWithoutEdgeEndsRun) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("only", [](int s) { return s + 5; }).has_value());
  ASSERT_TRUE(g.set_entry_point("only").has_value());
  auto result = g.invoke(1);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 6);
  EXPECT_EQ(result->iterations(), 1);
}

TEST(StateGraph, RejectsInvalidDefinitions) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("a", [](int s) { return s; }).has_value());

  auto empty = g.add_node("", [](int s) { return s; });
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, ErrorCode::InvalidGraph);
  EXPECT_FALSE(g.add_node(end_node(), [](int s) { return s; }).has_value());
  EXPECT_FALSE(g.add_node(std::string(kStart), [](int s) { return s; }).has_value());
  EXPECT_FALSE(g.add_node("a", [](int s) { return s; }).has_value());

  EXPECT_FALSE(g.add_edge("missing", "a").has_value());
  EXPECT_FALSE(g.add_edge("a", "missing").has_value());
  EXPECT_FALSE(g.set_entry_point("missing").has_value());
  EXPECT_FALSE(g.add_parallel_edge("a", {}).has_value());
  EXPECT_FALSE(g.add_parallel_edge("a", {"missing"}).has_value());
  EXPECT_FALSE(g.add_parallel_edge("a", {end_node()}).has_value());
  EXPECT_FALSE(g.add_conditional_edge("a", nullptr).has_value());
  EXPECT_FALSE(g.add_conditional_router("a", {Route<int>{"missing", [](const int&) { return true; }}}).has_value());
  EXPECT_TRUE(g.add_edge("a", end_node()).has_value());

  EXPECT_EQ(g.nodes().size(), 1u);
  EXPECT_EQ(g.edges().size(), 1u);
}

TEST(StateGraph, MissingEntryPointFails) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("a", [](int s) { return s; }).has_value());
  auto result = g.invoke(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidGraph);
}

TEST(StateGraph, ConditionalEdgeLoops) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("inc", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_conditional_edge("inc", [](const int& s) { return s < 5 ? std::string("inc") : end_node(); },
                                     "below five")
                  .has_value());
  ASSERT_TRUE(g.set_entry_point("inc").has_value());

  auto result = g.invoke(0);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 5);
  EXPECT_EQ(result->iterations(), 5);
  EXPECT_EQ(result->path().size(), 5u);
}

TEST(StateGraph, RunEndingAtCeilingSucceeds) {
  StateGraph<int> g(GraphConfig{.name = "bounded", .max_iterations = 3});
  ASSERT_TRUE(g.add_node("a", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_node("b", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_node("c", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_edge("a", "b").has_value());
  ASSERT_TRUE(g.add_edge("b", "c").has_value());
  ASSERT_TRUE(g.set_entry_point("a").has_value());

  auto result = g.invoke(0);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->iterations(), 3);
  EXPECT_EQ(result->state(), 3);
}

TEST(StateGraph, EndlessLoopHitsCeiling) {
  std::atomic<int> runs{0};
  StateGraph<int> g(GraphConfig{.name = "spinner", .max_iterations = 4});
  ASSERT_TRUE(g.add_node("spin", [&runs](int s) {
                 ++runs;
                 return s + 1;
               }).has_value());
  ASSERT_TRUE(g.add_edge("spin", "spin").has_value());
  ASSERT_TRUE(g.set_entry_point("spin").has_value());

  auto result = g.invoke(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::IterationCeiling);
  EXPECT_EQ(result.error().origin, "spin");
  EXPECT_EQ(runs.load(), 4);
}

TEST(StateGraph, MultiRouteTakesFirstMatch) {
  StateGraph<int> g;
  for (const auto* name : {"classify", "neg", "small", "big"}) {
    ASSERT_TRUE(g.add_node(name, [](int s) { return s; }).has_value());
  }
  std::vector<Route<int>> routes;
  routes.push_back(Route<int>{"neg", [](const int& s) { return s < 0; }});
  routes.push_back(Route<int>{"small", [](const int& s) { return s < 10; }});
  ASSERT_TRUE(g.add_conditional_router("classify", std::move(routes), "big").has_value());
  ASSERT_TRUE(g.set_entry_point("classify").has_value());

  EXPECT_EQ(g.invoke(-5)->path().back(), "neg");
  EXPECT_EQ(g.invoke(5)->path().back(), "small");
  EXPECT_EQ(g.invoke(50)->path().back(), "big");
}

TEST(StateGraph, RouterNamingUnknownNodeFails) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("a", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_conditional_edge("a", [](const int&) { return std::string("nowhere"); }).has_value());
  ASSERT_TRUE(g.set_entry_point("a").has_value());

  auto result = g.invoke(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidGraph);
  EXPECT_EQ(result.error().origin, "a");
}

TEST(StateGraph, NodeFailureCarriesNodeName) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("ok", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("thrower", [](int) -> int { throw std::runtime_error("exploded"); }).has_value());
  ASSERT_TRUE(g.add_node("refuser", [](int) -> Expected<int> {
                 return tl::unexpected(make_error(ErrorCode::UnitFailed, "refused"));
               }).has_value());
  ASSERT_TRUE(g.add_conditional_edge("ok", [](const int& s) { return s == 0 ? std::string("thrower")
                                                                           : std::string("refuser"); })
                  .has_value());
  ASSERT_TRUE(g.set_entry_point("ok").has_value());

  auto thrown = g.invoke(0);
  ASSERT_FALSE(thrown.has_value());
  EXPECT_EQ(thrown.error().code, ErrorCode::UnitFailed);
  EXPECT_EQ(thrown.error().message, "exploded");
  EXPECT_EQ(thrown.error().origin, "thrower");

  auto refused = g.invoke(1);
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error().message, "refused");
  EXPECT_EQ(refused.error().origin, "refuser");
}

TEST(StateGraph, ParallelEdgeMergesAndContinues) {
  auto g = fan_graph([](const int& original, std::vector<int> results) -> Expected<int> {
    int total = original;
    for (int r : results) {
      total += r - original;
    }
    return total;
  });

  auto result = g.invoke(1);
  ASSERT_TRUE(result.has_value()) << relay::engine::describe(result.error());
  EXPECT_EQ(result->state(), (1 + 1 + 10) * 2);
  EXPECT_EQ(result->path(), (std::vector<std::string>{"split", "a", "b", "join"}));
  EXPECT_EQ(result->iterations(), 2);
}

TEST(StateGraph, ParallelDefaultKeepsLastDeclaredResult) {
  relay::engine::Executor executor(relay::engine::ExecutorConfig{.threads = 4});
  compose::RunOptions options;
  options.executor = &executor;

  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("split", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("slow", [](int s) {
                 std::this_thread::sleep_for(std::chrono::milliseconds(30));
                 return s + 1;
               }).has_value());
  ASSERT_TRUE(g.add_node("fast", [](int s) { return s + 2; }).has_value());
  ASSERT_TRUE(g.add_parallel_edge("split", {"fast", "slow"}).has_value());
  ASSERT_TRUE(g.set_entry_point("split").has_value());

  auto result = g.invoke(0, options);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 1);
  EXPECT_EQ(result->path(), (std::vector<std::string>{"split", "fast", "slow"}));
}

TEST(StateGraph, SharedNodeCallableRunsConcurrently) {
  relay::engine::Executor executor(relay::engine::ExecutorConfig{.threads = 4});
  compose::RunOptions options;
  options.executor = &executor;

  CountingStep step;
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("split", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("left", step).has_value());
  ASSERT_TRUE(g.add_node("right", step).has_value());
  ASSERT_TRUE(g.add_parallel_edge("split", {"left", "right"}).has_value());
  ASSERT_TRUE(g.set_entry_point("split").has_value());

  auto ok = run_concurrent(4, 25, [&](int, int) {
    auto result = g.invoke(0, options);
    return result.has_value() && result->state() == 1;
  });
  EXPECT_TRUE(ok);
  EXPECT_EQ(step.calls->load(), 4 * 25 * 2);
}

TEST(StateGraph, ContinuationSkipsTerminatingTargets) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("split", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("left", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_node("right", [](int s) { return s + 2; }).has_value());
  ASSERT_TRUE(g.add_node("tail", [](int s) { return s * 10; }).has_value());
  ASSERT_TRUE(g.add_parallel_edge("split", {"left", "right"}).has_value());
  ASSERT_TRUE(g.add_edge("left", end_node()).has_value());
  ASSERT_TRUE(g.add_edge("right", "tail").has_value());
  ASSERT_TRUE(g.set_entry_point("split").has_value());

  auto result = g.invoke(1);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 30);
  EXPECT_EQ(result->path(), (std::vector<std::string>{"split", "left", "right", "tail"}));
}

TEST(StateGraph, ParallelFailureStopsRun) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("split", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("good", [](int s) { return s; }).has_value());
  ASSERT_TRUE(g.add_node("bad", [](int) -> int { throw std::runtime_error("branch failed"); }).has_value());
  ASSERT_TRUE(g.add_parallel_edge("split", {"good", "bad"}).has_value());
  ASSERT_TRUE(g.set_entry_point("split").has_value());

  auto result = g.invoke(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "branch failed");
  EXPECT_EQ(result.error().origin, "bad");
}

TEST(StateGraph, NodesMayTakeRunOptions) {
  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("bonus", [](int s, const compose::RunOptions& options) {
                 return s + options.metadata.value("bonus", 0);
               }).has_value());
  ASSERT_TRUE(g.set_entry_point("bonus").has_value());

  compose::RunOptions options;
  options.metadata = Json{{"bonus", 7}};
  EXPECT_EQ(g.invoke(1, options)->state(), 8);
}

TEST(StateGraph, SenderNodesAreAwaited) {
  exec::static_thread_pool pool(2);
  auto scheduler = pool.get_scheduler();

  StateGraph<int> g;
  ASSERT_TRUE(g.add_node("now", [](int s) { return stdexec::just(s + 1); }).has_value());
  ASSERT_TRUE(g.add_node("pooled", [scheduler](int s) {
                 return stdexec::schedule(scheduler) | stdexec::then([s]() { return s * 3; });
               }).has_value());
  ASSERT_TRUE(g.add_node("checked", [](int s) {
                 return stdexec::just(s > 100 ? Expected<int>(tl::unexpected(make_error(ErrorCode::UnitFailed, "big")))
                                              : Expected<int>(s));
               }).has_value());
  ASSERT_TRUE(g.add_edge("now", "pooled").has_value());
  ASSERT_TRUE(g.add_edge("pooled", "checked").has_value());
  ASSERT_TRUE(g.set_entry_point("now").has_value());

  auto small = g.invoke(1);
  ASSERT_TRUE(small.has_value());
  EXPECT_EQ(small->state(), 6);

  auto big = g.invoke(50);
  ASSERT_FALSE(big.has_value());
  EXPECT_EQ(big.error().origin, "checked");
}

TEST(StateGraph, CallbacksWrapGraphAndNodes) {
  auto recorder = std::make_shared<RecordingHandler>();
  StateGraph<int> g(GraphConfig{.name = "observed"});
  ASSERT_TRUE(g.add_node("a", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_node("b", [](int s) { return s + 1; }).has_value());
  ASSERT_TRUE(g.add_edge("a", "b").has_value());
  ASSERT_TRUE(g.set_entry_point("a").has_value());

  ASSERT_TRUE(g.invoke(0, recording_options(recorder)).has_value());
  EXPECT_EQ(recorder->calls(),
            (std::vector<std::string>{"start:observed", "start:a", "end:a", "start:b", "end:b", "end:observed"}));
  auto contexts = recorder->seen_contexts();
  ASSERT_EQ(contexts.size(), 3u);
  EXPECT_EQ(contexts[1]["rec"], "observed");
}

TEST(StateGraph, FailedNodeFiresErrorHooks) {
  auto recorder = std::make_shared<RecordingHandler>();
  StateGraph<int> g(GraphConfig{.name = "failing"});
  ASSERT_TRUE(g.add_node("bad", [](int) -> int { throw std::runtime_error("no"); }).has_value());
  ASSERT_TRUE(g.set_entry_point("bad").has_value());

  ASSERT_FALSE(g.invoke(0, recording_options(recorder)).has_value());
  EXPECT_EQ(recorder->calls(), (std::vector<std::string>{"start:failing", "start:bad", "error:bad", "error:failing"}));
}

TEST(StateGraph, ParallelNodesAreObserved) {
  auto recorder = std::make_shared<RecordingHandler>();
  auto g = fan_graph({});
  ASSERT_TRUE(g.invoke(0, recording_options(recorder)).has_value());

  auto calls = recorder->calls();
  EXPECT_EQ(calls.size(), 10u);
  EXPECT_EQ(count_of(calls, "start:a"), 1);
  EXPECT_EQ(count_of(calls, "end:b"), 1);
  EXPECT_EQ(calls.front(), "start:fan");
  EXPECT_EQ(calls.back(), "end:fan");
}

TEST(StateGraph, MermaidRendering) {
  auto g = fan_graph({});
  ASSERT_TRUE(g.add_node("described", [](int s) { return s; }, "does nothing").has_value());
  auto chart = g.to_mermaid();
  EXPECT_EQ(chart.rfind("graph TD\n", 0), 0u);
  EXPECT_NE(chart.find("__start__ --> split"), std::string::npos);
  EXPECT_NE(chart.find("split -.-> a"), std::string::npos);
  EXPECT_NE(chart.find("a --> join"), std::string::npos);
  EXPECT_NE(chart.find("join --> __end__"), std::string::npos);
  EXPECT_NE(chart.find("described[described<br/>does nothing]"), std::string::npos);
  EXPECT_EQ(g.describe(), "StateGraph(name: fan, nodes: 5, edges: 4, entry: split)");
}

TEST(GraphBuilder, BuildsAndRoutes) {
  auto g = GraphBuilder<int>(GraphConfig{.name = "built"})
               .with_node("start", [](int s) { return s + 1; })
               .with_node("even", [](int s) { return s * 10; })
               .with_node("odd", [](int s) { return s * 100; })
               .route_if("start", [](const int& s) { return s % 2 == 0; }, "even", "odd")
               .start_from("start")
               .build();
  ASSERT_TRUE(g.has_value());
  EXPECT_EQ(g->invoke(1)->state(), 20);
  EXPECT_EQ(g->invoke(2)->state(), 300);
}

TEST(GraphBuilder, RemembersFirstError) {
  auto g = GraphBuilder<int>()
               .with_node("a", [](int s) { return s; })
               .connect("a", "missing")
               .with_node("a", [](int s) { return s; })
               .start_from("a")
               .build();
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, ErrorCode::InvalidGraph);
  EXPECT_NE(g.error().message.find("missing"), std::string::npos);
}

TEST(GraphBuilder, RequiresEntryPoint) {
  auto g = GraphBuilder<int>().with_node("a", [](int s) { return s; }).build();
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, ErrorCode::InvalidGraph);
}

TEST(GraphPatterns, LinearAndLoop) {
  auto linear = GraphPatterns::linear<int>({NodeSpec<int>{"a", [](int s) -> Expected<int> { return s + 1; }},
                                            NodeSpec<int>{"b", [](int s) -> Expected<int> { return s * 3; }}});
  ASSERT_TRUE(linear.has_value());
  EXPECT_EQ(linear->invoke(1)->state(), 6);

  auto loop = GraphPatterns::loop<int>({NodeSpec<int>{"step", [](int s) -> Expected<int> { return s + 2; }}},
                                       [](const int& s) { return s < 9; });
  ASSERT_TRUE(loop.has_value());
  auto result = loop->invoke(0);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 10);
  EXPECT_EQ(result->iterations(), 5);

  EXPECT_FALSE(GraphPatterns::linear<int>({}).has_value());
}

TEST(GraphPatterns, MapReduceOverMapState) {
  auto g = GraphPatterns::map_reduce<MapState>(
      NodeSpec<MapState>{"split", [](MapState s) -> Expected<MapState> { return s.set("items", Json::array({1, 2, 3})); }},
      {NodeSpec<MapState>{"sum", [](MapState s) -> Expected<MapState> {
         int total = 0;
         for (const auto& item : s.data()["items"]) {
           total += item.get<int>();
         }
         return s.set("sum", total);
       }},
       NodeSpec<MapState>{"count", [](MapState s) -> Expected<MapState> {
         return s.set("count", s.data()["items"].size());
       }}},
      NodeSpec<MapState>{"report", [](MapState s) -> Expected<MapState> {
        return s.set("report", std::to_string(s.get<int>("sum").value_or(-1)) + "/" +
                                   std::to_string(s.get<int>("count").value_or(-1)));
      }},
      [](const MapState& original, std::vector<MapState> results) -> Expected<MapState> {
        auto merged = original;
        for (const auto& result : results) {
          merged = merged.set_all(result.data());
        }
        return merged;
      });
  ASSERT_TRUE(g.has_value());

  auto result = g->invoke(MapState());
  ASSERT_TRUE(result.has_value()) << relay::engine::describe(result.error());
  EXPECT_EQ(result->state().get<std::string>("report"), "6/3");
  EXPECT_EQ(result->path(), (std::vector<std::string>{"split", "sum", "count", "report"}));
}

TEST(MapState, UpdatesAreImmutable) {
  MapState empty;
  auto one = empty.set("x", 1);
  EXPECT_EQ(empty.size(), 0u);
  EXPECT_EQ(one.get<int>("x"), 1);
  EXPECT_FALSE(one.get<std::string>("x").has_value());
  EXPECT_FALSE(one.get<int>("y").has_value());

  auto both = one.set_all(Json{{"y", "why"}, {"x", 2}});
  EXPECT_EQ(both.get<int>("x"), 2);
  EXPECT_EQ(both.get<std::string>("y"), "why");
  EXPECT_EQ(one.get<int>("x"), 1);

  auto trimmed = both.remove("x");
  EXPECT_FALSE(trimmed.contains("x"));
  EXPECT_TRUE(both.contains("x"));
  EXPECT_EQ(trimmed, MapState(Json{{"y", "why"}}));
  EXPECT_EQ(trimmed.to_string(), "MapState({\"y\":\"why\"})");
  EXPECT_EQ(Json(trimmed), (Json{{"y", "why"}}));
  EXPECT_EQ(MapState(Json::array()).size(), 0u);
}

TEST(GraphRunnable, RunsGraphAsUnit) {
  auto built = GraphPatterns::linear<int>({NodeSpec<int>{"inc", [](int s) -> Expected<int> { return s + 1; }}},
                                          GraphConfig{.name = "wrapped"});
  ASSERT_TRUE(built.has_value());
  auto unit = graph::to_runnable(std::move(*built));

  auto result = unit->invoke(1);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state(), 2);

  auto streamed = unit->stream(5);
  ASSERT_TRUE(streamed.has_value());
  auto items = streamed->collect_all();
  ASSERT_TRUE(items.has_value());
  ASSERT_EQ(items->size(), 1u);
  EXPECT_EQ((*items)[0].state(), 6);
}

TEST(GraphRunnable, NestsSpansAroundGraph) {
  auto recorder = std::make_shared<RecordingHandler>();
  auto built = GraphPatterns::linear<int>({NodeSpec<int>{"inc", [](int s) -> Expected<int> { return s + 1; }}},
                                          GraphConfig{.name = "wrapped"});
  ASSERT_TRUE(built.has_value());
  auto unit = graph::to_runnable(std::move(*built));
  EXPECT_EQ(unit->run_info().type, "GraphRunnable");

  ASSERT_TRUE(unit->invoke(1, recording_options(recorder)).has_value());
  EXPECT_EQ(recorder->calls(),
            (std::vector<std::string>{"start:wrapped", "start:wrapped", "start:inc", "end:inc", "end:wrapped",
                                      "end:wrapped"}));
}

TEST(GraphRunnable, UnitsBecomeNodes) {
  auto square = compose::make_lambda([](int x) { return x * x; }, "square");
  StateGraph<MapState> g;
  ASSERT_TRUE(g.add_node("square",
                         graph::as_node<MapState>(
                             square, [](const MapState& s) { return s.get<int>("x").value_or(0); },
                             [](const MapState& s, int out) { return s.set("y", out); }))
                  .has_value());
  ASSERT_TRUE(g.set_entry_point("square").has_value());

  auto result = g.invoke(MapState().set("x", 7));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->state().get<int>("y"), 49);

  auto failing = compose::make_lambda([](int) -> int { throw std::runtime_error("unit failed"); }, "broken");
  StateGraph<MapState> h;
  ASSERT_TRUE(h.add_node("wrapped",
                         graph::as_node<MapState>(
                             failing, [](const MapState&) { return 0; },
                             [](const MapState& s, int) { return s; }))
                  .has_value());
  ASSERT_TRUE(h.set_entry_point("wrapped").has_value());
  auto failed = h.invoke(MapState());
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().origin, "broken");
}
