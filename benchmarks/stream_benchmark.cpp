#include <benchmark/benchmark.h>

#include <cstdint>
#include <thread>
#include <vector>

#include "compose/lambda.hpp"
#include "stream/channel.hpp"
#include "stream/stream_utils.hpp"

namespace {

constexpr std::int64_t kItems = 4096;

auto make_values(std::int64_t count) -> std::vector<std::int64_t> {
  std::vector<std::int64_t> values;
  values.reserve(static_cast<std::size_t>(count));
  for (std::int64_t i = 0; i < count; ++i) {
    values.push_back(i);
  }
  return values;
}

auto drain(relay::stream::StreamReader<std::int64_t>& reader, benchmark::State& state) -> std::int64_t {
  std::int64_t sum = 0;
  while (true) {
    auto item = reader.recv();
    if (!item) {
      state.SkipWithError(item.error().message.c_str());
      return sum;
    }
    if (item->is_eof()) {
      return sum;
    }
    if (item->is_error()) {
      state.SkipWithError(item->error().message.c_str());
      return sum;
    }
    sum += item->get();
  }
}

void BM_ChannelHandoff(benchmark::State& state) {
  const auto capacity = static_cast<std::size_t>(state.range(0));
  for (auto _ : state) {
    auto [reader, writer] = relay::stream::pipe<std::int64_t>(capacity);
    std::thread producer([writer = std::move(writer)]() mutable {
      for (std::int64_t i = 0; i < kItems; ++i) {
        if (!writer.write(i)) {
          break;
        }
      }
      writer.close();
    });
    benchmark::DoNotOptimize(drain(reader, state));
    producer.join();
  }
  state.SetItemsProcessed(state.iterations() * kItems);
}

BENCHMARK(BM_ChannelHandoff)->Arg(0)->Arg(1)->Arg(64)->UseRealTime();

void BM_CopyFanOut(benchmark::State& state) {
  const auto readers = static_cast<std::size_t>(state.range(0));
  const auto values = make_values(kItems);
  for (auto _ : state) {
    auto copies = relay::stream::copy(relay::stream::from_values(values), readers);
    std::vector<std::thread> consumers;
    consumers.reserve(copies.size());
    for (auto& copy : copies) {
      consumers.emplace_back([&copy, &state]() { benchmark::DoNotOptimize(drain(copy, state)); });
    }
    for (auto& consumer : consumers) {
      consumer.join();
    }
  }
  state.SetItemsProcessed(state.iterations() * kItems * state.range(0));
}

BENCHMARK(BM_CopyFanOut)->RangeMultiplier(2)->Range(1, 8)->UseRealTime();

void BM_Merge(benchmark::State& state) {
  const auto sources = state.range(0);
  const auto per_source = kItems / sources;
  const auto values = make_values(per_source);
  for (auto _ : state) {
    std::vector<relay::stream::StreamReader<std::int64_t>> readers;
    readers.reserve(static_cast<std::size_t>(sources));
    for (std::int64_t i = 0; i < sources; ++i) {
      readers.push_back(relay::stream::from_values(values));
    }
    auto merged = relay::stream::merge(std::move(readers));
    benchmark::DoNotOptimize(drain(merged, state));
  }
  state.SetItemsProcessed(state.iterations() * per_source * sources);
}

BENCHMARK(BM_Merge)->RangeMultiplier(2)->Range(1, 16)->UseRealTime();

void BM_DerivedTransform(benchmark::State& state) {
  auto doubler = relay::compose::make_lambda([](std::int64_t value) { return value * 2; }, "doubler");
  const auto values = make_values(kItems);
  for (auto _ : state) {
    auto output = doubler->transform(relay::stream::from_values(values));
    if (!output) {
      state.SkipWithError(output.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(drain(*output, state));
  }
  state.SetItemsProcessed(state.iterations() * kItems);
}

BENCHMARK(BM_DerivedTransform)->UseRealTime();

}  // namespace

BENCHMARK_MAIN();
