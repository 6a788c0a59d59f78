#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gflags/gflags.h>

#include "callbacks/logging_handler.hpp"
#include "common/logging/flags.hpp"
#include "common/logging/log.hpp"
#include "compose/lambda.hpp"
#include "compose/sequence.hpp"
#include "stream/stream_utils.hpp"

DEFINE_string(pipeline_text, "streams compose into pipelines of execution units",
              "Sentence fed through the token pipeline");

namespace {

using relay::compose::Capabilities;
using relay::compose::RunOptions;
using relay::engine::Expected;
using relay::stream::StreamReader;

auto tokenize(const std::string& text) -> StreamReader<std::string> {
  std::vector<std::string> words;
  std::istringstream in(text);
  for (std::string word; in >> word;) {
    words.push_back(word);
  }
  return relay::stream::from_values(std::move(words));
}

auto upper(std::string word) -> std::string {
  std::transform(word.begin(), word.end(), word.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return word;
}

/// Collect-only unit: total characters across the stream.
auto make_counter() -> relay::compose::RunnablePtr<std::string, int> {
  Capabilities<std::string, int> caps;
  caps.collect = [](StreamReader<std::string> input, const RunOptions&) -> Expected<int> {
    int total = 0;
    while (true) {
      auto item = input.recv();
      if (!item) {
        return tl::unexpected(item.error());
      }
      if (item->is_eof()) {
        return total;
      }
      if (item->is_error()) {
        return tl::unexpected(item->error());
      }
      total += static_cast<int>(item->get().size());
    }
  };
  return *relay::compose::Lambda<std::string, int>::create(std::move(caps), "char_counter");
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Streams tokens through composed execution units");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  relay::log::init();

  RunOptions options;
  options.callbacks = std::make_shared<relay::callbacks::CallbackManager>(
      std::vector<relay::callbacks::HandlerPtr>{std::make_shared<relay::callbacks::LoggingHandler>()});

  auto tokenizer = relay::compose::make_streaming_lambda(tokenize, "tokenizer");
  auto shout = relay::compose::pipe(tokenizer, relay::compose::make_lambda(upper, "upper"));

  auto tokens = shout->stream(FLAGS_pipeline_text, options);
  if (!tokens) {
    std::cerr << "pipeline error: " << relay::engine::describe(tokens.error()) << "\n";
    relay::log::shutdown();
    return 1;
  }

  auto branches = relay::stream::copy(std::move(*tokens), 2);
  auto counter = make_counter();
  Expected<int> characters = 0;
  std::thread counting([&]() { characters = counter->collect(std::move(branches[1]), options); });

  auto words = branches[0].collect_all();
  counting.join();
  if (!words || !characters) {
    std::cerr << "pipeline error: "
              << relay::engine::describe(!words ? words.error() : characters.error()) << "\n";
    relay::log::shutdown();
    return 1;
  }

  std::string joined;
  for (const auto& word : *words) {
    joined += joined.empty() ? word : " " + word;
  }
  std::cout << std::format("tokens: {}\ncharacters: {}\n", joined, *characters);

  std::map<std::string, StreamReader<std::string>> sources;
  sources.emplace("original", tokenize(FLAGS_pipeline_text));
  sources.emplace("shouted", relay::stream::transform(tokenize(FLAGS_pipeline_text), upper));
  auto merged = relay::stream::named_merge(std::move(sources));
  while (true) {
    auto item = merged.recv();
    if (!item || item->is_eof()) {
      break;
    }
    if (relay::stream::is_source_exhausted(*item)) {
      std::cout << std::format("source '{}' drained\n", item->error().origin);
    } else if (item->is_error()) {
      std::cout << std::format("error: {}\n", relay::engine::describe(item->error()));
    } else {
      std::cout << std::format("merged: {}\n", item->get());
    }
  }

  relay::log::shutdown();
  return 0;
}
