#include "callbacks/logging_handler.hpp"

#include <utility>

#include "common/logging/log.hpp"

namespace relay::callbacks {

namespace {

auto render(const Payload& payload) -> std::string {
  auto json = payload.to_json();
  if (!json) {
    return payload.empty() ? "<none>" : std::string("<") + payload.type().name() + ">";
  }
  return json->dump();
}

}  // namespace

LoggingHandler::LoggingHandler(LoggingOptions options) : options_(std::move(options)) {}

auto LoggingHandler::on_start(Context context, const RunInfo& info, const Payload& input) -> Context {
  if (!options_.verbose) {
    log::info("{} START: {}", options_.prefix, info.name);
    return context;
  }
  log::info("{} START: {} ({}) component={} metadata={}", options_.prefix, info.name, info.type,
            to_string(info.component), info.metadata.dump());
  if (options_.log_inputs) {
    log::info("{}   input: {} metadata={}", options_.prefix, render(input), input.metadata.dump());
  }
  return context;
}

auto LoggingHandler::on_end(Context context, const RunInfo& info, const Payload& output) -> Context {
  if (!options_.verbose) {
    log::info("{} END: {}", options_.prefix, info.name);
    return context;
  }
  log::info("{} END: {}", options_.prefix, info.name);
  if (options_.log_outputs) {
    log::info("{}   output: {} metadata={}", options_.prefix, render(output), output.metadata.dump());
  }
  return context;
}

auto LoggingHandler::on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context {
  log::error("{} ERROR in {}: {}", options_.prefix, info.name, engine::describe(error));
  if (options_.verbose) {
    log::error("{}   component: {} ({})", options_.prefix, info.type, to_string(info.component));
  }
  return context;
}

auto LoggingHandler::on_start_with_stream_input(Context context, const RunInfo& info,
                                                const StreamPayload& /*input*/) -> Context {
  log::info("{} START (streaming input): {}", options_.prefix, info.name);
  return context;
}

auto LoggingHandler::on_end_with_stream_output(Context context, const RunInfo& info,
                                               const StreamPayload& /*output*/) -> Context {
  log::info("{} END (streaming output): {}", options_.prefix, info.name);
  return context;
}

}  // namespace relay::callbacks
