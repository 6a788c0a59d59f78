#pragma once

#include <string>

#include "callbacks/callback_handler.hpp"

namespace relay::callbacks {

struct LoggingOptions {
  bool verbose = false;
  bool log_inputs = false;
  bool log_outputs = false;
  std::string prefix = "[relay]";
};

/// Writes one spdlog line per hook through relay::log.
class LoggingHandler : public CallbackHandler {
 public:
  explicit LoggingHandler(LoggingOptions options = {});

  auto on_start(Context context, const RunInfo& info, const Payload& input) -> Context override;
  auto on_end(Context context, const RunInfo& info, const Payload& output) -> Context override;
  auto on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context override;
  auto on_start_with_stream_input(Context context, const RunInfo& info, const StreamPayload& input)
      -> Context override;
  auto on_end_with_stream_output(Context context, const RunInfo& info, const StreamPayload& output)
      -> Context override;

  auto options() const -> const LoggingOptions& { return options_; }

 private:
  LoggingOptions options_;
};

}  // namespace relay::callbacks
