#pragma once

#include "callbacks/run_info.hpp"
#include "engine/error.hpp"

namespace relay::callbacks {

/// Observer of unit and graph execution. Every hook returns the context the next
/// handler receives; the defaults pass it through unchanged.
class CallbackHandler {
 public:
  virtual ~CallbackHandler() = default;

  virtual auto on_start(Context context, const RunInfo& /*info*/, const Payload& /*input*/) -> Context {
    return context;
  }

  virtual auto on_end(Context context, const RunInfo& /*info*/, const Payload& /*output*/) -> Context {
    return context;
  }

  virtual auto on_error(Context context, const RunInfo& /*info*/, const engine::Error& /*error*/)
      -> Context {
    return context;
  }

  virtual auto on_start_with_stream_input(Context context, const RunInfo& /*info*/,
                                          const StreamPayload& /*input*/) -> Context {
    return context;
  }

  virtual auto on_end_with_stream_output(Context context, const RunInfo& /*info*/,
                                         const StreamPayload& /*output*/) -> Context {
    return context;
  }
};

}  // namespace relay::callbacks
