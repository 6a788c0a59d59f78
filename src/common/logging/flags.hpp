#pragma once

#include <gflags/gflags.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

DECLARE_int32(graph_max_iterations);
DECLARE_int32(executor_threads);
DECLARE_int32(stream_merge_capacity);
