#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "relay.log", "Log file path; empty disables the file sink");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep");
DEFINE_bool(log_to_stderr, true, "Mirror log output to stderr");

DEFINE_int32(graph_max_iterations, 100, "Default iteration ceiling for state graph runs");
DEFINE_int32(executor_threads, 0, "Worker threads of the shared executor (0 = hardware concurrency)");
DEFINE_int32(stream_merge_capacity, 64, "Buffered items held by a merged stream reader");
