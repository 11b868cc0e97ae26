#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Run selection
DECLARE_string(task);
DECLARE_int32(runs);
DECLARE_int32(jobs);
DECLARE_string(script);

// Sandboxes
DECLARE_string(sandbox_base);
DECLARE_bool(keep_sandboxes);
DECLARE_int32(max_processes);

// Per-call and per-run budgets
DECLARE_int64(tool_timeout_ms);
DECLARE_int64(run_timeout_ms);
DECLARE_int32(max_steps);
DECLARE_int64(max_read_bytes);
DECLARE_int64(max_output_bytes);
DECLARE_int32(max_sql_rows);
DECLARE_int64(expression_cpu_ms);
DECLARE_int64(expression_memory_mb);
DECLARE_string(python);

// Accounting and output
DECLARE_double(price_input_per_mtok);
DECLARE_double(price_output_per_mtok);
DECLARE_string(report_path);

#endif
