#include "util/flags.hpp"

DEFINE_string(task, "",
              "Name of the task to evaluate. If unset or \"all\", evaluate "
              "every task");
DEFINE_int32(runs, 1, "Number of independent runs of the task");
DEFINE_int32(
    jobs, 0,
    "Number of runs to execute concurrently. If unset, autodetect");
DEFINE_string(script, "",
              "JSON file with the scripted agent transcript(s) to replay");

DEFINE_string(sandbox_base, "/tmp/agent_eval",
              "Where the per-run sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the sandboxes when a run ends");
DEFINE_int32(max_processes, 4,
             "Maximum number of tool subprocesses alive at the same time");

DEFINE_int64(tool_timeout_ms, 10000, "Wall clock budget of a single tool call");
DEFINE_int64(run_timeout_ms, 120000, "Wall clock budget of a whole run");
DEFINE_int32(max_steps, 0,
             "Maximum number of tool calls per run. If unset, use the task's");
DEFINE_int64(max_read_bytes, 64 * 1024, "Largest file file_read will return");
DEFINE_int64(max_output_bytes, 2000,
             "Textual tool output above this size keeps only head and tail");
DEFINE_int32(max_sql_rows, 200, "Maximum number of rows sql_query returns");
DEFINE_int64(expression_cpu_ms, 2000,
             "CPU time limit of a python_expression evaluation");
DEFINE_int64(expression_memory_mb, 256,
             "Address space limit of a python_expression evaluation");
DEFINE_string(python, "python3", "Python interpreter used by the tools");

DEFINE_double(price_input_per_mtok, 0.8, "USD per million input tokens");
DEFINE_double(price_output_per_mtok, 4.0, "USD per million output tokens");
DEFINE_string(report_path, "",
              "Where to write the JSON report. If unset, print it to stdout");
