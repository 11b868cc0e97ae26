#include "manager/report.hpp"

#include <iostream>
#include <stdexcept>

#include "absl/strings/str_format.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"

namespace manager {

namespace {
std::string Dump(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string MessageToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot serialize the report: " +
                             status.ToString());
  }
  return json;
}

void Emit(const std::string& json, const std::string& path) {
  if (path.empty()) {
    std::cout << json << std::flush;
  } else {
    util::File::Write(path, json);
  }
}

// Protobuf refuses to serialize strings that are not valid UTF-8.
std::string ValidUtf8(const std::string& text) {
  std::string quoted = Dump(nlohmann::json(text));
  return nlohmann::json::parse(quoted).get<std::string>();
}
}  // namespace

proto::AggregateReport ToProto(const AggregateReport& report) {
  proto::AggregateReport message;
  message.set_task(report.task);
  message.set_pass_count(report.pass_count);
  message.set_run_count(report.run_count);
  message.set_pass_rate(report.pass_rate);
  message.set_avg_reward(report.avg_reward);
  message.set_input_tokens(report.input_tokens);
  message.set_output_tokens(report.output_tokens);
  message.set_cost_input(report.cost_input);
  message.set_cost_output(report.cost_output);
  message.set_cost_total(report.cost_total);
  message.set_interrupted(report.interrupted);

  for (const RunRecord& run : report.runs) {
    proto::RunRecord* record = message.add_runs();
    record->set_index(run.index);
    record->set_variant(run.variant);
    for (const tools::ToolCall& call : run.transcript) {
      proto::ToolCall* entry = record->add_transcript();
      entry->set_name(ValidUtf8(call.name));
      entry->set_arguments(Dump(call.arguments));
      if (call.ok()) {
        entry->set_result(Dump(call.result));
      } else {
        entry->set_error_kind(tools::ErrorKindName(call.error->kind));
        entry->set_error_message(ValidUtf8(call.error->message));
      }
      entry->set_elapsed_micros(call.elapsed_micros);
      entry->set_output_bytes(call.output_bytes);
    }
    record->set_raw_output(ValidUtf8(run.raw_output));
    if (!run.envelope.is_null()) record->set_envelope(Dump(run.envelope));
    record->set_parse_error(ValidUtf8(run.parse_error));
    proto::GradeResult* grade = record->mutable_grade();
    grade->set_passed(run.grade.passed);
    grade->set_reward(run.grade.reward);
    for (const auto& signal : run.grade.signals) {
      (*grade->mutable_signals())[signal.first] = signal.second;
    }
    grade->set_detail(ValidUtf8(run.grade.detail));
    record->set_error(ValidUtf8(run.error));
    record->set_input_tokens(run.input_tokens);
    record->set_output_tokens(run.output_tokens);
    record->set_cost(run.cost);
    record->set_wall_time_millis(run.wall_time_millis);
  }
  return message;
}

std::string ReportToJson(const AggregateReport& report) {
  return MessageToJson(ToProto(report));
}

void WriteReport(const AggregateReport& report, const std::string& path) {
  Emit(ReportToJson(report), path);
}

std::string Summary(const AggregateReport& report) {
  std::string summary;
  for (const RunRecord& run : report.runs) {
    std::string outcome = !run.error.empty()         ? run.error
                          : !run.parse_error.empty() ? run.parse_error
                                                     : run.grade.detail;
    absl::StrAppendFormat(&summary, "#%-3d v%d %-4s %.3f %3d calls  %s\n",
                          run.index, run.variant,
                          run.grade.passed ? "PASS" : "FAIL", run.grade.reward,
                          static_cast<int>(run.transcript.size()),
                          outcome.substr(0, outcome.find('\n')));
  }
  absl::StrAppendFormat(
      &summary,
      "%s: %d/%d passed (%.1f%%), average reward %.3f, %d+%d tokens, "
      "$%.6f%s",
      report.task, report.pass_count, report.run_count,
      100 * report.pass_rate, report.avg_reward, report.input_tokens,
      report.output_tokens, report.cost_total,
      report.interrupted ? " [interrupted]" : "");
  return summary;
}

proto::EvaluationReport ToProto(const std::vector<AggregateReport>& reports) {
  proto::EvaluationReport message;
  for (const AggregateReport& report : reports) {
    *message.add_tasks() = ToProto(report);
    message.set_pass_count(message.pass_count() + report.pass_count);
    message.set_run_count(message.run_count() + report.run_count);
    message.set_cost_total(message.cost_total() + report.cost_total);
    if (report.interrupted) message.set_interrupted(true);
  }
  if (message.run_count() > 0) {
    message.set_pass_rate(static_cast<double>(message.pass_count()) /
                          message.run_count());
  }
  return message;
}

std::string ReportsToJson(const std::vector<AggregateReport>& reports) {
  return MessageToJson(ToProto(reports));
}

void WriteReports(const std::vector<AggregateReport>& reports,
                  const std::string& path) {
  Emit(ReportsToJson(reports), path);
}

std::string Summary(const std::vector<AggregateReport>& reports) {
  std::string summary;
  int32_t pass_count = 0;
  int32_t run_count = 0;
  double cost_total = 0;
  bool interrupted = false;
  for (const AggregateReport& report : reports) {
    absl::StrAppendFormat(&summary, "%-24s %3d/%-3d %.3f  $%.6f%s\n",
                          report.task, report.pass_count, report.run_count,
                          report.avg_reward, report.cost_total,
                          report.interrupted ? " [interrupted]" : "");
    pass_count += report.pass_count;
    run_count += report.run_count;
    cost_total += report.cost_total;
    interrupted = interrupted || report.interrupted;
  }
  absl::StrAppendFormat(&summary, "%d tasks: %d/%d passed, $%.6f%s",
                        static_cast<int>(reports.size()), pass_count,
                        run_count, cost_total,
                        interrupted ? " [interrupted]" : "");
  return summary;
}

}  // namespace manager
