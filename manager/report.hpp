#ifndef MANAGER_REPORT_HPP
#define MANAGER_REPORT_HPP

#include <string>
#include <vector>

#include "manager/run_record.hpp"
#include "proto/report.pb.h"

namespace manager {

proto::AggregateReport ToProto(const AggregateReport& report);

// The report as indented JSON, proto field names kept.
std::string ReportToJson(const AggregateReport& report);

// Writes the JSON report to path, or to stdout if path is empty.
void WriteReport(const AggregateReport& report, const std::string& path);

// One line per run plus the totals, for the log.
std::string Summary(const AggregateReport& report);

// Reports of several tasks, with totals across them.
proto::EvaluationReport ToProto(const std::vector<AggregateReport>& reports);
std::string ReportsToJson(const std::vector<AggregateReport>& reports);
void WriteReports(const std::vector<AggregateReport>& reports,
                  const std::string& path);

// One line per task plus the overall totals.
std::string Summary(const std::vector<AggregateReport>& reports);

}  // namespace manager

#endif
