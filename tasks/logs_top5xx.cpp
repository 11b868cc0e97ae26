#include <vector>

#include "absl/strings/str_cat.h"
#include "grading/ranking_grader.hpp"
#include "tasks/ground_truth.hpp"
#include "tasks/task.hpp"

namespace tasks {

namespace {

struct Request {
  const char* ip;
  const char* status;
  const char* path;
  const char* agent;
};

const std::vector<std::vector<Request>> kVariants = {
    {
        {"10.0.0.1", "500", "/api", "Mozilla"},
        {"10.0.0.1", "500", "/api", "Mozilla"},
        {"10.0.0.2", "502", "/api", "Mozilla"},
        {"10.0.0.3", "504", "/login", "curl"},
        {"10.0.0.3", "504", "/login", "curl"},
        {"10.0.0.4", "200", "/health", "Mozilla"},
        {"10.0.0.5", "503", "/checkout", "status-bot"},
        {"10.0.0.6", "500", "/sync", "Mozilla"},
        {"10.0.0.7", "200", "/health", "Chrome"},
        {"10.0.0.8", "200", "/status", "Firefox"},
        {"10.0.0.1", "200", "/api", "Mozilla"},
        {"10.0.0.9", "502", "/sync", "Robot-Checker"},
        {"10.0.0.10", "500", "/data", "Safari"},
    },
    {
        {"172.16.0.1", "502", "/", "Mozilla"},
        {"172.16.0.2", "500", "/export", "wget"},
        {"172.16.0.2", "500", "/export", "wget"},
        {"172.16.0.3", "504", "/login", "curl"},
        {"172.16.0.4", "200", "/dashboard", "Mozilla"},
        {"172.16.0.5", "503", "/status", "uptime-bot"},
        {"172.16.0.6", "500", "/", "Edge"},
        {"172.16.0.7", "200", "/api", "Chrome"},
        {"172.16.0.1", "200", "/", "Mozilla"},
        {"172.16.0.8", "504", "/login", "BOT-Monitor"},
        {"172.16.0.2", "200", "/export", "wget"},
    },
    {
        {"192.168.1.10", "500", "/payments", "Mozilla"},
        {"192.168.1.10", "500", "/payments", "Mozilla"},
        {"192.168.1.11", "503", "/inventory", "curl"},
        {"192.168.1.12", "504", "/inventory", "Mozilla"},
        {"192.168.1.13", "500", "/inventory", "Mozilla"},
        {"192.168.1.14", "200", "/inventory", "Mozilla"},
        {"192.168.1.15", "502", "/checkout", "robotics-scanner"},
        {"192.168.1.16", "200", "/status", "Safari"},
        {"192.168.1.17", "503", "/api", "Chrome"},
        {"192.168.1.10", "200", "/payments", "Mozilla"},
        {"192.168.1.18", "500", "/data", "Firefox"},
    },
    {
        {"10.1.1.1", "503", "/", "Chrome"},
        {"10.1.1.2", "500", "/", "SearchBot"},
        {"10.1.1.3", "502", "/", "Firefox"},
        {"10.1.1.3", "502", "/", "Firefox"},
        {"10.1.1.4", "200", "/", "Safari"},
        {"10.1.1.1", "503", "/", "Chrome"},
        {"10.1.1.5", "504", "/api", "Edge"},
        {"10.1.1.6", "200", "/api", "Opera"},
        {"10.1.1.7", "500", "/api", "monitoring-bot"},
        {"10.1.1.1", "200", "/api", "Chrome"},
        {"10.1.1.8", "500", "/sync", "Mozilla"},
        {"10.1.1.9", "502", "/data", "bOt-Crawler"},
        {"10.1.1.10", "200", "/health", "wget"},
        {"10.1.1.5", "200", "/api", "Edge"},
    },
};

const char* kInstructions =
    "Access log format: combined. Count only 5xx responses and ignore any "
    "request whose user agent contains \"bot\" in any case.\n";

const char* kPrompt =
    "logs/access.log holds the access log of a web service. Report the top 5 "
    "client IPs by number of 5xx responses, ignoring requests whose user "
    "agent contains \"bot\" (case-insensitive). Order by descending count, "
    "then by IP, and give each row as {\"ip\", \"count\"}.";

Fixture Build(workspace::SandboxInstance* sandbox, uint64_t seed) {
  Fixture fixture;
  fixture.variant = PickVariant(seed, kVariants.size());
  std::string log;
  for (const Request& request : kVariants[fixture.variant - 1]) {
    absl::StrAppend(&log, request.ip,
                    " - - [07/Jun/2023:12:00:00 +0000] \"GET ", request.path,
                    " HTTP/1.1\" ", request.status, " 512 \"-\" \"",
                    request.agent, "\"\n");
  }
  sandbox->WriteFile("logs/access.log", log);
  sandbox->WriteFile("instructions.txt", kInstructions);
  fixture.expected = Top5xx(log);
  return fixture;
}

TaskSpec Make() {
  return TaskSpec{
      "logs_top5xx",
      kPrompt,
      {"file_read", "grep_search", "python_expression"},
      envelope::AnswerSchema::Ranking("ip", "count", /*integral=*/true),
      Build,
      std::make_shared<grading::RankingGrader>(0.01),
      5};
}

Catalog::Register r(Make);

}  // namespace

}  // namespace tasks
