#include <stdexcept>

#include "glog/logging.h"
#include "manager/agent.hpp"
#include "util/file.hpp"

namespace manager {

namespace {
const int64_t kBytesPerToken = 4;

int64_t EstimateTokens(size_t bytes) {
  return static_cast<int64_t>((bytes + kBytesPerToken - 1) / kBytesPerToken);
}
}  // namespace

ScriptedAgent::ScriptedAgent(const nlohmann::json& script) {
  std::vector<nlohmann::json> items;
  if (script.is_array()) {
    items.assign(script.begin(), script.end());
  } else {
    items.push_back(script);
  }
  if (items.empty()) throw std::invalid_argument("Empty agent script");

  for (const nlohmann::json& item : items) {
    if (!item.is_object() || !item.value("final", nlohmann::json()).is_string()) {
      throw std::invalid_argument(
          "Every agent script needs a string \"final\" field");
    }
    Script parsed;
    parsed.final_text = item["final"].get<std::string>();
    nlohmann::json steps = item.value("steps", nlohmann::json::array());
    if (!steps.is_array()) {
      throw std::invalid_argument("\"steps\" must be an array");
    }
    for (const nlohmann::json& step : steps) {
      if (!step.is_object() || !step.value("tool", nlohmann::json()).is_string()) {
        throw std::invalid_argument("Every step needs a string \"tool\" field");
      }
      parsed.steps.push_back(
          {step["tool"].get<std::string>(),
           step.value("arguments", nlohmann::json::object())});
    }
    for (const char* field : {"input_tokens", "output_tokens"}) {
      if (!item.contains(field)) continue;
      if (!item[field].is_number_integer() || item[field].get<int64_t>() < 0) {
        throw std::invalid_argument(std::string(field) +
                                    " must be a non negative integer");
      }
    }
    parsed.input_tokens = item.value("input_tokens", int64_t{-1});
    parsed.output_tokens = item.value("output_tokens", int64_t{-1});
    scripts_.push_back(std::move(parsed));
  }
}

nlohmann::json ScriptedAgent::ForTask(const nlohmann::json& script,
                                      const std::string& task) {
  if (!script.is_object() || !script.contains("tasks")) return script;
  const nlohmann::json& per_task = script["tasks"];
  if (!per_task.is_object()) {
    throw std::invalid_argument("\"tasks\" must map task names to scripts");
  }
  auto it = per_task.find(task);
  if (it == per_task.end()) {
    throw std::invalid_argument("No agent script for task " + task);
  }
  return *it;
}

std::unique_ptr<ScriptedAgent> ScriptedAgent::FromFile(const std::string& path,
                                                       const std::string& task) {
  std::string content;
  try {
    content = util::File::Read(path);
  } catch (const std::system_error& e) {
    throw std::invalid_argument("Cannot read agent script " + path + ": " +
                                e.what());
  }
  nlohmann::json script = nlohmann::json::parse(content, nullptr, false);
  if (script.is_discarded()) {
    throw std::invalid_argument("Agent script " + path + " is not valid JSON");
  }
  return std::unique_ptr<ScriptedAgent>(
      new ScriptedAgent(ForTask(script, task)));
}

AgentOutput ScriptedAgent::Run(const std::string& prompt,
                               ToolSession* session) const {
  const Script& script = scripts_[session->Index() % scripts_.size()];
  size_t read_bytes = prompt.size();
  size_t written_bytes = script.final_text.size();
  for (const Step& step : script.steps) {
    VLOG(2) << "Run " << session->Index() << " replays " << step.tool;
    written_bytes += step.arguments.dump().size();
    read_bytes += session->Call(step.tool, step.arguments)
                      .dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace)
                      .size();
  }
  AgentOutput output;
  output.raw_text = script.final_text;
  output.input_tokens = script.input_tokens >= 0 ? script.input_tokens
                                                 : EstimateTokens(read_bytes);
  output.output_tokens = script.output_tokens >= 0
                             ? script.output_tokens
                             : EstimateTokens(written_bytes);
  return output;
}

}  // namespace manager
