#ifndef MANAGER_AGENT_HPP
#define MANAGER_AGENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "manager/tool_session.hpp"
#include "nlohmann/json.hpp"

namespace manager {

struct AgentOutput {
  // Free-form final text, expected to contain the answer envelope.
  std::string raw_text;
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
};

// The system under evaluation. Run is called once per run, possibly from
// several threads at the same time, each with its own session.
class Agent {
 public:
  // Works on the task described by prompt, calling tools through session,
  // and returns its final output. budget_exceeded thrown by the session must
  // be let through.
  virtual AgentOutput Run(const std::string& prompt,
                          ToolSession* session) const = 0;

  virtual ~Agent() = default;
  Agent() = default;
  Agent(const Agent&) = delete;
  Agent(Agent&&) = delete;
  Agent& operator=(const Agent&) = delete;
  Agent& operator=(Agent&&) = delete;
};

// Replays a fixed transcript. A script is an object
//   {"steps": [{"tool": name, "arguments": {...}}, ...],
//    "final": text, "input_tokens": n, "output_tokens": n}
// or an array of them, run index i replaying script i modulo their number.
// A file may also hold {"tasks": {task name: script, ...}} to give each task
// of a multi-task evaluation its own transcript.
// Token counts default to an estimate of 4 bytes per token of what the agent
// read and wrote.
class ScriptedAgent : public Agent {
 public:
  // Throws std::invalid_argument if script is not well formed.
  explicit ScriptedAgent(const nlohmann::json& script);

  // The script of task: its entry under "tasks" if script has one, script
  // itself otherwise. Throws std::invalid_argument if task has no entry.
  static nlohmann::json ForTask(const nlohmann::json& script,
                                const std::string& task);

  // Throws std::invalid_argument if the file is not a valid script.
  static std::unique_ptr<ScriptedAgent> FromFile(const std::string& path,
                                                 const std::string& task = "");

  AgentOutput Run(const std::string& prompt,
                  ToolSession* session) const override;

 private:
  struct Step {
    std::string tool;
    nlohmann::json arguments;
  };
  struct Script {
    std::vector<Step> steps;
    std::string final_text;
    int64_t input_tokens = -1;
    int64_t output_tokens = -1;
  };
  std::vector<Script> scripts_;
};

}  // namespace manager

#endif
