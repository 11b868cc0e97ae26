#ifndef ENVELOPE_ENVELOPE_HPP
#define ENVELOPE_ENVELOPE_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "absl/types/variant.h"
#include "nlohmann/json.hpp"

namespace envelope {

// answer: {"paths": [string]}
struct PathsAnswer {
  std::vector<std::string> paths;
};

// answer: {"patch": string}
struct PatchAnswer {
  std::string patch;
};

// One row of a ranking, e.g. {"ip": "10.0.0.1", "count": 3}.
struct RankingRow {
  std::string key;
  double value = 0;
};

// answer: {"results": [{<key field>: string, <value field>: number}]}
struct RankingAnswer {
  std::vector<RankingRow> results;
};

using Answer = absl::variant<PathsAnswer, PatchAnswer, RankingAnswer>;

// The final structured answer of the agent.
struct Envelope {
  bool passed = false;
  std::map<std::string, bool> checks;
  Answer answer;
  std::string notes;
};

bool operator==(const PathsAnswer& a, const PathsAnswer& b);
bool operator==(const PatchAnswer& a, const PatchAnswer& b);
bool operator==(const RankingRow& a, const RankingRow& b);
bool operator==(const RankingAnswer& a, const RankingAnswer& b);
bool operator==(const Envelope& a, const Envelope& b);

// Raised when the agent output does not contain a valid envelope. field is the
// offending top-level or answer field, or empty if no object could be found.
class malformed_envelope : public std::runtime_error {
 public:
  malformed_envelope(std::string field, const std::string& msg)
      : std::runtime_error(msg), field_(std::move(field)) {}
  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

// The shape the answer field of a task must have.
class AnswerSchema {
 public:
  enum Kind { PATHS, PATCH, RANKING };

  static AnswerSchema Paths();
  static AnswerSchema Patch();
  // Rows of {key_field: string, value_field: number}. If integral, values
  // must be JSON integers.
  static AnswerSchema Ranking(std::string key_field, std::string value_field,
                              bool integral);

  Kind kind() const { return kind_; }
  const std::string& key_field() const { return key_field_; }
  const std::string& value_field() const { return value_field_; }

  // Validates answer and converts it. Throws malformed_envelope.
  Answer Parse(const nlohmann::json& answer) const;

  // Inverse of Parse. answer must hold the alternative matching kind().
  nlohmann::json Serialize(const Answer& answer) const;

  // A human readable description, for prompts.
  std::string Describe() const;

 private:
  AnswerSchema(Kind kind, std::string key_field, std::string value_field,
               bool integral)
      : kind_(kind),
        key_field_(std::move(key_field)),
        value_field_(std::move(value_field)),
        integral_(integral) {}

  Kind kind_;
  std::string key_field_;
  std::string value_field_;
  bool integral_;
};

// Returns the first balanced top-level {...} block in text. Braces inside
// JSON string literals, including escaped quotes, do not count. Returns
// nothing if no block is ever closed.
absl::optional<std::string> FindFirstObject(const std::string& text);

// Extracts and validates the envelope from free-form agent output. Unknown
// top-level keys are ignored. Throws malformed_envelope.
Envelope Extract(const std::string& raw_text, const AnswerSchema& schema);

nlohmann::json ToJson(const Envelope& envelope, const AnswerSchema& schema);

}  // namespace envelope

#endif
