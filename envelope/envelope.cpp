#include "envelope/envelope.hpp"

#include "glog/logging.h"

namespace envelope {

namespace {

const char* TypeName(const nlohmann::json& value) { return value.type_name(); }

// name is the dotted path of the field, reported in errors.
const nlohmann::json& Require(const nlohmann::json& object,
                              const std::string& field,
                              const std::string& name) {
  auto it = object.find(field);
  if (it == object.end()) {
    throw malformed_envelope(name, "Missing field '" + name + "'");
  }
  return *it;
}

[[noreturn]] void WrongType(const std::string& field, const char* expected,
                            const nlohmann::json& value) {
  throw malformed_envelope(field, "Field '" + field + "' must be " + expected +
                                      ", got " + TypeName(value));
}

}  // namespace

bool operator==(const PathsAnswer& a, const PathsAnswer& b) {
  return a.paths == b.paths;
}
bool operator==(const PatchAnswer& a, const PatchAnswer& b) {
  return a.patch == b.patch;
}
bool operator==(const RankingRow& a, const RankingRow& b) {
  return a.key == b.key && a.value == b.value;
}
bool operator==(const RankingAnswer& a, const RankingAnswer& b) {
  return a.results == b.results;
}
bool operator==(const Envelope& a, const Envelope& b) {
  return a.passed == b.passed && a.checks == b.checks &&
         a.answer == b.answer && a.notes == b.notes;
}

AnswerSchema AnswerSchema::Paths() {
  return AnswerSchema(PATHS, "", "", false);
}

AnswerSchema AnswerSchema::Patch() {
  return AnswerSchema(PATCH, "", "", false);
}

AnswerSchema AnswerSchema::Ranking(std::string key_field,
                                   std::string value_field, bool integral) {
  return AnswerSchema(RANKING, std::move(key_field), std::move(value_field),
                      integral);
}

Answer AnswerSchema::Parse(const nlohmann::json& answer) const {
  if (!answer.is_object()) WrongType("answer", "an object", answer);
  switch (kind_) {
    case PATHS: {
      const nlohmann::json& paths = Require(answer, "paths", "answer.paths");
      if (!paths.is_array()) WrongType("answer.paths", "an array", paths);
      PathsAnswer parsed;
      for (const nlohmann::json& path : paths) {
        if (!path.is_string()) {
          WrongType("answer.paths", "an array of strings", path);
        }
        parsed.paths.push_back(path.get<std::string>());
      }
      return parsed;
    }
    case PATCH: {
      const nlohmann::json& patch = Require(answer, "patch", "answer.patch");
      if (!patch.is_string()) WrongType("answer.patch", "a string", patch);
      return PatchAnswer{patch.get<std::string>()};
    }
    case RANKING: {
      const nlohmann::json& results =
          Require(answer, "results", "answer.results");
      if (!results.is_array()) {
        WrongType("answer.results", "an array", results);
      }
      RankingAnswer parsed;
      for (const nlohmann::json& row : results) {
        if (!row.is_object()) {
          WrongType("answer.results", "an array of objects", row);
        }
        const std::string key_name = "answer.results." + key_field_;
        const std::string value_name = "answer.results." + value_field_;
        const nlohmann::json& key = Require(row, key_field_, key_name);
        const nlohmann::json& value = Require(row, value_field_, value_name);
        if (!key.is_string()) WrongType(key_name, "a string", key);
        if (integral_ && !value.is_number_integer()) {
          WrongType(value_name, "an integer", value);
        }
        if (!value.is_number()) WrongType(value_name, "a number", value);
        parsed.results.push_back({key.get<std::string>(), value.get<double>()});
      }
      return parsed;
    }
  }
  throw std::logic_error("Unknown answer schema");
}

nlohmann::json AnswerSchema::Serialize(const Answer& answer) const {
  nlohmann::json json = nlohmann::json::object();
  switch (kind_) {
    case PATHS:
      json["paths"] = absl::get<PathsAnswer>(answer).paths;
      break;
    case PATCH:
      json["patch"] = absl::get<PatchAnswer>(answer).patch;
      break;
    case RANKING: {
      json["results"] = nlohmann::json::array();
      for (const RankingRow& row : absl::get<RankingAnswer>(answer).results) {
        nlohmann::json entry;
        entry[key_field_] = row.key;
        if (integral_) {
          entry[value_field_] = static_cast<int64_t>(row.value);
        } else {
          entry[value_field_] = row.value;
        }
        json["results"].push_back(entry);
      }
      break;
    }
  }
  return json;
}

std::string AnswerSchema::Describe() const {
  switch (kind_) {
    case PATHS:
      return "{\"paths\": [string]}";
    case PATCH:
      return "{\"patch\": string}";
    case RANKING:
      return "{\"results\": [{\"" + key_field_ + "\": string, \"" +
             value_field_ + "\": " + (integral_ ? "integer" : "number") +
             "}]}";
  }
  return "";
}

absl::optional<std::string> FindFirstObject(const std::string& text) {
  size_t start = 0;
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (depth == 0) {
      // Prose outside of objects: only an opening brace matters.
      if (c == '{') {
        start = i;
        depth = 1;
      }
      continue;
    }
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      depth++;
    } else if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return {};
}

Envelope Extract(const std::string& raw_text, const AnswerSchema& schema) {
  absl::optional<std::string> candidate = FindFirstObject(raw_text);
  if (!candidate) {
    throw malformed_envelope("", "No balanced JSON object in the output");
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(*candidate);
  } catch (const nlohmann::json::parse_error& exc) {
    throw malformed_envelope("", std::string("Invalid JSON: ") + exc.what());
  }
  VLOG(2) << "Envelope candidate: " << *candidate;

  Envelope envelope;
  const nlohmann::json& passed = Require(json, "passed", "passed");
  if (!passed.is_boolean()) WrongType("passed", "a boolean", passed);
  envelope.passed = passed.get<bool>();

  const nlohmann::json& checks = Require(json, "checks", "checks");
  if (!checks.is_object()) WrongType("checks", "an object", checks);
  for (auto it = checks.begin(); it != checks.end(); ++it) {
    if (!it.value().is_boolean()) {
      WrongType("checks." + it.key(), "a boolean", it.value());
    }
    envelope.checks[it.key()] = it.value().get<bool>();
  }

  const nlohmann::json& notes = Require(json, "notes", "notes");
  if (!notes.is_string()) WrongType("notes", "a string", notes);
  envelope.notes = notes.get<std::string>();

  envelope.answer = schema.Parse(Require(json, "answer", "answer"));
  return envelope;
}

nlohmann::json ToJson(const Envelope& envelope, const AnswerSchema& schema) {
  nlohmann::json json;
  json["passed"] = envelope.passed;
  json["checks"] = nlohmann::json::object();
  for (const auto& check : envelope.checks) {
    json["checks"][check.first] = check.second;
  }
  json["answer"] = schema.Serialize(envelope.answer);
  json["notes"] = envelope.notes;
  return json;
}

}  // namespace envelope
