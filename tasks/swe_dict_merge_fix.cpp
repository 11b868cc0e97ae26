#include <vector>

#include "grading/patch_grader.hpp"
#include "nlohmann/json.hpp"
#include "tasks/task.hpp"

namespace tasks {

namespace {

const char* kModule = R"(from typing import Any, Dict


def merge_dicts(base: Dict[str, Any], patch: Dict[str, Any]) -> Dict[str, Any]:
    """Merge patch into base, nested dictionaries included."""
    result = base
    for key, value in patch.items():
        result[key] = value
    return result
)";

const char* kTests = R"(import json
import sys
from copy import deepcopy
from pathlib import Path

import pytest

sys.path.insert(0, str(Path(__file__).resolve().parents[1]))

from merge import merge_dicts  # noqa: E402

CASES_PATH = Path(__file__).parent / "data" / "cases.json"


def load_cases():
    with CASES_PATH.open("r", encoding="utf-8") as fh:
        return json.load(fh)


@pytest.mark.parametrize("case", load_cases(), ids=lambda case: case["title"])
def test_merge_behavior(case):
    base = case["base"]
    base_copy = deepcopy(base)
    result = merge_dicts(base, case["patch"])
    assert result == case["expected"]
    assert base == base_copy, "base must not be mutated"


def test_type_guard():
    with pytest.raises(TypeError):
        merge_dicts({}, [])
)";

const std::vector<const char*> kVariants = {
    R"([
  {"title": "Deep merge with overrides",
   "base": {"app": {"host": "localhost", "port": 8000}},
   "patch": {"app": {"port": 9000, "debug": true}},
   "expected": {"app": {"host": "localhost", "port": 9000, "debug": true}}},
  {"title": "List replacement",
   "base": {"plugins": ["auth", "cache"]},
   "patch": {"plugins": ["auth", "metrics"]},
   "expected": {"plugins": ["auth", "metrics"]}}
])",
    R"([
  {"title": "Multiple branches",
   "base": {"app": {"cache": {"enabled": false}}, "version": 1},
   "patch": {"app": {"cache": {"enabled": true, "ttl": 30}}, "version": 2},
   "expected": {"app": {"cache": {"enabled": true, "ttl": 30}}, "version": 2}},
  {"title": "Insert nested dict",
   "base": {"services": {}},
   "patch": {"services": {"payment": {"url": "https://pay"}}},
   "expected": {"services": {"payment": {"url": "https://pay"}}}}
])",
    R"([
  {"title": "Preserve unrelated keys",
   "base": {"env": {"prod": {"region": "eu"}, "dev": {"region": "us"}}},
   "patch": {"env": {"prod": {"region": "us", "replicas": 3}}},
   "expected": {"env": {"prod": {"region": "us", "replicas": 3},
                        "dev": {"region": "us"}}}},
  {"title": "Replace primitive",
   "base": {"feature": {"enabled": false}},
   "patch": {"feature": {"enabled": true}},
   "expected": {"feature": {"enabled": true}}}
])",
};

const char* kPrompt =
    "project/merge.py defines merge_dicts(base, patch), which should return "
    "a new dictionary with patch merged into base: nested dictionaries are "
    "merged recursively, any other value of patch replaces the one of base, "
    "base is never modified, and non-dictionary arguments raise TypeError. "
    "The test suite in project/tests fails. Fix the module and answer with a "
    "unified diff of your change, with paths relative to project/.";

Fixture Build(workspace::SandboxInstance* sandbox, uint64_t seed) {
  Fixture fixture;
  fixture.variant = PickVariant(seed, kVariants.size());
  sandbox->WriteFile("project/merge.py", kModule);
  sandbox->WriteFile("project/tests/test_merge.py", kTests);
  sandbox->WriteFile(
      "project/tests/data/cases.json",
      nlohmann::json::parse(kVariants[fixture.variant - 1]).dump(2) + "\n");
  fixture.expected = envelope::PatchAnswer{};
  return fixture;
}

TaskSpec Make() {
  return TaskSpec{"swe_dict_merge_fix",
                  kPrompt,
                  {"file_read", "file_write", "run_pytests"},
                  envelope::AnswerSchema::Patch(),
                  Build,
                  std::make_shared<grading::PatchGrader>("project"),
                  6};
}

Catalog::Register r(Make);

}  // namespace

}  // namespace tasks
