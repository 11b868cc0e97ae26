#include "grading/patch_grader.hpp"
#include "nlohmann/json.hpp"
#include "tasks/task.hpp"

namespace tasks {

namespace {

const char* kModule = R"(import re

TRANSLIT = {
    "ä": "ae", "ö": "oe", "ü": "ue", "ß": "ss",
    "é": "e", "è": "e", "ê": "e", "ë": "e",
}


def slugify(value: str) -> str:
    """Return a hyphen separated identifier for the given value."""

    if not isinstance(value, str):
        raise TypeError("value must be a string")

    text = value.lower()
    for char, repl in TRANSLIT.items():
        text = text.replace(char, repl)
    text = re.sub(r"[^a-z0-9]+", "-", text)
    return text
)";

const char* kTests = R"(import json
import sys
from pathlib import Path

import pytest

sys.path.insert(0, str(Path(__file__).resolve().parents[1]))

from slugify import slugify  # noqa: E402

CASES_PATH = Path(__file__).parent / "data" / "cases.json"


def load_cases():
    with CASES_PATH.open("r", encoding="utf-8") as fh:
        return json.load(fh)


@pytest.mark.parametrize("case", load_cases(), ids=lambda case: case["title"])
def test_slugify_expected_output(case):
    assert slugify(case["input"]) == case["expected"]


@pytest.mark.parametrize("value", [None, 123, []])
def test_slugify_rejects_non_string(value):
    with pytest.raises(TypeError):
        slugify(value)
)";

const char* kCases = R"([
  {"title": "collapse double hyphen", "input": "Config -- Reload",
   "expected": "config-reload"},
  {"title": "trim border hyphen", "input": "--release--",
   "expected": "release"},
  {"title": "german umlaut", "input": "Überraschung",
   "expected": "ueberraschung"},
  {"title": "mixed special chars", "input": "Café---Bar",
   "expected": "cafe-bar"},
  {"title": "complex trim", "input": "---Test---Case---",
   "expected": "test-case"}
])";

const char* kPrompt =
    "project/slugify.py turns arbitrary text into lowercase identifiers made "
    "of ASCII letters and digits separated by single hyphens, with no hyphen "
    "at either end. Some tests in project/tests fail. Fix the module and "
    "answer with a unified diff of your change, with paths relative to "
    "project/.";

Fixture Build(workspace::SandboxInstance* sandbox, uint64_t /*seed*/) {
  Fixture fixture;
  fixture.variant = 1;
  sandbox->WriteFile("project/slugify.py", kModule);
  sandbox->WriteFile("project/tests/test_slugify.py", kTests);
  // dump keeps the UTF-8 of the inputs as is.
  sandbox->WriteFile("project/tests/data/cases.json",
                     nlohmann::json::parse(kCases).dump(2) + "\n");
  fixture.expected = envelope::PatchAnswer{};
  return fixture;
}

TaskSpec Make() {
  return TaskSpec{"swe_slugify_fix",
                  kPrompt,
                  {"file_read", "run_pytests"},
                  envelope::AnswerSchema::Patch(),
                  Build,
                  std::make_shared<grading::PatchGrader>("project"),
                  4};
}

Catalog::Register r(Make);

}  // namespace

}  // namespace tasks
