#include "glog/logging.h"
#include "tools/tool.hpp"
#include "util/text.hpp"

namespace tools {

namespace {

// Evaluates the expression read from stdin and prints {"ok", "value"} or
// {"ok", "error"} as JSON. Only allow-listed builtins and math are in scope.
// Before evaluation the tree is rejected if it names anything starting with
// an underscore, reads an attribute outside of a fixed allow-list or uses an
// assignment expression. Everything lives in main so that the module
// globals hold no imported module.
const char* kDriver = R"PY(
def main():
    import ast, json, math, sys

    allowed_builtins = {
        "abs": abs, "all": all, "any": any, "bool": bool, "dict": dict,
        "divmod": divmod, "enumerate": enumerate, "filter": filter,
        "float": float, "int": int, "len": len, "list": list, "map": map,
        "max": max, "min": min, "pow": pow, "range": range,
        "reversed": reversed, "round": round, "set": set, "sorted": sorted,
        "str": str, "sum": sum, "tuple": tuple, "zip": zip,
        "True": True, "False": False, "None": None,
    }
    allowed_attributes = {
        # str
        "capitalize", "casefold", "center", "count", "endswith", "find",
        "index", "isalnum", "isalpha", "isdigit", "islower", "isnumeric",
        "isspace", "isupper", "join", "ljust", "lower", "lstrip",
        "partition", "removeprefix", "removesuffix", "replace", "rfind",
        "rindex", "rjust", "rpartition", "rsplit", "rstrip", "split",
        "splitlines", "startswith", "strip", "swapcase", "title", "upper",
        "zfill",
        # list, dict and set
        "append", "copy", "extend", "get", "items", "keys", "values",
        "difference", "intersection", "union", "issubset", "issuperset",
        "symmetric_difference",
        # numbers
        "real", "imag", "conjugate", "is_integer", "bit_length",
        "numerator", "denominator",
    }
    allowed_attributes.update(
        name for name in dir(math) if not name.startswith("_"))
    named_expr = getattr(ast, "NamedExpr", ())

    def check(tree):
        for node in ast.walk(tree):
            if isinstance(node, ast.Name) and node.id.startswith("_"):
                raise NameError("name '%s' is not allowed" % node.id)
            if isinstance(node, ast.Attribute) and (
                    node.attr not in allowed_attributes):
                raise AttributeError(
                    "attribute '%s' is not allowed" % node.attr)
            if named_expr and isinstance(node, named_expr):
                raise SyntaxError("assignment expressions are not allowed")

    def plain(value):
        if value is None or isinstance(value, (bool, int, str)):
            return value
        if isinstance(value, float):
            if value != value or value in (float("inf"), float("-inf")):
                raise ValueError("result is not a finite number")
            return value
        if isinstance(value, dict):
            return {str(k): plain(v) for k, v in value.items()}
        if isinstance(value, (set, frozenset)):
            return [plain(v) for v in sorted(value, key=repr)]
        if isinstance(value, (list, tuple, range, map, filter, zip, reversed,
                              enumerate)):
            return [plain(v) for v in value]
        raise TypeError(
            "cannot return a value of type " + type(value).__name__)

    try:
        source = sys.stdin.read()
        tree = ast.parse(source.strip(), mode="eval")
        check(tree)
        code = compile(tree, "<expression>", "eval")
        value = eval(code, {"__builtins__": allowed_builtins, "math": math},
                     {})
        out = {"ok": True, "value": plain(value)}
    except Exception as exc:
        out = {"ok": False, "error": "%s: %s" % (type(exc).__name__, exc)}
    sys.stdout.write(json.dumps(out))


main()
)PY";

class PythonExpression : public Tool {
 public:
  std::string Name() const override { return "python_expression"; }
  std::string Description() const override {
    return "python_expression(expr): value of one Python expression, with "
           "basic builtins and math only";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string expression = StringArg(args, "expr");
    if (expression.empty()) {
      throw tool_error(ErrorKind::EVALUATION_ERROR, "Empty expression");
    }

    executor::Request request;
    request.executable = context.limits.python;
    request.args = {"-I", "-S", "-c", kDriver};
    request.cwd = context.resolver->Root();
    request.stdin_data = expression;
    request.cpu_limit_millis = context.limits.expression_cpu_millis;
    request.memory_limit_kb = context.limits.expression_memory_mb * 1024;
    request.max_file_size_kb = 1024;
    executor::Response response = context.RunBounded(request);

    if (response.status == executor::Status::MEMORY_LIMIT) {
      throw tool_error(ErrorKind::EVALUATION_ERROR,
                       "MemoryError: memory limit exceeded");
    }
    nlohmann::json out;
    try {
      out = nlohmann::json::parse(response.stdout_data);
    } catch (const nlohmann::json::parse_error&) {
      throw tool_error(
          ErrorKind::EVALUATION_ERROR,
          "Evaluation failed: " + response.error_message + "\n" +
              util::TrimMiddle(response.stderr_data,
                               context.limits.max_output_bytes));
    }
    if (!out.is_object() || !out.value("ok", false)) {
      std::string error = out.is_object() ? out.value("error", "") : "";
      throw tool_error(ErrorKind::EVALUATION_ERROR, error);
    }
    nlohmann::json result;
    result["value"] = out["value"];
    if (result.dump().size() >
        static_cast<size_t>(context.limits.max_read_bytes)) {
      throw tool_error(ErrorKind::EVALUATION_ERROR, "Result is too large");
    }
    VLOG(2) << "python_expression " << expression << " = " << result.dump();
    return result;
  }
};

Tool::Register<PythonExpression> r;

}  // namespace

}  // namespace tools
