#pragma once
#include "types.h"

#include <optional>
#include <string>

namespace mender {

// Deterministic rule-based fix. fixed_code == the input code when no rule
// applies; explanation and reasoning are always filled in.
struct FallbackFix {
    std::string fixed_code;
    std::string explanation;
    std::string reasoning;
    bool changed{false};
};

// Dispatch on result.error_type (exhaustive over ErrorType).
FallbackFix apply_fallback(const std::string& code, const ExecutionResult& result);

// Sentinel printed by guarded divisions.
extern const char* const kZeroDivisionMessage;

// ---- traceback helpers ----

// Innermost line of script_name reported by a traceback ("File \"main.py\", line N").
std::optional<int> traceback_line(const std::string& trace, const std::string& script_name = "main.py");

// "name 'x' is not defined" -> "x".
std::optional<std::string> undefined_name(const std::string& trace);

// Module named by "No module named 'x'" or "cannot import name 'y' from 'x'".
struct MissingImport {
    std::string module;
    std::string name;  // set for "cannot import name"
};
std::optional<MissingImport> missing_import(const std::string& trace);

// ---- individual rules (exposed for tests) ----

// Wrap the statement at `line` (1-based) or, when it is not a guardable
// single-line statement, every statement containing '/' or '%'.
// *wrapped receives the number of statements guarded.
std::string guard_zero_division(const std::string& code, std::optional<int> line, int* wrapped);

// Bind `name = None` at module top, after shebang, encoding, docstring and
// __future__ imports.
std::string define_missing_name(const std::string& code, const std::string& name);

// Re-indent the whole program to 4 spaces per block level.
std::string reindent(const std::string& code);

// Comment out imports of the unavailable module. *removed receives the
// number of import statements disabled.
std::string disable_import(const std::string& code, const MissingImport& missing, int* removed);

} // namespace mender
