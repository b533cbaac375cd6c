#pragma once
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace mender {

// Candidate fix extracted from an inference reply.
struct ParsedPatch {
    std::string fixed_code;
    std::string explanation;
    std::string reasoning;
    std::vector<LineEdit> line_edits;  // advisory only; well-formed entries kept
};

struct ParsedReply {
    enum class Kind { OK, MALFORMED };
    Kind kind{Kind::MALFORMED};
    ParsedPatch patch;
    std::string detail;  // reason for MALFORMED
};

// Validate raw model output: find the JSON object carrying "fixed_code",
// normalize the code and fill defaults for the optional fields.
ParsedReply parse_inference_output(const std::string& raw);

// Clean up model-produced code (double escaping, code fences, surrounding
// whitespace). nullopt when the result is empty or not code; *why explains.
// Accepted code always ends with exactly one '\n'.
std::optional<std::string> normalize_code(const std::string& raw, std::string* why = nullptr);

// True when at least one line starts like Python code (keyword, builtin,
// call, assignment, decorator, comment).
bool looks_like_code(const std::string& text);

// Undo one level of string escaping (\n \r \t \" \' \\).
std::string unescape_sequences(const std::string& s);

} // namespace mender
