#pragma once
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace mender {

struct DiffResult {
    std::string unified_diff;          // empty when the inputs are equal
    std::vector<LineEdit> line_edits;  // 1-based original line numbers
};

// "\r\n" and lone "\r" become "\n".
std::string normalize_newlines(const std::string& text);

// Line diff of two program versions. Both inputs are newline-normalized
// first. Headers are "--- original.py" / "+++ fixed.py", 3 lines of context.
DiffResult diff(const std::string& original, const std::string& fixed);

// Replay edits produced by diff() against the original text.
// nullopt when an edit does not match the original (wrong line or old_text).
std::optional<std::string> apply_line_edits(const std::string& original,
                                            const std::vector<LineEdit>& edits);

// Diff primitives, exposed for tests.
struct DiffOp {
    enum class Tag { EQUAL, REPLACE, DELETE, INSERT };
    Tag tag{Tag::EQUAL};
    size_t i1{0}, i2{0};   // range in a
    size_t j1{0}, j2{0};   // range in b
};

std::vector<DiffOp> diff_opcodes(const std::vector<std::string>& a,
                                 const std::vector<std::string>& b);

std::string unified_diff(const std::string& original, const std::string& fixed,
                         const std::string& from_name, const std::string& to_name,
                         size_t context);

} // namespace mender
