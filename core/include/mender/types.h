#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mender {

// Closed set of failure classes the sandbox can report.
enum class ErrorType {
    ZeroDivisionError,
    NameError,
    TypeError,
    ImportError,
    ModuleNotFoundError,
    IndentationError,
    SyntaxError,
    TimeoutError,
    MemoryError,
    UnknownError,
};

const char* error_type_name(ErrorType t);
// Exact-name lookup; nullopt for names outside the closed set.
std::optional<ErrorType> parse_error_type(const std::string& s);

// One immutable version of the program under repair.
struct CodeArtifact {
    std::string source;
    int iteration{0};
};

struct ResourceLimits {
    size_t memory_bytes{128ULL * 1024 * 1024};
    double cpu_share{1.0};          // (0,1], throttle only
    bool network_enabled{false};    // true only for diagnostic runs
    double timeout_seconds{5.0};
};

// Outcome of one sandbox run.
// success => error_type/stack_trace empty; !success => error_type set.
struct ExecutionResult {
    bool success{false};
    std::string stdout_text;
    std::optional<ErrorType> error_type;
    std::optional<std::string> stack_trace;
    double duration_sec{0.0};

    int exit_code{-1};
    bool timed_out{false};
    bool output_truncated{false};
};

enum class EditKind { REPLACE, INSERT, DELETE };

const char* edit_kind_name(EditKind k);
std::optional<EditKind> parse_edit_kind(const std::string& s);

// line_number is 1-based in the original text. INSERT entries name the
// original line they precede (n+1 appends).
struct LineEdit {
    EditKind kind{EditKind::REPLACE};
    int line_number{0};
    std::string old_text;
    std::string new_text;

    bool operator==(const LineEdit& o) const {
        return kind == o.kind && line_number == o.line_number &&
               old_text == o.old_text && new_text == o.new_text;
    }
};

enum class PatchSource { AI, FALLBACK };

const char* patch_source_name(PatchSource s);

// Why the AI path was not used for a patch.
enum class GenerationFailure {
    NONE,
    BACKEND_UNAVAILABLE,
    BACKEND_TIMEOUT,
    MALFORMED_RESPONSE,
    NO_CHANGE_PROPOSED,   // the model returned the program unchanged
};

const char* generation_failure_name(GenerationFailure f);

struct PatchRecord {
    std::string original_code;
    std::string fixed_code;
    std::string unified_diff;
    std::vector<LineEdit> line_edits;
    std::string explanation;
    std::string reasoning;
    PatchSource source{PatchSource::FALLBACK};
    double generation_time_sec{0.0};

    std::optional<ErrorType> target_error;
    GenerationFailure fallback_reason{GenerationFailure::NONE};

    bool is_no_change() const { return fixed_code == original_code; }
};

enum class TerminalState { SUCCESS, EXHAUSTED_ITERATIONS, NON_RECOVERABLE };

const char* terminal_state_name(TerminalState s);

struct RepairSession {
    std::string session_id;
    std::string original_code;
    std::string final_code;
    std::vector<ExecutionResult> executions;
    std::vector<PatchRecord> patches;
    int total_iterations{0};
    TerminalState terminal_state{TerminalState::NON_RECOVERABLE};
    std::optional<std::string> failure_reason;
};

} // namespace mender
