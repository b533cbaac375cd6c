#include "mender/types.h"

namespace mender {

const char* error_type_name(ErrorType t) {
    switch (t) {
        case ErrorType::ZeroDivisionError: return "ZeroDivisionError";
        case ErrorType::NameError: return "NameError";
        case ErrorType::TypeError: return "TypeError";
        case ErrorType::ImportError: return "ImportError";
        case ErrorType::ModuleNotFoundError: return "ModuleNotFoundError";
        case ErrorType::IndentationError: return "IndentationError";
        case ErrorType::SyntaxError: return "SyntaxError";
        case ErrorType::TimeoutError: return "TimeoutError";
        case ErrorType::MemoryError: return "MemoryError";
        case ErrorType::UnknownError: return "UnknownError";
    }
    return "UnknownError";
}

std::optional<ErrorType> parse_error_type(const std::string& s) {
    static const ErrorType all[] = {
        ErrorType::ZeroDivisionError, ErrorType::NameError, ErrorType::TypeError,
        ErrorType::ImportError, ErrorType::ModuleNotFoundError, ErrorType::IndentationError,
        ErrorType::SyntaxError, ErrorType::TimeoutError, ErrorType::MemoryError,
        ErrorType::UnknownError,
    };
    for (ErrorType t : all) {
        if (s == error_type_name(t)) return t;
    }
    return std::nullopt;
}

const char* edit_kind_name(EditKind k) {
    switch (k) {
        case EditKind::REPLACE: return "replace";
        case EditKind::INSERT: return "insert";
        case EditKind::DELETE: return "delete";
    }
    return "replace";
}

std::optional<EditKind> parse_edit_kind(const std::string& s) {
    if (s == "replace") return EditKind::REPLACE;
    if (s == "insert") return EditKind::INSERT;
    if (s == "delete") return EditKind::DELETE;
    return std::nullopt;
}

const char* patch_source_name(PatchSource s) {
    switch (s) {
        case PatchSource::AI: return "ai";
        case PatchSource::FALLBACK: return "fallback";
    }
    return "fallback";
}

const char* generation_failure_name(GenerationFailure f) {
    switch (f) {
        case GenerationFailure::NONE: return "";
        case GenerationFailure::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case GenerationFailure::BACKEND_TIMEOUT: return "BackendTimeout";
        case GenerationFailure::MALFORMED_RESPONSE: return "MalformedResponse";
        case GenerationFailure::NO_CHANGE_PROPOSED: return "NoChangeProposed";
    }
    return "";
}

const char* terminal_state_name(TerminalState s) {
    switch (s) {
        case TerminalState::SUCCESS: return "Success";
        case TerminalState::EXHAUSTED_ITERATIONS: return "ExhaustedIterations";
        case TerminalState::NON_RECOVERABLE: return "NonRecoverable";
    }
    return "NonRecoverable";
}

} // namespace mender
