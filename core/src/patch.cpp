#include "mender/patch.h"
#include "mender/deadline.h"
#include "mender/diff.h"
#include "mender/fallback.h"
#include "mender/normalize.h"

#include <chrono>

namespace mender {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

std::string rstrip(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    return s;
}

GenerationFailure failure_for(InferenceReply::Kind k) {
    switch (k) {
        case InferenceReply::Kind::TIMEOUT: return GenerationFailure::BACKEND_TIMEOUT;
        case InferenceReply::Kind::MALFORMED: return GenerationFailure::MALFORMED_RESPONSE;
        case InferenceReply::Kind::UNAVAILABLE: return GenerationFailure::BACKEND_UNAVAILABLE;
        case InferenceReply::Kind::OK: return GenerationFailure::NONE;
    }
    return GenerationFailure::BACKEND_UNAVAILABLE;
}

} // namespace

bool same_program(const std::string& a, const std::string& b) {
    return rstrip(normalize_newlines(a)) == rstrip(normalize_newlines(b));
}

void annotate_diff(PatchRecord* rec) {
    DiffResult d = diff(rec->original_code, rec->fixed_code);
    rec->unified_diff = std::move(d.unified_diff);
    rec->line_edits = std::move(d.line_edits);
}

PatchGenerator::PatchGenerator(std::shared_ptr<IInferenceBackend> backend, PatchGeneratorConfig cfg)
    : backend_(std::move(backend)), cfg_(std::move(cfg)) {}

PatchRecord PatchGenerator::fallback_record(const CodeArtifact& code, const ExecutionResult& result,
                                            GenerationFailure why, double elapsed_sec) {
    FallbackFix fix = apply_fallback(code.source, result);
    PatchRecord rec;
    rec.original_code = code.source;
    rec.fixed_code = fix.changed ? fix.fixed_code : code.source;
    rec.explanation = fix.explanation;
    rec.reasoning = fix.reasoning;
    rec.source = PatchSource::FALLBACK;
    rec.target_error = result.error_type;
    rec.fallback_reason = why;
    rec.generation_time_sec = elapsed_sec;
    return rec;
}

PatchRecord PatchGenerator::generate(const CodeArtifact& code, const ExecutionResult& result) const {
    const auto t0 = std::chrono::steady_clock::now();
    if (result.success) {
        PatchRecord rec;
        rec.original_code = code.source;
        rec.fixed_code = code.source;
        rec.explanation = "The program ran without an error; no change is needed.";
        rec.reasoning = "No failure was reported by the sandbox.";
        return rec;
    }

    if (!backend_) return fallback_record(code, result, GenerationFailure::BACKEND_UNAVAILABLE, seconds_since(t0));

    InferenceRequest req;
    req.code = code.source;
    req.error_type = result.error_type.value_or(ErrorType::UnknownError);
    req.stack_trace = result.stack_trace.value_or("");
    req.constraints = default_constraints(cfg_.limits);

    auto backend = backend_;
    std::optional<InferenceReply> reply;
    try {
        reply = run_with_deadline<InferenceReply>([backend, req]() { return backend->infer(req); },
                                                  std::chrono::milliseconds(cfg_.generation_timeout_ms));
    } catch (const std::exception&) {
        return fallback_record(code, result, GenerationFailure::BACKEND_UNAVAILABLE, seconds_since(t0));
    }
    if (!reply) return fallback_record(code, result, GenerationFailure::BACKEND_TIMEOUT, seconds_since(t0));
    if (reply->kind != InferenceReply::Kind::OK) {
        return fallback_record(code, result, failure_for(reply->kind), seconds_since(t0));
    }

    ParsedReply parsed = parse_inference_output(reply->raw);
    if (parsed.kind != ParsedReply::Kind::OK) {
        return fallback_record(code, result, GenerationFailure::MALFORMED_RESPONSE, seconds_since(t0));
    }
    if (same_program(parsed.patch.fixed_code, code.source)) {
        return fallback_record(code, result, GenerationFailure::NO_CHANGE_PROPOSED, seconds_since(t0));
    }

    PatchRecord rec;
    rec.original_code = code.source;
    rec.fixed_code = parsed.patch.fixed_code;
    rec.explanation = parsed.patch.explanation;
    rec.reasoning = parsed.patch.reasoning;
    rec.line_edits = parsed.patch.line_edits;
    rec.source = PatchSource::AI;
    rec.target_error = result.error_type;
    rec.generation_time_sec = seconds_since(t0);
    return rec;
}

} // namespace mender
