#include "mender/orchestrator.h"
#include "mender/deadline.h"
#include "mender/ids.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace mender {

namespace {

const char* error_name_or_unknown(const ExecutionResult& r) {
    return error_type_name(r.error_type.value_or(ErrorType::UnknownError));
}

} // namespace

std::string journal_path_for(const std::string& dir, const std::string& session_id) {
    return (std::filesystem::path(dir) / (session_id + ".jsonl")).string();
}

RepairOrchestrator::RepairOrchestrator(std::shared_ptr<ISandboxExecutor> executor,
                                       std::shared_ptr<PatchGenerator> generator,
                                       OrchestratorConfig cfg)
    : executor_(std::move(executor)), generator_(std::move(generator)), cfg_(std::move(cfg)) {}

ExecutionResult RepairOrchestrator::run_sandbox(const CodeArtifact& code) const {
    const auto t0 = std::chrono::steady_clock::now();
    const auto budget = std::chrono::milliseconds(
        (long long)std::ceil(cfg_.limits.timeout_seconds * 1000.0) + cfg_.deadline_grace_ms);

    auto executor = executor_;
    const ResourceLimits limits = cfg_.limits;
    std::optional<ExecutionResult> r;
    try {
        r = run_with_deadline<ExecutionResult>([executor, code, limits]() { return executor->execute(code, limits); },
                                               budget);
    } catch (const std::exception& e) {
        return make_substrate_failure(e.what());
    }
    if (!r) {
        const double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        return make_timeout_result(waited, "sandbox did not report within the deadline");
    }
    return *r;
}

PatchRecord RepairOrchestrator::run_generator(const CodeArtifact& code, const ExecutionResult& result) const {
    const auto t0 = std::chrono::steady_clock::now();
    const auto budget =
        std::chrono::milliseconds(generator_->config().generation_timeout_ms + cfg_.deadline_grace_ms);

    auto generator = generator_;
    std::optional<PatchRecord> rec;
    try {
        rec = run_with_deadline<PatchRecord>([generator, code, result]() { return generator->generate(code, result); },
                                             budget);
    } catch (const std::exception&) {
        const double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        return PatchGenerator::fallback_record(code, result, GenerationFailure::BACKEND_UNAVAILABLE, waited);
    }
    const double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    if (!rec) return PatchGenerator::fallback_record(code, result, GenerationFailure::BACKEND_TIMEOUT, waited);
    return *rec;
}

RepairSession RepairOrchestrator::repair(const std::string& code, int max_iterations) {
    if (max_iterations < 1) max_iterations = 1;

    SessionRecorder rec(new_session_id(), code);
    if (!cfg_.journal_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(cfg_.journal_dir, ec);
        rec.attach_journal(std::make_shared<SessionJournal>(rec.session_id(),
                                                            journal_path_for(cfg_.journal_dir, rec.session_id())));
    }

    CodeArtifact current{code, 0};
    for (int i = 0;; ++i) {
        current.iteration = i;
        ExecutionResult result = run_sandbox(current);
        rec.append_execution(result);
        if (observer_.on_execution) observer_.on_execution(i, result);

        if (result.success) return rec.finish(TerminalState::SUCCESS, std::nullopt);

        if (i + 1 >= max_iterations) {
            return rec.finish(TerminalState::EXHAUSTED_ITERATIONS,
                              std::string("ExhaustedIterations: ") + error_name_or_unknown(result) +
                                  " still raised after " + std::to_string(i + 1) + " execution(s)");
        }

        PatchRecord patch = run_generator(current, result);
        annotate_diff(&patch);
        rec.append_patch(patch);
        if (observer_.on_patch) observer_.on_patch(i, patch);

        if (patch.fixed_code == current.source) {
            return rec.finish(TerminalState::NON_RECOVERABLE,
                              std::string("NonRecoverable: no automatic fix for ") + error_name_or_unknown(result));
        }
        current.source = patch.fixed_code;
    }
}

} // namespace mender
