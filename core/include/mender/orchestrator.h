#pragma once
#include "types.h"
#include "executor.h"
#include "patch.h"
#include "session.h"

#include <functional>
#include <memory>
#include <string>

namespace mender {

struct OrchestratorConfig {
    ResourceLimits limits;
    // Added to the sandbox and generation budgets before the caller-side
    // deadline gives up on a call.
    int deadline_grace_ms{2000};
    // When set, each session is journaled to <journal_dir>/<session_id>.jsonl.
    std::string journal_dir;
};

// Progress callback, invoked after each append (iteration is 0-based).
struct RepairObserver {
    std::function<void(int iteration, const ExecutionResult&)> on_execution;
    std::function<void(int iteration, const PatchRecord&)> on_patch;
};

// Drives execute -> generate -> diff until the program runs, the budget is
// spent, or no further fix can be produced. repair() always returns a
// finished session; component failures become data in it.
class RepairOrchestrator {
public:
    RepairOrchestrator(std::shared_ptr<ISandboxExecutor> executor,
                       std::shared_ptr<PatchGenerator> generator,
                       OrchestratorConfig cfg);

    void set_observer(RepairObserver obs) { observer_ = std::move(obs); }

    RepairSession repair(const std::string& code, int max_iterations);

    const OrchestratorConfig& config() const { return cfg_; }

private:
    ExecutionResult run_sandbox(const CodeArtifact& code) const;
    PatchRecord run_generator(const CodeArtifact& code, const ExecutionResult& result) const;

    std::shared_ptr<ISandboxExecutor> executor_;
    std::shared_ptr<PatchGenerator> generator_;
    OrchestratorConfig cfg_;
    RepairObserver observer_;
};

std::string journal_path_for(const std::string& dir, const std::string& session_id);

} // namespace mender
