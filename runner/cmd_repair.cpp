#include "cmd_repair.h"
#include "runner_utils.h"

#include "mender/hash.h"
#include "mender/orchestrator.h"
#include "mender/serialization.h"

#include <iostream>

using namespace mender;

int cmd_repair(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: mender_cli repair <script.py|-> [max_iterations]\n";
        std::cerr << "env: MENDER_AI_BACKEND=ollama|cmd|none, MENDER_LOG_DIR=<dir> (JSONL journal)\n";
        return 2;
    }
    Runtime rt = make_runtime();

    int max_iterations = rt.cfg.max_iterations;
    if (argc >= 4) {
        try {
            max_iterations = std::stoi(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "max_iterations must be an integer: " << argv[3] << "\n";
            return 2;
        }
    }

    const std::string code = slurp(argv[2]);
    std::cerr << "[mender] profile=" << profile_name(rt.cfg.profile) << " backend=" << rt.backend->name()
              << " code=" << hash::fingerprint(code) << " max_iterations=" << max_iterations << "\n";

    RepairOrchestrator orch(rt.sandbox, rt.generator, rt.cfg.orchestrator);
    RepairObserver obs;
    obs.on_execution = [](int i, const ExecutionResult& r) {
        std::cerr << "[mender] iteration " << i << ": "
                  << (r.success ? "success" : error_type_name(r.error_type.value_or(ErrorType::UnknownError)))
                  << " (" << r.duration_sec << "s)\n";
    };
    obs.on_patch = [](int i, const PatchRecord& p) {
        std::cerr << "[mender] iteration " << i << ": patch source=" << patch_source_name(p.source);
        if (p.fallback_reason != GenerationFailure::NONE) {
            std::cerr << " reason=" << generation_failure_name(p.fallback_reason);
        }
        std::cerr << " edits=" << p.line_edits.size() << "\n";
    };
    orch.set_observer(std::move(obs));

    RepairSession s = orch.repair(code, max_iterations);

    if (!rt.cfg.orchestrator.journal_dir.empty()) {
        std::cerr << "[mender] journal: " << journal_path_for(rt.cfg.orchestrator.journal_dir, s.session_id) << "\n";
    }
    std::cout << session_to_json_string(s) << "\n";
    return s.terminal_state == TerminalState::SUCCESS ? 0 : 1;
}
