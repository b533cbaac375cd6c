#pragma once
#include "types.h"
#include "inference.h"

#include <memory>
#include <string>

namespace mender {

struct PatchGeneratorConfig {
    int generation_timeout_ms{30000};  // bound on the backend call
    ResourceLimits limits;             // quoted to the model as constraints
};

// Produces one PatchRecord per failed execution: the inference backend
// first, the deterministic fallback rules when the backend is unavailable,
// slow, malformed or proposes nothing new. Never throws for backend failures.
class PatchGenerator {
public:
    PatchGenerator(std::shared_ptr<IInferenceBackend> backend, PatchGeneratorConfig cfg);
    virtual ~PatchGenerator() = default;

    virtual PatchRecord generate(const CodeArtifact& code, const ExecutionResult& result) const;

    // Fallback-only record; why is stored in fallback_reason.
    static PatchRecord fallback_record(const CodeArtifact& code, const ExecutionResult& result,
                                       GenerationFailure why, double elapsed_sec);

    const PatchGeneratorConfig& config() const { return cfg_; }

private:
    std::shared_ptr<IInferenceBackend> backend_;
    PatchGeneratorConfig cfg_;
};

// Fill unified_diff and line_edits from original_code -> fixed_code.
void annotate_diff(PatchRecord* rec);

// Equal after newline normalization and trailing whitespace.
bool same_program(const std::string& a, const std::string& b);

} // namespace mender
