#pragma once
#include "executor.h"
#include "inference.h"
#include "orchestrator.h"
#include "patch.h"

#include <string>

namespace mender {

enum class Profile { DEV, PROD };

// Detect profile from MENDER_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no seccomp, generous AI timeout)
// PROD: strict (seccomp enabled, tight timeouts)
// Must run before any worker thread exists.
void apply_profile_defaults(Profile p);

// Typed env lookups; defv when unset or unparsable.
int getenv_int(const char* name, int defv);
size_t getenv_size_t(const char* name, size_t defv);
double getenv_double(const char* name, double defv);
bool getenv_bool(const char* name, bool defv);
std::string getenv_str(const char* name, const std::string& defv);

// Everything the CLI needs, read from the environment once.
struct RepairConfig {
    Profile profile{Profile::DEV};
    ResourceLimits limits;
    SandboxConfig sandbox;
    BackendConfig backend;
    PatchGeneratorConfig generator;
    OrchestratorConfig orchestrator;
    int max_iterations{3};
};

RepairConfig load_repair_config();

} // namespace mender
