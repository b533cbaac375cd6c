#pragma once
#include "executor.h"
#include "inference.h"

#include <json-c/json.h>

#include <string>

namespace mender {

struct SystemStatus {
    bool sandbox_ready{false};
    std::string sandbox_detail;
    bool seccomp_available{false};
    bool inference_ready{false};
    std::string inference_detail;
    std::string inference_backend;
};

// Readiness of both collaborators. Runs no user code and sends no repair
// request.
SystemStatus check_status(ISandboxExecutor& sandbox, IInferenceBackend& backend);

json_object* system_status_to_json(const SystemStatus& s);

} // namespace mender
