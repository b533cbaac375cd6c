#pragma once

#include "mender/config.h"
#include "mender/executor.h"
#include "mender/inference.h"
#include "mender/patch.h"

#include <json-c/json.h>

#include <memory>
#include <string>

namespace mender {

// Whole file, or stdin when path is "-". Throws std::runtime_error.
std::string slurp(const std::string& path);

// Print and release a json-c object on stdout.
void print_json(json_object* obj, bool pretty = true);

// Components wired from one RepairConfig.
struct Runtime {
    RepairConfig cfg;
    std::shared_ptr<SandboxExecutor> sandbox;
    std::shared_ptr<IInferenceBackend> backend;
    std::shared_ptr<PatchGenerator> generator;
};

// Applies the profile defaults, then reads the environment.
Runtime make_runtime();

} // namespace mender
