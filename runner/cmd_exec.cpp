#include "cmd_exec.h"
#include "runner_utils.h"

#include "mender/serialization.h"

#include <iostream>

using namespace mender;

// One sandboxed run, no repair.
int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: mender_cli exec <script.py|->\n";
        return 2;
    }
    Runtime rt = make_runtime();
    const std::string code = slurp(argv[2]);

    ExecutionResult r = rt.sandbox->execute(CodeArtifact{code, 0}, rt.cfg.limits);
    json_object* out = json_object_new_object();
    json_object_object_add(out, "limits", resource_limits_to_json(rt.cfg.limits));
    json_object_object_add(out, "result", execution_result_to_json(r));
    print_json(out);
    return r.success ? 0 : 1;
}
