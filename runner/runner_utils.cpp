#include "runner_utils.h"

#include "mender/json_mini.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mender {

std::string slurp(const std::string& path) {
    std::stringstream ss;
    if (path == "-") {
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    ss << f.rdbuf();
    return ss.str();
}

void print_json(json_object* obj, bool pretty) {
    json_mini::Doc d(obj);
    std::cout << json_mini::to_string(d.root, pretty) << "\n";
}

Runtime make_runtime() {
    apply_profile_defaults(detect_profile());

    Runtime rt;
    rt.cfg = load_repair_config();
    rt.sandbox = std::make_shared<SandboxExecutor>(rt.cfg.sandbox);
    rt.backend = make_backend(rt.cfg.backend);
    rt.generator = std::make_shared<PatchGenerator>(rt.backend, rt.cfg.generator);
    return rt;
}

} // namespace mender
