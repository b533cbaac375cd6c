#include "mender/config.h"
#include "mender/proc.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace mender {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Whole-string numeric parse; trailing junk counts as unparsable.
template <class T, class F>
T parse_or(const char* v, T defv, F conv) {
    try {
        size_t used = 0;
        std::string s(v);
        T out = conv(s, &used);
        if (used != s.size()) return defv;
        return out;
    } catch (const std::invalid_argument&) {
        return defv;
    } catch (const std::out_of_range&) {
        return defv;
    }
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("MENDER_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("MENDER_NETWORK",         "0",     NO_OVERWRITE);
            setenv("MENDER_TIMEOUT_SEC",     "5",     NO_OVERWRITE);
            setenv("MENDER_AI_TIMEOUT_MS",   "60000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("MENDER_NETWORK",         "0",     NO_OVERWRITE);
            setenv("MENDER_TIMEOUT_SEC",     "5",     NO_OVERWRITE);
            setenv("MENDER_AI_TIMEOUT_MS",   "30000", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* name, int defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    return parse_or<int>(v, defv, [](const std::string& s, size_t* used) { return std::stoi(s, used); });
}

size_t getenv_size_t(const char* name, size_t defv) {
    const char* v = std::getenv(name);
    if (!v || *v == '-') return defv;
    return parse_or<size_t>(v, defv, [](const std::string& s, size_t* used) { return (size_t)std::stoull(s, used); });
}

double getenv_double(const char* name, double defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    return parse_or<double>(v, defv, [](const std::string& s, size_t* used) { return std::stod(s, used); });
}

bool getenv_bool(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    const std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defv;
}

RepairConfig load_repair_config() {
    RepairConfig c;
    c.profile = detect_profile();

    ResourceLimits& l = c.limits;
    l.memory_bytes = getenv_size_t("MENDER_MEM_BYTES", l.memory_bytes);
    l.cpu_share = getenv_double("MENDER_CPU_SHARE", l.cpu_share);
    if (!(l.cpu_share > 0.0) || l.cpu_share > 1.0) l.cpu_share = 1.0;
    l.network_enabled = getenv_bool("MENDER_NETWORK", l.network_enabled);
    l.timeout_seconds = getenv_double("MENDER_TIMEOUT_SEC", l.timeout_seconds);
    if (!(l.timeout_seconds > 0.0)) l.timeout_seconds = 5.0;

    SandboxConfig& s = c.sandbox;
    s.interpreter = getenv_str("MENDER_INTERPRETER", s.interpreter);
    s.stdout_max_bytes = getenv_size_t("MENDER_STDOUT_MAX", s.stdout_max_bytes);
    if (const char* w = std::getenv("MENDER_PROC_WRAPPER")) s.wrapper = split_argv_quoted(w);
    s.work_root = getenv_str("MENDER_WORK_DIR", "");

    BackendConfig& b = c.backend;
    b.kind = lower(getenv_str("MENDER_AI_BACKEND", b.kind));
    b.url = getenv_str("MENDER_AI_URL", b.url);
    b.model = getenv_str("MENDER_AI_MODEL", b.model);
    b.command = getenv_str("MENDER_AI_CMD", b.command);
    b.timeout_ms = std::max(1, getenv_int("MENDER_AI_TIMEOUT_MS", b.timeout_ms));

    c.generator.generation_timeout_ms = b.timeout_ms;
    c.generator.limits = l;

    c.orchestrator.limits = l;
    c.orchestrator.journal_dir = getenv_str("MENDER_LOG_DIR", "");

    c.max_iterations = std::max(1, getenv_int("MENDER_MAX_ITERATIONS", c.max_iterations));
    return c;
}

} // namespace mender
