#include "mender/inference.h"
#include "mender/json_mini.h"

#include <algorithm>
#include <sstream>

namespace mender {

namespace {

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

std::string strip_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

InferenceReply make_reply(InferenceReply::Kind kind, std::string detail, std::string raw = "") {
    InferenceReply r;
    r.kind = kind;
    r.detail = std::move(detail);
    r.raw = std::move(raw);
    return r;
}

std::string first_line(const std::string& s) {
    std::string t = trim_ws(s);
    size_t nl = t.find('\n');
    return nl == std::string::npos ? t : t.substr(0, nl);
}

} // namespace

const char* reply_kind_name(InferenceReply::Kind k) {
    switch (k) {
        case InferenceReply::Kind::OK: return "ok";
        case InferenceReply::Kind::UNAVAILABLE: return "unavailable";
        case InferenceReply::Kind::TIMEOUT: return "timeout";
        case InferenceReply::Kind::MALFORMED: return "malformed";
    }
    return "unavailable";
}

std::vector<std::string> default_constraints(const ResourceLimits& limits) {
    std::vector<std::string> c;
    if (!limits.network_enabled) c.push_back("The environment has NO INTERNET access.");
    c.push_back("You CANNOT install new packages (pip is disabled).");
    c.push_back("You CANNOT use external libraries like 'numpy', 'pandas', 'scipy', etc.");
    c.push_back("You MUST fix code by rewriting it to use ONLY the Python Standard Library (math, random, json, etc.).");

    std::ostringstream lim;
    lim << "The program must finish within " << limits.timeout_seconds << " seconds and use at most "
        << (limits.memory_bytes / (1024 * 1024)) << " MiB of memory.";
    c.push_back(lim.str());
    return c;
}

std::string build_system_prompt(const std::vector<std::string>& constraints) {
    std::ostringstream os;
    os << "You are an expert Python debugging assistant running in a RESTRICTED SANDBOX ENVIRONMENT.\n\n";
    os << "CRITICAL RULES:\n";
    for (size_t i = 0; i < constraints.size(); ++i) {
        os << (i + 1) << ". " << constraints[i] << "\n";
    }
    os << "\nAnalyze the code and error, then respond with ONLY a valid JSON object:\n"
       << "{\n"
       << "  \"explanation\": \"Single sentence explaining the bug and the fix\",\n"
       << "  \"fixed_code\": \"Complete corrected Python code using ONLY standard libraries\",\n"
       << "  \"reasoning\": \"Step-by-step analysis\"\n"
       << "}";
    return os.str();
}

std::string build_user_prompt(const InferenceRequest& req) {
    std::ostringstream os;
    os << "CODE:\n" << req.code << "\n\n";
    os << "ERROR (" << error_type_name(req.error_type) << "):\n" << req.stack_trace << "\n\n";
    os << "Return ONLY the JSON object with explanation and fixed_code.";
    return os.str();
}

std::string build_prompt(const InferenceRequest& req) {
    return build_system_prompt(req.constraints) + "\n\n" + build_user_prompt(req);
}

std::string request_to_json(const InferenceRequest& req) {
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "code", json_mini::new_string(req.code));
    json_object_object_add(root.root, "error_type", json_object_new_string(error_type_name(req.error_type)));
    json_object_object_add(root.root, "stack_trace", json_mini::new_string(req.stack_trace));
    json_object* arr = json_object_new_array();
    for (const auto& c : req.constraints) json_object_array_add(arr, json_mini::new_string(c));
    json_object_object_add(root.root, "constraints", arr);
    json_object_object_add(root.root, "prompt", json_mini::new_string(build_prompt(req)));
    return json_mini::to_string(root.root);
}

// ---------------- OllamaBackend ----------------

OllamaBackend::OllamaBackend(BackendConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> OllamaBackend::curl_argv(const std::string& path, int timeout_ms, bool post) const {
    const int secs = std::max(1, (timeout_ms + 999) / 1000);
    std::vector<std::string> av = {
        cfg_.curl, "-sS", "--fail", "--max-time", std::to_string(secs),
        "--max-filesize", std::to_string(cfg_.max_response_bytes),
    };
    if (post) {
        av.insert(av.end(), {"-X", "POST", "-H", "Content-Type: application/json", "--data-binary", "@-"});
    }
    av.push_back(strip_trailing_slash(cfg_.url) + path);
    return av;
}

ProcLimits OllamaBackend::limits(int timeout_ms) const {
    ProcLimits lim;
    // curl enforces --max-time itself; the runner kill is a backstop
    lim.timeout_ms = timeout_ms + 2000;
    lim.stdout_max_bytes = cfg_.max_response_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_bytes = 0;
    lim.merge_stderr = false;
    return lim;
}

InferenceReply OllamaBackend::reply_from_curl(const ProcResult& pr, bool started) {
    using Kind = InferenceReply::Kind;
    if (!started) return make_reply(Kind::UNAVAILABLE, pr.error.empty() ? "curl not started" : pr.error);
    if (pr.timed_out) return make_reply(Kind::TIMEOUT, "inference request timed out");

    switch (pr.exit_code) {
        case 0: break;
        case 28: return make_reply(Kind::TIMEOUT, "curl: operation timed out");
        case 6: return make_reply(Kind::UNAVAILABLE, "curl: could not resolve host");
        case 7: return make_reply(Kind::UNAVAILABLE, "curl: connection refused");
        case 22: return make_reply(Kind::UNAVAILABLE, "HTTP error: " + first_line(pr.err_output));
        case 127: return make_reply(Kind::UNAVAILABLE, "curl not found");
        default:
            return make_reply(Kind::UNAVAILABLE, "curl exit_code=" + std::to_string(pr.exit_code) +
                                                     (pr.err_output.empty() ? "" : ": " + first_line(pr.err_output)));
    }

    if (pr.output_truncated) return make_reply(Kind::MALFORMED, "response exceeded size limit");

    json_mini::Doc d = json_mini::parse(trim_ws(pr.output));
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        return make_reply(Kind::MALFORMED, "response body is not a JSON object", pr.output);
    }
    if (auto err = json_mini::get_string(d.root, "error")) {
        return make_reply(Kind::UNAVAILABLE, "server error: " + *err);
    }
    auto text = json_mini::get_string(d.root, "response");
    if (!text) return make_reply(Kind::MALFORMED, "response field missing", pr.output);
    return make_reply(Kind::OK, "", *text);
}

bool OllamaBackend::tags_list_model(const std::string& tags_json, const std::string& model) {
    json_mini::Doc d = json_mini::parse(tags_json);
    json_object* models = json_mini::get_field(d.root, "models");
    if (!models || !json_object_is_type(models, json_type_array)) return false;
    const size_t n = json_object_array_length(models);
    for (size_t i = 0; i < n; i++) {
        json_object* m = json_object_array_get_idx(models, i);
        for (const char* key : {"name", "model"}) {
            auto nm = json_mini::get_string(m, key);
            if (!nm) continue;
            // "llama3" matches "llama3:latest"
            if (*nm == model || nm->compare(0, model.size() + 1, model + ":") == 0) return true;
        }
    }
    return false;
}

InferenceReply OllamaBackend::infer(const InferenceRequest& req) {
    json_mini::Doc body(json_object_new_object());
    json_object_object_add(body.root, "model", json_mini::new_string(cfg_.model));
    json_object_object_add(body.root, "prompt", json_mini::new_string(build_prompt(req)));
    json_object_object_add(body.root, "stream", json_object_new_boolean(0));
    json_object_object_add(body.root, "format", json_object_new_string("json"));

    ProcResult pr;
    bool started = proc_run_capture_sandboxed_stdin(curl_argv("/api/generate", cfg_.timeout_ms, true), "",
                                                    json_mini::to_string(body.root), limits(cfg_.timeout_ms), &pr);
    return reply_from_curl(pr, started);
}

bool OllamaBackend::probe(std::string* detail) {
    ProcResult pr;
    bool started = proc_run_capture_sandboxed(curl_argv("/api/tags", cfg_.probe_timeout_ms, false), "",
                                              limits(cfg_.probe_timeout_ms), &pr);
    if (!started || pr.timed_out || pr.exit_code != 0) {
        InferenceReply r = reply_from_curl(pr, started);
        if (detail) *detail = "ollama at " + cfg_.url + " unreachable: " + r.detail;
        return false;
    }
    if (!tags_list_model(pr.output, cfg_.model)) {
        if (detail) *detail = "ollama reachable but model '" + cfg_.model + "' is not installed";
        return false;
    }
    if (detail) *detail = "ollama " + cfg_.url + " model " + cfg_.model;
    return true;
}

// ---------------- CommandBackend ----------------

CommandBackend::CommandBackend(BackendConfig cfg) : cfg_(std::move(cfg)) {
    argv_ = split_argv_quoted(cfg_.command);
}

InferenceReply CommandBackend::infer(const InferenceRequest& req) {
    using Kind = InferenceReply::Kind;
    if (argv_.empty()) return make_reply(Kind::UNAVAILABLE, "inference command not configured");

    ProcLimits lim;
    lim.timeout_ms = cfg_.timeout_ms;
    lim.stdout_max_bytes = cfg_.max_response_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.merge_stderr = false;

    ProcResult pr;
    bool started = proc_run_capture_sandboxed_stdin(argv_, "", request_to_json(req), lim, &pr);
    if (!started) return make_reply(Kind::UNAVAILABLE, pr.error.empty() ? "command not started" : pr.error);
    if (pr.timed_out) return make_reply(Kind::TIMEOUT, "inference command timed out");
    if (pr.exit_code != 0) {
        return make_reply(Kind::UNAVAILABLE, "inference command exit_code=" + std::to_string(pr.exit_code) +
                                                 (pr.err_output.empty() ? "" : ": " + first_line(pr.err_output)));
    }
    if (pr.output_truncated) return make_reply(Kind::MALFORMED, "response exceeded size limit");
    return make_reply(Kind::OK, "", pr.output);
}

bool CommandBackend::probe(std::string* detail) {
    if (argv_.empty()) {
        if (detail) *detail = "MENDER_AI_CMD is empty";
        return false;
    }
    std::string exe = find_executable(argv_[0]);
    if (exe.empty()) {
        if (detail) *detail = "inference command not found: " + argv_[0];
        return false;
    }
    if (detail) *detail = "command " + exe;
    return true;
}

// ---------------- NullBackend ----------------

InferenceReply NullBackend::infer(const InferenceRequest&) {
    return make_reply(InferenceReply::Kind::UNAVAILABLE, "inference disabled");
}

bool NullBackend::probe(std::string* detail) {
    if (detail) *detail = "inference disabled";
    return false;
}

std::shared_ptr<IInferenceBackend> make_backend(const BackendConfig& cfg) {
    if (cfg.kind == "ollama") return std::make_shared<OllamaBackend>(cfg);
    if (cfg.kind == "cmd") return std::make_shared<CommandBackend>(cfg);
    return std::make_shared<NullBackend>();
}

} // namespace mender
