#pragma once
#include "types.h"
#include "proc.h"

#include <memory>
#include <string>
#include <vector>

namespace mender {

struct InferenceRequest {
    std::string code;
    ErrorType error_type{ErrorType::UnknownError};
    std::string stack_trace;
    std::vector<std::string> constraints;
};

struct InferenceReply {
    enum class Kind { OK, UNAVAILABLE, TIMEOUT, MALFORMED };
    Kind kind{Kind::UNAVAILABLE};
    std::string raw;     // model output text (OK / MALFORMED)
    std::string detail;  // transport diagnostics
};

const char* reply_kind_name(InferenceReply::Kind k);

// Environment rules every proposed fix must respect.
std::vector<std::string> default_constraints(const ResourceLimits& limits);

std::string build_system_prompt(const std::vector<std::string>& constraints);
std::string build_user_prompt(const InferenceRequest& req);
// system + blank line + user
std::string build_prompt(const InferenceRequest& req);

// Request as a JSON object (sent to command backends on stdin).
std::string request_to_json(const InferenceRequest& req);

class IInferenceBackend {
public:
    virtual ~IInferenceBackend() = default;
    virtual InferenceReply infer(const InferenceRequest& req) = 0;
    // Reachability check; never sends a repair request.
    virtual bool probe(std::string* detail) = 0;
    virtual const char* name() const = 0;
};

struct BackendConfig {
    std::string kind{"ollama"};                 // ollama | cmd | none
    std::string url{"http://localhost:11434"};
    std::string model{"llama3"};
    std::string command;                        // cmd backend argv (quoted string)
    int timeout_ms{30000};
    int probe_timeout_ms{2000};
    size_t max_response_bytes{4 * 1024 * 1024};
    std::string curl{"curl"};
};

// Ollama /api/generate through a curl child process.
class OllamaBackend final : public IInferenceBackend {
public:
    explicit OllamaBackend(BackendConfig cfg);
    InferenceReply infer(const InferenceRequest& req) override;
    bool probe(std::string* detail) override;
    const char* name() const override { return "ollama"; }

    // Reply from a finished curl run (exposed for tests).
    static InferenceReply reply_from_curl(const ProcResult& pr, bool started);
    // True when `model` appears in an /api/tags listing.
    static bool tags_list_model(const std::string& tags_json, const std::string& model);

private:
    std::vector<std::string> curl_argv(const std::string& path, int timeout_ms, bool post) const;
    ProcLimits limits(int timeout_ms) const;

    BackendConfig cfg_;
};

// Operator command: request JSON on stdin, model reply on stdout.
class CommandBackend final : public IInferenceBackend {
public:
    explicit CommandBackend(BackendConfig cfg);
    InferenceReply infer(const InferenceRequest& req) override;
    bool probe(std::string* detail) override;
    const char* name() const override { return "cmd"; }

private:
    BackendConfig cfg_;
    std::vector<std::string> argv_;
};

// AI disabled: every request is UNAVAILABLE.
class NullBackend final : public IInferenceBackend {
public:
    InferenceReply infer(const InferenceRequest& req) override;
    bool probe(std::string* detail) override;
    const char* name() const override { return "none"; }
};

std::shared_ptr<IInferenceBackend> make_backend(const BackendConfig& cfg);

} // namespace mender
