#pragma once

// Scripted collaborators for generator and orchestrator tests.

#include "mender/executor.h"
#include "mender/inference.h"
#include "mender/patch.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mender_test {

using namespace mender;

// Fixed reply, optionally after a delay.
class ScriptedBackend final : public IInferenceBackend {
public:
    explicit ScriptedBackend(InferenceReply reply, int delay_ms = 0) : reply_(std::move(reply)), delay_ms_(delay_ms) {}

    InferenceReply infer(const InferenceRequest& req) override {
        calls_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(mu_);
            last_request_ = req;
        }
        if (delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return reply_;
    }
    bool probe(std::string* detail) override {
        if (detail) *detail = "scripted";
        return true;
    }
    const char* name() const override { return "scripted"; }

    int calls() const { return calls_.load(); }
    InferenceRequest last_request() {
        std::lock_guard<std::mutex> lk(mu_);
        return last_request_;
    }

private:
    InferenceReply reply_;
    int delay_ms_;
    std::atomic<int> calls_{0};
    std::mutex mu_;
    InferenceRequest last_request_;
};

class ThrowingBackend final : public IInferenceBackend {
public:
    InferenceReply infer(const InferenceRequest&) override { throw std::runtime_error("socket exploded"); }
    bool probe(std::string*) override { return false; }
    const char* name() const override { return "throwing"; }
};

// Generator whose own logic fails outside any backend call.
class ThrowingGenerator final : public PatchGenerator {
public:
    ThrowingGenerator() : PatchGenerator(nullptr, PatchGeneratorConfig{}) {}
    PatchRecord generate(const CodeArtifact&, const ExecutionResult&) const override {
        throw std::runtime_error("generator state corrupted");
    }
};

inline InferenceReply ok_reply(const std::string& raw) {
    InferenceReply r;
    r.kind = InferenceReply::Kind::OK;
    r.raw = raw;
    return r;
}

inline InferenceReply failed_reply(InferenceReply::Kind kind) {
    InferenceReply r;
    r.kind = kind;
    r.detail = "scripted failure";
    return r;
}

// Classifies programs by content, the way the real interpreter would for the
// handful of programs the tests use.
class FakeSandbox final : public ISandboxExecutor {
public:
    explicit FakeSandbox(int delay_ms = 0) : delay_ms_(delay_ms) {}

    ExecutionResult execute(const CodeArtifact& code, const ResourceLimits& limits) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            seen_.push_back(code.source);
        }
        if (delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        const std::string& s = code.source;

        if (s.find("while True") != std::string::npos) {
            return make_timeout_result(limits.timeout_seconds, "TimeoutError: execution exceeded the wall-clock limit");
        }
        if (s.find("print(1/0)") != std::string::npos && s.find("except ZeroDivisionError") == std::string::npos) {
            return error(ErrorType::ZeroDivisionError,
                         "Traceback (most recent call last):\n  File \"main.py\", line 1, in <module>\n"
                         "    print(1/0)\nZeroDivisionError: division by zero");
        }
        if (s.find("print(1/0)") != std::string::npos) return success("Error: Division by zero\n");
        if (s.find("undefined_var") != std::string::npos && s.find("undefined_var = None") == std::string::npos) {
            return error(ErrorType::NameError,
                         "Traceback (most recent call last):\n  File \"main.py\", line 1, in <module>\n"
                         "    print(undefined_var)\nNameError: name 'undefined_var' is not defined");
        }
        if (s.find("undefined_var") != std::string::npos) return success("None\n");
        if (s.find("raise TypeError") != std::string::npos) {
            return error(ErrorType::TypeError, "TypeError: unsupported operand");
        }
        if (s.find("print(2+2)") != std::string::npos) return success("4\n");
        return success("");
    }
    bool probe(std::string* detail) override {
        if (detail) *detail = "fake";
        return true;
    }

    std::vector<std::string> seen() {
        std::lock_guard<std::mutex> lk(mu_);
        return seen_;
    }

    static ExecutionResult error(ErrorType t, const std::string& trace) {
        ExecutionResult r;
        r.success = false;
        r.error_type = t;
        r.stack_trace = trace;
        r.exit_code = 1;
        return r;
    }
    static ExecutionResult success(const std::string& out) {
        ExecutionResult r;
        r.success = true;
        r.stdout_text = out;
        r.exit_code = 0;
        return r;
    }

private:
    int delay_ms_;
    std::mutex mu_;
    std::vector<std::string> seen_;
};

} // namespace mender_test
