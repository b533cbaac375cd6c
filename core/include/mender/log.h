#pragma once
#include <json-c/json.h>

#include <fstream>
#include <string>

namespace mender {

// Append-only JSONL journal of one repair session. Every line is canonical
// JSON (sorted keys) and carries a SHA-256 hash chain:
//   chain_hash = sha256(chain_prev || canonical record without chain fields)
// The first record chains from 64 zeros.
class SessionJournal {
public:
    SessionJournal(const std::string& session_id, const std::string& path);

    // Takes ownership of payload (may be nullptr). Returns false once the
    // file cannot be written; later calls keep returning false.
    bool event(const std::string& name, json_object* payload);

    bool ok() const { return ok_; }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string session_id_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    int seq_{0};
    bool ok_{true};
    std::string error_;
};

// Deterministic serialization with object keys sorted.
std::string canonical_json(json_object* obj);

// Re-check every chain link of a journal file. On failure *err names the
// first bad line (1-based).
bool verify_journal(const std::string& path, std::string* err);

} // namespace mender
