#pragma once
#include "types.h"
#include "log.h"

#include <memory>
#include <optional>
#include <string>

namespace mender {

// Append-only trace of one repair run. The finished RepairSession is only
// obtainable through finish(); any append or finish after that throws
// std::logic_error.
class SessionRecorder {
public:
    SessionRecorder(std::string session_id, std::string original_code);

    // Mirror every append to a JSONL journal. Journal write failures never
    // interrupt the session; check journal()->ok() afterwards.
    void attach_journal(std::shared_ptr<SessionJournal> journal);

    void append_execution(const ExecutionResult& r);
    void append_patch(const PatchRecord& p);

    RepairSession finish(TerminalState state, std::optional<std::string> failure_reason);

    bool finished() const { return finished_; }
    const std::string& session_id() const { return session_.session_id; }
    size_t execution_count() const { return session_.executions.size(); }
    const std::shared_ptr<SessionJournal>& journal() const { return journal_; }

private:
    void require_open(const char* op) const;

    RepairSession session_;
    std::shared_ptr<SessionJournal> journal_;
    bool finished_{false};
};

} // namespace mender
