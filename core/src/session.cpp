#include "mender/session.h"
#include "mender/hash.h"
#include "mender/json_mini.h"
#include "mender/serialization.h"

#include <stdexcept>

namespace mender {

SessionRecorder::SessionRecorder(std::string session_id, std::string original_code) {
    session_.session_id = std::move(session_id);
    session_.original_code = std::move(original_code);
    session_.final_code = session_.original_code;
}

void SessionRecorder::require_open(const char* op) const {
    if (finished_) {
        throw std::logic_error(std::string("SessionRecorder::") + op + " after finish (session " +
                               session_.session_id + ")");
    }
}

void SessionRecorder::attach_journal(std::shared_ptr<SessionJournal> journal) {
    require_open("attach_journal");
    journal_ = std::move(journal);
    if (!journal_) return;
    json_object* p = json_object_new_object();
    json_object_object_add(p, "original_code", json_mini::new_string(session_.original_code));
    json_object_object_add(p, "code_sha256", json_mini::new_string(hash::sha256_hex(session_.original_code)));
    journal_->event("session_start", p);
}

void SessionRecorder::append_execution(const ExecutionResult& r) {
    require_open("append_execution");
    session_.executions.push_back(r);
    if (journal_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "iteration", json_object_new_int((int)session_.executions.size() - 1));
        json_object_object_add(p, "result", execution_result_to_json(r));
        journal_->event("execution", p);
    }
}

void SessionRecorder::append_patch(const PatchRecord& p) {
    require_open("append_patch");
    session_.patches.push_back(p);
    if (journal_) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "iteration", json_object_new_int((int)session_.executions.size() - 1));
        json_object_object_add(o, "patch", patch_record_to_json(p));
        journal_->event("patch", o);
    }
}

RepairSession SessionRecorder::finish(TerminalState state, std::optional<std::string> failure_reason) {
    require_open("finish");
    finished_ = true;
    session_.terminal_state = state;
    session_.failure_reason = state == TerminalState::SUCCESS ? std::nullopt : std::move(failure_reason);
    session_.total_iterations = (int)session_.executions.size();
    session_.final_code = session_.patches.empty() ? session_.original_code : session_.patches.back().fixed_code;

    if (journal_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "terminal_state", json_object_new_string(terminal_state_name(state)));
        json_object_object_add(p, "failure_reason",
                               session_.failure_reason ? json_mini::new_string(*session_.failure_reason) : nullptr);
        json_object_object_add(p, "total_iterations", json_object_new_int(session_.total_iterations));
        json_object_object_add(p, "final_code_sha256", json_mini::new_string(hash::sha256_hex(session_.final_code)));
        journal_->event("session_end", p);
    }
    return session_;
}

} // namespace mender
