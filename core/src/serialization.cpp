#include "mender/serialization.h"
#include "mender/json_mini.h"

namespace mender {

namespace {

json_object* str(const std::string& s) { return json_mini::new_string(s); }

void add_optional_string(json_object* o, const char* key, const std::optional<std::string>& v) {
    json_object_object_add(o, key, v ? str(*v) : nullptr);
}

} // namespace

json_object* resource_limits_to_json(const ResourceLimits& l) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "memory_bytes", json_object_new_int64((int64_t)l.memory_bytes));
    json_object_object_add(o, "cpu_share", json_object_new_double(l.cpu_share));
    json_object_object_add(o, "network_enabled", json_object_new_boolean(l.network_enabled));
    json_object_object_add(o, "timeout_seconds", json_object_new_double(l.timeout_seconds));
    return o;
}

json_object* execution_result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "success", json_object_new_boolean(r.success));
    json_object_object_add(o, "stdout", str(r.stdout_text));
    json_object_object_add(o, "error_type", r.error_type ? json_object_new_string(error_type_name(*r.error_type)) : nullptr);
    add_optional_string(o, "stack_trace", r.stack_trace);
    json_object_object_add(o, "duration_sec", json_object_new_double(r.duration_sec));
    json_object_object_add(o, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(o, "timed_out", json_object_new_boolean(r.timed_out));
    json_object_object_add(o, "output_truncated", json_object_new_boolean(r.output_truncated));
    return o;
}

json_object* line_edit_to_json(const LineEdit& e) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "kind", json_object_new_string(edit_kind_name(e.kind)));
    json_object_object_add(o, "line_number", json_object_new_int(e.line_number));
    json_object_object_add(o, "old_text", str(e.old_text));
    json_object_object_add(o, "new_text", str(e.new_text));
    return o;
}

json_object* patch_record_to_json(const PatchRecord& p) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "original_code", str(p.original_code));
    json_object_object_add(o, "fixed_code", str(p.fixed_code));
    json_object_object_add(o, "unified_diff", str(p.unified_diff));
    json_object* edits = json_object_new_array();
    for (const auto& e : p.line_edits) json_object_array_add(edits, line_edit_to_json(e));
    json_object_object_add(o, "line_edits", edits);
    json_object_object_add(o, "explanation", str(p.explanation));
    json_object_object_add(o, "reasoning", str(p.reasoning));
    json_object_object_add(o, "source", json_object_new_string(patch_source_name(p.source)));
    json_object_object_add(o, "generation_time_sec", json_object_new_double(p.generation_time_sec));
    json_object_object_add(o, "target_error", p.target_error ? json_object_new_string(error_type_name(*p.target_error)) : nullptr);
    if (p.fallback_reason != GenerationFailure::NONE) {
        json_object_object_add(o, "fallback_reason", json_object_new_string(generation_failure_name(p.fallback_reason)));
    } else {
        json_object_object_add(o, "fallback_reason", nullptr);
    }
    return o;
}

json_object* repair_session_to_json(const RepairSession& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "session_id", str(s.session_id));
    json_object_object_add(o, "original_code", str(s.original_code));
    json_object_object_add(o, "final_code", str(s.final_code));
    json_object* execs = json_object_new_array();
    for (const auto& r : s.executions) json_object_array_add(execs, execution_result_to_json(r));
    json_object_object_add(o, "executions", execs);
    json_object* patches = json_object_new_array();
    for (const auto& p : s.patches) json_object_array_add(patches, patch_record_to_json(p));
    json_object_object_add(o, "patches", patches);
    json_object_object_add(o, "total_iterations", json_object_new_int(s.total_iterations));
    json_object_object_add(o, "terminal_state", json_object_new_string(terminal_state_name(s.terminal_state)));
    add_optional_string(o, "failure_reason", s.failure_reason);
    return o;
}

std::string session_to_json_string(const RepairSession& s, bool pretty) {
    json_mini::Doc d(repair_session_to_json(s));
    return json_mini::to_string(d.root, pretty);
}

} // namespace mender
