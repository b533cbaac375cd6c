#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>

namespace mender {

// --- json-c object builders (caller owns the returned object) ---

json_object* resource_limits_to_json(const ResourceLimits& l);
json_object* execution_result_to_json(const ExecutionResult& r);
json_object* line_edit_to_json(const LineEdit& e);
json_object* patch_record_to_json(const PatchRecord& p);
json_object* repair_session_to_json(const RepairSession& s);

// Pretty-printed session document.
std::string session_to_json_string(const RepairSession& s, bool pretty = true);

} // namespace mender
