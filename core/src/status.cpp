#include "mender/status.h"
#include "mender/json_mini.h"
#include "mender/sandbox.h"

namespace mender {

SystemStatus check_status(ISandboxExecutor& sandbox, IInferenceBackend& backend) {
    SystemStatus st;
    st.sandbox_ready = sandbox.probe(&st.sandbox_detail);
    st.seccomp_available = seccomp_available();
    st.inference_backend = backend.name();
    st.inference_ready = backend.probe(&st.inference_detail);
    return st;
}

json_object* system_status_to_json(const SystemStatus& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "sandbox_ready", json_object_new_boolean(s.sandbox_ready));
    json_object_object_add(o, "sandbox_detail", json_mini::new_string(s.sandbox_detail));
    json_object_object_add(o, "seccomp_available", json_object_new_boolean(s.seccomp_available));
    json_object_object_add(o, "inference_backend", json_mini::new_string(s.inference_backend));
    json_object_object_add(o, "inference_ready", json_object_new_boolean(s.inference_ready));
    json_object_object_add(o, "inference_detail", json_mini::new_string(s.inference_detail));
    return o;
}

} // namespace mender
