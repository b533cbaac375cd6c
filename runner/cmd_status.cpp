#include "cmd_status.h"
#include "runner_utils.h"

#include "mender/status.h"

using namespace mender;

int cmd_status(int, char**) {
    Runtime rt = make_runtime();
    SystemStatus st = check_status(*rt.sandbox, *rt.backend);
    json_object* out = system_status_to_json(st);
    json_object_object_add(out, "profile", json_object_new_string(profile_name(rt.cfg.profile)));
    print_json(out);
    return st.sandbox_ready ? 0 : 1;
}
