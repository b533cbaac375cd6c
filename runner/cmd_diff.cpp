#include "cmd_diff.h"
#include "runner_utils.h"

#include "mender/diff.h"
#include "mender/serialization.h"

#include <cstring>
#include <iostream>

using namespace mender;

int cmd_diff(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: mender_cli diff <original> <fixed> [--json]\n";
        return 2;
    }
    const bool as_json = argc >= 5 && std::strcmp(argv[4], "--json") == 0;
    DiffResult d = diff(slurp(argv[2]), slurp(argv[3]));

    if (as_json) {
        json_object* out = json_object_new_object();
        json_object_object_add(out, "unified_diff",
                               json_object_new_string_len(d.unified_diff.data(), (int)d.unified_diff.size()));
        json_object* edits = json_object_new_array();
        for (const auto& e : d.line_edits) json_object_array_add(edits, line_edit_to_json(e));
        json_object_object_add(out, "line_edits", edits);
        print_json(out);
    } else {
        std::cout << d.unified_diff;
    }
    return d.unified_diff.empty() ? 0 : 1;
}
