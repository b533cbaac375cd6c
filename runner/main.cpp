#include "cmd_diff.h"
#include "cmd_exec.h"
#include "cmd_repair.h"
#include "cmd_status.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "mender_cli <repair|exec|diff|status> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    try {
        if (cmd == "repair") return cmd_repair(argc, argv);
        if (cmd == "exec") return cmd_exec(argc, argv);
        if (cmd == "diff") return cmd_diff(argc, argv);
        if (cmd == "status") return cmd_status(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "mender_cli " << cmd << ": " << e.what() << "\n";
        return 1;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
