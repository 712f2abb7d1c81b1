#include "cmd_evaluate.h"
#include "cmd_report.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "patchbench_cli <evaluate|build-check|parse-report|task-id> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "evaluate") return cmd_evaluate(argc, argv);
    if (cmd == "build-check") return cmd_build_check(argc, argv);
    if (cmd == "parse-report") return cmd_parse_report(argc, argv);
    if (cmd == "task-id") return cmd_task_id(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
