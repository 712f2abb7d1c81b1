#include "cmd_report.h"
#include "runner_utils.h"

#include "patchbench/json_mini.h"
#include "patchbench/parsers.h"
#include "patchbench/report.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace patchbench;

int cmd_parse_report(int argc, char** argv) {
    std::vector<std::string> files;
    std::string hint;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--console") {
            if (!take_value(argc, argv, i, &hint)) break;
            ConsoleFormat f;
            if (!console_format_from_str(hint, &f)) {
                std::cerr << "unknown console format: " << hint << "\n";
                return 2;
            }
            continue;
        }
        files.push_back(a);
    }
    if (files.empty()) {
        std::cerr << "usage: patchbench_cli parse-report <file>... [--console FORMAT]\n";
        return 2;
    }

    std::vector<TestReport> usable;
    int64_t collected = 0;
    for (const auto& f : files) {
        std::string bytes;
        try {
            bytes = slurp(f);
        } catch (const std::exception& e) {
            std::cerr << "[parse-report] " << e.what() << "\n";
            return 2;
        }
        TestReport r = parse_artifact(bytes, hint);
        collected = std::max(collected, r.summary.collected);
        if (r.summary.total > 0) usable.push_back(std::move(r));
    }

    TestReport merged = usable.empty() ? unknown_report(collected) : merge_reports(usable);
    json_mini::Doc doc(report_to_json(merged));
    std::cout << json_mini::to_string_plain(doc.root) << "\n";
    return merged.status == ReportStatus::UNKNOWN ? 1 : 0;
}

int cmd_task_id(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: patchbench_cli task-id <in.jsonl>\n";
        return 2;
    }
    std::vector<std::string> rejected;
    std::vector<Task> tasks;
    try {
        tasks = read_tasks(argv[2], &rejected);
    } catch (const std::exception& e) {
        std::cerr << "[task-id] " << e.what() << "\n";
        return 2;
    }
    for (const auto& r : rejected) std::cerr << "[WARN] " << r << "\n";
    for (const auto& t : tasks) std::cout << t.task_id << "\n";
    return rejected.empty() ? 0 : 1;
}
