#pragma once
#include "language.h"

#include <optional>
#include <string>
#include <vector>

namespace patchbench {

constexpr int kDefaultBuildTimeoutSec = 300;
constexpr int kDefaultTestTimeoutSec = 600;

// Placeholder in command_test replaced by the test files a test_patch touches.
constexpr const char* kTestFilesPlaceholder = "{test_files}";

// One evaluation unit, as read from a JSONL line. raw_json keeps the whole
// input record so fields this harness does not know survive to the output.
struct Task {
    std::string raw_json;

    std::string repo;        // owner/name, URL or local path
    std::string base_commit;
    std::string language{"python"};
    std::string image_name;  // defaults from the language profile
    std::string command_build;
    std::string command_test;
    std::string patch;       // the fix
    std::string test_patch;  // new/changed tests only
    int timeout_build{kDefaultBuildTimeoutSec};
    int timeout_test{kDefaultTestTimeoutSec};
    std::optional<int> repo_build; // set by an earlier build-check stage

    std::string task_id;
};

// Parses one JSONL record, fills defaults from the language profile and
// computes task_id. Returns false with *err set on malformed input.
// Accepted aliases: repo_name, lang, build_command, test_command,
// build_timeout, test_timeout.
bool parse_task(const std::string& line, Task* out, std::string* err);

// <repo name>-<last 4 of commit>-<8 hex of FNV-1a over the canonical JSON of
// the configuration fields>. Identical configurations get identical ids.
std::string compute_task_id(const Task& t);

// Sorted, de-duplicated files a diff creates or modifies that the profile
// considers test files. Binary diffs yield nothing.
std::vector<std::string> test_files_from_patch(const std::string& diff, const LanguageProfile& profile);

// command_test with {test_files} substituted (shell-quoted, space separated).
// Returns false when the placeholder is present but the test_patch touches
// no test files.
bool resolve_test_command(const Task& t, const LanguageProfile& profile, std::string* out, std::string* err);

} // namespace patchbench
