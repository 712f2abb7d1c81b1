#pragma once
#include "repository.h"
#include "task.h"
#include "types.h"

#include <optional>
#include <set>
#include <string>

namespace patchbench {

class JsonlLogger;

// Test names (qualified) per outcome. A name reported more than once counts
// as passed only if every occurrence passed; failed, error and skipped
// tests all land in `failed`.
struct TestSets {
    std::set<std::string> passed;
    std::set<std::string> failed;
};

TestSets extract_sets(const TestReport& report);

struct CorrectnessVerdict {
    // gold makes at least one test pass that did not pass with tests only
    bool task_ok{false};
    // gold's passing set strictly extends after's, with no regressions
    bool task_perfect{false};
    std::set<std::string> pass_to_pass; // passed(gold)
    std::set<std::string> fail_to_pass; // failed(gold)
};

CorrectnessVerdict judge(const TestReport& after, const TestReport& gold);

struct BuildResult {
    bool reused_image{false}; // build skipped, a committed image existed
    std::optional<ExecutionResult> exec;
};

struct TestPhaseResult {
    std::string phase; // before | after | gold
    ExecutionResult exec;
};

// Everything one task produced. Built once, never mutated afterwards.
struct TaskOutcome {
    std::optional<int> repo_build;   // 1 / 0 / -1
    std::optional<BuildResult> build;
    std::optional<TestPhaseResult> before;
    std::optional<TestPhaseResult> after;
    std::optional<TestPhaseResult> gold;
    std::optional<CorrectnessVerdict> verdict;
    int run_status{0};               // 1 when all three phases ran
    std::string exception;
    ErrorKind error_kind{ErrorKind::NONE};
};

struct EvalOptions {
    JsonlLogger* events{nullptr};
};

// Three-phase protocol on one handle:
//   clean; before = run_test
//   clean; apply test_patch; after = run_test
//   clean; apply test_patch + patch; gold = run_test
// Tasks whose input carries repo_build != 1 are skipped. A failed build or
// any failed phase makes the task un-evaluable; phases that did run are kept.
// Never throws for task-level failures; they are recorded in the outcome.
TaskOutcome evaluate_task(RepositoryHandle& handle, const Task& task, const EvalOptions& opt = {});

// Build stage: repo_build = 1 when the build succeeds and the test command
// passes at least one test, 0 when it builds but no passing test is found,
// -1 on any error.
TaskOutcome check_build(RepositoryHandle& handle, const Task& task, const EvalOptions& opt = {});

// The task's input record enriched with the outcome: repo_build, task_ok,
// task_perfect, PASS_TO_PASS, FAIL_TO_PASS, run_status, exception,
// error_kind, task_id and, unless delete_log, dct_build and
// dct_test_before/after/gold. One JSONL line without the newline.
std::string outcome_to_json(const Task& task, const TaskOutcome& outcome, bool delete_log);

} // namespace patchbench
