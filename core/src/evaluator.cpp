#include "patchbench/evaluator.h"
#include "patchbench/errors.h"
#include "patchbench/json_mini.h"
#include "patchbench/log.h"
#include "patchbench/report.h"

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

namespace patchbench {

namespace jm = json_mini;

TestSets extract_sets(const TestReport& report) {
    TestSets s;
    for (const auto& t : report.tests) {
        const std::string name = qualified_name(t);
        if (t.status == TestStatus::PASSED) {
            if (!s.failed.count(name)) s.passed.insert(name);
        } else {
            s.passed.erase(name);
            s.failed.insert(name);
        }
    }
    return s;
}

CorrectnessVerdict judge(const TestReport& after, const TestReport& gold) {
    const TestSets a = extract_sets(after);
    const TestSets g = extract_sets(gold);

    CorrectnessVerdict v;
    std::vector<std::string> newly_passing;
    std::set_difference(g.passed.begin(), g.passed.end(), a.passed.begin(), a.passed.end(),
                        std::back_inserter(newly_passing));
    v.task_ok = !newly_passing.empty();
    v.task_perfect = g.passed.size() > a.passed.size() &&
                     std::includes(g.passed.begin(), g.passed.end(), a.passed.begin(), a.passed.end());
    v.pass_to_pass = g.passed;
    v.fail_to_pass = g.failed;
    return v;
}

namespace {

void emit(const EvalOptions& opt, const Task& task, const char* event, json_object* payload) {
    if (!opt.events) {
        json_object_put(payload);
        return;
    }
    json_object_object_add(payload, "task_id", jm::new_string(task.task_id));
    opt.events->event(event, payload);
}

json_object* summary_payload(const std::string& phase, const ExecutionResult& r) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "phase", jm::new_string(phase));
    json_object_object_add(p, "returncode", json_object_new_int(r.return_code));
    json_object_object_add(p, "duration", json_object_new_double(r.duration_sec));
    if (r.report) {
        json_object_object_add(p, "status", jm::new_string(report_status_to_str(r.report->status)));
        json_object_object_add(p, "total", json_object_new_int64(r.report->summary.total));
        json_object_object_add(p, "passed", json_object_new_int64(r.report->summary.passed));
        json_object_object_add(p, "failed", json_object_new_int64(r.report->summary.failed));
    }
    return p;
}

// Reuses a committed image when one exists, builds otherwise.
// Returns false (outcome filled in) when the build exited non-zero.
bool ensure_built(RepositoryHandle& handle, const Task& task, TaskOutcome& out, const EvalOptions& opt) {
    if (handle.was_built()) {
        handle.adopt_built_image();
        out.build = BuildResult{true, std::nullopt};
        emit(opt, task, "build_reused", json_object_new_object());
        return true;
    }
    ExecutionResult r = handle.build(task.command_build, task.timeout_build);
    emit(opt, task, "build", summary_payload("build", r));
    const int rc = r.return_code;
    out.build = BuildResult{false, std::move(r)};
    if (rc != 0) {
        out.exception = "build failed with exit code " + std::to_string(rc);
        out.error_kind = ErrorKind::BUILD;
        return false;
    }
    return true;
}

bool run_phase(RepositoryHandle& handle, const Task& task, const std::string& phase, const std::string& cmd,
               std::optional<TestPhaseResult>& slot, TaskOutcome& out, const EvalOptions& opt) {
    ExecutionResult r = handle.run_test(cmd, task.timeout_test);
    emit(opt, task, "phase", summary_payload(phase, r));
    const bool timed_out = r.error_kind == ErrorKind::TIMEOUT;
    slot = TestPhaseResult{phase, std::move(r)};
    if (timed_out) {
        out.exception = "test phase " + phase + " timed out after " + std::to_string(task.timeout_test) + "s";
        out.error_kind = ErrorKind::TIMEOUT;
        return false;
    }
    return true;
}

void record_failure(TaskOutcome& out, const std::exception& e, ErrorKind kind) {
    out.exception = e.what();
    out.error_kind = kind;
}

// Leaves the shared working tree at the pristine commit for the next task.
void restore_tree(RepositoryHandle& handle) {
    if (handle.state() == HandleState::FAILED) return;
    try {
        handle.clean();
    } catch (const std::exception& e) {
        console_line("[WARN] cannot reset " + handle.workdir().string() + ": " + e.what());
    }
}

ExecutionResult timeout_result(const TimeoutError& e) {
    ExecutionResult r;
    r.stdout_text = e.partial().stdout_text;
    r.stderr_text = e.partial().stderr_text;
    r.return_code = kTimeoutReturnCode;
    r.duration_sec = e.partial().duration_sec;
    r.error_kind = ErrorKind::TIMEOUT;
    r.error = e.what();
    return r;
}

} // namespace

TaskOutcome evaluate_task(RepositoryHandle& handle, const Task& task, const EvalOptions& opt) {
    TaskOutcome out;
    out.repo_build = task.repo_build;
    if (task.repo_build && *task.repo_build != 1) {
        out.exception = "skip, not built";
        return out;
    }
    std::string cmd;
    std::string err;
    if (!resolve_test_command(task, handle.profile(), &cmd, &err)) {
        out.exception = err;
        return out;
    }

    json_object* start = json_object_new_object();
    json_object_object_add(start, "repo", jm::new_string(task.repo));
    json_object_object_add(start, "base_commit", jm::new_string(task.base_commit));
    emit(opt, task, "task_start", start);

    bool prepared = false;
    try {
        handle.prepare();
        prepared = true;
        if (!ensure_built(handle, task, out, opt)) {
            out.repo_build = -1;
        } else {
            if (!out.repo_build) out.repo_build = 1;

            handle.clean();
            bool ok = run_phase(handle, task, "before", cmd, out.before, out, opt);

            if (ok) {
                handle.clean();
                handle.apply_patch(task.test_patch);
                ok = run_phase(handle, task, "after", cmd, out.after, out, opt);
            }
            if (ok) {
                handle.clean();
                handle.apply_patch(task.test_patch);
                handle.apply_patch(task.patch);
                ok = run_phase(handle, task, "gold", cmd, out.gold, out, opt);
            }
            if (ok) {
                out.verdict = judge(out.after->exec.report.value_or(unknown_report()),
                                    out.gold->exec.report.value_or(unknown_report()));
                out.run_status = 1;
            }
        }
    } catch (const TimeoutError& e) {
        out.build = BuildResult{false, timeout_result(e)};
        out.repo_build = -1;
        record_failure(out, e, ErrorKind::TIMEOUT);
    } catch (const GitApplyFailed& e) {
        record_failure(out, e, ErrorKind::GIT);
    } catch (const GitError& e) {
        out.exception = std::string("Repo missing or deleted: ") + e.what();
        out.error_kind = ErrorKind::GIT;
    } catch (const Error& e) {
        record_failure(out, e, e.kind());
    } catch (const std::exception& e) {
        record_failure(out, e, ErrorKind::INTERNAL);
    }
    if (prepared) restore_tree(handle);

    json_object* done = json_object_new_object();
    json_object_object_add(done, "run_status", json_object_new_int(out.run_status));
    json_object_object_add(done, "error_kind", jm::new_string(error_kind_to_str(out.error_kind)));
    if (out.verdict) {
        json_object_object_add(done, "task_ok", json_object_new_boolean(out.verdict->task_ok));
        json_object_object_add(done, "task_perfect", json_object_new_boolean(out.verdict->task_perfect));
        json_object_object_add(done, "fail_to_pass", json_object_new_int64((int64_t)out.verdict->fail_to_pass.size()));
    }
    emit(opt, task, "task_done", done);
    return out;
}

TaskOutcome check_build(RepositoryHandle& handle, const Task& task, const EvalOptions& opt) {
    TaskOutcome out;
    out.repo_build = -1;
    // no patch is applied at this stage, so a per-test-file command has nothing to select
    const std::string cmd = task.command_test.find(kTestFilesPlaceholder) == std::string::npos
                                ? task.command_test
                                : handle.profile().default_test_command;

    bool prepared = false;
    try {
        handle.prepare();
        prepared = true;
        if (ensure_built(handle, task, out, opt)) {
            handle.clean();
            if (run_phase(handle, task, "before", cmd, out.before, out, opt)) {
                const TestReport rep = out.before->exec.report.value_or(unknown_report());
                out.repo_build = rep.summary.passed > 0 ? 1 : 0;
                out.run_status = 1;
            }
        }
    } catch (const TimeoutError& e) {
        out.build = BuildResult{false, timeout_result(e)};
        record_failure(out, e, ErrorKind::TIMEOUT);
    } catch (const Error& e) {
        record_failure(out, e, e.kind());
    } catch (const std::exception& e) {
        record_failure(out, e, ErrorKind::INTERNAL);
    }
    if (prepared) restore_tree(handle);

    json_object* done = json_object_new_object();
    json_object_object_add(done, "repo_build", json_object_new_int(*out.repo_build));
    json_object_object_add(done, "error_kind", jm::new_string(error_kind_to_str(out.error_kind)));
    emit(opt, task, "build_check_done", done);
    return out;
}

static json_object* sorted_names(const std::set<std::string>& names) {
    return jm::new_string_array(std::vector<std::string>(names.begin(), names.end()));
}

std::string outcome_to_json(const Task& task, const TaskOutcome& outcome, bool delete_log) {
    jm::Doc doc = jm::parse(task.raw_json);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) doc = jm::Doc(json_object_new_object());
    json_object* o = doc.root;

    if (outcome.repo_build) json_object_object_add(o, "repo_build", json_object_new_int(*outcome.repo_build));
    if (outcome.verdict) {
        json_object_object_add(o, "task_ok", json_object_new_boolean(outcome.verdict->task_ok));
        json_object_object_add(o, "task_perfect", json_object_new_boolean(outcome.verdict->task_perfect));
        json_object_object_add(o, "PASS_TO_PASS", sorted_names(outcome.verdict->pass_to_pass));
        json_object_object_add(o, "FAIL_TO_PASS", sorted_names(outcome.verdict->fail_to_pass));
    }
    json_object_object_add(o, "run_status", json_object_new_int(outcome.run_status));
    json_object_object_add(o, "exception", jm::new_string(outcome.exception));
    json_object_object_add(o, "error_kind", jm::new_string(error_kind_to_str(outcome.error_kind)));
    json_object_object_add(o, "task_id", jm::new_string(task.task_id));

    if (!delete_log) {
        if (outcome.build && outcome.build->exec) {
            json_object_object_add(o, "dct_build", execution_result_to_json(*outcome.build->exec));
        }
        const std::pair<const char*, const std::optional<TestPhaseResult>*> phases[] = {
            {"dct_test_before", &outcome.before},
            {"dct_test_after", &outcome.after},
            {"dct_test_gold", &outcome.gold},
        };
        for (const auto& [key, phase] : phases) {
            if (*phase) json_object_object_add(o, key, execution_result_to_json((*phase)->exec));
        }
    }
    return jm::to_string_plain(o);
}

} // namespace patchbench
