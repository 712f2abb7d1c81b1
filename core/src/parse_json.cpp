#include "patchbench/parsers.h"
#include "patchbench/json_mini.h"
#include "patchbench/report.h"
#include "parse_util.h"

#include <functional>
#include <string>
#include <vector>

namespace patchbench {

namespace jm = json_mini;
namespace pu = parse_util;

namespace {

void for_each_object(json_object* arr, const std::function<void(json_object*)>& fn) {
    if (!arr || !json_object_is_type(arr, json_type_array)) return;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_object)) fn(el);
    }
}

json_object* first_object(json_object* arr) {
    if (!arr || json_object_array_length(arr) == 0) return nullptr;
    json_object* el = json_object_array_get_idx(arr, 0);
    if (!el || !json_object_is_type(el, json_type_object)) return nullptr;
    return el;
}

TestStatus status_or_error(const std::string& s) {
    auto st = test_status_from_str(s);
    return st ? *st : TestStatus::ERROR;
}

// ---- pytest-json-report ----

// Only "passed" is a pass. An unexpected pass of an xfail-marked test is a
// failure of the expectation.
TestStatus pytest_outcome(const std::string& outcome) {
    if (outcome == "xpassed") return TestStatus::FAILED;
    if (outcome == "xfailed") return TestStatus::SKIPPED;
    return status_or_error(outcome);
}

TestReport parse_pytest_json(json_object* root) {
    json_object* summary = jm::get_object(root, "summary");
    const int64_t collected = jm::get_int_or(summary, "collected", 0);

    std::vector<TestCase> tests;
    for_each_object(jm::get_array(root, "tests"), [&](json_object* tj) {
        TestCase t;
        t.name = jm::get_string_or(tj, "nodeid", "");
        t.status = pytest_outcome(jm::get_string_or(tj, "outcome", ""));
        for (const char* stage : {"setup", "call", "teardown"}) {
            json_object* sj = jm::get_object(tj, stage);
            if (!sj) continue;
            t.time += jm::get_number(sj, "duration").value_or(0.0);
            if (t.status != TestStatus::PASSED && t.message.empty()) {
                if (json_object* crash = jm::get_object(sj, "crash")) {
                    t.message = jm::get_string_or(crash, "message", "");
                }
                auto longrepr = jm::get_string(sj, "longrepr");
                if (longrepr) t.details = pu::cap_details(*longrepr);
            }
        }
        tests.push_back(std::move(t));
    });

    // modules that failed to import never produce test entries
    for_each_object(jm::get_array(root, "collectors"), [&](json_object* cj) {
        if (jm::get_string_or(cj, "outcome", "") != "failed") return;
        TestCase t;
        t.name = jm::get_string_or(cj, "nodeid", "");
        t.status = TestStatus::ERROR;
        t.message = "collection error";
        t.details = pu::cap_details(jm::get_string_or(cj, "longrepr", ""));
        tests.push_back(std::move(t));
    });

    if (!tests.empty()) return report_from_tests(std::move(tests), collected);

    TestReport r;
    r.summary.passed = jm::get_int_or(summary, "passed", 0);
    r.summary.failed = jm::get_int_or(summary, "failed", 0) + jm::get_int_or(summary, "xpassed", 0);
    r.summary.errors = jm::get_int_or(summary, "error", 0) + jm::get_int_or(summary, "errors", 0);
    r.summary.skipped = jm::get_int_or(summary, "skipped", 0) + jm::get_int_or(summary, "xfailed", 0);
    r.summary.collected = collected;
    finalize_report(r);
    return r;
}

// ---- Jest --json ----

TestReport parse_jest_json(json_object* root) {
    TestReport r;
    for_each_object(jm::get_array(root, "testResults"), [&](json_object* suite) {
        const std::string file = jm::get_string_or(suite, "name", jm::get_string_or(suite, "testFilePath", ""));
        json_object* assertions = jm::get_array(suite, "assertionResults");
        if (!assertions) assertions = jm::get_array(suite, "testResults");
        const size_t before = r.tests.size();
        for_each_object(assertions, [&](json_object* aj) {
            TestCase t;
            t.name = jm::get_string_or(aj, "fullName", jm::get_string_or(aj, "title", ""));
            t.classname = file;
            t.time = jm::get_number(aj, "duration").value_or(0.0) / 1000.0;
            t.status = status_or_error(jm::get_string_or(aj, "status", ""));
            auto failures = jm::get_array_strings(aj, "failureMessages");
            if (!failures.empty()) {
                t.message = pu::trim(failures.front().substr(0, failures.front().find('\n')));
                std::string joined;
                for (const auto& f : failures) joined += f + "\n";
                t.details = pu::cap_details(joined);
            }
            r.tests.push_back(std::move(t));
        });
        // a suite that failed before running any test (syntax error, missing module)
        if (r.tests.size() == before && jm::get_string_or(suite, "status", "") == "failed") {
            TestCase t;
            t.name = file;
            t.status = TestStatus::ERROR;
            t.message = "test suite failed to run";
            t.details = pu::cap_details(jm::get_string_or(suite, "message", jm::get_string_or(suite, "failureMessage", "")));
            r.tests.push_back(std::move(t));
        }
    });

    r.summary.passed = jm::get_int_or(root, "numPassedTests", 0);
    r.summary.failed = jm::get_int_or(root, "numFailedTests", 0);
    r.summary.skipped = jm::get_int_or(root, "numPendingTests", 0) + jm::get_int_or(root, "numTodoTests", 0);
    r.summary.errors = jm::get_int_or(root, "numRuntimeErrorTestSuites", 0);
    r.summary.total = jm::get_int_or(root, "numTotalTests", 0);
    if (r.summary.total > 0 || r.summary.errors > 0) r.summary.total += r.summary.errors;
    finalize_report(r);
    return r;
}

// ---- RSpec --format json ----

TestReport parse_rspec_json(json_object* root) {
    TestReport r;
    for_each_object(jm::get_array(root, "examples"), [&](json_object* ej) {
        TestCase t;
        t.name = jm::get_string_or(ej, "full_description", jm::get_string_or(ej, "description", ""));
        t.classname = jm::get_string_or(ej, "file_path", "");
        t.time = jm::get_number(ej, "run_time").value_or(0.0);
        t.status = status_or_error(jm::get_string_or(ej, "status", ""));
        if (json_object* ex = jm::get_object(ej, "exception")) {
            t.message = jm::get_string_or(ex, "message", "");
            std::string bt;
            for (const auto& line : jm::get_array_strings(ex, "backtrace")) bt += line + "\n";
            t.details = pu::cap_details(jm::get_string_or(ex, "class", "") + ": " + t.message + "\n" + bt);
        } else if (t.status == TestStatus::SKIPPED) {
            t.message = jm::get_string_or(ej, "pending_message", "");
        }
        r.tests.push_back(std::move(t));
    });

    json_object* summary = jm::get_object(root, "summary");
    if (summary) {
        const int64_t examples = jm::get_int_or(summary, "example_count", 0);
        r.summary.failed = jm::get_int_or(summary, "failure_count", 0);
        r.summary.skipped = jm::get_int_or(summary, "pending_count", 0);
        r.summary.errors = jm::get_int_or(summary, "errors_outside_of_examples_count", 0);
        r.summary.total = examples + r.summary.errors;
    }
    finalize_report(r);
    return r;
}

// ---- mocha --reporter json ----

TestReport parse_mocha_json(json_object* root) {
    TestReport r;
    auto add_all = [&](const char* key, TestStatus st) {
        for_each_object(jm::get_array(root, key), [&](json_object* tj) {
            TestCase t;
            t.name = jm::get_string_or(tj, "fullTitle", jm::get_string_or(tj, "title", ""));
            t.classname = jm::get_string_or(tj, "file", "");
            t.time = jm::get_number(tj, "duration").value_or(0.0) / 1000.0;
            t.status = st;
            if (json_object* err = jm::get_object(tj, "err")) {
                t.message = jm::get_string_or(err, "message", "");
                t.details = pu::cap_details(jm::get_string_or(err, "stack", ""));
            }
            r.tests.push_back(std::move(t));
        });
    };
    add_all("passes", TestStatus::PASSED);
    add_all("failures", TestStatus::FAILED);
    add_all("pending", TestStatus::SKIPPED);

    json_object* stats = jm::get_object(root, "stats");
    r.summary.total = jm::get_int_or(stats, "tests", 0);
    r.summary.passed = jm::get_int_or(stats, "passes", 0);
    r.summary.failed = jm::get_int_or(stats, "failures", 0);
    r.summary.skipped = jm::get_int_or(stats, "pending", 0);
    finalize_report(r);
    return r;
}

// ---- GoogleTest --gtest_output=json ----

TestReport parse_gtest_json(json_object* root) {
    std::vector<TestCase> tests;
    for_each_object(jm::get_array(root, "testsuites"), [&](json_object* suite) {
        const std::string suite_name = jm::get_string_or(suite, "name", "");
        for_each_object(jm::get_array(suite, "testsuite"), [&](json_object* cj) {
            TestCase t;
            t.name = jm::get_string_or(cj, "name", "");
            t.classname = jm::get_string_or(cj, "classname", suite_name);
            t.time = pu::to_seconds(jm::get_string_or(cj, "time", "0"));
            const std::string result = jm::get_string_or(cj, "result", "COMPLETED");
            const std::string status = jm::get_string_or(cj, "status", "RUN");
            std::string failure_text;
            for_each_object(jm::get_array(cj, "failures"), [&](json_object* fj) {
                failure_text += jm::get_string_or(fj, "failure", "") + "\n";
            });
            if (!failure_text.empty()) {
                t.status = TestStatus::FAILED;
                t.message = pu::trim(failure_text.substr(0, failure_text.find('\n')));
                t.details = pu::cap_details(failure_text);
            } else if (status == "NOTRUN" || result == "SKIPPED" || result == "SUPPRESSED") {
                t.status = TestStatus::SKIPPED;
            } else {
                t.status = TestStatus::PASSED;
            }
            tests.push_back(std::move(t));
        });
    });
    return report_from_tests(std::move(tests), jm::get_int_or(root, "tests", 0));
}

bool looks_like_pytest(json_object* root) {
    if (jm::has(root, "exitcode") && jm::has(root, "summary")) return true;
    json_object* first = first_object(jm::get_array(root, "tests"));
    return first && jm::has(first, "nodeid");
}

bool looks_like_canonical(json_object* root) {
    json_object* summary = jm::get_object(root, "summary");
    return summary && jm::has(summary, "total") && jm::get_array(root, "tests") &&
           jm::get_string(root, "status").has_value();
}

bool looks_like_gtest(json_object* root) {
    json_object* first = first_object(jm::get_array(root, "testsuites"));
    return first && jm::get_array(first, "testsuite");
}

} // namespace

TestReport parse_json_report(const std::string& json) {
    jm::Doc d = jm::parse(pu::strip_bom(json));
    if (!d || !json_object_is_type(d.root, json_type_object)) return unknown_report();
    json_object* root = d.root;

    if (jm::has(root, "numTotalTests")) return parse_jest_json(root);
    if (jm::get_array(root, "examples") && jm::get_object(root, "summary")) return parse_rspec_json(root);
    if (jm::get_object(root, "stats") && jm::has(root, "passes")) return parse_mocha_json(root);
    if (looks_like_gtest(root)) return parse_gtest_json(root);
    if (looks_like_pytest(root)) return parse_pytest_json(root);
    if (looks_like_canonical(root)) {
        TestReport r;
        if (report_from_json(root, &r)) return r;
    }
    return unknown_report();
}

} // namespace patchbench
