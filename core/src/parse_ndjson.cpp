#include "patchbench/parsers.h"
#include "patchbench/json_mini.h"
#include "patchbench/report.h"
#include "parse_util.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace patchbench {

namespace jm = json_mini;
namespace pu = parse_util;

namespace {

struct GoTestState {
    bool terminal{false};
    TestCase tc;
    std::string output; // captured "output" events, kept for failures only
};

struct GoPackageState {
    bool had_tests{false};
    bool failed{false};
    std::string output;
};

} // namespace

// Fold `go test -json` events into one status per (package, test). Only the
// terminal actions pass/fail/skip decide a status; "run" marks the test as
// collected; "output" lines are attached to failures.
TestReport parse_go_test_events(const std::string& ndjson) {
    using Key = std::pair<std::string, std::string>;
    std::map<Key, GoTestState> tests;
    std::vector<Key> order;
    std::map<std::string, GoPackageState> packages;
    std::vector<std::string> package_order;

    for (const auto& raw : pu::split_lines(pu::strip_bom(ndjson))) {
        const std::string line = pu::trim(raw);
        if (line.empty() || line[0] != '{') continue; // interleaved compiler output
        jm::Doc d = jm::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) continue;

        const std::string action = jm::get_string_or(d.root, "Action", "");
        const std::string pkg = jm::get_string_or(d.root, "Package", "");
        const std::string test = jm::get_string_or(d.root, "Test", "");
        if (action.empty()) continue;

        if (!packages.count(pkg)) package_order.push_back(pkg);
        GoPackageState& ps = packages[pkg];

        if (test.empty()) {
            if (action == "fail") ps.failed = true;
            else if (action == "output") ps.output += jm::get_string_or(d.root, "Output", "");
            continue;
        }

        ps.had_tests = true;
        Key key{pkg, test};
        auto it = tests.find(key);
        if (it == tests.end()) {
            it = tests.emplace(key, GoTestState{}).first;
            it->second.tc.name = test;
            it->second.tc.classname = pkg;
            order.push_back(key);
        }
        GoTestState& st = it->second;

        if (action == "output") {
            st.output += jm::get_string_or(d.root, "Output", "");
        } else if (action == "pass" || action == "fail" || action == "skip") {
            st.terminal = true;
            st.tc.time = jm::get_number(d.root, "Elapsed").value_or(0.0);
            if (action == "pass") st.tc.status = TestStatus::PASSED;
            else if (action == "fail") st.tc.status = TestStatus::FAILED;
            else st.tc.status = TestStatus::SKIPPED;
        }
    }

    std::vector<TestCase> out;
    for (const auto& key : order) {
        GoTestState& st = tests[key];
        if (!st.terminal) continue; // aborted mid-run: collected, not counted
        if (st.tc.status == TestStatus::FAILED) {
            st.tc.details = pu::cap_details(st.output);
            st.tc.message = "test failed";
        }
        out.push_back(std::move(st.tc));
    }
    // a package that fails without running any test did not compile
    for (const auto& pkg : package_order) {
        const GoPackageState& ps = packages[pkg];
        if (!ps.failed || ps.had_tests) continue;
        TestCase t;
        t.name = pkg;
        t.status = TestStatus::ERROR;
        t.message = "package failed without running tests";
        t.details = pu::cap_details(ps.output);
        out.push_back(std::move(t));
    }
    return report_from_tests(std::move(out), (int64_t)order.size());
}

} // namespace patchbench
