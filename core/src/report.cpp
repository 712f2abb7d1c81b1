#include "patchbench/report.h"
#include "patchbench/json_mini.h"

#include <algorithm>

namespace patchbench {

namespace jm = json_mini;

static TestSummary count_tests(const std::vector<TestCase>& tests) {
    TestSummary s;
    for (const auto& t : tests) {
        switch (t.status) {
            case TestStatus::PASSED:  s.passed++; break;
            case TestStatus::FAILED:  s.failed++; break;
            case TestStatus::SKIPPED: s.skipped++; break;
            case TestStatus::ERROR:   s.errors++; break;
        }
    }
    s.total = (int64_t)tests.size();
    return s;
}

void finalize_report(TestReport& r) {
    TestSummary& s = r.summary;
    s.failed = std::max<int64_t>(0, s.failed);
    s.errors = std::max<int64_t>(0, s.errors);
    s.skipped = std::max<int64_t>(0, s.skipped);
    s.passed = std::max<int64_t>(0, s.passed);

    if (s.total <= 0 && s.passed + s.failed + s.errors + s.skipped == 0 && !r.tests.empty()) {
        int64_t collected = s.collected;
        s = count_tests(r.tests);
        s.collected = collected;
    }

    const int64_t non_passing = s.failed + s.errors + s.skipped;
    if (s.total <= 0) {
        s.total = s.passed + non_passing;
    } else if (non_passing > s.total) {
        // counters from different summary lines overshoot the stated total
        s.total = s.passed + non_passing;
    } else {
        s.passed = s.total - non_passing;
    }

    s.collected = std::max(s.collected, s.total);

    if (s.total == 0) r.status = ReportStatus::UNKNOWN;
    else if (s.failed + s.errors > 0) r.status = ReportStatus::FAILED;
    else r.status = ReportStatus::PASSED;
}

TestReport report_from_tests(std::vector<TestCase> tests, int64_t collected) {
    TestReport r;
    r.tests = std::move(tests);
    r.summary.collected = collected;
    finalize_report(r);
    return r;
}

TestReport merge_reports(const std::vector<TestReport>& reports) {
    TestReport out;
    for (const auto& r : reports) {
        out.summary.total += r.summary.total;
        out.summary.passed += r.summary.passed;
        out.summary.failed += r.summary.failed;
        out.summary.skipped += r.summary.skipped;
        out.summary.errors += r.summary.errors;
        out.summary.collected += r.summary.collected;
        out.tests.insert(out.tests.end(), r.tests.begin(), r.tests.end());
    }
    finalize_report(out);
    return out;
}

TestReport unknown_report(int64_t collected) {
    TestReport r;
    r.summary.collected = std::max<int64_t>(0, collected);
    r.status = ReportStatus::UNKNOWN;
    return r;
}

std::string qualified_name(const TestCase& t) {
    if (t.classname.empty()) return t.name;
    return t.classname + "." + t.name;
}

json_object* report_to_json(const TestReport& r) {
    json_object* o = json_object_new_object();

    json_object* s = json_object_new_object();
    json_object_object_add(s, "total", json_object_new_int64(r.summary.total));
    json_object_object_add(s, "passed", json_object_new_int64(r.summary.passed));
    json_object_object_add(s, "failed", json_object_new_int64(r.summary.failed));
    json_object_object_add(s, "skipped", json_object_new_int64(r.summary.skipped));
    json_object_object_add(s, "errors", json_object_new_int64(r.summary.errors));
    json_object_object_add(s, "collected", json_object_new_int64(r.summary.collected));
    json_object_object_add(o, "summary", s);

    json_object* arr = json_object_new_array();
    for (const auto& t : r.tests) {
        json_object* tj = json_object_new_object();
        json_object_object_add(tj, "name", jm::new_string(t.name));
        json_object_object_add(tj, "classname", jm::new_string(t.classname));
        json_object_object_add(tj, "time", json_object_new_double(t.time));
        json_object_object_add(tj, "status", json_object_new_string(test_status_to_str(t.status)));
        if (!t.message.empty()) json_object_object_add(tj, "message", jm::new_string(t.message));
        if (!t.details.empty()) json_object_object_add(tj, "details", jm::new_string(t.details));
        json_object_array_add(arr, tj);
    }
    json_object_object_add(o, "tests", arr);
    json_object_object_add(o, "status", json_object_new_string(report_status_to_str(r.status)));
    return o;
}

bool report_from_json(json_object* o, TestReport* out) {
    if (!out || !o || !json_object_is_type(o, json_type_object)) return false;
    *out = TestReport{};

    if (json_object* s = jm::get_object(o, "summary")) {
        out->summary.total = jm::get_int_or(s, "total", 0);
        out->summary.passed = jm::get_int_or(s, "passed", 0);
        out->summary.failed = jm::get_int_or(s, "failed", 0);
        out->summary.skipped = jm::get_int_or(s, "skipped", 0);
        out->summary.errors = jm::get_int_or(s, "errors", 0);
        out->summary.collected = jm::get_int_or(s, "collected", 0);
    }
    if (json_object* arr = jm::get_array(o, "tests")) {
        const size_t n = json_object_array_length(arr);
        for (size_t i = 0; i < n; i++) {
            json_object* tj = json_object_array_get_idx(arr, i);
            if (!tj || !json_object_is_type(tj, json_type_object)) continue;
            TestCase t;
            t.name = jm::get_string_or(tj, "name", "");
            t.classname = jm::get_string_or(tj, "classname", "");
            t.time = jm::get_number(tj, "time").value_or(0.0);
            auto st = test_status_from_str(jm::get_string_or(tj, "status", ""));
            t.status = st ? *st : TestStatus::ERROR;
            t.message = jm::get_string_or(tj, "message", "");
            t.details = jm::get_string_or(tj, "details", "");
            out->tests.push_back(std::move(t));
        }
    }
    finalize_report(*out);
    return true;
}

json_object* execution_result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "stdout", jm::new_string(r.stdout_text));
    json_object_object_add(o, "stderr", jm::new_string(r.stderr_text));
    json_object_object_add(o, "returncode", json_object_new_int(r.return_code));
    json_object_object_add(o, "duration", json_object_new_double(r.duration_sec));
    if (r.report) json_object_object_add(o, "report", report_to_json(*r.report));
    if (r.error_kind != ErrorKind::NONE) {
        json_object_object_add(o, "error_kind", json_object_new_string(error_kind_to_str(r.error_kind)));
        json_object_object_add(o, "error", jm::new_string(r.error));
    }
    return o;
}

} // namespace patchbench
