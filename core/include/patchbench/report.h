#pragma once
#include "types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace patchbench {

// Bring a parsed report into canonical shape:
// - summary derived from tests when no aggregate count was parsed
// - passed repaired so passed + failed + errors + skipped == total
// - status: unknown iff total == 0, failed iff failed + errors > 0
// - collected >= total
void finalize_report(TestReport& r);

// Build a finalized report from per-test entries only.
TestReport report_from_tests(std::vector<TestCase> tests, int64_t collected = 0);

// Field-wise sum of summaries, concatenation of tests, recomputed status.
TestReport merge_reports(const std::vector<TestReport>& reports);

// No test evidence. collected may still record discovered tests.
TestReport unknown_report(int64_t collected = 0);

// "classname.name" when the test carries a classname, else name.
std::string qualified_name(const TestCase& t);

json_object* report_to_json(const TestReport& r);
// Accepts the canonical {summary, tests, status} shape. Returns false if o is not an object.
bool report_from_json(json_object* o, TestReport* out);

json_object* execution_result_to_json(const ExecutionResult& r);

} // namespace patchbench
