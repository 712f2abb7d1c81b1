#include "test_common.h"

#include "patchbench/language.h"
#include "patchbench/task.h"

using namespace patchbench;

static const char* kTestPatch =
    "diff --git a/tests/test_calc.py b/tests/test_calc.py\n"
    "--- a/tests/test_calc.py\n"
    "+++ b/tests/test_calc.py\n"
    "@@ -1 +1,3 @@\n"
    "+def test_add():\n"
    "+    assert add(1, 2) == 3\n"
    "diff --git a/tests/test_a b.py b/tests/test_a b.py\n"
    "new file mode 100644\n"
    "--- /dev/null\n"
    "+++ b/tests/test_a b.py\n"
    "@@ -0,0 +1 @@\n"
    "+pass\n"
    "diff --git a/docs/usage.md b/docs/usage.md\n"
    "--- a/docs/usage.md\n"
    "+++ b/docs/usage.md\n"
    "@@ -1 +1 @@\n"
    "-old\n"
    "+new\n"
    "diff --git a/tests/test_old.py b/tests/test_old.py\n"
    "deleted file mode 100644\n"
    "--- a/tests/test_old.py\n"
    "+++ /dev/null\n";

int main() {
    // Defaults from the language profile
    Task t;
    std::string err;
    expect_true(parse_task(R"({"repo": "acme/calc", "base_commit": "0123456789abcdef", "extra": [1, 2]})", &t, &err),
                "minimal record: " + err);
    const LanguageProfile& py = language_or_throw("python");
    expect_eq_str(t.language, "python", "python default");
    expect_eq_str(t.image_name, py.default_image, "default image");
    expect_eq_str(t.command_build, py.default_build_command, "default build");
    expect_eq_str(t.command_test, py.default_test_command, "default test");
    expect_eq_ll(t.timeout_build, kDefaultBuildTimeoutSec, "default build timeout");
    expect_eq_ll(t.timeout_test, kDefaultTestTimeoutSec, "default test timeout");
    expect_true(!t.repo_build.has_value(), "no repo_build");
    expect_true(t.raw_json.find("\"extra\"") != std::string::npos, "unknown fields kept");

    // Aliases and explicit values
    Task a;
    expect_true(parse_task(R"({"repo_name": "acme/svc", "base_commit": "feedbeef", "lang": "golang",
                               "build_command": "go build ./...", "test_command": "go test ./...",
                               "build_timeout": 42, "test_timeout": "90", "repo_build": 1})",
                           &a, &err),
                "aliased record: " + err);
    expect_eq_str(a.repo, "acme/svc", "repo_name alias");
    expect_eq_str(a.language, "go", "language alias canonicalised");
    expect_eq_str(a.command_build, "go build ./...", "build_command alias");
    expect_eq_ll(a.timeout_build, 42, "build_timeout alias");
    expect_eq_ll(a.timeout_test, 90, "numeric string timeout");
    expect_true(a.repo_build && *a.repo_build == 1, "repo_build read");

    // Timeouts and repo_build outside the int range fall back to the defaults
    Task huge;
    expect_true(parse_task(R"({"repo": "r", "base_commit": "c", "test_timeout": 1e12,
                               "build_timeout": "1e300", "repo_build": -1e10})",
                           &huge, &err),
                "oversized numbers accepted: " + err);
    expect_eq_ll(huge.timeout_test, kDefaultTestTimeoutSec, "1e12 test timeout ignored");
    expect_eq_ll(huge.timeout_build, kDefaultBuildTimeoutSec, "1e300 build timeout ignored");
    expect_true(!huge.repo_build.has_value(), "out of range repo_build ignored");
    Task inf;
    expect_true(parse_task(R"({"repo": "r", "base_commit": "c", "timeout_test": "inf", "test_timeout": 77})",
                           &inf, &err),
                "infinite timeout accepted: " + err);
    expect_eq_ll(inf.timeout_test, 77, "infinite value skipped for the next alias");

    Task nullrb;
    expect_true(parse_task(R"({"repo": "r", "base_commit": "c", "repo_build": null})", &nullrb, &err), "null repo_build");
    expect_true(!nullrb.repo_build.has_value(), "null repo_build ignored");

    // Rejections
    Task bad;
    expect_true(!parse_task("not json", &bad, &err), "not json");
    expect_true(!parse_task("[1]", &bad, &err), "not an object");
    expect_true(!parse_task(R"({"repo": "acme/calc"})", &bad, &err), "missing base_commit");
    expect_true(!parse_task(R"({"repo": "r", "base_commit": "c", "language": "cobol"})", &bad, &err), "cobol");
    expect_true(err.find("cobol") != std::string::npos, "language named in error");

    // task_id: deterministic, sensitive to configuration, readable prefix
    Task t2;
    expect_true(parse_task(R"({"base_commit": "0123456789abcdef", "repo": "acme/calc"})", &t2, &err), "reordered");
    expect_eq_str(t.task_id, t2.task_id, "key order does not matter");
    expect_true(t.task_id.rfind("calc-cdef-", 0) == 0, "name and commit tail prefix: " + t.task_id);
    expect_eq_ll((long long)t.task_id.size(), (long long)std::string("calc-cdef-").size() + 8, "8 hex digest");
    Task t3;
    expect_true(parse_task(R"({"repo": "acme/calc", "base_commit": "0123456789abcdef", "patch": "x"})", &t3, &err),
                "with patch");
    expect_true(t3.task_id != t.task_id, "patch changes the id");
    Task t4 = t;
    t4.repo = "https://github.com/acme/calc.git";
    expect_true(compute_task_id(t4).rfind("calc-cdef-", 0) == 0, "url repo name");

    // Test files touched by a diff
    auto files = test_files_from_patch(kTestPatch, py);
    expect_eq_ll((long long)files.size(), 2, "two python test files");
    expect_eq_str(files[0], "tests/test_a b.py", "sorted first");
    expect_eq_str(files[1], "tests/test_calc.py", "sorted second");
    expect_true(test_files_from_patch("diff --git a/x.png b/x.png\nBinary files a/x.png and b/x.png differ\n", py).empty(),
                "binary diff");
    expect_true(test_files_from_patch("", py).empty(), "empty diff");

    // {test_files} substitution
    Task p = t;
    p.test_patch = kTestPatch;
    p.command_test = "pytest -rA {test_files}";
    std::string cmd;
    expect_true(resolve_test_command(p, py, &cmd, &err), "placeholder resolved");
    expect_eq_str(cmd, "pytest -rA 'tests/test_a b.py' tests/test_calc.py", "quoted and joined");
    p.test_patch = "";
    expect_true(!resolve_test_command(p, py, &cmd, &err), "no test files");
    expect_eq_str(err, "No suitable test files in test_patch", "error text");
    p.command_test = "pytest";
    expect_true(resolve_test_command(p, py, &cmd, &err), "no placeholder");
    expect_eq_str(cmd, "pytest", "command untouched");

    std::cerr << "test_task: ALL PASSED" << std::endl;
    return 0;
}
