#include "test_common.h"
#include "fake_backend.h"

#include "patchbench/errors.h"
#include "patchbench/language.h"
#include "patchbench/proc.h"
#include "patchbench/repository.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace patchbench;
namespace fs = std::filesystem;

static void write_file(const fs::path& p, const std::string& body) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << body;
}

static std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static bool git_available() {
    ProcLimits lim;
    lim.timeout_ms = 10000;
    ProcResult r;
    return proc_run_capture({"git", "--version"}, "", lim, &r) && r.exit_code == 0;
}

static std::string run_git(const fs::path& cwd, const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"git", "-c", "user.name=patchbench", "-c", "user.email=patchbench@localhost",
                                     "-c", "commit.gpgsign=false"};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcLimits lim;
    lim.timeout_ms = 30000;
    ProcResult r;
    if (!proc_run_capture(argv, cwd.string(), lim, &r) || r.exit_code != 0) {
        die("git " + args.front() + " failed: " + r.stderr_text + r.error);
    }
    std::string out = r.stdout_text;
    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

static const char* kPytestReport = R"({"exitcode": 1, "summary": {"collected": 2},
  "tests": [{"nodeid": "tests/test_calc.py::test_add", "outcome": "passed"},
            {"nodeid": "tests/test_calc.py::test_sub", "outcome": "failed"}]})";

int main() {
    const LanguageProfile& py = language_or_throw("python");
    const fs::path root = fs::temp_directory_path() / "patchbench_test_repository";
    fs::remove_all(root);

    RepositoryOptions opt;
    opt.cache_root = (root / "cache").string();
    opt.cache_mode = CacheMode::VOLUME;

    // Resource names
    expect_eq_str(normalize_resource_name("Acme/Calc.Lib"), "acme-calc.lib", "repo id");
    expect_eq_str(normalize_resource_name("--Foo__Bar.."), "foo_bar", "separators collapsed");
    expect_eq_str(normalize_resource_name("!!!"), "repo", "empty falls back");
    expect_eq_str(clone_url_for("acme/calc", "https://github.com"), "https://github.com/acme/calc", "github url");
    expect_eq_str(clone_url_for("/srv/git/calc", "https://github.com/"), "/srv/git/calc", "local path as is");
    expect_eq_str(clone_url_for("git@host:acme/calc.git", "https://github.com/"), "git@host:acme/calc.git", "ssh as is");
    {
        FakeBackend backend;
        RepositoryHandle h(py, "Acme/Calc.Lib", "ABCDEF0123456789ABCDEF0123456789ABCDEF01", "", backend, opt);
        expect_eq_str(h.container_name(), "patchbench-acme-calc.lib-abcdef012345", "container name");
        expect_eq_str(h.built_image_name(), "patchbench-acme-calc.lib:abcdef012345", "built image name");
        expect_eq_str(h.image(), py.default_image, "profile image by default");
        expect_eq_str(h.workdir().string(), (fs::path(opt.cache_root) / "repos" / "acme-calc.lib-abcdef012345").string(),
                      "workdir keyed by repo and commit");
        expect_true(h.state() == HandleState::UNBUILT, "starts unbuilt");

        bool rejected = false;
        try {
            h.run_test("pytest", 10);
        } catch (const Error& e) {
            rejected = e.kind() == ErrorKind::INTERNAL;
        }
        expect_true(rejected, "tests need a built handle");
    }

    if (!git_available()) {
        std::cerr << "test_repository: git not available, lifecycle checks SKIPPED" << std::endl;
        std::cerr << "test_repository: ALL PASSED" << std::endl;
        return 0;
    }

    const fs::path upstream = root / "upstream" / "calc";
    fs::create_directories(upstream);
    run_git(upstream, {"init", "--quiet"});
    write_file(upstream / "calc.py", "def add(a, b):\n    return a - b\n");
    run_git(upstream, {"add", "."});
    run_git(upstream, {"commit", "--quiet", "-m", "initial"});
    const std::string commit = run_git(upstream, {"rev-parse", "HEAD"});

    FakeBackend backend;
    int builds = 0;
    bool test_timeout = false;
    bool write_report = true;
    backend.on_exec = [&](const std::string& cmd, const std::string& host) {
        ExecOutput out;
        if (cmd.find("rm -rf report_pytest.json") != std::string::npos) {
            std::error_code ec;
            fs::remove(fs::path(host) / "report_pytest.json", ec);
        }
        if (cmd.find("pip install") != std::string::npos) {
            builds++;
            out.stdout_text = "Successfully installed calc\n";
            return out;
        }
        if (test_timeout) {
            ExecOutput partial;
            partial.stdout_text = "tests/test_calc.py::test_add PASSED\n";
            throw TimeoutError("deadline", partial);
        }
        if (write_report) {
            write_file(fs::path(host) / "report_pytest.json", kPytestReport);
        } else {
            out.stdout_text = "tests/test_calc.py::test_add PASSED\n=== 1 passed in 0.01s ===\n";
        }
        out.return_code = 1;
        return out;
    };

    RepositoryHandle h(py, upstream.string(), commit, "", backend, opt);
    expect_true(!h.was_built(), "nothing built yet");

    // Build commits a reusable image
    ExecutionResult b = h.build("pip install -e .", 60);
    expect_eq_ll(b.return_code, 0, "build ok");
    expect_true(!b.report.has_value(), "builds carry no report");
    expect_true(h.state() == HandleState::BUILT, "built state");
    expect_eq_ll((long long)backend.commits.size(), 1, "image committed");
    expect_eq_str(backend.commits[0], h.built_image_name(), "committed under built name");
    expect_eq_str(h.image(), h.built_image_name(), "built image adopted");
    expect_eq_str(backend.starts[0].image, py.default_image, "build ran on the base image");
    expect_eq_str(backend.starts[0].mounts.at(kSandboxWorkdir).host_path, h.workdir().string(), "tree mounted");
    expect_true(backend.volumes.count("patchbench-python-pip") == 1, "pip cache volume created");
    expect_eq_ll(backend.stops, 1, "build container removed");
    expect_true(h.was_built(), "reusable after build");
    expect_eq_str(read_file(h.workdir() / "calc.py"), "def add(a, b):\n    return a - b\n", "tree at commit");

    // Test run parses the produced report
    ExecutionResult t = h.run_test("pytest --json-report --json-report-file=report_pytest.json", 60);
    expect_eq_ll(t.return_code, 1, "test exit code");
    expect_true(t.report.has_value(), "report attached");
    expect_eq_ll(t.report->summary.total, 2, "report total");
    expect_eq_ll(t.report->summary.failed, 1, "report failed");
    expect_eq_str(backend.starts.back().image, h.built_image_name(), "tests run on the built image");
    expect_true(backend.commands.back().rfind("rm -rf ", 0) == 0, "stale reports purged first");
    expect_true(h.state() == HandleState::BUILT, "back to built");

    // No artifact: console output is parsed instead
    write_report = false;
    ExecutionResult c = h.run_test("pytest -rA", 60);
    expect_eq_ll(c.report->summary.total, 1, "console fallback");
    expect_true(c.report->status == ReportStatus::PASSED, "console fallback status");

    // A test deadline is a result, not an exception
    test_timeout = true;
    ExecutionResult to = h.run_test("pytest", 1);
    expect_eq_ll(to.return_code, kTimeoutReturnCode, "timeout code");
    expect_eq_str(to.stderr_text, kTimeoutStderr, "timeout stderr");
    expect_true(to.error_kind == ErrorKind::TIMEOUT, "timeout kind");
    expect_true(to.stdout_text.find("test_add") != std::string::npos, "partial stdout kept");
    expect_true(h.state() == HandleState::BUILT, "handle usable after timeout");
    test_timeout = false;

    // Patches go through the host tree; clean undoes them
    h.apply_patch("diff --git a/calc.py b/calc.py\n--- a/calc.py\n+++ b/calc.py\n@@ -1,2 +1,2 @@\n"
                  " def add(a, b):\n-    return a - b\n+    return a + b\n");
    expect_true(read_file(h.workdir() / "calc.py").find("a + b") != std::string::npos, "patch applied");
    h.clean();
    expect_true(read_file(h.workdir() / "calc.py").find("a - b") != std::string::npos, "clean restores");

    // A second handle on the same checkout reuses the image
    {
        FakeBackend again;
        again.images = backend.images;
        RepositoryHandle h2(py, upstream.string(), commit, "", again, opt);
        expect_true(h2.was_built(), "marker plus image means reusable");
        h2.adopt_built_image();
        expect_true(h2.state() == HandleState::BUILT, "adopted");
        expect_eq_str(h2.image(), h2.built_image_name(), "adopted image");

        FakeBackend no_image;
        RepositoryHandle h3(py, upstream.string(), commit, "", no_image, opt);
        expect_true(!h3.was_built(), "image gone means rebuild");

        RepositoryOptions no_reuse = opt;
        no_reuse.reuse_images = false;
        RepositoryHandle h4(py, upstream.string(), commit, "", again, no_reuse);
        expect_true(!h4.was_built(), "reuse disabled");
    }

    // Failing build: no snapshot, failed state, result returned
    {
        FakeBackend fb;
        fb.on_exec = [](const std::string&, const std::string&) {
            ExecOutput out;
            out.stderr_text = "error: no setup.py\n";
            out.return_code = 1;
            return out;
        };
        RepositoryHandle hf(py, upstream.string(), commit, "", fb, opt);
        ExecutionResult r = hf.build("pip install -e .", 60);
        expect_eq_ll(r.return_code, 1, "failing build code");
        expect_true(fb.commits.empty(), "failed build not committed");
        expect_true(hf.state() == HandleState::FAILED, "failed state");
    }

    // Build deadline: exception with the timeout marker appended, container removed
    {
        FakeBackend tb;
        tb.on_exec = [](const std::string&, const std::string&) -> ExecOutput {
            ExecOutput partial;
            partial.stderr_text = "Collecting numpy\n";
            throw TimeoutError("deadline", partial);
        };
        RepositoryHandle ht(py, upstream.string(), commit, "", tb, opt);
        bool threw = false;
        try {
            ht.build("pip install -e .", 1);
        } catch (const TimeoutError& e) {
            threw = true;
            expect_eq_str(e.partial().stderr_text, "Collecting numpy\nTimeout exception", "timeout marker appended");
            expect_eq_ll(e.partial().return_code, kTimeoutReturnCode, "build timeout code");
        }
        expect_true(threw, "build timeout thrown");
        expect_eq_ll(tb.stops, 1, "container removed after timeout");
        expect_true(ht.state() == HandleState::FAILED, "timed out build fails the handle");
    }

    // Snapshots disabled: later runs keep the base image
    {
        FakeBackend nb;
        RepositoryOptions no_commit = opt;
        no_commit.commit_images = false;
        RepositoryHandle hn(py, upstream.string(), commit, "python:3.12", nb, no_commit);
        hn.build("pip install .", 60);
        expect_true(nb.commits.empty(), "no commit");
        expect_eq_str(hn.image(), "python:3.12", "explicit image kept");
    }

    // Unreachable repository
    {
        FakeBackend gb;
        RepositoryHandle hg(py, (root / "no-such-repo").string(), commit, "", gb, opt);
        bool git_failed = false;
        try {
            hg.prepare();
        } catch (const GitError&) {
            git_failed = true;
        }
        expect_true(git_failed, "missing repository is a git error");
        expect_true(hg.state() == HandleState::FAILED, "failed after git error");
    }

    fs::remove_all(root);
    std::cerr << "test_repository: ALL PASSED" << std::endl;
    return 0;
}
