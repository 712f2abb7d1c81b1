#include "test_common.h"

#include "patchbench/proc.h"

#include <climits>
#include <filesystem>

using namespace patchbench;
namespace fs = std::filesystem;

int main() {
    ProcLimits lim;
    lim.timeout_ms = 10000;

    // stdout and stderr captured separately, exit code preserved
    ProcResult r;
    expect_true(proc_run_capture({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, "", lim, &r), "start sh");
    expect_eq_str(r.stdout_text, "out\n", "stdout");
    expect_eq_str(r.stderr_text, "err\n", "stderr");
    expect_eq_ll(r.exit_code, 3, "exit code");
    expect_true(!r.timed_out, "no timeout");

    // cwd honoured
    const fs::path dir = fs::temp_directory_path() / "patchbench_test_proc";
    fs::remove_all(dir);
    fs::create_directories(dir);
    expect_true(proc_run_capture({"/bin/sh", "-c", "pwd"}, dir.string(), lim, &r), "start pwd");
    expect_eq_str(r.stdout_text, fs::canonical(dir).string() + "\n", "cwd");

    // stdin fed and closed
    expect_true(proc_run_capture_stdin({"cat"}, "", "line one\nline two\n", lim, &r), "start cat");
    expect_eq_str(r.stdout_text, "line one\nline two\n", "stdin echoed");
    expect_true(proc_run_capture_stdin({"cat"}, "", "", lim, &r), "empty stdin");
    expect_eq_str(r.stdout_text, "", "empty stdin closes immediately");

    // deadline kills the process group and keeps the partial output
    ProcLimits short_lim;
    short_lim.timeout_ms = 300;
    expect_true(proc_run_capture({"/bin/sh", "-c", "echo started; sleep 5 & wait"}, "", short_lim, &r),
                "start sleeper");
    expect_true(r.timed_out, "timed out");
    expect_eq_str(r.stdout_text, "started\n", "partial output kept");
    expect_true(r.duration_ms < 4000, "killed promptly");

    // output cap
    ProcLimits capped;
    capped.stdout_max_bytes = 10;
    expect_true(proc_run_capture({"/bin/sh", "-c", "printf '0123456789abcdef'"}, "", capped, &r), "start printf");
    expect_true(r.stdout_truncated, "truncated flag");
    expect_true(r.stdout_text.size() <= 10 + 64, "stdout capped");

    // missing binary: fork succeeds, exec fails
    expect_true(proc_run_capture({"patchbench-no-such-binary"}, "", lim, &r), "fork ok");
    expect_eq_ll(r.exit_code, 127, "exec failure code");
    expect_true(!proc_run_capture({}, "", lim, &r), "empty argv rejected");
    expect_true(!r.error.empty(), "runner error recorded");

    // second deadlines saturate instead of overflowing int milliseconds
    expect_eq_ll(deadline_ms(0), 0, "zero disables");
    expect_eq_ll(deadline_ms(-5), 0, "negative disables");
    expect_eq_ll(deadline_ms(30), 30000, "seconds scaled");
    expect_eq_ll(deadline_ms(3000000), INT_MAX, "3e6 s saturates");
    expect_eq_ll(deadline_ms(1000000000000LL), INT_MAX, "1e12 s saturates");

    // quoting helpers
    auto argv = split_argv_quoted("git apply --whitespace=nowarn 'a b' \"c \\\"d\\\"\"");
    expect_eq_ll((long long)argv.size(), 5, "split count");
    expect_eq_str(argv[3], "a b", "single quoted");
    expect_eq_str(argv[4], "c \"d\"", "double quoted with escapes");
    expect_eq_str(shell_quote("it's"), "'it'\\''s'", "shell_quote embedded quote");
    expect_true(proc_run_capture({"/bin/sh", "-c", "printf %s " + shell_quote("a b;$x")}, "", lim, &r), "quoted run");
    expect_eq_str(r.stdout_text, "a b;$x", "quoted argument survives the shell");

    fs::remove_all(dir);
    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
