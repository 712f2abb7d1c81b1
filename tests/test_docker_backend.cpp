#include "test_common.h"

#include "patchbench/docker_backend.h"
#include "patchbench/errors.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace patchbench;
namespace fs = std::filesystem;

// A stand-in docker CLI: logs its argv, runs exec'd commands on the host and
// fails on demand when marker files exist next to it.
static fs::path write_fake_docker(const fs::path& dir) {
    const fs::path bin = dir / "docker";
    std::ofstream f(bin, std::ios::trunc);
    f << "#!/bin/sh\n"
      << "D='" << dir.string() << "'\n"
      << "echo \"$*\" >> \"$D/calls.log\"\n"
      << "case \"$1\" in\n"
      << "  run)\n"
      << "    if [ -f \"$D/fail_run\" ]; then echo 'Unable to find image' >&2; exit 125; fi\n"
      << "    echo 0123456789abcdef; exit 0 ;;\n"
      << "  rm) echo 'Error: No such container' >&2; exit 1 ;;\n"
      << "  exec) shift 4; exec \"$@\" ;;\n"
      << "  commit)\n"
      << "    n=$(cat \"$D/commit_failures\" 2>/dev/null || echo 0)\n"
      << "    if [ \"$n\" -gt 0 ]; then echo $((n - 1)) > \"$D/commit_failures\"; echo 'commit error' >&2; exit 1; fi\n"
      << "    exit 0 ;;\n"
      << "  volume)\n"
      << "    if [ \"$2\" = create ] && [ -f \"$D/volume_race\" ]; then exit 1; fi\n"
      << "    exit 0 ;;\n"
      << "  image) if [ \"$5\" = present:tag ]; then echo sha256:1; exit 0; fi; exit 1 ;;\n"
      << "  rmi) exit 0 ;;\n"
      << "esac\n"
      << "exit 2\n";
    f.close();
    fs::permissions(bin, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return bin;
}

static std::string read_log(const fs::path& dir) {
    std::ifstream f(dir / "calls.log");
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

int main() {
    const fs::path dir = fs::temp_directory_path() / "patchbench_test_docker_backend";
    fs::remove_all(dir);
    fs::create_directories(dir);

    DockerOptions opt;
    opt.docker_bin = write_fake_docker(dir).string();
    opt.commit_retries = 3;
    opt.commit_retry_delay_ms = 0;
    opt.control_timeout_sec = 30;

    SandboxSpec spec;
    spec.image = "python:3.11";
    spec.name = "patchbench-calc-0123456789ab";
    BindSpec tree;
    tree.host_path = "/cache/repos/calc";
    spec.mounts[kSandboxWorkdir] = tree;
    BindSpec pip;
    pip.volume_name = "patchbench-python-pip";
    spec.mounts["/root/.cache/pip"] = pip;
    spec.env = {{"PIP_CACHE_DIR", "/root/.cache/pip"}};
    spec.shm_size = "2g";

    // run arguments
    auto args = docker_run_args(spec);
    std::string joined;
    for (const auto& a : args) joined += a + " ";
    expect_true(joined.rfind("run -d --name patchbench-calc-0123456789ab --shm-size 2g ", 0) == 0, "run prefix");
    expect_true(contains(joined, "-v /cache/repos/calc:/run_dir "), "tree bind");
    expect_true(contains(joined, "-v patchbench-python-pip:/root/.cache/pip "), "volume mount");
    expect_true(contains(joined, "-e PIP_CACHE_DIR=/root/.cache/pip "), "env");
    expect_true(contains(joined, "-w /run_dir python:3.11 /bin/sh -c tail -f /dev/null"), "keepalive command");
    expect_true(!contains(joined, "--cpus"), "no cpu limit unless set");

    {
        DockerCliBackend backend(opt);
        backend.start(spec);
        expect_true(backend.running(), "running after start");
        const std::string log = read_log(dir);
        expect_true(log.rfind("rm -f patchbench-calc-0123456789ab\nrun -d", 0) == 0, "stale container removed first");

        // exec runs through the requested shell, exit codes pass through
        ExecOutput out = backend.exec("echo hello; echo oops 1>&2; exit 4", "sh", 30);
        expect_eq_str(out.stdout_text, "hello\n", "exec stdout");
        expect_eq_str(out.stderr_text, "oops\n", "exec stderr");
        expect_eq_ll(out.return_code, 4, "exec exit code");
        expect_true(contains(read_log(dir), "exec -w /run_dir patchbench-calc-0123456789ab sh -c echo hello"),
                    "exec argv");

        // timeout surfaces as TimeoutError with the partial output
        bool timed_out = false;
        try {
            backend.exec("echo partial; sleep 10", "sh", 1);
        } catch (const TimeoutError& e) {
            timed_out = true;
            expect_eq_str(e.partial().stdout_text, "partial\n", "partial stdout");
            expect_eq_ll(e.partial().return_code, kTimeoutReturnCode, "timeout code");
            expect_true(e.kind() == ErrorKind::TIMEOUT, "timeout kind");
        }
        expect_true(timed_out, "exec timeout thrown");

        // commit retried until it succeeds
        {
            std::ofstream(dir / "commit_failures") << "2";
        }
        backend.commit_image("patchbench-calc:0123456789ab");
        const std::string after_commit = read_log(dir);
        size_t commits = 0;
        for (size_t pos = 0; (pos = after_commit.find("commit patchbench-calc", pos)) != std::string::npos; pos++) {
            commits++;
        }
        expect_eq_ll((long long)commits, 3, "two failures then success");

        // exhausted retries
        {
            std::ofstream(dir / "commit_failures") << "5";
        }
        bool commit_failed = false;
        try {
            backend.commit_image("patchbench-calc:0123456789ab");
        } catch (const SandboxCommitFailed& e) {
            commit_failed = true;
            expect_true(contains(e.what(), "after 3 attempts"), "attempt count in message");
        }
        expect_true(commit_failed, "commit gives up");

        backend.stop();
        expect_true(!backend.running(), "stopped");
        bool exec_failed = false;
        try {
            backend.exec("true", "sh", 5);
        } catch (const SandboxError&) {
            exec_failed = true;
        }
        expect_true(exec_failed, "exec after stop rejected");
    }

    // start failure cleans up and throws
    {
        std::ofstream(dir / "fail_run") << "1";
        DockerCliBackend backend(opt);
        bool start_failed = false;
        try {
            backend.start(spec);
        } catch (const SandboxStartFailed& e) {
            start_failed = true;
            expect_true(contains(e.what(), "Unable to find image"), "runtime message kept");
        }
        expect_true(start_failed, "start failure thrown");
        expect_true(!backend.running(), "not running after failed start");
        fs::remove(dir / "fail_run");
    }

    // volumes and images
    {
        DockerCliBackend backend(opt);
        backend.create_volume("patchbench-python-pip");
        std::ofstream(dir / "volume_race") << "1";
        backend.create_volume("patchbench-python-pip"); // inspect fallback
        expect_true(contains(read_log(dir), "volume inspect patchbench-python-pip"), "existing volume accepted");
        expect_true(backend.image_exists("present:tag"), "image present");
        expect_true(!backend.image_exists("absent:tag"), "image absent");
        backend.remove_image("present:tag");
    }

    // a missing CLI binary behaves like a failing command
    {
        DockerOptions missing = opt;
        missing.docker_bin = (dir / "no-such-docker").string();
        DockerCliBackend backend(missing);
        expect_true(!backend.image_exists("x:y"), "exec failure exit 127 treated as absent");
    }

    fs::remove_all(dir);
    std::cerr << "test_docker_backend: ALL PASSED" << std::endl;
    return 0;
}
