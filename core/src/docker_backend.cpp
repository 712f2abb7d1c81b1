#include "patchbench/docker_backend.h"
#include "patchbench/errors.h"
#include "patchbench/log.h"

#include <chrono>
#include <thread>
#include <utility>

namespace patchbench {

static std::string first_line(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find('\n', b);
    std::string line = s.substr(b, e == std::string::npos ? std::string::npos : e - b);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    return line;
}

static std::string describe_failure(const ProcResult& r) {
    if (r.timed_out) return "timed out after " + std::to_string(r.duration_ms) + "ms";
    std::string msg = first_line(r.stderr_text);
    if (msg.empty()) msg = first_line(r.stdout_text);
    return "exit " + std::to_string(r.exit_code) + (msg.empty() ? "" : ": " + msg);
}

std::vector<std::string> docker_run_args(const SandboxSpec& spec) {
    std::vector<std::string> a = {"run", "-d", "--name", spec.name};
    if (!spec.shm_size.empty()) {
        a.push_back("--shm-size");
        a.push_back(spec.shm_size);
    }
    if (!spec.cpus.empty()) {
        a.push_back("--cpus");
        a.push_back(spec.cpus);
    }
    if (!spec.memory.empty()) {
        a.push_back("--memory");
        a.push_back(spec.memory);
    }
    for (const auto& [mount_point, b] : spec.mounts) {
        std::string v = (b.is_volume() ? b.volume_name : b.host_path) + ":" + mount_point;
        if (b.read_only) v += ":ro";
        a.push_back("-v");
        a.push_back(v);
    }
    for (const auto& [k, val] : spec.env) {
        a.push_back("-e");
        a.push_back(k + "=" + val);
    }
    a.push_back("-w");
    a.push_back(spec.workdir);
    a.push_back(spec.image);
    // keeps the container alive between execs
    a.push_back("/bin/sh");
    a.push_back("-c");
    a.push_back("tail -f /dev/null");
    return a;
}

DockerCliBackend::DockerCliBackend(DockerOptions opt) : opt_(std::move(opt)) {}

DockerCliBackend::~DockerCliBackend() { stop(); }

ProcResult DockerCliBackend::docker(const std::vector<std::string>& args, int timeout_sec) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(opt_.docker_bin);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcLimits lim;
    lim.timeout_ms = deadline_ms(timeout_sec);
    ProcResult r;
    if (!proc_run_capture(argv, "", lim, &r)) {
        throw SandboxError("cannot run " + opt_.docker_bin + ": " + r.error);
    }
    return r;
}

void DockerCliBackend::start(const SandboxSpec& spec) {
    if (!container_.empty()) stop();

    // idempotent start: a stale container with the same name is removed first
    ProcResult rm = docker({"rm", "-f", spec.name}, opt_.control_timeout_sec);
    if (rm.exit_code != 0 && rm.stderr_text.find("No such container") == std::string::npos) {
        console_line("[sandbox] rm -f " + spec.name + " failed: " + describe_failure(rm));
    }

    ProcResult r = docker(docker_run_args(spec), opt_.control_timeout_sec);
    if (r.timed_out || r.exit_code != 0) {
        // a half-created container would block the next start under this name
        (void)docker({"rm", "-f", spec.name}, opt_.control_timeout_sec);
        throw SandboxStartFailed("docker run " + spec.image + " as " + spec.name + " failed: " + describe_failure(r));
    }
    container_ = spec.name;
    workdir_ = spec.workdir;
}

ExecOutput DockerCliBackend::exec(const std::string& command, const std::string& shell, int timeout_sec) {
    if (container_.empty()) throw SandboxError("exec without a running container");

    std::vector<std::string> argv = {opt_.docker_bin, "exec", "-w", workdir_, container_,
                                     shell.empty() ? "sh" : shell, "-c", command};
    ProcLimits lim;
    lim.timeout_ms = deadline_ms(timeout_sec);
    lim.stdout_max_bytes = opt_.exec_stdout_max_bytes;
    lim.stderr_max_bytes = opt_.exec_stderr_max_bytes;

    ProcResult r;
    if (!proc_run_capture(argv, "", lim, &r)) {
        throw SandboxError("cannot run " + opt_.docker_bin + " exec: " + r.error);
    }

    ExecOutput out;
    out.stdout_text = std::move(r.stdout_text);
    out.stderr_text = std::move(r.stderr_text);
    out.return_code = r.exit_code;
    out.duration_sec = static_cast<double>(r.duration_ms) / 1000.0;
    if (r.timed_out) {
        out.return_code = kTimeoutReturnCode;
        throw TimeoutError("command exceeded " + std::to_string(timeout_sec) + "s in " + container_, std::move(out));
    }
    return out;
}

void DockerCliBackend::commit_image(const std::string& image) {
    if (container_.empty()) throw SandboxError("commit without a running container");

    const int attempts = opt_.commit_retries > 0 ? opt_.commit_retries : 1;
    std::string last;
    for (int attempt = 1; attempt <= attempts; attempt++) {
        ProcResult r = docker({"commit", container_, image}, opt_.control_timeout_sec);
        if (!r.timed_out && r.exit_code == 0) return;
        last = describe_failure(r);
        console_line("[sandbox] commit " + image + " attempt " + std::to_string(attempt) + "/" +
                     std::to_string(attempts) + " failed: " + last);
        if (attempt < attempts && opt_.commit_retry_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opt_.commit_retry_delay_ms));
        }
    }
    throw SandboxCommitFailed("docker commit " + container_ + " " + image + " failed after " +
                              std::to_string(attempts) + " attempts: " + last);
}

void DockerCliBackend::stop() noexcept {
    if (container_.empty()) return;
    const std::string name = container_;
    container_.clear();

    std::vector<std::string> argv = {opt_.docker_bin, "rm", "-f", name};
    ProcLimits lim;
    lim.timeout_ms = deadline_ms(opt_.control_timeout_sec);
    ProcResult r;
    if (!proc_run_capture(argv, "", lim, &r)) {
        console_line("[sandbox] cannot remove " + name + ": " + r.error);
    } else if (r.timed_out || r.exit_code != 0) {
        console_line("[sandbox] rm -f " + name + " failed: " + describe_failure(r));
    }
}

void DockerCliBackend::create_volume(const std::string& name) {
    ProcResult r = docker({"volume", "create", name}, opt_.control_timeout_sec);
    if (!r.timed_out && r.exit_code == 0) return;
    // lost a creation race with another worker
    ProcResult chk = docker({"volume", "inspect", name}, opt_.control_timeout_sec);
    if (!chk.timed_out && chk.exit_code == 0) return;
    throw SandboxError("docker volume create " + name + " failed: " + describe_failure(r));
}

void DockerCliBackend::remove_volume(const std::string& name) {
    ProcResult r = docker({"volume", "rm", "-f", name}, opt_.control_timeout_sec);
    if (r.timed_out || r.exit_code != 0) {
        throw SandboxError("docker volume rm " + name + " failed: " + describe_failure(r));
    }
}

bool DockerCliBackend::image_exists(const std::string& image) {
    ProcResult r = docker({"image", "inspect", "--format", "{{.Id}}", image}, opt_.control_timeout_sec);
    if (r.timed_out) throw SandboxError("docker image inspect " + image + " timed out");
    return r.exit_code == 0;
}

void DockerCliBackend::remove_image(const std::string& image) {
    ProcResult r = docker({"rmi", "-f", image}, opt_.control_timeout_sec);
    if (r.timed_out || r.exit_code != 0) {
        throw SandboxError("docker rmi " + image + " failed: " + describe_failure(r));
    }
}

} // namespace patchbench
