#include "patchbench/local_backend.h"
#include "patchbench/errors.h"

#include <cctype>
#include <filesystem>
#include <utility>

namespace patchbench {

namespace fs = std::filesystem;

LocalBackend::LocalBackend(LocalOptions opt) : opt_(std::move(opt)) {}

void LocalBackend::start(const SandboxSpec& spec) {
    auto it = spec.mounts.find(spec.workdir);
    if (it == spec.mounts.end() || it->second.is_volume() || it->second.host_path.empty()) {
        throw SandboxStartFailed("local run of " + spec.name + " needs a host directory bound at " + spec.workdir);
    }
    std::error_code ec;
    if (!fs::is_directory(it->second.host_path, ec)) {
        throw SandboxStartFailed("local run of " + spec.name + ": " + it->second.host_path + " is not a directory");
    }
    sandbox_workdir_ = spec.workdir;
    host_workdir_ = it->second.host_path;
    env_ = spec.env;
    running_ = true;
}

std::string LocalBackend::map_workdir(const std::string& command) const {
    if (sandbox_workdir_.empty()) return command;
    std::string out;
    size_t from = 0;
    size_t pos;
    while ((pos = command.find(sandbox_workdir_, from)) != std::string::npos) {
        const size_t end = pos + sandbox_workdir_.size();
        // "/run_dir" must not match inside "/run_directory" or "/x/run_dir"
        const bool start_ok = pos == 0 || !(std::isalnum((unsigned char)command[pos - 1]) ||
                                            command[pos - 1] == '_' || command[pos - 1] == '.' ||
                                            command[pos - 1] == '/');
        const bool end_ok = end == command.size() ||
                            !(std::isalnum((unsigned char)command[end]) || command[end] == '_' ||
                              command[end] == '-' || command[end] == '.');
        out.append(command, from, pos - from);
        out += start_ok && end_ok ? host_workdir_ : sandbox_workdir_;
        from = end;
    }
    out.append(command, from, std::string::npos);
    return out;
}

ExecOutput LocalBackend::exec(const std::string& command, const std::string& shell, int timeout_sec) {
    if (!running_) throw SandboxError("exec without a running sandbox");

    std::vector<std::string> argv = {"env"};
    for (const auto& [k, v] : env_) argv.push_back(k + "=" + v);
    argv.push_back(shell.empty() ? "sh" : shell);
    argv.push_back("-c");
    argv.push_back(map_workdir(command));

    ProcLimits lim;
    lim.timeout_ms = deadline_ms(timeout_sec);
    lim.stdout_max_bytes = opt_.exec_stdout_max_bytes;
    lim.stderr_max_bytes = opt_.exec_stderr_max_bytes;

    ProcResult r;
    if (!proc_run_capture(argv, host_workdir_, lim, &r)) {
        throw SandboxError("cannot run " + argv[0] + " in " + host_workdir_ + ": " + r.error);
    }

    ExecOutput out;
    out.stdout_text = std::move(r.stdout_text);
    out.stderr_text = std::move(r.stderr_text);
    out.return_code = r.exit_code;
    out.duration_sec = static_cast<double>(r.duration_ms) / 1000.0;
    if (r.timed_out) {
        out.return_code = kTimeoutReturnCode;
        throw TimeoutError("command exceeded " + std::to_string(timeout_sec) + "s in " + host_workdir_, std::move(out));
    }
    return out;
}

// Nothing to snapshot: the build output stays in the host tree.
void LocalBackend::commit_image(const std::string& image) {
    if (!running_) throw SandboxError("commit of " + image + " without a running sandbox");
}

} // namespace patchbench
