#pragma once
#include "proc.h"
#include "sandbox.h"

#include <string>
#include <vector>

namespace patchbench {

struct DockerOptions {
    std::string docker_bin{"docker"};
    int commit_retries{3};
    int commit_retry_delay_ms{10000};
    // Deadline for control commands (run, rm, commit, volume, image).
    int control_timeout_sec{600};
    size_t exec_stdout_max_bytes{32 * 1024 * 1024};
    size_t exec_stderr_max_bytes{8 * 1024 * 1024};
};

// SandboxBackend driving the docker CLI through the process runner.
// Not thread-safe: one instance per repository handle.
class DockerCliBackend : public SandboxBackend {
public:
    explicit DockerCliBackend(DockerOptions opt = {});
    ~DockerCliBackend() override;

    DockerCliBackend(const DockerCliBackend&) = delete;
    DockerCliBackend& operator=(const DockerCliBackend&) = delete;

    void start(const SandboxSpec& spec) override;
    ExecOutput exec(const std::string& command, const std::string& shell, int timeout_sec) override;
    void commit_image(const std::string& image) override;
    void stop() noexcept override;
    bool running() const override { return !container_.empty(); }

    void create_volume(const std::string& name) override;
    void remove_volume(const std::string& name) override;
    bool image_exists(const std::string& image) override;
    void remove_image(const std::string& image) override;

    const DockerOptions& options() const { return opt_; }

private:
    // Runs `docker <args>`; throws SandboxError if the CLI cannot be started.
    ProcResult docker(const std::vector<std::string>& args, int timeout_sec) const;

    DockerOptions opt_;
    std::string container_;
    std::string workdir_;
};

// Arguments (after the docker binary) that start spec's container.
std::vector<std::string> docker_run_args(const SandboxSpec& spec);

} // namespace patchbench
