#pragma once
#include "proc.h"
#include "sandbox.h"

#include <string>
#include <utility>
#include <vector>

namespace patchbench {

struct LocalOptions {
    size_t exec_stdout_max_bytes{32 * 1024 * 1024};
    size_t exec_stderr_max_bytes{8 * 1024 * 1024};
};

// SandboxBackend without isolation: commands run on the host, in the working
// tree that would be bind-mounted at the sandbox workdir. References to the
// sandbox workdir inside a command are rewritten to the host path. Images and
// volumes do not exist, so every repository is rebuilt on first use.
class LocalBackend : public SandboxBackend {
public:
    explicit LocalBackend(LocalOptions opt = {});

    void start(const SandboxSpec& spec) override;
    ExecOutput exec(const std::string& command, const std::string& shell, int timeout_sec) override;
    void commit_image(const std::string& image) override;
    void stop() noexcept override { running_ = false; }
    bool running() const override { return running_; }

    void create_volume(const std::string&) override {}
    void remove_volume(const std::string&) override {}
    bool image_exists(const std::string&) override { return false; }
    void remove_image(const std::string&) override {}

    const std::string& host_workdir() const { return host_workdir_; }

    // `command` with every whole-path occurrence of the sandbox workdir
    // replaced by the host working tree.
    std::string map_workdir(const std::string& command) const;

private:
    LocalOptions opt_;
    bool running_{false};
    std::string sandbox_workdir_;
    std::string host_workdir_;
    std::vector<std::pair<std::string, std::string>> env_;
};

} // namespace patchbench
