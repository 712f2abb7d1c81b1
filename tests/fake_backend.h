#pragma once

#include "patchbench/errors.h"
#include "patchbench/sandbox.h"

#include <functional>
#include <set>
#include <string>
#include <vector>

// In-memory SandboxBackend: records every call, runs exec() through a
// scripted handler that sees the host side of the /run_dir bind.
class FakeBackend : public patchbench::SandboxBackend {
public:
    using Handler = std::function<patchbench::ExecOutput(const std::string& command, const std::string& host_workdir)>;

    Handler on_exec;
    bool fail_start{false};
    bool fail_commit{false};

    std::vector<patchbench::SandboxSpec> starts;
    std::vector<std::string> commands;
    std::vector<std::string> shells;
    std::vector<std::string> commits;
    std::set<std::string> volumes;
    std::set<std::string> images;
    int stops{0};

    void start(const patchbench::SandboxSpec& spec) override {
        if (fail_start) throw patchbench::SandboxStartFailed("fake start failure for " + spec.name);
        starts.push_back(spec);
        running_ = true;
    }

    patchbench::ExecOutput exec(const std::string& command, const std::string& shell, int) override {
        if (!running_) throw patchbench::SandboxError("exec without a running container");
        commands.push_back(command);
        shells.push_back(shell);
        if (!on_exec) return patchbench::ExecOutput{};
        return on_exec(command, host_workdir());
    }

    void commit_image(const std::string& image) override {
        if (fail_commit) throw patchbench::SandboxCommitFailed("fake commit failure for " + image);
        commits.push_back(image);
        images.insert(image);
    }

    void stop() noexcept override {
        if (running_) stops++;
        running_ = false;
    }

    bool running() const override { return running_; }

    void create_volume(const std::string& name) override { volumes.insert(name); }
    void remove_volume(const std::string& name) override { volumes.erase(name); }

    bool image_exists(const std::string& image) override { return images.count(image) > 0; }
    void remove_image(const std::string& image) override { images.erase(image); }

    std::string host_workdir() const {
        if (starts.empty()) return "";
        auto it = starts.back().mounts.find(patchbench::kSandboxWorkdir);
        return it == starts.back().mounts.end() ? "" : it->second.host_path;
    }

private:
    bool running_{false};
};
