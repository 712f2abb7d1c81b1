#pragma once
#include "cache_planner.h"
#include "types.h"

#include <string>
#include <utility>
#include <vector>

namespace patchbench {

struct SandboxSpec {
    std::string image;
    std::string name;                    // unique per (repository, commit)
    MountPlan mounts;
    std::string workdir{kSandboxWorkdir};
    std::vector<std::pair<std::string, std::string>> env;
    std::string shm_size;                // "" = runtime default
    std::string cpus;                    // "" = unlimited
    std::string memory;                  // "" = unlimited
};

// One live container at a time. All methods except stop() report failures
// by throwing SandboxError (or TimeoutError from exec).
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    // Force-removes any stale container with the same name, then starts
    // spec.image with a no-op foreground command so exec() can be issued
    // repeatedly against it.
    virtual void start(const SandboxSpec& spec) = 0;

    // Runs `command` through `shell -c` inside the running container.
    // timeout_sec <= 0 disables the deadline. On deadline the process
    // group is killed and TimeoutError is thrown carrying the partial output.
    virtual ExecOutput exec(const std::string& command, const std::string& shell, int timeout_sec) = 0;

    // Snapshots the running container as `image`. Retried a bounded number
    // of times; throws SandboxCommitFailed once the attempts are exhausted.
    virtual void commit_image(const std::string& image) = 0;

    // Removes the running container, if any. Best effort.
    virtual void stop() noexcept = 0;

    virtual bool running() const = 0;

    // Idempotent: an existing volume is not an error.
    virtual void create_volume(const std::string& name) = 0;
    virtual void remove_volume(const std::string& name) = 0;

    virtual bool image_exists(const std::string& image) = 0;
    virtual void remove_image(const std::string& image) = 0;
};

// Starts the container on construction and removes it on every exit path.
class ContainerSession {
public:
    ContainerSession(SandboxBackend& backend, const SandboxSpec& spec) : backend_(backend) { backend_.start(spec); }
    ~ContainerSession() { backend_.stop(); }

    ContainerSession(const ContainerSession&) = delete;
    ContainerSession& operator=(const ContainerSession&) = delete;

private:
    SandboxBackend& backend_;
};

} // namespace patchbench
