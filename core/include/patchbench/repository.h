#pragma once
#include "cache_planner.h"
#include "git_workspace.h"
#include "language.h"
#include "sandbox.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace patchbench {

enum class HandleState { UNBUILT, BUILDING, BUILT, TESTING, FAILED };

const char* handle_state_to_str(HandleState s);

struct RepositoryOptions {
    CacheMode cache_mode{CacheMode::VOLUME};
    std::string cache_root;  // working trees live under <cache_root>/repos
    std::string home_dir;    // for CacheMode::SHARED
    std::string clone_url_base{"https://github.com/"};
    std::string image_prefix{"patchbench"};
    std::string cpus;
    std::string memory;
    bool reuse_images{true};
    bool commit_images{true};
    GitOptions git;
};

// Lowercase, docker-safe form of a repository name or commit:
// [a-z0-9._-], no leading/trailing or repeated separators.
std::string normalize_resource_name(const std::string& s);

// Clone URL for "owner/name"; absolute paths and URLs are used as given.
std::string clone_url_for(const std::string& repo, const std::string& base);

// One (repository, commit) checkout plus the sandbox it is built and tested
// in. Generic over the language profile. Not thread-safe; the dispatcher
// gives each task its own handle.
//
//   UNBUILT -> BUILDING -> BUILT <-> TESTING
//   any step -> FAILED on an unrecoverable error
class RepositoryHandle {
public:
    RepositoryHandle(const LanguageProfile& profile,
                     std::string repo,
                     std::string commit,
                     std::string image,
                     SandboxBackend& backend,
                     RepositoryOptions opt);

    RepositoryHandle(const RepositoryHandle&) = delete;
    RepositoryHandle& operator=(const RepositoryHandle&) = delete;

    // Clone (first use only) and check out the commit. Idempotent.
    void prepare();

    // Runs the build command in a fresh container from image(). On exit code
    // 0 the container is committed as built_image_name() (if enabled) and
    // later runs start from it. Throws TimeoutError after the container was
    // removed, SandboxCommitFailed when the snapshot cannot be taken.
    ExecutionResult build(const std::string& command, int timeout_sec);

    // Runs the test command and normalises whatever report it produced.
    // Never throws on a deadline: the result carries return code 2, stderr
    // "Timeout exception" and error kind timeout.
    ExecutionResult run_test(const std::string& command, int timeout_sec);

    // Throws GitApplyFailed when the diff does not apply.
    void apply_patch(const std::string& diff);

    // Back to the pristine commit; undoes every apply_patch().
    void clean();

    // A reusable image from an earlier successful build exists.
    bool was_built();

    // Skip the build: run tests from the image a previous build committed.
    void adopt_built_image();

    HandleState state() const { return state_; }
    const LanguageProfile& profile() const { return profile_; }
    const std::string& repo() const { return repo_; }
    const std::string& commit() const { return commit_; }
    const std::string& image() const { return image_; }
    const std::string& container_name() const { return container_name_; }
    const std::string& built_image_name() const { return built_image_; }
    const std::filesystem::path& workdir() const { return workdir_; }

private:
    SandboxSpec sandbox_spec();
    std::filesystem::path built_marker() const;

    const LanguageProfile& profile_;
    std::string repo_;
    std::string commit_;
    std::string image_;
    SandboxBackend& backend_;
    RepositoryOptions opt_;

    std::string container_name_;
    std::string built_image_;
    std::filesystem::path workdir_;
    GitWorkspace git_;
    std::optional<MountPlan> mounts_;
    bool prepared_{false};
    HandleState state_{HandleState::UNBUILT};
};

} // namespace patchbench
