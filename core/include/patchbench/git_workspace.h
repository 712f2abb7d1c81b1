#pragma once
#include "proc.h"

#include <filesystem>
#include <string>
#include <vector>

namespace patchbench {

struct GitOptions {
    std::string git_bin{"git"};
    int timeout_sec{600}; // per git command
};

// A git working tree on the host. The tree is bind-mounted into the sandbox,
// so checkouts and patches applied here are what the sandbox sees.
// Failures throw the GitError family from errors.h.
class GitWorkspace {
public:
    GitWorkspace(std::filesystem::path dir, GitOptions opt = {});

    const std::filesystem::path& dir() const { return dir_; }
    bool is_repo() const;

    // Clones `url` into dir() unless a clone is already there.
    void ensure_clone(const std::string& url);

    // Detached checkout; fetches the commit from origin if it is not local yet.
    void checkout(const std::string& commit);

    // reset --hard <commit> and remove untracked files. Ignored files and
    // untracked paths matching a `keep` pattern (.gitignore syntax) survive.
    void clean(const std::string& commit, const std::vector<std::string>& keep = {});

    // Applies a unified diff to the tree. Empty diffs are a no-op.
    void apply(const std::string& diff);

    // Full hash of HEAD.
    std::string head();

    // Porcelain status; empty for a pristine tree.
    std::string status();

private:
    ProcResult git(const std::vector<std::string>& args, const std::string* stdin_data = nullptr) const;

    std::filesystem::path dir_;
    GitOptions opt_;
};

} // namespace patchbench
