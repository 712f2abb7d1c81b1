#include "patchbench/repository.h"
#include "patchbench/errors.h"
#include "patchbench/log.h"
#include "patchbench/parsers.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

namespace patchbench {

namespace fs = std::filesystem;

const char* handle_state_to_str(HandleState s) {
    switch (s) {
        case HandleState::UNBUILT:  return "unbuilt";
        case HandleState::BUILDING: return "building";
        case HandleState::BUILT:    return "built";
        case HandleState::TESTING:  return "testing";
        case HandleState::FAILED:   return "failed";
    }
    return "unbuilt";
}

static bool is_separator(char c) { return c == '.' || c == '_' || c == '-'; }

std::string normalize_resource_name(const std::string& s) {
    std::string out;
    bool last_sep = true; // drops leading separators
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) {
            out.push_back(static_cast<char>(std::tolower(u)));
            last_sep = false;
        } else if (!last_sep) {
            out.push_back(is_separator(c) ? c : '-');
            last_sep = true;
        }
    }
    while (!out.empty() && is_separator(out.back())) out.pop_back();
    return out.empty() ? "repo" : out;
}

std::string clone_url_for(const std::string& repo, const std::string& base) {
    if (repo.find("://") != std::string::npos || repo.rfind("git@", 0) == 0 || repo.rfind("/", 0) == 0) {
        return repo;
    }
    if (base.empty()) return repo;
    return base.back() == '/' ? base + repo : base + "/" + repo;
}

RepositoryHandle::RepositoryHandle(const LanguageProfile& profile,
                                   std::string repo,
                                   std::string commit,
                                   std::string image,
                                   SandboxBackend& backend,
                                   RepositoryOptions opt)
    : profile_(profile),
      repo_(std::move(repo)),
      commit_(std::move(commit)),
      image_(std::move(image)),
      backend_(backend),
      opt_(std::move(opt)),
      git_(fs::path(), opt_.git) {
    if (image_.empty()) image_ = profile_.default_image;
    if (opt_.cache_root.empty()) opt_.cache_root = (fs::temp_directory_path() / "patchbench").string();
    opt_.cache_root = fs::absolute(opt_.cache_root).lexically_normal().string();

    const std::string repo_id = normalize_resource_name(repo_);
    const std::string short_commit = normalize_resource_name(commit_).substr(0, 12);
    const std::string prefix = opt_.image_prefix.empty() ? "patchbench" : normalize_resource_name(opt_.image_prefix);

    container_name_ = prefix + "-" + repo_id + "-" + short_commit;
    built_image_ = prefix + "-" + repo_id + ":" + short_commit;
    workdir_ = fs::path(opt_.cache_root) / "repos" / (repo_id + "-" + short_commit);
    git_ = GitWorkspace(workdir_, opt_.git);
}

fs::path RepositoryHandle::built_marker() const {
    return fs::path(workdir_.string() + ".built");
}

void RepositoryHandle::prepare() {
    if (prepared_) return;
    try {
        if (!git_.is_repo()) {
            // a marker from an earlier tree does not describe a fresh clone
            std::error_code ec;
            fs::remove(built_marker(), ec);
            git_.ensure_clone(clone_url_for(repo_, opt_.clone_url_base));
        }
        git_.checkout(commit_);
    } catch (const Error&) {
        state_ = HandleState::FAILED;
        throw;
    }
    prepared_ = true;
}

SandboxSpec RepositoryHandle::sandbox_spec() {
    if (!mounts_) {
        MountPlan plan = plan_cache_mounts(opt_.cache_mode, profile_, workdir_.string(), opt_.cache_root,
                                           opt_.home_dir);
        mounts_ = prepare_cache_mounts(plan, backend_);
    }
    SandboxSpec s;
    s.image = image_;
    s.name = container_name_;
    s.mounts = *mounts_;
    s.env = profile_.env;
    s.shm_size = profile_.shm_size;
    s.cpus = opt_.cpus;
    s.memory = opt_.memory;
    return s;
}

ExecutionResult RepositoryHandle::build(const std::string& command, int timeout_sec) {
    state_ = HandleState::BUILDING;
    ExecutionResult res;
    bool committed = false;
    try {
        prepare();
        ContainerSession session(backend_, sandbox_spec());
        console_line("[repo] build " + container_name_ + " from " + image_);

        ExecOutput out;
        try {
            out = backend_.exec(effective_build_command(profile_, command), profile_.shell, timeout_sec);
        } catch (const TimeoutError& e) {
            ExecOutput partial = e.partial();
            partial.stderr_text += kTimeoutStderr;
            partial.return_code = kTimeoutReturnCode;
            throw TimeoutError("build of " + repo_ + "@" + commit_ + " exceeded " + std::to_string(timeout_sec) + "s",
                               std::move(partial));
        }
        res.stdout_text = std::move(out.stdout_text);
        res.stderr_text = std::move(out.stderr_text);
        res.return_code = out.return_code;
        res.duration_sec = out.duration_sec;

        if (res.return_code == 0 && opt_.commit_images) {
            backend_.commit_image(built_image_);
            committed = true;
            std::ofstream marker(built_marker(), std::ios::out | std::ios::trunc);
            if (marker) marker << built_image_ << "\n";
            else console_line("[WARN] cannot write build marker " + built_marker().string());
        }
    } catch (...) {
        state_ = HandleState::FAILED;
        throw;
    }

    if (res.return_code != 0) {
        console_line("[repo] build " + container_name_ + " exited " + std::to_string(res.return_code));
        state_ = HandleState::FAILED;
        return res;
    }
    if (committed) image_ = built_image_;
    state_ = HandleState::BUILT;
    return res;
}

ExecutionResult RepositoryHandle::run_test(const std::string& command, int timeout_sec) {
    if (state_ != HandleState::BUILT && state_ != HandleState::TESTING) {
        throw Error(ErrorKind::INTERNAL,
                    std::string("run_test on a handle in state ") + handle_state_to_str(state_));
    }
    state_ = HandleState::TESTING;

    ExecutionResult res;
    try {
        prepare();
        ContainerSession session(backend_, sandbox_spec());
        try {
            ExecOutput out = backend_.exec(effective_test_command(profile_, command), profile_.shell, timeout_sec);
            res.stdout_text = std::move(out.stdout_text);
            res.stderr_text = std::move(out.stderr_text);
            res.return_code = out.return_code;
            res.duration_sec = out.duration_sec;
        } catch (const TimeoutError& e) {
            console_line("[repo] test " + container_name_ + " timed out after " + std::to_string(timeout_sec) + "s");
            res.stdout_text = e.partial().stdout_text;
            res.stderr_text = kTimeoutStderr;
            res.return_code = kTimeoutReturnCode;
            res.duration_sec = e.partial().duration_sec;
            res.error_kind = ErrorKind::TIMEOUT;
            res.error = e.what();
        }
    } catch (...) {
        state_ = HandleState::FAILED;
        throw;
    }

    TestReport report = collect_reports(profile_, workdir_);
    if (report.status == ReportStatus::UNKNOWN) {
        TestReport console = parse_console_output(res.stdout_text, res.stderr_text, profile_.console_formats);
        if (console.status != ReportStatus::UNKNOWN) {
            report = std::move(console);
        } else {
            report.summary.collected = std::max(report.summary.collected, console.summary.collected);
        }
    }
    res.report = std::move(report);
    state_ = HandleState::BUILT;
    return res;
}

void RepositoryHandle::apply_patch(const std::string& diff) {
    prepare();
    git_.apply(diff);
}

void RepositoryHandle::clean() {
    prepare();
    git_.clean(commit_, profile_.build_outputs);
}

bool RepositoryHandle::was_built() {
    if (!opt_.reuse_images) return false;
    std::error_code ec;
    if (!fs::exists(built_marker(), ec) || !git_.is_repo()) return false;
    return backend_.image_exists(built_image_);
}

void RepositoryHandle::adopt_built_image() {
    image_ = built_image_;
    state_ = HandleState::BUILT;
}

} // namespace patchbench
