#include "patchbench/git_workspace.h"
#include "patchbench/errors.h"
#include "patchbench/log.h"

#include <system_error>
#include <utility>

namespace patchbench {

namespace fs = std::filesystem;

static std::string trim_tail(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

static std::string failure_text(const ProcResult& r) {
    if (r.timed_out) return "timed out";
    std::string msg = trim_tail(r.stderr_text);
    if (msg.empty()) msg = trim_tail(r.stdout_text);
    if (msg.size() > 2000) msg = msg.substr(0, 2000) + "...";
    return "exit " + std::to_string(r.exit_code) + (msg.empty() ? "" : ": " + msg);
}

static bool ok(const ProcResult& r) { return !r.timed_out && r.exit_code == 0; }

GitWorkspace::GitWorkspace(fs::path dir, GitOptions opt) : dir_(std::move(dir)), opt_(std::move(opt)) {}

bool GitWorkspace::is_repo() const {
    std::error_code ec;
    return fs::exists(dir_ / ".git", ec);
}

ProcResult GitWorkspace::git(const std::vector<std::string>& args, const std::string* stdin_data) const {
    // never block on a credential prompt for a deleted or private repository
    std::vector<std::string> argv = {opt_.git_bin, "-c", "core.askPass=true", "-c", "credential.helper="};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcLimits lim;
    lim.timeout_ms = deadline_ms(opt_.timeout_sec);
    ProcResult r;
    const std::string cwd = is_repo() ? dir_.string() : std::string();
    const bool started = stdin_data ? proc_run_capture_stdin(argv, cwd, *stdin_data, lim, &r)
                                    : proc_run_capture(argv, cwd, lim, &r);
    if (!started) throw GitError("cannot run " + opt_.git_bin + ": " + r.error);
    return r;
}

void GitWorkspace::ensure_clone(const std::string& url) {
    if (is_repo()) return;

    std::error_code ec;
    if (dir_.has_parent_path()) fs::create_directories(dir_.parent_path(), ec);
    if (ec) throw GitCloneFailed("cannot create " + dir_.parent_path().string() + ": " + ec.message());
    if (fs::exists(dir_, ec) && !fs::is_empty(dir_, ec)) {
        throw GitCloneFailed(dir_.string() + " exists and is not a git repository");
    }

    console_line("[git] clone " + url + " -> " + dir_.string());
    ProcResult r = git({"clone", "--quiet", url, dir_.string()});
    if (!ok(r)) throw GitCloneFailed("clone " + url + " failed: " + failure_text(r));
}

void GitWorkspace::checkout(const std::string& commit) {
    if (!is_repo()) throw GitCheckoutFailed(dir_.string() + " is not a git repository");

    ProcResult r = git({"-c", "advice.detachedHead=false", "checkout", "--quiet", "--force", commit});
    if (ok(r)) return;

    ProcResult f = git({"fetch", "--quiet", "origin", commit});
    if (!ok(f)) throw GitCheckoutFailed("commit " + commit + " not found: " + failure_text(f));
    r = git({"-c", "advice.detachedHead=false", "checkout", "--quiet", "--force", commit});
    if (!ok(r)) throw GitCheckoutFailed("checkout " + commit + " failed: " + failure_text(r));
}

void GitWorkspace::clean(const std::string& commit, const std::vector<std::string>& keep) {
    if (!is_repo()) throw GitError(dir_.string() + " is not a git repository");

    ProcResult r = git({"reset", "--quiet", "--hard", commit});
    if (!ok(r)) throw GitCheckoutFailed("reset --hard " + commit + " failed: " + failure_text(r));
    std::vector<std::string> args = {"clean", "-f", "-d", "--quiet"};
    for (const auto& pattern : keep) args.push_back("--exclude=" + pattern);
    r = git(args);
    if (!ok(r)) throw GitError("clean failed: " + failure_text(r));
}

void GitWorkspace::apply(const std::string& diff) {
    if (diff.find_first_not_of(" \t\r\n") == std::string::npos) return;
    if (!is_repo()) throw GitApplyFailed(dir_.string() + " is not a git repository");

    std::string body = diff;
    if (body.back() != '\n') body.push_back('\n');
    ProcResult r = git({"apply", "--whitespace=nowarn", "-"}, &body);
    if (!ok(r)) throw GitApplyFailed("patch does not apply: " + failure_text(r));
}

std::string GitWorkspace::head() {
    ProcResult r = git({"rev-parse", "HEAD"});
    if (!ok(r)) throw GitError("rev-parse HEAD failed: " + failure_text(r));
    return trim_tail(r.stdout_text);
}

std::string GitWorkspace::status() {
    ProcResult r = git({"status", "--porcelain"});
    if (!ok(r)) throw GitError("status failed: " + failure_text(r));
    return trim_tail(r.stdout_text);
}

} // namespace patchbench
