#include "test_common.h"
#include "fake_backend.h"

#include "patchbench/dispatcher.h"
#include "patchbench/errors.h"
#include "patchbench/language.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace patchbench;
namespace fs = std::filesystem;

static Task make(const std::string& repo, const std::string& commit) {
    Task t;
    t.repo = repo;
    t.base_commit = commit;
    t.task_id = repo + "@" + commit;
    return t;
}

int main() {
    RepositoryOptions ropt;
    ropt.cache_root = (fs::temp_directory_path() / "patchbench_test_dispatcher").string();
    ropt.cache_mode = CacheMode::DOWNLOAD;

    std::vector<Task> tasks;
    for (int i = 0; i < 12; i++) {
        // three tasks per checkout
        tasks.push_back(make("acme/lib" + std::to_string(i % 4), "c0ffee" + std::to_string(i % 4)));
    }
    tasks.push_back(make("acme/git-error", "1"));
    tasks.push_back(make("acme/std-error", "1"));
    tasks.push_back(make("acme/no-handle", "1"));
    tasks.push_back(make("acme/factory-error", "1"));

    HandleFactory factory = [&](const Task& t) {
        if (t.repo == "acme/factory-error") throw SandboxError("runtime unavailable");
        TaskContext ctx;
        ctx.backend = std::make_unique<FakeBackend>();
        if (t.repo != "acme/no-handle") {
            ctx.handle = std::make_unique<RepositoryHandle>(language_or_throw("python"), t.repo, t.base_commit, "",
                                                            *ctx.backend, ropt);
        }
        return ctx;
    };

    std::mutex mu;
    std::map<std::string, int> active;
    std::atomic<bool> overlap{false};
    TaskStage stage = [&](RepositoryHandle& h, const Task& t) {
        if (t.repo == "acme/git-error") throw GitCheckoutFailed("unknown revision");
        if (t.repo == "acme/std-error") throw std::runtime_error("boom");
        {
            std::lock_guard<std::mutex> lk(mu);
            if (++active[h.container_name()] > 1) overlap = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(15));
        {
            std::lock_guard<std::mutex> lk(mu);
            active[h.container_name()]--;
        }
        TaskOutcome o;
        o.exception = t.task_id;
        o.run_status = 1;
        return o;
    };

    size_t calls = 0;
    size_t last_done = 0;
    DispatchOptions opt;
    opt.n_jobs = 4;
    opt.on_progress = [&](size_t done, size_t total, const Task&, const TaskOutcome&) {
        calls++;
        last_done = done;
        expect_eq_ll((long long)total, (long long)tasks.size(), "progress total");
        if (done == 3) throw std::runtime_error("progress sink broke");
    };

    std::vector<TaskOutcome> out = dispatch(tasks, factory, stage, opt);
    expect_eq_ll((long long)out.size(), (long long)tasks.size(), "one outcome per task");
    for (size_t i = 0; i < 12; i++) {
        expect_eq_str(out[i].exception, tasks[i].task_id, "input order kept");
        expect_eq_ll(out[i].run_status, 1, "ran");
    }
    expect_true(!overlap, "tasks on one checkout never overlap");

    expect_true(out[12].error_kind == ErrorKind::GIT, "git error kind");
    expect_eq_str(out[12].exception, "unknown revision", "git error message");
    expect_true(out[13].error_kind == ErrorKind::INTERNAL, "std exception is internal");
    expect_eq_str(out[13].exception, "boom", "std message");
    expect_true(out[14].error_kind == ErrorKind::INTERNAL, "missing handle");
    expect_true(out[15].error_kind == ErrorKind::SANDBOX, "factory failure recorded");
    expect_eq_ll(out[15].run_status, 0, "factory failure not evaluated");

    expect_eq_ll((long long)calls, (long long)tasks.size(), "progress for every task");
    expect_eq_ll((long long)last_done, (long long)tasks.size(), "progress reaches total");

    // Worker count larger than the batch, and the hardware default
    opt.on_progress = nullptr;
    opt.n_jobs = 64;
    std::vector<Task> two(tasks.begin(), tasks.begin() + 2);
    auto small = dispatch(two, factory, stage, opt);
    expect_eq_str(small[1].exception, two[1].task_id, "small batch");
    opt.n_jobs = 0;
    auto hw = dispatch(two, factory, stage, opt);
    expect_eq_ll(hw[0].run_status, 1, "hardware default");
    expect_true(dispatch({}, factory, stage, opt).empty(), "empty batch");

    std::cerr << "test_dispatcher: ALL PASSED" << std::endl;
    return 0;
}
