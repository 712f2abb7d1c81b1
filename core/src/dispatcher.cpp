#include "patchbench/dispatcher.h"
#include "patchbench/errors.h"
#include "patchbench/log.h"
#include "patchbench/work_queue.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace patchbench {

namespace {

// One mutex per resource name, created on first use and never removed.
class KeyedLocks {
public:
    std::shared_ptr<std::mutex> get(const std::string& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto& m = locks_[key];
        if (!m) m = std::make_shared<std::mutex>();
        return m;
    }

private:
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

TaskOutcome run_one(const Task& task, const HandleFactory& factory, const TaskStage& stage, KeyedLocks& locks) {
    TaskOutcome out;
    try {
        TaskContext ctx = factory(task);
        if (!ctx.handle) throw Error(ErrorKind::INTERNAL, "no repository handle for " + task.repo);
        auto key_mu = locks.get(ctx.handle->container_name());
        std::lock_guard<std::mutex> lk(*key_mu);
        out = stage(*ctx.handle, task);
    } catch (const Error& e) {
        out.exception = e.what();
        out.error_kind = e.kind();
    } catch (const std::exception& e) {
        out.exception = e.what();
        out.error_kind = ErrorKind::INTERNAL;
    } catch (...) {
        out.exception = "non-standard exception";
        out.error_kind = ErrorKind::INTERNAL;
    }
    return out;
}

} // namespace

std::vector<TaskOutcome> dispatch(const std::vector<Task>& tasks,
                                  const HandleFactory& factory,
                                  const TaskStage& stage,
                                  const DispatchOptions& opt) {
    std::vector<TaskOutcome> results(tasks.size());
    if (tasks.empty()) return results;

    int n = opt.n_jobs;
    if (n <= 0) n = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    n = std::min<int>(n, static_cast<int>(tasks.size()));

    ConcurrentQueue<size_t> queue;
    for (size_t i = 0; i < tasks.size(); i++) queue.push(i);
    queue.close();

    KeyedLocks locks;
    std::mutex progress_mu;
    size_t done = 0;

    console_line("[dispatch] " + std::to_string(tasks.size()) + " task(s) on " + std::to_string(n) + " worker(s)");

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n));
    for (int w = 0; w < n; w++) {
        workers.emplace_back([&]() {
            size_t idx = 0;
            while (queue.pop(idx)) {
                results[idx] = run_one(tasks[idx], factory, stage, locks);
                std::lock_guard<std::mutex> lk(progress_mu);
                done++;
                if (opt.on_progress) {
                    try {
                        opt.on_progress(done, tasks.size(), tasks[idx], results[idx]);
                    } catch (const std::exception& e) {
                        console_line(std::string("[dispatch] progress callback failed: ") + e.what());
                    }
                }
            }
        });
    }
    for (auto& t : workers) t.join();
    return results;
}

} // namespace patchbench
