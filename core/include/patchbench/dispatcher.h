#pragma once
#include "evaluator.h"
#include "repository.h"
#include "sandbox.h"
#include "task.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace patchbench {

// Everything one task runs against. The handle refers to the backend, so
// it is declared (and destroyed) after it.
struct TaskContext {
    std::unique_ptr<SandboxBackend> backend;
    std::unique_ptr<RepositoryHandle> handle;
};

using HandleFactory = std::function<TaskContext(const Task&)>;
using TaskStage = std::function<TaskOutcome(RepositoryHandle&, const Task&)>;
using ProgressFn = std::function<void(size_t done, size_t total, const Task&, const TaskOutcome&)>;

struct DispatchOptions {
    int n_jobs{1}; // <= 0: one worker per hardware thread
    ProgressFn on_progress;
};

// Runs `stage` for every task on a pool of n_jobs workers. Each task gets
// its own context from `factory`. Tasks that share a container name (same
// repository and commit) never run at the same time. Any exception is
// recorded in that task's outcome; the batch always completes. Results are
// in input order.
std::vector<TaskOutcome> dispatch(const std::vector<Task>& tasks,
                                  const HandleFactory& factory,
                                  const TaskStage& stage,
                                  const DispatchOptions& opt);

} // namespace patchbench
