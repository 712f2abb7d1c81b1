#include "cmd_evaluate.h"
#include "runner_utils.h"

#include "patchbench/config.h"
#include "patchbench/dispatcher.h"
#include "patchbench/docker_backend.h"
#include "patchbench/evaluator.h"
#include "patchbench/local_backend.h"
#include "patchbench/log.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace patchbench;

namespace {

enum class Stage { EVALUATE, BUILD_CHECK };

HandleFactory handle_factory(const HarnessConfig& cfg) {
    return [cfg](const Task& t) {
        TaskContext ctx;
        if (cfg.backend == "local") ctx.backend = std::make_unique<LocalBackend>();
        else ctx.backend = std::make_unique<DockerCliBackend>(docker_options(cfg));
        const LanguageProfile& profile = language_or_throw(t.language);
        ctx.handle = std::make_unique<RepositoryHandle>(profile, t.repo, t.base_commit, t.image_name, *ctx.backend,
                                                        repository_options(cfg));
        return ctx;
    };
}

int usage(const char* cmd) {
    std::cerr << "usage: patchbench_cli " << cmd
              << " <in.jsonl> <out.jsonl> [--n_jobs N] [--cache_mode download|shared|local|volume]"
                 " [--backend docker|local] [--keep_log|--delete_log] [--event_log PATH]\n";
    return 2;
}

int run_stage(Stage stage, int argc, char** argv) {
    const char* name = stage == Stage::EVALUATE ? "evaluate" : "build-check";
    if (argc < 4) return usage(name);
    const std::string in_path = argv[2];
    const std::string out_path = argv[3];

    apply_profile_defaults(detect_profile());
    HarnessConfig cfg;
    try {
        cfg = load_harness_config();
    } catch (const std::exception& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 2;
    }

    for (int i = 4; i < argc; i++) {
        std::string a = argv[i];
        std::string v;
        if (a == "--keep_log") { cfg.delete_log = false; continue; }
        if (a == "--delete_log") { cfg.delete_log = true; continue; }
        if (a == "--n_jobs" && take_value(argc, argv, i, &v)) {
            if (!parse_int_arg(v, &cfg.n_jobs)) return usage(name);
            continue;
        }
        if (a == "--cache_mode" && take_value(argc, argv, i, &v)) {
            auto m = cache_mode_from_str(v);
            if (!m) {
                std::cerr << "unknown cache mode: " << v << "\n";
                return 2;
            }
            cfg.cache_mode = *m;
            continue;
        }
        if (a == "--backend" && take_value(argc, argv, i, &v)) {
            if (!is_known_backend(v)) {
                std::cerr << "unknown backend: " << v << "\n";
                return 2;
            }
            cfg.backend = v;
            continue;
        }
        if (a == "--event_log" && take_value(argc, argv, i, &v)) { cfg.event_log = v; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return usage(name);
    }

    std::vector<std::string> rejected;
    std::vector<Task> tasks;
    try {
        tasks = read_tasks(in_path, &rejected);
    } catch (const std::exception& e) {
        std::cerr << "[" << name << "] " << e.what() << "\n";
        return 2;
    }
    for (const auto& r : rejected) console_line(std::string("[WARN] ") + in_path + " " + r);

    std::unique_ptr<JsonlLogger> events;
    if (!cfg.event_log.empty()) {
        events = std::make_unique<JsonlLogger>(gen_run_id(), cfg.event_log);
        if (!events->ok()) {
            std::cerr << "[" << name << "] cannot open event log " << cfg.event_log << "\n";
            return 2;
        }
    }

    console_line(std::string("[") + name + "] profile=" + profile_name(detect_profile()) +
                 " tasks=" + std::to_string(tasks.size()) + " n_jobs=" + std::to_string(cfg.n_jobs) +
                 " backend=" + cfg.backend +
                 " cache_mode=" + cache_mode_to_str(cfg.cache_mode) + " cache_root=" + cfg.cache_root);

    EvalOptions eopt;
    eopt.events = events.get();
    TaskStage run = [stage, eopt](RepositoryHandle& h, const Task& t) {
        return stage == Stage::EVALUATE ? evaluate_task(h, t, eopt) : check_build(h, t, eopt);
    };

    DispatchOptions dopt;
    dopt.n_jobs = cfg.n_jobs;
    dopt.on_progress = [](size_t done, size_t total, const Task& t, const TaskOutcome& o) {
        std::string line = "[dispatch] " + std::to_string(done) + "/" + std::to_string(total) + " " + t.task_id +
                           " run_status=" + std::to_string(o.run_status);
        if (o.repo_build) line += " repo_build=" + std::to_string(*o.repo_build);
        if (!o.exception.empty()) line += " exception=" + o.exception;
        console_line(line);
    };

    std::vector<TaskOutcome> outcomes = dispatch(tasks, handle_factory(cfg), run, dopt);

    std::string body;
    size_t ok = 0;
    for (size_t i = 0; i < tasks.size(); i++) {
        body += outcome_to_json(tasks[i], outcomes[i], cfg.delete_log);
        body += "\n";
        if (outcomes[i].run_status == 1) ok++;
    }
    std::string werr = write_atomic(out_path, body);
    if (!werr.empty()) {
        std::cerr << "[" << name << "] " << werr << "\n";
        return 1;
    }
    console_line(std::string("[") + name + "] wrote " + std::to_string(tasks.size()) + " record(s) to " + out_path +
                 " (" + std::to_string(ok) + " completed)");
    return rejected.empty() ? 0 : 1;
}

} // namespace

int cmd_evaluate(int argc, char** argv) { return run_stage(Stage::EVALUATE, argc, argv); }

int cmd_build_check(int argc, char** argv) { return run_stage(Stage::BUILD_CHECK, argc, argv); }
