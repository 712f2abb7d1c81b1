#pragma once
#include "docker_backend.h"
#include "repository.h"
#include "types.h"

#include <string>

namespace patchbench {

enum class Profile { DEV, PROD };

// Detect profile from PATCHBENCH_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets PATCHBENCH_* env vars that are not already set.
// DEV: one worker, raw phase logs kept in the output
// PROD: parallel workers, phase logs dropped, shorter git deadline
void apply_profile_defaults(Profile p);

struct HarnessConfig {
    std::string cache_root;
    CacheMode cache_mode{CacheMode::VOLUME};
    std::string backend{"docker"}; // "docker" or "local" (no isolation)
    std::string home_dir;
    std::string docker_bin{"docker"};
    std::string git_bin{"git"};
    int n_jobs{1};
    int commit_retries{3};
    int commit_retry_delay_ms{10000};
    int git_timeout_sec{600};
    std::string clone_url_base{"https://github.com/"};
    std::string image_prefix{"patchbench"};
    std::string container_cpus;
    std::string container_memory;
    bool reuse_images{true};
    bool commit_images{true};
    bool delete_log{false};
    std::string event_log; // empty: no structured event log
};

// Reads the PATCHBENCH_* environment. Throws std::runtime_error on an
// unknown cache mode or backend.
HarnessConfig load_harness_config();

bool is_known_backend(const std::string& name);

DockerOptions docker_options(const HarnessConfig& cfg);
RepositoryOptions repository_options(const HarnessConfig& cfg);

} // namespace patchbench
