#include "patchbench/config.h"
#include "patchbench/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace patchbench {

static std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v;
}

static std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : defv;
}

static int getenv_int(const char* k, int defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        console_line(std::string("[WARN] ignoring non-numeric ") + k + "=" + v);
        return defv;
    }
}

static bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    const std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

Profile detect_profile() {
    const char* env = std::getenv("PATCHBENCH_PROFILE");
    if (!env) return Profile::DEV;
    const std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: must be called before any worker threads are created.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    setenv("PATCHBENCH_CACHE_MODE",            "volume", NO_OVERWRITE);
    setenv("PATCHBENCH_COMMIT_RETRIES",        "3",      NO_OVERWRITE);
    setenv("PATCHBENCH_COMMIT_RETRY_DELAY_MS", "10000",  NO_OVERWRITE);
    setenv("PATCHBENCH_REUSE_IMAGES",          "1",      NO_OVERWRITE);
    setenv("PATCHBENCH_COMMIT_IMAGES",         "1",      NO_OVERWRITE);

    switch (p) {
        case Profile::DEV:
            setenv("PATCHBENCH_N_JOBS",          "1",   NO_OVERWRITE);
            setenv("PATCHBENCH_DELETE_LOG",      "0",   NO_OVERWRITE);
            setenv("PATCHBENCH_GIT_TIMEOUT_SEC", "600", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("PATCHBENCH_N_JOBS",          "8",   NO_OVERWRITE);
            setenv("PATCHBENCH_DELETE_LOG",      "1",   NO_OVERWRITE);
            setenv("PATCHBENCH_GIT_TIMEOUT_SEC", "300", NO_OVERWRITE);
            break;
    }
}

static std::string default_cache_root(const std::string& home) {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/patchbench";
    if (!home.empty()) return home + "/.cache/patchbench";
    return "/tmp/patchbench";
}

HarnessConfig load_harness_config() {
    HarnessConfig c;
    c.home_dir = getenv_str("HOME", "");
    c.cache_root = getenv_str("PATCHBENCH_CACHE_ROOT", default_cache_root(c.home_dir));

    const std::string mode = getenv_str("PATCHBENCH_CACHE_MODE", "volume");
    auto m = cache_mode_from_str(mode);
    if (!m) throw std::runtime_error("PATCHBENCH_CACHE_MODE: unknown cache mode '" + mode + "'");
    c.cache_mode = *m;

    c.backend = getenv_str("PATCHBENCH_BACKEND", c.backend);
    if (!is_known_backend(c.backend)) {
        throw std::runtime_error("PATCHBENCH_BACKEND: unknown backend '" + c.backend + "'");
    }

    c.docker_bin = getenv_str("PATCHBENCH_DOCKER_BIN", c.docker_bin);
    c.git_bin = getenv_str("PATCHBENCH_GIT_BIN", c.git_bin);
    c.n_jobs = getenv_int("PATCHBENCH_N_JOBS", c.n_jobs);
    c.commit_retries = std::max(1, getenv_int("PATCHBENCH_COMMIT_RETRIES", c.commit_retries));
    c.commit_retry_delay_ms = std::max(0, getenv_int("PATCHBENCH_COMMIT_RETRY_DELAY_MS", c.commit_retry_delay_ms));
    c.git_timeout_sec = getenv_int("PATCHBENCH_GIT_TIMEOUT_SEC", c.git_timeout_sec);
    c.clone_url_base = getenv_str("PATCHBENCH_CLONE_URL_BASE", c.clone_url_base);
    c.image_prefix = getenv_str("PATCHBENCH_IMAGE_PREFIX", c.image_prefix);
    c.container_cpus = getenv_str("PATCHBENCH_CONTAINER_CPUS", "");
    c.container_memory = getenv_str("PATCHBENCH_CONTAINER_MEMORY", "");
    c.reuse_images = getenv_bool("PATCHBENCH_REUSE_IMAGES", c.reuse_images);
    c.commit_images = getenv_bool("PATCHBENCH_COMMIT_IMAGES", c.commit_images);
    c.delete_log = getenv_bool("PATCHBENCH_DELETE_LOG", c.delete_log);
    c.event_log = getenv_str("PATCHBENCH_EVENT_LOG", "");
    return c;
}

bool is_known_backend(const std::string& name) { return name == "docker" || name == "local"; }

DockerOptions docker_options(const HarnessConfig& cfg) {
    DockerOptions o;
    o.docker_bin = cfg.docker_bin;
    o.commit_retries = cfg.commit_retries;
    o.commit_retry_delay_ms = cfg.commit_retry_delay_ms;
    return o;
}

RepositoryOptions repository_options(const HarnessConfig& cfg) {
    RepositoryOptions o;
    o.cache_mode = cfg.cache_mode;
    o.cache_root = cfg.cache_root;
    o.home_dir = cfg.home_dir;
    o.clone_url_base = cfg.clone_url_base;
    o.image_prefix = cfg.image_prefix;
    o.cpus = cfg.container_cpus;
    o.memory = cfg.container_memory;
    o.reuse_images = cfg.reuse_images;
    o.commit_images = cfg.commit_images;
    o.git.git_bin = cfg.git_bin;
    o.git.timeout_sec = cfg.git_timeout_sec;
    return o;
}

} // namespace patchbench
