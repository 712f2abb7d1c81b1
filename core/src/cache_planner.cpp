#include "patchbench/cache_planner.h"
#include "patchbench/errors.h"
#include "patchbench/log.h"
#include "patchbench/sandbox.h"

#include <cctype>
#include <filesystem>

namespace patchbench {

namespace fs = std::filesystem;

static std::string docker_safe(const std::string& s) {
    std::string out;
    for (char c : s) {
        unsigned char u = (unsigned char)c;
        if (std::isalnum(u) || c == '_' || c == '.' || c == '-') out.push_back((char)std::tolower(u));
        else out.push_back('-');
    }
    return out;
}

std::string cache_volume_name(const LanguageProfile& p, const CacheLocation& c) {
    return "patchbench-" + docker_safe(p.name) + "-" + docker_safe(c.name);
}

MountPlan plan_cache_mounts(CacheMode mode,
                            const LanguageProfile& profile,
                            const std::string& host_workdir,
                            const std::string& cache_root,
                            const std::string& home_dir) {
    MountPlan plan;
    BindSpec work;
    work.host_path = host_workdir;
    plan[kSandboxWorkdir] = work;

    for (const auto& c : profile.caches) {
        BindSpec b;
        switch (mode) {
            case CacheMode::DOWNLOAD:
                continue;
            case CacheMode::SHARED:
                if (home_dir.empty()) continue;
                b.host_path = (fs::path(home_dir) / c.shared_host_path).string();
                break;
            case CacheMode::LOCAL:
                b.host_path = (fs::path(cache_root) / "local" / profile.name / c.name).string();
                b.create_if_missing = true;
                break;
            case CacheMode::VOLUME:
                b.volume_name = cache_volume_name(profile, c);
                break;
        }
        plan[c.container_path] = b;
    }
    return plan;
}

MountPlan prepare_cache_mounts(const MountPlan& plan, SandboxBackend& backend) {
    MountPlan out;
    for (const auto& [mount_point, spec] : plan) {
        if (spec.is_volume()) {
            backend.create_volume(spec.volume_name);
            out[mount_point] = spec;
            continue;
        }
        if (mount_point == kSandboxWorkdir) {
            out[mount_point] = spec;
            continue;
        }
        std::error_code ec;
        if (fs::exists(spec.host_path, ec)) {
            out[mount_point] = spec;
            continue;
        }
        if (spec.create_if_missing) {
            fs::create_directories(spec.host_path, ec);
            if (ec) {
                throw SandboxError("cannot create cache directory " + spec.host_path + ": " + ec.message());
            }
            out[mount_point] = spec;
        } else {
            console_line("[cache] shared cache " + spec.host_path + " does not exist, not mounting " + mount_point);
        }
    }
    return out;
}

} // namespace patchbench
