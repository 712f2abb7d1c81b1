#pragma once
#include "language.h"
#include "types.h"

#include <map>
#include <string>

namespace patchbench {

class SandboxBackend;

// Mount point inside the sandbox -> what backs it.
using MountPlan = std::map<std::string, BindSpec>;

// Named volume backing one language cache in VOLUME mode.
std::string cache_volume_name(const LanguageProfile& p, const CacheLocation& c);

// Pure: computes the mounts for one handle. The working tree bind
// (host_workdir -> /run_dir) is always part of the plan.
//   DOWNLOAD: no cache mounts
//   SHARED:   $HOME/<shared_host_path>
//   LOCAL:    <cache_root>/local/<language>/<cache name>
//   VOLUME:   named volume patchbench-<language>-<cache name>
MountPlan plan_cache_mounts(CacheMode mode,
                            const LanguageProfile& profile,
                            const std::string& host_workdir,
                            const std::string& cache_root,
                            const std::string& home_dir);

// Side effects needed before the plan can be mounted: creates named volumes
// (idempotent) and local cache directories. Shared mounts whose host directory
// does not exist are dropped from the returned plan instead of letting the
// runtime create root-owned directories in the user's home.
// Throws SandboxError if a volume cannot be created.
MountPlan prepare_cache_mounts(const MountPlan& plan, SandboxBackend& backend);

} // namespace patchbench
