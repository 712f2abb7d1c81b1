#pragma once
#include "parsers.h"

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace patchbench {

// One package/build cache a language toolchain writes to.
struct CacheLocation {
    std::string name;             // short id, used in volume and directory names
    std::string container_path;   // absolute path inside the sandbox
    std::string shared_host_path; // relative to $HOME, used by CacheMode::SHARED
};

// Everything that differs between language ecosystems. The repository
// handle is generic over this value; no per-language subclass exists.
struct LanguageProfile {
    std::string name;
    std::string default_image;
    std::string default_build_command;
    std::string default_test_command;
    std::string shell{"bash"}; // alpine-based images only ship sh
    std::string shm_size;      // empty: runtime default

    std::vector<CacheLocation> caches;

    // Report artifacts, relative to the working tree. "*" and "?" match within
    // one path segment, "**" matches any number of directories.
    std::vector<std::string> report_globs;
    // Shell globs removed inside the sandbox before each test run so a
    // previous phase's reports are never read twice.
    std::vector<std::string> stale_artifacts;
    // Exclude patterns (.gitignore syntax) for untracked build output that
    // resetting the tree between phases must keep.
    std::vector<std::string> build_outputs;
    // Console formats tried first by the text fallback; the first one is also
    // the hint for plain-text report files.
    std::vector<ConsoleFormat> console_formats;
    std::vector<std::pair<std::string, std::string>> env;

    std::function<std::string(const std::string&)> rewrite_build;
    std::function<std::string(const std::string&)> rewrite_test;
    // Reports whose location is only known at run time (CTest's Testing/TAG).
    std::function<std::vector<std::filesystem::path>(const std::filesystem::path& workdir)> extra_reports;
    // Does a path touched by a diff look like a test file of this ecosystem?
    std::function<bool(const std::string& path)> is_test_file;
};

// Lookup by name or alias ("golang", "c++", "js", "ts", "node", "py", "kt").
// Returns nullptr for unsupported languages.
const LanguageProfile* find_language(const std::string& name);

// Same, throws std::runtime_error for unsupported languages.
const LanguageProfile& language_or_throw(const std::string& name);

std::vector<std::string> language_names();

// Command actually executed for a build/test, after the profile's rewrites
// and (for tests) the stale-artifact purge.
std::string effective_build_command(const LanguageProfile& p, const std::string& cmd);
std::string effective_test_command(const LanguageProfile& p, const std::string& cmd);

// Match `pattern` (see report_globs) against files under root.
// Heavy dependency trees (.git, node_modules, vendor) are not descended by "**".
std::vector<std::filesystem::path> glob_files(const std::filesystem::path& root, const std::string& pattern);

// All report artifacts the profile knows about, de-duplicated, sorted.
std::vector<std::filesystem::path> locate_report_files(const LanguageProfile& p,
                                                       const std::filesystem::path& workdir);

// Parse and merge every located artifact. Artifacts without test evidence are
// dropped. Returns an unknown report when nothing usable was found; its
// `collected` keeps the largest discovered count.
TestReport collect_reports(const LanguageProfile& p, const std::filesystem::path& workdir);

} // namespace patchbench
