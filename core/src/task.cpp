#include "patchbench/task.h"
#include "patchbench/hash.h"
#include "patchbench/json_mini.h"
#include "patchbench/proc.h"
#include "patchbench/repository.h"

#include <climits>
#include <cmath>
#include <initializer_list>
#include <set>
#include <sstream>
#include <utility>

namespace patchbench {

namespace jm = json_mini;

static std::string first_string(json_object* o, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto v = jm::get_string(o, k);
        if (v) return *v;
    }
    return "";
}

// Values outside the int range (or not finite) count as absent.
static std::optional<int> first_int(json_object* o, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto v = jm::get_number(o, k);
        if (v && std::isfinite(*v) && *v >= INT_MIN && *v <= INT_MAX) return static_cast<int>(*v);
    }
    return std::nullopt;
}

bool parse_task(const std::string& line, Task* out, std::string* err) {
    auto doc = jm::parse(line);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "task record is not a JSON object";
        return false;
    }
    json_object* o = doc.root;

    Task t;
    t.raw_json = line;
    t.repo = first_string(o, {"repo", "repo_name"});
    t.base_commit = first_string(o, {"base_commit"});
    if (t.repo.empty() || t.base_commit.empty()) {
        if (err) *err = "task record needs repo and base_commit";
        return false;
    }

    std::string lang = first_string(o, {"language", "lang"});
    const LanguageProfile* profile = find_language(lang.empty() ? t.language : lang);
    if (!profile) {
        if (err) *err = "unsupported language: " + lang;
        return false;
    }
    t.language = profile->name;

    t.image_name = first_string(o, {"image_name"});
    if (t.image_name.empty()) t.image_name = profile->default_image;
    t.command_build = first_string(o, {"command_build", "build_command"});
    if (t.command_build.empty()) t.command_build = profile->default_build_command;
    t.command_test = first_string(o, {"command_test", "test_command"});
    if (t.command_test.empty()) t.command_test = profile->default_test_command;
    t.patch = first_string(o, {"patch"});
    t.test_patch = first_string(o, {"test_patch"});

    if (auto v = first_int(o, {"timeout_build", "build_timeout"}); v && *v > 0) t.timeout_build = *v;
    if (auto v = first_int(o, {"timeout_test", "test_timeout"}); v && *v > 0) t.timeout_test = *v;
    json_object* rb = jm::field(o, "repo_build");
    if (rb && !json_object_is_type(rb, json_type_null)) {
        if (auto v = first_int(o, {"repo_build"})) t.repo_build = *v;
    }

    t.task_id = compute_task_id(t);
    *out = std::move(t);
    return true;
}

std::string compute_task_id(const Task& t) {
    jm::Doc cfg(json_object_new_object());
    json_object_object_add(cfg.root, "base_commit", jm::new_string(t.base_commit));
    json_object_object_add(cfg.root, "command_build", jm::new_string(t.command_build));
    json_object_object_add(cfg.root, "command_test", jm::new_string(t.command_test));
    json_object_object_add(cfg.root, "image_name", jm::new_string(t.image_name));
    json_object_object_add(cfg.root, "language", jm::new_string(t.language));
    json_object_object_add(cfg.root, "patch", jm::new_string(t.patch));
    json_object_object_add(cfg.root, "repo", jm::new_string(t.repo));
    json_object_object_add(cfg.root, "test_patch", jm::new_string(t.test_patch));
    json_object_object_add(cfg.root, "timeout_build", json_object_new_int(t.timeout_build));
    json_object_object_add(cfg.root, "timeout_test", json_object_new_int(t.timeout_test));

    std::string name = t.repo;
    while (!name.empty() && name.back() == '/') name.pop_back();
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".git") == 0) name.resize(name.size() - 4);
    size_t slash = name.find_last_of("/:");
    if (slash != std::string::npos) name = name.substr(slash + 1);

    const std::string commit = normalize_resource_name(t.base_commit);
    const std::string tail = commit.size() > 4 ? commit.substr(commit.size() - 4) : commit;
    return normalize_resource_name(name) + "-" + tail + "-" + hash::fnv1a64_hex(jm::canonical(cfg.root)).substr(0, 8);
}

std::vector<std::string> test_files_from_patch(const std::string& diff, const LanguageProfile& profile) {
    if (diff.find("GIT binary patch") != std::string::npos || diff.find("Binary files") != std::string::npos) {
        return {};
    }
    std::set<std::string> files;
    std::istringstream in(diff);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.rfind("+++ b/", 0) != 0) continue;
        std::string path = line.substr(6);
        size_t tab = path.find('\t');
        if (tab != std::string::npos) path.resize(tab);
        if (path.empty()) continue;
        if (profile.is_test_file && profile.is_test_file(path)) files.insert(path);
    }
    return std::vector<std::string>(files.begin(), files.end());
}

bool resolve_test_command(const Task& t, const LanguageProfile& profile, std::string* out, std::string* err) {
    const std::string ph = kTestFilesPlaceholder;
    size_t pos = t.command_test.find(ph);
    if (pos == std::string::npos) {
        *out = t.command_test;
        return true;
    }
    auto files = test_files_from_patch(t.test_patch, profile);
    if (files.empty()) {
        if (err) *err = "No suitable test files in test_patch";
        return false;
    }
    std::string joined;
    for (const auto& f : files) {
        if (!joined.empty()) joined += " ";
        joined += shell_quote(f);
    }
    std::string cmd = t.command_test;
    while (pos != std::string::npos) {
        cmd.replace(pos, ph.size(), joined);
        pos = cmd.find(ph, pos + joined.size());
    }
    *out = cmd;
    return true;
}

} // namespace patchbench
