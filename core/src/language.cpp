#include "patchbench/language.h"
#include "patchbench/log.h"
#include "patchbench/report.h"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace patchbench {

namespace fs = std::filesystem;

namespace {

constexpr uintmax_t kMaxReportBytes = 64ULL * 1024 * 1024;

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string basename_of(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

bool has_dir(const std::string& path, const std::string& dir) {
    return path.rfind(dir + "/", 0) == 0 || path.find("/" + dir + "/") != std::string::npos;
}

std::string prefix_ulimit(const std::string& cmd) {
    return "ulimit -n 65535 2>/dev/null; " + cmd;
}

// ctest writes JUnit only when asked; inject it right after the ctest word
// so trailing "&& ..." chains keep working.
std::string ctest_with_junit(const std::string& cmd) {
    const std::string junit = std::string(kSandboxWorkdir) + "/test-results/junit.xml";
    std::string out = "mkdir -p " + std::string(kSandboxWorkdir) + "/test-results && ";
    if (cmd.find("--output-junit") != std::string::npos) return out + cmd;
    size_t pos = 0;
    while ((pos = cmd.find("ctest", pos)) != std::string::npos) {
        const bool start_ok = pos == 0 || cmd[pos - 1] == ' ' || cmd[pos - 1] == ';' ||
                              cmd[pos - 1] == '&' || cmd[pos - 1] == '(' || cmd[pos - 1] == '/';
        const size_t end = pos + 5;
        const bool end_ok = end == cmd.size() || cmd[end] == ' ' || cmd[end] == ';' || cmd[end] == '&';
        if (start_ok && end_ok) {
            return out + cmd.substr(0, end) + " --output-junit " + junit + cmd.substr(end);
        }
        pos = end;
    }
    return out + cmd;
}

// Only consulted when ctest wrote no JUnit file, so one run is not counted twice.
std::vector<fs::path> ctest_dashboard_reports(const fs::path& workdir) {
    std::vector<fs::path> out;
    if (!glob_files(workdir, "test-results/*.xml").empty()) return out;
    for (const char* dir : {"Testing", "build/Testing"}) {
        const fs::path tag_file = workdir / dir / "TAG";
        std::ifstream f(tag_file);
        if (!f) continue;
        std::string tag;
        std::getline(f, tag);
        while (!tag.empty() && (tag.back() == '\r' || tag.back() == ' ')) tag.pop_back();
        if (tag.empty()) continue;
        const fs::path xml = workdir / dir / tag / "Test.xml";
        std::error_code ec;
        if (fs::is_regular_file(xml, ec)) out.push_back(xml);
    }
    return out;
}

bool js_test_file(const std::string& path) {
    static const char* exts[] = {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx", ".mts", ".cts"};
    const std::string base = basename_of(path);
    bool code = false;
    for (const char* e : exts) code = code || ends_with(base, e);
    if (!code) return false;
    return base.find(".test.") != std::string::npos || base.find(".spec.") != std::string::npos ||
           has_dir(path, "__tests__") || has_dir(path, "test") || has_dir(path, "tests");
}

LanguageProfile make_python() {
    LanguageProfile p;
    p.name = "python";
    p.default_image = "python:3.11.11-slim-bookworm";
    p.default_build_command = "pip install -e .";
    p.default_test_command = "pytest --json-report --json-report-file=report_pytest.json -rA";
    p.caches = {{"pip", "/root/.cache/pip", ".cache/pip"}};
    p.report_globs = {"report_pytest.json", "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"report_pytest.json", "test-results"};
    p.build_outputs = {"*.egg-info/", "/build/"};
    p.console_formats = {ConsoleFormat::PYTEST};
    p.env = {{"PIP_CACHE_DIR", "/root/.cache/pip"}};
    p.is_test_file = [](const std::string& path) {
        const std::string base = basename_of(path);
        return ends_with(base, ".py") && base.find("test") != std::string::npos;
    };
    return p;
}

LanguageProfile make_java() {
    LanguageProfile p;
    p.name = "java";
    p.default_image = "maven:3.9-eclipse-temurin-17";
    p.default_build_command = "mvn -B -q -DskipTests install";
    p.default_test_command = "mvn -B test -fae";
    p.caches = {{"maven", "/root/.m2", ".m2"}};
    p.report_globs = {"**/target/surefire-reports/TEST-*.xml", "**/build/test-results/**/*.xml",
                      "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"target/surefire-reports", "*/target/surefire-reports",
                         "build/test-results", "*/build/test-results", "test-results"};
    p.build_outputs = {"target/"};
    p.console_formats = {ConsoleFormat::MAVEN, ConsoleFormat::GRADLE};
    p.is_test_file = [](const std::string& path) {
        const std::string base = basename_of(path);
        return ends_with(base, ".java") &&
               (has_dir(path, "test") || ends_with(base, "Test.java") || ends_with(base, "Tests.java"));
    };
    return p;
}

LanguageProfile make_kotlin() {
    LanguageProfile p;
    p.name = "kotlin";
    p.default_image = "gradle:8.5-jdk17";
    p.default_build_command = "./gradlew assemble --no-daemon";
    p.default_test_command = "./gradlew test --no-daemon --continue";
    p.shm_size = "2g";
    p.caches = {{"gradle", "/root/.gradle", ".gradle"}, {"kotlin", "/root/.kotlin", ".kotlin"}};
    p.report_globs = {"**/build/test-results/**/*.xml", "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"build/test-results", "*/build/test-results", "*/*/build/test-results", "test-results"};
    p.build_outputs = {"build/", "/.gradle/"};
    p.console_formats = {ConsoleFormat::GRADLE};
    p.env = {{"GRADLE_OPTS", "-Dorg.gradle.daemon=false -Dorg.gradle.jvmargs=-Xmx2g"}};
    auto prep = [](const std::string& cmd) {
        return "chmod +x gradlew 2>/dev/null || true; " + cmd;
    };
    p.rewrite_build = prep;
    p.rewrite_test = prep;
    p.is_test_file = [](const std::string& path) {
        const std::string base = basename_of(path);
        return (ends_with(base, ".kt") || ends_with(base, ".java")) && has_dir(path, "test");
    };
    return p;
}

LanguageProfile make_scala() {
    LanguageProfile p;
    p.name = "scala";
    p.default_image = "hseeberger/scala-sbt:11.0.12_1.5.5_2.13.6";
    p.default_build_command = "sbt -batch compile";
    p.default_test_command = "sbt -batch test";
    p.caches = {{"sbt", "/root/.sbt", ".sbt"},
                {"ivy", "/root/.ivy2", ".ivy2"},
                {"coursier", "/root/.cache/coursier", ".cache/coursier"}};
    p.report_globs = {"**/target/test-reports/*.xml", "test-results/*.xml"};
    p.stale_artifacts = {"target/test-reports", "*/target/test-reports", "test-results"};
    p.build_outputs = {"target/"};
    p.console_formats = {ConsoleFormat::SBT};
    p.is_test_file = [](const std::string& path) {
        return ends_with(path, ".scala") && has_dir(path, "test");
    };
    return p;
}

LanguageProfile make_go() {
    LanguageProfile p;
    p.name = "go";
    p.default_image = "golang:latest";
    p.default_build_command = "go mod download && go build ./...";
    p.default_test_command = "go test -json ./... > gotest_results.jsonl";
    p.caches = {{"gopath", "/go", "go"}, {"gobuild", "/root/.cache/go-build", ".cache/go-build"}};
    p.report_globs = {"gotest_results.jsonl", "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"gotest_results.jsonl", "test-results"};
    p.console_formats = {ConsoleFormat::GO};
    p.is_test_file = [](const std::string& path) { return ends_with(path, "_test.go"); };
    return p;
}

LanguageProfile make_rust() {
    LanguageProfile p;
    p.name = "rust";
    p.default_image = "rust:latest";
    p.default_build_command = "cargo build --tests";
    p.default_test_command = "cargo test --no-fail-fast 2>&1 | tee test_results.txt";
    // registry and git only: mounting all of CARGO_HOME would hide the toolchain binaries
    p.caches = {{"cargo-registry", "/usr/local/cargo/registry", ".cargo/registry"},
                {"cargo-git", "/usr/local/cargo/git", ".cargo/git"}};
    p.report_globs = {"test_results.txt", "target/nextest/*/junit.xml", "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"test_results.txt", "target/nextest", "test-results"};
    p.build_outputs = {"/target/"};
    p.console_formats = {ConsoleFormat::CARGO};
    p.is_test_file = [](const std::string& path) {
        return ends_with(path, ".rs") && (has_dir(path, "tests") || basename_of(path).find("test") != std::string::npos);
    };
    return p;
}

LanguageProfile make_cpp() {
    LanguageProfile p;
    p.name = "cpp";
    p.default_image = "rikorose/gcc-cmake:latest";
    p.default_build_command = "cmake -S . -B build && cmake --build build -j4";
    p.default_test_command = "cmake --build build -j4 && cd build && ctest --output-on-failure";
    p.caches = {{"cmake", "/root/.cmake", ".cmake"},
                {"ccache", "/root/.ccache", ".ccache"},
                {"cpp", "/root/.cache/cpp", ".cache/cpp"}};
    p.report_globs = {"test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"test-results", "Testing/*/Test.xml", "build/Testing/*/Test.xml"};
    p.build_outputs = {"/build/"};
    p.console_formats = {ConsoleFormat::CTEST, ConsoleFormat::GTEST};
    p.env = {{"CCACHE_DIR", "/root/.ccache"}};
    p.rewrite_build = [](const std::string& cmd) {
        return "mkdir -p " + std::string(kSandboxWorkdir) + "/test-results && " + cmd;
    };
    p.rewrite_test = ctest_with_junit;
    p.extra_reports = ctest_dashboard_reports;
    p.is_test_file = [](const std::string& path) {
        static const char* exts[] = {".cpp", ".cc", ".cxx", ".c", ".h", ".hpp"};
        bool code = false;
        for (const char* e : exts) code = code || ends_with(path, e);
        return code && (has_dir(path, "test") || has_dir(path, "tests") ||
                        lower_ascii(basename_of(path)).find("test") != std::string::npos);
    };
    return p;
}

LanguageProfile make_javascript(const std::string& name, const std::string& image) {
    LanguageProfile p;
    p.name = name;
    p.default_image = image;
    p.default_build_command = "npm ci || npm install";
    p.default_test_command = "npx jest --ci --json --outputFile=jest-results.json";
    p.caches = {{"npm", "/root/.npm", ".npm"}, {"yarn", "/usr/local/share/.cache/yarn", ".cache/yarn"}};
    p.report_globs = {"jest-results.json", "test-results.xml", "mocha-results.json",
                      "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"jest-results.json", "test-results.xml", "mocha-results.json", "test-results"};
    p.build_outputs = {"/node_modules/"};
    p.console_formats = {ConsoleFormat::JEST, ConsoleFormat::MOCHA};
    p.rewrite_build = prefix_ulimit;
    p.rewrite_test = prefix_ulimit;
    p.is_test_file = js_test_file;
    return p;
}

LanguageProfile make_typescript() {
    LanguageProfile p = make_javascript("typescript", "node:latest");
    p.default_build_command = "yarn install --frozen-lockfile || yarn install";
    p.default_test_command = "yarn jest --ci --json --outputFile=jest-results.json";
    return p;
}

LanguageProfile make_php() {
    LanguageProfile p;
    p.name = "php";
    p.default_image = "composer:latest";
    p.default_build_command = "composer install --no-interaction --prefer-dist";
    p.default_test_command = "vendor/bin/phpunit --log-junit test-results/junit.xml";
    p.shell = "sh";
    p.caches = {{"composer", "/tmp/composer", ".cache/composer"}};
    p.report_globs = {"test-results/*.xml", "test-results/*.json", "junit.xml"};
    p.stale_artifacts = {"test-results", "junit.xml"};
    p.build_outputs = {"/vendor/"};
    p.console_formats = {ConsoleFormat::PHPUNIT};
    p.env = {{"COMPOSER_CACHE_DIR", "/tmp/composer"}, {"COMPOSER_ALLOW_SUPERUSER", "1"}};
    p.rewrite_test = [](const std::string& cmd) { return "mkdir -p test-results && " + cmd; };
    p.is_test_file = [](const std::string& path) { return ends_with(path, "Test.php"); };
    return p;
}

LanguageProfile make_ruby() {
    LanguageProfile p;
    p.name = "ruby";
    p.default_image = "ruby:latest";
    p.default_build_command = "bundle install";
    p.default_test_command = "bundle exec rspec --format progress --format json --out rspec_results.json";
    p.caches = {{"gem", "/usr/local/bundle", ".gem"}};
    p.report_globs = {"rspec_results.json", "test-results/*.xml", "test-results/*.json"};
    p.stale_artifacts = {"rspec_results.json", "test-results"};
    p.build_outputs = {"/.bundle/"};
    p.console_formats = {ConsoleFormat::RSPEC};
    p.is_test_file = [](const std::string& path) {
        return ends_with(path, "_spec.rb") || ends_with(path, "_test.rb");
    };
    return p;
}

const std::map<std::string, LanguageProfile>& registry() {
    static const std::map<std::string, LanguageProfile> profiles = [] {
        std::map<std::string, LanguageProfile> m;
        for (LanguageProfile p : {make_python(), make_java(), make_kotlin(), make_scala(), make_go(),
                                  make_rust(), make_cpp(), make_javascript("javascript", "node:22"),
                                  make_javascript("nodejs", "node:18"), make_typescript(), make_php(),
                                  make_ruby()}) {
            std::string key = p.name;
            m.emplace(std::move(key), std::move(p));
        }
        return m;
    }();
    return profiles;
}

std::string canonical_language(const std::string& name) {
    static const std::map<std::string, std::string> aliases = {
        {"py", "python"}, {"python3", "python"}, {"golang", "go"}, {"c++", "cpp"}, {"cxx", "cpp"},
        {"js", "javascript"}, {"ts", "typescript"}, {"node", "nodejs"}, {"kt", "kotlin"},
        {"rs", "rust"}, {"rb", "ruby"},
    };
    std::string n = lower_ascii(name);
    auto it = aliases.find(n);
    return it == aliases.end() ? n : it->second;
}

// ---- glob ----

bool skip_dir(const std::string& name) {
    return name == ".git" || name == "node_modules" || name == "vendor" || name == ".gradle" ||
           name == "__pycache__" || name == ".venv";
}

std::vector<std::string> split_pattern(const std::string& pattern) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : pattern) {
        if (c == '/') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

void glob_walk(const fs::path& dir, const std::vector<std::string>& segs, size_t i,
               std::set<fs::path>& out) {
    std::error_code ec;
    if (i == segs.size()) return;
    const std::string& seg = segs[i];
    const bool last = i + 1 == segs.size();

    if (seg == "**") {
        // zero directories
        glob_walk(dir, segs, i + 1, out);
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (it->is_directory(ec) && !it->is_symlink(ec) && !skip_dir(name)) {
                glob_walk(it->path(), segs, i, out);
            }
        }
        return;
    }

    if (seg.find_first_of("*?[") == std::string::npos) {
        const fs::path next = dir / seg;
        if (last) {
            if (fs::is_regular_file(next, ec)) out.insert(next);
        } else if (fs::is_directory(next, ec)) {
            glob_walk(next, segs, i + 1, out);
        }
        return;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (fnmatch(seg.c_str(), name.c_str(), FNM_PERIOD) != 0) continue;
        if (last) {
            if (it->is_regular_file(ec)) out.insert(it->path());
        } else if (it->is_directory(ec)) {
            glob_walk(it->path(), segs, i + 1, out);
        }
    }
}

bool read_capped(const fs::path& p, std::string* out) {
    std::error_code ec;
    const uintmax_t size = fs::file_size(p, ec);
    if (ec) return false;
    if (size > kMaxReportBytes) {
        console_line("[report] skipping oversized artifact " + p.string() + " (" + std::to_string(size) + " bytes)");
        return false;
    }
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

} // namespace

const LanguageProfile* find_language(const std::string& name) {
    const auto& reg = registry();
    auto it = reg.find(canonical_language(name));
    return it == reg.end() ? nullptr : &it->second;
}

const LanguageProfile& language_or_throw(const std::string& name) {
    const LanguageProfile* p = find_language(name);
    if (!p) throw std::runtime_error("unsupported language: " + name);
    return *p;
}

std::vector<std::string> language_names() {
    std::vector<std::string> out;
    for (const auto& kv : registry()) out.push_back(kv.first);
    return out;
}

std::string effective_build_command(const LanguageProfile& p, const std::string& cmd) {
    return p.rewrite_build ? p.rewrite_build(cmd) : cmd;
}

std::string effective_test_command(const LanguageProfile& p, const std::string& cmd) {
    std::string out = p.rewrite_test ? p.rewrite_test(cmd) : cmd;
    if (p.stale_artifacts.empty()) return out;
    std::string purge = "rm -rf";
    for (const auto& g : p.stale_artifacts) purge += " " + g; // left unquoted: shell expands the globs
    return purge + "; " + out;
}

std::vector<fs::path> glob_files(const fs::path& root, const std::string& pattern) {
    std::set<fs::path> found;
    const auto segs = split_pattern(pattern);
    if (!segs.empty()) glob_walk(root, segs, 0, found);
    return std::vector<fs::path>(found.begin(), found.end());
}

std::vector<fs::path> locate_report_files(const LanguageProfile& p, const fs::path& workdir) {
    std::set<fs::path> found;
    for (const auto& g : p.report_globs) {
        for (auto& f : glob_files(workdir, g)) found.insert(f);
    }
    if (p.extra_reports) {
        for (auto& f : p.extra_reports(workdir)) found.insert(f);
    }
    return std::vector<fs::path>(found.begin(), found.end());
}

TestReport collect_reports(const LanguageProfile& p, const fs::path& workdir) {
    const std::string hint = p.console_formats.empty() ? "" : console_format_to_str(p.console_formats.front());
    std::vector<TestReport> usable;
    int64_t collected = 0;
    for (const auto& f : locate_report_files(p, workdir)) {
        std::string bytes;
        if (!read_capped(f, &bytes)) continue;
        TestReport r = parse_artifact(bytes, hint);
        if (r.summary.total > 0) usable.push_back(std::move(r));
        else collected = std::max(collected, r.summary.collected);
    }
    if (usable.empty()) return unknown_report(collected);
    return merge_reports(usable);
}

} // namespace patchbench
