#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

// Return code reserved for a command killed by its deadline.
constexpr int kTimeoutReturnCode = 2;
constexpr const char* kTimeoutStderr = "Timeout exception";

// Working directory of every sandbox (bind-mounted from the host checkout).
constexpr const char* kSandboxWorkdir = "/run_dir";

enum class CacheMode {
    DOWNLOAD, // fresh download every run, nothing mounted
    SHARED,   // the invoking user's real cache directories
    LOCAL,    // per-language directories under the harness cache root
    VOLUME,   // container-runtime managed named volumes
};

const char* cache_mode_to_str(CacheMode m);
std::optional<CacheMode> cache_mode_from_str(const std::string& s);

enum class TestStatus { PASSED, FAILED, SKIPPED, ERROR };

const char* test_status_to_str(TestStatus s);
std::optional<TestStatus> test_status_from_str(const std::string& s);

struct TestCase {
    std::string name;
    std::string classname;
    double time{0.0}; // seconds
    TestStatus status{TestStatus::PASSED};
    std::string message;
    std::string details;
};

struct TestSummary {
    int64_t total{0};
    int64_t passed{0};
    int64_t failed{0};
    int64_t skipped{0};
    int64_t errors{0};
    int64_t collected{0};
};

enum class ReportStatus { PASSED, FAILED, UNKNOWN };

const char* report_status_to_str(ReportStatus s);

struct TestReport {
    TestSummary summary;
    std::vector<TestCase> tests;
    ReportStatus status{ReportStatus::UNKNOWN};
};

// Classification of a failed step. NONE means the step completed.
enum class ErrorKind { NONE, TIMEOUT, GIT, SANDBOX, BUILD, INTERNAL };

const char* error_kind_to_str(ErrorKind k);

// Raw output of one command executed inside a sandbox.
struct ExecOutput {
    std::string stdout_text;
    std::string stderr_text;
    int return_code{0};
    double duration_sec{0.0};
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int return_code{0};
    double duration_sec{0.0};
    std::optional<TestReport> report; // absent for build commands
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error;
};

// One host <-> sandbox binding. Either a bind mount (host_path) or a
// runtime-managed named volume (volume_name).
struct BindSpec {
    std::string host_path;
    std::string volume_name;
    bool read_only{false};
    bool create_if_missing{false}; // host directory owned by the harness

    bool is_volume() const { return !volume_name.empty(); }
};

} // namespace patchbench
