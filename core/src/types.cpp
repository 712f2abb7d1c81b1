#include "patchbench/types.h"

#include <algorithm>
#include <cctype>

namespace patchbench {

static std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

const char* cache_mode_to_str(CacheMode m) {
    switch (m) {
        case CacheMode::DOWNLOAD: return "download";
        case CacheMode::SHARED:   return "shared";
        case CacheMode::LOCAL:    return "local";
        case CacheMode::VOLUME:   return "volume";
    }
    return "volume";
}

std::optional<CacheMode> cache_mode_from_str(const std::string& s) {
    const std::string v = lower_copy(s);
    if (v == "download") return CacheMode::DOWNLOAD;
    if (v == "shared") return CacheMode::SHARED;
    if (v == "local") return CacheMode::LOCAL;
    if (v == "volume") return CacheMode::VOLUME;
    return std::nullopt;
}

const char* test_status_to_str(TestStatus s) {
    switch (s) {
        case TestStatus::PASSED:  return "passed";
        case TestStatus::FAILED:  return "failed";
        case TestStatus::SKIPPED: return "skipped";
        case TestStatus::ERROR:   return "error";
    }
    return "error";
}

std::optional<TestStatus> test_status_from_str(const std::string& s) {
    const std::string v = lower_copy(s);
    if (v == "passed" || v == "pass" || v == "ok" || v == "success") return TestStatus::PASSED;
    if (v == "failed" || v == "fail" || v == "failure") return TestStatus::FAILED;
    if (v == "skipped" || v == "skip" || v == "pending" || v == "ignored" || v == "todo" ||
        v == "disabled") {
        return TestStatus::SKIPPED;
    }
    if (v == "error" || v == "errored") return TestStatus::ERROR;
    return std::nullopt;
}

const char* report_status_to_str(ReportStatus s) {
    switch (s) {
        case ReportStatus::PASSED:  return "passed";
        case ReportStatus::FAILED:  return "failed";
        case ReportStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* error_kind_to_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:     return "";
        case ErrorKind::TIMEOUT:  return "timeout";
        case ErrorKind::GIT:      return "git";
        case ErrorKind::SANDBOX:  return "sandbox";
        case ErrorKind::BUILD:    return "build";
        case ErrorKind::INTERNAL: return "internal";
    }
    return "internal";
}

} // namespace patchbench
