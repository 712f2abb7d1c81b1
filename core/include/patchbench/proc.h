#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace patchbench {

struct ProcLimits {
    int timeout_ms{60000};                     // <= 0 disables the deadline
    size_t stdout_max_bytes{8 * 1024 * 1024};
    size_t stderr_max_bytes{2 * 1024 * 1024};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string stdout_text;
    std::string stderr_text;
    long long duration_ms{0};
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is resolved through PATH), capture stdout and stderr
// separately, enforce the deadline by killing the child's whole process group.
// Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same, feeding stdin_data to the child's stdin (closed once written).
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Deadline in milliseconds for a timeout given in seconds: <= 0 disables it,
// values past INT_MAX milliseconds saturate.
int deadline_ms(long long timeout_sec);

// Split a command string into argv tokens. Supports single/double quotes and
// backslash escaping inside double quotes. Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Quote a string for safe inclusion in a POSIX shell command line.
std::string shell_quote(const std::string& s);

} // namespace patchbench
