#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace patchbench {

// Write one diagnostic line to stderr. Lines from concurrent workers never
// interleave. Callers put a "[tag] " prefix on the line themselves.
void console_line(const std::string& line);

// Random-enough id for one harness invocation: "run_<ms>_<hex>".
std::string gen_run_id();

// Append-only structured event log. Every line is canonical JSON (sorted
// keys) with a tamper-evident chain:
//   chain_hash = fnv1a64(chain_prev || canonical record without chain fields)
// The first record's chain_prev is sixteen zeros. Thread-safe.
class JsonlLogger {
public:
    JsonlLogger(const std::string& run_id, const std::string& path);

    bool ok() const { return static_cast<bool>(out_); }

    // Takes ownership of payload (may be nullptr).
    void event(const std::string& name, json_object* payload);
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::mutex mu_;
    std::string run_id_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
};

} // namespace patchbench
