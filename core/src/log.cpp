#include "patchbench/log.h"
#include "patchbench/hash.h"
#include "patchbench/json_mini.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace patchbench {

static std::mutex& console_mutex() {
    static std::mutex mu;
    return mu;
}

void console_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(console_mutex());
    std::cerr << line << "\n";
    std::cerr.flush();
}

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

std::string gen_run_id() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    std::random_device rd;
    uint64_t r = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    return "run_" + std::to_string(ms) + "_" + hash::hex64(r).substr(0, 8);
}

JsonlLogger::JsonlLogger(const std::string& run_id, const std::string& path)
    : run_id_(run_id), path_(path), out_(path, std::ios::out | std::ios::app), chain_prev_(std::string(16, '0')) {}

void JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    auto doc = json_mini::parse(payload_json);
    if (doc) {
        event(name, doc.release());
    } else {
        event(name, json_mini::new_string(payload_json));
    }
}

void JsonlLogger::event(const std::string& name, json_object* payload) {
    json_mini::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "event", json_mini::new_string(name));
    json_object_object_add(rec.root, "payload", payload);
    json_object_object_add(rec.root, "run_id", json_mini::new_string(run_id_));
    json_object_object_add(rec.root, "ts", json_mini::new_string(iso_now()));

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(rec.root, "seq", json_object_new_int64(static_cast<int64_t>(seq_++)));

    const std::string record = json_mini::canonical(rec.root);
    const std::string chain_hash = hash::fnv1a64_hex(chain_prev_ + record);

    json_object_object_add(rec.root, "chain_prev", json_mini::new_string(chain_prev_));
    json_object_object_add(rec.root, "chain_hash", json_mini::new_string(chain_hash));
    out_ << json_mini::canonical(rec.root) << "\n";
    out_.flush();
    chain_prev_ = chain_hash;
}

} // namespace patchbench
