#include "runner_utils.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace patchbench {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<Task> read_tasks(const std::string& path, std::vector<std::string>* rejected) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path);

    std::vector<Task> tasks;
    std::string line;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        lineno++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        Task t;
        std::string err;
        if (!parse_task(line, &t, &err)) {
            if (rejected) rejected->push_back("line " + std::to_string(lineno) + ": " + err);
            continue;
        }
        tasks.push_back(std::move(t));
    }
    return tasks;
}

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        f.flush();
        if (!f) return "short write to " + tmp.string();
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::string msg = "rename to " + dst.string() + " failed: " + ec.message();
        std::filesystem::remove(tmp, ec);
        return msg;
    }
    return "";
}

bool take_value(int argc, char** argv, int& i, std::string* out) {
    if (i + 1 >= argc) return false;
    *out = argv[++i];
    return true;
}

bool parse_int_arg(const std::string& s, int* out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        *out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace patchbench
