#pragma once

#include "patchbench/task.h"

#include <filesystem>
#include <string>
#include <vector>

namespace patchbench {

std::string slurp(const std::string& path);

// Reads a JSONL task file. Blank lines are ignored; records that fail to
// parse are reported in `rejected` as "line N: reason" and skipped.
// Throws std::runtime_error if the file cannot be read.
std::vector<Task> read_tasks(const std::string& path, std::vector<std::string>* rejected);

// Write via <dst>.tmp + rename. Returns "" on success, an error otherwise.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Value following argv[i] for a "--flag value" pair; advances i.
bool take_value(int argc, char** argv, int& i, std::string* out);

bool parse_int_arg(const std::string& s, int* out);

} // namespace patchbench
