#pragma once
#include "types.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace patchbench {

// Base of every harness failure. kind() selects how the dispatcher records it.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// A command exceeded its deadline; partial() holds what it printed before the kill.
class TimeoutError : public Error {
public:
    TimeoutError(const std::string& msg, ExecOutput partial)
        : Error(ErrorKind::TIMEOUT, msg), partial_(std::move(partial)) {}
    const ExecOutput& partial() const { return partial_; }

private:
    ExecOutput partial_;
};

class GitError : public Error {
public:
    explicit GitError(const std::string& msg) : Error(ErrorKind::GIT, msg) {}
};

class GitCloneFailed : public GitError {
public:
    explicit GitCloneFailed(const std::string& msg) : GitError(msg) {}
};

class GitCheckoutFailed : public GitError {
public:
    explicit GitCheckoutFailed(const std::string& msg) : GitError(msg) {}
};

class GitApplyFailed : public GitError {
public:
    explicit GitApplyFailed(const std::string& msg) : GitError(msg) {}
};

class SandboxError : public Error {
public:
    explicit SandboxError(const std::string& msg) : Error(ErrorKind::SANDBOX, msg) {}
};

class SandboxStartFailed : public SandboxError {
public:
    explicit SandboxStartFailed(const std::string& msg) : SandboxError(msg) {}
};

class SandboxCommitFailed : public SandboxError {
public:
    explicit SandboxCommitFailed(const std::string& msg) : SandboxError(msg) {}
};

} // namespace patchbench
