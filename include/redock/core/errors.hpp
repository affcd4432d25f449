/**
 * @file errors.hpp
 * @brief Exception types raised by the reconciliation engine
 *
 * Setup errors (ArgumentError) abort the whole invocation. Everything else is
 * per-target: UpdateEngine catches it at the target boundary, converts it to a
 * ledger record and moves on to the next target.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace redock {

/// Malformed or conflicting command-line / configuration input
class ArgumentError : public std::runtime_error {
public:
    explicit ArgumentError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Target container does not exist
class ContainerNotFound : public std::runtime_error {
public:
    explicit ContainerNotFound(const std::string& name)
        : std::runtime_error("Container '" + name + "' not found"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// Image reference cannot be resolved from the local image store
class ImageNotFound : public std::runtime_error {
public:
    explicit ImageNotFound(const std::string& reference)
        : std::runtime_error("Image '" + reference + "' not found locally"), reference_(reference) {}

    const std::string& reference() const { return reference_; }

private:
    std::string reference_;
};

/// Invalid interactive input (rollback menu selection)
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Nothing in the ledger (or the runtime) matches the requested target
class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& message)
        : std::runtime_error(message) {}
};

/// A runtime / orchestration command failed or returned unusable output
class RuntimeCommandError : public std::runtime_error {
public:
    explicit RuntimeCommandError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace redock
