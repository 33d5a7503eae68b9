#pragma once

#include <stdexcept>
#include <string>

namespace dic::stats {

// Caller supplied a bad date, range or count. Raised before any state is
// touched.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// The backing database could not complete an operation. Retryable.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// The final flush did not succeed before the shutdown deadline.
class ShutdownTimeoutError : public std::runtime_error {
public:
    explicit ShutdownTimeoutError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace dic::stats
