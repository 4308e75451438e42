#pragma once

#include <stdexcept>
#include <string>

namespace dbvh {
    /// Bounds with Min > Max on some axis (or NaN) handed to a mutating call.
    class InvalidBounds : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// Broken internal invariant (double free, dangling index...). Not recoverable.
    class InvariantViolation : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    class SnapshotError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace dbvh
