#pragma once
#include <stdexcept>
#include <string>

/// @file
/// Exception types raised at the entry of the analysis functions. Hot loops
/// never throw; everything is validated before the first element is touched.

/// Non-positive bin count, bin width or coincidence window, or a channel index
/// outside the supported range.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what) {}
};

/// Input sequence is not sorted ascending. Only raised by the optional
/// ordering check.
class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string &what)
        : std::logic_error(what) {}
};
