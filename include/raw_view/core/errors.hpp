#pragma once

#include <stdexcept>
#include <string>

namespace raw_view {

class RawViewError : public std::runtime_error {
public:
    explicit RawViewError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public RawViewError {
public:
    explicit ConfigError(const std::string& message)
        : RawViewError("Config error: " + message) {}
};

class ValidationError : public RawViewError {
public:
    explicit ValidationError(const std::string& message)
        : RawViewError("Validation error: " + message) {}
};

// Sample count does not match the frame geometry, or calibration is degenerate.
class InvalidGeometryError : public ValidationError {
public:
    explicit InvalidGeometryError(const std::string& message)
        : ValidationError("invalid geometry: " + message) {}
};

class UnsupportedPatternError : public ValidationError {
public:
    explicit UnsupportedPatternError(const std::string& message)
        : ValidationError("unsupported Bayer pattern: " + message) {}
};

class DecodeError : public RawViewError {
public:
    explicit DecodeError(const std::string& message)
        : RawViewError("Decode error: " + message) {}
};

} // namespace raw_view
