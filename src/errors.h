#pragma once

#include <stdexcept>
#include <string>

namespace gaprun {

// Base for every error raised by gaprun
class GaprunError : public std::runtime_error {
public:
    explicit GaprunError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed job or invariant violation
class ValidationError : public GaprunError {
public:
    explicit ValidationError(const std::string& msg)
        : GaprunError("Validation error: " + msg) {}
};

// Transition not legal from the job's current status
class StateTransitionError : public GaprunError {
public:
    explicit StateTransitionError(const std::string& msg)
        : GaprunError("Invalid state transition: " + msg) {}
};

// Code or data directory missing before start
class PathNotFoundError : public GaprunError {
public:
    explicit PathNotFoundError(const std::string& msg) : GaprunError(msg) {}
};

// Container engine (or cluster) unreachable
class SandboxUnavailableError : public GaprunError {
public:
    explicit SandboxUnavailableError(const std::string& msg)
        : GaprunError("Sandbox unavailable: " + msg) {}
};

class BuildFailureError : public GaprunError {
public:
    explicit BuildFailureError(const std::string& msg)
        : GaprunError("Image build failed: " + msg) {}
};

class JobNotFoundError : public GaprunError {
public:
    explicit JobNotFoundError(const std::string& job_id)
        : GaprunError("Job " + job_id + " not found") {}
};

class DatasetNotFoundError : public GaprunError {
public:
    explicit DatasetNotFoundError(const std::string& name)
        : GaprunError("Dataset '" + name + "' not found") {}
};

// Private data requested by a non-owner, or on a side that has none
class PermissionError : public GaprunError {
public:
    explicit PermissionError(const std::string& msg)
        : GaprunError("Permission denied: " + msg) {}
};

class UnsupportedFileTypeError : public GaprunError {
public:
    explicit UnsupportedFileTypeError(const std::string& path)
        : GaprunError("Unsupported file type: " + path) {}
};

class OutputTooLargeError : public GaprunError {
public:
    explicit OutputTooLargeError(const std::string& msg) : GaprunError(msg) {}
};

// Unresolvable connection, missing runtime root, unreadable config files
class ConfigError : public GaprunError {
public:
    explicit ConfigError(const std::string& msg)
        : GaprunError("Configuration error: " + msg) {}
};

} // namespace gaprun
