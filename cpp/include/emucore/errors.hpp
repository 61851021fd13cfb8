/**
 * @file errors.hpp
 * @brief Exception hierarchy for compute operations
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every error raised on the device/port boundary derives from ComputeError
 * and carries the status an HTTP layer reports for it.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace emucore {

/**
 * @brief Boundary status of an error
 */
enum class ErrorStatus {
    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    Conflict = 409,
    Internal = 500
};

/**
 * @brief Base class of every compute error
 */
class ComputeError : public std::runtime_error {
public:
    ComputeError(ErrorStatus status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    ErrorStatus status() const { return status_; }

    int status_code() const { return static_cast<int>(status_); }

private:
    ErrorStatus status_;
};

// ============================================================================
// Port Errors
// ============================================================================

/// Port range with end < start
class PortRangeInvalidError : public ComputeError {
public:
    explicit PortRangeInvalidError(const std::string& message)
        : ComputeError(ErrorStatus::Conflict, message) {}
};

/// No free port left in a range
class PortExhaustedError : public ComputeError {
public:
    PortExhaustedError(uint16_t start, uint16_t end, const std::string& host,
                       std::error_code last_error)
        : ComputeError(ErrorStatus::Conflict,
                       "Could not find a free port between " + std::to_string(start) +
                       " and " + std::to_string(end) + " on host " + host +
                       (last_error ? ", last exception: " + last_error.message() : std::string()))
        , start_(start), end_(end), host_(host), last_error_(last_error) {}

    uint16_t start() const { return start_; }
    uint16_t end() const { return end_; }
    const std::string& host() const { return host_; }
    std::error_code last_error() const { return last_error_; }

private:
    uint16_t start_;
    uint16_t end_;
    std::string host_;
    std::error_code last_error_;
};

/// Requested port is taken or outside its range
class PortConflictError : public ComputeError {
public:
    explicit PortConflictError(const std::string& message)
        : ComputeError(ErrorStatus::Conflict, message) {}
};

// ============================================================================
// Lookup Errors
// ============================================================================

/// Identifier is not a well-formed UUID
class InvalidIdentifierError : public ComputeError {
public:
    explicit InvalidIdentifierError(const std::string& message)
        : ComputeError(ErrorStatus::BadRequest, message) {}
};

class NotFoundError : public ComputeError {
public:
    explicit NotFoundError(const std::string& message)
        : ComputeError(ErrorStatus::NotFound, message) {}
};

class DeviceNotFoundError : public NotFoundError {
public:
    using NotFoundError::NotFoundError;
};

class ProjectNotFoundError : public NotFoundError {
public:
    using NotFoundError::NotFoundError;
};

/// Device exists but belongs to another project; reported as not found
class ProjectMismatchError : public NotFoundError {
public:
    using NotFoundError::NotFoundError;
};

/// Access outside an allowed directory
class ForbiddenError : public ComputeError {
public:
    explicit ForbiddenError(const std::string& message)
        : ComputeError(ErrorStatus::Forbidden, message) {}
};

// ============================================================================
// Device Errors
// ============================================================================

class DeviceError : public ComputeError {
public:
    explicit DeviceError(const std::string& message)
        : ComputeError(ErrorStatus::Conflict, message) {}
};

/// Image path rejected (foreign drive path or outside the images root)
class ImagePathError : public DeviceError {
public:
    using DeviceError::DeviceError;
};

class ImageMissingError : public DeviceError {
public:
    ImageMissingError(const std::string& image, const std::string& message)
        : DeviceError(message), image_(image) {}

    const std::string& image() const { return image_; }

private:
    std::string image_;
};

class AdapterOutOfRangeError : public DeviceError {
public:
    using DeviceError::DeviceError;
};

class PortOutOfRangeError : public DeviceError {
public:
    using DeviceError::DeviceError;
};

class InvalidConsolePortError : public DeviceError {
public:
    using DeviceError::DeviceError;
};

/// Bridge hypervisor missing, too old or unreachable
class BridgeError : public DeviceError {
public:
    using DeviceError::DeviceError;
};

// ============================================================================
// Link, Migration and Project Errors
// ============================================================================

/// Virtual link cannot be created
class NioError : public ComputeError {
public:
    explicit NioError(const std::string& message)
        : ComputeError(ErrorStatus::Conflict, message) {}
};

/// Filesystem failure while converting a legacy project
class MigrationError : public ComputeError {
public:
    explicit MigrationError(const std::string& message)
        : ComputeError(ErrorStatus::Internal, message) {}
};

class ProjectError : public ComputeError {
public:
    explicit ProjectError(const std::string& message)
        : ComputeError(ErrorStatus::Internal, message) {}
};

} // namespace emucore
