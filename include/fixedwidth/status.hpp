#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for fixedwidth
 */

#include <string>
#include <string_view>

namespace fixedwidth {

/**
 * @brief Status codes for schema operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kInvalidArgument,
    kConfigError,     // Option validation or required-option failure
    kDuplicateName,   // Field, group or schema name collision
    kSchemaError,     // Unresolvable reference, cycle, malformed declaration
    kInternal,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status ConfigError(std::string msg = "") { return Status(StatusCode::kConfigError, std::move(msg)); }
    [[nodiscard]] static Status DuplicateName(std::string msg = "") { return Status(StatusCode::kDuplicateName, std::move(msg)); }
    [[nodiscard]] static Status SchemaError(std::string msg = "") { return Status(StatusCode::kSchemaError, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool is_config_error() const noexcept { return code_ == StatusCode::kConfigError; }
    [[nodiscard]] bool is_duplicate_name() const noexcept { return code_ == StatusCode::kDuplicateName; }
    [[nodiscard]] bool is_schema_error() const noexcept { return code_ == StatusCode::kSchemaError; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace fixedwidth
