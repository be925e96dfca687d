#pragma once

/// @file error.h
/// @brief driftwatch error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace driftwatch {

/// @brief Error kinds raised by the monitoring engine
///
/// Several kinds share an absl::StatusCode, so the kind itself travels as a
/// status payload (see GetErrorCode).
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kInternal,

    // Monitoring-specific error kinds
    kInsufficientData,    ///< Too few samples for a test or an accuracy figure
    kSchemaMismatch,      ///< Feature count/width differs between datasets
    kDegenerateBaseline,  ///< Baseline mean is zero for prediction drift
    kPublishFailed,       ///< Telemetry backend unreachable or rejected a batch
    kDataSource,          ///< Data source collaborator failed
    kConfigurationError,
};

/// @brief Payload type URL carrying the ErrorCode
inline constexpr std::string_view kErrorCodePayload = "type.driftwatch/error_code";

/// @brief Convert error code to its absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code (e.g. "SchemaMismatchError")
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the error kind of a status
///
/// Statuses created outside MakeError map to kOk, kInvalidArgument,
/// kInternal or kUnknown based on their absl code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Prefix the message of a status, keeping its code and payloads
absl::Status AnnotateError(const absl::Status& status, std::string_view context);

inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

inline absl::Status SchemaMismatchError(std::string_view message) {
    return MakeError(ErrorCode::kSchemaMismatch, message);
}

inline absl::Status DegenerateBaselineError(std::string_view message) {
    return MakeError(ErrorCode::kDegenerateBaseline, message);
}

inline absl::Status PublishError(std::string_view message) {
    return MakeError(ErrorCode::kPublishFailed, message);
}

inline absl::Status DataSourceError(std::string_view message) {
    return MakeError(ErrorCode::kDataSource, message);
}

inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

inline bool IsInsufficientData(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kInsufficientData;
}

inline bool IsSchemaMismatch(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kSchemaMismatch;
}

inline bool IsDegenerateBaseline(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kDegenerateBaseline;
}

inline bool IsPublishError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kPublishFailed;
}

inline bool IsDataSourceError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kDataSource;
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTWATCH_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTWATCH_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(                                          \
        DRIFTWATCH_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTWATCH_CONCAT(a, b) DRIFTWATCH_CONCAT_IMPL(a, b)
#define DRIFTWATCH_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTWATCH_CHECK_OR_RETURN(condition, error_status)                    \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftwatch
