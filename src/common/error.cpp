#include "error.h"

#include <optional>

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace driftwatch {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kSchemaMismatch:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kInsufficientData:
        case ErrorCode::kDegenerateBaseline:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kPublishFailed:
        case ErrorCode::kDataSource:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "Ok";
        case ErrorCode::kInvalidArgument:
            return "InvalidArgument";
        case ErrorCode::kInternal:
            return "Internal";
        case ErrorCode::kInsufficientData:
            return "InsufficientDataError";
        case ErrorCode::kSchemaMismatch:
            return "SchemaMismatchError";
        case ErrorCode::kDegenerateBaseline:
            return "DegenerateBaselineError";
        case ErrorCode::kPublishFailed:
            return "PublishError";
        case ErrorCode::kDataSource:
            return "DataSourceError";
        case ErrorCode::kConfigurationError:
            return "ConfigurationError";
        case ErrorCode::kUnknown:
        default:
            return "Unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()),
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    absl::optional<absl::Cord> payload = status.GetPayload(absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()));
    int raw = 0;
    if (payload.has_value() && absl::SimpleAtoi(std::string(*payload), &raw)) {
        return static_cast<ErrorCode>(raw);
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        default:
            return ErrorCode::kUnknown;
    }
}

absl::Status AnnotateError(const absl::Status& status, std::string_view context) {
    if (status.ok()) {
        return status;
    }

    absl::Status annotated(status.code(),
                           absl::StrCat(absl::string_view(context.data(), context.size()), ": ", status.message()));
    status.ForEachPayload(
        [&annotated](absl::string_view type_url, const absl::Cord& payload) {
            annotated.SetPayload(type_url, payload);
        });
    return annotated;
}

}  // namespace driftwatch
