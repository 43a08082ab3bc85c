// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Failure taxonomy carried on absl::Status payloads
// -----------------------------------------------------------------------------

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sockcan::bus {

/// Which step of frame building, socket handling or error decoding failed.
enum class Failure : uint8_t {
    kIdTooLarge = 1,            ///< identifier above the 29-bit range
    kTooMuchData,               ///< payload longer than 8 bytes
    kLookup,                    ///< interface name not found
    kIo,                        ///< socket syscall failed or short transfer
    kNotAnError,                ///< decode attempted on a non-error frame
    kUnknownErrorType,          ///< detail = raw error code
    kNotEnoughData,             ///< detail = payload byte index
    kInvalidControllerProblem,
    kInvalidViolationType,
    kInvalidLocation,
    kInvalidTransceiverError,
};

inline constexpr std::string_view kFailurePayloadUrl = "type.sockcan/failure";

std::string_view FailureName(Failure kind);

absl::Status MakeFailure(Failure kind, std::string_view message, uint32_t detail = 0);

// errno is kept on the payload; the status code comes from absl::ErrnoToStatusCode.
absl::Status MakeOsFailure(Failure kind, int err, std::string_view what);

std::optional<Failure>  GetFailure(const absl::Status& status);
std::optional<uint32_t> GetFailureDetail(const absl::Status& status);
std::optional<int>      GetErrno(const absl::Status& status);

/// True for would-block, in-progress and interrupted conditions. Timeouts set
/// with SetReadTimeout/SetWriteTimeout surface as EAGAIN and are retryable too.
bool ShouldRetry(const absl::Status& status);

template <typename T>
bool ShouldRetry(const absl::StatusOr<T>& result) {
    return !result.ok() && ShouldRetry(result.status());
}

} // namespace sockcan::bus
