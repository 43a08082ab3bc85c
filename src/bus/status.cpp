// src/bus/status.cpp

#include "bus/status.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <fmt/core.h>

namespace sockcan::bus {

namespace {

// payload layout: "<kind>:<detail>:<errno>", errno 0 when not an OS failure
struct FailureInfo {
    uint32_t kind   = 0;
    uint32_t detail = 0;
    int      err    = 0;
};

std::optional<FailureInfo> parsePayload(const absl::Status& status) {
    std::optional<absl::Cord> payload = status.GetPayload(kFailurePayloadUrl);
    if (!payload) return std::nullopt;

    std::string text(*payload);
    std::vector<std::string_view> parts = absl::StrSplit(text, ':');
    if (parts.size() != 3) return std::nullopt;

    FailureInfo info;
    if (!absl::SimpleAtoi(parts[0], &info.kind) ||
        !absl::SimpleAtoi(parts[1], &info.detail) ||
        !absl::SimpleAtoi(parts[2], &info.err)) {
        return std::nullopt;
    }
    return info;
}

absl::StatusCode codeFor(Failure kind) {
    switch (kind) {
        case Failure::kIdTooLarge:       return absl::StatusCode::kOutOfRange;
        case Failure::kTooMuchData:      return absl::StatusCode::kOutOfRange;
        case Failure::kLookup:           return absl::StatusCode::kNotFound;
        case Failure::kIo:               return absl::StatusCode::kDataLoss;
        case Failure::kNotAnError:       return absl::StatusCode::kFailedPrecondition;
        case Failure::kUnknownErrorType: return absl::StatusCode::kUnimplemented;
        case Failure::kNotEnoughData:    return absl::StatusCode::kOutOfRange;
        case Failure::kInvalidControllerProblem:
        case Failure::kInvalidViolationType:
        case Failure::kInvalidLocation:
        case Failure::kInvalidTransceiverError:
            return absl::StatusCode::kInvalidArgument;
    }
    return absl::StatusCode::kUnknown;
}

void attach(absl::Status& status, Failure kind, uint32_t detail, int err) {
    status.SetPayload(kFailurePayloadUrl,
                      absl::Cord(fmt::format("{}:{}:{}", static_cast<unsigned>(kind), detail, err)));
}

} // namespace

std::string_view FailureName(Failure kind) {
    switch (kind) {
        case Failure::kIdTooLarge:                return "IDTooLarge";
        case Failure::kTooMuchData:               return "TooMuchData";
        case Failure::kLookup:                    return "LookupError";
        case Failure::kIo:                        return "IOError";
        case Failure::kNotAnError:                return "NotAnError";
        case Failure::kUnknownErrorType:          return "UnknownErrorType";
        case Failure::kNotEnoughData:             return "NotEnoughData";
        case Failure::kInvalidControllerProblem:  return "InvalidControllerProblem";
        case Failure::kInvalidViolationType:      return "InvalidViolationType";
        case Failure::kInvalidLocation:           return "InvalidLocation";
        case Failure::kInvalidTransceiverError:   return "InvalidTransceiverError";
    }
    return "Unknown";
}

absl::Status MakeFailure(Failure kind, std::string_view message, uint32_t detail) {
    absl::Status status(codeFor(kind), message);
    attach(status, kind, detail, 0);
    return status;
}

absl::Status MakeOsFailure(Failure kind, int err, std::string_view what) {
    absl::Status status(absl::ErrnoToStatusCode(err),
                        fmt::format("{}: {}", what, std::strerror(err)));
    attach(status, kind, 0, err);
    return status;
}

std::optional<Failure> GetFailure(const absl::Status& status) {
    auto info = parsePayload(status);
    if (!info) return std::nullopt;
    return static_cast<Failure>(info->kind);
}

std::optional<uint32_t> GetFailureDetail(const absl::Status& status) {
    auto info = parsePayload(status);
    if (!info) return std::nullopt;
    return info->detail;
}

std::optional<int> GetErrno(const absl::Status& status) {
    auto info = parsePayload(status);
    if (!info || info->err == 0) return std::nullopt;
    return info->err;
}

bool ShouldRetry(const absl::Status& status) {
    if (status.ok()) return false;
    auto err = GetErrno(status);
    if (!err) return false;
    return *err == EAGAIN || *err == EWOULDBLOCK || *err == EINPROGRESS || *err == EINTR;
}

} // namespace sockcan::bus
