#pragma once

#include <cerrno>
#include <chrono>
#include <span>

#include <sys/socket.h>
#include <sys/time.h>
#include <time.h>

#include <absl/status/status.h>

#include "bus/status.hpp"

namespace sockcan::util {

/// Typed setsockopt. `value` must have the exact type the option expects
/// (an `int` for boolean toggles, not a `bool`).
template <typename T>
absl::Status SetSocketOption(int fd, int level, int name, const T& value, const char* what) {
    if (::setsockopt(fd, level, name, &value, sizeof(T)) != 0) {
        return bus::MakeOsFailure(bus::Failure::kIo, errno, what);
    }
    return absl::OkStatus();
}

/// Array form; an empty span passes a null pointer with length zero.
template <typename T>
absl::Status SetSocketOptionArray(int fd, int level, int name, std::span<const T> values, const char* what) {
    const void* ptr = values.empty() ? nullptr : values.data();
    const auto len  = static_cast<socklen_t>(values.size_bytes());
    if (::setsockopt(fd, level, name, ptr, len) != 0) {
        return bus::MakeOsFailure(bus::Failure::kIo, errno, what);
    }
    return absl::OkStatus();
}

inline timeval TimevalFromDuration(std::chrono::microseconds d) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(secs.count());
    tv.tv_usec = static_cast<suseconds_t>((d - secs).count());
    return tv;
}

inline std::chrono::system_clock::time_point TimePointFromTimespec(const timespec& ts) {
    const auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

} // namespace sockcan::util
