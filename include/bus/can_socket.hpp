// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Raw SocketCAN endpoint (PF_CAN / SOCK_RAW / CAN_RAW)
// -----------------------------------------------------------------------------

#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "bus/filter.hpp"
#include "bus/frame.hpp"
#include "bus/status.hpp"

namespace sockcan::bus {

/// Kernel receive time of a frame. Taken with SIOCGSTAMPNS, so the value is
/// nanosecond capable; actual accuracy depends on the driver.
using Timestamp = std::chrono::system_clock::time_point;

struct ReceivedFrame {
    Frame     frame;
    Timestamp timestamp;
};

/// Calls `attempt` until it succeeds or fails with a non-retryable status.
/// There is no cap and no backoff. Socket timeouts do not bound it either: an
/// expired SO_SNDTIMEO/SO_RCVTIMEO is EAGAIN, which is retryable, so a timeout
/// only sets how often the loop wakes up.
template <typename Attempt>
absl::Status RetryWhileRetryable(Attempt&& attempt) {
    for (;;) {
        absl::Status status = attempt();
        if (status.ok() || !ShouldRetry(status)) return status;
    }
}

/// Like RetryWhileRetryable, but gives up once `deadline` has passed and
/// returns the last retryable status. `wait(remaining)` runs between
/// attempts; it should block until a retry can make progress or the time
/// is up, and its failure ends the loop.
template <typename Attempt, typename Wait>
absl::Status RetryUntil(std::chrono::steady_clock::time_point deadline, Attempt&& attempt, Wait&& wait) {
    for (;;) {
        absl::Status status = attempt();
        if (status.ok() || !ShouldRetry(status)) return status;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return status;
        if (auto st = wait(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)); !st.ok()) {
            return st;
        }
    }
}

/// Owns exactly one socket descriptor; closes it once, on Close() or on
/// destruction, whichever comes first. Not safe for concurrent use beyond
/// one reader plus one writer.
class CanSocket {
    public:
        CanSocket(const CanSocket&)            = delete; // non-copyable
        CanSocket& operator=(const CanSocket&) = delete; // non-copyable
        CanSocket(CanSocket&& other) noexcept;
        CanSocket& operator=(CanSocket&& other) noexcept;

        ~CanSocket();

        /// Resolves `ifname` ("can0", "vcan0", ...) and binds to it.
        /// kLookup when the interface does not exist, kIo when socket/bind fail.
        static absl::StatusOr<CanSocket> Open(std::string_view ifname);
        static absl::StatusOr<CanSocket> OpenByIndex(unsigned int if_index);

        /// Takes ownership of an already open descriptor.
        static CanSocket FromFd(int fd) { return CanSocket(fd); }

        /// dup(2) of the descriptor; both objects own their own handle.
        absl::StatusOr<CanSocket> Duplicate() const;

        /// Gives up ownership; the socket is closed afterwards.
        int Release() { return std::exchange(fd_, -1); }

        int  fd() const { return fd_; }
        bool is_open() const { return fd_ >= 0; }

        /// One 16 byte read followed by the timestamp query for it. Either
        /// both succeed or the call fails.
        absl::StatusOr<ReceivedFrame> Read() const;

        /// One 16 byte write. EAGAIN and friends are reported, never retried.
        absl::Status Write(const Frame& frame) const;

        /// Write() until it succeeds or fails non-retryably. Unbounded even
        /// with a write timeout set: the expired timeout is EAGAIN and gets
        /// retried, so a persistently full queue keeps this call here forever.
        absl::Status WriteRetry(const Frame& frame) const;

        /// Bounded WriteRetry. Between attempts waits for POLLOUT; once
        /// `budget` has run out the last retryable status is returned.
        absl::Status WriteRetryFor(const Frame& frame, std::chrono::milliseconds budget) const;

        /// poll(2) for input / output readiness. Running out of time is not
        /// an error; the caller's next Read/Write reports the state.
        absl::Status WaitReadable(std::chrono::milliseconds timeout) const;
        absl::Status WaitWritable(std::chrono::milliseconds timeout) const;

        absl::Status SetNonBlocking(bool nonblocking);

        /// Zero disables the timeout. An expired timeout reads as EAGAIN.
        absl::Status SetReadTimeout(std::chrono::microseconds timeout);
        absl::Status SetWriteTimeout(std::chrono::microseconds timeout);

        /// Replaces the whole filter set. An empty list receives nothing.
        absl::Status SetFilters(std::span<const Filter> filters);

        /// Which error classes the kernel reports as error frames
        /// (kErrMaskNone by default, kErrMaskAll for everything).
        absl::Status SetErrorMask(uint32_t mask);

        absl::Status SetLoopback(bool enabled);       ///< default on
        absl::Status SetRecvOwnMsgs(bool enabled);    ///< default off
        absl::Status SetJoinFilters(bool enabled);    ///< default off

        /// Closing an already closed socket is a no-op returning OK. The
        /// descriptor is given up even when close(2) reports an error.
        absl::Status Close();

    private:
        explicit CanSocket(int fd) : fd_(fd) {}
        absl::Status checkOpen() const;
        absl::Status setFlag(int name, bool enabled, const char* what);
        absl::Status waitFor(short events, std::chrono::milliseconds timeout) const;

        int fd_ = -1;
};

} // namespace sockcan::bus
