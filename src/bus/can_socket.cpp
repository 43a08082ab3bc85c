// src/bus/can_socket.cpp

#include "bus/can_socket.hpp"
#include "util/sockopt.hpp"

#include <linux/can.h>
#include <linux/can/raw.h>
#include <linux/sockios.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace sockcan::bus {

CanSocket::CanSocket(CanSocket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

CanSocket& CanSocket::operator=(CanSocket&& other) noexcept {
    if (this != &other) {
        Close().IgnoreError();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

CanSocket::~CanSocket() { Close().IgnoreError(); }

/* ───── open ───── */

absl::StatusOr<CanSocket> CanSocket::Open(std::string_view ifname) {
    if (ifname.empty() || ifname.size() >= IFNAMSIZ) {
        return MakeOsFailure(Failure::kLookup, ENODEV,
                             fmt::format("CAN device '{}' not found", ifname));
    }
    const std::string name(ifname);
    const unsigned int if_index = ::if_nametoindex(name.c_str());
    if (if_index == 0) {
        const int err = errno;
        return MakeOsFailure(Failure::kLookup, err,
                             fmt::format("CAN device '{}' not found", ifname));
    }
    return OpenByIndex(if_index);
}

absl::StatusOr<CanSocket> CanSocket::OpenByIndex(unsigned int if_index) {
    const int fd = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (fd < 0) {
        return MakeOsFailure(Failure::kIo, errno, "socket(PF_CAN)");
    }
    // owns fd from here on, so every early return below releases it
    CanSocket sock(fd);

    sockaddr_can addr{};
    addr.can_family  = AF_CAN;
    addr.can_ifindex = static_cast<int>(if_index);

    if (::bind(sock.fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        return MakeOsFailure(Failure::kIo, err, fmt::format("bind to interface {}", if_index));
    }
    return sock;
}

absl::StatusOr<CanSocket> CanSocket::Duplicate() const {
    if (auto st = checkOpen(); !st.ok()) return st;
    const int fd = ::dup(fd_);
    if (fd < 0) {
        return MakeOsFailure(Failure::kIo, errno, "dup");
    }
    return CanSocket(fd);
}

absl::Status CanSocket::Close() {
    if (fd_ < 0) return absl::OkStatus();
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        return MakeOsFailure(Failure::kIo, errno, "close");
    }
    return absl::OkStatus();
}

absl::Status CanSocket::checkOpen() const {
    if (fd_ < 0) return MakeOsFailure(Failure::kIo, EBADF, "socket is closed");
    return absl::OkStatus();
}

/* ───── read / write ───── */

absl::StatusOr<ReceivedFrame> CanSocket::Read() const {
    if (auto st = checkOpen(); !st.ok()) return st;

    can_frame raw{};
    const ssize_t n = ::read(fd_, &raw, sizeof(raw));
    if (n < 0) {
        return MakeOsFailure(Failure::kIo, errno, "read");
    }
    if (static_cast<size_t>(n) != sizeof(raw)) {
        return MakeFailure(Failure::kIo, fmt::format("short read: {} of {} bytes", n, sizeof(raw)));
    }

    timespec ts{};
    if (::ioctl(fd_, SIOCGSTAMPNS, &ts) < 0) {
        return MakeOsFailure(Failure::kIo, errno, "SIOCGSTAMPNS");
    }

    auto frame = Frame::FromWire(raw);
    if (!frame.ok()) return frame.status();
    return ReceivedFrame{*frame, util::TimePointFromTimespec(ts)};
}

absl::Status CanSocket::Write(const Frame& frame) const {
    if (auto st = checkOpen(); !st.ok()) return st;

    const can_frame& raw = frame.ToWire();
    const ssize_t n = ::write(fd_, &raw, sizeof(raw));
    if (n < 0) {
        return MakeOsFailure(Failure::kIo, errno, "write");
    }
    if (static_cast<size_t>(n) != sizeof(raw)) {
        return MakeFailure(Failure::kIo, fmt::format("short write: {} of {} bytes", n, sizeof(raw)));
    }
    return absl::OkStatus();
}

absl::Status CanSocket::WriteRetry(const Frame& frame) const {
    return RetryWhileRetryable([&] { return Write(frame); });
}

absl::Status CanSocket::WriteRetryFor(const Frame& frame, std::chrono::milliseconds budget) const {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    return RetryUntil(deadline,
                      [&] { return Write(frame); },
                      [this](std::chrono::milliseconds remaining) { return WaitWritable(remaining); });
}

absl::Status CanSocket::WaitReadable(std::chrono::milliseconds timeout) const {
    return waitFor(POLLIN, timeout);
}

absl::Status CanSocket::WaitWritable(std::chrono::milliseconds timeout) const {
    return waitFor(POLLOUT, timeout);
}

absl::Status CanSocket::waitFor(short events, std::chrono::milliseconds timeout) const {
    if (auto st = checkOpen(); !st.ok()) return st;

    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = events;
    const int ms = timeout.count() < 0 ? 0 : static_cast<int>(std::min<int64_t>(timeout.count(), INT32_MAX));
    if (::poll(&pfd, 1, ms) < 0 && errno != EINTR) {
        return MakeOsFailure(Failure::kIo, errno, "poll");
    }
    return absl::OkStatus();
}

/* ───── options ───── */

absl::Status CanSocket::SetNonBlocking(bool nonblocking) {
    if (auto st = checkOpen(); !st.ok()) return st;

    const int old_flags = ::fcntl(fd_, F_GETFL);
    if (old_flags == -1) {
        return MakeOsFailure(Failure::kIo, errno, "fcntl(F_GETFL)");
    }
    const int new_flags = nonblocking ? (old_flags | O_NONBLOCK) : (old_flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, new_flags) == -1) {
        return MakeOsFailure(Failure::kIo, errno, "fcntl(F_SETFL)");
    }
    return absl::OkStatus();
}

absl::Status CanSocket::SetReadTimeout(std::chrono::microseconds timeout) {
    if (timeout.count() < 0) return absl::InvalidArgumentError("negative read timeout");
    if (auto st = checkOpen(); !st.ok()) return st;
    return util::SetSocketOption(fd_, SOL_SOCKET, SO_RCVTIMEO,
                                 util::TimevalFromDuration(timeout), "setsockopt(SO_RCVTIMEO)");
}

absl::Status CanSocket::SetWriteTimeout(std::chrono::microseconds timeout) {
    if (timeout.count() < 0) return absl::InvalidArgumentError("negative write timeout");
    if (auto st = checkOpen(); !st.ok()) return st;
    return util::SetSocketOption(fd_, SOL_SOCKET, SO_SNDTIMEO,
                                 util::TimevalFromDuration(timeout), "setsockopt(SO_SNDTIMEO)");
}

absl::Status CanSocket::SetFilters(std::span<const Filter> filters) {
    if (auto st = checkOpen(); !st.ok()) return st;

    std::vector<can_filter> raw;
    raw.reserve(filters.size());
    for (const Filter& f : filters) raw.push_back(f.ToKernel());

    return util::SetSocketOptionArray<can_filter>(fd_, SOL_CAN_RAW, CAN_RAW_FILTER, raw,
                                                  "setsockopt(CAN_RAW_FILTER)");
}

absl::Status CanSocket::SetErrorMask(uint32_t mask) {
    if (auto st = checkOpen(); !st.ok()) return st;
    const can_err_mask_t value = mask;
    return util::SetSocketOption(fd_, SOL_CAN_RAW, CAN_RAW_ERR_FILTER, value,
                                 "setsockopt(CAN_RAW_ERR_FILTER)");
}

absl::Status CanSocket::setFlag(int name, bool enabled, const char* what) {
    if (auto st = checkOpen(); !st.ok()) return st;
    const int value = enabled ? 1 : 0;
    return util::SetSocketOption(fd_, SOL_CAN_RAW, name, value, what);
}

absl::Status CanSocket::SetLoopback(bool enabled) {
    return setFlag(CAN_RAW_LOOPBACK, enabled, "setsockopt(CAN_RAW_LOOPBACK)");
}

absl::Status CanSocket::SetRecvOwnMsgs(bool enabled) {
    return setFlag(CAN_RAW_RECV_OWN_MSGS, enabled, "setsockopt(CAN_RAW_RECV_OWN_MSGS)");
}

absl::Status CanSocket::SetJoinFilters(bool enabled) {
    return setFlag(CAN_RAW_JOIN_FILTERS, enabled, "setsockopt(CAN_RAW_JOIN_FILTERS)");
}

} // namespace sockcan::bus
