#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "bus/can_socket.hpp"
#include "bus/filter.hpp"
#include "config/config_loader.hpp"

namespace sockcan::config {

/// `[can]` section of config.ini. Options left unset keep the kernel default.
struct SocketConfig {
    std::string channel;                                ///< e.g. vcan0
    std::optional<std::vector<bus::Filter>> filters;    ///< absent: no CAN_RAW_FILTER call
    std::optional<uint32_t> error_mask;
    std::optional<bool> loopback;
    std::optional<bool> recv_own_msgs;
    std::optional<bool> join_filters;
    bool nonblocking = false;
    std::chrono::milliseconds read_timeout{0};          ///< 0 = block forever
    std::chrono::milliseconds write_timeout{0};
};

/// "100:7FF,18DAF100:1FFFFFFF" -> filters. Hex ids and masks, `0x` optional.
/// An empty string yields an empty list (receive nothing).
absl::StatusOr<std::vector<bus::Filter>> ParseFilters(std::string_view text);

absl::StatusOr<SocketConfig> LoadSocketConfig(const ConfigLoader& loader);

absl::Status ApplySocketConfig(bus::CanSocket& socket, const SocketConfig& cfg);

}  // namespace sockcan::config
