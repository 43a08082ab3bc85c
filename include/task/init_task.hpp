#pragma once

#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "bus/can_socket.hpp"

namespace sockcan::task {

/// Loads `config_path` (falling back to ../<config_path>), overrides the
/// channel when `channel` is not empty, then opens and configures the socket.
absl::StatusOr<bus::CanSocket> Init(const std::string& config_path, std::string_view channel);

}  // namespace sockcan::task
