#pragma once

#include <string>

#include <absl/status/status.h>

#include "bus/can_socket.hpp"

namespace sockcan::task {

/// Reads frames and prints each one as JSON on stdout, on the calling thread.
/// Retryable errors (timeouts, would-block) wait up to a second for input and
/// keep the loop going; the first other error ends it and is returned.
absl::Status StartListener(const bus::CanSocket& sock, const std::string& bus_name);

}  // namespace sockcan::task
