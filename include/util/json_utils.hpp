#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bus/can_socket.hpp"
#include "bus/frame.hpp"

using sockcan_json = nlohmann::json;

namespace sockcan::util::json
{
    /// "DE AD BE EF"
    std::string ToHex(const uint8_t* d, size_t len);

    /// One received frame as JSON: ts (us since epoch), bus, id, extended,
    /// rtr, dlc, raw and, for error frames, either `error` or `decode_failure`.
    sockcan_json BuildJson(const bus::Frame& frame, bus::Timestamp ts, std::string_view bus);

} // namespace sockcan::util::json
