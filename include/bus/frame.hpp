// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Classic CAN frame, stored in the kernel's struct can_frame layout
// -----------------------------------------------------------------------------

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <linux/can.h>

#include <absl/status/statusor.h>
#include <fmt/format.h>

namespace sockcan::bus {

inline constexpr uint32_t kEffFlag = CAN_EFF_FLAG;   ///< bit 31, extended format
inline constexpr uint32_t kRtrFlag = CAN_RTR_FLAG;   ///< bit 30, remote request
inline constexpr uint32_t kErrFlag = CAN_ERR_FLAG;   ///< bit 29, error frame

inline constexpr uint32_t kSffMask = CAN_SFF_MASK;   ///< 11-bit identifier
inline constexpr uint32_t kEffMask = CAN_EFF_MASK;   ///< 29-bit identifier
inline constexpr uint32_t kErrMask = CAN_ERR_MASK;   ///< error class bits

inline constexpr std::size_t kMaxDataLen = CAN_MAX_DLEN;
inline constexpr std::size_t kFrameSize  = sizeof(can_frame);

static_assert(kFrameSize == 16, "classic CAN transfer unit is 16 bytes");
static_assert(offsetof(can_frame, can_id) == 0);
static_assert(offsetof(can_frame, can_dlc) == 4);
static_assert(offsetof(can_frame, data) == 8);

class Frame {
    public:
        /// Zero identifier, empty payload.
        Frame() = default;

        /// Builds a frame for transmission. Extended format is chosen by the
        /// size of `id` alone. Fails with kIdTooLarge / kTooMuchData.
        static absl::StatusOr<Frame> Create(uint32_t id,
                                            std::span<const uint8_t> data,
                                            bool rtr = false,
                                            bool err = false);

        /// Receive path. The kernel never hands out a length above 8, but a
        /// foreign buffer might; such a buffer is rejected with kTooMuchData.
        static absl::StatusOr<Frame> FromWire(const can_frame& raw);

        /// `bytes` must be exactly kFrameSize long, otherwise kIo.
        static absl::StatusOr<Frame> FromBytes(std::span<const uint8_t> bytes);

        /// Parses the `<hex-id>#<hex-bytes>` text form. An identifier written
        /// with 8 hex digits forces extended format, `#R` marks a remote
        /// request and `.` may separate payload bytes.
        static absl::StatusOr<Frame> Parse(std::string_view text);

        uint32_t id() const;
        uint32_t raw_id() const { return raw_.can_id; }
        uint32_t err() const { return raw_.can_id & kErrMask; }   ///< only meaningful if is_error()

        bool is_extended() const { return (raw_.can_id & kEffFlag) != 0; }
        bool is_rtr() const { return (raw_.can_id & kRtrFlag) != 0; }
        bool is_error() const { return (raw_.can_id & kErrFlag) != 0; }

        std::span<const uint8_t> data() const { return {raw_.data, raw_.can_dlc}; }

        /// Controller specific bytes 5..7 of an error frame, present only for a
        /// full 8 byte payload.
        std::optional<std::span<const uint8_t>> ControllerSpecificInfo() const;

        const can_frame& ToWire() const { return raw_; }
        std::array<uint8_t, kFrameSize> ToBytes() const;

        /// `7B#DEADBEEF`, or `7B#DE AD BE EF` when spaced.
        std::string ToString(bool spaced = false) const;

        friend bool operator==(const Frame& lhs, const Frame& rhs);

    private:
        can_frame raw_{};
};

} // namespace sockcan::bus

/// `{}` renders the compact form, `{:s}` inserts spaces between payload bytes.
template <>
struct fmt::formatter<sockcan::bus::Frame> {
    bool spaced = false;

    constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == 's') {
            spaced = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') throw format_error("invalid format for sockcan::bus::Frame");
        return it;
    }

    auto format(const sockcan::bus::Frame& frame, format_context& ctx) const -> format_context::iterator {
        return fmt::format_to(ctx.out(), "{}", frame.ToString(spaced));
    }
};
