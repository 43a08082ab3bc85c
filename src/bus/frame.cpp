// src/bus/frame.cpp

#include "bus/frame.hpp"
#include "bus/status.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

namespace sockcan::bus {

namespace {

bool parseHexByte(std::string_view two, uint8_t& out) {
    if (two.size() != 2 || !absl::ascii_isxdigit(two[0]) || !absl::ascii_isxdigit(two[1])) {
        return false;
    }
    uint32_t value = 0;
    if (!absl::SimpleHexAtoi(two, &value)) return false;
    out = static_cast<uint8_t>(value);
    return true;
}

} // namespace

absl::StatusOr<Frame> Frame::Create(uint32_t id,
                                    std::span<const uint8_t> data,
                                    bool rtr,
                                    bool err) {
    if (data.size() > kMaxDataLen) {
        return MakeFailure(Failure::kTooMuchData,
                           fmt::format("payload of {} bytes is larger than the CAN maximum of {}",
                                       data.size(), kMaxDataLen));
    }
    if (id > kEffMask) {
        return MakeFailure(Failure::kIdTooLarge, fmt::format("CAN id 0x{:X} too large", id));
    }

    Frame frame;
    frame.raw_.can_id = id;
    if (id > kSffMask) frame.raw_.can_id |= kEffFlag;   // size of the id decides the format
    if (rtr) frame.raw_.can_id |= kRtrFlag;
    if (err) frame.raw_.can_id |= kErrFlag;

    frame.raw_.can_dlc = static_cast<uint8_t>(data.size());
    std::copy(data.begin(), data.end(), frame.raw_.data);
    return frame;
}

absl::StatusOr<Frame> Frame::FromWire(const can_frame& raw) {
    if (raw.can_dlc > kMaxDataLen) {
        return MakeFailure(Failure::kTooMuchData,
                           fmt::format("length byte {} exceeds the CAN maximum of {}",
                                       raw.can_dlc, kMaxDataLen));
    }
    Frame frame;
    frame.raw_.can_id  = raw.can_id;
    frame.raw_.can_dlc = raw.can_dlc;
    // bytes past the length are not meaningful, keep them zero
    std::memcpy(frame.raw_.data, raw.data, raw.can_dlc);
    return frame;
}

absl::StatusOr<Frame> Frame::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kFrameSize) {
        return MakeFailure(Failure::kIo,
                           fmt::format("transfer of {} bytes, expected {}", bytes.size(), kFrameSize));
    }
    can_frame raw{};
    std::memcpy(&raw, bytes.data(), kFrameSize);
    return FromWire(raw);
}

absl::StatusOr<Frame> Frame::Parse(std::string_view text) {
    const auto hash = text.find('#');
    if (hash == std::string_view::npos || hash == 0 || hash > 8) {
        return absl::InvalidArgumentError(fmt::format("'{}' is not <id>#<data>", text));
    }

    const std::string_view id_text = text.substr(0, hash);
    uint32_t id = 0;
    if (!std::all_of(id_text.begin(), id_text.end(), absl::ascii_isxdigit) ||
        !absl::SimpleHexAtoi(id_text, &id)) {
        return absl::InvalidArgumentError(fmt::format("'{}' is not a hex CAN id", id_text));
    }
    const bool force_extended = id_text.size() == 8;

    std::string_view rest = text.substr(hash + 1);
    bool rtr = false;
    std::vector<uint8_t> data;

    if (!rest.empty() && (rest.front() == 'R' || rest.front() == 'r')) {
        if (rest.size() != 1) {
            return absl::InvalidArgumentError(fmt::format("trailing characters after RTR in '{}'", text));
        }
        rtr = true;
    } else {
        while (!rest.empty()) {
            if (rest.front() == '.') {
                rest.remove_prefix(1);
                continue;
            }
            uint8_t byte = 0;
            if (!parseHexByte(rest.substr(0, 2), byte)) {
                return absl::InvalidArgumentError(fmt::format("bad payload byte in '{}'", text));
            }
            data.push_back(byte);
            rest.remove_prefix(2);
        }
    }

    auto frame = Create(id, data, rtr, false);
    if (!frame.ok()) return frame.status();
    if (force_extended) frame->raw_.can_id |= kEffFlag;
    return frame;
}

uint32_t Frame::id() const {
    return is_extended() ? (raw_.can_id & kEffMask) : (raw_.can_id & kSffMask);
}

std::optional<std::span<const uint8_t>> Frame::ControllerSpecificInfo() const {
    auto payload = data();
    if (payload.size() != kMaxDataLen) return std::nullopt;
    return payload.subspan(5);
}

std::array<uint8_t, kFrameSize> Frame::ToBytes() const {
    std::array<uint8_t, kFrameSize> out{};
    std::memcpy(out.data(), &raw_, kFrameSize);
    return out;
}

std::string Frame::ToString(bool spaced) const {
    std::string out = fmt::format("{:X}#", id());
    bool first = true;
    for (uint8_t b : data()) {
        if (spaced && !first) out += ' ';
        fmt::format_to(std::back_inserter(out), "{:02X}", b);
        first = false;
    }
    return out;
}

bool operator==(const Frame& lhs, const Frame& rhs) {
    auto a = lhs.data();
    auto b = rhs.data();
    return lhs.raw_.can_id == rhs.raw_.can_id &&
           std::equal(a.begin(), a.end(), b.begin(), b.end());
}

} // namespace sockcan::bus
