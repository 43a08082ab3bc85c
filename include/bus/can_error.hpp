// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Error frame classification (see <linux/can/error.h>)
// -----------------------------------------------------------------------------

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <linux/can/error.h>

#include <absl/status/statusor.h>
#include <fmt/format.h>

#include "bus/frame.hpp"

namespace sockcan::bus {

/// Error classes, i.e. the raw error code of an error frame.
inline constexpr uint32_t kErrTxTimeout = CAN_ERR_TX_TIMEOUT;
inline constexpr uint32_t kErrLostArb   = CAN_ERR_LOSTARB;     ///< data[0]
inline constexpr uint32_t kErrCrtl      = CAN_ERR_CRTL;        ///< data[1]
inline constexpr uint32_t kErrProt      = CAN_ERR_PROT;        ///< data[2..3]
inline constexpr uint32_t kErrTrx       = CAN_ERR_TRX;         ///< data[4]
inline constexpr uint32_t kErrAck       = CAN_ERR_ACK;
inline constexpr uint32_t kErrBusOff    = CAN_ERR_BUSOFF;
inline constexpr uint32_t kErrBusError  = CAN_ERR_BUSERROR;
inline constexpr uint32_t kErrRestarted = CAN_ERR_RESTARTED;

/// Masks for CanSocket::SetErrorMask.
inline constexpr uint32_t kErrMaskAll  = CAN_ERR_MASK;
inline constexpr uint32_t kErrMaskNone = 0;

enum class ControllerProblem : uint8_t {
    kUnspecified            = CAN_ERR_CRTL_UNSPEC,
    kReceiveBufferOverflow  = CAN_ERR_CRTL_RX_OVERFLOW,
    kTransmitBufferOverflow = CAN_ERR_CRTL_TX_OVERFLOW,
    kReceiveErrorWarning    = CAN_ERR_CRTL_RX_WARNING,
    kTransmitErrorWarning   = CAN_ERR_CRTL_TX_WARNING,
    kReceiveErrorPassive    = CAN_ERR_CRTL_RX_PASSIVE,
    kTransmitErrorPassive   = CAN_ERR_CRTL_TX_PASSIVE,
    kActive                 = CAN_ERR_CRTL_ACTIVE,      ///< recovered to error active
};

enum class ViolationType : uint8_t {
    kUnspecified              = CAN_ERR_PROT_UNSPEC,
    kSingleBitError           = CAN_ERR_PROT_BIT,
    kFrameFormatError         = CAN_ERR_PROT_FORM,
    kBitStuffingError         = CAN_ERR_PROT_STUFF,
    kUnableToSendDominantBit  = CAN_ERR_PROT_BIT0,
    kUnableToSendRecessiveBit = CAN_ERR_PROT_BIT1,
    kBusOverload              = CAN_ERR_PROT_OVERLOAD,
    kActive                   = CAN_ERR_PROT_ACTIVE,
    kTransmissionError        = CAN_ERR_PROT_TX,
};

/// Position in the frame where a protocol violation was detected.
enum class Location : uint8_t {
    kUnspecified         = CAN_ERR_PROT_LOC_UNSPEC,
    kStartOfFrame        = CAN_ERR_PROT_LOC_SOF,
    kId2821              = CAN_ERR_PROT_LOC_ID28_21,
    kId2018              = CAN_ERR_PROT_LOC_ID20_18,
    kSubstituteRtr       = CAN_ERR_PROT_LOC_SRTR,
    kIdentifierExtension = CAN_ERR_PROT_LOC_IDE,
    kId1713              = CAN_ERR_PROT_LOC_ID17_13,
    kId1205              = CAN_ERR_PROT_LOC_ID12_05,
    kId0400              = CAN_ERR_PROT_LOC_ID04_00,
    kRtr                 = CAN_ERR_PROT_LOC_RTR,
    kReserved1           = CAN_ERR_PROT_LOC_RES1,
    kReserved0           = CAN_ERR_PROT_LOC_RES0,
    kDataLengthCode      = CAN_ERR_PROT_LOC_DLC,
    kDataSection         = CAN_ERR_PROT_LOC_DATA,
    kCrcSequence         = CAN_ERR_PROT_LOC_CRC_SEQ,
    kCrcDelimiter        = CAN_ERR_PROT_LOC_CRC_DEL,
    kAckSlot             = CAN_ERR_PROT_LOC_ACK,
    kAckDelimiter        = CAN_ERR_PROT_LOC_ACK_DEL,
    kEndOfFrame          = CAN_ERR_PROT_LOC_EOF,
    kIntermission        = CAN_ERR_PROT_LOC_INTERM,
};

enum class TransceiverError : uint8_t {
    kUnspecified          = CAN_ERR_TRX_UNSPEC,
    kCanHighNoWire        = CAN_ERR_TRX_CANH_NO_WIRE,
    kCanHighShortToBat    = CAN_ERR_TRX_CANH_SHORT_TO_BAT,
    kCanHighShortToVcc    = CAN_ERR_TRX_CANH_SHORT_TO_VCC,
    kCanHighShortToGnd    = CAN_ERR_TRX_CANH_SHORT_TO_GND,
    kCanLowNoWire         = CAN_ERR_TRX_CANL_NO_WIRE,
    kCanLowShortToBat     = CAN_ERR_TRX_CANL_SHORT_TO_BAT,
    kCanLowShortToVcc     = CAN_ERR_TRX_CANL_SHORT_TO_VCC,
    kCanLowShortToGnd     = CAN_ERR_TRX_CANL_SHORT_TO_GND,
    kCanLowShortToCanHigh = CAN_ERR_TRX_CANL_SHORT_TO_CANH,
};

// Byte -> sub kind. Unmapped bytes fail with the matching kInvalid* failure.
absl::StatusOr<ControllerProblem> ControllerProblemFromByte(uint8_t value);
absl::StatusOr<ViolationType>     ViolationTypeFromByte(uint8_t value);
absl::StatusOr<Location>          LocationFromByte(uint8_t value);
absl::StatusOr<TransceiverError>  TransceiverErrorFromByte(uint8_t value);

std::string_view ToString(ControllerProblem problem);
std::string_view ToString(ViolationType type);
std::string_view ToString(Location location);
std::string_view ToString(TransceiverError error);

struct TransmitTimeout {
    friend bool operator==(const TransmitTimeout&, const TransmitTimeout&) = default;
};

struct LostArbitration {
    uint8_t bit;   ///< bit position where arbitration was lost
    friend bool operator==(const LostArbitration&, const LostArbitration&) = default;
};

struct ControllerFault {
    ControllerProblem problem;
    friend bool operator==(const ControllerFault&, const ControllerFault&) = default;
};

struct ProtocolViolation {
    ViolationType type;
    Location      location;
    friend bool operator==(const ProtocolViolation&, const ProtocolViolation&) = default;
};

struct TransceiverFault {
    TransceiverError status;
    friend bool operator==(const TransceiverFault&, const TransceiverFault&) = default;
};

struct NoAck {
    friend bool operator==(const NoAck&, const NoAck&) = default;
};

struct BusOff {
    friend bool operator==(const BusOff&, const BusOff&) = default;
};

struct BusError {
    friend bool operator==(const BusError&, const BusError&) = default;
};

struct Restarted {
    friend bool operator==(const Restarted&, const Restarted&) = default;
};

struct UnknownError {
    uint32_t code;
    friend bool operator==(const UnknownError&, const UnknownError&) = default;
};

using CanError = std::variant<TransmitTimeout,
                              LostArbitration,
                              ControllerFault,
                              ProtocolViolation,
                              TransceiverFault,
                              NoAck,
                              BusOff,
                              BusError,
                              Restarted,
                              UnknownError>;

/// Classifies an error frame. Pure: the same frame always yields the same
/// result. Fails with kNotAnError, kUnknownErrorType, kNotEnoughData or one
/// of the kInvalid* failures; never substitutes a default.
absl::StatusOr<CanError> DecodeError(const Frame& frame);

std::string ToString(const CanError& error);

} // namespace sockcan::bus

template <>
struct fmt::formatter<sockcan::bus::CanError> : fmt::formatter<std::string_view> {
    auto format(const sockcan::bus::CanError& error, format_context& ctx) const -> format_context::iterator {
        return fmt::formatter<std::string_view>::format(sockcan::bus::ToString(error), ctx);
    }
};
