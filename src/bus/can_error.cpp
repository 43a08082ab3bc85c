// src/bus/can_error.cpp

#include "bus/can_error.hpp"
#include "bus/status.hpp"

#include <fmt/format.h>

namespace sockcan::bus {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

absl::StatusOr<uint8_t> byteAt(const Frame& frame, uint8_t index) {
    auto payload = frame.data();
    if (index >= payload.size()) {
        return MakeFailure(Failure::kNotEnoughData,
                           fmt::format("error frame has no data byte {}", index), index);
    }
    return payload[index];
}

} // namespace

/* ───── byte tables ───── */

absl::StatusOr<ControllerProblem> ControllerProblemFromByte(uint8_t value) {
    switch (value) {
        case CAN_ERR_CRTL_UNSPEC:      return ControllerProblem::kUnspecified;
        case CAN_ERR_CRTL_RX_OVERFLOW: return ControllerProblem::kReceiveBufferOverflow;
        case CAN_ERR_CRTL_TX_OVERFLOW: return ControllerProblem::kTransmitBufferOverflow;
        case CAN_ERR_CRTL_RX_WARNING:  return ControllerProblem::kReceiveErrorWarning;
        case CAN_ERR_CRTL_TX_WARNING:  return ControllerProblem::kTransmitErrorWarning;
        case CAN_ERR_CRTL_RX_PASSIVE:  return ControllerProblem::kReceiveErrorPassive;
        case CAN_ERR_CRTL_TX_PASSIVE:  return ControllerProblem::kTransmitErrorPassive;
        case CAN_ERR_CRTL_ACTIVE:      return ControllerProblem::kActive;
    }
    return MakeFailure(Failure::kInvalidControllerProblem,
                       fmt::format("0x{:02X} is not a valid controller problem", value), value);
}

absl::StatusOr<ViolationType> ViolationTypeFromByte(uint8_t value) {
    switch (value) {
        case CAN_ERR_PROT_UNSPEC:   return ViolationType::kUnspecified;
        case CAN_ERR_PROT_BIT:      return ViolationType::kSingleBitError;
        case CAN_ERR_PROT_FORM:     return ViolationType::kFrameFormatError;
        case CAN_ERR_PROT_STUFF:    return ViolationType::kBitStuffingError;
        case CAN_ERR_PROT_BIT0:     return ViolationType::kUnableToSendDominantBit;
        case CAN_ERR_PROT_BIT1:     return ViolationType::kUnableToSendRecessiveBit;
        case CAN_ERR_PROT_OVERLOAD: return ViolationType::kBusOverload;
        case CAN_ERR_PROT_ACTIVE:   return ViolationType::kActive;
        case CAN_ERR_PROT_TX:       return ViolationType::kTransmissionError;
    }
    return MakeFailure(Failure::kInvalidViolationType,
                       fmt::format("0x{:02X} is not a valid violation type", value), value);
}

absl::StatusOr<Location> LocationFromByte(uint8_t value) {
    switch (value) {
        case CAN_ERR_PROT_LOC_UNSPEC:  return Location::kUnspecified;
        case CAN_ERR_PROT_LOC_SOF:     return Location::kStartOfFrame;
        case CAN_ERR_PROT_LOC_ID28_21: return Location::kId2821;
        case CAN_ERR_PROT_LOC_ID20_18: return Location::kId2018;
        case CAN_ERR_PROT_LOC_SRTR:    return Location::kSubstituteRtr;
        case CAN_ERR_PROT_LOC_IDE:     return Location::kIdentifierExtension;
        case CAN_ERR_PROT_LOC_ID17_13: return Location::kId1713;
        case CAN_ERR_PROT_LOC_ID12_05: return Location::kId1205;
        case CAN_ERR_PROT_LOC_ID04_00: return Location::kId0400;
        case CAN_ERR_PROT_LOC_RTR:     return Location::kRtr;
        case CAN_ERR_PROT_LOC_RES1:    return Location::kReserved1;
        case CAN_ERR_PROT_LOC_RES0:    return Location::kReserved0;
        case CAN_ERR_PROT_LOC_DLC:     return Location::kDataLengthCode;
        case CAN_ERR_PROT_LOC_DATA:    return Location::kDataSection;
        case CAN_ERR_PROT_LOC_CRC_SEQ: return Location::kCrcSequence;
        case CAN_ERR_PROT_LOC_CRC_DEL: return Location::kCrcDelimiter;
        case CAN_ERR_PROT_LOC_ACK:     return Location::kAckSlot;
        case CAN_ERR_PROT_LOC_ACK_DEL: return Location::kAckDelimiter;
        case CAN_ERR_PROT_LOC_EOF:     return Location::kEndOfFrame;
        case CAN_ERR_PROT_LOC_INTERM:  return Location::kIntermission;
    }
    return MakeFailure(Failure::kInvalidLocation,
                       fmt::format("0x{:02X} is not a valid location", value), value);
}

absl::StatusOr<TransceiverError> TransceiverErrorFromByte(uint8_t value) {
    switch (value) {
        case CAN_ERR_TRX_UNSPEC:             return TransceiverError::kUnspecified;
        case CAN_ERR_TRX_CANH_NO_WIRE:       return TransceiverError::kCanHighNoWire;
        case CAN_ERR_TRX_CANH_SHORT_TO_BAT:  return TransceiverError::kCanHighShortToBat;
        case CAN_ERR_TRX_CANH_SHORT_TO_VCC:  return TransceiverError::kCanHighShortToVcc;
        case CAN_ERR_TRX_CANH_SHORT_TO_GND:  return TransceiverError::kCanHighShortToGnd;
        case CAN_ERR_TRX_CANL_NO_WIRE:       return TransceiverError::kCanLowNoWire;
        case CAN_ERR_TRX_CANL_SHORT_TO_BAT:  return TransceiverError::kCanLowShortToBat;
        case CAN_ERR_TRX_CANL_SHORT_TO_VCC:  return TransceiverError::kCanLowShortToVcc;
        case CAN_ERR_TRX_CANL_SHORT_TO_GND:  return TransceiverError::kCanLowShortToGnd;
        case CAN_ERR_TRX_CANL_SHORT_TO_CANH: return TransceiverError::kCanLowShortToCanHigh;
    }
    return MakeFailure(Failure::kInvalidTransceiverError,
                       fmt::format("0x{:02X} is not a valid transceiver error", value), value);
}

/* ───── text ───── */

std::string_view ToString(ControllerProblem problem) {
    switch (problem) {
        case ControllerProblem::kUnspecified:            return "unspecified controller problem";
        case ControllerProblem::kReceiveBufferOverflow:  return "receive buffer overflow";
        case ControllerProblem::kTransmitBufferOverflow: return "transmit buffer overflow";
        case ControllerProblem::kReceiveErrorWarning:    return "ERROR WARNING (receive)";
        case ControllerProblem::kTransmitErrorWarning:   return "ERROR WARNING (transmit)";
        case ControllerProblem::kReceiveErrorPassive:    return "ERROR PASSIVE (receive)";
        case ControllerProblem::kTransmitErrorPassive:   return "ERROR PASSIVE (transmit)";
        case ControllerProblem::kActive:                 return "ERROR ACTIVE";
    }
    return "?";
}

std::string_view ToString(ViolationType type) {
    switch (type) {
        case ViolationType::kUnspecified:              return "unspecified";
        case ViolationType::kSingleBitError:           return "single bit error";
        case ViolationType::kFrameFormatError:         return "frame format error";
        case ViolationType::kBitStuffingError:         return "bit stuffing error";
        case ViolationType::kUnableToSendDominantBit:  return "unable to send dominant bit";
        case ViolationType::kUnableToSendRecessiveBit: return "unable to send recessive bit";
        case ViolationType::kBusOverload:              return "bus overload";
        case ViolationType::kActive:                   return "active error announcement";
        case ViolationType::kTransmissionError:        return "error on transmission";
    }
    return "?";
}

std::string_view ToString(Location location) {
    switch (location) {
        case Location::kUnspecified:         return "unspecified location";
        case Location::kStartOfFrame:        return "start of frame";
        case Location::kId2821:              return "ID bits 28-21";
        case Location::kId2018:              return "ID bits 20-18";
        case Location::kSubstituteRtr:       return "substitute RTR bit";
        case Location::kIdentifierExtension: return "identifier extension";
        case Location::kId1713:              return "ID bits 17-13";
        case Location::kId1205:              return "ID bits 12-05";
        case Location::kId0400:              return "ID bits 04-00";
        case Location::kRtr:                 return "RTR bit";
        case Location::kReserved1:           return "reserved bit 1";
        case Location::kReserved0:           return "reserved bit 0";
        case Location::kDataLengthCode:      return "data length code";
        case Location::kDataSection:         return "data section";
        case Location::kCrcSequence:         return "CRC sequence";
        case Location::kCrcDelimiter:        return "CRC delimiter";
        case Location::kAckSlot:             return "ACK slot";
        case Location::kAckDelimiter:        return "ACK delimiter";
        case Location::kEndOfFrame:          return "end of frame";
        case Location::kIntermission:        return "intermission";
    }
    return "?";
}

std::string_view ToString(TransceiverError error) {
    switch (error) {
        case TransceiverError::kUnspecified:          return "unspecified";
        case TransceiverError::kCanHighNoWire:        return "CAN high wire open";
        case TransceiverError::kCanHighShortToBat:    return "CAN high short to battery";
        case TransceiverError::kCanHighShortToVcc:    return "CAN high short to VCC";
        case TransceiverError::kCanHighShortToGnd:    return "CAN high short to ground";
        case TransceiverError::kCanLowNoWire:         return "CAN low wire open";
        case TransceiverError::kCanLowShortToBat:     return "CAN low short to battery";
        case TransceiverError::kCanLowShortToVcc:     return "CAN low short to VCC";
        case TransceiverError::kCanLowShortToGnd:     return "CAN low short to ground";
        case TransceiverError::kCanLowShortToCanHigh: return "CAN low shorted to CAN high";
    }
    return "?";
}

std::string ToString(const CanError& error) {
    return std::visit(overloaded{
        [](const TransmitTimeout&) -> std::string { return "transmission timeout"; },
        [](const LostArbitration& e) -> std::string {
            return fmt::format("arbitration lost after {} bits", e.bit);
        },
        [](const ControllerFault& e) -> std::string {
            return fmt::format("controller problem: {}", ToString(e.problem));
        },
        [](const ProtocolViolation& e) -> std::string {
            return fmt::format("protocol violation at {}: {}", ToString(e.location), ToString(e.type));
        },
        [](const TransceiverFault& e) -> std::string {
            return fmt::format("transceiver error: {}", ToString(e.status));
        },
        [](const NoAck&) -> std::string { return "no ack"; },
        [](const BusOff&) -> std::string { return "bus off"; },
        [](const BusError&) -> std::string { return "bus error"; },
        [](const Restarted&) -> std::string { return "restarted"; },
        [](const UnknownError& e) -> std::string {
            return fmt::format("unknown error (0x{:X})", e.code);
        },
    }, error);
}

/* ───── decode ───── */

absl::StatusOr<CanError> DecodeError(const Frame& frame) {
    if (!frame.is_error()) {
        return MakeFailure(Failure::kNotAnError, "CAN frame is not an error frame");
    }

    switch (frame.err()) {
        case kErrTxTimeout:
            return TransmitTimeout{};

        case kErrLostArb: {
            auto bit = byteAt(frame, 0);
            if (!bit.ok()) return bit.status();
            return LostArbitration{*bit};
        }

        case kErrCrtl: {
            auto raw = byteAt(frame, 1);
            if (!raw.ok()) return raw.status();
            auto problem = ControllerProblemFromByte(*raw);
            if (!problem.ok()) return problem.status();
            return ControllerFault{*problem};
        }

        case kErrProt: {
            auto raw_type = byteAt(frame, 2);
            if (!raw_type.ok()) return raw_type.status();
            auto type = ViolationTypeFromByte(*raw_type);
            if (!type.ok()) return type.status();

            auto raw_loc = byteAt(frame, 3);
            if (!raw_loc.ok()) return raw_loc.status();
            auto location = LocationFromByte(*raw_loc);
            if (!location.ok()) return location.status();
            return ProtocolViolation{*type, *location};
        }

        case kErrTrx: {
            auto raw = byteAt(frame, 4);
            if (!raw.ok()) return raw.status();
            auto status = TransceiverErrorFromByte(*raw);
            if (!status.ok()) return status.status();
            return TransceiverFault{*status};
        }

        case kErrAck:       return NoAck{};
        case kErrBusOff:    return BusOff{};
        case kErrBusError:  return BusError{};
        case kErrRestarted: return Restarted{};
    }

    return MakeFailure(Failure::kUnknownErrorType,
                       fmt::format("unknown error type 0x{:X}", frame.err()), frame.err());
}

} // namespace sockcan::bus
