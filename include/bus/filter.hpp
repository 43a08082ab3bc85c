// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
// -----------------------------------------------------------------------------
// Acceptance filters (id, mask) as installed with CAN_RAW_FILTER
// -----------------------------------------------------------------------------

#pragma once

#include <cstdint>
#include <span>

#include <linux/can.h>

#include "bus/frame.hpp"

namespace sockcan::bus {

struct Filter {
    uint32_t id   {};
    uint32_t mask {};

    /// Matches exactly one identifier, in the format its size implies, and
    /// never a remote request.
    static Filter Exact(uint32_t id);

    /// (raw_id & mask) == (id & mask)
    bool Matches(const Frame& frame) const;

    can_filter ToKernel() const { return can_filter{id, mask}; }
};

/// Kernel acceptance decision for a filter list: any filter matches, or all
/// of them when `join_filters` is set. An empty list accepts nothing.
bool Accepts(std::span<const Filter> filters, const Frame& frame, bool join_filters = false);

} // namespace sockcan::bus
