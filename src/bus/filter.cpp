// src/bus/filter.cpp

#include "bus/filter.hpp"

#include <algorithm>

namespace sockcan::bus {

Filter Filter::Exact(uint32_t id) {
    if (id > kSffMask) {
        return Filter{(id & kEffMask) | kEffFlag, kEffMask | kEffFlag | kRtrFlag};
    }
    return Filter{id, kSffMask | kEffFlag | kRtrFlag};
}

bool Filter::Matches(const Frame& frame) const {
    return (frame.raw_id() & mask) == (id & mask);
}

bool Accepts(std::span<const Filter> filters, const Frame& frame, bool join_filters) {
    if (filters.empty()) return false;

    auto match = [&frame](const Filter& f) { return f.Matches(frame); };
    return join_filters ? std::all_of(filters.begin(), filters.end(), match)
                        : std::any_of(filters.begin(), filters.end(), match);
}

} // namespace sockcan::bus
