#pragma once

#include "util/error.hpp"

#include <cstdint>

struct PortRange {
    uint16_t first = 0;
    uint16_t last = 0;
};

namespace ports {

// True if a listener can bind 127.0.0.1:port right now.
bool is_available(uint16_t port);

// First bindable port in [first, last].
Result<uint16_t> find_available(PortRange range);

} // namespace ports
