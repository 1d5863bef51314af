/**
 * @file spsc_queue.cpp
 * @brief SpscError names and the ring instantiations used across the project.
 */

#include "rpkiv/mem/spsc_queue.hpp"
#include "rpkiv/rtr/session.hpp"

namespace rpkiv::mem {

    const char* to_string(SpscError e) noexcept {
        switch (e) {
            case SpscError::CapacityZero:             return "capacity is zero";
            case SpscError::CapacityNotPowerOfTwo:    return "capacity is not a power of two";
            case SpscError::AllocationFailed:         return "slot allocation failed";
            case SpscError::ElementNotNothrowMovable: return "element type is not nothrow-movable";
        }
        return "unknown";
    }

    template class SpscQueue<int>;                        // tests
    template class SpscQueue<rpkiv::rtr::SessionUpdate>;  // session -> coordinator channel

} // namespace rpkiv::mem
