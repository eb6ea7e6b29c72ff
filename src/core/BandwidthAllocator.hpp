#pragma once
#include "Topology.hpp"
#include <usbbw/Types.hpp>
#include <cstdint>
#include <vector>

namespace usbbw {

struct BusRecommendation {
    uint8_t bus{0};
    uint64_t availableBps{0};
};

// Derives each bus's periodic bandwidth pool from the endpoints of every
// device reachable from it. This is accounting, not scheduling: the host
// controller already made the allocation decisions.
class BandwidthAllocator {
public:
    // Returns a new topology with pools filled in; the input is untouched.
    // Applying it again to its own output yields identical pools.
    static Topology allocate(const Topology& topology);

    // Buses of the pool class serving `speed` with at least `requiredBps`
    // available, most available first, ties by ascending bus number. A
    // High-speed request skips Low/Full-speed buses of the same class.
    static std::vector<BusRecommendation> bestBusesFor(const Topology& topology,
                                                       uint64_t requiredBps,
                                                       Speed speed);

    static std::vector<uint8_t> overSubscribedBuses(const Topology& topology);
};

}
