#include "BandwidthAllocator.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace usbbw {

Topology BandwidthAllocator::allocate(const Topology& topology) {
    auto data = std::make_shared<TopologyData>(topology.data());

    for (auto& bus : data->buses) {
        uint64_t used = 0;
        for (DeviceIndex index : topology.devicesInTreeOrder(bus.number)) {
            for (const auto& endpoint : data->devices[index].endpoints) {
                used += endpointBandwidthBps(endpoint);
            }
        }
        bus.pool = BandwidthPool::forBus(bus.speed, used);

        if (bus.pool.isOverSubscribed()) {
            LOG_WARNING("bus " + std::to_string(bus.number) + " periodic bandwidth over capacity: " +
                        formatBps(bus.pool.usedBps) + " used of " +
                        formatBps(bus.pool.capacityBps));
        }
    }

    return Topology(std::move(data));
}

std::vector<BusRecommendation> BandwidthAllocator::bestBusesFor(const Topology& topology,
                                                                uint64_t requiredBps,
                                                                Speed speed) {
    std::vector<BusRecommendation> result;
    PoolClass wanted = poolClassFor(speed);

    for (const auto& bus : topology.buses()) {
        if (bus.poolClass() != wanted) {
            continue;
        }
        // A Low/Full-speed bus cannot carry a High-speed device at its speed
        if (speed == Speed::High && bus.speed != Speed::High) {
            continue;
        }
        uint64_t available = bus.pool.availableBps();
        if (available < requiredBps) {
            continue;
        }
        result.push_back(BusRecommendation{bus.number, available});
    }

    std::sort(result.begin(), result.end(),
              [](const BusRecommendation& a, const BusRecommendation& b) {
                  if (a.availableBps != b.availableBps) {
                      return a.availableBps > b.availableBps;
                  }
                  return a.bus < b.bus;
              });
    return result;
}

std::vector<uint8_t> BandwidthAllocator::overSubscribedBuses(const Topology& topology) {
    std::vector<uint8_t> result;
    for (const auto& bus : topology.buses()) {
        if (bus.pool.isOverSubscribed()) {
            result.push_back(bus.number);
        }
    }
    return result;
}

}
