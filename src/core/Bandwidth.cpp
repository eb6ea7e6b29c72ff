#include "Bandwidth.hpp"
#include <usbbw/Constants.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace usbbw {

uint32_t Endpoint::multiplier() const {
    return additionalTransactions ? 1u + *additionalTransactions : 1u;
}

uint32_t Endpoint::intervalUsFor(uint8_t bInterval, Speed deviceSpeed) {
    if (bInterval == 0) {
        return 0;
    }

    switch (deviceSpeed) {
        case Speed::Low:
        case Speed::Full:
            // bInterval counts 1 ms frames
            return static_cast<uint32_t>(bInterval) * 1000u;
        case Speed::High:
        case Speed::Super:
        case Speed::SuperPlus:
        case Speed::SuperPlus2: {
            // 2^(bInterval-1) microframes of 125 us
            int exponent = std::min<int>(bInterval, MAX_INTERVAL_EXPONENT) - 1;
            return (1u << exponent) * MICROFRAME_US;
        }
    }
    return 0;
}

Endpoint Endpoint::fromDescriptor(uint8_t address,
                                  TransferType type,
                                  Direction direction,
                                  uint16_t wMaxPacketSize,
                                  uint8_t bInterval,
                                  Speed deviceSpeed) {
    Endpoint ep;
    ep.address = address;
    ep.transferType = type;
    ep.direction = direction;
    ep.maxPacketSize = wMaxPacketSize & 0x07FF;
    ep.intervalUs = intervalUsFor(bInterval, deviceSpeed);

    uint8_t multBits = (wMaxPacketSize >> 11) & 0x03;
    if (deviceSpeed == Speed::High && multBits != 0) {
        ep.additionalTransactions = multBits;
    }

    if (ep.reservesBandwidth() && ep.intervalUs == 0) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer),
                      "endpoint 0x%02x: periodic endpoint with zero interval", address);
        throw UsbError(ErrorCode::InvalidEndpoint, buffer);
    }

    return ep;
}

uint64_t endpointBandwidthBps(const Endpoint& endpoint) {
    if (!endpoint.reservesBandwidth()) {
        return 0;
    }

    if (endpoint.intervalUs == 0) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer),
                      "endpoint 0x%02x has a zero polling interval", endpoint.address);
        throw UsbError(ErrorCode::InvalidEndpoint, buffer);
    }

    uint64_t bitsPerInterval = static_cast<uint64_t>(endpoint.maxPacketSize) *
                               endpoint.multiplier() * 8;
    return bitsPerInterval * 1000000ULL / endpoint.intervalUs;
}

BandwidthPool BandwidthPool::forBus(Speed busSpeed, uint64_t usedBps) {
    BandwidthPool pool;
    pool.poolClass = poolClassFor(busSpeed);
    pool.capacityBps = capacityFor(busSpeed);
    pool.usedBps = usedBps;
    return pool;
}

uint64_t BandwidthPool::capacityFor(Speed busSpeed) {
    switch (busSpeed) {
        case Speed::Low:
        case Speed::Full:
            // 1 ms frames: 90% of the bus's own link rate
            return rawLinkRateBps(busSpeed) / 100 * FULL_SPEED_PERIODIC_PERCENT;
        case Speed::High:
            return USB2_PERIODIC_CAPACITY_BPS;
        case Speed::Super:
        case Speed::SuperPlus:
        case Speed::SuperPlus2:
            break;
    }
    return rawLinkRateBps(busSpeed) / 100 * USB3_PERIODIC_PERCENT;
}

double BandwidthPool::usagePercent() const {
    if (capacityBps == 0) {
        return 0.0;
    }
    return static_cast<double>(usedBps) / static_cast<double>(capacityBps) * 100.0;
}

bool BandwidthPool::isHighUsage() const {
    return usagePercent() > HIGH_USAGE_PERCENT;
}

bool BandwidthPool::isCritical() const {
    return usagePercent() > CRITICAL_USAGE_PERCENT;
}

std::string formatBps(uint64_t bps) {
    char buffer[32];
    if (bps >= 1000000000ULL) {
        std::snprintf(buffer, sizeof(buffer), "%.2f Gbps", bps / 1e9);
    } else if (bps >= 1000000ULL) {
        std::snprintf(buffer, sizeof(buffer), "%.2f Mbps", bps / 1e6);
    } else if (bps >= 1000ULL) {
        std::snprintf(buffer, sizeof(buffer), "%.2f Kbps", bps / 1e3);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llu bps",
                      static_cast<unsigned long long>(bps));
    }
    return buffer;
}

std::string bandwidthBar(double percent, size_t width) {
    auto filled = static_cast<size_t>(std::lround(std::max(0.0, percent) / 100.0 * width));
    filled = std::min(filled, width);

    std::stringstream ss;
    ss << "[" << std::string(filled, '#') << std::string(width - filled, '.') << "]";
    return ss.str();
}

}
