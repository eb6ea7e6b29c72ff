#pragma once
#include <usbbw/Types.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace usbbw {

struct Endpoint {
    uint8_t address{0};
    Direction direction{Direction::In};
    TransferType transferType{TransferType::Control};
    uint16_t maxPacketSize{0};  // bytes per transaction
    uint32_t intervalUs{0};
    // Extra transactions per microframe (high-speed high-bandwidth endpoints)
    std::optional<uint8_t> additionalTransactions;
    std::string intervalText;   // as reported by the source, e.g. "4ms"

    // Only periodic transfers reserve bandwidth.
    bool reservesBandwidth() const {
        return transferType == TransferType::Interrupt ||
               transferType == TransferType::Isochronous;
    }

    uint8_t number() const { return address & 0x0F; }
    uint32_t multiplier() const;

    // Decodes descriptor fields against the speed of the owning device.
    // Throws UsbError(InvalidEndpoint) for a periodic endpoint with no interval.
    static Endpoint fromDescriptor(uint8_t address,
                                   TransferType type,
                                   Direction direction,
                                   uint16_t wMaxPacketSize,
                                   uint8_t bInterval,
                                   Speed deviceSpeed);

    static uint32_t intervalUsFor(uint8_t bInterval, Speed deviceSpeed);
};

// Periodic bandwidth reserved by one endpoint. Control and Bulk endpoints
// reserve nothing and always yield 0. Throws UsbError(InvalidEndpoint) when a
// periodic endpoint has a zero interval.
uint64_t endpointBandwidthBps(const Endpoint& endpoint);

struct BandwidthPool {
    PoolClass poolClass{PoolClass::Usb2};
    uint64_t capacityBps{0};
    uint64_t usedBps{0};   // true sum, never clamped to capacity

    static BandwidthPool forBus(Speed busSpeed, uint64_t usedBps = 0);
    static uint64_t capacityFor(Speed busSpeed);

    uint64_t availableBps() const {
        return usedBps >= capacityBps ? 0 : capacityBps - usedBps;
    }
    bool isOverSubscribed() const { return usedBps > capacityBps; }
    uint64_t overSubscribedBps() const {
        return isOverSubscribed() ? usedBps - capacityBps : 0;
    }

    double usagePercent() const;
    bool isHighUsage() const;
    bool isCritical() const;

    bool operator==(const BandwidthPool& other) const {
        return poolClass == other.poolClass &&
               capacityBps == other.capacityBps &&
               usedBps == other.usedBps;
    }
    bool operator!=(const BandwidthPool& other) const { return !(*this == other); }
};

std::string formatBps(uint64_t bps);
std::string bandwidthBar(double percent, size_t width);

}
