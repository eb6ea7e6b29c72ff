#pragma once
#include "Bandwidth.hpp"
#include <usbbw/Types.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usbbw {

// Position of a device: bus number plus the port chain from the root hub,
// written "<bus>-<port>[.<port>]*" (e.g. "3-2.1").
struct DevicePath {
    uint8_t bus{0};
    std::vector<uint8_t> ports;

    // Throws UsbError(InvalidPath) on anything but the canonical syntax.
    static DevicePath parse(const std::string& text);

    std::string toString() const;

    // Parent hub path; nullopt for devices directly below the root hub.
    std::optional<DevicePath> parent() const;

    // 0 for a device plugged into a root port
    size_t depth() const { return ports.empty() ? 0 : ports.size() - 1; }
    uint8_t port() const { return ports.empty() ? 0 : ports.back(); }

    bool operator<(const DevicePath& other) const {
        if (bus != other.bus) return bus < other.bus;
        return ports < other.ports;
    }
    bool operator==(const DevicePath& other) const {
        return bus == other.bus && ports == other.ports;
    }
    bool operator!=(const DevicePath& other) const { return !(*this == other); }
};

using DeviceIndex = size_t;

struct Device {
    DevicePath path;
    uint16_t vendorId{0};
    uint16_t productId{0};
    std::optional<std::string> serial;
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    Speed speed{Speed::Full};
    bool configured{false};
    std::vector<Endpoint> endpoints;
    std::optional<uint16_t> maxPowerMa;
    uint8_t deviceClass{0};
    bool isHub{false};
    std::optional<uint8_t> numPorts;
    std::string usbVersion;
    uint8_t numInterfaces{0};
    std::optional<PhysicalLocation> physicalLocation;

    // Arena links; children are kept in ascending port order.
    std::optional<DeviceIndex> parent;
    std::vector<DeviceIndex> children;

    std::string vidPid() const;
    // VID:PID:Serial when a serial is present, VID:PID otherwise
    std::string configKey() const;
    std::string displayName() const;

    uint64_t periodicBandwidthBps() const;
    std::vector<const Endpoint*> periodicEndpoints() const;
};

struct Bus {
    uint8_t number{0};
    Speed speed{Speed::High};
    std::string version;
    uint8_t numPorts{0};
    std::string controllerId;
    std::vector<DeviceIndex> rootDevices;  // ascending port
    BandwidthPool pool;

    bool isSuperSpeed() const { return usbbw::isSuperSpeed(speed); }
    PoolClass poolClass() const { return poolClassFor(speed); }
};

struct Controller {
    std::string id;
    std::string pciAddress;
    std::optional<uint8_t> usb2Bus;
    std::optional<uint8_t> usb3Bus;
};

struct TopologyData {
    std::vector<Controller> controllers;   // sorted by id
    std::vector<Bus> buses;                // ascending bus number
    std::vector<Device> devices;           // arena
    std::map<DevicePath, DeviceIndex> pathIndex;
};

// One snapshot of the USB tree. Immutable once built; copies share storage.
class Topology {
public:
    Topology();
    explicit Topology(std::shared_ptr<const TopologyData> data);

    const std::vector<Controller>& controllers() const { return d->controllers; }
    const std::vector<Bus>& buses() const { return d->buses; }
    const std::vector<Device>& devices() const { return d->devices; }
    const TopologyData& data() const { return *d; }

    const Bus* bus(uint8_t number) const;
    const Device& device(DeviceIndex index) const { return d->devices.at(index); }
    const Device* findDevice(const DevicePath& path) const;
    const Device* findDevice(const std::string& path) const;
    size_t deviceCount() const { return d->devices.size(); }
    bool empty() const { return d->buses.empty(); }

    // Depth-first, ascending port order.
    std::vector<DeviceIndex> devicesInTreeOrder(uint8_t busNumber) const;
    // All buses in ascending bus order.
    std::vector<DeviceIndex> devicesInTreeOrder() const;

    const Controller* controllerForBus(uint8_t busNumber) const;
    std::optional<uint8_t> pairedBus(uint8_t busNumber) const;

    uint64_t periodicBandwidthBps(uint8_t busNumber) const;
    uint32_t totalPowerMa(uint8_t busNumber) const;

private:
    std::shared_ptr<const TopologyData> d;
};

// xHCI pairing rule: odd bus N (USB 2.x) and even bus N+1 (USB 3.x) belong
// to the same controller.
uint8_t pairedBusNumber(uint8_t busNumber);
std::string pairedControllerId(uint8_t busNumber);

std::string formatVidPid(uint16_t vendorId, uint16_t productId);

}
