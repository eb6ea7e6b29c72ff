#pragma once
#include <usbbw/Types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usbbw {

// Raw attribute text as the kernel exposes it under /sys/bus/usb/devices.
// Sources that are not sysfs render their values in the same conventions
// (hex ids, speed in Mbps, "Interrupt"/"Isoc" type words, ...).

struct RawEndpoint {
    std::string name;            // ep_81
    std::string address;         // bEndpointAddress, hex
    std::string type;            // Control, Bulk, Interrupt, Isoc
    std::string direction;       // in, out
    std::string bInterval;       // hex
    std::string wMaxPacketSize;  // hex
    std::string interval;        // human readable, e.g. "8ms"
};

struct RawDevice {
    std::string name;  // device path, e.g. 3-1.2
    std::optional<std::string> idVendor;
    std::optional<std::string> idProduct;
    std::optional<std::string> serial;
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> speed;
    std::optional<std::string> bConfigurationValue;
    std::optional<std::string> bMaxPower;
    std::optional<std::string> bDeviceClass;
    std::optional<std::string> bNumInterfaces;
    std::optional<std::string> version;
    std::optional<std::string> maxchild;
    std::vector<RawEndpoint> endpoints;
    std::optional<PhysicalLocation> physicalLocation;
};

struct RawBus {
    uint8_t number{0};
    std::optional<std::string> speed;
    std::optional<std::string> version;
    std::optional<std::string> maxchild;
    std::optional<std::string> pciAddress;  // controller the root hub hangs off
};

struct RawTopology {
    std::vector<RawBus> buses;
    std::vector<RawDevice> devices;
};

class AttributeSource {
public:
    virtual ~AttributeSource() = default;

    // Blocking read of the whole tree. Throws UsbError(SourceError) when the
    // source cannot be read at all; unreadable optional attributes are left
    // empty for the builder to judge.
    virtual RawTopology read() = 0;
    virtual std::string name() const = 0;
};

}
