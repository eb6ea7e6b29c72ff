#pragma once
#include "AttributeSource.hpp"
#include <memory>
#include <optional>
#include <string>

struct libusb_context;
struct libusb_device;

namespace usbbw {

// Enumerates devices through libusb descriptors. libusb knows nothing about
// PCI, so buses are grouped by the odd/even pairing rule only.
class LibusbAttributeSource : public AttributeSource {
public:
    LibusbAttributeSource();
    ~LibusbAttributeSource() override;

    LibusbAttributeSource(const LibusbAttributeSource&) = delete;
    LibusbAttributeSource& operator=(const LibusbAttributeSource&) = delete;

    RawTopology read() override;
    std::string name() const override { return "libusb"; }

    // Off by default; opening a device for its string descriptors needs
    // write access to its node.
    void setReadStrings(bool enable);

    // libusb_speed value -> speed in Mbps, as sysfs reports it
    static std::optional<std::string> speedText(int speed);

private:
    RawBus readRootHub(libusb_device* device, uint8_t busNumber) const;
    RawDevice readDevice(libusb_device* device, const std::string& path) const;

    class Private;
    std::unique_ptr<Private> d;
};

}
