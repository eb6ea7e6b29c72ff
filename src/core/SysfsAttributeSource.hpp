#pragma once
#include "AttributeSource.hpp"
#include <usbbw/Constants.hpp>
#include <optional>
#include <string>

namespace usbbw {

// Reads the kernel's USB device tree (/sys/bus/usb/devices by default).
class SysfsAttributeSource : public AttributeSource {
public:
    explicit SysfsAttributeSource(std::string root = SYSFS_USB_DEVICES);

    RawTopology read() override;
    std::string name() const override { return "sysfs"; }

    const std::string& root() const { return root_; }

    // "0000:c1:00.4" from a link target such as
    // ../../../devices/pci0000:00/0000:00:08.1/0000:c1:00.4/usb1
    static std::optional<std::string> pciAddressFromLink(const std::string& target);

private:
    RawBus readBus(const std::string& entry, uint8_t number) const;
    RawDevice readDevice(const std::string& entry) const;
    std::vector<RawEndpoint> readEndpoints(const std::string& devicePath) const;
    std::optional<PhysicalLocation> readPhysicalLocation(const std::string& devicePath) const;

    std::string root_;
};

}
