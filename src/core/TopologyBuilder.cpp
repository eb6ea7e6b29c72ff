#include "TopologyBuilder.hpp"
#include "Logger.hpp"
#include <usbbw/Constants.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace usbbw {

namespace {

std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<uint32_t> parseUnsigned(const std::string& text, int base, uint32_t maxValue) {
    std::string value = trimmed(text);
    if (value.empty() || value.size() > 8) {
        return std::nullopt;
    }
    uint32_t result = 0;
    for (char c : value) {
        int digit;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = c - '0';
        } else if (base == 16 && std::isxdigit(static_cast<unsigned char>(c))) {
            digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        } else {
            return std::nullopt;
        }
        if (digit >= base) {
            return std::nullopt;
        }
        result = result * base + digit;
    }
    if (result > maxValue) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> trimmedText(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    std::string text = trimmed(*value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

uint16_t requireId(const std::optional<std::string>& value, const char* attribute,
                   const std::string& path) {
    if (!value) {
        throw UsbError(ErrorCode::MalformedDevice,
                       path + ": missing " + attribute);
    }
    auto id = parseUnsigned(*value, 16, 0xFFFF);
    if (!id) {
        throw UsbError(ErrorCode::MalformedDevice,
                       path + ": invalid " + attribute + " '" + trimmed(*value) + "'");
    }
    return static_cast<uint16_t>(*id);
}

Speed speedOrFallback(const std::optional<std::string>& value, const std::string& what) {
    if (value) {
        if (auto speed = speedFromMbps(*value)) {
            return *speed;
        }
    }
    LOG_DEBUG(what + ": unknown speed '" + (value ? trimmed(*value) : std::string()) +
              "', assuming full speed");
    return Speed::Full;
}

} // namespace

bool TopologyBuilder::parseConfigured(const std::optional<std::string>& bConfigurationValue) {
    if (!bConfigurationValue) {
        return false;
    }
    auto value = parseUnsigned(*bConfigurationValue, 10, 255);
    return value && *value > 0;
}

std::optional<uint16_t> TopologyBuilder::parseMaxPower(const std::optional<std::string>& bMaxPower) {
    if (!bMaxPower) {
        return std::nullopt;
    }
    std::string text = trimmed(*bMaxPower);
    if (text.size() >= 2 && text.compare(text.size() - 2, 2, "mA") == 0) {
        text.erase(text.size() - 2);
    }
    auto value = parseUnsigned(text, 10, 0xFFFF);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

Endpoint TopologyBuilder::parseEndpoint(const RawEndpoint& raw, Speed deviceSpeed) {
    auto type = transferTypeFromSysfs(raw.type);
    if (!type) {
        throw UsbError(ErrorCode::InvalidEndpoint,
                       raw.name + ": unknown transfer type '" + trimmed(raw.type) + "'");
    }
    auto direction = directionFromSysfs(raw.direction);
    if (!direction) {
        throw UsbError(ErrorCode::InvalidEndpoint,
                       raw.name + ": unknown direction '" + trimmed(raw.direction) + "'");
    }
    auto address = parseUnsigned(raw.address, 16, 0xFF);
    if (!address) {
        throw UsbError(ErrorCode::InvalidEndpoint,
                       raw.name + ": invalid bEndpointAddress '" + trimmed(raw.address) + "'");
    }

    auto bInterval = parseUnsigned(raw.bInterval, 16, 0xFF).value_or(0);
    auto wMaxPacketSize = parseUnsigned(raw.wMaxPacketSize, 16, 0xFFFF).value_or(0);

    Endpoint endpoint = Endpoint::fromDescriptor(
        static_cast<uint8_t>(*address), *type, *direction,
        static_cast<uint16_t>(wMaxPacketSize), static_cast<uint8_t>(bInterval),
        deviceSpeed);
    endpoint.intervalText = trimmed(raw.interval);
    return endpoint;
}

Device TopologyBuilder::parseDevice(const RawDevice& raw) {
    Device device;
    device.path = DevicePath::parse(trimmed(raw.name));

    const std::string name = device.path.toString();
    device.vendorId = requireId(raw.idVendor, "idVendor", name);
    device.productId = requireId(raw.idProduct, "idProduct", name);
    device.serial = trimmedText(raw.serial);
    device.manufacturer = trimmedText(raw.manufacturer);
    device.product = trimmedText(raw.product);
    device.speed = speedOrFallback(raw.speed, name);

    // Absent, empty or zero means the device never got a configuration
    // (typically a failed bandwidth reservation).
    device.configured = parseConfigured(raw.bConfigurationValue);
    device.maxPowerMa = parseMaxPower(raw.bMaxPower);

    if (raw.bDeviceClass) {
        device.deviceClass = static_cast<uint8_t>(
            parseUnsigned(*raw.bDeviceClass, 16, 0xFF).value_or(0));
    }
    device.isHub = device.deviceClass == HUB_DEVICE_CLASS;
    if (device.isHub && raw.maxchild) {
        if (auto ports = parseUnsigned(*raw.maxchild, 10, 0xFF)) {
            device.numPorts = static_cast<uint8_t>(*ports);
        }
    }
    if (raw.bNumInterfaces) {
        device.numInterfaces = static_cast<uint8_t>(
            parseUnsigned(*raw.bNumInterfaces, 10, 0xFF).value_or(0));
    }
    device.usbVersion = raw.version ? trimmed(*raw.version) : std::string();
    device.physicalLocation = raw.physicalLocation;

    // An unconfigured device has no active interfaces and reserves nothing.
    if (device.configured) {
        for (const auto& rawEndpoint : raw.endpoints) {
            try {
                device.endpoints.push_back(parseEndpoint(rawEndpoint, device.speed));
            } catch (const UsbError& e) {
                throw UsbError(e.code(), name + ": " + e.what());
            }
        }
    }

    return device;
}

BuildResult TopologyBuilder::build(const RawTopology& raw) {
    BuildResult result;
    auto data = std::make_shared<TopologyData>();

    auto warn = [&result](ErrorCode code, const std::string& path, const std::string& message) {
        LOG_WARNING(std::string(errorCodeName(code)) + ": " + message);
        result.warnings.push_back(TopologyWarning{code, path, message});
    };

    // Buses and their controllers
    std::map<std::string, Controller> controllers;
    for (const auto& rawBus : raw.buses) {
        const std::string busName = "usb" + std::to_string(rawBus.number);
        if (rawBus.number == 0) {
            warn(ErrorCode::InvalidPath, busName, "bus number 0 is not valid");
            continue;
        }
        if (std::any_of(data->buses.begin(), data->buses.end(),
                        [&rawBus](const Bus& b) { return b.number == rawBus.number; })) {
            warn(ErrorCode::InvalidPath, busName, busName + " reported twice");
            continue;
        }

        Bus bus;
        bus.number = rawBus.number;
        bus.speed = speedOrFallback(rawBus.speed, busName);
        bus.version = rawBus.version ? trimmed(*rawBus.version) : std::string();
        if (rawBus.maxchild) {
            bus.numPorts = static_cast<uint8_t>(
                parseUnsigned(*rawBus.maxchild, 10, 0xFF).value_or(0));
        }
        bus.pool = BandwidthPool::forBus(bus.speed);

        auto pci = trimmedText(rawBus.pciAddress);
        bus.controllerId = pci ? *pci : pairedControllerId(bus.number);

        auto& controller = controllers[bus.controllerId];
        controller.id = bus.controllerId;
        controller.pciAddress = pci.value_or(std::string());
        auto& slot = bus.isSuperSpeed() ? controller.usb3Bus : controller.usb2Bus;
        if (slot) {
            LOG_WARNING("controller " + controller.id + " already has a " +
                        poolClassName(bus.poolClass()) + " bus (" +
                        std::to_string(*slot) + "), ignoring pairing for " + busName);
        } else {
            slot = bus.number;
        }

        data->buses.push_back(std::move(bus));
    }
    std::sort(data->buses.begin(), data->buses.end(),
              [](const Bus& a, const Bus& b) { return a.number < b.number; });
    for (auto& [id, controller] : controllers) {
        data->controllers.push_back(std::move(controller));
    }

    // Devices, validated one at a time
    std::map<DevicePath, Device> accepted;
    for (const auto& rawDevice : raw.devices) {
        try {
            Device device = parseDevice(rawDevice);
            if (accepted.count(device.path)) {
                warn(ErrorCode::InvalidPath, device.path.toString(),
                     device.path.toString() + " reported twice");
                continue;
            }
            DevicePath key = device.path;
            accepted.emplace(std::move(key), std::move(device));
        } catch (const UsbError& e) {
            warn(e.code(), trimmed(rawDevice.name), e.what());
        }
    }

    // Link in path order so every parent is placed before its children.
    for (auto& [path, device] : accepted) {
        auto busIt = std::find_if(data->buses.begin(), data->buses.end(),
                                  [&path](const Bus& b) { return b.number == path.bus; });
        if (busIt == data->buses.end()) {
            warn(ErrorCode::OrphanedDevice, path.toString(),
                 path.toString() + ": bus " + std::to_string(path.bus) + " is not present");
            continue;
        }

        // A rejected or missing hub does not take its subtree out of the
        // pool: the device hangs off the nearest surviving ancestor instead.
        std::optional<DeviceIndex> parentIndex;
        if (auto parentPath = path.parent()) {
            std::optional<DevicePath> ancestor = parentPath;
            while (ancestor && !data->pathIndex.count(*ancestor)) {
                ancestor = ancestor->parent();
            }
            if (ancestor) {
                parentIndex = data->pathIndex.at(*ancestor);
            }
            if (ancestor != parentPath) {
                warn(ErrorCode::OrphanedDevice, path.toString(),
                     path.toString() + ": parent hub " + parentPath->toString() +
                     " is not present, attached to " +
                     (ancestor ? ancestor->toString() : "usb" + std::to_string(path.bus)));
            }
        }

        DeviceIndex index = data->devices.size();
        device.parent = parentIndex;
        data->devices.push_back(std::move(device));
        data->pathIndex[path] = index;

        if (parentIndex) {
            data->devices[*parentIndex].children.push_back(index);
        } else {
            busIt->rootDevices.push_back(index);
        }
    }

    result.topology = Topology(std::move(data));
    return result;
}

}
