#include "Topology.hpp"
#include <usbbw/Constants.hpp>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace usbbw {

namespace {

int parseNumber(const std::string& text, const std::string& whole) {
    if (text.empty() || text.size() > 3) {
        throw UsbError(ErrorCode::InvalidPath, "invalid device path '" + whole + "'");
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw UsbError(ErrorCode::InvalidPath, "invalid device path '" + whole + "'");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

DevicePath DevicePath::parse(const std::string& text) {
    auto dash = text.find('-');
    if (dash == std::string::npos || text.find('-', dash + 1) != std::string::npos) {
        throw UsbError(ErrorCode::InvalidPath, "invalid device path '" + text + "'");
    }

    DevicePath path;
    int bus = parseNumber(text.substr(0, dash), text);
    if (bus < 1 || bus > MAX_BUSES) {
        throw UsbError(ErrorCode::InvalidPath, "bus number out of range in '" + text + "'");
    }
    path.bus = static_cast<uint8_t>(bus);

    std::string chain = text.substr(dash + 1);
    size_t start = 0;
    while (true) {
        size_t dot = chain.find('.', start);
        std::string part = chain.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        int port = parseNumber(part, text);
        if (port < 1 || port > MAX_PORTS) {
            throw UsbError(ErrorCode::InvalidPath, "port number out of range in '" + text + "'");
        }
        path.ports.push_back(static_cast<uint8_t>(port));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    return path;
}

std::string DevicePath::toString() const {
    std::stringstream ss;
    ss << static_cast<int>(bus) << "-";
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) ss << ".";
        ss << static_cast<int>(ports[i]);
    }
    return ss.str();
}

std::optional<DevicePath> DevicePath::parent() const {
    if (ports.size() <= 1) {
        return std::nullopt;
    }
    DevicePath result;
    result.bus = bus;
    result.ports.assign(ports.begin(), ports.end() - 1);
    return result;
}

std::string formatVidPid(uint16_t vendorId, uint16_t productId) {
    char buffer[10];
    std::snprintf(buffer, sizeof(buffer), "%04x:%04x", vendorId, productId);
    return buffer;
}

std::string Device::vidPid() const {
    return formatVidPid(vendorId, productId);
}

std::string Device::configKey() const {
    if (serial && !serial->empty()) {
        return vidPid() + ":" + *serial;
    }
    return vidPid();
}

std::string Device::displayName() const {
    if (product && !product->empty()) return *product;
    if (manufacturer && !manufacturer->empty()) return *manufacturer;
    return vidPid();
}

uint64_t Device::periodicBandwidthBps() const {
    uint64_t total = 0;
    for (const auto& endpoint : endpoints) {
        total += endpointBandwidthBps(endpoint);
    }
    return total;
}

std::vector<const Endpoint*> Device::periodicEndpoints() const {
    std::vector<const Endpoint*> result;
    for (const auto& endpoint : endpoints) {
        if (endpoint.reservesBandwidth()) {
            result.push_back(&endpoint);
        }
    }
    return result;
}

Topology::Topology()
    : d(std::make_shared<const TopologyData>()) {
}

Topology::Topology(std::shared_ptr<const TopologyData> data)
    : d(data ? std::move(data) : std::make_shared<const TopologyData>()) {
}

const Bus* Topology::bus(uint8_t number) const {
    for (const auto& bus : d->buses) {
        if (bus.number == number) {
            return &bus;
        }
    }
    return nullptr;
}

const Device* Topology::findDevice(const DevicePath& path) const {
    auto it = d->pathIndex.find(path);
    if (it == d->pathIndex.end()) {
        return nullptr;
    }
    return &d->devices[it->second];
}

const Device* Topology::findDevice(const std::string& path) const {
    try {
        return findDevice(DevicePath::parse(path));
    } catch (const UsbError&) {
        return nullptr;
    }
}

std::vector<DeviceIndex> Topology::devicesInTreeOrder(uint8_t busNumber) const {
    std::vector<DeviceIndex> result;
    const Bus* b = bus(busNumber);
    if (!b) {
        return result;
    }

    std::vector<DeviceIndex> stack(b->rootDevices.rbegin(), b->rootDevices.rend());
    while (!stack.empty()) {
        DeviceIndex index = stack.back();
        stack.pop_back();
        result.push_back(index);

        const auto& children = d->devices[index].children;
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return result;
}

std::vector<DeviceIndex> Topology::devicesInTreeOrder() const {
    std::vector<DeviceIndex> result;
    for (const auto& bus : d->buses) {
        auto busDevices = devicesInTreeOrder(bus.number);
        result.insert(result.end(), busDevices.begin(), busDevices.end());
    }
    return result;
}

const Controller* Topology::controllerForBus(uint8_t busNumber) const {
    for (const auto& controller : d->controllers) {
        if (controller.usb2Bus == busNumber || controller.usb3Bus == busNumber) {
            return &controller;
        }
    }
    return nullptr;
}

std::optional<uint8_t> Topology::pairedBus(uint8_t busNumber) const {
    const Controller* controller = controllerForBus(busNumber);
    if (!controller) {
        return std::nullopt;
    }
    if (controller->usb2Bus == busNumber) {
        return controller->usb3Bus;
    }
    return controller->usb2Bus;
}

uint64_t Topology::periodicBandwidthBps(uint8_t busNumber) const {
    uint64_t total = 0;
    for (DeviceIndex index : devicesInTreeOrder(busNumber)) {
        total += d->devices[index].periodicBandwidthBps();
    }
    return total;
}

uint32_t Topology::totalPowerMa(uint8_t busNumber) const {
    uint32_t total = 0;
    for (DeviceIndex index : devicesInTreeOrder(busNumber)) {
        total += d->devices[index].maxPowerMa.value_or(0);
    }
    return total;
}

uint8_t pairedBusNumber(uint8_t busNumber) {
    return (busNumber % 2 == 1) ? static_cast<uint8_t>(busNumber + 1)
                                : static_cast<uint8_t>(busNumber - 1);
}

std::string pairedControllerId(uint8_t busNumber) {
    int first = (busNumber % 2 == 1) ? busNumber : busNumber - 1;
    return "bus" + std::to_string(first);
}

}
