#include "LibusbAttributeSource.hpp"
#include "Logger.hpp"
#include <libusb.h>
#include <cstdio>
#include <optional>
#include <utility>

namespace usbbw {

namespace {

constexpr int MAX_PORT_DEPTH = 7;
constexpr int MAX_STRING_LENGTH = 256;

std::string hex(unsigned value, int digits) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%0*x", digits, value);
    return buffer;
}

std::string bcdVersion(uint16_t bcd) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%2x.%02x", bcd >> 8, bcd & 0xFF);
    return buffer;
}

const char* transferTypeText(uint8_t bmAttributes) {
    switch (bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) {
    case LIBUSB_TRANSFER_TYPE_CONTROL: return "Control";
    case LIBUSB_TRANSFER_TYPE_ISOCHRONOUS: return "Isoc";
    case LIBUSB_TRANSFER_TYPE_BULK: return "Bulk";
    default: return "Interrupt";
    }
}

std::optional<std::string> stringDescriptor(libusb_device_handle* handle, uint8_t index) {
    if (!handle || index == 0) {
        return std::nullopt;
    }
    unsigned char buffer[MAX_STRING_LENGTH];
    int ret = libusb_get_string_descriptor_ascii(handle, index, buffer, sizeof(buffer));
    if (ret < 0) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<char*>(buffer), ret);
}

} // namespace

std::optional<std::string> LibusbAttributeSource::speedText(int speed) {
    switch (speed) {
    case LIBUSB_SPEED_LOW: return std::string("1.5");
    case LIBUSB_SPEED_FULL: return std::string("12");
    case LIBUSB_SPEED_HIGH: return std::string("480");
    case LIBUSB_SPEED_SUPER: return std::string("5000");
    case LIBUSB_SPEED_SUPER_PLUS: return std::string("10000");
#if defined(LIBUSB_API_VERSION) && LIBUSB_API_VERSION >= 0x0100010A
    case LIBUSB_SPEED_SUPER_PLUS_X2: return std::string("20000");
#endif
    default: return std::nullopt;
    }
}

class LibusbAttributeSource::Private {
public:
    libusb_context* context{nullptr};
    int initResult{LIBUSB_SUCCESS};
    bool readStrings{false};
};

LibusbAttributeSource::LibusbAttributeSource()
    : d(std::make_unique<Private>()) {
    d->initResult = libusb_init(&d->context);
    if (d->initResult != LIBUSB_SUCCESS) {
        LOG_ERROR("Failed to initialize libusb: " +
                  std::string(libusb_error_name(d->initResult)));
        d->context = nullptr;
    }
}

LibusbAttributeSource::~LibusbAttributeSource() {
    if (d->context) {
        libusb_exit(d->context);
    }
}

void LibusbAttributeSource::setReadStrings(bool enable) {
    d->readStrings = enable;
}

RawTopology LibusbAttributeSource::read() {
    if (!d->context) {
        throw UsbError(ErrorCode::SourceError,
                       "libusb unavailable: " + std::string(libusb_error_name(d->initResult)));
    }

    libusb_device** list;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        throw UsbError(ErrorCode::SourceError,
                       "Failed to get device list: " +
                       std::string(libusb_error_name(static_cast<int>(count))));
    }

    RawTopology raw;
    for (ssize_t i = 0; i < count; i++) {
        libusb_device* device = list[i];
        uint8_t bus = libusb_get_bus_number(device);

        uint8_t ports[MAX_PORT_DEPTH];
        int depth = libusb_get_port_numbers(device, ports, MAX_PORT_DEPTH);
        if (depth < 0) {
            LOG_WARNING("bus " + std::to_string(bus) + ": cannot read port chain: " +
                        libusb_error_name(depth));
            continue;
        }

        if (depth == 0) {
            raw.buses.push_back(readRootHub(device, bus));
            continue;
        }

        std::string path = std::to_string(bus) + "-";
        for (int p = 0; p < depth; ++p) {
            if (p > 0) path += ".";
            path += std::to_string(ports[p]);
        }
        raw.devices.push_back(readDevice(device, path));
    }

    libusb_free_device_list(list, 1);
    return raw;
}

RawBus LibusbAttributeSource::readRootHub(libusb_device* device, uint8_t busNumber) const {
    RawBus bus;
    bus.number = busNumber;
    bus.speed = speedText(libusb_get_device_speed(device));

    libusb_device_descriptor descriptor;
    if (libusb_get_device_descriptor(device, &descriptor) == 0) {
        bus.version = bcdVersion(descriptor.bcdUSB);
    }
    return bus;
}

RawDevice LibusbAttributeSource::readDevice(libusb_device* device, const std::string& path) const {
    RawDevice raw;
    raw.name = path;
    int speed = libusb_get_device_speed(device);
    raw.speed = speedText(speed);

    libusb_device_descriptor descriptor;
    int ret = libusb_get_device_descriptor(device, &descriptor);
    if (ret != 0) {
        // Left without ids; the builder rejects it as malformed.
        LOG_DEBUG(path + ": no device descriptor: " + libusb_error_name(ret));
        return raw;
    }

    raw.idVendor = hex(descriptor.idVendor, 4);
    raw.idProduct = hex(descriptor.idProduct, 4);
    raw.bDeviceClass = hex(descriptor.bDeviceClass, 2);
    raw.version = bcdVersion(descriptor.bcdUSB);

    if (d->readStrings) {
        libusb_device_handle* handle = nullptr;
        ret = libusb_open(device, &handle);
        if (ret == LIBUSB_SUCCESS) {
            raw.manufacturer = stringDescriptor(handle, descriptor.iManufacturer);
            raw.product = stringDescriptor(handle, descriptor.iProduct);
            raw.serial = stringDescriptor(handle, descriptor.iSerialNumber);
            libusb_close(handle);
        } else {
            LOG_DEBUG(path + ": cannot open for strings: " + libusb_error_name(ret));
        }
    }

    libusb_config_descriptor* config = nullptr;
    ret = libusb_get_active_config_descriptor(device, &config);
    if (ret == LIBUSB_ERROR_NOT_FOUND) {
        raw.bConfigurationValue = "0";
        return raw;
    }
    if (ret != LIBUSB_SUCCESS) {
        LOG_DEBUG(path + ": no active configuration: " + libusb_error_name(ret));
        return raw;
    }

    // bMaxPower is in 2 mA units below SuperSpeed, 8 mA units at SuperSpeed
    unsigned unit = speed >= LIBUSB_SPEED_SUPER ? 8 : 2;
    raw.bConfigurationValue = std::to_string(config->bConfigurationValue);
    raw.bMaxPower = std::to_string(config->MaxPower * unit) + "mA";
    raw.bNumInterfaces = std::to_string(config->bNumInterfaces);

    for (uint8_t i = 0; i < config->bNumInterfaces; ++i) {
        const libusb_interface& interface = config->interface[i];
        if (interface.num_altsetting < 1) {
            continue;
        }
        const libusb_interface_descriptor& setting = interface.altsetting[0];
        for (uint8_t e = 0; e < setting.bNumEndpoints; ++e) {
            const libusb_endpoint_descriptor& ep = setting.endpoint[e];
            RawEndpoint endpoint;
            endpoint.name = "ep_" + hex(ep.bEndpointAddress, 2);
            endpoint.address = hex(ep.bEndpointAddress, 2);
            endpoint.type = transferTypeText(ep.bmAttributes);
            endpoint.direction = (ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) ? "in" : "out";
            endpoint.bInterval = hex(ep.bInterval, 2);
            endpoint.wMaxPacketSize = hex(ep.wMaxPacketSize, 4);
            raw.endpoints.push_back(std::move(endpoint));
        }
    }

    libusb_free_config_descriptor(config);
    return raw;
}

}
