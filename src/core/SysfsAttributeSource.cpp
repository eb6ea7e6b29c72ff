#include "SysfsAttributeSource.hpp"
#include "Logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <utility>

namespace usbbw {

namespace {

std::optional<std::string> readAttribute(const QString& dir, const char* attribute) {
    QFile file(dir + "/" + attribute);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll()).trimmed().toStdString();
}

std::string readText(const QString& dir, const char* attribute) {
    return readAttribute(dir, attribute).value_or(std::string());
}

} // namespace

SysfsAttributeSource::SysfsAttributeSource(std::string root)
    : root_(std::move(root)) {
}

std::optional<std::string> SysfsAttributeSource::pciAddressFromLink(const std::string& target) {
    const QStringList components = QString::fromStdString(target).split('/', Qt::SkipEmptyParts);
    for (int i = 1; i < components.size(); ++i) {
        if (!components[i].startsWith("usb")) {
            continue;
        }
        const QString& previous = components[i - 1];
        if (previous.size() >= 7 && previous.contains(':') && previous.contains('.')) {
            return previous.toStdString();
        }
    }
    return std::nullopt;
}

RawTopology SysfsAttributeSource::read() {
    QDir dir(QString::fromStdString(root_));
    if (!dir.exists() || !dir.isReadable()) {
        throw UsbError(ErrorCode::SourceError, "cannot read " + root_);
    }

    RawTopology raw;
    const QStringList entries = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::System,
                                              QDir::Name);
    for (const QString& entry : entries) {
        if (entry.startsWith("usb")) {
            bool ok = false;
            uint number = entry.mid(3).toUInt(&ok);
            if (!ok || number > MAX_BUSES) {
                LOG_DEBUG("skipping " + entry.toStdString());
                continue;
            }
            raw.buses.push_back(readBus(entry.toStdString(), static_cast<uint8_t>(number)));
        } else if (entry.contains('-') && !entry.contains(':')) {
            raw.devices.push_back(readDevice(entry.toStdString()));
        }
    }

    LOG_DEBUG("sysfs: " + std::to_string(raw.buses.size()) + " buses, " +
              std::to_string(raw.devices.size()) + " devices");
    return raw;
}

RawBus SysfsAttributeSource::readBus(const std::string& entry, uint8_t number) const {
    const QString path = QString::fromStdString(root_ + "/" + entry);

    RawBus bus;
    bus.number = number;
    bus.speed = readAttribute(path, "speed");
    bus.version = readAttribute(path, "version");
    bus.maxchild = readAttribute(path, "maxchild");

    QFileInfo link(path);
    if (link.isSymLink()) {
        bus.pciAddress = pciAddressFromLink(link.symLinkTarget().toStdString());
    }
    return bus;
}

RawDevice SysfsAttributeSource::readDevice(const std::string& entry) const {
    const QString path = QString::fromStdString(root_ + "/" + entry);

    RawDevice device;
    device.name = entry;
    device.idVendor = readAttribute(path, "idVendor");
    device.idProduct = readAttribute(path, "idProduct");
    device.serial = readAttribute(path, "serial");
    device.manufacturer = readAttribute(path, "manufacturer");
    device.product = readAttribute(path, "product");
    device.speed = readAttribute(path, "speed");
    device.bConfigurationValue = readAttribute(path, "bConfigurationValue");
    device.bMaxPower = readAttribute(path, "bMaxPower");
    device.bDeviceClass = readAttribute(path, "bDeviceClass");
    device.bNumInterfaces = readAttribute(path, "bNumInterfaces");
    device.version = readAttribute(path, "version");
    device.maxchild = readAttribute(path, "maxchild");
    device.endpoints = readEndpoints(path.toStdString());
    device.physicalLocation = readPhysicalLocation(path.toStdString());
    return device;
}

std::vector<RawEndpoint> SysfsAttributeSource::readEndpoints(const std::string& devicePath) const {
    std::vector<RawEndpoint> endpoints;

    // Interface directories are named <device>:<config>.<interface>
    QDir device(QString::fromStdString(devicePath));
    const QStringList interfaces = device.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& interface : interfaces) {
        if (!interface.contains(':')) {
            continue;
        }
        QDir interfaceDir(device.filePath(interface));
        const QStringList eps = interfaceDir.entryList({"ep_*"}, QDir::Dirs | QDir::NoDotAndDotDot,
                                                       QDir::Name);
        for (const QString& ep : eps) {
            if (ep == "ep_00") {
                continue;
            }
            const QString epPath = interfaceDir.filePath(ep);
            RawEndpoint endpoint;
            endpoint.name = ep.toStdString();
            endpoint.address = readText(epPath, "bEndpointAddress");
            endpoint.type = readText(epPath, "type");
            endpoint.direction = readText(epPath, "direction");
            endpoint.bInterval = readText(epPath, "bInterval");
            endpoint.wMaxPacketSize = readText(epPath, "wMaxPacketSize");
            endpoint.interval = readText(epPath, "interval");
            endpoints.push_back(std::move(endpoint));
        }
    }
    return endpoints;
}

std::optional<PhysicalLocation> SysfsAttributeSource::readPhysicalLocation(
    const std::string& devicePath) const {
    const QString path = QString::fromStdString(devicePath) + "/physical_location";
    if (!QFileInfo(path).isDir()) {
        return std::nullopt;
    }

    PhysicalLocation location;
    location.panel = readText(path, "panel");
    location.horizontalPosition = readText(path, "horizontal_position");
    location.verticalPosition = readText(path, "vertical_position");
    location.dock = readText(path, "dock") == "yes";
    location.lid = readText(path, "lid") == "yes";
    return location;
}

}
