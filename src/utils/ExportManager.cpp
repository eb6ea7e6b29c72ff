#include "ExportManager.hpp"
#include "BandwidthAllocator.hpp"
#include "Logger.hpp"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

namespace usbbw {

namespace {

constexpr size_t BAR_WIDTH = 20;

std::string percentText(double percent) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << percent << "%";
    return ss.str();
}

std::string mermaidText(const std::string& text) {
    std::string result;
    for (char c : text) {
        if (c == '"') {
            result += "#quot;";
        } else {
            result += c;
        }
    }
    return result;
}

std::string hexByte(uint8_t value) {
    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(value);
    return ss.str();
}

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

class ExportManager::Private {
public:
    LabelResolver labels;

    std::string busHeading(const Bus& bus) const {
        return labels.busLabel(bus) + " (" + poolClassName(bus.poolClass()) + ", " +
               speedShortName(bus.speed) + ")";
    }

    void writeDevice(std::stringstream& out, const Snapshot& snapshot,
                     const Device& device, const ListOptions& options) const {
        const auto periodic = device.periodicEndpoints();
        if (options.periodicOnly && periodic.empty()) {
            return;
        }

        std::string indent((device.path.depth() + 1) * 2, ' ');
        const char* icon = !device.configured ? "(!)" : (device.isHub ? "Hub" : "Dev");

        out << indent << icon << " " << device.path.toString() << " "
            << snapshot.labelText(device) << " (" << device.vidPid() << ")";
        if (!device.configured) {
            out << " [NOT CONFIGURED]";
        } else if (uint64_t bps = device.periodicBandwidthBps()) {
            out << " [" << formatBps(bps) << "]";
        }
        out << "\n";

        if (!options.verbose) {
            return;
        }
        if (device.maxPowerMa && *device.maxPowerMa > 0) {
            out << indent << "    Power: " << *device.maxPowerMa << " mA\n";
        }
        if (device.serial) {
            out << indent << "    Serial: " << *device.serial << "\n";
        }
        for (const Endpoint* ep : periodic) {
            out << indent << "    EP" << hexByte(ep->address) << " "
                << transferTypeName(ep->transferType) << " " << directionName(ep->direction)
                << " " << ep->maxPacketSize << "B";
            if (ep->multiplier() > 1) {
                out << " x" << ep->multiplier();
            }
            out << " @ " << formatInterval(*ep) << " -> "
                << formatBps(endpointBandwidthBps(*ep)) << "\n";
        }
    }

    void writeMermaidDevice(std::stringstream& out, const Snapshot& snapshot,
                            DeviceIndex index, const std::string& parentNode,
                            std::vector<std::string>& unconfigured) const {
        const auto& mermaid = labels.config().mermaid;
        const Device& device = snapshot.topology.device(index);
        const std::string path = device.path.toString();

        if (std::find(mermaid.hidePaths.begin(), mermaid.hidePaths.end(), path) !=
            mermaid.hidePaths.end()) {
            return;
        }

        bool shown = true;
        if (!mermaid.filterVendors.empty()) {
            const std::string vendor = device.vidPid().substr(0, 4);
            shown = std::find(mermaid.filterVendors.begin(), mermaid.filterVendors.end(),
                              vendor) != mermaid.filterVendors.end();
        }
        if (mermaid.collapseSingleChildHubs && device.isHub && device.children.size() == 1) {
            shown = false;
        }

        std::string node = parentNode;
        if (shown) {
            node = "dev_" + mermaidNodeId(path);
            out << "    " << node << "[\"" << mermaidText(snapshot.labelText(device))
                << "<br/>" << path << " " << device.vidPid();
            if (uint64_t bps = device.periodicBandwidthBps()) {
                out << "<br/>" << formatBps(bps);
            }
            out << "\"]\n";
            out << "    " << parentNode << " --> " << node << "\n";
            if (!device.configured) {
                unconfigured.push_back(node);
            }
        }

        for (DeviceIndex child : device.children) {
            writeMermaidDevice(out, snapshot, child, node, unconfigured);
        }
    }
};

ExportManager::ExportManager(LabelResolver labels, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->labels = std::move(labels);
}

ExportManager::~ExportManager() = default;

std::string ExportManager::summary(const Snapshot& snapshot) const {
    std::stringstream out;
    out << "USB Bus Bandwidth Summary\n"
        << "=========================\n\n";

    const Topology& topology = snapshot.topology;
    for (const auto& bus : topology.buses()) {
        const BandwidthPool& pool = bus.pool;
        out << d->busHeading(bus) << "\n";
        out << "  Periodic BW: " << formatBps(pool.usedBps) << " / "
            << formatBps(pool.capacityBps) << " (" << percentText(pool.usagePercent()) << ") "
            << bandwidthBar(pool.usagePercent(), BAR_WIDTH) << "\n";
        out << "  Available:   " << formatBps(pool.availableBps()) << "\n";
        out << "  Devices:     " << topology.devicesInTreeOrder(bus.number).size() << "\n";
        if (uint32_t power = topology.totalPowerMa(bus.number)) {
            out << "  Power:       " << power << " mA\n";
        }
        if (pool.isOverSubscribed()) {
            out << "  OVER-SUBSCRIBED by " << formatBps(pool.overSubscribedBps()) << "\n";
        } else if (pool.isCritical()) {
            out << "  Critical usage\n";
        } else if (pool.isHighUsage()) {
            out << "  High usage\n";
        }
        out << "\n";
    }

    if (!snapshot.warnings.empty()) {
        out << snapshot.warnings.size() << " device(s) could not be read:\n";
        for (const auto& warning : snapshot.warnings) {
            out << "  " << errorCodeName(warning.code) << ": " << warning.message << "\n";
        }
    }
    return out.str();
}

std::string ExportManager::deviceList(const Snapshot& snapshot, const ListOptions& options) const {
    std::stringstream out;
    const Topology& topology = snapshot.topology;
    for (const auto& bus : topology.buses()) {
        out << "=== " << d->labels.busLabel(bus) << " (" << speedShortName(bus.speed)
            << ") ===\n";
        for (DeviceIndex index : topology.devicesInTreeOrder(bus.number)) {
            d->writeDevice(out, snapshot, topology.device(index), options);
        }
        out << "\n";
    }
    return out.str();
}

std::string ExportManager::recommendations(const Snapshot& snapshot, uint64_t requiredBps) const {
    std::stringstream out;
    out << "Best Buses for New Devices\n"
        << "==========================\n\n"
        << "Note: Bandwidth is shared across the entire bus, not per-hub.\n"
        << "All devices behind a hub share the bus bandwidth pool.\n";
    if (requiredBps > 0) {
        out << "Required: " << formatBps(requiredBps) << "\n";
    }

    const std::pair<const char*, Speed> classes[] = {
        {"USB 3.x Buses (SuperSpeed):", Speed::Super},
        {"USB 2.0 Buses (High Speed):", Speed::High},
    };
    for (const auto& [heading, speed] : classes) {
        out << "\n" << heading << "\n";
        auto best = BandwidthAllocator::bestBusesFor(snapshot.topology, requiredBps, speed);
        if (best.empty()) {
            out << "  (none)\n";
        }
        for (const auto& rec : best) {
            const Bus* bus = snapshot.topology.bus(rec.bus);
            out << "  " << d->labels.busLabel(*bus) << " - " << formatBps(rec.availableBps)
                << " available (" << percentText(bus->pool.usagePercent()) << " used)\n";
        }
    }
    return out.str();
}

std::string ExportManager::mermaid(const Snapshot& snapshot) const {
    std::stringstream out;
    std::vector<std::string> unconfigured;
    std::vector<std::string> overSubscribed;
    const Topology& topology = snapshot.topology;

    out << "flowchart LR\n";
    for (const auto& controller : topology.controllers()) {
        std::string node = "ctrl_" + mermaidNodeId(controller.id);
        out << "    " << node << "[\"" << mermaidText(d->labels.controllerLabel(controller));
        if (!controller.pciAddress.empty()) {
            out << "<br/>" << controller.pciAddress;
        }
        out << "\"]\n";

        for (auto busNumber : {controller.usb2Bus, controller.usb3Bus}) {
            const Bus* bus = busNumber ? topology.bus(*busNumber) : nullptr;
            if (!bus) {
                continue;
            }
            std::string busNode = "bus_" + std::to_string(bus->number);
            out << "    " << busNode << "[\"" << mermaidText(d->labels.busLabel(*bus))
                << "<br/>" << poolClassName(bus->poolClass()) << " " << speedShortName(bus->speed)
                << "<br/>" << formatBps(bus->pool.usedBps) << " / "
                << formatBps(bus->pool.capacityBps) << "\"]\n";
            out << "    " << node << " --> " << busNode << "\n";
            if (bus->pool.isOverSubscribed()) {
                overSubscribed.push_back(busNode);
            }
            for (DeviceIndex root : bus->rootDevices) {
                d->writeMermaidDevice(out, snapshot, root, busNode, unconfigured);
            }
        }
    }

    if (!unconfigured.empty()) {
        out << "    classDef unconfigured fill:#fdd,stroke:#c00\n";
        for (const auto& node : unconfigured) {
            out << "    class " << node << " unconfigured\n";
        }
    }
    if (!overSubscribed.empty()) {
        out << "    classDef oversubscribed fill:#fcc,stroke:#900,stroke-width:2px\n";
        for (const auto& node : overSubscribed) {
            out << "    class " << node << " oversubscribed\n";
        }
    }
    return out.str();
}

std::string ExportManager::markdown(const Snapshot& snapshot) const {
    std::stringstream out;
    out << "# USB Topology\n\n"
        << "## Bandwidth Summary\n\n"
        << "| Bus | Class | Speed | Used | Capacity | Usage | Available | Devices |\n"
        << "|-----|-------|-------|------|----------|-------|-----------|---------|\n";

    const Topology& topology = snapshot.topology;
    for (const auto& bus : topology.buses()) {
        out << "| " << d->labels.busLabel(bus) << " | " << poolClassName(bus.poolClass())
            << " | " << speedShortName(bus.speed) << " | " << formatBps(bus.pool.usedBps)
            << " | " << formatBps(bus.pool.capacityBps) << " | "
            << percentText(bus.pool.usagePercent()) << " | "
            << formatBps(bus.pool.availableBps()) << " | "
            << topology.devicesInTreeOrder(bus.number).size() << " |\n";
    }

    out << "\n## Topology\n\n"
        << "```mermaid\n" << mermaid(snapshot) << "```\n";
    return out.str();
}

std::string ExportManager::generateConfig(const Snapshot& snapshot) const {
    const Topology& topology = snapshot.topology;
    QJsonObject root;

    QJsonObject settings;
    settings["refresh_ms"] = d->labels.config().settings.refreshMs;
    settings["theme"] = qs(d->labels.config().settings.theme);
    settings["use_bits"] = d->labels.config().settings.useBits;
    root["settings"] = settings;

    QJsonObject controllers;
    for (const auto& controller : topology.controllers()) {
        const std::string& key = controller.pciAddress.empty() ? controller.id
                                                               : controller.pciAddress;
        controllers[qs(key)] = qs(d->labels.controllerLabel(controller));
    }
    root["controllers"] = controllers;

    QJsonObject buses;
    for (const auto& bus : topology.buses()) {
        buses[qs(std::to_string(bus.number))] = qs(d->labels.busLabel(bus));
    }
    root["buses"] = buses;

    // Configured rules first, then one rule per newly seen specific location
    std::set<std::tuple<std::string, std::string, std::string>> locations;
    QJsonArray ports;
    for (const auto& rule : d->labels.config().physicalPorts) {
        locations.emplace(rule.panel.value_or(""), rule.horizontalPosition.value_or(""),
                          rule.verticalPosition.value_or(""));
        QJsonObject existing;
        if (rule.panel) existing["panel"] = qs(*rule.panel);
        if (rule.horizontalPosition) existing["horizontal_position"] = qs(*rule.horizontalPosition);
        if (rule.verticalPosition) existing["vertical_position"] = qs(*rule.verticalPosition);
        if (rule.dock) existing["dock"] = *rule.dock;
        existing["label"] = qs(rule.label);
        ports.append(existing);
    }
    for (const auto& device : topology.devices()) {
        if (!device.physicalLocation || !device.physicalLocation->isSpecific()) {
            continue;
        }
        const PhysicalLocation& loc = *device.physicalLocation;
        if (!locations.emplace(loc.panel, loc.horizontalPosition, loc.verticalPosition).second) {
            continue;
        }
        QJsonObject rule;
        if (!loc.panel.empty()) rule["panel"] = qs(loc.panel);
        if (!loc.horizontalPosition.empty()) {
            rule["horizontal_position"] = qs(loc.horizontalPosition);
        }
        if (!loc.verticalPosition.empty()) rule["vertical_position"] = qs(loc.verticalPosition);
        rule["label"] = qs(d->labels.autoPortLabel(loc).value_or("USB Port"));
        ports.append(rule);
    }
    root["physical_ports"] = ports;

    QJsonObject products;
    for (const auto& [key, label] : d->labels.config().products) {
        products[qs(key)] = qs(label);
    }
    for (const auto& device : topology.devices()) {
        if (device.isHub || products.contains(qs(device.vidPid()))) {
            continue;
        }
        std::string name = device.product.value_or(device.manufacturer.value_or("Unknown Device"));
        products[qs(device.vidPid())] = qs(name);
    }
    root["products"] = products;

    QJsonObject positions;
    positions["panel"] = QJsonObject();
    positions["vertical"] = QJsonObject();
    positions["horizontal"] = QJsonObject();
    root["position_labels"] = positions;

    return QJsonDocument(root).toJson(QJsonDocument::Indented).toStdString();
}

bool ExportManager::write(const std::string& content, const std::string& filename) {
    if (filename.empty()) {
        std::cout << content;
        std::cout.flush();
        return true;
    }

    QFile file(qs(filename));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        std::string message = "Cannot write " + filename + ": " +
                              file.errorString().toStdString();
        LOG_ERROR(message);
        emit exportError(message);
        return false;
    }
    QByteArray bytes = QByteArray::fromStdString(content);
    if (file.write(bytes) != bytes.size()) {
        std::string message = "Short write to " + filename;
        LOG_ERROR(message);
        emit exportError(message);
        return false;
    }

    LOG_INFO("Wrote " + filename);
    emit exportComplete(filename);
    return true;
}

std::string ExportManager::mermaidNodeId(const std::string& path) {
    std::string id;
    for (char c : path) {
        id += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    return id;
}

std::string ExportManager::formatInterval(const Endpoint& endpoint) {
    if (!endpoint.intervalText.empty()) {
        return endpoint.intervalText;
    }
    if (endpoint.intervalUs % 1000 == 0) {
        return std::to_string(endpoint.intervalUs / 1000) + "ms";
    }
    return std::to_string(endpoint.intervalUs) + "us";
}

}
