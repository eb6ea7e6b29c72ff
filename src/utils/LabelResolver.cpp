#include "LabelResolver.hpp"
#include <cctype>
#include <utility>
#include <vector>

namespace usbbw {

namespace {

std::string capitalize(const std::string& word) {
    std::string result = word;
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string mapped(const std::map<std::string, std::string>& table, const std::string& word) {
    auto it = table.find(word);
    return it != table.end() ? it->second : word;
}

}

LabelResolver::LabelResolver(LabelConfig config)
    : config_(std::move(config)) {
}

std::optional<ResolvedLabel> LabelResolver::configuredDeviceLabel(const Device& device) const {
    const auto& products = config_.products;

    if (device.serial) {
        auto it = products.find(device.vidPid() + ":" + *device.serial);
        if (it != products.end()) {
            return ResolvedLabel{it->second, LabelSource::SerialProduct};
        }
    }

    auto it = products.find(device.vidPid());
    if (it != products.end()) {
        return ResolvedLabel{it->second, LabelSource::Product};
    }

    if (device.physicalLocation) {
        for (const auto& rule : config_.physicalPorts) {
            if (rule.matches(*device.physicalLocation)) {
                return ResolvedLabel{rule.label, LabelSource::PhysicalPort};
            }
        }
    }

    auto byPath = config_.devices.find(device.path.toString());
    if (byPath != config_.devices.end()) {
        return ResolvedLabel{byPath->second, LabelSource::DevicePath};
    }

    return std::nullopt;
}

ResolvedLabel LabelResolver::deviceLabel(const Device& device) const {
    if (auto label = configuredDeviceLabel(device)) {
        return *label;
    }

    if (device.product && !device.product->empty()) {
        return {*device.product, LabelSource::Auto};
    }
    if (device.manufacturer && !device.manufacturer->empty()) {
        return {*device.manufacturer, LabelSource::Auto};
    }
    if (device.physicalLocation) {
        if (auto port = autoPortLabel(*device.physicalLocation)) {
            return {*port, LabelSource::Auto};
        }
    }
    return {device.vidPid(), LabelSource::Auto};
}

std::string LabelResolver::busLabel(const Bus& bus) const {
    auto it = config_.buses.find(std::to_string(bus.number));
    if (it != config_.buses.end()) {
        return it->second;
    }
    return "Bus " + std::to_string(bus.number);
}

std::string LabelResolver::controllerLabel(const Controller& controller) const {
    if (!controller.pciAddress.empty()) {
        auto it = config_.controllers.find(controller.pciAddress);
        if (it != config_.controllers.end()) {
            return it->second;
        }
    }
    auto it = config_.controllers.find(controller.id);
    if (it != config_.controllers.end()) {
        return it->second;
    }
    return "USB Controller";
}

std::optional<std::string> LabelResolver::autoPortLabel(const PhysicalLocation& location) const {
    if (!location.isSpecific()) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    if (!location.panel.empty() && location.panel != "unknown") {
        parts.push_back(capitalize(mapped(config_.positionLabels.panel, location.panel)));
    }
    if (!location.verticalPosition.empty() && location.verticalPosition != "unknown") {
        parts.push_back(capitalize(mapped(config_.positionLabels.vertical,
                                          location.verticalPosition)));
    }

    std::string label;
    for (const auto& part : parts) {
        label += part + " ";
    }
    return label + "USB Port";
}

std::map<std::string, ResolvedLabel> LabelResolver::resolveAll(const Topology& topology) const {
    std::map<std::string, ResolvedLabel> labels;
    for (const auto& device : topology.devices()) {
        labels.emplace(device.path.toString(), deviceLabel(device));
    }
    return labels;
}

const char* labelSourceName(LabelSource source) {
    switch (source) {
    case LabelSource::SerialProduct: return "product+serial";
    case LabelSource::Product: return "product";
    case LabelSource::PhysicalPort: return "physical port";
    case LabelSource::DevicePath: return "device path";
    case LabelSource::Auto: return "auto";
    }
    return "unknown";
}

}
