#pragma once
#include "ConfigManager.hpp"
#include "Topology.hpp"
#include <map>
#include <optional>
#include <string>

namespace usbbw {

// Where a device label came from, highest priority first.
enum class LabelSource {
    SerialProduct,  // VID:PID:Serial
    Product,        // VID:PID
    PhysicalPort,
    DevicePath,
    Auto
};

struct ResolvedLabel {
    std::string text;
    LabelSource source{LabelSource::Auto};

    bool isConfigured() const { return source != LabelSource::Auto; }
};

class LabelResolver {
public:
    LabelResolver() = default;
    explicit LabelResolver(LabelConfig config);

    const LabelConfig& config() const { return config_; }

    // Steps 1-4 of the lookup chain; nullopt when nothing is configured.
    std::optional<ResolvedLabel> configuredDeviceLabel(const Device& device) const;
    // Full chain, never empty.
    ResolvedLabel deviceLabel(const Device& device) const;

    std::string busLabel(const Bus& bus) const;
    std::string controllerLabel(const Controller& controller) const;

    // "Left Rear USB Port" style name for a specific ACPI location
    std::optional<std::string> autoPortLabel(const PhysicalLocation& location) const;

    // Path -> label for every device of the topology
    std::map<std::string, ResolvedLabel> resolveAll(const Topology& topology) const;

private:
    LabelConfig config_;
};

const char* labelSourceName(LabelSource source);

}
