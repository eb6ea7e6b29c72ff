#pragma once
#include "AttributeSource.hpp"
#include "Topology.hpp"
#include <usbbw/Types.hpp>
#include <string>
#include <vector>

namespace usbbw {

struct TopologyWarning {
    ErrorCode code;
    std::string path;     // device path or bus name the warning is about
    std::string message;
};

struct BuildResult {
    Topology topology;
    std::vector<TopologyWarning> warnings;
};

// Turns raw attribute records into a validated Topology. Devices that fail
// validation are left out and reported as warnings; their descendants move
// up to the nearest surviving ancestor. The build itself never fails.
class TopologyBuilder {
public:
    static BuildResult build(const RawTopology& raw);

    // Exposed for sources and tests; all throw UsbError.
    static Device parseDevice(const RawDevice& raw);
    static Endpoint parseEndpoint(const RawEndpoint& raw, Speed deviceSpeed);
    static bool parseConfigured(const std::optional<std::string>& bConfigurationValue);
    static std::optional<uint16_t> parseMaxPower(const std::optional<std::string>& bMaxPower);
};

}
