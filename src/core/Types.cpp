#include <usbbw/Types.hpp>
#include <usbbw/Constants.hpp>
#include <vector>

namespace usbbw {

namespace {

std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string capitalized(std::string s) {
    if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') {
        s[0] = static_cast<char>(s[0] - 'a' + 'A');
    }
    return s;
}

} // namespace

std::string PhysicalLocation::display() const {
    std::vector<std::string> parts;
    for (const auto* part : {&panel, &verticalPosition, &horizontalPosition}) {
        if (!part->empty() && *part != "unknown") {
            parts.push_back(*part);
        }
    }

    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) result += " ";
        result += capitalized(part);
    }
    return result;
}

std::optional<Speed> speedFromMbps(const std::string& mbps) {
    std::string value = trimmed(mbps);
    if (value == "1.5" || value == "1" || value == "2") return Speed::Low;
    if (value == "12") return Speed::Full;
    if (value == "480") return Speed::High;
    if (value == "5000") return Speed::Super;
    if (value == "10000") return Speed::SuperPlus;
    if (value == "20000") return Speed::SuperPlus2;
    return std::nullopt;
}

uint64_t rawLinkRateBps(Speed speed) {
    switch (speed) {
        case Speed::Low:        return 1500000ULL;
        case Speed::Full:       return 12000000ULL;
        case Speed::High:       return USB2_LINK_RATE_BPS;
        case Speed::Super:      return 5000000000ULL;
        case Speed::SuperPlus:  return 10000000000ULL;
        case Speed::SuperPlus2: return 20000000000ULL;
    }
    return 0;
}

bool isSuperSpeed(Speed speed) {
    return speed == Speed::Super ||
           speed == Speed::SuperPlus ||
           speed == Speed::SuperPlus2;
}

PoolClass poolClassFor(Speed speed) {
    return isSuperSpeed(speed) ? PoolClass::Usb3 : PoolClass::Usb2;
}

const char* speedShortName(Speed speed) {
    switch (speed) {
        case Speed::Low:        return "1.5M";
        case Speed::Full:       return "12M";
        case Speed::High:       return "480M";
        case Speed::Super:      return "5G";
        case Speed::SuperPlus:  return "10G";
        case Speed::SuperPlus2: return "20G";
    }
    return "?";
}

std::string speedName(Speed speed) {
    switch (speed) {
        case Speed::Low:        return "Low Speed (1.5 Mbps)";
        case Speed::Full:       return "Full Speed (12 Mbps)";
        case Speed::High:       return "High Speed (480 Mbps)";
        case Speed::Super:      return "SuperSpeed (5 Gbps)";
        case Speed::SuperPlus:  return "SuperSpeed+ (10 Gbps)";
        case Speed::SuperPlus2: return "SuperSpeed+ 2x2 (20 Gbps)";
    }
    return "Unknown";
}

std::optional<TransferType> transferTypeFromSysfs(const std::string& word) {
    std::string value = trimmed(word);
    if (value == "Control") return TransferType::Control;
    if (value == "Bulk") return TransferType::Bulk;
    if (value == "Interrupt") return TransferType::Interrupt;
    if (value == "Isoc" || value == "Isochronous") return TransferType::Isochronous;
    return std::nullopt;
}

std::optional<Direction> directionFromSysfs(const std::string& word) {
    std::string value = trimmed(word);
    if (value == "in") return Direction::In;
    if (value == "out") return Direction::Out;
    return std::nullopt;
}

const char* transferTypeName(TransferType type) {
    switch (type) {
        case TransferType::Control:     return "Control";
        case TransferType::Bulk:        return "Bulk";
        case TransferType::Interrupt:   return "Interrupt";
        case TransferType::Isochronous: return "Isochronous";
    }
    return "Unknown";
}

const char* directionName(Direction direction) {
    return direction == Direction::In ? "IN" : "OUT";
}

const char* poolClassName(PoolClass pool) {
    return pool == PoolClass::Usb3 ? "USB 3.x" : "USB 2.0";
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidEndpoint:  return "InvalidEndpoint";
        case ErrorCode::MalformedDevice:  return "MalformedDevice";
        case ErrorCode::InvalidPath:      return "InvalidPath";
        case ErrorCode::OrphanedDevice:   return "OrphanedDevice";
        case ErrorCode::ConfigCycle:      return "ConfigCycle";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::ConfigNotFound:   return "ConfigNotFound";
        case ErrorCode::SourceError:      return "SourceError";
    }
    return "Unknown";
}

}
