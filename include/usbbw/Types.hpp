#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace usbbw {

enum class Speed {
    Low,        // 1.5 Mbps
    Full,       // 12 Mbps
    High,       // 480 Mbps
    Super,      // 5 Gbps
    SuperPlus,  // 10 Gbps
    SuperPlus2  // 20 Gbps
};

enum class PoolClass {
    Usb2,
    Usb3
};

enum class TransferType {
    Control,
    Bulk,
    Interrupt,
    Isochronous
};

enum class Direction {
    In,
    Out
};

enum class ErrorCode {
    InvalidEndpoint,
    MalformedDevice,
    InvalidPath,
    OrphanedDevice,
    ConfigCycle,
    ConfigParseError,
    ConfigNotFound,
    SourceError
};

// Thrown by constructors and parsers; callers that own a refresh turn it
// into a warning, callers that own config loading turn it into a ConfigError.
class UsbError : public std::runtime_error {
public:
    UsbError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

struct PhysicalLocation {
    std::string panel;              // left, right, back, front, top, bottom
    std::string horizontalPosition; // left, center, right
    std::string verticalPosition;   // upper, center, lower
    bool dock{false};
    bool lid{false};

    // center/center is what ACPI reports when it knows nothing useful
    bool isSpecific() const {
        if (horizontalPosition == "center" && verticalPosition == "center") {
            return false;
        }
        return !panel.empty() || !horizontalPosition.empty() || !verticalPosition.empty();
    }

    std::string display() const;
};

std::optional<Speed> speedFromMbps(const std::string& mbps);
uint64_t rawLinkRateBps(Speed speed);
bool isSuperSpeed(Speed speed);
PoolClass poolClassFor(Speed speed);
const char* speedShortName(Speed speed);
std::string speedName(Speed speed);

std::optional<TransferType> transferTypeFromSysfs(const std::string& word);
std::optional<Direction> directionFromSysfs(const std::string& word);
const char* transferTypeName(TransferType type);
const char* directionName(Direction direction);
const char* poolClassName(PoolClass pool);

const char* errorCodeName(ErrorCode code);

}
