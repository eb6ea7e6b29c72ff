#pragma once
#include <cstdint>

namespace usbbw {

constexpr int MAX_PORTS = 255;
constexpr int MAX_BUSES = 255;
constexpr int MAX_INTERVAL_EXPONENT = 16;

constexpr uint64_t USB2_LINK_RATE_BPS = 480000000ULL;
constexpr uint64_t USB2_PERIODIC_CAPACITY_BPS = USB2_LINK_RATE_BPS * 80 / 100; // 384 Mbps
constexpr int USB3_PERIODIC_PERCENT = 80;
constexpr int FULL_SPEED_PERIODIC_PERCENT = 90;

constexpr double HIGH_USAGE_PERCENT = 80.0;
constexpr double CRITICAL_USAGE_PERCENT = 95.0;

constexpr int DEFAULT_REFRESH_MS = 1000;
constexpr int MICROFRAME_US = 125;

constexpr uint8_t HUB_DEVICE_CLASS = 0x09;

constexpr char SYSFS_USB_DEVICES[] = "/sys/bus/usb/devices";

}
