// tests/test_LibusbAttributeSource.cpp
#include <gtest/gtest.h>
#include "LibusbAttributeSource.hpp"
#include "TopologyBuilder.hpp"
#include <libusb.h>

namespace usbbw {
namespace testing {

// Whatever the machine has attached: a readable tree in sysfs conventions,
// or a SourceError when libusb cannot enumerate (containers, no usbfs).
TEST(LibusbAttributeSourceTest, ReadsHostTreeOrReportsSourceError) {
    LibusbAttributeSource source;
    EXPECT_EQ(source.name(), "libusb");

    RawTopology raw;
    try {
        raw = source.read();
    } catch (const UsbError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SourceError);
        return;
    }

    for (const auto& device : raw.devices) {
        EXPECT_NE(device.name.find('-'), std::string::npos) << device.name;
        for (const auto& ep : device.endpoints) {
            EXPECT_NE(ep.name, "ep_00");
        }
    }
    BuildResult built = TopologyBuilder::build(raw);
    EXPECT_EQ(built.topology.buses().size(), raw.buses.size());
}

TEST(LibusbSpeedTest, SpeedsRenderedInSysfsUnits) {
    EXPECT_EQ(LibusbAttributeSource::speedText(LIBUSB_SPEED_LOW), std::optional<std::string>("1.5"));
    EXPECT_EQ(LibusbAttributeSource::speedText(LIBUSB_SPEED_HIGH), std::optional<std::string>("480"));
    EXPECT_EQ(LibusbAttributeSource::speedText(LIBUSB_SPEED_SUPER_PLUS),
              std::optional<std::string>("10000"));
    EXPECT_FALSE(LibusbAttributeSource::speedText(LIBUSB_SPEED_UNKNOWN).has_value());
}

#if defined(LIBUSB_API_VERSION) && LIBUSB_API_VERSION >= 0x0100010A
TEST(LibusbSpeedTest, TwentyGigabitLandsInUsb3Pool) {
    auto text = LibusbAttributeSource::speedText(LIBUSB_SPEED_SUPER_PLUS_X2);
    ASSERT_EQ(text, std::optional<std::string>("20000"));
    auto speed = speedFromMbps(*text);
    ASSERT_EQ(speed, std::optional<Speed>(Speed::SuperPlus2));
    EXPECT_EQ(poolClassFor(*speed), PoolClass::Usb3);
}
#endif

} // namespace testing
} // namespace usbbw
