// tests/test_TopologyBuilder.cpp
#include <gtest/gtest.h>
#include "TopologyBuilder.hpp"
#include "TestHelpers.hpp"
#include <algorithm>
#include <utility>

namespace usbbw {
namespace testing {

namespace {

const TopologyWarning* findWarning(const BuildResult& result, const std::string& path) {
    auto it = std::find_if(result.warnings.begin(), result.warnings.end(),
                           [&path](const TopologyWarning& w) { return w.path == path; });
    return it != result.warnings.end() ? &*it : nullptr;
}

}

class TopologyBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        raw.buses = {rawBus(1)};
    }

    RawTopology raw;
};

TEST_F(TopologyBuilderTest, MissingVendorIdRejectsOnlyThatDevice) {
    RawDevice broken = rawDevice("1-2");
    broken.idVendor.reset();
    raw.devices = {rawDevice("1-1"), broken, rawDevice("1-3")};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_EQ(result.topology.deviceCount(), 2u);
    EXPECT_EQ(result.topology.findDevice("1-2"), nullptr);

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, ErrorCode::MalformedDevice);
    EXPECT_EQ(result.warnings[0].path, "1-2");
}

TEST_F(TopologyBuilderTest, InvalidHexIdIsMalformed) {
    raw.devices = {rawDevice("1-1", "zzzz"), rawDevice("1-2", "046d", "1ffff")};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_TRUE(result.topology.devices().empty());
    ASSERT_EQ(result.warnings.size(), 2u);
    for (const auto& warning : result.warnings) {
        EXPECT_EQ(warning.code, ErrorCode::MalformedDevice);
    }
}

TEST_F(TopologyBuilderTest, ConfigurationValueDecidesConfigured) {
    EXPECT_FALSE(TopologyBuilder::parseConfigured(std::nullopt));
    EXPECT_FALSE(TopologyBuilder::parseConfigured(std::string("")));
    EXPECT_FALSE(TopologyBuilder::parseConfigured(std::string("0")));
    EXPECT_FALSE(TopologyBuilder::parseConfigured(std::string("junk")));
    EXPECT_TRUE(TopologyBuilder::parseConfigured(std::string("1")));
    EXPECT_TRUE(TopologyBuilder::parseConfigured(std::string("2\n")));
}

TEST_F(TopologyBuilderTest, UnconfiguredDeviceCarriesNoEndpoints) {
    RawDevice device = rawDevice("1-1");
    device.bConfigurationValue.reset();
    device.endpoints = {hsInterrupt64()};
    raw.devices = {device};

    BuildResult result = TopologyBuilder::build(raw);
    const Device* parsed = result.topology.findDevice("1-1");
    ASSERT_NE(parsed, nullptr);
    EXPECT_FALSE(parsed->configured);
    EXPECT_TRUE(parsed->endpoints.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(TopologyBuilderTest, ZeroIntervalEndpointRejectsDevice) {
    RawDevice device = rawDevice("1-1");
    device.endpoints = {rawEndpoint("81", "Interrupt", "00", "0008")};
    raw.devices = {device};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_EQ(result.topology.findDevice("1-1"), nullptr);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, ErrorCode::InvalidEndpoint);
    EXPECT_NE(result.warnings[0].message.find("1-1"), std::string::npos);
}

TEST_F(TopologyBuilderTest, UnknownTransferTypeRejectsDevice) {
    RawDevice device = rawDevice("1-1");
    device.endpoints = {rawEndpoint("81", "Sideways", "04", "0040")};
    raw.devices = {device};

    BuildResult result = TopologyBuilder::build(raw);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, ErrorCode::InvalidEndpoint);
}

TEST_F(TopologyBuilderTest, EndpointsDecodedAgainstDeviceSpeed) {
    RawDevice full = rawDevice("1-1", "046d", "c077", "12");
    full.endpoints = {rawEndpoint("81", "Interrupt", "0a", "0008")};
    RawDevice high = rawDevice("1-2");
    high.endpoints = {hsInterrupt64(), rawEndpoint("02", "Bulk", "00", "0200")};
    raw.devices = {full, high};

    BuildResult result = TopologyBuilder::build(raw);
    ASSERT_TRUE(result.warnings.empty());

    const Device* mouse = result.topology.findDevice("1-1");
    ASSERT_NE(mouse, nullptr);
    ASSERT_EQ(mouse->endpoints.size(), 1u);
    EXPECT_EQ(mouse->endpoints[0].intervalUs, 10000u);
    EXPECT_EQ(mouse->periodicBandwidthBps(), 6400u);

    const Device* disk = result.topology.findDevice("1-2");
    ASSERT_NE(disk, nullptr);
    EXPECT_EQ(disk->endpoints.size(), 2u);
    EXPECT_EQ(disk->periodicEndpoints().size(), 1u);
    EXPECT_EQ(disk->periodicBandwidthBps(), 512000u);
}

TEST_F(TopologyBuilderTest, InvalidPathIsReported) {
    raw.devices = {rawDevice("1-1"), rawDevice("usb-x")};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_EQ(result.topology.deviceCount(), 1u);
    const auto* warning = findWarning(result, "usb-x");
    ASSERT_NE(warning, nullptr);
    EXPECT_EQ(warning->code, ErrorCode::InvalidPath);
}

TEST_F(TopologyBuilderTest, OrphansAttachToNearestAncestor) {
    // 1-3 missing, so 1-3.1 hangs off the root hub; bus 9 does not exist
    raw.devices = {rawDevice("1-1"), rawHub("1-3.1"), rawDevice("1-3.1.2"),
                   rawDevice("9-1")};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_EQ(result.topology.deviceCount(), 3u);
    ASSERT_EQ(result.warnings.size(), 2u);
    for (const auto& warning : result.warnings) {
        EXPECT_EQ(warning.code, ErrorCode::OrphanedDevice);
    }
    EXPECT_NE(findWarning(result, "1-3.1"), nullptr);
    EXPECT_NE(findWarning(result, "9-1"), nullptr);
    EXPECT_EQ(result.topology.findDevice("9-1"), nullptr);

    const Bus* bus = result.topology.bus(1);
    ASSERT_EQ(bus->rootDevices.size(), 2u);
    const Device& adopted = result.topology.device(bus->rootDevices[1]);
    EXPECT_EQ(adopted.path.toString(), "1-3.1");
    EXPECT_FALSE(adopted.parent.has_value());
    ASSERT_EQ(adopted.children.size(), 1u);
    EXPECT_EQ(result.topology.device(adopted.children[0]).path.toString(), "1-3.1.2");
}

TEST_F(TopologyBuilderTest, RejectedHubKeepsDownstreamBandwidth) {
    RawDevice hub = rawHub("1-1");
    hub.endpoints = {rawEndpoint("81", "Interrupt", "00", "0001")};
    RawDevice innerHub = rawHub("1-1.3");
    RawDevice camera = rawDevice("1-1.2", "046d", "0825");
    camera.endpoints = {hsIsocHighBandwidth()};
    RawDevice keyboard = rawDevice("1-1.3.1");
    keyboard.endpoints = {hsInterrupt64()};
    raw.devices = {hub, camera, innerHub, keyboard};

    BuildResult result = TopologyBuilder::build(raw);
    EXPECT_EQ(result.topology.findDevice("1-1"), nullptr);
    ASSERT_EQ(result.topology.deviceCount(), 3u);

    ASSERT_EQ(result.warnings.size(), 3u);
    for (const auto& [path, code] : {std::make_pair("1-1", ErrorCode::InvalidEndpoint),
                                     std::make_pair("1-1.2", ErrorCode::OrphanedDevice),
                                     std::make_pair("1-1.3", ErrorCode::OrphanedDevice)}) {
        const auto* warning = findWarning(result, path);
        ASSERT_NE(warning, nullptr) << path;
        EXPECT_EQ(warning->code, code);
    }
    EXPECT_EQ(findWarning(result, "1-1.3.1"), nullptr);

    EXPECT_EQ(result.topology.devicesInTreeOrder(1).size(), 3u);
    EXPECT_EQ(result.topology.periodicBandwidthBps(1), 196608000u + 512000u);
}

TEST_F(TopologyBuilderTest, DuplicatePathsKeepTheFirst) {
    raw.devices = {rawDevice("1-1", "1111", "2222"), rawDevice("1-1", "3333", "4444")};

    BuildResult result = TopologyBuilder::build(raw);
    ASSERT_EQ(result.topology.deviceCount(), 1u);
    EXPECT_EQ(result.topology.findDevice("1-1")->vendorId, 0x1111);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(TopologyBuilderTest, ControllersGroupedByPciAddress) {
    raw.buses = {rawBus(1, "480", std::string("0000:00:14.0")),
                 rawBus(2, "5000", std::string("0000:00:14.0")),
                 rawBus(3, "480"), rawBus(4, "10000")};

    BuildResult result = TopologyBuilder::build(raw);
    const auto& controllers = result.topology.controllers();
    ASSERT_EQ(controllers.size(), 2u);

    const Controller* pci = result.topology.controllerForBus(2);
    ASSERT_NE(pci, nullptr);
    EXPECT_EQ(pci->pciAddress, "0000:00:14.0");
    EXPECT_EQ(pci->usb2Bus, std::optional<uint8_t>(1));
    EXPECT_EQ(pci->usb3Bus, std::optional<uint8_t>(2));

    const Controller* paired = result.topology.controllerForBus(4);
    ASSERT_NE(paired, nullptr);
    EXPECT_EQ(paired->id, "bus3");
    EXPECT_TRUE(paired->pciAddress.empty());
    EXPECT_EQ(paired->usb2Bus, std::optional<uint8_t>(3));
    EXPECT_EQ(paired->usb3Bus, std::optional<uint8_t>(4));
}

TEST_F(TopologyBuilderTest, BusesSortedWithInitialPools) {
    raw.buses = {rawBus(2, "5000"), rawBus(1), rawBus(0)};

    BuildResult result = TopologyBuilder::build(raw);
    ASSERT_EQ(result.topology.buses().size(), 2u);
    EXPECT_EQ(result.topology.buses()[0].number, 1);
    EXPECT_EQ(result.topology.buses()[1].pool.capacityBps, 4000000000u);
    EXPECT_EQ(result.topology.buses()[1].pool.usedBps, 0u);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(TopologyBuilderTest, UnknownSpeedFallsBackToFull) {
    RawDevice device = rawDevice("1-1", "046d", "c52b", "7");
    raw.devices = {device};

    BuildResult result = TopologyBuilder::build(raw);
    ASSERT_NE(result.topology.findDevice("1-1"), nullptr);
    EXPECT_EQ(result.topology.findDevice("1-1")->speed, Speed::Full);
}

TEST_F(TopologyBuilderTest, DeviceDetails) {
    RawDevice hub = rawHub("1-1", 7);
    hub.bMaxPower = "0mA";
    RawDevice device = rawDevice("1-1.4");
    device.serial = std::string("  SN42\n");
    device.manufacturer = std::string("");
    device.bMaxPower = std::string("500mA");
    device.bNumInterfaces = std::string(" 2");
    device.version = std::string(" 2.00");
    PhysicalLocation location;
    location.panel = "left";
    location.verticalPosition = "upper";
    device.physicalLocation = location;
    raw.devices = {hub, device};

    BuildResult result = TopologyBuilder::build(raw);
    const Device* parsedHub = result.topology.findDevice("1-1");
    ASSERT_NE(parsedHub, nullptr);
    EXPECT_TRUE(parsedHub->isHub);
    EXPECT_EQ(parsedHub->numPorts, std::optional<uint8_t>(7));
    EXPECT_EQ(parsedHub->maxPowerMa, std::optional<uint16_t>(0));

    const Device* parsed = result.topology.findDevice("1-1.4");
    ASSERT_NE(parsed, nullptr);
    EXPECT_EQ(parsed->serial, std::optional<std::string>("SN42"));
    EXPECT_FALSE(parsed->manufacturer.has_value());
    EXPECT_EQ(parsed->maxPowerMa, std::optional<uint16_t>(500));
    EXPECT_EQ(parsed->numInterfaces, 2);
    EXPECT_EQ(parsed->usbVersion, "2.00");
    ASSERT_TRUE(parsed->physicalLocation.has_value());
    EXPECT_EQ(parsed->physicalLocation->panel, "left");
}

TEST(MaxPowerTest, Parsing) {
    EXPECT_EQ(TopologyBuilder::parseMaxPower(std::string("500mA")), std::optional<uint16_t>(500));
    EXPECT_EQ(TopologyBuilder::parseMaxPower(std::string("100")), std::optional<uint16_t>(100));
    EXPECT_FALSE(TopologyBuilder::parseMaxPower(std::string("lots")).has_value());
    EXPECT_FALSE(TopologyBuilder::parseMaxPower(std::nullopt).has_value());
}

} // namespace testing
} // namespace usbbw
