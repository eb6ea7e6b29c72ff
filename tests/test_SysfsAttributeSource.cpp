// tests/test_SysfsAttributeSource.cpp
#include <gtest/gtest.h>
#include "SysfsAttributeSource.hpp"
#include "BandwidthAllocator.hpp"
#include "TestHelpers.hpp"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <algorithm>
#include <map>

namespace usbbw {
namespace testing {

class SysfsAttributeSourceTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        ASSERT_TRUE(tmp.isValid());
        root = tmp.filePath("usb/devices");
        ASSERT_TRUE(QDir().mkpath(root));
    }

    void attributes(const QString& dir, const std::map<QString, QByteArray>& values) {
        QString path = root + "/" + dir;
        ASSERT_TRUE(QDir().mkpath(path));
        for (const auto& [name, value] : values) {
            QFile file(path + "/" + name);
            ASSERT_TRUE(file.open(QIODevice::WriteOnly));
            file.write(value + "\n");
        }
    }

    void endpoint(const QString& dir, const QByteArray& address, const QByteArray& type,
                  const QByteArray& direction, const QByteArray& bInterval,
                  const QByteArray& wMaxPacketSize) {
        attributes(dir, {{"bEndpointAddress", address}, {"type", type},
                         {"direction", direction}, {"bInterval", bInterval},
                         {"wMaxPacketSize", wMaxPacketSize}, {"interval", "1ms"}});
    }

    // A root hub, a keyboard with one interrupt endpoint and an
    // unconfigured webcam.
    void populate() {
        attributes("usb1", {{"speed", "480"}, {"version", " 2.00"}, {"maxchild", "12"},
                            {"idVendor", "1d6b"}, {"idProduct", "0002"}});
        attributes("1-0:1.0", {{"bInterfaceClass", "09"}});
        attributes("1-2", {{"idVendor", "046d"}, {"idProduct", "c31c"}, {"speed", "480"},
                           {"bConfigurationValue", "1"}, {"bMaxPower", "98mA"},
                           {"bDeviceClass", "00"}, {"bNumInterfaces", " 1"},
                           {"manufacturer", "Logitech"}, {"product", "Keyboard"},
                           {"version", " 2.00"}});
        endpoint("1-2/ep_00", "00", "Control", "both", "00", "0040");
        endpoint("1-2/1-2:1.0/ep_81", "81", "Interrupt", "in", "04", "0040");
        attributes("1-2/physical_location", {{"panel", "left"}, {"vertical_position", "upper"},
                                             {"horizontal_position", "left"}, {"dock", "no"},
                                             {"lid", "no"}});
        attributes("1-3", {{"idVendor", "0c45"}, {"idProduct", "6366"}, {"speed", "480"},
                           {"bConfigurationValue", ""}, {"bDeviceClass", "ef"}});
    }

    QTemporaryDir tmp;
    QString root;
};

TEST_F(SysfsAttributeSourceTest, ReadsBusesDevicesAndEndpoints) {
    populate();
    SysfsAttributeSource source(root.toStdString());
    RawTopology raw = source.read();

    ASSERT_EQ(raw.buses.size(), 1u);
    EXPECT_EQ(raw.buses[0].number, 1);
    EXPECT_EQ(raw.buses[0].speed, std::optional<std::string>("480"));
    EXPECT_EQ(raw.buses[0].maxchild, std::optional<std::string>("12"));
    EXPECT_FALSE(raw.buses[0].pciAddress.has_value());

    // interface directories are not devices
    ASSERT_EQ(raw.devices.size(), 2u);
    auto keyboard = std::find_if(raw.devices.begin(), raw.devices.end(),
                                 [](const RawDevice& d) { return d.name == "1-2"; });
    ASSERT_NE(keyboard, raw.devices.end());
    EXPECT_EQ(keyboard->idVendor, std::optional<std::string>("046d"));
    EXPECT_EQ(keyboard->product, std::optional<std::string>("Keyboard"));
    EXPECT_FALSE(keyboard->serial.has_value());

    // ep_00 is not listed
    ASSERT_EQ(keyboard->endpoints.size(), 1u);
    EXPECT_EQ(keyboard->endpoints[0].name, "ep_81");
    EXPECT_EQ(keyboard->endpoints[0].type, "Interrupt");
    EXPECT_EQ(keyboard->endpoints[0].interval, "1ms");

    ASSERT_TRUE(keyboard->physicalLocation.has_value());
    EXPECT_EQ(keyboard->physicalLocation->panel, "left");
    EXPECT_EQ(keyboard->physicalLocation->verticalPosition, "upper");
    EXPECT_FALSE(keyboard->physicalLocation->dock);
}

TEST_F(SysfsAttributeSourceTest, BuildsAllocatedTopology) {
    populate();
    SysfsAttributeSource source(root.toStdString());
    BuildResult built = TopologyBuilder::build(source.read());
    EXPECT_TRUE(built.warnings.empty());

    Topology topology = BandwidthAllocator::allocate(built.topology);
    EXPECT_EQ(topology.bus(1)->pool.usedBps, 512000u);
    EXPECT_EQ(topology.bus(1)->numPorts, 12);

    const Device* camera = topology.findDevice("1-3");
    ASSERT_NE(camera, nullptr);
    EXPECT_FALSE(camera->configured);

    const Device* keyboard = topology.findDevice("1-2");
    ASSERT_NE(keyboard, nullptr);
    EXPECT_EQ(keyboard->maxPowerMa, std::optional<uint16_t>(98));
    EXPECT_EQ(keyboard->endpoints[0].intervalText, "1ms");
}

TEST_F(SysfsAttributeSourceTest, ControllerFromSymlinkTarget) {
    QString target = tmp.filePath("devices/pci0000:00/0000:00:14.0/usb2");
    ASSERT_TRUE(QDir().mkpath(target));
    {
        QFile speed(target + "/speed");
        ASSERT_TRUE(speed.open(QIODevice::WriteOnly));
        speed.write("5000\n");
    }
    ASSERT_TRUE(QFile::link(target, root + "/usb2"));

    SysfsAttributeSource source(root.toStdString());
    RawTopology raw = source.read();
    ASSERT_EQ(raw.buses.size(), 1u);
    EXPECT_EQ(raw.buses[0].number, 2);
    EXPECT_EQ(raw.buses[0].speed, std::optional<std::string>("5000"));
    EXPECT_EQ(raw.buses[0].pciAddress, std::optional<std::string>("0000:00:14.0"));
}

TEST_F(SysfsAttributeSourceTest, MissingRootIsASourceError) {
    SysfsAttributeSource source(tmp.filePath("nowhere").toStdString());
    try {
        source.read();
        FAIL() << "expected SourceError";
    } catch (const UsbError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SourceError);
    }
}

TEST(PciAddressTest, TakenFromComponentBeforeUsbN) {
    EXPECT_EQ(SysfsAttributeSource::pciAddressFromLink(
                  "../../../devices/pci0000:00/0000:00:08.1/0000:c1:00.4/usb1"),
              std::optional<std::string>("0000:c1:00.4"));
    EXPECT_FALSE(SysfsAttributeSource::pciAddressFromLink(
                     "../../../devices/platform/dummy_hcd.0/usb3").has_value());
    EXPECT_FALSE(SysfsAttributeSource::pciAddressFromLink("usb1").has_value());
}

} // namespace testing
} // namespace usbbw
