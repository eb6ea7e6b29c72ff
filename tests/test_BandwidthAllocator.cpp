// tests/test_BandwidthAllocator.cpp
#include <gtest/gtest.h>
#include "BandwidthAllocator.hpp"
#include "TestHelpers.hpp"

namespace usbbw {
namespace testing {

class BandwidthAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Bus 1: a hub chain three levels deep. Bus 2: its SuperSpeed sibling.
        // Bus 3: idle. Bus 5: two high-bandwidth isochronous cameras.
        raw.buses = {rawBus(1), rawBus(2, "5000"), rawBus(3), rawBus(5)};

        RawDevice keyboard = rawDevice("1-1.1");
        keyboard.endpoints = {hsInterrupt64()};
        RawDevice mouse = rawDevice("1-1.2.3", "046d", "c077", "12");
        mouse.endpoints = {rawEndpoint("81", "Interrupt", "0a", "0008")};
        RawDevice disk = rawDevice("2-1", "0bda", "9210", "5000");
        disk.endpoints = {rawEndpoint("81", "Bulk", "00", "0400"),
                          rawEndpoint("02", "Bulk", "00", "0400")};
        RawDevice cam1 = rawDevice("5-1");
        cam1.endpoints = {hsIsocHighBandwidth()};
        RawDevice cam2 = rawDevice("5-2");
        cam2.endpoints = {hsIsocHighBandwidth()};

        raw.devices = {rawHub("1-1"), keyboard, rawHub("1-1.2"), mouse, disk, cam1, cam2};
        topology = BandwidthAllocator::allocate(buildTopology(raw));
    }

    RawTopology raw;
    Topology topology;
};

TEST_F(BandwidthAllocatorTest, UsedIsSumOverWholeTree) {
    const Bus* bus = topology.bus(1);
    ASSERT_NE(bus, nullptr);
    EXPECT_EQ(bus->pool.usedBps, 512000u + 6400u);
    EXPECT_EQ(bus->pool.usedBps, topology.periodicBandwidthBps(1));
    EXPECT_EQ(bus->pool.capacityBps, 384000000u);
}

TEST_F(BandwidthAllocatorTest, BulkOnlyBusUsesNothing) {
    const Bus* bus = topology.bus(2);
    ASSERT_NE(bus, nullptr);
    EXPECT_EQ(bus->pool.usedBps, 0u);
    EXPECT_EQ(bus->pool.capacityBps, 4000000000u);
    EXPECT_EQ(bus->pool.poolClass, PoolClass::Usb3);
}

TEST_F(BandwidthAllocatorTest, OverSubscriptionKeepsTrueSum) {
    const Bus* bus = topology.bus(5);
    ASSERT_NE(bus, nullptr);
    EXPECT_EQ(bus->pool.usedBps, 2u * 196608000u);
    EXPECT_TRUE(bus->pool.isOverSubscribed());
    EXPECT_EQ(bus->pool.availableBps(), 0u);
    EXPECT_EQ(BandwidthAllocator::overSubscribedBuses(topology), (std::vector<uint8_t>{5}));
}

TEST_F(BandwidthAllocatorTest, AllocationIsIdempotent) {
    Topology again = BandwidthAllocator::allocate(topology);
    ASSERT_EQ(again.buses().size(), topology.buses().size());
    for (size_t i = 0; i < topology.buses().size(); ++i) {
        EXPECT_EQ(again.buses()[i].pool, topology.buses()[i].pool);
    }
}

TEST_F(BandwidthAllocatorTest, InputIsUntouched) {
    Topology built = buildTopology(raw);
    Topology allocated = BandwidthAllocator::allocate(built);
    EXPECT_EQ(built.bus(1)->pool.usedBps, 0u);
    EXPECT_EQ(allocated.bus(1)->pool.usedBps, 518400u);
}

TEST_F(BandwidthAllocatorTest, Usb3PoolIndependentOfUsb2Sibling) {
    RawTopology busy = raw;
    for (int port = 2; port <= 4; ++port) {
        RawDevice cam = rawDevice("1-" + std::to_string(port));
        cam.endpoints = {hsIsocHighBandwidth()};
        busy.devices.push_back(cam);
    }
    Topology loaded = BandwidthAllocator::allocate(buildTopology(busy));
    EXPECT_TRUE(loaded.bus(1)->pool.isOverSubscribed());
    EXPECT_EQ(loaded.bus(2)->pool, topology.bus(2)->pool);
}

TEST_F(BandwidthAllocatorTest, BestBusesSortedByAvailability) {
    auto best = BandwidthAllocator::bestBusesFor(topology, 0, Speed::High);
    ASSERT_EQ(best.size(), 3u);
    EXPECT_EQ(best[0].bus, 3);
    EXPECT_EQ(best[0].availableBps, 384000000u);
    EXPECT_EQ(best[1].bus, 1);
    EXPECT_EQ(best[1].availableBps, 384000000u - 518400u);
    EXPECT_EQ(best[2].bus, 5);
    EXPECT_EQ(best[2].availableBps, 0u);
}

TEST_F(BandwidthAllocatorTest, BestBusesFilterByRequirementAndClass) {
    auto best = BandwidthAllocator::bestBusesFor(topology, 100000000u, Speed::Full);
    ASSERT_EQ(best.size(), 2u);
    EXPECT_EQ(best[0].bus, 3);
    EXPECT_EQ(best[1].bus, 1);

    auto superSpeed = BandwidthAllocator::bestBusesFor(topology, 0, Speed::SuperPlus);
    ASSERT_EQ(superSpeed.size(), 1u);
    EXPECT_EQ(superSpeed[0].bus, 2);

    EXPECT_TRUE(BandwidthAllocator::bestBusesFor(topology, 5000000000ULL, Speed::Super).empty());
}

TEST(BandwidthAllocatorTieTest, TiesBrokenByBusNumber) {
    RawTopology raw;
    raw.buses = {rawBus(7), rawBus(3), rawBus(5)};
    Topology topology = BandwidthAllocator::allocate(buildTopology(raw));

    auto best = BandwidthAllocator::bestBusesFor(topology, 0, Speed::High);
    ASSERT_EQ(best.size(), 3u);
    EXPECT_EQ(best[0].bus, 3);
    EXPECT_EQ(best[1].bus, 5);
    EXPECT_EQ(best[2].bus, 7);
}

TEST(BandwidthAllocatorSpeedTest, FullSpeedBusNotOfferedForHighSpeedDevice) {
    RawTopology raw;
    raw.buses = {rawBus(1), rawBus(3, "12")};
    RawDevice keyboard = rawDevice("3-1", "046d", "c31c", "12");
    keyboard.endpoints = {rawEndpoint("81", "Interrupt", "0a", "0008")};
    raw.devices = {keyboard};
    Topology topology = BandwidthAllocator::allocate(buildTopology(raw));

    const Bus* companion = topology.bus(3);
    ASSERT_NE(companion, nullptr);
    EXPECT_EQ(companion->pool.capacityBps, 10800000u);
    EXPECT_EQ(companion->pool.availableBps(), 10800000u - 6400u);

    auto highSpeed = BandwidthAllocator::bestBusesFor(topology, 100000000u, Speed::High);
    ASSERT_EQ(highSpeed.size(), 1u);
    EXPECT_EQ(highSpeed[0].bus, 1);
    EXPECT_EQ(highSpeed[0].availableBps, 384000000u);

    EXPECT_EQ(BandwidthAllocator::bestBusesFor(topology, 0, Speed::High).size(), 1u);

    auto fullSpeed = BandwidthAllocator::bestBusesFor(topology, 0, Speed::Full);
    ASSERT_EQ(fullSpeed.size(), 2u);
    EXPECT_EQ(fullSpeed[0].bus, 1);
    EXPECT_EQ(fullSpeed[1].bus, 3);
}

TEST(BandwidthAllocatorEmptyTest, EmptyTopologyIsFine) {
    Topology topology = BandwidthAllocator::allocate(Topology());
    EXPECT_TRUE(topology.empty());
    EXPECT_TRUE(BandwidthAllocator::bestBusesFor(topology, 0, Speed::High).empty());
    EXPECT_TRUE(BandwidthAllocator::overSubscribedBuses(topology).empty());
}

} // namespace testing
} // namespace usbbw
