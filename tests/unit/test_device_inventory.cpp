/**
 * @file test_device_inventory.cpp
 * @brief Unit tests for DeviceInventory and ARP table parsing
 */

#include <gtest/gtest.h>
#include <lanscope/core/device_inventory.hpp>

#include <cstdio>
#include <fstream>

using namespace lanscope::core;

namespace {

const char* kArpTable =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.20     0x1         0x2         AA:BB:CC:DD:EE:01     *        eth0\n"
    "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
    "192.168.1.1      0x1         0x2         10:20:30:40:50:60     *        eth0\n";

}  // namespace

TEST(ArpTableTest, ParsesCompleteEntriesOnly) {
    auto table = parseArpTable(kArpTable);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table["192.168.1.20"], "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(table["192.168.1.1"], "10:20:30:40:50:60");
    EXPECT_EQ(table.count("192.168.1.21"), 0u);
}

TEST(ArpTableTest, MissingFileIsEmpty) {
    EXPECT_TRUE(readArpTable("/nonexistent/lanscope/arp").empty());
}

TEST(ArpTableTest, ReadsFromFile) {
    std::string path = ::testing::TempDir() + "lanscope_arp_test";
    {
        std::ofstream out(path);
        out << kArpTable;
    }
    EXPECT_EQ(readArpTable(path).size(), 2u);
    std::remove(path.c_str());
}

class DeviceInventoryTest : public ::testing::Test {
protected:
    DeviceInventory inventory;
};

TEST_F(DeviceInventoryTest, ImportCreatesEachAddressOnce) {
    EXPECT_EQ(inventory.importAddresses({"10.0.0.1", "10.0.0.2"}), 2u);
    EXPECT_EQ(inventory.importAddresses({"10.0.0.2", "10.0.0.3"}), 1u);
    EXPECT_EQ(inventory.size(), 3u);
    EXPECT_EQ(inventory.addresses(),
              (std::vector<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"}));

    auto device = inventory.find("10.0.0.1");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->deviceType, "unknown");
    EXPECT_TRUE(device->online);
    EXPECT_FALSE(device->rogue);
    EXPECT_EQ(device->source, DeviceSource::Advertisement);
}

TEST_F(DeviceInventoryTest, SynthesizedEntryIsAppleIot) {
    EXPECT_TRUE(inventory.synthesize("10.0.0.9"));
    EXPECT_FALSE(inventory.synthesize("10.0.0.9"));

    auto device = inventory.find("10.0.0.9");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->manufacturer, "Apple");
    EXPECT_EQ(device->deviceType, "iot");
    EXPECT_EQ(device->source, DeviceSource::Tool);
}

TEST_F(DeviceInventoryTest, SynthesizeKeepsExistingEntry) {
    inventory.importAddresses({"10.0.0.1"});
    EXPECT_FALSE(inventory.synthesize("10.0.0.1"));
    EXPECT_EQ(inventory.find("10.0.0.1")->deviceType, "unknown");
}

TEST_F(DeviceInventoryTest, OpenPortsApplyToKnownDevicesOnly) {
    inventory.importAddresses({"10.0.0.1"});
    inventory.updateOpenPorts({{"10.0.0.1", {80, 443}}, {"10.0.0.99", {22}}});

    EXPECT_EQ(inventory.find("10.0.0.1")->openPorts, (std::set<uint16_t>{80, 443}));
    EXPECT_FALSE(inventory.find("10.0.0.99").has_value());
}

TEST_F(DeviceInventoryTest, MergeMetadataKeepsExistingFieldsForEmptyValues) {
    inventory.importAddresses({"10.0.0.1"});
    ASSERT_TRUE(inventory.mergeMetadata("10.0.0.1", "Eve Energy", "Outlet", {{"md", "Eve"}}));
    ASSERT_TRUE(inventory.mergeMetadata("10.0.0.1", "", "", {{"ci", "7"}}));
    EXPECT_FALSE(inventory.mergeMetadata("10.0.0.2", "X", "Y", {}));

    auto device = inventory.find("10.0.0.1");
    EXPECT_EQ(device->hostname, "Eve Energy");
    EXPECT_EQ(device->deviceType, "Outlet");
    EXPECT_EQ(device->metadata.size(), 2u);
}

TEST_F(DeviceInventoryTest, HardwareAddressesFromArp) {
    inventory.importAddresses({"192.168.1.20", "192.168.1.50"});
    EXPECT_EQ(inventory.applyHardwareAddresses(parseArpTable(kArpTable)), 1u);
    EXPECT_EQ(inventory.find("192.168.1.20")->macAddress, "aa:bb:cc:dd:ee:01");
    EXPECT_TRUE(inventory.find("192.168.1.50")->macAddress.empty());
    EXPECT_EQ(inventory.applyHardwareAddresses(parseArpTable(kArpTable)), 0u);
}

TEST_F(DeviceInventoryTest, RefreshOnlineMarksUnseenOffline) {
    inventory.importAddresses({"10.0.0.1", "10.0.0.2"});
    inventory.refreshOnline({"10.0.0.2"});
    EXPECT_FALSE(inventory.find("10.0.0.1")->online);
    EXPECT_TRUE(inventory.find("10.0.0.2")->online);

    // Seen again in a later scan
    inventory.importAddresses({"10.0.0.1"});
    EXPECT_TRUE(inventory.find("10.0.0.1")->online);
}

TEST_F(DeviceInventoryTest, SetRogueRequiresKnownAddress) {
    inventory.importAddresses({"10.0.0.1"});
    EXPECT_TRUE(inventory.setRogue("10.0.0.1", true));
    EXPECT_TRUE(inventory.find("10.0.0.1")->rogue);
    EXPECT_TRUE(inventory.setRogue("10.0.0.1", false));
    EXPECT_FALSE(inventory.find("10.0.0.1")->rogue);
    EXPECT_FALSE(inventory.setRogue("10.0.0.2", true));
}

TEST_F(DeviceInventoryTest, ClearEmpties) {
    inventory.importAddresses({"10.0.0.1"});
    inventory.clear();
    EXPECT_EQ(inventory.size(), 0u);
    EXPECT_TRUE(inventory.devices().empty());
}
