/**
 * @file test_snapshot_store.cpp
 * @brief Unit tests for snapshot construction and the bounded snapshot store
 */

#include <gtest/gtest.h>
#include <lanscope/core/snapshot_store.hpp>
#include <lanscope/utils/uuid.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace lanscope::core;
namespace fs = std::filesystem;

namespace {

DeviceSnapshot device(const std::string& address, std::set<uint16_t> ports = {},
                      bool online = true) {
    DeviceSnapshot d;
    d.address = address;
    d.hostname = "host-" + address;
    d.deviceType = "Outlet";
    d.openPorts = std::move(ports);
    d.online = online;
    return d;
}

Snapshot snapshotOf(std::vector<DeviceSnapshot> devices) {
    return makeSnapshot(std::move(devices), std::chrono::milliseconds(1500));
}

}  // namespace

// =============================================================================
// Snapshot construction
// =============================================================================

TEST(SnapshotTest, CountsAndOrdering) {
    Snapshot s = snapshotOf({device("10.0.0.9", {80}), device("10.0.0.1", {80, 443}, false)});

    EXPECT_TRUE(lanscope::utils::isValidUuid(s.id));
    EXPECT_EQ(s.deviceCount, 2u);
    EXPECT_EQ(s.onlineCount, 1u);
    EXPECT_EQ(s.openPortCount, 3u);
    EXPECT_EQ(s.duration.count(), 1500);
    ASSERT_EQ(s.devices.size(), 2u);
    EXPECT_EQ(s.devices[0].address, "10.0.0.1");
}

TEST(SnapshotTest, DuplicateAddressesKeepFirst) {
    auto first = device("10.0.0.1");
    first.hostname = "first";
    auto second = device("10.0.0.1");
    second.hostname = "second";

    Snapshot s = snapshotOf({first, second});
    ASSERT_EQ(s.devices.size(), 1u);
    EXPECT_EQ(s.devices[0].hostname, "first");
    EXPECT_EQ(s.deviceCount, 1u);
}

TEST(SnapshotTest, FindDeviceAndDisplayName) {
    auto unnamed = device("10.0.0.2");
    unnamed.hostname.clear();
    Snapshot s = snapshotOf({device("10.0.0.1"), unnamed});

    ASSERT_NE(s.findDevice("10.0.0.2"), nullptr);
    EXPECT_EQ(s.findDevice("10.0.0.2")->displayName(), "10.0.0.2");
    EXPECT_EQ(s.findDevice("10.0.0.1")->displayName(), "host-10.0.0.1");
    EXPECT_EQ(s.findDevice("10.0.0.3"), nullptr);
}

TEST(SnapshotTest, FromInventoryDevices) {
    InventoryDevice d;
    d.address = "10.0.0.5";
    d.macAddress = "aa:bb:cc:dd:ee:ff";
    d.rogue = true;
    d.openPorts = {80};

    Snapshot s = makeSnapshot(std::vector<InventoryDevice>{d}, std::chrono::milliseconds(10));
    ASSERT_EQ(s.devices.size(), 1u);
    EXPECT_EQ(s.devices[0].macAddress, "aa:bb:cc:dd:ee:ff");
    EXPECT_TRUE(s.devices[0].rogue);
}

// =============================================================================
// Store
// =============================================================================

class SnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::path(::testing::TempDir()) / ("lanscope-store-" + lanscope::utils::generateUuid());
        config.directory = dir.string();
        config.name = "history";
        config.capacity = 3;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    SnapshotStoreConfig config;
};

TEST_F(SnapshotStoreTest, ZeroCapacityIsRejected) {
    config.capacity = 0;
    EXPECT_THROW(SnapshotStore store(config), std::invalid_argument);
}

TEST_F(SnapshotStoreTest, ListIsNewestFirst) {
    SnapshotStore store(config);
    Snapshot a = snapshotOf({device("10.0.0.1")});
    Snapshot b = snapshotOf({device("10.0.0.2")});
    store.add(a);
    store.add(b);

    auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, b.id);
    EXPECT_EQ(all[1].id, a.id);
    EXPECT_EQ(store.latest()->id, b.id);
}

TEST_F(SnapshotStoreTest, OldestIsEvictedAtCapacity) {
    SnapshotStore store(config);
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        Snapshot s = snapshotOf({device("10.0.0." + std::to_string(i))});
        ids.push_back(s.id);
        store.add(s);
    }

    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(store.get(ids[0]).has_value());
    EXPECT_FALSE(store.get(ids[1]).has_value());
    EXPECT_TRUE(store.get(ids[2]).has_value());
    EXPECT_EQ(store.latest()->id, ids[4]);
}

TEST_F(SnapshotStoreTest, UnknownIdIsAbsent) {
    SnapshotStore store(config);
    EXPECT_FALSE(store.get("missing").has_value());
    EXPECT_FALSE(store.latest().has_value());
}

TEST_F(SnapshotStoreTest, HistorySurvivesReload) {
    Snapshot saved = snapshotOf({device("10.0.0.1", {80, 8080}), device("10.0.0.2", {}, false)});
    saved.devices[0].macAddress = "aa:bb:cc:00:11:22";
    saved.devices[1].rogue = true;
    {
        SnapshotStore store(config);
        store.add(saved);
    }
    EXPECT_TRUE(fs::exists(dir / "history.pb"));

    SnapshotStore reloaded(config);
    ASSERT_EQ(reloaded.size(), 1u);
    Snapshot loaded = *reloaded.latest();
    EXPECT_EQ(loaded.id, saved.id);
    EXPECT_EQ(toEpochMillis(loaded.createdAt), toEpochMillis(saved.createdAt));
    EXPECT_EQ(loaded.duration, saved.duration);
    EXPECT_EQ(loaded.onlineCount, 1u);
    EXPECT_EQ(loaded.openPortCount, 2u);
    ASSERT_EQ(loaded.devices.size(), 2u);
    EXPECT_EQ(loaded.devices[0].openPorts, (std::set<uint16_t>{80, 8080}));
    EXPECT_EQ(loaded.devices[0].macAddress, "aa:bb:cc:00:11:22");
    EXPECT_FALSE(loaded.devices[1].online);
    EXPECT_TRUE(loaded.devices[1].rogue);
}

TEST_F(SnapshotStoreTest, ReloadHonorsSmallerCapacity) {
    {
        SnapshotStore store(config);
        for (int i = 0; i < 3; ++i) {
            store.add(snapshotOf({device("10.0.0.1")}));
        }
    }
    config.capacity = 1;
    SnapshotStore reloaded(config);
    EXPECT_EQ(reloaded.size(), 1u);
}

TEST_F(SnapshotStoreTest, CorruptFileStartsEmpty) {
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "history.pb", std::ios::binary);
        out << "\xff\xff\xff not a protobuf";
    }
    SnapshotStore store(config);
    EXPECT_EQ(store.size(), 0u);

    store.add(snapshotOf({device("10.0.0.1")}));
    EXPECT_EQ(SnapshotStore(config).size(), 1u);
}

TEST_F(SnapshotStoreTest, ClearPersists) {
    {
        SnapshotStore store(config);
        store.add(snapshotOf({device("10.0.0.1")}));
        store.clear();
        EXPECT_EQ(store.size(), 0u);
    }
    EXPECT_EQ(SnapshotStore(config).size(), 0u);
}

TEST_F(SnapshotStoreTest, MemoryOnlyStoreWritesNothing) {
    config.persist = false;
    SnapshotStore store(config);
    store.add(snapshotOf({device("10.0.0.1")}));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(SnapshotStoreTest, RangeFiltersByCreationTime) {
    config.persist = false;
    SnapshotStore store(config);
    auto base = SystemClock::now();
    store.add(makeSnapshot(std::vector<DeviceSnapshot>{}, std::chrono::milliseconds(0),
                           base - std::chrono::hours(2)));
    store.add(makeSnapshot(std::vector<DeviceSnapshot>{}, std::chrono::milliseconds(0),
                           base - std::chrono::minutes(30)));
    store.add(makeSnapshot(std::vector<DeviceSnapshot>{}, std::chrono::milliseconds(0), base));

    auto recent = store.range(base - std::chrono::hours(1), base);
    EXPECT_EQ(recent.size(), 2u);
}
