/**
 * @file test_identity_resolver.cpp
 * @brief Unit tests for IdentityResolver merge rules and discovery history
 */

#include <gtest/gtest.h>
#include <lanscope/core/identity_resolver.hpp>

#include <atomic>
#include <thread>

using namespace lanscope::core;

class IdentityResolverTest : public ::testing::Test {
protected:
    IdentityResolver resolver;
};

TEST_F(IdentityResolverTest, FirstSightingCreatesRecordAndEvent) {
    auto decision = resolver.ingest("Eve Energy", ServiceCategory::Hap, std::string("10.0.0.5"));
    EXPECT_EQ(decision, MergeDecision::Created);

    auto record = resolver.find("Eve Energy");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->strong);
    EXPECT_EQ(record->address, "10.0.0.5");
    EXPECT_EQ(record->categoryLabel, std::string(categoryLabel(ServiceCategory::Hap)));

    auto events = resolver.history();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, DiscoveryEventKind::Discovered);
    EXPECT_EQ(events[0].deviceName, "Eve Energy");
}

TEST_F(IdentityResolverTest, RepeatedSightingIsIgnored) {
    resolver.ingest("Eve Energy", ServiceCategory::Hap, std::string("10.0.0.5"));
    EXPECT_EQ(resolver.ingest("Eve Energy", ServiceCategory::Hap, std::string("10.0.0.5")),
              MergeDecision::Ignored);
    EXPECT_EQ(resolver.size(), 1u);
    EXPECT_EQ(resolver.history().size(), 1u);
}

TEST_F(IdentityResolverTest, SpellingsOfOneDeviceShareARecord) {
    resolver.ingest("Eve\\032Energy._hap._tcp.local.", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("Eve Energy", ServiceCategory::HomeKit, std::nullopt);
    EXPECT_EQ(resolver.size(), 1u);
}

TEST_F(IdentityResolverTest, StrongSignalUpgradesWeakRecord) {
    resolver.ingest("Living Room", ServiceCategory::AirPlay, std::string("10.0.0.9"),
                    {{"model", "AppleTV"}});
    auto decision = resolver.ingest("Living Room", ServiceCategory::Hap, std::nullopt,
                                    {{"md", "Bridge"}});
    EXPECT_EQ(decision, MergeDecision::Upgraded);

    auto record = resolver.find("Living Room");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->strong);
    EXPECT_EQ(record->category, ServiceCategory::Hap);
    EXPECT_EQ(record->address, "10.0.0.9");
    EXPECT_EQ(record->metadata.at("model"), "AppleTV");
    EXPECT_EQ(record->metadata.at("md"), "Bridge");
    EXPECT_EQ(record->seenCategories.size(), 2u);

    auto events = resolver.history();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, DiscoveryEventKind::Updated);
    EXPECT_EQ(events[1].kind, DiscoveryEventKind::Discovered);
}

TEST_F(IdentityResolverTest, WeakSignalNeverDemotesStrongRecord) {
    resolver.ingest("Lamp", ServiceCategory::Hap, std::string("10.0.0.2"));
    auto decision = resolver.ingest("Lamp", ServiceCategory::Raop, std::string("10.0.0.3"));
    EXPECT_EQ(decision, MergeDecision::Ignored);

    auto record = resolver.find("Lamp");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->strong);
    EXPECT_EQ(record->category, ServiceCategory::Hap);
    EXPECT_EQ(record->address, "10.0.0.2");
}

TEST_F(IdentityResolverTest, EveryAdvertisedCategoryIsRemembered) {
    resolver.ingest("Lamp", ServiceCategory::Hap, std::string("10.0.0.2"));
    resolver.ingest("Lamp", ServiceCategory::Raop, std::nullopt);
    resolver.ingest("Lamp", ServiceCategory::AirPlay, std::string("10.0.0.2"));

    auto record = resolver.find("Lamp");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->category, ServiceCategory::Hap);
    EXPECT_EQ(record->seenCategories.size(), 3u);
    EXPECT_EQ(record->seenCategories.count(serviceTypeOf(ServiceCategory::Raop)), 1u);
    EXPECT_EQ(record->seenCategories.count(serviceTypeOf(ServiceCategory::AirPlay)), 1u);
    EXPECT_EQ(resolver.history().size(), 1u);
}

TEST_F(IdentityResolverTest, StrongSignalMovesAddressWithoutEvent) {
    resolver.ingest("Lamp", ServiceCategory::Hap, std::string("10.0.0.2"));
    EXPECT_EQ(resolver.ingest("Lamp", ServiceCategory::HomeKit, std::string("10.0.0.7")),
              MergeDecision::AddressUpdated);
    EXPECT_EQ(resolver.find("Lamp")->address, "10.0.0.7");
    EXPECT_EQ(resolver.history().size(), 1u);
}

TEST_F(IdentityResolverTest, LateAddressFillsWeakRecord) {
    resolver.ingest("Speaker", ServiceCategory::Raop, std::nullopt);
    EXPECT_EQ(resolver.ingest("Speaker", ServiceCategory::Raop, std::string("10.0.0.4")),
              MergeDecision::AddressUpdated);
    EXPECT_EQ(resolver.find("Speaker")->address, "10.0.0.4");
}

TEST_F(IdentityResolverTest, HistoryIsNewestFirstAndLimited) {
    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("B", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("C", ServiceCategory::Hap, std::nullopt);

    auto events = resolver.history(2);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].deviceName, "C");
    EXPECT_EQ(events[1].deviceName, "B");
    EXPECT_GE(events[0].timestamp, events[1].timestamp);
}

TEST(IdentityResolverBoundedTest, OldestEventsAreDropped) {
    IdentityResolver resolver(2);
    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("B", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("C", ServiceCategory::Hap, std::nullopt);

    auto events = resolver.history();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].deviceName, "B");
    EXPECT_EQ(resolver.size(), 3u);
}

TEST_F(IdentityResolverTest, ListenersReceiveEventsUntilUnsubscribed) {
    std::vector<DiscoveryEvent> received;
    auto token = resolver.subscribe([&received](const DiscoveryEvent& e) { received.push_back(e); });

    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, DiscoveryEventKind::Discovered);

    resolver.unsubscribe(token);
    resolver.ingest("B", ServiceCategory::Hap, std::nullopt);
    EXPECT_EQ(received.size(), 1u);
}

TEST_F(IdentityResolverTest, RetireUnseenRemovesAndRecordsDisappearance) {
    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    resolver.ingest("B", ServiceCategory::Hap, std::nullopt);

    auto removed = resolver.retireUnseen({"A"});
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "B");
    EXPECT_FALSE(resolver.find("B").has_value());
    EXPECT_EQ(resolver.history(1)[0].kind, DiscoveryEventKind::Disappeared);

    // Coming back is a fresh discovery
    EXPECT_EQ(resolver.ingest("B", ServiceCategory::Hap, std::nullopt), MergeDecision::Created);
}

TEST_F(IdentityResolverTest, ClearDropsRecordsAndHistory) {
    resolver.ingest("A", ServiceCategory::Hap, std::nullopt);
    resolver.clear();
    EXPECT_EQ(resolver.size(), 0u);
    EXPECT_TRUE(resolver.history().empty());
}

TEST_F(IdentityResolverTest, ConcurrentIngestKeepsOneRecordPerName) {
    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &created] {
            for (int i = 0; i < 50; ++i) {
                auto d = resolver.ingest("Device " + std::to_string(i), ServiceCategory::Hap,
                                         std::nullopt);
                if (d == MergeDecision::Created) {
                    created++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(created.load(), 50);
    EXPECT_EQ(resolver.size(), 50u);
}
