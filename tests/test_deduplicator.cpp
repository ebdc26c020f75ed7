#include <gtest/gtest.h>
#include "engine/Deduplicator.hpp"

using namespace securewatch;

namespace {

constexpr uint64_t kBase = 1700000000000ULL;
constexpr uint64_t kInterval = 300000;

Notification StatusChange(const std::string& alert_id, const std::string& key, const std::string& status) {
    Notification notification(NotificationType::ALERT_STATUS_CHANGED, alert_id);
    notification.metadata["dedupe_key"] = key;
    notification.metadata["status"] = status;
    return notification;
}

} // namespace

class DeduplicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();
    }

    void TearDown() override {
        EventBus::Instance().Clear();
    }

    Deduplicator dedup_{kInterval};
};

TEST_F(DeduplicatorTest, KeyIsStableAndNormalized) {
    auto key = Deduplicator::ComputeDedupeKey("r1", {"Alice", "10.0.0.5"});
    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(key, Deduplicator::ComputeDedupeKey("r1", {"  alice ", "10.0.0.5"}));
    EXPECT_NE(key, Deduplicator::ComputeDedupeKey("r2", {"alice", "10.0.0.5"}));
    EXPECT_NE(key, Deduplicator::ComputeDedupeKey("r1", {"alice10.0.0.5"}));
    EXPECT_NE(Deduplicator::ComputeDedupeKey("r1", {}), Deduplicator::ComputeDedupeKey("r1", {""}));
}

TEST_F(DeduplicatorTest, SuppressesWithinInterval) {
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::NONE);
    EXPECT_TRUE(dedup_.TryAcquire("k", "a1", kBase));
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::ACTIVE);

    EXPECT_FALSE(dedup_.TryAcquire("k", "a2", kBase + 1000));
    EXPECT_FALSE(dedup_.TryAcquire("k", "a3", kBase + kInterval - 1));
    EXPECT_EQ(dedup_.GetSuppressedCount("k"), 2u);

    // other keys are independent
    EXPECT_TRUE(dedup_.TryAcquire("other", "b1", kBase + 1000));
}

TEST_F(DeduplicatorTest, IntervalAnchoredAtEmission) {
    dedup_.TryAcquire("k", "a1", kBase);
    // suppressed attempts do not push the expiry out
    dedup_.TryAcquire("k", "a2", kBase + kInterval - 10);

    EXPECT_EQ(dedup_.GetState("k", kBase + kInterval), DedupeState::EXPIRED);
    EXPECT_TRUE(dedup_.TryAcquire("k", "a3", kBase + kInterval));
    EXPECT_EQ(dedup_.GetState("k", kBase + kInterval), DedupeState::ACTIVE);
    EXPECT_EQ(dedup_.GetSuppressedCount("k"), 0u);
}

TEST_F(DeduplicatorTest, ReleaseOnlyForOwningAlert) {
    dedup_.TryAcquire("k", "a1", kBase);
    dedup_.Release("k", "someone-else");
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::ACTIVE);

    dedup_.Release("k", "a1");
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::NONE);
    EXPECT_TRUE(dedup_.TryAcquire("k", "a2", kBase + 1));
}

TEST_F(DeduplicatorTest, ResolveReleasesKey) {
    dedup_.TryAcquire("k", "a1", kBase);
    dedup_.Resolve("k", "stale-alert");
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::ACTIVE);

    dedup_.Resolve("k", "a1");
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::NONE);

    dedup_.TryAcquire("k", "a2", kBase);
    dedup_.Resolve("k");
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::NONE);

    // unknown key is a no-op
    dedup_.Resolve("missing");
    EXPECT_EQ(dedup_.GetTrackedKeyCount(), 0u);
}

TEST_F(DeduplicatorTest, SweepDropsExpiredEntries) {
    dedup_.TryAcquire("k1", "a1", kBase);
    dedup_.TryAcquire("k2", "a2", kBase + 1000);

    EXPECT_EQ(dedup_.Sweep(kBase + kInterval), 1u);
    EXPECT_EQ(dedup_.GetTrackedKeyCount(), 1u);
    EXPECT_EQ(dedup_.GetState("k1", kBase + kInterval), DedupeState::NONE);
    EXPECT_EQ(dedup_.Sweep(kBase + kInterval + 1000), 1u);
}

TEST_F(DeduplicatorTest, ResolutionThroughEventBus) {
    dedup_.Start();
    dedup_.TryAcquire("k", "a1", kBase);

    EventBus::Instance().Publish(StatusChange("a1", "k", "acknowledged"));
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::ACTIVE);

    EventBus::Instance().Publish(StatusChange("a0", "k", "resolved"));
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::ACTIVE);

    EventBus::Instance().Publish(StatusChange("a1", "k", "resolved"));
    EXPECT_EQ(dedup_.GetState("k", kBase), DedupeState::NONE);

    dedup_.Stop();
    EXPECT_EQ(EventBus::Instance().GetSubscriberCount(NotificationType::ALERT_STATUS_CHANGED), 0u);
}

TEST_F(DeduplicatorTest, StateNames) {
    EXPECT_EQ(DedupeStateToString(DedupeState::NONE), "NONE");
    EXPECT_EQ(DedupeStateToString(DedupeState::ACTIVE), "ACTIVE");
    EXPECT_EQ(DedupeStateToString(DedupeState::EXPIRED), "EXPIRED");
}
