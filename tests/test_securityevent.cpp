#include <gtest/gtest.h>
#include "core/SecurityEvent.hpp"
#include <stdexcept>

using namespace securewatch;

TEST(SecurityEventTest, ParsesCamelCaseEnvelope) {
    auto j = nlohmann::json::parse(R"({
        "id": "e-1",
        "timestamp": 1700000000000,
        "organizationId": "org-1",
        "sourceIdentifier": "auth",
        "category": "authentication",
        "fields": {"user": "alice", "attempts": 3}
    })");

    auto event = SecurityEvent::FromJson(j);
    EXPECT_EQ(event.id, "e-1");
    EXPECT_EQ(event.timestamp, 1700000000000ULL);
    EXPECT_EQ(event.organization_id, "org-1");
    EXPECT_EQ(event.source_identifier, "auth");
    EXPECT_EQ(event.category, "authentication");
    EXPECT_EQ(event.GetField("user"), "alice");
    EXPECT_EQ(event.GetField("attempts"), "3");
}

TEST(SecurityEventTest, ParsesSnakeCaseAndIsoTimestamp) {
    auto j = nlohmann::json::parse(R"({
        "id": "e-2",
        "timestamp": "2023-11-14T22:13:20.250Z",
        "organization_id": "org-2",
        "source_identifier": "firewall",
        "src_ip": "10.0.0.1"
    })");

    auto event = SecurityEvent::FromJson(j);
    EXPECT_EQ(event.timestamp, 1700000000250ULL);
    EXPECT_EQ(event.organization_id, "org-2");
    EXPECT_EQ(event.source_identifier, "firewall");
    EXPECT_EQ(event.GetField("src_ip"), "10.0.0.1");
}

TEST(SecurityEventTest, FlattensNestedObjects) {
    auto j = nlohmann::json::parse(R"({
        "id": "e-3",
        "timestamp": 1,
        "threat_intel": {"match": true, "feed": {"name": "abuse"}}
    })");

    auto event = SecurityEvent::FromJson(j);
    EXPECT_EQ(event.GetField("threat_intel.match"), "true");
    EXPECT_EQ(event.GetField("threat_intel.feed.name"), "abuse");
}

TEST(SecurityEventTest, AttributesShadowEnvelope) {
    SecurityEvent event;
    event.source_identifier = "auth";
    EXPECT_EQ(event.GetField("source"), "auth");

    event.fields["source"] = "override";
    EXPECT_EQ(event.GetField("source"), "override");
    EXPECT_FALSE(event.GetField("missing").has_value());
}

TEST(SecurityEventTest, EmptyEnvelopeFieldsAreAbsent) {
    auto event = SecurityEvent::FromJson(nlohmann::json::parse(R"({"timestamp": 1000, "user": "alice"})"));
    EXPECT_FALSE(event.GetField("category").has_value());
    EXPECT_FALSE(event.GetField("organizationId").has_value());
    EXPECT_FALSE(event.GetField("sourceIdentifier").has_value());
    EXPECT_FALSE(event.GetField("source").has_value());
    EXPECT_FALSE(event.GetField("id").has_value());
    EXPECT_EQ(event.GetField("timestamp"), "1000");

    event.category = "authentication";
    EXPECT_EQ(event.GetField("category"), "authentication");
}

TEST(SecurityEventTest, RejectsMalformedInput) {
    EXPECT_THROW(SecurityEvent::FromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(SecurityEvent::FromJson(nlohmann::json::parse(R"({"timestamp": "yesterday"})")),
                 std::invalid_argument);
    EXPECT_THROW(SecurityEvent::FromJson(nlohmann::json::parse(R"({"timestamp": -5})")),
                 std::invalid_argument);
}

TEST(SecurityEventTest, ToJsonCarriesFields) {
    SecurityEvent event;
    event.id = "e-4";
    event.timestamp = 42;
    event.fields["user"] = "bob";

    auto j = event.ToJson();
    EXPECT_EQ(j["id"], "e-4");
    EXPECT_EQ(j["timestamp"], 42);
    EXPECT_EQ(j["fields"]["user"], "bob");

    auto back = SecurityEvent::FromJson(j);
    EXPECT_EQ(back.GetField("user"), "bob");
}
