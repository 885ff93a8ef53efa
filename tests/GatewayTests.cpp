/*
 * DomainSentry - Secure Web Gateway Categorization Engine
 * Copyright (C) 2026 DomainSentry Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "TestHelpers.hpp"

#include "Gateway/EnforcementGateway.hpp"
#include "Gateway/ActivityLog.hpp"
#include "Gateway/BlockPage.hpp"
#include "Categorization/DomainClassifier.hpp"
#include "Policy/PolicyResolver.hpp"
#include "Storage/CategoryStore.hpp"
#include "Utils/JSONUtils.hpp"

#include <chrono>
#include <sstream>

using namespace DomainSentry;
using namespace DomainSentry::Gateway;
using DomainSentry::Testing::TempDir;
using DomainSentry::Testing::WriteFile;
using DomainSentry::Testing::ReadFile;
using DomainSentry::Testing::MockCategorizationClient;
using Categorization::CategorizationResult;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::_;

namespace {

RequestDescriptor Request(const std::string& host) {
    RequestDescriptor r;
    r.host = host;
    r.scheme = "https";
    r.method = "GET";
    r.path = "/";
    r.clientAddress = "10.0.0.5";
    return r;
}

}  // namespace

class EnforcementGatewayTest : public ::testing::Test {
protected:
    void Build(GatewayConfig gatewayConfig = {}) {
        Storage::CategoryStoreConfig cfg;
        cfg.cacheFile = dir / "domain_cache.json";
        cfg.policyFile = dir / "categories.json";
        store = std::make_unique<Storage::CategoryStore>(cfg);
        (void)store->Open();

        client = std::make_shared<NiceMock<MockCategorizationClient>>();
        Categorization::RetryConfig retry;
        retry.maxAttempts = 1;
        classifier = std::make_unique<Categorization::DomainClassifier>(
            *store, client, Categorization::RetryPolicy(retry));
        resolver = std::make_unique<Policy::PolicyResolver>(*store);
        gateway = std::make_unique<EnforcementGateway>(*classifier, *resolver, gatewayConfig);

        sink = std::make_shared<MemoryActivitySink>();
        gateway->AddSink(sink);
    }

    TempDir dir;
    std::unique_ptr<Storage::CategoryStore> store;
    std::shared_ptr<NiceMock<MockCategorizationClient>> client;
    std::unique_ptr<Categorization::DomainClassifier> classifier;
    std::unique_ptr<Policy::PolicyResolver> resolver;
    std::unique_ptr<EnforcementGateway> gateway;
    std::shared_ptr<MemoryActivitySink> sink;
};

TEST_F(EnforcementGatewayTest, BlockedCategoryIsBlockedAndRecorded) {
    WriteFile(dir / "categories.json", R"({"Gambling": "blocked"})");
    Build();
    EXPECT_CALL(*client, Classify(std::string_view("bet365.com")))
        .WillOnce(Return(CategorizationResult::Success("Gambling")));

    const auto decision = gateway->Decide(Request("www.bet365.com"));
    EXPECT_TRUE(decision.IsBlocked());
    EXPECT_EQ(decision.record.domain, "bet365.com");
    EXPECT_EQ(decision.record.category, "Gambling");
    EXPECT_EQ(decision.record.errorKind, ErrorKind::None);
    EXPECT_FALSE(decision.record.cacheHit);

    const auto records = sink->Snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].verdict, Verdict::Blocked);
    EXPECT_EQ(records[0].host, "www.bet365.com");
    EXPECT_EQ(records[0].clientAddress, "10.0.0.5");

    // Second request is a cache hit with the same verdict.
    const auto again = gateway->Decide(Request("bet365.com"));
    EXPECT_TRUE(again.IsBlocked());
    EXPECT_TRUE(again.record.cacheHit);
    EXPECT_EQ(gateway->GetStatistics().blocked.load(), 2u);
}

TEST_F(EnforcementGatewayTest, NewCategoryIsAllowedAndRegistered) {
    Build();
    EXPECT_CALL(*client, Classify(_)).WillOnce(Return(CategorizationResult::Success("Education")));

    const auto decision = gateway->Decide(Request("khanacademy.org"));
    EXPECT_FALSE(decision.IsBlocked());
    EXPECT_EQ(decision.record.category, "Education");
    EXPECT_EQ(store->GetPolicy("Education").verdict, Verdict::Allowed);
}

TEST_F(EnforcementGatewayTest, OracleFailureUsesFallbackVerdict) {
    GatewayConfig cfg;
    cfg.fallbackVerdict = Verdict::Blocked;
    WriteFile(dir / "categories.json", R"({"Uncategorized": "allowed"})");
    Build(cfg);
    EXPECT_CALL(*client, Classify(_))
        .WillOnce(Return(CategorizationResult::Failure(ErrorKind::OracleUnreachable, "down")));

    const auto decision = gateway->Decide(Request("unknown-site.io"));
    EXPECT_TRUE(decision.IsBlocked());
    EXPECT_EQ(decision.record.category, "Uncategorized");
    EXPECT_EQ(decision.record.errorKind, ErrorKind::OracleUnreachable);
    EXPECT_EQ(gateway->GetStatistics().fallbacks.load(), 1u);
}

TEST_F(EnforcementGatewayTest, DefaultFallbackAllows) {
    Build();
    EXPECT_CALL(*client, Classify(_))
        .WillOnce(Return(CategorizationResult::Failure(ErrorKind::OracleTimeout, "slow")));

    const auto decision = gateway->Decide(Request("slow.example"));
    EXPECT_FALSE(decision.IsBlocked());
    EXPECT_EQ(decision.record.errorKind, ErrorKind::OracleTimeout);
    EXPECT_FALSE(store->Get("slow.example").has_value());
    EXPECT_EQ(store->GetCacheSize(), 0u);
}

TEST_F(EnforcementGatewayTest, PolicyEditChangesVerdictForCachedDomain) {
    const auto policyPath = dir / "categories.json";
    WriteFile(policyPath, R"({"Streaming": "allowed"})");
    Build();
    EXPECT_CALL(*client, Classify(_)).Times(0);
    ASSERT_TRUE(store->Put(CacheEntry{"twitch.tv", "Streaming", std::chrono::system_clock::now()}));

    const auto before = gateway->Decide(Request("www.twitch.tv"));
    EXPECT_FALSE(before.IsBlocked());
    EXPECT_TRUE(before.record.cacheHit);

    // Same byte count, rewritten in place.
    WriteFile(policyPath, R"({"Streaming": "blocked"})");

    const auto after = gateway->Decide(Request("www.twitch.tv"));
    EXPECT_TRUE(after.IsBlocked());
    EXPECT_TRUE(after.record.cacheHit);
    EXPECT_EQ(after.record.category, "Streaming");
    EXPECT_EQ(classifier->GetStatistics().oracleCalls.load(), 0u);
}

TEST_F(EnforcementGatewayTest, SniIsUsedWhenHostIsMissing) {
    Build();
    EXPECT_CALL(*client, Classify(std::string_view("reddit.com")))
        .WillOnce(Return(CategorizationResult::Success("Social Media")));

    RequestDescriptor req = Request("");
    req.sni = "old.reddit.com";
    const auto decision = gateway->Decide(req);
    EXPECT_EQ(decision.record.domain, "reddit.com");
    EXPECT_EQ(decision.record.category, "Social Media");
}

TEST_F(EnforcementGatewayTest, InvalidHostIsRecordedWithRawTarget) {
    Build();
    EXPECT_CALL(*client, Classify(_)).Times(0);

    const auto decision = gateway->Decide(Request("bad host"));
    EXPECT_FALSE(decision.IsBlocked());
    EXPECT_EQ(decision.record.domain, "bad host");
    EXPECT_EQ(decision.record.errorKind, ErrorKind::InvalidDomain);
}

TEST_F(EnforcementGatewayTest, InvalidPolicyValueIsRecordedAndAllowed) {
    WriteFile(dir / "categories.json", R"({"Gaming": "BLOCK"})");
    Build();
    EXPECT_CALL(*client, Classify(_)).WillOnce(Return(CategorizationResult::Success("Gaming")));

    const auto decision = gateway->Decide(Request("steampowered.com"));
    EXPECT_FALSE(decision.IsBlocked());
    EXPECT_EQ(decision.record.errorKind, ErrorKind::InvalidPolicyValue);
}

TEST_F(EnforcementGatewayTest, EveryDecisionProducesOneRecord) {
    Build();
    ASSERT_TRUE(store->Put(CacheEntry{"a.com", "News", std::chrono::system_clock::now()}));
    ASSERT_TRUE(store->Put(CacheEntry{"b.com", "News", std::chrono::system_clock::now()}));

    (void)gateway->Decide(Request("a.com"));
    (void)gateway->Decide(Request("b.com"));
    (void)gateway->Decide(Request(""));
    EXPECT_EQ(sink->Size(), 3u);
    EXPECT_EQ(gateway->GetStatistics().decisions.load(), 3u);
}

// ============================================================================
// Activity log
// ============================================================================

TEST(ActivityRecordTest, JsonOmitsCleanErrorKind) {
    ActivityRecord record;
    record.domain = "example.com";
    record.category = "News";
    record.verdict = Verdict::Blocked;
    record.timestamp = FromUnixSeconds(1700000000);
    record.latency = std::chrono::microseconds(1500);

    Utils::JSON::Json j;
    ASSERT_TRUE(Utils::JSON::Parse(record.ToJson(), j));
    EXPECT_EQ(j.at("verdict"), "blocked");
    EXPECT_EQ(j.at("latencyUs"), 1500);
    EXPECT_EQ(j.at("timestamp"), "2023-11-14T22:13:20.000Z");
    EXPECT_FALSE(j.contains("errorKind"));
    EXPECT_FALSE(j.contains("categoryRegistered"));

    record.errorKind = ErrorKind::OracleTimeout;
    ASSERT_TRUE(Utils::JSON::Parse(record.ToJson(), j));
    EXPECT_EQ(j.at("errorKind"), "OracleTimeout");
}

TEST(ActivitySinkTest, JsonLinesSinkAppendsOneLinePerRecord) {
    TempDir dir;
    const auto path = dir.Path() / "logs" / "activity.jsonl";
    {
        JsonLinesActivitySink sink(path);
        std::string err;
        ASSERT_TRUE(sink.Open(&err)) << err;

        ActivityRecord record;
        record.domain = "one.com";
        sink.Append(record);
        record.domain = "two.com";
        sink.Append(record);
        EXPECT_EQ(sink.GetWrittenCount(), 2u);
    }
    {
        JsonLinesActivitySink sink(path);
        ASSERT_TRUE(sink.Open());
        ActivityRecord record;
        record.domain = "three.com";
        sink.Append(record);
    }

    std::istringstream lines(ReadFile(path));
    std::vector<std::string> domains;
    for (std::string line; std::getline(lines, line);) {
        Utils::JSON::Json j;
        ASSERT_TRUE(Utils::JSON::Parse(line, j)) << line;
        domains.push_back(j.at("domain").get<std::string>());
    }
    EXPECT_EQ(domains, (std::vector<std::string>{"one.com", "two.com", "three.com"}));
}

TEST(ActivitySinkTest, MemorySinkKeepsMostRecent) {
    MemoryActivitySink sink(2);
    ActivityRecord record;
    for (const char* d : {"a.com", "b.com", "c.com"}) {
        record.domain = d;
        sink.Append(record);
    }
    const auto snap = sink.Snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].domain, "b.com");
    EXPECT_EQ(snap[1].domain, "c.com");
    sink.Clear();
    EXPECT_EQ(sink.Size(), 0u);
}

// ============================================================================
// Block page
// ============================================================================

TEST(BlockPageTest, BuiltInPageUntilTemplateLoads) {
    BlockPage page;
    EXPECT_TRUE(page.IsBuiltIn());
    EXPECT_EQ(page.GetTemplate(), BlockPageConstants::FALLBACK_HTML);

    TempDir dir;
    EXPECT_FALSE(page.LoadFromFile(dir / "missing.html"));
    EXPECT_TRUE(page.IsBuiltIn());

    WriteFile(dir / "empty.html", "  \n");
    EXPECT_FALSE(page.LoadFromFile(dir / "empty.html"));
    EXPECT_TRUE(page.IsBuiltIn());

    WriteFile(dir / "block.html", "<p>{{domain}} is {{category}}</p>");
    EXPECT_TRUE(page.LoadFromFile(dir / "block.html"));
    EXPECT_FALSE(page.IsBuiltIn());
}

TEST(BlockPageTest, RenderEscapesSubstitutions) {
    BlockPage page;
    page.SetTemplate("<h1>{{domain}}</h1><p>{{category}} / {{category}}</p>");

    const auto response = page.MakeResponse("evil.com", "<script>\"x\"</script>");
    EXPECT_EQ(response.statusCode, 403u);
    EXPECT_EQ(response.contentType, "text/html");
    EXPECT_EQ(response.body,
              "<h1>evil.com</h1><p>&lt;script&gt;&quot;x&quot;&lt;/script&gt; / "
              "&lt;script&gt;&quot;x&quot;&lt;/script&gt;</p>");
}
