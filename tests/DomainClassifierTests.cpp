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

#include "Categorization/DomainClassifier.hpp"
#include "Storage/CategoryStore.hpp"

#include <thread>
#include <vector>

using namespace DomainSentry;
using namespace DomainSentry::Categorization;
using DomainSentry::Testing::TempDir;
using DomainSentry::Testing::WaitFor;
using DomainSentry::Testing::MockCategorizationClient;
using DomainSentry::Testing::GatedClient;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace {

RetryPolicy FastRetry(uint32_t attempts) {
    RetryConfig cfg;
    cfg.maxAttempts = attempts;
    cfg.initialDelayMs = 1;
    cfg.maxDelayMs = 5;
    return RetryPolicy(cfg);
}

CategorizationResult RateLimited(int64_t retryAfterSeconds) {
    auto r = CategorizationResult::Failure(ErrorKind::OracleRateLimited, "HTTP 429");
    r.httpStatus = 429;
    r.retryAfter = std::chrono::seconds(retryAfterSeconds);
    return r;
}

}  // namespace

class DomainClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        Storage::CategoryStoreConfig cfg;
        cfg.cacheFile = dir / "domain_cache.json";
        cfg.policyFile = dir / "categories.json";
        store = std::make_unique<Storage::CategoryStore>(cfg);
        ASSERT_TRUE(store->Open());
    }

    TempDir dir;
    std::unique_ptr<Storage::CategoryStore> store;
};

// ============================================================================
// Cache path
// ============================================================================

TEST_F(DomainClassifierTest, CacheHitNeverCallsOracle) {
    ASSERT_TRUE(store->Put(CacheEntry{"youtube.com", "Entertainment", std::chrono::system_clock::now()}));

    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_)).Times(0);

    DomainClassifier classifier(*store, client);
    const auto result = classifier.Resolve("https://www.youtube.com/watch?v=1");

    EXPECT_TRUE(result.cacheHit);
    EXPECT_EQ(result.category, "Entertainment");
    EXPECT_EQ(result.normalizedDomain, "youtube.com");
    EXPECT_EQ(result.error, ErrorKind::None);
    EXPECT_EQ(result.attempts, 0u);
}

TEST_F(DomainClassifierTest, MissClassifiesCachesAndRegistersCategory) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(std::string_view("github.com")))
        .WillOnce(Return(CategorizationResult::Success("Technology")));

    DomainClassifier classifier(*store, client);
    const auto first = classifier.Resolve("api.github.com:443");
    EXPECT_FALSE(first.cacheHit);
    EXPECT_EQ(first.category, "Technology");
    EXPECT_EQ(first.error, ErrorKind::None);
    EXPECT_EQ(first.attempts, 1u);

    ASSERT_TRUE(store->Get("github.com").has_value());
    EXPECT_EQ(store->GetPolicy("Technology").verdict, Verdict::Allowed);

    const auto second = classifier.Resolve("github.com");
    EXPECT_TRUE(second.cacheHit);
    EXPECT_EQ(second.category, "Technology");

    const auto stats = classifier.GetStatistics();
    EXPECT_EQ(stats.oracleCalls.load(), 1u);
    EXPECT_EQ(stats.categoriesRegistered.load(), 1u);
}

TEST_F(DomainClassifierTest, CollapseCanBeDisabled) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    ClassifierConfig cfg;
    cfg.collapseToRegistrableDomain = false;
    DomainClassifier classifier(*store, client, RetryPolicy{}, cfg);

    std::string out;
    ASSERT_TRUE(classifier.NormalizeDomain("WWW.Example.com.", out));
    EXPECT_EQ(out, "www.example.com");
}

TEST_F(DomainClassifierTest, SitesUnderMultiLabelSuffixKeepSeparateEntries) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(std::string_view("uw.edu.pl")))
        .WillOnce(Return(CategorizationResult::Success("Education")));
    EXPECT_CALL(*client, Classify(std::string_view("pw.edu.pl")))
        .WillOnce(Return(CategorizationResult::Success("Research")));

    DomainClassifier classifier(*store, client);
    EXPECT_EQ(classifier.Resolve("www.uw.edu.pl").category, "Education");
    EXPECT_EQ(classifier.Resolve("www.pw.edu.pl").category, "Research");
    EXPECT_FALSE(store->Get("edu.pl").has_value());
}

TEST_F(DomainClassifierTest, InvalidHostSkipsOracle) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_)).Times(0);

    DomainClassifier classifier(*store, client);
    const auto result = classifier.Resolve("not a host");
    EXPECT_EQ(result.error, ErrorKind::InvalidDomain);
    EXPECT_EQ(result.category, ClassifierConstants::DEFAULT_FALLBACK_CATEGORY);
    EXPECT_TRUE(result.IsFallback());
    EXPECT_EQ(classifier.GetStatistics().invalidDomains.load(), 1u);
}

// ============================================================================
// Failures and retries
// ============================================================================

TEST_F(DomainClassifierTest, RetriesStopAtMaxAttemptsAndNothingIsCached) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_))
        .Times(6)
        .WillRepeatedly(Return(CategorizationResult::Failure(ErrorKind::OracleTimeout, "timeout")));

    DomainClassifier classifier(*store, client, FastRetry(3));

    const auto first = classifier.Resolve("flaky.com");
    EXPECT_EQ(first.error, ErrorKind::OracleTimeout);
    EXPECT_EQ(first.attempts, 3u);
    EXPECT_EQ(first.category, "Uncategorized");
    EXPECT_TRUE(first.IsFallback());
    EXPECT_FALSE(store->Get("flaky.com").has_value());
    EXPECT_FALSE(store->GetPolicy("Uncategorized").found);

    // Failure is not cached: the next request asks again.
    const auto second = classifier.Resolve("flaky.com");
    EXPECT_EQ(second.attempts, 3u);

    const auto stats = classifier.GetStatistics();
    EXPECT_EQ(stats.retries.load(), 4u);
    EXPECT_EQ(stats.chainsFailed.load(), 2u);
}

TEST_F(DomainClassifierTest, NotConfiguredIsNotRetried) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_))
        .Times(1)
        .WillOnce(Return(CategorizationResult::Failure(ErrorKind::OracleNotConfigured, "no key")));

    DomainClassifier classifier(*store, client, FastRetry(5));
    const auto result = classifier.Resolve("example.com");
    EXPECT_EQ(result.error, ErrorKind::OracleNotConfigured);
    EXPECT_EQ(result.attempts, 1u);
}

TEST_F(DomainClassifierTest, RateLimitedThenSucceeds) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_))
        .WillOnce(Return(RateLimited(0)))
        .WillOnce(Return(CategorizationResult::Success("Shopping")));

    DomainClassifier classifier(*store, client, FastRetry(2));
    const auto result = classifier.Resolve("amazon.com");
    EXPECT_EQ(result.error, ErrorKind::None);
    EXPECT_EQ(result.category, "Shopping");
    EXPECT_EQ(result.attempts, 2u);
}

TEST_F(DomainClassifierTest, ClientExceptionBecomesInternalError) {
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_)).WillOnce(Throw(std::runtime_error("bug")));

    DomainClassifier classifier(*store, client, FastRetry(3));
    const auto result = classifier.Resolve("example.com");
    EXPECT_EQ(result.error, ErrorKind::InternalError);
    EXPECT_TRUE(result.IsFallback());
}

TEST_F(DomainClassifierTest, MissingClientIsNotConfigured) {
    DomainClassifier classifier(*store, nullptr);
    const auto result = classifier.Resolve("example.com");
    EXPECT_EQ(result.error, ErrorKind::OracleNotConfigured);
}

TEST_F(DomainClassifierTest, StoreWriteFailureStillReturnsCategory) {
    Testing::WriteFile(dir / "blocker", "not a directory");
    Storage::CategoryStoreConfig cfg;
    cfg.cacheFile = dir.Path() / "blocker" / "domain_cache.json";
    cfg.policyFile = dir / "categories.json";
    cfg.writeAttempts = 1;
    Storage::CategoryStore brokenStore(cfg);
    EXPECT_FALSE(brokenStore.Open());

    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_)).WillOnce(Return(CategorizationResult::Success("News")));

    DomainClassifier classifier(brokenStore, client);
    const auto result = classifier.Resolve("bbc.com");
    EXPECT_EQ(result.category, "News");
    EXPECT_EQ(result.error, ErrorKind::StoreWriteFailure);
    EXPECT_FALSE(result.IsFallback());

    // The in-memory entry keeps serving.
    EXPECT_TRUE(classifier.Resolve("bbc.com").cacheHit);
}

// ============================================================================
// Single flight, deadlines and cancellation
// ============================================================================

TEST_F(DomainClassifierTest, ConcurrentMissesShareOneOracleCall) {
    auto client = std::make_shared<GatedClient>("News");
    DomainClassifier classifier(*store, client);

    constexpr int kCallers = 6;
    std::vector<ResolveResult> results(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&classifier, &results, i]() {
            results[i] = classifier.Resolve(i % 2 == 0 ? "www.cnn.com" : "edition.cnn.com");
        });
    }

    EXPECT_TRUE(WaitFor([&]() { return client->Calls() == 1; }));
    EXPECT_TRUE(WaitFor([&]() {
        return classifier.GetStatistics().singleFlightJoins.load() == kCallers - 1;
    }));
    EXPECT_EQ(classifier.GetInFlightCount(), 1u);

    client->Release();
    for (auto& t : callers) t.join();

    EXPECT_EQ(client->Calls(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r.category, "News");
        EXPECT_EQ(r.error, ErrorKind::None);
    }
    EXPECT_EQ(classifier.GetInFlightCount(), 0u);
}

TEST_F(DomainClassifierTest, DeadlineFallsBackWhileChainFillsCache) {
    auto client = std::make_shared<GatedClient>("Sports");
    ClassifierConfig cfg;
    cfg.resolveDeadline = std::chrono::milliseconds(50);
    DomainClassifier classifier(*store, client, RetryPolicy{}, cfg);

    const auto result = classifier.Resolve("espn.com");
    EXPECT_EQ(result.error, ErrorKind::OracleTimeout);
    EXPECT_EQ(result.category, "Uncategorized");
    EXPECT_EQ(classifier.GetStatistics().deadlineExpirations.load(), 1u);

    client->Release();
    EXPECT_TRUE(WaitFor([&]() { return store->Get("espn.com").has_value(); }));

    const auto later = classifier.Resolve("espn.com");
    EXPECT_TRUE(later.cacheHit);
    EXPECT_EQ(later.category, "Sports");
    EXPECT_EQ(client->Calls(), 1);
}

TEST_F(DomainClassifierTest, CancelledCallerStopsWaiting) {
    auto client = std::make_shared<GatedClient>("Gaming");
    DomainClassifier classifier(*store, client);

    std::atomic<bool> cancel{false};
    std::thread canceller([&]() {
        WaitFor([&]() { return client->Calls() == 1; });
        cancel = true;
    });

    const auto start = std::chrono::steady_clock::now();
    const auto result = classifier.Resolve("twitch.tv", &cancel);
    const auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(result.error, ErrorKind::RequestCancelled);
    EXPECT_TRUE(result.IsFallback());
    EXPECT_LT(waited, std::chrono::seconds(5));

    client->Release();
    EXPECT_TRUE(WaitFor([&]() { return store->Get("twitch.tv").has_value(); }));
}

TEST_F(DomainClassifierTest, FullQueueRejectsNewMisses) {
    auto client = std::make_shared<GatedClient>("News");
    ClassifierConfig cfg;
    cfg.maxConcurrentLookups = 1;
    cfg.maxQueuedLookups = 1;
    cfg.resolveDeadline = std::chrono::milliseconds(20);
    DomainClassifier classifier(*store, client, RetryPolicy{}, cfg);

    EXPECT_EQ(classifier.Resolve("a.com").error, ErrorKind::OracleTimeout);
    ASSERT_TRUE(WaitFor([&]() { return client->Calls() == 1; }));

    EXPECT_EQ(classifier.Resolve("b.com").error, ErrorKind::OracleTimeout);  // queued
    const auto rejected = classifier.Resolve("c.com");
    EXPECT_EQ(rejected.error, ErrorKind::OracleUnreachable);
    EXPECT_EQ(classifier.GetStatistics().queueRejections.load(), 1u);

    client->Release();
    EXPECT_TRUE(WaitFor([&]() { return classifier.GetInFlightCount() == 0; }));
}

TEST_F(DomainClassifierTest, ShutdownRefusesNewMissesButServesCache) {
    ASSERT_TRUE(store->Put(CacheEntry{"cached.com", "News", std::chrono::system_clock::now()}));
    auto client = std::make_shared<NiceMock<MockCategorizationClient>>();
    EXPECT_CALL(*client, Classify(_)).Times(0);

    DomainClassifier classifier(*store, client);
    classifier.Shutdown();
    classifier.Shutdown();

    EXPECT_EQ(classifier.Resolve("new.com").error, ErrorKind::OracleUnreachable);
    EXPECT_TRUE(classifier.Resolve("cached.com").cacheHit);
}
