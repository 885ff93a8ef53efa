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

#include "Config/ConfigManager.hpp"

#include <map>

using namespace DomainSentry;
using namespace DomainSentry::Config;
using DomainSentry::Testing::TempDir;
using DomainSentry::Testing::WriteFile;

namespace {

/// Environment backed by a map instead of the process environment.
EnvironmentLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

bool HasErrorFor(const ConfigManager& mgr, const std::string& key, ValidationResult result) {
    for (const auto& e : mgr.GetErrors()) {
        if (e.key == key && e.result == result) return true;
    }
    return false;
}

}  // namespace

TEST(ConfigManagerTest, DefaultsAreValid) {
    ConfigManager mgr;
    EXPECT_TRUE(mgr.LoadDefault(FakeEnv({})));
    EXPECT_TRUE(mgr.GetErrors().empty()) << mgr.FormatErrors();

    const auto& c = mgr.Get();
    EXPECT_TRUE(c.oracle.apiKey.empty());
    EXPECT_EQ(c.oracle.model, "gemini-2.5-flash");
    EXPECT_EQ(c.store.cacheFile.string(), "domain_cache.json");
    EXPECT_EQ(c.store.policyFile.string(), "categories.json");
    EXPECT_EQ(c.gateway.fallbackVerdict, Verdict::Allowed);
    EXPECT_EQ(c.classifier.fallbackCategory, "Uncategorized");
    EXPECT_TRUE(c.IsValid());
}

TEST(ConfigManagerTest, JsonFileOverridesDefaults) {
    ConfigManager mgr;
    ASSERT_TRUE(mgr.LoadFromJson(R"({
        "oracle": {"model": "gemini-pro", "timeoutMs": 2500, "maxAttempts": 4, "verifySSL": false},
        "classifier": {"fallbackCategory": "Unknown", "resolveDeadlineMs": 3000, "collapseToRegistrableDomain": false},
        "store": {"cacheFile": "/var/lib/ds/cache.json", "cacheTtlSeconds": 86400},
        "gateway": {"fallbackVerdict": "Blocked", "activityLog": "/var/log/ds/activity.jsonl"},
        "logging": {"level": "debug", "jsonLines": true}
    })")) << mgr.FormatErrors();

    const auto& c = mgr.Get();
    EXPECT_EQ(c.oracle.model, "gemini-pro");
    EXPECT_EQ(c.oracle.timeoutMs, 2500u);
    EXPECT_FALSE(c.oracle.verifySSL);
    EXPECT_EQ(c.retry.maxAttempts, 4u);
    EXPECT_EQ(c.classifier.fallbackCategory, "Unknown");
    EXPECT_EQ(c.classifier.resolveDeadline, std::chrono::milliseconds(3000));
    EXPECT_FALSE(c.classifier.collapseToRegistrableDomain);
    EXPECT_EQ(c.store.cacheFile.string(), "/var/lib/ds/cache.json");
    EXPECT_EQ(c.store.cacheTtl, std::chrono::seconds(86400));
    EXPECT_EQ(c.gateway.fallbackVerdict, Verdict::Blocked);
    EXPECT_EQ(c.activityLogPath.string(), "/var/log/ds/activity.jsonl");
    EXPECT_EQ(c.logging.level, Utils::LogLevel::Debug);
    EXPECT_TRUE(c.logging.jsonLines);

    const auto logger = c.ToLoggerConfig();
    EXPECT_EQ(logger.minimalLevel, Utils::LogLevel::Debug);
    EXPECT_TRUE(logger.jsonLines);
}

TEST(ConfigManagerTest, InvalidFileValuesNameTheKey) {
    ConfigManager mgr;
    EXPECT_FALSE(mgr.LoadFromJson(R"({
        "oracle": {"timeoutMs": -5, "maxAttempts": 50},
        "gateway": {"fallbackVerdict": "deny"},
        "logging": {"level": 3},
        "store": "nope"
    })"));

    EXPECT_TRUE(HasErrorFor(mgr, "oracle.timeoutMs", ValidationResult::InvalidType));
    EXPECT_TRUE(HasErrorFor(mgr, "oracle.maxAttempts", ValidationResult::OutOfRange));
    EXPECT_TRUE(HasErrorFor(mgr, "gateway.fallbackVerdict", ValidationResult::InvalidFormat));
    EXPECT_TRUE(HasErrorFor(mgr, "logging.level", ValidationResult::InvalidType));
    EXPECT_TRUE(HasErrorFor(mgr, "store", ValidationResult::InvalidType));

    // Rejected values leave the defaults in place.
    EXPECT_EQ(mgr.Get().oracle.timeoutMs, 5000u);
    EXPECT_EQ(mgr.Get().retry.maxAttempts, 2u);
    EXPECT_NE(mgr.FormatErrors().find("oracle.maxAttempts: "), std::string::npos);
}

TEST(ConfigManagerTest, MalformedDocumentIsReported) {
    ConfigManager mgr;
    EXPECT_FALSE(mgr.LoadFromJson("{ broken", "settings.json"));
    EXPECT_TRUE(HasErrorFor(mgr, "settings.json", ValidationResult::InvalidFormat));

    mgr.ClearErrors();
    EXPECT_FALSE(mgr.LoadFromJson("[1, 2]", "settings.json"));
    EXPECT_TRUE(HasErrorFor(mgr, "settings.json", ValidationResult::InvalidType));
}

TEST(ConfigManagerTest, EnvironmentOverridesFile) {
    TempDir dir;
    const auto file = dir / "domainsentry.json";
    WriteFile(file, R"({"oracle": {"model": "from-file"}, "gateway": {"fallbackVerdict": "allowed"}})");

    ConfigManager mgr;
    ASSERT_TRUE(mgr.LoadDefault(FakeEnv({
        {"DOMAINSENTRY_CONFIG", file.string()},
        {"GOOGLE_API_KEY", "  secret  "},
        {"DOMAINSENTRY_MODEL", "from-env"},
        {"DOMAINSENTRY_FALLBACK_VERDICT", "BLOCKED"},
        {"DOMAINSENTRY_RESOLVE_DEADLINE_MS", "750"},
        {"DOMAINSENTRY_CACHE_TTL_SECONDS", "60"},
        {"DOMAINSENTRY_LOG_LEVEL", "warn"},
    }))) << mgr.FormatErrors();

    const auto& c = mgr.Get();
    EXPECT_EQ(c.oracle.apiKey, "secret");
    EXPECT_EQ(c.oracle.model, "from-env");
    EXPECT_EQ(c.gateway.fallbackVerdict, Verdict::Blocked);
    EXPECT_EQ(c.classifier.resolveDeadline, std::chrono::milliseconds(750));
    EXPECT_EQ(c.store.cacheTtl, std::chrono::seconds(60));
    EXPECT_EQ(c.logging.level, Utils::LogLevel::Warn);

    // The key never appears in serialized config.
    EXPECT_EQ(c.ToJson().find("secret"), std::string::npos);
}

TEST(ConfigManagerTest, InvalidEnvironmentValuesNameTheVariable) {
    ConfigManager mgr;
    EXPECT_FALSE(mgr.ApplyEnvironment(FakeEnv({
        {"DOMAINSENTRY_ORACLE_TIMEOUT_MS", "fast"},
        {"DOMAINSENTRY_ORACLE_MAX_ATTEMPTS", "0"},
        {"DOMAINSENTRY_FALLBACK_VERDICT", "maybe"},
        {"DOMAINSENTRY_LOG_LEVEL", "loud"},
        {"DOMAINSENTRY_CACHE_FILE", "   "},
    })));

    EXPECT_TRUE(HasErrorFor(mgr, "DOMAINSENTRY_ORACLE_TIMEOUT_MS", ValidationResult::OutOfRange));
    EXPECT_TRUE(HasErrorFor(mgr, "DOMAINSENTRY_ORACLE_MAX_ATTEMPTS", ValidationResult::OutOfRange));
    EXPECT_TRUE(HasErrorFor(mgr, "DOMAINSENTRY_FALLBACK_VERDICT", ValidationResult::InvalidFormat));
    EXPECT_TRUE(HasErrorFor(mgr, "DOMAINSENTRY_LOG_LEVEL", ValidationResult::InvalidFormat));
    EXPECT_TRUE(HasErrorFor(mgr, "DOMAINSENTRY_CACHE_FILE", ValidationResult::InvalidFormat));
    EXPECT_EQ(mgr.GetErrors().size(), 5u);
}

TEST(ConfigManagerTest, MissingConfigFileIsUnreadable) {
    TempDir dir;
    ConfigManager mgr;
    EXPECT_FALSE(mgr.LoadDefault(FakeEnv({{"DOMAINSENTRY_CONFIG", (dir / "absent.json").string()}})));
    EXPECT_TRUE(HasErrorFor(mgr, (dir / "absent.json").string(), ValidationResult::Unreadable));
}

TEST(ConfigManagerTest, CrossFieldValidation) {
    ConfigManager mgr;
    ASSERT_TRUE(mgr.LoadFromJson(R"({
        "store": {"cacheFile": "same.json", "policyFile": "same.json"},
        "oracle": {"initialBackoffMs": 9000, "maxBackoffMs": 100}
    })"));
    EXPECT_FALSE(mgr.Validate());
    EXPECT_TRUE(HasErrorFor(mgr, "store.policyFile", ValidationResult::InvalidFormat));
    EXPECT_TRUE(HasErrorFor(mgr, "oracle.initialBackoffMs", ValidationResult::OutOfRange));
}
