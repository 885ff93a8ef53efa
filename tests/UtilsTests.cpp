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

#include "Core/EngineTypes.hpp"
#include "Utils/StringUtils.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/JSONUtils.hpp"
#include "Utils/Logger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace DomainSentry;
using namespace DomainSentry::Utils;
using DomainSentry::Testing::TempDir;
using DomainSentry::Testing::WriteFile;
using DomainSentry::Testing::ReadFile;

// ============================================================================
// StringUtils
// ============================================================================

TEST(StringUtilsTest, NormalizeHostStripsUrlDecorations) {
    std::string out;
    ASSERT_TRUE(StringUtils::NormalizeHost("https://User:pw@WWW.Example.COM:8443/path?q=1#frag", out));
    EXPECT_EQ(out, "www.example.com");

    ASSERT_TRUE(StringUtils::NormalizeHost("  News.BBC.co.uk.  ", out));
    EXPECT_EQ(out, "news.bbc.co.uk");

    ASSERT_TRUE(StringUtils::NormalizeHost("example.org:443", out));
    EXPECT_EQ(out, "example.org");
}

TEST(StringUtilsTest, NormalizeHostHandlesIpLiterals) {
    std::string out;
    ASSERT_TRUE(StringUtils::NormalizeHost("[2001:DB8::1]:443", out));
    EXPECT_EQ(out, "2001:db8::1");

    ASSERT_TRUE(StringUtils::NormalizeHost("192.168.1.10:8080", out));
    EXPECT_EQ(out, "192.168.1.10");
}

TEST(StringUtilsTest, NormalizeHostRejectsGarbage) {
    std::string out;
    EXPECT_FALSE(StringUtils::NormalizeHost("", out));
    EXPECT_FALSE(StringUtils::NormalizeHost("   ", out));
    EXPECT_FALSE(StringUtils::NormalizeHost("https://", out));
    EXPECT_FALSE(StringUtils::NormalizeHost("bad host.com", out));
    EXPECT_FALSE(StringUtils::NormalizeHost("a..b.com", out));
    EXPECT_FALSE(StringUtils::NormalizeHost(".example.com", out));
    EXPECT_FALSE(StringUtils::NormalizeHost(std::string(254, 'a'), out));
}

TEST(StringUtilsTest, RegistrableDomainCollapsesSubdomains) {
    EXPECT_EQ(StringUtils::RegistrableDomain("www.google.com"), "google.com");
    EXPECT_EQ(StringUtils::RegistrableDomain("a.b.c.example.org"), "example.org");
    EXPECT_EQ(StringUtils::RegistrableDomain("www.news.bbc.co.uk"), "bbc.co.uk");
    EXPECT_EQ(StringUtils::RegistrableDomain("shop.example.com.au"), "example.com.au");
    EXPECT_EQ(StringUtils::RegistrableDomain("co.uk"), "co.uk");
    EXPECT_EQ(StringUtils::RegistrableDomain("localhost"), "localhost");
    EXPECT_EQ(StringUtils::RegistrableDomain("10.0.0.1"), "10.0.0.1");
}

TEST(StringUtilsTest, RegistrableDomainFollowsPublicSuffixList) {
    EXPECT_EQ(StringUtils::RegistrableDomain("www.service-public.gouv.fr"), "service-public.gouv.fr");
    EXPECT_EQ(StringUtils::RegistrableDomain("www.uw.edu.pl"), "uw.edu.pl");
    EXPECT_EQ(StringUtils::RegistrableDomain("www.pw.edu.pl"), "pw.edu.pl");
    EXPECT_EQ(StringUtils::RegistrableDomain("www.canada.gc.ca"), "canada.gc.ca");
    EXPECT_EQ(StringUtils::RegistrableDomain("gouv.fr"), "gouv.fr");
    EXPECT_NE(StringUtils::RegistrableDomain("www.uw.edu.pl"), StringUtils::RegistrableDomain("www.pw.edu.pl"));
}

TEST(StringUtilsTest, HtmlEscapeEscapesMarkup) {
    EXPECT_EQ(StringUtils::HtmlEscape("<a href=\"x\">&'</a>"),
              "&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;");
}

// ============================================================================
// EngineTypes
// ============================================================================

TEST(EngineTypesTest, ParseVerdictIsCaseInsensitive) {
    EXPECT_EQ(ParseVerdict("allowed"), Verdict::Allowed);
    EXPECT_EQ(ParseVerdict(" BLOCKED "), Verdict::Blocked);
    EXPECT_EQ(ParseVerdict("Blocked"), Verdict::Blocked);
    EXPECT_FALSE(ParseVerdict("block").has_value());
    EXPECT_FALSE(ParseVerdict("").has_value());
}

TEST(EngineTypesTest, OracleErrorClassification) {
    EXPECT_TRUE(IsOracleError(ErrorKind::OracleTimeout));
    EXPECT_TRUE(IsOracleError(ErrorKind::OracleNotConfigured));
    EXPECT_FALSE(IsOracleError(ErrorKind::StoreWriteFailure));
    EXPECT_FALSE(IsOracleError(ErrorKind::None));
    EXPECT_EQ(GetErrorKindName(ErrorKind::InvalidPolicyValue), "InvalidPolicyValue");
}

TEST(EngineTypesTest, TimestampFormatting) {
    const auto tp = FromUnixSeconds(1700000000) + std::chrono::milliseconds(250);
    EXPECT_EQ(FormatTimestampUtc(tp), "2023-11-14T22:13:20.250Z");
    EXPECT_EQ(ToUnixSeconds(tp), 1700000000);
}

// ============================================================================
// FileUtils
// ============================================================================

TEST(FileUtilsTest, AtomicWriteReplacesContentAndLeavesNoTempFiles) {
    TempDir dir;
    const auto path = dir / "data.json";

    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(path, "first"));
    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(path, "second"));
    EXPECT_EQ(ReadFile(path), "second");

    size_t entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir.Path())) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(FileUtilsTest, AtomicWriteCreatesParentDirectories) {
    TempDir dir;
    const auto path = dir.Path() / "nested" / "deeper" / "file.txt";
    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(path, "x"));
    EXPECT_EQ(ReadFile(path), "x");
}

TEST(FileUtilsTest, ReadMissingFileReportsError) {
    TempDir dir;
    std::string out = "stale";
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::ReadAllText(dir / "missing.txt", out, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_TRUE(out.empty());
}

TEST(FileUtilsTest, FileIdentityChangesOnRewrite) {
    TempDir dir;
    const auto path = dir / "policy.json";

    EXPECT_FALSE(FileUtils::GetFileIdentity(path).exists);

    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(path, "{}"));
    const auto first = FileUtils::GetFileIdentity(path);
    ASSERT_TRUE(first.exists);
    EXPECT_EQ(first, FileUtils::GetFileIdentity(path));

    // Rename-replace yields a new inode even when size and mtime collide.
    ASSERT_TRUE(FileUtils::WriteAllTextAtomic(path, "[]"));
    EXPECT_NE(first, FileUtils::GetFileIdentity(path));
}

// ============================================================================
// JSONUtils
// ============================================================================

TEST(JSONUtilsTest, ParseReportsOffsetOnError) {
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse("{\"a\": }", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_GT(err.byteOffset, 0u);
}

TEST(JSONUtilsTest, LoadFromFileSkipsBom) {
    TempDir dir;
    const auto path = dir / "bom.json";
    WriteFile(path, "\xEF\xBB\xBF{\"News\": \"allowed\"}");

    JSON::Json j;
    ASSERT_TRUE(JSON::LoadFromFile(path, j));
    EXPECT_EQ(j.at("News").get<std::string>(), "allowed");
}

TEST(JSONUtilsTest, LoadFromMissingFileIsIoError) {
    TempDir dir;
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::LoadFromFile(dir / "nope.json", j, &err));
    EXPECT_TRUE(err.ioError);
}

TEST(JSONUtilsTest, SaveThenLoadPreservesDocument) {
    TempDir dir;
    const auto path = dir / "out.json";
    JSON::Json j = {{"example.com", {{"category", "News"}, {"observedAt", 1700000000}}}};

    JSON::StringifyOptions opt;
    opt.pretty = true;
    ASSERT_TRUE(JSON::SaveToFile(path, j, nullptr, opt));

    const std::string text = ReadFile(path);
    EXPECT_EQ(text.back(), '\n');

    JSON::Json loaded;
    ASSERT_TRUE(JSON::LoadFromFile(path, loaded));
    EXPECT_EQ(loaded, j);
}

TEST(JSONUtilsTest, TypedGetters) {
    JSON::Json j = {{"n", 5}, {"s", "text"}};
    int n = 0;
    EXPECT_TRUE(JSON::Get(j, "n", n));
    EXPECT_EQ(n, 5);
    std::string s;
    EXPECT_FALSE(JSON::Get(j, "n", s));
    EXPECT_EQ(JSON::GetOr<std::string>(j, "missing", "dflt"), "dflt");
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ParseLogLevelNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(ParseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::Warn);
}

namespace {

// Same settings TestMain installs for the whole run.
void RestoreTestLogger() {
    LoggerConfig cfg{};
    cfg.toConsole = true;
    cfg.toFile = false;
    cfg.async = false;
    cfg.minimalLevel = LogLevel::Warn;
    cfg.flushLevel = LogLevel::Error;
    Logger::Instance().Initialize(cfg);
}

void TimedSection() {
    DS_LOG_SCOPE("Timing");
}

}  // namespace

TEST(LoggerTest, ScopeLogsEnterAndExit) {
    TempDir dir;
    LoggerConfig cfg{};
    cfg.toConsole = false;
    cfg.toFile = true;
    cfg.async = false;
    cfg.logDirectory = (dir / "logs").string();
    cfg.baseFileName = "scope";
    cfg.minimalLevel = LogLevel::Debug;
    cfg.flushLevel = LogLevel::Debug;
    Logger::Instance().Initialize(cfg);

    TimedSection();
    Logger::Instance().Flush();
    RestoreTestLogger();

    const std::string log = ReadFile(dir / "logs" / "scope.log");
    EXPECT_NE(log.find("Enter"), std::string::npos);
    EXPECT_NE(log.find("Exit ("), std::string::npos);
    EXPECT_NE(log.find("Timing"), std::string::npos);
}

TEST(LoggerTest, ReconfigureWhileOtherThreadsLog) {
    LoggerConfig cfg{};
    cfg.toConsole = false;
    cfg.toFile = false;
    cfg.async = true;
    cfg.minimalLevel = LogLevel::Info;
    Logger::Instance().Initialize(cfg);

    std::atomic<bool> done{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&done] {
            while (!done.load()) {
                DS_LOG_INFO("Race", "message from a writer thread");
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        cfg.maxQueueSize = (i % 2 == 0) ? 2 : 64;
        cfg.bpPolicy = (i % 2 == 0) ? LoggerConfig::BackPressurePolicy::DropNewest
                                    : LoggerConfig::BackPressurePolicy::DropOldest;
        Logger::Instance().Initialize(cfg);
    }

    done = true;
    for (auto& w : writers) {
        w.join();
    }
    EXPECT_TRUE(Logger::Instance().IsInitialized());
    RestoreTestLogger();
}
