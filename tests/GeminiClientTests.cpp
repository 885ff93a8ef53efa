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

#include "Categorization/GeminiCategorizationClient.hpp"
#include "Utils/JSONUtils.hpp"

using namespace DomainSentry;
using namespace DomainSentry::Categorization;
namespace Net = DomainSentry::Utils::NetworkUtils;

namespace {

/// Transport double that records the request and replays a canned outcome.
struct FakeTransport {
    struct Captured {
        std::string url;
        Net::HttpRequestOptions options;
        int calls = 0;
    };

    std::shared_ptr<Captured> captured = std::make_shared<Captured>();
    bool delivered = true;
    Net::HttpResponse response;
    Net::TransportError failure = Net::TransportError::None;

    HttpTransport Make() const {
        auto cap = captured;
        auto resp = response;
        auto ok = delivered;
        auto fail = failure;
        return [cap, resp, ok, fail](std::string_view url, Net::HttpResponse& out,
                                     const Net::HttpRequestOptions& options, Net::Error* err) {
            cap->url = std::string(url);
            cap->options = options;
            cap->calls++;
            if (!ok) {
                if (err) {
                    err->kind = fail;
                    err->message = "simulated";
                }
                return false;
            }
            out = resp;
            return true;
        };
    }
};

std::string CandidateBody(const std::string& text) {
    Utils::JSON::Json part = Utils::JSON::Json::object();
    part["text"] = text;
    Utils::JSON::Json content = Utils::JSON::Json::object();
    content["parts"] = Utils::JSON::Json::array({part});
    Utils::JSON::Json candidate = Utils::JSON::Json::object();
    candidate["content"] = content;
    Utils::JSON::Json root = Utils::JSON::Json::object();
    root["candidates"] = Utils::JSON::Json::array({candidate});
    return root.dump();
}

GeminiClientConfig KeyedConfig() {
    GeminiClientConfig cfg;
    cfg.apiKey = "test-key";
    return cfg;
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(GeminiHelpersTest, NormalizeLabelTakesTextAfterLastColon) {
    EXPECT_EQ(NormalizeCategoryLabel("  Technology \n", 50), "Technology");
    EXPECT_EQ(NormalizeCategoryLabel("Category: News", 50), "News");
    EXPECT_EQ(NormalizeCategoryLabel("Answer: Category:  Social Media ", 50), "Social Media");
    EXPECT_EQ(NormalizeCategoryLabel("   ", 50), "");
    EXPECT_EQ(NormalizeCategoryLabel("Category:", 50), "");
    EXPECT_EQ(NormalizeCategoryLabel(std::string(51, 'x'), 50), "Unknown");
    EXPECT_EQ(NormalizeCategoryLabel(std::string(50, 'x'), 50), std::string(50, 'x'));
}

TEST(GeminiHelpersTest, ExtractCandidateText) {
    std::string text;
    EXPECT_TRUE(ExtractCandidateText(CandidateBody("Gaming"), text));
    EXPECT_EQ(text, "Gaming");

    EXPECT_FALSE(ExtractCandidateText("not json", text));
    EXPECT_FALSE(ExtractCandidateText(R"({"candidates": []})", text));
    EXPECT_FALSE(ExtractCandidateText(R"({"candidates": [{"content": {"parts": []}}]})", text));
    EXPECT_FALSE(ExtractCandidateText(R"({"candidates": [{"content": {"parts": [{"text": 7}]}}]})", text));
}

TEST(GeminiHelpersTest, ParseRetryAfterAcceptsDeltaSecondsOnly) {
    EXPECT_EQ(ParseRetryAfter(" 12 "), std::chrono::seconds(12));
    EXPECT_EQ(ParseRetryAfter("0"), std::chrono::seconds(0));
    EXPECT_FALSE(ParseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
    EXPECT_FALSE(ParseRetryAfter("-1").has_value());
    EXPECT_FALSE(ParseRetryAfter("").has_value());
}

TEST(GeminiHelpersTest, RequestBodyCarriesPromptAndZeroTemperature) {
    Utils::JSON::Json body;
    ASSERT_TRUE(Utils::JSON::Parse(BuildGenerateContentBody("example.com"), body));

    const auto text = body.at("contents").at(0).at("parts").at(0).at("text").get<std::string>();
    EXPECT_NE(text.find("example.com"), std::string::npos);
    EXPECT_NE(text.find("Technology"), std::string::npos);
    EXPECT_EQ(body.at("generationConfig").at("temperature").get<double>(), 0.0);
}

TEST(GeminiHelpersTest, ConfigBuildsUrlAndRedactsKey) {
    GeminiClientConfig cfg = KeyedConfig();
    cfg.endpoint = "http://127.0.0.1:8080/";
    cfg.model = "gemini-test";
    EXPECT_EQ(cfg.BuildUrl(), "http://127.0.0.1:8080/v1beta/models/gemini-test:generateContent");
    EXPECT_EQ(cfg.ToJson().find("test-key"), std::string::npos);
    EXPECT_TRUE(cfg.IsValid());
}

// ============================================================================
// Client
// ============================================================================

TEST(GeminiClientTest, MissingKeyFailsWithoutCallingTransport) {
    FakeTransport fake;
    GeminiCategorizationClient client(GeminiClientConfig{}, fake.Make());

    EXPECT_FALSE(client.IsConfigured());
    const auto result = client.Classify("example.com");
    EXPECT_EQ(result.error, ErrorKind::OracleNotConfigured);
    EXPECT_EQ(fake.captured->calls, 0);
    EXPECT_EQ(client.GetStatistics().notConfigured.load(), 1u);
}

TEST(GeminiClientTest, SuccessfulCallSendsKeyHeaderAndReturnsLabel) {
    FakeTransport fake;
    fake.response.statusCode = 200;
    fake.response.body = CandidateBody("Category: Technology\n");
    GeminiCategorizationClient client(KeyedConfig(), fake.Make());

    const auto result = client.Classify("github.com");
    ASSERT_TRUE(result.IsSuccess()) << result.message;
    EXPECT_EQ(result.category, "Technology");
    EXPECT_EQ(result.httpStatus, 200u);

    EXPECT_EQ(fake.captured->calls, 1);
    EXPECT_EQ(fake.captured->url, KeyedConfig().BuildUrl());
    EXPECT_EQ(fake.captured->options.method, Net::HttpMethod::POST);
    EXPECT_EQ(fake.captured->options.contentType, "application/json");
    EXPECT_EQ(fake.captured->options.timeoutMs, GeminiConstants::DEFAULT_TIMEOUT_MS);

    bool sawKey = false;
    for (const auto& h : fake.captured->options.headers) {
        if (h.name == GeminiConstants::API_KEY_HEADER && h.value == "test-key") sawKey = true;
    }
    EXPECT_TRUE(sawKey);
    EXPECT_NE(fake.captured->options.body.find("github.com"), std::string::npos);
}

TEST(GeminiClientTest, OverlongLabelBecomesUnknown) {
    FakeTransport fake;
    fake.response.statusCode = 200;
    fake.response.body = CandidateBody("I am not sure what this website is about, it might be several things");
    GeminiCategorizationClient client(KeyedConfig(), fake.Make());

    const auto result = client.Classify("weird.example");
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.category, "Unknown");
    EXPECT_EQ(client.GetStatistics().unknownLabels.load(), 1u);
}

TEST(GeminiClientTest, RateLimitCarriesRetryAfter) {
    FakeTransport fake;
    fake.response.statusCode = 429;
    fake.response.headers.push_back({"retry-after", "7"});
    GeminiCategorizationClient client(KeyedConfig(), fake.Make());

    const auto result = client.Classify("example.com");
    EXPECT_EQ(result.error, ErrorKind::OracleRateLimited);
    ASSERT_TRUE(result.retryAfter.has_value());
    EXPECT_EQ(*result.retryAfter, std::chrono::seconds(7));
    EXPECT_EQ(result.httpStatus, 429u);
}

TEST(GeminiClientTest, StatusMapping) {
    struct Case { uint32_t status; ErrorKind expected; };
    const Case cases[] = {
        {504, ErrorKind::OracleTimeout},
        {408, ErrorKind::OracleTimeout},
        {500, ErrorKind::OracleUnreachable},
        {403, ErrorKind::OracleUnreachable},
    };
    for (const auto& c : cases) {
        FakeTransport fake;
        fake.response.statusCode = c.status;
        GeminiCategorizationClient client(KeyedConfig(), fake.Make());
        EXPECT_EQ(client.Classify("example.com").error, c.expected) << "HTTP " << c.status;
    }
}

TEST(GeminiClientTest, TransportFailureMapping) {
    struct Case { Net::TransportError failure; ErrorKind expected; };
    const Case cases[] = {
        {Net::TransportError::Timeout, ErrorKind::OracleTimeout},
        {Net::TransportError::Resolve, ErrorKind::OracleUnreachable},
        {Net::TransportError::Connect, ErrorKind::OracleUnreachable},
        {Net::TransportError::Tls, ErrorKind::OracleUnreachable},
        {Net::TransportError::TooLarge, ErrorKind::OracleMalformedResponse},
    };
    for (const auto& c : cases) {
        FakeTransport fake;
        fake.delivered = false;
        fake.failure = c.failure;
        GeminiCategorizationClient client(KeyedConfig(), fake.Make());
        EXPECT_EQ(client.Classify("example.com").error, c.expected)
            << Net::TransportErrorName(c.failure);
    }
}

TEST(GeminiClientTest, SuccessStatusWithoutTextIsMalformed) {
    FakeTransport fake;
    fake.response.statusCode = 200;
    fake.response.body = R"({"promptFeedback": {"blockReason": "SAFETY"}})";
    GeminiCategorizationClient client(KeyedConfig(), fake.Make());
    EXPECT_EQ(client.Classify("example.com").error, ErrorKind::OracleMalformedResponse);

    FakeTransport empty;
    empty.response.statusCode = 200;
    empty.response.body = CandidateBody("  ");
    GeminiCategorizationClient client2(KeyedConfig(), empty.Make());
    EXPECT_EQ(client2.Classify("example.com").error, ErrorKind::OracleMalformedResponse);
}

TEST(GeminiClientTest, ThrowingTransportIsUnreachable) {
    HttpTransport throwing = [](std::string_view, Net::HttpResponse&, const Net::HttpRequestOptions&, Net::Error*) -> bool {
        throw std::runtime_error("boom");
    };
    GeminiCategorizationClient client(KeyedConfig(), throwing);
    EXPECT_EQ(client.Classify("example.com").error, ErrorKind::OracleUnreachable);
}
