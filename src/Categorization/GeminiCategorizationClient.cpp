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
/**
 * ============================================================================
 * DomainSentry - GEMINI CATEGORIZATION CLIENT IMPLEMENTATION
 * ============================================================================
 *
 * @file GeminiCategorizationClient.cpp
 *
 * ============================================================================
 */

#include "pch.h"
#include "GeminiCategorizationClient.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Categorization {

using namespace Utils;
using json = nlohmann::json;

#define ORACLE_LOG_INFO(fmt, ...)   DS_LOG_INFO("Oracle", fmt, ##__VA_ARGS__)
#define ORACLE_LOG_WARN(fmt, ...)   DS_LOG_WARN("Oracle", fmt, ##__VA_ARGS__)
#define ORACLE_LOG_ERROR(fmt, ...)  DS_LOG_ERROR("Oracle", fmt, ##__VA_ARGS__)
#define ORACLE_LOG_DEBUG(fmt, ...)  DS_LOG_DEBUG("Oracle", fmt, ##__VA_ARGS__)

namespace {

    constexpr const char* CATEGORY_LABELS[] = {
        "Social Media", "News", "Video Streaming", "E-commerce", "Software Development",
        "Cloud Storage", "Communication", "Search Engine", "Phishing", "Malware",
        "Suspicious", "Encyclopedia", "Business", "Content Delivery Network",
        "Adult Content", "Pornography", "Healthcare", "Information Technology",
        "Travel", "Education", "Entertainment", "Shopping", "Vehicles", "Games",
        "Drugs", "AI/ML"
    };

    constexpr const char* PROMPT_GUIDELINES =
        "Guidelines:\n"
        "- If the domain appears dangerous, contains misspellings, obscure TLDs, or is linked to harmful behavior, choose 'Malware' or 'Phishing'.\n"
        "- Use 'Malware' for domains that are likely hosting malicious software or malware distribution.\n"
        "- Use 'Phishing' for domains pretending to be legitimate to steal information.\n"
        "- Use 'Suspicious' for odd or generic domains that might be harmful but aren't clearly phishing or malware.\n"
        "- Even if the domain is unfamiliar, use your judgment based on common threat indicators or name patterns.\n"
        "- If still unsure, return 'Unknown'.\n"
        "\n"
        "Examples:\n"
        "- google.com -> Search Engine\n"
        "- instagram.com -> Social Media\n"
        "- nytimes.com -> News\n"
        "- github.com -> Software Development\n"
        "- dropbox.com -> Cloud Storage\n"
        "- bankofamerica-login.com -> Phishing\n"
        "- update-your-browser-info.ru -> Malware\n"
        "- suspicious-checker.xyz -> Suspicious\n"
        "- xakjduqw.net -> Suspicious\n"
        "- malicious-update-download.com -> Malware\n";

    int64_t ElapsedUs(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
    }

}  // namespace

// ============================================================================
// STRUCT IMPLEMENTATIONS
// ============================================================================

bool GeminiClientConfig::IsValid() const noexcept {
    if (model.empty() || endpoint.empty()) return false;
    if (timeoutMs == 0) return false;
    if (maxLabelLength == 0) return false;
    return true;
}

std::string GeminiClientConfig::ToJson() const {
    json j;
    j["apiKey"] = apiKey.empty() ? "" : "<redacted>";
    j["model"] = model;
    j["endpoint"] = endpoint;
    j["timeoutMs"] = timeoutMs;
    j["maxLabelLength"] = maxLabelLength;
    j["verifySSL"] = verifySSL;
    j["proxy"] = proxy;
    return j.dump();
}

std::string GeminiClientConfig::BuildUrl() const {
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/v1beta/models/" + model + ":generateContent";
}

GeminiClientStatistics::GeminiClientStatistics(const GeminiClientStatistics& other) noexcept {
    *this = other;
}

GeminiClientStatistics& GeminiClientStatistics::operator=(const GeminiClientStatistics& other) noexcept {
    calls = other.calls.load();
    successes = other.successes.load();
    timeouts = other.timeouts.load();
    unreachable = other.unreachable.load();
    rateLimited = other.rateLimited.load();
    malformed = other.malformed.load();
    notConfigured = other.notConfigured.load();
    unknownLabels = other.unknownLabels.load();
    totalLatencyUs = other.totalLatencyUs.load();
    return *this;
}

void GeminiClientStatistics::Reset() noexcept {
    calls = 0;
    successes = 0;
    timeouts = 0;
    unreachable = 0;
    rateLimited = 0;
    malformed = 0;
    notConfigured = 0;
    unknownLabels = 0;
    totalLatencyUs = 0;
}

std::string GeminiClientStatistics::ToJson() const {
    json j;
    j["calls"] = calls.load();
    j["successes"] = successes.load();
    j["timeouts"] = timeouts.load();
    j["unreachable"] = unreachable.load();
    j["rateLimited"] = rateLimited.load();
    j["malformed"] = malformed.load();
    j["notConfigured"] = notConfigured.load();
    j["unknownLabels"] = unknownLabels.load();
    j["totalLatencyUs"] = totalLatencyUs.load();
    const uint64_t n = calls.load();
    j["avgLatencyUs"] = n > 0 ? totalLatencyUs.load() / n : 0;
    return j.dump();
}

// ============================================================================
// PROMPT & RESPONSE HELPERS
// ============================================================================

std::string BuildCategorizationPrompt(std::string_view domain) {
    std::string prompt;
    prompt.reserve(2048);
    prompt += "You are a cybersecurity expert helping categorize website domains "
              "based on their most likely purpose or threat level.\n\n";
    prompt += "Use only one of the following category labels:\n";
    for (const char* label : CATEGORY_LABELS) {
        prompt += "- ";
        prompt += label;
        prompt += '\n';
    }
    prompt += '\n';
    prompt += PROMPT_GUIDELINES;
    prompt += "\nDomain: ";
    prompt.append(domain.data(), domain.size());
    prompt += "\nCategory:\n";
    return prompt;
}

std::string BuildGenerateContentBody(std::string_view domain) {
    json part = json::object();
    part["text"] = BuildCategorizationPrompt(domain);

    json content = json::object();
    content["parts"] = json::array();
    content["parts"].push_back(std::move(part));

    json body = json::object();
    body["contents"] = json::array();
    body["contents"].push_back(std::move(content));
    body["generationConfig"]["temperature"] = 0.0;
    return body.dump();
}

std::string NormalizeCategoryLabel(std::string_view text, size_t maxLabelLength) {
    std::string_view label = StringUtils::TrimView(text);
    if (const auto pos = label.rfind(':'); pos != std::string_view::npos) {
        label = StringUtils::TrimView(label.substr(pos + 1));
    }
    if (label.empty()) {
        return {};
    }
    if (label.size() > maxLabelLength) {
        return GeminiConstants::UNKNOWN_LABEL;
    }
    return std::string(label);
}

bool ExtractCandidateText(std::string_view body, std::string& text) {
    text.clear();

    JSON::Json root;
    if (!JSON::Parse(body, root)) {
        return false;
    }

    try {
        const auto& parts = root.at("candidates").at(0).at("content").at("parts");
        if (!parts.is_array() || parts.empty()) {
            return false;
        }
        const auto& first = parts.at(0).at("text");
        if (!first.is_string()) {
            return false;
        }
        text = first.get<std::string>();
        return true;
    }
    catch (const json::exception&) {
        return false;
    }
}

std::optional<std::chrono::seconds> ParseRetryAfter(std::string_view value) {
    const std::string_view v = StringUtils::TrimView(value);
    if (v.empty() || v.size() > 9) {
        return std::nullopt;
    }
    int64_t seconds = 0;
    for (char c : v) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        seconds = seconds * 10 + (c - '0');
    }
    return std::chrono::seconds(seconds);
}

// ============================================================================
// IMPLEMENTATION CLASS (PIMPL)
// ============================================================================

class GeminiCategorizationClientImpl {
public:
    GeminiCategorizationClientImpl(GeminiClientConfig config, HttpTransport transport)
        : m_config(std::move(config))
        , m_transport(std::move(transport))
        , m_url(m_config.BuildUrl()) {
        if (!m_transport) {
            m_transport = [](std::string_view url, NetworkUtils::HttpResponse& response,
                             const NetworkUtils::HttpRequestOptions& options, NetworkUtils::Error* err) {
                return NetworkUtils::HttpRequest(url, response, options, err);
            };
        }

        if (m_config.apiKey.empty()) {
            ORACLE_LOG_WARN("No API key configured; classification calls will fail with OracleNotConfigured");
        }
    }

    [[nodiscard]] CategorizationResult Classify(std::string_view domain) {
        if (m_config.apiKey.empty()) {
            m_stats.notConfigured++;
            return CategorizationResult::Failure(ErrorKind::OracleNotConfigured, "API key not set");
        }

        m_stats.calls++;
        const auto start = std::chrono::steady_clock::now();

        NetworkUtils::HttpRequestOptions options;
        options.method = NetworkUtils::HttpMethod::POST;
        options.body = BuildGenerateContentBody(domain);
        options.contentType = "application/json";
        options.timeoutMs = m_config.timeoutMs;
        options.verifySSL = m_config.verifySSL;
        options.proxy = m_config.proxy;
        options.headers.push_back({GeminiConstants::API_KEY_HEADER, m_config.apiKey});

        NetworkUtils::HttpResponse response;
        NetworkUtils::Error netErr;
        bool received = false;
        try {
            received = m_transport(m_url, response, options, &netErr);
        }
        catch (const std::exception& ex) {
            netErr.kind = NetworkUtils::TransportError::Other;
            netErr.message = ex.what();
        }

        CategorizationResult result = received
            ? MapResponse(domain, response)
            : MapTransportError(netErr);

        const int64_t us = ElapsedUs(start);
        result.latency = std::chrono::microseconds(us);
        m_stats.totalLatencyUs += static_cast<uint64_t>(us);

        if (result.IsSuccess()) {
            m_stats.successes++;
            ORACLE_LOG_INFO("Oracle returned category '%s' for domain '%.*s' in %.2f ms",
                            result.category.c_str(), static_cast<int>(domain.size()), domain.data(),
                            static_cast<double>(us) / 1000.0);
        } else {
            ORACLE_LOG_ERROR("%s for domain '%.*s': %s",
                             std::string(GetErrorKindName(result.error)).c_str(),
                             static_cast<int>(domain.size()), domain.data(), result.message.c_str());
        }
        return result;
    }

    [[nodiscard]] bool IsConfigured() const noexcept {
        return !m_config.apiKey.empty();
    }

    [[nodiscard]] GeminiClientStatistics GetStatistics() const {
        return m_stats;
    }

    void ResetStatistics() {
        m_stats.Reset();
    }

    [[nodiscard]] const GeminiClientConfig& GetConfig() const noexcept {
        return m_config;
    }

private:
    CategorizationResult MapTransportError(const NetworkUtils::Error& err) {
        using NetworkUtils::TransportError;

        switch (err.kind) {
            case TransportError::Timeout:
                m_stats.timeouts++;
                return CategorizationResult::Failure(ErrorKind::OracleTimeout, err.message);
            case TransportError::TooLarge:
                m_stats.malformed++;
                return CategorizationResult::Failure(ErrorKind::OracleMalformedResponse, err.message);
            default:
                m_stats.unreachable++;
                return CategorizationResult::Failure(ErrorKind::OracleUnreachable,
                    std::string(NetworkUtils::TransportErrorName(err.kind)) + ": " + err.message);
        }
    }

    CategorizationResult MapResponse(std::string_view domain, const NetworkUtils::HttpResponse& response) {
        const uint32_t status = response.statusCode;
        CategorizationResult result;

        if (status == 429) {
            m_stats.rateLimited++;
            result = CategorizationResult::Failure(ErrorKind::OracleRateLimited, "HTTP 429");
            if (auto header = response.FindHeader("Retry-After")) {
                result.retryAfter = ParseRetryAfter(*header);
            }
        } else if (status == 408 || status == 504) {
            m_stats.timeouts++;
            result = CategorizationResult::Failure(ErrorKind::OracleTimeout, "HTTP " + std::to_string(status));
        } else if (status < 200 || status >= 300) {
            m_stats.unreachable++;
            result = CategorizationResult::Failure(ErrorKind::OracleUnreachable, "HTTP " + std::to_string(status));
        } else {
            std::string text;
            if (!ExtractCandidateText(response.body, text)) {
                m_stats.malformed++;
                result = CategorizationResult::Failure(ErrorKind::OracleMalformedResponse,
                                                       "response has no candidate text");
            } else {
                std::string label = NormalizeCategoryLabel(text, m_config.maxLabelLength);
                if (label.empty()) {
                    m_stats.malformed++;
                    result = CategorizationResult::Failure(ErrorKind::OracleMalformedResponse, "empty category label");
                } else {
                    if (label == GeminiConstants::UNKNOWN_LABEL &&
                        StringUtils::TrimView(text).size() > m_config.maxLabelLength) {
                        m_stats.unknownLabels++;
                        ORACLE_LOG_WARN("Unusual category for %.*s ('%s'); defaulting to Unknown",
                                        static_cast<int>(domain.size()), domain.data(), text.c_str());
                    }
                    result = CategorizationResult::Success(std::move(label));
                }
            }
        }

        result.httpStatus = status;
        return result;
    }

    GeminiClientConfig m_config;
    HttpTransport m_transport;
    std::string m_url;
    mutable GeminiClientStatistics m_stats;
};

// ============================================================================
// FACADE
// ============================================================================

GeminiCategorizationClient::GeminiCategorizationClient(GeminiClientConfig config, HttpTransport transport)
    : m_impl(std::make_unique<GeminiCategorizationClientImpl>(std::move(config), std::move(transport))) {
}

GeminiCategorizationClient::~GeminiCategorizationClient() = default;

CategorizationResult GeminiCategorizationClient::Classify(std::string_view domain) {
    return m_impl->Classify(domain);
}

bool GeminiCategorizationClient::IsConfigured() const noexcept {
    return m_impl->IsConfigured();
}

GeminiClientStatistics GeminiCategorizationClient::GetStatistics() const {
    return m_impl->GetStatistics();
}

void GeminiCategorizationClient::ResetStatistics() {
    m_impl->ResetStatistics();
}

const GeminiClientConfig& GeminiCategorizationClient::GetConfig() const noexcept {
    return m_impl->GetConfig();
}

}  // namespace Categorization
}  // namespace DomainSentry
