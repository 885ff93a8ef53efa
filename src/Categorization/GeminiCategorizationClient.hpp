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
 * DomainSentry - GEMINI CATEGORIZATION CLIENT
 * ============================================================================
 *
 * @file GeminiCategorizationClient.hpp
 * @brief Categorization oracle backed by the Google Gemini generateContent API.
 *
 * REQUEST:
 * ========
 *   POST {endpoint}/v1beta/models/{model}:generateContent
 *   x-goog-api-key: <key>
 *   {"contents":[{"parts":[{"text": <prompt>}]}],
 *    "generationConfig":{"temperature":0.0}}
 *
 * RESPONSE MAPPING:
 * =================
 *   2xx + candidates[0].content.parts[0].text -> label
 *   429                                       -> OracleRateLimited (+Retry-After)
 *   408, 504, transport timeout               -> OracleTimeout
 *   other status, connect/DNS/TLS failure     -> OracleUnreachable
 *   2xx without usable text                   -> OracleMalformedResponse
 *   no API key                                -> OracleNotConfigured (no call)
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <atomic>
#include <memory>

#include "CategorizationClient.hpp"
#include "../Utils/NetworkUtils.hpp"

namespace DomainSentry::Categorization {
    class GeminiCategorizationClientImpl;
}

namespace DomainSentry {
namespace Categorization {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace GeminiConstants {

    inline constexpr const char* DEFAULT_ENDPOINT = "https://generativelanguage.googleapis.com";

    inline constexpr const char* DEFAULT_MODEL = "gemini-2.5-flash";

    inline constexpr uint32_t DEFAULT_TIMEOUT_MS = 5000;

    /// @brief Longer labels are treated as a confused answer
    inline constexpr size_t MAX_LABEL_LENGTH = 50;

    inline constexpr const char* UNKNOWN_LABEL = "Unknown";

    inline constexpr const char* API_KEY_HEADER = "x-goog-api-key";

}  // namespace GeminiConstants

// ============================================================================
// STRUCTURES
// ============================================================================

struct GeminiClientConfig {
    /// @brief API key; empty = not configured
    std::string apiKey;

    std::string model = GeminiConstants::DEFAULT_MODEL;

    /// @brief Base URL without trailing path
    std::string endpoint = GeminiConstants::DEFAULT_ENDPOINT;

    /// @brief Whole-call timeout
    uint32_t timeoutMs = GeminiConstants::DEFAULT_TIMEOUT_MS;

    size_t maxLabelLength = GeminiConstants::MAX_LABEL_LENGTH;

    bool verifySSL = true;

    /// @brief Empty = libcurl environment defaults
    std::string proxy;

    [[nodiscard]] bool IsValid() const noexcept;

    /// @brief Serialized config with the key redacted
    [[nodiscard]] std::string ToJson() const;

    /// @brief Full generateContent URL
    [[nodiscard]] std::string BuildUrl() const;
};

struct GeminiClientStatistics {
    std::atomic<uint64_t> calls{0};
    std::atomic<uint64_t> successes{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> unreachable{0};
    std::atomic<uint64_t> rateLimited{0};
    std::atomic<uint64_t> malformed{0};
    std::atomic<uint64_t> notConfigured{0};
    std::atomic<uint64_t> unknownLabels{0};
    std::atomic<uint64_t> totalLatencyUs{0};

    GeminiClientStatistics() = default;
    GeminiClientStatistics(const GeminiClientStatistics& other) noexcept;
    GeminiClientStatistics& operator=(const GeminiClientStatistics& other) noexcept;

    void Reset() noexcept;
    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief HTTP transport used by the client. Defaults to NetworkUtils::HttpRequest.
 */
using HttpTransport = std::function<bool(std::string_view url,
                                         Utils::NetworkUtils::HttpResponse& response,
                                         const Utils::NetworkUtils::HttpRequestOptions& options,
                                         Utils::NetworkUtils::Error* err)>;

// ============================================================================
// PROMPT & RESPONSE HELPERS
// ============================================================================

/// @brief Category-labelling prompt for one domain
[[nodiscard]] std::string BuildCategorizationPrompt(std::string_view domain);

/// @brief generateContent request body (temperature 0)
[[nodiscard]] std::string BuildGenerateContentBody(std::string_view domain);

/**
 * @brief Reduce raw model text to a label.
 *
 * Trims, keeps the part after the last ':' and trims again. A label longer
 * than maxLabelLength becomes "Unknown". Returns an empty string when nothing
 * is left.
 */
[[nodiscard]] std::string NormalizeCategoryLabel(std::string_view text, size_t maxLabelLength);

/**
 * @brief Extract candidates[0].content.parts[0].text from a response body.
 * @return false when the body is not JSON or lacks the text field
 */
[[nodiscard]] bool ExtractCandidateText(std::string_view body, std::string& text);

/**
 * @brief Parse a Retry-After header value (delta-seconds form only)
 */
[[nodiscard]] std::optional<std::chrono::seconds> ParseRetryAfter(std::string_view value);

// ============================================================================
// CLIENT CLASS
// ============================================================================

/**
 * @class GeminiCategorizationClient
 * @brief Production oracle client. Thread-safe; holds no per-call state.
 */
class GeminiCategorizationClient final : public ICategorizationClient {
public:
    explicit GeminiCategorizationClient(GeminiClientConfig config, HttpTransport transport = {});
    ~GeminiCategorizationClient() override;

    GeminiCategorizationClient(const GeminiCategorizationClient&) = delete;
    GeminiCategorizationClient& operator=(const GeminiCategorizationClient&) = delete;

    [[nodiscard]] CategorizationResult Classify(std::string_view domain) override;

    [[nodiscard]] bool IsConfigured() const noexcept override;

    [[nodiscard]] GeminiClientStatistics GetStatistics() const;

    void ResetStatistics();

    [[nodiscard]] const GeminiClientConfig& GetConfig() const noexcept;

private:
    std::unique_ptr<GeminiCategorizationClientImpl> m_impl;
};

}  // namespace Categorization
}  // namespace DomainSentry
