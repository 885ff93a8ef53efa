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
 * DomainSentry - CONFIGURATION MANAGER
 * ============================================================================
 *
 * @file ConfigManager.hpp
 * @brief Engine configuration: defaults, JSON file, environment overrides.
 *
 * LAYERS (lowest to highest priority):
 * ====================================
 *   1. Factory defaults (EngineConfig{})
 *   2. JSON file (DOMAINSENTRY_CONFIG or an explicit path)
 *   3. Environment variables (DOMAINSENTRY_*, GOOGLE_API_KEY)
 *
 * FILE LAYOUT:
 * ============
 * @code
 *   {
 *     "oracle":     {"model": "...", "endpoint": "...", "timeoutMs": 5000,
 *                    "maxAttempts": 2, "initialBackoffMs": 250, "maxBackoffMs": 4000,
 *                    "verifySSL": true, "proxy": ""},
 *     "classifier": {"fallbackCategory": "Uncategorized", "maxConcurrentLookups": 8,
 *                    "maxQueuedLookups": 1024, "resolveDeadlineMs": 12000,
 *                    "collapseToRegistrableDomain": true},
 *     "store":      {"cacheFile": "...", "policyFile": "...", "cacheTtlSeconds": 0,
 *                    "writeAttempts": 3, "writeBackoffMs": 50, "policyRefreshIntervalMs": 0},
 *     "gateway":    {"fallbackVerdict": "allowed", "activityLog": "...",
 *                    "blockPage": "...", "logDecisions": true},
 *     "logging":    {"directory": "logs", "level": "info", "console": true,
 *                    "file": true, "jsonLines": false}
 *   }
 * @endcode
 *
 * The API key is only taken from the environment.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

#include "../Storage/CategoryStore.hpp"
#include "../Categorization/GeminiCategorizationClient.hpp"
#include "../Categorization/RetryPolicy.hpp"
#include "../Categorization/DomainClassifier.hpp"
#include "../Gateway/EnforcementGateway.hpp"
#include "../Gateway/BlockPage.hpp"
#include "../Utils/Logger.hpp"

namespace DomainSentry {
namespace Config {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace ConfigConstants {

    inline constexpr const char* ENV_CONFIG_FILE        = "DOMAINSENTRY_CONFIG";
    inline constexpr const char* ENV_API_KEY            = "GOOGLE_API_KEY";
    inline constexpr const char* ENV_MODEL              = "DOMAINSENTRY_MODEL";
    inline constexpr const char* ENV_ORACLE_ENDPOINT    = "DOMAINSENTRY_ORACLE_ENDPOINT";
    inline constexpr const char* ENV_ORACLE_TIMEOUT_MS  = "DOMAINSENTRY_ORACLE_TIMEOUT_MS";
    inline constexpr const char* ENV_ORACLE_MAX_ATTEMPTS = "DOMAINSENTRY_ORACLE_MAX_ATTEMPTS";
    inline constexpr const char* ENV_RESOLVE_DEADLINE_MS = "DOMAINSENTRY_RESOLVE_DEADLINE_MS";
    inline constexpr const char* ENV_CACHE_FILE         = "DOMAINSENTRY_CACHE_FILE";
    inline constexpr const char* ENV_POLICY_FILE        = "DOMAINSENTRY_POLICY_FILE";
    inline constexpr const char* ENV_ACTIVITY_LOG       = "DOMAINSENTRY_ACTIVITY_LOG";
    inline constexpr const char* ENV_BLOCK_PAGE         = "DOMAINSENTRY_BLOCK_PAGE";
    inline constexpr const char* ENV_FALLBACK_VERDICT   = "DOMAINSENTRY_FALLBACK_VERDICT";
    inline constexpr const char* ENV_FALLBACK_CATEGORY  = "DOMAINSENTRY_FALLBACK_CATEGORY";
    inline constexpr const char* ENV_CACHE_TTL_SECONDS  = "DOMAINSENTRY_CACHE_TTL_SECONDS";
    inline constexpr const char* ENV_LOG_DIR            = "DOMAINSENTRY_LOG_DIR";
    inline constexpr const char* ENV_LOG_LEVEL          = "DOMAINSENTRY_LOG_LEVEL";

    inline constexpr const char* DEFAULT_ACTIVITY_LOG = "activity.jsonl";

}  // namespace ConfigConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Validation result
 */
enum class ValidationResult : uint8_t {
    Valid           = 0,
    InvalidType     = 1,
    OutOfRange      = 2,
    InvalidFormat   = 3,
    Unreadable      = 4
};

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Configuration validation error
 */
struct ConfigValidationError {
    /// @brief Key with error ("oracle.timeoutMs", "DOMAINSENTRY_LOG_LEVEL", ...)
    std::string key;

    ValidationResult result = ValidationResult::InvalidFormat;

    std::string message;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Logger settings as configured by the operator
 */
struct LoggingSettings {
    std::string directory = "logs";
    Utils::LogLevel level = Utils::LogLevel::Info;
    bool toConsole = true;
    bool toFile = true;
    bool jsonLines = false;
};

/**
 * @brief Everything needed to assemble the engine
 */
struct EngineConfig {
    Storage::CategoryStoreConfig store;
    Categorization::GeminiClientConfig oracle;
    Categorization::RetryConfig retry;
    Categorization::ClassifierConfig classifier;
    Gateway::GatewayConfig gateway;
    LoggingSettings logging;

    std::filesystem::path activityLogPath = ConfigConstants::DEFAULT_ACTIVITY_LOG;
    std::filesystem::path blockPagePath = Gateway::BlockPageConstants::DEFAULT_FILE;

    [[nodiscard]] bool IsValid() const noexcept;

    /// @brief Serialized config; API key redacted
    [[nodiscard]] std::string ToJson() const;

    [[nodiscard]] Utils::LoggerConfig ToLoggerConfig() const;
};

/// @brief Environment accessor; nullopt when the variable is unset
using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

/// @brief Reads the process environment
[[nodiscard]] std::optional<std::string> ProcessEnvironment(const char* name);

// ============================================================================
// CONFIG MANAGER CLASS
// ============================================================================

/**
 * @class ConfigManager
 * @brief Builds an EngineConfig layer by layer, collecting every error.
 *
 * Not thread-safe; used during startup only.
 */
class ConfigManager final {
public:
    ConfigManager() = default;

    /**
     * @brief Merge a JSON config file over the current values.
     * @return false when the file is unreadable or any key is invalid
     */
    bool LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Merge a JSON document over the current values.
     */
    bool LoadFromJson(std::string_view jsonText, const std::string& source = "<memory>");

    /**
     * @brief Apply environment overrides.
     * @return false when any variable holds an invalid value
     */
    bool ApplyEnvironment(const EnvironmentLookup& lookup = ProcessEnvironment);

    /**
     * @brief Defaults, then DOMAINSENTRY_CONFIG (if set), then environment.
     */
    bool LoadDefault(const EnvironmentLookup& lookup = ProcessEnvironment);

    /**
     * @brief Cross-field validation of the assembled config.
     */
    [[nodiscard]] bool Validate();

    [[nodiscard]] const EngineConfig& Get() const noexcept { return m_config; }

    [[nodiscard]] EngineConfig& Mutable() noexcept { return m_config; }

    [[nodiscard]] const std::vector<ConfigValidationError>& GetErrors() const noexcept { return m_errors; }

    /// @brief Errors as "key: message" lines
    [[nodiscard]] std::string FormatErrors() const;

    void ClearErrors() noexcept { m_errors.clear(); }

private:
    void AddError(std::string key, ValidationResult result, std::string message);

    EngineConfig m_config;
    std::vector<ConfigValidationError> m_errors;
};

}  // namespace Config
}  // namespace DomainSentry
