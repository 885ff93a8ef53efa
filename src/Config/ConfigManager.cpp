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
 * @file ConfigManager.cpp
 */

#include "pch.h"
#include "ConfigManager.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <cstdlib>
#include <limits>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Config {

using Utils::JSON::Json;

namespace {

    using ErrorList = std::vector<ConfigValidationError>;

    void Push(ErrorList& errors, std::string key, ValidationResult result, std::string message) {
        ConfigValidationError e;
        e.key = std::move(key);
        e.result = result;
        e.message = std::move(message);
        errors.push_back(std::move(e));
    }

    std::string Key(const char* section, const char* key) {
        return std::string(section) + "." + key;
    }

    bool ParseUnsigned(std::string_view text, uint64_t minValue, uint64_t maxValue, uint64_t& out) {
        const std::string_view v = Utils::StringUtils::TrimView(text);
        if (v.empty() || v.size() > 19) {
            return false;
        }
        uint64_t value = 0;
        for (char c : v) {
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
        }
        if (value < minValue || value > maxValue) {
            return false;
        }
        out = value;
        return true;
    }

    // ========================================================================
    // JSON SECTION READERS
    // ========================================================================

    class SectionReader {
    public:
        SectionReader(const Json& root, const char* name, ErrorList& errors)
            : m_name(name)
            , m_errors(errors) {
            auto it = root.find(name);
            if (it == root.end()) {
                return;
            }
            if (!it->is_object()) {
                Push(m_errors, name, ValidationResult::InvalidType, "section must be an object");
                return;
            }
            m_section = &*it;
        }

        template <typename T>
        void Unsigned(const char* key, uint64_t minValue, uint64_t maxValue, T& out) {
            const Json* v = Find(key);
            if (v == nullptr) return;
            if (!v->is_number_unsigned() && !(v->is_number_integer() && v->get<int64_t>() >= 0)) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidType, "expected a non-negative integer");
                return;
            }
            const uint64_t value = v->get<uint64_t>();
            if (value < minValue || value > maxValue) {
                Push(m_errors, Key(m_name, key), ValidationResult::OutOfRange,
                     "must be between " + std::to_string(minValue) + " and " + std::to_string(maxValue));
                return;
            }
            out = static_cast<T>(value);
        }

        void Milliseconds(const char* key, uint64_t minValue, uint64_t maxValue, std::chrono::milliseconds& out) {
            uint64_t value = static_cast<uint64_t>(out.count());
            Unsigned(key, minValue, maxValue, value);
            out = std::chrono::milliseconds(value);
        }

        void Double(const char* key, double minValue, double maxValue, double& out) {
            const Json* v = Find(key);
            if (v == nullptr) return;
            if (!v->is_number()) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidType, "expected a number");
                return;
            }
            const double value = v->get<double>();
            if (value < minValue || value > maxValue) {
                Push(m_errors, Key(m_name, key), ValidationResult::OutOfRange, "value out of range");
                return;
            }
            out = value;
        }

        void Bool(const char* key, bool& out) {
            const Json* v = Find(key);
            if (v == nullptr) return;
            if (!v->is_boolean()) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidType, "expected true or false");
                return;
            }
            out = v->get<bool>();
        }

        void String(const char* key, std::string& out, bool allowEmpty = false) {
            const Json* v = Find(key);
            if (v == nullptr) return;
            if (!v->is_string()) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidType, "expected a string");
                return;
            }
            std::string value = v->get<std::string>();
            if (!allowEmpty && Utils::StringUtils::TrimView(value).empty()) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidFormat, "must not be empty");
                return;
            }
            out = std::move(value);
        }

        void Path(const char* key, std::filesystem::path& out) {
            std::string value = out.string();
            String(key, value);
            out = value;
        }

        void VerdictValue(const char* key, Verdict& out) {
            std::string value;
            const size_t before = m_errors.size();
            String(key, value);
            if (value.empty() || m_errors.size() != before) return;
            if (auto v = ParseVerdict(value)) {
                out = *v;
            } else {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidFormat, "expected \"allowed\" or \"blocked\"");
            }
        }

        void Level(const char* key, Utils::LogLevel& out) {
            std::string value;
            const size_t before = m_errors.size();
            String(key, value);
            if (value.empty() || m_errors.size() != before) return;
            if (!Utils::ParseLogLevel(value, out)) {
                Push(m_errors, Key(m_name, key), ValidationResult::InvalidFormat,
                     "expected trace, debug, info, warn, error or fatal");
            }
        }

    private:
        const Json* Find(const char* key) const {
            if (m_section == nullptr) return nullptr;
            auto it = m_section->find(key);
            return it == m_section->end() ? nullptr : &*it;
        }

        const char* m_name;
        ErrorList& m_errors;
        const Json* m_section = nullptr;
    };

}  // namespace

// ============================================================================
// STRUCT IMPLEMENTATIONS
// ============================================================================

std::string ConfigValidationError::ToJson() const {
    nlohmann::json j;
    j["key"] = key;
    j["result"] = static_cast<int>(result);
    j["message"] = message;
    return j.dump();
}

bool EngineConfig::IsValid() const noexcept {
    return store.IsValid() &&
           oracle.IsValid() &&
           retry.IsValid() &&
           classifier.IsValid() &&
           !activityLogPath.empty();
}

std::string EngineConfig::ToJson() const {
    nlohmann::json j;
    j["store"] = nlohmann::json::parse(store.ToJson());
    j["oracle"] = nlohmann::json::parse(oracle.ToJson());
    j["retry"] = nlohmann::json::parse(retry.ToJson());
    j["classifier"] = nlohmann::json::parse(classifier.ToJson());
    j["gateway"] = nlohmann::json::parse(gateway.ToJson());
    j["logging"] = {
        {"directory", logging.directory},
        {"level", Utils::LogLevelName(logging.level)},
        {"console", logging.toConsole},
        {"file", logging.toFile},
        {"jsonLines", logging.jsonLines}
    };
    j["activityLog"] = activityLogPath.string();
    j["blockPage"] = blockPagePath.string();
    return j.dump();
}

Utils::LoggerConfig EngineConfig::ToLoggerConfig() const {
    Utils::LoggerConfig cfg;
    cfg.logDirectory = logging.directory;
    cfg.minimalLevel = logging.level;
    cfg.toConsole = logging.toConsole;
    cfg.toFile = logging.toFile;
    cfg.jsonLines = logging.jsonLines;
    return cfg;
}

std::optional<std::string> ProcessEnvironment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ============================================================================
// CONFIG MANAGER
// ============================================================================

void ConfigManager::AddError(std::string key, ValidationResult result, std::string message) {
    Push(m_errors, std::move(key), result, std::move(message));
}

bool ConfigManager::LoadFromFile(const std::filesystem::path& path) {
    Json root;
    Utils::JSON::Error err;
    if (!Utils::JSON::LoadFromFile(path, root, &err)) {
        AddError(path.string(), err.ioError ? ValidationResult::Unreadable : ValidationResult::InvalidFormat,
                 err.message);
        return false;
    }
    return LoadFromJson(root.dump(), path.string());
}

bool ConfigManager::LoadFromJson(std::string_view jsonText, const std::string& source) {
    Json root;
    Utils::JSON::Error err;
    if (!Utils::JSON::Parse(jsonText, root, &err)) {
        AddError(source, ValidationResult::InvalidFormat, err.message);
        return false;
    }
    if (!root.is_object()) {
        AddError(source, ValidationResult::InvalidType, "top-level value must be an object");
        return false;
    }

    const size_t before = m_errors.size();
    EngineConfig& c = m_config;

    SectionReader oracle(root, "oracle", m_errors);
    oracle.String("model", c.oracle.model);
    oracle.String("endpoint", c.oracle.endpoint);
    oracle.Unsigned("timeoutMs", 1, 600000, c.oracle.timeoutMs);
    oracle.Unsigned("maxAttempts", 1, 10, c.retry.maxAttempts);
    oracle.Unsigned("initialBackoffMs", 0, 600000, c.retry.initialDelayMs);
    oracle.Unsigned("maxBackoffMs", 0, 600000, c.retry.maxDelayMs);
    oracle.Double("backoffMultiplier", 1.0, 10.0, c.retry.backoffMultiplier);
    oracle.Bool("verifySSL", c.oracle.verifySSL);
    oracle.String("proxy", c.oracle.proxy, true);

    SectionReader classifier(root, "classifier", m_errors);
    classifier.String("fallbackCategory", c.classifier.fallbackCategory);
    classifier.Unsigned("maxConcurrentLookups", 1, 256, c.classifier.maxConcurrentLookups);
    classifier.Unsigned("maxQueuedLookups", 1, 1000000, c.classifier.maxQueuedLookups);
    classifier.Milliseconds("resolveDeadlineMs", 1, 600000, c.classifier.resolveDeadline);
    classifier.Bool("collapseToRegistrableDomain", c.classifier.collapseToRegistrableDomain);

    SectionReader store(root, "store", m_errors);
    store.Path("cacheFile", c.store.cacheFile);
    store.Path("policyFile", c.store.policyFile);
    uint64_t ttl = static_cast<uint64_t>(c.store.cacheTtl.count());
    store.Unsigned("cacheTtlSeconds", 0, std::numeric_limits<uint32_t>::max(), ttl);
    c.store.cacheTtl = std::chrono::seconds(ttl);
    store.Unsigned("writeAttempts", 1, 20, c.store.writeAttempts);
    store.Milliseconds("writeBackoffMs", 0, 60000, c.store.writeBackoff);
    store.Milliseconds("policyRefreshIntervalMs", 0, 3600000, c.store.policyRefreshInterval);

    SectionReader gateway(root, "gateway", m_errors);
    gateway.VerdictValue("fallbackVerdict", c.gateway.fallbackVerdict);
    gateway.Path("activityLog", c.activityLogPath);
    gateway.Path("blockPage", c.blockPagePath);
    gateway.Bool("logDecisions", c.gateway.logDecisions);

    SectionReader logging(root, "logging", m_errors);
    logging.String("directory", c.logging.directory);
    logging.Level("level", c.logging.level);
    logging.Bool("console", c.logging.toConsole);
    logging.Bool("file", c.logging.toFile);
    logging.Bool("jsonLines", c.logging.jsonLines);

    return m_errors.size() == before;
}

bool ConfigManager::ApplyEnvironment(const EnvironmentLookup& lookup) {
    using namespace ConfigConstants;

    const size_t before = m_errors.size();
    EngineConfig& c = m_config;

    auto text = [&](const char* name, auto&& apply) {
        if (auto v = lookup(name)) {
            const std::string trimmed = Utils::StringUtils::Trim(*v);
            if (trimmed.empty()) {
                AddError(name, ValidationResult::InvalidFormat, "must not be empty");
                return;
            }
            apply(trimmed);
        }
    };

    auto number = [&](const char* name, uint64_t minValue, uint64_t maxValue, auto&& apply) {
        if (auto v = lookup(name)) {
            uint64_t value = 0;
            if (!ParseUnsigned(*v, minValue, maxValue, value)) {
                AddError(name, ValidationResult::OutOfRange,
                         "'" + *v + "' is not an integer between " + std::to_string(minValue) +
                         " and " + std::to_string(maxValue));
                return;
            }
            apply(value);
        }
    };

    // An empty key simply leaves the oracle unconfigured.
    if (auto key = lookup(ENV_API_KEY)) {
        c.oracle.apiKey = Utils::StringUtils::Trim(*key);
    }

    text(ENV_MODEL, [&](const std::string& v) { c.oracle.model = v; });
    text(ENV_ORACLE_ENDPOINT, [&](const std::string& v) { c.oracle.endpoint = v; });
    number(ENV_ORACLE_TIMEOUT_MS, 1, 600000, [&](uint64_t v) { c.oracle.timeoutMs = static_cast<uint32_t>(v); });
    number(ENV_ORACLE_MAX_ATTEMPTS, 1, 10, [&](uint64_t v) { c.retry.maxAttempts = static_cast<uint32_t>(v); });
    number(ENV_RESOLVE_DEADLINE_MS, 1, 600000, [&](uint64_t v) {
        c.classifier.resolveDeadline = std::chrono::milliseconds(v);
    });
    text(ENV_CACHE_FILE, [&](const std::string& v) { c.store.cacheFile = v; });
    text(ENV_POLICY_FILE, [&](const std::string& v) { c.store.policyFile = v; });
    text(ENV_ACTIVITY_LOG, [&](const std::string& v) { c.activityLogPath = v; });
    text(ENV_BLOCK_PAGE, [&](const std::string& v) { c.blockPagePath = v; });
    text(ENV_FALLBACK_VERDICT, [&](const std::string& v) {
        if (auto verdict = ParseVerdict(v)) {
            c.gateway.fallbackVerdict = *verdict;
        } else {
            AddError(ENV_FALLBACK_VERDICT, ValidationResult::InvalidFormat,
                     "'" + v + "' is not \"allowed\" or \"blocked\"");
        }
    });
    text(ENV_FALLBACK_CATEGORY, [&](const std::string& v) { c.classifier.fallbackCategory = v; });
    number(ENV_CACHE_TTL_SECONDS, 0, std::numeric_limits<uint32_t>::max(), [&](uint64_t v) {
        c.store.cacheTtl = std::chrono::seconds(v);
    });
    text(ENV_LOG_DIR, [&](const std::string& v) { c.logging.directory = v; });
    text(ENV_LOG_LEVEL, [&](const std::string& v) {
        if (!Utils::ParseLogLevel(v, c.logging.level)) {
            AddError(ENV_LOG_LEVEL, ValidationResult::InvalidFormat,
                     "'" + v + "' is not trace, debug, info, warn, error or fatal");
        }
    });

    return m_errors.size() == before;
}

bool ConfigManager::LoadDefault(const EnvironmentLookup& lookup) {
    bool ok = true;
    if (auto path = lookup(ConfigConstants::ENV_CONFIG_FILE)) {
        const std::string trimmed = Utils::StringUtils::Trim(*path);
        if (!trimmed.empty()) {
            ok = LoadFromFile(trimmed) && ok;
        }
    }
    ok = ApplyEnvironment(lookup) && ok;
    ok = Validate() && ok;
    return ok;
}

bool ConfigManager::Validate() {
    const size_t before = m_errors.size();
    const EngineConfig& c = m_config;

    if (c.store.cacheFile == c.store.policyFile) {
        AddError("store.policyFile", ValidationResult::InvalidFormat, "cache and policy files must differ");
    }
    if (c.retry.initialDelayMs > c.retry.maxDelayMs) {
        AddError("oracle.initialBackoffMs", ValidationResult::OutOfRange, "must not exceed oracle.maxBackoffMs");
    }
    if (!c.store.IsValid()) {
        AddError("store", ValidationResult::InvalidFormat, "invalid store settings");
    }
    if (!c.oracle.IsValid()) {
        AddError("oracle", ValidationResult::InvalidFormat, "invalid oracle settings");
    }
    if (!c.classifier.IsValid()) {
        AddError("classifier", ValidationResult::InvalidFormat, "invalid classifier settings");
    }
    if (c.activityLogPath.empty()) {
        AddError("gateway.activityLog", ValidationResult::InvalidFormat, "must not be empty");
    }
    return m_errors.size() == before;
}

std::string ConfigManager::FormatErrors() const {
    std::string out;
    for (const auto& e : m_errors) {
        out += e.key;
        out += ": ";
        out += e.message;
        out += '\n';
    }
    return out;
}

}  // namespace Config
}  // namespace DomainSentry
