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
 * DomainSentry - CATEGORY STORE IMPLEMENTATION
 * ============================================================================
 *
 * @file CategoryStore.cpp
 * @brief JSON-file backed cache and policy table with atomic rewrites.
 *
 * ============================================================================
 */

#include "pch.h"
#include "CategoryStore.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/FileUtils.hpp"

#include <shared_mutex>
#include <mutex>
#include <unordered_map>
#include <set>
#include <functional>
#include <thread>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Storage {

using namespace Utils;
using json = nlohmann::json;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define STORE_LOG_INFO(fmt, ...)    DS_LOG_INFO("CategoryStore", fmt, ##__VA_ARGS__)
#define STORE_LOG_WARN(fmt, ...)    DS_LOG_WARN("CategoryStore", fmt, ##__VA_ARGS__)
#define STORE_LOG_ERROR(fmt, ...)   DS_LOG_ERROR("CategoryStore", fmt, ##__VA_ARGS__)
#define STORE_LOG_DEBUG(fmt, ...)   DS_LOG_DEBUG("CategoryStore", fmt, ##__VA_ARGS__)

// ============================================================================
// STRUCT IMPLEMENTATIONS
// ============================================================================

bool CategoryStoreConfig::IsValid() const noexcept {
    if (cacheFile.empty() || policyFile.empty()) return false;
    if (cacheFile == policyFile) return false;
    if (writeAttempts == 0) return false;
    if (writeBackoff.count() < 0 || policyRefreshInterval.count() < 0 || cacheTtl.count() < 0) return false;
    return true;
}

std::string CategoryStoreConfig::ToJson() const {
    json j;
    j["cacheFile"] = cacheFile.string();
    j["policyFile"] = policyFile.string();
    j["writeAttempts"] = writeAttempts;
    j["writeBackoffMs"] = writeBackoff.count();
    j["policyRefreshIntervalMs"] = policyRefreshInterval.count();
    j["cacheTtlSeconds"] = cacheTtl.count();
    j["createMissingFiles"] = createMissingFiles;
    j["prettyPrint"] = prettyPrint;
    return j.dump();
}

StoreStatistics::StoreStatistics(const StoreStatistics& other) noexcept {
    *this = other;
}

StoreStatistics& StoreStatistics::operator=(const StoreStatistics& other) noexcept {
    cacheLookups = other.cacheLookups.load();
    cacheHits = other.cacheHits.load();
    cacheMisses = other.cacheMisses.load();
    expiredEntries = other.expiredEntries.load();
    cacheWrites = other.cacheWrites.load();
    cacheWriteFailures = other.cacheWriteFailures.load();
    policyLookups = other.policyLookups.load();
    policyReloads = other.policyReloads.load();
    policyRegistrations = other.policyRegistrations.load();
    policyWriteFailures = other.policyWriteFailures.load();
    invalidPolicyValues = other.invalidPolicyValues.load();
    readFailures = other.readFailures.load();
    return *this;
}

void StoreStatistics::Reset() noexcept {
    cacheLookups = 0;
    cacheHits = 0;
    cacheMisses = 0;
    expiredEntries = 0;
    cacheWrites = 0;
    cacheWriteFailures = 0;
    policyLookups = 0;
    policyReloads = 0;
    policyRegistrations = 0;
    policyWriteFailures = 0;
    invalidPolicyValues = 0;
    readFailures = 0;
}

std::string StoreStatistics::ToJson() const {
    json j;
    j["cacheLookups"] = cacheLookups.load();
    j["cacheHits"] = cacheHits.load();
    j["cacheMisses"] = cacheMisses.load();
    j["expiredEntries"] = expiredEntries.load();
    j["cacheWrites"] = cacheWrites.load();
    j["cacheWriteFailures"] = cacheWriteFailures.load();
    j["policyLookups"] = policyLookups.load();
    j["policyReloads"] = policyReloads.load();
    j["policyRegistrations"] = policyRegistrations.load();
    j["policyWriteFailures"] = policyWriteFailures.load();
    j["invalidPolicyValues"] = invalidPolicyValues.load();
    j["readFailures"] = readFailures.load();
    return j.dump();
}

// ============================================================================
// IMPLEMENTATION CLASS (PIMPL)
// ============================================================================

class CategoryStoreImpl {
public:
    explicit CategoryStoreImpl(CategoryStoreConfig config)
        : m_config(std::move(config)) {
    }

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    [[nodiscard]] bool Open() {
        if (!m_config.IsValid()) {
            STORE_LOG_ERROR("Invalid configuration: %s", m_config.ToJson().c_str());
            m_open = true;
            return false;
        }

        const bool cacheOk = LoadCacheFile();
        const bool policyOk = LoadPolicyFile();

        m_open = true;
        STORE_LOG_INFO("Opened store: %zu cached domains, %zu policy categories (cache=%s, policy=%s)",
                       GetCacheSize(), PolicySize(),
                       m_config.cacheFile.c_str(), m_config.policyFile.c_str());
        return cacheOk && policyOk;
    }

    [[nodiscard]] bool IsOpen() const noexcept {
        return m_open;
    }

    // ========================================================================
    // DOMAIN CACHE
    // ========================================================================

    [[nodiscard]] std::optional<CacheEntry> Get(std::string_view domain) const {
        m_stats.cacheLookups++;

        std::shared_lock lock(m_cacheMutex);
        auto it = m_cache.find(std::string(domain));
        if (it == m_cache.end()) {
            m_stats.cacheMisses++;
            return std::nullopt;
        }

        if (m_config.cacheTtl.count() > 0 &&
            std::chrono::system_clock::now() - it->second.observedAt > m_config.cacheTtl) {
            m_stats.expiredEntries++;
            m_stats.cacheMisses++;
            return std::nullopt;
        }

        m_stats.cacheHits++;
        return it->second;
    }

    [[nodiscard]] bool Put(const CacheEntry& entry) {
        CacheEntry stored = entry;
        stored.observedAt = std::chrono::time_point_cast<std::chrono::seconds>(entry.observedAt);

        {
            std::unique_lock lock(m_cacheMutex);
            m_cache[stored.domain] = stored;
        }

        m_stats.cacheWrites++;
        return PersistCache("put " + stored.domain);
    }

    bool Invalidate(std::string_view domain) {
        size_t removed = 0;
        {
            std::unique_lock lock(m_cacheMutex);
            removed = m_cache.erase(std::string(domain));
        }
        if (removed == 0) {
            return false;
        }
        STORE_LOG_INFO("Invalidated cache entry for %.*s", static_cast<int>(domain.size()), domain.data());
        (void)PersistCache("invalidate");
        return true;
    }

    [[nodiscard]] bool ClearCache() {
        {
            std::unique_lock lock(m_cacheMutex);
            m_cache.clear();
        }
        STORE_LOG_INFO("Cache cleared");
        return PersistCache("clear");
    }

    [[nodiscard]] size_t GetCacheSize() const noexcept {
        std::shared_lock lock(m_cacheMutex);
        return m_cache.size();
    }

    // ========================================================================
    // POLICY TABLE
    // ========================================================================

    [[nodiscard]] PolicyLookup GetPolicy(std::string_view category) {
        m_stats.policyLookups++;
        RefreshPolicyIfChanged(false);

        PolicyLookup result;
        std::shared_lock lock(m_policyMutex);
        auto it = m_policy.find(category);
        if (it == m_policy.end()) {
            return result;
        }

        result.found = true;
        result.verdict = it->second.verdict;
        if (!it->second.IsValid()) {
            result.invalidValue = it->second.raw;
        }
        return result;
    }

    RegisterResult RegisterCategory(std::string_view category, Verdict defaultVerdict) {
        RegisterResult result;

        std::lock_guard fileLock(m_policyFileMutex);
        RefreshPolicyIfChanged(true);

        PolicyTable snapshot;
        bool parsable = true;
        {
            std::unique_lock lock(m_policyMutex);
            auto it = m_policy.find(category);
            if (it != m_policy.end()) {
                result.inserted = false;
                result.persisted = true;
                result.current = it->second;
                return result;
            }

            PolicyValue value;
            value.verdict = defaultVerdict;
            value.raw = std::string(GetVerdictPolicyValue(defaultVerdict));
            m_policy.emplace(std::string(category), value);

            result.inserted = true;
            result.current = value;
            snapshot = m_policy;
            parsable = m_policyParsable;
        }

        m_stats.policyRegistrations++;

        if (!parsable) {
            STORE_LOG_WARN("Policy file %s is not valid JSON; registration of '%.*s' kept in memory only",
                           m_config.policyFile.c_str(), static_cast<int>(category.size()), category.data());
            result.persisted = false;
            return result;
        }

        result.persisted = WritePolicyFile(snapshot);
        if (result.persisted) {
            STORE_LOG_INFO("Registered new category '%.*s' = %s",
                           static_cast<int>(category.size()), category.data(),
                           std::string(GetVerdictPolicyValue(defaultVerdict)).c_str());
        }
        return result;
    }

    [[nodiscard]] PolicyTable ListPolicy() {
        RefreshPolicyIfChanged(false);
        std::shared_lock lock(m_policyMutex);
        return m_policy;
    }

    bool ReloadPolicy() {
        return RefreshPolicyIfChanged(true);
    }

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] StoreStatistics GetStatistics() const {
        return m_stats;
    }

    void ResetStatistics() {
        m_stats.Reset();
    }

    [[nodiscard]] const CategoryStoreConfig& GetConfig() const noexcept {
        return m_config;
    }

private:
    // ========================================================================
    // CACHE FILE
    // ========================================================================

    bool LoadCacheFile() {
        if (!EnsureFileExists(m_config.cacheFile)) {
            return false;
        }

        JSON::Json root;
        JSON::Error err;
        if (!JSON::LoadFromFile(m_config.cacheFile, root, &err)) {
            m_stats.readFailures++;
            STORE_LOG_ERROR("StoreReadFailure: cannot load cache file %s (%s); starting with an empty cache",
                            m_config.cacheFile.c_str(), err.message.c_str());
            return false;
        }

        if (!root.is_object()) {
            m_stats.readFailures++;
            STORE_LOG_ERROR("StoreReadFailure: cache file %s is not a JSON object; starting with an empty cache",
                            m_config.cacheFile.c_str());
            return false;
        }

        const auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
        std::unordered_map<std::string, CacheEntry> loaded;
        size_t skipped = 0;

        for (auto it = root.begin(); it != root.end(); ++it) {
            CacheEntry entry;
            entry.domain = it.key();

            if (it->is_string()) {
                // Legacy {"domain": "category"} layout
                entry.category = it->get<std::string>();
                entry.observedAt = now;
            } else if (it->is_object()) {
                std::string category;
                if (!JSON::Get(*it, "category", category)) {
                    ++skipped;
                    continue;
                }
                entry.category = std::move(category);
                entry.observedAt = FromUnixSeconds(JSON::GetOr<int64_t>(*it, "observedAt", ToUnixSeconds(now)));
            } else {
                ++skipped;
                continue;
            }

            if (entry.domain.empty() || entry.category.empty()) {
                ++skipped;
                continue;
            }
            loaded[entry.domain] = std::move(entry);
        }

        if (skipped > 0) {
            STORE_LOG_WARN("Skipped %zu malformed cache entries in %s", skipped, m_config.cacheFile.c_str());
        }

        std::unique_lock lock(m_cacheMutex);
        m_cache = std::move(loaded);
        return true;
    }

    bool PersistCache(const std::string& reason) {
        std::lock_guard fileLock(m_cacheFileMutex);

        json root = json::object();
        {
            std::shared_lock lock(m_cacheMutex);
            for (const auto& [domain, entry] : m_cache) {
                root[domain] = {
                    {"category", entry.category},
                    {"observedAt", ToUnixSeconds(entry.observedAt)}
                };
            }
        }

        if (!SaveWithRetry(m_config.cacheFile, root)) {
            m_stats.cacheWriteFailures++;
            STORE_LOG_ERROR("StoreWriteFailure: cache file %s not updated (%s); in-memory cache still serves",
                            m_config.cacheFile.c_str(), reason.c_str());
            return false;
        }
        return true;
    }

    // ========================================================================
    // POLICY FILE
    // ========================================================================

    [[nodiscard]] size_t PolicySize() const {
        std::shared_lock lock(m_policyMutex);
        return m_policy.size();
    }

    bool LoadPolicyFile() {
        if (!EnsureFileExists(m_config.policyFile)) {
            std::unique_lock lock(m_policyMutex);
            m_policyParsable = false;
            return false;
        }
        const bool ok = RefreshPolicyIfChanged(true);
        if (!ok) {
            STORE_LOG_ERROR("StoreReadFailure: policy file %s unusable at startup; every category defaults to allowed",
                            m_config.policyFile.c_str());
        }
        return ok;
    }

    /**
     * Reloads the policy table when the file identity changed (or when forced).
     * Returns false when the current file could not be parsed; the previous
     * table is kept in that case.
     */
    bool RefreshPolicyIfChanged(bool force) {
        const auto nowSteady = std::chrono::steady_clock::now();

        if (!force && m_config.policyRefreshInterval.count() > 0) {
            std::shared_lock lock(m_policyMutex);
            if (m_lastPolicyCheck.has_value() &&
                nowSteady - *m_lastPolicyCheck < m_config.policyRefreshInterval) {
                return m_policyParsable;
            }
        }

        const FileUtils::FileIdentity identity = FileUtils::GetFileIdentity(m_config.policyFile);
        bool racilyClean = false;
        {
            std::shared_lock lock(m_policyMutex);
            if (!force && m_policyIdentity.has_value() && *m_policyIdentity == identity) {
                // An in-place edit within one timestamp tick of the last check keeps size and mtime.
                racilyClean = identity.exists &&
                              m_policyVerifiedAtNs - identity.mtimeNs < StoreConstants::POLICY_TIMESTAMP_TICK_NS;
                if (!racilyClean) {
                    return m_policyParsable;
                }
            }
        }

        std::string text;
        FileUtils::Error readErr;
        const bool readOk = identity.exists && FileUtils::ReadAllText(m_config.policyFile, text, &readErr);
        const size_t contentHash = std::hash<std::string>{}(text);

        if (racilyClean && readOk) {
            std::unique_lock lock(m_policyMutex);
            if (m_policyContentHash == contentHash) {
                m_lastPolicyCheck = nowSteady;
                m_policyVerifiedAtNs = WallClockNs();
                return m_policyParsable;
            }
        }

        PolicyTable table;
        bool parsed = true;
        std::string error;

        if (identity.exists) {
            JSON::Json root;
            JSON::Error err;
            if (!readOk) {
                parsed = false;
                error = readErr.message;
            } else if (!JSON::Parse(JSON::StripUtf8Bom(text), root, &err)) {
                parsed = false;
                error = err.message;
            } else if (!root.is_object()) {
                parsed = false;
                error = "top-level value is not an object";
            } else {
                table = ParsePolicyObject(root);
            }
        }
        // A deleted policy file reads as an empty table.

        std::unique_lock lock(m_policyMutex);
        m_lastPolicyCheck = nowSteady;
        m_policyIdentity = identity;
        m_policyContentHash = contentHash;
        m_policyVerifiedAtNs = WallClockNs();

        if (!parsed) {
            m_stats.readFailures++;
            if (m_policyParsable || force) {
                STORE_LOG_ERROR("StoreReadFailure: cannot parse policy file %s (%s); keeping %zu previously loaded entries",
                                m_config.policyFile.c_str(), error.c_str(), m_policy.size());
            }
            m_policyParsable = false;
            return false;
        }

        m_policy = std::move(table);
        m_policyParsable = true;
        m_stats.policyReloads++;
        STORE_LOG_DEBUG("Policy table loaded: %zu categories", m_policy.size());
        return true;
    }

    PolicyTable ParsePolicyObject(const JSON::Json& root) {
        PolicyTable table;
        for (auto it = root.begin(); it != root.end(); ++it) {
            PolicyValue value;
            if (it->is_string()) {
                value.raw = it->get<std::string>();
                value.verdict = ParseVerdict(value.raw);
            } else {
                value.raw = it->dump();
                value.rawIsJson = true;
            }

            if (!value.IsValid()) {
                ReportInvalidValue(it.key(), value.raw);
            }
            table.emplace(it.key(), std::move(value));
        }
        return table;
    }

    void ReportInvalidValue(const std::string& category, const std::string& raw) {
        m_stats.invalidPolicyValues++;

        std::lock_guard lock(m_reportedMutex);
        if (m_reportedInvalid.insert(category + '\0' + raw).second) {
            STORE_LOG_ERROR("InvalidPolicyValue: category '%s' has value %s in %s; expected \"allowed\" or \"blocked\", treating as unresolved",
                            category.c_str(), raw.c_str(), m_config.policyFile.c_str());
        }
    }

    bool WritePolicyFile(const PolicyTable& table) {
        json root = json::object();
        for (const auto& [category, value] : table) {
            if (value.rawIsJson) {
                JSON::Json original;
                if (JSON::Parse(value.raw, original)) {
                    root[category] = std::move(original);
                    continue;
                }
            }
            root[category] = value.raw;
        }

        if (!SaveWithRetry(m_config.policyFile, root)) {
            m_stats.policyWriteFailures++;
            STORE_LOG_ERROR("StoreWriteFailure: policy file %s not updated; in-memory table still serves",
                            m_config.policyFile.c_str());
            return false;
        }

        const auto identity = FileUtils::GetFileIdentity(m_config.policyFile);
        std::string text;
        const bool readOk = FileUtils::ReadAllText(m_config.policyFile, text);

        std::unique_lock lock(m_policyMutex);
        m_policyIdentity = identity;
        // An unreadable write-back is confirmed by content on the next check.
        m_policyContentHash = readOk ? std::hash<std::string>{}(text) : 0;
        m_policyVerifiedAtNs = readOk ? WallClockNs() : 0;
        return true;
    }

    static int64_t WallClockNs() noexcept {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // ========================================================================
    // HELPERS
    // ========================================================================

    bool EnsureFileExists(const std::filesystem::path& path) {
        if (FileUtils::Exists(path) || !m_config.createMissingFiles) {
            return true;
        }

        JSON::Error err;
        if (!JSON::SaveToFile(path, JSON::Json::object(), &err)) {
            m_stats.readFailures++;
            STORE_LOG_ERROR("StoreReadFailure: cannot create %s (%s)", path.c_str(), err.message.c_str());
            return false;
        }
        STORE_LOG_WARN("File %s not found; created new empty file", path.c_str());
        return true;
    }

    bool SaveWithRetry(const std::filesystem::path& path, const json& root) {
        JSON::StringifyOptions opt;
        opt.pretty = m_config.prettyPrint;

        for (uint32_t attempt = 1; attempt <= m_config.writeAttempts; ++attempt) {
            JSON::Error err;
            if (JSON::SaveToFile(path, root, &err, opt)) {
                return true;
            }

            STORE_LOG_WARN("Write attempt %u/%u for %s failed: %s",
                           attempt, m_config.writeAttempts, path.c_str(), err.message.c_str());

            if (attempt < m_config.writeAttempts) {
                auto delay = m_config.writeBackoff * attempt;
                delay = std::min(delay, std::chrono::milliseconds(StoreConstants::MAX_WRITE_BACKOFF_MS));
                std::this_thread::sleep_for(delay);
            }
        }
        return false;
    }

    // ========================================================================
    // MEMBERS
    // ========================================================================

    CategoryStoreConfig m_config;
    std::atomic<bool> m_open{false};

    mutable std::shared_mutex m_cacheMutex;
    std::unordered_map<std::string, CacheEntry> m_cache;
    std::mutex m_cacheFileMutex;

    mutable std::shared_mutex m_policyMutex;
    PolicyTable m_policy;
    std::optional<FileUtils::FileIdentity> m_policyIdentity;
    std::optional<SteadyTimePoint> m_lastPolicyCheck;
    size_t m_policyContentHash = 0;
    int64_t m_policyVerifiedAtNs = 0;
    bool m_policyParsable = true;
    std::mutex m_policyFileMutex;

    std::mutex m_reportedMutex;
    std::set<std::string> m_reportedInvalid;

    mutable StoreStatistics m_stats;
};

// ============================================================================
// CATEGORYSTORE FACADE IMPLEMENTATION
// ============================================================================

CategoryStore::CategoryStore(CategoryStoreConfig config)
    : m_impl(std::make_unique<CategoryStoreImpl>(std::move(config))) {
}

CategoryStore::~CategoryStore() = default;

bool CategoryStore::Open() {
    return m_impl->Open();
}

bool CategoryStore::IsOpen() const noexcept {
    return m_impl->IsOpen();
}

std::optional<CacheEntry> CategoryStore::Get(std::string_view domain) const {
    return m_impl->Get(domain);
}

bool CategoryStore::Put(const CacheEntry& entry) {
    return m_impl->Put(entry);
}

bool CategoryStore::Invalidate(std::string_view domain) {
    return m_impl->Invalidate(domain);
}

bool CategoryStore::ClearCache() {
    return m_impl->ClearCache();
}

size_t CategoryStore::GetCacheSize() const noexcept {
    return m_impl->GetCacheSize();
}

PolicyLookup CategoryStore::GetPolicy(std::string_view category) {
    return m_impl->GetPolicy(category);
}

RegisterResult CategoryStore::RegisterCategory(std::string_view category, Verdict defaultVerdict) {
    return m_impl->RegisterCategory(category, defaultVerdict);
}

PolicyTable CategoryStore::ListPolicy() {
    return m_impl->ListPolicy();
}

bool CategoryStore::ReloadPolicy() {
    return m_impl->ReloadPolicy();
}

StoreStatistics CategoryStore::GetStatistics() const {
    return m_impl->GetStatistics();
}

void CategoryStore::ResetStatistics() {
    m_impl->ResetStatistics();
}

const CategoryStoreConfig& CategoryStore::GetConfig() const noexcept {
    return m_impl->GetConfig();
}

}  // namespace Storage
}  // namespace DomainSentry
