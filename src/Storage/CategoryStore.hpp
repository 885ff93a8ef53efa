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
 * DomainSentry - CATEGORY STORE
 * ============================================================================
 *
 * @file CategoryStore.hpp
 * @brief Durable domain->category cache and category->policy table.
 *
 * STORAGE MODEL:
 * ==============
 *
 * 1. DOMAIN CACHE (domain_cache.json)
 *    - {"domain": {"category": "...", "observedAt": <unix seconds>}}
 *    - Legacy {"domain": "category"} accepted on load
 *    - Entries replaced whole; optional TTL
 *
 * 2. POLICY TABLE (categories.json)
 *    - {"Category": "allowed" | "blocked"}, operator-editable
 *    - Re-read whenever the file identity (inode/size/mtime) changes
 *    - Invalid values are kept verbatim and reported, never coerced
 *
 * 3. DURABILITY
 *    - Every rewrite goes temp file -> fsync -> rename -> fsync(dir)
 *    - Writers of one table are serialized; last writer wins
 *    - Write failures are retried with backoff, then reported; the
 *      in-memory view keeps serving the process
 *
 * THREAD SAFETY: All public methods are thread-safe.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <map>
#include <optional>
#include <memory>
#include <chrono>
#include <atomic>
#include <filesystem>

#include "../Core/EngineTypes.hpp"

namespace DomainSentry::Storage {
    class CategoryStoreImpl;
}

namespace DomainSentry {
namespace Storage {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace StoreConstants {

    inline constexpr const char* DEFAULT_CACHE_FILE = "domain_cache.json";

    inline constexpr const char* DEFAULT_POLICY_FILE = "categories.json";

    inline constexpr uint32_t DEFAULT_WRITE_ATTEMPTS = 3;

    inline constexpr uint32_t DEFAULT_WRITE_BACKOFF_MS = 50;

    /// @brief Upper bound on a single retry sleep
    inline constexpr uint32_t MAX_WRITE_BACKOFF_MS = 2000;

    /// @brief Coarsest file timestamp tick expected; edits inside it are confirmed by content
    inline constexpr int64_t POLICY_TIMESTAMP_TICK_NS = 2000000000LL;

}  // namespace StoreConstants

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Configuration for the durable store
 */
struct CategoryStoreConfig {
    std::filesystem::path cacheFile = StoreConstants::DEFAULT_CACHE_FILE;

    std::filesystem::path policyFile = StoreConstants::DEFAULT_POLICY_FILE;

    /// @brief Attempts per file rewrite before reporting StoreWriteFailure
    uint32_t writeAttempts = StoreConstants::DEFAULT_WRITE_ATTEMPTS;

    /// @brief Sleep before retry n is writeBackoff * n
    std::chrono::milliseconds writeBackoff{StoreConstants::DEFAULT_WRITE_BACKOFF_MS};

    /// @brief Minimum time between policy file identity checks (0 = every lookup)
    std::chrono::milliseconds policyRefreshInterval{0};

    /// @brief Cache entry lifetime (0 = valid until invalidated)
    std::chrono::seconds cacheTtl{0};

    /// @brief Create "{}" files when missing at startup
    bool createMissingFiles = true;

    /// @brief Indent written JSON for operators
    bool prettyPrint = true;

    [[nodiscard]] bool IsValid() const noexcept;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief One policy table value as read from the file.
 *
 * raw keeps the operator's spelling; for non-string JSON values it holds the
 * serialized JSON and rawIsJson is set.
 */
struct PolicyValue {
    std::optional<Verdict> verdict;
    std::string raw;
    bool rawIsJson = false;

    [[nodiscard]] bool IsValid() const noexcept { return verdict.has_value(); }
};

using PolicyTable = std::map<std::string, PolicyValue, std::less<>>;

/**
 * @brief Result of a policy lookup
 */
struct PolicyLookup {
    /// @brief Category has an entry (valid or not)
    bool found = false;

    /// @brief Set when the entry holds "allowed"/"blocked"
    std::optional<Verdict> verdict;

    /// @brief Operator value when invalid
    std::string invalidValue;

    [[nodiscard]] bool IsInvalid() const noexcept { return found && !verdict.has_value(); }
};

/**
 * @brief Result of RegisterCategory
 */
struct RegisterResult {
    /// @brief This call added the category
    bool inserted = false;

    /// @brief The table on disk reflects the call (false = in-memory only)
    bool persisted = true;

    /// @brief Entry after the call (existing entry wins over the default)
    PolicyValue current;
};

/**
 * @brief Store counters
 */
struct StoreStatistics {
    std::atomic<uint64_t> cacheLookups{0};
    std::atomic<uint64_t> cacheHits{0};
    std::atomic<uint64_t> cacheMisses{0};
    std::atomic<uint64_t> expiredEntries{0};
    std::atomic<uint64_t> cacheWrites{0};
    std::atomic<uint64_t> cacheWriteFailures{0};
    std::atomic<uint64_t> policyLookups{0};
    std::atomic<uint64_t> policyReloads{0};
    std::atomic<uint64_t> policyRegistrations{0};
    std::atomic<uint64_t> policyWriteFailures{0};
    std::atomic<uint64_t> invalidPolicyValues{0};
    std::atomic<uint64_t> readFailures{0};

    StoreStatistics() = default;
    StoreStatistics(const StoreStatistics& other) noexcept;
    StoreStatistics& operator=(const StoreStatistics& other) noexcept;

    void Reset() noexcept;

    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// CATEGORY STORE CLASS
// ============================================================================

/**
 * @class CategoryStore
 * @brief Owner of all durable engine state.
 *
 * Components receive a reference at construction; nothing else writes the
 * cache or policy files.
 *
 * USAGE:
 * @code
 *     Storage::CategoryStoreConfig cfg;
 *     cfg.cacheFile = "/var/lib/domainsentry/domain_cache.json";
 *     Storage::CategoryStore store(cfg);
 *     if (!store.Open()) {
 *         // degraded: started with empty tables, already logged
 *     }
 *     store.Put({"example.com", "News", std::chrono::system_clock::now()});
 * @endcode
 */
class CategoryStore final {
public:
    explicit CategoryStore(CategoryStoreConfig config = {});
    ~CategoryStore();

    CategoryStore(const CategoryStore&) = delete;
    CategoryStore& operator=(const CategoryStore&) = delete;
    CategoryStore(CategoryStore&&) = delete;
    CategoryStore& operator=(CategoryStore&&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Load both tables from disk.
     *
     * Missing files are created empty. Unreadable or unparsable files leave
     * the corresponding table empty (StoreReadFailure, logged once).
     *
     * @return true when both tables loaded cleanly; false means degraded but usable
     */
    [[nodiscard]] bool Open();

    [[nodiscard]] bool IsOpen() const noexcept;

    // ========================================================================
    // DOMAIN CACHE
    // ========================================================================

    /**
     * @brief Cached classification for a normalized domain.
     * @return nullopt on miss or when the entry outlived cacheTtl
     */
    [[nodiscard]] std::optional<CacheEntry> Get(std::string_view domain) const;

    /**
     * @brief Insert or replace an entry and persist the cache file.
     *
     * observedAt is truncated to whole seconds (the file precision).
     *
     * @return false when persisting failed after all attempts (StoreWriteFailure);
     *         the in-memory entry is kept either way
     */
    [[nodiscard]] bool Put(const CacheEntry& entry);

    /**
     * @brief Drop one domain. @return true if an entry was removed
     */
    bool Invalidate(std::string_view domain);

    /**
     * @brief Drop every cached domain and persist. @return false on write failure
     */
    [[nodiscard]] bool ClearCache();

    [[nodiscard]] size_t GetCacheSize() const noexcept;

    // ========================================================================
    // POLICY TABLE
    // ========================================================================

    /**
     * @brief Current policy entry for a category (file re-read if it changed).
     */
    [[nodiscard]] PolicyLookup GetPolicy(std::string_view category);

    /**
     * @brief Add category with defaultVerdict unless an entry already exists.
     *
     * Re-reads the policy file first so concurrent operator edits are merged,
     * then rewrites it atomically. An existing entry (even an invalid one) is
     * never replaced.
     */
    RegisterResult RegisterCategory(std::string_view category, Verdict defaultVerdict);

    /**
     * @brief Snapshot of the whole policy table.
     */
    [[nodiscard]] PolicyTable ListPolicy();

    /**
     * @brief Force a policy file re-read. @return false if the file could not be parsed
     */
    bool ReloadPolicy();

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] StoreStatistics GetStatistics() const;

    void ResetStatistics();

    [[nodiscard]] const CategoryStoreConfig& GetConfig() const noexcept;

private:
    std::unique_ptr<CategoryStoreImpl> m_impl;
};

}  // namespace Storage
}  // namespace DomainSentry
