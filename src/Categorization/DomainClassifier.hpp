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
 * DomainSentry - DOMAIN CLASSIFIER
 * ============================================================================
 *
 * @file DomainClassifier.hpp
 * @brief Domain -> category resolution with a single-flight oracle path.
 *
 * RESOLUTION:
 * ===========
 *   normalize -> cache lookup -> (miss) join or start the one in-flight
 *   chain for that domain -> wait up to resolveDeadline
 *
 * A chain runs on the classifier's worker pool, applies the RetryPolicy
 * around the oracle client, writes the cache entry and registers the
 * category before its waiters are released. Failed chains cache nothing.
 *
 * A caller that gives up (deadline or cancellation) gets the fallback
 * category; the chain keeps running and fills the cache for later callers.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <atomic>
#include <chrono>

#include "../Core/EngineTypes.hpp"
#include "CategorizationClient.hpp"
#include "RetryPolicy.hpp"

namespace DomainSentry::Storage {
    class CategoryStore;
}

namespace DomainSentry::Categorization {
    class DomainClassifierImpl;
}

namespace DomainSentry {
namespace Categorization {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace ClassifierConstants {

    inline constexpr const char* DEFAULT_FALLBACK_CATEGORY = "Uncategorized";

    inline constexpr uint32_t DEFAULT_MAX_CONCURRENT_LOOKUPS = 8;

    inline constexpr uint32_t DEFAULT_MAX_QUEUED_LOOKUPS = 1024;

    inline constexpr uint32_t DEFAULT_RESOLVE_DEADLINE_MS = 12000;

    /// @brief Poll period while a cancellation flag is being watched
    inline constexpr uint32_t CANCEL_POLL_INTERVAL_MS = 5;

}  // namespace ClassifierConstants

// ============================================================================
// STRUCTURES
// ============================================================================

struct ClassifierConfig {
    /// @brief Category reported when classification fails
    std::string fallbackCategory = ClassifierConstants::DEFAULT_FALLBACK_CATEGORY;

    /// @brief Worker threads running oracle chains
    uint32_t maxConcurrentLookups = ClassifierConstants::DEFAULT_MAX_CONCURRENT_LOOKUPS;

    /// @brief Chains waiting for a worker before new misses are refused
    uint32_t maxQueuedLookups = ClassifierConstants::DEFAULT_MAX_QUEUED_LOOKUPS;

    /// @brief Longest a caller waits for a chain
    std::chrono::milliseconds resolveDeadline{ClassifierConstants::DEFAULT_RESOLVE_DEADLINE_MS};

    /// @brief Reduce hosts to their registrable domain (www.bbc.co.uk -> bbc.co.uk)
    bool collapseToRegistrableDomain = true;

    /// @brief Register newly seen categories as allowed after a successful chain
    bool registerNewCategories = true;

    [[nodiscard]] bool IsValid() const noexcept;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Result of Resolve()
 */
struct ResolveResult {
    /// @brief Category label, or the fallback category on failure
    std::string category;

    bool cacheHit = false;

    /// @brief First failure affecting this resolution
    ErrorKind error = ErrorKind::None;

    std::string normalizedDomain;

    /// @brief Time spent in oracle calls by the chain (0 on cache hit)
    std::chrono::microseconds oracleLatency{0};

    /// @brief Oracle attempts made by the chain
    uint32_t attempts = 0;

    /// @brief Caller waited on a chain started by another caller
    bool joinedInFlight = false;

    /// @brief Category is the fallback, not a classification
    [[nodiscard]] bool IsFallback() const noexcept;
};

struct ClassifierStatistics {
    std::atomic<uint64_t> resolves{0};
    std::atomic<uint64_t> cacheHits{0};
    std::atomic<uint64_t> cacheMisses{0};
    std::atomic<uint64_t> chainsStarted{0};
    std::atomic<uint64_t> chainsSucceeded{0};
    std::atomic<uint64_t> chainsFailed{0};
    std::atomic<uint64_t> oracleCalls{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> singleFlightJoins{0};
    std::atomic<uint64_t> deadlineExpirations{0};
    std::atomic<uint64_t> cancellations{0};
    std::atomic<uint64_t> invalidDomains{0};
    std::atomic<uint64_t> queueRejections{0};
    std::atomic<uint64_t> storeWriteFailures{0};
    std::atomic<uint64_t> categoriesRegistered{0};

    ClassifierStatistics() = default;
    ClassifierStatistics(const ClassifierStatistics& other) noexcept;
    ClassifierStatistics& operator=(const ClassifierStatistics& other) noexcept;

    void Reset() noexcept;
    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// CLASSIFIER CLASS
// ============================================================================

/**
 * @class DomainClassifier
 * @brief Resolves domains to categories. Thread-safe.
 *
 * The store and client must outlive the classifier. Destruction completes
 * queued chains with OracleUnreachable and joins running ones.
 */
class DomainClassifier final {
public:
    DomainClassifier(Storage::CategoryStore& store,
                     std::shared_ptr<ICategorizationClient> client,
                     RetryPolicy retryPolicy = {},
                     ClassifierConfig config = {});
    ~DomainClassifier();

    DomainClassifier(const DomainClassifier&) = delete;
    DomainClassifier& operator=(const DomainClassifier&) = delete;

    /**
     * @brief Resolve a host (URL, host:port, bare name) to a category.
     *
     * @param host Raw host as seen by the transport
     * @param cancel Optional flag; when it becomes true the caller stops
     *        waiting with RequestCancelled. The chain is not cancelled.
     */
    [[nodiscard]] ResolveResult Resolve(std::string_view host, const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Normalize a host the way Resolve() does.
     * @return false when nothing classifiable remains
     */
    [[nodiscard]] bool NormalizeDomain(std::string_view host, std::string& out) const;

    /// @brief Chains queued or running
    [[nodiscard]] size_t GetInFlightCount() const;

    /// @brief Stop workers. Idempotent; later misses fail with OracleUnreachable.
    void Shutdown();

    [[nodiscard]] ClassifierStatistics GetStatistics() const;

    void ResetStatistics();

    [[nodiscard]] const ClassifierConfig& GetConfig() const noexcept;

private:
    std::unique_ptr<DomainClassifierImpl> m_impl;
};

}  // namespace Categorization
}  // namespace DomainSentry
