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
 * DomainSentry - DOMAIN CLASSIFIER IMPLEMENTATION
 * ============================================================================
 *
 * @file DomainClassifier.cpp
 *
 * ============================================================================
 */

#include "pch.h"
#include "DomainClassifier.hpp"
#include "../Storage/CategoryStore.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <mutex>
#include <condition_variable>
#include <future>
#include <thread>
#include <deque>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Categorization {

using namespace Utils;

#define CLS_LOG_INFO(fmt, ...)   DS_LOG_INFO("Classifier", fmt, ##__VA_ARGS__)
#define CLS_LOG_WARN(fmt, ...)   DS_LOG_WARN("Classifier", fmt, ##__VA_ARGS__)
#define CLS_LOG_ERROR(fmt, ...)  DS_LOG_ERROR("Classifier", fmt, ##__VA_ARGS__)
#define CLS_LOG_DEBUG(fmt, ...)  DS_LOG_DEBUG("Classifier", fmt, ##__VA_ARGS__)

// ============================================================================
// STRUCT IMPLEMENTATIONS
// ============================================================================

bool ClassifierConfig::IsValid() const noexcept {
    if (fallbackCategory.empty()) return false;
    if (maxConcurrentLookups == 0 || maxConcurrentLookups > 256) return false;
    if (maxQueuedLookups == 0) return false;
    if (resolveDeadline.count() <= 0) return false;
    return true;
}

std::string ClassifierConfig::ToJson() const {
    nlohmann::json j;
    j["fallbackCategory"] = fallbackCategory;
    j["maxConcurrentLookups"] = maxConcurrentLookups;
    j["maxQueuedLookups"] = maxQueuedLookups;
    j["resolveDeadlineMs"] = resolveDeadline.count();
    j["collapseToRegistrableDomain"] = collapseToRegistrableDomain;
    j["registerNewCategories"] = registerNewCategories;
    return j.dump();
}

bool ResolveResult::IsFallback() const noexcept {
    return IsOracleError(error) ||
           error == ErrorKind::InvalidDomain ||
           error == ErrorKind::RequestCancelled ||
           error == ErrorKind::InternalError;
}

ClassifierStatistics::ClassifierStatistics(const ClassifierStatistics& other) noexcept {
    *this = other;
}

ClassifierStatistics& ClassifierStatistics::operator=(const ClassifierStatistics& other) noexcept {
    resolves = other.resolves.load();
    cacheHits = other.cacheHits.load();
    cacheMisses = other.cacheMisses.load();
    chainsStarted = other.chainsStarted.load();
    chainsSucceeded = other.chainsSucceeded.load();
    chainsFailed = other.chainsFailed.load();
    oracleCalls = other.oracleCalls.load();
    retries = other.retries.load();
    singleFlightJoins = other.singleFlightJoins.load();
    deadlineExpirations = other.deadlineExpirations.load();
    cancellations = other.cancellations.load();
    invalidDomains = other.invalidDomains.load();
    queueRejections = other.queueRejections.load();
    storeWriteFailures = other.storeWriteFailures.load();
    categoriesRegistered = other.categoriesRegistered.load();
    return *this;
}

void ClassifierStatistics::Reset() noexcept {
    resolves = 0;
    cacheHits = 0;
    cacheMisses = 0;
    chainsStarted = 0;
    chainsSucceeded = 0;
    chainsFailed = 0;
    oracleCalls = 0;
    retries = 0;
    singleFlightJoins = 0;
    deadlineExpirations = 0;
    cancellations = 0;
    invalidDomains = 0;
    queueRejections = 0;
    storeWriteFailures = 0;
    categoriesRegistered = 0;
}

std::string ClassifierStatistics::ToJson() const {
    nlohmann::json j;
    j["resolves"] = resolves.load();
    j["cacheHits"] = cacheHits.load();
    j["cacheMisses"] = cacheMisses.load();
    j["chainsStarted"] = chainsStarted.load();
    j["chainsSucceeded"] = chainsSucceeded.load();
    j["chainsFailed"] = chainsFailed.load();
    j["oracleCalls"] = oracleCalls.load();
    j["retries"] = retries.load();
    j["singleFlightJoins"] = singleFlightJoins.load();
    j["deadlineExpirations"] = deadlineExpirations.load();
    j["cancellations"] = cancellations.load();
    j["invalidDomains"] = invalidDomains.load();
    j["queueRejections"] = queueRejections.load();
    j["storeWriteFailures"] = storeWriteFailures.load();
    j["categoriesRegistered"] = categoriesRegistered.load();
    return j.dump();
}

// ============================================================================
// IMPLEMENTATION CLASS (PIMPL)
// ============================================================================

class DomainClassifierImpl {
public:
    DomainClassifierImpl(Storage::CategoryStore& store,
                         std::shared_ptr<ICategorizationClient> client,
                         RetryPolicy retryPolicy,
                         ClassifierConfig config)
        : m_store(store)
        , m_client(std::move(client))
        , m_retry(std::move(retryPolicy))
        , m_config(std::move(config)) {
        if (!m_config.IsValid()) {
            CLS_LOG_WARN("Invalid classifier configuration %s; using defaults", m_config.ToJson().c_str());
            m_config = ClassifierConfig{};
        }

        m_workers.reserve(m_config.maxConcurrentLookups);
        for (uint32_t i = 0; i < m_config.maxConcurrentLookups; ++i) {
            m_workers.emplace_back(&DomainClassifierImpl::WorkerLoop, this);
        }

        CLS_LOG_DEBUG("Classifier started: %s retry=%s",
                      m_config.ToJson().c_str(), m_retry.GetConfig().ToJson().c_str());
    }

    ~DomainClassifierImpl() {
        Shutdown();
    }

    // ========================================================================
    // RESOLUTION
    // ========================================================================

    [[nodiscard]] ResolveResult Resolve(std::string_view host, const std::atomic<bool>* cancel) {
        m_stats.resolves++;

        ResolveResult result;
        if (!NormalizeDomain(host, result.normalizedDomain)) {
            m_stats.invalidDomains++;
            CLS_LOG_WARN("Could not extract a valid domain from '%.*s'",
                         static_cast<int>(host.size()), host.data());
            return Fallback(std::move(result), ErrorKind::InvalidDomain);
        }

        const std::string& domain = result.normalizedDomain;

        if (auto entry = m_store.Get(domain)) {
            m_stats.cacheHits++;
            result.category = entry->category;
            result.cacheHit = true;
            CLS_LOG_DEBUG("Domain: %s, Category: %s (cached)", domain.c_str(), result.category.c_str());
            return result;
        }
        m_stats.cacheMisses++;

        std::shared_future<ChainOutcome> future;
        {
            std::unique_lock lock(m_mutex);
            if (m_stopping) {
                return Fallback(std::move(result), ErrorKind::OracleUnreachable);
            }

            auto it = m_inFlight.find(domain);
            if (it != m_inFlight.end()) {
                future = it->second->future;
                result.joinedInFlight = true;
                m_stats.singleFlightJoins++;
            } else {
                // A chain may have finished between the lookup above and taking the lock.
                if (auto entry = m_store.Get(domain)) {
                    m_stats.cacheHits++;
                    result.category = entry->category;
                    result.cacheHit = true;
                    return result;
                }

                if (m_queue.size() >= m_config.maxQueuedLookups) {
                    m_stats.queueRejections++;
                    CLS_LOG_WARN("Lookup queue full (%zu); %s not classified", m_queue.size(), domain.c_str());
                    return Fallback(std::move(result), ErrorKind::OracleUnreachable);
                }

                auto chain = std::make_shared<InFlightChain>();
                chain->future = chain->promise.get_future().share();
                future = chain->future;
                m_inFlight.emplace(domain, std::move(chain));
                m_queue.push_back(domain);
                m_stats.chainsStarted++;
            }
        }
        if (!result.joinedInFlight) {
            m_queueCv.notify_one();
        }

        const auto deadline = std::chrono::steady_clock::now() + m_config.resolveDeadline;
        const auto pollInterval = std::chrono::milliseconds(ClassifierConstants::CANCEL_POLL_INTERVAL_MS);

        for (;;) {
            if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
                m_stats.cancellations++;
                CLS_LOG_DEBUG("Caller stopped waiting for %s; lookup continues", domain.c_str());
                return Fallback(std::move(result), ErrorKind::RequestCancelled);
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                m_stats.deadlineExpirations++;
                CLS_LOG_WARN("Deadline of %lld ms expired for %s; lookup continues in background",
                             static_cast<long long>(m_config.resolveDeadline.count()), domain.c_str());
                return Fallback(std::move(result), ErrorKind::OracleTimeout);
            }

            auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            if (cancel != nullptr) {
                slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(pollInterval));
            }
            if (slice.count() <= 0) {
                slice = std::chrono::milliseconds(1);
            }

            if (future.wait_for(slice) == std::future_status::ready) {
                break;
            }
        }

        const ChainOutcome& outcome = future.get();
        result.oracleLatency = outcome.oracleLatency;
        result.attempts = outcome.attempts;

        if (outcome.error != ErrorKind::None) {
            return Fallback(std::move(result), outcome.error);
        }

        result.category = outcome.category;
        if (outcome.storeWriteFailed) {
            result.error = ErrorKind::StoreWriteFailure;
        }
        return result;
    }

    [[nodiscard]] bool NormalizeDomain(std::string_view host, std::string& out) const {
        std::string normalized;
        if (!StringUtils::NormalizeHost(host, normalized)) {
            out.clear();
            return false;
        }
        out = m_config.collapseToRegistrableDomain
            ? StringUtils::RegistrableDomain(normalized)
            : std::move(normalized);
        return !out.empty();
    }

    [[nodiscard]] size_t GetInFlightCount() const {
        std::lock_guard lock(m_mutex);
        return m_inFlight.size();
    }

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    void Shutdown() {
        std::vector<std::shared_ptr<InFlightChain>> abandoned;
        {
            std::lock_guard lock(m_mutex);
            if (m_stopping) {
                return;
            }
            m_stopping = true;

            for (const auto& domain : m_queue) {
                auto it = m_inFlight.find(domain);
                if (it != m_inFlight.end()) {
                    abandoned.push_back(std::move(it->second));
                    m_inFlight.erase(it);
                }
            }
            m_queue.clear();
        }
        m_queueCv.notify_all();
        m_stopCv.notify_all();

        ChainOutcome stopped;
        stopped.category = m_config.fallbackCategory;
        stopped.error = ErrorKind::OracleUnreachable;
        for (auto& chain : abandoned) {
            chain->promise.set_value(stopped);
        }

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();

        if (!abandoned.empty()) {
            CLS_LOG_INFO("Classifier stopped; %zu queued lookups abandoned", abandoned.size());
        }
    }

    [[nodiscard]] ClassifierStatistics GetStatistics() const {
        return m_stats;
    }

    void ResetStatistics() {
        m_stats.Reset();
    }

    [[nodiscard]] const ClassifierConfig& GetConfig() const noexcept {
        return m_config;
    }

private:
    struct ChainOutcome {
        std::string category;
        ErrorKind error = ErrorKind::None;
        std::chrono::microseconds oracleLatency{0};
        uint32_t attempts = 0;
        bool storeWriteFailed = false;
    };

    struct InFlightChain {
        std::promise<ChainOutcome> promise;
        std::shared_future<ChainOutcome> future;
    };

    ResolveResult Fallback(ResolveResult result, ErrorKind kind) const {
        result.category = m_config.fallbackCategory;
        result.cacheHit = false;
        result.error = kind;
        return result;
    }

    // ========================================================================
    // WORKERS
    // ========================================================================

    void WorkerLoop() {
        for (;;) {
            std::string domain;
            {
                std::unique_lock lock(m_mutex);
                m_queueCv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
                if (m_stopping) {
                    return;
                }
                domain = std::move(m_queue.front());
                m_queue.pop_front();
            }

            ChainOutcome outcome;
            try {
                outcome = RunChain(domain);
            }
            catch (const std::exception& ex) {
                CLS_LOG_ERROR("InternalError while classifying %s: %s", domain.c_str(), ex.what());
                outcome = ChainOutcome{};
                outcome.category = m_config.fallbackCategory;
                outcome.error = ErrorKind::InternalError;
            }

            std::shared_ptr<InFlightChain> chain;
            {
                std::lock_guard lock(m_mutex);
                auto it = m_inFlight.find(domain);
                if (it != m_inFlight.end()) {
                    chain = std::move(it->second);
                    m_inFlight.erase(it);
                }
            }
            if (chain) {
                chain->promise.set_value(std::move(outcome));
            }
        }
    }

    ChainOutcome RunChain(const std::string& domain) {
        ChainOutcome outcome;

        for (uint32_t attempt = 1;; ++attempt) {
            CategorizationResult response;
            try {
                response = m_client
                    ? m_client->Classify(domain)
                    : CategorizationResult::Failure(ErrorKind::OracleNotConfigured, "no categorization client");
            }
            catch (const std::exception& ex) {
                response = CategorizationResult::Failure(ErrorKind::InternalError, ex.what());
            }

            m_stats.oracleCalls++;
            outcome.attempts = attempt;
            outcome.oracleLatency += response.latency;

            if (response.IsSuccess()) {
                outcome.category = std::move(response.category);
                outcome.error = ErrorKind::None;
                m_stats.chainsSucceeded++;
                CLS_LOG_INFO("Oracle latency for domain %s: %.2f ms (%u attempt%s)",
                             domain.c_str(), static_cast<double>(outcome.oracleLatency.count()) / 1000.0,
                             attempt, attempt == 1 ? "" : "s");
                Persist(domain, outcome);
                return outcome;
            }

            outcome.error = response.error == ErrorKind::None ? ErrorKind::OracleMalformedResponse : response.error;

            if (!m_retry.ShouldRetry(outcome.error, attempt)) {
                break;
            }

            const auto delay = m_retry.DelayAfter(attempt, response.retryAfter);
            m_stats.retries++;
            CLS_LOG_DEBUG("Retrying %s after %s in %lld ms",
                          domain.c_str(), std::string(GetErrorKindName(outcome.error)).c_str(),
                          static_cast<long long>(delay.count()));

            if (!SleepUnlessStopping(delay)) {
                break;
            }
        }

        m_stats.chainsFailed++;
        outcome.category = m_config.fallbackCategory;
        CLS_LOG_ERROR("Failed to categorize domain %s: %s after %u attempt(s)",
                      domain.c_str(), std::string(GetErrorKindName(outcome.error)).c_str(), outcome.attempts);
        return outcome;
    }

    void Persist(const std::string& domain, ChainOutcome& outcome) {
        CacheEntry entry;
        entry.domain = domain;
        entry.category = outcome.category;
        entry.observedAt = std::chrono::system_clock::now();

        if (!m_store.Put(entry)) {
            m_stats.storeWriteFailures++;
            outcome.storeWriteFailed = true;
        }

        if (!m_config.registerNewCategories) {
            return;
        }

        const auto reg = m_store.RegisterCategory(outcome.category, Verdict::Allowed);
        if (reg.inserted) {
            m_stats.categoriesRegistered++;
        }
        if (!reg.persisted) {
            m_stats.storeWriteFailures++;
            outcome.storeWriteFailed = true;
        }
    }

    /// @return false when shutdown interrupted the sleep
    bool SleepUnlessStopping(std::chrono::milliseconds delay) {
        std::unique_lock lock(m_mutex);
        return !m_stopCv.wait_for(lock, delay, [this] { return m_stopping; });
    }

    // ========================================================================
    // MEMBERS
    // ========================================================================

    Storage::CategoryStore& m_store;
    std::shared_ptr<ICategorizationClient> m_client;
    RetryPolicy m_retry;
    ClassifierConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_stopCv;
    std::deque<std::string> m_queue;
    std::unordered_map<std::string, std::shared_ptr<InFlightChain>> m_inFlight;
    std::vector<std::thread> m_workers;
    bool m_stopping = false;

    mutable ClassifierStatistics m_stats;
};

// ============================================================================
// FACADE
// ============================================================================

DomainClassifier::DomainClassifier(Storage::CategoryStore& store,
                                   std::shared_ptr<ICategorizationClient> client,
                                   RetryPolicy retryPolicy,
                                   ClassifierConfig config)
    : m_impl(std::make_unique<DomainClassifierImpl>(store, std::move(client),
                                                    std::move(retryPolicy), std::move(config))) {
}

DomainClassifier::~DomainClassifier() = default;

ResolveResult DomainClassifier::Resolve(std::string_view host, const std::atomic<bool>* cancel) {
    return m_impl->Resolve(host, cancel);
}

bool DomainClassifier::NormalizeDomain(std::string_view host, std::string& out) const {
    return m_impl->NormalizeDomain(host, out);
}

size_t DomainClassifier::GetInFlightCount() const {
    return m_impl->GetInFlightCount();
}

void DomainClassifier::Shutdown() {
    m_impl->Shutdown();
}

ClassifierStatistics DomainClassifier::GetStatistics() const {
    return m_impl->GetStatistics();
}

void DomainClassifier::ResetStatistics() {
    m_impl->ResetStatistics();
}

const ClassifierConfig& DomainClassifier::GetConfig() const noexcept {
    return m_impl->GetConfig();
}

}  // namespace Categorization
}  // namespace DomainSentry
