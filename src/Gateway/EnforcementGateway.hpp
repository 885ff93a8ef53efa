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
 * DomainSentry - ENFORCEMENT GATEWAY
 * ============================================================================
 *
 * @file EnforcementGateway.hpp
 * @brief Per-request entry point used by the interception transport.
 *
 * FLOW:
 * =====
 *   RequestDescriptor -> domain (Host, else SNI)
 *                     -> DomainClassifier::Resolve
 *                     -> PolicyResolver::VerdictFor   (skipped on fallback)
 *                     -> ActivityRecord to every sink
 *                     -> Decision
 *
 * Decide() never throws. Classification failures and internal errors
 * produce the configured fallback verdict (default: allowed).
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <shared_mutex>

#include "../Core/EngineTypes.hpp"
#include "ActivityLog.hpp"

namespace DomainSentry::Categorization {
    class DomainClassifier;
}

namespace DomainSentry::Policy {
    class PolicyResolver;
}

namespace DomainSentry {
namespace Gateway {

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief What the transport knows about an intercepted request
 */
struct RequestDescriptor {
    /// @brief Host header / authority (may carry a port)
    std::string host;

    /// @brief TLS SNI, used when host is empty
    std::string sni;

    std::string scheme;
    std::string method;
    std::string path;
    std::string clientAddress;
};

struct GatewayConfig {
    /// @brief Verdict when no category could be obtained
    Verdict fallbackVerdict = Verdict::Allowed;

    /// @brief Log every decision (allowed at Info, blocked at Warn)
    bool logDecisions = true;

    [[nodiscard]] std::string ToJson() const;
};

struct Decision {
    Verdict verdict = Verdict::Allowed;
    ActivityRecord record;

    [[nodiscard]] bool IsBlocked() const noexcept { return verdict == Verdict::Blocked; }
};

struct GatewayStatistics {
    std::atomic<uint64_t> decisions{0};
    std::atomic<uint64_t> allowed{0};
    std::atomic<uint64_t> blocked{0};
    std::atomic<uint64_t> cacheHits{0};
    std::atomic<uint64_t> cacheMisses{0};
    std::atomic<uint64_t> fallbacks{0};
    std::atomic<uint64_t> registrations{0};
    std::atomic<uint64_t> internalErrors{0};
    std::atomic<uint64_t> totalLatencyUs{0};
    std::atomic<uint64_t> maxLatencyUs{0};

    GatewayStatistics() = default;
    GatewayStatistics(const GatewayStatistics& other) noexcept;
    GatewayStatistics& operator=(const GatewayStatistics& other) noexcept;

    void Reset() noexcept;
    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// GATEWAY CLASS
// ============================================================================

/**
 * @class EnforcementGateway
 * @brief Thread-safe; one instance serves all connections.
 */
class EnforcementGateway final {
public:
    EnforcementGateway(Categorization::DomainClassifier& classifier,
                       Policy::PolicyResolver& resolver,
                       GatewayConfig config = {});

    EnforcementGateway(const EnforcementGateway&) = delete;
    EnforcementGateway& operator=(const EnforcementGateway&) = delete;

    void AddSink(std::shared_ptr<ActivitySink> sink);

    /**
     * @brief Decide one request.
     * @param cancel Optional flag set by the transport when the client went away
     */
    [[nodiscard]] Decision Decide(const RequestDescriptor& request,
                                  const std::atomic<bool>* cancel = nullptr) noexcept;

    [[nodiscard]] GatewayStatistics GetStatistics() const;

    void ResetStatistics();

    [[nodiscard]] const GatewayConfig& GetConfig() const noexcept { return m_config; }

private:
    void Emit(const ActivityRecord& record) noexcept;
    void Account(const Decision& decision) noexcept;

    Categorization::DomainClassifier& m_classifier;
    Policy::PolicyResolver& m_resolver;
    GatewayConfig m_config;

    mutable std::shared_mutex m_sinksMutex;
    std::vector<std::shared_ptr<ActivitySink>> m_sinks;

    GatewayStatistics m_stats;
};

}  // namespace Gateway
}  // namespace DomainSentry
