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
 * @file EnforcementGateway.cpp
 */

#include "pch.h"
#include "EnforcementGateway.hpp"
#include "../Categorization/DomainClassifier.hpp"
#include "../Policy/PolicyResolver.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Gateway {

#define GW_LOG_INFO(fmt, ...)   DS_LOG_INFO("Gateway", fmt, ##__VA_ARGS__)
#define GW_LOG_WARN(fmt, ...)   DS_LOG_WARN("Gateway", fmt, ##__VA_ARGS__)
#define GW_LOG_ERROR(fmt, ...)  DS_LOG_ERROR("Gateway", fmt, ##__VA_ARGS__)

// ============================================================================
// STRUCT IMPLEMENTATIONS
// ============================================================================

std::string GatewayConfig::ToJson() const {
    nlohmann::json j;
    j["fallbackVerdict"] = std::string(GetVerdictPolicyValue(fallbackVerdict));
    j["logDecisions"] = logDecisions;
    return j.dump();
}

GatewayStatistics::GatewayStatistics(const GatewayStatistics& other) noexcept {
    *this = other;
}

GatewayStatistics& GatewayStatistics::operator=(const GatewayStatistics& other) noexcept {
    decisions = other.decisions.load();
    allowed = other.allowed.load();
    blocked = other.blocked.load();
    cacheHits = other.cacheHits.load();
    cacheMisses = other.cacheMisses.load();
    fallbacks = other.fallbacks.load();
    registrations = other.registrations.load();
    internalErrors = other.internalErrors.load();
    totalLatencyUs = other.totalLatencyUs.load();
    maxLatencyUs = other.maxLatencyUs.load();
    return *this;
}

void GatewayStatistics::Reset() noexcept {
    decisions = 0;
    allowed = 0;
    blocked = 0;
    cacheHits = 0;
    cacheMisses = 0;
    fallbacks = 0;
    registrations = 0;
    internalErrors = 0;
    totalLatencyUs = 0;
    maxLatencyUs = 0;
}

std::string GatewayStatistics::ToJson() const {
    nlohmann::json j;
    j["decisions"] = decisions.load();
    j["allowed"] = allowed.load();
    j["blocked"] = blocked.load();
    j["cacheHits"] = cacheHits.load();
    j["cacheMisses"] = cacheMisses.load();
    j["fallbacks"] = fallbacks.load();
    j["registrations"] = registrations.load();
    j["internalErrors"] = internalErrors.load();
    j["totalLatencyUs"] = totalLatencyUs.load();
    j["maxLatencyUs"] = maxLatencyUs.load();
    const uint64_t n = decisions.load();
    j["avgLatencyUs"] = n > 0 ? totalLatencyUs.load() / n : 0;
    return j.dump();
}

// ============================================================================
// GATEWAY
// ============================================================================

EnforcementGateway::EnforcementGateway(Categorization::DomainClassifier& classifier,
                                       Policy::PolicyResolver& resolver,
                                       GatewayConfig config)
    : m_classifier(classifier)
    , m_resolver(resolver)
    , m_config(config) {
}

void EnforcementGateway::AddSink(std::shared_ptr<ActivitySink> sink) {
    if (!sink) {
        return;
    }
    std::unique_lock lock(m_sinksMutex);
    m_sinks.push_back(std::move(sink));
}

Decision EnforcementGateway::Decide(const RequestDescriptor& request, const std::atomic<bool>* cancel) noexcept {
    const auto start = std::chrono::steady_clock::now();

    Decision decision;
    ActivityRecord& record = decision.record;

    try {
        record.timestamp = std::chrono::system_clock::now();
        record.host = request.host;
        record.scheme = request.scheme;
        record.method = request.method;
        record.path = request.path;
        record.clientAddress = request.clientAddress;

        const std::string_view target = Utils::StringUtils::TrimView(request.host).empty()
            ? std::string_view(request.sni)
            : std::string_view(request.host);

        const Categorization::ResolveResult resolved = m_classifier.Resolve(target, cancel);

        record.domain = resolved.normalizedDomain.empty() ? std::string(target) : resolved.normalizedDomain;
        record.category = resolved.category;
        record.cacheHit = resolved.cacheHit;
        record.oracleLatency = resolved.oracleLatency;
        record.errorKind = resolved.error;

        if (resolved.IsFallback()) {
            decision.verdict = m_config.fallbackVerdict;
            m_stats.fallbacks++;
        } else {
            const Policy::PolicyDecision policy = m_resolver.VerdictFor(resolved.category);
            decision.verdict = policy.verdict;
            record.categoryRegistered = policy.registered;
            if (record.errorKind == ErrorKind::None) {
                record.errorKind = policy.GetError();
            }
        }
    }
    catch (const std::exception& ex) {
        GW_LOG_ERROR("InternalError deciding request for host '%s': %s", request.host.c_str(), ex.what());
        decision.verdict = m_config.fallbackVerdict;
        record.errorKind = ErrorKind::InternalError;
        if (record.category.empty()) {
            record.category = m_classifier.GetConfig().fallbackCategory;
        }
        m_stats.internalErrors++;
        m_stats.fallbacks++;
    }

    record.verdict = decision.verdict;
    record.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    Account(decision);

    if (m_config.logDecisions) {
        const double ms = static_cast<double>(record.latency.count()) / 1000.0;
        const char* source = record.cacheHit ? "cached" : "oracle";
        if (decision.IsBlocked()) {
            GW_LOG_WARN("Blocking %s - Category: %s (%s, %.3f ms)",
                        record.domain.c_str(), record.category.c_str(), source, ms);
        } else if (record.errorKind != ErrorKind::None) {
            GW_LOG_INFO("Allowing %s - Category: %s (%s, %s, %.3f ms)",
                        record.domain.c_str(), record.category.c_str(), source,
                        std::string(GetErrorKindName(record.errorKind)).c_str(), ms);
        } else {
            GW_LOG_INFO("Allowing %s - Category: %s (%s, %.3f ms)",
                        record.domain.c_str(), record.category.c_str(), source, ms);
        }
    }

    Emit(record);
    return decision;
}

void EnforcementGateway::Emit(const ActivityRecord& record) noexcept {
    std::shared_lock lock(m_sinksMutex);
    for (const auto& sink : m_sinks) {
        sink->Append(record);
    }
}

void EnforcementGateway::Account(const Decision& decision) noexcept {
    const ActivityRecord& record = decision.record;

    m_stats.decisions++;
    if (decision.IsBlocked()) {
        m_stats.blocked++;
    } else {
        m_stats.allowed++;
    }
    if (record.cacheHit) {
        m_stats.cacheHits++;
    } else {
        m_stats.cacheMisses++;
    }
    if (record.categoryRegistered) {
        m_stats.registrations++;
    }

    const auto us = static_cast<uint64_t>(record.latency.count());
    m_stats.totalLatencyUs += us;
    uint64_t prev = m_stats.maxLatencyUs.load();
    while (us > prev && !m_stats.maxLatencyUs.compare_exchange_weak(prev, us)) {
    }
}

GatewayStatistics EnforcementGateway::GetStatistics() const {
    return m_stats;
}

void EnforcementGateway::ResetStatistics() {
    m_stats.Reset();
}

}  // namespace Gateway
}  // namespace DomainSentry
