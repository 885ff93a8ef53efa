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
#include "pch.h"
#include "RetryPolicy.hpp"

#include <cmath>
#include <algorithm>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Categorization {

bool RetryConfig::IsValid() const noexcept {
    if (maxAttempts == 0 || maxAttempts > 10) return false;
    if (backoffMultiplier < 1.0) return false;
    if (initialDelayMs > maxDelayMs) return false;
    return true;
}

std::string RetryConfig::ToJson() const {
    nlohmann::json j;
    j["maxAttempts"] = maxAttempts;
    j["initialDelayMs"] = initialDelayMs;
    j["maxDelayMs"] = maxDelayMs;
    j["backoffMultiplier"] = backoffMultiplier;
    j["retryOnTimeout"] = retryOnTimeout;
    j["retryOnUnreachable"] = retryOnUnreachable;
    j["retryOnRateLimit"] = retryOnRateLimit;
    j["retryOnMalformed"] = retryOnMalformed;
    return j.dump();
}

RetryPolicy::RetryPolicy(RetryConfig config)
    : m_config(config) {
}

RetryPolicy RetryPolicy::NoRetry() {
    RetryConfig cfg;
    cfg.maxAttempts = 1;
    return RetryPolicy(cfg);
}

bool RetryPolicy::IsRetryable(ErrorKind kind) const noexcept {
    switch (kind) {
        case ErrorKind::OracleTimeout:           return m_config.retryOnTimeout;
        case ErrorKind::OracleUnreachable:       return m_config.retryOnUnreachable;
        case ErrorKind::OracleRateLimited:       return m_config.retryOnRateLimit;
        case ErrorKind::OracleMalformedResponse: return m_config.retryOnMalformed;
        default:                                 return false;
    }
}

bool RetryPolicy::ShouldRetry(ErrorKind kind, uint32_t attemptsMade) const noexcept {
    return attemptsMade < m_config.maxAttempts && IsRetryable(kind);
}

std::chrono::milliseconds RetryPolicy::DelayAfter(uint32_t attemptsMade,
                                                  std::optional<std::chrono::seconds> retryAfter) const noexcept {
    const auto cap = static_cast<double>(m_config.maxDelayMs);

    if (retryAfter.has_value() && retryAfter->count() >= 0) {
        const double ms = static_cast<double>(retryAfter->count()) * 1000.0;
        return std::chrono::milliseconds(static_cast<int64_t>(std::min(ms, cap)));
    }

    const uint32_t exponent = attemptsMade > 0 ? attemptsMade - 1 : 0;
    double delay = static_cast<double>(m_config.initialDelayMs) *
                   std::pow(m_config.backoffMultiplier, static_cast<double>(exponent));
    delay = std::min(delay, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace Categorization
}  // namespace DomainSentry
