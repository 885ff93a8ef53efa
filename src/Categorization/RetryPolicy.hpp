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
 * @file RetryPolicy.hpp
 * @brief Attempt budget and backoff schedule for oracle calls.
 */

#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <chrono>

#include "../Core/EngineTypes.hpp"

namespace DomainSentry {
namespace Categorization {

struct RetryConfig {
    /// @brief Total attempts including the first (1 = no retry)
    uint32_t maxAttempts = 2;

    uint32_t initialDelayMs = 250;

    uint32_t maxDelayMs = 4000;

    double backoffMultiplier = 2.0;

    bool retryOnTimeout = true;

    bool retryOnUnreachable = true;

    bool retryOnRateLimit = true;

    bool retryOnMalformed = false;

    [[nodiscard]] bool IsValid() const noexcept;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @class RetryPolicy
 * @brief Stateless decision helper; safe to share between threads.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    explicit RetryPolicy(RetryConfig config);

    /**
     * @brief Whether another attempt should follow a failed one.
     * @param kind Failure of the attempt that just finished
     * @param attemptsMade Attempts made so far (>= 1)
     */
    [[nodiscard]] bool ShouldRetry(ErrorKind kind, uint32_t attemptsMade) const noexcept;

    /**
     * @brief Sleep before the next attempt.
     *
     * initialDelay * multiplier^(attemptsMade-1), capped at maxDelay. A server
     * Retry-After replaces the computed value and is capped the same way.
     */
    [[nodiscard]] std::chrono::milliseconds DelayAfter(uint32_t attemptsMade,
        std::optional<std::chrono::seconds> retryAfter = std::nullopt) const noexcept;

    [[nodiscard]] bool IsRetryable(ErrorKind kind) const noexcept;

    [[nodiscard]] const RetryConfig& GetConfig() const noexcept { return m_config; }

    /// @brief Policy that never retries
    [[nodiscard]] static RetryPolicy NoRetry();

private:
    RetryConfig m_config;
};

}  // namespace Categorization
}  // namespace DomainSentry
