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
 * DomainSentry - ENGINE TYPES
 * ============================================================================
 *
 * @file EngineTypes.hpp
 * @brief Value types shared by the store, classifier, policy resolver and
 *        enforcement gateway.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <chrono>

namespace DomainSentry {

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SystemTimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Decision returned to the transport
 */
enum class Verdict : uint8_t {
    Allowed = 0,    ///< Forward unmodified
    Blocked = 1     ///< Substitute the block page
};

/**
 * @brief Failure taxonomy carried by resolve results and activity records.
 *
 * A cache miss is a control state (cacheHit == false), not an error.
 */
enum class ErrorKind : uint8_t {
    None                    = 0,
    OracleUnreachable       = 1,
    OracleTimeout           = 2,
    OracleMalformedResponse = 3,
    OracleRateLimited       = 4,
    OracleNotConfigured     = 5,    ///< No credential; no call was made
    StoreReadFailure        = 6,
    StoreWriteFailure       = 7,
    InvalidPolicyValue      = 8,
    InvalidDomain           = 9,    ///< Nothing classifiable in the request
    RequestCancelled        = 10,   ///< Caller stopped waiting; classification continues
    InternalError           = 11
};

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief One cached classification. Replaced whole, never patched.
 */
struct CacheEntry {
    std::string domain;
    std::string category;
    SystemTimePoint observedAt{};

    [[nodiscard]] bool operator==(const CacheEntry& other) const noexcept {
        return domain == other.domain && category == other.category && observedAt == other.observedAt;
    }
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

[[nodiscard]] std::string_view GetVerdictName(Verdict verdict) noexcept;

/// @brief Policy file spelling ("allowed" / "blocked")
[[nodiscard]] std::string_view GetVerdictPolicyValue(Verdict verdict) noexcept;

/**
 * @brief Parse a policy file value, case-insensitively.
 * @return nullopt for anything other than "allowed" / "blocked"
 */
[[nodiscard]] std::optional<Verdict> ParseVerdict(std::string_view value) noexcept;

[[nodiscard]] std::string_view GetErrorKindName(ErrorKind kind) noexcept;

/// @brief True for the Oracle* kinds
[[nodiscard]] bool IsOracleError(ErrorKind kind) noexcept;

/// @brief ISO 8601 UTC with milliseconds ("2026-10-19T08:15:30.250Z")
[[nodiscard]] std::string FormatTimestampUtc(SystemTimePoint tp);

[[nodiscard]] int64_t ToUnixSeconds(SystemTimePoint tp) noexcept;

[[nodiscard]] SystemTimePoint FromUnixSeconds(int64_t seconds) noexcept;

}  // namespace DomainSentry
