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
 * DomainSentry - CATEGORIZATION CLIENT INTERFACE
 * ============================================================================
 *
 * @file CategorizationClient.hpp
 * @brief Seam between the classifier and the external categorization oracle.
 *
 * A client performs exactly one oracle call per Classify() invocation and
 * reports failures as values. Retrying is the classifier's job.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <chrono>

#include "../Core/EngineTypes.hpp"

namespace DomainSentry {
namespace Categorization {

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Outcome of one oracle call
 */
struct CategorizationResult {
    /// @brief Category label (empty on failure)
    std::string category;

    /// @brief ErrorKind::None on success, one of the Oracle* kinds otherwise
    ErrorKind error = ErrorKind::None;

    /// @brief HTTP status when a response was received
    uint32_t httpStatus = 0;

    /// @brief Server-provided Retry-After (RateLimited only)
    std::optional<std::chrono::seconds> retryAfter;

    /// @brief Diagnostic text for logs
    std::string message;

    /// @brief Wall-clock time of the call
    std::chrono::microseconds latency{0};

    [[nodiscard]] bool IsSuccess() const noexcept { return error == ErrorKind::None && !category.empty(); }

    [[nodiscard]] static CategorizationResult Success(std::string label) {
        CategorizationResult r;
        r.category = std::move(label);
        return r;
    }

    [[nodiscard]] static CategorizationResult Failure(ErrorKind kind, std::string text) {
        CategorizationResult r;
        r.error = kind;
        r.message = std::move(text);
        return r;
    }
};

// ============================================================================
// INTERFACE
// ============================================================================

/**
 * @brief Oracle client. Implementations must be callable from several
 *        worker threads at once and must not throw.
 */
class ICategorizationClient {
public:
    virtual ~ICategorizationClient() = default;

    /// @brief Classify a normalized domain with a single bounded call
    [[nodiscard]] virtual CategorizationResult Classify(std::string_view domain) = 0;

    /// @brief False when no credential is available (calls fail NotConfigured)
    [[nodiscard]] virtual bool IsConfigured() const noexcept = 0;
};

}  // namespace Categorization
}  // namespace DomainSentry
