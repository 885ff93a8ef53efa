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
 * @file PolicyResolver.hpp
 * @brief Category -> verdict against the store's current policy table.
 *
 * Unseen categories are registered as allowed. Invalid operator values are
 * reported and treated as allowed, and never rewritten.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <atomic>
#include <optional>
#include <memory>

#include "../Core/EngineTypes.hpp"

namespace DomainSentry::Storage {
    class CategoryStore;
}

namespace DomainSentry {
namespace Policy {

struct PolicyDecision {
    Verdict verdict = Verdict::Allowed;

    /// @brief This lookup added the category to the policy table
    bool registered = false;

    /// @brief Registration stayed in memory (policy file not written)
    bool registrationNotPersisted = false;

    /// @brief Operator value when the entry is not "allowed"/"blocked"
    std::optional<std::string> invalidValue;

    /// @brief Failure affecting this decision (InvalidPolicyValue, StoreWriteFailure)
    [[nodiscard]] ErrorKind GetError() const noexcept;
};

struct PolicyResolverStatistics {
    std::atomic<uint64_t> decisions{0};
    std::atomic<uint64_t> allowed{0};
    std::atomic<uint64_t> blocked{0};
    std::atomic<uint64_t> registrations{0};
    std::atomic<uint64_t> invalidValues{0};

    PolicyResolverStatistics() = default;
    PolicyResolverStatistics(const PolicyResolverStatistics& other) noexcept;
    PolicyResolverStatistics& operator=(const PolicyResolverStatistics& other) noexcept;

    void Reset() noexcept;
    [[nodiscard]] std::string ToJson() const;
};

/**
 * @class PolicyResolver
 * @brief Stateless apart from counters; thread-safe. Never touches the network.
 */
class PolicyResolver final {
public:
    explicit PolicyResolver(Storage::CategoryStore& store);

    PolicyResolver(const PolicyResolver&) = delete;
    PolicyResolver& operator=(const PolicyResolver&) = delete;

    [[nodiscard]] PolicyDecision VerdictFor(std::string_view category);

    [[nodiscard]] PolicyResolverStatistics GetStatistics() const;

    void ResetStatistics();

private:
    Storage::CategoryStore& m_store;
    PolicyResolverStatistics m_stats;
};

}  // namespace Policy
}  // namespace DomainSentry
