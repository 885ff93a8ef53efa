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
#include "PolicyResolver.hpp"
#include "../Storage/CategoryStore.hpp"
#include "../Utils/Logger.hpp"

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Policy {

ErrorKind PolicyDecision::GetError() const noexcept {
    if (invalidValue.has_value()) return ErrorKind::InvalidPolicyValue;
    if (registrationNotPersisted) return ErrorKind::StoreWriteFailure;
    return ErrorKind::None;
}

PolicyResolverStatistics::PolicyResolverStatistics(const PolicyResolverStatistics& other) noexcept {
    *this = other;
}

PolicyResolverStatistics& PolicyResolverStatistics::operator=(const PolicyResolverStatistics& other) noexcept {
    decisions = other.decisions.load();
    allowed = other.allowed.load();
    blocked = other.blocked.load();
    registrations = other.registrations.load();
    invalidValues = other.invalidValues.load();
    return *this;
}

void PolicyResolverStatistics::Reset() noexcept {
    decisions = 0;
    allowed = 0;
    blocked = 0;
    registrations = 0;
    invalidValues = 0;
}

std::string PolicyResolverStatistics::ToJson() const {
    nlohmann::json j;
    j["decisions"] = decisions.load();
    j["allowed"] = allowed.load();
    j["blocked"] = blocked.load();
    j["registrations"] = registrations.load();
    j["invalidValues"] = invalidValues.load();
    return j.dump();
}

PolicyResolver::PolicyResolver(Storage::CategoryStore& store)
    : m_store(store) {
}

PolicyDecision PolicyResolver::VerdictFor(std::string_view category) {
    m_stats.decisions++;
    PolicyDecision decision;

    const Storage::PolicyLookup lookup = m_store.GetPolicy(category);

    if (lookup.found && lookup.verdict.has_value()) {
        decision.verdict = *lookup.verdict;
    } else if (lookup.IsInvalid()) {
        // Store already logged the bad value once; keep the counter per decision.
        m_stats.invalidValues++;
        decision.verdict = Verdict::Allowed;
        decision.invalidValue = lookup.invalidValue;
    } else {
        const Storage::RegisterResult reg = m_store.RegisterCategory(category, Verdict::Allowed);
        if (reg.inserted) {
            m_stats.registrations++;
            decision.registered = true;
            decision.registrationNotPersisted = !reg.persisted;
            DS_LOG_INFO("Policy", "Added new category to policy: %.*s = allowed",
                        static_cast<int>(category.size()), category.data());
        }
        // Another writer may have registered it first, possibly with another value.
        decision.verdict = reg.current.verdict.value_or(Verdict::Allowed);
        if (!reg.current.IsValid()) {
            decision.invalidValue = reg.current.raw;
            m_stats.invalidValues++;
        }
    }

    if (decision.verdict == Verdict::Blocked) {
        m_stats.blocked++;
    } else {
        m_stats.allowed++;
    }
    return decision;
}

PolicyResolverStatistics PolicyResolver::GetStatistics() const {
    return m_stats;
}

void PolicyResolver::ResetStatistics() {
    m_stats.Reset();
}

}  // namespace Policy
}  // namespace DomainSentry
