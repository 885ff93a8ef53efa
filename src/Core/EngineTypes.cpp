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
#include "EngineTypes.hpp"
#include "../Utils/StringUtils.hpp"

#include <cstdio>
#include <ctime>

namespace DomainSentry {

std::string_view GetVerdictName(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::Allowed:  return "Allowed";
        case Verdict::Blocked:  return "Blocked";
        default:                return "Unknown";
    }
}

std::string_view GetVerdictPolicyValue(Verdict verdict) noexcept {
    return verdict == Verdict::Blocked ? "blocked" : "allowed";
}

std::optional<Verdict> ParseVerdict(std::string_view value) noexcept {
    const std::string_view v = Utils::StringUtils::TrimView(value);
    if (Utils::StringUtils::EqualsIgnoreCase(v, "allowed")) return Verdict::Allowed;
    if (Utils::StringUtils::EqualsIgnoreCase(v, "blocked")) return Verdict::Blocked;
    return std::nullopt;
}

std::string_view GetErrorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                    return "None";
        case ErrorKind::OracleUnreachable:       return "OracleUnreachable";
        case ErrorKind::OracleTimeout:           return "OracleTimeout";
        case ErrorKind::OracleMalformedResponse: return "OracleMalformedResponse";
        case ErrorKind::OracleRateLimited:       return "OracleRateLimited";
        case ErrorKind::OracleNotConfigured:     return "OracleNotConfigured";
        case ErrorKind::StoreReadFailure:        return "StoreReadFailure";
        case ErrorKind::StoreWriteFailure:       return "StoreWriteFailure";
        case ErrorKind::InvalidPolicyValue:      return "InvalidPolicyValue";
        case ErrorKind::InvalidDomain:           return "InvalidDomain";
        case ErrorKind::RequestCancelled:        return "RequestCancelled";
        case ErrorKind::InternalError:           return "InternalError";
        default:                                 return "Unknown";
    }
}

bool IsOracleError(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::OracleUnreachable:
        case ErrorKind::OracleTimeout:
        case ErrorKind::OracleMalformedResponse:
        case ErrorKind::OracleRateLimited:
        case ErrorKind::OracleNotConfigured:
            return true;
        default:
            return false;
    }
}

std::string FormatTimestampUtc(SystemTimePoint tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    if (ms < 0) ms = 0;
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

int64_t ToUnixSeconds(SystemTimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

SystemTimePoint FromUnixSeconds(int64_t seconds) noexcept {
    return SystemTimePoint(std::chrono::seconds(seconds));
}

}  // namespace DomainSentry
