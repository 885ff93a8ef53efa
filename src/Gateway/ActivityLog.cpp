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
#include "ActivityLog.hpp"
#include "../Utils/Logger.hpp"

#include <cerrno>
#include <cstring>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Gateway {

std::string ActivityRecord::ToJson() const {
    nlohmann::json j;
    j["timestamp"] = FormatTimestampUtc(timestamp);
    j["domain"] = domain;
    j["category"] = category;
    j["verdict"] = std::string(GetVerdictPolicyValue(verdict));
    j["cacheHit"] = cacheHit;
    j["latencyUs"] = latency.count();
    j["oracleLatencyUs"] = oracleLatency.count();
    if (errorKind != ErrorKind::None) {
        j["errorKind"] = std::string(GetErrorKindName(errorKind));
    }
    if (categoryRegistered) {
        j["categoryRegistered"] = true;
    }
    j["host"] = host;
    j["scheme"] = scheme;
    j["method"] = method;
    j["path"] = path;
    j["clientAddress"] = clientAddress;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// JsonLinesActivitySink
// ============================================================================

JsonLinesActivitySink::JsonLinesActivitySink(std::filesystem::path path)
    : m_path(std::move(path)) {
}

JsonLinesActivitySink::~JsonLinesActivitySink() {
    Close();
}

bool JsonLinesActivitySink::Open(std::string* errorMessage) {
    std::lock_guard lock(m_mutex);
    if (m_file != nullptr) {
        return true;
    }

    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }

    m_file = std::fopen(m_path.c_str(), "a");
    if (m_file == nullptr) {
        const std::string reason = std::strerror(errno);
        DS_LOG_ERROR("ActivityLog", "Cannot open activity log %s: %s", m_path.c_str(), reason.c_str());
        if (errorMessage != nullptr) {
            *errorMessage = reason;
        }
        return false;
    }
    return true;
}

bool JsonLinesActivitySink::IsOpen() const noexcept {
    std::lock_guard lock(m_mutex);
    return m_file != nullptr;
}

void JsonLinesActivitySink::Append(const ActivityRecord& record) noexcept {
    std::string line;
    try {
        line = record.ToJson();
        line.push_back('\n');
    }
    catch (const std::exception& ex) {
        m_failed++;
        DS_LOG_ERROR("ActivityLog", "Cannot serialize activity record for %s: %s",
                     record.domain.c_str(), ex.what());
        return;
    }

    std::lock_guard lock(m_mutex);
    if (m_file == nullptr) {
        m_failed++;
        return;
    }
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size() || std::fflush(m_file) != 0) {
        m_failed++;
        return;
    }
    m_written++;
}

void JsonLinesActivitySink::Flush() noexcept {
    std::lock_guard lock(m_mutex);
    if (m_file != nullptr) {
        std::fflush(m_file);
    }
}

void JsonLinesActivitySink::Close() noexcept {
    std::lock_guard lock(m_mutex);
    if (m_file != nullptr) {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

// ============================================================================
// MemoryActivitySink
// ============================================================================

MemoryActivitySink::MemoryActivitySink(size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity) {
}

void MemoryActivitySink::Append(const ActivityRecord& record) noexcept {
    try {
        std::lock_guard lock(m_mutex);
        if (m_records.size() >= m_capacity) {
            m_records.pop_front();
        }
        m_records.push_back(record);
    }
    catch (const std::exception& ex) {
        DS_LOG_ERROR("ActivityLog", "Dropped in-memory activity record: %s", ex.what());
    }
}

std::vector<ActivityRecord> MemoryActivitySink::Snapshot() const {
    std::lock_guard lock(m_mutex);
    return {m_records.begin(), m_records.end()};
}

size_t MemoryActivitySink::Size() const {
    std::lock_guard lock(m_mutex);
    return m_records.size();
}

void MemoryActivitySink::Clear() {
    std::lock_guard lock(m_mutex);
    m_records.clear();
}

}  // namespace Gateway
}  // namespace DomainSentry
