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
 * DomainSentry - ACTIVITY LOG
 * ============================================================================
 *
 * @file ActivityLog.hpp
 * @brief Append-only structured records of enforcement decisions.
 *
 * One ActivityRecord is produced per request reaching the gateway. Sinks
 * receive records from many threads; no ordering between concurrent
 * requests is promised.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <filesystem>

#include "../Core/EngineTypes.hpp"

namespace DomainSentry {
namespace Gateway {

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief One enforcement decision
 */
struct ActivityRecord {
    std::string domain;
    std::string category;
    Verdict verdict = Verdict::Allowed;
    bool cacheHit = false;

    /// @brief Wall-clock time spent in Decide()
    std::chrono::microseconds latency{0};

    /// @brief Oracle time included in latency (0 on cache hit)
    std::chrono::microseconds oracleLatency{0};

    SystemTimePoint timestamp{};

    /// @brief None when the decision was clean
    ErrorKind errorKind = ErrorKind::None;

    /// @brief Category was added to the policy table by this request
    bool categoryRegistered = false;

    // Request metadata
    std::string host;
    std::string scheme;
    std::string method;
    std::string path;
    std::string clientAddress;

    /// @brief Single-line JSON; errorKind omitted when None
    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// SINK INTERFACE
// ============================================================================

class ActivitySink {
public:
    virtual ~ActivitySink() = default;

    /// @brief Record one decision. Must not throw.
    virtual void Append(const ActivityRecord& record) noexcept = 0;

    virtual void Flush() noexcept {}
};

// ============================================================================
// JSON LINES FILE SINK
// ============================================================================

/**
 * @class JsonLinesActivitySink
 * @brief Appends one JSON object per line, flushed per record.
 */
class JsonLinesActivitySink final : public ActivitySink {
public:
    explicit JsonLinesActivitySink(std::filesystem::path path);
    ~JsonLinesActivitySink() override;

    JsonLinesActivitySink(const JsonLinesActivitySink&) = delete;
    JsonLinesActivitySink& operator=(const JsonLinesActivitySink&) = delete;

    /**
     * @brief Open (create/append) the file; parent directories are created.
     * @param errorMessage Optional reason on failure
     */
    [[nodiscard]] bool Open(std::string* errorMessage = nullptr);

    [[nodiscard]] bool IsOpen() const noexcept;

    void Append(const ActivityRecord& record) noexcept override;

    void Flush() noexcept override;

    void Close() noexcept;

    [[nodiscard]] uint64_t GetWrittenCount() const noexcept { return m_written.load(); }

    [[nodiscard]] uint64_t GetFailedCount() const noexcept { return m_failed.load(); }

    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::FILE* m_file = nullptr;
    std::atomic<uint64_t> m_written{0};
    std::atomic<uint64_t> m_failed{0};
};

// ============================================================================
// IN-MEMORY SINK
// ============================================================================

/**
 * @class MemoryActivitySink
 * @brief Bounded ring of the most recent records.
 */
class MemoryActivitySink final : public ActivitySink {
public:
    explicit MemoryActivitySink(size_t capacity = 4096);

    void Append(const ActivityRecord& record) noexcept override;

    [[nodiscard]] std::vector<ActivityRecord> Snapshot() const;

    [[nodiscard]] size_t Size() const;

    void Clear();

private:
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::deque<ActivityRecord> m_records;
};

}  // namespace Gateway
}  // namespace DomainSentry
