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
 * DomainSentry - ENGINE SERVICE
 * ============================================================================
 *
 * @file SentryService.hpp
 * @brief Assembles and owns the engine components for one process.
 *
 * Startup order: logger -> store -> oracle client -> classifier ->
 * policy resolver -> gateway -> activity log -> block page.
 * Stop() tears down in reverse and flushes the logger.
 *
 * ============================================================================
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <atomic>

#include "../Config/ConfigManager.hpp"
#include "../Categorization/CategorizationClient.hpp"
#include "../Gateway/EnforcementGateway.hpp"
#include "../Gateway/BlockPage.hpp"

namespace DomainSentry::Storage {
    class CategoryStore;
}

namespace DomainSentry::Categorization {
    class DomainClassifier;
}

namespace DomainSentry::Service {
    class SentryServiceImpl;
}

namespace DomainSentry {
namespace Service {

struct ServiceOptions {
    /// @brief Initialize the global logger from the engine config
    bool configureLogger = true;

    /// @brief Open the JSON lines activity log
    bool enableActivityLog = true;

    /// @brief Oracle client to use instead of the Gemini client
    std::shared_ptr<Categorization::ICategorizationClient> clientOverride;
};

/**
 * @class SentryService
 * @brief Owns one engine instance. Decide() is thread-safe once initialized.
 */
class SentryService final {
public:
    SentryService();
    ~SentryService();

    SentryService(const SentryService&) = delete;
    SentryService& operator=(const SentryService&) = delete;

    /**
     * @brief Build all components.
     *
     * Store read problems are tolerated (degraded start, logged). Returns
     * false only when the configuration is invalid or a component cannot be
     * constructed.
     */
    [[nodiscard]] bool Initialize(const Config::EngineConfig& config, ServiceOptions options = {});

    [[nodiscard]] bool IsInitialized() const noexcept;

    /// @brief Decide one request; allowed (fail-open) when not initialized
    [[nodiscard]] Gateway::Decision Decide(const Gateway::RequestDescriptor& request,
                                           const std::atomic<bool>* cancel = nullptr);

    /// @brief Block page response for a blocked decision
    [[nodiscard]] Gateway::BlockResponse MakeBlockResponse(const Gateway::Decision& decision) const;

    [[nodiscard]] Storage::CategoryStore& GetStore();

    [[nodiscard]] Categorization::DomainClassifier& GetClassifier();

    [[nodiscard]] Gateway::EnforcementGateway& GetGateway();

    /// @brief Combined component statistics as a JSON object
    [[nodiscard]] std::string GetStatusReport() const;

    /// @brief Releases the engine; in-progress Decide() calls finish first, later ones fail open.
    void Stop();

private:
    std::unique_ptr<SentryServiceImpl> m_impl;
};

}  // namespace Service
}  // namespace DomainSentry
