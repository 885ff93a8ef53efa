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
 * @file SentryService.cpp
 */

#include "pch.h"
#include "SentryService.hpp"

#include "../Utils/Logger.hpp"
#include "../Storage/CategoryStore.hpp"
#include "../Categorization/GeminiCategorizationClient.hpp"
#include "../Categorization/DomainClassifier.hpp"
#include "../Policy/PolicyResolver.hpp"

#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace DomainSentry {
namespace Service {

static constexpr const char* LOG_CATEGORY = "Service";

// ============================================================================
// SERVICE IMPLEMENTATION (PIMPL)
// ============================================================================

class SentryServiceImpl final {
public:
    SentryServiceImpl() = default;
    ~SentryServiceImpl() { Stop(); }

    SentryServiceImpl(const SentryServiceImpl&) = delete;
    SentryServiceImpl& operator=(const SentryServiceImpl&) = delete;

    [[nodiscard]] bool Initialize(const Config::EngineConfig& config, ServiceOptions options) {
        std::lock_guard lock(m_mutex);
        if (m_components) {
            return true;
        }

        if (options.configureLogger) {
            Utils::Logger::Instance().Initialize(config.ToLoggerConfig());
        }

        if (!config.IsValid()) {
            DS_LOG_ERROR(LOG_CATEGORY, "Refusing to start with invalid configuration: %s", config.ToJson().c_str());
            return false;
        }

        try {
            DS_LOG_SCOPE(LOG_CATEGORY);
            DS_LOG_INFO(LOG_CATEGORY, "DomainSentry initializing...");
            auto components = std::make_shared<Components>();

            // 1. Durable state
            components->store = std::make_unique<Storage::CategoryStore>(config.store);
            if (!components->store->Open()) {
                DS_LOG_WARN(LOG_CATEGORY, "Store opened degraded; continuing with the tables that could be read");
            }

            // 2. Oracle client
            components->client = options.clientOverride;
            if (!components->client) {
                components->client = std::make_shared<Categorization::GeminiCategorizationClient>(config.oracle);
            }

            // 3. Classification and policy
            components->classifier = std::make_unique<Categorization::DomainClassifier>(
                *components->store, components->client, Categorization::RetryPolicy(config.retry), config.classifier);
            components->resolver = std::make_unique<Policy::PolicyResolver>(*components->store);

            // 4. Enforcement
            components->gateway = std::make_unique<Gateway::EnforcementGateway>(
                *components->classifier, *components->resolver, config.gateway);

            if (options.enableActivityLog) {
                auto sink = std::make_shared<Gateway::JsonLinesActivitySink>(config.activityLogPath);
                std::string reason;
                if (sink->Open(&reason)) {
                    components->gateway->AddSink(sink);
                } else {
                    DS_LOG_WARN(LOG_CATEGORY, "Activity log disabled: %s", reason.c_str());
                }
            }

            components->blockPage.LoadFromFile(config.blockPagePath);

            const bool configured = components->client->IsConfigured();
            m_components = std::move(components);
            m_initialized = true;
            DS_LOG_INFO(LOG_CATEGORY, "DomainSentry initialization complete (oracle %s)",
                        configured ? "configured" : "NOT configured");
            return true;
        }
        catch (const std::exception& ex) {
            DS_LOG_FATAL(LOG_CATEGORY, "Initialization failed: %s", ex.what());
            return false;
        }
    }

    [[nodiscard]] bool IsInitialized() const noexcept {
        return m_initialized.load();
    }

    [[nodiscard]] Gateway::Decision Decide(const Gateway::RequestDescriptor& request, const std::atomic<bool>* cancel) {
        // The snapshot keeps every component alive until this decision returns, even across Stop().
        const auto components = Snapshot();
        if (!components) {
            Gateway::Decision decision;
            decision.record.host = request.host;
            decision.record.errorKind = ErrorKind::InternalError;
            return decision;
        }
        return components->gateway->Decide(request, cancel);
    }

    [[nodiscard]] Gateway::BlockResponse MakeBlockResponse(const Gateway::Decision& decision) const {
        const auto components = Snapshot();
        if (!components) {
            return Gateway::BlockPage().MakeResponse(decision.record.domain, decision.record.category);
        }
        return components->blockPage.MakeResponse(decision.record.domain, decision.record.category);
    }

    Storage::CategoryStore& GetStore() {
        return *Require()->store;
    }

    Categorization::DomainClassifier& GetClassifier() {
        return *Require()->classifier;
    }

    Gateway::EnforcementGateway& GetGateway() {
        return *Require()->gateway;
    }

    [[nodiscard]] std::string GetStatusReport() const {
        const auto components = Snapshot();
        nlohmann::json j;
        j["initialized"] = components != nullptr;
        if (components) {
            j["gateway"] = nlohmann::json::parse(components->gateway->GetStatistics().ToJson());
            j["classifier"] = nlohmann::json::parse(components->classifier->GetStatistics().ToJson());
            j["policy"] = nlohmann::json::parse(components->resolver->GetStatistics().ToJson());
            j["store"] = nlohmann::json::parse(components->store->GetStatistics().ToJson());
            j["cacheSize"] = components->store->GetCacheSize();
            j["inFlight"] = components->classifier->GetInFlightCount();
        }
        return j.dump();
    }

    void Stop() {
        std::shared_ptr<Components> released;
        {
            std::lock_guard lock(m_mutex);
            if (!m_components) {
                return;
            }
            DS_LOG_INFO(LOG_CATEGORY, "DomainSentry stopping");
            m_initialized = false;
            released = std::move(m_components);
        }
        {
            DS_LOG_SCOPE(LOG_CATEGORY);
            // New misses are refused from here on; decisions still holding a snapshot finish on the cache.
            released->classifier->Shutdown();
        }
        released.reset();
        Utils::Logger::Instance().Flush();
    }

private:
    /// Members are destroyed in reverse order: gateway first, store last.
    struct Components {
        std::unique_ptr<Storage::CategoryStore> store;
        std::shared_ptr<Categorization::ICategorizationClient> client;
        std::unique_ptr<Categorization::DomainClassifier> classifier;
        std::unique_ptr<Policy::PolicyResolver> resolver;
        std::unique_ptr<Gateway::EnforcementGateway> gateway;
        Gateway::BlockPage blockPage;
    };

    [[nodiscard]] std::shared_ptr<Components> Snapshot() const {
        std::lock_guard lock(m_mutex);
        return m_components;
    }

    [[nodiscard]] std::shared_ptr<Components> Require() const {
        auto components = Snapshot();
        if (!components) {
            throw std::logic_error("SentryService is not initialized");
        }
        return components;
    }

    mutable std::mutex m_mutex;
    std::atomic<bool> m_initialized{false};
    std::shared_ptr<Components> m_components;
};

// ============================================================================
// FACADE
// ============================================================================

SentryService::SentryService()
    : m_impl(std::make_unique<SentryServiceImpl>()) {
}

SentryService::~SentryService() = default;

bool SentryService::Initialize(const Config::EngineConfig& config, ServiceOptions options) {
    return m_impl->Initialize(config, std::move(options));
}

bool SentryService::IsInitialized() const noexcept {
    return m_impl->IsInitialized();
}

Gateway::Decision SentryService::Decide(const Gateway::RequestDescriptor& request, const std::atomic<bool>* cancel) {
    return m_impl->Decide(request, cancel);
}

Gateway::BlockResponse SentryService::MakeBlockResponse(const Gateway::Decision& decision) const {
    return m_impl->MakeBlockResponse(decision);
}

Storage::CategoryStore& SentryService::GetStore() {
    return m_impl->GetStore();
}

Categorization::DomainClassifier& SentryService::GetClassifier() {
    return m_impl->GetClassifier();
}

Gateway::EnforcementGateway& SentryService::GetGateway() {
    return m_impl->GetGateway();
}

std::string SentryService::GetStatusReport() const {
    return m_impl->GetStatusReport();
}

void SentryService::Stop() {
    m_impl->Stop();
}

}  // namespace Service
}  // namespace DomainSentry
