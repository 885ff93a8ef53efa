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
 * @file LatencyBench.cpp
 * @brief Decision latency over a domain list: per-domain means and overall
 *        mean/min/max/standard deviation.
 *
 * The first round usually pays the oracle; later rounds measure the cache.
 */

#include "pch.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <optional>
#include <thread>
#include <vector>
#include <string>
#include <algorithm>

#include "Config/ConfigManager.hpp"
#include "Service/SentryService.hpp"
#include "Utils/Logger.hpp"

using namespace DomainSentry;

namespace {

    const std::vector<std::string> DEFAULT_DOMAINS = {
        "google.com", "youtube.com", "facebook.com", "amazon.com",
        "wikipedia.org", "twitter.com", "instagram.com", "linkedin.com",
        "microsoft.com", "apple.com", "netflix.com", "reddit.com",
        "office.com", "yahoo.com", "bing.com", "salesforce.com",
        "ebay.com", "cnn.com", "nytimes.com", "github.com"
    };

    struct BenchOptions {
        uint32_t rounds = 5;
        uint32_t delayMs = 0;
        std::vector<std::string> domains;
    };

    bool ParseUnsignedArg(const char* text, uint32_t& out) {
        try {
            const unsigned long v = std::stoul(text);
            if (v > 1000000UL) return false;
            out = static_cast<uint32_t>(v);
            return true;
        }
        catch (const std::exception&) {
            return false;
        }
    }

    bool ParseArgs(int argc, char** argv, BenchOptions& opts) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "--rounds" || arg == "--delay-ms") && i + 1 < argc) {
                uint32_t& target = arg == "--rounds" ? opts.rounds : opts.delayMs;
                if (!ParseUnsignedArg(argv[++i], target)) {
                    std::cerr << "Invalid value for " << arg << "\n";
                    return false;
                }
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Usage: " << argv[0] << " [--rounds N] [--delay-ms MS] [domain ...]\n";
                return false;
            } else {
                opts.domains.push_back(arg);
            }
        }
        if (opts.rounds == 0) {
            std::cerr << "--rounds must be at least 1\n";
            return false;
        }
        if (opts.domains.empty()) {
            opts.domains = DEFAULT_DOMAINS;
        }
        return true;
    }

    double Mean(const std::vector<double>& v) {
        return v.empty() ? 0.0 : std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
    }

    /// @brief Sample standard deviation (n - 1)
    double StdDev(const std::vector<double>& v) {
        if (v.size() < 2) return 0.0;
        const double m = Mean(v);
        double acc = 0.0;
        for (double x : v) {
            acc += (x - m) * (x - m);
        }
        return std::sqrt(acc / static_cast<double>(v.size() - 1));
    }

}  // namespace

int main(int argc, char** argv) {
    BenchOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        return 2;
    }

    Config::ConfigManager config;
    if (!config.LoadDefault()) {
        std::cerr << "Invalid configuration:\n" << config.FormatErrors();
        return 2;
    }

    Config::EngineConfig engine = config.Get();
    engine.gateway.logDecisions = false;

    Service::SentryService service;
    if (!service.Initialize(engine)) {
        std::cerr << "DomainSentry failed to start\n";
        Utils::Logger::Instance().ShutDown();
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "--- Starting Latency Test ---\n";

    std::vector<std::optional<double>> results;
    for (const auto& domain : opts.domains) {
        std::vector<double> samples;
        bool classified = false;

        for (uint32_t round = 1; round <= opts.rounds; ++round) {
            Gateway::RequestDescriptor request;
            request.host = domain;
            request.scheme = "https";
            request.method = "GET";
            request.path = "/";
            request.clientAddress = "bench";

            const Gateway::Decision decision = service.Decide(request);
            const double ms = static_cast<double>(decision.record.latency.count()) / 1000.0;
            samples.push_back(ms);

            const bool fallback = IsOracleError(decision.record.errorKind) ||
                                  decision.record.errorKind == ErrorKind::InvalidDomain ||
                                  decision.record.errorKind == ErrorKind::InternalError;
            classified = classified || !fallback;

            std::cout << "  " << round << "/" << opts.rounds << " -> " << domain << ": " << ms << " ms ("
                      << GetVerdictPolicyValue(decision.verdict) << ", " << decision.record.category
                      << (decision.record.cacheHit ? ", cached" : "") << ")\n";

            if (opts.delayMs > 0 && round < opts.rounds) {
                std::this_thread::sleep_for(std::chrono::milliseconds(opts.delayMs));
            }
        }

        if (classified) {
            const double avg = Mean(samples);
            results.emplace_back(avg);
            std::cout << "-> Average for " << domain << ": " << avg << " ms\n\n";
        } else {
            results.emplace_back(std::nullopt);
            std::cout << "Could not classify " << domain << "\n\n";
        }
    }

    std::vector<double> successful;
    for (const auto& r : results) {
        if (r.has_value()) {
            successful.push_back(*r);
        }
    }

    if (successful.empty()) {
        std::cout << "\nNo domains were classified.\n";
    } else {
        std::cout << "\n--- Overall Latency Statistics ---\n"
                  << "Total domains tested: " << opts.domains.size() << "\n"
                  << "Successfully classified: " << successful.size() << "\n"
                  << "Overall Average Latency: " << Mean(successful) << " ms\n"
                  << "Minimum Latency: " << *std::min_element(successful.begin(), successful.end()) << " ms\n"
                  << "Maximum Latency: " << *std::max_element(successful.begin(), successful.end()) << " ms\n"
                  << "Standard Deviation: " << StdDev(successful) << " ms\n";
    }

    service.Stop();
    Utils::Logger::Instance().ShutDown();
    return successful.empty() ? 1 : 0;
}
