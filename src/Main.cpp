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
 * DomainSentry - COMMAND-LINE DRIVER
 * ============================================================================
 *
 * @file Main.cpp
 * @brief Plays the transport role: one request per input line, one JSON
 *        decision per output line.
 *
 * Input line: host [sni] [scheme] [method] [path]   ('-' = empty field)
 *
 * ============================================================================
 */

#include "pch.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Config/ConfigManager.hpp"
#include "Service/SentryService.hpp"
#include "Storage/CategoryStore.hpp"
#include "Utils/Logger.hpp"
#include "Utils/StringUtils.hpp"

using namespace DomainSentry;

namespace {

    struct CommandLine {
        std::string configFile;
        std::vector<std::string> hosts;
        std::vector<std::string> invalidate;
        bool clearCache = false;
        bool listPolicy = false;
        bool printStats = false;
        bool printConfig = false;
        bool showHelp = false;
    };

    void PrintUsage(const char* argv0) {
        std::cout
            << "Usage: " << argv0 << " [options] [host ...]\n"
            << "\n"
            << "Decides each host given on the command line, or each line read from stdin:\n"
            << "  host [sni] [scheme] [method] [path]   ('-' leaves a field empty)\n"
            << "\n"
            << "Options:\n"
            << "  --config FILE        JSON configuration file (overrides DOMAINSENTRY_CONFIG)\n"
            << "  --invalidate DOMAIN  Drop a cached classification\n"
            << "  --clear-cache        Drop every cached classification\n"
            << "  --list-policy        Print the category policy table\n"
            << "  --stats              Print engine statistics at exit\n"
            << "  --print-config       Print the effective configuration\n"
            << "  -h, --help           Show this help\n";
    }

    bool ParseCommandLine(int argc, char** argv, CommandLine& cmd) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&](std::string& out) {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for " << arg << "\n";
                    return false;
                }
                out = argv[++i];
                return true;
            };

            if (arg == "-h" || arg == "--help") {
                cmd.showHelp = true;
            } else if (arg == "--config") {
                if (!value(cmd.configFile)) return false;
            } else if (arg == "--invalidate") {
                std::string domain;
                if (!value(domain)) return false;
                cmd.invalidate.push_back(std::move(domain));
            } else if (arg == "--clear-cache") {
                cmd.clearCache = true;
            } else if (arg == "--list-policy") {
                cmd.listPolicy = true;
            } else if (arg == "--stats") {
                cmd.printStats = true;
            } else if (arg == "--print-config") {
                cmd.printConfig = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Unknown option " << arg << "\n";
                return false;
            } else {
                cmd.hosts.push_back(arg);
            }
        }
        return true;
    }

    Gateway::RequestDescriptor ParseRequestLine(const std::string& line) {
        std::istringstream in(line);
        std::vector<std::string> fields;
        std::string field;
        while (in >> field) {
            fields.push_back(field == "-" ? std::string() : field);
        }

        Gateway::RequestDescriptor request;
        if (fields.size() > 0) request.host = fields[0];
        if (fields.size() > 1) request.sni = fields[1];
        request.scheme = fields.size() > 2 ? fields[2] : "https";
        request.method = fields.size() > 3 ? fields[3] : "GET";
        request.path = fields.size() > 4 ? fields[4] : "/";
        request.clientAddress = "cli";
        return request;
    }

    void PrintDecision(Service::SentryService& service, const Gateway::Decision& decision) {
        nlohmann::json out = nlohmann::json::parse(decision.record.ToJson());
        if (decision.IsBlocked()) {
            const Gateway::BlockResponse block = service.MakeBlockResponse(decision);
            out["blockResponse"] = {
                {"status", block.statusCode},
                {"contentType", block.contentType},
                {"bytes", block.body.size()}
            };
        }
        std::cout << out.dump() << std::endl;
    }

    void PrintPolicy(Storage::CategoryStore& store) {
        nlohmann::json table = nlohmann::json::object();
        for (const auto& [category, value] : store.ListPolicy()) {
            table[category] = value.IsValid()
                ? std::string(GetVerdictPolicyValue(*value.verdict))
                : "invalid: " + value.raw;
        }
        std::cout << table.dump(4) << std::endl;
    }

}  // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!ParseCommandLine(argc, argv, cmd)) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (cmd.showHelp) {
        PrintUsage(argv[0]);
        return 0;
    }

    Config::ConfigManager config;
    bool configOk = true;
    if (!cmd.configFile.empty()) {
        configOk = config.LoadFromFile(cmd.configFile);
        configOk = config.ApplyEnvironment() && configOk;
        configOk = config.Validate() && configOk;
    } else {
        configOk = config.LoadDefault();
    }
    if (!configOk) {
        std::cerr << "Invalid configuration:\n" << config.FormatErrors();
        return 2;
    }

    if (cmd.printConfig) {
        std::cout << nlohmann::json::parse(config.Get().ToJson()).dump(4) << std::endl;
    }

    Service::SentryService service;
    if (!service.Initialize(config.Get())) {
        std::cerr << "DomainSentry failed to start; see log for details\n";
        Utils::Logger::Instance().ShutDown();
        return 1;
    }

    int exitCode = 0;
    try {
        Storage::CategoryStore& store = service.GetStore();

        for (const auto& domain : cmd.invalidate) {
            std::string normalized;
            if (!service.GetClassifier().NormalizeDomain(domain, normalized)) {
                std::cerr << "Not a valid domain: " << domain << "\n";
                exitCode = 1;
                continue;
            }
            std::cout << (store.Invalidate(normalized) ? "invalidated " : "not cached ") << normalized << std::endl;
        }

        if (cmd.clearCache && !store.ClearCache()) {
            std::cerr << "Cache cleared in memory but the cache file could not be written\n";
            exitCode = 1;
        }

        if (cmd.listPolicy) {
            PrintPolicy(store);
        }

        const bool commandOnly = !cmd.invalidate.empty() || cmd.clearCache || cmd.listPolicy || cmd.printConfig;

        if (!cmd.hosts.empty()) {
            for (const auto& host : cmd.hosts) {
                PrintDecision(service, service.Decide(ParseRequestLine(host)));
            }
        } else if (!commandOnly) {
            std::string line;
            while (std::getline(std::cin, line)) {
                const std::string_view trimmed = Utils::StringUtils::TrimView(line);
                if (trimmed.empty() || trimmed.front() == '#') {
                    continue;
                }
                PrintDecision(service, service.Decide(ParseRequestLine(line)));
            }
        }

        if (cmd.printStats) {
            std::cout << nlohmann::json::parse(service.GetStatusReport()).dump(4) << std::endl;
        }
    }
    catch (const std::exception& ex) {
        DS_LOG_FATAL("Main", "Unhandled exception: %s", ex.what());
        exitCode = 1;
    }

    service.Stop();
    Utils::Logger::Instance().ShutDown();
    return exitCode;
}
