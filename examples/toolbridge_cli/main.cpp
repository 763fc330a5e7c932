//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line front end: connects the configured tool servers, shows status and tools, and
//          invokes a single tool
//==========================================================================================================

#include "logging/Logger.h"
#include "toolbridge/Config.h"
#include "toolbridge/ProcessTransport.hpp"
#include "toolbridge/ServerSupervisor.h"
#include "toolbridge/ToolDispatcher.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace toolbridge;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "usage: toolbridge_cli [--config=FILE] [--list] [--status] [--details=SERVER]\n"
                 "                      [--call=SERVER.TOOL|TOOL] [--args=JSON]\n";
}

static void printStatus(const ServerSupervisor& supervisor) {
    const auto summary = supervisor.GetStatusSummary();
    std::cout << "Servers: " << summary.ready << "/" << summary.total << " ready, " << summary.failed
              << " failed\n";
    for (const auto& snap : supervisor.GetSnapshots()) {
        std::cout << "  " << snap.name << " [" << toString(snap.state) << "]";
        if (!snap.enabled) {
            std::cout << " (disabled)";
        }
        if (snap.degraded) {
            std::cout << " (degraded)";
        }
        if (snap.state == ServerState::Ready) {
            std::cout << " tools=" << snap.toolCount;
        }
        if (snap.lastError) {
            std::cout << " error: " << *snap.lastError;
        }
        std::cout << "\n";
    }
}

static void printTools(const ToolDispatcher& dispatcher) {
    for (const auto& def : dispatcher.GetFunctionDefinitions()) {
        std::cout << def.name << "\n    " << def.description << "\n    parameters: "
                  << SerializeJSON(def.parameters) << "\n";
    }
}

static void printDetails(const ServerSupervisor& supervisor, const std::string& name) {
    auto details = supervisor.GetServerErrorDetails(name);
    if (!details) {
        std::cout << name << ": no error recorded\n";
        return;
    }
    std::cout << "Server:   " << details->serverName << "\n"
              << "Command:  " << details->fullCommand << "\n"
              << "Category: " << errors::toString(details->category) << "\n"
              << "Error:    " << details->lastError << "\n";
    if (details->exitCode) {
        std::cout << "Exit:     " << *details->exitCode << "\n";
    }
    if (!details->stderrTail.empty()) {
        std::cout << "Stderr:\n" << details->stderrTail << "\n";
    }
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }

    OrchestratorSettings settings = OrchestratorSettings::FromEnvironment();
    if (auto cfg = getArgValue(argc, argv, "--config")) {
        settings.serversConfigPath = *cfg;
    }
    ApplyLoggingSettings(settings);

    std::vector<ServerConfig> configs;
    try {
        configs = LoadServerConfigs(settings.serversConfigPath);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load server configuration: {}", e.what());
        return 2;
    }

    auto factory = std::make_shared<ProcessTransportFactory>(settings.shutdownGrace);
    ServerSupervisor supervisor(configs, factory, settings);
    ToolDispatcher dispatcher(supervisor);

    const auto results = supervisor.RefreshAll().get();
    for (const auto& [name, ok] : results) {
        if (!ok) {
            LOG_WARN("Server '{}' did not come up", name);
        }
    }

    int rc = 0;
    if (hasFlag(argc, argv, "--status") || argc == 1) {
        printStatus(supervisor);
    }
    if (auto details = getArgValue(argc, argv, "--details")) {
        printDetails(supervisor, *details);
    }
    if (hasFlag(argc, argv, "--list")) {
        printTools(dispatcher);
    }
    if (auto call = getArgValue(argc, argv, "--call")) {
        const std::string args = getArgValue(argc, argv, "--args").value_or("");
        ToolOutcome outcome = dispatcher.InvokeFunctionCall(*call, args);
        std::cout << SerializeJSON(outcome.ToJSON()) << "\n";
        if (!outcome.success) {
            rc = 1;
        }
    }

    supervisor.Shutdown();
    return rc;
}
