//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server list loading/saving and environment-driven orchestrator settings
//==========================================================================================================

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "toolbridge/Config.h"
#include "logging/Logger.h"
#include "env/EnvVars.h"

namespace toolbridge {

namespace {
std::optional<ServerConfig> parseOne(const JSONValue& entry, const std::optional<std::string>& keyName) {
    if (!entry.isObject()) {
        LOG_ERROR("Server config entry is not an object; skipping");
        return std::nullopt;
    }
    ServerConfig cfg;
    auto name = GetStringMember(entry, "name");
    if (!name.has_value() && keyName.has_value()) {
        name = keyName;
    }
    if (!name.has_value() || name->empty()) {
        LOG_ERROR("Server config entry without a name; skipping");
        return std::nullopt;
    }
    cfg.name = *name;
    if (cfg.name.find('.') != std::string::npos) {
        // Qualified tool names are "server.tool"; a dot in the server name would still resolve by prefix,
        // but shadowing between "a" and "a.b" is confusing enough to warn about.
        LOG_WARN("Server name '{}' contains '.'", cfg.name);
    }
    auto command = GetStringMember(entry, "command");
    if (!command.has_value() || command->empty()) {
        LOG_ERROR("Server config '{}' has no command; skipping", cfg.name);
        return std::nullopt;
    }
    cfg.command = *command;

    if (const JSONValue* args = FindMember(entry, "args")) {
        if (!args->isArray()) {
            LOG_ERROR("Server config '{}': args must be an array; skipping", cfg.name);
            return std::nullopt;
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                LOG_ERROR("Server config '{}': args must be strings; skipping", cfg.name);
                return std::nullopt;
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }
    cfg.description = GetStringMember(entry, "description").value_or("");
    cfg.enabled = GetBoolMember(entry, "enabled").value_or(true);
    if (const JSONValue* env = FindMember(entry, "env")) {
        if (!env->isObject()) {
            LOG_ERROR("Server config '{}': env must be an object; skipping", cfg.name);
            return std::nullopt;
        }
        for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
            if (!v || !v->isString()) {
                LOG_WARN("Server config '{}': env '{}' is not a string; ignored", cfg.name, k);
                continue;
            }
            cfg.env.emplace_back(k, std::get<std::string>(v->value));
        }
    }
    cfg.cwd = GetStringMember(entry, "cwd");
    if (auto framing = GetStringMember(entry, "framing")) {
        auto mode = parseFramingMode(*framing);
        if (!mode.has_value()) {
            LOG_ERROR("Server config '{}': unknown framing '{}'; skipping", cfg.name, *framing);
            return std::nullopt;
        }
        cfg.framing = *mode;
    }
    if (auto t = GetIntMember(entry, "timeoutMs")) {
        if (*t <= 0) {
            LOG_WARN("Server config '{}': ignoring non-positive timeoutMs {}", cfg.name, *t);
        } else {
            cfg.timeoutMs = static_cast<uint64_t>(*t);
        }
    }
    cfg.captureStderr = GetBoolMember(entry, "captureStderr").value_or(false);
    return cfg;
}
} // namespace

std::string ServerConfig::FullCommand() const {
    std::string out = command;
    for (const auto& a : args) {
        out.push_back(' ');
        out.append(a);
    }
    return out;
}

bool ServerConfig::operator==(const ServerConfig& o) const {
    return name == o.name && command == o.command && args == o.args && description == o.description &&
           enabled == o.enabled && env == o.env && cwd == o.cwd && framing == o.framing &&
           timeoutMs == o.timeoutMs && captureStderr == o.captureStderr;
}

std::vector<ServerConfig> ParseServerConfigs(const JSONValue& doc) {
    FUNC_SCOPE();
    std::vector<std::pair<std::optional<std::string>, const JSONValue*>> entries;

    const JSONValue* list = nullptr;
    if (doc.isArray()) {
        list = &doc;
    } else if (doc.isObject()) {
        list = FindMember(doc, "servers");
        if (list == nullptr) list = FindMember(doc, "mcpServers");
    }
    if (list == nullptr) {
        throw std::runtime_error("Server config: expected an array or an object with \"servers\"/\"mcpServers\"");
    }
    if (list->isArray()) {
        for (const auto& e : std::get<JSONValue::Array>(list->value)) {
            if (e) entries.emplace_back(std::nullopt, e.get());
        }
    } else if (list->isObject()) {
        for (const auto& [k, e] : std::get<JSONValue::Object>(list->value)) {
            if (e) entries.emplace_back(k, e.get());
        }
    } else {
        throw std::runtime_error("Server config: server list must be an array or an object");
    }

    std::vector<ServerConfig> out;
    std::unordered_set<std::string> seen;
    for (const auto& [key, entry] : entries) {
        auto cfg = parseOne(*entry, key);
        if (!cfg.has_value()) continue;
        if (!seen.insert(cfg->name).second) {
            LOG_ERROR("Duplicate server name '{}'; keeping the first entry", cfg->name);
            continue;
        }
        out.push_back(std::move(*cfg));
    }
    return out;
}

std::vector<ServerConfig> LoadServerConfigs(const std::string& path) {
    FUNC_SCOPE();
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open server config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    JSONValue doc;
    try {
        doc = ParseJSON(ss.str());
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    auto configs = ParseServerConfigs(doc);
    LOG_INFO("Loaded {} server config(s) from {}", configs.size(), path);
    return configs;
}

JSONValue ServerConfigsToJSON(const std::vector<ServerConfig>& configs) {
    JSONValue::Array arr;
    for (const auto& cfg : configs) {
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(cfg.name);
        o["command"] = std::make_shared<JSONValue>(cfg.command);
        JSONValue::Array args;
        for (const auto& a : cfg.args) args.push_back(std::make_shared<JSONValue>(a));
        o["args"] = std::make_shared<JSONValue>(args);
        o["description"] = std::make_shared<JSONValue>(cfg.description);
        o["enabled"] = std::make_shared<JSONValue>(cfg.enabled);
        if (!cfg.env.empty()) {
            JSONValue::Object env;
            for (const auto& [k, v] : cfg.env) env[k] = std::make_shared<JSONValue>(v);
            o["env"] = std::make_shared<JSONValue>(env);
        }
        if (cfg.cwd) o["cwd"] = std::make_shared<JSONValue>(*cfg.cwd);
        o["framing"] = std::make_shared<JSONValue>(toString(cfg.framing));
        if (cfg.timeoutMs) o["timeoutMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(*cfg.timeoutMs));
        if (cfg.captureStderr) o["captureStderr"] = std::make_shared<JSONValue>(true);
        arr.push_back(std::make_shared<JSONValue>(o));
    }
    return JSONValue{arr};
}

void SaveServerConfigs(const std::string& path, const std::vector<ServerConfig>& configs) {
    FUNC_SCOPE();
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write server config file: " + path);
    }
    out << SerializeJSON(ServerConfigsToJSON(configs)) << "\n";
    if (!out.good()) {
        throw std::runtime_error("Failed writing server config file: " + path);
    }
}

OrchestratorSettings OrchestratorSettings::FromEnvironment() {
    OrchestratorSettings s;
    s.serversConfigPath = GetEnvOrDefault("TOOLBRIDGE_SERVERS_CONFIG", s.serversConfigPath);
    s.callTimeout = std::chrono::milliseconds(GetEnvUInt64OrDefault("TOOLBRIDGE_TIMEOUT_MS", s.callTimeout.count()));
    s.handshakeTimeout = std::chrono::milliseconds(GetEnvUInt64OrDefault("TOOLBRIDGE_HANDSHAKE_TIMEOUT_MS", s.handshakeTimeout.count()));
    s.discoveryTimeout = std::chrono::milliseconds(GetEnvUInt64OrDefault("TOOLBRIDGE_DISCOVERY_TIMEOUT_MS", s.discoveryTimeout.count()));
    s.retryAttempts = static_cast<unsigned int>(GetEnvUInt64OrDefault("TOOLBRIDGE_RETRY_ATTEMPTS", s.retryAttempts));
    if (s.retryAttempts == 0) {
        s.retryAttempts = 1;
    }
    s.retryBackoff = std::chrono::milliseconds(GetEnvUInt64OrDefault("TOOLBRIDGE_RETRY_BACKOFF_MS", s.retryBackoff.count()));
    s.retryUnknownIdempotency = GetEnvBoolOrDefault("TOOLBRIDGE_RETRY_UNKNOWN_IDEMPOTENCY", s.retryUnknownIdempotency);
    s.degradedThreshold = static_cast<unsigned int>(GetEnvUInt64OrDefault("TOOLBRIDGE_DEGRADED_THRESHOLD", s.degradedThreshold));
    s.shutdownGrace = std::chrono::milliseconds(GetEnvUInt64OrDefault("TOOLBRIDGE_SHUTDOWN_GRACE_MS", s.shutdownGrace.count()));
    s.maxTurns = static_cast<unsigned int>(GetEnvUInt64OrDefault("TOOLBRIDGE_MAX_TURNS", s.maxTurns));
    s.logLevel = GetEnvOrDefault("TOOLBRIDGE_LOG_LEVEL", s.logLevel);
    std::string logFile = GetEnvOrDefault("TOOLBRIDGE_LOG_FILE", "");
    if (!logFile.empty()) {
        s.logFile = logFile;
    }
    s.validation = validation::parseMode(GetEnvOrDefault("TOOLBRIDGE_VALIDATION", "off"));
    return s;
}

void ApplyLoggingSettings(const OrchestratorSettings& settings) {
    Logger::setLogLevel(Logger::toLogLevel(Logger::levelFromString(settings.logLevel)));
    if (settings.logFile.has_value()) {
        Logger::setLogFile(settings.logFile.value());
    }
}

} // namespace toolbridge
