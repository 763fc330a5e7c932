//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Server list parsing/persistence and environment-driven settings
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolbridge/Config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace toolbridge;

namespace {
std::string tempPath(const std::string& stem) {
    return "/tmp/toolbridge_" + stem + "_" + std::to_string(::getpid()) + ".json";
}

const ServerConfig* byName(const std::vector<ServerConfig>& v, const std::string& name) {
    for (const auto& c : v) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name(name) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(name); }
private:
    const char* name;
};
} // namespace

TEST(Config, ParsesArrayShapeWithAllFields) {
    auto configs = ParseServerConfigs(ParseJSON(R"([
        {"name":"files","command":"python3","args":["-m","fs_server"],"description":"File tools",
         "env":{"ROOT":"/srv"},"cwd":"/tmp","framing":"content-length","timeoutMs":1500,"captureStderr":true},
        {"name":"web","command":"node","args":["web.js"],"enabled":false}
    ])"));
    ASSERT_EQ(configs.size(), 2u);
    const auto& files = configs[0];
    EXPECT_EQ(files.name, "files");
    EXPECT_EQ(files.FullCommand(), "python3 -m fs_server");
    EXPECT_EQ(files.description, "File tools");
    ASSERT_EQ(files.env.size(), 1u);
    EXPECT_EQ(files.env[0].first, "ROOT");
    EXPECT_EQ(files.cwd, std::string("/tmp"));
    EXPECT_EQ(files.framing, FramingMode::ContentLength);
    EXPECT_EQ(files.timeoutMs, 1500u);
    EXPECT_TRUE(files.captureStderr);
    EXPECT_TRUE(files.enabled);

    EXPECT_FALSE(configs[1].enabled);
    EXPECT_EQ(configs[1].framing, FramingMode::Newline);
    EXPECT_FALSE(configs[1].timeoutMs.has_value());
}

TEST(Config, ParsesKeyedMcpServersShape) {
    auto configs = ParseServerConfigs(ParseJSON(R"({"mcpServers":{
        "calc":{"command":"calc-server"},
        "notes":{"command":"notes-server","args":["--db","notes.db"]}
    }})"));
    ASSERT_EQ(configs.size(), 2u);
    ASSERT_NE(byName(configs, "calc"), nullptr);
    ASSERT_NE(byName(configs, "notes"), nullptr);
    EXPECT_EQ(byName(configs, "notes")->args.size(), 2u);
}

TEST(Config, InvalidEntriesAreSkipped) {
    auto configs = ParseServerConfigs(ParseJSON(R"({"servers":[
        {"name":"ok","command":"a"},
        {"command":"no-name"},
        {"name":"no-command"},
        {"name":"bad-args","command":"b","args":"not-an-array"},
        {"name":"bad-framing","command":"c","framing":"xml"},
        {"name":"ok","command":"duplicate"},
        42
    ]})"));
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].name, "ok");
    EXPECT_EQ(configs[0].command, "a");
}

TEST(Config, NonPositiveTimeoutIsIgnored) {
    auto configs = ParseServerConfigs(ParseJSON(R"([{"name":"x","command":"y","timeoutMs":0}])"));
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_FALSE(configs[0].timeoutMs.has_value());
}

TEST(Config, UnsupportedShapeThrows) {
    EXPECT_THROW(ParseServerConfigs(ParseJSON(R"({"other":[]})")), std::runtime_error);
    EXPECT_THROW(ParseServerConfigs(ParseJSON(R"({"servers":"x"})")), std::runtime_error);
    EXPECT_THROW(ParseServerConfigs(ParseJSON("3")), std::runtime_error);
}

TEST(Config, SaveThenLoadPreservesConfigs) {
    ServerConfig a;
    a.name = "alpha";
    a.command = "/usr/bin/alpha";
    a.args = {"--fast"};
    a.description = "Alpha tools";
    a.env = {{"TOKEN", "abc"}};
    a.framing = FramingMode::ContentLength;
    a.timeoutMs = 2500;
    ServerConfig b;
    b.name = "beta";
    b.command = "beta";
    b.enabled = false;

    const std::string path = tempPath("roundtrip");
    SaveServerConfigs(path, {a, b});
    auto loaded = LoadServerConfigs(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0], a);
    EXPECT_EQ(loaded[1], b);
}

TEST(Config, LoadReportsMissingAndInvalidFiles) {
    EXPECT_THROW(LoadServerConfigs("/nonexistent/dir/servers.json"), std::runtime_error);

    const std::string path = tempPath("invalid");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(LoadServerConfigs(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(Config, EqualityCoversLaunchFields) {
    ServerConfig a;
    a.name = "s";
    a.command = "cmd";
    ServerConfig b = a;
    EXPECT_EQ(a, b);
    b.args.push_back("--x");
    EXPECT_NE(a, b);
    b = a;
    b.enabled = false;
    EXPECT_NE(a, b);
}

TEST(Settings, DefaultsWithoutEnvironment) {
    OrchestratorSettings s = OrchestratorSettings::FromEnvironment();
    EXPECT_EQ(s.callTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(s.retryAttempts, 3u);
    EXPECT_EQ(s.degradedThreshold, 3u);
    EXPECT_EQ(s.maxTurns, 5u);
    EXPECT_EQ(s.validation, validation::ValidationMode::Off);
    EXPECT_FALSE(s.logFile.has_value());
}

TEST(Settings, EnvironmentOverrides) {
    EnvGuard timeout("TOOLBRIDGE_TIMEOUT_MS", "1234");
    EnvGuard retries("TOOLBRIDGE_RETRY_ATTEMPTS", "0");
    EnvGuard turns("TOOLBRIDGE_MAX_TURNS", "9");
    EnvGuard unknown("TOOLBRIDGE_RETRY_UNKNOWN_IDEMPOTENCY", "false");
    EnvGuard strict("TOOLBRIDGE_VALIDATION", "strict");
    EnvGuard config("TOOLBRIDGE_SERVERS_CONFIG", "/etc/toolbridge/servers.json");
    OrchestratorSettings s = OrchestratorSettings::FromEnvironment();
    EXPECT_EQ(s.callTimeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(s.retryAttempts, 1u);
    EXPECT_EQ(s.maxTurns, 9u);
    EXPECT_FALSE(s.retryUnknownIdempotency);
    EXPECT_EQ(s.validation, validation::ValidationMode::Strict);
    EXPECT_EQ(s.serversConfigPath, "/etc/toolbridge/servers.json");
}

TEST(Settings, MalformedNumbersKeepDefaults) {
    EnvGuard timeout("TOOLBRIDGE_TIMEOUT_MS", "12ms");
    EnvGuard threshold("TOOLBRIDGE_DEGRADED_THRESHOLD", "-4");
    OrchestratorSettings s = OrchestratorSettings::FromEnvironment();
    EXPECT_EQ(s.callTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(s.degradedThreshold, 3u);
}
