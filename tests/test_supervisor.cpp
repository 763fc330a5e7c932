//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_supervisor.cpp
// Purpose: ServerSupervisor lifecycle against scripted in-memory servers
//==========================================================================================================

#include <gtest/gtest.h>
#include "FakeToolServer.h"
#include "toolbridge/ServerSupervisor.h"

#include <chrono>
#include <functional>
#include <thread>

using namespace toolbridge;
using namespace toolbridge::testing;
using errors::ErrorCategory;
using errors::McpException;
using namespace std::chrono_literals;

namespace {

OrchestratorSettings fastSettings() {
    OrchestratorSettings s;
    s.handshakeTimeout = 500ms;
    s.discoveryTimeout = 500ms;
    s.callTimeout = 1000ms;
    s.degradedThreshold = 2;
    return s;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

ErrorCategory failureOf(std::future<void>& fut) {
    try {
        fut.get();
    } catch (const McpException& e) {
        return e.category();
    }
    return ErrorCategory::Unknown;
}

void withTools(FakeToolServer& s, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        s.AddTool(MakeTool(n), [](const JSONValue&) { return TextResult("ok"); });
    }
}

} // namespace

TEST(Supervisor, StartsDisconnected) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("a"), MakeConfig("b")}, farm.Factory(), fastSettings());
    auto summary = sup.GetStatusSummary();
    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.disconnected, 2u);
    EXPECT_EQ(sup.GetState("a"), ServerState::Disconnected);
    EXPECT_FALSE(sup.GetState("missing").has_value());
    EXPECT_TRUE(sup.ListAvailableTools().empty());
    EXPECT_EQ(farm.Launches("a"), 0);
}

TEST(Supervisor, DuplicateConfigNamesKeepFirst) {
    FakeServerFarm farm;
    ServerConfig second = MakeConfig("a");
    second.description = "shadowed";
    ServerSupervisor sup({MakeConfig("a"), second}, farm.Factory(), fastSettings());
    auto configs = sup.GetConfigs();
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].description, "fake server a");
}

TEST(Supervisor, ConnectRunsHandshakeAndDiscovery) {
    FakeServerFarm farm;
    farm.SetScript("files", [](FakeToolServer& s) { withTools(s, {"read", "write"}); });
    ServerSupervisor sup({MakeConfig("files")}, farm.Factory(), fastSettings());

    sup.Connect("files").get();
    EXPECT_EQ(sup.GetState("files"), ServerState::Ready);
    auto snap = sup.GetServerSnapshot("files");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->toolCount, 2u);
    EXPECT_EQ(snap->toolNames, (std::vector<std::string>{"read", "write"}));
    ASSERT_TRUE(snap->serverInfo.has_value());
    EXPECT_EQ(snap->serverInfo->implementation.name, "fake-tool-server");
    EXPECT_TRUE(snap->connectedSince.has_value());
    EXPECT_TRUE(snap->connectionTime.has_value());
    EXPECT_FALSE(snap->lastError.has_value());

    auto tools = sup.ListAvailableTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].QualifiedName(), "files.read");
    EXPECT_NE(sup.GetReadySession("files"), nullptr);
    EXPECT_EQ(farm.Launches("files"), 1);
}

TEST(Supervisor, ConnectOnReadyServerIsNoop) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("a")}, farm.Factory(), fastSettings());
    sup.Connect("a").get();
    sup.Connect("a").get();
    EXPECT_EQ(farm.Launches("a"), 1);
}

TEST(Supervisor, ConcurrentConnectsShareOneAttempt) {
    FakeServerFarm farm;
    farm.SetScript("slow", [](FakeToolServer& s) { s.SetInitializeDelay(150ms); });
    ServerSupervisor sup({MakeConfig("slow")}, farm.Factory(), fastSettings());
    auto first = sup.Connect("slow");
    auto second = sup.Connect("slow");
    first.get();
    second.get();
    EXPECT_EQ(farm.Launches("slow"), 1);
    EXPECT_EQ(sup.GetState("slow"), ServerState::Ready);
}

TEST(Supervisor, UnknownAndDisabledServersAreUnavailable) {
    FakeServerFarm farm;
    ServerConfig off = MakeConfig("off");
    off.enabled = false;
    ServerSupervisor sup({off}, farm.Factory(), fastSettings());

    auto unknown = sup.Connect("nope");
    EXPECT_EQ(failureOf(unknown), ErrorCategory::ServerUnavailable);
    auto disabled = sup.Connect("off");
    EXPECT_EQ(failureOf(disabled), ErrorCategory::ServerUnavailable);
    EXPECT_EQ(farm.Launches("off"), 0);
    EXPECT_EQ(sup.GetState("off"), ServerState::Disconnected);
}

TEST(Supervisor, LaunchFailureRecordsDetails) {
    FakeServerFarm farm;
    farm.SetLaunchFailure("broken", true);
    ServerSupervisor sup({MakeConfig("broken")}, farm.Factory(), fastSettings());

    auto fut = sup.Connect("broken");
    EXPECT_EQ(failureOf(fut), ErrorCategory::TransportIOFailure);
    EXPECT_EQ(sup.GetState("broken"), ServerState::Failed);
    auto details = sup.GetServerErrorDetails("broken");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->serverName, "broken");
    EXPECT_EQ(details->category, ErrorCategory::TransportIOFailure);
    EXPECT_EQ(details->fullCommand, "fake-broken");
    EXPECT_FALSE(details->lastError.empty());
    EXPECT_EQ(sup.GetStatusSummary().failed, 1u);
    EXPECT_TRUE(sup.GetServerSnapshot("broken")->lastError.has_value());
}

TEST(Supervisor, FailedServerCanBeRetried) {
    FakeServerFarm farm;
    farm.SetLaunchFailure("flaky", true);
    ServerSupervisor sup({MakeConfig("flaky")}, farm.Factory(), fastSettings());
    auto first = sup.Connect("flaky");
    EXPECT_EQ(failureOf(first), ErrorCategory::TransportIOFailure);

    farm.SetLaunchFailure("flaky", false);
    sup.Connect("flaky").get();
    EXPECT_EQ(sup.GetState("flaky"), ServerState::Ready);
    EXPECT_FALSE(sup.GetServerErrorDetails("flaky").has_value());
    EXPECT_EQ(farm.Launches("flaky"), 2);
}

TEST(Supervisor, HandshakeRejectionFailsServer) {
    FakeServerFarm farm;
    farm.SetScript("picky", [](FakeToolServer& s) { s.SetRejectInitialize(true); });
    ServerSupervisor sup({MakeConfig("picky")}, farm.Factory(), fastSettings());
    auto fut = sup.Connect("picky");
    EXPECT_EQ(failureOf(fut), ErrorCategory::HandshakeFailed);
    EXPECT_EQ(sup.GetState("picky"), ServerState::Failed);
    EXPECT_EQ(sup.GetServerErrorDetails("picky")->category, ErrorCategory::HandshakeFailed);
}

TEST(Supervisor, HandshakeTimeoutFailsServer) {
    FakeServerFarm farm;
    farm.SetScript("mute", [](FakeToolServer& s) { s.SetSilentInitialize(true); });
    ServerSupervisor sup({MakeConfig("mute")}, farm.Factory(), fastSettings());
    auto fut = sup.Connect("mute");
    EXPECT_EQ(failureOf(fut), ErrorCategory::HandshakeFailed);
    EXPECT_EQ(sup.GetState("mute"), ServerState::Failed);
}

TEST(Supervisor, FailedDiscoveryLeavesServerReadyWithoutTools) {
    FakeServerFarm farm;
    farm.SetScript("quiet", [](FakeToolServer& s) {
        withTools(s, {"x"});
        s.SetSilentListTools(true);
    });
    ServerSupervisor sup({MakeConfig("quiet")}, farm.Factory(), fastSettings());
    sup.Connect("quiet").get();
    EXPECT_EQ(sup.GetState("quiet"), ServerState::Ready);
    EXPECT_EQ(sup.GetServerSnapshot("quiet")->toolCount, 0u);

    farm.Latest("quiet")->SetSilentListTools(false);
    EXPECT_EQ(sup.RefreshTools("quiet").get(), 1u);
}

TEST(Supervisor, RefreshOfUnchangedCatalogIsStable) {
    FakeServerFarm farm;
    farm.SetScript("files", [](FakeToolServer& s) { withTools(s, {"a", "b", "c"}); });
    ServerSupervisor sup({MakeConfig("files")}, farm.Factory(), fastSettings());
    sup.Connect("files").get();
    const auto before = sup.ListAvailableTools();

    EXPECT_EQ(sup.RefreshTools("files").get(), 3u);
    EXPECT_EQ(sup.RefreshTools("files").get(), 3u);
    const auto after = sup.ListAvailableTools();
    ASSERT_EQ(after.size(), before.size());
    for (std::size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].QualifiedName(), before[i].QualifiedName());
    }
    EXPECT_EQ(farm.Launches("files"), 1);
}

TEST(Supervisor, RefreshToolsRequiresReadyServer) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("a")}, farm.Factory(), fastSettings());
    auto fut = sup.RefreshTools("a");
    try {
        fut.get();
        FAIL() << "expected ServerUnavailable";
    } catch (const McpException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ServerUnavailable);
    }
}

TEST(Supervisor, PeerCrashMovesServerToFailed) {
    FakeServerFarm farm;
    farm.SetScript("crashy", [](FakeToolServer& s) { withTools(s, {"t"}); });
    ServerSupervisor sup({MakeConfig("crashy")}, farm.Factory(), fastSettings());
    sup.Connect("crashy").get();

    farm.Latest("crashy")->CloseAbruptly("segmentation fault");
    ASSERT_TRUE(waitUntil([&]() { return sup.GetState("crashy") == ServerState::Failed; }));
    auto details = sup.GetServerErrorDetails("crashy");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->category, ErrorCategory::TransportIOFailure);
    EXPECT_EQ(details->lastError, "segmentation fault");
    EXPECT_TRUE(sup.ListAvailableTools().empty());
    EXPECT_EQ(sup.GetReadySession("crashy"), nullptr);
}

TEST(Supervisor, PeerExitMidCallFailsCallAndServer) {
    FakeServerFarm farm;
    farm.SetScript("files", [](FakeToolServer& s) {
        s.AddTool(MakeTool("hang"), nullptr);
        s.SetSilentCalls(true);
    });
    ServerSupervisor sup({MakeConfig("files")}, farm.Factory(), fastSettings());
    sup.Connect("files").get();
    auto session = sup.GetReadySession("files");
    ASSERT_NE(session, nullptr);

    auto call = session->CallTool("hang", JSONValue{JSONValue::Object{}}, 5000ms);
    auto server = farm.Latest("files");
    ASSERT_TRUE(server->WaitFor(Methods::CallTool, 1));
    server->CloseCleanly();
    try {
        call.get();
        FAIL() << "expected TransportClosed";
    } catch (const McpException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::TransportClosed);
    }
    ASSERT_TRUE(waitUntil([&]() { return sup.GetState("files") == ServerState::Failed; }));
    auto details = sup.GetServerErrorDetails("files");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->category, ErrorCategory::TransportClosed);
    EXPECT_EQ(sup.GetReadySession("files"), nullptr);
    EXPECT_TRUE(sup.ListAvailableTools().empty());
}

TEST(Supervisor, NoAutomaticReconnectAfterFailure) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("once")}, farm.Factory(), fastSettings());
    sup.Connect("once").get();
    farm.Latest("once")->CloseCleanly();
    ASSERT_TRUE(waitUntil([&]() { return sup.GetState("once") == ServerState::Failed; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(farm.Launches("once"), 1);
    EXPECT_EQ(sup.GetState("once"), ServerState::Failed);
}

TEST(Supervisor, DisconnectDiscardsCatalog) {
    FakeServerFarm farm;
    farm.SetScript("a", [](FakeToolServer& s) { withTools(s, {"t"}); });
    ServerSupervisor sup({MakeConfig("a")}, farm.Factory(), fastSettings());
    sup.Connect("a").get();
    const uint64_t genBefore = sup.GetServerSnapshot("a")->generation;

    sup.Disconnect("a").get();
    EXPECT_EQ(sup.GetState("a"), ServerState::Disconnected);
    auto snap = sup.GetServerSnapshot("a");
    EXPECT_EQ(snap->toolCount, 0u);
    EXPECT_FALSE(snap->connectedSince.has_value());
    EXPECT_GT(snap->generation, genBefore);
    EXPECT_TRUE(sup.ListAvailableTools().empty());

    // Disconnecting twice is harmless
    sup.Disconnect("a").get();

    // The restarted peer reports a different catalog; nothing of the old one survives
    farm.SetScript("a", [](FakeToolServer& s) { withTools(s, {"u", "v"}); });
    sup.Connect("a").get();
    EXPECT_EQ(sup.GetServerSnapshot("a")->toolNames, (std::vector<std::string>{"u", "v"}));
    EXPECT_EQ(farm.Launches("a"), 2);
}

TEST(Supervisor, DisconnectCancelsHandshakeInFlight) {
    FakeServerFarm farm;
    farm.SetScript("slow", [](FakeToolServer& s) { s.SetSilentInitialize(true); });
    OrchestratorSettings settings = fastSettings();
    settings.handshakeTimeout = 5000ms;
    ServerSupervisor sup({MakeConfig("slow")}, farm.Factory(), settings);

    auto connecting = sup.Connect("slow");
    ASSERT_TRUE(waitUntil([&]() { return sup.GetState("slow") == ServerState::Handshaking; }));
    sup.Disconnect("slow").get();
    EXPECT_EQ(failureOf(connecting), ErrorCategory::ServerUnavailable);
    EXPECT_EQ(sup.GetState("slow"), ServerState::Disconnected);
}

TEST(Supervisor, ToolListChangedTriggersRediscovery) {
    FakeServerFarm farm;
    farm.SetScript("dyn", [](FakeToolServer& s) { withTools(s, {"first"}); });
    ServerSupervisor sup({MakeConfig("dyn")}, farm.Factory(), fastSettings());
    sup.Connect("dyn").get();
    ASSERT_EQ(sup.ListAvailableTools().size(), 1u);

    auto server = farm.Latest("dyn");
    withTools(*server, {"second"});
    server->SendNotification(Methods::ToolListChanged);
    ASSERT_TRUE(waitUntil([&]() { return sup.ListAvailableTools().size() == 2u; }));

    server->RemoveTool("first");
    server->SendNotification(Methods::ToolListChanged);
    ASSERT_TRUE(waitUntil([&]() { return sup.ListAvailableTools().size() == 1u; }));
    EXPECT_EQ(sup.ListAvailableTools()[0].name, "second");
}

TEST(Supervisor, RepeatedTimeoutsMarkServerDegraded) {
    FakeServerFarm farm;
    farm.SetScript("sluggish", [](FakeToolServer& s) { withTools(s, {"t"}); });
    ServerSupervisor sup({MakeConfig("sluggish")}, farm.Factory(), fastSettings());
    sup.Connect("sluggish").get();
    auto session = sup.GetReadySession("sluggish");
    ASSERT_NE(session, nullptr);

    farm.Latest("sluggish")->SetSilentFirstCalls(2);
    for (int i = 0; i < 2; ++i) {
        auto fut = session->CallTool("t", JSONValue{JSONValue::Object{}}, 60ms);
        EXPECT_THROW(fut.get(), McpException);
    }
    ASSERT_TRUE(waitUntil([&]() { return sup.GetServerSnapshot("sluggish")->degraded; }));
    EXPECT_EQ(sup.GetServerSnapshot("sluggish")->consecutiveTimeouts, 2u);
    EXPECT_EQ(sup.GetState("sluggish"), ServerState::Ready);

    session->CallTool("t", JSONValue{JSONValue::Object{}}, 1000ms).get();
    ASSERT_TRUE(waitUntil([&]() { return !sup.GetServerSnapshot("sluggish")->degraded; }));
    EXPECT_EQ(sup.GetServerSnapshot("sluggish")->consecutiveTimeouts, 0u);
}

TEST(Supervisor, RefreshAllConnectsEnabledServers) {
    FakeServerFarm farm;
    farm.SetLaunchFailure("bad", true);
    farm.SetScript("good", [](FakeToolServer& s) { withTools(s, {"t"}); });
    ServerConfig off = MakeConfig("off");
    off.enabled = false;
    ServerSupervisor sup({MakeConfig("good"), MakeConfig("bad"), off}, farm.Factory(), fastSettings());

    auto results = sup.RefreshAll().get();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results.at("good"));
    EXPECT_FALSE(results.at("bad"));
    EXPECT_EQ(results.count("off"), 0u);
    EXPECT_EQ(sup.GetState("good"), ServerState::Ready);
    EXPECT_EQ(sup.GetState("bad"), ServerState::Failed);
    EXPECT_EQ(sup.GetState("off"), ServerState::Disconnected);

    // A second pass re-runs discovery on the ready server instead of relaunching it
    withTools(*farm.Latest("good"), {"u"});
    results = sup.RefreshAll().get();
    EXPECT_TRUE(results.at("good"));
    EXPECT_EQ(farm.Launches("good"), 1);
    EXPECT_EQ(sup.GetServerSnapshot("good")->toolCount, 2u);
}

TEST(Supervisor, RefreshAllWithNothingEnabledIsEmpty) {
    FakeServerFarm farm;
    ServerConfig off = MakeConfig("off");
    off.enabled = false;
    ServerSupervisor sup({off}, farm.Factory(), fastSettings());
    EXPECT_TRUE(sup.RefreshAll().get().empty());
}

TEST(Supervisor, ReloadKeepsUnchangedAndRetiresChanged) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("keep"), MakeConfig("change"), MakeConfig("drop")}, farm.Factory(),
                         fastSettings());
    sup.RefreshAll().get();
    ASSERT_EQ(sup.GetStatusSummary().ready, 3u);

    ServerConfig changed = MakeConfig("change");
    changed.args = {"--verbose"};
    sup.ReloadConfigs({MakeConfig("keep"), changed, MakeConfig("new")}).get();

    EXPECT_EQ(sup.GetState("keep"), ServerState::Ready);
    EXPECT_EQ(sup.GetState("change"), ServerState::Disconnected);
    EXPECT_EQ(sup.GetState("new"), ServerState::Disconnected);
    EXPECT_FALSE(sup.GetState("drop").has_value());
    auto configs = sup.GetConfigs();
    ASSERT_EQ(configs.size(), 3u);
    EXPECT_EQ(configs[1].args, (std::vector<std::string>{"--verbose"}));
}

TEST(Supervisor, DisablingDisconnects) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("a")}, farm.Factory(), fastSettings());
    sup.Connect("a").get();
    sup.SetServerEnabled("a", false).get();
    EXPECT_EQ(sup.GetState("a"), ServerState::Disconnected);
    EXPECT_FALSE(sup.GetServerSnapshot("a")->enabled);
    EXPECT_FALSE(sup.GetConfigs()[0].enabled);
    auto refused = sup.Connect("a");
    EXPECT_EQ(failureOf(refused), ErrorCategory::ServerUnavailable);

    sup.SetServerEnabled("a", true).get();
    sup.Connect("a").get();
    EXPECT_EQ(sup.GetState("a"), ServerState::Ready);

    auto unknown = sup.SetServerEnabled("zzz", true);
    EXPECT_EQ(failureOf(unknown), ErrorCategory::ServerUnavailable);
}

TEST(Supervisor, CallTimeoutPrefersServerOverride) {
    FakeServerFarm farm;
    ServerConfig custom = MakeConfig("custom");
    custom.timeoutMs = 1234;
    ServerSupervisor sup({custom, MakeConfig("plain")}, farm.Factory(), fastSettings());
    EXPECT_EQ(sup.GetCallTimeout("custom"), 1234ms);
    EXPECT_EQ(sup.GetCallTimeout("plain"), 1000ms);
    EXPECT_EQ(sup.GetCallTimeout("unknown"), 1000ms);
}

TEST(Supervisor, ShutdownDisconnectsEverything) {
    FakeServerFarm farm;
    ServerSupervisor sup({MakeConfig("a"), MakeConfig("b")}, farm.Factory(), fastSettings());
    sup.RefreshAll().get();
    sup.Shutdown();
    auto summary = sup.GetStatusSummary();
    EXPECT_EQ(summary.disconnected, 2u);
    EXPECT_EQ(summary.ready, 0u);
}
