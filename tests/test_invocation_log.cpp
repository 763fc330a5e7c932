//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_invocation_log.cpp
// Purpose: Invocation history queries and summary
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolbridge/InvocationLog.h"

using namespace toolbridge;
using errors::ErrorCategory;

namespace {
ToolInvocationRecord rec(const std::string& server, const std::string& tool, bool ok, int latencyMs) {
    ToolInvocationRecord r;
    r.serverName = server;
    r.toolName = tool;
    r.success = ok;
    r.latency = std::chrono::milliseconds(latencyMs);
    if (!ok) {
        r.errorCategory = ErrorCategory::Timeout;
        r.errorMessage = "timed out";
    }
    return r;
}
} // namespace

TEST(InvocationLog, EmptySummary) {
    InvocationLog log;
    auto s = log.Summary();
    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(s.averageLatencyMs, 0.0);
    EXPECT_TRUE(s.toolsUsed.empty());
    EXPECT_TRUE(log.Recent().empty());
}

TEST(InvocationLog, SummaryCountsAndDistinctNames) {
    InvocationLog log;
    log.Append(rec("web", "search", true, 10));
    log.Append(rec("files", "read", false, 30));
    log.Append(rec("web", "search", true, 20));
    log.Append(rec("", "ghost", false, 0));

    auto s = log.Summary();
    EXPECT_EQ(s.total, 4u);
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 2u);
    EXPECT_EQ(s.toolsUsed, (std::vector<std::string>{"ghost", "read", "search"}));
    EXPECT_EQ(s.serversUsed, (std::vector<std::string>{"files", "web"}));
    EXPECT_DOUBLE_EQ(s.averageLatencyMs, 15.0);
}

TEST(InvocationLog, RecentReturnsNewestInOrder) {
    InvocationLog log;
    for (int i = 0; i < 5; ++i) {
        log.Append(rec("s", "t" + std::to_string(i), true, i));
    }
    auto recent = log.Recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].toolName, "t3");
    EXPECT_EQ(recent[1].toolName, "t4");
    EXPECT_EQ(log.Recent(50).size(), 5u);
    EXPECT_TRUE(log.Recent(0).empty());
}

TEST(InvocationLog, ClearEmptiesHistory) {
    InvocationLog log;
    log.Append(rec("s", "t", true, 1));
    EXPECT_EQ(log.Size(), 1u);
    log.Clear();
    EXPECT_EQ(log.Size(), 0u);
    EXPECT_TRUE(log.Records().empty());
}
