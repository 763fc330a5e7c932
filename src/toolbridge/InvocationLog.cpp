//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationLog.cpp
// Purpose: Tool invocation audit trail
//==========================================================================================================

#include <set>

#include "logging/Logger.h"
#include "toolbridge/InvocationLog.h"

namespace toolbridge {

void InvocationLog::Append(ToolInvocationRecord record) {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back(std::move(record));
}

std::vector<ToolInvocationRecord> InvocationLog::Records() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records;
}

std::vector<ToolInvocationRecord> InvocationLog::Recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex);
    const std::size_t start = records.size() > limit ? records.size() - limit : 0;
    return std::vector<ToolInvocationRecord>(records.begin() + static_cast<std::ptrdiff_t>(start), records.end());
}

InvocationSummary InvocationLog::Summary() const {
    std::lock_guard<std::mutex> lock(mutex);
    InvocationSummary s;
    std::set<std::string> tools;
    std::set<std::string> servers;
    double totalMs = 0.0;
    for (const auto& r : records) {
        ++s.total;
        if (r.success) {
            ++s.succeeded;
        } else {
            ++s.failed;
        }
        tools.insert(r.toolName);
        if (!r.serverName.empty()) {
            servers.insert(r.serverName);
        }
        totalMs += static_cast<double>(r.latency.count());
    }
    s.toolsUsed.assign(tools.begin(), tools.end());
    s.serversUsed.assign(servers.begin(), servers.end());
    if (s.total > 0) {
        s.averageLatencyMs = totalMs / static_cast<double>(s.total);
    }
    return s;
}

std::size_t InvocationLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
}

void InvocationLog::Clear() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        records.clear();
    }
    LOG_INFO("Cleared tool invocation history");
}

} // namespace toolbridge
