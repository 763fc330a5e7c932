//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationLog.h
// Purpose: Append-only audit trail of tool invocations
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include "toolbridge/errors/Errors.h"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// ToolInvocationRecord
// Purpose: One invocation as it was dispatched. serverName is empty when the tool reference never
//          resolved to a server.
//==========================================================================================================
struct ToolInvocationRecord {
    std::string serverName;
    std::string toolName;
    JSONValue arguments;
    bool success{false};
    std::optional<JSONValue> result;
    std::optional<errors::ErrorCategory> errorCategory;
    std::string errorMessage;
    std::chrono::milliseconds latency{0};
    std::chrono::system_clock::time_point timestamp{};
    unsigned int attempts{0};
};

struct InvocationSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::vector<std::string> toolsUsed;    // sorted, distinct
    std::vector<std::string> serversUsed;  // sorted, distinct
    double averageLatencyMs{0.0};
};

class InvocationLog {
public:
    void Append(ToolInvocationRecord record);

    std::vector<ToolInvocationRecord> Records() const;
    // Last `limit` records, oldest first.
    std::vector<ToolInvocationRecord> Recent(std::size_t limit = 10) const;
    InvocationSummary Summary() const;
    std::size_t Size() const;
    void Clear();

private:
    mutable std::mutex mutex;
    std::vector<ToolInvocationRecord> records;
};

} // namespace toolbridge
