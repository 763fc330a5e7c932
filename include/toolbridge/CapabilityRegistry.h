//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Per-connection cache of a server's discovered tool catalog
//==========================================================================================================

#pragma once

#include "Protocol.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// ToolCatalog
// Purpose: Immutable result of one successful discovery. Readers hold it through shared_ptr<const>.
//==========================================================================================================
struct ToolCatalog {
    uint64_t generation{0};
    std::vector<Tool> tools;
    std::chrono::system_clock::time_point discoveredAt{};

    const Tool* Find(const std::string& toolName) const;
    std::vector<std::string> Names() const;
};

//==========================================================================================================
// CapabilityRegistry
// Purpose: Holds the catalog for the current connection generation of one server. A new generation
//          discards the previous catalog; Replace() for an older generation is ignored so a late
//          discovery from a dead connection can never overwrite the live one.
//==========================================================================================================
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(std::string serverName);

    //==========================================================================================================
    // BeginGeneration
    // Purpose: Starts a new connection generation and clears the catalog.
    // Returns:
    //   The new generation number.
    //==========================================================================================================
    uint64_t BeginGeneration();

    //==========================================================================================================
    // Replace
    // Purpose: Installs the tools from a discovery run on `generation`. Duplicate tool names keep the first
    //          entry. Tools are re-tagged with this registry's server name.
    // Returns:
    //   true when installed; false when `generation` is not current.
    //==========================================================================================================
    bool Replace(uint64_t generation, std::vector<Tool> tools);

    // Drops the catalog without starting a new generation.
    void Clear();

    // Current catalog or nullptr when none has been discovered for this generation.
    std::shared_ptr<const ToolCatalog> Snapshot() const;

    std::optional<Tool> Find(const std::string& toolName) const;
    uint64_t CurrentGeneration() const;
    std::size_t Size() const;
    const std::string& ServerName() const { return serverName; }

private:
    std::string serverName;
    mutable std::mutex mutex;
    uint64_t generation{0};
    std::shared_ptr<const ToolCatalog> catalog;
};

} // namespace toolbridge
