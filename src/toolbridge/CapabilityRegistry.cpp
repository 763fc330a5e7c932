//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Per-connection tool catalog cache
//==========================================================================================================

#include <unordered_set>

#include "logging/Logger.h"
#include "toolbridge/CapabilityRegistry.h"

namespace toolbridge {

const Tool* ToolCatalog::Find(const std::string& toolName) const {
    for (const auto& t : tools) {
        if (t.name == toolName) {
            return &t;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolCatalog::Names() const {
    std::vector<std::string> names;
    names.reserve(tools.size());
    for (const auto& t : tools) {
        names.push_back(t.name);
    }
    return names;
}

CapabilityRegistry::CapabilityRegistry(std::string serverName)
    : serverName(std::move(serverName)) {}

uint64_t CapabilityRegistry::BeginGeneration() {
    std::lock_guard<std::mutex> lock(mutex);
    ++generation;
    catalog.reset();
    LOG_DEBUG("Registry '{}' now at generation {}", serverName, generation);
    return generation;
}

bool CapabilityRegistry::Replace(uint64_t gen, std::vector<Tool> tools) {
    auto next = std::make_shared<ToolCatalog>();
    next->generation = gen;
    next->discoveredAt = std::chrono::system_clock::now();
    next->tools.reserve(tools.size());
    std::unordered_set<std::string> seen;
    for (auto& t : tools) {
        if (!seen.insert(t.name).second) {
            LOG_WARN("Server '{}' listed tool '{}' more than once; keeping the first", serverName, t.name);
            continue;
        }
        t.serverName = serverName;
        next->tools.push_back(std::move(t));
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (gen != generation) {
        LOG_DEBUG("Ignoring catalog for '{}' from stale generation {} (current {})", serverName, gen, generation);
        return false;
    }
    catalog = std::move(next);
    return true;
}

void CapabilityRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    catalog.reset();
}

std::shared_ptr<const ToolCatalog> CapabilityRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return catalog;
}

std::optional<Tool> CapabilityRegistry::Find(const std::string& toolName) const {
    auto snap = Snapshot();
    if (!snap) {
        return std::nullopt;
    }
    const Tool* t = snap->Find(toolName);
    if (t == nullptr) {
        return std::nullopt;
    }
    return *t;
}

uint64_t CapabilityRegistry::CurrentGeneration() const {
    std::lock_guard<std::mutex> lock(mutex);
    return generation;
}

std::size_t CapabilityRegistry::Size() const {
    auto snap = Snapshot();
    return snap ? snap->tools.size() : 0;
}

} // namespace toolbridge
