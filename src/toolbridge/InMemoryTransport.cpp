//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "toolbridge/Config.h"
#include "toolbridge/InMemoryTransport.hpp"
#include "toolbridge/errors/Errors.h"

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpException;

struct InMemoryTransport::Link {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox[2];
    bool closed{false};
    ErrorCategory closeCategory{ErrorCategory::TransportClosed};
    std::string closeReason;

    void close(ErrorCategory category, const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return;
            closed = true;
            closeCategory = category;
            closeReason = reason;
        }
        cv.notify_all();
    }
};

class InMemoryTransport::Impl {
public:
    std::shared_ptr<Link> link;
    int side;
    std::string sessionId;
    std::atomic<bool> started{false};
    std::optional<std::string> startFailure;

    Impl(std::shared_ptr<Link> l, int s, std::string id)
        : link(std::move(l)), side(s), sessionId(std::move(id)) {}
};

InMemoryTransport::InMemoryTransport(std::shared_ptr<Link> link, int side, std::string sessionId)
    : pImpl(std::make_unique<Impl>(std::move(link), side, std::move(sessionId))) {
    FUNC_SCOPE();
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    if (pImpl && pImpl->link) {
        pImpl->link->close(ErrorCategory::TransportClosed, "in-memory peer destroyed");
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>>
InMemoryTransport::CreatePair(const std::string& label) {
    FUNC_SCOPE();
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);
    const std::string suffix = std::to_string(dis(gen));
    auto link = std::make_shared<Link>();
    std::unique_ptr<InMemoryTransport> client(new InMemoryTransport(link, 0, label + "-client-" + suffix));
    std::unique_ptr<InMemoryTransport> peer(new InMemoryTransport(link, 1, label + "-peer-" + suffix));
    return { std::move(client), std::move(peer) };
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (pImpl->startFailure.has_value()) {
        const std::string msg = pImpl->startFailure.value();
        pImpl->link->close(ErrorCategory::TransportIOFailure, msg);
        promise.set_exception(std::make_exception_ptr(McpException(ErrorCategory::TransportIOFailure, msg)));
        return fut;
    }
    pImpl->started = true;
    promise.set_value();
    return fut;
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing in-memory transport {}", pImpl->sessionId);
    pImpl->link->close(ErrorCategory::TransportClosed, "in-memory channel closed");
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

void InMemoryTransport::CloseWithError(const std::string& message) {
    pImpl->link->close(ErrorCategory::TransportIOFailure, message);
}

void InMemoryTransport::FailStart(const std::string& message) {
    pImpl->startFailure = message;
}

bool InMemoryTransport::IsConnected() const {
    std::lock_guard<std::mutex> lock(pImpl->link->mutex);
    return !pImpl->link->closed;
}

std::string InMemoryTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void InMemoryTransport::Send(const std::string& payload) {
    auto& link = *pImpl->link;
    {
        std::lock_guard<std::mutex> lock(link.mutex);
        if (link.closed) {
            throw McpException(link.closeCategory, link.closeReason);
        }
        link.inbox[1 - pImpl->side].push_back(payload);
    }
    link.cv.notify_all();
}

std::string InMemoryTransport::Receive() {
    auto& link = *pImpl->link;
    auto& inbox = link.inbox[pImpl->side];
    std::unique_lock<std::mutex> lock(link.mutex);
    link.cv.wait(lock, [&]() { return !inbox.empty() || link.closed; });
    if (!inbox.empty()) {
        std::string msg = std::move(inbox.front());
        inbox.pop_front();
        return msg;
    }
    throw McpException(link.closeCategory, link.closeReason);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const ServerConfig& config) {
    FUNC_SCOPE();
    auto [client, peer] = InMemoryTransport::CreatePair(config.name);
    bool ok = onPeer ? onPeer(config, std::move(peer)) : false;
    if (!ok) {
        client->FailStart("failed to launch in-memory server '" + config.name + "'");
    }
    return client;
}

} // namespace toolbridge
