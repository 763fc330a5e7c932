//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: MCP protocol session implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolbridge/Session.h"
#include "toolbridge/JsonRpcMessageRouter.h"
#include "toolbridge/validation/Validators.h"

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpError;
using errors::McpException;

namespace {
// Upper bound on tools/list pages followed for one ListTools() call
constexpr int kMaxToolPages = 64;
constexpr std::chrono::milliseconds kTimeoutTick{50};
} // namespace

class ProtocolSession::Impl {
public:
    using clock = std::chrono::steady_clock;

    struct PendingRequest {
        std::string method;
        std::chrono::milliseconds timeout{0};
        clock::time_point deadline;
        std::function<void(JSONRPCResponse&&)> onResponse;
        std::function<void(std::exception_ptr)> onFailure;
    };

    struct ListState {
        std::vector<Tool> tools;
        int pages{0};
        std::promise<std::vector<Tool>> promise;
    };

    std::string serverName;
    std::unique_ptr<ITransport> transport;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    std::thread readerThread;
    std::thread timeoutThread;
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> readerExited{false};

    mutable std::mutex requestMutex;
    std::condition_variable timeoutCv;
    bool stopTimeouts{false};
    std::unordered_map<std::string, PendingRequest> pendingRequests;
    std::atomic<int64_t> nextRequestId{1};

    std::mutex handlerMutex;
    std::unordered_map<std::string, NotificationHandler> notificationHandlers;
    ErrorHandler errorHandler;
    HealthHandler healthHandler;

    std::atomic<unsigned int> consecutiveTimeouts{0};
    std::atomic<bool> handshakeStarted{false};
    std::atomic<bool> initialized{false};
    mutable std::mutex infoMutex;
    std::optional<ServerInfo> serverInfo;
    std::atomic<validation::ValidationMode> validationMode{validation::ValidationMode::Off};

    explicit Impl(std::string name)
        : serverName(std::move(name)), router(MakeDefaultJsonRpcMessageRouter()) {}

    bool strict() const { return validationMode.load() == validation::ValidationMode::Strict; }

    template <typename T>
    static std::future<T> failedFuture(ErrorCategory category, const std::string& message) {
        std::promise<T> promise;
        promise.set_exception(std::make_exception_ptr(McpException(category, message)));
        return promise.get_future();
    }

    ////////////////////////////////////////// Request plumbing ///////////////////////////////////////////
    void sendRequest(const std::string& method, std::optional<JSONValue> params, std::chrono::milliseconds timeout,
                     std::function<void(JSONRPCResponse&&)> onResponse,
                     std::function<void(std::exception_ptr)> onFailure) {
        if (!connected.load()) {
            onFailure(std::make_exception_ptr(
                McpException(ErrorCategory::TransportClosed, "session with '" + serverName + "' is not connected")));
            return;
        }
        const int64_t id = nextRequestId.fetch_add(1);
        const std::string key = std::to_string(id);
        JSONRPCRequest request(id, method, std::move(params));

        {
            std::lock_guard<std::mutex> lock(requestMutex);
            PendingRequest entry;
            entry.method = method;
            entry.timeout = timeout;
            entry.deadline = timeout.count() > 0 ? clock::now() + timeout : clock::time_point::max();
            entry.onResponse = std::move(onResponse);
            entry.onFailure = onFailure;
            pendingRequests.emplace(key, std::move(entry));
        }

        const std::string serialized = request.Serialize();
        LOG_DEBUG("Sending {} (id {}) to '{}'", method, key, serverName);
        try {
            transport->Send(serialized);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to send {} to '{}': {}", method, serverName, e.what());
            bool owned = false;
            {
                std::lock_guard<std::mutex> lock(requestMutex);
                owned = pendingRequests.erase(key) > 0;
            }
            // When the entry is gone the reader or the watchdog already resolved it
            if (owned) {
                onFailure(std::current_exception());
            }
        }
    }

    template <typename T>
    std::future<T> request(const std::string& method, std::optional<JSONValue> params,
                           std::chrono::milliseconds timeout, std::function<T(JSONRPCResponse&&)> convert) {
        auto promise = std::make_shared<std::promise<T>>();
        auto fut = promise->get_future();
        sendRequest(method, std::move(params), timeout,
            [promise, convert = std::move(convert)](JSONRPCResponse&& resp) {
                try {
                    promise->set_value(convert(std::move(resp)));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            },
            [promise](std::exception_ptr ep) { promise->set_exception(ep); });
        return fut;
    }

    void resolveResponse(JSONRPCResponse&& response) {
        const std::string key = IdToString(response.id);
        std::optional<PendingRequest> entry;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            auto it = pendingRequests.find(key);
            if (it != pendingRequests.end()) {
                entry = std::move(it->second);
                pendingRequests.erase(it);
            }
        }
        if (!entry.has_value()) {
            LOG_WARN("Dropping response from '{}' for unknown or already resolved id {}", serverName, key);
            return;
        }
        if (consecutiveTimeouts.exchange(0) > 0) {
            notifyHealth(0);
        }
        entry->onResponse(std::move(response));
    }

    void failAllPending(ErrorCategory category, const std::string& message) {
        std::unordered_map<std::string, PendingRequest> drained;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            drained.swap(pendingRequests);
        }
        if (!drained.empty()) {
            LOG_DEBUG("Failing {} pending request(s) on '{}': {}", drained.size(), serverName, message);
        }
        for (auto& [key, entry] : drained) {
            entry.onFailure(std::make_exception_ptr(McpException(category, message)));
        }
    }

    void failSession(const McpError& err) {
        bool expected = false;
        if (!failed.compare_exchange_strong(expected, true)) {
            return;
        }
        connected = false;
        failAllPending(err.category, err.message);
        if (closing.load()) {
            return;
        }
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(err);
        }
    }

    void notifyHealth(unsigned int count) {
        HealthHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = healthHandler;
        }
        if (handler) {
            handler(count);
        }
    }

    ////////////////////////////////////////// Threads ///////////////////////////////////////////
    void startReader() {
        readerThread = std::thread([this]() {
            RouterHandlers handlers;
            handlers.requestHandler = [this](const JSONRPCRequest& req) { return onRequest(req); };
            handlers.notificationHandler = [this](const JSONRPCNotification& n) { onNotification(n); };
            const ResponseResolver resolver = [this](JSONRPCResponse&& r) { resolveResponse(std::move(r)); };

            while (!closing.load()) {
                try {
                    const std::string frame = transport->Receive();
                    LOG_DEBUG("Received message from '{}': {}", serverName, frame);
                    auto reply = router->route(frame, handlers, resolver);
                    if (reply.has_value()) {
                        transport->Send(reply.value());
                    }
                } catch (const McpException& e) {
                    if (!closing.load()) {
                        LOG_ERROR("Session with '{}' failed ({}): {}", serverName, errors::toString(e.category()), e.what());
                        failSession(e.error());
                    }
                    break;
                } catch (const std::exception& e) {
                    if (!closing.load()) {
                        LOG_ERROR("Session with '{}' failed: {}", serverName, e.what());
                        failSession(errors::makeError(ErrorCategory::TransportIOFailure, e.what()));
                    }
                    break;
                }
            }
            readerExited = true;
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            while (true) {
                std::vector<PendingRequest> expired;
                {
                    std::unique_lock<std::mutex> lock(requestMutex);
                    timeoutCv.wait_for(lock, kTimeoutTick, [this]() { return stopTimeouts; });
                    if (stopTimeouts) {
                        break;
                    }
                    const auto now = clock::now();
                    for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                        if (it->second.deadline <= now) {
                            expired.push_back(std::move(it->second));
                            it = pendingRequests.erase(it);
                        } else {
                            ++it;
                        }
                    }
                }
                for (auto& entry : expired) {
                    LOG_WARN("{} to '{}' timed out after {} ms", entry.method, serverName, entry.timeout.count());
                    const std::string message = entry.method + " to '" + serverName + "' timed out after " +
                                                std::to_string(entry.timeout.count()) + " ms";
                    // A handshake that never completes is a handshake failure
                    if (entry.method == Methods::Initialize) {
                        entry.onFailure(std::make_exception_ptr(McpException(ErrorCategory::HandshakeFailed, message)));
                        continue;
                    }
                    const unsigned int count = ++consecutiveTimeouts;
                    entry.onFailure(std::make_exception_ptr(McpException(ErrorCategory::Timeout, message)));
                    notifyHealth(count);
                }
            }
        });
    }

    ////////////////////////////////////////// Inbound traffic ///////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> onRequest(const JSONRPCRequest& req) {
        LOG_DEBUG("Peer request from '{}': {}", serverName, req.method);
        if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        }
        return nullptr;
    }

    void onNotification(const JSONRPCNotification& n) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            auto it = notificationHandlers.find(n.method);
            if (it != notificationHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            if (n.method == Methods::Log && n.params.has_value()) {
                LOG_DEBUG("Log from '{}': {}", serverName, SerializeJSON(n.params.value()));
            } else {
                LOG_DEBUG("Ignoring notification {} from '{}'", n.method, serverName);
            }
            return;
        }
        try {
            handler(n);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification handler for {} threw: {}", n.method, e.what());
        }
    }

    ////////////////////////////////////////// Tools pagination ///////////////////////////////////////////
    void requestToolsPage(const std::shared_ptr<ListState>& state, const std::optional<std::string>& cursor,
                          std::chrono::milliseconds timeout) {
        std::optional<JSONValue> params;
        if (cursor.has_value()) {
            JSONValue::Object p;
            p["cursor"] = std::make_shared<JSONValue>(cursor.value());
            params = JSONValue{p};
        }
        sendRequest(Methods::ListTools, std::move(params), timeout,
            [this, state, timeout](JSONRPCResponse&& resp) {
                try {
                    if (resp.IsError()) {
                        auto err = errors::mcpErrorFromResponse(resp);
                        if (!err.has_value()) {
                            throw McpException(ErrorCategory::MalformedMessage,
                                               "tools/list error reply from '" + serverName + "' is not a valid error object");
                        }
                        throw McpException(err.value());
                    }
                    if (!resp.result.has_value() ||
                        (strict() && !validation::validateToolsListResultJson(resp.result.value()))) {
                        throw McpException(ErrorCategory::MalformedMessage,
                                           "tools/list result from '" + serverName + "' is malformed");
                    }
                    auto page = ParseToolsListResult(resp.result.value(), serverName);
                    if (!page.has_value()) {
                        throw McpException(ErrorCategory::MalformedMessage,
                                           "tools/list result from '" + serverName + "' has no tools array");
                    }
                    for (auto& t : page->tools) {
                        state->tools.push_back(std::move(t));
                    }
                    ++state->pages;
                    if (page->nextCursor.has_value()) {
                        if (state->pages < kMaxToolPages) {
                            requestToolsPage(state, page->nextCursor, timeout);
                            return;
                        }
                        LOG_WARN("tools/list on '{}' still paginating after {} pages; using what was received",
                                 serverName, state->pages);
                    }
                    LOG_DEBUG("Discovered {} tool(s) on '{}'", state->tools.size(), serverName);
                    state->promise.set_value(std::move(state->tools));
                } catch (...) {
                    state->promise.set_exception(std::current_exception());
                }
            },
            [state](std::exception_ptr ep) { state->promise.set_exception(ep); });
    }
};

ProtocolSession::ProtocolSession(std::string serverName)
    : pImpl(std::make_unique<Impl>(std::move(serverName))) {
    FUNC_SCOPE();
}

ProtocolSession::~ProtocolSession() {
    FUNC_SCOPE();
    try {
        Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Closing session with '{}' failed: {}", pImpl->serverName, e.what());
    }
}

std::future<void> ProtocolSession::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (pImpl->transport) {
        promise.set_exception(std::make_exception_ptr(McpException(
            ErrorCategory::TransportIOFailure, "session with '" + pImpl->serverName + "' already has a transport")));
        return fut;
    }
    pImpl->transport = std::move(transport);
    try {
        pImpl->transport->Start().get();
    } catch (...) {
        promise.set_exception(std::current_exception());
        return fut;
    }
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startTimeouts();
    LOG_DEBUG("Session with '{}' connected (transport {})", pImpl->serverName, pImpl->transport->GetSessionId());
    promise.set_value();
    return fut;
}

std::future<void> ProtocolSession::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (pImpl->closing.exchange(true)) {
        promise.set_value();
        return fut;
    }
    LOG_DEBUG("Closing session with '{}'", pImpl->serverName);
    pImpl->connected = false;

    if (pImpl->transport) {
        try {
            pImpl->transport->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Transport close for '{}' reported: {}", pImpl->serverName, e.what());
        }
    }

    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerThread.get_id() == std::this_thread::get_id()) {
            pImpl->readerThread.detach();
        } else {
            pImpl->readerThread.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->stopTimeouts = true;
    }
    pImpl->timeoutCv.notify_all();
    if (pImpl->timeoutThread.joinable()) {
        pImpl->timeoutThread.join();
    }

    pImpl->failAllPending(ErrorCategory::TransportClosed, "session with '" + pImpl->serverName + "' closed");
    promise.set_value();
    return fut;
}

bool ProtocolSession::IsConnected() const {
    return pImpl->connected.load();
}

std::future<ServerInfo> ProtocolSession::Initialize(const Implementation& clientInfo,
                                                    std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const std::string& name = pImpl->serverName;
    if (!pImpl->connected.load()) {
        return Impl::failedFuture<ServerInfo>(ErrorCategory::TransportClosed,
                                              "session with '" + name + "' is not connected");
    }
    if (pImpl->handshakeStarted.exchange(true)) {
        return Impl::failedFuture<ServerInfo>(ErrorCategory::HandshakeFailed,
                                              "initialize already attempted on session with '" + name + "'");
    }
    LOG_INFO("Initializing session with '{}'", name);
    Impl* impl = pImpl.get();
    return impl->request<ServerInfo>(Methods::Initialize, MakeInitializeParams(clientInfo), timeout,
        [impl](JSONRPCResponse&& resp) -> ServerInfo {
            const std::string& server = impl->serverName;
            if (resp.IsError()) {
                auto err = errors::mcpErrorFromResponse(resp);
                const std::string reason = err.has_value() ? err->message : std::string("invalid error object");
                throw McpException(errors::makeError(ErrorCategory::HandshakeFailed,
                                                     "initialize rejected by '" + server + "': " + reason,
                                                     err.has_value() ? err->data : std::nullopt));
            }
            if (!resp.result.has_value() ||
                (impl->strict() && !validation::validateInitializeResultJson(resp.result.value()))) {
                throw McpException(ErrorCategory::HandshakeFailed, "initialize result from '" + server + "' is malformed");
            }
            auto info = ParseServerInfo(resp.result.value());
            if (!info.has_value()) {
                throw McpException(ErrorCategory::HandshakeFailed,
                                   "initialize result from '" + server + "' lacks protocolVersion or serverInfo");
            }
            if (info->protocolVersion != PROTOCOL_VERSION) {
                LOG_WARN("Server '{}' answered with protocol {} (requested {})", server, info->protocolVersion,
                         PROTOCOL_VERSION);
            }
            impl->transport->Send(JSONRPCNotification(Methods::Initialized).Serialize());
            {
                std::lock_guard<std::mutex> lock(impl->infoMutex);
                impl->serverInfo = info;
            }
            impl->initialized = true;
            LOG_INFO("Session with '{}' initialized: {} {} (protocol {})", server, info->implementation.name,
                     info->implementation.version, info->protocolVersion);
            return info.value();
        });
}

std::future<std::vector<Tool>> ProtocolSession::ListTools(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    if (!pImpl->initialized.load()) {
        return Impl::failedFuture<std::vector<Tool>>(ErrorCategory::HandshakeFailed,
                                                     "session with '" + pImpl->serverName + "' is not initialized");
    }
    auto state = std::make_shared<Impl::ListState>();
    auto fut = state->promise.get_future();
    pImpl->requestToolsPage(state, std::nullopt, timeout);
    return fut;
}

std::future<CallToolResult> ProtocolSession::CallTool(const std::string& name, const JSONValue& arguments,
                                                      std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    if (!pImpl->initialized.load()) {
        return Impl::failedFuture<CallToolResult>(ErrorCategory::HandshakeFailed,
                                                  "session with '" + pImpl->serverName + "' is not initialized");
    }
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("Calling tool {} on '{}'", name, pImpl->serverName);
    Impl* impl = pImpl.get();
    return impl->request<CallToolResult>(Methods::CallTool, JSONValue{params}, timeout,
        [impl, name](JSONRPCResponse&& resp) -> CallToolResult {
            if (resp.IsError()) {
                auto err = errors::mcpErrorFromResponse(resp);
                if (!err.has_value()) {
                    throw McpException(ErrorCategory::MalformedMessage,
                                       "tools/call error reply for " + name + " is not a valid error object");
                }
                // Keep the peer's code and data; the category marks it as a tool-level failure
                McpError e = err.value();
                e.category = ErrorCategory::ToolError;
                throw McpException(e);
            }
            if (!resp.result.has_value() || !resp.result->isObject() ||
                (impl->strict() && !validation::validateCallToolResultJson(resp.result.value()))) {
                throw McpException(ErrorCategory::MalformedMessage,
                                   "tools/call result for " + name + " from '" + impl->serverName + "' is malformed");
            }
            return ParseCallToolResult(resp.result.value());
        });
}

void ProtocolSession::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    if (handler) {
        pImpl->notificationHandlers[method] = std::move(handler);
    } else {
        pImpl->notificationHandlers.erase(method);
    }
}

void ProtocolSession::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void ProtocolSession::SetHealthHandler(HealthHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->healthHandler = std::move(handler);
}

void ProtocolSession::SetValidationMode(validation::ValidationMode mode) {
    pImpl->validationMode = mode;
}

validation::ValidationMode ProtocolSession::GetValidationMode() const {
    return pImpl->validationMode.load();
}

bool ProtocolSession::IsInitialized() const {
    return pImpl->initialized.load();
}

std::optional<ServerInfo> ProtocolSession::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    return pImpl->serverInfo;
}

std::size_t ProtocolSession::GetPendingRequestCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

unsigned int ProtocolSession::GetConsecutiveTimeouts() const {
    return pImpl->consecutiveTimeouts.load();
}

std::optional<int> ProtocolSession::GetExitCode() const {
    return pImpl->transport ? pImpl->transport->GetExitCode() : std::nullopt;
}

std::string ProtocolSession::GetStderrTail() const {
    return pImpl->transport ? pImpl->transport->GetStderrTail() : std::string();
}

} // namespace toolbridge
