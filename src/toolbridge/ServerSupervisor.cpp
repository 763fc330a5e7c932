//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSupervisor.cpp
// Purpose: Server lifecycle supervision implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "toolbridge/ServerSupervisor.h"
#include "toolbridge/version.h"

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpError;
using errors::McpException;

const char* toString(ServerState state) {
    switch (state) {
        case ServerState::Disconnected: return "Disconnected";
        case ServerState::Connecting: return "Connecting";
        case ServerState::Handshaking: return "Handshaking";
        case ServerState::Ready: return "Ready";
        case ServerState::Disconnecting: return "Disconnecting";
        case ServerState::Failed: return "Failed";
    }
    return "Unknown";
}

namespace {

using Completion = std::function<void(std::exception_ptr)>;

std::string describe(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

void resolveAll(const std::vector<Completion>& waiters, const std::exception_ptr& ep) {
    for (const auto& w : waiters) {
        w(ep);
    }
}

std::exception_ptr unavailable(const std::string& message) {
    return std::make_exception_ptr(McpException(ErrorCategory::ServerUnavailable, message));
}

//==========================================================================================================
// Connection
// Purpose: Supervisor-side record of one configured server. Every field below `mutex` is guarded by it.
//==========================================================================================================
struct Connection {
    explicit Connection(ServerConfig cfg) : config(std::move(cfg)), registry(config.name) {}

    mutable std::mutex mutex;
    ServerConfig config;
    ServerState state{ServerState::Disconnected};
    std::shared_ptr<IProtocolSession> session;
    CapabilityRegistry registry;
    std::vector<Completion> connectWaiters;
    std::vector<Completion> disconnectWaiters;
    std::optional<ServerErrorDetails> lastError;
    std::optional<std::chrono::system_clock::time_point> connectedSince;
    std::optional<std::chrono::milliseconds> connectionTime;
    unsigned int consecutiveTimeouts{0};
    bool degraded{false};
    std::optional<ServerInfo> serverInfo;

    const std::string& name() const { return config.name; }
    bool isCurrent(uint64_t gen) const { return registry.CurrentGeneration() == gen; }
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace

class ServerSupervisor::Impl {
public:
    std::shared_ptr<ITransportFactory> factory;
    OrchestratorSettings settings;
    boost::asio::thread_pool pool;

    mutable std::shared_mutex mapMutex;
    std::vector<std::string> order;
    std::unordered_map<std::string, ConnectionPtr> connections;

    Impl(std::shared_ptr<ITransportFactory> f, OrchestratorSettings s, std::size_t threads)
        : factory(std::move(f)), settings(std::move(s)), pool(threads) {}

    ConnectionPtr find(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        auto it = connections.find(name);
        return it == connections.end() ? nullptr : it->second;
    }

    std::vector<ConnectionPtr> all() const {
        std::shared_lock<std::shared_mutex> lock(mapMutex);
        std::vector<ConnectionPtr> out;
        out.reserve(order.size());
        for (const auto& n : order) {
            out.push_back(connections.at(n));
        }
        return out;
    }

    void installConfigs(std::vector<ServerConfig> configs, std::vector<ConnectionPtr>* retired) {
        std::unordered_map<std::string, ConnectionPtr> next;
        std::vector<std::string> nextOrder;
        std::unique_lock<std::shared_mutex> lock(mapMutex);
        for (auto& cfg : configs) {
            if (next.count(cfg.name) > 0) {
                LOG_WARN("Duplicate server name '{}' in configuration; keeping the first", cfg.name);
                continue;
            }
            ConnectionPtr conn;
            auto it = connections.find(cfg.name);
            if (it != connections.end()) {
                bool same = false;
                {
                    std::lock_guard<std::mutex> cl(it->second->mutex);
                    same = it->second->config == cfg;
                }
                if (same) {
                    conn = it->second;
                }
            }
            if (!conn) {
                conn = std::make_shared<Connection>(cfg);
            }
            nextOrder.push_back(cfg.name);
            next.emplace(cfg.name, std::move(conn));
        }
        if (retired != nullptr) {
            for (const auto& [name, conn] : connections) {
                auto it = next.find(name);
                if (it == next.end() || it->second != conn) {
                    retired->push_back(conn);
                }
            }
        }
        connections.swap(next);
        order.swap(nextOrder);
    }

    ////////////////////////////////////////// Helpers ///////////////////////////////////////////
    void closeSession(const std::shared_ptr<IProtocolSession>& session, const std::string& name) {
        if (!session) {
            return;
        }
        try {
            session->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Closing session with '{}' reported: {}", name, e.what());
        }
    }

    // Caller holds conn->mutex
    static void recordError(Connection& conn, const McpError& err, const std::shared_ptr<IProtocolSession>& session) {
        ServerErrorDetails d;
        d.serverName = conn.config.name;
        d.lastError = err.message;
        d.category = err.category;
        d.errorTimestamp = std::chrono::system_clock::now();
        d.fullCommand = conn.config.FullCommand();
        if (session) {
            d.exitCode = session->GetExitCode();
            d.stderrTail = session->GetStderrTail();
        }
        conn.lastError = std::move(d);
    }

    // Caller holds conn->mutex. The error a connection attempt reports when its state moved under it: the
    // recorded session failure when the peer died, otherwise a cancellation.
    static McpException attemptEnded(const Connection& conn, uint64_t gen) {
        if (conn.isCurrent(gen) && conn.state == ServerState::Failed && conn.lastError.has_value()) {
            return McpException(errors::makeError(conn.lastError->category, conn.lastError->lastError));
        }
        return McpException(ErrorCategory::ServerUnavailable, "connection attempt to '" + conn.name() + "' was cancelled");
    }

    std::pair<std::shared_ptr<IProtocolSession>, uint64_t> readySession(const ConnectionPtr& conn) const {
        std::lock_guard<std::mutex> lock(conn->mutex);
        if (conn->state != ServerState::Ready || !conn->session) {
            return { nullptr, 0 };
        }
        return { conn->session, conn->registry.CurrentGeneration() };
    }

    ////////////////////////////////////////// Connect ///////////////////////////////////////////
    void startConnect(const ConnectionPtr& conn, Completion done) {
        std::exception_ptr immediate;
        bool finishedNow = false;
        std::shared_ptr<IProtocolSession> stale;
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            switch (conn->state) {
                case ServerState::Ready:
                    finishedNow = true;
                    break;
                case ServerState::Connecting:
                case ServerState::Handshaking:
                    conn->connectWaiters.push_back(std::move(done));
                    return;
                case ServerState::Disconnecting:
                    finishedNow = true;
                    immediate = unavailable("server '" + conn->name() + "' is disconnecting");
                    break;
                case ServerState::Disconnected:
                case ServerState::Failed:
                    break;
            }
            if (!finishedNow && !conn->config.enabled) {
                finishedNow = true;
                immediate = unavailable("server '" + conn->name() + "' is disabled");
            }
            if (!finishedNow) {
                conn->state = ServerState::Connecting;
                stale = std::move(conn->session);
                gen = conn->registry.BeginGeneration();
                conn->lastError.reset();
                conn->connectedSince.reset();
                conn->connectionTime.reset();
                conn->serverInfo.reset();
                conn->consecutiveTimeouts = 0;
                conn->degraded = false;
                conn->connectWaiters.push_back(std::move(done));
            }
        }
        if (finishedNow) {
            done(immediate);
            return;
        }
        LOG_INFO("Connecting to server '{}'", conn->name());
        boost::asio::post(pool, [this, conn, gen, stale]() { runConnect(conn, gen, stale); });
    }

    void runConnect(const ConnectionPtr& conn, uint64_t gen, const std::shared_ptr<IProtocolSession>& stale) {
        closeSession(stale, conn->name());

        ServerConfig config;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            config = conn->config;
        }
        auto session = std::make_shared<ProtocolSession>(config.name);
        session->SetValidationMode(settings.validation);
        std::weak_ptr<Connection> weak = conn;
        session->SetErrorHandler([this, weak, gen](const McpError& err) {
            if (auto c = weak.lock()) onSessionFailure(c, gen, err);
        });
        session->SetHealthHandler([this, weak, gen](unsigned int count) {
            if (auto c = weak.lock()) onHealth(c, gen, count);
        });
        session->SetNotificationHandler(Methods::ToolListChanged, [this, weak, gen](const JSONRPCNotification&) {
            if (auto c = weak.lock()) onToolListChanged(c, gen);
        });
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->isCurrent(gen)) {
                conn->session = session;
            }
        }

        try {
            session->Connect(factory->CreateTransport(config)).get();
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                if (!conn->isCurrent(gen) || conn->state != ServerState::Connecting) {
                    throw attemptEnded(*conn, gen);
                }
                conn->state = ServerState::Handshaking;
            }
            const auto started = std::chrono::steady_clock::now();
            ServerInfo info = session->Initialize(clientIdentity(), settings.handshakeTimeout).get();
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                if (!conn->isCurrent(gen) || conn->state != ServerState::Handshaking) {
                    throw attemptEnded(*conn, gen);
                }
                conn->state = ServerState::Ready;
                conn->connectedSince = std::chrono::system_clock::now();
                conn->connectionTime = elapsed;
                conn->serverInfo = info;
            }
            LOG_INFO("Server '{}' ready: {} {} in {} ms", config.name, info.implementation.name,
                     info.implementation.version, elapsed.count());
        } catch (const McpException& e) {
            connectFailed(conn, gen, session, e.error());
            return;
        } catch (const std::exception& e) {
            connectFailed(conn, gen, session, errors::makeError(ErrorCategory::TransportIOFailure, e.what()));
            return;
        }

        try {
            discover(conn, gen, session);
        } catch (const std::exception& e) {
            LOG_WARN("Initial tool discovery on '{}' failed: {}", config.name, e.what());
        }

        std::vector<Completion> waiters;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->isCurrent(gen)) {
                waiters.swap(conn->connectWaiters);
            }
        }
        resolveAll(waiters, nullptr);
    }

    void connectFailed(const ConnectionPtr& conn, uint64_t gen, const std::shared_ptr<IProtocolSession>& session,
                       const McpError& err) {
        closeSession(session, conn->name());
        std::vector<Completion> waiters;
        bool current = false;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            current = conn->isCurrent(gen) && conn->state != ServerState::Disconnecting;
            if (current) {
                if (conn->session == session) {
                    conn->session.reset();
                }
                conn->registry.Clear();
                if (conn->state == ServerState::Failed && conn->lastError.has_value()) {
                    // The session failure handler got there first; its error is the real cause
                    if (!conn->lastError->exitCode.has_value()) {
                        conn->lastError->exitCode = session->GetExitCode();
                    }
                    conn->lastError->stderrTail = session->GetStderrTail();
                } else {
                    conn->state = ServerState::Failed;
                    recordError(*conn, err, session);
                }
                waiters.swap(conn->connectWaiters);
            }
        }
        if (!current) {
            LOG_INFO("Connection attempt to '{}' abandoned: {}", conn->name(), err.message);
            finishDisconnect(conn);
            return;
        }
        LOG_ERROR("Connecting to '{}' failed ({}): {}", conn->name(), errors::toString(err.category), err.message);
        resolveAll(waiters, std::make_exception_ptr(McpException(err)));
    }

    ////////////////////////////////////////// Disconnect ///////////////////////////////////////////
    void startDisconnect(const ConnectionPtr& conn, Completion done) {
        std::vector<Completion> cancelled;
        std::shared_ptr<IProtocolSession> toClose;
        bool finishedNow = false;
        bool postClose = false;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            switch (conn->state) {
                case ServerState::Disconnected:
                    finishedNow = true;
                    break;
                case ServerState::Disconnecting:
                    conn->disconnectWaiters.push_back(std::move(done));
                    return;
                case ServerState::Connecting:
                    // The attempt owns the session until its Connect() returns; it finishes the disconnect
                    conn->state = ServerState::Disconnecting;
                    conn->registry.BeginGeneration();
                    cancelled.swap(conn->connectWaiters);
                    conn->disconnectWaiters.push_back(std::move(done));
                    break;
                case ServerState::Handshaking:
                case ServerState::Ready:
                case ServerState::Failed:
                    conn->state = ServerState::Disconnecting;
                    conn->registry.BeginGeneration();
                    cancelled.swap(conn->connectWaiters);
                    toClose = std::move(conn->session);
                    conn->disconnectWaiters.push_back(std::move(done));
                    postClose = true;
                    break;
            }
        }
        if (finishedNow) {
            done(nullptr);
            return;
        }
        LOG_INFO("Disconnecting server '{}'", conn->name());
        resolveAll(cancelled, unavailable("connection attempt to '" + conn->name() + "' was cancelled by disconnect"));
        if (postClose) {
            boost::asio::post(pool, [this, conn, toClose]() {
                closeSession(toClose, conn->name());
                finishDisconnect(conn);
            });
        }
    }

    void finishDisconnect(const ConnectionPtr& conn) {
        std::vector<Completion> waiters;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->state != ServerState::Disconnecting) {
                return;
            }
            conn->state = ServerState::Disconnected;
            conn->session.reset();
            conn->connectedSince.reset();
            conn->serverInfo.reset();
            conn->consecutiveTimeouts = 0;
            conn->degraded = false;
            waiters.swap(conn->disconnectWaiters);
        }
        LOG_INFO("Server '{}' disconnected", conn->name());
        resolveAll(waiters, nullptr);
    }

    ////////////////////////////////////////// Discovery ///////////////////////////////////////////
    std::size_t discover(const ConnectionPtr& conn, uint64_t gen, const std::shared_ptr<IProtocolSession>& session) {
        std::vector<Tool> tools = session->ListTools(settings.discoveryTimeout).get();
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->state != ServerState::Ready || !conn->registry.Replace(gen, std::move(tools))) {
                throw McpException(ErrorCategory::ServerUnavailable,
                                   "server '" + conn->name() + "' changed state during discovery");
            }
            count = conn->registry.Size();
        }
        LOG_INFO("Server '{}' exposes {} tool(s)", conn->name(), count);
        return count;
    }

    void startDiscovery(const ConnectionPtr& conn, std::function<void(std::exception_ptr, std::size_t)> done) {
        auto [session, gen] = readySession(conn);
        if (!session) {
            done(unavailable("server '" + conn->name() + "' is not ready"), 0);
            return;
        }
        boost::asio::post(pool, [this, conn, session = session, gen = gen, done]() {
            std::size_t count = 0;
            try {
                count = discover(conn, gen, session);
            } catch (...) {
                done(std::current_exception(), 0);
                return;
            }
            done(nullptr, count);
        });
    }

    ////////////////////////////////////////// Session events ///////////////////////////////////////////
    void onSessionFailure(const ConnectionPtr& conn, uint64_t gen, const McpError& err) {
        std::shared_ptr<IProtocolSession> session;
        std::vector<Completion> waiters;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (!conn->isCurrent(gen)) {
                return;
            }
            if (conn->state != ServerState::Connecting && conn->state != ServerState::Handshaking &&
                conn->state != ServerState::Ready) {
                return;
            }
            conn->state = ServerState::Failed;
            session = std::move(conn->session);
            conn->registry.Clear();
            conn->connectedSince.reset();
            recordError(*conn, err, session);
            waiters.swap(conn->connectWaiters);
        }
        LOG_ERROR("Server '{}' failed ({}): {}", conn->name(), errors::toString(err.category), err.message);
        resolveAll(waiters, std::make_exception_ptr(McpException(err)));
        if (!session) {
            return;
        }
        // Reap the peer off the reader thread, then keep whatever exit status it reported
        boost::asio::post(pool, [this, conn, gen, session]() {
            closeSession(session, conn->name());
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->isCurrent(gen) && conn->state == ServerState::Failed && conn->lastError.has_value()) {
                if (!conn->lastError->exitCode.has_value()) {
                    conn->lastError->exitCode = session->GetExitCode();
                }
                conn->lastError->stderrTail = session->GetStderrTail();
            }
        });
    }

    void onHealth(const ConnectionPtr& conn, uint64_t gen, unsigned int count) {
        bool becameDegraded = false;
        bool recovered = false;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (!conn->isCurrent(gen)) {
                return;
            }
            conn->consecutiveTimeouts = count;
            if (count >= settings.degradedThreshold && !conn->degraded) {
                conn->degraded = true;
                becameDegraded = true;
            } else if (count == 0 && conn->degraded) {
                conn->degraded = false;
                recovered = true;
            }
        }
        if (becameDegraded) {
            LOG_WARN("Server '{}' is degraded: {} consecutive request timeouts", conn->name(), count);
        } else if (recovered) {
            LOG_INFO("Server '{}' is responding again", conn->name());
        }
    }

    void onToolListChanged(const ConnectionPtr& conn, uint64_t gen) {
        LOG_INFO("Server '{}' reported a tool list change", conn->name());
        boost::asio::post(pool, [this, conn, gen]() {
            auto [session, currentGen] = readySession(conn);
            if (!session || currentGen != gen) {
                return;
            }
            try {
                discover(conn, gen, session);
            } catch (const std::exception& e) {
                LOG_WARN("Re-discovery on '{}' failed: {}", conn->name(), e.what());
            }
        });
    }

    ////////////////////////////////////////// Views ///////////////////////////////////////////
    static ServerSnapshot snapshotOf(const Connection& conn) {
        ServerSnapshot s;
        s.name = conn.config.name;
        s.description = conn.config.description;
        s.enabled = conn.config.enabled;
        s.state = conn.state;
        if (conn.lastError.has_value()) {
            s.lastError = conn.lastError->lastError;
        }
        s.connectedSince = conn.connectedSince;
        s.connectionTime = conn.connectionTime;
        if (auto cat = conn.registry.Snapshot()) {
            s.toolCount = cat->tools.size();
            s.toolNames = cat->Names();
        }
        s.consecutiveTimeouts = conn.consecutiveTimeouts;
        s.degraded = conn.degraded;
        s.serverInfo = conn.serverInfo;
        s.generation = conn.registry.CurrentGeneration();
        return s;
    }
};

ServerSupervisor::ServerSupervisor(std::vector<ServerConfig> configs,
                                   std::shared_ptr<ITransportFactory> factory,
                                   OrchestratorSettings settings,
                                   std::size_t workerThreads) {
    FUNC_SCOPE();
    if (workerThreads == 0) {
        workerThreads = std::max<std::size_t>({8, 2 * static_cast<std::size_t>(std::thread::hardware_concurrency()),
                                               2 * configs.size()});
    }
    pImpl = std::make_unique<Impl>(std::move(factory), std::move(settings), workerThreads);
    pImpl->installConfigs(std::move(configs), nullptr);
    LOG_DEBUG("Supervisor created with {} server(s), {} worker thread(s)", pImpl->order.size(), workerThreads);
}

ServerSupervisor::~ServerSupervisor() {
    FUNC_SCOPE();
    Shutdown();
    pImpl->pool.join();
}

std::future<void> ServerSupervisor::Connect(const std::string& name) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    auto conn = pImpl->find(name);
    if (!conn) {
        promise->set_exception(unavailable("unknown server '" + name + "'"));
        return fut;
    }
    pImpl->startConnect(conn, [promise](std::exception_ptr ep) {
        if (ep) {
            promise->set_exception(ep);
        } else {
            promise->set_value();
        }
    });
    return fut;
}

std::future<void> ServerSupervisor::Disconnect(const std::string& name) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    auto conn = pImpl->find(name);
    if (!conn) {
        promise->set_exception(unavailable("unknown server '" + name + "'"));
        return fut;
    }
    pImpl->startDisconnect(conn, [promise](std::exception_ptr ep) {
        if (ep) {
            promise->set_exception(ep);
        } else {
            promise->set_value();
        }
    });
    return fut;
}

std::future<std::map<std::string, bool>> ServerSupervisor::RefreshAll() {
    FUNC_SCOPE();
    struct Aggregate {
        std::mutex mutex;
        std::map<std::string, bool> results;
        std::size_t remaining{0};
        std::promise<std::map<std::string, bool>> promise;
    };
    auto agg = std::make_shared<Aggregate>();
    auto fut = agg->promise.get_future();

    std::vector<ConnectionPtr> targets;
    for (const auto& conn : pImpl->all()) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        if (conn->config.enabled) {
            targets.push_back(conn);
        }
    }
    if (targets.empty()) {
        agg->promise.set_value({});
        return fut;
    }
    agg->remaining = targets.size();
    LOG_INFO("Refreshing {} enabled server(s)", targets.size());

    auto finish = [agg](const std::string& name, const std::exception_ptr& ep) {
        if (ep) {
            LOG_WARN("Refresh of '{}' failed: {}", name, describe(ep));
        }
        std::lock_guard<std::mutex> lock(agg->mutex);
        agg->results[name] = !ep;
        if (--agg->remaining == 0) {
            agg->promise.set_value(std::move(agg->results));
        }
    };
    for (const auto& conn : targets) {
        const std::string name = conn->name();
        bool ready = false;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            ready = conn->state == ServerState::Ready;
        }
        if (ready) {
            pImpl->startDiscovery(conn, [finish, name](std::exception_ptr ep, std::size_t) { finish(name, ep); });
        } else {
            pImpl->startConnect(conn, [finish, name](std::exception_ptr ep) { finish(name, ep); });
        }
    }
    return fut;
}

std::future<std::size_t> ServerSupervisor::RefreshTools(const std::string& name) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<std::size_t>>();
    auto fut = promise->get_future();
    auto conn = pImpl->find(name);
    if (!conn) {
        promise->set_exception(unavailable("unknown server '" + name + "'"));
        return fut;
    }
    pImpl->startDiscovery(conn, [promise](std::exception_ptr ep, std::size_t count) {
        if (ep) {
            promise->set_exception(ep);
        } else {
            promise->set_value(count);
        }
    });
    return fut;
}

std::future<void> ServerSupervisor::ReloadConfigs(std::vector<ServerConfig> configs) {
    FUNC_SCOPE();
    std::vector<ConnectionPtr> retired;
    const std::size_t count = configs.size();
    pImpl->installConfigs(std::move(configs), &retired);
    LOG_INFO("Loaded {} server config(s); {} connection(s) retired", count, retired.size());

    struct Aggregate {
        std::mutex mutex;
        std::size_t remaining{0};
        std::promise<void> promise;
    };
    auto agg = std::make_shared<Aggregate>();
    auto fut = agg->promise.get_future();
    if (retired.empty()) {
        agg->promise.set_value();
        return fut;
    }
    agg->remaining = retired.size();
    for (const auto& conn : retired) {
        pImpl->startDisconnect(conn, [agg](std::exception_ptr) {
            std::lock_guard<std::mutex> lock(agg->mutex);
            if (--agg->remaining == 0) {
                agg->promise.set_value();
            }
        });
    }
    return fut;
}

std::future<void> ServerSupervisor::SetServerEnabled(const std::string& name, bool enabled) {
    FUNC_SCOPE();
    auto conn = pImpl->find(name);
    if (!conn) {
        std::promise<void> promise;
        promise.set_exception(unavailable("unknown server '" + name + "'"));
        return promise.get_future();
    }
    {
        std::lock_guard<std::mutex> lock(conn->mutex);
        conn->config.enabled = enabled;
    }
    LOG_INFO("Server '{}' {}", name, enabled ? "enabled" : "disabled");
    if (!enabled) {
        return Disconnect(name);
    }
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

void ServerSupervisor::Shutdown() {
    FUNC_SCOPE();
    std::vector<std::future<void>> pending;
    for (const auto& conn : pImpl->all()) {
        auto promise = std::make_shared<std::promise<void>>();
        pending.push_back(promise->get_future());
        pImpl->startDisconnect(conn, [promise](std::exception_ptr) { promise->set_value(); });
    }
    for (auto& f : pending) {
        f.get();
    }
}

std::vector<ServerConfig> ServerSupervisor::GetConfigs() const {
    std::vector<ServerConfig> out;
    for (const auto& conn : pImpl->all()) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        out.push_back(conn->config);
    }
    return out;
}

std::vector<ServerSnapshot> ServerSupervisor::GetSnapshots() const {
    std::vector<ServerSnapshot> out;
    for (const auto& conn : pImpl->all()) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        out.push_back(Impl::snapshotOf(*conn));
    }
    return out;
}

std::optional<ServerSnapshot> ServerSupervisor::GetServerSnapshot(const std::string& name) const {
    auto conn = pImpl->find(name);
    if (!conn) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(conn->mutex);
    return Impl::snapshotOf(*conn);
}

std::optional<ServerErrorDetails> ServerSupervisor::GetServerErrorDetails(const std::string& name) const {
    auto conn = pImpl->find(name);
    if (!conn) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(conn->mutex);
    return conn->lastError;
}

StatusSummary ServerSupervisor::GetStatusSummary() const {
    StatusSummary s;
    for (const auto& conn : pImpl->all()) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        ++s.total;
        switch (conn->state) {
            case ServerState::Ready: ++s.ready; break;
            case ServerState::Disconnected: ++s.disconnected; break;
            case ServerState::Failed: ++s.failed; break;
            case ServerState::Connecting:
            case ServerState::Handshaking: ++s.connecting; break;
            case ServerState::Disconnecting: ++s.disconnecting; break;
        }
    }
    return s;
}

std::optional<ServerState> ServerSupervisor::GetState(const std::string& name) const {
    auto conn = pImpl->find(name);
    if (!conn) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(conn->mutex);
    return conn->state;
}

std::vector<Tool> ServerSupervisor::ListAvailableTools() const {
    std::vector<Tool> out;
    for (const auto& ready : GetReadyServers()) {
        out.insert(out.end(), ready.catalog->tools.begin(), ready.catalog->tools.end());
    }
    return out;
}

std::vector<ReadyServer> ServerSupervisor::GetReadyServers() const {
    std::vector<ReadyServer> out;
    for (const auto& conn : pImpl->all()) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        if (conn->state != ServerState::Ready) {
            continue;
        }
        auto catalog = conn->registry.Snapshot();
        if (!catalog) {
            catalog = std::make_shared<const ToolCatalog>();
        }
        out.push_back(ReadyServer{ conn->name(), std::move(catalog) });
    }
    return out;
}

std::shared_ptr<IProtocolSession> ServerSupervisor::GetReadySession(const std::string& name) const {
    auto conn = pImpl->find(name);
    if (!conn) {
        return nullptr;
    }
    return pImpl->readySession(conn).first;
}

std::chrono::milliseconds ServerSupervisor::GetCallTimeout(const std::string& name) const {
    auto conn = pImpl->find(name);
    if (conn) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        if (conn->config.timeoutMs.has_value()) {
            return std::chrono::milliseconds(static_cast<int64_t>(conn->config.timeoutMs.value()));
        }
    }
    return pImpl->settings.callTimeout;
}

const OrchestratorSettings& ServerSupervisor::GetSettings() const {
    return pImpl->settings;
}

} // namespace toolbridge
