//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeToolServer.h
// Purpose: Scripted in-process tool server driving the peer end of an InMemoryTransport
//==========================================================================================================
#pragma once

#include "toolbridge/Config.h"
#include "toolbridge/InMemoryTransport.hpp"
#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/Protocol.h"
#include "toolbridge/errors/Errors.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {
namespace testing {

inline JSONValue TextResult(const std::string& text, bool isError = false) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(content);
    if (isError) {
        result["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{result};
}

inline JSONValue ObjectArgs(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& m : members) {
        obj[m.first] = std::make_shared<JSONValue>(m.second);
    }
    return JSONValue{obj};
}

inline Tool MakeTool(const std::string& name, const std::string& description = "test tool") {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    return Tool(name, description, JSONValue{schema});
}

//==========================================================================================================
// FakeToolServer
// Purpose: Answers initialize, ping, tools/list and tools/call from a script. Knobs simulate slow, silent,
//          duplicate and misaddressed replies. Every request method seen is recorded.
//==========================================================================================================
class FakeToolServer {
public:
    using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

    struct ScriptedTool {
        Tool tool;
        ToolHandler handler;
        std::chrono::milliseconds delay{0};
        std::optional<errors::McpError> rpcError;  // answer tools/call with this JSON-RPC error
    };

    FakeToolServer() = default;
    explicit FakeToolServer(std::unique_ptr<InMemoryTransport> peer) { Attach(std::move(peer)); }

    ~FakeToolServer() { Stop(); }

    FakeToolServer(const FakeToolServer&) = delete;
    FakeToolServer& operator=(const FakeToolServer&) = delete;

    // Binds the peer end and starts answering. Tools may be added before or after.
    void Attach(std::unique_ptr<InMemoryTransport> peer) {
        transport = std::move(peer);
        transport->Start().get();
        reader = std::thread([this]() { readLoop(); });
    }

    void Stop() {
        if (transport) {
            transport->Close().get();
        }
        if (reader.joinable()) {
            reader.join();
        }
        std::vector<std::thread> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.swap(workers);
        }
        for (auto& t : pending) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    void AddTool(Tool tool, ToolHandler handler, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::lock_guard<std::mutex> lock(mutex);
        tools.push_back(ScriptedTool{std::move(tool), std::move(handler), delay, std::nullopt});
    }

    void AddFailingTool(Tool tool, errors::McpError err) {
        std::lock_guard<std::mutex> lock(mutex);
        tools.push_back(ScriptedTool{std::move(tool), nullptr, std::chrono::milliseconds(0), std::move(err)});
    }

    void RemoveTool(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        tools.erase(std::remove_if(tools.begin(), tools.end(),
                                   [&](const ScriptedTool& t) { return t.tool.name == name; }),
                    tools.end());
    }

    ////////////////////////////////////////// Behaviour knobs //////////////////////////////////////////
    void SetPageSize(std::size_t n) { pageSize = n; }
    void SetInitializeDelay(std::chrono::milliseconds d) { initDelay = d; }
    void SetRejectInitialize(bool v) { rejectInit = v; }
    void SetSilentInitialize(bool v) { silentInit = v; }
    void SetMalformedInitializeResult(bool v) { malformedInit = v; }
    void SetProtocolVersion(const std::string& v) {
        std::lock_guard<std::mutex> lock(mutex);
        protocolVersion = v;
    }
    void SetSilentCalls(bool v) { silentCalls = v; }
    void SetSilentListTools(bool v) { silentList = v; }
    void SetDuplicateResponses(bool v) { duplicateResponses = v; }
    // Answer the next request with this id instead of the real one
    void SetNextResponseIdOverride(int64_t id) { idOverride = id; }
    // Fail the tools/call of the first `n` calls with no reply, then answer normally
    void SetSilentFirstCalls(int n) { silentFirstCalls = n; }

    ////////////////////////////////////////// Peer-initiated traffic //////////////////////////////////////////
    void SendRaw(const std::string& payload) { transport->Send(payload); }

    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        transport->Send(JSONRPCNotification(method, std::move(params)).Serialize());
    }

    void SendRequest(const std::string& id, const std::string& method) {
        transport->Send(JSONRPCRequest(id, method).Serialize());
    }

    void CloseAbruptly(const std::string& reason = "peer crashed") { transport->CloseWithError(reason); }
    void CloseCleanly() { transport->Close().get(); }

    ////////////////////////////////////////// Observations //////////////////////////////////////////
    std::vector<std::string> ReceivedMethods() const {
        std::lock_guard<std::mutex> lock(mutex);
        return methods;
    }

    int CountOf(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(std::count(methods.begin(), methods.end(), method));
    }

    int CallsOf(const std::string& tool) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = calls.find(tool);
        return it == calls.end() ? 0 : it->second;
    }

    std::vector<std::string> Replies() const {
        std::lock_guard<std::mutex> lock(mutex);
        return replies;
    }

    // Waits until `method` has been received at least `count` times.
    bool WaitFor(const std::string& method, int count = 1,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() {
            return std::count(methods.begin(), methods.end(), method) >= count;
        });
    }

    bool WaitForReplies(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return replies.size() >= count; });
    }

private:
    void readLoop() {
        for (;;) {
            std::string line;
            try {
                line = transport->Receive();
            } catch (const std::exception&) {
                return;
            }
            handleLine(line);
        }
    }

    void handleLine(const std::string& line) {
        JSONValue doc;
        try {
            doc = ParseJSON(line);
        } catch (const std::exception&) {
            return;
        }
        if (FindMember(doc, "method") == nullptr) {
            // A reply to something we asked
            std::lock_guard<std::mutex> lock(mutex);
            replies.push_back(line);
            cv.notify_all();
            return;
        }
        JSONRPCRequest req;
        if (!req.FromJSONValue(doc)) {
            JSONRPCNotification note;
            if (note.FromJSONValue(doc)) {
                record(note.method);
            }
            return;
        }
        record(req.method);

        if (req.method == Methods::Initialize) {
            handleInitialize(req);
        } else if (req.method == Methods::Ping) {
            respond(req.id, JSONValue{JSONValue::Object{}});
        } else if (req.method == Methods::ListTools) {
            handleList(req);
        } else if (req.method == Methods::CallTool) {
            handleCall(req);
        } else {
            respondError(req.id, JSONRPCErrorCodes::MethodNotFound, "method not found: " + req.method);
        }
    }

    void record(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        methods.push_back(method);
        cv.notify_all();
    }

    void handleInitialize(const JSONRPCRequest& req) {
        if (silentInit) {
            return;
        }
        if (initDelay.load().count() > 0) {
            std::this_thread::sleep_for(initDelay.load());
        }
        if (rejectInit) {
            respondError(req.id, JSONRPCErrorCodes::InvalidRequest, "unsupported protocol version");
            return;
        }
        if (malformedInit) {
            respond(req.id, ObjectArgs({{"unexpected", JSONValue(true)}}));
            return;
        }
        std::string version;
        {
            std::lock_guard<std::mutex> lock(mutex);
            version = protocolVersion;
        }
        JSONValue::Object toolsCap;
        toolsCap["listChanged"] = std::make_shared<JSONValue>(true);
        JSONValue::Object caps;
        caps["tools"] = std::make_shared<JSONValue>(toolsCap);
        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(version);
        result["serverInfo"] = std::make_shared<JSONValue>(
            ObjectArgs({{"name", JSONValue("fake-tool-server")}, {"version", JSONValue("1.2.3")}}));
        result["capabilities"] = std::make_shared<JSONValue>(caps);
        respond(req.id, JSONValue{result});
    }

    void handleList(const JSONRPCRequest& req) {
        if (silentList) {
            return;
        }
        std::vector<Tool> current;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& t : tools) {
                current.push_back(t.tool);
            }
        }
        std::size_t start = 0;
        if (req.params) {
            if (auto cursor = GetStringMember(*req.params, "cursor")) {
                start = static_cast<std::size_t>(std::stoul(*cursor));
            }
        }
        const std::size_t size = pageSize.load();
        const std::size_t end = size == 0 ? current.size() : std::min(current.size(), start + size);
        JSONValue::Array arr;
        for (std::size_t i = start; i < end; ++i) {
            arr.push_back(std::make_shared<JSONValue>(ToolToJSON(current[i])));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(arr);
        if (end < current.size()) {
            result["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
        }
        respond(req.id, JSONValue{result});
    }

    void handleCall(const JSONRPCRequest& req) {
        const JSONValue params = req.params.value_or(JSONValue{JSONValue::Object{}});
        const std::string name = GetStringMember(params, "name").value_or("");
        JSONValue args{JSONValue::Object{}};
        if (const JSONValue* a = FindMember(params, "arguments")) {
            args = *a;
        }
        std::optional<ScriptedTool> scripted;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++calls[name];
            for (const auto& t : tools) {
                if (t.tool.name == name) {
                    scripted = t;
                    break;
                }
            }
        }
        if (silentCalls) {
            return;
        }
        if (silentFirstCalls.load() > 0) {
            --silentFirstCalls;
            return;
        }
        if (!scripted) {
            respondError(req.id, JSONRPCErrorCodes::ToolNotFound, "no such tool: " + name);
            return;
        }
        if (scripted->rpcError) {
            const auto& e = *scripted->rpcError;
            respondError(req.id, e.code, e.message, e.data);
            return;
        }
        const JSONRPCId id = req.id;
        auto run = [this, id, args, tool = *scripted]() {
            if (tool.delay.count() > 0) {
                std::this_thread::sleep_for(tool.delay);
            }
            respond(id, tool.handler ? tool.handler(args) : TextResult(""));
        };
        if (scripted->delay.count() > 0) {
            std::lock_guard<std::mutex> lock(mutex);
            workers.emplace_back(std::move(run));
        } else {
            run();
        }
    }

    void respond(const JSONRPCId& id, JSONValue result) {
        JSONRPCResponse resp(takeId(id), std::move(result));
        send(resp.Serialize());
    }

    void respondError(const JSONRPCId& id, int code, const std::string& message,
                      const std::optional<JSONValue>& data = std::nullopt) {
        send(CreateErrorResponse(takeId(id), code, message, data)->Serialize());
    }

    JSONRPCId takeId(const JSONRPCId& id) {
        const int64_t over = idOverride.exchange(0);
        if (over != 0) {
            return JSONRPCId{over};
        }
        return id;
    }

    void send(const std::string& payload) {
        try {
            transport->Send(payload);
            if (duplicateResponses) {
                transport->Send(payload);
            }
        } catch (const std::exception&) {
            // Client went away; nothing left to answer
        }
    }

    std::unique_ptr<InMemoryTransport> transport;
    std::thread reader;

    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    std::vector<ScriptedTool> tools;
    std::vector<std::string> methods;
    std::vector<std::string> replies;
    std::map<std::string, int> calls;
    std::vector<std::thread> workers;
    std::string protocolVersion{PROTOCOL_VERSION};

    std::atomic<std::size_t> pageSize{0};
    std::atomic<std::chrono::milliseconds> initDelay{std::chrono::milliseconds(0)};
    std::atomic<bool> rejectInit{false};
    std::atomic<bool> silentInit{false};
    std::atomic<bool> malformedInit{false};
    std::atomic<bool> silentCalls{false};
    std::atomic<bool> silentList{false};
    std::atomic<bool> duplicateResponses{false};
    std::atomic<int64_t> idOverride{0};
    std::atomic<int> silentFirstCalls{0};
};

//==========================================================================================================
// FakeServerFarm
// Purpose: Transport factory for supervisor tests. Each connection attempt gets a fresh FakeToolServer,
//          set up by the server's registered script. Names in the launch-failure set fail to start.
//==========================================================================================================
class FakeServerFarm {
public:
    using Script = std::function<void(FakeToolServer&)>;

    FakeServerFarm()
        : factory(std::make_shared<InMemoryTransportFactory>(
              [this](const ServerConfig& cfg, std::unique_ptr<InMemoryTransport> peer) {
                  return onPeer(cfg, std::move(peer));
              })) {}

    ~FakeServerFarm() { StopAll(); }

    std::shared_ptr<ITransportFactory> Factory() const { return factory; }

    void SetScript(const std::string& server, Script script) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts[server] = std::move(script);
    }

    void SetLaunchFailure(const std::string& server, bool fail) {
        std::lock_guard<std::mutex> lock(mutex);
        if (fail) {
            failing.insert(server);
        } else {
            failing.erase(server);
        }
    }

    // Latest server instance spawned for `name`, or nullptr
    std::shared_ptr<FakeToolServer> Latest(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = latest.find(name);
        return it == latest.end() ? nullptr : it->second;
    }

    int Launches(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = launches.find(name);
        return it == launches.end() ? 0 : it->second;
    }

    void StopAll() {
        std::vector<std::shared_ptr<FakeToolServer>> all;
        {
            std::lock_guard<std::mutex> lock(mutex);
            all.swap(spawned);
        }
        for (auto& s : all) {
            s->Stop();
        }
    }

private:
    bool onPeer(const ServerConfig& cfg, std::unique_ptr<InMemoryTransport> peer) {
        Script script;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++launches[cfg.name];
            if (failing.count(cfg.name) > 0) {
                return false;
            }
            auto it = scripts.find(cfg.name);
            if (it != scripts.end()) {
                script = it->second;
            }
        }
        auto server = std::make_shared<FakeToolServer>();
        if (script) {
            script(*server);
        }
        server->Attach(std::move(peer));
        std::lock_guard<std::mutex> lock(mutex);
        latest[cfg.name] = server;
        spawned.push_back(server);
        return true;
    }

    mutable std::mutex mutex;
    std::map<std::string, Script> scripts;
    std::set<std::string> failing;
    std::map<std::string, std::shared_ptr<FakeToolServer>> latest;
    std::map<std::string, int> launches;
    std::vector<std::shared_ptr<FakeToolServer>> spawned;
    std::shared_ptr<InMemoryTransportFactory> factory;
};

inline ServerConfig MakeConfig(const std::string& name) {
    ServerConfig cfg;
    cfg.name = name;
    cfg.command = "fake-" + name;
    cfg.description = "fake server " + name;
    return cfg;
}

} // namespace testing
} // namespace toolbridge
