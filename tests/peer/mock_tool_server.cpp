//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: mock_tool_server.cpp
// Purpose: Stdio tool server used by the process transport and supervisor tests (newline framing)
//
// Tools: echo {text}, sleep {ms}, fail {}, crash {code}
// Options:
//   --page-size=N      split tools/list into pages of N entries
//   --reject-init      answer initialize with a JSON-RPC error
//   --exit-at-start=N  print to stderr and exit with code N before reading anything
//   --garbage          answer the first request with a non-JSON line
//==========================================================================================================

#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/Protocol.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace toolbridge;

namespace {

std::optional<std::string> argValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind(key + "=", 0) == 0) {
            return a.substr(key.size() + 1);
        }
        if (a == key) {
            return std::string();
        }
    }
    return std::nullopt;
}

JSONValue textContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(content);
    return JSONValue{result};
}

JSONValue objectSchema(const std::string& prop, const std::string& type) {
    JSONValue::Object propSchema;
    propSchema["type"] = std::make_shared<JSONValue>(type);
    JSONValue::Object props;
    if (!prop.empty()) {
        props[prop] = std::make_shared<JSONValue>(propSchema);
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(props);
    return JSONValue{schema};
}

std::vector<Tool> catalog() {
    std::vector<Tool> tools;
    tools.emplace_back("echo", "Echo the given text", objectSchema("text", "string"));
    ToolAnnotations readOnly;
    readOnly.readOnlyHint = true;
    tools.back().annotations = readOnly;
    tools.emplace_back("sleep", "Sleep for ms milliseconds", objectSchema("ms", "integer"));
    tools.emplace_back("fail", "Always reports a tool error", objectSchema("", "object"));
    tools.emplace_back("crash", "Exit the server process", objectSchema("code", "integer"));
    return tools;
}

void reply(const std::string& text) {
    std::cout << text << "\n";
    std::cout.flush();
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries the protocol; library diagnostics must not land there
    ::setenv("TOOLBRIDGE_LOG_STDERR", "1", 1);
    if (auto code = argValue(argc, argv, "--exit-at-start")) {
        std::cerr << "mock_tool_server: refusing to start" << std::endl;
        return std::atoi(code->c_str());
    }
    const std::size_t pageSize = static_cast<std::size_t>(std::atoi(argValue(argc, argv, "--page-size").value_or("0").c_str()));
    const bool rejectInit = argValue(argc, argv, "--reject-init").has_value();
    bool garbage = argValue(argc, argv, "--garbage").has_value();
    const auto tools = catalog();

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        JSONRPCRequest req;
        if (!req.Deserialize(line)) {
            continue;  // notifications and anything else without an id
        }
        if (garbage) {
            garbage = false;
            reply("this is not json");
            continue;
        }

        if (req.method == Methods::Initialize) {
            if (rejectInit) {
                reply(CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidRequest, "unsupported client")->Serialize());
                continue;
            }
            JSONValue::Object info;
            info["name"] = std::make_shared<JSONValue>("mock-tool-server");
            info["version"] = std::make_shared<JSONValue>("0.1.0");
            JSONValue::Object toolsCap;
            toolsCap["listChanged"] = std::make_shared<JSONValue>(true);
            JSONValue::Object caps;
            caps["tools"] = std::make_shared<JSONValue>(toolsCap);
            JSONValue::Object result;
            result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
            result["serverInfo"] = std::make_shared<JSONValue>(info);
            result["capabilities"] = std::make_shared<JSONValue>(caps);
            reply(JSONRPCResponse(req.id, JSONValue{result}).Serialize());
        } else if (req.method == Methods::Ping) {
            reply(JSONRPCResponse(req.id, JSONValue{JSONValue::Object{}}).Serialize());
        } else if (req.method == Methods::ListTools) {
            std::size_t start = 0;
            if (req.params) {
                if (auto cursor = GetStringMember(*req.params, "cursor")) {
                    start = static_cast<std::size_t>(std::atoi(cursor->c_str()));
                }
            }
            const std::size_t end = pageSize == 0 ? tools.size() : std::min(tools.size(), start + pageSize);
            JSONValue::Array arr;
            for (std::size_t i = start; i < end; ++i) {
                arr.push_back(std::make_shared<JSONValue>(ToolToJSON(tools[i])));
            }
            JSONValue::Object result;
            result["tools"] = std::make_shared<JSONValue>(arr);
            if (end < tools.size()) {
                result["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
            }
            reply(JSONRPCResponse(req.id, JSONValue{result}).Serialize());
        } else if (req.method == Methods::CallTool) {
            const JSONValue params = req.params.value_or(JSONValue{JSONValue::Object{}});
            const std::string name = GetStringMember(params, "name").value_or("");
            const JSONValue* args = FindMember(params, "arguments");
            const JSONValue noArgs{JSONValue::Object{}};
            const JSONValue& a = args != nullptr ? *args : noArgs;
            if (name == "echo") {
                reply(JSONRPCResponse(req.id, textContent(GetStringMember(a, "text").value_or(""))).Serialize());
            } else if (name == "sleep") {
                std::this_thread::sleep_for(std::chrono::milliseconds(GetIntMember(a, "ms").value_or(0)));
                reply(JSONRPCResponse(req.id, textContent("slept")).Serialize());
            } else if (name == "fail") {
                JSONValue result = textContent("tool failed on purpose");
                std::get<JSONValue::Object>(result.value)["isError"] = std::make_shared<JSONValue>(true);
                reply(JSONRPCResponse(req.id, result).Serialize());
            } else if (name == "crash") {
                std::cerr << "mock_tool_server: crashing as requested" << std::endl;
                std::exit(static_cast<int>(GetIntMember(a, "code").value_or(7)));
            } else {
                reply(CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "no such tool: " + name)->Serialize());
            }
        } else {
            reply(CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "method not found: " + req.method)->Serialize());
        }
    }
    return 0;
}
