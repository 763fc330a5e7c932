//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationLoop.h
// Purpose: Turn-taking loop between a model provider and the tool dispatcher
//==========================================================================================================

#pragma once

#include "ToolDispatcher.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// A tool call requested by the model. argumentsJson is the raw argument text it produced.
struct ToolCallRequest {
    std::string id;
    std::string name;
    std::string argumentsJson;
};

struct ChatMessage {
    enum class Role { System, User, Assistant, Tool };

    Role role{Role::User};
    std::string content;
    std::vector<ToolCallRequest> toolCalls;  // Assistant messages only
    std::string toolCallId;                  // Tool messages only
    std::string name;                        // Tool messages: the tool that answered
};

const char* toString(ChatMessage::Role role);

// What the model wants next: a final answer (no tool calls) or tool calls to run first.
struct ModelAction {
    std::string content;
    std::vector<ToolCallRequest> toolCalls;

    bool IsFinal() const { return toolCalls.empty(); }
};

//==========================================================================================================
// IModelProvider
// Purpose: Boundary to the text-generation service. Implementations may block; failures are reported by
//          throwing.
//==========================================================================================================
class IModelProvider {
public:
    virtual ~IModelProvider() = default;

    virtual ModelAction NextAction(const std::vector<ChatMessage>& conversation,
                                   const std::vector<FunctionDefinition>& tools) = 0;
};

struct ConversationTurn {
    std::string userMessage;
    std::string assistantResponse;
    std::vector<ToolOutcome> toolOutcomes;
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::milliseconds totalTime{0};
    unsigned int iterations{0};
    bool turnLimitReached{false};
    bool failed{false};
};

//==========================================================================================================
// InvocationLoop
// Purpose: Runs one user message to completion: asks the provider for the next action, executes the tool
//          calls it requests in order, feeds each result back as a tool message, and stops at a final
//          answer or after maxTurns provider round trips.
//==========================================================================================================
class InvocationLoop {
public:
    InvocationLoop(std::shared_ptr<IModelProvider> provider, ToolDispatcher& dispatcher,
                   unsigned int maxTurns = 5, std::optional<std::string> systemPrompt = std::nullopt);

    ConversationTurn HandleUserMessage(const std::string& text);

    std::vector<ChatMessage> Conversation() const;
    std::vector<ConversationTurn> Turns() const;

    // Drops the history; the system message is kept.
    void Reset();

    static std::string DefaultSystemPrompt();

private:
    std::shared_ptr<IModelProvider> provider;
    ToolDispatcher& dispatcher;
    unsigned int maxTurns;
    ChatMessage systemMessage;

    mutable std::mutex mutex;
    std::vector<ChatMessage> conversation;
    std::vector<ConversationTurn> turns;
};

} // namespace toolbridge
