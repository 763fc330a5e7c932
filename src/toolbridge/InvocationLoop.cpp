//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InvocationLoop.cpp
// Purpose: Model/tool turn-taking loop
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "toolbridge/InvocationLoop.h"

namespace toolbridge {

const char* toString(ChatMessage::Role role) {
    switch (role) {
        case ChatMessage::Role::System: return "system";
        case ChatMessage::Role::User: return "user";
        case ChatMessage::Role::Assistant: return "assistant";
        case ChatMessage::Role::Tool: return "tool";
    }
    return "user";
}

std::string InvocationLoop::DefaultSystemPrompt() {
    return "You are a helpful assistant with access to tools provided by connected tool servers. "
           "Each tool description starts with its server name in brackets, and tool names are qualified "
           "as <server>.<tool>. Use tools when they help, run several in sequence when needed, and explain "
           "any tool error you receive instead of ignoring it.";
}

InvocationLoop::InvocationLoop(std::shared_ptr<IModelProvider> provider, ToolDispatcher& dispatcher,
                               unsigned int maxTurns, std::optional<std::string> systemPrompt)
    : provider(std::move(provider)), dispatcher(dispatcher), maxTurns(std::max(1u, maxTurns)) {
    systemMessage.role = ChatMessage::Role::System;
    systemMessage.content = systemPrompt.value_or(DefaultSystemPrompt());
    conversation.push_back(systemMessage);
}

ConversationTurn InvocationLoop::HandleUserMessage(const std::string& text) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex);
    const auto started = std::chrono::steady_clock::now();
    LOG_INFO("Handling user message ({} chars)", text.size());

    ConversationTurn turn;
    turn.userMessage = text;
    turn.timestamp = std::chrono::system_clock::now();

    ChatMessage user;
    user.role = ChatMessage::Role::User;
    user.content = text;
    conversation.push_back(std::move(user));

    try {
        bool finished = false;
        while (turn.iterations < maxTurns) {
            ++turn.iterations;
            const auto tools = dispatcher.GetFunctionDefinitions();
            LOG_DEBUG("Asking provider for next action (iteration {}, {} tool(s))", turn.iterations, tools.size());
            ModelAction action = provider->NextAction(conversation, tools);

            ChatMessage assistant;
            assistant.role = ChatMessage::Role::Assistant;
            assistant.content = action.content;
            assistant.toolCalls = action.toolCalls;
            conversation.push_back(std::move(assistant));
            turn.assistantResponse = action.content;

            if (action.IsFinal()) {
                finished = true;
                break;
            }
            for (const auto& call : action.toolCalls) {
                ToolOutcome outcome = dispatcher.InvokeFunctionCall(call.name, call.argumentsJson);
                ChatMessage toolMsg;
                toolMsg.role = ChatMessage::Role::Tool;
                toolMsg.content = outcome.ToModelText();
                toolMsg.toolCallId = call.id;
                toolMsg.name = call.name;
                conversation.push_back(std::move(toolMsg));
                turn.toolOutcomes.push_back(std::move(outcome));
            }
        }
        if (!finished) {
            turn.turnLimitReached = true;
            LOG_WARN("Stopped after {} provider round trips with tool calls still pending", maxTurns);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling user message: {}", e.what());
        turn.failed = true;
        turn.assistantResponse = std::string("I encountered an error: ") + e.what();
    }

    turn.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    turns.push_back(turn);
    return turn;
}

std::vector<ChatMessage> InvocationLoop::Conversation() const {
    std::lock_guard<std::mutex> lock(mutex);
    return conversation;
}

std::vector<ConversationTurn> InvocationLoop::Turns() const {
    std::lock_guard<std::mutex> lock(mutex);
    return turns;
}

void InvocationLoop::Reset() {
    std::lock_guard<std::mutex> lock(mutex);
    conversation.clear();
    conversation.push_back(systemMessage);
    turns.clear();
}

} // namespace toolbridge
