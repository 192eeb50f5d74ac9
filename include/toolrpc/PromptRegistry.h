//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.h
// Purpose: Prompt templates exposed through prompts/list and prompts/get
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required{false};
};

// One message of a rendered prompt. content items are {type:"text", text} or
// {type:"image"|"audio", data, mimeType} or {type:"resource", uri}.
struct PromptMessage {
    std::string role{"user"};
    std::vector<JSONValue> content;

    static PromptMessage Text(const std::string& role, const std::string& text);
};

// Receives the caller's argument object ({} when omitted).
using PromptProvider = std::function<std::vector<PromptMessage>(const JSONValue& args)>;

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
    std::optional<std::string> icon;
    PromptProvider provider;
};

class PromptRegistry {
public:
    PromptRegistry() = default;
    PromptRegistry(const PromptRegistry&) = delete;
    PromptRegistry& operator=(const PromptRegistry&) = delete;

    // Throws errors::ConfigurationError for a blank name, a missing provider or a duplicate name.
    void Register(Prompt prompt);

    std::shared_ptr<const Prompt> Find(const std::string& name) const;
    std::size_t Size() const;
    bool Empty() const { return Size() == 0; }

    JSONValue ListJSON() const;

    //======================================================================================================
    // Get
    // Purpose: Renders a prompt into {description?, messages:[{role, content:[...]}]}.
    // Throws:
    //   errors::PromptNotFoundError for an unknown name.
    //   errors::ValidationError ("Missing required argument: X") when a required argument is absent.
    //======================================================================================================
    JSONValue Get(const std::string& name, const JSONValue& args) const;

private:
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<const Prompt>> prompts;
};

} // namespace toolrpc
