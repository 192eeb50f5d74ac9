//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CatalogLoader.cpp
// Purpose: External tool catalog parsing and registration
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "toolrpc/CatalogLoader.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

namespace {

std::string entryPrefix(std::size_t index) {
    return "tools[" + std::to_string(index) + "]";
}

} // namespace

std::vector<CatalogEntry> ParseCatalog(const std::string& json) {
    JSONValue root;
    try {
        root = ParseJSON(json);
    } catch (const JSONParseError& e) {
        throw errors::ConfigurationError(std::string("Invalid catalog JSON: ") + e.what());
    }
    const JSONValue* tools = root.find("tools");
    if (!tools || !tools->isArray()) {
        throw errors::ConfigurationError("Catalog must be an object with a 'tools' array");
    }

    std::vector<CatalogEntry> out;
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    out.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const JSONValue& item = arr[i] ? *arr[i] : JSONValue();
        if (!item.isObject()) {
            throw errors::ConfigurationError(entryPrefix(i) + ": entry must be an object");
        }
        CatalogEntry e;
        auto name = GetString(item, "name");
        if (!name || name->empty()) {
            throw errors::ConfigurationError(entryPrefix(i) + ": missing required field 'name'");
        }
        auto description = GetString(item, "description");
        if (!description || description->empty()) {
            throw errors::ConfigurationError(entryPrefix(i) + " ('" + *name + "'): missing required field 'description'");
        }
        e.name = *name;
        e.description = *description;
        if (const JSONValue* schema = item.find("inputSchema")) {
            e.inputSchema = *schema;
        } else {
            e.inputSchema = MakeObject({{"type", JSONValue("object")}});
        }
        e.content = GetString(item, "content").value_or(std::string());
        out.push_back(std::move(e));
    }
    return out;
}

std::string RenderTemplate(const std::string& content, const JSONValue& args) {
    std::string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        const std::size_t open = content.find("{{", pos);
        if (open == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        const std::size_t close = content.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, open - pos);
        const std::string key = content.substr(open + 2, close - open - 2);
        if (const JSONValue* v = args.find(key)) {
            out += v->isString() ? std::get<std::string>(v->value) : SerializeJSON(*v);
        }
        pos = close + 2;
    }
    return out;
}

std::vector<std::string> LoadCatalogJson(const std::string& json, ToolRegistry& registry) {
    std::vector<std::string> names;
    for (auto& entry : ParseCatalog(json)) {
        const std::string content = entry.content;
        ToolExecutor exec = [content](const JSONValue& args, const CancellationHandle&) {
            return JSONValue(RenderTemplate(content, args));
        };
        names.push_back(registry.Register(entry.name, entry.description, entry.inputSchema,
                                          std::move(exec), ToolSource::External));
    }
    LOG_INFO("Loaded {} catalog tools", names.size());
    return names;
}

std::vector<std::string> LoadCatalogFile(const std::string& path, ToolRegistry& registry) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw errors::ConfigurationError("Cannot open catalog file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    LOG_DEBUG("Reading catalog {}", path);
    return LoadCatalogJson(ss.str(), registry);
}

} // namespace toolrpc
