//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CatalogLoader.h
// Purpose: Imports template tools from an external JSON catalog
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

class ToolRegistry;

struct CatalogEntry {
    std::string name;
    std::string description;
    JSONValue inputSchema;      // {"type":"object"} when the entry has none
    std::string content;        // template text with {{param}} placeholders
};

//==========================================================================================================
// ParseCatalog
// Purpose: Reads {"tools":[{"name","description","inputSchema"?,"content"}]}.
// Throws:
//   errors::ConfigurationError for malformed JSON or an entry missing name/description ("tools[i]: ...").
//==========================================================================================================
std::vector<CatalogEntry> ParseCatalog(const std::string& json);

// Replaces {{key}} with the argument value (strings raw, other values as JSON). Placeholders without a
// matching argument are removed.
std::string RenderTemplate(const std::string& content, const JSONValue& args);

//==========================================================================================================
// LoadCatalogJson / LoadCatalogFile
// Purpose: Registers every entry as ToolSource::External, so names failing the naming policy are
//          rewritten. Each executor returns the rendered content.
// Returns:
//   Registered names in catalog order.
// Throws:
//   errors::ConfigurationError for parse failures, unreadable files and registration errors.
//==========================================================================================================
std::vector<std::string> LoadCatalogJson(const std::string& json, ToolRegistry& registry);
std::vector<std::string> LoadCatalogFile(const std::string& path, ToolRegistry& registry);

} // namespace toolrpc
