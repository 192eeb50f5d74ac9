//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolNaming.cpp
// Purpose: Tool naming policy implementation
//==========================================================================================================

#include <cctype>
#include <regex>

#include "toolrpc/validation/ToolNaming.h"

namespace toolrpc {
namespace validation {

namespace {
bool isLower(char c) { return c >= 'a' && c <= 'z'; }
bool isAllowed(char c) { return isLower(c) || (c >= '0' && c <= '9') || c == '_' || c == '-'; }

std::string collapseUnderscores(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(c);
    }
    return out;
}

std::string trimChar(const std::string& s, char ch) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && s[b] == ch) ++b;
    while (e > b && s[e - 1] == ch) --e;
    return s.substr(b, e - b);
}
} // namespace

std::optional<std::string> ToolNaming::Validate(const std::string& name) {
    if (name.empty()) {
        return std::string("Tool name cannot be empty");
    }
    if (name.size() > kMaxToolNameLength) {
        return std::string("Tool name must be 100 characters or less");
    }
    static const std::regex valid("^[a-z][a-z0-9_-]*$");
    if (!std::regex_match(name, valid)) {
        return std::string("Tool name must start with a lowercase letter and contain only lowercase letters, numbers, underscores, and hyphens");
    }
    const bool reserved = name.front() == '_' ||
                          name.find("__") != std::string::npos ||
                          name.back() == '-' ||
                          name.rfind("system", 0) == 0 ||
                          name.rfind("internal", 0) == 0;
    if (reserved) {
        return "Tool name '" + name + "' matches a reserved pattern";
    }
    return std::nullopt;
}

std::string ToolNaming::Suggest(const std::string& name) {
    if (name.empty()) {
        return "tool_name";
    }

    // Lowercase, whitespace/dot runs to '_', drop everything else outside [a-z0-9_-]
    std::string s;
    s.reserve(name.size());
    bool inSep = false;
    for (unsigned char uc : name) {
        const char c = static_cast<char>(std::tolower(uc));
        if (std::isspace(uc) || c == '.') {
            if (!inSep) s.push_back('_');
            inSep = true;
            continue;
        }
        inSep = false;
        if (isAllowed(c)) s.push_back(c);
    }

    if (s.empty() || !isLower(s.front())) {
        s = "tool_" + s;
    }
    s = trimChar(collapseUnderscores(s), '_');

    if (s.rfind("system", 0) == 0 || s.rfind("internal", 0) == 0) {
        s = "skill_" + s;
    }
    if (!s.empty() && s.back() == '-') {
        s.pop_back();
        s += "_tool";
    }
    s = collapseUnderscores(s);

    if (s.size() > kMaxToolNameLength) {
        s.resize(kMaxToolNameLength);
        while (!s.empty() && (s.back() == '-' || s.back() == '_')) s.pop_back();
    }
    if (s.empty()) {
        s = "tool_name";
    }
    return s;
}

} // namespace validation
} // namespace toolrpc
