//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolNaming.h
// Purpose: Tool naming policy and deterministic name suggestions
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace toolrpc {
namespace validation {

constexpr std::size_t kMaxToolNameLength = 100;

class ToolNaming {
public:
    //==========================================================================================================
    // Validate
    // Purpose: Checks a name against ^[a-z][a-z0-9_-]*$, the length cap and the reserved patterns
    //          (^_, __, -$, ^system, ^internal).
    // Returns:
    //   std::nullopt when the name is acceptable; otherwise the first violated rule as a message.
    //==========================================================================================================
    static std::optional<std::string> Validate(const std::string& name);

    //==========================================================================================================
    // Suggest
    // Purpose: Slugifies an arbitrary string into a name that passes Validate. Deterministic.
    // Example:
    //   "My Tool.v2" -> "my_tool_v2", "9lives" -> "tool_9lives", "system-check" -> "skill_system-check"
    //==========================================================================================================
    static std::string Suggest(const std::string& name);
};

} // namespace validation
} // namespace toolrpc
