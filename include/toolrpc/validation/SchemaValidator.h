//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Validation of tool call arguments against a tool's ObjectSchema
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Schema.h"

namespace toolrpc {
namespace validation {

//==========================================================================================================
// ValidateArguments
// Purpose: Checks an arguments object against schema. The first failure wins, in this order:
//   1. every required name is present and non-null   "Missing required parameter: X"
//   2. no undeclared keys                            "Unknown parameter: X"
//   3. primitive type of each supplied value         "Parameter 'X' must be a string" (an integer, ...)
//   4. enum membership                               "Parameter 'X' must be one of: a, b"
// Returns:
//   std::nullopt when valid; otherwise the error message.
//==========================================================================================================
std::optional<std::string> ValidateArguments(const JSONValue& args, const ObjectSchema& schema);

// True when value satisfies the primitive type. Whole-number doubles count as integers.
bool MatchesType(const JSONValue& value, PropertyType type);

} // namespace validation
} // namespace toolrpc
