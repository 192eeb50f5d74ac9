//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Schema.h
// Purpose: Object schema model for tool arguments (flat properties of primitive type)
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

enum class PropertyType {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
    Any      // no "type" keyword; any value is accepted
};

const char* toString(PropertyType t);
std::optional<PropertyType> propertyTypeFromString(const std::string& s);

struct PropertySchema {
    PropertyType type{PropertyType::Any};
    std::optional<std::string> description;
    std::optional<std::vector<JSONValue>> enumValues;
    std::optional<JSONValue> defaultValue;
    // The property's schema as supplied (preserved for tools/list).
    JSONValue raw;
};

//==========================================================================================================
// ObjectSchema
// Purpose: inputSchema of a tool. Properties are ordered by name for stable listings.
//==========================================================================================================
struct ObjectSchema {
    std::map<std::string, PropertySchema> properties;
    std::vector<std::string> required;
    // Other top-level keywords (e.g. "additionalProperties", "$schema") kept verbatim.
    JSONValue::Object extra;

    //======================================================================================================
    // FromJSON
    // Purpose: Parses and validates a schema definition.
    // Args:
    //   schema: JSON object with type "object", optional properties and required.
    //   owner: Tool name used in error messages.
    // Throws:
    //   errors::ConfigurationError naming the tool and the offending keyword.
    //======================================================================================================
    static ObjectSchema FromJSON(const JSONValue& schema, const std::string& owner);

    // Convenience for code-defined tools: {"type":"object"} with no properties.
    static ObjectSchema Empty();

    JSONValue ToJSON() const;
};

//==========================================================================================================
// SchemaBuilder
// Purpose: Fluent construction of ObjectSchema for tools registered in code.
//==========================================================================================================
class SchemaBuilder {
public:
    SchemaBuilder& Property(const std::string& name, PropertyType type, const std::string& description = {},
                            bool isRequired = false);
    SchemaBuilder& Enum(const std::string& name, std::vector<std::string> values);
    SchemaBuilder& Default(const std::string& name, JSONValue value);
    ObjectSchema Build() const { return schema; }

private:
    ObjectSchema schema;
};

} // namespace toolrpc
