//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Argument validation against flat object schemas
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <vector>

#include "toolrpc/validation/SchemaValidator.h"

namespace toolrpc {
namespace validation {

namespace {
const char* article(PropertyType t) {
    return (t == PropertyType::Integer || t == PropertyType::Array || t == PropertyType::Object) ? "an" : "a";
}

std::string joinEnum(const std::vector<JSONValue>& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        if (const auto* s = std::get_if<std::string>(&values[i].value)) {
            out += *s;
        } else {
            out += SerializeJSON(values[i]);
        }
    }
    return out;
}
} // namespace

bool MatchesType(const JSONValue& value, PropertyType type) {
    switch (type) {
        case PropertyType::String: return value.isString();
        case PropertyType::Number:
            if (value.isInteger()) return true;
            if (const auto* d = std::get_if<double>(&value.value)) return !std::isnan(*d);
            return false;
        case PropertyType::Integer:
            if (value.isInteger()) return true;
            if (const auto* d = std::get_if<double>(&value.value)) return std::isfinite(*d) && std::floor(*d) == *d;
            return false;
        case PropertyType::Boolean: return value.isBool();
        case PropertyType::Array: return value.isArray();
        case PropertyType::Object: return value.isObject();
        case PropertyType::Any:
        default: return true;
    }
}

std::optional<std::string> ValidateArguments(const JSONValue& args, const ObjectSchema& schema) {
    const auto* obj = std::get_if<JSONValue::Object>(&args.value);
    if (!obj) {
        return std::string("Tool arguments must be an object");
    }

    for (const auto& name : schema.required) {
        auto it = obj->find(name);
        if (it == obj->end() || !it->second || it->second->isNull()) {
            return "Missing required parameter: " + name;
        }
    }

    // Lowest unknown key by name, so the message does not depend on hash order.
    std::optional<std::string> unknown;
    for (const auto& entry : *obj) {
        if (schema.properties.find(entry.first) == schema.properties.end()) {
            if (!unknown || entry.first < *unknown) unknown = entry.first;
        }
    }
    if (unknown) {
        return "Unknown parameter: " + *unknown;
    }

    for (const auto& [name, prop] : schema.properties) {
        auto it = obj->find(name);
        if (it == obj->end() || !it->second) {
            continue;
        }
        const JSONValue& value = *it->second;
        if (value.isNull() && std::find(schema.required.begin(), schema.required.end(), name) == schema.required.end()) {
            // Optional parameter explicitly set to null is treated as absent
            continue;
        }
        if (!MatchesType(value, prop.type)) {
            return "Parameter '" + name + "' must be " + article(prop.type) + " " + toString(prop.type);
        }
        if (prop.enumValues.has_value()) {
            bool found = false;
            for (const auto& allowed : *prop.enumValues) {
                if (allowed == value) { found = true; break; }
            }
            if (!found) {
                return "Parameter '" + name + "' must be one of: " + joinEnum(*prop.enumValues);
            }
        }
    }
    return std::nullopt;
}

} // namespace validation
} // namespace toolrpc
