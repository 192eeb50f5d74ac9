//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Schema.cpp
// Purpose: Schema parsing, definition checks and serialization
//==========================================================================================================

#include <algorithm>

#include "toolrpc/Schema.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

namespace {
constexpr const char* kValidTypes = "string, number, integer, boolean, array, object";

[[noreturn]] void fail(const std::string& owner, const std::string& what) {
    throw errors::ConfigurationError("Tool '" + owner + "': " + what);
}
} // namespace

const char* toString(PropertyType t) {
    switch (t) {
        case PropertyType::String: return "string";
        case PropertyType::Number: return "number";
        case PropertyType::Integer: return "integer";
        case PropertyType::Boolean: return "boolean";
        case PropertyType::Array: return "array";
        case PropertyType::Object: return "object";
        case PropertyType::Any:
        default: return "any";
    }
}

std::optional<PropertyType> propertyTypeFromString(const std::string& s) {
    if (s == "string") return PropertyType::String;
    if (s == "number") return PropertyType::Number;
    if (s == "integer") return PropertyType::Integer;
    if (s == "boolean") return PropertyType::Boolean;
    if (s == "array") return PropertyType::Array;
    if (s == "object") return PropertyType::Object;
    return std::nullopt;
}

ObjectSchema ObjectSchema::FromJSON(const JSONValue& schema, const std::string& owner) {
    const auto* obj = std::get_if<JSONValue::Object>(&schema.value);
    if (!obj) {
        fail(owner, "inputSchema must be an object");
    }
    auto type = GetString(schema, "type");
    if (!type || *type != "object") {
        fail(owner, "inputSchema.type must be 'object'");
    }

    ObjectSchema out;
    for (const auto& [k, v] : *obj) {
        if (k != "type" && k != "properties" && k != "required" && v) {
            out.extra[k] = v;
        }
    }

    if (const JSONValue* props = schema.find("properties")) {
        const auto* pobj = std::get_if<JSONValue::Object>(&props->value);
        if (!pobj) {
            fail(owner, "inputSchema.properties must be an object");
        }
        for (const auto& [name, def] : *pobj) {
            if (!def || !def->isObject()) {
                fail(owner, "property '" + name + "' must be an object");
            }
            PropertySchema ps;
            ps.raw = *def;
            if (const JSONValue* t = def->find("type")) {
                const auto* ts = std::get_if<std::string>(&t->value);
                auto parsed = ts ? propertyTypeFromString(*ts) : std::nullopt;
                if (!parsed) {
                    fail(owner, "property '" + name + "' has invalid type '" +
                                (ts ? *ts : SerializeJSON(*t)) + "'. Must be one of: " + kValidTypes);
                }
                ps.type = *parsed;
            }
            if (const JSONValue* d = def->find("description")) {
                const auto* ds = std::get_if<std::string>(&d->value);
                if (!ds) {
                    fail(owner, "property '" + name + "' description must be a string if provided");
                }
                ps.description = *ds;
            }
            if (const JSONValue* e = def->find("enum")) {
                const auto* arr = std::get_if<JSONValue::Array>(&e->value);
                if (!arr || arr->empty()) {
                    fail(owner, "property '" + name + "' enum must be a non-empty array");
                }
                std::vector<JSONValue> values;
                for (const auto& item : *arr) {
                    values.push_back(item ? *item : JSONValue());
                }
                ps.enumValues = std::move(values);
            }
            if (const JSONValue* d = def->find("default")) {
                ps.defaultValue = *d;
            }
            out.properties.emplace(name, std::move(ps));
        }
    }

    if (const JSONValue* req = schema.find("required")) {
        const auto* arr = std::get_if<JSONValue::Array>(&req->value);
        if (!arr) {
            fail(owner, "inputSchema.required must be an array");
        }
        for (const auto& item : *arr) {
            const auto* s = item ? std::get_if<std::string>(&item->value) : nullptr;
            if (!s) {
                fail(owner, "inputSchema.required entries must be strings");
            }
            if (out.properties.find(*s) == out.properties.end()) {
                fail(owner, "required property '" + *s + "' does not exist in properties");
            }
            if (std::find(out.required.begin(), out.required.end(), *s) == out.required.end()) {
                out.required.push_back(*s);
            }
        }
    }
    return out;
}

ObjectSchema ObjectSchema::Empty() {
    return ObjectSchema{};
}

JSONValue ObjectSchema::ToJSON() const {
    JSONValue::Object o = extra;
    o["type"] = MakeShared(JSONValue("object"));
    JSONValue::Object props;
    for (const auto& [name, ps] : properties) {
        props[name] = MakeShared(ps.raw);
    }
    o["properties"] = MakeShared(JSONValue(std::move(props)));
    if (!required.empty()) {
        JSONValue::Array req;
        for (const auto& r : required) {
            req.push_back(MakeShared(JSONValue(r)));
        }
        o["required"] = MakeShared(JSONValue(std::move(req)));
    }
    return JSONValue(std::move(o));
}

namespace {
// Rebuilds the raw JSON of a property after builder edits.
void refreshRaw(PropertySchema& ps) {
    JSONValue::Object o;
    if (ps.type != PropertyType::Any) {
        o["type"] = MakeShared(JSONValue(toString(ps.type)));
    }
    if (ps.description && !ps.description->empty()) {
        o["description"] = MakeShared(JSONValue(*ps.description));
    }
    if (ps.enumValues) {
        JSONValue::Array arr;
        for (const auto& v : *ps.enumValues) arr.push_back(MakeShared(v));
        o["enum"] = MakeShared(JSONValue(std::move(arr)));
    }
    if (ps.defaultValue) {
        o["default"] = MakeShared(*ps.defaultValue);
    }
    ps.raw = JSONValue(std::move(o));
}
} // namespace

SchemaBuilder& SchemaBuilder::Property(const std::string& name, PropertyType type, const std::string& description,
                                       bool isRequired) {
    PropertySchema& ps = schema.properties[name];
    ps.type = type;
    if (!description.empty()) ps.description = description;
    refreshRaw(ps);
    if (isRequired && std::find(schema.required.begin(), schema.required.end(), name) == schema.required.end()) {
        schema.required.push_back(name);
    }
    return *this;
}

SchemaBuilder& SchemaBuilder::Enum(const std::string& name, std::vector<std::string> values) {
    PropertySchema& ps = schema.properties[name];
    std::vector<JSONValue> vs;
    for (auto& v : values) vs.emplace_back(std::move(v));
    ps.enumValues = std::move(vs);
    refreshRaw(ps);
    return *this;
}

SchemaBuilder& SchemaBuilder::Default(const std::string& name, JSONValue value) {
    PropertySchema& ps = schema.properties[name];
    ps.defaultValue = std::move(value);
    refreshRaw(ps);
    return *this;
}

} // namespace toolrpc
