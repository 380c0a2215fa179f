//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: JSON Schema subset validator
//==========================================================================================================

#include "codebridge/validation/SchemaValidator.h"

namespace codebridge {
namespace validation {

namespace {

std::string joinPath(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::string at(const std::string& path) {
    return path.empty() ? std::string("params") : path;
}

bool matchesType(const std::string& type, const JSONValue& value) {
    if (type == "null") return value.isNull();
    if (type == "boolean") return std::holds_alternative<bool>(value.value);
    if (type == "integer") return value.isInteger();
    if (type == "number") return value.isInteger() || std::holds_alternative<double>(value.value);
    if (type == "string") return value.isString();
    if (type == "array") return value.isArray();
    if (type == "object") return value.isObject();
    return true;
}

std::optional<double> numericValue(const JSONValue& v) {
    if (v.isInteger()) return static_cast<double>(std::get<int64_t>(v.value));
    if (std::holds_alternative<double>(v.value)) return std::get<double>(v.value);
    return std::nullopt;
}

std::optional<std::string> validateAt(const JSONValue& schema, const JSONValue& value, const std::string& path) {
    if (!schema.isObject()) {
        return std::nullopt;
    }

    if (const JSONValue* type = GetMember(schema, "type")) {
        bool ok = true;
        std::string expected;
        if (type->isString()) {
            expected = std::get<std::string>(type->value);
            ok = matchesType(expected, value);
        } else if (type->isArray()) {
            ok = false;
            for (const auto& t : std::get<JSONValue::Array>(type->value)) {
                if (!t || !t->isString()) continue;
                if (!expected.empty()) expected += " or ";
                expected += std::get<std::string>(t->value);
                if (matchesType(std::get<std::string>(t->value), value)) ok = true;
            }
        }
        if (!ok) {
            return at(path) + ": expected " + expected + ", got " + JsonTypeName(value);
        }
    }

    if (const JSONValue* allowed = GetMember(schema, "enum"); allowed && allowed->isArray()) {
        bool found = false;
        for (const auto& candidate : std::get<JSONValue::Array>(allowed->value)) {
            if (candidate && *candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return at(path) + ": value " + SerializeJSON(value) + " is not one of " + SerializeJSON(*allowed);
        }
    }

    if (auto num = numericValue(value)) {
        if (auto min = GetMember(schema, "minimum")) {
            if (auto bound = numericValue(*min); bound && *num < *bound) {
                return at(path) + ": must be >= " + SerializeJSON(*min);
            }
        }
        if (auto max = GetMember(schema, "maximum")) {
            if (auto bound = numericValue(*max); bound && *num > *bound) {
                return at(path) + ": must be <= " + SerializeJSON(*max);
            }
        }
    }

    if (value.isString()) {
        if (const JSONValue* minLength = GetMember(schema, "minLength"); minLength && minLength->isInteger()) {
            // Length in code points, not bytes.
            const auto& s = std::get<std::string>(value.value);
            int64_t codePoints = 0;
            for (unsigned char c : s) {
                if ((c & 0xC0) != 0x80) ++codePoints;
            }
            if (codePoints < std::get<int64_t>(minLength->value)) {
                return at(path) + (codePoints == 0 ? std::string(": must not be empty")
                                                   : ": shorter than " + SerializeJSON(*minLength) + " characters");
            }
        }
    }

    if (value.isObject()) {
        const auto& obj = std::get<JSONValue::Object>(value.value);
        if (const JSONValue* required = GetMember(schema, "required"); required && required->isArray()) {
            for (const auto& name : std::get<JSONValue::Array>(required->value)) {
                if (!name || !name->isString()) continue;
                const auto& key = std::get<std::string>(name->value);
                if (obj.find(key) == obj.end()) {
                    return joinPath(path, key) + ": required property missing";
                }
            }
        }
        if (const JSONValue* props = GetMember(schema, "properties"); props && props->isObject()) {
            for (const auto& [key, sub] : std::get<JSONValue::Object>(props->value)) {
                auto it = obj.find(key);
                if (it == obj.end() || !it->second || !sub) continue;
                if (auto err = validateAt(*sub, *it->second, joinPath(path, key))) {
                    return err;
                }
            }
        }
    }

    if (value.isArray()) {
        if (const JSONValue* items = GetMember(schema, "items"); items && items->isObject()) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (!arr[i]) continue;
                if (auto err = validateAt(*items, *arr[i], at(path) + "[" + std::to_string(i) + "]")) {
                    return err;
                }
            }
        }
    }

    return std::nullopt;
}

} // namespace

const char* JsonTypeName(const JSONValue& value) {
    switch (value.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

std::optional<std::string> ValidateAgainstSchema(const JSONValue& schema, const JSONValue& value) {
    return validateAt(schema, value, "");
}

} // namespace validation
} // namespace codebridge
