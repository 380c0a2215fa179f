//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Validation of JSON values against the JSON Schema subset used by tool input schemas
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "codebridge/JSONRPCTypes.h"

namespace codebridge {
namespace validation {

//==========================================================================================================
// ValidateAgainstSchema
// Purpose: Checks value against schema. Supported keywords: type (string or array of strings), properties,
//          required, items, enum, minimum, maximum, minLength. Other keywords are ignored, as are
//          properties the schema does not describe.
// Args:
//   schema: Schema object. A non-object schema accepts everything.
//   value: Instance to check.
// Returns:
//   std::nullopt when value conforms; otherwise a one-line message naming the offending location
//   ("limit: expected integer").
//==========================================================================================================
std::optional<std::string> ValidateAgainstSchema(const JSONValue& schema, const JSONValue& value);

// JSON Schema type name of a value ("integer" for int64, "number" for double).
const char* JsonTypeName(const JSONValue& value);

} // namespace validation
} // namespace codebridge
