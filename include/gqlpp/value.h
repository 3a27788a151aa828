#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/value.h — Dynamic value type shared by every layer
// ═══════════════════════════════════════════════════════════════════
//  Root values, resolver results, arguments, variables, context, the
//  `data` tree and error paths are all nlohmann::ordered_json, so that
//  response objects keep their fields in selection order.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>

namespace gqlpp {

using Value = nlohmann::ordered_json;

// ── Append one segment (field name or list index) to a response path ──
inline Value appendPath(const Value& path, Value segment) {
    Value next = path.is_array() ? path : Value::array();
    next.push_back(std::move(segment));
    return next;
}

// ── Short human-readable rendering used in error messages ──
inline std::string inspect(const Value& value) {
    if (value.is_string()) return "\"" + value.get<std::string>() + "\"";
    return value.dump();
}

} // namespace gqlpp
