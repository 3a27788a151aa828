#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/execution_result.h — Outcome of one GraphQL execution
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include "value.h"
#include <optional>
#include <string>
#include <vector>

namespace gqlpp {

struct ExecutionResult {
    // Absent when execution never started; null when a non-null error
    // reached the root.
    std::optional<Value> data;
    std::vector<Error> errors;

    static ExecutionResult failure(std::vector<Error> errors) {
        ExecutionResult result;
        result.errors = std::move(errors);
        return result;
    }

    // ── {data?, errors?} ──
    Value toJson() const {
        Value out = Value::object();
        if (data) {
            out["data"] = *data;
        }
        if (!errors.empty()) {
            Value list = Value::array();
            for (const auto& error : errors) {
                list.push_back(error.toJson());
            }
            out["errors"] = std::move(list);
        }
        return out;
    }
};

// ── Per-execution settings ──
struct ExecuteOptions {
    Value rootValue;
    Value context = Value::object();
    Value variables = Value::object();
    std::string operationName;
};

} // namespace gqlpp
