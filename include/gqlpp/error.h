#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/error.h — GraphQL error records and fatal conditions
// ═══════════════════════════════════════════════════════════════════
//
//  Error          — a located, serializable GraphQL error. Anything a
//                   resolver throws ends up as one of these in
//                   ExecutionResult::errors.
//  SyntaxError    — raised by the parser, always with one location.
//  DeadlockError  — raised by SyncAdapter::wait when a future can no
//                   longer settle. Never reported as a GraphQL error.
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace gqlpp {

struct SourceLocation {
    int line = 0;
    int column = 0;

    bool operator==(const SourceLocation& other) const {
        return line == other.line && column == other.column;
    }
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message,
                   std::vector<SourceLocation> locations = {},
                   Value path = Value())
        : std::runtime_error(message),
          locations_(std::move(locations)),
          path_(std::move(path)) {}

    const std::vector<SourceLocation>& locations() const { return locations_; }
    const Value& path() const { return path_; }
    bool hasPath() const { return path_.is_array(); }

    // ── {message, locations?, path?} ──
    Value toJson() const {
        Value out = Value::object();
        out["message"] = what();
        if (!locations_.empty()) {
            Value locations = Value::array();
            for (const auto& loc : locations_) {
                locations.push_back(Value{{"line", loc.line}, {"column", loc.column}});
            }
            out["locations"] = std::move(locations);
        }
        if (hasPath()) {
            out["path"] = path_;
        }
        return out;
    }

    // Converts a captured exception into an Error carrying the given
    // locations and path. Errors that already have a path keep it.
    static Error located(std::exception_ptr error,
                         std::vector<SourceLocation> locations,
                         Value path) {
        try {
            std::rethrow_exception(error);
        } catch (const Error& e) {
            if (e.hasPath()) return e;
            return Error(e.what(),
                         e.locations().empty() ? std::move(locations) : e.locations(),
                         std::move(path));
        } catch (const std::exception& e) {
            return Error(e.what(), std::move(locations), std::move(path));
        } catch (...) {
            return Error("Unknown error", std::move(locations), std::move(path));
        }
    }

private:
    std::vector<SourceLocation> locations_;
    Value path_;
};

class SyntaxError : public Error {
public:
    SyntaxError(const std::string& description, SourceLocation location)
        : Error("Syntax Error: " + description, {location}) {}
};

class DeadlockError : public std::logic_error {
public:
    explicit DeadlockError(const std::string& message) : std::logic_error(message) {}
};

} // namespace gqlpp
