#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/thenable.h — What a resolver may hand back
// ═══════════════════════════════════════════════════════════════════
//
//  A resolver returns a Resolved: either a plain Value, available now,
//  or a Thenable that produces one later. The executor inspects the
//  variant exactly once and converts thenables through the adapter.
//
//  Usage (inside a resolver):
//    return promise::defer([root] { return root; });
//
//  Returning a bare `nullptr` is ambiguous between the two
//  alternatives; return `Value(nullptr)` instead.
//
// ═══════════════════════════════════════════════════════════════════

#include "value.h"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace gqlpp::promise {

// ── Minimal chaining contract for values produced outside the adapter ──
class Thenable {
public:
    using OnFulfilled = std::function<void(Value)>;
    using OnRejected = std::function<void(std::exception_ptr)>;

    virtual ~Thenable() = default;

    // Must eventually call exactly one of the two handlers.
    virtual void then(OnFulfilled onFulfilled, OnRejected onRejected) = 0;
};

using ThenablePtr = std::shared_ptr<Thenable>;
using Resolved = std::variant<Value, ThenablePtr>;

// ═══════════════════════════════════════════
//  class Deferred — lazily evaluated computation
// ═══════════════════════════════════════════
//  The computation runs at most once, the first time a handler is
//  attached. Its value or exception is memoized for later callers.
class Deferred : public Thenable {
public:
    using Computation = std::function<Value()>;

    explicit Deferred(Computation computation) : computation_(std::move(computation)) {}

    static std::shared_ptr<Deferred> create(Computation computation) {
        return std::make_shared<Deferred>(std::move(computation));
    }

    bool evaluated() const { return evaluated_; }

    void then(OnFulfilled onFulfilled, OnRejected onRejected) override {
        evaluate();
        if (error_) {
            if (onRejected) onRejected(error_);
            return;
        }
        if (onFulfilled) onFulfilled(*value_);
    }

private:
    void evaluate() {
        if (evaluated_) return;
        evaluated_ = true;
        try {
            value_.emplace(computation_());
        } catch (...) {
            error_ = std::current_exception();
        }
        computation_ = nullptr;
    }

    Computation computation_;
    bool evaluated_ = false;
    std::optional<Value> value_;
    std::exception_ptr error_;
};

inline Resolved defer(Deferred::Computation computation) {
    return Resolved(std::in_place_type<ThenablePtr>, Deferred::create(std::move(computation)));
}

} // namespace gqlpp::promise
