#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/future.h — Settle-once futures with queued reactions
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    promise::SyncAdapter adapter;
//    auto p = adapter.createPending<int>();
//    auto doubled = p.future().then([](const int& v) { return v * 2; });
//    p.resolve(21);
//    adapter.wait(doubled);   // 42
//
//  A Future moves from Pending to Fulfilled or Rejected exactly once.
//  Reactions never run inline: settlement moves them to the owning
//  adapter's TaskQueue in registration order, and registering on an
//  already-settled future queues the reaction right away.
//
//  A handler may return a plain T, a Future<T>, or a MaybeFuture<T>.
//  A returned future is adopted: the downstream future is tagged as
//  adopting and settles when the returned one does, one queue hop
//  later, so deep chains never recurse. Dropping a pending chain tears it
//  down iteratively as well.
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "task_queue.h"
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gqlpp::promise {

enum class FutureState { Pending, Fulfilled, Rejected };

inline const char* toString(FutureState state) {
    switch (state) {
        case FutureState::Pending:   return "pending";
        case FutureState::Fulfilled: return "fulfilled";
        case FutureState::Rejected:  return "rejected";
    }
    return "unknown";
}

template <typename T> class Future;
template <typename T> class Promise;
class SyncAdapter;

// ── Either a value that is ready now or one that will be ──
template <typename T>
using MaybeFuture = std::variant<T, Future<T>>;

namespace detail {

// Maps a handler's return type to the value type of the future it yields.
template <typename R>
struct FutureTraits { using value_type = R; };

template <typename T>
struct FutureTraits<Future<T>> { using value_type = T; };

template <typename T>
struct FutureTraits<std::variant<T, Future<T>>> { using value_type = T; };

template <typename R>
using unwrap_t = typename FutureTraits<std::decay_t<R>>::value_type;

// ── Pending reactions released by a dropped core ──
// A pending core's reactions own its downstream cores, so dropping the
// head of a long chain would destroy it one nested frame per link. The
// outermost release drains the lists here instead; inner ones only park.
struct Teardown {
    bool active = false;
    std::vector<std::shared_ptr<void>> parked;
};

inline Teardown& teardown() {
    thread_local Teardown state;
    return state;
}

inline void release(std::shared_ptr<void> reactions) {
    auto& state = teardown();
    state.parked.push_back(std::move(reactions));
    if (state.active) return;
    state.active = true;
    while (!state.parked.empty()) {
        std::shared_ptr<void> next = std::move(state.parked.back());
        state.parked.pop_back();
        next.reset();
    }
    state.active = false;
}

// ═══════════════════════════════════════════
//  FutureCore — the shared state behind Future and Promise
// ═══════════════════════════════════════════
template <typename T>
class FutureCore : public std::enable_shared_from_this<FutureCore<T>> {
public:
    using Reaction = std::function<void(const FutureCore&)>;

    explicit FutureCore(std::shared_ptr<TaskQueue> queue) : queue_(std::move(queue)) {}

    FutureCore(const FutureCore&) = delete;
    FutureCore& operator=(const FutureCore&) = delete;

    ~FutureCore() {
        if (reactions_.empty()) return;
        release(std::make_shared<std::vector<Reaction>>(std::move(reactions_)));
    }

    FutureState state() const { return state_; }
    bool adopting() const { return adopting_; }
    const T& value() const { return *value_; }
    std::exception_ptr error() const { return error_; }
    const std::shared_ptr<TaskQueue>& queue() const { return queue_; }

    void resolve(T value) {
        if (!acceptsSettlement()) return;
        fulfill(std::move(value));
    }

    void reject(std::exception_ptr error) {
        if (!acceptsSettlement()) return;
        fail(std::move(error));
    }

    // Makes `target` follow `source` instead of settling directly.
    static void adopt(const std::shared_ptr<FutureCore>& target,
                      const std::shared_ptr<FutureCore>& source) {
        if (!target->acceptsSettlement()) return;
        if (target == source) {
            target->fail(std::make_exception_ptr(
                std::logic_error("A future cannot adopt itself")));
            return;
        }
        target->adopting_ = true;
        source->subscribe([target](const FutureCore& settled) {
            if (settled.state() == FutureState::Fulfilled) {
                target->fulfill(settled.value());
            } else {
                target->fail(settled.error());
            }
        });
    }

    void subscribe(Reaction reaction) {
        if (state_ == FutureState::Pending) {
            reactions_.push_back(std::move(reaction));
            return;
        }
        schedule(std::move(reaction));
    }

private:
    bool acceptsSettlement() const {
        if (state_ == FutureState::Pending && !adopting_) return true;
        console::warn("Ignoring settlement of a future that is already",
                      adopting_ ? "adopting another future" : toString(state_));
        return false;
    }

    void fulfill(T value) {
        value_.emplace(std::move(value));
        state_ = FutureState::Fulfilled;
        adopting_ = false;
        flush();
    }

    void fail(std::exception_ptr error) {
        error_ = std::move(error);
        state_ = FutureState::Rejected;
        adopting_ = false;
        flush();
    }

    void flush() {
        std::vector<Reaction> reactions = std::move(reactions_);
        reactions_.clear();
        for (auto& reaction : reactions) {
            schedule(std::move(reaction));
        }
    }

    void schedule(Reaction reaction) {
        queue_->enqueue([self = this->shared_from_this(), reaction = std::move(reaction)] {
            reaction(*self);
        });
    }

    std::shared_ptr<TaskQueue> queue_;
    FutureState state_ = FutureState::Pending;
    bool adopting_ = false;
    std::optional<T> value_;
    std::exception_ptr error_;
    std::vector<Reaction> reactions_;
};

} // namespace detail

// ═══════════════════════════════════════════
//  class Future — read end
// ═══════════════════════════════════════════
template <typename T>
class Future {
public:
    using value_type = T;

    Future() = default;

    bool valid() const { return core_ != nullptr; }

    FutureState state() const { return core_->state(); }
    bool isPending() const { return state() == FutureState::Pending; }
    bool isFulfilled() const { return state() == FutureState::Fulfilled; }
    bool isRejected() const { return state() == FutureState::Rejected; }
    bool isAdopting() const { return core_->adopting(); }

    const T& value() const {
        if (!isFulfilled()) {
            throw std::logic_error(std::string("Future is ") + toString(state()) +
                                   ", not fulfilled");
        }
        return core_->value();
    }

    std::exception_ptr error() const { return core_->error(); }

    // ── Chaining ──
    template <typename OnFulfilled>
    auto then(OnFulfilled onFulfilled) const {
        using Next = detail::unwrap_t<std::invoke_result_t<OnFulfilled&, const T&>>;
        return chain<Next>(std::move(onFulfilled), nullptr);
    }

    template <typename OnFulfilled, typename OnRejected>
    auto then(OnFulfilled onFulfilled, OnRejected onRejected) const {
        using Next = detail::unwrap_t<std::invoke_result_t<OnFulfilled&, const T&>>;
        return chain<Next>(std::move(onFulfilled), std::move(onRejected));
    }

    template <typename OnRejected>
    Future<T> otherwise(OnRejected onRejected) const {
        return chain<T>(nullptr, std::move(onRejected));
    }

    bool operator==(const Future& other) const { return core_ == other.core_; }
    bool operator!=(const Future& other) const { return core_ != other.core_; }

private:
    using Core = detail::FutureCore<T>;

    template <typename U> friend class Future;
    template <typename U> friend class Promise;
    friend class SyncAdapter;

    explicit Future(std::shared_ptr<Core> core) : core_(std::move(core)) {}

    template <typename Next, typename OnFulfilled, typename OnRejected>
    Future<Next> chain(OnFulfilled onFulfilled, OnRejected onRejected) const {
        auto next = std::make_shared<detail::FutureCore<Next>>(core_->queue());
        core_->subscribe(
            [next, onFulfilled = std::move(onFulfilled), onRejected = std::move(onRejected)](
                const Core& settled) mutable {
                try {
                    if (settled.state() == FutureState::Fulfilled) {
                        if constexpr (std::is_same_v<OnFulfilled, std::nullptr_t>) {
                            Future<Next>::settleFrom(next, settled.value());
                        } else {
                            Future<Next>::settleFrom(next, std::invoke(onFulfilled, settled.value()));
                        }
                    } else {
                        if constexpr (std::is_same_v<OnRejected, std::nullptr_t>) {
                            next->reject(settled.error());
                        } else {
                            Future<Next>::settleFrom(next, std::invoke(onRejected, settled.error()));
                        }
                    }
                } catch (...) {
                    next->reject(std::current_exception());
                }
            });
        return Future<Next>(next);
    }

    template <typename R>
    static void settleFrom(const std::shared_ptr<Core>& target, R&& result) {
        using Result = std::decay_t<R>;
        if constexpr (std::is_same_v<Result, Future<T>>) {
            Core::adopt(target, result.core_);
        } else if constexpr (std::is_same_v<Result, MaybeFuture<T>>) {
            if (const auto* future = std::get_if<Future<T>>(&result)) {
                Core::adopt(target, future->core_);
            } else {
                target->resolve(std::get<T>(std::forward<R>(result)));
            }
        } else {
            target->resolve(T(std::forward<R>(result)));
        }
    }

    std::shared_ptr<Core> core_;
};

// ═══════════════════════════════════════════
//  class Promise — write end, handed out by SyncAdapter::createPending
// ═══════════════════════════════════════════
template <typename T>
class Promise {
public:
    Future<T> future() const { return Future<T>(core_); }

    void resolve(T value) const { core_->resolve(std::move(value)); }
    void resolve(const Future<T>& other) const { detail::FutureCore<T>::adopt(core_, other.core_); }
    void reject(std::exception_ptr error) const { core_->reject(std::move(error)); }

    bool isPending() const { return core_->state() == FutureState::Pending; }

private:
    friend class SyncAdapter;

    explicit Promise(std::shared_ptr<TaskQueue> queue)
        : core_(std::make_shared<detail::FutureCore<T>>(std::move(queue))) {}

    std::shared_ptr<detail::FutureCore<T>> core_;
};

} // namespace gqlpp::promise
