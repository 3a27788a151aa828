#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/sync_adapter.h — Future factory and synchronous drain loop
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    promise::SyncAdapter adapter;
//    auto f = adapter.convert(promise::Deferred::create([] { return Value(1); }));
//    f.isPending();        // true, nothing has run yet
//    adapter.wait(f);      // drains the queue, returns 1
//
//  Each adapter owns its TaskQueue. Futures created through an adapter
//  (and everything chained from them) schedule their reactions on that
//  queue, so two executions with two adapters never interfere.
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "error.h"
#include "future.h"
#include "task_queue.h"
#include "thenable.h"
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <variant>
#include <vector>

namespace gqlpp::promise {

class SyncAdapter {
public:
    SyncAdapter() : queue_(std::make_shared<TaskQueue>()) {}

    SyncAdapter(const SyncAdapter&) = delete;
    SyncAdapter& operator=(const SyncAdapter&) = delete;

    // ── Construction ──
    template <typename T>
    Promise<T> createPending() const {
        return Promise<T>(queue_);
    }

    template <typename T>
    Future<T> createFulfilled(T value) const {
        auto promise = createPending<T>();
        promise.resolve(std::move(value));
        return promise.future();
    }

    template <typename T>
    Future<T> createRejected(std::exception_ptr error) const {
        auto promise = createPending<T>();
        promise.reject(std::move(error));
        return promise.future();
    }

    // Runs `resolver(resolve, reject)` right away. An exception thrown by
    // the resolver rejects the future unless it was already settled.
    template <typename T, typename ResolverFn>
    Future<T> create(ResolverFn&& resolver) const {
        auto promise = createPending<T>();
        try {
            resolver([promise](T value) { promise.resolve(std::move(value)); },
                     [promise](std::exception_ptr error) { promise.reject(std::move(error)); });
        } catch (...) {
            if (promise.isPending()) {
                promise.reject(std::current_exception());
            } else {
                console::warn("Resolver threw after settling its future; the exception is ignored");
            }
        }
        return promise.future();
    }

    // ── Thenables ──
    bool isThenable(const Resolved& result) const {
        return std::holds_alternative<ThenablePtr>(result);
    }

    Future<Value> convert(ThenablePtr thenable) const;

    // ── Chaining ──
    template <typename T, typename OnFulfilled>
    auto then(const Future<T>& future, OnFulfilled onFulfilled) const {
        return future.then(std::move(onFulfilled));
    }

    template <typename T, typename OnFulfilled, typename OnRejected>
    auto then(const Future<T>& future, OnFulfilled onFulfilled, OnRejected onRejected) const {
        return future.then(std::move(onFulfilled), std::move(onRejected));
    }

    // Fulfills with every value in input order, or rejects with the first
    // rejection observed. Inputs are subscribed in order, so inputs that
    // are already settled are observed in order too.
    template <typename T>
    Future<std::vector<T>> all(std::vector<Future<T>> futures) const {
        auto promise = createPending<std::vector<T>>();
        if (futures.empty()) {
            promise.resolve(std::vector<T>{});
            return promise.future();
        }

        struct Gather {
            std::vector<std::optional<T>> slots;
            std::size_t remaining = 0;
            bool done = false;
        };
        auto gather = std::make_shared<Gather>();
        gather->slots.resize(futures.size());
        gather->remaining = futures.size();

        for (std::size_t i = 0; i < futures.size(); ++i) {
            futures[i].core_->subscribe([gather, promise, i](const detail::FutureCore<T>& settled) {
                if (gather->done) return;
                if (settled.state() == FutureState::Rejected) {
                    gather->done = true;
                    promise.reject(settled.error());
                    return;
                }
                gather->slots[i].emplace(settled.value());
                if (--gather->remaining > 0) return;

                gather->done = true;
                std::vector<T> values;
                values.reserve(gather->slots.size());
                for (auto& slot : gather->slots) {
                    values.push_back(std::move(*slot));
                }
                promise.resolve(std::move(values));
            });
        }
        return promise.future();
    }

    // ── Synchronous drain ──
    // Runs queued tasks oldest first until `future` settles. Throws the
    // rejection reason, or DeadlockError when the queue runs dry first.
    template <typename T>
    T wait(const Future<T>& future) const {
        if (!future.valid()) {
            throw std::invalid_argument("Cannot wait on an empty future");
        }
        if (future.core_->queue() != queue_) {
            throw std::invalid_argument("Future was created by a different adapter");
        }

        while (future.isPending()) {
            if (!queue_->runNext()) {
                console::error("Deadlock: task queue drained after", queue_->processed(),
                               "tasks while the awaited future is still pending");
                throw DeadlockError("Could not resolve promise: no queued work can settle it");
            }
        }

        if (future.isRejected()) {
            std::rethrow_exception(future.error());
        }
        return future.value();
    }

    const TaskQueue& queue() const { return *queue_; }

private:
    std::shared_ptr<TaskQueue> queue_;
};

} // namespace gqlpp::promise
