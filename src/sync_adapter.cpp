// ═══════════════════════════════════════════════════════════════════
//  sync_adapter.cpp — Conversion of foreign thenables
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/sync_adapter.h"

namespace gqlpp::promise {

// The thenable is not touched here. Subscribing to it is queued, so a
// Deferred only runs once somebody drains the queue, and whatever it
// throws while being subscribed to becomes a rejection.
Future<Value> SyncAdapter::convert(ThenablePtr thenable) const {
    auto promise = createPending<Value>();
    if (!thenable) {
        promise.reject(std::make_exception_ptr(
            std::invalid_argument("Cannot convert a null thenable")));
        return promise.future();
    }

    queue_->enqueue([promise, thenable = std::move(thenable)] {
        try {
            thenable->then([promise](Value value) { promise.resolve(std::move(value)); },
                           [promise](std::exception_ptr error) { promise.reject(std::move(error)); });
        } catch (...) {
            if (promise.isPending()) {
                promise.reject(std::current_exception());
            } else {
                console::warn("Thenable threw after settling its future; the exception is ignored");
            }
        }
    });
    return promise.future();
}

} // namespace gqlpp::promise
