#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/executor.h — Field resolution over a parsed document
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    promise::SyncAdapter adapter;
//    auto result = executor::execute(adapter, schema, document, Value("rootValue"));
//    if (result.isPending()) adapter.wait(result);
//
//  The returned future is already fulfilled whenever no resolver handed
//  back a thenable. Only when some field did is it pending, and then
//  SyncAdapter::wait drives it to completion.
//
//  The adapter must outlive the returned future. The schema and a copy
//  of the document are kept alive by the execution itself.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "execution_result.h"
#include "future.h"
#include "schema.h"
#include "sync_adapter.h"
#include <memory>

namespace gqlpp::executor {

class Executor {
public:
    static promise::Future<ExecutionResult> promiseToExecute(
        const promise::SyncAdapter& adapter,
        std::shared_ptr<const type::Schema> schema,
        const language::Document& document,
        const ExecuteOptions& options = {});
};

inline promise::Future<ExecutionResult> execute(const promise::SyncAdapter& adapter,
                                                std::shared_ptr<const type::Schema> schema,
                                                const language::Document& document,
                                                Value rootValue = Value()) {
    ExecuteOptions options;
    options.rootValue = std::move(rootValue);
    return Executor::promiseToExecute(adapter, std::move(schema), document, options);
}

} // namespace gqlpp::executor
