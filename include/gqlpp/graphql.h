#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/graphql.h — Parse, validate and execute a request
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    promise::SyncAdapter adapter;
//    auto result = gqlpp::promiseToExecute(adapter, schema, "{ hello }");
//    // result.isFulfilled() when every resolver answered synchronously
//    auto json = adapter.wait(result).toJson();
//
//    auto same = gqlpp::executeSync(schema, "{ hello }");
//
//  Syntax and validation errors never raise: they come back as an
//  already fulfilled result with `errors` set and no `data`.
//
// ═══════════════════════════════════════════════════════════════════

#include "execution_result.h"
#include "future.h"
#include "schema.h"
#include "sync_adapter.h"
#include <memory>
#include <string>

namespace gqlpp {

promise::Future<ExecutionResult> promiseToExecute(const promise::SyncAdapter& adapter,
                                                  std::shared_ptr<const type::Schema> schema,
                                                  const std::string& source,
                                                  const ExecuteOptions& options = {});

// Runs the request on a private adapter and drains it. Throws
// DeadlockError if a resolver hands back work that never completes.
ExecutionResult executeSync(std::shared_ptr<const type::Schema> schema,
                            const std::string& source,
                            const ExecuteOptions& options = {});

} // namespace gqlpp
