// ═══════════════════════════════════════════════════════════════════
//  src/graphql.cpp — Request pipeline: parse, validate, execute
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/graphql.h"
#include "gqlpp/console.h"
#include "gqlpp/executor.h"
#include "gqlpp/parser.h"
#include "gqlpp/validator.h"

namespace gqlpp {

promise::Future<ExecutionResult> promiseToExecute(const promise::SyncAdapter& adapter,
                                                  std::shared_ptr<const type::Schema> schema,
                                                  const std::string& source,
                                                  const ExecuteOptions& options) {
    language::Document document;
    try {
        document = language::parse(source);
    } catch (const SyntaxError& e) {
        console::debug("Rejected request:", e.what());
        return adapter.createFulfilled(ExecutionResult::failure({e}));
    }

    auto errors = validator::validate(*schema, document);
    if (!errors.empty()) {
        console::debug("Rejected request with", errors.size(), "validation error(s)");
        return adapter.createFulfilled(ExecutionResult::failure(std::move(errors)));
    }

    return executor::Executor::promiseToExecute(adapter, std::move(schema), document, options);
}

ExecutionResult executeSync(std::shared_ptr<const type::Schema> schema,
                            const std::string& source,
                            const ExecuteOptions& options) {
    promise::SyncAdapter adapter;
    auto result = promiseToExecute(adapter, std::move(schema), source, options);
    return adapter.wait(result);
}

} // namespace gqlpp
