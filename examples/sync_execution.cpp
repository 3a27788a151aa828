// ═══════════════════════════════════════════════════════════════════
//  sync_execution.cpp — Synchronous-when-possible GraphQL execution
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Defining a schema with plain and deferred resolvers
//    • A query that completes without draining anything
//    • A query whose result stays pending until SyncAdapter::wait
//    • Field errors, mutations and executeSync()
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/gqlpp.h"
#include <vector>

using namespace gqlpp;

static Value users = Value::parse(R"([
    {"id": 1, "name": "Alice", "email": "alice@example.com"},
    {"id": 2, "name": "Bob",   "email": "bob@example.com"}
])");
static int nextId = 3;

static const char* stateOf(const promise::Future<ExecutionResult>& result) {
    return promise::toString(result.state());
}

int main() {
    console::setLevel(console::Level::Debug);

    // ── Define schema ──
    type::ObjectType user("User");
    user.field("id", type::TypeRef::nonNull(type::TypeRef::id()))
        .field("name", type::TypeRef::string())
        .field("email", type::TypeRef::string());

    type::ObjectType query("Query");

    // Query: users — answered right away
    query.field("users", type::TypeRef::listOf(type::TypeRef::object("User")),
                [](const Value&, const Value&, const Value&, const type::ResolveInfo&)
                    -> promise::Resolved { return users; });

    // Query: user(id) — answered once the queue is drained
    query.field("user", type::TypeRef::object("User"),
                [](const Value&, const Value& args, const Value&, const type::ResolveInfo&) {
                    int id = std::stoi(args["id"].get<std::string>());
                    return promise::defer([id] {
                        for (const auto& entry : users) {
                            if (entry["id"] == id) return entry;
                        }
                        throw Error("User not found with id " + std::to_string(id));
                    });
                },
                {{"id", type::TypeRef::nonNull(type::TypeRef::id()), std::nullopt}});

    type::ObjectType mutation("Mutation");

    // Mutation: createUser(name, email)
    mutation.field("createUser", type::TypeRef::object("User"),
                   [](const Value&, const Value& args, const Value&, const type::ResolveInfo&)
                       -> promise::Resolved {
                       Value created = {{"id", nextId++},
                                        {"name", args["name"]},
                                        {"email", args["email"]}};
                       users.push_back(created);
                       return created;
                   },
                   {{"name", type::TypeRef::nonNull(type::TypeRef::string()), std::nullopt},
                    {"email", type::TypeRef::string(), Value(nullptr)}});

    auto schema = std::make_shared<const type::Schema>(query, mutation,
                                                       std::vector<type::ObjectType>{user});
    promise::SyncAdapter adapter;

    // ── All resolvers synchronous: fulfilled immediately ──
    auto listed = gqlpp::promiseToExecute(adapter, schema, "{ users { id name } }");
    console::info("users query is", stateOf(listed), "with", adapter.queue().size(), "queued tasks");
    console::log(listed.value().toJson());

    // ── One deferred field: pending until drained ──
    auto found = gqlpp::promiseToExecute(adapter, schema,
                                         R"({ users { name } user(id: "2") { name email } })");
    console::info("user query is", stateOf(found));
    console::log(adapter.wait(found).toJson());
    console::info("drained", adapter.queue().processed(), "tasks so far");

    // ── Field errors land in `errors` next to partial data ──
    auto missing = gqlpp::promiseToExecute(adapter, schema,
                                           R"({ a: user(id: "1") { name } b: user(id: "9") { name } })");
    console::warn(adapter.wait(missing).toJson());

    // ── Mutations and executeSync ──
    auto created = executeSync(schema,
                               R"(mutation { createUser(name: "Carol", email: "carol@example.com") { id name } })");
    console::success(created.toJson());

    auto invalid = executeSync(schema, "{ users { nickname } }");
    console::error(invalid.toJson());

    return 0;
}
