// ═══════════════════════════════════════════════════════════════════
//  test_executor.cpp — Field resolution, errors and synchronization
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/executor.h"
#include "gqlpp/parser.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace gqlpp;

namespace {

using type::ResolveInfo;
using type::TypeRef;

Value json(const char* text) {
    return Value::parse(text);
}

Value arg(const Value& args, const std::string& name) {
    auto it = args.find(name);
    return it == args.end() ? Value() : Value(*it);
}

type::FieldResolver returns(Value value) {
    return [value](const Value&, const Value&, const Value&, const ResolveInfo&) -> promise::Resolved {
        return value;
    };
}

type::FieldResolver returnsLater(Value value) {
    return [value](const Value&, const Value&, const Value&, const ResolveInfo&) {
        return promise::defer([value] { return value; });
    };
}

type::FieldResolver throws(std::string message) {
    return [message](const Value&, const Value&, const Value&, const ResolveInfo&) -> promise::Resolved {
        throw Error(message);
    };
}

type::FieldResolver throwsLater(std::string message) {
    return [message](const Value&, const Value&, const Value&, const ResolveInfo&) {
        return promise::defer([message]() -> Value { throw Error(message); });
    };
}

class RejectingThenable : public promise::Thenable {
public:
    void then(OnFulfilled, OnRejected onRejected) override {
        onRejected(std::make_exception_ptr(Error("remote failed")));
    }
};

std::shared_ptr<const type::Schema> buildSchema() {
    type::ObjectType child("Child");
    child.field("ok", TypeRef::string(), returns("fine"))
        .field("bad", TypeRef::nonNull(TypeRef::string()), throws("bad failed"))
        .field("badLater", TypeRef::nonNull(TypeRef::string()), throwsLater("bad failed later"))
        .field("nothing", TypeRef::nonNull(TypeRef::string()), returns(nullptr));

    type::ObjectType user("User");
    user.field("name", TypeRef::string())
        .field("lazyName", TypeRef::string(),
               [](const Value& source, const Value&, const Value&, const ResolveInfo&) {
                   Value name = arg(source, "name");
                   return promise::defer([name] { return name; });
               });

    Value people = json(R"([{"name": "Ada"}, {"name": "Grace"}])");

    type::ObjectType query("Query");
    query.field("syncField", TypeRef::string(), returns("sync"))
        .field("asyncField", TypeRef::string(), returnsLater("async"))
        .field("syncError", TypeRef::string(), throws("sync failure"))
        .field("asyncError", TypeRef::string(), throwsLater("async failure"))
        .field("required", TypeRef::nonNull(TypeRef::string()), throws("required failed"))
        .field("requiredLater", TypeRef::nonNull(TypeRef::string()),
               throwsLater("required failed later"))
        .field("child", TypeRef::object("Child"), returns(Value::object()))
        .field("lazyChild", TypeRef::object("Child"), returnsLater(Value::object()))
        .field("numbers", TypeRef::listOf(TypeRef::integer()), returns(json("[1, 2, 3]")))
        .field("mixed", TypeRef::listOf(TypeRef::integer()), returns(json(R"([1, "x", 3])")))
        .field("strict", TypeRef::listOf(TypeRef::nonNull(TypeRef::integer())),
               returns(json(R"([1, "x"])")))
        .field("notList", TypeRef::listOf(TypeRef::integer()), returns(5))
        .field("whole", TypeRef::integer(), returns(42.0))
        .field("tooBig", TypeRef::integer(), returns(1e20))
        .field("huge", TypeRef::integer(), returns(std::numeric_limits<std::uint64_t>::max()))
        .field("users", TypeRef::listOf(TypeRef::object("User")), returns(people))
        .field("lazyUsers", TypeRef::listOf(TypeRef::object("User")), returnsLater(people))
        .field("echo", TypeRef::string(),
               [](const Value&, const Value& args, const Value&, const ResolveInfo&)
                   -> promise::Resolved { return arg(args, "value"); },
               {{"value", TypeRef::string(), Value("default")}})
        .field("need", TypeRef::id(),
               [](const Value&, const Value& args, const Value&, const ResolveInfo&)
                   -> promise::Resolved { return arg(args, "id"); },
               {{"id", TypeRef::nonNull(TypeRef::id()), std::nullopt}})
        .field("double", TypeRef::integer(),
               [](const Value&, const Value& args, const Value&, const ResolveInfo&)
                   -> promise::Resolved {
                   Value n = arg(args, "n");
                   return n.is_null() ? Value(nullptr) : Value(n.get<int>() * 2);
               },
               {{"n", TypeRef::integer(), std::nullopt}})
        .field("context", TypeRef::string(),
               [](const Value&, const Value&, const Value& context, const ResolveInfo&)
                   -> promise::Resolved { return arg(context, "user"); })
        .field("root", TypeRef::string(),
               [](const Value& source, const Value&, const Value&, const ResolveInfo&)
                   -> promise::Resolved { return source; })
        .field("info", TypeRef::string(),
               [](const Value&, const Value&, const Value&, const ResolveInfo& info)
                   -> promise::Resolved {
                   return Value(info.parentType + "." + info.fieldName + " at " + info.path.dump());
               })
        .field("plain", TypeRef::string())
        .field("remote", TypeRef::string(),
               [](const Value&, const Value&, const Value&, const ResolveInfo&)
                   -> promise::Resolved {
                   return promise::ThenablePtr(std::make_shared<RejectingThenable>());
               })
        .field("odd", TypeRef::string(),
               [](const Value&, const Value&, const Value&, const ResolveInfo&)
                   -> promise::Resolved { throw 42; });

    return std::make_shared<type::Schema>(query, std::nullopt,
                                          std::vector<type::ObjectType>{child, user});
}

} // namespace

class ExecutorTest : public ::testing::Test {
protected:
    promise::SyncAdapter adapter;
    std::shared_ptr<const type::Schema> schema = buildSchema();

    promise::Future<ExecutionResult> start(const std::string& source,
                                           const ExecuteOptions& options = {}) {
        return executor::Executor::promiseToExecute(adapter, schema, language::parse(source),
                                                    options);
    }

    Value run(const std::string& source, const ExecuteOptions& options = {}) {
        return adapter.wait(start(source, options)).toJson();
    }
};

// ═══════════════════════════════════════════
//  Synchronization policy
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, PlainValuesCollapseToFulfilledResult) {
    auto result = start("{ syncField child { ok } numbers }");

    ASSERT_TRUE(result.isFulfilled());
    EXPECT_TRUE(adapter.queue().empty());
    EXPECT_EQ(result.value().toJson(),
              json(R"({"data": {"syncField": "sync", "child": {"ok": "fine"}, "numbers": [1, 2, 3]}})"));
}

TEST_F(ExecutorTest, ThenableFieldLeavesResultPending) {
    auto result = start("{ syncField asyncField }");

    EXPECT_TRUE(result.isPending());
    EXPECT_EQ(adapter.wait(result).toJson(),
              json(R"({"data": {"syncField": "sync", "asyncField": "async"}})"));
}

TEST_F(ExecutorTest, DeferredDataMatchesSynchronousData) {
    auto sync = run("{ c: child { ok } u: users { n: name } }");
    auto later = run("{ c: lazyChild { ok } u: lazyUsers { n: lazyName } }");
    EXPECT_EQ(sync, later);
}

TEST_F(ExecutorTest, FieldOrderFollowsSelection) {
    EXPECT_EQ(run("{ asyncField syncField numbers }"),
              json(R"({"data": {"asyncField": "async", "syncField": "sync", "numbers": [1, 2, 3]}})"));
}

// ═══════════════════════════════════════════
//  Field errors
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, SyncErrorDoesNotAffectSiblings) {
    EXPECT_EQ(run("{ syncError syncField }"), json(R"({
        "data": {"syncError": null, "syncField": "sync"},
        "errors": [{"message": "sync failure", "locations": [{"line": 1, "column": 3}], "path": ["syncError"]}]
    })"));
}

TEST_F(ExecutorTest, SiblingIsolationHoldsInEitherOrder) {
    auto first = adapter.wait(start("{ asyncError asyncField }"));
    auto second = adapter.wait(start("{ asyncField asyncError }"));

    ASSERT_TRUE(first.data.has_value());
    EXPECT_EQ(*first.data, json(R"({"asyncError": null, "asyncField": "async"})"));
    ASSERT_EQ(first.errors.size(), 1u);
    EXPECT_STREQ(first.errors[0].what(), "async failure");
    EXPECT_EQ(first.errors[0].path(), json(R"(["asyncError"])"));

    ASSERT_TRUE(second.data.has_value());
    EXPECT_EQ(*second.data, json(R"({"asyncField": "async", "asyncError": null})"));
    ASSERT_EQ(second.errors.size(), 1u);
    EXPECT_EQ(second.errors[0].path(), json(R"(["asyncError"])"));
}

TEST_F(ExecutorTest, NonNullErrorNullsNearestNullableParent) {
    EXPECT_EQ(run("{ child { ok bad } }"), json(R"({
        "data": {"child": null},
        "errors": [{"message": "bad failed", "locations": [{"line": 1, "column": 14}], "path": ["child", "bad"]}]
    })"));
}

TEST_F(ExecutorTest, DeferredNonNullErrorNullsNearestNullableParent) {
    EXPECT_EQ(run("{ lazyChild { ok badLater } syncField }"), json(R"({
        "data": {"lazyChild": null, "syncField": "sync"},
        "errors": [{"message": "bad failed later", "locations": [{"line": 1, "column": 18}], "path": ["lazyChild", "badLater"]}]
    })"));
}

TEST_F(ExecutorTest, NullForNonNullField) {
    auto result = adapter.wait(start("{ child { nothing } }"));

    EXPECT_EQ(*result.data, json(R"({"child": null})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(), "Cannot return null for non-nullable field Child.nothing.");
    EXPECT_EQ(result.errors[0].path(), json(R"(["child", "nothing"])"));
}

TEST_F(ExecutorTest, NonNullRootFieldNullsData) {
    EXPECT_EQ(run("{ required }"), json(R"({
        "data": null,
        "errors": [{"message": "required failed", "locations": [{"line": 1, "column": 3}], "path": ["required"]}]
    })"));
}

TEST_F(ExecutorTest, DeferredNonNullRootFieldNullsData) {
    auto result = adapter.wait(start("{ syncField requiredLater }"));

    ASSERT_TRUE(result.data.has_value());
    EXPECT_TRUE(result.data->is_null());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(), "required failed later");
    EXPECT_EQ(result.errors[0].path(), json(R"(["requiredLater"])"));
}

TEST_F(ExecutorTest, RejectedThenableBecomesFieldError) {
    auto result = adapter.wait(start("{ remote syncField }"));

    EXPECT_EQ(*result.data, json(R"({"remote": null, "syncField": "sync"})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(), "remote failed");
}

TEST_F(ExecutorTest, NonStandardExceptionBecomesUnknownError) {
    auto result = adapter.wait(start("{ odd }"));

    EXPECT_EQ(*result.data, json(R"({"odd": null})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(), "Unknown error");
}

// ═══════════════════════════════════════════
//  Lists
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, ListsOfScalarsAndObjects) {
    EXPECT_EQ(run("{ numbers users { name } }"), json(R"({"data": {
        "numbers": [1, 2, 3],
        "users": [{"name": "Ada"}, {"name": "Grace"}]
    }})"));
}

TEST_F(ExecutorTest, ListItemErrorsAreIsolated) {
    EXPECT_EQ(run("{ mixed }"), json(R"({
        "data": {"mixed": [1, null, 3]},
        "errors": [{"message": "Int cannot represent non-integer value: \"x\"", "locations": [{"line": 1, "column": 3}], "path": ["mixed", 1]}]
    })"));
}

TEST_F(ExecutorTest, NonNullItemErrorNullsTheList) {
    auto result = adapter.wait(start("{ strict }"));

    EXPECT_EQ(*result.data, json(R"({"strict": null})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path(), json(R"(["strict", 1])"));
}

TEST_F(ExecutorTest, NonListValueForListField) {
    auto result = adapter.wait(start("{ notList }"));

    EXPECT_EQ(*result.data, json(R"({"notList": null})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(),
                 "Expected Iterable, but did not find one for field Query.notList.");
}

// ═══════════════════════════════════════════
//  Int serialization
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, IntegralFloatSerializesAsInt) {
    EXPECT_EQ(run("{ whole }"), json(R"({"data": {"whole": 42}})"));
}

TEST_F(ExecutorTest, UnsignedOutOfRangeIsAFieldError) {
    EXPECT_EQ(run("{ huge }"), json(R"({
        "data": {"huge": null},
        "errors": [{"message": "Int cannot represent non 32-bit signed integer value: 18446744073709551615", "locations": [{"line": 1, "column": 3}], "path": ["huge"]}]
    })"));
}

TEST_F(ExecutorTest, LargeFloatIsAFieldError) {
    auto result = adapter.wait(start("{ tooBig syncField }"));

    EXPECT_EQ(*result.data, json(R"({"tooBig": null, "syncField": "sync"})"));
    ASSERT_EQ(result.errors.size(), 1u);
    std::string message = result.errors[0].what();
    EXPECT_EQ(message, "Int cannot represent non 32-bit signed integer value: " + inspect(Value(1e20)));
    EXPECT_EQ(message.find("-9223372036854775808"), std::string::npos);
}

TEST_F(ExecutorTest, DeferredListItems) {
    auto result = start("{ lazyUsers { lazyName } }");

    EXPECT_TRUE(result.isPending());
    EXPECT_EQ(adapter.wait(result).toJson(), json(R"({"data": {
        "lazyUsers": [{"lazyName": "Ada"}, {"lazyName": "Grace"}]
    }})"));
}

// ═══════════════════════════════════════════
//  Field collection
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, FragmentsAndAliases) {
    EXPECT_EQ(run(R"(
        { ...F ... on Query { asyncField } alias: syncField }
        fragment F on Query { syncField }
    )"), json(R"({"data": {"syncField": "sync", "asyncField": "async", "alias": "sync"}})"));
}

TEST_F(ExecutorTest, MergesFieldsWithTheSameResponseName) {
    EXPECT_EQ(run("{ users { name } users { lazyName } }"), json(R"({"data": {"users": [
        {"name": "Ada", "lazyName": "Ada"},
        {"name": "Grace", "lazyName": "Grace"}
    ]}})"));
}

TEST_F(ExecutorTest, Typename) {
    EXPECT_EQ(run("{ __typename child { __typename ok } }"),
              json(R"({"data": {"__typename": "Query", "child": {"__typename": "Child", "ok": "fine"}}})"));
}

TEST_F(ExecutorTest, InlineFragmentOnOtherTypeIsSkipped) {
    EXPECT_EQ(run("{ child { ... on Query { syncField } ok } }"),
              json(R"({"data": {"child": {"ok": "fine"}}})"));
}

TEST_F(ExecutorTest, UnknownFieldsAreOmitted) {
    EXPECT_EQ(run("{ missing syncField }"), json(R"({"data": {"syncField": "sync"}})"));
}

TEST_F(ExecutorTest, SkipAndIncludeDirectives) {
    const char* source = "query Q($s: Boolean!) { syncField @skip(if: $s) asyncField @include(if: $s) }";

    ExecuteOptions on;
    on.variables = json(R"({"s": true})");
    EXPECT_EQ(run(source, on), json(R"({"data": {"asyncField": "async"}})"));

    ExecuteOptions off;
    off.variables = json(R"({"s": false})");
    EXPECT_EQ(run(source, off), json(R"({"data": {"syncField": "sync"}})"));
}

TEST_F(ExecutorTest, DirectivesOnFragments) {
    EXPECT_EQ(run(R"(
        { ...F @skip(if: true) ... @include(if: true) { asyncField } }
        fragment F on Query { syncField }
    )"), json(R"({"data": {"asyncField": "async"}})"));
}

// ═══════════════════════════════════════════
//  Arguments and variables
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, ArgumentLiteralsAndDefaults) {
    EXPECT_EQ(run(R"({ a: echo b: echo(value: "hi") c: need(id: 7) })"),
              json(R"({"data": {"a": "default", "b": "hi", "c": "7"}})"));
}

TEST_F(ExecutorTest, ArgumentFromVariable) {
    const char* source = "query Q($v: String) { echo(value: $v) }";

    ExecuteOptions options;
    options.variables = json(R"({"v": "var"})");
    EXPECT_EQ(run(source, options), json(R"({"data": {"echo": "var"}})"));

    EXPECT_EQ(run(source), json(R"({"data": {"echo": "default"}})"));
}

TEST_F(ExecutorTest, MissingRequiredArgument) {
    EXPECT_EQ(run("{ need }"), json(R"({
        "data": {"need": null},
        "errors": [{"message": "Argument \"id\" of required type \"ID!\" was not provided.", "locations": [{"line": 1, "column": 3}], "path": ["need"]}]
    })"));
}

TEST_F(ExecutorTest, VariableDefaults) {
    EXPECT_EQ(run("query Q($n: Int = 5) { double(n: $n) }"),
              json(R"({"data": {"double": 10}})"));
}

TEST_F(ExecutorTest, MissingRequiredVariableStopsExecution) {
    auto result = start("query Q($n: Int!) { double(n: $n) }");

    ASSERT_TRUE(result.isFulfilled());
    EXPECT_FALSE(result.value().data.has_value());
    EXPECT_EQ(result.value().toJson(), json(R"({"errors": [{
        "message": "Variable \"$n\" of required type \"Int!\" was not provided.",
        "locations": [{"line": 1, "column": 9}]
    }]})"));
}

TEST_F(ExecutorTest, NullForNonNullVariable) {
    ExecuteOptions options;
    options.variables = json(R"({"n": null})");
    auto result = adapter.wait(start("query Q($n: Int!) { double(n: $n) }", options));

    EXPECT_FALSE(result.data.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_STREQ(result.errors[0].what(), "Variable \"$n\" of non-null type \"Int!\" must not be null.");
}

// ═══════════════════════════════════════════
//  Operations, root value and context
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, EmptyDocumentHasNoOperation) {
    auto result = executor::Executor::promiseToExecute(adapter, schema, language::Document{});

    ASSERT_TRUE(result.isFulfilled());
    EXPECT_FALSE(result.value().data.has_value());
    EXPECT_EQ(result.value().toJson(), json(R"({"errors": [{"message": "Must provide an operation."}]})"));
}

TEST_F(ExecutorTest, OperationSelection) {
    const char* source = "query A { syncField } query B { asyncField }";

    auto ambiguous = adapter.wait(start(source));
    ASSERT_EQ(ambiguous.errors.size(), 1u);
    EXPECT_STREQ(ambiguous.errors[0].what(),
                 "Must provide operation name if query contains multiple operations.");

    ExecuteOptions unknown;
    unknown.operationName = "C";
    auto missing = adapter.wait(start(source, unknown));
    ASSERT_EQ(missing.errors.size(), 1u);
    EXPECT_STREQ(missing.errors[0].what(), "Unknown operation named \"C\".");

    ExecuteOptions named;
    named.operationName = "B";
    EXPECT_EQ(run(source, named), json(R"({"data": {"asyncField": "async"}})"));
}

TEST_F(ExecutorTest, RootValueContextAndInfoReachResolvers) {
    ExecuteOptions options;
    options.rootValue = "rootValue";
    options.context = json(R"({"user": "ada"})");

    EXPECT_EQ(run("{ context root info }", options), json(R"({"data": {
        "context": "ada",
        "root": "rootValue",
        "info": "Query.info at [\"info\"]"
    }})"));
}

TEST_F(ExecutorTest, DefaultResolverReadsSourceProperty) {
    ExecuteOptions options;
    options.rootValue = json(R"({"plain": "from root"})");
    EXPECT_EQ(run("{ plain }", options), json(R"({"data": {"plain": "from root"}})"));
}

TEST_F(ExecutorTest, MissingRootTypeNullsData) {
    EXPECT_EQ(run("mutation { syncField }"), json(R"({
        "data": null,
        "errors": [{"message": "Schema is not configured for mutations.", "locations": [{"line": 1, "column": 1}]}]
    })"));
    EXPECT_EQ(run("subscription { syncField }"), json(R"({
        "data": null,
        "errors": [{"message": "Schema is not configured for subscriptions.", "locations": [{"line": 1, "column": 1}]}]
    })"));
}

TEST_F(ExecutorTest, ExecutionOutlivesTheDocument) {
    promise::Future<ExecutionResult> result;
    {
        auto document = language::parse("{ asyncField }");
        result = executor::execute(adapter, schema, document);
    }
    EXPECT_EQ(adapter.wait(result).toJson(), json(R"({"data": {"asyncField": "async"}})"));
}

// ═══════════════════════════════════════════
//  Mutations
// ═══════════════════════════════════════════

namespace {

type::FieldResolver loggedLater(std::vector<std::string>& log, std::string name) {
    return [&log, name](const Value&, const Value&, const Value&, const ResolveInfo&) {
        log.push_back("resolve " + name);
        return promise::defer([&log, name] {
            log.push_back("compute " + name);
            return Value(name);
        });
    };
}

} // namespace

TEST(ExecutorMutationTest, TopLevelMutationFieldsRunSerially) {
    std::vector<std::string> log;

    type::ObjectType query("Query");
    query.field("first", TypeRef::string(), loggedLater(log, "first"))
        .field("second", TypeRef::string(), loggedLater(log, "second"));

    type::ObjectType mutation("Mutation");
    mutation.field("first", TypeRef::string(), loggedLater(log, "first"))
        .field("second", TypeRef::string(), loggedLater(log, "second"));

    auto schema = std::make_shared<const type::Schema>(query, mutation);
    promise::SyncAdapter adapter;

    auto queried = executor::execute(adapter, schema, language::parse("{ first second }"));
    adapter.wait(queried);
    EXPECT_EQ(log, (std::vector<std::string>{
        "resolve first", "resolve second", "compute first", "compute second"}));

    log.clear();
    auto mutated = executor::execute(adapter, schema, language::parse("mutation { first second }"));
    EXPECT_TRUE(mutated.isPending());
    EXPECT_EQ(adapter.wait(mutated).toJson(), json(R"({"data": {"first": "first", "second": "second"}})"));
    EXPECT_EQ(log, (std::vector<std::string>{
        "resolve first", "compute first", "resolve second", "compute second"}));
}

TEST(ExecutorMutationTest, SynchronousMutationCollapses) {
    type::ObjectType query("Query");
    query.field("syncField", TypeRef::string(), returns("rootValue"));
    type::ObjectType mutation("Mutation");
    mutation.field("syncField", TypeRef::string(),
                   [](const Value& source, const Value&, const Value&, const ResolveInfo&)
                       -> promise::Resolved { return source; });

    auto schema = std::make_shared<const type::Schema>(query, mutation);
    promise::SyncAdapter adapter;
    auto result = executor::execute(adapter, schema, language::parse("mutation { syncField }"),
                                    Value("rootValue"));

    ASSERT_TRUE(result.isFulfilled());
    EXPECT_EQ(result.value().toJson(), json(R"({"data": {"syncField": "rootValue"}})"));
}
