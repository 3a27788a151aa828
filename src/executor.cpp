// ═══════════════════════════════════════════════════════════════════
//  executor.cpp — Execution of one operation
// ═══════════════════════════════════════════════════════════════════
//
//  Every completion step returns a MaybeFuture<Value>. As long as the
//  resolvers return plain values, completions stay plain values and the
//  whole tree is assembled inline. The first thenable turns its field
//  into a future, and only the selection sets above it are combined
//  with SyncAdapter::all and reassembled through then().
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/executor.h"
#include "gqlpp/console.h"
#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gqlpp::executor {

namespace {

using promise::Future;
using Completion = promise::MaybeFuture<Value>;
using FieldNodes = std::vector<const language::Field*>;
using GroupedFields = std::vector<std::pair<std::string, FieldNodes>>;

Value valueFromAst(const language::ValueNode& node, const Value& variables) {
    using Kind = language::ValueNode::Kind;
    switch (node.kind) {
        case Kind::Variable: {
            auto it = variables.find(node.raw);
            return it == variables.end() ? Value(nullptr) : Value(*it);
        }
        case Kind::Int:
        case Kind::Float:
            return Value::parse(node.raw);
        case Kind::String:
        case Kind::Enum:
            return Value(node.raw);
        case Kind::Boolean:
            return Value(node.raw == "true");
        case Kind::Null:
            return Value(nullptr);
        case Kind::List: {
            Value list = Value::array();
            for (const auto& item : node.items) {
                list.push_back(valueFromAst(item, variables));
            }
            return list;
        }
        case Kind::Object: {
            Value object = Value::object();
            for (const auto& [name, field] : node.fields) {
                object[name] = valueFromAst(field, variables);
            }
            return object;
        }
    }
    return Value(nullptr);
}

std::vector<SourceLocation> locationsOf(const FieldNodes& nodes) {
    std::vector<SourceLocation> locations;
    locations.reserve(nodes.size());
    for (const auto* node : nodes) {
        locations.push_back(node->location);
    }
    return locations;
}

const language::OperationDefinition* selectOperation(const language::Document& document,
                                                     const std::string& operationName,
                                                     std::vector<Error>& errors) {
    if (document.operations.empty()) {
        errors.push_back(Error("Must provide an operation."));
        return nullptr;
    }
    if (operationName.empty()) {
        if (document.operations.size() > 1) {
            errors.push_back(
                Error("Must provide operation name if query contains multiple operations."));
            return nullptr;
        }
        return &document.operations.front();
    }
    for (const auto& operation : document.operations) {
        if (operation.name == operationName) return &operation;
    }
    errors.push_back(Error("Unknown operation named \"" + operationName + "\"."));
    return nullptr;
}

Value coerceVariables(const language::OperationDefinition& operation, const Value& provided,
                      std::vector<Error>& errors) {
    Value coerced = Value::object();
    for (const auto& definition : operation.variables) {
        if (provided.is_object() && provided.contains(definition.name)) {
            const Value& value = provided[definition.name];
            if (value.is_null() && definition.required()) {
                errors.push_back(Error("Variable \"$" + definition.name + "\" of non-null type \"" +
                                       definition.type + "\" must not be null.",
                                       {definition.location}));
            } else {
                coerced[definition.name] = value;
            }
            continue;
        }
        if (definition.defaultValue) {
            coerced[definition.name] = valueFromAst(*definition.defaultValue, Value::object());
            continue;
        }
        if (definition.required()) {
            errors.push_back(Error("Variable \"$" + definition.name + "\" of required type \"" +
                                   definition.type + "\" was not provided.",
                                   {definition.location}));
        }
    }
    return coerced;
}

// ═══════════════════════════════════════════
//  ExecutionContext — state of one execution, shared by its futures
// ═══════════════════════════════════════════
class ExecutionContext : public std::enable_shared_from_this<ExecutionContext> {
public:
    ExecutionContext(const promise::SyncAdapter& adapter,
                     std::shared_ptr<const type::Schema> schema,
                     std::shared_ptr<const language::Document> document,
                     const language::OperationDefinition& operation,
                     ExecuteOptions options,
                     Value variables)
        : adapter_(adapter),
          schema_(std::move(schema)),
          document_(std::move(document)),
          operation_(operation),
          options_(std::move(options)),
          variables_(std::move(variables)) {}

    Future<ExecutionResult> run();

private:
    const promise::SyncAdapter& adapter_;
    std::shared_ptr<const type::Schema> schema_;
    std::shared_ptr<const language::Document> document_;
    const language::OperationDefinition& operation_;
    ExecuteOptions options_;
    Value variables_;
    std::vector<Error> errors_;

    Completion executeOperation();
    Completion executeFields(const type::ObjectType& parentType, const Value& source,
                             const Value& path, const GroupedFields& fields);
    Completion executeFieldsSerially(const type::ObjectType& parentType, const Value& source,
                                     const Value& path,
                                     std::shared_ptr<const GroupedFields> fields,
                                     std::size_t index, Value results);

    std::optional<Completion> resolveField(const type::ObjectType& parentType, const Value& source,
                                           const FieldNodes& nodes, const Value& path);
    Completion completeValueCatchingError(const type::TypeRef& returnType, const FieldNodes& nodes,
                                          const type::ResolveInfo& info, const Value& path,
                                          promise::Resolved result);
    Completion completeValue(const type::TypeRef& returnType, const FieldNodes& nodes,
                             const type::ResolveInfo& info, const Value& path, const Value& result);
    Completion completeListValue(const type::TypeRef& returnType, const FieldNodes& nodes,
                                 const type::ResolveInfo& info, const Value& path,
                                 const Value& result);
    Value handleFieldError(std::exception_ptr error, const type::TypeRef& returnType,
                           const FieldNodes& nodes, const Value& path);

    Future<Value> toFuture(Completion completion) const;
    Value argumentValues(const type::FieldDefinition& definition, const language::Field& node) const;
    bool shouldInclude(const std::vector<language::Directive>& directives) const;
    void collectFields(const type::ObjectType& type, const language::SelectionSet& set,
                       GroupedFields& fields, std::set<std::string>& visitedFragments) const;
    GroupedFields collectSubfields(const type::ObjectType& type, const FieldNodes& nodes) const;
    ExecutionResult buildResult(Value data) const;
};

Future<ExecutionResult> ExecutionContext::run() {
    console::debug("Executing", operation_.operation,
                   operation_.name.empty() ? std::string("(anonymous)") : operation_.name);

    Completion data = executeOperation();
    if (auto* value = std::get_if<Value>(&data)) {
        return adapter_.createFulfilled(buildResult(std::move(*value)));
    }

    auto self = shared_from_this();
    return std::get<Future<Value>>(data).then(
        [self](const Value& value) { return self->buildResult(value); },
        [self](std::exception_ptr error) {
            self->errors_.push_back(Error::located(std::move(error), {}, Value()));
            return self->buildResult(Value(nullptr));
        });
}

Completion ExecutionContext::executeOperation() {
    const type::ObjectType* rootType = nullptr;
    if (operation_.operation == "query") {
        rootType = &schema_->queryType();
    } else if (operation_.operation == "mutation") {
        rootType = schema_->mutationType();
    }
    if (!rootType) {
        errors_.push_back(Error("Schema is not configured for " + operation_.operation + "s.",
                                {operation_.location}));
        return Value(nullptr);
    }

    GroupedFields fields;
    std::set<std::string> visitedFragments;
    collectFields(*rootType, operation_.selectionSet, fields, visitedFragments);

    // A non-null root field that failed synchronously nulls the whole result.
    try {
        if (operation_.operation == "mutation") {
            return executeFieldsSerially(*rootType, options_.rootValue, Value::array(),
                                         std::make_shared<const GroupedFields>(std::move(fields)),
                                         0, Value::object());
        }
        return executeFields(*rootType, options_.rootValue, Value::array(), fields);
    } catch (...) {
        errors_.push_back(Error::located(std::current_exception(), {}, Value()));
        return Value(nullptr);
    }
}

Completion ExecutionContext::executeFields(const type::ObjectType& parentType, const Value& source,
                                           const Value& path, const GroupedFields& fields) {
    std::vector<std::string> names;
    std::vector<Completion> completions;
    bool containsFuture = false;

    for (const auto& [responseName, nodes] : fields) {
        auto completion = resolveField(parentType, source, nodes, appendPath(path, responseName));
        if (!completion) continue;
        containsFuture = containsFuture || std::holds_alternative<Future<Value>>(*completion);
        names.push_back(responseName);
        completions.push_back(std::move(*completion));
    }

    if (!containsFuture) {
        Value results = Value::object();
        for (std::size_t i = 0; i < names.size(); ++i) {
            results[names[i]] = std::move(std::get<Value>(completions[i]));
        }
        return results;
    }

    std::vector<Future<Value>> futures;
    futures.reserve(completions.size());
    for (auto& completion : completions) {
        futures.push_back(toFuture(std::move(completion)));
    }
    return adapter_.all(std::move(futures))
        .then([names = std::move(names)](const std::vector<Value>& values) {
            Value results = Value::object();
            for (std::size_t i = 0; i < names.size(); ++i) {
                results[names[i]] = values[i];
            }
            return results;
        });
}

// Mutation fields run one after another: field N+1 is resolved only
// once field N has completed.
Completion ExecutionContext::executeFieldsSerially(const type::ObjectType& parentType,
                                                   const Value& source, const Value& path,
                                                   std::shared_ptr<const GroupedFields> fields,
                                                   std::size_t index, Value results) {
    for (std::size_t i = index; i < fields->size(); ++i) {
        const auto& [responseName, nodes] = (*fields)[i];
        auto completion = resolveField(parentType, source, nodes, appendPath(path, responseName));
        if (!completion) continue;

        if (auto* value = std::get_if<Value>(&*completion)) {
            results[responseName] = std::move(*value);
            continue;
        }

        auto self = shared_from_this();
        const type::ObjectType* parent = &parentType;
        return std::get<Future<Value>>(*completion).then(
            [self, parent, source, path, fields, i, results, name = responseName](
                const Value& value) mutable -> Completion {
                results[name] = value;
                return self->executeFieldsSerially(*parent, source, path, fields, i + 1,
                                                   std::move(results));
            });
    }
    return results;
}

std::optional<Completion> ExecutionContext::resolveField(const type::ObjectType& parentType,
                                                         const Value& source,
                                                         const FieldNodes& nodes,
                                                         const Value& path) {
    const language::Field& node = *nodes.front();
    const type::FieldDefinition* definition = node.name == "__typename"
        ? &type::Schema::typenameField()
        : parentType.findField(node.name);
    if (!definition) return std::nullopt;

    type::ResolveInfo info;
    info.fieldName = node.name;
    info.parentType = parentType.name();
    info.returnType = definition->type;
    info.path = path;
    info.fieldNodes = nodes;
    info.operation = &operation_;
    info.variables = variables_;
    info.rootValue = options_.rootValue;

    promise::Resolved result;
    try {
        Value args = argumentValues(*definition, node);
        if (definition->resolve) {
            result = definition->resolve(source, args, options_.context, info);
        } else {
            result = type::defaultResolver(source, args, options_.context, info);
        }
    } catch (...) {
        return Completion{handleFieldError(std::current_exception(), definition->type, nodes, path)};
    }
    return completeValueCatchingError(definition->type, nodes, info, path, std::move(result));
}

Completion ExecutionContext::completeValueCatchingError(const type::TypeRef& returnType,
                                                        const FieldNodes& nodes,
                                                        const type::ResolveInfo& info,
                                                        const Value& path,
                                                        promise::Resolved result) {
    try {
        Completion completed;
        if (adapter_.isThenable(result)) {
            auto self = shared_from_this();
            completed = adapter_.convert(std::get<promise::ThenablePtr>(std::move(result)))
                .then([self, returnType, nodes, info, path](const Value& resolved) {
                    return self->completeValue(returnType, nodes, info, path, resolved);
                });
        } else {
            completed = completeValue(returnType, nodes, info, path, std::get<Value>(result));
        }

        if (auto* future = std::get_if<Future<Value>>(&completed)) {
            auto self = shared_from_this();
            return future->otherwise([self, returnType, nodes, path](std::exception_ptr error) {
                return self->handleFieldError(std::move(error), returnType, nodes, path);
            });
        }
        return completed;
    } catch (...) {
        return Completion{handleFieldError(std::current_exception(), returnType, nodes, path)};
    }
}

Completion ExecutionContext::completeValue(const type::TypeRef& returnType, const FieldNodes& nodes,
                                           const type::ResolveInfo& info, const Value& path,
                                           const Value& result) {
    if (returnType.isNonNull()) {
        Completion completed = completeValue(returnType.ofType(), nodes, info, path, result);
        std::string message = "Cannot return null for non-nullable field " + info.parentType +
                              "." + info.fieldName + ".";
        if (const auto* value = std::get_if<Value>(&completed)) {
            if (value->is_null()) throw Error(message);
            return completed;
        }
        return std::get<Future<Value>>(completed).then([message](const Value& value) {
            if (value.is_null()) throw Error(message);
            return value;
        });
    }

    if (result.is_null()) return Value(nullptr);

    if (returnType.isList()) {
        return completeListValue(returnType, nodes, info, path, result);
    }
    if (returnType.isLeaf()) {
        return type::serializeScalar(returnType.name(), result);
    }

    const type::ObjectType* objectType = schema_->findType(returnType.name());
    if (!objectType) {
        throw Error("Unknown type \"" + returnType.name() + "\" for field " + info.parentType +
                    "." + info.fieldName + ".");
    }
    return executeFields(*objectType, result, path, collectSubfields(*objectType, nodes));
}

Completion ExecutionContext::completeListValue(const type::TypeRef& returnType,
                                               const FieldNodes& nodes,
                                               const type::ResolveInfo& info, const Value& path,
                                               const Value& result) {
    if (!result.is_array()) {
        throw Error("Expected Iterable, but did not find one for field " + info.parentType + "." +
                    info.fieldName + ".");
    }

    const type::TypeRef& itemType = returnType.ofType();
    std::vector<Completion> items;
    items.reserve(result.size());
    bool containsFuture = false;

    for (std::size_t i = 0; i < result.size(); ++i) {
        auto item = completeValueCatchingError(itemType, nodes, info, appendPath(path, i),
                                               promise::Resolved(result[i]));
        containsFuture = containsFuture || std::holds_alternative<Future<Value>>(item);
        items.push_back(std::move(item));
    }

    if (!containsFuture) {
        Value list = Value::array();
        for (auto& item : items) {
            list.push_back(std::move(std::get<Value>(item)));
        }
        return list;
    }

    std::vector<Future<Value>> futures;
    futures.reserve(items.size());
    for (auto& item : items) {
        futures.push_back(toFuture(std::move(item)));
    }
    return adapter_.all(std::move(futures)).then([](const std::vector<Value>& values) {
        Value list = Value::array();
        for (const auto& value : values) {
            list.push_back(value);
        }
        return list;
    });
}

// Nullable fields swallow the error into `errors` and become null.
// Non-null fields rethrow it, located, so the parent field absorbs it.
Value ExecutionContext::handleFieldError(std::exception_ptr error, const type::TypeRef& returnType,
                                         const FieldNodes& nodes, const Value& path) {
    Error located = Error::located(std::move(error), locationsOf(nodes), path);
    if (returnType.isNonNull()) {
        throw located;
    }
    console::debug("Field error at", path.dump(), located.what());
    errors_.push_back(std::move(located));
    return Value(nullptr);
}

Future<Value> ExecutionContext::toFuture(Completion completion) const {
    if (auto* value = std::get_if<Value>(&completion)) {
        return adapter_.createFulfilled(std::move(*value));
    }
    return std::get<Future<Value>>(std::move(completion));
}

Value ExecutionContext::argumentValues(const type::FieldDefinition& definition,
                                       const language::Field& node) const {
    Value args = Value::object();
    for (const auto& argument : node.arguments) {
        // A variable that was not supplied counts as an omitted argument.
        if (argument.value.kind == language::ValueNode::Kind::Variable &&
            !variables_.contains(argument.value.raw)) {
            continue;
        }
        args[argument.name] = valueFromAst(argument.value, variables_);
    }

    for (const auto& argument : definition.args) {
        if (!args.contains(argument.name)) {
            if (argument.defaultValue) {
                args[argument.name] = *argument.defaultValue;
            } else if (argument.type.isNonNull()) {
                throw Error("Argument \"" + argument.name + "\" of required type \"" +
                            argument.type.toString() + "\" was not provided.",
                            {node.location});
            }
        } else if (args[argument.name].is_null() && argument.type.isNonNull()) {
            throw Error("Argument \"" + argument.name + "\" of non-null type \"" +
                        argument.type.toString() + "\" must not be null.",
                        {node.location});
        }
    }
    return args;
}

bool ExecutionContext::shouldInclude(const std::vector<language::Directive>& directives) const {
    for (const auto& directive : directives) {
        if (directive.name != "skip" && directive.name != "include") continue;

        bool condition = false;
        for (const auto& argument : directive.arguments) {
            if (argument.name != "if") continue;
            Value value = valueFromAst(argument.value, variables_);
            condition = value.is_boolean() && value.get<bool>();
        }
        if (directive.name == "skip" && condition) return false;
        if (directive.name == "include" && !condition) return false;
    }
    return true;
}

void ExecutionContext::collectFields(const type::ObjectType& type,
                                     const language::SelectionSet& set,
                                     GroupedFields& fields,
                                     std::set<std::string>& visitedFragments) const {
    for (const auto& selection : set) {
        if (const auto* field = std::get_if<language::Field>(&selection.node)) {
            if (!shouldInclude(field->directives)) continue;
            const std::string& name = field->responseName();
            auto it = std::find_if(fields.begin(), fields.end(),
                                   [&](const auto& entry) { return entry.first == name; });
            if (it == fields.end()) {
                fields.emplace_back(name, FieldNodes{field});
            } else {
                it->second.push_back(field);
            }
        } else if (const auto* spread = std::get_if<language::FragmentSpread>(&selection.node)) {
            if (!shouldInclude(spread->directives)) continue;
            if (!visitedFragments.insert(spread->name).second) continue;
            const auto* fragment = document_->findFragment(spread->name);
            if (!fragment || fragment->typeCondition != type.name()) continue;
            collectFields(type, fragment->selectionSet, fields, visitedFragments);
        } else {
            const auto& inlineFragment = std::get<language::InlineFragment>(selection.node);
            if (!shouldInclude(inlineFragment.directives)) continue;
            if (inlineFragment.typeCondition && *inlineFragment.typeCondition != type.name()) continue;
            collectFields(type, inlineFragment.selectionSet, fields, visitedFragments);
        }
    }
}

GroupedFields ExecutionContext::collectSubfields(const type::ObjectType& type,
                                                 const FieldNodes& nodes) const {
    GroupedFields fields;
    std::set<std::string> visitedFragments;
    for (const auto* node : nodes) {
        collectFields(type, node->selectionSet, fields, visitedFragments);
    }
    return fields;
}

ExecutionResult ExecutionContext::buildResult(Value data) const {
    ExecutionResult result;
    result.data = std::move(data);
    result.errors = errors_;
    return result;
}

} // namespace

promise::Future<ExecutionResult> Executor::promiseToExecute(const promise::SyncAdapter& adapter,
                                                            std::shared_ptr<const type::Schema> schema,
                                                            const language::Document& document,
                                                            const ExecuteOptions& options) {
    auto owned = std::make_shared<const language::Document>(document);

    std::vector<Error> errors;
    const auto* operation = selectOperation(*owned, options.operationName, errors);
    Value variables = Value::object();
    if (operation) {
        variables = coerceVariables(*operation, options.variables, errors);
    }
    if (!errors.empty()) {
        console::debug("Execution stopped before resolving any field:", errors.front().what());
        return adapter.createFulfilled(ExecutionResult::failure(std::move(errors)));
    }

    auto context = std::make_shared<ExecutionContext>(adapter, std::move(schema), std::move(owned),
                                                      *operation, options, std::move(variables));
    return context->run();
}

} // namespace gqlpp::executor
