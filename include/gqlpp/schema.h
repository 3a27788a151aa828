#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/schema.h — Object types, fields, resolvers and the schema
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    type::ObjectType query("Query");
//    query.field("hello", type::TypeRef::string(),
//        [](const Value&, const Value&, const Value&, const type::ResolveInfo&)
//            -> promise::Resolved { return Value("world"); });
//    auto schema = std::make_shared<type::Schema>(query);
//
//  Object types are referenced by name (TypeRef::object("User")) and
//  looked up in the schema, so types may refer to each other freely.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "thenable.h"
#include "value.h"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gqlpp::type {

// ═══════════════════════════════════════════
//  TypeRef — String, [User!]!, ...
// ═══════════════════════════════════════════
class TypeRef {
public:
    enum class Kind { Scalar, Object, List, NonNull };

    static TypeRef scalar(std::string name) { return TypeRef(Kind::Scalar, std::move(name)); }
    static TypeRef string() { return scalar("String"); }
    static TypeRef integer() { return scalar("Int"); }
    static TypeRef floating() { return scalar("Float"); }
    static TypeRef boolean() { return scalar("Boolean"); }
    static TypeRef id() { return scalar("ID"); }
    static TypeRef object(std::string name) { return TypeRef(Kind::Object, std::move(name)); }

    static TypeRef listOf(TypeRef item) {
        TypeRef list(Kind::List, "");
        list.ofType_ = std::make_shared<TypeRef>(std::move(item));
        return list;
    }

    static TypeRef nonNull(TypeRef inner) {
        if (inner.isNonNull()) return inner;
        TypeRef wrapped(Kind::NonNull, "");
        wrapped.ofType_ = std::make_shared<TypeRef>(std::move(inner));
        return wrapped;
    }

    Kind kind() const { return kind_; }
    bool isNonNull() const { return kind_ == Kind::NonNull; }
    bool isList() const { return kind_ == Kind::List; }
    bool isLeaf() const { return kind_ == Kind::Scalar; }
    bool isObject() const { return kind_ == Kind::Object; }

    const TypeRef& ofType() const {
        if (!ofType_) throw std::logic_error("Type " + toString() + " does not wrap another type");
        return *ofType_;
    }

    // Innermost scalar or object type.
    const TypeRef& namedType() const { return ofType_ ? ofType_->namedType() : *this; }

    // Scalar or object name; empty for wrappers.
    const std::string& name() const { return name_; }

    std::string toString() const {
        switch (kind_) {
            case Kind::List:    return "[" + ofType_->toString() + "]";
            case Kind::NonNull: return ofType_->toString() + "!";
            default:            return name_;
        }
    }

private:
    TypeRef(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

    Kind kind_;
    std::string name_;
    std::shared_ptr<TypeRef> ofType_;
};

// ═══════════════════════════════════════════
//  Resolver contract
// ═══════════════════════════════════════════
struct ResolveInfo {
    std::string fieldName;
    std::string parentType;
    TypeRef returnType = TypeRef::string();
    Value path;
    std::vector<const language::Field*> fieldNodes;
    const language::OperationDefinition* operation = nullptr;
    Value variables;
    Value rootValue;
};

using FieldResolver = std::function<promise::Resolved(
    const Value& source, const Value& args, const Value& context, const ResolveInfo& info)>;

// ── Property of the same name on an object source, else null ──
inline promise::Resolved defaultResolver(const Value& source, const Value&, const Value&,
                                         const ResolveInfo& info) {
    if (source.is_object()) {
        auto it = source.find(info.fieldName);
        if (it != source.end()) return Value(*it);
    }
    return Value(nullptr);
}

struct ArgumentDefinition {
    std::string name;
    TypeRef type;
    std::optional<Value> defaultValue;
};

struct FieldDefinition {
    std::string name;
    TypeRef type;
    FieldResolver resolve;
    std::vector<ArgumentDefinition> args;
};

// ═══════════════════════════════════════════
//  class ObjectType
// ═══════════════════════════════════════════
class ObjectType {
public:
    explicit ObjectType(std::string name) : name_(std::move(name)) {}

    ObjectType& field(std::string fieldName, TypeRef type, FieldResolver resolve = nullptr,
                      std::vector<ArgumentDefinition> args = {}) {
        return field(FieldDefinition{std::move(fieldName), std::move(type), std::move(resolve),
                                     std::move(args)});
    }

    ObjectType& field(FieldDefinition definition) {
        auto it = index_.find(definition.name);
        if (it != index_.end()) {
            fields_[it->second] = std::move(definition);
            return *this;
        }
        index_[definition.name] = fields_.size();
        fields_.push_back(std::move(definition));
        return *this;
    }

    const std::string& name() const { return name_; }
    const std::vector<FieldDefinition>& fields() const { return fields_; }

    const FieldDefinition* findField(const std::string& fieldName) const {
        auto it = index_.find(fieldName);
        return it == index_.end() ? nullptr : &fields_[it->second];
    }

private:
    std::string name_;
    std::vector<FieldDefinition> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ═══════════════════════════════════════════
//  class Schema
// ═══════════════════════════════════════════
class Schema {
public:
    explicit Schema(ObjectType query,
                    std::optional<ObjectType> mutation = std::nullopt,
                    std::vector<ObjectType> types = {});

    const ObjectType& queryType() const { return *findType(queryName_); }
    const ObjectType* mutationType() const {
        return mutationName_.empty() ? nullptr : findType(mutationName_);
    }

    const ObjectType* findType(const std::string& name) const {
        auto it = types_.find(name);
        return it == types_.end() ? nullptr : &it->second;
    }

    bool isScalar(const std::string& name) const;

    // ── Implicit `__typename: String!` available on every object type ──
    static const FieldDefinition& typenameField();

private:
    void addType(ObjectType type);

    std::unordered_map<std::string, ObjectType> types_;
    std::unordered_set<std::string> scalars_;
    std::string queryName_;
    std::string mutationName_;
};

// Serializes a resolved value as the named scalar. Throws gqlpp::Error
// when the value cannot be represented. Unknown scalar names pass the
// value through unchanged.
Value serializeScalar(const std::string& scalarName, const Value& value);

} // namespace gqlpp::type
