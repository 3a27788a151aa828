// ═══════════════════════════════════════════════════════════════════
//  schema.cpp — Schema assembly and scalar serialization
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/schema.h"
#include "gqlpp/error.h"
#include <cmath>
#include <cstdint>
#include <limits>

namespace gqlpp::type {

Schema::Schema(ObjectType query, std::optional<ObjectType> mutation, std::vector<ObjectType> types)
    : scalars_({"String", "Int", "Float", "Boolean", "ID"}), queryName_(query.name()) {
    addType(std::move(query));
    if (mutation) {
        mutationName_ = mutation->name();
        addType(std::move(*mutation));
    }
    for (auto& type : types) {
        addType(std::move(type));
    }
}

void Schema::addType(ObjectType type) {
    for (const auto& field : type.fields()) {
        const TypeRef& named = field.type.namedType();
        if (named.isLeaf()) scalars_.insert(named.name());
    }
    auto name = type.name();
    if (scalars_.count(name) > 0 || !types_.emplace(name, std::move(type)).second) {
        throw std::invalid_argument(
            "Schema must contain unique named types but contains multiple types named \"" +
            name + "\".");
    }
}

bool Schema::isScalar(const std::string& name) const {
    return scalars_.count(name) > 0;
}

const FieldDefinition& Schema::typenameField() {
    static const FieldDefinition field{
        "__typename",
        TypeRef::nonNull(TypeRef::string()),
        [](const Value&, const Value&, const Value&, const ResolveInfo& info) -> promise::Resolved {
            return Value(info.parentType);
        },
        {}};
    return field;
}

// ═══════════════════════════════════════════
//  Scalar serialization
// ═══════════════════════════════════════════

namespace {

Value serializeString(const Value& value) {
    if (value.is_string()) return value;
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_number()) return value.dump();
    throw Error("String cannot represent value: " + inspect(value));
}

Value serializeInt(const Value& value) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(kMax)) {
            throw Error("Int cannot represent non 32-bit signed integer value: " + inspect(value));
        }
        return static_cast<int>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<std::int64_t>();
        if (n > kMax || n < kMin) {
            throw Error("Int cannot represent non 32-bit signed integer value: " + inspect(value));
        }
        return static_cast<int>(n);
    }
    if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d) {
            throw Error("Int cannot represent non-integer value: " + inspect(value));
        }
        if (d > static_cast<double>(kMax) || d < static_cast<double>(kMin)) {
            throw Error("Int cannot represent non 32-bit signed integer value: " + inspect(value));
        }
        return static_cast<int>(d);
    }
    throw Error("Int cannot represent non-integer value: " + inspect(value));
}

Value serializeFloat(const Value& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
    throw Error("Float cannot represent non numeric value: " + inspect(value));
}

Value serializeBoolean(const Value& value) {
    if (value.is_boolean()) return value;
    if (value.is_number()) return value.get<double>() != 0.0;
    throw Error("Boolean cannot represent a non boolean value: " + inspect(value));
}

Value serializeId(const Value& value) {
    if (value.is_string()) return value;
    if (value.is_number_integer()) return value.dump();
    throw Error("ID cannot represent value: " + inspect(value));
}

} // namespace

Value serializeScalar(const std::string& scalarName, const Value& value) {
    if (scalarName == "String") return serializeString(value);
    if (scalarName == "Int") return serializeInt(value);
    if (scalarName == "Float") return serializeFloat(value);
    if (scalarName == "Boolean") return serializeBoolean(value);
    if (scalarName == "ID") return serializeId(value);
    return value;
}

} // namespace gqlpp::type
