#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/ast.h — Executable GraphQL document tree
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gqlpp::language {

// ── Literal or variable as written in the document ──
struct ValueNode {
    enum class Kind { Variable, Int, Float, String, Boolean, Null, Enum, List, Object };

    Kind kind = Kind::Null;
    std::string raw;   // literal text, unescaped string, enum or variable name
    std::vector<ValueNode> items;
    std::vector<std::pair<std::string, ValueNode>> fields;
    SourceLocation location;
};

struct Argument {
    std::string name;
    ValueNode value;
    SourceLocation location;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    SourceLocation location;
};

struct Selection;
using SelectionSet = std::vector<Selection>;

struct Field {
    std::string alias;
    std::string name;
    std::vector<Argument> arguments;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    SourceLocation location;

    const std::string& responseName() const { return alias.empty() ? name : alias; }
};

struct FragmentSpread {
    std::string name;
    std::vector<Directive> directives;
    SourceLocation location;
};

struct InlineFragment {
    std::optional<std::string> typeCondition;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    SourceLocation location;
};

struct Selection {
    std::variant<Field, FragmentSpread, InlineFragment> node;
};

struct VariableDefinition {
    std::string name;
    std::string type;   // e.g. "Int!", "[String]"
    std::optional<ValueNode> defaultValue;
    SourceLocation location;

    bool required() const { return !type.empty() && type.back() == '!'; }
};

struct OperationDefinition {
    std::string operation = "query";   // "query", "mutation" or "subscription"
    std::string name;
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    SourceLocation location;
};

struct FragmentDefinition {
    std::string name;
    std::string typeCondition;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    SourceLocation location;
};

struct Document {
    std::vector<OperationDefinition> operations;
    std::vector<FragmentDefinition> fragments;

    const FragmentDefinition* findFragment(const std::string& name) const {
        for (const auto& fragment : fragments) {
            if (fragment.name == name) return &fragment;
        }
        return nullptr;
    }
};

} // namespace gqlpp::language
