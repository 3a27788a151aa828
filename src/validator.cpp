// ═══════════════════════════════════════════════════════════════════
//  validator.cpp — Validation rules
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/validator.h"
#include <map>
#include <variant>

namespace gqlpp::validator {

std::vector<Error> validate(const type::Schema& schema, const language::Document& document) {
    detail::DocumentValidator validator(schema, document);
    return validator.run();
}

namespace detail {

std::vector<Error> DocumentValidator::run() {
    errors_.clear();
    checkOperationNames();
    checkFragmentNames();

    for (const auto& operation : document_.operations) {
        visitDirectives(operation.directives);
        const type::ObjectType* root = nullptr;
        if (operation.operation == "query") {
            root = &schema_.queryType();
        } else if (operation.operation == "mutation") {
            root = schema_.mutationType();
        }
        visitSelectionSet(root, operation.selectionSet);
    }

    for (const auto& fragment : document_.fragments) {
        visitDirectives(fragment.directives);
        auto* type = checkTypeCondition(fragment.typeCondition, fragment.location, fragment.name);
        visitSelectionSet(type, fragment.selectionSet);
    }

    checkUnusedFragments();
    return errors_;
}

// ── UniqueOperationNames, LoneAnonymousOperation ──
void DocumentValidator::checkOperationNames() {
    std::map<std::string, SourceLocation> seen;
    for (const auto& operation : document_.operations) {
        if (operation.name.empty()) {
            if (document_.operations.size() > 1) {
                report("This anonymous operation must be the only defined operation.",
                       operation.location);
            }
            continue;
        }
        if (!seen.emplace(operation.name, operation.location).second) {
            report("There can be only one operation named \"" + operation.name + "\".",
                   operation.location);
        }
    }
}

// ── UniqueFragmentNames ──
void DocumentValidator::checkFragmentNames() {
    std::set<std::string> seen;
    for (const auto& fragment : document_.fragments) {
        if (!seen.insert(fragment.name).second) {
            report("There can be only one fragment named \"" + fragment.name + "\".",
                   fragment.location);
        }
    }
}

// ── NoUnusedFragments ──
void DocumentValidator::checkUnusedFragments() {
    std::set<std::string> used;
    std::vector<const language::SelectionSet*> pending;
    for (const auto& operation : document_.operations) {
        pending.push_back(&operation.selectionSet);
    }

    while (!pending.empty()) {
        const auto* set = pending.back();
        pending.pop_back();
        std::set<std::string> spreads;
        collectSpreads(*set, spreads);
        for (const auto& name : spreads) {
            if (!used.insert(name).second) continue;
            if (const auto* fragment = document_.findFragment(name)) {
                pending.push_back(&fragment->selectionSet);
            }
        }
    }

    for (const auto& fragment : document_.fragments) {
        if (used.count(fragment.name) == 0) {
            report("Fragment \"" + fragment.name + "\" is never used.", fragment.location);
        }
    }
}

// ── KnownTypeNames, FragmentsOnCompositeTypes ──
const type::ObjectType* DocumentValidator::checkTypeCondition(const std::string& typeName,
                                                              SourceLocation location,
                                                              const std::string& fragmentName) {
    if (const auto* type = schema_.findType(typeName)) {
        return type;
    }
    if (schema_.isScalar(typeName)) {
        if (fragmentName.empty()) {
            report("Fragment cannot condition on non composite type \"" + typeName + "\".",
                   location);
        } else {
            report("Fragment \"" + fragmentName + "\" cannot condition on non composite type \"" +
                   typeName + "\".", location);
        }
        return nullptr;
    }
    report("Unknown type \"" + typeName + "\".", location);
    return nullptr;
}

void DocumentValidator::visitSelectionSet(const type::ObjectType* parentType,
                                          const language::SelectionSet& set) {
    for (const auto& selection : set) {
        if (const auto* field = std::get_if<language::Field>(&selection.node)) {
            visitField(parentType, *field);
        } else if (const auto* spread = std::get_if<language::FragmentSpread>(&selection.node)) {
            // KnownFragmentNames, PossibleFragmentSpreads
            visitDirectives(spread->directives);
            const auto* fragment = document_.findFragment(spread->name);
            if (!fragment) {
                report("Unknown fragment \"" + spread->name + "\".", spread->location);
                continue;
            }
            if (parentType && schema_.findType(fragment->typeCondition) &&
                fragment->typeCondition != parentType->name()) {
                report("Fragment \"" + spread->name + "\" cannot be spread here as objects of type \"" +
                       parentType->name() + "\" can never be of type \"" +
                       fragment->typeCondition + "\".", spread->location);
            }
        } else {
            const auto& inlineFragment = std::get<language::InlineFragment>(selection.node);
            visitDirectives(inlineFragment.directives);
            const type::ObjectType* type = parentType;
            if (inlineFragment.typeCondition) {
                type = checkTypeCondition(*inlineFragment.typeCondition, inlineFragment.location, "");
                if (type && parentType && type != parentType) {
                    report("Fragment cannot be spread here as objects of type \"" +
                           parentType->name() + "\" can never be of type \"" + type->name() + "\".",
                           inlineFragment.location);
                }
            }
            visitSelectionSet(type, inlineFragment.selectionSet);
        }
    }
}

// ── FieldsOnCorrectType, ScalarLeafs ──
void DocumentValidator::visitField(const type::ObjectType* parentType, const language::Field& field) {
    visitDirectives(field.directives);
    if (!parentType) return;

    const type::FieldDefinition* definition = field.name == "__typename"
        ? &type::Schema::typenameField()
        : parentType->findField(field.name);
    if (!definition) {
        report("Cannot query field \"" + field.name + "\" on type \"" + parentType->name() + "\".",
               field.location);
        return;
    }

    const type::TypeRef& named = definition->type.namedType();
    std::string typeString = definition->type.toString();
    if (named.isLeaf()) {
        if (!field.selectionSet.empty()) {
            report("Field \"" + field.name + "\" must not have a selection since type \"" +
                   typeString + "\" has no subfields.", field.location);
        }
        return;
    }

    if (field.selectionSet.empty()) {
        report("Field \"" + field.name + "\" of type \"" + typeString +
               "\" must have a selection of subfields. Did you mean \"" + field.name +
               " { ... }\"?", field.location);
        return;
    }
    visitSelectionSet(schema_.findType(named.name()), field.selectionSet);
}

// ── KnownDirectives, ProvidedRequiredArguments on directives ──
void DocumentValidator::visitDirectives(const std::vector<language::Directive>& directives) {
    for (const auto& directive : directives) {
        if (directive.name != "skip" && directive.name != "include") {
            report("Unknown directive \"@" + directive.name + "\".", directive.location);
            continue;
        }
        bool hasIf = false;
        for (const auto& argument : directive.arguments) {
            if (argument.name == "if") {
                hasIf = true;
            } else {
                report("Unknown argument \"" + argument.name + "\" on directive \"@" +
                       directive.name + "\".", argument.location);
            }
        }
        if (!hasIf) {
            report("Directive \"@" + directive.name +
                   "\" argument \"if\" of type \"Boolean!\" is required, but it was not provided.",
                   directive.location);
        }
    }
}

void DocumentValidator::collectSpreads(const language::SelectionSet& set,
                                       std::set<std::string>& names) const {
    for (const auto& selection : set) {
        if (const auto* field = std::get_if<language::Field>(&selection.node)) {
            collectSpreads(field->selectionSet, names);
        } else if (const auto* spread = std::get_if<language::FragmentSpread>(&selection.node)) {
            names.insert(spread->name);
        } else {
            collectSpreads(std::get<language::InlineFragment>(selection.node).selectionSet, names);
        }
    }
}

} // namespace detail

} // namespace gqlpp::validator
