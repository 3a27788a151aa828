#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/validator.h — Pre-execution document validation
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto errors = validator::validate(*schema, document);
//    if (!errors.empty()) { ... do not execute ... }
//
//  Rules: unique operation and fragment names, lone anonymous
//  operation, known type names on fragment conditions, fragments on
//  composite types, fields on correct type, scalar leafs, known
//  fragment names, possible fragment spreads, known directives and
//  their required arguments, no unused fragments.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "error.h"
#include "schema.h"
#include <set>
#include <string>
#include <vector>

namespace gqlpp::validator {

std::vector<Error> validate(const type::Schema& schema, const language::Document& document);

namespace detail {

class DocumentValidator {
public:
    DocumentValidator(const type::Schema& schema, const language::Document& document)
        : schema_(schema), document_(document) {}

    std::vector<Error> run();

private:
    const type::Schema& schema_;
    const language::Document& document_;
    std::vector<Error> errors_;

    void report(const std::string& message, SourceLocation location) {
        errors_.push_back(Error(message, {location}));
    }

    void checkOperationNames();
    void checkFragmentNames();
    void checkUnusedFragments();

    // Returns the object type a fragment condition selects, or nullptr.
    const type::ObjectType* checkTypeCondition(const std::string& typeName, SourceLocation location,
                                               const std::string& fragmentName);
    void visitSelectionSet(const type::ObjectType* parentType, const language::SelectionSet& set);
    void visitField(const type::ObjectType* parentType, const language::Field& field);
    void visitDirectives(const std::vector<language::Directive>& directives);

    void collectSpreads(const language::SelectionSet& set, std::set<std::string>& names) const;
};

} // namespace detail

} // namespace gqlpp::validator
