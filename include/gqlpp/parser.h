#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/parser.h — GraphQL lexer and recursive-descent parser
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto document = language::parse("query Example { syncField }");
//
//  Throws gqlpp::SyntaxError with the line and column of the offending
//  token, e.g. "Syntax Error: Expected Name, found {".
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "error.h"
#include <cstddef>
#include <string>
#include <vector>

namespace gqlpp::language {

Document parse(const std::string& source);

namespace detail {

enum class TokenKind {
    StartOfFile, EndOfFile, Bang, Dollar, Amp, ParenL, ParenR, Spread, Colon,
    Equals, At, BracketL, BracketR, BraceL, Pipe, BraceR, Name, Int, Float, String
};

const char* kindName(TokenKind kind);

struct Token {
    TokenKind kind = TokenKind::StartOfFile;
    std::string value;
    SourceLocation location;

    // "{", "<EOF>" or `Name "foo"` as used in syntax error messages
    std::string describe() const;
};

class Lexer {
public:
    explicit Lexer(const std::string& source) : source_(source) {}

    Token next();

private:
    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    std::size_t lineStart_ = 0;

    char peek(std::size_t offset = 0) const {
        return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
    }

    SourceLocation here() const {
        return {line_, static_cast<int>(pos_ - lineStart_) + 1};
    }

    void skipIgnored();
    Token readName(SourceLocation start);
    Token readNumber(SourceLocation start);
    Token readString(SourceLocation start);
    void readDigits(std::string& out);
};

class Parser {
public:
    explicit Parser(const std::string& source) : lexer_(source) {}

    Document parseDocument();

private:
    Lexer lexer_;
    Token token_;

    void advance() { token_ = lexer_.next(); }
    bool peek(TokenKind kind) const { return token_.kind == kind; }
    bool peekKeyword(const std::string& keyword) const {
        return token_.kind == TokenKind::Name && token_.value == keyword;
    }

    Token expect(TokenKind kind);
    void expectKeyword(const std::string& keyword);
    bool skip(TokenKind kind);
    SyntaxError unexpected(const Token& token) const;

    std::string parseName();
    OperationDefinition parseOperationDefinition();
    FragmentDefinition parseFragmentDefinition();
    std::vector<VariableDefinition> parseVariableDefinitions();
    std::string parseTypeReference();
    std::vector<Directive> parseDirectives(bool isConst);
    std::vector<Argument> parseArguments(bool isConst);
    SelectionSet parseSelectionSet();
    Selection parseSelection();
    Field parseField();
    ValueNode parseValue(bool isConst);
};

} // namespace detail

} // namespace gqlpp::language
