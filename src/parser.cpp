// ═══════════════════════════════════════════════════════════════════
//  parser.cpp — GraphQL lexer and parser implementation
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/parser.h"

namespace gqlpp::language {

Document parse(const std::string& source) {
    detail::Parser parser(source);
    return parser.parseDocument();
}

namespace detail {

namespace {

bool isNameStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isNameContinue(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

std::string describeChar(char c) {
    if (c == '\0') return "<EOF>";
    return std::string("\"") + c + "\"";
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendUtf8(std::string& out, unsigned int codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

} // namespace

const char* kindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::StartOfFile: return "<SOF>";
        case TokenKind::EndOfFile:   return "<EOF>";
        case TokenKind::Bang:        return "!";
        case TokenKind::Dollar:      return "$";
        case TokenKind::Amp:         return "&";
        case TokenKind::ParenL:      return "(";
        case TokenKind::ParenR:      return ")";
        case TokenKind::Spread:      return "...";
        case TokenKind::Colon:       return ":";
        case TokenKind::Equals:      return "=";
        case TokenKind::At:          return "@";
        case TokenKind::BracketL:    return "[";
        case TokenKind::BracketR:    return "]";
        case TokenKind::BraceL:      return "{";
        case TokenKind::Pipe:        return "|";
        case TokenKind::BraceR:      return "}";
        case TokenKind::Name:        return "Name";
        case TokenKind::Int:         return "Int";
        case TokenKind::Float:       return "Float";
        case TokenKind::String:      return "String";
    }
    return "?";
}

std::string Token::describe() const {
    switch (kind) {
        case TokenKind::Name:
        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::String:
            return std::string(kindName(kind)) + " \"" + value + "\"";
        default:
            return kindName(kind);
    }
}

// ═══════════════════════════════════════════
//  Lexer
// ═══════════════════════════════════════════

Token Lexer::next() {
    skipIgnored();
    SourceLocation start = here();
    if (pos_ >= source_.size()) {
        return {TokenKind::EndOfFile, "", start};
    }

    auto punct = [&](TokenKind kind) {
        ++pos_;
        return Token{kind, "", start};
    };

    char c = peek();
    switch (c) {
        case '!': return punct(TokenKind::Bang);
        case '$': return punct(TokenKind::Dollar);
        case '&': return punct(TokenKind::Amp);
        case '(': return punct(TokenKind::ParenL);
        case ')': return punct(TokenKind::ParenR);
        case ':': return punct(TokenKind::Colon);
        case '=': return punct(TokenKind::Equals);
        case '@': return punct(TokenKind::At);
        case '[': return punct(TokenKind::BracketL);
        case ']': return punct(TokenKind::BracketR);
        case '{': return punct(TokenKind::BraceL);
        case '|': return punct(TokenKind::Pipe);
        case '}': return punct(TokenKind::BraceR);
        case '.':
            if (peek(1) == '.' && peek(2) == '.') {
                pos_ += 3;
                return {TokenKind::Spread, "", start};
            }
            break;
        case '"':
            return readString(start);
        default:
            break;
    }

    if (isNameStart(c)) return readName(start);
    if (c == '-' || isDigit(c)) return readNumber(start);

    throw SyntaxError("Cannot parse the unexpected character " + describeChar(c) + ".", start);
}

void Lexer::skipIgnored() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == ' ' || c == '\t' || c == ',') {
            ++pos_;
        } else if (c == '\n') {
            ++pos_;
            ++line_;
            lineStart_ = pos_;
        } else if (c == '\r') {
            ++pos_;
            if (peek() == '\n') ++pos_;
            ++line_;
            lineStart_ = pos_;
        } else if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n' && source_[pos_] != '\r') {
                ++pos_;
            }
        } else if (source_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) {
            pos_ += 3;
        } else {
            break;
        }
    }
}

Token Lexer::readName(SourceLocation start) {
    std::size_t begin = pos_;
    while (pos_ < source_.size() && isNameContinue(source_[pos_])) {
        ++pos_;
    }
    return {TokenKind::Name, source_.substr(begin, pos_ - begin), start};
}

void Lexer::readDigits(std::string& out) {
    if (!isDigit(peek())) {
        throw SyntaxError("Invalid number, expected digit but got: " + describeChar(peek()) + ".",
                          here());
    }
    while (isDigit(peek())) {
        out += source_[pos_++];
    }
}

Token Lexer::readNumber(SourceLocation start) {
    std::string text;
    bool isFloat = false;

    if (peek() == '-') text += source_[pos_++];

    if (peek() == '0') {
        text += source_[pos_++];
        if (isDigit(peek())) {
            throw SyntaxError("Invalid number, unexpected digit after 0: " +
                              describeChar(peek()) + ".", here());
        }
    } else {
        readDigits(text);
    }

    if (peek() == '.') {
        isFloat = true;
        text += source_[pos_++];
        readDigits(text);
    }

    if (peek() == 'e' || peek() == 'E') {
        isFloat = true;
        text += source_[pos_++];
        if (peek() == '+' || peek() == '-') text += source_[pos_++];
        readDigits(text);
    }

    if (peek() == '.' || isNameStart(peek())) {
        throw SyntaxError("Invalid number, expected digit but got: " + describeChar(peek()) + ".",
                          here());
    }

    return {isFloat ? TokenKind::Float : TokenKind::Int, text, start};
}

Token Lexer::readString(SourceLocation start) {
    if (peek(1) == '"' && peek(2) == '"') {
        throw SyntaxError("Block strings are not supported.", start);
    }
    ++pos_;

    std::string value;
    while (true) {
        char c = peek();
        if (pos_ >= source_.size() || c == '\n' || c == '\r') {
            throw SyntaxError("Unterminated string.", here());
        }
        if (c == '"') {
            ++pos_;
            return {TokenKind::String, value, start};
        }
        if (c != '\\') {
            value += c;
            ++pos_;
            continue;
        }

        SourceLocation escapeAt = here();
        char esc = peek(1);
        pos_ += 2;
        switch (esc) {
            case '"':  value += '"'; break;
            case '\\': value += '\\'; break;
            case '/':  value += '/'; break;
            case 'b':  value += '\b'; break;
            case 'f':  value += '\f'; break;
            case 'n':  value += '\n'; break;
            case 'r':  value += '\r'; break;
            case 't':  value += '\t'; break;
            case 'u': {
                unsigned int codePoint = 0;
                for (int i = 0; i < 4; ++i) {
                    int digit = hexValue(peek());
                    if (digit < 0) {
                        throw SyntaxError("Invalid character escape sequence: \\u" +
                                          source_.substr(pos_ - i, 4) + ".", escapeAt);
                    }
                    codePoint = codePoint * 16 + static_cast<unsigned int>(digit);
                    ++pos_;
                }
                appendUtf8(value, codePoint);
                break;
            }
            default:
                throw SyntaxError(std::string("Invalid character escape sequence: \\") + esc + ".",
                                  escapeAt);
        }
    }
}

// ═══════════════════════════════════════════
//  Parser
// ═══════════════════════════════════════════

Token Parser::expect(TokenKind kind) {
    if (token_.kind != kind) {
        throw SyntaxError(std::string("Expected ") + kindName(kind) + ", found " + token_.describe(),
                          token_.location);
    }
    Token matched = token_;
    advance();
    return matched;
}

void Parser::expectKeyword(const std::string& keyword) {
    if (!peekKeyword(keyword)) {
        throw SyntaxError("Expected \"" + keyword + "\", found " + token_.describe(),
                          token_.location);
    }
    advance();
}

bool Parser::skip(TokenKind kind) {
    if (token_.kind != kind) return false;
    advance();
    return true;
}

SyntaxError Parser::unexpected(const Token& token) const {
    return SyntaxError("Unexpected " + token.describe(), token.location);
}

std::string Parser::parseName() {
    return expect(TokenKind::Name).value;
}

Document Parser::parseDocument() {
    advance();
    Document document;
    do {
        if (peek(TokenKind::BraceL) || peekKeyword("query") || peekKeyword("mutation") ||
            peekKeyword("subscription")) {
            document.operations.push_back(parseOperationDefinition());
        } else if (peekKeyword("fragment")) {
            document.fragments.push_back(parseFragmentDefinition());
        } else {
            throw unexpected(token_);
        }
    } while (!peek(TokenKind::EndOfFile));
    return document;
}

OperationDefinition Parser::parseOperationDefinition() {
    OperationDefinition operation;
    operation.location = token_.location;

    if (peek(TokenKind::BraceL)) {
        operation.selectionSet = parseSelectionSet();
        return operation;
    }

    operation.operation = parseName();
    if (peek(TokenKind::Name)) {
        operation.name = parseName();
    }
    if (peek(TokenKind::ParenL)) {
        operation.variables = parseVariableDefinitions();
    }
    operation.directives = parseDirectives(false);
    operation.selectionSet = parseSelectionSet();
    return operation;
}

FragmentDefinition Parser::parseFragmentDefinition() {
    FragmentDefinition fragment;
    fragment.location = token_.location;

    expectKeyword("fragment");
    if (peekKeyword("on")) {
        throw unexpected(token_);
    }
    fragment.name = parseName();
    expectKeyword("on");
    fragment.typeCondition = parseName();
    fragment.directives = parseDirectives(false);
    fragment.selectionSet = parseSelectionSet();
    return fragment;
}

std::vector<VariableDefinition> Parser::parseVariableDefinitions() {
    std::vector<VariableDefinition> definitions;
    expect(TokenKind::ParenL);
    do {
        VariableDefinition definition;
        definition.location = token_.location;
        expect(TokenKind::Dollar);
        definition.name = parseName();
        expect(TokenKind::Colon);
        definition.type = parseTypeReference();
        if (skip(TokenKind::Equals)) {
            definition.defaultValue = parseValue(true);
        }
        parseDirectives(true);
        definitions.push_back(std::move(definition));
    } while (!skip(TokenKind::ParenR));
    return definitions;
}

std::string Parser::parseTypeReference() {
    std::string type;
    if (skip(TokenKind::BracketL)) {
        type = "[" + parseTypeReference() + "]";
        expect(TokenKind::BracketR);
    } else {
        type = parseName();
    }
    if (skip(TokenKind::Bang)) {
        type += "!";
    }
    return type;
}

std::vector<Directive> Parser::parseDirectives(bool isConst) {
    std::vector<Directive> directives;
    while (peek(TokenKind::At)) {
        Directive directive;
        directive.location = token_.location;
        advance();
        directive.name = parseName();
        if (peek(TokenKind::ParenL)) {
            directive.arguments = parseArguments(isConst);
        }
        directives.push_back(std::move(directive));
    }
    return directives;
}

std::vector<Argument> Parser::parseArguments(bool isConst) {
    std::vector<Argument> arguments;
    expect(TokenKind::ParenL);
    do {
        Argument argument;
        argument.location = token_.location;
        argument.name = parseName();
        expect(TokenKind::Colon);
        argument.value = parseValue(isConst);
        arguments.push_back(std::move(argument));
    } while (!skip(TokenKind::ParenR));
    return arguments;
}

SelectionSet Parser::parseSelectionSet() {
    SelectionSet selections;
    expect(TokenKind::BraceL);
    do {
        selections.push_back(parseSelection());
    } while (!skip(TokenKind::BraceR));
    return selections;
}

Selection Parser::parseSelection() {
    if (!peek(TokenKind::Spread)) {
        return Selection{parseField()};
    }

    SourceLocation start = token_.location;
    advance();

    if (peek(TokenKind::Name) && !peekKeyword("on")) {
        FragmentSpread spread;
        spread.location = start;
        spread.name = parseName();
        spread.directives = parseDirectives(false);
        return Selection{std::move(spread)};
    }

    InlineFragment fragment;
    fragment.location = start;
    if (peekKeyword("on")) {
        advance();
        fragment.typeCondition = parseName();
    }
    fragment.directives = parseDirectives(false);
    fragment.selectionSet = parseSelectionSet();
    return Selection{std::move(fragment)};
}

Field Parser::parseField() {
    Field field;
    field.location = token_.location;

    auto nameOrAlias = parseName();
    if (skip(TokenKind::Colon)) {
        field.alias = nameOrAlias;
        field.name = parseName();
    } else {
        field.name = nameOrAlias;
    }

    if (peek(TokenKind::ParenL)) {
        field.arguments = parseArguments(false);
    }
    field.directives = parseDirectives(false);
    if (peek(TokenKind::BraceL)) {
        field.selectionSet = parseSelectionSet();
    }
    return field;
}

ValueNode Parser::parseValue(bool isConst) {
    ValueNode node;
    node.location = token_.location;

    switch (token_.kind) {
        case TokenKind::BracketL:
            advance();
            node.kind = ValueNode::Kind::List;
            while (!skip(TokenKind::BracketR)) {
                node.items.push_back(parseValue(isConst));
            }
            return node;

        case TokenKind::BraceL:
            advance();
            node.kind = ValueNode::Kind::Object;
            while (!skip(TokenKind::BraceR)) {
                auto name = parseName();
                expect(TokenKind::Colon);
                node.fields.emplace_back(std::move(name), parseValue(isConst));
            }
            return node;

        case TokenKind::Int:
        case TokenKind::Float:
        case TokenKind::String:
            node.kind = token_.kind == TokenKind::Int     ? ValueNode::Kind::Int
                      : token_.kind == TokenKind::Float   ? ValueNode::Kind::Float
                                                          : ValueNode::Kind::String;
            node.raw = token_.value;
            advance();
            return node;

        case TokenKind::Name:
            if (token_.value == "true" || token_.value == "false") {
                node.kind = ValueNode::Kind::Boolean;
            } else if (token_.value == "null") {
                node.kind = ValueNode::Kind::Null;
            } else {
                node.kind = ValueNode::Kind::Enum;
            }
            node.raw = token_.value;
            advance();
            return node;

        case TokenKind::Dollar:
            if (!isConst) {
                advance();
                node.kind = ValueNode::Kind::Variable;
                node.raw = parseName();
                return node;
            }
            break;

        default:
            break;
    }
    throw unexpected(token_);
}

} // namespace detail

} // namespace gqlpp::language
