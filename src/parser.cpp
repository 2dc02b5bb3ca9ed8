// src/parser.cpp
#include "parser.hpp"

#include <cstdlib>
#include <utility>

#include "FormulaError.hpp"

namespace formula {

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token or EOF token
Token Parser::consume() {
    if (position < tokens.size()) return tokens[position++];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        error_at(peek(), errMsg);
    }
    return consume();
}

void Parser::error_at(const Token& tok, const std::string& message) const {
    std::string found = tok.type == TokenType::EOF_TOKEN ? "end of input" : "'" + tok.value + "'";
    throw SyntaxError(message + " (found " + found + ")", tok.loc);
}

ProgramNode Parser::parse() {
    ProgramNode program;
    program.token = peek();
    if (peek().type == TokenType::EOF_TOKEN) {
        error_at(peek(), "Expected an expression");
    }
    program.body = parse_expression();
    if (peek().type != TokenType::EOF_TOKEN) {
        error_at(peek(), "Unexpected token after expression");
    }
    return program;
}

// ---------- expressions (precedence) ----------
NodePtr Parser::parse_expression() {
    return parse_ternary();
}

// right-associative: a ? b : c ? d : e == a ? b : (c ? d : e)
NodePtr Parser::parse_ternary() {
    auto test = parse_logical_or();

    if (peek().type != TokenType::QUESTIONMARK) {
        return test;
    }

    Token qTok = consume();  // consume '?'
    auto consequent = parse_ternary();
    expect(TokenType::COLON, "Expected ':' after conditional 'then' expression");
    auto alternate = parse_ternary();

    return make_node(ConditionalExpressionNode{std::move(test), std::move(consequent), std::move(alternate)}, qTok);
}

NodePtr Parser::parse_logical_or() {
    auto left = parse_logical_and();
    while (peek().type == TokenType::OR) {
        Token op = consume();
        auto right = parse_logical_and();
        left = make_node(BinaryExpressionNode{"||", std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_logical_and() {
    auto left = parse_equality();
    while (peek().type == TokenType::AND) {
        Token op = consume();
        auto right = parse_equality();
        left = make_node(BinaryExpressionNode{"&&", std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_equality() {
    auto left = parse_comparison();
    while (true) {
        TokenType t = peek().type;
        if (t == TokenType::EQUALITY || t == TokenType::NOTEQUAL) {
            // loose equality does not exist in formulas
            error_at(peek(), t == TokenType::EQUALITY ? "Use '===' for equality" : "Use '!==' for inequality");
        }
        if (t != TokenType::STRICT_EQUALITY && t != TokenType::STRICT_NOTEQUAL) break;

        Token op = consume();
        auto right = parse_comparison();
        left = make_node(BinaryExpressionNode{op.value, std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_comparison() {
    auto left = parse_additive();
    while (peek().type == TokenType::GREATERTHAN ||
        peek().type == TokenType::GREATEROREQUALTHAN ||
        peek().type == TokenType::LESSTHAN ||
        peek().type == TokenType::LESSOREQUALTHAN) {
        Token op = consume();
        auto right = parse_additive();
        left = make_node(BinaryExpressionNode{op.value, std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_additive() {
    auto left = parse_multiplicative();
    while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
        Token op = consume();
        auto right = parse_multiplicative();
        left = make_node(BinaryExpressionNode{op.value, std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_multiplicative() {
    auto left = parse_unary();
    while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
        Token op = consume();
        auto right = parse_unary();
        left = make_node(BinaryExpressionNode{op.value, std::move(left), std::move(right)}, op);
    }
    return left;
}

NodePtr Parser::parse_unary() {
    if (peek().type == TokenType::NOT || peek().type == TokenType::MINUS) {
        Token op = consume();
        auto argument = parse_unary();
        return make_node(UnaryExpressionNode{op.value, true, std::move(argument)}, op);
    }
    return parse_postfix(parse_primary());
}

// Postfix loop: member access (obj.prop) and indexing (obj[index])
NodePtr Parser::parse_postfix(NodePtr node) {
    while (true) {
        if (peek().type == TokenType::DOT) {
            Token dotTok = consume();
            // keywords are valid property names: row.null, flags.true
            if (peek().type == TokenType::BOOLEAN || peek().type == TokenType::NULL_LITERAL) {
                tokens[position].type = TokenType::IDENTIFIER;
            }
            Token propTok = expect(TokenType::IDENTIFIER, "Expected property name after '.'");
            auto property = make_node(IdentifierNode{propTok.value}, propTok);
            node = make_node(MemberExpressionNode{std::move(node), std::move(property), false}, dotTok);
            continue;
        }
        if (peek().type == TokenType::OPENBRACKET) {
            Token openIdx = consume();
            auto index = parse_expression();
            expect(TokenType::CLOSEBRACKET, "Expected ']' after index expression");
            node = make_node(MemberExpressionNode{std::move(node), std::move(index), true}, openIdx);
            continue;
        }
        break;
    }
    return node;
}

NodePtr Parser::parse_primary() {
    Token tok = peek();

    switch (tok.type) {
        case TokenType::NUMBER: {
            consume();
            return make_node(LiteralNode{std::strtod(tok.value.c_str(), nullptr)}, tok);
        }
        case TokenType::STRING:
        case TokenType::SINGLE_QUOTED_STRING: {
            consume();
            return make_node(LiteralNode{tok.value}, tok);
        }
        case TokenType::BOOLEAN: {
            consume();
            return make_node(LiteralNode{tok.value == "true"}, tok);
        }
        case TokenType::NULL_LITERAL: {
            consume();
            return make_node(LiteralNode{std::monostate{}}, tok);
        }
        case TokenType::IDENTIFIER: {
            consume();
            return make_node(IdentifierNode{tok.value}, tok);
        }
        case TokenType::AT_SIGN: {
            consume();
            return parse_call(tok);
        }
        case TokenType::OPENPARENTHESIS: {
            consume();
            auto inner = parse_expression();
            expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
            return inner;
        }
        default:
            break;
    }

    if (tok.type == TokenType::EOF_TOKEN) {
        error_at(tok, "Expected an expression");
    }
    error_at(tok, "Unexpected token");
}

// @name(arg, ...)
NodePtr Parser::parse_call(const Token& atTok) {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expected function name after '@'");
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name '" + nameTok.value + "'");

    CallExpressionNode call;
    call.callee = IdentifierNode{nameTok.value};

    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        do {
            call.arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after arguments to '" + nameTok.value + "'");

    return make_node(std::move(call), atTok);
}

}  // namespace formula
