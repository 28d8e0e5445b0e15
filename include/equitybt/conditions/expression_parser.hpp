// expression_parser.hpp
// Boolean expression parser over condition ids: and / or / not / parentheses
// Produces a postfix program; any malformed input is a ConfigurationException

#pragma once

#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"

namespace equitybt {

struct Instruction {
    enum class Op : uint8_t {
        PUSH,   // push the mask of condition `operand`
        AND,
        OR,
        NOT
    };
    Op op;
    size_t operand = 0;
};

using PredicateProgram = std::vector<Instruction>;

// ============================================================================
// Expression Parser (recursive descent)
// ============================================================================
//
//   expr    := and_expr ( OR and_expr )*
//   and_expr:= unary ( AND unary )*
//   unary   := NOT unary | primary
//   primary := IDENT | '(' expr ')'
//
// OR  : "or"  "||" "|"
// AND : "and" "&&" "&"
// NOT : "not" "!"

class ExpressionParser {
public:
    using Resolver = std::function<std::optional<size_t>(const std::string&)>;

private:
    enum class TokenType {
        IDENT,
        AND,
        OR,
        NOT,
        LPAREN,
        RPAREN,
        END
    };

    struct Token {
        TokenType type;
        std::string text;
        size_t position;
    };

    std::string text_;
    std::string field_;
    std::vector<Token> tokens_;
    size_t cursor_ = 0;
    Resolver resolve_;
    PredicateProgram program_;

    [[noreturn]] void fail(const std::string& what, size_t position) const {
        throw ConfigurationException(field_, what + " at position " + std::to_string(position) +
                                             " in '" + text_ + "'");
    }

    static bool isIdentChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    }

    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    void tokenize() {
        size_t i = 0;
        while (i < text_.size()) {
            const char c = text_[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
            } else if (c == '(') {
                tokens_.push_back({TokenType::LPAREN, "(", i++});
            } else if (c == ')') {
                tokens_.push_back({TokenType::RPAREN, ")", i++});
            } else if (c == '!') {
                tokens_.push_back({TokenType::NOT, "!", i++});
            } else if (c == '&' || c == '|') {
                const size_t start = i;
                const size_t len = (i + 1 < text_.size() && text_[i + 1] == c) ? 2 : 1;
                i += len;
                tokens_.push_back({c == '&' ? TokenType::AND : TokenType::OR, text_.substr(start, len), start});
            } else if (isIdentChar(c)) {
                const size_t start = i;
                while (i < text_.size() && isIdentChar(text_[i])) ++i;
                std::string word = text_.substr(start, i - start);
                const std::string lw = lower(word);
                if (lw == "and") {
                    tokens_.push_back({TokenType::AND, word, start});
                } else if (lw == "or") {
                    tokens_.push_back({TokenType::OR, word, start});
                } else if (lw == "not") {
                    tokens_.push_back({TokenType::NOT, word, start});
                } else {
                    tokens_.push_back({TokenType::IDENT, word, start});
                }
            } else {
                fail(std::string("unexpected character '") + c + "'", i);
            }
        }
        tokens_.push_back({TokenType::END, "", text_.size()});
    }

    const Token& peek() const { return tokens_[cursor_]; }
    const Token& advance() { return tokens_[cursor_++]; }

    void parseOr() {
        parseAnd();
        while (peek().type == TokenType::OR) {
            advance();
            parseAnd();
            program_.push_back({Instruction::Op::OR, 0});
        }
    }

    void parseAnd() {
        parseUnary();
        while (peek().type == TokenType::AND) {
            advance();
            parseUnary();
            program_.push_back({Instruction::Op::AND, 0});
        }
    }

    void parseUnary() {
        if (peek().type == TokenType::NOT) {
            advance();
            parseUnary();
            program_.push_back({Instruction::Op::NOT, 0});
            return;
        }
        parsePrimary();
    }

    void parsePrimary() {
        const Token& tok = advance();
        switch (tok.type) {
            case TokenType::IDENT: {
                auto index = resolve_(tok.text);
                if (!index) fail("unknown condition id '" + tok.text + "'", tok.position);
                program_.push_back({Instruction::Op::PUSH, *index});
                return;
            }
            case TokenType::LPAREN:
                parseOr();
                if (peek().type != TokenType::RPAREN) fail("missing ')'", peek().position);
                advance();
                return;
            case TokenType::END:
                fail("unexpected end of expression", tok.position);
            default:
                fail("unexpected '" + tok.text + "'", tok.position);
        }
    }

public:
    ExpressionParser(std::string text, std::string field)
        : text_(std::move(text))
        , field_(std::move(field)) {}

    PredicateProgram parse(Resolver resolve) {
        tokens_.clear();
        program_.clear();
        cursor_ = 0;
        resolve_ = std::move(resolve);

        tokenize();
        if (peek().type == TokenType::END) fail("empty expression", 0);
        parseOr();
        if (peek().type != TokenType::END) fail("unexpected '" + peek().text + "'", peek().position);
        return program_;
    }
};

} // namespace equitybt
