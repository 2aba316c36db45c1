#pragma once

/**
 * @file parser.hpp
 * @brief Parser for INI configuration (converts tokens to sections)
 *
 * WHY THIS FILE EXISTS:
 * The parser is the second stage of config processing:
 * 1. Lexer converts text → tokens
 * 2. Parser converts tokens → IniDocument
 *
 * GRAMMAR:
 * <document> ::= <section>*
 * <section>  ::= SECTION <pair>*
 * <pair>     ::= KEY VALUE CONTINUATION*
 *
 * HOW IT INTEGRATES:
 * - config/loader.cpp feeds .bumpversion.cfg text in
 * - The loader picks [bumpversion] and [bumpversion:file:*] out of the document
 *
 * Only structure is checked here. Whether current_version exists or parses
 * is the loader's concern.
 */

#include "vsync/config/lexer.hpp"
#include "vsync/core/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace vsync {
namespace config {

/**
 * @brief One [section] with its pairs in file order
 */
struct IniSection {
    std::string name;
    std::vector<std::pair<std::string, std::string>> values;

    /// Last assignment wins, as with configparser
    const std::string* find(const std::string& key) const {
        const std::string* found = nullptr;
        for (const auto& [k, v] : values) {
            if (k == key) {
                found = &v;
            }
        }
        return found;
    }
};

struct IniDocument {
    std::vector<IniSection> sections;

    const IniSection* find(const std::string& name) const {
        for (const auto& section : sections) {
            if (section.name == name) {
                return &section;
            }
        }
        return nullptr;
    }
};

/**
 * @brief Recursive descent parser for INI text
 *
 * EXAMPLE USAGE:
 * Parser parser("[bumpversion]\ncurrent_version = 1.2.3\n");
 * auto result = parser.parse_document();
 * if (result.is_ok()) {
 *     const auto* section = result.value().find("bumpversion");
 * }
 */
class Parser {
public:
    explicit Parser(const std::string& input)
        : lexer_(input), current_token_(lexer_.next_token()) {}

    /**
     * Parse the complete document
     *
     * @return Result<IniDocument> - sections or Config error with line number
     */
    Result<IniDocument> parse_document() {
        IniDocument document;

        while (!is_at_end()) {
            auto section = parse_section();
            if (section.is_error()) {
                return Err<IniDocument>(section.error());
            }
            document.sections.push_back(std::move(section.value()));
        }

        return Ok(document);
    }

private:
    Lexer lexer_;                  // Lexer for tokenizing input
    Token current_token_;          // Current token being examined
    Token previous_token_;         // Previous token (for values)

    bool is_at_end() const {
        return current_token_.type == TokenType::END_OF_FILE;
    }

    void advance() {
        previous_token_ = current_token_;
        current_token_ = lexer_.next_token();
    }

    bool check(TokenType type) const {
        if (is_at_end()) return false;
        return current_token_.type == type;
    }

    bool expect(TokenType type) {
        if (check(type)) {
            advance();
            return true;
        }
        return false;
    }

    /**
     * <section> ::= SECTION <pair>*
     */
    Result<IniSection> parse_section() {
        IniSection section;

        if (!expect(TokenType::SECTION)) {
            return Err<IniSection>(error("Expected [section] header, found '" + current_token_.lexeme + "'"));
        }
        section.name = previous_token_.lexeme;

        while (check(TokenType::KEY)) {
            auto pair = parse_pair();
            if (pair.is_error()) {
                return Err<IniSection>(pair.error());
            }
            section.values.push_back(std::move(pair.value()));
        }

        if (check(TokenType::UNKNOWN) || check(TokenType::CONTINUATION)) {
            return Err<IniSection>(error("Unexpected line '" + current_token_.lexeme + "'"));
        }

        return Ok(section);
    }

    /**
     * <pair> ::= KEY VALUE CONTINUATION*
     *
     * Continuation lines are joined with '\n'. An empty first value
     * ("search =" followed by indented lines) starts with the first
     * continuation line.
     */
    Result<std::pair<std::string, std::string>> parse_pair() {
        advance();  // KEY
        std::string key = previous_token_.lexeme;

        if (!expect(TokenType::VALUE)) {
            return Err<std::pair<std::string, std::string>>(error("Expected value after key '" + key + "'"));
        }
        std::string value = previous_token_.lexeme;

        while (check(TokenType::CONTINUATION)) {
            advance();
            if (!value.empty()) {
                value += '\n';
            }
            value += previous_token_.lexeme;
        }

        return Ok(std::make_pair(std::move(key), std::move(value)));
    }

    Error error(const std::string& message) const {
        return Error::config("line " + std::to_string(current_token_.line) + ": " + message);
    }
};

} // namespace config
} // namespace vsync
