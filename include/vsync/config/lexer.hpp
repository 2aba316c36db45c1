#pragma once

/**
 * @file lexer.hpp
 * @brief Lexer (tokenizer) for bumpversion INI configuration
 *
 * WHY THIS FILE EXISTS:
 * Reading .bumpversion.cfg is a two-step process: Lexing → Parsing
 * 1. Lexer (this file): Converts lines into tokens
 * 2. Parser (parser.hpp): Converts tokens into sections and key/value pairs
 *
 * EXAMPLE:
 * Input text:
 *   [bumpversion]
 *   current_version = 1.2.3
 *
 *   [bumpversion:file:setup.py]
 *   search = version="{current_version}"
 * Tokens:
 *   [SECTION:bumpversion] [KEY:current_version] [VALUE:1.2.3]
 *   [SECTION:bumpversion:file:setup.py] [KEY:search] [VALUE:version="{current_version}"]
 *
 * DESIGN DECISIONS:
 * - Line-oriented state machine: INI is a line format, no regex needed
 * - Indented lines directly after a value are CONTINUATION tokens
 *   (multi-line search/replace templates)
 * - '#' and ';' start a comment only at the beginning of a line, because
 *   templates may legitimately contain those characters
 */

#include <cctype>
#include <optional>
#include <string>

namespace vsync {
namespace config {

/**
 * @brief Token types in an INI document
 */
enum class TokenType {
    SECTION,        // [name]
    KEY,            // key before '=' or ':'
    VALUE,          // text after the delimiter (may be empty)
    CONTINUATION,   // indented line extending the previous value

    END_OF_FILE,    // End of input
    UNKNOWN         // Line that is neither section, pair nor continuation
};

/**
 * @brief Represents a single token
 */
struct Token {
    TokenType type;        // What kind of token is this?
    std::string lexeme;    // Section name, key, or value text
    size_t line;           // Line number (for error messages)

    Token(TokenType t = TokenType::UNKNOWN,
          const std::string& lex = "",
          size_t ln = 0)
        : type(t), lexeme(lex), line(ln) {}
};

/**
 * @brief Lexer for INI text
 *
 * HOW IT WORKS (State Machine):
 * 1. Read the next physical line
 * 2. Blank line or comment? → skip, and end any running value
 * 3. Indented and a value is running? → CONTINUATION
 * 4. Starts with '['? → SECTION
 * 5. Contains '=' or ':'? → KEY, then VALUE on the next call
 * 6. Otherwise → UNKNOWN
 *
 * EXAMPLE USAGE:
 * Lexer lexer("[bumpversion]\ncurrent_version = 1.2.3\n");
 * Token t1 = lexer.next_token();  // SECTION bumpversion
 * Token t2 = lexer.next_token();  // KEY current_version
 * Token t3 = lexer.next_token();  // VALUE 1.2.3
 */
class Lexer {
public:
    explicit Lexer(const std::string& input)
        : input_(input), position_(0), line_(0), in_value_(false) {}

    /**
     * Get the next token from the input
     *
     * @return Next token in the input stream
     */
    Token next_token() {
        if (pending_value_) {
            Token value = *pending_value_;
            pending_value_.reset();
            return value;
        }

        while (!is_at_end()) {
            std::string raw = read_line();
            std::string text = trim(raw);

            if (text.empty() || text[0] == '#' || text[0] == ';') {
                in_value_ = false;
                continue;
            }

            const bool indented = std::isspace(static_cast<unsigned char>(raw[0])) != 0;
            if (indented && in_value_) {
                return Token(TokenType::CONTINUATION, text, line_);
            }

            if (text.front() == '[') {
                in_value_ = false;
                const auto close = text.find(']');
                if (close == std::string::npos) {
                    return Token(TokenType::UNKNOWN, text, line_);
                }
                return Token(TokenType::SECTION, trim(text.substr(1, close - 1)), line_);
            }

            const auto delimiter = text.find_first_of("=:");
            if (delimiter == std::string::npos || delimiter == 0) {
                in_value_ = false;
                return Token(TokenType::UNKNOWN, text, line_);
            }

            in_value_ = true;
            pending_value_ = Token(TokenType::VALUE, trim(text.substr(delimiter + 1)), line_);
            return Token(TokenType::KEY, to_lower(trim(text.substr(0, delimiter))), line_);
        }

        return Token(TokenType::END_OF_FILE, "", line_);
    }

    /**
     * Peek at the next token without consuming it
     *
     * HOW IT WORKS:
     * Save current state → get next token → restore state
     */
    Token peek_token() {
        size_t saved_pos = position_;
        size_t saved_line = line_;
        bool saved_in_value = in_value_;
        std::optional<Token> saved_pending = pending_value_;

        Token token = next_token();

        position_ = saved_pos;
        line_ = saved_line;
        in_value_ = saved_in_value;
        pending_value_ = saved_pending;

        return token;
    }

    /**
     * Get current line number
     * WHY: For error messages
     */
    size_t current_line() const { return line_; }

private:
    std::string input_;           // Input text to tokenize
    size_t position_;             // Current position in input
    size_t line_;                 // Number of the line last read (1-based)
    bool in_value_;               // A KEY/VALUE pair may still be continued
    std::optional<Token> pending_value_;  // VALUE queued behind its KEY

    bool is_at_end() const {
        return position_ >= input_.length();
    }

    /**
     * Consume one physical line (without its terminator)
     */
    std::string read_line() {
        const auto end = input_.find('\n', position_);
        std::string line;
        if (end == std::string::npos) {
            line = input_.substr(position_);
            position_ = input_.length();
        } else {
            line = input_.substr(position_, end - position_);
            position_ = end + 1;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        line_++;
        return line;
    }

    static std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    // Keys are case-insensitive, as configparser treats them
    static std::string to_lower(std::string text) {
        for (auto& c : text) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return text;
    }
};

} // namespace config
} // namespace vsync
