#include "lexer.hpp"

#include <cctype>
#include <cstdint>
#include <unordered_map>

#include "FormulaError.hpp"

namespace formula {

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr, int first_line)
    : src(source), filename(filename), i(0), line(first_line), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

TokenLocation Lexer::location(int tok_line, int tok_col, int tok_length) const {
    return TokenLocation(filename.empty() ? "<expr>" : filename, tok_line, tok_col, tok_length, src_mgr);
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    out.emplace_back(type, value, location(tok_line, tok_col, len));
}

static int hex_digit(char hc) {
    if (hc >= '0' && hc <= '9') return hc - '0';
    if (hc >= 'a' && hc <= 'f') return 10 + (hc - 'a');
    if (hc >= 'A' && hc <= 'F') return 10 + (hc - 'A');
    return -1;
}

static void append_utf8(std::string& val, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        val.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        val.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        val.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        val.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        val.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        val.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

// scan quoted string with basic escapes; supports single and double quotes
// start_index points to the opening quote position in src
void Lexer::scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index, char quote) {
    // skip opening quote
    advance();
    std::string val;
    bool closed = false;

    while (!eof()) {
        char c = peek();
        if (c == quote) {
            advance();
            closed = true;
            break;
        }

        if (c != '\\') {
            val.push_back(advance());
            continue;
        }

        advance();  // consume backslash
        if (eof()) break;
        char nxt = advance();
        switch (nxt) {
            case 'n':
                val.push_back('\n');
                break;
            case 't':
                val.push_back('\t');
                break;
            case 'r':
                val.push_back('\r');
                break;
            case '0':
                val.push_back('\0');
                break;
            case 'u': {
                uint32_t codepoint = 0;
                int digits = 0;
                while (digits < 4 && hex_digit(peek()) >= 0) {
                    codepoint = (codepoint << 4) | static_cast<uint32_t>(hex_digit(advance()));
                    digits++;
                }
                if (digits != 4) {
                    throw SyntaxError("Invalid unicode escape: expected 4 hex digits after \\u", location(line, col));
                }
                append_utf8(val, codepoint);
                break;
            }
            default:
                // \\, \", \' and any other escaped character stand for themselves
                val.push_back(nxt);
                break;
        }
    }

    if (!closed) {
        throw SyntaxError("Unterminated string literal", location(tok_line, tok_col));
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, quote == '"' ? TokenType::STRING : TokenType::SINGLE_QUOTED_STRING, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    bool seen_dot = false;

    while (!eof()) {
        char c = peek();

        // digits
        if (std::isdigit((unsigned char)c)) {
            val.push_back(advance());
        }
        // decimal point (only one allowed, and must be followed by a digit)
        else if (c == '.' && !seen_dot && std::isdigit((unsigned char)peek_next())) {
            seen_dot = true;
            val.push_back(advance());
        }
        // exponent part: 'e' or 'E'
        else if (c == 'e' || c == 'E') {
            size_t offset = 1;
            if (peek(offset) == '+' || peek(offset) == '-') offset++;
            if (!std::isdigit((unsigned char)peek(offset))) break;  // "1e" is a number followed by an identifier

            val.push_back(advance());
            if (peek() == '+' || peek() == '-') val.push_back(advance());
            while (std::isdigit((unsigned char)peek())) val.push_back(advance());
            break;
        } else {
            break;
        }
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, val, tok_line, tok_col, tok_length);
}

static bool is_identifier_start(char c) {
    return std::isalpha((unsigned char)c) || c == '_' || c == '$';
}

static bool is_identifier_part(char c) {
    return std::isalnum((unsigned char)c) || c == '_' || c == '$';
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof() && is_identifier_part(peek())) id.push_back(advance());

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},
        {"null", TokenType::NULL_LITERAL}};

    auto it = keywords.find(id);
    TokenType type = it != keywords.end() ? it->second : TokenType::IDENTIFIER;
    add_token(out, type, id, tok_line, tok_col, static_cast<int>(i - start_index));
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    // formulas may span lines; newlines are plain whitespace here
    if (std::isspace((unsigned char)c)) {
        advance();
        return;
    }

    if (std::isdigit((unsigned char)c) || (c == '.' && std::isdigit((unsigned char)peek_next()))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }

    if (is_identifier_start(c)) {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    if (c == '"' || c == '\'') {
        scan_quoted_string(out, tok_line, tok_col, start_index, c);
        return;
    }

    // three-character operators first, then two, then one
    auto three = src.substr(i, 3);
    if (three == "===" || three == "!==") {
        advance();
        advance();
        advance();
        add_token(out, three == "===" ? TokenType::STRICT_EQUALITY : TokenType::STRICT_NOTEQUAL, three, tok_line, tok_col, 3);
        return;
    }

    static const std::unordered_map<std::string, TokenType> two_char = {
        {">=", TokenType::GREATEROREQUALTHAN},
        {"<=", TokenType::LESSOREQUALTHAN},
        {"&&", TokenType::AND},
        {"||", TokenType::OR},
        {"==", TokenType::EQUALITY},
        {"!=", TokenType::NOTEQUAL}};

    auto two = src.substr(i, 2);
    auto it2 = two_char.find(two);
    if (it2 != two_char.end()) {
        advance();
        advance();
        add_token(out, it2->second, two, tok_line, tok_col, 2);
        return;
    }

    static const std::unordered_map<char, TokenType> one_char = {
        {'+', TokenType::PLUS},
        {'-', TokenType::MINUS},
        {'*', TokenType::STAR},
        {'/', TokenType::SLASH},
        {'%', TokenType::PERCENT},
        {'>', TokenType::GREATERTHAN},
        {'<', TokenType::LESSTHAN},
        {'!', TokenType::NOT},
        {'(', TokenType::OPENPARENTHESIS},
        {')', TokenType::CLOSEPARENTHESIS},
        {'[', TokenType::OPENBRACKET},
        {']', TokenType::CLOSEBRACKET},
        {'.', TokenType::DOT},
        {',', TokenType::COMMA},
        {'?', TokenType::QUESTIONMARK},
        {':', TokenType::COLON},
        {'@', TokenType::AT_SIGN}};

    auto it1 = one_char.find(c);
    if (it1 != one_char.end()) {
        advance();
        add_token(out, it1->second, std::string(1, c), tok_line, tok_col, 1);
        return;
    }

    throw SyntaxError(std::string("Unexpected character '") + c + "'", location(tok_line, tok_col));
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
        col = 4;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}

}  // namespace formula
