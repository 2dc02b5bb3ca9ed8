#include "print_debug.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_map>

#include "value.hpp"

namespace formula {

std::string token_type_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::NUMBER, "NUMBER"}, {TokenType::STRING, "STRING"},
        {TokenType::SINGLE_QUOTED_STRING, "SINGLE_QUOTED_STRING"}, {TokenType::BOOLEAN, "BOOLEAN"},
        {TokenType::NULL_LITERAL, "NULL_LITERAL"}, {TokenType::COMMA, "COMMA"},
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACKET, "OPENBRACKET"}, {TokenType::CLOSEBRACKET, "CLOSEBRACKET"},
        {TokenType::COLON, "COLON"}, {TokenType::QUESTIONMARK, "QUESTIONMARK"}, {TokenType::DOT, "DOT"},
        {TokenType::AT_SIGN, "AT_SIGN"}, {TokenType::PLUS, "PLUS"}, {TokenType::MINUS, "MINUS"},
        {TokenType::STAR, "STAR"}, {TokenType::SLASH, "SLASH"}, {TokenType::PERCENT, "PERCENT"},
        {TokenType::AND, "AND"}, {TokenType::OR, "OR"}, {TokenType::NOT, "NOT"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::EQUALITY, "EQUALITY"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::STRICT_EQUALITY, "STRICT_EQUALITY"}, {TokenType::STRICT_NOTEQUAL, "STRICT_NOTEQUAL"},
        {TokenType::EOF_TOKEN, "EOF_TOKEN"}, {TokenType::UNKNOWN, "UNKNOWN"}};
    auto it = names.find(t);
    return it != names.end() ? it->second : "TOKEN(?)";
}

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '"':
            case '\\':
                out.push_back('\\');
                out.push_back(c);
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                    out += hex.str();
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "[\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        out << "  {\n";
        out << "    \"type\": \"" << token_type_name(tok.type) << "\",\n";
        out << "    \"value\": \"" << escape(tok.value) << "\",\n";
        out << "    \"loc\": \"" << escape(tok.loc.to_string()) << "\",\n";
        out << "    \"length\": " << tok.loc.length << "\n";
        out << "  }" << (i + 1 < tokens.size() ? "," : "") << "\n";
    }
    out << "]\n";
}

static void print_node(const Node* node, std::ostream& out, int indent);

static void print_field(const char* name, const NodePtr& child, std::ostream& out, int indent) {
    std::string ind(indent, ' ');
    out << ind << "\"" << name << "\": ";
    print_node(child.get(), out, indent);
    out << ",\n";
}

static void print_literal(const LiteralValue& value, std::ostream& out) {
    if (std::holds_alternative<std::monostate>(value)) {
        out << "null";
    } else if (auto b = std::get_if<bool>(&value)) {
        out << (*b ? "true" : "false");
    } else if (auto s = std::get_if<std::string>(&value)) {
        out << "\"" << escape(*s) << "\"";
    } else {
        double d = std::get<double>(value);
        // JSON has no NaN / Infinity
        out << (std::isfinite(d) ? number_to_string(d) : "null");
    }
}

static void print_node(const Node* node, std::ostream& out, int indent) {
    if (!node) {
        out << "null";
        return;
    }

    std::string ind(indent + 2, ' ');
    out << "{\n";
    out << ind << "\"type\": \"" << node_type_name(*node) << "\",\n";

    struct Fields {
        std::ostream& out;
        const std::string& ind;
        int indent;

        void operator()(const LiteralNode& n) const {
            out << ind << "\"value\": ";
            print_literal(n.value, out);
            out << ",\n";
        }
        void operator()(const IdentifierNode& n) const {
            out << ind << "\"name\": \"" << escape(n.name) << "\",\n";
        }
        void operator()(const MemberExpressionNode& n) const {
            print_field("object", n.object, out, indent);
            print_field("property", n.property, out, indent);
            out << ind << "\"computed\": " << (n.computed ? "true" : "false") << ",\n";
        }
        void operator()(const CallExpressionNode& n) const {
            out << ind << "\"callee\": {\"type\": \"Identifier\", \"name\": \"" << escape(n.callee.name) << "\"},\n";
            out << ind << "\"arguments\": [";
            for (size_t i = 0; i < n.arguments.size(); ++i) {
                out << (i ? ", " : "");
                print_node(n.arguments[i].get(), out, indent);
            }
            out << "],\n";
        }
        void operator()(const BinaryExpressionNode& n) const {
            out << ind << "\"operator\": \"" << escape(n.op) << "\",\n";
            print_field("left", n.left, out, indent);
            print_field("right", n.right, out, indent);
        }
        void operator()(const UnaryExpressionNode& n) const {
            out << ind << "\"operator\": \"" << escape(n.op) << "\",\n";
            out << ind << "\"prefix\": " << (n.prefix ? "true" : "false") << ",\n";
            print_field("argument", n.argument, out, indent);
        }
        void operator()(const ConditionalExpressionNode& n) const {
            print_field("test", n.test, out, indent);
            print_field("consequent", n.consequent, out, indent);
            print_field("alternate", n.alternate, out, indent);
        }
        void operator()(const UnsupportedNode&) const {}
    };
    std::visit(Fields{out, ind, indent + 2}, node->kind);

    out << ind << "\"loc\": \"" << escape(node->token.loc.to_string()) << "\"\n";
    out << std::string(indent, ' ') << "}";
}

void print_program_debug(const ProgramNode& ast, std::ostream& out, int indent) {
    std::string ind(indent, ' ');
    out << ind << "{\n";
    out << ind << "  \"type\": \"Program\",\n";
    out << ind << "  \"body\": ";
    print_node(ast.body.get(), out, indent + 2);
    out << "\n";
    out << ind << "}\n";
}

}  // namespace formula
