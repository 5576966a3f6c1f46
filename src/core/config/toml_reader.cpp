#include "core/config/toml_reader.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace orch::core::config {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

class TomlParser {
public:
    explicit TomlParser(const std::string& text) : text_(text) {}

    core::errors::Result<json> parse() {
        root_ = json::object();
        current_ = &root_;
        while (true) {
            skip_blank_and_comments();
            if (at_end()) {
                break;
            }
            bool ok = false;
            if (peek() == '[') {
                ok = parse_header();
            } else {
                ok = parse_key_value(*current_);
                if (ok) {
                    ok = expect_line_end();
                }
            }
            if (!ok) {
                return OrchError{ErrorCategory::Malformed,
                                 "TOML parse error at line " + std::to_string(line_) +
                                     ": " + error_,
                                 "toml_parse_error"};
            }
        }
        return root_;
    }

private:
    bool at_end() const { return pos_ >= text_.size(); }
    char peek(std::size_t offset = 0) const {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }
    char advance() {
        const char c = text_[pos_++];
        if (c == '\n') {
            ++line_;
        }
        return c;
    }
    bool fail(const std::string& message) {
        error_ = message;
        return false;
    }

    void skip_inline_space() {
        while (!at_end() && (peek() == ' ' || peek() == '\t')) {
            advance();
        }
    }

    void skip_comment() {
        if (peek() == '#') {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        }
    }

    void skip_blank_and_comments() {
        while (!at_end()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    bool expect_line_end() {
        skip_inline_space();
        skip_comment();
        if (at_end()) {
            return true;
        }
        if (peek() == '\r') {
            advance();
        }
        if (peek() == '\n') {
            advance();
            return true;
        }
        return fail(std::string("unexpected character '") + peek() + "' after value");
    }

    bool parse_key_part(std::string& out) {
        skip_inline_space();
        if (peek() == '"' || peek() == '\'') {
            json value;
            if (!parse_string(value)) {
                return false;
            }
            out = value.get<std::string>();
            return true;
        }
        std::string key;
        while (!at_end()) {
            const char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-') {
                key.push_back(advance());
            } else {
                break;
            }
        }
        if (key.empty()) {
            return fail("expected a key");
        }
        out = key;
        return true;
    }

    bool parse_dotted_key(std::vector<std::string>& parts) {
        while (true) {
            std::string part;
            if (!parse_key_part(part)) {
                return false;
            }
            parts.push_back(part);
            skip_inline_space();
            if (peek() == '.') {
                advance();
                continue;
            }
            return true;
        }
    }

    // Walks (and creates) nested tables; arrays of tables resolve to their last element.
    bool descend(json*& node, const std::string& key) {
        if (!node->is_object()) {
            return fail("key '" + key + "' is not a table");
        }
        json& child = (*node)[key];
        if (child.is_null()) {
            child = json::object();
        }
        if (child.is_array()) {
            if (child.empty() || !child.back().is_object()) {
                return fail("key '" + key + "' is not an array of tables");
            }
            node = &child.back();
            return true;
        }
        if (!child.is_object()) {
            return fail("key '" + key + "' is already defined as a value");
        }
        node = &child;
        return true;
    }

    bool parse_header() {
        advance();
        const bool array_of_tables = peek() == '[';
        if (array_of_tables) {
            advance();
        }
        std::vector<std::string> parts;
        if (!parse_dotted_key(parts)) {
            return false;
        }
        skip_inline_space();
        if (peek() != ']') {
            return fail("expected ']' to close table header");
        }
        advance();
        if (array_of_tables) {
            if (peek() != ']') {
                return fail("expected ']]' to close array-of-tables header");
            }
            advance();
        }

        json* node = &root_;
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            if (!descend(node, parts[i])) {
                return false;
            }
        }
        const std::string& last = parts.back();
        if (array_of_tables) {
            json& arr = (*node)[last];
            if (arr.is_null()) {
                arr = json::array();
            }
            if (!arr.is_array()) {
                return fail("key '" + last + "' is not an array of tables");
            }
            arr.push_back(json::object());
            current_ = &arr.back();
        } else {
            if (!descend(node, last)) {
                return false;
            }
            current_ = node;
        }
        return expect_line_end();
    }

    bool parse_key_value(json& table) {
        std::vector<std::string> parts;
        if (!parse_dotted_key(parts)) {
            return false;
        }
        skip_inline_space();
        if (peek() != '=') {
            return fail("expected '=' after key");
        }
        advance();
        skip_inline_space();

        json* node = &table;
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            if (!descend(node, parts[i])) {
                return false;
            }
        }
        json value;
        if (!parse_value(value)) {
            return false;
        }
        (*node)[parts.back()] = std::move(value);
        return true;
    }

    bool parse_value(json& out) {
        const char c = peek();
        if (c == '"' || c == '\'') {
            return parse_string(out);
        }
        if (c == '[') {
            return parse_array(out);
        }
        if (c == '{') {
            return parse_inline_table(out);
        }
        return parse_scalar(out);
    }

    bool parse_escape(std::string& out) {
        const char e = advance();
        switch (e) {
            case 'n': out.push_back('\n'); return true;
            case 't': out.push_back('\t'); return true;
            case 'r': out.push_back('\r'); return true;
            case '"': out.push_back('"'); return true;
            case '\\': out.push_back('\\'); return true;
            case 'b': out.push_back('\b'); return true;
            case 'f': out.push_back('\f'); return true;
            case 'u':
            case 'U': {
                const std::size_t len = e == 'u' ? 4 : 8;
                if (pos_ + len > text_.size()) {
                    return fail("truncated unicode escape");
                }
                for (std::size_t i = 0; i < len; ++i) {
                    if (std::isxdigit(static_cast<unsigned char>(text_[pos_ + i])) == 0) {
                        return fail("invalid unicode escape");
                    }
                }
                const unsigned long cp = std::stoul(text_.substr(pos_, len), nullptr, 16);
                pos_ += len;
                if (cp < 0x80) {
                    out.push_back(static_cast<char>(cp));
                } else if (cp < 0x800) {
                    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else if (cp < 0x10000) {
                    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else {
                    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
                return true;
            }
            default:
                return fail(std::string("invalid escape '\\") + e + "'");
        }
    }

    bool parse_string(json& out) {
        const char quote = advance();
        const bool multiline = peek() == quote && peek(1) == quote;
        std::string value;
        if (multiline) {
            advance();
            advance();
            if (peek() == '\n') {
                advance();
            } else if (peek() == '\r' && peek(1) == '\n') {
                advance();
                advance();
            }
            while (true) {
                if (at_end()) {
                    return fail("unterminated multi-line string");
                }
                if (peek() == quote && peek(1) == quote && peek(2) == quote) {
                    advance();
                    advance();
                    advance();
                    break;
                }
                const char c = advance();
                if (c == '\\' && quote == '"') {
                    if (peek() == '\n' || peek() == '\r') {
                        while (!at_end() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
                            advance();
                        }
                        continue;
                    }
                    if (!parse_escape(value)) {
                        return false;
                    }
                } else {
                    value.push_back(c);
                }
            }
            out = value;
            return true;
        }

        while (true) {
            if (at_end() || peek() == '\n') {
                return fail("unterminated string");
            }
            const char c = advance();
            if (c == quote) {
                break;
            }
            if (c == '\\' && quote == '"') {
                if (!parse_escape(value)) {
                    return false;
                }
            } else {
                value.push_back(c);
            }
        }
        out = value;
        return true;
    }

    bool parse_array(json& out) {
        advance();
        out = json::array();
        while (true) {
            skip_blank_and_comments();
            if (at_end()) {
                return fail("unterminated array");
            }
            if (peek() == ']') {
                advance();
                return true;
            }
            json item;
            if (!parse_value(item)) {
                return false;
            }
            out.push_back(std::move(item));
            skip_blank_and_comments();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                return true;
            }
            return fail("expected ',' or ']' in array");
        }
    }

    bool parse_inline_table(json& out) {
        advance();
        out = json::object();
        skip_inline_space();
        if (peek() == '}') {
            advance();
            return true;
        }
        while (true) {
            if (!parse_key_value(out)) {
                return false;
            }
            skip_inline_space();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == '}') {
                advance();
                return true;
            }
            return fail("expected ',' or '}' in inline table");
        }
    }

    bool parse_scalar(json& out) {
        std::string token;
        while (!at_end()) {
            const char c = peek();
            if (c == ',' || c == ']' || c == '}' || c == '\n' || c == '\r' || c == '#') {
                break;
            }
            token.push_back(advance());
        }
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
            token.pop_back();
        }
        if (token.empty()) {
            return fail("expected a value");
        }
        if (token == "true") {
            out = true;
            return true;
        }
        if (token == "false") {
            out = false;
            return true;
        }

        std::string digits;
        for (const char c : token) {
            if (c != '_') {
                digits.push_back(c);
            }
        }
        if (digits.empty()) {
            return fail("invalid value '" + token + "'");
        }
        bool is_integer = true;
        bool is_float = true;
        const std::size_t start = (digits[0] == '+' || digits[0] == '-') ? 1 : 0;
        if (start >= digits.size()) {
            return fail("invalid number '" + token + "'");
        }
        for (std::size_t i = start; i < digits.size(); ++i) {
            const char c = digits[i];
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                is_integer = false;
                if (c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-') {
                    is_float = false;
                }
            }
        }
        if (is_integer) {
            long long value = 0;
            const char* begin = digits.data() + (digits[0] == '+' ? 1 : 0);
            const char* end = digits.data() + digits.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return fail("integer out of range '" + token + "'");
            }
            out = value;
            return true;
        }
        if (is_float && std::isdigit(static_cast<unsigned char>(digits[start])) != 0) {
            std::istringstream in(digits);
            double value = 0.0;
            in >> value;
            if (!in.fail() && in.eof()) {
                out = value;
                return true;
            }
        }
        if (std::isdigit(static_cast<unsigned char>(token[0])) != 0) {
            // Offset date-times and local dates stay as their literal text.
            out = token;
            return true;
        }
        return fail("invalid value '" + token + "'");
    }

    const std::string& text_;
    std::size_t pos_ = 0;
    int line_ = 1;
    std::string error_;
    json root_;
    json* current_ = nullptr;
};

}  // namespace

core::errors::Result<json> parse_toml(const std::string& text) {
    TomlParser parser(text);
    return parser.parse();
}

core::errors::Result<json> read_toml_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::External,
                         "Unable to open TOML file: " + path.string(),
                         "config_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto parsed = parse_toml(buffer.str());
    if (core::errors::is_error(parsed)) {
        OrchError error = core::errors::get_error(parsed);
        error.message = path.string() + ": " + error.message;
        return error;
    }
    return parsed;
}

std::string toml_quote(const std::string& value) {
    std::string out = "\"";
    for (const char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c);
        }
    }
    out += "\"";
    return out;
}

}  // namespace orch::core::config
