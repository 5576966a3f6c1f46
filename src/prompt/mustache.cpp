#include "prompt/mustache.hpp"

#include <memory>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"

namespace orch::prompt {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

enum class TokenKind { Text, Variable, Section, Inverted, Close, Comment };

struct Token {
    TokenKind kind;
    std::string value;
};

struct Node {
    TokenKind kind;
    std::string value;
    std::vector<Node> children;
};

bool is_blank(const std::string& text, std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
        if (text[i] != ' ' && text[i] != '\t') return false;
    }
    return true;
}

core::errors::Result<std::vector<Token>> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find("{{", pos);
        if (open == std::string::npos) {
            tokens.push_back({TokenKind::Text, text.substr(pos)});
            break;
        }
        if (open > pos) {
            tokens.push_back({TokenKind::Text, text.substr(pos, open - pos)});
        }

        const bool triple = text.compare(open, 3, "{{{") == 0;
        const std::string closer = triple ? "}}}" : "}}";
        const std::size_t content_start = open + (triple ? 3 : 2);
        const auto close = text.find(closer, content_start);
        if (close == std::string::npos) {
            return OrchError{ErrorCategory::Malformed,
                             "Unterminated tag at offset " + std::to_string(open),
                             "template_unterminated_tag"};
        }
        std::string tag = core::util::trim(text.substr(content_start, close - content_start));
        pos = close + closer.size();

        if (triple) {
            tokens.push_back({TokenKind::Variable, tag});
            continue;
        }
        const char sigil = tag.empty() ? '\0' : tag.front();
        const std::string name = tag.empty() ? tag : core::util::trim(tag.substr(1));
        switch (sigil) {
            case '!': tokens.push_back({TokenKind::Comment, ""}); break;
            case '#': tokens.push_back({TokenKind::Section, name}); break;
            case '^': tokens.push_back({TokenKind::Inverted, name}); break;
            case '/': tokens.push_back({TokenKind::Close, name}); break;
            case '&': tokens.push_back({TokenKind::Variable, name}); break;
            default: tokens.push_back({TokenKind::Variable, tag}); break;
        }
    }
    return tokens;
}

// Drops the line of a tag that is the only thing on it.
void strip_standalone(std::vector<Token>& tokens) {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const TokenKind kind = tokens[i].kind;
        if (kind == TokenKind::Text || kind == TokenKind::Variable) continue;

        std::size_t line_start = 0;
        bool before_ok = false;
        if (i == 0) {
            before_ok = true;
        } else if (tokens[i - 1].kind == TokenKind::Text) {
            const std::string& prev = tokens[i - 1].value;
            const auto newline = prev.rfind('\n');
            line_start = newline == std::string::npos ? 0 : newline + 1;
            // Without a newline the tag is only standalone at the very start.
            before_ok = is_blank(prev, line_start, prev.size()) &&
                        (newline != std::string::npos || i == 1);
        }
        if (!before_ok) continue;

        std::size_t line_end = 0;
        bool after_ok = false;
        bool at_end = i + 1 == tokens.size();
        if (at_end) {
            after_ok = true;
        } else if (tokens[i + 1].kind == TokenKind::Text) {
            const std::string& next = tokens[i + 1].value;
            const auto newline = next.find('\n');
            const std::size_t limit = newline == std::string::npos ? next.size() : newline;
            if (is_blank(next, 0, limit) && (newline != std::string::npos || i + 2 == tokens.size())) {
                after_ok = true;
                line_end = newline == std::string::npos ? next.size() : newline + 1;
            }
        }
        if (!after_ok) continue;

        if (i > 0) tokens[i - 1].value.erase(line_start);
        if (!at_end) tokens[i + 1].value.erase(0, line_end);
    }
}

core::errors::Result<std::vector<Node>> build_tree(const std::vector<Token>& tokens) {
    std::vector<Node> root;
    std::vector<std::vector<Node>*> stack{&root};
    std::vector<std::string> open_names;
    // Owned section nodes under construction, innermost last.
    std::vector<std::unique_ptr<Node>> pending;

    for (const auto& token : tokens) {
        switch (token.kind) {
            case TokenKind::Comment:
                break;
            case TokenKind::Text:
            case TokenKind::Variable:
                stack.back()->push_back(Node{token.kind, token.value, {}});
                break;
            case TokenKind::Section:
            case TokenKind::Inverted:
                pending.push_back(std::make_unique<Node>(Node{token.kind, token.value, {}}));
                stack.push_back(&pending.back()->children);
                open_names.push_back(token.value);
                break;
            case TokenKind::Close: {
                if (open_names.empty() || open_names.back() != token.value) {
                    return OrchError{ErrorCategory::Malformed,
                                     "Unexpected closing tag {{/" + token.value + "}}",
                                     "template_mismatched_section"};
                }
                Node finished = std::move(*pending.back());
                pending.pop_back();
                stack.pop_back();
                open_names.pop_back();
                stack.back()->push_back(std::move(finished));
                break;
            }
        }
    }
    if (!open_names.empty()) {
        return OrchError{ErrorCategory::Malformed,
                         "Unclosed section {{#" + open_names.back() + "}}",
                         "template_unclosed_section"};
    }
    return root;
}

const json* lookup(const std::vector<const json*>& scopes, const std::string& name) {
    if (name == ".") {
        return scopes.back();
    }
    const auto parts = core::util::split(name, '.');
    for (auto it = scopes.rbegin(); it != scopes.rend(); ++it) {
        const json* scope = *it;
        if (!scope->is_object() || !scope->contains(parts.front())) continue;
        const json* value = &(*scope)[parts.front()];
        for (std::size_t i = 1; i < parts.size() && value != nullptr; ++i) {
            value = value->is_object() && value->contains(parts[i]) ? &(*value)[parts[i]]
                                                                    : nullptr;
        }
        return value;
    }
    return nullptr;
}

bool truthy(const json* value) {
    if (value == nullptr || value->is_null()) return false;
    if (value->is_boolean()) return value->get<bool>();
    if (value->is_string()) return !value->get_ref<const std::string&>().empty();
    if (value->is_array() || value->is_object()) return !value->empty();
    if (value->is_number_integer()) return value->get<long long>() != 0;
    if (value->is_number()) return value->get<double>() != 0.0;
    return true;
}

std::string stringify(const json* value) {
    if (value == nullptr || value->is_null()) return "";
    if (value->is_string()) return value->get<std::string>();
    return value->dump();
}

void render_nodes(const std::vector<Node>& nodes, std::vector<const json*>& scopes,
                  std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
            case TokenKind::Text:
                out += node.value;
                break;
            case TokenKind::Variable:
                out += stringify(lookup(scopes, node.value));
                break;
            case TokenKind::Section: {
                const json* value = lookup(scopes, node.value);
                if (!truthy(value)) break;
                if (value->is_array()) {
                    for (const auto& item : *value) {
                        scopes.push_back(&item);
                        render_nodes(node.children, scopes, out);
                        scopes.pop_back();
                    }
                } else {
                    scopes.push_back(value);
                    render_nodes(node.children, scopes, out);
                    scopes.pop_back();
                }
                break;
            }
            case TokenKind::Inverted:
                if (!truthy(lookup(scopes, node.value))) {
                    render_nodes(node.children, scopes, out);
                }
                break;
            case TokenKind::Close:
            case TokenKind::Comment:
                break;
        }
    }
}

}  // namespace

core::errors::Result<std::string> render_template(const std::string& text, const json& context) {
    auto tokens = tokenize(text);
    if (core::errors::is_error(tokens)) {
        return core::errors::get_error(tokens);
    }
    strip_standalone(core::errors::get_value(tokens));
    auto tree = build_tree(core::errors::get_value(tokens));
    if (core::errors::is_error(tree)) {
        return core::errors::get_error(tree);
    }
    std::vector<const json*> scopes{&context};
    std::string out;
    render_nodes(core::errors::get_value(tree), scopes, out);
    return out;
}

std::string render_or_raw(const std::string& text, const json& context) {
    auto rendered = render_template(text, context);
    if (core::errors::is_error(rendered)) {
        LOG_WARN("Template left unrendered: " + core::errors::get_error(rendered).message);
        return text;
    }
    return core::errors::get_value(rendered);
}

}  // namespace orch::prompt
