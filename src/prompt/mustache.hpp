#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::prompt {

// Logic-less template rendering over a JSON context.
//
// Supports {{ name }}, {{{ name }}} and {{& name }} (all unescaped, prompts are
// plain text), dotted names, {{#section}}...{{/section}} over truthy values and
// lists ({{.}} is the current item), {{^inverted}} and {{! comments }}.
// Section, inverted, closing and comment tags alone on a line remove that line.
// Missing keys render as empty strings.
core::errors::Result<std::string> render_template(const std::string& text,
                                                  const nlohmann::json& context);

// Same as render_template but replaces any parse failure with the raw text.
std::string render_or_raw(const std::string& text, const nlohmann::json& context);

}  // namespace orch::prompt
