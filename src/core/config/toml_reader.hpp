#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::core::config {

// Reads the TOML subset used by the operator's config and collections files
// into a JSON document: tables, dotted and quoted keys, arrays of tables,
// inline tables, basic/literal/multi-line strings, integers, floats,
// booleans and arrays. Dates are kept as strings.
core::errors::Result<nlohmann::json> parse_toml(const std::string& text);

core::errors::Result<nlohmann::json> read_toml_file(const std::filesystem::path& path);

// Quotes a string for use as a TOML key or value.
std::string toml_quote(const std::string& value);

}  // namespace orch::core::config
