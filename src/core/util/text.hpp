#pragma once
#include <string>
#include <vector>

namespace orch::core::util {

std::string trim(const std::string& value);
std::string trim_start(const std::string& value);
std::string lowercase(std::string value);
std::string uppercase(std::string value);
bool starts_with(const std::string& value, const std::string& prefix);
bool ends_with(const std::string& value, const std::string& suffix);

std::vector<std::string> split(const std::string& value, char delimiter);
// Splits on the delimiter, trims each part and drops empty parts.
std::vector<std::string> split_list(const std::string& value, char delimiter = ',');
std::string join(const std::vector<std::string>& parts, const std::string& separator);
std::string replace_all(std::string value, const std::string& from, const std::string& to);

// Lowercase words of [a-z0-9] joined by '-', cut at max_length without a trailing '-'.
std::string slugify(const std::string& value, std::size_t max_length = 50);

// Wraps the value in single quotes; embedded quotes become '"'"'.
std::string shell_escape(const std::string& value);

// Returns the value as-is when it is a single safe shell word, otherwise
// shell_escape(value). An empty value becomes ''.
std::string shell_word(const std::string& value);

// Cuts at the last space before max_length and appends "...".
std::string truncate_words(const std::string& value, std::size_t max_length);

}  // namespace orch::core::util
