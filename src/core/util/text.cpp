#include "core/util/text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>

namespace orch::core::util {

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string trim_start(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    return value.substr(begin);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& value, const char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(value);
    while (std::getline(in, current, delimiter)) {
        parts.push_back(current);
    }
    if (!value.empty() && value.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::vector<std::string> split_list(const std::string& value, const char delimiter) {
    std::vector<std::string> parts;
    for (const auto& part : split(value, delimiter)) {
        const std::string trimmed = trim(part);
        if (!trimmed.empty()) {
            parts.push_back(trimmed);
        }
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

std::string replace_all(std::string value, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return value;
    }
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

std::string slugify(const std::string& value, const std::size_t max_length) {
    std::string slug;
    bool pending_dash = false;
    for (const unsigned char c : value) {
        if (std::isalnum(c) != 0) {
            if (pending_dash && !slug.empty()) {
                slug.push_back('-');
            }
            pending_dash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }
    if (slug.size() > max_length) {
        slug.resize(max_length);
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    return slug;
}

std::string shell_escape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    escaped.push_back('\'');
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\"'\"'";
        } else {
            escaped.push_back(c);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string shell_word(const std::string& value) {
    if (value.empty()) {
        return "''";
    }
    const bool safe = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || std::string_view("@%+=:,./_-").find(static_cast<char>(c)) !=
                                      std::string_view::npos;
    });
    return safe ? value : shell_escape(value);
}

std::string truncate_words(const std::string& value, const std::size_t max_length) {
    if (value.size() <= max_length) {
        return value;
    }
    const std::size_t limit = max_length > 3 ? max_length - 3 : 0;
    std::string cut = value.substr(0, limit);
    const auto last_space = cut.find_last_of(' ');
    if (last_space != std::string::npos && last_space > 0) {
        cut = cut.substr(0, last_space);
    }
    return cut + "...";
}

}  // namespace orch::core::util
