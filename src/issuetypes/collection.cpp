#include "issuetypes/collection.hpp"

#include <algorithm>
#include <limits>
#include "core/config/toml_reader.hpp"
#include "core/util/text.hpp"

namespace orch::issuetypes {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

std::size_t Collection::priority_index(const std::string& key) const {
    const auto& order = priority_order.empty() ? types : priority_order;
    const auto it = std::find(order.begin(), order.end(), key);
    if (it == order.end()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(std::distance(order.begin(), it));
}

bool Collection::contains(const std::string& key) const {
    return std::find(types.begin(), types.end(), key) != types.end();
}

std::vector<Collection> builtin_collections() {
    return {
        Collection{"simple", "Simple workflow with TASK only", {"TASK"}, {}},
        Collection{"dev",
                   "Developer kanban with TASK, FEAT, FIX",
                   {"TASK", "FEAT", "FIX"},
                   {"FIX", "FEAT", "TASK"}},
        Collection{"devops",
                   "DevOps kanban with TASK, SPIKE, INV, FEAT, FIX",
                   {"TASK", "SPIKE", "INV", "FEAT", "FIX"},
                   {"INV", "FIX", "FEAT", "SPIKE", "TASK"}},
    };
}

std::string canonical_collection_name(const std::string& name) {
    const std::string lowered = core::util::lowercase(name);
    if (lowered == "dev_kanban" || lowered == "devkanban") return "dev";
    if (lowered == "devops_kanban" || lowered == "devopskanban") return "devops";
    if (lowered == "simple" || lowered == "dev" || lowered == "devops") return lowered;
    return name;
}

json collection_to_json(const Collection& collection) {
    return json{{"name", collection.name},
                {"description", collection.description},
                {"types", collection.types},
                {"priority_order", collection.priority_order}};
}

Collection collection_from_json(const std::string& name, const json& j) {
    Collection collection;
    collection.name = j.value("name", name);
    collection.description = j.value("description", "");
    if (j.contains("types") && j["types"].is_array()) {
        for (const auto& entry : j["types"]) {
            if (entry.is_string()) collection.types.push_back(entry.get<std::string>());
        }
    }
    if (j.contains("priority_order") && j["priority_order"].is_array()) {
        for (const auto& entry : j["priority_order"]) {
            if (entry.is_string()) {
                collection.priority_order.push_back(entry.get<std::string>());
            }
        }
    }
    return collection;
}

namespace {

core::errors::Result<std::map<std::string, Collection>> collections_from_document(
    const json& doc) {
    std::map<std::string, Collection> collections;
    if (!doc.contains("collections")) {
        return collections;
    }
    if (!doc["collections"].is_object()) {
        return OrchError{ErrorCategory::Malformed,
                         "'collections' must be a table of named collections",
                         "invalid_collections"};
    }
    for (const auto& [name, body] : doc["collections"].items()) {
        if (!body.is_object()) {
            return OrchError{ErrorCategory::Malformed,
                             "Collection '" + name + "' must be a table",
                             "invalid_collections"};
        }
        collections.emplace(name, collection_from_json(name, body));
    }
    return collections;
}

}  // namespace

core::errors::Result<std::map<std::string, Collection>> parse_collections(
    const std::string& toml_text) {
    auto parsed = core::config::parse_toml(toml_text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return collections_from_document(core::errors::get_value(parsed));
}

core::errors::Result<std::map<std::string, Collection>> load_collections(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::map<std::string, Collection>{};
    }
    auto parsed = core::config::read_toml_file(path);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return collections_from_document(core::errors::get_value(parsed));
}

}  // namespace orch::issuetypes
