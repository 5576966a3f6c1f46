#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::issuetypes {

// Named, ordered subset of issue-type keys; one collection is active at a time.
struct Collection {
    std::string name;
    std::string description;
    std::vector<std::string> types;
    std::vector<std::string> priority_order;

    // Position in priority_order (or types when no order is given); SIZE_MAX if absent.
    std::size_t priority_index(const std::string& key) const;
    bool contains(const std::string& key) const;
};

// Built-in presets: simple, dev, devops.
std::vector<Collection> builtin_collections();

// Maps preset aliases (dev_kanban, devops_kanban, ...) to their canonical name.
std::string canonical_collection_name(const std::string& name);

nlohmann::json collection_to_json(const Collection& collection);
Collection collection_from_json(const std::string& name, const nlohmann::json& j);

// Parses [collections.<name>] tables from collections.toml text.
core::errors::Result<std::map<std::string, Collection>> parse_collections(
    const std::string& toml_text);
core::errors::Result<std::map<std::string, Collection>> load_collections(
    const std::filesystem::path& path);

}  // namespace orch::issuetypes
