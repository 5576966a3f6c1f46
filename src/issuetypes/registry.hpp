#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/collection.hpp"
#include "issuetypes/issue_type.hpp"

namespace orch::issuetypes {

// Authoritative set of issue types and collections. Reads take a shared lock,
// registration and activation take an exclusive one.
class IssueTypeRegistry {
public:
    // Starts with the builtin types and presets, "devops" active.
    IssueTypeRegistry();

    // Loads <dir>/*.json user types, <dir>/imports/<provider>/<project>/*.json
    // and <dir>/collections.toml. Invalid files are logged and skipped.
    core::errors::Status load(const std::filesystem::path& issuetypes_dir);

    std::optional<IssueType> get(const std::string& key) const;
    std::vector<IssueType> all_types() const;
    std::vector<Collection> all_collections() const;
    std::optional<Collection> get_collection(const std::string& name) const;
    std::vector<IssueType> active_types() const;
    std::string active_collection_name() const;
    std::size_t priority_index(const std::string& key) const;

    core::errors::Status activate_collection(const std::string& name);

    // Fails with validation_failed (all messages joined), or Conflict on a duplicate key.
    core::errors::Status register_type(const IssueType& issue_type);
    core::errors::Status update_type(const std::string& key, const IssueType& issue_type);
    core::errors::Status remove_type(const std::string& key);
    core::errors::Status register_collection(const Collection& collection);

    // Writes <issuetypes_dir>/<KEY>.json for a user type.
    core::errors::Status save_user_type(const IssueType& issue_type) const;

    std::size_t type_count() const;
    std::size_t collection_count() const;

private:
    void load_user_types(const std::filesystem::path& dir);
    void load_imported_types(const std::filesystem::path& imports_dir);
    void load_user_collections(const std::filesystem::path& path);
    // Drops unknown keys with a warning; false when nothing valid is left.
    bool filter_collection(Collection& collection) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, IssueType> types_;
    std::map<std::string, Collection> collections_;
    std::string active_collection_ = "devops";
    std::filesystem::path issuetypes_dir_;
};

}  // namespace orch::issuetypes
