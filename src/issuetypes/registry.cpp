#include "issuetypes/registry.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "issuetypes/builtins.hpp"

namespace orch::issuetypes {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

core::errors::Result<IssueType> read_issue_type_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::External, "Unable to open " + path.string(),
                         "issuetype_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_issue_type(buffer.str());
}

std::vector<std::filesystem::path> json_files_in(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::filesystem::path> subdirectories(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> dirs;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return dirs;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_directory()) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

OrchError validation_failure(const IssueType& issue_type,
                             const std::vector<ValidationError>& errors) {
    return OrchError{ErrorCategory::Validation,
                     "Issue type '" + issue_type.key + "' is invalid: " + describe(errors),
                     "validation_failed"};
}

}  // namespace

IssueTypeRegistry::IssueTypeRegistry() {
    for (auto& issue_type : builtin_issue_types()) {
        types_.emplace(issue_type.key, std::move(issue_type));
    }
    for (auto& collection : builtin_collections()) {
        collections_.emplace(collection.name, std::move(collection));
    }
}

core::errors::Status IssueTypeRegistry::load(const std::filesystem::path& issuetypes_dir) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        issuetypes_dir_ = issuetypes_dir;
    }
    load_user_types(issuetypes_dir);
    load_imported_types(issuetypes_dir / "imports");
    load_user_collections(issuetypes_dir / "collections.toml");
    LOG_INFO("Registry: " + std::to_string(type_count()) + " issue types, " +
             std::to_string(collection_count()) + " collections");
    return core::errors::ok();
}

void IssueTypeRegistry::load_user_types(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& path : json_files_in(dir)) {
        auto parsed = read_issue_type_file(path);
        if (core::errors::is_error(parsed)) {
            LOG_WARN("Skipping issue type " + path.string() + ": " +
                     core::errors::get_error(parsed).message);
            continue;
        }
        IssueType issue_type = core::errors::get_value(parsed);
        issue_type.source = IssueTypeSource::user();
        const auto errors = validate(issue_type);
        if (!errors.empty()) {
            LOG_WARN("Skipping invalid issue type " + path.string() + ": " + describe(errors));
            continue;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        types_[issue_type.key] = issue_type;
        ++count;
    }
    if (count > 0) {
        LOG_INFO("Registry: loaded " + std::to_string(count) + " user-defined issue types");
    }
}

void IssueTypeRegistry::load_imported_types(const std::filesystem::path& imports_dir) {
    std::size_t count = 0;
    for (const auto& provider_dir : subdirectories(imports_dir)) {
        const std::string provider = provider_dir.filename().string();
        for (const auto& project_dir : subdirectories(provider_dir)) {
            const std::string project = project_dir.filename().string();
            for (const auto& path : json_files_in(project_dir)) {
                auto parsed = read_issue_type_file(path);
                if (core::errors::is_error(parsed)) {
                    LOG_WARN("Skipping imported type " + path.string() + ": " +
                             core::errors::get_error(parsed).message);
                    continue;
                }
                IssueType issue_type = core::errors::get_value(parsed);
                issue_type.source = IssueTypeSource::import(provider, project);
                const std::string full_key =
                    core::util::uppercase(project) + "_" + issue_type.key;
                std::unique_lock<std::shared_mutex> lock(mutex_);
                types_[full_key] = issue_type;
                ++count;
            }
        }
    }
    if (count > 0) {
        LOG_INFO("Registry: loaded " + std::to_string(count) + " imported issue types");
    }
}

void IssueTypeRegistry::load_user_collections(const std::filesystem::path& path) {
    auto loaded = load_collections(path);
    if (core::errors::is_error(loaded)) {
        LOG_WARN("Skipping collections file: " + core::errors::get_error(loaded).message);
        return;
    }
    for (auto& [name, collection] : core::errors::get_value(loaded)) {
        if (!filter_collection(collection)) {
            LOG_WARN("Collection '" + name + "' has no valid types, skipping");
            continue;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        collections_[name] = collection;
    }
}

bool IssueTypeRegistry::filter_collection(Collection& collection) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> valid;
    for (const auto& key : collection.types) {
        if (types_.count(key) == 0) {
            LOG_WARN("Collection '" + collection.name + "' references unknown type '" + key +
                     "', dropping it");
            continue;
        }
        valid.push_back(key);
    }
    collection.types = valid;
    collection.priority_order.erase(
        std::remove_if(collection.priority_order.begin(), collection.priority_order.end(),
                       [&valid](const std::string& key) {
                           return std::find(valid.begin(), valid.end(), key) == valid.end();
                       }),
        collection.priority_order.end());
    return !collection.types.empty();
}

std::optional<IssueType> IssueTypeRegistry::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = types_.find(key);
    if (it == types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IssueType> IssueTypeRegistry::all_types() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<IssueType> types;
    types.reserve(types_.size());
    for (const auto& [key, issue_type] : types_) {
        types.push_back(issue_type);
    }
    return types;
}

std::vector<Collection> IssueTypeRegistry::all_collections() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Collection> collections;
    for (const auto& [name, collection] : collections_) {
        collections.push_back(collection);
    }
    return collections;
}

std::optional<Collection> IssueTypeRegistry::get_collection(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = collections_.find(canonical_collection_name(name));
    if (it == collections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IssueType> IssueTypeRegistry::active_types() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<IssueType> types;
    const auto active = collections_.find(active_collection_);
    if (active == collections_.end()) {
        return types;
    }
    for (const auto& key : active->second.types) {
        const auto it = types_.find(key);
        if (it != types_.end()) {
            types.push_back(it->second);
        }
    }
    return types;
}

std::string IssueTypeRegistry::active_collection_name() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return active_collection_;
}

std::size_t IssueTypeRegistry::priority_index(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto active = collections_.find(active_collection_);
    if (active == collections_.end()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return active->second.priority_index(key);
}

core::errors::Status IssueTypeRegistry::activate_collection(const std::string& name) {
    const std::string canonical = canonical_collection_name(name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (collections_.count(canonical) == 0) {
        return OrchError{ErrorCategory::NotFound, "Collection '" + name + "' not found",
                         "collection_not_found"};
    }
    if (active_collection_ != canonical) {
        LOG_INFO("Registry: active collection " + active_collection_ + " -> " + canonical);
        active_collection_ = canonical;
    }
    return core::errors::ok();
}

core::errors::Status IssueTypeRegistry::register_type(const IssueType& issue_type) {
    const auto errors = validate(issue_type);
    if (!errors.empty()) {
        return validation_failure(issue_type, errors);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (types_.count(issue_type.key) > 0) {
        return OrchError{ErrorCategory::Conflict,
                         "Issue type '" + issue_type.key + "' already exists",
                         "duplicate_issue_type"};
    }
    types_.emplace(issue_type.key, issue_type);
    LOG_DEBUG("Registry: registered issue type " + issue_type.key);
    return core::errors::ok();
}

core::errors::Status IssueTypeRegistry::update_type(const std::string& key,
                                                    const IssueType& issue_type) {
    if (issue_type.key != key) {
        return OrchError{ErrorCategory::Input,
                         "Body key '" + issue_type.key + "' does not match '" + key + "'",
                         "key_mismatch"};
    }
    const auto errors = validate(issue_type);
    if (!errors.empty()) {
        return validation_failure(issue_type, errors);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = types_.find(key);
    if (it == types_.end()) {
        return OrchError{ErrorCategory::NotFound, "Issue type '" + key + "' not found",
                         "issuetype_not_found"};
    }
    if (it->second.is_builtin()) {
        return OrchError{ErrorCategory::Permission,
                         "Builtin issue type '" + key + "' cannot be modified",
                         "builtin_readonly"};
    }
    IssueType updated = issue_type;
    updated.source = it->second.source;
    it->second = updated;
    return core::errors::ok();
}

core::errors::Status IssueTypeRegistry::remove_type(const std::string& key) {
    std::filesystem::path file;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto it = types_.find(key);
        if (it == types_.end()) {
            return OrchError{ErrorCategory::NotFound, "Issue type '" + key + "' not found",
                             "issuetype_not_found"};
        }
        if (it->second.is_builtin()) {
            return OrchError{ErrorCategory::Permission,
                             "Builtin issue type '" + key + "' cannot be deleted",
                             "builtin_readonly"};
        }
        if (it->second.source.kind == IssueTypeSource::Kind::User &&
            !issuetypes_dir_.empty()) {
            file = issuetypes_dir_ / (key + ".json");
        }
        types_.erase(it);
    }
    if (!file.empty()) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            LOG_WARN("Registry: unable to remove " + file.string() + ": " + ec.message());
        }
    }
    LOG_INFO("Registry: removed issue type " + key);
    return core::errors::ok();
}

core::errors::Status IssueTypeRegistry::register_collection(const Collection& collection) {
    Collection filtered = collection;
    if (!filter_collection(filtered)) {
        return OrchError{ErrorCategory::Validation,
                         "Collection '" + collection.name + "' has no valid types",
                         "empty_collection"};
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    collections_[filtered.name] = filtered;
    LOG_DEBUG("Registry: registered collection " + filtered.name);
    return core::errors::ok();
}

core::errors::Status IssueTypeRegistry::save_user_type(const IssueType& issue_type) const {
    std::filesystem::path dir;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        dir = issuetypes_dir_;
    }
    if (dir.empty()) {
        return OrchError{ErrorCategory::Precondition,
                         "Registry has no issue type directory to save into",
                         "registry_not_loaded"};
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to create " + dir.string() + ": " + ec.message(),
                         "issuetype_write_failed"};
    }
    const auto path = dir / (issue_type.key + ".json");
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return OrchError{ErrorCategory::External, "Unable to open " + path.string(),
                         "issuetype_write_failed"};
    }
    out << issue_type_to_json(issue_type).dump(2) << "\n";
    if (!out.good()) {
        return OrchError{ErrorCategory::External, "Unable to write " + path.string(),
                         "issuetype_write_failed"};
    }
    return core::errors::ok();
}

std::size_t IssueTypeRegistry::type_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return types_.size();
}

std::size_t IssueTypeRegistry::collection_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collections_.size();
}

}  // namespace orch::issuetypes
