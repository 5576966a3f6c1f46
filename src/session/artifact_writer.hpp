#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::session {

// Writes per-launch files under <tickets>/operator: prompts/<uuid>.txt,
// commands/<uuid>.sh and sessions/<ticket_id>/{audit.json, aux configs}.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path operator_dir);

    core::errors::Result<std::filesystem::path> session_dir(const std::string& ticket_id) const;

    core::errors::Result<std::filesystem::path> write_session_file(
        const std::string& ticket_id, const std::string& filename,
        const std::string& content) const;

    core::errors::Result<std::filesystem::path> write_audit(const std::string& ticket_id,
                                                            const nlohmann::json& record) const;

    core::errors::Result<std::filesystem::path> write_prompt(const std::string& session_id,
                                                             const std::string& prompt) const;

    // Written with mode 0755.
    core::errors::Result<std::filesystem::path> write_script(const std::string& session_id,
                                                             const std::string& script) const;

    const std::filesystem::path& operator_dir() const { return operator_dir_; }

private:
    core::errors::Result<std::filesystem::path> artifact_dir(const std::string& subdir) const;
    core::errors::Result<std::filesystem::path> write_text(const std::filesystem::path& path,
                                                           const std::string& text) const;

    std::filesystem::path operator_dir_;
};

}  // namespace orch::session
