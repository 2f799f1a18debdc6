#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "protocol/collaborators.hpp"
#include "protocol/run_execution_contract.hpp"

namespace overseer::session {

// File-backed PersistSink. Each key is one pretty-printed JSON document under
// <output_root>/<history_subdir>/<key>.json, replaced atomically by writing a
// temporary file and renaming it over the old one.
class HistoryStore : public protocol::PersistSink {
public:
    explicit HistoryStore(std::filesystem::path output_root,
                          std::filesystem::path history_subdir = "agent_history");

    core::errors::Status write(const std::string& key,
                               const nlohmann::json& value) override;

    core::errors::Result<std::filesystem::path> write_summary(
        const std::string& run_id, const protocol::RunReport& report);

    core::errors::Result<std::filesystem::path> write_unfinished_summary(
        const std::string& run_id, const std::string& status,
        const std::string& message);

    core::errors::Result<std::filesystem::path> history_dir() const;

    std::filesystem::path path_for(const std::string& key) const;

private:
    core::errors::Result<std::filesystem::path> replace_document(
        const std::string& key, const nlohmann::json& value) const;

    std::filesystem::path output_root_;
    std::filesystem::path history_subdir_;
};

}  // namespace overseer::session
