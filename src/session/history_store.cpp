#include "session/history_store.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace overseer::session {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

bool is_valid_key(const std::string& key) {
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return key.find('/') == std::string::npos;
}

}  // namespace

HistoryStore::HistoryStore(std::filesystem::path output_root,
                           std::filesystem::path history_subdir)
    : output_root_(std::move(output_root)),
      history_subdir_(std::move(history_subdir)) {}

std::filesystem::path HistoryStore::path_for(const std::string& key) const {
    return output_root_ / history_subdir_ / (key + ".json");
}

core::errors::Result<std::filesystem::path> HistoryStore::history_dir() const {
    std::error_code ec;
    if (!std::filesystem::exists(output_root_, ec) || ec) {
        return Error{ErrorCategory::Input,
                     "Output root does not exist: " + output_root_.string(),
                     "invalid_output_root"};
    }
    if (!std::filesystem::is_directory(output_root_, ec) || ec) {
        return Error{ErrorCategory::Input,
                     "Output root is not a directory: " + output_root_.string(),
                     "invalid_output_root"};
    }

    const auto dir = output_root_ / history_subdir_;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCategory::Persistence,
                     "Unable to create history directory: " + dir.string(),
                     "history_dir_create_failed"};
    }
    return dir;
}

core::errors::Result<std::filesystem::path> HistoryStore::replace_document(
    const std::string& key, const json& value) const {
    if (!is_valid_key(key)) {
        return Error{ErrorCategory::Input, "Invalid history key: '" + key + "'",
                     "invalid_history_key"};
    }

    auto dir_result = history_dir();
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }

    // Observations carry raw subprocess output; invalid UTF-8 becomes U+FFFD
    // instead of throwing.
    const std::string document =
        value.dump(4, ' ', false, json::error_handler_t::replace);

    const auto target = path_for(key);
    const auto staging = core::errors::get_value(dir_result) /
                         ("." + key + ".json.tmp" + std::to_string(getpid()));
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            return Error{ErrorCategory::Persistence,
                         "Unable to open history file: " + staging.string(),
                         "history_open_failed"};
        }
        out << document;
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code cleanup_ec;
            std::filesystem::remove(staging, cleanup_ec);
            return Error{ErrorCategory::Persistence,
                         "Unable to write history file: " + staging.string(),
                         "history_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(staging, cleanup_ec);
        return Error{ErrorCategory::Persistence,
                     "Unable to replace history file: " + target.string() + ": " +
                         ec.message(),
                     "history_rename_failed"};
    }
    return target;
}

core::errors::Status HistoryStore::write(const std::string& key, const json& value) {
    auto written = replace_document(key, value);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return core::errors::ok();
}

core::errors::Result<std::filesystem::path> HistoryStore::write_summary(
    const std::string& run_id, const protocol::RunReport& report) {
    json summary;
    summary["ts_unix_ms"] = now_unix_ms();
    summary["run_id"] = run_id;
    summary["status"] = "finished";
    summary["termination_reason"] = protocol::to_string(report.reason);
    summary["steps_completed"] = report.steps_completed;
    summary["elapsed_ms"] = report.elapsed.count();
    summary["last_reward"] = report.last_reward;
    summary["detail"] = report.detail;
    return replace_document("run_summary", summary);
}

core::errors::Result<std::filesystem::path> HistoryStore::write_unfinished_summary(
    const std::string& run_id, const std::string& status,
    const std::string& message) {
    json summary;
    summary["ts_unix_ms"] = now_unix_ms();
    summary["run_id"] = run_id;
    summary["status"] = status;
    summary["message"] = message;
    return replace_document("run_summary", summary);
}

}  // namespace overseer::session
