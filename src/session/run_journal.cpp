#include "session/run_journal.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace neoforge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& name, const std::string& run_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

// Invalid UTF-8 in model or user text is replaced rather than thrown on.
std::string to_line(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

RunJournal::RunJournal(std::filesystem::path workspace_root,
                       std::filesystem::path journal_subdir)
    : workspace_root_(std::move(workspace_root)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> RunJournal::journal_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return ForgeError{ErrorCategory::Input, "Run ID cannot be empty.",
                          "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto journal_dir = workspace_root_ / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to create journal directory: " +
                              journal_dir.string(),
                          "journal_dir_create_failed"};
    }

    return journal_dir / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> RunJournal::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto path_result = journal_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to open journal file: " + path.string(),
                          "journal_write_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to write journal event: " + path.string(),
                          "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> RunJournal::write_request(
    const std::string& run_id, const std::string& requirement,
    const std::string& model) const {
    json payload;
    payload["requirement"] = requirement;
    payload["model"] = model;
    payload["workspace_root"] = workspace_root_.string();
    return append_event(run_id, to_line(make_event("request", run_id, std::move(payload))));
}

core::errors::Result<std::filesystem::path> RunJournal::write_phase_started(
    const std::string& run_id, const std::string& phase_id,
    const std::string& label) const {
    json payload;
    payload["phase"] = phase_id;
    payload["label"] = label;
    return append_event(run_id,
                        to_line(make_event("phase_started", run_id, std::move(payload))));
}

core::errors::Result<std::filesystem::path> RunJournal::write_phase_finished(
    const std::string& run_id, const PhaseJournalEntry& entry) const {
    json payload;
    payload["phase"] = entry.phase_id;
    payload["label"] = entry.label;
    payload["outcome"] = entry.outcome;
    payload["productive_calls"] = entry.productive_calls;
    payload["rate_limit_hits"] = entry.rate_limit_hits;
    payload["malformed_retries"] = entry.malformed_retries;
    payload["artifact_present"] = entry.artifact_present;
    return append_event(run_id,
                        to_line(make_event("phase_finished", run_id, std::move(payload))));
}

core::errors::Result<std::filesystem::path> RunJournal::write_final(
    const std::string& run_id, const bool succeeded, const std::string& summary,
    const std::optional<std::string>& error_message) const {
    json payload;
    payload["status"] = succeeded ? "completed" : "failed";
    payload["summary"] = summary;
    payload["error_message"] =
        error_message.has_value() ? error_message.value() : "";
    return append_event(run_id, to_line(make_event("final", run_id, std::move(payload))));
}

}  // namespace neoforge::session
