#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"

namespace neoforge::session {

struct PhaseJournalEntry {
    std::string phase_id;
    std::string label;
    std::string outcome;        // engine outcome, or "error"
    std::uint32_t productive_calls = 0;
    std::uint32_t rate_limit_hits = 0;
    std::uint32_t malformed_retries = 0;
    bool artifact_present = false;
};

// Appends JSON-lines events for one pipeline run to <root>/<subdir>/<run_id>.jsonl.
class RunJournal {
public:
    explicit RunJournal(std::filesystem::path workspace_root,
                        std::filesystem::path journal_subdir = "logs");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const std::string& requirement,
        const std::string& model) const;

    core::errors::Result<std::filesystem::path> write_phase_started(
        const std::string& run_id, const std::string& phase_id,
        const std::string& label) const;

    core::errors::Result<std::filesystem::path> write_phase_finished(
        const std::string& run_id, const PhaseJournalEntry& entry) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, bool succeeded, const std::string& summary,
        const std::optional<std::string>& error_message = std::nullopt) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path journal_subdir_;
};

}  // namespace neoforge::session
