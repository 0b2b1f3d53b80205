#pragma once

#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "pipeline/phase.hpp"
#include "pipeline/project_workspace.hpp"
#include "runtime/execution_engine.hpp"
#include "session/run_journal.hpp"
#include "status/progress_sink.hpp"

namespace neoforge::pipeline {

enum class PipelineState {
    Created,
    Running,
    Completed,
    Aborted
};

struct PhaseReport {
    std::string phase_id;
    std::string label;
    runtime::RunOutcome outcome = runtime::RunOutcome::Completed;
    std::string result_text;
    runtime::EngineCounters counters;
    bool artifact_present = false;
};

struct PipelineReport {
    std::string run_id;
    std::vector<PhaseReport> phases;
    std::string summary;
};

// Linear chain of gated phases. Each phase is one engine run followed by an
// existence check of its artifact; a missing artifact aborts the whole run
// before the next phase starts.
class PhasePipeline {
public:
    PhasePipeline(runtime::ExecutionEngine& engine, std::vector<Phase> phases,
                  status::ProgressSink* progress = nullptr);

    core::errors::Result<PipelineReport> run(const std::string& run_id,
                                             const std::string& requirement,
                                             const ProjectWorkspace& workspace,
                                             const session::RunJournal* journal = nullptr);

    PipelineState state() const { return state_; }
    // Phases whose artifact was verified, in order.
    const std::vector<PhaseReport>& completed_phases() const { return completed_; }
    const std::vector<Phase>& phases() const { return phases_; }

    static std::string to_string(PipelineState state);

private:
    void transition(PipelineState next);
    void journal_error(const session::RunJournal* journal, const std::string& run_id,
                       const core::errors::Result<std::filesystem::path>& written) const;

    runtime::ExecutionEngine& engine_;
    std::vector<Phase> phases_;
    status::ProgressSink* progress_;
    PipelineState state_ = PipelineState::Created;
    std::vector<PhaseReport> completed_;
};

}  // namespace neoforge::pipeline
