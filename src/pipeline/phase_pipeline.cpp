#include "pipeline/phase_pipeline.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace neoforge::pipeline {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

PhasePipeline::PhasePipeline(runtime::ExecutionEngine& engine, std::vector<Phase> phases,
                             status::ProgressSink* progress)
    : engine_(engine), phases_(std::move(phases)), progress_(progress) {}

std::string PhasePipeline::to_string(const PipelineState state) {
    switch (state) {
        case PipelineState::Created:
            return "created";
        case PipelineState::Running:
            return "running";
        case PipelineState::Completed:
            return "completed";
        case PipelineState::Aborted:
            return "aborted";
        default:
            return "unknown";
    }
}

void PhasePipeline::transition(const PipelineState next) {
    LOG_INFO("PhasePipeline: transition " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

void PhasePipeline::journal_error(
    const session::RunJournal* journal, const std::string& run_id,
    const core::errors::Result<std::filesystem::path>& written) const {
    if (journal != nullptr && core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        LOG_WARN("PhasePipeline: journal write failed for " + run_id + " [" + err.code +
                 "]: " + err.message);
    }
}

core::errors::Result<PipelineReport> PhasePipeline::run(const std::string& run_id,
                                                        const std::string& requirement,
                                                        const ProjectWorkspace& workspace,
                                                        const session::RunJournal* journal) {
    if (state_ != PipelineState::Created) {
        return ForgeError{ErrorCategory::Internal,
                          "Pipeline already used (state " + to_string(state_) + ").",
                          "invalid_state_transition"};
    }
    transition(PipelineState::Running);

    LOG_INFO("Starting orchestration for: " + requirement);
    LOG_INFO("Output directory: " + workspace.root().string());
    if (journal != nullptr) {
        journal_error(journal, run_id,
                      journal->write_request(run_id, requirement, engine_.model()));
    }

    PipelineReport report;
    report.run_id = run_id;

    for (std::size_t i = 0; i < phases_.size(); ++i) {
        const Phase& phase = phases_[i];
        const auto vars = phase_variables(phase, requirement);

        runtime::AgentTurn turn;
        turn.agent_label = phase.label;
        turn.system_prompt = format_template(phase.instruction_template, vars);
        turn.user_message = format_template(phase.message_template, vars);
        turn.workspace_root = workspace.root();

        LOG_INFO("PhasePipeline: phase " + std::to_string(i + 1) + "/" +
                 std::to_string(phases_.size()) + " " + phase.id + " (" + phase.label + ")");
        if (progress_ != nullptr) {
            progress_->update(phase.label, turn.user_message.substr(0, 60),
                              "Phase " + phase.id + " started");
        }
        if (journal != nullptr) {
            journal_error(journal, run_id,
                          journal->write_phase_started(run_id, phase.id, phase.label));
        }

        auto engine_result = engine_.run(turn);
        if (core::errors::is_error(engine_result)) {
            const ForgeError& err = core::errors::get_error(engine_result);
            LOG_ERROR("PhasePipeline: " + phase.label + " failed [" + err.code +
                      "]: " + err.message);
            if (journal != nullptr) {
                session::PhaseJournalEntry entry{phase.id, phase.label, "error", 0, 0, 0,
                                                 false};
                journal_error(journal, run_id, journal->write_phase_finished(run_id, entry));
                journal_error(journal, run_id,
                              journal->write_final(run_id, false, "Phase " + phase.id +
                                                                      " failed.",
                                                   err.message));
            }
            if (progress_ != nullptr) {
                progress_->update("System", "Aborted", "Phase " + phase.id + " failed");
            }
            transition(PipelineState::Aborted);
            return err;
        }

        const runtime::EngineResult& outcome = core::errors::get_value(engine_result);
        PhaseReport phase_report;
        phase_report.phase_id = phase.id;
        phase_report.label = phase.label;
        phase_report.outcome = outcome.outcome;
        phase_report.result_text = outcome.text;
        phase_report.counters = outcome.counters;
        // The gate looks at the disk, never at the engine's sentinel text.
        phase_report.artifact_present = artifact_present(workspace.root(), phase);

        if (journal != nullptr) {
            session::PhaseJournalEntry entry{phase.id,
                                             phase.label,
                                             runtime::to_string(outcome.outcome),
                                             outcome.counters.productive_calls,
                                             outcome.counters.rate_limit_hits,
                                             outcome.counters.malformed_retries,
                                             phase_report.artifact_present};
            journal_error(journal, run_id, journal->write_phase_finished(run_id, entry));
        }

        if (!phase_report.artifact_present) {
            const std::string artifact = phase.required_artifact.generic_string();
            LOG_ERROR(phase.label + " failed to create " + artifact + ". Aborting.");
            if (progress_ != nullptr) {
                progress_->update("System", "Aborted",
                                  artifact + " missing after phase " + phase.id);
            }
            ForgeError error{ErrorCategory::Structural,
                             artifact + " not created by " + phase.label + " agent.",
                             "missing_artifact",
                             "Engine outcome was " + runtime::to_string(outcome.outcome) +
                                 ": " + outcome.text};
            if (journal != nullptr) {
                journal_error(journal, run_id,
                              journal->write_final(run_id, false, "Aborted at phase " + phase.id,
                                                   error.message));
            }
            transition(PipelineState::Aborted);
            return error;
        }

        completed_.push_back(phase_report);
        report.phases.push_back(std::move(phase_report));
    }

    report.summary = "NeoForge pipeline completed. Output in: " + workspace.root().string();
    if (progress_ != nullptr) {
        progress_->update("System", "Orchestration Complete", "All phases completed");
    }
    if (journal != nullptr) {
        journal_error(journal, run_id, journal->write_final(run_id, true, report.summary));
    }
    LOG_INFO("Orchestration complete.");
    transition(PipelineState::Completed);
    return report;
}

}  // namespace neoforge::pipeline
