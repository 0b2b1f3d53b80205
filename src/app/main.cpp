#include <filesystem>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/phase.hpp"
#include "pipeline/phase_pipeline.hpp"
#include "pipeline/project_workspace.hpp"
#include "provider/credential_pool.hpp"
#include "provider/http_chat_transport.hpp"
#include "runtime/execution_engine.hpp"
#include "session/run_journal.hpp"
#include "status/progress_sink.hpp"
#include "status/status_publisher.hpp"

namespace {

void print_failure(const neoforge::core::errors::ForgeError& err,
                   const neoforge::pipeline::PhasePipeline* pipeline) {
    std::cerr << "\nExecution failed\n"
              << "  category: " << neoforge::core::errors::to_string(err.category) << "\n"
              << "  code:     " << err.code << "\n"
              << "  message:  " << err.message << "\n";
    if (!err.hint.empty()) {
        std::cerr << "  hint:     " << err.hint << "\n";
    }
    if (pipeline == nullptr) {
        return;
    }
    std::cerr << "  pipeline state: "
              << neoforge::pipeline::PhasePipeline::to_string(pipeline->state()) << "\n"
              << "  phase trail:\n";
    for (const auto& phase : pipeline->completed_phases()) {
        std::cerr << "    [ok]     " << phase.phase_id << " (" << phase.label << ") "
                  << neoforge::runtime::to_string(phase.outcome) << ", "
                  << phase.counters.productive_calls << " call(s), "
                  << phase.counters.rate_limit_hits << " rate hit(s)\n";
    }
    const auto done = pipeline->completed_phases().size();
    if (done < pipeline->phases().size()) {
        const auto& failed = pipeline->phases()[done];
        std::cerr << "    [failed] " << failed.id << " (" << failed.label << ")\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a unique Run ID for this execution
    const std::string run_id = neoforge::core::config::generate_run_id();
    neoforge::core::logging::Logger::get().set_run_id(run_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = neoforge::app::cli::parse_and_validate(argc, argv);
    if (neoforge::core::errors::is_error(parsed)) {
        const auto& err = neoforge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = neoforge::core::errors::get_value(parsed);
    if (options.verbose) {
        neoforge::core::logging::Logger::get().set_min_level(
            neoforge::core::logging::LogLevel::DEBUG);
    }

    // 3. Configuration: dotenv, environment, CLI overrides
    auto dotenv = neoforge::core::config::load_dotenv(options.env_file.value_or(".env"));
    if (neoforge::core::errors::is_error(dotenv)) {
        const auto& err = neoforge::core::errors::get_error(dotenv);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 3;
    }
    auto settings =
        neoforge::core::config::load_settings(neoforge::core::config::process_environment());
    if (options.model) {
        settings.model = neoforge::core::config::normalize_model_id(options.model.value());
    }
    if (options.projects_dir) {
        settings.projects_dir = options.projects_dir.value();
    }
    if (!neoforge::core::logging::Logger::get().set_file_sink(settings.log_file)) {
        LOG_WARN("Unable to open log file " + settings.log_file.string());
    }

    LOG_INFO("Initializing NeoForge orchestrator...");
    auto pool_result = neoforge::provider::CredentialPool::build(settings.credentials);
    if (neoforge::core::errors::is_error(pool_result)) {
        const auto& err = neoforge::core::errors::get_error(pool_result);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        print_failure(err, nullptr);
        return 3;
    }
    const auto& pool = neoforge::core::errors::get_value(pool_result);

    // 4. Project workspace
    auto workspace_result = neoforge::pipeline::ProjectWorkspace::create(
        settings.projects_dir, options.requirement);
    if (neoforge::core::errors::is_error(workspace_result)) {
        const auto& err = neoforge::core::errors::get_error(workspace_result);
        LOG_ERROR("Workspace error [" + err.code + "]: " + err.message);
        print_failure(err, nullptr);
        return 1;
    }
    const auto& workspace = neoforge::core::errors::get_value(workspace_result);
    std::cout << "\nProject folder: " << workspace.root().string() << "\n" << std::endl;
    LOG_INFO("Project directory: " + workspace.root().string());

    // 5. Progress sink and its observer
    neoforge::status::ProgressSink progress;
    progress.update("System", "Initializing...");
    neoforge::status::StatusPublisher publisher(progress, workspace.logs_dir() / "status.json");
    if (options.publish_status) {
        publisher.start();
    }

    // 6. Engine + pipeline
    neoforge::provider::HttpChatConfig http_config;
    http_config.api_base = settings.api_base;
    http_config.timeout_seconds = settings.http_timeout_seconds;
    neoforge::provider::HttpChatTransport transport(http_config);

    neoforge::runtime::ExecutionEngine engine(transport, pool, settings.model, settings.limits,
                                              &progress);
    neoforge::pipeline::PhasePipeline pipeline(engine, neoforge::pipeline::default_phases(),
                                               &progress);
    const neoforge::session::RunJournal journal(workspace.root());

    auto run_result = pipeline.run(run_id, options.requirement, workspace, &journal);
    publisher.stop();

    if (neoforge::core::errors::is_error(run_result)) {
        const auto& err = neoforge::core::errors::get_error(run_result);
        LOG_ERROR("Execution failed [" + err.code + "]: " + err.message);
        print_failure(err, &pipeline);
        return 1;
    }

    const auto& report = neoforge::core::errors::get_value(run_result);
    std::cout << "\n\n*** NEOFORGE EXECUTION COMPLETE ***\n"
              << "Project output: " << workspace.root().string() << "\n"
              << "Final Result:\n"
              << report.summary << std::endl;
    auto journal_path = journal.journal_path(run_id);
    if (!neoforge::core::errors::is_error(journal_path)) {
        LOG_INFO("Run journal: " + neoforge::core::errors::get_value(journal_path).string());
    }
    return 0;
}
