#include "pipeline/phase.hpp"

#include <system_error>

namespace neoforge::pipeline {

std::string format_template(const std::string& text,
                            const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('{', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        const auto close = text.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        const std::string name = text.substr(open + 1, close - open - 1);
        const auto it = vars.find(name);
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

std::map<std::string, std::string> phase_variables(const Phase& phase,
                                                   const std::string& requirement) {
    std::string inputs;
    for (const auto& input : phase.inputs) {
        if (!inputs.empty()) {
            inputs += ", ";
        }
        inputs += input.generic_string();
    }
    return {{"deliverable", phase.required_artifact.generic_string()},
            {"inputs", inputs},
            {"requirement", requirement}};
}

bool artifact_present(const std::filesystem::path& workspace_root, const Phase& phase) {
    const auto path = workspace_root / phase.required_artifact;
    std::error_code ec;
    switch (phase.artifact_kind) {
        case ArtifactKind::File:
            return std::filesystem::is_regular_file(path, ec) && !ec;
        case ArtifactKind::NonEmptyDirectory:
            if (!std::filesystem::is_directory(path, ec) || ec) {
                return false;
            }
            return std::filesystem::directory_iterator(path, ec) !=
                       std::filesystem::directory_iterator() &&
                   !ec;
    }
    return false;
}

std::vector<Phase> default_phases() {
    std::vector<Phase> phases;

    phases.push_back(Phase{
        "requirements", "Project Manager",
        "You are a Project Manager. Write a detailed Product Requirements Document for the "
        "given project.\nCall write_file ONCE with path='{deliverable}' containing a thorough "
        "PRD. Then stop.",
        "Write a PRD for this project: {requirement}",
        "PRD.md", ArtifactKind::File, {}});

    phases.push_back(Phase{
        "architecture", "Architect",
        "You are a Project Manager and System Architect.\n"
        "First, call read_file for each of: {inputs}.\n"
        "Then call write_file ONCE with path='{deliverable}'.\n\n"
        "{deliverable} must describe:\n"
        "1. Technology stack choices\n"
        "2. Folder layout:\n"
        "   - src/      : main source code files (list each file with its purpose)\n"
        "   - tests/    : unit test files\n"
        "   - frontend/ : HTML/CSS/JS files (if applicable)\n"
        "   - logs/     : runtime log files\n"
        "3. Every source file explicitly, one per line with its purpose.",
        "Read {inputs}, then write {deliverable} with the folder layout and file list.",
        "ARCHITECTURE.md", ArtifactKind::File, {"PRD.md"}});

    phases.push_back(Phase{
        "task_list", "Team Lead",
        "You are a Team Lead. Break the project into development tasks.\n"
        "First, call read_file for each of: {inputs}.\n"
        "Then, call write_file ONCE with path='{deliverable}'.\n\n"
        "The JSON must be an array of task objects, each with: id, name, description, files.\n"
        "The 'files' key must list REAL source file paths that match the architecture.\n\n"
        "Critical rules:\n"
        "- Do NOT use names like 'file1.txt'.\n"
        "- Use paths from the architecture (src/, frontend/, tests/).\n"
        "- Stop after writing {deliverable}.",
        "Read {inputs}, then write {deliverable}.",
        "TASK_LIST.json", ArtifactKind::File, {"PRD.md", "ARCHITECTURE.md"}});

    phases.push_back(Phase{
        "implementation", "Developer",
        "You are a senior Developer. Implement ALL project source files listed in the task "
        "list.\n\nSteps:\n"
        "1. Call read_file for each of: {inputs}\n"
        "2. For EVERY file in the 'files' array of every task, call write_file with COMPLETE "
        "working code.\n"
        "   - Use the exact path from the task list; source files live under "
        "{deliverable}/.\n"
        "   - Write REAL runnable code - no placeholders, no pseudocode.\n"
        "   - Include all imports and a working entry point.\n\n"
        "Write every file. Stop only after ALL files are written.",
        "Read {inputs}. Implement every source file listed.",
        "src", ArtifactKind::NonEmptyDirectory, {"ARCHITECTURE.md", "TASK_LIST.json"}});

    phases.push_back(Phase{
        "validation", "Backend Logic Validator",
        "You are a Code Reviewer. Validate the generated source files.\n"
        "1. Call read_file for each of: {inputs} to get the file list.\n"
        "2. Call read_file for each source file.\n"
        "3. Call write_file ONCE with path='{deliverable}' - a real report with "
        "CRITICAL/ADVISORY/NITPICK findings.\n"
        "Stop after writing the report.",
        "Read {inputs}, read each source file, write {deliverable}.",
        "VALIDATION_REPORT.md", ArtifactKind::File, {"TASK_LIST.json"}});

    phases.push_back(Phase{
        "tests", "QA Tester",
        "You are a QA Engineer. Write unit tests for the project.\n"
        "1. Call read_file for each of: {inputs} to get the file list.\n"
        "2. Call read_file for each source file (once each).\n"
        "3. Call write_file ONCE with path='{deliverable}'.\n"
        "   - Include happy path, edge case, and error condition tests.\n"
        "Stop immediately after writing. Do NOT re-read or rewrite the test file.",
        "Read {inputs}, read each source file once, write {deliverable}.",
        "tests/test_main.py", ArtifactKind::File, {"TASK_LIST.json"}});

    return phases;
}

}  // namespace neoforge::pipeline
