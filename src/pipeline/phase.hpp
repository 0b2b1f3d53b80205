#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace neoforge::pipeline {

enum class ArtifactKind {
    File,               // a regular file must exist
    NonEmptyDirectory   // a directory with at least one entry must exist
};

// One gated stage. Immutable once the pipeline is defined.
struct Phase {
    std::string id;
    std::string label;                      // agent label shown to observers
    std::string instruction_template;       // system prompt, with placeholders
    std::string message_template;           // user message, with placeholders
    std::filesystem::path required_artifact;
    ArtifactKind artifact_kind = ArtifactKind::File;
    std::vector<std::filesystem::path> inputs;  // predecessor deliverables consumed
};

// Replaces every "{name}" with vars.at(name). Unknown placeholders are left as-is,
// so the output depends only on the template and vars.
std::string format_template(const std::string& text,
                            const std::map<std::string, std::string>& vars);

// Variables for a phase: deliverable, inputs (comma separated) and requirement.
std::map<std::string, std::string> phase_variables(const Phase& phase,
                                                   const std::string& requirement);

bool artifact_present(const std::filesystem::path& workspace_root, const Phase& phase);

// requirements -> architecture -> task_list -> implementation -> validation -> tests
std::vector<Phase> default_phases();

}  // namespace neoforge::pipeline
