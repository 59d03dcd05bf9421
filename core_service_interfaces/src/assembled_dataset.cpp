#include "core_services/assembly/assembled_dataset.h"
#include "common_utils/utilities/exceptions.h"

namespace rastercube {
namespace core_services {

std::string toString(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::Debug: return "debug";
        case DiagnosticSeverity::Info: return "info";
        case DiagnosticSeverity::Warning: return "warning";
        case DiagnosticSeverity::Error: return "error";
    }
    return "unknown";
}

std::string toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UNMAPPED_OBJECT_KEY: return "unmapped_object_key";
        case DiagnosticKind::MISSING_TIMESTAMP: return "missing_timestamp";
        case DiagnosticKind::UNPARSED_TIME: return "unparsed_time";
        case DiagnosticKind::LOAD_FAILURE: return "load_failure";
        case DiagnosticKind::EMPTY_VARIABLE: return "empty_variable";
        case DiagnosticKind::DISCARDED_PLANE: return "discarded_plane";
        case DiagnosticKind::EXCLUDED_VARIABLES: return "excluded_variables";
        case DiagnosticKind::GRID_ALIGNED: return "grid_aligned";
    }
    return "unknown";
}

std::string AssemblyDiagnostic::toString() const {
    return "[" + core_services::toString(severity) + "] " + core_services::toString(kind) +
           " (" + subject + "): " + message;
}

AssembledDataset::AssembledDataset(std::vector<Variable> variables,
                                   std::map<std::string, std::string> attributes,
                                   std::vector<AssemblyDiagnostic> diagnostics)
    : variables_(std::move(variables)),
      attributes_(std::move(attributes)),
      diagnostics_(std::move(diagnostics)) {}

std::vector<std::string> AssembledDataset::variableNames() const {
    std::vector<std::string> names;
    names.reserve(variables_.size());
    for (const auto& [name, array] : variables_) {
        names.push_back(name);
    }
    return names;
}

bool AssembledDataset::contains(const std::string& name) const {
    for (const auto& variable : variables_) {
        if (variable.first == name) {
            return true;
        }
    }
    return false;
}

const GriddedArray& AssembledDataset::variable(const std::string& name) const {
    for (const auto& variable : variables_) {
        if (variable.first == name) {
            return variable.second;
        }
    }
    throw common_utils::ResourceNotFoundException("Variable '" + name + "' is not in the dataset");
}

std::optional<std::string> AssembledDataset::attribute(const std::string& key) const {
    auto it = attributes_.find(key);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AssemblyDiagnostic> AssembledDataset::diagnosticsOfKind(DiagnosticKind kind) const {
    std::vector<AssemblyDiagnostic> result;
    for (const auto& diagnostic : diagnostics_) {
        if (diagnostic.kind == kind) {
            result.push_back(diagnostic);
        }
    }
    return result;
}

} // namespace core_services
} // namespace rastercube
