/**
 * @file diagnostics.hpp
 * @brief Wiring errors reported by the pipeline compiler
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace tickflow {

enum class DiagnosticKind {
    DuplicateCycler,
    DuplicateModule,
    DuplicateOutput,
    UnresolvedInput,
    AmbiguousInput,
    InputTypeMismatch,
    DependencyCycle,
    MissingHistoricBuffer,
    UnknownParameter,
    ParameterTypeMismatch,
    StateTypeMismatch,
    InvalidTrigger
};

constexpr const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DuplicateCycler:       return "duplicate cycler";
        case DiagnosticKind::DuplicateModule:       return "duplicate module";
        case DiagnosticKind::DuplicateOutput:       return "duplicate output";
        case DiagnosticKind::UnresolvedInput:       return "unresolved input";
        case DiagnosticKind::AmbiguousInput:        return "ambiguous input";
        case DiagnosticKind::InputTypeMismatch:     return "input type mismatch";
        case DiagnosticKind::DependencyCycle:       return "dependency cycle";
        case DiagnosticKind::MissingHistoricBuffer: return "missing historic buffer";
        case DiagnosticKind::UnknownParameter:      return "unknown parameter";
        case DiagnosticKind::ParameterTypeMismatch: return "parameter type mismatch";
        case DiagnosticKind::StateTypeMismatch:     return "state type mismatch";
        case DiagnosticKind::InvalidTrigger:        return "invalid trigger";
    }
    return "unknown";
}

struct Diagnostic {
    DiagnosticKind kind;
    std::string cycler;
    std::vector<std::string> modules;   ///< Offending modules; the full path for cycles
    std::string path;                   ///< Producer.field, parameter path or state name
    std::string message;
};

inline std::string to_string(const Diagnostic& diagnostic) {
    return "[" + diagnostic.cycler + "] " + to_string(diagnostic.kind) + ": " + diagnostic.message;
}

/**
 * @brief Thrown when a pipeline with wiring errors is about to be run
 */
class PipelineCompileError : public std::runtime_error {
public:
    explicit PipelineCompileError(std::vector<Diagnostic> diagnostics)
        : std::runtime_error(summarize(diagnostics)), diagnostics_(std::move(diagnostics)) {}
    
    const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }
    
private:
    static std::string summarize(const std::vector<Diagnostic>& diagnostics) {
        std::string text = "pipeline has " + std::to_string(diagnostics.size()) + " wiring error(s)";
        for (const auto& diagnostic : diagnostics) {
            text += "\n  " + to_string(diagnostic);
        }
        return text;
    }
    
    std::vector<Diagnostic> diagnostics_;
};

} // namespace tickflow
