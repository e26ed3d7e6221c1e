#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "workflow.hpp"

namespace advgate::pipeline {

/**
 * \brief Emits machine-readable and human-friendly reports for a pipeline run.
 *
 * - write_json(): The full WorkflowResult as a JSON document.
 * - write_html(): A self-contained HTML page with the verdict, findings and failures.
 *
 * Parent directories are created; failure to open the destination throws
 * std::runtime_error.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_json(const std::filesystem::path& destination, const WorkflowResult& result) const;

    void write_html(const std::filesystem::path& destination, const WorkflowResult& result) const;

    [[nodiscard]] static nlohmann::json to_json(const WorkflowResult& result);

    [[nodiscard]] static std::string render_html(const WorkflowResult& result);
};

}  // namespace advgate::pipeline
