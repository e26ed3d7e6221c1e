#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "workflow.hpp"

namespace advgate::pipeline {

/// Module named by an import or module-resolution error in `stderr_text`, if any.
/// An import error without a recognisable name yields "<unknown>".
[[nodiscard]] std::optional<std::string> find_import_failure(std::string_view stderr_text);

/// Maps test function name to the claim number tagged in the generated module.
[[nodiscard]] std::map<std::string, std::size_t> claim_tags(std::string_view test_source);

/**
 * \brief Turns adversarial pytest output into TestFailure records.
 *
 * Reads `FAILED` / `ERROR` summary lines and the short traceback sections of
 * `pytest -rf --tb=short`. When the run exited non-zero and nothing could be
 * parsed, a single synthetic NonZeroExit failure is returned so that a broken
 * run never reads as a pass.
 */
[[nodiscard]] std::vector<TestFailure> parse_adversarial_output(std::string_view output,
                                                                int exit_code,
                                                                std::string_view test_source,
                                                                const std::vector<std::string>& claims);

}  // namespace advgate::pipeline
