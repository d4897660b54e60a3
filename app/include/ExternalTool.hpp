#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Thin wrapper over QProcess for command-line helpers found on PATH.
 */
namespace ExternalTool {

/**
 * @brief Absolute path of @p name on PATH, or std::nullopt.
 */
std::optional<std::string> find_executable(const std::string& name);

/**
 * @brief Runs @p program and returns its standard output.
 *
 * Returns std::nullopt when the process cannot start, exceeds @p timeout_ms,
 * crashes or exits with a non-zero code. Output beyond @p max_output bytes is
 * discarded.
 */
std::optional<std::string> run_process(const std::string& program,
                                       const std::vector<std::string>& args,
                                       int timeout_ms,
                                       std::size_t max_output = 4 * 1024 * 1024);

} // namespace ExternalTool
