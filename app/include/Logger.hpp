#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Owns the application's named spdlog loggers.
 *
 * Two loggers are registered by setup_loggers(): "core_logger" for extraction,
 * sanitization and configuration, and "cli_logger" for the command-line front-end.
 * Library code must tolerate get_logger() returning nullptr, which is the case
 * whenever setup_loggers() was not called (unit tests, embedding callers).
 */
class Logger {
public:
    /**
     * @brief Create the rotating file and console sinks and register the loggers.
     * @throws spdlog::spdlog_ex when the log file cannot be created.
     */
    static void setup_loggers();

    /**
     * @brief Fetch a registered logger by name.
     * @return The logger, or nullptr when it has not been registered.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Directory that receives the rotating log files.
     */
    static std::string get_log_directory();

private:
    static spdlog::level::level_enum resolve_level();
};

#endif
