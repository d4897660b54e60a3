#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}
}


void Logger::setup_loggers()
{
    const std::filesystem::path log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    const auto level = resolve_level();

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / "file_renamer.log").string(), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern(kLogPattern);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("[%n] [%^%l%$] %v");

    const std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    for (const char* name : {"core_logger", "cli_logger"}) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        spdlog::register_logger(make_logger(name, sinks, level));
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


std::string Logger::get_log_directory()
{
    const std::string app_name = "FileRenamer";
    if (const char* override_root = std::getenv("FILE_RENAMER_CONFIG_DIR")) {
        return (std::filesystem::path(override_root) / app_name / "logs").string();
    }
#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA")) {
        return (std::filesystem::path(appdata) / app_name / "logs").string();
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / "Library" / "Logs" / app_name).string();
    }
#else
    if (const char* state_home = std::getenv("XDG_STATE_HOME")) {
        return (std::filesystem::path(state_home) / app_name / "logs").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".local" / "state" / app_name / "logs").string();
    }
#endif
    return (std::filesystem::temp_directory_path() / app_name / "logs").string();
}


spdlog::level::level_enum Logger::resolve_level()
{
    const char* value = std::getenv("FILE_RENAMER_LOG_LEVEL");
    if (!value) {
        return spdlog::level::info;
    }
    const auto level = spdlog::level::from_str(value);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && std::string(value) != "off") {
        return spdlog::level::info;
    }
    return level;
}
