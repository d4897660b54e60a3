#include "AppException.hpp"
#include "ContentExtractorRegistry.hpp"
#include "Logger.hpp"
#include "RenameCli.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <QCoreApplication>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <locale.h>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

void save_defaults(Settings& settings, const CliOptions& options)
{
    settings.set_sanitize_config(options.sanitize);
    settings.set_extraction_options(options.extraction);
    settings.set_dry_run(options.dry_run);
    if (!options.directory.empty()) {
        settings.set_last_folder(Utils::path_to_utf8(options.directory));
    }
    if (!settings.save()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, settings.get_config_path());
    }
    std::cout << "Defaults saved to " << settings.get_config_path() << '\n';
}

int run_application(int argc, char** argv)
{
    setlocale(LC_ALL, "");
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("file_renamer"));

    Settings settings;
    settings.load();

    CliOptions options;
    try {
        options = RenameCli::parse(QCoreApplication::arguments(),
                                   settings.sanitize_config(),
                                   settings.extraction_options(),
                                   settings.get_dry_run(),
                                   settings.get_last_folder());
    } catch (const ErrorCodes::AppException& ex) {
        std::cerr << ex.what() << "\nRun with --help for usage.\n";
        return RenameCli::kExitUsage;
    }

    if (options.show_help) {
        std::cout << options.help_text;
        return RenameCli::kExitSuccess;
    }

    const ContentExtractorRegistry registry;
    const RenameCli cli(std::cout, std::cerr);

    if (options.save_defaults) {
        save_defaults(settings, options);
        if (options.directory.empty() && !options.list_formats) {
            return RenameCli::kExitSuccess;
        }
    }
    if (options.list_formats) {
        return cli.list_formats(registry);
    }
    return cli.run(options, registry);
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(argc, argv);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
