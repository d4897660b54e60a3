#include "RenameCli.hpp"

#include "AppException.hpp"
#include "ConflictResolver.hpp"
#include "ContentExtractor.hpp"
#include "ContentExtractorRegistry.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <fmt/format.h>

#include <set>

namespace {
std::string to_std(const QString& value)
{
    return value.toStdString();
}

int parse_int_option(const QCommandLineParser& parser, const QCommandLineOption& option,
                     const char* name, int minimum)
{
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_FORMAT,
                            fmt::format("--{} expects a number", name),
                            to_std(parser.value(option)));
    }
    if (value < minimum) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                            fmt::format("--{} must be at least {}", name, minimum),
                            std::to_string(value));
    }
    return value;
}

bool is_dir_error(ErrorCodes::Code code)
{
    return code == ErrorCodes::Code::DIRECTORY_NOT_FOUND ||
           code == ErrorCodes::Code::DIRECTORY_INVALID;
}
}

RenameRule CliOptions::rule() const
{
    switch (rule_kind) {
        case RenameRuleKind::Sequential: return RenameRule::sequential(base_name);
        case RenameRuleKind::AddText: return RenameRule::add_text(prefix, suffix);
        case RenameRuleKind::Replace: return RenameRule::replace(find, replacement);
        case RenameRuleKind::FolderSequential: return RenameRule::folder_sequential();
        case RenameRuleKind::Content: return RenameRule::content();
    }
    return RenameRule::sequential(base_name);
}


RenameCli::RenameCli(std::ostream& out, std::ostream& err)
    : out_(out), err_(err)
{}


CliOptions RenameCli::parse(const QStringList& arguments,
                            const SanitizeConfig& sanitize_defaults,
                            const ExtractionOptions& extraction_defaults,
                            bool dry_run_default,
                            const std::string& last_folder)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Batch-rename files with sanitized, collision-free names."));
    const QCommandLineOption help_option = parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("directory"), QStringLiteral("Directory holding the files."));
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Files to rename (default: all)."),
                                 QStringLiteral("[files...]"));

    const QCommandLineOption rule_option(QStringLiteral("rule"),
        QStringLiteral("sequential, add-text, replace, folder-sequential or content."), QStringLiteral("rule"));
    const QCommandLineOption base_option(QStringLiteral("base"),
        QStringLiteral("Base name of the sequential rule."), QStringLiteral("text"));
    const QCommandLineOption prefix_option(QStringLiteral("prefix"),
        QStringLiteral("Text added before each name."), QStringLiteral("text"));
    const QCommandLineOption suffix_option(QStringLiteral("suffix"),
        QStringLiteral("Text added after each stem."), QStringLiteral("text"));
    const QCommandLineOption find_option(QStringLiteral("find"),
        QStringLiteral("Text replaced by the replace rule."), QStringLiteral("text"));
    const QCommandLineOption replace_option(QStringLiteral("replace"),
        QStringLiteral("Replacement of the replace rule."), QStringLiteral("text"));
    const QCommandLineOption regex_option(QStringLiteral("regex"),
        QStringLiteral("Pattern selecting the content; its first group is used."), QStringLiteral("pattern"));
    const QCommandLineOption max_pages_option(QStringLiteral("max-pages"),
        QStringLiteral("Pages read from documents."), QStringLiteral("n"));
    const QCommandLineOption date_format_option(QStringLiteral("date-format"),
        QStringLiteral("Photo date template (YYYY, MM, DD, HH, MM, SS or strftime)."), QStringLiteral("template"));
    const QCommandLineOption case_option(QStringLiteral("case"),
        QStringLiteral("lower, upper, title, sentence or none."), QStringLiteral("style"));
    const QCommandLineOption replace_spaces_option(QStringLiteral("replace-spaces"),
        QStringLiteral("Replace spaces with underscores."));
    const QCommandLineOption no_normalize_option(QStringLiteral("no-unicode-normalization"),
        QStringLiteral("Keep accents and compatibility characters."));
    const QCommandLineOption max_length_option(QStringLiteral("max-length"),
        QStringLiteral("Maximum filename length in characters."), QStringLiteral("n"));
    const QCommandLineOption suffix_format_option(QStringLiteral("suffix-format"),
        QStringLiteral("Conflict suffix template with a {n} slot."), QStringLiteral("template"));
    const QCommandLineOption no_conflict_option(QStringLiteral("no-conflict-resolution"),
        QStringLiteral("Do not renumber names taken in the directory."));
    const QCommandLineOption dry_run_option(QStringLiteral("dry-run"),
        QStringLiteral("Print the plan without renaming."));
    const QCommandLineOption list_formats_option(QStringLiteral("list-formats"),
        QStringLiteral("List the extensions the content rule can read."));
    const QCommandLineOption save_defaults_option(QStringLiteral("save-defaults"),
        QStringLiteral("Store the sanitize and extraction options as defaults."));

    parser.addOptions({rule_option, base_option, prefix_option, suffix_option, find_option,
                       replace_option, regex_option, max_pages_option, date_format_option,
                       case_option, replace_spaces_option, no_normalize_option, max_length_option,
                       suffix_format_option, no_conflict_option, dry_run_option,
                       list_formats_option, save_defaults_option});

    if (!parser.parse(arguments)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            to_std(parser.errorText()), to_std(arguments.join(QLatin1Char(' '))));
    }

    CliOptions options;
    options.sanitize = sanitize_defaults;
    options.extraction = extraction_defaults;
    options.dry_run = dry_run_default;

    if (parser.isSet(help_option)) {
        options.show_help = true;
        options.help_text = to_std(parser.helpText());
        return options;
    }

    options.list_formats = parser.isSet(list_formats_option);
    options.save_defaults = parser.isSet(save_defaults_option);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        if (!options.list_formats && !options.save_defaults) {
            if (last_folder.empty()) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_EMPTY_FIELD,
                                    "Missing directory argument", "");
            }
            options.directory = Utils::utf8_to_path(last_folder);
        }
    } else {
        options.directory = Utils::utf8_to_path(to_std(positional.front()));
        for (qsizetype i = 1; i < positional.size(); ++i) {
            options.files.push_back(to_std(positional.at(i)));
        }
    }

    if (parser.isSet(rule_option)) {
        const std::string value = to_std(parser.value(rule_option));
        const auto kind = rename_rule_kind_from_string(value);
        if (!kind) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                fmt::format("Unknown rule '{}'", value), value);
        }
        options.rule_kind = *kind;
    }

    if (parser.isSet(base_option)) options.base_name = to_std(parser.value(base_option));
    if (parser.isSet(prefix_option)) options.prefix = to_std(parser.value(prefix_option));
    if (parser.isSet(suffix_option)) options.suffix = to_std(parser.value(suffix_option));
    if (parser.isSet(find_option)) options.find = to_std(parser.value(find_option));
    if (parser.isSet(replace_option)) options.replacement = to_std(parser.value(replace_option));

    if (parser.isSet(regex_option)) {
        const std::string pattern = to_std(parser.value(regex_option));
        std::string error;
        if (!ContentSelection::is_valid_pattern(pattern, &error)) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_FORMAT,
                                fmt::format("Invalid --regex pattern: {}", error), pattern);
        }
        options.extraction.regex_pattern = pattern;
    }

    if (parser.isSet(max_pages_option)) {
        options.extraction.max_pages = parse_int_option(parser, max_pages_option, "max-pages", 1);
    }
    if (parser.isSet(date_format_option)) {
        const std::string format = to_std(parser.value(date_format_option));
        if (format.empty()) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_EMPTY_FIELD,
                                "--date-format must not be empty", "");
        }
        options.extraction.date_format = format;
    }

    if (parser.isSet(case_option)) {
        const std::string value = Utils::to_lower_copy(to_std(parser.value(case_option)));
        if (value == "none") {
            options.sanitize.case_style.reset();
        } else {
            const auto style = case_style_from_string(value);
            if (!style) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    fmt::format("Unknown case style '{}'", value), value);
            }
            options.sanitize.case_style = style;
        }
    }

    if (parser.isSet(replace_spaces_option)) options.sanitize.replace_spaces = true;
    if (parser.isSet(no_normalize_option)) options.sanitize.normalize_unicode = false;
    if (parser.isSet(no_conflict_option)) options.sanitize.conflict_resolution = false;
    if (parser.isSet(dry_run_option)) options.dry_run = true;

    if (parser.isSet(max_length_option)) {
        options.sanitize.max_length =
            static_cast<std::size_t>(parse_int_option(parser, max_length_option, "max-length", 1));
    }
    if (parser.isSet(suffix_format_option)) {
        const std::string format = to_std(parser.value(suffix_format_option));
        if (!ConflictResolver::is_valid_suffix_format(format)) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_FORMAT,
                                "--suffix-format needs a {n} slot", format);
        }
        options.sanitize.conflict_suffix_format = format;
    }

    if (options.rule_kind == RenameRuleKind::Sequential && options.base_name.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::RENAME_INVALID_RULE,
                            "The sequential rule needs a base name", "");
    }

    return options;
}


std::vector<std::string> RenameCli::select_files(const CliOptions& options) const
{
    if (!options.files.empty()) {
        return options.files;
    }

    const FileScanner scanner;
    return scanner.list_file_names(options.directory);
}


int RenameCli::run(const CliOptions& options, const ContentExtractorRegistry& registry) const
{
    auto logger = Logger::get_logger("cli_logger");

    try {
        const auto selected = select_files(options);
        if (selected.empty()) {
            THROW_APP_ERROR(ErrorCodes::Code::RENAME_NO_FILES, Utils::path_to_utf8(options.directory));
        }

        const RenameRule rule = options.rule();
        const bool rule_uses_affixes = options.rule_kind == RenameRuleKind::AddText;
        const RenamePlanner planner(&registry);
        const auto plan = planner.plan(options.directory, selected, rule, options.sanitize,
                                       options.extraction,
                                       rule_uses_affixes ? std::string() : options.prefix,
                                       rule_uses_affixes ? std::string() : options.suffix);

        for (const auto& entry : plan) {
            out_ << format_plan_line(entry) << '\n';
        }

        const RenameExecutor executor;
        const RenameReport report = executor.apply(options.directory, plan, options.dry_run);
        out_ << format_summary(report);
        out_.flush();

        if (logger) {
            logger->info("{} of {} file(s) {} in '{}'", report.renamed, plan.size(),
                         options.dry_run ? "would be renamed" : "renamed",
                         Utils::path_to_utf8(options.directory));
        }
        return report.has_errors() ? kExitFailures : kExitSuccess;
    } catch (const ErrorCodes::AppException& ex) {
        if (logger) {
            logger->error("{}", ex.get_full_details());
        }
        err_ << ex.get_user_message() << '\n';
        return is_dir_error(ex.get_error_code()) ? kExitUsage : kExitFailures;
    }
}


int RenameCli::list_formats(const ContentExtractorRegistry& registry) const
{
    const auto join = [](const std::set<std::string>& extensions) {
        std::string joined;
        for (const auto& ext : extensions) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += ext;
        }
        return joined;
    };

    for (const auto& extractor : registry.all()) {
        out_ << fmt::format("{:<16}{:<14}{}\n", extractor->name(),
                            extractor->is_available() ? "available" : "unavailable",
                            join(extractor->extensions()));
    }

    const auto supported = registry.supported_extensions();
    out_ << fmt::format("Supported: {}\n", supported.empty() ? std::string("none") : join(supported));
    return kExitSuccess;
}


std::string RenameCli::format_plan_line(const RenamePlanEntry& entry)
{
    switch (entry.status) {
        case PlanStatus::Ready:
            return fmt::format("  {} -> {}", entry.source, entry.proposed);
        case PlanStatus::Unchanged:
            return fmt::format("  {} (unchanged)", entry.source);
        case PlanStatus::NoCandidate:
            return fmt::format("  {} (no new name)", entry.source);
    }
    return entry.source;
}


std::string RenameCli::format_summary(const RenameReport& report)
{
    std::string summary = fmt::format("{} file(s) {}.\n", report.renamed,
                                      report.dry_run ? "would be renamed" : "renamed");
    const auto errors = report.errors();
    if (!errors.empty()) {
        summary += fmt::format("{} error(s):\n", errors.size());
        for (const auto& message : errors) {
            summary += "  " + message + "\n";
        }
    }
    return summary;
}
