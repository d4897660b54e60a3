#include "RenameExecutor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <system_error>

namespace {
bool is_error(RenameOutcome outcome)
{
    return outcome != RenameOutcome::Renamed && outcome != RenameOutcome::Skipped;
}
}

std::string to_string(RenameOutcome outcome)
{
    switch (outcome) {
        case RenameOutcome::Renamed: return "renamed";
        case RenameOutcome::Skipped: return "skipped";
        case RenameOutcome::NoCandidate: return "no-candidate";
        case RenameOutcome::SourceMissing: return "source-missing";
        case RenameOutcome::DestinationExists: return "destination-exists";
        case RenameOutcome::Failed: return "failed";
        default: return "failed";
    }
}


std::vector<std::string> RenameReport::errors() const
{
    std::vector<std::string> messages;
    for (const auto& result : results) {
        if (is_error(result.outcome)) {
            messages.push_back(result.message);
        }
    }
    return messages;
}


bool RenameReport::has_errors() const
{
    for (const auto& result : results) {
        if (is_error(result.outcome)) {
            return true;
        }
    }
    return false;
}


RenameReport RenameExecutor::apply(const std::filesystem::path& directory,
                                   const std::vector<RenamePlanEntry>& plan,
                                   bool dry_run) const
{
    RenameReport report;
    report.dry_run = dry_run;
    report.results.reserve(plan.size());

    for (const auto& entry : plan) {
        RenameResult result = apply_entry(directory, entry, dry_run);
        if (result.outcome == RenameOutcome::Renamed) {
            ++report.renamed;
        }
        report.results.push_back(std::move(result));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("{} {} of {} file(s) in '{}'", dry_run ? "Would rename" : "Renamed",
                     report.renamed, plan.size(), Utils::path_to_utf8(directory));
    }
    return report;
}


RenameResult RenameExecutor::apply_entry(const std::filesystem::path& directory,
                                         const RenamePlanEntry& entry,
                                         bool dry_run) const
{
    RenameResult result{entry.source, entry.proposed, RenameOutcome::Skipped, {}};
    auto logger = Logger::get_logger("core_logger");

    if (entry.status == PlanStatus::NoCandidate) {
        result.outcome = RenameOutcome::NoCandidate;
        result.message = fmt::format("'{}': no new name generated", entry.source);
        return result;
    }
    if (entry.status == PlanStatus::Unchanged) {
        return result;
    }

    const auto source_path = directory / Utils::utf8_to_path(entry.source);
    const auto target_path = directory / Utils::utf8_to_path(entry.proposed);

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(source_path, ec))) {
        result.outcome = RenameOutcome::SourceMissing;
        result.message = fmt::format("'{}': file no longer exists", entry.source);
        return result;
    }
    if (std::filesystem::exists(std::filesystem::symlink_status(target_path, ec))) {
        result.outcome = RenameOutcome::DestinationExists;
        result.message = fmt::format("'{}' -> '{}': destination already exists",
                                     entry.source, entry.proposed);
        return result;
    }

    if (!dry_run) {
        std::filesystem::rename(source_path, target_path, ec);
        if (ec) {
            result.outcome = RenameOutcome::Failed;
            result.message = fmt::format("Error renaming '{}': {}", entry.source, ec.message());
            if (logger) {
                logger->warn("{}", result.message);
            }
            return result;
        }
    }

    result.outcome = RenameOutcome::Renamed;
    if (logger) {
        logger->debug("{} '{}' -> '{}'", dry_run ? "Would rename" : "Renamed",
                      entry.source, entry.proposed);
    }
    return result;
}
