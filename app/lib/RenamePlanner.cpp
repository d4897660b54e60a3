#include "RenamePlanner.hpp"

#include "FilenameSanitizer.hpp"
#include "Logger.hpp"
#include "NameSet.hpp"
#include "Utils.hpp"

namespace {
class ExcludingNameSet : public INameSet {
public:
    ExcludingNameSet(const INameSet& base, const std::string& excluded)
        : base_(base), excluded_(excluded) {}

    bool contains(const std::string& name) const override {
        return name != excluded_ && base_.contains(name);
    }

private:
    const INameSet& base_;
    const std::string& excluded_;
};
}

std::string to_string(PlanStatus status)
{
    switch (status) {
        case PlanStatus::Ready: return "ready";
        case PlanStatus::Unchanged: return "unchanged";
        case PlanStatus::NoCandidate: return "no-candidate";
        default: return "no-candidate";
    }
}


RenamePlanner::RenamePlanner(const ContentExtractorRegistry* registry)
    : registry_(registry)
{}


std::vector<RenamePlanEntry> RenamePlanner::plan(const std::filesystem::path& directory,
                                                 const std::vector<std::string>& selected,
                                                 const RenameRule& rule,
                                                 const SanitizeConfig& config,
                                                 const ExtractionOptions& options,
                                                 const std::string& prefix,
                                                 const std::string& suffix) const
{
    const FilenameSanitizer sanitizer(config);
    const DirectoryNameSet on_disk(directory);
    InMemoryNameSet used;

    std::vector<RenamePlanEntry> entries;
    entries.reserve(selected.size());

    for (std::size_t i = 0; i < selected.size(); ++i) {
        const std::string& source = selected[i];
        RenamePlanEntry entry{source, source, PlanStatus::NoCandidate};

        const auto candidate = rule.candidate_for(directory, source, i, registry_, options);
        if (!candidate) {
            entries.push_back(std::move(entry));
            continue;
        }

        const ExcludingNameSet others(on_disk, source);
        const INameSet* existing = config.conflict_resolution ? &others : nullptr;
        std::string sanitized = sanitizer.sanitize_against(*candidate, existing, prefix, suffix);
        entry.proposed = sanitizer.claim_in_batch(sanitized, used, existing);
        entry.status = entry.proposed == source ? PlanStatus::Unchanged : PlanStatus::Ready;
        entries.push_back(std::move(entry));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Planned {} rename(s) in '{}' with rule '{}'", entries.size(),
                     Utils::path_to_utf8(directory), to_string(rule.kind()));
    }
    return entries;
}
