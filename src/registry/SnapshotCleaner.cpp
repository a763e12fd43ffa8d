#include "SnapshotCleaner.hpp"
#include "../matching/TextUtils.hpp"

#include <plog/Log.h>

#include <set>
#include <string>
#include <utility>

namespace registry
{

std::vector<CanonicalEntry> SnapshotCleaner::removeEmptyNames(const std::vector<CanonicalEntry>& entries,
                                                              CleanReport& report)
{
    std::vector<CanonicalEntry> kept;
    kept.reserve(entries.size());
    for (const auto& entry : entries)
    {
        if (matching::trim(entry.name).empty())
        {
            ++report.removed_empty;
            continue;
        }
        kept.push_back(entry);
    }

    report.remaining = kept.size();
    if (report.removed_empty > 0)
    {
        PLOG_INFO << "[SnapshotCleaner] Removed " << report.removed_empty << " teams with empty names";
    }
    return kept;
}

std::vector<CanonicalEntry> SnapshotCleaner::removeDuplicates(const std::vector<CanonicalEntry>& entries,
                                                              CleanReport& report)
{
    std::set<std::pair<std::string, std::string>> seen;
    std::vector<CanonicalEntry> kept;
    kept.reserve(entries.size());

    for (const auto& entry : entries)
    {
        auto key = std::make_pair(TeamRegistry::categoryKey(entry.category), matching::foldCase(entry.name));
        if (!seen.insert(std::move(key)).second)
        {
            PLOG_DEBUG << "[SnapshotCleaner] Duplicate: " << entry.category << " / " << entry.name;
            ++report.removed_duplicates;
            continue;
        }
        kept.push_back(entry);
    }

    report.remaining = kept.size();
    if (report.removed_duplicates > 0)
    {
        PLOG_INFO << "[SnapshotCleaner] Removed " << report.removed_duplicates << " duplicate teams";
    }
    return kept;
}

std::vector<CanonicalEntry> SnapshotCleaner::clean(const std::vector<CanonicalEntry>& entries, CleanReport& report)
{
    return removeDuplicates(removeEmptyNames(entries, report), report);
}

} // namespace registry
