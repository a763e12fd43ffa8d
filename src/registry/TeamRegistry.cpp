#include "TeamRegistry.hpp"
#include "../matching/Diagnostics.hpp"
#include "../matching/TextUtils.hpp"

#include <plog/Log.h>

using matching::Diagnostics;

namespace registry
{

TeamRegistry::TeamRegistry(std::vector<CanonicalEntry> snapshot)
    : entries_(std::move(snapshot))
{
    rebuildIndex();
}

void TeamRegistry::reload(std::vector<CanonicalEntry> snapshot)
{
    entries_ = std::move(snapshot);
    rebuildIndex();
    PLOG_INFO_(Diagnostics::kLogInstance) << "[TeamRegistry] Loaded " << entries_.size() << " entries in "
                                          << category_order_.size() << " categories";
}

const std::vector<std::string>& TeamRegistry::lookup(const std::string& category) const
{
    static const std::vector<std::string> empty;
    auto it = index_.find(categoryKey(category));
    if (it == index_.end())
    {
        return empty;
    }
    return it->second;
}

CanonicalEntry TeamRegistry::add(const std::string& category, const std::string& name)
{
    CanonicalEntry entry{ categoryKey(category), name };
    entries_.push_back(entry);
    indexEntry(entry);

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[TeamRegistry] Added " << Diagnostics::Preview(entry.name) << " to "
                                           << entry.category << " (" << entries_.size() << " entries)";
    return entry;
}

std::optional<std::string> TeamRegistry::findExact(const std::string& category, const std::string& name) const
{
    const auto& names = lookup(category);
    if (names.empty() || name.empty())
    {
        return std::nullopt;
    }

    const std::string folded = matching::foldCase(name);
    for (const auto& existing : names)
    {
        if (existing == name || matching::foldCase(existing) == folded)
        {
            return existing;
        }
    }
    return std::nullopt;
}

std::string TeamRegistry::categoryKey(const std::string& category)
{
    return matching::foldCase(matching::trim(category));
}

void TeamRegistry::rebuildIndex()
{
    index_.clear();
    category_order_.clear();
    for (const auto& entry : entries_)
    {
        indexEntry(entry);
    }
}

void TeamRegistry::indexEntry(const CanonicalEntry& entry)
{
    if (matching::trim(entry.name).empty())
    {
        return;
    }

    // A blank category is an ordinary key
    std::string key = categoryKey(entry.category);
    auto [it, inserted] = index_.try_emplace(key);
    if (inserted)
    {
        category_order_.push_back(key);
    }
    it->second.push_back(entry.name);
}

} // namespace registry
