#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace registry
{

/// One canonical team name within a category (sport)
struct CanonicalEntry
{
    std::string category;
    std::string name;

    bool operator==(const CanonicalEntry& other) const
    {
        return category == other.category && name == other.name;
    }
};

/**
 * @brief In-memory category -> canonical name store.
 *
 * Owns the ordered entry sequence; the per-category index is a cache rebuilt from it on
 * load and extended on add. Categories are compared trimmed and case-insensitively, so a
 * blank category is one key like any other. Entries with a blank name are kept (they
 * round-trip through snapshots) but never indexed.
 *
 * Not thread-safe: one standardization or traversal at a time per instance.
 */
class TeamRegistry
{
public:
    TeamRegistry() = default;
    explicit TeamRegistry(std::vector<CanonicalEntry> snapshot);

    /// Replace all entries and rebuild the index
    void reload(std::vector<CanonicalEntry> snapshot);

    /// Names of the category in insertion order; empty for unknown categories
    const std::vector<std::string>& lookup(const std::string& category) const;

    /// Append unconditionally; callers decide about duplicates beforehand
    CanonicalEntry add(const std::string& category, const std::string& name);

    /// Stored name equal to @p name ignoring case, if any
    std::optional<std::string> findExact(const std::string& category, const std::string& name) const;

    const std::vector<CanonicalEntry>& entries() const { return entries_; }

    std::size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    std::size_t categoryCount(const std::string& category) const { return lookup(category).size(); }

    /// Indexed category keys in first-seen order
    const std::vector<std::string>& categories() const { return category_order_; }

    /// Lookup key of a category: trimmed and case folded
    static std::string categoryKey(const std::string& category);

private:
    void rebuildIndex();
    void indexEntry(const CanonicalEntry& entry);

    std::vector<CanonicalEntry> entries_;
    std::unordered_map<std::string, std::vector<std::string>> index_;
    std::vector<std::string> category_order_;
};

} // namespace registry
