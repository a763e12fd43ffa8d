#pragma once

#include "TeamRegistry.hpp"

#include <cstddef>
#include <vector>

namespace registry
{

struct CleanReport
{
    std::size_t removed_empty = 0;
    std::size_t removed_duplicates = 0;
    std::size_t remaining = 0;
};

/**
 * @brief Offline maintenance of registry snapshots.
 *
 * Operates on snapshots, never on a live TeamRegistry. Order of the surviving entries
 * is preserved.
 */
class SnapshotCleaner
{
public:
    /// Drop entries whose name is blank
    static std::vector<CanonicalEntry> removeEmptyNames(const std::vector<CanonicalEntry>& entries,
                                                        CleanReport& report);

    /// Keep the first entry of every (category, name) pair, both compared ignoring case
    static std::vector<CanonicalEntry> removeDuplicates(const std::vector<CanonicalEntry>& entries,
                                                        CleanReport& report);

    /// removeEmptyNames followed by removeDuplicates
    static std::vector<CanonicalEntry> clean(const std::vector<CanonicalEntry>& entries, CleanReport& report);
};

} // namespace registry
