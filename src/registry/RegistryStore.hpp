#pragma once

#include "TeamRegistry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace registry
{

/**
 * @brief JSON file persistence for registry snapshots.
 *
 * Snapshot format: an array of {"sport": ..., "canonical_team_name": ...} records in
 * insertion order.
 */
class RegistryStore
{
public:
    explicit RegistryStore(std::string path = "teams.json", bool backup_on_save = true);

    /**
     * @brief Read the snapshot file.
     *
     * @return The entries, or std::nullopt when the file is missing (lastError() empty) or
     *         cannot be read or parsed (lastError() set, reported to ErrorReporter)
     */
    std::optional<std::vector<CanonicalEntry>> load();

    /**
     * @brief Write the snapshot atomically (temp file + rename).
     *
     * When backups are enabled an existing file is first copied to
     * "<path>.backup_YYYYmmdd_HHMMSS".
     */
    bool save(const std::vector<CanonicalEntry>& entries);

    const std::string& path() const { return path_; }
    const std::string& lastError() const { return last_error_; }
    const std::string& lastBackupPath() const { return last_backup_path_; }

    static nlohmann::json toJson(const std::vector<CanonicalEntry>& entries);

    /// Records that are not objects are skipped; missing fields load as empty strings
    static std::vector<CanonicalEntry> fromJson(const nlohmann::json& snapshot, std::size_t* skipped = nullptr);

private:
    bool createBackup();

    std::string path_;
    bool backup_on_save_;
    std::string last_error_;
    std::string last_backup_path_;
};

} // namespace registry
