#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/**
 * @brief TOML configuration file shared by several settings owners.
 *
 * Each owner registers the table it reads (dotted path, e.g. "matching") and the keys it
 * writes back. Keys nobody owns survive a save untouched. A key may be owned by only one
 * handler per table.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    /// Parse the file and hand every registered table to its owner. A missing file is not an
    /// error; a parse error leaves the owners at their defaults and returns false.
    bool load();

    /// load() again when the file's modification time moved since the last load or save
    bool reloadIfChanged();

    /// Merge owned keys into the last parsed document and write it atomically
    bool save();

    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    void dispatchLoad(const toml::table& document) const;
    void mergeHandlers(toml::table& document) const;
    bool writeAtomically(const toml::table& document);
    void rememberWriteTime();

    static std::vector<std::string> splitPath(const std::string& path);
    static const toml::table* findTable(const toml::table& root, const std::string& path);
    static toml::table* ensureTable(toml::table& root, const std::string& path);

    std::string config_path_;
    std::string last_error_;
    std::optional<std::filesystem::file_time_type> last_write_;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};

} // namespace config
