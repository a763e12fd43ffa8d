#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace config
{

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
    rememberWriteTime();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << "[ConfigManager] " << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "[ConfigManager] No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }

    try
    {
        auto document = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        dispatchLoad(*document);
        root_ = std::move(document);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream details;
        if (pe.source().begin.line > 0)
            details << "Error at line " << pe.source().begin.line << ": ";
        details << pe.description() << "\nFile: " << config_path_;

        last_error_ = "config parse error: " + std::string(pe.description());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", details.str());
        return false;
    }

    rememberWriteTime();
    PLOG_INFO << "[ConfigManager] Loaded " << config_path_;
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    std::error_code ec;
    const auto current = fs::last_write_time(config_path_, ec);
    if (ec || (last_write_ && *last_write_ == current))
        return false;

    if (!load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to reload configuration",
                                            last_error_.empty() ? std::string("See logs for details") : last_error_);
        return false;
    }

    PLOG_INFO << "[ConfigManager] Reloaded " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table document = root_ ? *root_ : toml::table{};
    mergeHandlers(document);

    if (!writeAtomically(document))
        return false;

    root_ = std::make_unique<toml::table>(std::move(document));
    rememberWriteTime();
    PLOG_INFO << "[ConfigManager] Saved " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

void ConfigManager::dispatchLoad(const toml::table& document) const
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = findTable(document, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

void ConfigManager::mergeHandlers(toml::table& document) const
{
    for (const auto& handler : handlers_)
    {
        toml::table* target = ensureTable(document, handler.path);
        if (!target)
        {
            PLOG_WARNING << "[ConfigManager] '" << handler.path << "' is not a table; its settings are not saved";
            continue;
        }

        const toml::table values = handler.callbacks.save();
        for (const auto& [key, value] : values)
        {
            const bool owned = std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key.str()) !=
                               handler.ownedKeys.end();
            if (!owned)
                PLOG_WARNING << "[ConfigManager] Dropping unowned key '" << key.str() << "' from '" << handler.path
                             << "'";
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (const toml::node* value = values.get(key))
                target->insert_or_assign(key, *value);
            else
                target->erase(key);
        }
    }
}

bool ConfigManager::writeAtomically(const toml::table& document)
{
    std::error_code ec;
    const fs::path parent = fs::path(config_path_).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << document << '\n';
    }

    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "Failed to rename: " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

void ConfigManager::rememberWriteTime()
{
    std::error_code ec;
    const auto stamp = fs::last_write_time(config_path_, ec);
    if (ec)
        last_write_.reset();
    else
        last_write_ = stamp;
}

std::vector<std::string> ConfigManager::splitPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
        segments.push_back(segment);
    return segments;
}

const toml::table* ConfigManager::findTable(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        if (segment.empty())
            return nullptr;

        const toml::node* child = current->get(segment);
        current = child ? child->as_table() : nullptr;
        if (!current)
            return nullptr;
    }
    return current;
}

toml::table* ConfigManager::ensureTable(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        if (segment.empty())
            return nullptr;

        auto [it, inserted] = current->try_emplace(segment, toml::table{});
        current = it->second.as_table();
        if (!current)
            return nullptr;
    }
    return current;
}

} // namespace config
