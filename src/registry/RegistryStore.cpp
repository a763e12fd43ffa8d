#include "RegistryStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace registry
{

namespace
{

constexpr const char* kCategoryField = "sport";
constexpr const char* kNameField = "canonical_team_name";

std::string backupSuffix()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream oss;
    oss << ".backup_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string stringField(const json& record, const char* field)
{
    auto it = record.find(field);
    if (it == record.end() || !it->is_string())
    {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

RegistryStore::RegistryStore(std::string path, bool backup_on_save)
    : path_(std::move(path))
    , backup_on_save_(backup_on_save)
{
}

std::optional<std::vector<CanonicalEntry>> RegistryStore::load()
{
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        PLOG_INFO << "[RegistryStore] No snapshot at " << path_ << ", starting with an empty registry";
        return std::nullopt;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
    {
        last_error_ = "Failed to open registry snapshot: " + path_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence, "Failed to read registry snapshot",
                                            "Path: " + path_);
        return std::nullopt;
    }

    try
    {
        json snapshot = json::parse(file);
        if (!snapshot.is_array())
        {
            last_error_ = "Invalid snapshot format (expected array): " + path_;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence,
                                                "Registry snapshot has an unexpected format", last_error_);
            return std::nullopt;
        }

        std::size_t skipped = 0;
        auto entries = fromJson(snapshot, &skipped);
        if (skipped > 0)
        {
            PLOG_WARNING << "[RegistryStore] Skipped " << skipped << " malformed records in " << path_;
        }
        PLOG_INFO << "[RegistryStore] Loaded " << entries.size() << " teams from " << path_;
        return entries;
    }
    catch (const json::exception& e)
    {
        last_error_ = std::string("JSON parse error in ") + path_ + ": " + e.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence, "Registry snapshot is not valid JSON",
                                            last_error_);
        return std::nullopt;
    }
}

bool RegistryStore::save(const std::vector<CanonicalEntry>& entries)
{
    last_error_.clear();
    last_backup_path_.clear();

    std::error_code ec;
    auto parent_path = fs::path(path_).parent_path();
    if (!parent_path.empty())
    {
        fs::create_directories(parent_path, ec);
        if (ec)
        {
            last_error_ = "Failed to create directory " + parent_path.string() + ": " + ec.message();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence,
                                              "Failed to create directory for registry snapshot", last_error_);
            return false;
        }
    }

    if (backup_on_save_ && fs::exists(path_, ec) && !createBackup())
    {
        return false;
    }

    std::string serialized;
    try
    {
        serialized = toJson(entries).dump(2, ' ', false, json::error_handler_t::replace);
    }
    catch (const json::exception& e)
    {
        last_error_ = std::string("Failed to serialize registry: ") + e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to save registry", last_error_);
        return false;
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Could not create temporary file for writing: " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to save registry",
                                              last_error_);
            return false;
        }
        ofs << serialized << '\n';
        ofs.flush();
        if (!ofs.good())
        {
            last_error_ = "Error writing temporary file: " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to save registry",
                                              last_error_);
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec)
    {
        last_error_ = "Could not rename temporary file: " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to save registry", last_error_);
        fs::remove(tmp, ec);
        return false;
    }

    PLOG_INFO << "[RegistryStore] Saved " << entries.size() << " teams to " << path_;
    return true;
}

json RegistryStore::toJson(const std::vector<CanonicalEntry>& entries)
{
    json snapshot = json::array();
    for (const auto& entry : entries)
    {
        snapshot.push_back({ { kCategoryField, entry.category }, { kNameField, entry.name } });
    }
    return snapshot;
}

std::vector<CanonicalEntry> RegistryStore::fromJson(const json& snapshot, std::size_t* skipped)
{
    std::vector<CanonicalEntry> entries;
    std::size_t skipped_count = 0;

    if (snapshot.is_array())
    {
        entries.reserve(snapshot.size());
        for (const auto& record : snapshot)
        {
            if (!record.is_object())
            {
                ++skipped_count;
                continue;
            }
            entries.push_back(CanonicalEntry{ stringField(record, kCategoryField), stringField(record, kNameField) });
        }
    }

    if (skipped)
    {
        *skipped = skipped_count;
    }
    return entries;
}

bool RegistryStore::createBackup()
{
    std::string backup_path = path_ + backupSuffix();
    std::error_code ec;
    fs::copy_file(path_, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        last_error_ = "Failed to back up " + path_ + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to back up registry snapshot",
                                          last_error_);
        return false;
    }

    last_backup_path_ = backup_path;
    PLOG_INFO << "[RegistryStore] Created backup: " << backup_path;
    return true;
}

} // namespace registry
