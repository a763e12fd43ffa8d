#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief Owns the plog appenders of the process.
 *
 * Settings come from the [logging] table of the configuration file:
 *
 *   [logging]
 *   level = 4            # plog severity, 0 (none) .. 6 (verbose)
 *   append = true        # false truncates the log files on startup
 *   file = "logs/team_standardizer.log"
 *
 * Each plog instance gets a rolling file appender, optionally mirrored to stderr.
 */
class LogManager
{
public:
    struct Settings
    {
        plog::Severity level = plog::info;
        bool append = true;
        std::string file = "logs/team_standardizer.log";
    };

    struct Sink
    {
        std::string name;
        std::string file;
        std::optional<plog::Severity> level; // Settings::level when unset
        bool mirror_to_stderr = false;
        std::size_t max_file_size = 10 * 1024 * 1024;
        int max_files = 3;
    };

    /// Missing file or table keeps the defaults; out-of-range levels are ignored
    static Settings LoadSettings(const std::string& config_path);

    static bool Initialize(const Settings& settings);

    template <int InstanceId = 0>
    static bool Attach(const Sink& sink);

    static void Shutdown();

    static const Settings& Current();

private:
    LogManager() = default;

    static bool ensureDirectory(const std::string& file);

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
