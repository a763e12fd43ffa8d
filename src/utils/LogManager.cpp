#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../matching/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogManager::Settings LogManager::LoadSettings(const std::string& config_path)
{
    Settings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return settings;

    toml::table document;
    try
    {
        document = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()) + "\nFile: " + config_path);
        return settings;
    }

    const toml::table* logging = document["logging"].as_table();
    if (!logging)
        return settings;

    if (auto level = (*logging)["level"].value<int64_t>(); level && *level >= plog::none && *level <= plog::verbose)
        settings.level = static_cast<plog::Severity>(*level);

    settings.append = (*logging)["append"].value_or(settings.append);

    if (auto file = (*logging)["file"].value<std::string>(); file && !file->empty())
        settings.file = *file;

    return settings;
}

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    s_initialized = true;
    return ensureDirectory(s_settings.file);
}

template <int InstanceId>
bool LogManager::Attach(const Sink& sink)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging used before initialization", sink.name);
        return false;
    }

    if (!ensureDirectory(sink.file))
        return false;

    try
    {
        if (!s_settings.append)
            std::ofstream(sink.file, std::ios::trunc).close();

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(sink.file.c_str(),
                                                                                    sink.max_file_size,
                                                                                    sink.max_files);
        auto& logger = plog::init<InstanceId>(sink.level.value_or(s_settings.level), file.get());
        s_appenders.push_back(std::move(file));

        if (sink.mirror_to_stderr)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + sink.name, ex.what());
        return false;
    }
}

template bool LogManager::Attach<0>(const Sink&);
template bool LogManager::Attach<matching::Diagnostics::kLogInstance>(const Sink&);

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

const LogManager::Settings& LogManager::Current() { return s_settings; }

bool LogManager::ensureDirectory(const std::string& file)
{
    const std::filesystem::path dir = std::filesystem::path(file).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
