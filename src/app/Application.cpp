#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../matching/Diagnostics.hpp"
#include "../matching/TextUtils.hpp"
#include "../registry/RegistryStore.hpp"
#include "../registry/SnapshotCleaner.hpp"
#include "../standardize/MatchDecision.hpp"
#include "../standardize/ResponseProcessor.hpp"
#include "../standardize/TeamStandardizer.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace
{

const char* kDiagnosticsLogName = "matching.log";

bool isFlag(const char* arg, const char* flag) { return std::strcmp(arg, flag) == 0; }

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    if (options_.show_help)
    {
        PrintUsage(std::cout);
        return kExitOk;
    }

    if (options_.show_version)
    {
        PrintVersion(std::cout);
        return kExitOk;
    }

    if (!initializeLogging())
    {
        flushErrors();
        return kExitUsage;
    }

    if (!initializeConfig())
    {
        flushErrors();
        return kExitUsage;
    }

    int status = kExitOk;
    switch (options_.command)
    {
    case Command::Standardize:
        status = runStandardize();
        break;
    case Command::Process:
        status = runProcess();
        break;
    case Command::Add:
        status = runAdd();
        break;
    case Command::Stats:
        status = runStats();
        break;
    case Command::Clean:
        status = runClean();
        break;
    case Command::None:
        PrintUsage(std::cerr);
        status = kExitUsage;
        break;
    }

    flushErrors();
    return status;
}

bool Application::parseCommandLineArgs()
{
    auto needValue = [this](int& i, std::string& out) {
        if (i + 1 >= argc_)
        {
            std::cerr << "Missing value for " << argv_[i] << "\n";
            return false;
        }
        out = argv_[++i];
        return true;
    };

    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        std::string value;

        if (isFlag(arg, "--help") || isFlag(arg, "-h"))
            options_.show_help = true;
        else if (isFlag(arg, "--version"))
            options_.show_version = true;
        else if (isFlag(arg, "--verbose") || isFlag(arg, "-v"))
            options_.verbose = true;
        else if (isFlag(arg, "--no-add"))
            options_.no_add = true;
        else if (isFlag(arg, "--force"))
            options_.force = true;
        else if (isFlag(arg, "--config"))
        {
            if (!needValue(i, value))
                return false;
            options_.config_path = value;
        }
        else if (isFlag(arg, "--registry"))
        {
            if (!needValue(i, value))
                return false;
            options_.registry_path = value;
        }
        else if (isFlag(arg, "--sport"))
        {
            if (!needValue(i, value))
                return false;
            options_.sport = value;
        }
        else if (isFlag(arg, "--output"))
        {
            if (!needValue(i, value))
                return false;
            options_.output = value;
        }
        else if (std::strncmp(arg, "--", 2) == 0)
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else if (options_.command == Command::None)
        {
            if (isFlag(arg, "standardize"))
                options_.command = Command::Standardize;
            else if (isFlag(arg, "process"))
                options_.command = Command::Process;
            else if (isFlag(arg, "add"))
                options_.command = Command::Add;
            else if (isFlag(arg, "stats"))
                options_.command = Command::Stats;
            else if (isFlag(arg, "clean"))
                options_.command = Command::Clean;
            else
            {
                std::cerr << "Unknown command: " << arg << "\n";
                return false;
            }
        }
        else
        {
            options_.arguments.emplace_back(arg);
        }
    }

    if (options_.show_help || options_.show_version)
        return true;

    std::size_t expected = 0;
    switch (options_.command)
    {
    case Command::Standardize:
    case Command::Add:
        expected = 2;
        break;
    case Command::Process:
        expected = 1;
        break;
    case Command::Stats:
    case Command::Clean:
        expected = 0;
        break;
    case Command::None:
        std::cerr << "No command given\n";
        return false;
    }

    if (options_.arguments.size() != expected)
    {
        std::cerr << "Expected " << expected << " argument(s), got " << options_.arguments.size() << "\n";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(utils::LogManager::LoadSettings(options_.config_path)))
        return false;

    std::optional<plog::Severity> level;
    if (options_.verbose)
    {
        level = plog::debug;
        matching::Diagnostics::SetVerbose(true);
    }

    const std::string& main_log = utils::LogManager::Current().file;
    const std::filesystem::path diagnostics_log =
        std::filesystem::path(main_log).parent_path() / kDiagnosticsLogName;

    const bool main_ok = utils::LogManager::Attach<0>(
        { .name = "main", .file = main_log, .level = level, .mirror_to_stderr = options_.verbose });
    const bool diagnostics_ok = utils::LogManager::Attach<matching::Diagnostics::kLogInstance>(
        { .name = "diagnostics", .file = diagnostics_log.string(), .level = level, .mirror_to_stderr = options_.verbose });

    PLOG_INFO << "team_standardizer " << TEAM_STANDARDIZER_VERSION << " starting";
    return main_ok && diagnostics_ok;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<config::ConfigManager>(options_.config_path);
    if (!settings_.bind(*config_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to register settings",
                                          config_->lastError());
        return false;
    }

    // Parse errors fall back to defaults and are already reported
    config_->load();

    if (settings_.warnings() > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Some configuration values were ignored",
                                            std::to_string(settings_.warnings()) + " value(s) of the wrong type in " +
                                                options_.config_path);
    }

    const std::string registry_file = options_.registry_path.value_or(settings_.registry.file);
    store_ = std::make_unique<registry::RegistryStore>(registry_file, settings_.registry.backup_on_save);
    return true;
}

bool Application::createStandardizer()
{
    std::string error;
    standardizer_ = standardize::TeamStandardizer::create(registry_, settings_.matching, &error);
    if (!standardizer_)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid matching configuration",
                                          error);
        return false;
    }
    return true;
}

int Application::loadRegistry()
{
    auto snapshot = store_->load();
    if (!snapshot)
    {
        if (!store_->lastError().empty())
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Persistence,
                                              "Cannot continue without the registry", store_->path());
            return kExitPersistence;
        }
        snapshot.emplace();
    }

    registry_.reload(std::move(*snapshot));
    return createStandardizer() ? kExitOk : kExitUsage;
}

int Application::saveRegistry()
{
    if (!store_->save(registry_.entries()))
        return kExitPersistence;
    return kExitOk;
}

int Application::runStandardize()
{
    if (int status = loadRegistry(); status != kExitOk)
        return status;

    const bool auto_add = settings_.processing.auto_add && !options_.no_add;
    auto result = standardizer_->standardize(options_.arguments[1], options_.arguments[0], auto_add);

    std::cout << result.canonical_name << "\n";
    std::cout << standardize::toJson(result.decision).dump(2) << std::endl;

    if (!standardizer_->sessionAdditions().empty() && settings_.processing.auto_save)
        return saveRegistry();
    return kExitOk;
}

int Application::runProcess()
{
    const std::string& input_path = options_.arguments[0];
    nlohmann::ordered_json document;
    {
        std::ifstream ifs(input_path, std::ios::binary);
        if (!ifs)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Cannot open input document", input_path);
            return kExitUsage;
        }

        try
        {
            document = nlohmann::ordered_json::parse(ifs);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Input document is not valid JSON",
                                              std::string(e.what()) + "\nFile: " + input_path);
            return kExitUsage;
        }
    }

    if (int status = loadRegistry(); status != kExitOk)
        return status;

    const bool auto_add = settings_.processing.auto_add && !options_.no_add;
    standardize::ResponseProcessor processor(*standardizer_, settings_.processing.fields, auto_add);
    auto outcome = processor.process(document, options_.sport);

    const std::string rendered = outcome.document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (options_.output)
    {
        std::ofstream ofs(*options_.output, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Cannot write output document",
                                              *options_.output);
            return kExitPersistence;
        }
        ofs << rendered << '\n';
        PLOG_INFO << "Wrote processed document to " << *options_.output;
    }
    else
    {
        std::cout << rendered << std::endl;
    }

    if (!standardizer_->sessionAdditions().empty() && settings_.processing.auto_save)
        return saveRegistry();
    return kExitOk;
}

int Application::runAdd()
{
    if (int status = loadRegistry(); status != kExitOk)
        return status;

    const std::string& category = options_.arguments[0];
    const std::string& name = options_.arguments[1];
    auto result = standardizer_->addManually(name, category, options_.force);

    switch (result.outcome)
    {
    case standardize::AddOutcome::Added:
        std::cout << "Added '" << matching::trim(name) << "' to " << category << "\n";
        return saveRegistry();
    case standardize::AddOutcome::EmptyName:
        std::cerr << "Team name cannot be empty\n";
        break;
    case standardize::AddOutcome::Duplicate:
        std::cerr << "'" << result.existing_name << "' already exists in " << category << "\n";
        break;
    case standardize::AddOutcome::SimilarExists:
        std::cerr << "Similar team exists: '" << result.existing_name << "' (score: " << result.similarity
                  << "). Use --force to add anyway.\n";
        break;
    }
    return kExitUsage;
}

int Application::runStats()
{
    if (int status = loadRegistry(); status != kExitOk)
        return status;

    std::cout << standardize::toJson(standardizer_->statistics()).dump(2) << std::endl;
    return kExitOk;
}

int Application::runClean()
{
    auto snapshot = store_->load();
    if (!snapshot)
    {
        if (!store_->lastError().empty())
            return kExitPersistence;
        std::cout << "No registry at " << store_->path() << "\n";
        return kExitOk;
    }

    registry::CleanReport report;
    auto cleaned = registry::SnapshotCleaner::clean(*snapshot, report);
    std::cout << "Removed " << report.removed_empty << " empty and " << report.removed_duplicates
              << " duplicate entries, " << report.remaining << " remaining\n";

    if (report.removed_empty == 0 && report.removed_duplicates == 0)
        return kExitOk;

    if (!store_->save(cleaned))
        return kExitPersistence;
    if (!store_->lastBackupPath().empty())
        std::cout << "Backup: " << store_->lastBackupPath() << "\n";
    return kExitOk;
}

void Application::flushErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
}

void Application::PrintUsage(std::ostream& os)
{
    os << "Usage: team_standardizer [--config FILE] [--registry FILE] [--verbose] <command> [args]\n"
          "\n"
          "Commands:\n"
          "  standardize <category> <name> [--no-add]   Resolve a team name to its canonical form\n"
          "  process <input.json> [--sport CATEGORY] [--output FILE] [--no-add]\n"
          "                                             Standardize team names inside a JSON document\n"
          "  add <category> <name> [--force]            Register a team name manually\n"
          "  stats                                      Print registry statistics\n"
          "  clean                                      Remove empty and duplicate registry entries\n"
          "\n"
          "Options:\n"
          "  --config FILE     Configuration file (default: config.toml)\n"
          "  --registry FILE   Registry snapshot, overrides [registry] file\n"
          "  --verbose, -v     Debug logging to stderr\n"
          "  --help, -h        Show this help\n"
          "  --version         Show version\n";
}

void Application::PrintVersion(std::ostream& os) { os << "team_standardizer " << TEAM_STANDARDIZER_VERSION << "\n"; }
