#pragma once

#include "../config/StandardizerSettings.hpp"
#include "../registry/TeamRegistry.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
}
namespace registry
{
class RegistryStore;
}
namespace standardize
{
class TeamStandardizer;
}

class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitPersistence = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class Command
    {
        None,
        Standardize,
        Process,
        Add,
        Stats,
        Clean
    };

    struct Options
    {
        std::string config_path = "config.toml";
        std::optional<std::string> registry_path;
        bool verbose = false;
        bool show_help = false;
        bool show_version = false;

        Command command = Command::None;
        std::vector<std::string> arguments;
        std::optional<std::string> sport;
        std::optional<std::string> output;
        bool no_add = false;
        bool force = false;
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    bool initializeConfig();
    bool createStandardizer();
    int loadRegistry();
    int saveRegistry();

    int runStandardize();
    int runProcess();
    int runAdd();
    int runStats();
    int runClean();

    void flushErrors() const;

    static void PrintUsage(std::ostream& os);
    static void PrintVersion(std::ostream& os);

    int argc_ = 0;
    char** argv_ = nullptr;
    Options options_;

    std::unique_ptr<config::ConfigManager> config_;
    config::StandardizerSettings settings_;
    std::unique_ptr<registry::RegistryStore> store_;
    registry::TeamRegistry registry_;
    std::unique_ptr<standardize::TeamStandardizer> standardizer_;
};
