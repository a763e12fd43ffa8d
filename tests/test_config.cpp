#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config/ConfigManager.hpp"
#include "config/StandardizerSettings.hpp"
#include "matching/ScoreCombiner.hpp"
#include "utils/LogManager.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace config;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

// Test fixture for a temporary config file
class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& content = "")
    {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("team_config_test_" + std::to_string(rd()));
        fs::create_directories(dir_);
        path_ = (dir_ / "config.toml").string();
        if (!content.empty())
        {
            std::ofstream out(path_, std::ios::binary);
            out << content;
        }
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    const std::string& path() const { return path_; }

private:
    fs::path dir_;
    std::string path_;
};

TEST_CASE("StandardizerSettings - Defaults", "[config]")
{
    TempConfigFile file;
    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));

    REQUIRE(manager.load());

    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.75, 1e-9));
    REQUIRE_THAT(settings.matching.auto_add_threshold, WithinAbs(0.70, 1e-9));
    REQUIRE(settings.matching.effectiveWeights() == matching::ScoreCombiner::DefaultWeights());
    REQUIRE(settings.registry.file == "teams.json");
    REQUIRE(settings.processing.auto_add);
    REQUIRE(settings.processing.fields.name_keys.size() == 5);
    REQUIRE(settings.warnings() == 0);
}

TEST_CASE("StandardizerSettings - Load Values", "[config]")
{
    TempConfigFile file(R"(
[matching]
threshold = 0.8
auto_add_threshold = 0.6
ngram_size = 3
weights = [0.2, 0.1, 0.1, 0.3, 0.25, 0.05]

[registry]
file = "data/teams.json"
backup_on_save = false

[processing]
auto_add = false
name_keys = ["club"]
default_category = "misc"
)");

    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));
    REQUIRE(manager.load());

    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.8, 1e-9));
    REQUIRE_THAT(settings.matching.auto_add_threshold, WithinAbs(0.6, 1e-9));
    REQUIRE(settings.matching.ngram_size == 3);
    REQUIRE(settings.matching.weights.size() == 6);
    REQUIRE(settings.registry.file == "data/teams.json");
    REQUIRE_FALSE(settings.registry.backup_on_save);
    REQUIRE_FALSE(settings.processing.auto_add);
    REQUIRE(settings.processing.auto_save);
    REQUIRE(settings.processing.fields.name_keys == std::vector<std::string>{ "club" });
    REQUIRE(settings.processing.fields.category_keys.size() == 3);
    REQUIRE(settings.processing.fields.default_category == "misc");

    std::string error;
    REQUIRE(settings.matching.validate(error));
}

TEST_CASE("StandardizerSettings - Wrong Types Keep Defaults", "[config]")
{
    TempConfigFile file(R"(
[matching]
threshold = "high"
weights = [0.5, "x"]

[processing]
auto_save = 1
)");

    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));
    REQUIRE(manager.load());

    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.75, 1e-9));
    REQUIRE(settings.matching.weights.empty());
    REQUIRE(settings.processing.auto_save);
    REQUIRE(settings.warnings() == 3);
}

TEST_CASE("StandardizerSettings - Integer Thresholds", "[config]")
{
    TempConfigFile file("[matching]\nthreshold = 1\nauto_add_threshold = 0\n");

    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));
    REQUIRE(manager.load());

    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(settings.matching.auto_add_threshold, WithinAbs(0.0, 1e-9));
}

TEST_CASE("ConfigManager - Parse Errors", "[config]")
{
    TempConfigFile file("[matching\nthreshold = ");

    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));

    REQUIRE_FALSE(manager.load());
    REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.75, 1e-9));
}

TEST_CASE("ConfigManager - Save Keeps Foreign Keys", "[config]")
{
    TempConfigFile file(R"(
[matching]
threshold = 0.9
note = "kept"

[other]
value = 42
)");

    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));
    REQUIRE(manager.load());

    settings.matching.auto_add_threshold = 0.5;
    REQUIRE(manager.save());

    ConfigManager reread(file.path());
    StandardizerSettings reloaded;
    REQUIRE(reloaded.bind(reread));
    REQUIRE(reread.load());

    REQUIRE_THAT(reloaded.matching.match_threshold, WithinAbs(0.9, 1e-9));
    REQUIRE_THAT(reloaded.matching.auto_add_threshold, WithinAbs(0.5, 1e-9));
    REQUIRE(reread.root()["matching"]["note"].value<std::string>() == std::optional<std::string>("kept"));
    REQUIRE(reread.root()["other"]["value"].value<int64_t>() == std::optional<int64_t>(42));
}

TEST_CASE("ConfigManager - Duplicate Key Ownership", "[config]")
{
    ConfigManager manager("unused.toml");
    TableCallbacks callbacks{ [](const toml::table&) {}, []() { return toml::table{}; } };

    REQUIRE(manager.registerTable("matching", callbacks, { "threshold" }));
    REQUIRE_FALSE(manager.registerTable("matching", callbacks, { "threshold" }));
    REQUIRE(manager.registerTable("registry", callbacks, { "threshold" }));
}

TEST_CASE("ConfigManager - Reload If Changed", "[config]")
{
    TempConfigFile file("[matching]\nthreshold = 0.8\n");
    ConfigManager manager(file.path());
    StandardizerSettings settings;
    REQUIRE(settings.bind(manager));
    REQUIRE(manager.load());
    REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.8, 1e-9));

    SECTION("Unchanged file is not reloaded")
    {
        REQUIRE_FALSE(manager.reloadIfChanged());
    }

    SECTION("Newer file is reloaded")
    {
        const auto previous = fs::last_write_time(file.path());
        {
            std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
            out << "[matching]\nthreshold = 0.85\n";
        }
        fs::last_write_time(file.path(), previous + std::chrono::seconds(5));

        REQUIRE(manager.reloadIfChanged());
        REQUIRE_THAT(settings.matching.match_threshold, WithinAbs(0.85, 1e-9));
        REQUIRE_FALSE(manager.reloadIfChanged());
    }
}

TEST_CASE("LogManager - Load Settings", "[config]")
{
    SECTION("Missing file keeps defaults")
    {
        const auto settings = utils::LogManager::LoadSettings("does_not_exist.toml");
        REQUIRE(settings.level == plog::info);
        REQUIRE(settings.append);
        REQUIRE(settings.file == "logs/team_standardizer.log");
    }

    SECTION("Logging table is read")
    {
        TempConfigFile file("[logging]\nlevel = 5\nappend = false\nfile = \"out/run.log\"\n");
        const auto settings = utils::LogManager::LoadSettings(file.path());
        REQUIRE(settings.level == plog::debug);
        REQUIRE_FALSE(settings.append);
        REQUIRE(settings.file == "out/run.log");
    }

    SECTION("Out of range level and empty file are ignored")
    {
        TempConfigFile file("[logging]\nlevel = 9\nfile = \"\"\n");
        const auto settings = utils::LogManager::LoadSettings(file.path());
        REQUIRE(settings.level == plog::info);
        REQUIRE(settings.file == "logs/team_standardizer.log");
    }
}
