#pragma once

#include "../standardize/ResponseProcessor.hpp"
#include "../standardize/StandardizerConfig.hpp"

#include <cstddef>
#include <string>

#include <toml++/toml.h>

namespace config
{

class ConfigManager;

struct RegistrySettings
{
    std::string file = "teams.json";
    bool backup_on_save = true;
};

struct ProcessingSettings
{
    bool auto_add = true;
    bool auto_save = true;
    standardize::ResponseFields fields;
};

/**
 * @brief Settings of the standardizer application bound to the [matching], [registry]
 * and [processing] tables of the config file.
 *
 * Missing keys keep their defaults. Values of the wrong type are ignored and counted in
 * warnings(). Threshold consistency is checked by TeamStandardizer::create, not here.
 */
class StandardizerSettings
{
public:
    /// Register the three tables with @p manager; the settings must outlive it
    bool bind(ConfigManager& manager);

    standardize::StandardizerConfig matching;
    RegistrySettings registry;
    ProcessingSettings processing;

    std::size_t warnings() const { return warnings_; }

private:
    void loadMatching(const toml::table& section);
    void loadRegistry(const toml::table& section);
    void loadProcessing(const toml::table& section);

    toml::table saveMatching() const;
    toml::table saveRegistry() const;
    toml::table saveProcessing() const;

    std::size_t warnings_ = 0;
};

} // namespace config
