#include "StandardizerSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace config
{

namespace
{

void warnType(std::string_view table, std::string_view key, std::size_t& warnings)
{
    PLOG_WARNING << "[StandardizerSettings] Ignoring [" << table << "] " << key << ": unexpected value type";
    ++warnings;
}

template <typename T>
void readValue(const toml::table& section, std::string_view table, std::string_view key, T& target,
               std::size_t& warnings)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;

    if (auto value = node->value<T>())
        target = *value;
    else
        warnType(table, key, warnings);
}

void readStrings(const toml::table& section, std::string_view table, std::string_view key,
                 std::vector<std::string>& target, std::size_t& warnings)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;

    const toml::array* arr = node->as_array();
    if (!arr)
    {
        warnType(table, key, warnings);
        return;
    }

    std::vector<std::string> values;
    for (const auto& element : *arr)
    {
        auto value = element.value<std::string>();
        if (!value)
        {
            warnType(table, key, warnings);
            return;
        }
        values.push_back(std::move(*value));
    }
    target = std::move(values);
}

toml::array toArray(const std::vector<std::string>& values)
{
    toml::array arr;
    for (const auto& value : values)
        arr.push_back(value);
    return arr;
}

} // anonymous namespace

bool StandardizerSettings::bind(ConfigManager& manager)
{
    bool ok = manager.registerTable(
        "matching",
        TableCallbacks{[this](const toml::table& section) { loadMatching(section); },
                       [this]() { return saveMatching(); }},
        {"threshold", "auto_add_threshold", "ngram_size", "weights"});

    ok = manager.registerTable(
             "registry",
             TableCallbacks{[this](const toml::table& section) { loadRegistry(section); },
                            [this]() { return saveRegistry(); }},
             {"file", "backup_on_save"}) && ok;

    ok = manager.registerTable(
             "processing",
             TableCallbacks{[this](const toml::table& section) { loadProcessing(section); },
                            [this]() { return saveProcessing(); }},
             {"auto_add", "auto_save", "name_keys", "category_keys", "default_category"}) && ok;

    return ok;
}

void StandardizerSettings::loadMatching(const toml::table& section)
{
    readValue(section, "matching", "threshold", matching.match_threshold, warnings_);
    readValue(section, "matching", "auto_add_threshold", matching.auto_add_threshold, warnings_);

    std::int64_t ngram = static_cast<std::int64_t>(matching.ngram_size);
    readValue(section, "matching", "ngram_size", ngram, warnings_);
    if (ngram >= 0)
        matching.ngram_size = static_cast<std::size_t>(ngram);
    else
        warnType("matching", "ngram_size", warnings_);

    if (const toml::node* node = section.get("weights"))
    {
        const toml::array* arr = node->as_array();
        std::vector<double> weights;
        bool valid = arr != nullptr;
        if (arr)
        {
            for (const auto& element : *arr)
            {
                auto weight = element.value<double>();
                if (!weight)
                {
                    valid = false;
                    break;
                }
                weights.push_back(*weight);
            }
        }

        if (valid)
            matching.weights = std::move(weights);
        else
            warnType("matching", "weights", warnings_);
    }
}

void StandardizerSettings::loadRegistry(const toml::table& section)
{
    readValue(section, "registry", "file", registry.file, warnings_);
    readValue(section, "registry", "backup_on_save", registry.backup_on_save, warnings_);
}

void StandardizerSettings::loadProcessing(const toml::table& section)
{
    readValue(section, "processing", "auto_add", processing.auto_add, warnings_);
    readValue(section, "processing", "auto_save", processing.auto_save, warnings_);
    readStrings(section, "processing", "name_keys", processing.fields.name_keys, warnings_);
    readStrings(section, "processing", "category_keys", processing.fields.category_keys, warnings_);
    readValue(section, "processing", "default_category", processing.fields.default_category, warnings_);
}

toml::table StandardizerSettings::saveMatching() const
{
    toml::array weights;
    for (double weight : matching.effectiveWeights())
        weights.push_back(weight);

    return toml::table{
        {"threshold", matching.match_threshold},
        {"auto_add_threshold", matching.auto_add_threshold},
        {"ngram_size", static_cast<std::int64_t>(matching.ngram_size)},
        {"weights", std::move(weights)},
    };
}

toml::table StandardizerSettings::saveRegistry() const
{
    return toml::table{
        {"file", registry.file},
        {"backup_on_save", registry.backup_on_save},
    };
}

toml::table StandardizerSettings::saveProcessing() const
{
    return toml::table{
        {"auto_add", processing.auto_add},
        {"auto_save", processing.auto_save},
        {"name_keys", toArray(processing.fields.name_keys)},
        {"category_keys", toArray(processing.fields.category_keys)},
        {"default_category", processing.fields.default_category},
    };
}

} // namespace config
