#include "ResponseProcessor.hpp"
#include "TeamStandardizer.hpp"
#include "../matching/Diagnostics.hpp"

#include <plog/Log.h>

#include <utility>

using matching::Diagnostics;

namespace standardize
{

ResponseProcessor::ResponseProcessor(TeamStandardizer& standardizer, ResponseFields fields, bool auto_add)
    : standardizer_(standardizer)
    , fields_(std::move(fields))
    , auto_add_(auto_add)
{
}

ProcessingOutcome ResponseProcessor::process(const nlohmann::ordered_json& document,
                                             const std::optional<std::string>& category_override)
{
    ProcessingOutcome outcome;
    outcome.document = document;

    visit(outcome.document, std::string(), category_override, outcome);

    outcome.new_teams_added = standardizer_.sessionAdditions().size();

    if (outcome.document.is_object())
    {
        outcome.document[fields_.summary_key] = {
            {"teams_processed", outcome.teams_processed},
            {"changes_made", outcome.changes_made},
            {"new_teams_added", outcome.new_teams_added},
        };
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[ResponseProcessor] Processed " << outcome.teams_processed
                                          << " teams, changes=" << (outcome.changes_made ? "yes" : "no")
                                          << ", session additions=" << outcome.new_teams_added;
    return outcome;
}

void ResponseProcessor::visit(nlohmann::ordered_json& node, const std::string& inherited_category,
                              const std::optional<std::string>& category_override, ProcessingOutcome& outcome)
{
    if (node.is_array())
    {
        for (auto& element : node)
            visit(element, inherited_category, category_override, outcome);
        return;
    }

    if (!node.is_object())
        return;

    const std::string own = ownCategory(node, inherited_category);
    std::string category = category_override ? *category_override : own;
    if (category.empty())
        category = fields_.default_category;

    standardizeFields(node, category, outcome);

    for (auto it = node.begin(); it != node.end(); ++it)
    {
        if (isDiagnosticKey(it.key()))
            continue;
        if (it->is_object() || it->is_array())
            visit(*it, own, category_override, outcome);
    }
}

void ResponseProcessor::standardizeFields(nlohmann::ordered_json& object, const std::string& category,
                                          ProcessingOutcome& outcome)
{
    for (const auto& key : fields_.name_keys)
    {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string())
            continue;

        const std::string original = it->get<std::string>();
        if (original.empty())
            continue;

        auto result = standardizer_.standardize(original, category, auto_add_);
        ++outcome.teams_processed;

        if (result.canonical_name != original)
        {
            *it = result.canonical_name;
            outcome.changes_made = true;
        }

        object[key + fields_.diagnostic_suffix] = {
            {"original", original},
            {"standardized", result.canonical_name},
            {"details", toJson(result.decision)},
        };
    }
}

std::string ResponseProcessor::ownCategory(const nlohmann::ordered_json& object, const std::string& inherited) const
{
    for (const auto& key : fields_.category_keys)
    {
        auto it = object.find(key);
        if (it != object.end() && it->is_string())
        {
            auto value = it->get<std::string>();
            if (!value.empty())
                return value;
        }
    }
    return inherited;
}

bool ResponseProcessor::isDiagnosticKey(const std::string& key) const
{
    const auto& suffix = fields_.diagnostic_suffix;
    if (key.size() <= suffix.size() || key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0)
        return false;

    const std::string base = key.substr(0, key.size() - suffix.size());
    for (const auto& name_key : fields_.name_keys)
    {
        if (name_key == base)
            return true;
    }
    return false;
}

} // namespace standardize
