#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace standardize
{

class TeamStandardizer;

/// Keys the bulk rewriter recognizes inside API response documents
struct ResponseFields
{
    std::vector<std::string> name_keys{"home_team", "away_team", "team_name", "team", "participant"};
    std::vector<std::string> category_keys{"sport", "sport_key", "category"};
    std::string default_category = "unknown";
    std::string diagnostic_suffix = "_standardization";
    std::string summary_key = "_processing_summary";
};

struct ProcessingOutcome
{
    nlohmann::ordered_json document;
    std::size_t teams_processed = 0;
    bool changes_made = false;
    std::size_t new_teams_added = 0;
};

/**
 * @brief Rewrites team names found anywhere inside a JSON document.
 *
 * Works on a copy; the input is never modified. Every rewritten mapping gets a
 * "<key>_standardization" object with the original value, the standardized value and the
 * decision details. Key order of the input is preserved.
 */
class ResponseProcessor
{
public:
    explicit ResponseProcessor(TeamStandardizer& standardizer, ResponseFields fields = {}, bool auto_add = true);

    ProcessingOutcome process(const nlohmann::ordered_json& document,
                              const std::optional<std::string>& category_override = std::nullopt);

    const ResponseFields& fields() const { return fields_; }

private:
    void visit(nlohmann::ordered_json& node, const std::string& inherited_category,
               const std::optional<std::string>& category_override, ProcessingOutcome& outcome);

    void standardizeFields(nlohmann::ordered_json& object, const std::string& category, ProcessingOutcome& outcome);

    /// First category key of @p object holding a non-empty string, else @p inherited
    std::string ownCategory(const nlohmann::ordered_json& object, const std::string& inherited) const;

    bool isDiagnosticKey(const std::string& key) const;

    TeamStandardizer& standardizer_;
    ResponseFields fields_;
    bool auto_add_;
};

} // namespace standardize
