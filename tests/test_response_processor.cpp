#include <catch2/catch_test_macros.hpp>
#include "registry/TeamRegistry.hpp"
#include "standardize/ResponseProcessor.hpp"
#include "standardize/TeamStandardizer.hpp"

#include <nlohmann/json.hpp>

#include <vector>

using namespace standardize;
using registry::CanonicalEntry;
using registry::TeamRegistry;
using json = nlohmann::ordered_json;

TEST_CASE("ResponseProcessor - Flat Event", "[processor]")
{
    TeamRegistry registry(std::vector<CanonicalEntry>{ { "basketball", "Kauno Zalgiris" } });
    auto standardizer = TeamStandardizer::create(registry);
    ResponseProcessor processor(*standardizer);

    const json input = {
        { "sport", "basketball" },
        { "home_team", "Zalgiris Kaunas" },
        { "away_team", "Brand New FC" },
    };

    auto outcome = processor.process(input);

    SECTION("Known team is rewritten, new team is added unchanged")
    {
        REQUIRE(outcome.document["home_team"] == "Kauno Zalgiris");
        REQUIRE(outcome.document["away_team"] == "Brand New FC");
        REQUIRE(registry.lookup("basketball").size() == 2);
    }

    SECTION("Counters")
    {
        REQUIRE(outcome.teams_processed == 2);
        REQUIRE(outcome.changes_made);
        REQUIRE(outcome.new_teams_added == 1);
    }

    SECTION("Diagnostics are attached beside each field")
    {
        const auto& home = outcome.document["home_team_standardization"];
        REQUIRE(home["original"] == "Zalgiris Kaunas");
        REQUIRE(home["standardized"] == "Kauno Zalgiris");
        REQUIRE(home["details"]["status"] == "fuzzy_match");

        const auto& away = outcome.document["away_team_standardization"];
        REQUIRE(away["details"]["status"] == "auto_added");
    }

    SECTION("Summary is added to the root mapping")
    {
        const auto& summary = outcome.document["_processing_summary"];
        REQUIRE(summary["teams_processed"] == 2);
        REQUIRE(summary["changes_made"] == true);
        REQUIRE(summary["new_teams_added"] == 1);
    }

    SECTION("Input is not modified and key order is kept")
    {
        REQUIRE(input["home_team"] == "Zalgiris Kaunas");
        REQUIRE_FALSE(input.contains("_processing_summary"));
        REQUIRE(outcome.document.begin().key() == "sport");
    }
}

TEST_CASE("ResponseProcessor - Nested Documents", "[processor]")
{
    TeamRegistry registry(std::vector<CanonicalEntry>{
        { "basketball", "Kauno Zalgiris" },
        { "soccer", "Barcelona" },
    });
    auto standardizer = TeamStandardizer::create(registry);
    ResponseProcessor processor(*standardizer);

    SECTION("Category is inherited from the enclosing mapping")
    {
        const json input = {
            { "sport", "basketball" },
            { "games", json::array({ { { "home_team", "Kaunas Zalgiris" } }, { { "home_team", "Kauno Zalgiris" } } }) },
        };

        auto outcome = processor.process(input);

        REQUIRE(outcome.teams_processed == 2);
        REQUIRE(outcome.changes_made);
        REQUIRE(outcome.new_teams_added == 0);
        REQUIRE(outcome.document["games"][0]["home_team"] == "Kauno Zalgiris");
        REQUIRE(outcome.document["games"][1]["home_team_standardization"]["details"]["status"] == "exact_match");
    }

    SECTION("Inner category key takes precedence over the inherited one")
    {
        const json input = {
            { "sport", "basketball" },
            { "match", { { "sport", "soccer" }, { "team", "Barcelona FC" } } },
        };

        auto outcome = processor.process(input);
        REQUIRE(outcome.document["match"]["team"] == "Barcelona");
    }

    SECTION("Array root gets no summary")
    {
        const json input = json::array({ { { "sport", "soccer" }, { "team", "Barcelona FC" } } });

        auto outcome = processor.process(input);

        REQUIRE(outcome.document.is_array());
        REQUIRE(outcome.document[0]["team"] == "Barcelona");
        REQUIRE(outcome.teams_processed == 1);
    }

    SECTION("Override replaces every category")
    {
        const json input = { { "sport", "basketball" }, { "team", "Barcelona FC" } };

        auto outcome = processor.process(input, std::string("soccer"));
        REQUIRE(outcome.document["team"] == "Barcelona");
    }

    SECTION("Missing category falls back to unknown")
    {
        const json input = { { "participant", "Lonely Rangers" } };

        auto outcome = processor.process(input);

        REQUIRE(outcome.teams_processed == 1);
        REQUIRE_FALSE(outcome.changes_made);
        REQUIRE(registry.lookup("unknown").size() == 1);
    }

    SECTION("Non-string and empty name values are skipped")
    {
        const json input = {
            { "sport", "soccer" },
            { "team", { { "id", 7 } } },
            { "home_team", "" },
            { "away_team", 42 },
        };

        auto outcome = processor.process(input);

        REQUIRE(outcome.teams_processed == 0);
        REQUIRE_FALSE(outcome.changes_made);
        REQUIRE_FALSE(outcome.document.contains("home_team_standardization"));
    }
}

TEST_CASE("ResponseProcessor - Configuration", "[processor]")
{
    TeamRegistry registry(std::vector<CanonicalEntry>{ { "soccer", "Barcelona" } });
    auto standardizer = TeamStandardizer::create(registry);

    SECTION("Custom keys")
    {
        ResponseFields fields;
        fields.name_keys = { "club" };
        fields.category_keys = { "league_sport" };
        fields.summary_key = "summary";
        ResponseProcessor processor(*standardizer, fields);

        const json input = { { "league_sport", "soccer" }, { "club", "FC Barcelona" }, { "team", "Ignored FC" } };
        auto outcome = processor.process(input);

        REQUIRE(outcome.document["club"] == "Barcelona");
        REQUIRE(outcome.document["team"] == "Ignored FC");
        REQUIRE(outcome.document.contains("club_standardization"));
        REQUIRE(outcome.document.contains("summary"));
    }

    SECTION("Auto-add disabled")
    {
        ResponseProcessor processor(*standardizer, ResponseFields{}, false);

        const json input = { { "sport", "soccer" }, { "team", "Totally Unrelated Club" } };
        auto outcome = processor.process(input);

        REQUIRE(outcome.document["team_standardization"]["details"]["status"] == "no_match_no_add");
        REQUIRE(outcome.new_teams_added == 0);
        REQUIRE(registry.lookup("soccer").size() == 1);
    }
}

TEST_CASE("ResponseProcessor - Earlier Additions Match Later Fields", "[processor]")
{
    TeamRegistry registry;
    auto standardizer = TeamStandardizer::create(registry);
    ResponseProcessor processor(*standardizer);

    const json input = {
        { "sport", "basketball" },
        { "events",
          json::array({
              { { "home_team", "Vilniaus Rytas" } },
              { { "home_team", "Vilnius Rytas" } },
          }) },
    };

    auto outcome = processor.process(input);
    const auto& events = outcome.document["events"];

    SECTION("First spelling is added, second matches it")
    {
        REQUIRE(events[0]["home_team"] == "Vilniaus Rytas");
        REQUIRE(events[0]["home_team_standardization"]["details"]["status"] == "auto_added");
        REQUIRE(events[1]["home_team"] == "Vilniaus Rytas");
        REQUIRE(events[1]["home_team_standardization"]["details"]["status"] == "fuzzy_match");
        REQUIRE(registry.lookup("basketball").size() == 1);
    }

    SECTION("Only one team counts as new")
    {
        REQUIRE(outcome.teams_processed == 2);
        REQUIRE(outcome.changes_made);
        REQUIRE(outcome.document["_processing_summary"]["new_teams_added"] == 1);
    }
}
