#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "matching/SimilarityMetrics.hpp"

#include <utility>
#include <vector>

using namespace matching;
using Catch::Matchers::WithinAbs;

TEST_CASE("SimilarityMetrics - Edit Distance", "[metrics]")
{
    SECTION("Classic Levenshtein distance")
    {
        REQUIRE(editDistance(U"kitten", U"sitting") == 3);
        REQUIRE(editDistance(U"", U"abc") == 3);
        REQUIRE(editDistance(U"abc", U"abc") == 0);
    }

    SECTION("Ratio is normalized by the longer string")
    {
        REQUIRE_THAT(editDistanceRatio(U"kitten", U"sitting"), WithinAbs(0.5714, 0.001));
    }

    SECTION("Two empty strings are identical")
    {
        REQUIRE_THAT(editDistanceRatio(U"", U""), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("SimilarityMetrics - Jaro", "[metrics]")
{
    SECTION("Textbook examples")
    {
        REQUIRE_THAT(jaroSimilarity(U"martha", U"marhta"), WithinAbs(0.9444, 0.001));
        REQUIRE_THAT(jaroSimilarity(U"dixon", U"dicksonx"), WithinAbs(0.7667, 0.001));
    }

    SECTION("Empty input scores zero")
    {
        REQUIRE_THAT(jaroSimilarity(U"", U"abc"), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(jaroSimilarity(U"", U""), WithinAbs(0.0, 1e-9));
    }

    SECTION("No common characters scores zero")
    {
        REQUIRE_THAT(jaroSimilarity(U"abc", U"xyz"), WithinAbs(0.0, 1e-9));
    }
}

TEST_CASE("SimilarityMetrics - N-gram Jaccard", "[metrics]")
{
    SECTION("Bigram overlap")
    {
        // {ni, ig, gh, ht} vs {na, ac, ch, ht}: 1 shared of 7
        REQUIRE_THAT(ngramJaccard(U"night", U"nacht"), WithinAbs(1.0 / 7.0, 1e-6));
    }

    SECTION("Strings shorter than n compare as a whole")
    {
        REQUIRE_THAT(ngramJaccard(U"a", U"a"), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(ngramJaccard(U"a", U"b"), WithinAbs(0.0, 1e-9));
    }

    SECTION("Empty inputs")
    {
        REQUIRE_THAT(ngramJaccard(U"", U""), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(ngramJaccard(U"", U"abc"), WithinAbs(0.0, 1e-9));
    }
}

TEST_CASE("SimilarityMetrics - Token Metrics", "[metrics]")
{
    SECTION("Token order does not matter for token sort")
    {
        REQUIRE_THAT(tokenSortRatio(U"a b", U"b a"), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(tokenSortRatio(U"boston celtics", U"celtics boston"), WithinAbs(1.0, 1e-9));
    }

    SECTION("Token set treats a subset as a full match")
    {
        REQUIRE_THAT(tokenSetRatio(U"boston celtics", U"boston"), WithinAbs(1.0, 1e-9));
    }

    SECTION("Sequence ratio of reordered tokens")
    {
        REQUIRE_THAT(sequenceRatio(U"boston celtics", U"celtics boston"), WithinAbs(0.5, 0.001));
        REQUIRE_THAT(sequenceRatio(U"", U""), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("SimilarityMetrics - Known Pair Profile", "[metrics]")
{
    const std::u32string a = U"kaunas zalgiris";
    const std::u32string b = U"kauno zalgiris";

    const std::vector<std::pair<Metric, double>> expected = {
        { Metric::EditDistanceRatio, 0.8667 }, { Metric::Jaro, 0.8933 },          { Metric::NgramJaccard, 0.6875 },
        { Metric::TokenSortRatio, 0.8667 },    { Metric::TokenSetRatio, 0.8667 }, { Metric::SequenceRatio, 0.8966 },
    };

    for (const auto& [metric, value] : expected)
    {
        INFO("metric: " << metricName(metric));
        REQUIRE_THAT(computeMetric(metric, a, b), WithinAbs(value, 0.001));
    }
}

TEST_CASE("SimilarityMetrics - Symmetry, Bounds and Identity", "[metrics]")
{
    const std::vector<std::pair<std::u32string, std::u32string>> pairs = {
        { U"kaunas zalgiris", U"kauno zalgiris" },
        { U"boston celtics", U"celtics boston" },
        { U"los angeles lakers", U"lakers" },
        { U"madrid", U"atletico madrid" },
        { U"žalgiris", U"zalgiris" },
        { U"a", U"" },
    };

    for (Metric metric : kAllMetrics)
    {
        INFO("metric: " << metricName(metric));
        for (const auto& [a, b] : pairs)
        {
            const double forward = computeMetric(metric, a, b);
            const double backward = computeMetric(metric, b, a);
            REQUIRE_THAT(forward, WithinAbs(backward, 1e-9));
            REQUIRE(forward >= 0.0);
            REQUIRE(forward <= 1.0);

            if (!a.empty())
                REQUIRE_THAT(computeMetric(metric, a, a), WithinAbs(1.0, 1e-9));
        }
    }
}

TEST_CASE("SimilarityMetrics - Metric Names", "[metrics]")
{
    REQUIRE(metricName(Metric::Jaro) == "jaro");
    REQUIRE(metricName(Metric::TokenSetRatio) == "token_set_ratio");
}
