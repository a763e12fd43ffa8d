// Catch2WithMain provides main(); this file only holds the framework smoke test

#include <catch2/catch_test_macros.hpp>

#include "matching/TeamNameNormalizer.hpp"

// Verifies the framework runs and the default normalizer tables load
TEST_CASE("Framework smoke test", "[smoke]") {
    matching::TeamNameNormalizer normalizer;
    REQUIRE_FALSE(normalizer.rules().abbreviations.empty());
    REQUIRE(normalizer.normalize("Chicago") == "chicago");
}
