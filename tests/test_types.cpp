#include <catch2/catch_test_macros.hpp>
#include "questlog/types.hpp"

using namespace questlog;

TEST_CASE("Priority labels parse in both vocabularies", "[types]")
{
    REQUIRE(priority_from_string("alta") == Priority::High);
    REQUIRE(priority_from_string("média") == Priority::Medium);
    REQUIRE(priority_from_string("media") == Priority::Medium);
    REQUIRE(priority_from_string("baixa") == Priority::Low);
    REQUIRE(priority_from_string("high") == Priority::High);
    REQUIRE(priority_from_string("medium") == Priority::Medium);
    REQUIRE(priority_from_string("low") == Priority::Low);
}

TEST_CASE("Unknown priority is InvalidInput", "[types]")
{
    auto p = priority_from_string("urgent");
    REQUIRE_FALSE(p.has_value());
    REQUIRE(p.error().code == ErrorCode::InvalidInput);

    REQUIRE_FALSE(priority_from_string("").has_value());
    REQUIRE_FALSE(priority_from_string("Alta").has_value());
}

TEST_CASE("Priority renders in the configured vocabulary", "[types]")
{
    REQUIRE(priority_to_string(Priority::High) == "alta");
    REQUIRE(priority_to_string(Priority::Medium) == "média");
    REQUIRE(priority_to_string(Priority::Low) == "baixa");
    REQUIRE(priority_to_string(Priority::High, PriorityLabels::Neutral) == "high");
    REQUIRE(priority_to_string(Priority::Medium, PriorityLabels::Neutral) == "medium");
    REQUIRE(priority_to_string(Priority::Low, PriorityLabels::Neutral) == "low");
}

TEST_CASE("Label vocabulary names", "[types]")
{
    REQUIRE(labels_from_string("reference") == PriorityLabels::Reference);
    REQUIRE(labels_from_string("neutral") == PriorityLabels::Neutral);

    auto bad = labels_from_string("english");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ConfigError);
}
