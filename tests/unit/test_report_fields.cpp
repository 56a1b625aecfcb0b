#include <catch2/catch_test_macros.hpp>
#include "core/report_fields.hpp"

using namespace tidesync;

namespace {

FieldValue parse_value(std::string_view text) {
    auto parsed = report::parse_assignment(text);
    REQUIRE(parsed.is_ok());
    return parsed.unwrap().second;
}

} // namespace

TEST_CASE("Report assignments follow the field schema", "[unit][report]") {
    SECTION("Species is a tag set") {
        REQUIRE(parse_value("species=blue crab, shrimp,,") == FieldValue(TagSet{"blue crab", "shrimp"}));
    }

    SECTION("Location is a coordinate pair") {
        REQUIRE(parse_value("location=30.6954,-88.0399") == FieldValue(GeoPoint{30.6954, -88.0399}));
    }

    SECTION("Environment is a measurement map") {
        REQUIRE(parse_value("environment=water_temp:28.5,salinity:12") ==
                FieldValue(MeasurementMap{{"water_temp", 28.5}, {"salinity", 12.0}}));
    }

    SECTION("Timestamp accepts ISO 8601 and epoch milliseconds") {
        REQUIRE(parse_value("timestamp=1720071000000") == FieldValue(Timestamp(1720071000000)));
        REQUIRE(parse_value("timestamp=2024-07-04T05:30:00Z") == FieldValue(Timestamp(1720071000000)));
    }

    SECTION("Everything else is text") {
        auto parsed = report::parse_assignment("intensity=Major");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap().first == "intensity");
        REQUIRE(parsed.unwrap().second == FieldValue(std::string("Major")));
    }

    SECTION("An empty value clears the field") {
        REQUIRE(std::holds_alternative<std::monostate>(parse_value("notes=")));
    }
}

TEST_CASE("Bad report assignments are rejected", "[unit][report]") {
    for (const auto* text : {"no equals sign", "=value", "location=30.6954", "location=abc,def",
                             "location=95,10", "environment=water_temp", "environment=temp:warm",
                             "timestamp=yesterday"}) {
        INFO(text);
        auto parsed = report::parse_assignment(text);
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().code == ErrorCode::InvalidArguments);
    }
}

TEST_CASE("Report values render the way they are typed", "[unit][report]") {
    REQUIRE(report::format_value(TagSet{"shrimp", "blue crab"}) == "blue crab,shrimp");
    REQUIRE(report::format_value(GeoPoint{30.6954, -88.0399}) == "30.6954,-88.0399");
    REQUIRE(report::format_value(MeasurementMap{{"salinity", 12.0}, {"water_temp", 28.5}}) ==
            "salinity:12,water_temp:28.5");
    REQUIRE(report::format_value(Timestamp(1720071000000)) == "2024-07-04T05:30:00.000Z");
    REQUIRE(report::format_value(std::string("Minor")) == "Minor");
    REQUIRE(report::format_value(std::monostate{}).empty());
}

TEST_CASE("Report field kinds", "[unit][report]") {
    REQUIRE(report::field_kind(report::kSpecies) == FieldKind::Tags);
    REQUIRE(report::field_kind(report::kLocation) == FieldKind::Geo);
    REQUIRE(report::field_kind(report::kEnvironment) == FieldKind::Measurements);
    REQUIRE(report::field_kind(report::kTimestamp) == FieldKind::Instant);
    REQUIRE(report::field_kind(report::kVerificationStatus) == FieldKind::Text);
    REQUIRE(report::field_kind("anything_else") == FieldKind::Text);
}
