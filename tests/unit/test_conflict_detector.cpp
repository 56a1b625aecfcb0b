#include <catch2/catch_test_macros.hpp>
#include "sync/conflict_detector.hpp"

using namespace tidesync;
using namespace tidesync::sync;

namespace {

std::pair<Entity, Entity> pair_of(const std::string& name, FieldValue local, FieldValue remote) {
    auto a = make_entity("report", Timestamp(1000));
    auto b = a;
    a.set_field(name, std::move(local), Timestamp(1000));
    b.set_field(name, std::move(remote), Timestamp(2000));
    return {a, b};
}

bool conflicts(const std::pair<Entity, Entity>& versions) {
    ConflictDetector detector;
    auto report = detector.detect(versions.first, versions.second);
    REQUIRE(report.is_ok());
    return report.unwrap().has_conflict;
}

} // namespace

TEST_CASE("Coordinates within ten metres do not conflict", "[unit][detector]") {
    // local (30.6954, -88.0399) vs remote (30.69545, -88.03991)
    REQUIRE_FALSE(conflicts(pair_of("location", GeoPoint{30.6954, -88.0399}, GeoPoint{30.69545, -88.03991})));
    REQUIRE(conflicts(pair_of("location", GeoPoint{30.6954, -88.0399}, GeoPoint{30.6956, -88.0399})));
    REQUIRE(conflicts(pair_of("location", GeoPoint{30.6954, -88.0399}, GeoPoint{30.6954, -88.0401})));
}

TEST_CASE("Instants within sixty seconds do not conflict", "[unit][detector]") {
    const Timestamp t(1720071000000);
    REQUIRE_FALSE(conflicts(pair_of("timestamp", t, t + std::chrono::seconds(59))));
    REQUIRE_FALSE(conflicts(pair_of("timestamp", t, t - std::chrono::seconds(60))));
    REQUIRE(conflicts(pair_of("timestamp", t, t + std::chrono::seconds(61))));

    SECTION("An instant missing on one side is not a conflict") {
        auto versions = pair_of("timestamp", t, t);
        versions.second.fields.erase("timestamp");
        REQUIRE_FALSE(conflicts(versions));
    }
}

TEST_CASE("Categorical, text and tag fields must be equal", "[unit][detector]") {
    REQUIRE(conflicts(pair_of("intensity", std::string("Minor"), std::string("Major"))));
    REQUIRE_FALSE(conflicts(pair_of("intensity", std::string("Minor"), std::string("Minor"))));
    REQUIRE(conflicts(pair_of("species", TagSet{"shrimp"}, TagSet{"shrimp", "blue crab"})));
    REQUIRE_FALSE(conflicts(pair_of("species", TagSet{"shrimp", "blue crab"}, TagSet{"blue crab", "shrimp"})));
}

TEST_CASE("Measurements compare key by key", "[unit][detector]") {
    REQUIRE_FALSE(conflicts(pair_of("environment", MeasurementMap{{"salinity", 12.0}},
                                    MeasurementMap{{"salinity", 12.0}})));
    REQUIRE(conflicts(pair_of("environment", MeasurementMap{{"salinity", 12.0}},
                              MeasurementMap{{"salinity", 14.0}})));
    REQUIRE(conflicts(pair_of("environment", MeasurementMap{{"salinity", 12.0}},
                              MeasurementMap{{"salinity", 12.0}, {"water_temp", 28.5}})));
}

TEST_CASE("Kind mismatches and one-sided fields conflict", "[unit][detector]") {
    REQUIRE(conflicts(pair_of("notes", std::string("12"), 12.0)));

    auto versions = pair_of("notes", std::string("tide"), std::string("tide"));
    versions.second.fields.erase("notes");
    REQUIRE(conflicts(versions));
}

TEST_CASE("The report names the disagreeing fields", "[unit][detector]") {
    auto local = make_entity("report", Timestamp(1000));
    local.set_field("intensity", std::string("Minor"), Timestamp(1000));
    local.set_field("notes", std::string("same"), Timestamp(1000));
    local.set_field("species", TagSet{"shrimp"}, Timestamp(1000));
    auto remote = local;
    remote.set_field("intensity", std::string("Major"), Timestamp(2000));
    remote.set_field("species", TagSet{"flounder"}, Timestamp(2000));
    // Sync metadata never counts.
    remote.change_tag = "tag-2";
    remote.sync_status = SyncStatus::Synced;

    ConflictDetector detector;
    auto report = detector.detect(local, remote).unwrap();
    REQUIRE(report.has_conflict);
    REQUIRE(report.conflicting_fields == std::vector<std::string>{"intensity", "species"});

    auto same = detector.detect(local, local).unwrap();
    REQUIRE_FALSE(same.has_conflict);
    REQUIRE(same.conflicting_fields.empty());
}

TEST_CASE("Different entities cannot be compared", "[unit][detector]") {
    ConflictDetector detector;
    auto result = detector.detect(make_entity("report"), make_entity("report"));
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == ErrorCode::InvalidArguments);
}

TEST_CASE("Tolerances are configurable", "[unit][detector]") {
    ConflictDetector strict(DetectionTolerances{.coordinate_degrees = 0.00001, .instant = std::chrono::seconds(1)});
    REQUIRE(strict.values_conflict(GeoPoint{30.6954, -88.0399}, GeoPoint{30.69545, -88.03991}));
    REQUIRE(strict.values_conflict(Timestamp(0), Timestamp(2000)));
}
