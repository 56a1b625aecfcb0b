#include <catch2/catch_test_macros.hpp>
#include "sync/conflict_resolver.hpp"

using namespace tidesync;
using namespace tidesync::sync;

namespace {

// Same entity edited on two devices: local at T1, remote at T2.
struct Versions {
    Entity base;
    Entity local;
    Entity remote;
};

Versions diverged(Timestamp t1, Timestamp t2) {
    auto base = make_entity("report", Timestamp(100));
    base.set_field("intensity", std::string("Minor"), Timestamp(100));
    base.set_field("notes", std::string("initial"), Timestamp(100));
    base.record_id = base.uuid.to_string();
    base.change_tag = "tag-1";

    auto local = base;
    auto remote = base;
    remote.change_tag = "tag-2";
    local.last_modified = t1;
    remote.last_modified = t2;
    return {base, local, remote};
}

ConflictResolver resolver_for(ResolutionStrategy strategy) {
    return ConflictResolver(strategy, [] { return Timestamp(9999); });
}

} // namespace

TEST_CASE("Most recent picks the newer side", "[unit][resolver]") {
    auto resolver = resolver_for(ResolutionStrategy::MostRecent);

    SECTION("Minor at T1 vs Major at T2 > T1 uses the remote") {
        auto v = diverged(Timestamp(1000), Timestamp(2000));
        v.local.set_field("intensity", std::string("Minor"), Timestamp(1000));
        v.remote.set_field("intensity", std::string("Major"), Timestamp(2000));

        auto resolution = resolver.resolve(v.local, v.remote);
        REQUIRE(resolution.is_ok());
        REQUIRE(resolution.unwrap().kind == Resolution::Kind::UseRemote);
        REQUIRE(resolution.unwrap().description() == "use_remote");
        REQUIRE_FALSE(resolution.unwrap().merged.has_value());
    }

    SECTION("Newer local uses the local") {
        auto v = diverged(Timestamp(3000), Timestamp(2000));
        REQUIRE(resolver.resolve(v.local, v.remote).unwrap().kind == Resolution::Kind::UseLocal);
    }

    SECTION("A tie goes to the server copy") {
        auto v = diverged(Timestamp(2000), Timestamp(2000));
        REQUIRE(resolver.resolve(v.local, v.remote).unwrap().kind == Resolution::Kind::UseRemote);
    }
}

TEST_CASE("Fixed strategies", "[unit][resolver]") {
    auto v = diverged(Timestamp(1000), Timestamp(2000));

    REQUIRE(resolver_for(ResolutionStrategy::ServerWins).resolve(v.local, v.remote).unwrap().kind ==
            Resolution::Kind::UseRemote);
    REQUIRE(resolver_for(ResolutionStrategy::ClientWins).resolve(v.local, v.remote).unwrap().kind ==
            Resolution::Kind::UseLocal);
    REQUIRE(resolver_for(ResolutionStrategy::Manual).resolve(v.local, v.remote).unwrap().kind ==
            Resolution::Kind::Manual);
}

TEST_CASE("Field-level merge keeps both sides' edits", "[unit][resolver]") {
    auto resolver = resolver_for(ResolutionStrategy::FieldLevelMerge);
    auto v = diverged(Timestamp(1000), Timestamp(2000));
    v.local.set_field("notes", std::string("local note"), Timestamp(1500));
    v.remote.set_field("intensity", std::string("Major"), Timestamp(2000));
    v.remote.set_field("species", TagSet{"shrimp"}, Timestamp(2000));

    auto resolution = resolver.resolve(v.local, v.remote).unwrap();
    REQUIRE(resolution.kind == Resolution::Kind::Merge);
    REQUIRE(resolution.merged.has_value());

    const auto& merged = *resolution.merged;
    REQUIRE(*merged.field("notes") == FieldValue(std::string("local note")));
    REQUIRE(*merged.field("intensity") == FieldValue(std::string("Major")));
    REQUIRE(*merged.field("species") == FieldValue(TagSet{"shrimp"}));
    REQUIRE(merged.change_tag == v.remote.change_tag);
    REQUIRE(merged.uuid == v.local.uuid);
    REQUIRE(merged.last_modified == Timestamp(2000));

    SECTION("The newer stamp wins a field edited on both sides") {
        v.local.set_field("intensity", std::string("Severe"), Timestamp(2500));
        auto again = resolver.resolve(v.local, v.remote).unwrap();
        REQUIRE(*again.merged->field("intensity") == FieldValue(std::string("Severe")));
        REQUIRE(again.merged->field_stamp("intensity") == Timestamp(2500));
    }

    SECTION("A stamped removal beats an older value") {
        v.local.set_field("notes", std::monostate{}, Timestamp(2600));
        auto again = resolver.resolve(v.local, v.remote).unwrap();
        REQUIRE(again.merged->field("notes") == nullptr);
    }

    SECTION("Instants take the later one") {
        v.local.set_field("timestamp", Timestamp(50000), Timestamp(1000));
        v.remote.set_field("timestamp", Timestamp(40000), Timestamp(2000));
        auto again = resolver.resolve(v.local, v.remote).unwrap();
        REQUIRE(*again.merged->field("timestamp") == FieldValue(Timestamp(50000)));
    }
}

TEST_CASE("Three-way merge uses the common ancestor", "[unit][resolver]") {
    auto resolver = resolver_for(ResolutionStrategy::ThreeWayMerge);
    auto v = diverged(Timestamp(1000), Timestamp(2000));
    v.local.set_field("notes", std::string("local note"), Timestamp(1000));
    v.remote.set_field("intensity", std::string("Major"), Timestamp(2000));

    auto resolution = resolver.resolve(v.local, v.remote, &v.base).unwrap();
    REQUIRE(resolution.kind == Resolution::Kind::Merge);
    REQUIRE(resolution.unresolved_fields.empty());
    const auto& merged = *resolution.merged;
    REQUIRE(*merged.field("notes") == FieldValue(std::string("local note")));
    REQUIRE(*merged.field("intensity") == FieldValue(std::string("Major")));
    REQUIRE(merged.change_tag == std::optional<std::string>("tag-2"));
    REQUIRE(merged.last_modified == Timestamp(9999));

    SECTION("Both sides changing a field to different values keeps the base") {
        v.local.set_field("intensity", std::string("Severe"), Timestamp(1000));
        auto clash = resolver.resolve(v.local, v.remote, &v.base).unwrap();
        REQUIRE(clash.unresolved_fields == std::vector<std::string>{"intensity"});
        REQUIRE(*clash.merged->field("intensity") == FieldValue(std::string("Minor")));
    }

    SECTION("Without a base the local copy stands in for it") {
        auto approx = resolver.resolve(v.local, v.remote).unwrap();
        // Every local value looks unchanged, so the remote wins each difference.
        REQUIRE(*approx.merged->field("intensity") == FieldValue(std::string("Major")));
        REQUIRE(*approx.merged->field("notes") == FieldValue(std::string("initial")));
    }
}

TEST_CASE("Three-way merge treats locations within tolerance as unchanged", "[unit][resolver]") {
    auto resolver = resolver_for(ResolutionStrategy::ThreeWayMerge);
    auto v = diverged(Timestamp(3000), Timestamp(2000));
    v.base.set_field("location", GeoPoint{30.6954, -88.0399}, Timestamp(100));
    v.local.set_field("location", GeoPoint{30.69541, -88.03991}, Timestamp(3000));
    v.remote.set_field("location", GeoPoint{30.7000, -88.0500}, Timestamp(2000));

    auto resolution = resolver.resolve(v.local, v.remote, &v.base).unwrap();
    REQUIRE(resolution.unresolved_fields.empty());
    REQUIRE(*resolution.merged->field("location") == FieldValue(GeoPoint{30.7000, -88.0500}));

    SECTION("Real moves on both sides keep the newer entity's location") {
        v.local.set_field("location", GeoPoint{30.6000, -88.1000}, Timestamp(3000));
        auto clash = resolver.resolve(v.local, v.remote, &v.base).unwrap();
        REQUIRE(clash.unresolved_fields.empty());
        REQUIRE(*clash.merged->field("location") == FieldValue(GeoPoint{30.6000, -88.1000}));
    }
}

TEST_CASE("Resolver refuses mismatched inputs", "[unit][resolver]") {
    auto resolver = resolver_for(ResolutionStrategy::MostRecent);
    auto v = diverged(Timestamp(1000), Timestamp(2000));

    SECTION("Different entity types") {
        v.remote.entity_type = "sighting";
        auto result = resolver.resolve(v.local, v.remote);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidEntityType);
    }

    SECTION("Empty entity type") {
        v.local.entity_type.clear();
        v.remote.entity_type.clear();
        REQUIRE(resolver.resolve(v.local, v.remote).unwrap_err().code == ErrorCode::InvalidEntityType);
    }

    SECTION("Different entities") {
        v.remote.uuid = Uuid::generate();
        REQUIRE(resolver.resolve(v.local, v.remote).unwrap_err().code == ErrorCode::InvalidArguments);
    }
}

TEST_CASE("Strategy ids", "[unit][resolver]") {
    for (auto strategy : {ResolutionStrategy::ServerWins, ResolutionStrategy::ClientWins,
                          ResolutionStrategy::MostRecent, ResolutionStrategy::FieldLevelMerge,
                          ResolutionStrategy::ThreeWayMerge, ResolutionStrategy::Manual}) {
        REQUIRE(parse_strategy(to_string(strategy)) == strategy);
    }
    REQUIRE(to_string(ResolutionStrategy::FieldLevelMerge) == "field_level_merge");
    REQUIRE_FALSE(parse_strategy("newest").has_value());
}
