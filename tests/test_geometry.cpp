#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include "geofence_service/geometry.hpp"
#include "zone_fixtures.hpp"

using namespace geofence_service;
using geofence_service::test::k_downtown_center;
using geofence_service::test::make_circle;
using geofence_service::test::make_depot_rectangle;
using geofence_service::test::make_polygon;

TEST_CASE("Circle contains its center and rejects far positions") {
    const Zone downtown = make_circle("downtown", k_downtown_center, 500.0);

    REQUIRE(contains(downtown, k_downtown_center));
    REQUIRE(contains(downtown, Position{18.5224, 73.8567}));
    REQUIRE_FALSE(contains(downtown, Position{18.6104, 73.8567}));
}

TEST_CASE("Circle boundary is inclusive") {
    const Position on_boundary{k_downtown_center.latitude_deg + 0.001, k_downtown_center.longitude_deg};
    const double radius_m = planar_distance_m(k_downtown_center, on_boundary);
    const Zone zone = make_circle("edge", k_downtown_center, radius_m);

    REQUIRE(contains(zone, on_boundary));

    const Zone shrunk = make_circle("shrunk", k_downtown_center, std::nextafter(radius_m, 0.0));
    REQUIRE_FALSE(contains(shrunk, on_boundary));
}

TEST_CASE("Planar distance approximates metres near Pune") {
    const Position ten_km_north{k_downtown_center.latitude_deg + 0.09, k_downtown_center.longitude_deg};
    REQUIRE(planar_distance_m(k_downtown_center, ten_km_north) == Approx(10'001.88).margin(0.5));

    const Position one_km_east{k_downtown_center.latitude_deg, k_downtown_center.longitude_deg + 0.0094764};
    REQUIRE(planar_distance_m(k_downtown_center, one_km_east) == Approx(1'000.0).margin(1.0));
}

TEST_CASE("Polygon contains interior points and rejects exterior points") {
    const Zone depot = make_depot_rectangle();

    REQUIRE(contains(depot, Position{18.5315, 73.8495}));
    REQUIRE_FALSE(contains(depot, Position{18.5350, 73.8495}));
    REQUIRE_FALSE(contains(depot, Position{18.5315, 73.8540}));
    REQUIRE_FALSE(contains(depot, k_downtown_center));
}

TEST_CASE("Polygon edges and vertices count as inside") {
    const Zone depot = make_depot_rectangle();

    SECTION("southern edge") {
        REQUIRE(contains(depot, Position{18.5290, 73.8500}));
    }
    SECTION("eastern edge") {
        REQUIRE(contains(depot, Position{18.5315, 73.8530}));
    }
    SECTION("vertex") {
        REQUIRE(contains(depot, Position{18.5340, 73.8530}));
        REQUIRE(contains(depot, Position{18.5290, 73.8460}));
    }
}

TEST_CASE("Concave polygon excludes its notch") {
    // L-shape: the north-east quadrant is cut away.
    const Zone l_shape = make_polygon("l-shape", {
        Position{0.00, 0.00},
        Position{0.00, 0.02},
        Position{0.01, 0.02},
        Position{0.01, 0.01},
        Position{0.02, 0.01},
        Position{0.02, 0.00},
    });

    REQUIRE(contains(l_shape, Position{0.005, 0.015}));
    REQUIRE(contains(l_shape, Position{0.015, 0.005}));
    REQUIRE_FALSE(contains(l_shape, Position{0.015, 0.015}));
}

TEST_CASE("Degenerate geometry never contains anything") {
    SECTION("two distinct vertices") {
        const Zone sliver = make_polygon("sliver", {
            Position{0.0, 0.0},
            Position{0.0, 0.01},
            Position{0.0, 0.0},
        });
        REQUIRE(count_distinct_vertices(sliver.ring) == 2);
        REQUIRE_FALSE(contains(sliver, Position{0.0, 0.005}));
    }
    SECTION("empty ring") {
        const Zone empty = make_polygon("empty", {});
        REQUIRE_FALSE(contains(empty, Position{0.0, 0.0}));
    }
    SECTION("zero radius") {
        const Zone point = make_circle("point", k_downtown_center, 0.0);
        REQUIRE_FALSE(contains(point, k_downtown_center));
    }
    SECTION("non-finite radius") {
        const Zone broken = make_circle("nan", k_downtown_center, std::numeric_limits<double>::quiet_NaN());
        REQUIRE_FALSE(contains(broken, k_downtown_center));
    }
}

TEST_CASE("Out-of-range positions are never contained") {
    const Zone downtown = make_circle("downtown", k_downtown_center, 500.0);

    REQUIRE_FALSE(is_valid_position(Position{91.0, 0.0}));
    REQUIRE_FALSE(is_valid_position(Position{0.0, -180.5}));
    REQUIRE_FALSE(is_valid_position(Position{std::numeric_limits<double>::infinity(), 0.0}));
    REQUIRE(is_valid_position(Position{-90.0, 180.0}));
    REQUIRE_FALSE(contains(downtown, Position{k_downtown_center.latitude_deg, 200.0}));
}

TEST_CASE("zones_containing reports overlapping zones in registry order") {
    const std::vector<Zone> zones{
        make_circle("outer", k_downtown_center, 2'000.0),
        make_depot_rectangle(),
        make_circle("inner", k_downtown_center, 100.0),
    };

    const std::vector<std::string> ids = zones_containing(zones, k_downtown_center);
    REQUIRE(ids == std::vector<std::string>{"outer", "inner"});
}
