#include <catch2/catch.hpp>
#include <sstream>
#include "geometry/geometry_kind.hpp"

using namespace geocodec::geometry;

TEST_CASE("GeometryKind type tags", "[geometry_kind]") {
    SECTION("Canonical tags") {
        REQUIRE(std::string(toString(GeometryKind::POINT)) == "Point");
        REQUIRE(std::string(toString(GeometryKind::LINE_STRING)) == "LineString");
        REQUIRE(std::string(toString(GeometryKind::POLYGON)) == "Polygon");
        REQUIRE(std::string(toString(GeometryKind::MULTI_POINT)) == "MultiPoint");
        REQUIRE(std::string(toString(GeometryKind::MULTI_LINE_STRING)) == "MultiLineString");
        REQUIRE(std::string(toString(GeometryKind::MULTI_POLYGON)) == "MultiPolygon");
        REQUIRE(std::string(toString(GeometryKind::GEOMETRY_COLLECTION)) == "GeometryCollection");
    }

    SECTION("Lookup is the inverse of toString") {
        for (GeometryKind kind : ALL_GEOMETRY_KINDS) {
            auto found = geometryKindFromString(toString(kind));
            REQUIRE(found.has_value());
            REQUIRE(*found == kind);
        }
    }

    SECTION("Unknown and differently cased tags") {
        REQUIRE_FALSE(geometryKindFromString("Blob").has_value());
        REQUIRE_FALSE(geometryKindFromString("point").has_value());
        REQUIRE_FALSE(geometryKindFromString("").has_value());
    }

    SECTION("Stream output") {
        std::ostringstream os;
        os << GeometryKind::MULTI_POLYGON;
        REQUIRE(os.str() == "MultiPolygon");
    }
}

TEST_CASE("GeometryKind bit masks", "[geometry_kind]") {
    unsigned int combined = 0;
    for (GeometryKind kind : ALL_GEOMETRY_KINDS) {
        REQUIRE((combined & kindMask(kind)) == 0);
        combined |= kindMask(kind);
    }
    REQUIRE(combined == 0x7Fu);
    REQUIRE(kindMask(GeometryKind::POINT) == 1u);
    REQUIRE(kindMask(GeometryKind::GEOMETRY_COLLECTION) == 64u);
}

TEST_CASE("GeometryKind subtypes", "[geometry_kind]") {
    SECTION("Every kind is a subtype of itself") {
        for (GeometryKind kind : ALL_GEOMETRY_KINDS) {
            REQUIRE(isSubtypeOf(kind, kind));
        }
    }

    SECTION("Multi kinds are geometry collections") {
        REQUIRE(isSubtypeOf(GeometryKind::MULTI_POINT, GeometryKind::GEOMETRY_COLLECTION));
        REQUIRE(isSubtypeOf(GeometryKind::MULTI_LINE_STRING, GeometryKind::GEOMETRY_COLLECTION));
        REQUIRE(isSubtypeOf(GeometryKind::MULTI_POLYGON, GeometryKind::GEOMETRY_COLLECTION));
    }

    SECTION("Unrelated kinds") {
        REQUIRE_FALSE(isSubtypeOf(GeometryKind::POINT, GeometryKind::POLYGON));
        REQUIRE_FALSE(isSubtypeOf(GeometryKind::POINT, GeometryKind::GEOMETRY_COLLECTION));
        REQUIRE_FALSE(isSubtypeOf(GeometryKind::GEOMETRY_COLLECTION, GeometryKind::MULTI_POINT));
        REQUIRE_FALSE(isSubtypeOf(GeometryKind::POLYGON, GeometryKind::MULTI_POLYGON));
    }
}
