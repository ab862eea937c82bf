#include <catch2/catch.hpp>
#include <string>
#include "codec/codec_error.hpp"
#include "codec/geometry_decoder.hpp"
#include "geometry/geometry_factory.hpp"

using namespace geocodec::codec;
using namespace geocodec::geometry;

namespace {

Geometry decodeText(const GeometryDecoder& decoder, const std::string& text) {
    auto result = decoder.decode(Json::parse(text));
    REQUIRE(result.has_value());
    return *result;
}

} // namespace

TEST_CASE("GeometryDecoder per kind", "[geometry_decoder]") {
    GeometryDecoder decoder;

    SECTION("Point") {
        Geometry point = decodeText(decoder, R"({"type":"Point","coordinates":[100.0,0.5]})");
        REQUIRE(point.getKind() == GeometryKind::POINT);
        REQUIRE(point.as<Point>().coordinate->x == 100.0);
        REQUIRE(point.as<Point>().coordinate->y == 0.5);
        REQUIRE(point.getSRID() == 4326);
    }

    SECTION("Empty point") {
        Geometry point = decodeText(decoder, R"({"type":"Point","coordinates":[]})");
        REQUIRE(point.as<Point>().empty());
    }

    SECTION("LineString") {
        Geometry line = decodeText(decoder, R"({"type":"LineString","coordinates":[[100,0],[101,1,5]]})");
        const auto& coordinates = line.as<LineString>();
        REQUIRE(coordinates.size() == 2);
        REQUIRE_FALSE(coordinates[0].hasZ());
        REQUIRE(coordinates[1].z == 5.0);
    }

    SECTION("Polygon with a hole") {
        Geometry polygon = decodeText(decoder,
            R"({"type":"Polygon","coordinates":[[[0,0],[10,0],[10,10],[0,10],[0,0]],[[2,2],[4,2],[4,4],[2,2]]]})");
        const auto& value = polygon.as<Polygon>();
        REQUIRE(value.outer().size() == 5);
        REQUIRE(value.inners().size() == 1);
        REQUIRE(value.inners()[0][1].x == 4.0);
    }

    SECTION("Empty polygon") {
        Geometry polygon = decodeText(decoder, R"({"type":"Polygon","coordinates":[]})");
        REQUIRE(polygon.isEmpty());
    }

    SECTION("MultiPoint") {
        Geometry points = decodeText(decoder, R"({"type":"MultiPoint","coordinates":[[3,3],[1,1]]})");
        REQUIRE(points.as<MultiPoint>().size() == 2);
        REQUIRE(points.as<MultiPoint>()[0].x == 3.0);
    }

    SECTION("MultiLineString") {
        Geometry lines = decodeText(decoder,
            R"({"type":"MultiLineString","coordinates":[[[0,0],[1,1]],[[2,2],[3,3],[4,4]]]})");
        REQUIRE(lines.as<MultiLineString>().size() == 2);
        REQUIRE(lines.as<MultiLineString>()[1].size() == 3);
    }

    SECTION("MultiPolygon") {
        Geometry polygons = decodeText(decoder,
            R"({"type":"MultiPolygon","coordinates":[[[[0,0],[1,0],[1,1],[0,0]]],[[[5,5],[6,5],[6,6],[5,5]]]]})");
        REQUIRE(polygons.as<MultiPolygon>().size() == 2);
        REQUIRE(polygons.as<MultiPolygon>()[1].outer()[0].x == 5.0);
    }

    SECTION("Coordinate object form") {
        Geometry point = decodeText(decoder, R"({"type":"Point","coordinates":{"x":1,"y":2,"z":3}})");
        REQUIRE(point.as<Point>().coordinate->z == 3.0);
    }

    SECTION("Bounding box member is ignored") {
        Geometry line = decodeText(decoder, R"({"type":"LineString","bbox":[0,0,1,1],"coordinates":[[0,0],[1,1]]})");
        REQUIRE(line.as<LineString>().size() == 2);
    }
}

TEST_CASE("GeometryDecoder nested collections", "[geometry_decoder]") {
    GeometryDecoder decoder;
    const std::string text =
        R"({"type":"GeometryCollection","geometries":[{"type":"Point","coordinates":[1,2]},)"
        R"({"type":"GeometryCollection","geometries":[]}]})";

    SECTION("Unbounded by default") {
        Geometry collection = decodeText(decoder, text);
        const auto& children = collection.as<GeometryCollection>().geometries;
        REQUIRE(children.size() == 2);
        REQUIRE(children[0].getKind() == GeometryKind::POINT);
        REQUIRE(children[1].getKind() == GeometryKind::GEOMETRY_COLLECTION);
        REQUIRE(children[1].as<GeometryCollection>().geometries.empty());
        REQUIRE(decoder.getMaxNestingDepth() == GeometryDecoder::UNBOUNDED_DEPTH);
    }

    SECTION("Within the nesting bound") {
        GeometryDecoder bounded(GeometryFactory(), 2);
        REQUIRE(decodeText(bounded, text).as<GeometryCollection>().geometries.size() == 2);
    }

    SECTION("Beyond the nesting bound") {
        GeometryDecoder bounded(GeometryFactory(), 1);
        REQUIRE_THROWS_AS(bounded.decode(Json::parse(text)), NestingDepthExceeded);
        REQUIRE_THROWS_WITH(bounded.decode(Json::parse(text)),
                            "GeometryCollection nesting exceeds maximum depth of 1");
    }

    SECTION("Null children are malformed") {
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"GeometryCollection","geometries":[null]})")),
                            "Invalid geometry, expecting an object but got: NULL");
    }

    SECTION("Geometries must be an array") {
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"GeometryCollection","geometries":{}})")),
                            "Invalid coordinates, expecting an array but got: OBJECT");
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"GeometryCollection"})")),
                            "Invalid coordinates, expecting an array but got: MISSING");
    }
}

TEST_CASE("GeometryDecoder null input", "[geometry_decoder]") {
    GeometryDecoder decoder;
    REQUIRE_FALSE(decoder.decode(Json(nullptr)).has_value());
}

TEST_CASE("GeometryDecoder factory", "[geometry_decoder]") {
    GeometryDecoder decoder(GeometryFactory(3857));
    Geometry collection = decodeText(decoder,
        R"({"type":"GeometryCollection","geometries":[{"type":"Point","coordinates":[1,2]}]})");
    REQUIRE(collection.getSRID() == 3857);
    REQUIRE(collection.as<GeometryCollection>().geometries[0].getSRID() == 3857);
    REQUIRE(decoder.getGeometryFactory().getSRID() == 3857);
}

TEST_CASE("GeometryDecoder diagnostics", "[geometry_decoder]") {
    GeometryDecoder decoder;

    SECTION("Coordinates given as a string") {
        Json node = Json::parse(R"({"type":"Point","coordinates":"not-an-array"})");
        REQUIRE_THROWS_AS(decoder.decode(node), MalformedCoordinates);
        REQUIRE_THROWS_WITH(decoder.decode(node), Catch::StartsWith("Invalid coordinates, expecting an array but got: STRING"));
    }

    SECTION("Point given a sequence of positions") {
        Json node = Json::parse(R"({"type":"Point","coordinates":[[1,2],[3,4]]})");
        REQUIRE_THROWS_AS(decoder.decode(node), MalformedCoordinates);
        REQUIRE_THROWS_WITH(decoder.decode(node), Catch::StartsWith("Invalid coordinates, expecting numbers but got: ARRAY"));
    }

    SECTION("Missing coordinates") {
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"LineString"})")),
                            "Invalid coordinates, expecting an array but got: MISSING");
    }

    SECTION("Ring that is not an array") {
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"Polygon","coordinates":[5]})")),
                            "Invalid coordinates, expecting an array but got: NUMBER");
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"MultiLineString","coordinates":[{}]})")),
                            "Invalid coordinates, expecting an array but got: OBJECT");
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"MultiPolygon","coordinates":["x"]})")),
                            "Invalid coordinates, expecting an array but got: STRING");
    }

    SECTION("Short position") {
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"Point","coordinates":[1]})")),
                            "Invalid number of ordinates: 1");
    }

    SECTION("Unknown type") {
        Json node = Json::parse(R"({"type":"Blob","coordinates":[]})");
        REQUIRE_THROWS_AS(decoder.decode(node), UnknownGeometryType);
        REQUIRE_THROWS_WITH(decoder.decode(node), "Invalid geometry type: Blob");
    }

    SECTION("Missing or non-string type") {
        REQUIRE_THROWS_AS(decoder.decode(Json::parse(R"({"coordinates":[1,2]})")), UnknownGeometryType);
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"coordinates":[1,2]})")),
                            "Invalid geometry type, expecting a string but got: MISSING");
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":7,"coordinates":[1,2]})")),
                            "Invalid geometry type, expecting a string but got: NUMBER");
    }

    SECTION("Geometry that is not an object") {
        REQUIRE_THROWS_AS(decoder.decode(Json::parse("[1,2]")), MalformedGeometry);
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse("[1,2]")),
                            "Invalid geometry, expecting an object but got: ARRAY");
    }

    SECTION("Invalid rings are reported by the factory") {
        REQUIRE_THROWS_AS(decoder.decode(Json::parse(R"({"type":"Polygon","coordinates":[[[0,0],[1,0],[1,1],[0,1]]]})")),
                          InvalidGeometry);
        REQUIRE_THROWS_WITH(decoder.decode(Json::parse(R"({"type":"LineString","coordinates":[[0,0]]})")),
                            "Invalid number of points in LineString (found 1 - must be 0 or >= 2)");
    }
}
