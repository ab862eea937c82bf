#include <catch2/catch.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include "codec/codec_error.hpp"
#include "codec/coordinate_codec.hpp"

using namespace geocodec::codec;
using geocodec::geometry::Coordinate;

TEST_CASE("CoordinateCodec precision", "[coordinate_codec]") {
    SECTION("Two decimal places") {
        CoordinateCodec codec(2);
        REQUIRE(codec.encode(Coordinate(1.123456789, 2.0)).dump() == "[1.12,2]");
    }

    SECTION("Zero decimal places") {
        CoordinateCodec codec(0);
        REQUIRE(codec.encode(Coordinate(1.123456789, 2.0)).dump() == "[1,2]");
    }

    SECTION("Default of eight decimal places") {
        CoordinateCodec codec;
        REQUIRE(codec.getDecimalPlaces() == 8);
        REQUIRE(codec.encode(Coordinate(1.123456789, -0.5)).dump() == "[1.12345679,-0.5]");
    }

    SECTION("Integral values are integer tokens") {
        CoordinateCodec codec(3);
        Json position = codec.encode(Coordinate(100.0, -7.0004));
        REQUIRE(position[0].is_number_integer());
        REQUIRE(position[1].is_number_integer());
        REQUIRE(position.dump() == "[100,-7]");
    }

    SECTION("Negative precision") {
        REQUIRE_THROWS_AS(CoordinateCodec(-1), InvalidConfiguration);
        REQUIRE_THROWS_WITH(CoordinateCodec(-1), "decimalPlaces < 0");
    }
}

TEST_CASE("CoordinateCodec rounding", "[coordinate_codec]") {
    SECTION("Half up") {
        CoordinateCodec codec(0);
        REQUIRE(codec.round(2.5) == 3.0);
        REQUIRE(codec.round(2.4999) == 2.0);
        REQUIRE(codec.round(0.5) == 1.0);
    }

    SECTION("Half away from zero for negative values") {
        CoordinateCodec codec(0);
        REQUIRE(codec.round(-2.5) == -3.0);
        REQUIRE(codec.round(-2.4) == -2.0);
    }

    SECTION("Fraction digits") {
        CoordinateCodec codec(2);
        REQUIRE(codec.round(0.125) == Approx(0.13));
        REQUIRE(codec.round(-73.98765) == Approx(-73.99));
    }

    SECTION("Decimal ties not representable in binary") {
        CoordinateCodec codec(2);
        REQUIRE(codec.round(1.115) == Approx(1.11));
        REQUIRE(codec.round(2.675) == Approx(2.67));
        REQUIRE(codec.round(-2.675) == Approx(-2.67));
        REQUIRE(codec.encode(Coordinate(1.115, 2.675)).dump() == "[1.11,2.67]");
    }

    SECTION("Values without room for fraction digits are unchanged") {
        CoordinateCodec codec(8);
        REQUIRE(codec.round(1.0e20) == 1.0e20);
        REQUIRE(std::isnan(codec.round(std::numeric_limits<double>::quiet_NaN())));
    }
}

TEST_CASE("CoordinateCodec z ordinate", "[coordinate_codec]") {
    CoordinateCodec codec;

    SECTION("NaN z is omitted") {
        Json position = codec.encode(Coordinate(1.0, 2.0, std::numeric_limits<double>::quiet_NaN()));
        REQUIRE(position.size() == 2);
    }

    SECTION("Infinite z is omitted") {
        Json position = codec.encode(Coordinate(1.0, 2.0, -std::numeric_limits<double>::infinity()));
        REQUIRE(position.size() == 2);
    }

    SECTION("Finite z is written") {
        Json position = codec.encode(Coordinate(1.0, 2.0, 3.5));
        REQUIRE(position.size() == 3);
        REQUIRE(position.dump() == "[1,2,3.5]");
    }
}

TEST_CASE("CoordinateCodec decoding", "[coordinate_codec]") {
    CoordinateCodec codec;

    SECTION("2D array") {
        Coordinate c = codec.decode(Json::parse("[1.5, -2]"));
        REQUIRE(c.x == 1.5);
        REQUIRE(c.y == -2.0);
        REQUIRE_FALSE(c.hasZ());
    }

    SECTION("3D array") {
        Coordinate c = codec.decode(Json::parse("[1, 2, 3]"));
        REQUIRE(c.hasZ());
        REQUIRE(c.z == 3.0);
    }

    SECTION("Extra ordinates are ignored silently") {
        std::ostringstream captured;
        std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
        Coordinate c = codec.decode(Json::parse("[1, 2, 3, 4]"));
        std::cerr.rdbuf(previous);

        REQUIRE(c.x == 1.0);
        REQUIRE(c.z == 3.0);
        REQUIRE(captured.str().empty());
    }

    SECTION("Object form") {
        Coordinate c = codec.decode(Json::parse(R"({"x": 10, "y": 20})"));
        REQUIRE(c.x == 10.0);
        REQUIRE(c.y == 20.0);
        REQUIRE_FALSE(c.hasZ());

        Coordinate raised = codec.decode(Json::parse(R"({"x": 10, "y": 20, "z": 30})"));
        REQUIRE(raised.z == 30.0);
    }

    SECTION("Too few ordinates") {
        REQUIRE_THROWS_AS(codec.decode(Json::parse("[1]")), MalformedCoordinates);
        REQUIRE_THROWS_WITH(codec.decode(Json::parse("[1]")), "Invalid number of ordinates: 1");
        REQUIRE_THROWS_WITH(codec.decode(Json::parse("[]")), "Invalid number of ordinates: 0");
    }

    SECTION("Non-numeric ordinates name the node kind") {
        REQUIRE_THROWS_WITH(codec.decode(Json::parse("[[1, 2], [3, 4]]")),
                            "Invalid coordinates, expecting numbers but got: ARRAY");
        REQUIRE_THROWS_WITH(codec.decode(Json::parse(R"([1, "2"])")),
                            "Invalid coordinates, expecting numbers but got: STRING");
        REQUIRE_THROWS_WITH(codec.decode(Json::parse("[1, 2, null]")),
                            "Invalid coordinates, expecting numbers but got: NULL");
        REQUIRE_THROWS_WITH(codec.decode(Json::parse(R"({"x": 1})")),
                            "Invalid coordinates, expecting numbers but got: MISSING");
        REQUIRE_THROWS_WITH(codec.decode(Json::parse(R"({"x": 1, "y": true})")),
                            "Invalid coordinates, expecting numbers but got: BOOLEAN");
    }

    SECTION("Unknown container") {
        REQUIRE_THROWS_AS(codec.decode(Json::parse("\"1,2\"")), MalformedCoordinates);
        REQUIRE_THROWS_WITH(codec.decode(Json::parse("42")), "Unknown coordinates format: 42");
    }
}
