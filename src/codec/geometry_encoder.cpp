#include "codec/geometry_encoder.hpp"
#include "codec/codec_error.hpp"
#include <type_traits>
#include <variant>

namespace geocodec {
namespace codec {

namespace bg = boost::geometry;

GeometryEncoder::GeometryEncoder(const BoundingBoxPolicy& policy, const CoordinateCodec& coordinate_codec)
    : policy_(policy), coordinate_codec_(coordinate_codec) {
}

Json GeometryEncoder::encode(const std::optional<geometry::Geometry>& geometry) const {
    if (!geometry) {
        return Json(nullptr);
    }
    return encode(*geometry);
}

Json GeometryEncoder::encode(const geometry::Geometry& geometry) const {
    if (!geometry.hasValue()) {
        throw UnsupportedGeometry("Geometry type <valueless> is not supported.");
    }

    Json object = encodeTypeAndBoundingBox(geometry);

    std::visit([&](const auto& payload) {
        using Payload = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<Payload, geometry::GeometryCollection>) {
            Json geometries = Json::array();
            for (const auto& child : payload.geometries) {
                geometries.push_back(encode(child));
            }
            object[fields::GEOMETRIES] = std::move(geometries);
        } else {
            object[fields::COORDINATES] = encodeCoordinates(payload);
        }
    }, geometry.value());

    return object;
}

Json GeometryEncoder::encodeTypeAndBoundingBox(const geometry::Geometry& geometry) const {
    Json object = Json::object();
    object[fields::TYPE] = geometry::toString(geometry.getKind());

    if (policy_.shouldIncludeBoundingBoxFor(geometry.getKind()) && !geometry.isEmpty()) {
        // Envelope values are written unrounded
        geometry::Box envelope = geometry.getEnvelope();
        Json bbox = Json::array();
        bbox.push_back(bg::get<bg::min_corner, 0>(envelope));
        bbox.push_back(bg::get<bg::min_corner, 1>(envelope));
        bbox.push_back(bg::get<bg::max_corner, 0>(envelope));
        bbox.push_back(bg::get<bg::max_corner, 1>(envelope));
        object[fields::BOUNDING_BOX] = std::move(bbox);
    }

    return object;
}

template <typename Range>
Json GeometryEncoder::encodeCoordinateSequence(const Range& coordinates) const {
    Json positions = Json::array();
    for (const auto& coordinate : coordinates) {
        positions.push_back(coordinate_codec_.encode(coordinate));
    }
    return positions;
}

Json GeometryEncoder::encodeCoordinates(const geometry::Point& point) const {
    if (point.empty()) {
        return Json::array();
    }
    return coordinate_codec_.encode(*point.coordinate);
}

Json GeometryEncoder::encodeCoordinates(const geometry::LineString& lineString) const {
    return encodeCoordinateSequence(lineString);
}

Json GeometryEncoder::encodeCoordinates(const geometry::Polygon& polygon) const {
    Json rings = Json::array();

    // Empty polygons have no rings at all
    if (polygon.outer().empty()) {
        return rings;
    }

    rings.push_back(encodeCoordinateSequence(polygon.outer()));
    for (const auto& inner : polygon.inners()) {
        rings.push_back(encodeCoordinateSequence(inner));
    }
    return rings;
}

Json GeometryEncoder::encodeCoordinates(const geometry::MultiPoint& multiPoint) const {
    return encodeCoordinateSequence(multiPoint);
}

Json GeometryEncoder::encodeCoordinates(const geometry::MultiLineString& multiLineString) const {
    Json lines = Json::array();
    for (const auto& lineString : multiLineString) {
        lines.push_back(encodeCoordinates(lineString));
    }
    return lines;
}

Json GeometryEncoder::encodeCoordinates(const geometry::MultiPolygon& multiPolygon) const {
    Json polygons = Json::array();
    for (const auto& polygon : multiPolygon) {
        polygons.push_back(encodeCoordinates(polygon));
    }
    return polygons;
}

} // namespace codec
} // namespace geocodec
