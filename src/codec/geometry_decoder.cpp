#include "codec/geometry_decoder.hpp"
#include "codec/codec_error.hpp"

namespace geocodec {
namespace codec {

using geometry::Coordinate;
using geometry::Geometry;
using geometry::GeometryKind;

GeometryDecoder::GeometryDecoder(const geometry::GeometryFactory& factory, std::size_t max_nesting_depth)
    : factory_(factory), coordinate_codec_(), max_nesting_depth_(max_nesting_depth) {
}

std::optional<Geometry> GeometryDecoder::decode(const Json& node) const {
    if (node.is_null()) {
        return std::nullopt;
    }
    return decodeGeometry(node, 0);
}

Geometry GeometryDecoder::decodeGeometry(const Json& node, std::size_t depth) const {
    if (!node.is_object()) {
        throw MalformedGeometry("Invalid geometry, expecting an object but got: " + nodeTypeName(node));
    }

    const Json* type_node = findField(node, fields::TYPE);
    if (!type_node || !type_node->is_string()) {
        throw UnknownGeometryType("Invalid geometry type, expecting a string but got: " + nodeTypeName(type_node));
    }

    const std::string type_name = type_node->get<std::string>();
    std::optional<GeometryKind> kind = geometry::geometryKindFromString(type_name);
    if (!kind) {
        throw UnknownGeometryType("Invalid geometry type: " + type_name);
    }

    switch (*kind) {
        case GeometryKind::POINT:
            return decodePoint(node);
        case GeometryKind::LINE_STRING:
            return decodeLineString(node);
        case GeometryKind::POLYGON:
            return decodePolygon(node);
        case GeometryKind::MULTI_POINT:
            return decodeMultiPoint(node);
        case GeometryKind::MULTI_LINE_STRING:
            return decodeMultiLineString(node);
        case GeometryKind::MULTI_POLYGON:
            return decodeMultiPolygon(node);
        case GeometryKind::GEOMETRY_COLLECTION:
            return decodeGeometryCollection(node, depth);
    }

    throw UnknownGeometryType("Invalid geometry type: " + type_name);
}

Geometry GeometryDecoder::decodePoint(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);

    // An empty position is the encoding of the empty point
    if (coordinates.empty()) {
        return factory_.createPoint();
    }
    return factory_.createPoint(coordinate_codec_.decode(coordinates));
}

Geometry GeometryDecoder::decodeLineString(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);
    return factory_.createLineString(decodeCoordinateSequence(coordinates));
}

Geometry GeometryDecoder::decodePolygon(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);
    return factory_.createPolygon(decodeRings(coordinates));
}

Geometry GeometryDecoder::decodeMultiPoint(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);
    return factory_.createMultiPoint(decodeCoordinateSequence(coordinates));
}

Geometry GeometryDecoder::decodeMultiLineString(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);

    std::vector<geometry::LineString> lineStrings;
    lineStrings.reserve(coordinates.size());
    for (const auto& element : coordinates) {
        const Json& line = requireArrayElement(element);
        lineStrings.push_back(factory_.assembleLineString(decodeCoordinateSequence(line)));
    }
    return factory_.createMultiLineString(std::move(lineStrings));
}

Geometry GeometryDecoder::decodeMultiPolygon(const Json& node) const {
    const Json& coordinates = requireArray(node, fields::COORDINATES);

    std::vector<geometry::Polygon> polygons;
    polygons.reserve(coordinates.size());
    for (const auto& element : coordinates) {
        polygons.push_back(decodeRings(requireArrayElement(element)));
    }
    return factory_.createMultiPolygon(std::move(polygons));
}

Geometry GeometryDecoder::decodeGeometryCollection(const Json& node, std::size_t depth) const {
    const std::size_t nested_depth = depth + 1;
    if (max_nesting_depth_ != UNBOUNDED_DEPTH && nested_depth > max_nesting_depth_) {
        throw NestingDepthExceeded("GeometryCollection nesting exceeds maximum depth of " +
                                   std::to_string(max_nesting_depth_));
    }

    const Json& geometries = requireArray(node, fields::GEOMETRIES);

    std::vector<Geometry> children;
    children.reserve(geometries.size());
    for (const auto& element : geometries) {
        children.push_back(decodeGeometry(element, nested_depth));
    }
    return factory_.createGeometryCollection(std::move(children));
}

const Json& GeometryDecoder::requireArray(const Json& node, const char* name) const {
    const Json* member = findField(node, name);
    if (!member || !member->is_array()) {
        throw MalformedCoordinates("Invalid coordinates, expecting an array but got: " + nodeTypeName(member));
    }
    return *member;
}

const Json& GeometryDecoder::requireArrayElement(const Json& element) const {
    if (!element.is_array()) {
        throw MalformedCoordinates("Invalid coordinates, expecting an array but got: " + nodeTypeName(element));
    }
    return element;
}

std::vector<Coordinate> GeometryDecoder::decodeCoordinateSequence(const Json& array) const {
    std::vector<Coordinate> coordinates;
    coordinates.reserve(array.size());
    for (const auto& element : array) {
        coordinates.push_back(coordinate_codec_.decode(element));
    }
    return coordinates;
}

geometry::LinearRing GeometryDecoder::decodeLinearRing(const Json& array) const {
    return factory_.createLinearRing(decodeCoordinateSequence(requireArrayElement(array)));
}

geometry::Polygon GeometryDecoder::decodeRings(const Json& array) const {
    if (array.empty()) {
        return factory_.assemblePolygon(geometry::LinearRing());
    }

    // First ring is the shell, the rest are holes
    geometry::LinearRing shell = decodeLinearRing(array[0]);
    std::vector<geometry::LinearRing> holes;
    holes.reserve(array.size() - 1);
    for (std::size_t i = 1; i < array.size(); ++i) {
        holes.push_back(decodeLinearRing(array[i]));
    }
    return factory_.assemblePolygon(std::move(shell), std::move(holes));
}

} // namespace codec
} // namespace geocodec
