#include "geometry/geometry_factory.hpp"

namespace geocodec {
namespace geometry {

GeometryFactory::GeometryFactory(int srid)
    : srid_(srid) {
}

LinearRing GeometryFactory::createLinearRing(std::vector<Coordinate> coordinates) const {
    if (!coordinates.empty() && !bg::equals(coordinates.front(), coordinates.back())) {
        throw InvalidGeometry("Points of LinearRing do not form a closed linestring");
    }

    if (!coordinates.empty() && coordinates.size() < 4) {
        throw InvalidGeometry("Invalid number of points in LinearRing (found " +
                              std::to_string(coordinates.size()) + " - must be 0 or >= 4)");
    }

    return LinearRing(coordinates.begin(), coordinates.end());
}

LineString GeometryFactory::assembleLineString(std::vector<Coordinate> coordinates) const {
    if (coordinates.size() == 1) {
        throw InvalidGeometry("Invalid number of points in LineString (found 1 - must be 0 or >= 2)");
    }
    return LineString(coordinates.begin(), coordinates.end());
}

Polygon GeometryFactory::assemblePolygon(LinearRing shell, std::vector<LinearRing> holes) const {
    Polygon polygon;

    if (shell.empty()) {
        for (const auto& hole : holes) {
            if (!hole.empty()) {
                throw InvalidGeometry("shell is empty but holes are not");
            }
        }
        return polygon;
    }

    polygon.outer() = std::move(shell);
    for (auto& hole : holes) {
        polygon.inners().push_back(std::move(hole));
    }
    return polygon;
}

Geometry GeometryFactory::createPoint(std::optional<Coordinate> coordinate) const {
    Point point;
    point.coordinate = coordinate;
    return Geometry(std::move(point), srid_);
}

Geometry GeometryFactory::createLineString(std::vector<Coordinate> coordinates) const {
    return Geometry(assembleLineString(std::move(coordinates)), srid_);
}

Geometry GeometryFactory::createPolygon(Polygon polygon) const {
    return Geometry(std::move(polygon), srid_);
}

Geometry GeometryFactory::createPolygon(LinearRing shell, std::vector<LinearRing> holes) const {
    return createPolygon(assemblePolygon(std::move(shell), std::move(holes)));
}

Geometry GeometryFactory::createMultiPoint(std::vector<Coordinate> coordinates) const {
    return Geometry(MultiPoint(coordinates.begin(), coordinates.end()), srid_);
}

Geometry GeometryFactory::createMultiLineString(std::vector<LineString> lineStrings) const {
    MultiLineString multi;
    multi.reserve(lineStrings.size());
    for (auto& line : lineStrings) {
        multi.push_back(std::move(line));
    }
    return Geometry(std::move(multi), srid_);
}

Geometry GeometryFactory::createMultiPolygon(std::vector<Polygon> polygons) const {
    MultiPolygon multi;
    multi.reserve(polygons.size());
    for (auto& polygon : polygons) {
        multi.push_back(std::move(polygon));
    }
    return Geometry(std::move(multi), srid_);
}

Geometry GeometryFactory::createGeometryCollection(std::vector<Geometry> geometries) const {
    GeometryCollection collection;
    collection.geometries = std::move(geometries);
    return Geometry(std::move(collection), srid_);
}

} // namespace geometry
} // namespace geocodec
