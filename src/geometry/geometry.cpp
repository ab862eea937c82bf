#include "geometry/geometry.hpp"
#include <algorithm>

namespace geocodec {
namespace geometry {

namespace {

// Coordinate sequence helpers shared by linestrings, rings and multi points
template <typename Range>
void expandByCoordinates(Box& box, const Range& coordinates) {
    for (const auto& coordinate : coordinates) {
        bg::expand(box, coordinate);
    }
}

// The shell bounds the polygon; holes never extend the envelope
void expandByPolygon(Box& box, const Polygon& polygon) {
    expandByCoordinates(box, polygon.outer());
}

bool ordinateEquals(double a, double b, double tolerance) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::isnan(a) && std::isnan(b);
    }
    return std::abs(a - b) <= tolerance;
}

bool coordinateEquals(const Coordinate& a, const Coordinate& b, double tolerance) {
    if (a.hasZ() != b.hasZ()) {
        return false;
    }
    if (!ordinateEquals(a.x, b.x, tolerance) || !ordinateEquals(a.y, b.y, tolerance)) {
        return false;
    }
    return !a.hasZ() || ordinateEquals(a.z, b.z, tolerance);
}

template <typename Range>
bool sequenceEquals(const Range& a, const Range& b, double tolerance) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!coordinateEquals(a[i], b[i], tolerance)) {
            return false;
        }
    }
    return true;
}

bool polygonEquals(const Polygon& a, const Polygon& b, double tolerance) {
    if (!sequenceEquals(a.outer(), b.outer(), tolerance) || a.inners().size() != b.inners().size()) {
        return false;
    }
    for (size_t i = 0; i < a.inners().size(); ++i) {
        if (!sequenceEquals(a.inners()[i], b.inners()[i], tolerance)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool Geometry::isEmpty() const {
    switch (getKind()) {
        case GeometryKind::POINT:
            return as<Point>().empty();
        case GeometryKind::LINE_STRING:
            return as<LineString>().empty();
        case GeometryKind::POLYGON:
            return as<Polygon>().outer().empty();
        case GeometryKind::MULTI_POINT:
            return as<MultiPoint>().empty();
        case GeometryKind::MULTI_LINE_STRING: {
            const auto& lines = as<MultiLineString>();
            return std::all_of(lines.begin(), lines.end(),
                               [](const LineString& line) { return line.empty(); });
        }
        case GeometryKind::MULTI_POLYGON: {
            const auto& polygons = as<MultiPolygon>();
            return std::all_of(polygons.begin(), polygons.end(),
                               [](const Polygon& polygon) { return polygon.outer().empty(); });
        }
        case GeometryKind::GEOMETRY_COLLECTION: {
            const auto& children = as<GeometryCollection>().geometries;
            return std::all_of(children.begin(), children.end(),
                               [](const Geometry& child) { return child.isEmpty(); });
        }
    }
    return true;
}

Box Geometry::getEnvelope() const {
    Box box;
    bg::assign_inverse(box);

    switch (getKind()) {
        case GeometryKind::POINT: {
            const auto& point = as<Point>();
            if (point.coordinate) {
                bg::expand(box, *point.coordinate);
            }
            break;
        }
        case GeometryKind::LINE_STRING:
            expandByCoordinates(box, as<LineString>());
            break;
        case GeometryKind::POLYGON:
            expandByPolygon(box, as<Polygon>());
            break;
        case GeometryKind::MULTI_POINT:
            expandByCoordinates(box, as<MultiPoint>());
            break;
        case GeometryKind::MULTI_LINE_STRING:
            for (const auto& line : as<MultiLineString>()) {
                expandByCoordinates(box, line);
            }
            break;
        case GeometryKind::MULTI_POLYGON:
            for (const auto& polygon : as<MultiPolygon>()) {
                expandByPolygon(box, polygon);
            }
            break;
        case GeometryKind::GEOMETRY_COLLECTION:
            for (const auto& child : as<GeometryCollection>().geometries) {
                if (!child.isEmpty()) {
                    bg::expand(box, child.getEnvelope());
                }
            }
            break;
    }

    return box;
}

bool Geometry::equalsExact(const Geometry& other, double tolerance) const {
    if (getKind() != other.getKind()) {
        return false;
    }

    switch (getKind()) {
        case GeometryKind::POINT: {
            const auto& a = as<Point>();
            const auto& b = other.as<Point>();
            if (a.empty() || b.empty()) {
                return a.empty() == b.empty();
            }
            return coordinateEquals(*a.coordinate, *b.coordinate, tolerance);
        }
        case GeometryKind::LINE_STRING:
            return sequenceEquals(as<LineString>(), other.as<LineString>(), tolerance);
        case GeometryKind::POLYGON:
            return polygonEquals(as<Polygon>(), other.as<Polygon>(), tolerance);
        case GeometryKind::MULTI_POINT:
            return sequenceEquals(as<MultiPoint>(), other.as<MultiPoint>(), tolerance);
        case GeometryKind::MULTI_LINE_STRING: {
            const auto& a = as<MultiLineString>();
            const auto& b = other.as<MultiLineString>();
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                if (!sequenceEquals(a[i], b[i], tolerance)) {
                    return false;
                }
            }
            return true;
        }
        case GeometryKind::MULTI_POLYGON: {
            const auto& a = as<MultiPolygon>();
            const auto& b = other.as<MultiPolygon>();
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                if (!polygonEquals(a[i], b[i], tolerance)) {
                    return false;
                }
            }
            return true;
        }
        case GeometryKind::GEOMETRY_COLLECTION: {
            const auto& a = as<GeometryCollection>().geometries;
            const auto& b = other.as<GeometryCollection>().geometries;
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                if (!a[i].equalsExact(b[i], tolerance)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

} // namespace geometry
} // namespace geocodec
