#include "geometry/geometry_kind.hpp"

namespace geocodec {
namespace geometry {

const char* toString(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::POINT:
            return "Point";
        case GeometryKind::LINE_STRING:
            return "LineString";
        case GeometryKind::POLYGON:
            return "Polygon";
        case GeometryKind::MULTI_POINT:
            return "MultiPoint";
        case GeometryKind::MULTI_LINE_STRING:
            return "MultiLineString";
        case GeometryKind::MULTI_POLYGON:
            return "MultiPolygon";
        case GeometryKind::GEOMETRY_COLLECTION:
            return "GeometryCollection";
    }
    return "Unknown";
}

std::optional<GeometryKind> geometryKindFromString(const std::string& tag) {
    for (GeometryKind kind : ALL_GEOMETRY_KINDS) {
        if (tag == toString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool isSubtypeOf(GeometryKind kind, GeometryKind base) {
    if (kind == base) {
        return true;
    }

    // Multi geometries are homogeneous geometry collections
    if (base == GeometryKind::GEOMETRY_COLLECTION) {
        return kind == GeometryKind::MULTI_POINT ||
               kind == GeometryKind::MULTI_LINE_STRING ||
               kind == GeometryKind::MULTI_POLYGON;
    }

    return false;
}

std::ostream& operator<<(std::ostream& os, GeometryKind kind) {
    return os << toString(kind);
}

} // namespace geometry
} // namespace geocodec
