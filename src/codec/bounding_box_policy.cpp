#include "codec/bounding_box_policy.hpp"
#include "codec/codec_error.hpp"
#include <algorithm>

namespace geocodec {
namespace codec {

using geometry::GeometryKind;

BoundingBoxPolicy BoundingBoxPolicy::never() {
    return BoundingBoxPolicy(0);
}

BoundingBoxPolicy BoundingBoxPolicy::always() {
    return never()
        .forGeometryCollection()
        .forMultiPolygon()
        .forMultiLineString()
        .forMultiPoint()
        .forPolygon()
        .forLineString()
        .forPoint();
}

BoundingBoxPolicy BoundingBoxPolicy::exceptPoints() {
    return never()
        .forGeometryCollection()
        .forMultiPolygon()
        .forMultiLineString()
        .forMultiPoint()
        .forPolygon()
        .forLineString();
}

BoundingBoxPolicy BoundingBoxPolicy::fromString(const std::string& name) {
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '-', '_');

    if (normalized == "never") {
        return never();
    } else if (normalized == "always") {
        return always();
    } else if (normalized == "except_points") {
        return exceptPoints();
    } else if (normalized == "multi_geometry") {
        return never().forMultiGeometry();
    }
    throw InvalidConfiguration("Unknown bounding box policy: " + name);
}

BoundingBoxPolicy BoundingBoxPolicy::include(GeometryKind kind) const {
    return BoundingBoxPolicy(mask_ | geometry::kindMask(kind));
}

BoundingBoxPolicy BoundingBoxPolicy::forPoint() const {
    return include(GeometryKind::POINT);
}

BoundingBoxPolicy BoundingBoxPolicy::forLineString() const {
    return include(GeometryKind::LINE_STRING);
}

BoundingBoxPolicy BoundingBoxPolicy::forPolygon() const {
    return include(GeometryKind::POLYGON);
}

BoundingBoxPolicy BoundingBoxPolicy::forMultiPoint() const {
    return include(GeometryKind::MULTI_POINT);
}

BoundingBoxPolicy BoundingBoxPolicy::forMultiLineString() const {
    return include(GeometryKind::MULTI_LINE_STRING);
}

BoundingBoxPolicy BoundingBoxPolicy::forMultiPolygon() const {
    return include(GeometryKind::MULTI_POLYGON);
}

BoundingBoxPolicy BoundingBoxPolicy::forGeometryCollection() const {
    return include(GeometryKind::GEOMETRY_COLLECTION);
}

BoundingBoxPolicy BoundingBoxPolicy::forMultiGeometry() const {
    return forMultiPoint()
        .forMultiLineString()
        .forMultiPolygon()
        .forGeometryCollection();
}

bool BoundingBoxPolicy::shouldIncludeBoundingBoxFor(GeometryKind kind) const {
    return (mask_ & geometry::kindMask(kind)) != 0;
}

bool BoundingBoxPolicy::shouldIncludeBoundingBoxFor(const geometry::Geometry& geometry) const {
    if (!geometry.hasValue()) {
        return false;
    }
    return shouldIncludeBoundingBoxFor(geometry.getKind());
}

} // namespace codec
} // namespace geocodec
