#ifndef GEOCODEC_GEOMETRY_HPP
#define GEOCODEC_GEOMETRY_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include "geometry/geometry_kind.hpp"

namespace geocodec {
namespace geometry {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

/**
 * Coordinate with x, y and an optional z ordinate.
 * z is absent when it is not finite (NaN marks a 2D coordinate).
 */
struct Coordinate {
    double x;
    double y;
    double z;

    Coordinate()
        : x(0.0), y(0.0), z(std::numeric_limits<double>::quiet_NaN()) {}

    Coordinate(double x_val, double y_val, double z_val = std::numeric_limits<double>::quiet_NaN())
        : x(x_val), y(y_val), z(z_val) {}

    bool hasZ() const { return std::isfinite(z); }

    bool equals2D(const Coordinate& other) const {
        return x == other.x && y == other.y;
    }
};

} // namespace geometry
} // namespace geocodec

// Coordinate participates in Boost Geometry algorithms as a 2D cartesian point
BOOST_GEOMETRY_REGISTER_POINT_2D(geocodec::geometry::Coordinate, double, boost::geometry::cs::cartesian, x, y)

namespace geocodec {
namespace geometry {

// Geometry payload types
using LineString = bg::model::linestring<Coordinate>;
using LinearRing = bg::model::ring<Coordinate>;
using Polygon = bg::model::polygon<Coordinate>;
using MultiPoint = bg::model::multi_point<Coordinate>;
using MultiLineString = bg::model::multi_linestring<LineString>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using Box = bg::model::box<Coordinate>;

// Point payload; the empty point carries no coordinate
struct Point {
    std::optional<Coordinate> coordinate;

    Point() = default;
    explicit Point(const Coordinate& coord) : coordinate(coord) {}

    bool empty() const { return !coordinate.has_value(); }
};

class Geometry;

// Ordered heterogeneous children, may nest further collections
struct GeometryCollection {
    std::vector<Geometry> geometries;
};

/**
 * A geometry value: one of the seven GeoJSON geometry payloads tagged with a
 * spatial reference identifier. Owns all of its coordinates and children.
 */
class Geometry {
public:
    using Variant = std::variant<Point, LineString, Polygon, MultiPoint,
                                 MultiLineString, MultiPolygon, GeometryCollection>;

    Geometry(Variant value, int srid = 0)
        : value_(std::move(value)), srid_(srid) {}

    /**
     * Get the geometry kind of this value
     * @return Kind matching the held payload
     */
    GeometryKind getKind() const { return static_cast<GeometryKind>(value_.index()); }

    int getSRID() const { return srid_; }

    const Variant& value() const { return value_; }

    Variant& value() { return value_; }

    /**
     * Check whether the held payload is a usable alternative.
     * A variant left valueless by a throwing assignment is not.
     */
    bool hasValue() const { return !value_.valueless_by_exception(); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(value_); }

    /**
     * Access the payload as a specific type
     * @throws std::bad_variant_access if the payload is of another type
     */
    template <typename T>
    const T& as() const { return std::get<T>(value_); }

    template <typename T>
    T& as() { return std::get<T>(value_); }

    /**
     * Check whether the geometry has no coordinates.
     * Multi geometries and collections are empty when every child is empty.
     */
    bool isEmpty() const;

    /**
     * Compute the axis-aligned envelope over every coordinate
     * @return Envelope box, inverse-initialized (min > max) for empty geometries
     */
    Box getEnvelope() const;

    /**
     * Structural equality: same kind, same nesting, same coordinate count and
     * coordinates equal within tolerance (z presence must match).
     * The SRID is not compared.
     */
    bool equalsExact(const Geometry& other, double tolerance = 0.0) const;

private:
    Variant value_;
    int srid_;
};

// Variant order is the GeometryKind order
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(GeometryKind::POINT), Geometry::Variant>, Point>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(GeometryKind::POLYGON), Geometry::Variant>, Polygon>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(GeometryKind::GEOMETRY_COLLECTION), Geometry::Variant>, GeometryCollection>);
static_assert(std::variant_size_v<Geometry::Variant> == GEOMETRY_KIND_COUNT);

/**
 * Geometry kind of a payload type
 */
template <typename T>
constexpr GeometryKind kindOf();

template <> constexpr GeometryKind kindOf<Point>() { return GeometryKind::POINT; }
template <> constexpr GeometryKind kindOf<LineString>() { return GeometryKind::LINE_STRING; }
template <> constexpr GeometryKind kindOf<Polygon>() { return GeometryKind::POLYGON; }
template <> constexpr GeometryKind kindOf<MultiPoint>() { return GeometryKind::MULTI_POINT; }
template <> constexpr GeometryKind kindOf<MultiLineString>() { return GeometryKind::MULTI_LINE_STRING; }
template <> constexpr GeometryKind kindOf<MultiPolygon>() { return GeometryKind::MULTI_POLYGON; }
template <> constexpr GeometryKind kindOf<GeometryCollection>() { return GeometryKind::GEOMETRY_COLLECTION; }

} // namespace geometry
} // namespace geocodec

#endif // GEOCODEC_GEOMETRY_HPP
