#ifndef GEOCODEC_GEOMETRY_KIND_HPP
#define GEOCODEC_GEOMETRY_KIND_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace geocodec {
namespace geometry {

/**
 * GeoJSON geometry discriminators.
 * The enumerator order is the bit position used by set membership tests and
 * matches the alternative order of Geometry::Variant.
 */
enum class GeometryKind {
    POINT,
    LINE_STRING,
    POLYGON,
    MULTI_POINT,
    MULTI_LINE_STRING,
    MULTI_POLYGON,
    GEOMETRY_COLLECTION
};

constexpr std::size_t GEOMETRY_KIND_COUNT = 7;

constexpr std::array<GeometryKind, GEOMETRY_KIND_COUNT> ALL_GEOMETRY_KINDS = {
    GeometryKind::POINT,
    GeometryKind::LINE_STRING,
    GeometryKind::POLYGON,
    GeometryKind::MULTI_POINT,
    GeometryKind::MULTI_LINE_STRING,
    GeometryKind::MULTI_POLYGON,
    GeometryKind::GEOMETRY_COLLECTION
};

/**
 * Bit mask value of a geometry kind
 * @param kind Geometry kind
 * @return 1 shifted by the ordinal of the kind
 */
constexpr unsigned int kindMask(GeometryKind kind) {
    return 1u << static_cast<unsigned int>(kind);
}

/**
 * Canonical GeoJSON type tag of a geometry kind (e.g. "MultiPolygon")
 * @param kind Geometry kind
 * @return Type tag
 */
const char* toString(GeometryKind kind);

/**
 * Look up a geometry kind by its GeoJSON type tag
 * @param tag Type tag, matched case-sensitively
 * @return Geometry kind or nullopt if the tag is not a geometry type
 */
std::optional<GeometryKind> geometryKindFromString(const std::string& tag);

/**
 * Check whether values of one kind are acceptable where another kind is requested.
 * Every kind is a subtype of itself; the three multi kinds are subtypes of
 * GEOMETRY_COLLECTION.
 * @param kind Kind of the actual value
 * @param base Requested kind
 * @return true if kind is base or a subtype of it
 */
bool isSubtypeOf(GeometryKind kind, GeometryKind base);

std::ostream& operator<<(std::ostream& os, GeometryKind kind);

} // namespace geometry
} // namespace geocodec

#endif // GEOCODEC_GEOMETRY_KIND_HPP
