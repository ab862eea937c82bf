#ifndef GEOCODEC_GEOMETRY_DECODER_HPP
#define GEOCODEC_GEOMETRY_DECODER_HPP

#include <cstddef>
#include <optional>
#include <vector>
#include "codec/coordinate_codec.hpp"
#include "codec/json_utils.hpp"
#include "geometry/geometry.hpp"
#include "geometry/geometry_factory.hpp"

namespace geocodec {
namespace codec {

/**
 * Decoder reconstructing geometries from GeoJSON geometry objects.
 *
 * Dispatches on the "type" member and validates every level of the
 * coordinate nesting. Diagnostics name the JSON node kind actually found,
 * e.g. "Invalid coordinates, expecting an array but got: STRING".
 */
class GeometryDecoder {
public:
    // No limit on GeometryCollection nesting
    static constexpr std::size_t UNBOUNDED_DEPTH = 0;

    /**
     * @param factory Factory used for every geometry created during decoding
     * @param max_nesting_depth Maximum GeometryCollection nesting, UNBOUNDED_DEPTH for none
     */
    explicit GeometryDecoder(const geometry::GeometryFactory& factory = geometry::GeometryFactory(),
                             std::size_t max_nesting_depth = UNBOUNDED_DEPTH);

    /**
     * Decode a GeoJSON geometry object
     * @param node GeoJSON geometry object or null
     * @return Decoded geometry, nullopt for a JSON null
     * @throws UnknownGeometryType, MalformedCoordinates, MalformedGeometry,
     *         NestingDepthExceeded, geometry::InvalidGeometry
     */
    std::optional<geometry::Geometry> decode(const Json& node) const;

    const geometry::GeometryFactory& getGeometryFactory() const { return factory_; }

    std::size_t getMaxNestingDepth() const { return max_nesting_depth_; }

private:
    geometry::GeometryFactory factory_;
    CoordinateCodec coordinate_codec_;
    std::size_t max_nesting_depth_;

    geometry::Geometry decodeGeometry(const Json& node, std::size_t depth) const;

    geometry::Geometry decodePoint(const Json& node) const;
    geometry::Geometry decodeLineString(const Json& node) const;
    geometry::Geometry decodePolygon(const Json& node) const;
    geometry::Geometry decodeMultiPoint(const Json& node) const;
    geometry::Geometry decodeMultiLineString(const Json& node) const;
    geometry::Geometry decodeMultiPolygon(const Json& node) const;
    geometry::Geometry decodeGeometryCollection(const Json& node, std::size_t depth) const;

    /**
     * Get a member that must be a JSON array
     * @throws MalformedCoordinates naming the kind of node found instead
     */
    const Json& requireArray(const Json& node, const char* name) const;

    // Checks that a nested coordinate level is an array
    const Json& requireArrayElement(const Json& element) const;

    std::vector<geometry::Coordinate> decodeCoordinateSequence(const Json& array) const;
    geometry::LinearRing decodeLinearRing(const Json& array) const;
    geometry::Polygon decodeRings(const Json& array) const;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_GEOMETRY_DECODER_HPP
