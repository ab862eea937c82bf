#ifndef GEOCODEC_GEOMETRY_ENCODER_HPP
#define GEOCODEC_GEOMETRY_ENCODER_HPP

#include <optional>
#include "codec/bounding_box_policy.hpp"
#include "codec/coordinate_codec.hpp"
#include "codec/json_utils.hpp"
#include "geometry/geometry.hpp"

namespace geocodec {
namespace codec {

/**
 * Encoder converting geometries to GeoJSON geometry objects.
 * Every object carries, in order, "type", an optional "bbox" and then
 * "coordinates" (or "geometries" for collections).
 */
class GeometryEncoder {
public:
    explicit GeometryEncoder(const BoundingBoxPolicy& policy = BoundingBoxPolicy::never(),
                             const CoordinateCodec& coordinate_codec = CoordinateCodec());

    /**
     * Encode a geometry
     * @param geometry Geometry to encode
     * @return GeoJSON geometry object
     * @throws UnsupportedGeometry if the geometry holds no supported payload
     */
    Json encode(const geometry::Geometry& geometry) const;

    /**
     * Encode an optional geometry; an absent geometry encodes as JSON null
     */
    Json encode(const std::optional<geometry::Geometry>& geometry) const;

    const BoundingBoxPolicy& getBoundingBoxPolicy() const { return policy_; }

    const CoordinateCodec& getCoordinateCodec() const { return coordinate_codec_; }

private:
    BoundingBoxPolicy policy_;
    CoordinateCodec coordinate_codec_;

    /**
     * Start a geometry object with its "type" member and, when the policy asks for
     * it and the geometry is not empty, its "bbox" member
     */
    Json encodeTypeAndBoundingBox(const geometry::Geometry& geometry) const;

    // Per-kind coordinate payloads
    Json encodeCoordinates(const geometry::Point& point) const;
    Json encodeCoordinates(const geometry::LineString& lineString) const;
    Json encodeCoordinates(const geometry::Polygon& polygon) const;
    Json encodeCoordinates(const geometry::MultiPoint& multiPoint) const;
    Json encodeCoordinates(const geometry::MultiLineString& multiLineString) const;
    Json encodeCoordinates(const geometry::MultiPolygon& multiPolygon) const;

    template <typename Range>
    Json encodeCoordinateSequence(const Range& coordinates) const;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_GEOMETRY_ENCODER_HPP
