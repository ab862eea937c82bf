#ifndef GEOCODEC_BOUNDING_BOX_POLICY_HPP
#define GEOCODEC_BOUNDING_BOX_POLICY_HPP

#include <string>
#include "geometry/geometry.hpp"
#include "geometry/geometry_kind.hpp"

namespace geocodec {
namespace codec {

/**
 * Decides per geometry kind whether an encoded geometry carries a "bbox" member.
 * Immutable: every builder method returns a new policy.
 */
class BoundingBoxPolicy {
public:
    /**
     * Never include a bounding box
     */
    static BoundingBoxPolicy never();

    /**
     * Include a bounding box for every geometry kind
     */
    static BoundingBoxPolicy always();

    /**
     * Include a bounding box for every geometry kind except Point
     */
    static BoundingBoxPolicy exceptPoints();

    /**
     * Parse a policy name: "never", "always", "except_points" or "multi_geometry"
     * @param name Policy name ('-' and '_' are interchangeable)
     * @return Policy
     * @throws InvalidConfiguration for an unknown name
     */
    static BoundingBoxPolicy fromString(const std::string& name);

    BoundingBoxPolicy include(geometry::GeometryKind kind) const;

    BoundingBoxPolicy forPoint() const;
    BoundingBoxPolicy forLineString() const;
    BoundingBoxPolicy forPolygon() const;
    BoundingBoxPolicy forMultiPoint() const;
    BoundingBoxPolicy forMultiLineString() const;
    BoundingBoxPolicy forMultiPolygon() const;
    BoundingBoxPolicy forGeometryCollection() const;

    /**
     * Include the bounding box for MultiPoint, MultiLineString, MultiPolygon
     * and GeometryCollection
     */
    BoundingBoxPolicy forMultiGeometry() const;

    bool shouldIncludeBoundingBoxFor(geometry::GeometryKind kind) const;

    bool shouldIncludeBoundingBoxFor(const geometry::Geometry& geometry) const;

    unsigned int mask() const { return mask_; }

    bool operator==(const BoundingBoxPolicy& other) const { return mask_ == other.mask_; }
    bool operator!=(const BoundingBoxPolicy& other) const { return mask_ != other.mask_; }

private:
    explicit BoundingBoxPolicy(unsigned int mask) : mask_(mask) {}

    unsigned int mask_;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_BOUNDING_BOX_POLICY_HPP
