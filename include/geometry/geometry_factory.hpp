#ifndef GEOCODEC_GEOMETRY_FACTORY_HPP
#define GEOCODEC_GEOMETRY_FACTORY_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "geometry/geometry.hpp"

namespace geocodec {
namespace geometry {

/**
 * Raised when a geometry cannot be constructed from the supplied parts
 * (unclosed ring, too few ring points, holes without a shell)
 */
class InvalidGeometry : public std::runtime_error {
public:
    explicit InvalidGeometry(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Constructs geometries stamped with a fixed spatial reference identifier.
 * Holds no mutable state; one instance may be shared by any number of decoders.
 */
class GeometryFactory {
public:
    static constexpr int DEFAULT_SRID = 4326;

    explicit GeometryFactory(int srid = DEFAULT_SRID);

    int getSRID() const { return srid_; }

    /**
     * Create a closed linear ring
     * @param coordinates Ring coordinates, first equal to last
     * @return Linear ring
     * @throws InvalidGeometry if the ring is not closed or has 1 to 3 points
     */
    LinearRing createLinearRing(std::vector<Coordinate> coordinates) const;

    /**
     * Assemble a linestring payload
     * @throws InvalidGeometry if exactly one coordinate is given
     */
    LineString assembleLineString(std::vector<Coordinate> coordinates) const;

    /**
     * Assemble a polygon from a shell and holes
     * @param shell Exterior ring (may be empty)
     * @param holes Interior rings
     * @return Polygon payload
     * @throws InvalidGeometry if the shell is empty but holes are not
     */
    Polygon assemblePolygon(LinearRing shell, std::vector<LinearRing> holes = {}) const;

    Geometry createPoint(std::optional<Coordinate> coordinate = std::nullopt) const;
    Geometry createLineString(std::vector<Coordinate> coordinates) const;
    Geometry createPolygon(Polygon polygon) const;
    Geometry createPolygon(LinearRing shell, std::vector<LinearRing> holes) const;
    Geometry createMultiPoint(std::vector<Coordinate> coordinates) const;
    Geometry createMultiLineString(std::vector<LineString> lineStrings) const;
    Geometry createMultiPolygon(std::vector<Polygon> polygons) const;
    Geometry createGeometryCollection(std::vector<Geometry> geometries) const;

private:
    int srid_;
};

} // namespace geometry
} // namespace geocodec

#endif // GEOCODEC_GEOMETRY_FACTORY_HPP
