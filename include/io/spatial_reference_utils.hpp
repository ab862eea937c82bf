#ifndef GEOCODEC_SPATIAL_REFERENCE_UTILS_HPP
#define GEOCODEC_SPATIAL_REFERENCE_UTILS_HPP

#include <string>
#include <ogr_srs_api.h>

namespace geocodec {
namespace io {

/**
 * Spatial reference lookups against the EPSG registry, used to validate the SRID
 * stamped on decoded geometries
 */
class SpatialReferenceUtils {
public:
    /**
     * Check whether an EPSG code is known to the registry
     * @param epsg EPSG code
     * @return true if the code can be imported, false otherwise
     */
    static bool isKnownEPSG(int epsg);

    /**
     * Get the name of the coordinate reference system of an EPSG code
     * @param epsg EPSG code
     * @return CRS name (e.g., "WGS 84"), empty string if the code is unknown
     */
    static std::string getEPSGName(int epsg);

    /**
     * Check if an EPSG code describes EPSG:4326 (WGS84)
     * @param epsg EPSG code
     * @return true if the coordinate system is the same as EPSG:4326
     */
    static bool isEPSG4326(int epsg);

private:
    // Import an EPSG code, nullptr if unknown (caller owns the handle)
    static OGRSpatialReferenceH importEPSG(int epsg);

    // Disable instantiation
    SpatialReferenceUtils() = delete;
};

} // namespace io
} // namespace geocodec

#endif // GEOCODEC_SPATIAL_REFERENCE_UTILS_HPP
