#include "io/spatial_reference_utils.hpp"
#include <cpl_error.h>
#include <ogr_srs_api.h>

namespace geocodec {
namespace io {

OGRSpatialReferenceH SpatialReferenceUtils::importEPSG(int epsg) {
    if (epsg <= 0) {
        return nullptr;
    }

    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    if (!srs) {
        return nullptr;
    }

    // Unknown codes are reported through the return value, keep GDAL quiet
    CPLPushErrorHandler(CPLQuietErrorHandler);
    OGRErr err = OSRImportFromEPSG(srs, epsg);
    CPLPopErrorHandler();

    if (err != OGRERR_NONE) {
        OSRDestroySpatialReference(srs);
        return nullptr;
    }
    return srs;
}

bool SpatialReferenceUtils::isKnownEPSG(int epsg) {
    OGRSpatialReferenceH srs = importEPSG(epsg);
    if (!srs) {
        return false;
    }
    OSRDestroySpatialReference(srs);
    return true;
}

std::string SpatialReferenceUtils::getEPSGName(int epsg) {
    OGRSpatialReferenceH srs = importEPSG(epsg);
    if (!srs) {
        return "";
    }

    const char* name = OSRGetName(srs);
    std::string result = name ? std::string(name) : "";

    OSRDestroySpatialReference(srs);
    return result;
}

bool SpatialReferenceUtils::isEPSG4326(int epsg) {
    OGRSpatialReferenceH srs = importEPSG(epsg);
    if (!srs) {
        return false;
    }

    OGRSpatialReferenceH wgs84 = importEPSG(4326);
    bool is_same = wgs84 && OSRIsSame(srs, wgs84);

    if (wgs84) {
        OSRDestroySpatialReference(wgs84);
    }
    OSRDestroySpatialReference(srs);
    return is_same;
}

} // namespace io
} // namespace geocodec
