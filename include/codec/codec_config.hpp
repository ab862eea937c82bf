#ifndef GEOCODEC_CODEC_CONFIG_HPP
#define GEOCODEC_CODEC_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <nlohmann/json.hpp>
#include "codec/bounding_box_policy.hpp"
#include "codec/coordinate_codec.hpp"
#include "codec/geometry_decoder.hpp"
#include "geometry/geometry_factory.hpp"

namespace geocodec {
namespace codec {

// Codec configuration
struct CodecConfig {
    std::optional<geometry::GeometryFactory> geometry_factory;                   // Factory for decoded geometries (optional, SRID 4326 if not specified)
    BoundingBoxPolicy bounding_box_policy = BoundingBoxPolicy::never();           // Kinds encoded with a "bbox" member
    int decimal_places = CoordinateCodec::DEFAULT_DECIMAL_PLACES;                 // Fraction digits kept when encoding ordinates
    std::size_t max_nesting_depth = GeometryDecoder::UNBOUNDED_DEPTH;             // GeometryCollection nesting bound (0 = unbounded)

    CodecConfig() = default;
};

/**
 * Parse a codec configuration from JSON.
 *
 * Recognized keys (all optional):
 * - "srid": integer SRID of the geometry factory
 * - "bbox": policy name ("never", "always", "except_points", "multi_geometry")
 *           or an array of GeoJSON type tags
 * - "decimal_places": non-negative integer
 * - "max_nesting_depth": non-negative integer, 0 for unbounded
 *
 * @param config_json JSON object
 * @return Parsed configuration
 * @throws InvalidConfiguration for wrongly typed or unknown values
 */
CodecConfig parseCodecConfig(const nlohmann::json& config_json);

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_CODEC_CONFIG_HPP
