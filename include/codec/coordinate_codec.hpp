#ifndef GEOCODEC_COORDINATE_CODEC_HPP
#define GEOCODEC_COORDINATE_CODEC_HPP

#include "codec/json_utils.hpp"
#include "geometry/geometry.hpp"

namespace geocodec {
namespace codec {

/**
 * Encodes a coordinate to a GeoJSON position array and decodes positions back.
 *
 * Encoding rounds every ordinate half-up to a fixed number of decimal places.
 * An ordinate that is integral after rounding is written as an integer token,
 * so (1.123456789, 2.0) at two decimal places becomes [1.12,2]. The z ordinate
 * is written only when it is finite.
 *
 * Decoding accepts an array [x, y] or [x, y, z] (further elements are ignored)
 * or an object {"x": .., "y": .., "z": ..} with optional z.
 */
class CoordinateCodec {
public:
    static constexpr int DEFAULT_DECIMAL_PLACES = 8;

    /**
     * @param decimal_places Number of fraction digits kept when encoding
     * @throws InvalidConfiguration if decimal_places is negative
     */
    explicit CoordinateCodec(int decimal_places = DEFAULT_DECIMAL_PLACES);

    int getDecimalPlaces() const { return decimal_places_; }

    /**
     * Encode a coordinate as a position array of 2 or 3 numbers
     */
    Json encode(const geometry::Coordinate& coordinate) const;

    /**
     * Round and wrap a single ordinate as a JSON number
     */
    Json encodeOrdinate(double value) const;

    /**
     * Round a value half-up (away from zero) to the configured decimal places.
     * The tie is decided on the exact binary value, so 2.675 (stored as
     * 2.67499999...) rounds to 2.67 at two places.
     * Values too large to carry fraction digits at this precision are returned unchanged.
     */
    double round(double value) const;

    /**
     * Decode a position
     * @param node JSON array or object
     * @return Coordinate, z is NaN for 2D positions
     * @throws MalformedCoordinates on fewer than 2 ordinates, non-numeric ordinates
     *         or a node that is neither an array nor an object
     */
    geometry::Coordinate decode(const Json& node) const;

private:
    int decimal_places_;
    double scale_;

    geometry::Coordinate decodeArray(const Json& node) const;
    geometry::Coordinate decodeObject(const Json& node) const;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_COORDINATE_CODEC_HPP
