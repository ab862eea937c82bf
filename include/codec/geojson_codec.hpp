#ifndef GEOCODEC_GEOJSON_CODEC_HPP
#define GEOCODEC_GEOJSON_CODEC_HPP

#include <optional>
#include <string>
#include "codec/codec_config.hpp"
#include "codec/geometry_decoder.hpp"
#include "codec/geometry_encoder.hpp"
#include "codec/json_utils.hpp"
#include "codec/typed_geometry_decoder.hpp"
#include "geometry/geometry.hpp"
#include "geometry/geometry_kind.hpp"

namespace geocodec {

/**
 * Library version as "MAJOR.MINOR.PATCH"
 */
std::string versionString();

namespace codec {

/**
 * GeoJSON geometry codec: one encoder and one decoder built from a CodecConfig.
 * Immutable after construction; a single instance may be shared between threads.
 */
class GeoJsonCodec {
public:
    explicit GeoJsonCodec(const CodecConfig& config = CodecConfig());

    /**
     * Encode a geometry as a GeoJSON geometry object
     * @throws UnsupportedGeometry
     */
    Json encode(const geometry::Geometry& geometry) const;

    // Absent geometries encode as JSON null
    Json encode(const std::optional<geometry::Geometry>& geometry) const;

    /**
     * Decode a GeoJSON geometry object
     * @return Geometry, nullopt for a JSON null
     */
    std::optional<geometry::Geometry> decode(const Json& node) const;

    /**
     * Decode a geometry that must be of the given kind or one of its subtypes
     * @throws TypeMismatch when another kind is decoded
     */
    std::optional<geometry::Geometry> decodeAs(geometry::GeometryKind kind, const Json& node) const;

    template <typename T>
    std::optional<geometry::Geometry> decodeAs(const Json& node) const {
        return decodeAs(geometry::kindOf<T>(), node);
    }

    TypedGeometryDecoder typedDecoder(geometry::GeometryKind kind) const;

    /**
     * Encode a geometry straight to GeoJSON text
     * @param geometry Geometry to encode
     * @param indent Indentation width, -1 for compact output
     * @return GeoJSON text
     */
    std::string writeToString(const geometry::Geometry& geometry, int indent = -1) const;

    /**
     * Parse GeoJSON text and decode it
     * @param text GeoJSON geometry text
     * @return Geometry, nullopt for the literal null
     * @throws MalformedJson if the text is not valid JSON
     */
    std::optional<geometry::Geometry> readFromString(const std::string& text) const;

    /**
     * Parse GeoJSON text into a JSON value tree without decoding it
     * @throws MalformedJson if the text is not valid JSON
     */
    static Json parse(const std::string& text);

    const CodecConfig& getConfig() const { return config_; }

    const GeometryEncoder& getEncoder() const { return encoder_; }

    const GeometryDecoder& getDecoder() const { return decoder_; }

private:
    CodecConfig config_;
    GeometryEncoder encoder_;
    GeometryDecoder decoder_;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_GEOJSON_CODEC_HPP
