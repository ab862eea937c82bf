#include "codec/geojson_codec.hpp"
#include "codec/codec_error.hpp"

namespace geocodec {

std::string versionString() {
    return std::to_string(GEOCODEC_VERSION_MAJOR) + "." +
           std::to_string(GEOCODEC_VERSION_MINOR) + "." +
           std::to_string(GEOCODEC_VERSION_PATCH);
}

namespace codec {

GeoJsonCodec::GeoJsonCodec(const CodecConfig& config)
    : config_(config),
      encoder_(config.bounding_box_policy, CoordinateCodec(config.decimal_places)),
      decoder_(config.geometry_factory.value_or(geometry::GeometryFactory()), config.max_nesting_depth) {
}

Json GeoJsonCodec::encode(const geometry::Geometry& geometry) const {
    return encoder_.encode(geometry);
}

Json GeoJsonCodec::encode(const std::optional<geometry::Geometry>& geometry) const {
    return encoder_.encode(geometry);
}

std::optional<geometry::Geometry> GeoJsonCodec::decode(const Json& node) const {
    return decoder_.decode(node);
}

std::optional<geometry::Geometry> GeoJsonCodec::decodeAs(geometry::GeometryKind kind, const Json& node) const {
    return typedDecoder(kind).decode(node);
}

TypedGeometryDecoder GeoJsonCodec::typedDecoder(geometry::GeometryKind kind) const {
    return TypedGeometryDecoder(kind, decoder_);
}

std::string GeoJsonCodec::writeToString(const geometry::Geometry& geometry, int indent) const {
    return encode(geometry).dump(indent);
}

std::optional<geometry::Geometry> GeoJsonCodec::readFromString(const std::string& text) const {
    return decode(parse(text));
}

Json GeoJsonCodec::parse(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedJson(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace codec
} // namespace geocodec
