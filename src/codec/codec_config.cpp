#include "codec/codec_config.hpp"
#include "codec/codec_error.hpp"
#include "geometry/geometry_kind.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace geocodec {
namespace codec {

namespace {

int readInteger(const nlohmann::json& config_json, const char* key) {
    const nlohmann::json& value = config_json[key];
    if (!value.is_number_integer()) {
        throw InvalidConfiguration(std::string("Invalid value for ") + key + ", expecting an integer but got: " +
                                   value.dump());
    }

    // Reject values get<int>() would silently wrap
    bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw InvalidConfiguration(std::string("Invalid value for ") + key + ", integer out of range: " +
                                   value.dump());
    }
    return value.get<int>();
}

BoundingBoxPolicy parseBoundingBoxPolicy(const nlohmann::json& value) {
    if (value.is_string()) {
        return BoundingBoxPolicy::fromString(value.get<std::string>());
    }

    if (!value.is_array()) {
        throw InvalidConfiguration("Invalid value for bbox, expecting a string or an array but got: " + value.dump());
    }

    BoundingBoxPolicy policy = BoundingBoxPolicy::never();
    for (const auto& tag : value) {
        if (!tag.is_string()) {
            throw InvalidConfiguration("Invalid bbox geometry type: " + tag.dump());
        }
        std::optional<geometry::GeometryKind> kind = geometry::geometryKindFromString(tag.get<std::string>());
        if (!kind) {
            throw InvalidConfiguration("Invalid bbox geometry type: " + tag.get<std::string>());
        }
        policy = policy.include(*kind);
    }
    return policy;
}

} // namespace

CodecConfig parseCodecConfig(const nlohmann::json& config_json) {
    if (!config_json.is_object()) {
        throw InvalidConfiguration("Invalid codec configuration, expecting an object but got: " + config_json.dump());
    }

    CodecConfig config;

    if (config_json.contains("srid")) {
        config.geometry_factory = geometry::GeometryFactory(readInteger(config_json, "srid"));
    }
    if (config_json.contains("bbox")) {
        config.bounding_box_policy = parseBoundingBoxPolicy(config_json["bbox"]);
    }
    if (config_json.contains("decimal_places")) {
        config.decimal_places = readInteger(config_json, "decimal_places");
        if (config.decimal_places < 0) {
            throw InvalidConfiguration("decimalPlaces < 0");
        }
    }
    if (config_json.contains("max_nesting_depth")) {
        int depth = readInteger(config_json, "max_nesting_depth");
        if (depth < 0) {
            throw InvalidConfiguration("max_nesting_depth < 0");
        }
        config.max_nesting_depth = static_cast<std::size_t>(depth);
    }

    return config;
}

} // namespace codec
} // namespace geocodec
