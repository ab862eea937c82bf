#include "codec/coordinate_codec.hpp"
#include "codec/codec_error.hpp"
#include <cmath>
#include <cstdint>

namespace geocodec {
namespace codec {

namespace {

// Largest magnitude at which every integer is exactly representable as a double
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

double readOrdinate(const Json* node) {
    if (!node || !node->is_number()) {
        throw MalformedCoordinates("Invalid coordinates, expecting numbers but got: " + nodeTypeName(node));
    }
    return node->get<double>();
}

} // namespace

CoordinateCodec::CoordinateCodec(int decimal_places)
    : decimal_places_(decimal_places), scale_(1.0) {
    if (decimal_places < 0) {
        throw InvalidConfiguration("decimalPlaces < 0");
    }
    scale_ = std::pow(10.0, decimal_places);
}

double CoordinateCodec::round(double value) const {
    if (!std::isfinite(value)) {
        return value;
    }

    double magnitude = std::abs(value);
    double scaled = magnitude * scale_;
    if (!std::isfinite(scaled) || scaled >= MAX_EXACT_INTEGER) {
        return value;
    }

    // The tie is decided on the exact product, scaled itself may have been rounded up to .5
    double floored = std::floor(scaled);
    double remainder = std::fma(magnitude, scale_, -(floored + 0.5));
    double rounded = (remainder >= 0.0) ? floored + 1.0 : floored;
    return std::copysign(rounded / scale_, value);
}

Json CoordinateCodec::encodeOrdinate(double value) const {
    double rounded = round(value);

    if (std::isfinite(rounded) && std::abs(rounded) < MAX_EXACT_INTEGER && std::trunc(rounded) == rounded) {
        return Json(static_cast<std::int64_t>(rounded));
    }
    return Json(rounded);
}

Json CoordinateCodec::encode(const geometry::Coordinate& coordinate) const {
    Json position = Json::array();
    position.push_back(encodeOrdinate(coordinate.x));
    position.push_back(encodeOrdinate(coordinate.y));
    if (coordinate.hasZ()) {
        position.push_back(encodeOrdinate(coordinate.z));
    }
    return position;
}

geometry::Coordinate CoordinateCodec::decode(const Json& node) const {
    if (node.is_array()) {
        return decodeArray(node);
    } else if (node.is_object()) {
        return decodeObject(node);
    }
    throw MalformedCoordinates("Unknown coordinates format: " + node.dump());
}

geometry::Coordinate CoordinateCodec::decodeArray(const Json& node) const {
    if (node.size() < 2) {
        throw MalformedCoordinates("Invalid number of ordinates: " + std::to_string(node.size()));
    }

    double x = readOrdinate(&node[0]);
    double y = readOrdinate(&node[1]);
    if (node.size() < 3) {
        return geometry::Coordinate(x, y);
    }

    // Ordinates after z are ignored
    double z = readOrdinate(&node[2]);
    return geometry::Coordinate(x, y, z);
}

geometry::Coordinate CoordinateCodec::decodeObject(const Json& node) const {
    double x = readOrdinate(findField(node, "x"));
    double y = readOrdinate(findField(node, "y"));

    const Json* z = findField(node, "z");
    if (!z) {
        return geometry::Coordinate(x, y);
    }
    return geometry::Coordinate(x, y, readOrdinate(z));
}

} // namespace codec
} // namespace geocodec
