#include "codec/typed_geometry_decoder.hpp"
#include "codec/codec_error.hpp"
#include <string>

namespace geocodec {
namespace codec {

TypedGeometryDecoder::TypedGeometryDecoder(geometry::GeometryKind kind, const GeometryDecoder& decoder)
    : kind_(kind), decoder_(decoder) {
}

std::optional<geometry::Geometry> TypedGeometryDecoder::decode(const Json& node) const {
    std::optional<geometry::Geometry> result = decoder_.decode(node);
    if (!result) {
        return result;
    }

    if (!geometry::isSubtypeOf(result->getKind(), kind_)) {
        throw TypeMismatch(std::string("Invalid type for ") + geometry::toString(kind_) +
                           ": " + geometry::toString(result->getKind()));
    }
    return result;
}

} // namespace codec
} // namespace geocodec
