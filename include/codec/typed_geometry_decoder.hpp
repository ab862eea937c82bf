#ifndef GEOCODEC_TYPED_GEOMETRY_DECODER_HPP
#define GEOCODEC_TYPED_GEOMETRY_DECODER_HPP

#include <optional>
#include "codec/geometry_decoder.hpp"
#include "codec/json_utils.hpp"
#include "geometry/geometry.hpp"
#include "geometry/geometry_kind.hpp"

namespace geocodec {
namespace codec {

/**
 * Decoder restricted to one requested geometry kind.
 *
 * Delegates to a GeometryDecoder and accepts the result only if its kind is the
 * requested kind or a subtype of it (see geometry::isSubtypeOf). A JSON null
 * still decodes to nullopt.
 */
class TypedGeometryDecoder {
public:
    /**
     * @param kind Requested geometry kind
     * @param decoder Decoder doing the actual work
     */
    TypedGeometryDecoder(geometry::GeometryKind kind, const GeometryDecoder& decoder);

    /**
     * Decode a geometry of the requested kind
     * @param node GeoJSON geometry object or null
     * @return Decoded geometry, nullopt for a JSON null
     * @throws TypeMismatch if the decoded geometry is of an unrelated kind,
     *         plus everything GeometryDecoder::decode throws
     */
    std::optional<geometry::Geometry> decode(const Json& node) const;

    geometry::GeometryKind getKind() const { return kind_; }

private:
    geometry::GeometryKind kind_;
    GeometryDecoder decoder_;
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_TYPED_GEOMETRY_DECODER_HPP
