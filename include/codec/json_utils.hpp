#ifndef GEOCODEC_JSON_UTILS_HPP
#define GEOCODEC_JSON_UTILS_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace geocodec {
namespace codec {

// JSON value tree and generator used by the codec; preserves member insertion order
using Json = nlohmann::ordered_json;

// GeoJSON geometry member names
namespace fields {
constexpr const char* TYPE = "type";
constexpr const char* BOUNDING_BOX = "bbox";
constexpr const char* COORDINATES = "coordinates";
constexpr const char* GEOMETRIES = "geometries";
} // namespace fields

/**
 * Find a member of a JSON object
 * @param object JSON value, normally an object
 * @param name Member name
 * @return Pointer to the member value, nullptr if absent or if object is not an object
 */
const Json* findField(const Json& object, const char* name);

/**
 * Name of the kind of a JSON node as used in diagnostics
 * (NULL, OBJECT, ARRAY, STRING, BOOLEAN, NUMBER, BINARY)
 * @param node JSON node, nullptr for an absent member
 * @return Node kind name, MISSING for nullptr
 */
std::string nodeTypeName(const Json* node);

std::string nodeTypeName(const Json& node);

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_JSON_UTILS_HPP
