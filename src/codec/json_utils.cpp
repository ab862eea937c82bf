#include "codec/json_utils.hpp"

namespace geocodec {
namespace codec {

const Json* findField(const Json& object, const char* name) {
    if (!object.is_object()) {
        return nullptr;
    }

    auto it = object.find(name);
    if (it == object.end()) {
        return nullptr;
    }
    return &(*it);
}

std::string nodeTypeName(const Json* node) {
    if (!node) {
        return "MISSING";
    }
    return nodeTypeName(*node);
}

std::string nodeTypeName(const Json& node) {
    switch (node.type()) {
        case Json::value_t::null:
            return "NULL";
        case Json::value_t::object:
            return "OBJECT";
        case Json::value_t::array:
            return "ARRAY";
        case Json::value_t::string:
            return "STRING";
        case Json::value_t::boolean:
            return "BOOLEAN";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return "NUMBER";
        case Json::value_t::binary:
            return "BINARY";
        case Json::value_t::discarded:
            return "MISSING";
    }
    return "MISSING";
}

} // namespace codec
} // namespace geocodec
