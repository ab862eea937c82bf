#ifndef GEOCODEC_CODEC_ERROR_HPP
#define GEOCODEC_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace geocodec {
namespace codec {

/**
 * Base class of every error raised while configuring, encoding or decoding.
 * Messages are part of the contract: callers match on their prefixes.
 */
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message)
        : std::runtime_error(message) {}
};

// Rejected codec settings (e.g. negative decimal places)
class InvalidConfiguration : public CodecError {
public:
    explicit InvalidConfiguration(const std::string& message)
        : CodecError(message) {}
};

// Encoder given a geometry outside the supported kinds
class UnsupportedGeometry : public CodecError {
public:
    explicit UnsupportedGeometry(const std::string& message)
        : CodecError(message) {}
};

// Decoder found a missing, non-string or unknown "type" tag
class UnknownGeometryType : public CodecError {
public:
    explicit UnknownGeometryType(const std::string& message)
        : CodecError(message) {}
};

// Coordinates payload of the wrong shape or with non-numeric ordinates
class MalformedCoordinates : public CodecError {
public:
    explicit MalformedCoordinates(const std::string& message)
        : CodecError(message) {}
};

// Geometry node that is not a JSON object
class MalformedGeometry : public CodecError {
public:
    explicit MalformedGeometry(const std::string& message)
        : CodecError(message) {}
};

// Input text that is not valid JSON
class MalformedJson : public CodecError {
public:
    explicit MalformedJson(const std::string& message)
        : CodecError(message) {}
};

// Typed decode produced a geometry of another kind
class TypeMismatch : public CodecError {
public:
    explicit TypeMismatch(const std::string& message)
        : CodecError(message) {}
};

// Geometry collections nested deeper than the configured bound
class NestingDepthExceeded : public CodecError {
public:
    explicit NestingDepthExceeded(const std::string& message)
        : CodecError(message) {}
};

} // namespace codec
} // namespace geocodec

#endif // GEOCODEC_CODEC_ERROR_HPP
