// regionmap World Format
// decode_error.cpp - Structured decode failure

#include <regionmap/world/decode_error.hpp>

namespace regionmap::world {

const char* decode_error_code_to_string(DecodeErrorCode code) {
    switch (code) {
        case DecodeErrorCode::NotFound:
            return "NotFound";
        case DecodeErrorCode::CorruptFormat:
            return "CorruptFormat";
        case DecodeErrorCode::CorruptPayload:
            return "CorruptPayload";
    }
    return "Unknown";
}

DecodeError::DecodeError(DecodeErrorCode code, const std::string& message, size_t offset, size_t expected)
    : std::runtime_error(message), code_(code), offset_(offset), expected_(expected) {}

}  // namespace regionmap::world
