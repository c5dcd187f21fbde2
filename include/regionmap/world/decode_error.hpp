// regionmap World Format
// decode_error.hpp - Structured failure raised by the binary decoders

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace regionmap::world {

enum class DecodeErrorCode : uint8_t {
    NotFound,       // Region file missing or chunk slot empty
    CorruptFormat,  // Bad magic, truncated read, schema violation
    CorruptPayload  // Decompression or BSON failure
};

[[nodiscard]] const char* decode_error_code_to_string(DecodeErrorCode code);

class DecodeError : public std::runtime_error {
public:
    static constexpr size_t NO_OFFSET = static_cast<size_t>(-1);

    DecodeError(DecodeErrorCode code, const std::string& message, size_t offset = NO_OFFSET, size_t expected = 0);

    [[nodiscard]] DecodeErrorCode code() const noexcept { return code_; }

    // Byte offset where the failure was detected (NO_OFFSET if not positional)
    [[nodiscard]] size_t offset() const noexcept { return offset_; }

    // Number of bytes the failing read asked for
    [[nodiscard]] size_t expected() const noexcept { return expected_; }

private:
    DecodeErrorCode code_;
    size_t offset_;
    size_t expected_;
};

}  // namespace regionmap::world
