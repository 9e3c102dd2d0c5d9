#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <span>
#include <string>
#include <string_view>

namespace weave::protocol {

/**
 * Encoder - appends lib0-compatible primitives to a byte buffer.
 *
 * var uint: 7 bits per byte, least significant group first, high bit set on
 * every byte but the last. Byte arrays and strings are var-uint length prefixed.
 */
class Encoder {
public:
    void write_var_uint(uint64_t value);
    void write_var_bytes(std::span<const uint8_t> bytes);
    void write_var_string(std::string_view text);
    void write_raw(std::span<const uint8_t> bytes);

    [[nodiscard]] const Bytes& bytes() const { return buffer_; }
    [[nodiscard]] Bytes take() { return std::move(buffer_); }

private:
    Bytes buffer_;
};

/**
 * Decoder - reads what Encoder writes. Every read reports truncation or
 * overflow as ErrorCode::ProtocolDecode instead of reading past the end.
 */
class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] Result<uint64_t, Error> read_var_uint();
    [[nodiscard]] Result<Bytes, Error> read_var_bytes();
    [[nodiscard]] Result<std::string, Error> read_var_string();

    /**
     * Consume and return everything not yet read.
     */
    [[nodiscard]] Bytes read_rest();

    [[nodiscard]] bool at_end() const { return pos_ >= data_.size(); }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace weave::protocol
