#include "protocol/varint.hpp"

namespace weave::protocol {

namespace {
constexpr int kMaxVarUintBytes = 10;  // ceil(64 / 7)
}

void Encoder::write_var_uint(uint64_t value) {
    while (value > 0x7F) {
        buffer_.push_back(static_cast<uint8_t>(0x80 | (value & 0x7F)));
        value >>= 7;
    }
    buffer_.push_back(static_cast<uint8_t>(value));
}

void Encoder::write_var_bytes(std::span<const uint8_t> bytes) {
    write_var_uint(bytes.size());
    write_raw(bytes);
}

void Encoder::write_var_string(std::string_view text) {
    write_var_uint(text.size());
    buffer_.insert(buffer_.end(), text.begin(), text.end());
}

void Encoder::write_raw(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

Result<uint64_t, Error> Decoder::read_var_uint() {
    uint64_t value = 0;
    for (int i = 0; i < kMaxVarUintBytes; ++i) {
        if (pos_ >= data_.size()) {
            return Result<uint64_t, Error>::err(
                Error{"Unexpected end of buffer in var uint", ErrorCode::ProtocolDecode});
        }
        const uint8_t byte = data_[pos_++];
        const uint64_t group = byte & 0x7F;
        const int shift = 7 * i;
        if (shift == 63 && group > 1) {
            return Result<uint64_t, Error>::err(
                Error{"Var uint overflows 64 bits", ErrorCode::ProtocolDecode});
        }
        value |= group << shift;
        if ((byte & 0x80) == 0) {
            return Result<uint64_t, Error>::ok(value);
        }
    }
    return Result<uint64_t, Error>::err(
        Error{"Var uint longer than 10 bytes", ErrorCode::ProtocolDecode});
}

Result<Bytes, Error> Decoder::read_var_bytes() {
    auto len = read_var_uint();
    if (len.is_err()) {
        return Result<Bytes, Error>::err(len.unwrap_err());
    }
    const auto n = len.unwrap();
    if (n > remaining()) {
        return Result<Bytes, Error>::err(
            Error{"Length prefix exceeds buffer (" + std::to_string(n) + " > " +
                      std::to_string(remaining()) + ")",
                  ErrorCode::ProtocolDecode});
    }
    Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
              data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return Result<Bytes, Error>::ok(std::move(out));
}

Result<std::string, Error> Decoder::read_var_string() {
    return read_var_bytes().map([](Bytes raw) {
        return std::string(raw.begin(), raw.end());
    });
}

Bytes Decoder::read_rest() {
    Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(pos_), data_.end());
    pos_ = data_.size();
    return out;
}

} // namespace weave::protocol
