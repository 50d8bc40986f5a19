/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

namespace strata {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);

    for (uint8_t byte : data) {
        result.push_back(HEX_DIGITS[byte >> 4]);
        result.push_back(HEX_DIGITS[byte & 0x0F]);
    }

    return result;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::ProtocolMalformed, "Нечётная длина hex строки");
    }

    Bytes result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(ErrorCode::ProtocolMalformed, "Недопустимый символ в hex строке");
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return result;
}

} // namespace strata
