/**
 * @file hex.hpp
 * @brief Преобразование между байтами и hex строками
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace strata {

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Декодировать hex строку
 *
 * @param hex Строка чётной длины из символов [0-9a-fA-F]
 * @return Result<Bytes> Байты или ProtocolMalformed
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

} // namespace strata
