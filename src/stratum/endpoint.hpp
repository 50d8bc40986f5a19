/**
 * @file endpoint.hpp
 * @brief Адрес stratum сервера
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace strata::stratum {

/**
 * @brief Адрес сервера host:port
 */
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    /**
     * @brief Разобрать адрес
     *
     * Допустимые формы: "host:port", "stratum+tcp://host:port", "tcp://host:port".
     *
     * @return Result<Endpoint> Адрес или ConfigInvalidValue
     */
    [[nodiscard]] static Result<Endpoint> parse(std::string_view address);

    /**
     * @brief "host:port"
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Endpoint&) const = default;
};

} // namespace strata::stratum
