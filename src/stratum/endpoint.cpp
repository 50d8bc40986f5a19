/**
 * @file endpoint.cpp
 * @brief Разбор адреса stratum сервера
 */

#include "endpoint.hpp"

#include <format>
#include <regex>

namespace strata::stratum {

Result<Endpoint> Endpoint::parse(std::string_view address) {
    // Формат: [stratum+tcp://|tcp://]host:port
    static const std::regex address_regex(
        R"((?:(?:stratum\+)?tcp://)?([^:/\s]+):(\d{1,5}))",
        std::regex::icase
    );

    const std::string text(address);
    std::smatch match;
    if (!std::regex_match(text, match, address_regex)) {
        return Err<Endpoint>(ErrorCode::ConfigInvalidValue,
            std::format("Некорректный адрес сервера: '{}'", text));
    }

    const unsigned long port = std::stoul(match[2].str());
    if (port == 0 || port > 65535) {
        return Err<Endpoint>(ErrorCode::ConfigInvalidValue,
            std::format("Порт вне диапазона 1..65535: '{}'", text));
    }

    Endpoint endpoint;
    endpoint.host = match[1].str();
    endpoint.port = static_cast<uint16_t>(port);
    return endpoint;
}

std::string Endpoint::to_string() const {
    return std::format("{}:{}", host, port);
}

} // namespace strata::stratum
