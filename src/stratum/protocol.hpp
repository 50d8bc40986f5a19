/**
 * @file protocol.hpp
 * @brief Кодек Grin stratum (JSON-RPC 2.0, один объект на строку)
 *
 * Запросы клиента:
 * - login          {"login","pass","agent"}
 * - getjobtemplate null
 * - submit         {"edge_bits","height","job_id","nonce","pow":[...]}
 * - keepalive      null
 *
 * Сообщения сервера:
 * - ответ на запрос: есть поле "result" или "error"
 * - push задания:    "method":"job", "params":{"difficulty","height","job_id","pre_pow"}
 */

#pragma once

#include "../core/json.hpp"
#include "../core/types.hpp"
#include "../mining/job.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace strata::stratum {

namespace method {
    inline constexpr std::string_view LOGIN = "login";
    inline constexpr std::string_view GET_JOB_TEMPLATE = "getjobtemplate";
    inline constexpr std::string_view JOB = "job";
    inline constexpr std::string_view SUBMIT = "submit";
    inline constexpr std::string_view KEEPALIVE = "keepalive";
}

// =============================================================================
// Сообщения сервера
// =============================================================================

/**
 * @brief Ошибка JSON-RPC, сообщённая сервером
 */
struct RpcError {
    int64_t code = 0;
    std::string message;
};

/**
 * @brief Ответ на запрос клиента
 */
struct Response {
    /// @brief Идентификатор запроса
    uint64_t id = 0;

    /// @brief Поле result (null, если его нет)
    JsonValue result;

    /// @brief Поле error, если оно не null
    std::optional<RpcError> error;

    /// @brief Успешен ли ответ (поле error отсутствует или null)
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/**
 * @brief Задание, присланное сервером по своей инициативе
 */
struct JobNotification {
    mining::Job job;
};

/**
 * @brief Разобранная строка от сервера
 */
using ServerMessage = std::variant<Response, JobNotification>;

// =============================================================================
// Кодирование
// =============================================================================

/**
 * @brief Закодировать запрос {"id","jsonrpc","method","params"}
 */
[[nodiscard]] std::string encode_request(uint64_t id, std::string_view method,
                                         const JsonValue& params);

[[nodiscard]] std::string encode_login(uint64_t id, std::string_view login,
                                       std::string_view password, std::string_view agent);

[[nodiscard]] std::string encode_get_job_template(uint64_t id);

[[nodiscard]] std::string encode_keepalive(uint64_t id);

[[nodiscard]] std::string encode_submit(uint64_t id, const mining::Solution& solution);

// =============================================================================
// Разбор
// =============================================================================

/**
 * @brief Разобрать строку от сервера
 *
 * @return ServerMessage или ProtocolMalformed (не JSON, неизвестная форма)
 *         / ProtocolUnexpected (неизвестный метод push уведомления)
 */
[[nodiscard]] Result<ServerMessage> parse_line(std::string_view line);

/**
 * @brief Разобрать объект задания (params push уведомления или result getjobtemplate)
 *
 * job_id принимается как число или строка и хранится строкой.
 */
[[nodiscard]] Result<mining::Job> parse_job(const JsonValue& value);

} // namespace strata::stratum
