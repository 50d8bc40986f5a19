/**
 * @file types.hpp
 * @brief Базовые типы для Strata Miner
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Bytes: динамический массив байт
 * - ErrorCode / Error: коды ошибок, сгруппированные по категориям
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Исключения не пересекают границы модулей: всё, что может
 *       завершиться неудачей, возвращает Result<T>.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief Динамический массив байт
 *
 * Используется для pre_pow заголовка и других бинарных данных
 * переменной длины.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок Strata
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Диапазоны кодов соответствуют категориям ошибок (см. ErrorCategory).
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,
    ConfigUnknownDevice = 103,

    // Ошибки соединения (200-299)
    ConnectionFailed = 200,
    ConnectionTimeout = 201,
    ConnectionClosed = 202,
    SendFailed = 203,
    ResolveFailed = 204,

    // Ошибки протокола (300-399)
    ProtocolMalformed = 300,
    ProtocolUnexpected = 301,
    LoginRejected = 302,
    RequestTimeout = 303,

    // Ошибки устройств (400-499)
    DeviceStartFailed = 400,
    DeviceFault = 401,
    DeviceCancelTimeout = 402,
    DeviceNotFound = 403,

    // Ошибки отправки решений (500-599)
    SubmissionRejected = 500,
    SubmissionStale = 501,
    SubmissionLowDifficulty = 502,
    SubmissionMalformed = 503,
    SubmissionUnanswered = 504,
};

/**
 * @brief Категория ошибки
 */
enum class ErrorCategory {
    None,
    Configuration,   ///< Фатально только при старте
    Connection,      ///< Запускает политику переподключения
    Protocol,        ///< Строка пропускается, либо переподключение при handshake
    Device,          ///< Изолировано в пределах одного устройства
    Submission       ///< Учитывается в статистике, не фатально
};

/**
 * @brief Определить категорию по коду ошибки
 */
[[nodiscard]] constexpr ErrorCategory error_category(ErrorCode code) noexcept {
    const auto value = static_cast<int>(code);
    if (value >= 100 && value < 200) return ErrorCategory::Configuration;
    if (value >= 200 && value < 300) return ErrorCategory::Connection;
    if (value >= 300 && value < 400) return ErrorCategory::Protocol;
    if (value >= 400 && value < 500) return ErrorCategory::Device;
    if (value >= 500 && value < 600) return ErrorCategory::Submission;
    return ErrorCategory::None;
}

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::ConfigUnknownDevice: return "Неизвестный тип устройства";
        case ErrorCode::ConnectionFailed: return "Ошибка подключения";
        case ErrorCode::ConnectionTimeout: return "Таймаут подключения";
        case ErrorCode::ConnectionClosed: return "Соединение закрыто";
        case ErrorCode::SendFailed: return "Ошибка отправки данных";
        case ErrorCode::ResolveFailed: return "Не удалось разрешить адрес";
        case ErrorCode::ProtocolMalformed: return "Некорректное сообщение";
        case ErrorCode::ProtocolUnexpected: return "Неожиданное сообщение";
        case ErrorCode::LoginRejected: return "Авторизация отклонена";
        case ErrorCode::RequestTimeout: return "Таймаут ответа на запрос";
        case ErrorCode::DeviceStartFailed: return "Не удалось запустить устройство";
        case ErrorCode::DeviceFault: return "Сбой устройства";
        case ErrorCode::DeviceCancelTimeout: return "Устройство не ответило на отмену";
        case ErrorCode::DeviceNotFound: return "Устройство не найдено";
        case ErrorCode::SubmissionRejected: return "Решение отклонено сервером";
        case ErrorCode::SubmissionStale: return "Решение устарело";
        case ErrorCode::SubmissionLowDifficulty: return "Сложность решения ниже цели";
        case ErrorCode::SubmissionMalformed: return "Некорректный формат решения";
        case ErrorCode::SubmissionUnanswered: return "Нет ответа на отправку решения";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Преобразование категории в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:          return "none";
        case ErrorCategory::Configuration: return "ConfigurationError";
        case ErrorCategory::Connection:    return "ConnectionError";
        case ErrorCategory::Protocol:      return "ProtocolError";
        case ErrorCategory::Device:        return "DeviceError";
        case ErrorCategory::Submission:    return "SubmissionRejected";
        default: return "unknown";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    /**
     * @brief Категория ошибки
     */
    [[nodiscard]] ErrorCategory category() const noexcept {
        return error_category(code);
    }

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * Result<uint16_t> parse_port(std::string_view str);
 *
 * auto port = parse_port("13416");
 * if (!port) {
 *     logger.error("config", port.error().message);
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace strata
