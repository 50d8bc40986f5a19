/**
 * @file constants.hpp
 * @brief Константы протокола и значения по умолчанию Strata Miner
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace strata::constants {

// =============================================================================
// Версия и идентификация
// =============================================================================

/// @brief Версия программы
inline constexpr std::string_view VERSION = "1.0.0";

/// @brief Agent, передаваемый серверу при login
inline constexpr std::string_view USER_AGENT = "strata-miner/1.0";

/// @brief Имя файла конфигурации по умолчанию
inline constexpr std::string_view CONFIG_FILE_NAME = "strata-miner.toml";

// =============================================================================
// Протокол
// =============================================================================

/// @brief Порт stratum сервера по умолчанию
inline constexpr uint16_t DEFAULT_STRATUM_PORT = 13416;

/// @brief Количество рёбер в цикле (размер proof)
inline constexpr std::size_t PROOF_SIZE = 42;

/// @brief Минимальный и максимальный размер графа (edge_bits)
inline constexpr uint32_t MIN_EDGE_BITS = 10;
inline constexpr uint32_t MAX_EDGE_BITS = 63;

/// @brief Максимальная длина одной строки протокола
inline constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;

// =============================================================================
// Тайминги по умолчанию (мс)
// =============================================================================

/// @brief Окно, в течение которого принимаются решения для предыдущего задания
inline constexpr uint32_t DEFAULT_GRACE_WINDOW_MS = 2000;

/// @brief Срок кооперативной отмены на устройстве
inline constexpr uint32_t DEFAULT_CANCEL_DEADLINE_MS = 500;

/// @brief Начальная и максимальная задержка переподключения
inline constexpr uint32_t DEFAULT_RECONNECT_INITIAL_MS = 1000;
inline constexpr uint32_t DEFAULT_RECONNECT_MAX_MS = 60000;

/// @brief Таймаут TCP подключения
inline constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 5000;

/// @brief Интервал keepalive
inline constexpr uint32_t DEFAULT_KEEPALIVE_INTERVAL_MS = 30000;

/// @brief Таймаут ответа на запрос
inline constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 30000;

/// @brief Интервал сбора статистики
inline constexpr uint32_t DEFAULT_STATS_INTERVAL_MS = 1000;

/// @brief Базовая задержка перезапуска устройства
inline constexpr uint32_t DEFAULT_DEVICE_RESTART_BACKOFF_MS = 1000;

/// @brief Время стабильной работы, после которого счётчик перезапусков сбрасывается (мс)
inline constexpr uint32_t DEVICE_STABLE_PERIOD_MS = 30000;

/// @brief Время в Ready, после которого задержка переподключения сбрасывается (мс)
inline constexpr uint32_t SESSION_STABLE_PERIOD_MS = 30000;

/// @brief Период опроса устройств супервизором пула (мс)
inline constexpr uint32_t POOL_SUPERVISE_INTERVAL_MS = 10;

/// @brief Максимальное ожидание события циклом оркестратора (мс)
inline constexpr uint32_t ORCHESTRATOR_WAIT_MS = 50;

/// @brief Сколько при остановке ждать ответов на отправленные решения (мс)
inline constexpr uint32_t SHUTDOWN_RESPONSE_WAIT_MS = 1000;

// =============================================================================
// Ёмкости очередей
// =============================================================================

/// @brief Очередь решений, ожидающих переподключения
inline constexpr std::size_t DEFAULT_SUBMIT_QUEUE_SIZE = 64;

/// @brief Канал решений от устройств к оркестратору
inline constexpr std::size_t DEFAULT_SOLUTION_QUEUE_SIZE = 1024;

/// @brief Максимальное количество перезапусков устройства подряд
inline constexpr uint32_t DEFAULT_DEVICE_MAX_RESTARTS = 3;

/// @brief Размер истории событий
inline constexpr std::size_t DEFAULT_EVENT_HISTORY = 200;

} // namespace strata::constants
