/**
 * @file stratum_session.hpp
 * @brief Сессия с Grin stratum сервером
 *
 * Сессия единолично владеет сокетом, состоянием подключения и таблицей
 * ожидающих ответа запросов. Наружу она отдаёт только события
 * (SessionEvent) в строгом порядке поступления и снимок SessionInfo.
 *
 * Потоки:
 * - поток чтения (на каждое подключение): разбор строк, маршрутизация
 *   ответов, keepalive и таймауты запросов
 * - супервизор (после start()): подключение и переподключение
 *   с удваивающейся задержкой и разбросом +-20%
 *
 * Пока сессия не Ready, submit_solution() ставит решения в ограниченную
 * очередь (при переполнении вытесняется самое старое). После
 * переподключения очередь отправляется по порядку, каждое решение ровно
 * один раз. Отправленное, но не получившее ответа решение при обрыве
 * не переотправляется: сервер мог его принять.
 */

#pragma once

#include "endpoint.hpp"
#include "../core/channel.hpp"
#include "../core/config.hpp"
#include "../core/json.hpp"
#include "../core/types.hpp"
#include "../log/logger.hpp"
#include "../mining/job.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::stratum {

// =============================================================================
// Состояние сессии
// =============================================================================

enum class SessionState {
    Disconnected,
    Connecting,
    Authenticating,
    Ready,
    Reconnecting
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Disconnected:   return "Disconnected";
        case SessionState::Connecting:     return "Connecting";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Ready:          return "Ready";
        case SessionState::Reconnecting:   return "Reconnecting";
        default: return "Unknown";
    }
}

/**
 * @brief Идентификатор запроса для сопоставления ответа
 */
using RequestHandle = uint64_t;

// =============================================================================
// События
// =============================================================================

/// @brief Сервер прислал задание (push или ответ на getjobtemplate)
struct JobReceived {
    mining::Job job;
};

/**
 * @brief Ответ на запрос, либо его отсутствие
 *
 * Ошибки: SubmissionRejected (отказ сервера), RequestTimeout,
 * SubmissionUnanswered (обрыв связи или вытеснение из очереди).
 */
struct ResponseReceived {
    RequestHandle handle = 0;
    std::string method;
    Result<JsonValue> result;
};

/// @brief Подключение потеряно
struct ConnectionLost {
    std::string reason;
};

/// @brief Ответ на keepalive
struct Heartbeat {};

/// @brief Сессия готова к работе (в том числе после переподключения)
struct Connected {
    bool reconnect = false;
};

using SessionEvent = std::variant<JobReceived, ResponseReceived, ConnectionLost,
                                  Heartbeat, Connected>;

// =============================================================================
// Конфигурация и информация
// =============================================================================

/**
 * @brief Параметры сессии
 */
struct SessionConfig {
    Endpoint endpoint;
    std::optional<std::string> login;
    std::optional<std::string> password;
    std::string agent{constants::USER_AGENT};

    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds keepalive_interval{constants::DEFAULT_KEEPALIVE_INTERVAL_MS};
    std::chrono::milliseconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds reconnect_initial{constants::DEFAULT_RECONNECT_INITIAL_MS};
    std::chrono::milliseconds reconnect_max{constants::DEFAULT_RECONNECT_MAX_MS};

    /// @brief Подключение, продержавшееся дольше, сбрасывает задержку к reconnect_initial
    std::chrono::milliseconds stable_period{constants::SESSION_STABLE_PERIOD_MS};
    std::size_t submit_queue_size = constants::DEFAULT_SUBMIT_QUEUE_SIZE;

    /**
     * @brief Параметры из секции [mining]
     *
     * @return SessionConfig или ConfigInvalidValue (плохой адрес)
     */
    [[nodiscard]] static Result<SessionConfig> from(const MiningConfig& mining);
};

/**
 * @brief Снимок состояния сессии
 */
struct SessionInfo {
    SessionState state = SessionState::Disconnected;
    std::string endpoint;
    std::optional<std::chrono::steady_clock::time_point> connected_since;
    uint64_t reconnects = 0;
    std::chrono::milliseconds current_backoff{0};
    std::optional<std::chrono::system_clock::time_point> last_message_sent;
    std::optional<std::chrono::system_clock::time_point> last_message_received;
    std::size_t outstanding_requests = 0;
    std::size_t queued_submissions = 0;
    uint64_t dropped_submissions = 0;
    uint64_t malformed_lines = 0;
    std::string last_error;
};

// =============================================================================
// StratumSession
// =============================================================================

class StratumSession {
public:
    /**
     * @param config Параметры сессии
     * @param logger Журнал
     * @param event_signal Сигнал, который дёргается при появлении событий
     */
    StratumSession(SessionConfig config, log::Logger& logger,
                   std::shared_ptr<EventSignal> event_signal = nullptr);

    ~StratumSession();

    // Запрещаем копирование
    StratumSession(const StratumSession&) = delete;
    StratumSession& operator=(const StratumSession&) = delete;

    // ==========================================================================
    // Подключение
    // ==========================================================================

    /**
     * @brief Одна попытка подключения к настроенному адресу
     *
     * Подключение, login (если задан), запрос задания.
     *
     * @return Result<void> Успех, ConnectionError или ProtocolError
     */
    [[nodiscard]] Result<void> connect();

    /**
     * @brief Подключиться к другому адресу ("host:port" или "stratum+tcp://host:port")
     */
    [[nodiscard]] Result<void> connect(std::string_view address);

    /**
     * @brief Запустить супервизор: подключение и переподключение в фоне
     */
    void start();

    /**
     * @brief Прекратить переподключения, закрыть сокет, дождаться потоков
     *
     * Идемпотентно.
     */
    void shutdown();

    // ==========================================================================
    // Запросы
    // ==========================================================================

    /**
     * @brief Отправить произвольный запрос
     *
     * Не блокирует. Если сессия не Ready, ответ придёт сразу
     * как ResponseReceived с ошибкой ConnectionClosed.
     */
    RequestHandle send_request(std::string_view method, JsonValue params);

    /**
     * @brief Отправить решение (или поставить в очередь до переподключения)
     */
    RequestHandle submit_solution(const mining::Solution& solution);

    // ==========================================================================
    // События
    // ==========================================================================

    /**
     * @brief Забрать накопленные события в порядке поступления
     */
    [[nodiscard]] std::vector<SessionEvent> poll_events();

    /**
     * @brief Забрать одно событие
     */
    [[nodiscard]] std::optional<SessionEvent> next_event();

    // ==========================================================================
    // Информация
    // ==========================================================================

    [[nodiscard]] SessionState state() const noexcept;

    [[nodiscard]] SessionInfo info() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::stratum
